#pragma once

// toml++ helpers shared by the configuration and manifest readers.

#include <pinfold/config.hpp>
#include <toml++/toml.hpp>
#include <set>
#include <string>

namespace pinfold::detail {

// Parse TOML text; syntax errors become ConfigFormat errors at file:line
Result<toml::table> parse_toml(const std::string& text, const std::string& source);

// ConfigFormat error located at `node`
PinfoldError config_error(const std::string& message, const toml::source_region& where,
                          const std::string& source);

// Validate a table holding packages / compilers / config sections and
// convert it. Keys in `skip` belong to the caller and are not checked.
Result<ConfigData> config_from_toml(const toml::table& tbl, const std::string& source,
                                    const std::set<std::string>& skip = {});

} // namespace pinfold::detail
