#pragma once

#include <pinfold/config.hpp>
#include <pinfold/result.hpp>
#include <string>
#include <vector>

namespace pinfold {

// pinfold.toml, the user-editable half of an environment:
//
//   [env]
//   specs = ["mpileaks", "libelf@0.8.12"]
//   include = ["./site-packages.toml", "/shared/config-dir"]
//
//   [env.packages.mpileaks]
//   version = ["2.2"]
//
// [env] also accepts inline `compilers` and `config` sections, which form
// the environment's own configuration scope.
struct Manifest {
    std::vector<std::string> specs;
    std::vector<std::string> includes;
    ConfigData inline_config;
    std::string source;
    // Text as read; kept so rewriting the spec list preserves the rest
    std::string text;

    static constexpr const char* kFileName = "pinfold.toml";
    static constexpr const char* kDefaultText = "[env]\nspecs = []\n";

    // Unknown keys and wrong types are ConfigFormat errors at file:line
    static Result<Manifest> parse(const std::string& toml_str,
                                  const std::string& source = kFileName);
    static Result<Manifest> load(const std::string& path);

    // Manifest text with env.specs replaced by `new_specs`
    Result<std::string> render(const std::vector<std::string>& new_specs) const;
};

} // namespace pinfold
