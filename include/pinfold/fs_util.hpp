#pragma once

#include <pinfold/result.hpp>
#include <string>

namespace pinfold {

// Whole-file read; IO error when the file cannot be opened
Result<std::string> read_file(const std::string& path);

// Write `content` to a temporary file beside `path`, fsync it, then rename
// it over `path`. Readers see either the old or the new file, never a mix.
Status atomic_write_file(const std::string& path, const std::string& content);

} // namespace pinfold
