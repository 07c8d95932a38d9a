#include <pinfold/error.hpp>

#include <iterator>
#include <sstream>

namespace pinfold {

namespace {

// Indexed by PinfoldError::Code
constexpr const char* kCodeNames[] = {
    "IO", "Parse", "Version", "Dependency", "Variant", "NotFound",
    "Duplicate", "Cycle", "Checksum", "InvalidArg", "Command",
    "IncompleteSpec", "ConcretizationConflict", "ConfigFormat",
    "UnknownEnvironment", "BuildFailure", "Internal",
};

static_assert(std::size(kCodeNames) == PinfoldError::Internal + 1,
              "every error code needs a name");

} // namespace

const char* PinfoldError::code_name(Code c) {
    auto i = static_cast<size_t>(c);
    return i < std::size(kCodeNames) ? kCodeNames[i] : "Unknown";
}

std::string PinfoldError::location() const {
    if (file.empty() || line <= 0) return file;
    return file + ':' + std::to_string(line);
}

std::string PinfoldError::format() const {
    std::ostringstream out;
    out << "error[" << code_name(code) << "]: " << message;
    if (!hint.empty()) out << "\n  hint: " << hint;
    if (!file.empty()) out << "\n  --> " << location();
    return out.str();
}

} // namespace pinfold
