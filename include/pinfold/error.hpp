#pragma once

#include <string>
#include <utility>

namespace pinfold {

// Every fallible pinfold operation reports one of these. `file` and `line`
// point at the manifest, config scope or lockfile that caused it, when there
// is one.
struct PinfoldError {
    enum Code {
        IO,
        Parse,
        Version,
        Dependency,
        Variant,
        NotFound,
        Duplicate,
        Cycle,
        Checksum,
        InvalidArg,
        Command,
        IncompleteSpec,
        ConcretizationConflict,
        ConfigFormat,
        UnknownEnvironment,
        BuildFailure,
        Internal,
    };

    Code code = Internal;
    std::string message;
    std::string hint;
    std::string file;
    int line = 0;

    PinfoldError() = default;
    PinfoldError(Code c, std::string msg, std::string h = {},
                 std::string f = {}, int l = 0)
        : code(c), message(std::move(msg)), hint(std::move(h)),
          file(std::move(f)), line(l) {}

    // "file:line", "file" when no line is known, or empty
    std::string location() const;

    // error[Code]: message
    //   hint: ...
    //   --> file:line
    std::string format() const;

    static const char* code_name(Code c);
};

} // namespace pinfold
