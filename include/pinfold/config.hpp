#pragma once

#include <pinfold/result.hpp>
#include <pinfold/spec.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace pinfold {

// [packages.<name>] (or [packages.all]) preferences. Every field is optional
// so a higher scope only replaces what it sets.
struct PackageSettings {
    std::optional<std::vector<VersionList>> versions;    // ranked
    std::optional<std::vector<CompilerSpec>> compilers;  // ranked
    std::optional<VariantMap> variants;
    std::map<std::string, std::vector<std::string>> providers;  // virtual -> ranked
    std::optional<std::string> target;

    bool empty() const {
        return !versions && !compilers && !variants && providers.empty() && !target;
    }

    // Overlay `higher` on top of this
    void merge(const PackageSettings& higher);
};

// One [[compilers]] entry
struct CompilerEntry {
    CompilerSpec spec;
    std::string operating_system;
};

// [config] section
struct GeneralSettings {
    std::optional<std::string> platform;
    std::optional<std::string> os;
    std::optional<std::string> target;
    std::optional<int> build_jobs;

    void merge(const GeneralSettings& higher);
};

// Typed contents of one scope, or of a whole merged stack.
struct ConfigData {
    std::map<std::string, PackageSettings> packages;
    // Replaced as a whole by a higher scope that lists compilers
    std::optional<std::vector<CompilerEntry>> compilers;
    GeneralSettings config;

    void merge(const ConfigData& higher);
};

// A named configuration layer with the file or directory it came from.
struct ConfigScope {
    std::string name;
    std::string source;
    ConfigData data;

    // Parse and validate TOML text; `source` names the origin in errors
    static Result<ConfigScope> from_string(const std::string& name,
                                           const std::string& text,
                                           const std::string& source);

    static Result<ConfigScope> from_file(const std::string& name,
                                         const std::string& path);

    // Reads packages.toml, compilers.toml and config.toml when present.
    // A missing directory yields an empty scope.
    static Result<ConfigScope> from_directory(const std::string& name,
                                              const std::string& dir);

    // File or directory, decided by what exists at `path`
    static Result<ConfigScope> from_path(const std::string& name,
                                         const std::string& path);
};

// Ordered configuration layers, lowest precedence first.
class ConfigScopeStack {
public:
    // Duplicate error if a scope of the same name is already on the stack
    Status push(ConfigScope scope);
    bool remove(const std::string& name);
    void clear();

    const std::vector<ConfigScope>& scopes() const { return scopes_; }
    const ConfigScope* find(const std::string& name) const;

    // Effective configuration: scopes overlaid lowest to highest
    ConfigData merged() const;

    // Settings for one package with "all" underneath
    PackageSettings package(const std::string& name) const;
    std::vector<CompilerEntry> compilers() const;
    GeneralSettings settings() const;

    // Bumped by every mutation; lets caches detect they are stale
    uint64_t generation() const { return generation_; }

private:
    std::vector<ConfigScope> scopes_;
    uint64_t generation_ = 0;
};

} // namespace pinfold
