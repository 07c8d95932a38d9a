#pragma once

#include <pinfold/config.hpp>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace pinfold {

// Ranking rules for one package, projected from the merged configuration
// ("all" settings underneath the package's own).
struct PackagePrefs {
    std::vector<VersionList> versions;
    std::vector<CompilerSpec> compilers;
    VariantMap variants;
    std::map<std::string, std::vector<std::string>> providers;
    std::optional<std::string> target;
};

// Memoized read-through cache over one ConfigScopeStack.
//
// Each Environment owns its own instance. Entries are dropped by
// invalidate(), and also whenever the stack's generation differs from the
// one the cache was filled at, so a lookup never sees stale configuration.
// Lookups are safe from concurrent concretization workers.
class PackagePreferences {
public:
    explicit PackagePreferences(const ConfigScopeStack& stack) : stack_(stack) {}

    PackagePrefs get(const std::string& name) const;

    // Index of the first preferred version list containing `v`, or the
    // number of preferences when none does (lower ranks first)
    size_t version_rank(const std::string& name, const Version& v) const;
    size_t compiler_rank(const std::string& name, const CompilerSpec& c) const;
    // Configured ranking of providers for a virtual package
    std::vector<std::string> providers(const std::string& virtual_name) const;

    void invalidate();
    size_t cached_count() const;

private:
    const ConfigScopeStack& stack_;
    mutable std::mutex mutex_;
    mutable std::map<std::string, PackagePrefs> cache_;
    mutable uint64_t generation_ = 0;
    mutable bool filled_ = false;
};

} // namespace pinfold
