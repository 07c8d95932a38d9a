#include <pinfold/preferences.hpp>
#include <pinfold/log.hpp>

namespace pinfold {

PackagePrefs PackagePreferences::get(const std::string& name) const {
    std::lock_guard<std::mutex> lock(mutex_);

    if (filled_ && generation_ != stack_.generation()) {
        log::debug("config changed, dropping %zu cached preference entries",
                   cache_.size());
        cache_.clear();
    }
    generation_ = stack_.generation();
    filled_ = true;

    auto it = cache_.find(name);
    if (it != cache_.end()) return it->second;

    PackageSettings settings = stack_.package(name);
    PackagePrefs prefs;
    if (settings.versions) prefs.versions = *settings.versions;
    if (settings.compilers) prefs.compilers = *settings.compilers;
    if (settings.variants) prefs.variants = *settings.variants;
    prefs.providers = settings.providers;
    prefs.target = settings.target;

    cache_.emplace(name, prefs);
    return prefs;
}

size_t PackagePreferences::version_rank(const std::string& name, const Version& v) const {
    PackagePrefs prefs = get(name);
    for (size_t i = 0; i < prefs.versions.size(); ++i) {
        if (prefs.versions[i].contains(v)) return i;
    }
    return prefs.versions.size();
}

size_t PackagePreferences::compiler_rank(const std::string& name, const CompilerSpec& c) const {
    PackagePrefs prefs = get(name);
    for (size_t i = 0; i < prefs.compilers.size(); ++i) {
        if (c.satisfies(prefs.compilers[i])) return i;
    }
    return prefs.compilers.size();
}

std::vector<std::string> PackagePreferences::providers(const std::string& virtual_name) const {
    PackagePrefs prefs = get(virtual_name);
    auto it = prefs.providers.find(virtual_name);
    if (it == prefs.providers.end()) return {};
    return it->second;
}

void PackagePreferences::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    cache_.clear();
    filled_ = false;
}

size_t PackagePreferences::cached_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace pinfold
