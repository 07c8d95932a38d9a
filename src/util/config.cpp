#include <pinfold/config.hpp>
#include <pinfold/fs_util.hpp>
#include <pinfold/log.hpp>
#include "toml_config.hpp"

#include <filesystem>

namespace fs = std::filesystem;

namespace pinfold {

// ---------------------------------------------------------------------------
// Merging
// ---------------------------------------------------------------------------

void PackageSettings::merge(const PackageSettings& higher) {
    if (higher.versions) versions = higher.versions;
    if (higher.compilers) compilers = higher.compilers;
    if (higher.variants) variants = higher.variants;
    if (higher.target) target = higher.target;
    for (const auto& [virtual_name, ranked] : higher.providers) {
        providers[virtual_name] = ranked;
    }
}

void GeneralSettings::merge(const GeneralSettings& higher) {
    if (higher.platform) platform = higher.platform;
    if (higher.os) os = higher.os;
    if (higher.target) target = higher.target;
    if (higher.build_jobs) build_jobs = higher.build_jobs;
}

void ConfigData::merge(const ConfigData& higher) {
    for (const auto& [name, settings] : higher.packages) {
        packages[name].merge(settings);
    }
    if (higher.compilers) compilers = higher.compilers;
    config.merge(higher.config);
}

// ---------------------------------------------------------------------------
// TOML schema
// ---------------------------------------------------------------------------

namespace detail {

PinfoldError config_error(const std::string& message, const toml::source_region& where,
                          const std::string& source) {
    return PinfoldError{PinfoldError::ConfigFormat, message, "",
                        source, static_cast<int>(where.begin.line)};
}

Result<toml::table> parse_toml(const std::string& text, const std::string& source) {
    try {
        return Result<toml::table>::ok(toml::parse(text, source));
    } catch (const toml::parse_error& e) {
        return config_error("invalid TOML: " + std::string(e.description()),
                            e.source(), source);
    }
}

static PinfoldError unexpected_key(const toml::key& key, const std::string& source,
                                   const std::string& allowed) {
    auto e = config_error("'" + std::string(key.str()) + "' was unexpected",
                          key.source(), source);
    e.hint = "expected one of: " + allowed;
    return e;
}

static PinfoldError wrong_type(const std::string& key, const toml::node& node,
                               const std::string& source, const std::string& type) {
    return config_error("'" + key + "' must be " + type, node.source(), source);
}

static Result<std::vector<std::string>> string_array(const std::string& key,
                                                     const toml::node& node,
                                                     const std::string& source) {
    auto arr = node.as_array();
    if (!arr) return wrong_type(key, node, source, "an array of strings");
    std::vector<std::string> out;
    for (const auto& elem : *arr) {
        auto s = elem.value<std::string>();
        if (!s) return wrong_type(key, elem, source, "an array of strings");
        out.push_back(*s);
    }
    return Result<std::vector<std::string>>::ok(std::move(out));
}

static Result<PackageSettings> parse_package(const std::string& pkg,
                                             const toml::table& tbl,
                                             const std::string& source) {
    PackageSettings ps;
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        if (k == "version") {
            PINFOLD_TRY_ASSIGN(auto items, string_array(k, val, source));
            std::vector<VersionList> versions;
            for (const auto& item : items) {
                auto vl = VersionList::parse(item);
                if (vl.is_err()) {
                    return config_error("invalid version '" + item + "' for package '" +
                                        pkg + "': " + vl.error().message,
                                        val.source(), source);
                }
                versions.push_back(std::move(vl).value());
            }
            ps.versions = std::move(versions);
        } else if (k == "compiler") {
            PINFOLD_TRY_ASSIGN(auto items, string_array(k, val, source));
            std::vector<CompilerSpec> compilers;
            for (const auto& item : items) {
                auto cs = CompilerSpec::parse(item);
                if (cs.is_err()) {
                    return config_error(cs.error().message, val.source(), source);
                }
                compilers.push_back(std::move(cs).value());
            }
            ps.compilers = std::move(compilers);
        } else if (k == "variants") {
            auto text = val.value<std::string>();
            if (!text) return wrong_type(k, val, source, "a string");
            auto parsed = Spec::parse(*text);
            if (parsed.is_err() || !parsed.value().is_anonymous() ||
                !parsed.value().dependencies().empty()) {
                return config_error("invalid variants '" + *text + "' for package '" +
                                    pkg + "'", val.source(), source);
            }
            ps.variants = parsed.value().variants();
        } else if (k == "providers") {
            auto providers = val.as_table();
            if (!providers) return wrong_type(k, val, source, "a table");
            for (const auto& [virtual_name, ranked] : *providers) {
                PINFOLD_TRY_ASSIGN(auto names,
                    string_array(std::string(virtual_name.str()), ranked, source));
                ps.providers[std::string(virtual_name.str())] = std::move(names);
            }
        } else if (k == "target") {
            auto text = val.value<std::string>();
            if (!text) return wrong_type(k, val, source, "a string");
            ps.target = *text;
        } else {
            return unexpected_key(key, source, "version, compiler, variants, providers, target");
        }
    }
    return Result<PackageSettings>::ok(std::move(ps));
}

static Result<std::vector<CompilerEntry>> parse_compilers(const toml::node& node,
                                                          const std::string& source) {
    auto arr = node.as_array();
    if (!arr) return wrong_type("compilers", node, source, "an array of tables");

    std::vector<CompilerEntry> out;
    for (const auto& elem : *arr) {
        auto tbl = elem.as_table();
        if (!tbl) return wrong_type("compilers", elem, source, "an array of tables");

        CompilerEntry entry;
        bool has_spec = false;
        for (const auto& [key, val] : *tbl) {
            std::string k(key.str());
            if (k == "spec") {
                auto text = val.value<std::string>();
                if (!text) return wrong_type(k, val, source, "a string");
                auto cs = CompilerSpec::parse(*text);
                if (cs.is_err()) return config_error(cs.error().message, val.source(), source);
                if (!cs.value().is_concrete()) {
                    return config_error("compiler '" + *text + "' needs an exact version",
                                        val.source(), source);
                }
                entry.spec = std::move(cs).value();
                has_spec = true;
            } else if (k == "operating_system") {
                auto text = val.value<std::string>();
                if (!text) return wrong_type(k, val, source, "a string");
                entry.operating_system = *text;
            } else {
                return unexpected_key(key, source, "spec, operating_system");
            }
        }
        if (!has_spec) {
            return config_error("compiler entry is missing 'spec'", elem.source(), source);
        }
        out.push_back(std::move(entry));
    }
    return Result<std::vector<CompilerEntry>>::ok(std::move(out));
}

static Result<GeneralSettings> parse_general(const toml::table& tbl,
                                             const std::string& source) {
    GeneralSettings gs;
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        if (k == "platform" || k == "os" || k == "target") {
            auto text = val.value<std::string>();
            if (!text) return wrong_type(k, val, source, "a string");
            if (k == "platform") gs.platform = *text;
            else if (k == "os") gs.os = *text;
            else gs.target = *text;
        } else if (k == "build_jobs") {
            auto jobs = val.value<int64_t>();
            if (!jobs || !val.is_integer() || *jobs < 1) {
                return wrong_type(k, val, source, "a positive integer");
            }
            gs.build_jobs = static_cast<int>(*jobs);
        } else {
            return unexpected_key(key, source, "platform, os, target, build_jobs");
        }
    }
    return Result<GeneralSettings>::ok(std::move(gs));
}

Result<ConfigData> config_from_toml(const toml::table& tbl, const std::string& source,
                                    const std::set<std::string>& skip) {
    ConfigData data;
    for (const auto& [key, val] : tbl) {
        std::string k(key.str());
        if (skip.count(k)) continue;

        if (k == "packages") {
            auto packages = val.as_table();
            if (!packages) return wrong_type(k, val, source, "a table");
            for (const auto& [pkg, settings] : *packages) {
                std::string name(pkg.str());
                auto pkg_tbl = settings.as_table();
                if (!pkg_tbl) return wrong_type(name, settings, source, "a table");
                PINFOLD_TRY_ASSIGN(data.packages[name], parse_package(name, *pkg_tbl, source));
            }
        } else if (k == "compilers") {
            PINFOLD_TRY_ASSIGN(data.compilers, parse_compilers(val, source));
        } else if (k == "config") {
            auto general = val.as_table();
            if (!general) return wrong_type(k, val, source, "a table");
            PINFOLD_TRY_ASSIGN(data.config, parse_general(*general, source));
        } else {
            std::string allowed = "packages, compilers, config";
            for (const auto& s : skip) allowed = s + ", " + allowed;
            return unexpected_key(key, source, allowed);
        }
    }
    return Result<ConfigData>::ok(std::move(data));
}

} // namespace detail

// ---------------------------------------------------------------------------
// ConfigScope
// ---------------------------------------------------------------------------

Result<ConfigScope> ConfigScope::from_string(const std::string& name,
                                             const std::string& text,
                                             const std::string& source) {
    PINFOLD_TRY_ASSIGN(auto doc, detail::parse_toml(text, source));
    PINFOLD_TRY_ASSIGN(auto data, detail::config_from_toml(doc, source));

    ConfigScope scope;
    scope.name = name;
    scope.source = source;
    scope.data = std::move(data);
    return Result<ConfigScope>::ok(std::move(scope));
}

Result<ConfigScope> ConfigScope::from_file(const std::string& name,
                                           const std::string& path) {
    PINFOLD_TRY_ASSIGN(std::string text, read_file(path));
    return from_string(name, text, path);
}

Result<ConfigScope> ConfigScope::from_directory(const std::string& name,
                                                const std::string& dir) {
    ConfigScope scope;
    scope.name = name;
    scope.source = dir;

    for (const char* file : {"packages.toml", "compilers.toml", "config.toml"}) {
        fs::path path = fs::path(dir) / file;
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) continue;
        PINFOLD_TRY_ASSIGN(auto part, from_file(name, path.string()));
        scope.data.merge(part.data);
    }
    return Result<ConfigScope>::ok(std::move(scope));
}

Result<ConfigScope> ConfigScope::from_path(const std::string& name,
                                           const std::string& path) {
    std::error_code ec;
    if (fs::is_directory(path, ec)) return from_directory(name, path);
    return from_file(name, path);
}

// ---------------------------------------------------------------------------
// ConfigScopeStack
// ---------------------------------------------------------------------------

Status ConfigScopeStack::push(ConfigScope scope) {
    if (find(scope.name)) {
        return PinfoldError{PinfoldError::Duplicate,
            "config scope '" + scope.name + "' is already on the stack"};
    }
    log::debug("pushing config scope '%s' from %s",
               scope.name.c_str(), scope.source.c_str());
    scopes_.push_back(std::move(scope));
    ++generation_;
    return ok_status();
}

bool ConfigScopeStack::remove(const std::string& name) {
    for (auto it = scopes_.begin(); it != scopes_.end(); ++it) {
        if (it->name == name) {
            scopes_.erase(it);
            ++generation_;
            return true;
        }
    }
    return false;
}

void ConfigScopeStack::clear() {
    scopes_.clear();
    ++generation_;
}

const ConfigScope* ConfigScopeStack::find(const std::string& name) const {
    for (const auto& scope : scopes_) {
        if (scope.name == name) return &scope;
    }
    return nullptr;
}

ConfigData ConfigScopeStack::merged() const {
    ConfigData result;
    for (const auto& scope : scopes_) {
        result.merge(scope.data);
    }
    return result;
}

PackageSettings ConfigScopeStack::package(const std::string& name) const {
    ConfigData data = merged();
    PackageSettings result;
    auto all = data.packages.find("all");
    if (all != data.packages.end()) result.merge(all->second);
    auto pkg = data.packages.find(name);
    if (pkg != data.packages.end() && name != "all") result.merge(pkg->second);
    return result;
}

std::vector<CompilerEntry> ConfigScopeStack::compilers() const {
    return merged().compilers.value_or(std::vector<CompilerEntry>{});
}

GeneralSettings ConfigScopeStack::settings() const {
    return merged().config;
}

} // namespace pinfold
