#include <pinfold/repository.hpp>
#include <pinfold/fs_util.hpp>
#include <pinfold/log.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <filesystem>

namespace fs = std::filesystem;

namespace pinfold {

bool VariantDef::allows(const std::string& value) const {
    if (is_bool()) return value == "true" || value == "false";
    return std::find(values.begin(), values.end(), value) != values.end();
}

static void sort_newest_first(std::vector<Version>& versions) {
    std::sort(versions.begin(), versions.end(),
              [](const Version& a, const Version& b) { return a > b; });
}

// ---------------------------------------------------------------------------
// PackageRecipe::parse
// ---------------------------------------------------------------------------

static PinfoldError recipe_error(const std::string& msg, const toml::node& node,
                                 const std::string& source) {
    return PinfoldError{PinfoldError::Parse, msg, "", source,
                        static_cast<int>(node.source().begin.line)};
}

static Result<VariantDef> parse_variant(const std::string& name, const toml::table& tbl,
                                        const std::string& source) {
    VariantDef def;
    def.name = name;
    if (auto d = tbl["description"].value<std::string>()) def.description = *d;

    if (auto arr = tbl["values"].as_array()) {
        for (const auto& elem : *arr) {
            auto s = elem.value<std::string>();
            if (!s) return recipe_error("variant '" + name + "' values must be strings", elem, source);
            def.values.push_back(*s);
        }
    }

    const toml::node* dflt = tbl.get("default");
    if (!dflt) {
        return recipe_error("variant '" + name + "' has no default", tbl, source);
    }
    if (auto b = dflt->value_exact<bool>()) {
        if (!def.values.empty()) {
            return recipe_error("variant '" + name + "' with values needs a string default",
                                *dflt, source);
        }
        def.default_value = *b ? "true" : "false";
    } else if (auto s = dflt->value<std::string>()) {
        if (def.values.empty()) {
            return recipe_error("variant '" + name + "' needs 'values' for a string default",
                                *dflt, source);
        }
        def.default_value = *s;
        if (!def.allows(def.default_value)) {
            return recipe_error("default '" + *s + "' is not a value of variant '" + name + "'",
                                *dflt, source);
        }
    } else {
        return recipe_error("variant '" + name + "' default must be a boolean or string",
                            *dflt, source);
    }
    return Result<VariantDef>::ok(std::move(def));
}

Result<PackageRecipe> PackageRecipe::parse(const std::string& toml_str,
                                           const std::string& source) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source);
    } catch (const toml::parse_error& e) {
        return PinfoldError{PinfoldError::Parse,
            "recipe parse error: " + std::string(e.description()), "",
            source, static_cast<int>(e.source().begin.line)};
    }

    auto pkg = doc["package"].as_table();
    if (!pkg) {
        return PinfoldError{PinfoldError::Parse,
            "recipe has no [package] table", "", source, 0};
    }

    PackageRecipe recipe;
    auto name = (*pkg)["name"].value<std::string>();
    if (!name || name->empty()) {
        return recipe_error("recipe is missing package.name", *pkg, source);
    }
    recipe.name = *name;

    auto versions = (*pkg)["versions"].as_array();
    if (!versions || versions->empty()) {
        return recipe_error("package '" + recipe.name + "' lists no versions", *pkg, source);
    }
    for (const auto& elem : *versions) {
        auto s = elem.value<std::string>();
        if (!s) return recipe_error("versions must be strings", elem, source);
        auto v = Version::parse(*s);
        if (v.is_err()) return recipe_error(v.error().message, elem, source);
        recipe.versions.push_back(std::move(v).value());
    }
    sort_newest_first(recipe.versions);

    if (auto pref = (*pkg)["preferred"].value<std::string>()) {
        auto v = Version::parse(*pref);
        if (v.is_err() || !recipe.has_version(v.value())) {
            return recipe_error("preferred version '" + *pref + "' is not a listed version",
                                *(*pkg).get("preferred"), source);
        }
        recipe.preferred = std::move(v).value();
    }

    if (auto provides = (*pkg)["provides"].as_array()) {
        for (const auto& elem : *provides) {
            auto s = elem.value<std::string>();
            if (!s) return recipe_error("provides must be strings", elem, source);
            recipe.provides.push_back(*s);
        }
    }

    if (auto variants = doc["variants"].as_table()) {
        for (const auto& [key, val] : *variants) {
            std::string vname(key.str());
            auto tbl = val.as_table();
            if (!tbl) return recipe_error("variant '" + vname + "' must be a table", val, source);
            PINFOLD_TRY_ASSIGN(recipe.variants[vname], parse_variant(vname, *tbl, source));
        }
    }

    if (auto deps = doc["dependencies"].as_array()) {
        for (const auto& elem : *deps) {
            auto tbl = elem.as_table();
            if (!tbl) return recipe_error("dependencies must be tables", elem, source);
            auto spec_text = (*tbl)["spec"].value<std::string>();
            if (!spec_text) return recipe_error("dependency is missing 'spec'", elem, source);

            auto spec = Spec::parse(*spec_text);
            if (spec.is_err()) return recipe_error(spec.error().message, elem, source);
            DependencyDef dep;
            dep.spec = std::move(spec).value();
            if (dep.spec.is_anonymous()) {
                return recipe_error("dependency '" + *spec_text + "' has no name", elem, source);
            }

            if (auto when = (*tbl)["when"].value<std::string>()) {
                auto cond = Spec::parse(*when);
                if (cond.is_err()) return recipe_error(cond.error().message, elem, source);
                dep.when = std::move(cond).value();
            }
            recipe.dependencies.push_back(std::move(dep));
        }
    }

    return Result<PackageRecipe>::ok(std::move(recipe));
}

Result<PackageRecipe> PackageRecipe::load(const std::string& path) {
    PINFOLD_TRY_ASSIGN(std::string text, read_file(path));
    return PackageRecipe::parse(text, path);
}

bool PackageRecipe::has_version(const Version& v) const {
    return std::find(versions.begin(), versions.end(), v) != versions.end();
}

// ---------------------------------------------------------------------------
// Repository
// ---------------------------------------------------------------------------

Result<Repository> Repository::load(const std::string& dir) {
    fs::path repo_file = fs::path(dir) / "repo.toml";
    std::error_code ec;
    if (!fs::exists(repo_file, ec)) {
        return PinfoldError{PinfoldError::NotFound,
            "no repository at " + dir,
            "a repository directory holds repo.toml and packages/"};
    }

    toml::table doc;
    try {
        doc = toml::parse_file(repo_file.string());
    } catch (const toml::parse_error& e) {
        return PinfoldError{PinfoldError::Parse,
            "repo.toml parse error: " + std::string(e.description()), "",
            repo_file.string(), static_cast<int>(e.source().begin.line)};
    }

    auto ns = doc["repo"]["namespace"].value<std::string>();
    if (!ns || ns->empty()) {
        return PinfoldError{PinfoldError::Parse,
            "repository is missing repo.namespace", "", repo_file.string(), 0};
    }

    Repository repo(*ns);

    // Sorted so load order and duplicate reports are stable
    std::vector<fs::path> files;
    fs::path packages_dir = fs::path(dir) / "packages";
    if (fs::is_directory(packages_dir, ec)) {
        for (const auto& entry : fs::directory_iterator(packages_dir, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".toml") {
                files.push_back(entry.path());
            }
        }
    }
    if (ec) {
        return PinfoldError{PinfoldError::IO,
            "cannot list " + packages_dir.string() + ": " + ec.message()};
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        PINFOLD_TRY_ASSIGN(auto recipe, PackageRecipe::load(file.string()));
        PINFOLD_TRY(repo.add(std::move(recipe)));
    }

    log::debug("loaded %zu recipes from repository '%s'", repo.size(), ns->c_str());
    return Result<Repository>::ok(std::move(repo));
}

Status Repository::add(PackageRecipe recipe) {
    if (recipes_.count(recipe.name)) {
        return PinfoldError{PinfoldError::Duplicate,
            "package '" + recipe.name + "' is defined twice in repository '" + namespace_ + "'"};
    }
    recipe.namespace_name = namespace_;
    // Recipes built in code may list versions in any order
    sort_newest_first(recipe.versions);
    std::string name = recipe.name;
    recipes_.emplace(std::move(name), std::move(recipe));
    return ok_status();
}

Result<const PackageRecipe*> Repository::get(const std::string& name) const {
    auto it = recipes_.find(name);
    if (it == recipes_.end()) {
        return PinfoldError{PinfoldError::NotFound,
            "package '" + name + "' not found in repository '" + namespace_ + "'"};
    }
    return Result<const PackageRecipe*>::ok(&it->second);
}

std::vector<std::string> Repository::package_names() const {
    std::vector<std::string> names;
    for (const auto& [name, recipe] : recipes_) names.push_back(name);
    return names;
}

std::vector<std::string> Repository::providers_for(const std::string& virtual_name) const {
    std::vector<std::string> out;
    for (const auto& [name, recipe] : recipes_) {
        if (std::find(recipe.provides.begin(), recipe.provides.end(), virtual_name) !=
            recipe.provides.end()) {
            out.push_back(name);
        }
    }
    return out;
}

// ---------------------------------------------------------------------------
// RepositoryOverlay
// ---------------------------------------------------------------------------

RepositoryOverlay::RepositoryOverlay(std::shared_ptr<const Repository> base,
                                     const std::string& env_name)
    : base_(std::move(base)), local_(env_name) {}

Status RepositoryOverlay::load_local(const std::string& dir) {
    std::error_code ec;
    fs::path packages_dir = fs::path(dir) / "packages";
    if (!fs::is_directory(packages_dir, ec)) return ok_status();

    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(packages_dir, ec)) {
        if (entry.is_regular_file() && entry.path().extension() == ".toml") {
            files.push_back(entry.path());
        }
    }
    if (ec) {
        return PinfoldError{PinfoldError::IO,
            "cannot list " + packages_dir.string() + ": " + ec.message()};
    }
    std::sort(files.begin(), files.end());

    for (const auto& file : files) {
        PINFOLD_TRY_ASSIGN(auto recipe, PackageRecipe::load(file.string()));
        if (base_->exists(recipe.name)) {
            log::debug("environment recipe %s shadows %s.%s", file.string().c_str(),
                       base_->namespace_name().c_str(), recipe.name.c_str());
        }
        PINFOLD_TRY(local_.add(std::move(recipe)));
    }
    return ok_status();
}

Result<const PackageRecipe*> RepositoryOverlay::get(const std::string& name,
                                                    const std::string& ns) const {
    if (ns.empty() || ns == local_.namespace_name()) {
        if (local_.exists(name)) return local_.get(name);
        if (!ns.empty()) return local_.get(name);
    }
    if (ns.empty() || ns == base_->namespace_name()) {
        return base_->get(name);
    }
    return PinfoldError{PinfoldError::NotFound,
        "unknown namespace '" + ns + "' for package '" + name + "'",
        "known namespaces: " + local_.namespace_name() + ", " + base_->namespace_name()};
}

Result<const PackageRecipe*> RepositoryOverlay::get(const Spec& spec) const {
    return get(spec.name(), spec.namespace_name());
}

bool RepositoryOverlay::exists(const std::string& name) const {
    return local_.exists(name) || base_->exists(name);
}

bool RepositoryOverlay::is_virtual(const std::string& name) const {
    return !exists(name) && !providers_for(name).empty();
}

std::vector<std::string> RepositoryOverlay::providers_for(const std::string& virtual_name) const {
    std::set<std::string> names;
    // A local recipe replaces the base recipe of the same name entirely
    for (const auto& name : local_.providers_for(virtual_name)) names.insert(name);
    for (const auto& name : base_->providers_for(virtual_name)) {
        if (!local_.exists(name)) names.insert(name);
    }
    return std::vector<std::string>(names.begin(), names.end());
}

std::set<std::string> RepositoryOverlay::possible_dependencies(const std::string& name) const {
    std::set<std::string> seen;
    std::vector<std::string> stack{name};
    while (!stack.empty()) {
        std::string current = stack.back();
        stack.pop_back();
        if (!seen.insert(current).second) continue;

        if (!exists(current)) {
            for (const auto& provider : providers_for(current)) stack.push_back(provider);
            continue;
        }
        auto recipe = get(current);
        if (recipe.is_err()) continue;
        for (const auto& dep : recipe.value()->dependencies) {
            stack.push_back(dep.spec.name());
        }
    }
    return seen;
}

} // namespace pinfold
