#pragma once

#include <pinfold/result.hpp>
#include <pinfold/spec.hpp>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pinfold {

// [variants.<name>]. A boolean default with no value list declares an
// on/off variant.
struct VariantDef {
    std::string name;
    std::string default_value;
    std::vector<std::string> values;
    std::string description;

    bool is_bool() const { return values.empty(); }
    bool allows(const std::string& value) const;
};

// [[dependencies]] entry; `when` restricts it to matching dependents
struct DependencyDef {
    Spec spec;
    std::optional<Spec> when;
};

// Package metadata used by concretization. Build logic lives elsewhere.
struct PackageRecipe {
    std::string name;
    std::string namespace_name;
    std::vector<Version> versions;      // newest first
    std::optional<Version> preferred;
    std::vector<std::string> provides;  // virtual packages
    std::map<std::string, VariantDef> variants;
    std::vector<DependencyDef> dependencies;

    // Recipe TOML:
    //   [package] name, versions, preferred, provides
    //   [variants.<name>] default, values, description
    //   [[dependencies]] spec, when
    static Result<PackageRecipe> parse(const std::string& toml_str,
                                       const std::string& source = "<recipe>");
    static Result<PackageRecipe> load(const std::string& path);

    bool has_version(const Version& v) const;
    std::string qualified_name() const { return namespace_name + "." + name; }
};

// A namespace of recipes, loaded from a directory or built in code.
//
// Directory layout:
//   <dir>/repo.toml          [repo] namespace = "builtin"
//   <dir>/packages/*.toml    one recipe per file
class Repository {
public:
    Repository() = default;
    explicit Repository(std::string ns) : namespace_(std::move(ns)) {}

    static Result<Repository> load(const std::string& dir);

    const std::string& namespace_name() const { return namespace_; }

    // Stamps the recipe with this repository's namespace
    Status add(PackageRecipe recipe);

    bool exists(const std::string& name) const { return recipes_.count(name) > 0; }
    Result<const PackageRecipe*> get(const std::string& name) const;
    std::vector<std::string> package_names() const;
    // Names of recipes providing `virtual_name`, sorted
    std::vector<std::string> providers_for(const std::string& virtual_name) const;
    size_t size() const { return recipes_.size(); }

private:
    std::string namespace_;
    std::map<std::string, PackageRecipe> recipes_;
};

// Environment-local recipes layered over a shared base repository.
//
// Local recipes take the environment name as their namespace, so they never
// leak into other environments. A lookup returns the local recipe first,
// unless the request names the base namespace explicitly.
class RepositoryOverlay {
public:
    RepositoryOverlay(std::shared_ptr<const Repository> base, const std::string& env_name);

    // Load local recipes from `dir`; a missing directory leaves it empty
    Status load_local(const std::string& dir);
    Status add_local(PackageRecipe recipe) { return local_.add(std::move(recipe)); }

    // NotFound when neither layer has a recipe of that name (and namespace)
    Result<const PackageRecipe*> get(const std::string& name,
                                     const std::string& ns = "") const;
    Result<const PackageRecipe*> get(const Spec& spec) const;

    bool exists(const std::string& name) const;
    // Virtual: not a recipe itself, but provided by at least one recipe
    bool is_virtual(const std::string& name) const;
    std::vector<std::string> providers_for(const std::string& virtual_name) const;

    // Names `name` could depend on, transitively, regardless of conditions
    // and with virtuals expanded to every provider. Includes `name`.
    std::set<std::string> possible_dependencies(const std::string& name) const;

    const Repository& base() const { return *base_; }
    const Repository& local() const { return local_; }

private:
    std::shared_ptr<const Repository> base_;
    Repository local_;
};

} // namespace pinfold
