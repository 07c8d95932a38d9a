#pragma once

#include <pinfold/concretizer.hpp>
#include <pinfold/config.hpp>
#include <pinfold/installer.hpp>
#include <pinfold/lockfile.hpp>
#include <pinfold/manifest.hpp>
#include <pinfold/preferences.hpp>
#include <pinfold/repository.hpp>
#include <pinfold/result.hpp>
#include <pinfold/site.hpp>
#include <pinfold/spec.hpp>
#include <map>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace pinfold {

// A named set of abstract specs and the concrete DAG they resolved to.
//
// On disk, under <site>/environments/<name>/:
//   pinfold.toml   manifest (user specs, includes, inline configuration)
//   pinfold.lock   lockfile (concretized roots and every concrete spec)
//   repo/          environment-local recipes
//   loads          module load lines written by loads()
//
// Each Environment owns its configuration stack, preference cache and
// repository overlay; nothing is shared with other environments. An
// Environment is not safe for concurrent use.
class Environment {
public:
    static constexpr const char* kLockFileName = "pinfold.lock";

    // In-memory environment; nothing is written until write()
    static Result<Environment> make(const Site& site, const std::string& name,
                                    const std::string& manifest_text = Manifest::kDefaultText);

    // Writes a new environment directory. Duplicate error if it exists.
    static Result<Environment> create(const Site& site, const std::string& name,
                                      const std::string& manifest_text = Manifest::kDefaultText);
    // UnknownEnvironment error if there is no such environment
    static Result<Environment> read(const Site& site, const std::string& name);
    static bool exists(const Site& site, const std::string& name);
    // Sorted environment names
    static Result<std::vector<std::string>> list(const Site& site);
    static Status destroy(const Site& site, const std::string& name);

    Environment(Environment&&) = default;
    Environment& operator=(Environment&&) = default;

    // --- user specs ---

    // Duplicate error if a spec of the same name is already present
    Status add(const std::string& spec_str);
    // Drops the matching user spec and its concretized root. The concrete
    // specs stay in specs_by_hash() until the next concretize().
    Status remove(const std::string& spec_str);

    // --- resolution ---

    // Resolve every user spec, reusing the previous concrete specs wherever
    // they still satisfy the request. `force` resolves from scratch.
    Status concretize(bool force = false);
    // Re-resolve `name` to the best available candidate, ignoring its
    // current pin and any version constraint on it. Only `name` and its
    // dependents change.
    Status upgrade_dependency(const std::string& name);
    // Choose compiler and operating system of every node again, using
    // compiler `compiler` when given. Versions and variants are kept.
    Status reset_os_and_compiler(const std::optional<std::string>& compiler = std::nullopt);

    // --- reporting and collaborators ---

    // Each user spec, and for concretized ones the concrete spec, its short
    // hash, install state (when `builder` is given) and dependency tree
    void status(std::ostream& out, const BuildCollaborator* builder = nullptr) const;
    // Concretizes first when user specs changed since the last concretize()
    Result<InstallReport> install(BuildCollaborator& builder, InstallDatabase& db,
                                  InstallOptions options = {});
    // Dependents first; returns the removed hashes
    Result<std::vector<std::string>> uninstall(BuildCollaborator& builder, InstallDatabase& db);
    Status stage(StageCollaborator& stager) const;
    // Writes `loads` and returns its path
    Result<std::string> loads() const;

    // --- persistence ---

    LockFile to_lockfile() const;
    Status from_lockfile(const LockFile& lock);
    // Manifest and lockfile, each replaced atomically
    Status write() const;

    // --- state ---

    const std::string& name() const { return name_; }
    const std::string& path() const { return path_; }
    std::string manifest_path() const;
    std::string lockfile_path() const;
    std::string repo_path() const;

    const std::vector<Spec>& user_specs() const { return user_specs_; }
    const std::vector<Spec>& concretized_user_specs() const { return concretized_user_specs_; }
    const std::vector<std::string>& concretized_order() const { return concretized_order_; }
    const std::map<std::string, SpecPtr>& specs_by_hash() const { return specs_by_hash_; }

    // Concrete roots in concretized_order()
    std::vector<SpecPtr> roots() const;
    // Closure of the current roots, dependencies first
    Result<std::vector<SpecPtr>> environment_specs() const;
    // True when user specs differ from those last concretized
    bool needs_concretize() const;

    const RepositoryOverlay& repo() const { return *repo_; }
    RepositoryOverlay& repo() { return *repo_; }
    const ConfigScopeStack& config() const { return *config_; }
    const PackagePreferences& preferences() const { return *prefs_; }

    // Rebuild the configuration stack: site base scopes, then includes in
    // listed order, then the manifest's inline scope. Re-reads included
    // files and drops cached preferences.
    Status prepare_config_scope();

private:
    Environment(const Site& site, std::string name, std::string path);

    Status load_manifest(Manifest manifest);
    Status run_concretizer(const ConcretizeOptions& options);
    // Every root and every reachable dependency is in specs_by_hash_
    Status check_closure() const;

    Site site_;
    std::string name_;
    std::string path_;
    Manifest manifest_;

    std::vector<Spec> user_specs_;
    std::vector<Spec> concretized_user_specs_;
    std::vector<std::string> concretized_order_;
    std::map<std::string, SpecPtr> specs_by_hash_;

    // Heap-held so references between them survive moves
    std::unique_ptr<ConfigScopeStack> config_;
    std::unique_ptr<PackagePreferences> prefs_;
    std::unique_ptr<RepositoryOverlay> repo_;
};

} // namespace pinfold
