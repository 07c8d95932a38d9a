#pragma once

#include <pinfold/config.hpp>
#include <pinfold/repository.hpp>
#include <pinfold/result.hpp>
#include <memory>
#include <string>
#include <vector>

namespace pinfold {

// Process context shared by every environment: where state lives, the base
// package repository and the configuration scopes underneath each
// environment's own. Passed explicitly; there is no global instance.
//
// Layout under the root:
//   environments/<name>/   one directory per environment
//   repos/builtin/         base repository
//   etc/pinfold/           site configuration scope
//   opt/                   install prefixes
//   stage/                 staged sources
//   db/install.sqlite      install records and claims
class Site {
public:
    Site(std::string root,
         std::shared_ptr<const Repository> repo,
         std::vector<ConfigScope> base_scopes);

    // Root from PINFOLD_ROOT, else $HOME/.pinfold
    static Result<Site> from_environment();

    // Loads <root>/repos/builtin (empty when absent) and the base scopes:
    // built-in defaults, <root>/etc/pinfold, $HOME/.config/pinfold
    static Result<Site> open(const std::string& root);

    // platform/os/target of this machine and build_jobs from the CPU count
    static ConfigScope builtin_defaults();

    const std::string& root() const { return root_; }
    std::string environments_dir() const;
    std::string environment_dir(const std::string& name) const;
    std::string install_root() const;
    std::string stage_root() const;
    std::string install_db_path() const;

    const std::shared_ptr<const Repository>& repository() const { return repo_; }
    // Lowest precedence first
    const std::vector<ConfigScope>& base_scopes() const { return base_scopes_; }

private:
    std::string root_;
    std::shared_ptr<const Repository> repo_;
    std::vector<ConfigScope> base_scopes_;
};

} // namespace pinfold
