#pragma once

#include <pinfold/result.hpp>
#include <pinfold/site.hpp>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace pinfold::commands {

// Where a command may find its environment name
struct EnvArgs {
    std::optional<std::string> flag;        // -e/--env
    std::optional<std::string> positional;  // trailing name argument
};

// Flag, then positional, then PINFOLD_ENV. Command error when none is set.
Result<std::string> resolve_env_name(const std::string& command, const EnvArgs& args);

// `manifest_file` seeds the new environment's pinfold.toml
Status create(const Site& site, const std::optional<std::string>& name,
              const std::optional<std::string>& manifest_file, std::ostream& out);
Status destroy(const Site& site, const std::optional<std::string>& name, std::ostream& out);
Status list(const Site& site, std::ostream& out);

Status add(const Site& site, const EnvArgs& env, const std::vector<std::string>& specs,
           std::ostream& out);
Status remove(const Site& site, const EnvArgs& env, const std::vector<std::string>& specs,
              std::ostream& out);
Status concretize(const Site& site, const EnvArgs& env, bool force, std::ostream& out);
Status status(const Site& site, const EnvArgs& env, std::ostream& out);

// Install into <site>/opt with the prefix-creating builder; `jobs` of 0
// uses config.build_jobs
Status install(const Site& site, const EnvArgs& env, int jobs, std::ostream& out);
Status uninstall(const Site& site, const EnvArgs& env, std::ostream& out);
Status stage(const Site& site, const EnvArgs& env, std::ostream& out);
Status loads(const Site& site, const EnvArgs& env, std::ostream& out);

} // namespace pinfold::commands
