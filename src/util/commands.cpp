#include <pinfold/commands.hpp>
#include <pinfold/environment.hpp>
#include <pinfold/install_db.hpp>
#include <pinfold/installer.hpp>

#include <cstdlib>

namespace pinfold::commands {

Result<std::string> resolve_env_name(const std::string& command, const EnvArgs& args) {
    if (args.flag && !args.flag->empty()) return Result<std::string>::ok(*args.flag);
    if (args.positional && !args.positional->empty()) return Result<std::string>::ok(*args.positional);
    if (const char* active = std::getenv("PINFOLD_ENV")) {
        if (*active) return Result<std::string>::ok(active);
    }
    return PinfoldError{PinfoldError::Command,
        "'pinfold env " + command + "' requires an environment",
        "pass -e <name>, name it as an argument, or set PINFOLD_ENV"};
}

static Result<Environment> open_env(const Site& site, const std::string& command,
                                    const EnvArgs& args) {
    PINFOLD_TRY_ASSIGN(std::string name, resolve_env_name(command, args));
    return Environment::read(site, name);
}

static Status require_name(const std::string& command, const std::optional<std::string>& name) {
    if (!name || name->empty()) {
        return PinfoldError{PinfoldError::Command,
            "'pinfold env " + command + "' requires an environment name"};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

Status create(const Site& site, const std::optional<std::string>& name,
              const std::optional<std::string>& manifest_file, std::ostream& out) {
    PINFOLD_TRY(require_name("create", name));

    std::string text = Manifest::kDefaultText;
    if (manifest_file) {
        // Validated here so errors point at the user's file, not the copy
        PINFOLD_TRY_ASSIGN(Manifest manifest, Manifest::load(*manifest_file));
        text = manifest.text;
    }
    PINFOLD_TRY_ASSIGN(Environment env, Environment::create(site, *name, text));
    out << "Created environment '" << env.name() << "' in " << env.path() << "\n";
    return ok_status();
}

Status destroy(const Site& site, const std::optional<std::string>& name, std::ostream& out) {
    PINFOLD_TRY(require_name("destroy", name));
    PINFOLD_TRY(Environment::destroy(site, *name));
    out << "Destroyed environment '" << *name << "'\n";
    return ok_status();
}

Status list(const Site& site, std::ostream& out) {
    PINFOLD_TRY_ASSIGN(std::vector<std::string> names, Environment::list(site));
    if (names.empty()) {
        out << "No environments\n";
        return ok_status();
    }
    for (const auto& name : names) out << name << "\n";
    return ok_status();
}

// ---------------------------------------------------------------------------
// Spec edits and resolution
// ---------------------------------------------------------------------------

Status add(const Site& site, const EnvArgs& env_args, const std::vector<std::string>& specs,
           std::ostream& out) {
    PINFOLD_TRY_ASSIGN(Environment env, open_env(site, "add", env_args));
    for (const auto& spec : specs) {
        PINFOLD_TRY(env.add(spec));
        out << "Added " << spec << " to environment '" << env.name() << "'\n";
    }
    return env.write();
}

Status remove(const Site& site, const EnvArgs& env_args, const std::vector<std::string>& specs,
              std::ostream& out) {
    PINFOLD_TRY_ASSIGN(Environment env, open_env(site, "remove", env_args));
    for (const auto& spec : specs) {
        PINFOLD_TRY(env.remove(spec));
        out << "Removed " << spec << " from environment '" << env.name() << "'\n";
    }
    return env.write();
}

Status concretize(const Site& site, const EnvArgs& env_args, bool force, std::ostream& out) {
    PINFOLD_TRY_ASSIGN(Environment env, open_env(site, "concretize", env_args));
    PINFOLD_TRY(env.concretize(force));
    PINFOLD_TRY(env.write());
    out << "Concretized " << env.concretized_order().size() << " roots ("
        << env.specs_by_hash().size() << " specs) in environment '" << env.name() << "'\n";
    return ok_status();
}

Status status(const Site& site, const EnvArgs& env_args, std::ostream& out) {
    PINFOLD_TRY_ASSIGN(Environment env, open_env(site, "status", env_args));
    FakeBuilder builder(site.install_root());
    env.status(out, &builder);
    return ok_status();
}

// ---------------------------------------------------------------------------
// Collaborators
// ---------------------------------------------------------------------------

Status install(const Site& site, const EnvArgs& env_args, int jobs, std::ostream& out) {
    PINFOLD_TRY_ASSIGN(Environment env, open_env(site, "install", env_args));

    InstallDatabase db;
    PINFOLD_TRY(db.open(site.install_db_path()));
    FakeBuilder builder(site.install_root());

    InstallOptions options;
    options.jobs = jobs;
    PINFOLD_TRY_ASSIGN(InstallReport report, env.install(builder, db, options));
    out << "Installed " << report.installed.size() << " packages ("
        << report.reused.size() << " already installed) for environment '"
        << env.name() << "'\n";
    return ok_status();
}

Status uninstall(const Site& site, const EnvArgs& env_args, std::ostream& out) {
    PINFOLD_TRY_ASSIGN(Environment env, open_env(site, "uninstall", env_args));

    InstallDatabase db;
    PINFOLD_TRY(db.open(site.install_db_path()));
    FakeBuilder builder(site.install_root());

    PINFOLD_TRY_ASSIGN(std::vector<std::string> removed, env.uninstall(builder, db));
    out << "Uninstalled " << removed.size() << " packages from environment '"
        << env.name() << "'\n";
    return ok_status();
}

Status stage(const Site& site, const EnvArgs& env_args, std::ostream& out) {
    PINFOLD_TRY_ASSIGN(Environment env, open_env(site, "stage", env_args));
    DirectoryStager stager(site.stage_root());
    PINFOLD_TRY(env.stage(stager));
    out << "Staged environment '" << env.name() << "' in " << site.stage_root() << "\n";
    return ok_status();
}

Status loads(const Site& site, const EnvArgs& env_args, std::ostream& out) {
    PINFOLD_TRY_ASSIGN(Environment env, open_env(site, "loads", env_args));
    PINFOLD_TRY_ASSIGN(std::string path, env.loads());
    out << "Wrote " << path << "\n";
    return ok_status();
}

} // namespace pinfold::commands
