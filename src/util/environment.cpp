#include <pinfold/environment.hpp>
#include <pinfold/fs_util.hpp>
#include <pinfold/log.hpp>

#include <algorithm>
#include <filesystem>
#include <set>
#include <sstream>

namespace fs = std::filesystem;

namespace pinfold {

static Status validate_env_name(const std::string& name) {
    if (name.empty() || name[0] == '.' ||
        name.find_first_of("/\\ \t") != std::string::npos) {
        return PinfoldError{PinfoldError::InvalidArg,
            "invalid environment name '" + name + "'",
            "names may not be empty, start with '.', or contain '/' or whitespace"};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

Environment::Environment(const Site& site, std::string name, std::string path)
    : site_(site), name_(std::move(name)), path_(std::move(path)),
      config_(std::make_unique<ConfigScopeStack>()),
      prefs_(std::make_unique<PackagePreferences>(*config_)),
      repo_(std::make_unique<RepositoryOverlay>(site.repository(), name_)) {}

std::string Environment::manifest_path() const {
    return (fs::path(path_) / Manifest::kFileName).string();
}

std::string Environment::lockfile_path() const {
    return (fs::path(path_) / kLockFileName).string();
}

std::string Environment::repo_path() const {
    return (fs::path(path_) / "repo").string();
}

Status Environment::load_manifest(Manifest manifest) {
    manifest_ = std::move(manifest);
    user_specs_.clear();
    for (const auto& text : manifest_.specs) {
        PINFOLD_TRY_ASSIGN(Spec spec, Spec::parse(text));
        user_specs_.push_back(std::move(spec));
    }
    PINFOLD_TRY(repo_->load_local(repo_path()));
    return prepare_config_scope();
}

Result<Environment> Environment::make(const Site& site, const std::string& name,
                                      const std::string& manifest_text) {
    PINFOLD_TRY(validate_env_name(name));
    Environment env(site, name, site.environment_dir(name));
    PINFOLD_TRY_ASSIGN(Manifest manifest, Manifest::parse(manifest_text));
    PINFOLD_TRY(env.load_manifest(std::move(manifest)));
    return Result<Environment>::ok(std::move(env));
}

Result<Environment> Environment::create(const Site& site, const std::string& name,
                                        const std::string& manifest_text) {
    PINFOLD_TRY(validate_env_name(name));
    if (exists(site, name)) {
        return PinfoldError{PinfoldError::Duplicate,
            "environment '" + name + "' already exists",
            "use 'pinfold env destroy " + name + "' first"};
    }

    std::error_code ec;
    fs::create_directories(site.environment_dir(name), ec);
    if (ec) {
        return PinfoldError{PinfoldError::IO,
            "cannot create " + site.environment_dir(name) + ": " + ec.message()};
    }

    // The manifest is written as given so its comments and layout survive
    auto written = atomic_write_file(
        (fs::path(site.environment_dir(name)) / Manifest::kFileName).string(), manifest_text);
    if (written.is_ok()) {
        auto env = read(site, name);
        if (env.is_ok()) {
            log::info("created environment '%s' in %s",
                      name.c_str(), site.environment_dir(name).c_str());
            return env;
        }
        written = std::move(env).error();
    }

    std::error_code cleanup_ec;
    fs::remove_all(site.environment_dir(name), cleanup_ec);
    if (cleanup_ec) {
        log::warn("could not remove %s: %s",
                  site.environment_dir(name).c_str(), cleanup_ec.message().c_str());
    }
    return std::move(written).error();
}

Result<Environment> Environment::read(const Site& site, const std::string& name) {
    PINFOLD_TRY(validate_env_name(name));
    if (!exists(site, name)) {
        return PinfoldError{PinfoldError::UnknownEnvironment,
            "no such environment: '" + name + "'",
            "run 'pinfold env list' to see the environments"};
    }

    Environment env(site, name, site.environment_dir(name));
    PINFOLD_TRY_ASSIGN(Manifest manifest, Manifest::load(env.manifest_path()));
    PINFOLD_TRY(env.load_manifest(std::move(manifest)));

    std::error_code ec;
    if (fs::exists(env.lockfile_path(), ec)) {
        PINFOLD_TRY_ASSIGN(LockFile lock, LockFile::load(env.lockfile_path()));
        PINFOLD_TRY(env.from_lockfile(lock));
    }
    log::debug("read environment '%s' (%zu user specs, %zu concrete specs)",
               name.c_str(), env.user_specs_.size(), env.specs_by_hash_.size());
    return Result<Environment>::ok(std::move(env));
}

bool Environment::exists(const Site& site, const std::string& name) {
    if (validate_env_name(name).is_err()) return false;
    std::error_code ec;
    return fs::is_regular_file(fs::path(site.environment_dir(name)) / Manifest::kFileName, ec);
}

Result<std::vector<std::string>> Environment::list(const Site& site) {
    std::vector<std::string> names;
    std::error_code ec;
    if (!fs::is_directory(site.environments_dir(), ec)) {
        return Result<std::vector<std::string>>::ok(std::move(names));
    }
    for (const auto& entry : fs::directory_iterator(site.environments_dir(), ec)) {
        std::string name = entry.path().filename().string();
        if (entry.is_directory() && exists(site, name)) names.push_back(name);
    }
    if (ec) {
        return PinfoldError{PinfoldError::IO,
            "cannot list " + site.environments_dir() + ": " + ec.message()};
    }
    std::sort(names.begin(), names.end());
    return Result<std::vector<std::string>>::ok(std::move(names));
}

Status Environment::destroy(const Site& site, const std::string& name) {
    if (!exists(site, name)) {
        return PinfoldError{PinfoldError::UnknownEnvironment,
            "no such environment: '" + name + "'"};
    }
    std::error_code ec;
    fs::remove_all(site.environment_dir(name), ec);
    if (ec) {
        return PinfoldError{PinfoldError::IO,
            "cannot remove " + site.environment_dir(name) + ": " + ec.message()};
    }
    log::info("destroyed environment '%s'", name.c_str());
    return ok_status();
}

// ---------------------------------------------------------------------------
// Configuration
// ---------------------------------------------------------------------------

Status Environment::prepare_config_scope() {
    config_->clear();
    for (const auto& scope : site_.base_scopes()) {
        PINFOLD_TRY(config_->push(scope));
    }

    for (size_t i = 0; i < manifest_.includes.size(); ++i) {
        fs::path include = manifest_.includes[i];
        if (include.is_relative()) include = fs::path(path_) / include;
        include = include.lexically_normal();
        std::string scope_name = "include:" + std::to_string(i) + ":" + manifest_.includes[i];

        // Included files may be written after the manifest that names them
        std::error_code ec;
        if (!fs::exists(include, ec)) {
            log::debug("included config %s does not exist yet", include.string().c_str());
            ConfigScope empty;
            empty.name = scope_name;
            empty.source = include.string();
            PINFOLD_TRY(config_->push(std::move(empty)));
            continue;
        }
        PINFOLD_TRY_ASSIGN(ConfigScope scope, ConfigScope::from_path(scope_name, include.string()));
        PINFOLD_TRY(config_->push(std::move(scope)));
    }

    ConfigScope inline_scope;
    inline_scope.name = "env:" + name_;
    inline_scope.source = manifest_.source;
    inline_scope.data = manifest_.inline_config;
    PINFOLD_TRY(config_->push(std::move(inline_scope)));

    prefs_->invalidate();
    return ok_status();
}

// ---------------------------------------------------------------------------
// User specs
// ---------------------------------------------------------------------------

Status Environment::add(const std::string& spec_str) {
    PINFOLD_TRY_ASSIGN(Spec spec, Spec::parse(spec_str));
    if (spec.is_anonymous()) {
        return PinfoldError{PinfoldError::InvalidArg,
            "cannot add '" + spec_str + "': no package name"};
    }
    for (const auto& existing : user_specs_) {
        if (existing.name() == spec.name()) {
            return PinfoldError{PinfoldError::Duplicate,
                "environment '" + name_ + "' already contains '" + existing.to_string() + "'",
                "remove it first to change its constraints"};
        }
    }
    log::debug("adding '%s' to environment '%s'", spec_str.c_str(), name_.c_str());
    user_specs_.push_back(std::move(spec));
    return ok_status();
}

Status Environment::remove(const std::string& spec_str) {
    PINFOLD_TRY_ASSIGN(Spec query, Spec::parse(spec_str));

    auto it = std::find_if(user_specs_.begin(), user_specs_.end(),
                           [&](const Spec& s) { return s.name() == query.name(); });
    if (it == user_specs_.end()) {
        return PinfoldError{PinfoldError::NotFound,
            "environment '" + name_ + "' has no spec matching '" + spec_str + "'"};
    }
    user_specs_.erase(it);

    for (size_t i = 0; i < concretized_user_specs_.size(); ++i) {
        if (concretized_user_specs_[i].name() == query.name()) {
            concretized_user_specs_.erase(concretized_user_specs_.begin() + static_cast<long>(i));
            concretized_order_.erase(concretized_order_.begin() + static_cast<long>(i));
            break;
        }
    }
    log::debug("removed '%s' from environment '%s'", spec_str.c_str(), name_.c_str());
    return ok_status();
}

// ---------------------------------------------------------------------------
// Resolution
// ---------------------------------------------------------------------------

Status Environment::run_concretizer(const ConcretizeOptions& options) {
    std::vector<RootRequest> requests;
    for (const auto& spec : user_specs_) {
        requests.push_back(RootRequest{spec,
            "'" + spec.to_string() + "' in environment '" + name_ + "'"});
    }

    Concretizer concretizer(*repo_, *prefs_, *config_);
    PINFOLD_TRY_ASSIGN(ConcretizeResult result, concretizer.concretize(requests, options));

    concretized_user_specs_ = user_specs_;
    concretized_order_.clear();
    for (const auto& root : result.roots) {
        concretized_order_.push_back(root->hash());
    }
    // Only the closure of the new roots survives
    specs_by_hash_ = std::move(result.specs_by_hash);

    PINFOLD_TRY(check_closure());
    log::info("concretized %zu roots (%zu specs) in environment '%s'",
              concretized_order_.size(), specs_by_hash_.size(), name_.c_str());
    return ok_status();
}

Status Environment::concretize(bool force) {
    ConcretizeOptions options;
    if (force) {
        concretized_user_specs_.clear();
        concretized_order_.clear();
        specs_by_hash_.clear();
    } else {
        PINFOLD_TRY_ASSIGN(options.pinned, environment_specs());
    }
    return run_concretizer(options);
}

Status Environment::upgrade_dependency(const std::string& name) {
    PINFOLD_TRY_ASSIGN(std::vector<SpecPtr> current, environment_specs());
    bool present = std::any_of(current.begin(), current.end(),
                               [&](const SpecPtr& s) { return s->name() == name; });
    if (!present) {
        return PinfoldError{PinfoldError::NotFound,
            "environment '" + name_ + "' has no concrete spec named '" + name + "'",
            "concretize the environment first"};
    }

    ConcretizeOptions options;
    options.pinned = std::move(current);
    options.unpinned.insert(name);
    options.relaxed_versions.insert(name);
    log::info("upgrading '%s' in environment '%s'", name.c_str(), name_.c_str());
    return run_concretizer(options);
}

Status Environment::reset_os_and_compiler(const std::optional<std::string>& compiler) {
    ConcretizeOptions options;
    PINFOLD_TRY_ASSIGN(options.pinned, environment_specs());
    options.repick_compiler_and_arch = true;
    if (compiler) {
        auto entries = config_->compilers();
        bool known = std::any_of(entries.begin(), entries.end(),
                                 [&](const CompilerEntry& e) { return e.spec.name == *compiler; });
        if (!known) {
            return PinfoldError{PinfoldError::NotFound,
                "unknown compiler '" + *compiler + "'",
                "add it to the [[compilers]] configuration"};
        }
        options.force_compiler = *compiler;
    }
    log::info("re-resolving compilers of environment '%s'", name_.c_str());
    return run_concretizer(options);
}

bool Environment::needs_concretize() const {
    if (user_specs_.size() != concretized_user_specs_.size()) return true;
    for (size_t i = 0; i < user_specs_.size(); ++i) {
        if (user_specs_[i].to_string() != concretized_user_specs_[i].to_string()) return true;
    }
    return false;
}

std::vector<SpecPtr> Environment::roots() const {
    std::vector<SpecPtr> out;
    for (const auto& hash : concretized_order_) {
        auto it = specs_by_hash_.find(hash);
        if (it != specs_by_hash_.end()) out.push_back(it->second);
    }
    return out;
}

Result<std::vector<SpecPtr>> Environment::environment_specs() const {
    PINFOLD_TRY(check_closure());
    return dependency_order(roots());
}

Status Environment::check_closure() const {
    for (const auto& hash : concretized_order_) {
        auto it = specs_by_hash_.find(hash);
        if (it == specs_by_hash_.end()) {
            log::error("environment '%s': root %s has no concrete spec",
                       name_.c_str(), hash.c_str());
            return PinfoldError{PinfoldError::Internal,
                "root " + hash + " of environment '" + name_ + "' is missing"};
        }
        for (const auto& node : traverse(it->second)) {
            if (!specs_by_hash_.count(node->hash())) {
                log::error("environment '%s': %s/%s is reachable but not recorded",
                           name_.c_str(), node->name().c_str(), node->hash().c_str());
                return PinfoldError{PinfoldError::Internal,
                    "dependency " + node->hash() + " of environment '" + name_ + "' is missing"};
            }
        }
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// Reporting and collaborators
// ---------------------------------------------------------------------------

void Environment::status(std::ostream& out, const BuildCollaborator* builder) const {
    out << "Environment " << name_ << "\n";
    if (user_specs_.empty()) {
        out << "  (no specs)\n";
        return;
    }

    std::map<std::string, SpecPtr> concrete;
    for (size_t i = 0; i < concretized_user_specs_.size(); ++i) {
        auto it = specs_by_hash_.find(concretized_order_[i]);
        if (it != specs_by_hash_.end()) {
            concrete[concretized_user_specs_[i].to_string()] = it->second;
        }
    }

    for (const auto& user : user_specs_) {
        out << "  " << user.to_string() << "\n";
        auto it = concrete.find(user.to_string());
        if (it == concrete.end()) {
            out << "      (not concretized)\n";
            continue;
        }
        const Spec& spec = *it->second;
        out << "      /" << spec.short_hash();
        if (builder) {
            out << (builder->is_installed(spec) ? "  [installed]" : "  [not installed]");
        }
        out << "\n" << spec.tree("      ");
    }
}

Result<InstallReport> Environment::install(BuildCollaborator& builder, InstallDatabase& db,
                                           InstallOptions options) {
    if (needs_concretize()) {
        PINFOLD_TRY(concretize());
        PINFOLD_TRY(write());
    }
    if (options.jobs < 1) {
        options.jobs = config_->settings().build_jobs.value_or(1);
    }

    Installer installer(builder, db, options);
    InstallReport report = installer.install(roots());
    log::info("environment '%s': %zu installed, %zu already installed",
              name_.c_str(), report.installed.size(), report.reused.size());
    if (!report.ok()) return report.to_error();
    return Result<InstallReport>::ok(std::move(report));
}

Result<std::vector<std::string>> Environment::uninstall(BuildCollaborator& builder,
                                                        InstallDatabase& db) {
    Installer installer(builder, db);
    return installer.uninstall(roots());
}

Status Environment::stage(StageCollaborator& stager) const {
    PINFOLD_TRY_ASSIGN(std::vector<SpecPtr> specs, environment_specs());
    for (const auto& spec : specs) {
        PINFOLD_TRY(stager.stage(*spec));
    }
    return ok_status();
}

Result<std::string> Environment::loads() const {
    PINFOLD_TRY_ASSIGN(std::vector<SpecPtr> specs, environment_specs());

    std::ostringstream out;
    for (const auto& spec : specs) {
        out << "module load " << spec->name() << "-" << spec->version().to_string();
        if (spec->compiler()) {
            out << "-" << spec->compiler()->name << "-"
                << spec->compiler()->versions.to_string();
        }
        out << "-" << spec->short_hash() << "\n";
    }

    std::string path = (fs::path(path_) / "loads").string();
    PINFOLD_TRY(atomic_write_file(path, out.str()));
    return Result<std::string>::ok(std::move(path));
}

// ---------------------------------------------------------------------------
// Persistence
// ---------------------------------------------------------------------------

LockFile Environment::to_lockfile() const {
    LockFile lock;
    for (size_t i = 0; i < concretized_order_.size(); ++i) {
        lock.roots.push_back(LockedRoot{concretized_order_[i],
                                        concretized_user_specs_[i].to_string()});
    }
    lock.specs_by_hash = specs_by_hash_;
    return lock;
}

Status Environment::from_lockfile(const LockFile& lock) {
    std::vector<Spec> user_specs;
    std::vector<std::string> order;
    for (const auto& root : lock.roots) {
        PINFOLD_TRY_ASSIGN(Spec spec, Spec::parse(root.spec));
        user_specs.push_back(std::move(spec));
        order.push_back(root.hash);
    }

    concretized_user_specs_ = std::move(user_specs);
    concretized_order_ = std::move(order);
    specs_by_hash_ = lock.specs_by_hash;
    return check_closure();
}

Status Environment::write() const {
    std::error_code ec;
    fs::create_directories(path_, ec);
    if (ec) {
        return PinfoldError{PinfoldError::IO,
            "cannot create " + path_ + ": " + ec.message()};
    }

    std::vector<std::string> specs;
    for (const auto& spec : user_specs_) specs.push_back(spec.to_string());
    PINFOLD_TRY_ASSIGN(std::string text, manifest_.render(specs));
    PINFOLD_TRY(atomic_write_file(manifest_path(), text));
    PINFOLD_TRY(to_lockfile().save(lockfile_path()));
    log::debug("wrote environment '%s'", name_.c_str());
    return ok_status();
}

} // namespace pinfold
