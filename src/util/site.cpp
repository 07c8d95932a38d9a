#include <pinfold/site.hpp>
#include <pinfold/log.hpp>

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <thread>
#include <sys/utsname.h>

namespace fs = std::filesystem;

namespace pinfold {

Site::Site(std::string root,
           std::shared_ptr<const Repository> repo,
           std::vector<ConfigScope> base_scopes)
    : root_(std::move(root)), repo_(std::move(repo)), base_scopes_(std::move(base_scopes)) {}

std::string Site::environments_dir() const {
    return (fs::path(root_) / "environments").string();
}

std::string Site::environment_dir(const std::string& name) const {
    return (fs::path(environments_dir()) / name).string();
}

std::string Site::install_root() const {
    return (fs::path(root_) / "opt").string();
}

std::string Site::stage_root() const {
    return (fs::path(root_) / "stage").string();
}

std::string Site::install_db_path() const {
    return (fs::path(root_) / "db" / "install.sqlite").string();
}

// ---------------------------------------------------------------------------
// Host detection
// ---------------------------------------------------------------------------

static std::string lowercase(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

static std::string unquote(std::string s) {
    if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'') && s.back() == s.front()) {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

// "<ID><major VERSION_ID>" from /etc/os-release, e.g. "debian12", "rhel8"
static std::string detect_os() {
    std::ifstream in("/etc/os-release");
    std::string id, version;
    std::string line;
    while (std::getline(in, line)) {
        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string value = unquote(line.substr(eq + 1));
        if (key == "ID") id = value;
        else if (key == "VERSION_ID") version = value.substr(0, value.find('.'));
    }
    // '-' separates arch fields
    std::replace(id.begin(), id.end(), '-', '_');
    return id.empty() ? "unknown" : id + version;
}

ConfigScope Site::builtin_defaults() {
    ConfigScope scope;
    scope.name = "defaults";
    scope.source = "<builtin>";

    struct utsname host;
    if (::uname(&host) == 0) {
        scope.data.config.platform = lowercase(host.sysname);
        std::string machine = host.machine;
        std::replace(machine.begin(), machine.end(), '-', '_');
        scope.data.config.target = machine;
    } else {
        log::debug("uname failed; platform and target left unset");
    }
    scope.data.config.os = detect_os();

    unsigned cpus = std::thread::hardware_concurrency();
    scope.data.config.build_jobs = cpus > 0 ? static_cast<int>(cpus) : 1;
    return scope;
}

// ---------------------------------------------------------------------------
// Construction
// ---------------------------------------------------------------------------

Result<Site> Site::from_environment() {
    if (const char* root = std::getenv("PINFOLD_ROOT")) {
        if (*root) return Site::open(root);
    }
    const char* home = std::getenv("HOME");
    if (!home || !*home) {
        return PinfoldError{PinfoldError::InvalidArg,
            "cannot locate the pinfold root",
            "set PINFOLD_ROOT or HOME"};
    }
    return Site::open((fs::path(home) / ".pinfold").string());
}

Result<Site> Site::open(const std::string& root) {
    std::shared_ptr<const Repository> repo;
    fs::path repo_dir = fs::path(root) / "repos" / "builtin";
    std::error_code ec;
    if (fs::exists(repo_dir / "repo.toml", ec)) {
        PINFOLD_TRY_ASSIGN(Repository loaded, Repository::load(repo_dir.string()));
        log::debug("loaded %zu recipes from %s", loaded.size(), repo_dir.string().c_str());
        repo = std::make_shared<const Repository>(std::move(loaded));
    } else {
        log::debug("no base repository at %s", repo_dir.string().c_str());
        repo = std::make_shared<const Repository>("builtin");
    }

    std::vector<ConfigScope> scopes;
    scopes.push_back(builtin_defaults());

    PINFOLD_TRY_ASSIGN(ConfigScope site_scope,
        ConfigScope::from_directory("site", (fs::path(root) / "etc" / "pinfold").string()));
    scopes.push_back(std::move(site_scope));

    if (const char* home = std::getenv("HOME")) {
        PINFOLD_TRY_ASSIGN(ConfigScope user_scope,
            ConfigScope::from_directory("user", (fs::path(home) / ".config" / "pinfold").string()));
        scopes.push_back(std::move(user_scope));
    }

    return Result<Site>::ok(Site(root, std::move(repo), std::move(scopes)));
}

} // namespace pinfold
