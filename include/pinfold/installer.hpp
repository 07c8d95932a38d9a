#pragma once

#include <pinfold/install_db.hpp>
#include <pinfold/result.hpp>
#include <pinfold/spec.hpp>
#include <chrono>
#include <string>
#include <vector>

namespace pinfold {

// ---------------------------------------------------------------------------
// Collaborators
// ---------------------------------------------------------------------------

// Package build logic. Called once per hash, dependencies first.
class BuildCollaborator {
public:
    virtual ~BuildCollaborator() = default;

    virtual Status install(const Spec& spec) = 0;
    virtual bool is_installed(const Spec& spec) const = 0;
    virtual Status uninstall(const Spec& spec) = 0;

    // Where `spec` is installed, recorded in the install database
    virtual std::string prefix(const Spec& spec) const = 0;
};

// Source fetch and staging
class StageCollaborator {
public:
    virtual ~StageCollaborator() = default;
    virtual Status stage(const Spec& spec) = 0;
};

// "<name>-<version>-<hash>"
std::string install_dir_name(const Spec& spec);

// Creates <install_root>/<name>-<version>-<hash>/.pinfold/spec.toml holding
// the spec's attributes. Nothing is built.
class FakeBuilder : public BuildCollaborator {
public:
    explicit FakeBuilder(std::string install_root) : root_(std::move(install_root)) {}

    Status install(const Spec& spec) override;
    bool is_installed(const Spec& spec) const override;
    Status uninstall(const Spec& spec) override;
    std::string prefix(const Spec& spec) const override;

private:
    std::string root_;
};

// Creates an empty <stage_root>/<name>-<version>-<hash> directory.
class DirectoryStager : public StageCollaborator {
public:
    explicit DirectoryStager(std::string stage_root) : root_(std::move(stage_root)) {}

    Status stage(const Spec& spec) override;
    std::string stage_path(const Spec& spec) const;

private:
    std::string root_;
};

// ---------------------------------------------------------------------------
// Installer
// ---------------------------------------------------------------------------

struct InstallFailure {
    std::string hash;
    std::string name;
    std::string message;
};

// Outcome of one install run. Every list is in dependency order.
struct InstallReport {
    std::vector<std::string> installed;  // built by this run
    std::vector<std::string> reused;     // already installed
    std::vector<InstallFailure> failed;
    std::vector<std::string> skipped;    // a dependency failed

    bool ok() const { return failed.empty() && skipped.empty(); }
    // BuildFailure naming every failed hash
    PinfoldError to_error() const;
};

struct InstallOptions {
    int jobs = 1;
    // Claim owner; defaults to "pid:<pid>"
    std::string owner;
    // How often a node held by another owner is re-checked
    std::chrono::milliseconds poll_interval{100};
};

// Installs a closure of concrete specs with a pool of worker threads.
//
// A node starts only after every one of its dependencies succeeded. When a
// node fails, its dependents are skipped, but independent subtrees keep
// going. Each hash is claimed in the install database before it is built,
// so two environments (or processes) sharing a dependency never build it
// twice; the loser of the claim waits for the winner.
class Installer {
public:
    Installer(BuildCollaborator& builder, InstallDatabase& db, InstallOptions options = {});

    // `roots` and everything they depend on
    InstallReport install(const std::vector<SpecPtr>& roots);

    // Dependents first. Returns the hashes that were removed.
    Result<std::vector<std::string>> uninstall(const std::vector<SpecPtr>& roots);

private:
    enum class Outcome { Installed, Reused, Failed };
    Outcome install_one(const Spec& spec, std::string& message);

    BuildCollaborator& builder_;
    InstallDatabase& db_;
    InstallOptions options_;
};

} // namespace pinfold
