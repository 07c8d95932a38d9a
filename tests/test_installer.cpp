#include <catch2/catch.hpp>
#include <pinfold/concretizer.hpp>
#include <pinfold/installer.hpp>
#include "mock_repo.hpp"

#include <algorithm>
#include <filesystem>
#include <map>
#include <mutex>
#include <thread>

using namespace pinfold;
using pinfold::testing::TempDir;

namespace fs = std::filesystem;

namespace {

SpecPtr concretize(const std::string& text) {
    RepositoryOverlay repo{pinfold::testing::mock_repository(), "test"};
    ConfigScopeStack config = pinfold::testing::mock_config();
    PackagePreferences prefs{config};
    Concretizer concretizer{repo, prefs, config};
    auto r = concretizer.concretize_one(Spec::parse(text).value());
    if (r.is_err()) FAIL(r.error().format());
    return r.value();
}

std::string hash_of(const SpecPtr& root, const std::string& name) {
    SpecPtr node = root->name() == name ? root : root->find(name);
    REQUIRE(node != nullptr);
    return node->hash();
}

// Every hash appears after the hashes of its dependencies
void require_dependency_order(const std::vector<std::string>& hashes, const SpecPtr& root) {
    std::map<std::string, size_t> pos;
    for (size_t i = 0; i < hashes.size(); ++i) pos[hashes[i]] = i;
    for (const auto& node : traverse(root)) {
        if (!pos.count(node->hash())) continue;
        for (const auto& [name, dep] : node->dependencies()) {
            if (!pos.count(dep->hash())) continue;
            CHECK(pos[dep->hash()] < pos[node->hash()]);
        }
    }
}

// Fails for one package name and counts every build
class TestBuilder : public FakeBuilder {
public:
    explicit TestBuilder(std::string root, std::string fail_name = "")
        : FakeBuilder(std::move(root)), fail_name_(std::move(fail_name)) {}

    Status install(const Spec& spec) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            ++builds_[spec.hash()];
        }
        if (spec.name() == fail_name_) {
            return PinfoldError{PinfoldError::BuildFailure, "compiler exploded"};
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
        return FakeBuilder::install(spec);
    }

    int builds(const std::string& hash) {
        std::lock_guard<std::mutex> lock(mutex_);
        return builds_[hash];
    }

private:
    std::string fail_name_;
    std::mutex mutex_;
    std::map<std::string, int> builds_;
};

struct InstallFixture {
    TempDir tmp;
    InstallDatabase db;

    InstallFixture() {
        REQUIRE(db.open(tmp / "var/install.db").is_ok());
    }

    std::string install_root() const { return tmp / "opt"; }
};

} // namespace

// ---------------------------------------------------------------------------
// Collaborators
// ---------------------------------------------------------------------------

TEST_CASE("install_dir_name joins name, version and hash", "[installer]") {
    auto spec = concretize("libelf");
    REQUIRE(install_dir_name(*spec) == "libelf-0.8.13-" + spec->hash());
}

TEST_CASE("FakeBuilder writes spec.toml under the prefix", "[installer]") {
    TempDir tmp;
    FakeBuilder builder(tmp / "opt");
    auto spec = concretize("libdwarf");

    REQUIRE_FALSE(builder.is_installed(*spec));
    REQUIRE(builder.install(*spec).is_ok());
    REQUIRE(builder.is_installed(*spec));
    REQUIRE(builder.prefix(*spec) == tmp / ("opt/" + install_dir_name(*spec)));

    std::string meta = pinfold::testing::read_text(builder.prefix(*spec) + "/.pinfold/spec.toml");
    CHECK(meta.find("libdwarf") != std::string::npos);
    CHECK(meta.find(spec->hash()) != std::string::npos);
    CHECK(meta.find(hash_of(spec, "libelf")) != std::string::npos);

    REQUIRE(builder.uninstall(*spec).is_ok());
    REQUIRE_FALSE(builder.is_installed(*spec));
    REQUIRE_FALSE(fs::exists(builder.prefix(*spec)));
}

TEST_CASE("DirectoryStager creates one directory per spec", "[installer]") {
    TempDir tmp;
    DirectoryStager stager(tmp / "stage");
    auto spec = concretize("libelf");
    REQUIRE(stager.stage(*spec).is_ok());
    REQUIRE(fs::is_directory(stager.stage_path(*spec)));
    // Staging twice is harmless
    REQUIRE(stager.stage(*spec).is_ok());
}

// ---------------------------------------------------------------------------
// Installing
// ---------------------------------------------------------------------------

TEST_CASE("Install builds the closure in dependency order", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root());
    auto root = concretize("mpileaks");

    Installer installer(builder, f.db);
    auto report = installer.install({root});

    REQUIRE(report.ok());
    REQUIRE(report.installed.size() == 6);
    REQUIRE(report.reused.empty());
    REQUIRE(report.installed.back() == root->hash());
    require_dependency_order(report.installed, root);

    for (const auto& node : traverse(root)) {
        CHECK(builder.is_installed(*node));
        auto rec = f.db.lookup(node->hash());
        REQUIRE(rec.is_ok());
        REQUIRE(rec.value().has_value());
        CHECK(rec.value()->prefix == builder.prefix(*node));
        CHECK(rec.value()->spec == node->format());
        CHECK_FALSE(f.db.claim_exists(node->hash()).value());
    }
}

TEST_CASE("Second install reuses everything", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root());
    auto root = concretize("mpileaks");

    Installer installer(builder, f.db);
    REQUIRE(installer.install({root}).ok());
    auto again = installer.install({root});

    REQUIRE(again.ok());
    REQUIRE(again.installed.empty());
    REQUIRE(again.reused.size() == 6);
    require_dependency_order(again.reused, root);
    REQUIRE(builder.builds(root->hash()) == 1);
}

TEST_CASE("Parallel install gives the same result", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root());
    auto root = concretize("mpileaks");

    InstallOptions options;
    options.jobs = 4;
    Installer installer(builder, f.db, options);
    auto report = installer.install({root});

    REQUIRE(report.ok());
    REQUIRE(report.installed.size() == 6);
    require_dependency_order(report.installed, root);
    for (const auto& node : traverse(root)) {
        CHECK(builder.builds(node->hash()) == 1);
    }
}

TEST_CASE("Shared dependencies are installed once for several roots", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root());
    auto mpileaks = concretize("mpileaks");
    auto hypre = concretize("hypre");
    REQUIRE(hash_of(mpileaks, "mpich") == hash_of(hypre, "mpich"));

    Installer installer(builder, f.db);
    auto report = installer.install({mpileaks, hypre});
    REQUIRE(report.ok());
    REQUIRE(report.installed.size() == 7);
    REQUIRE(builder.builds(hash_of(hypre, "mpich")) == 1);
}

TEST_CASE("Failure skips dependents and keeps independent subtrees", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root(), "libdwarf");
    auto root = concretize("mpileaks");

    Installer installer(builder, f.db);
    auto report = installer.install({root});

    REQUIRE_FALSE(report.ok());
    REQUIRE(report.failed.size() == 1);
    CHECK(report.failed[0].name == "libdwarf");
    CHECK(report.failed[0].message == "compiler exploded");

    std::vector<std::string> skipped = report.skipped;
    std::sort(skipped.begin(), skipped.end());
    std::vector<std::string> expected = {
        hash_of(root, "dyninst"), hash_of(root, "callpath"), root->hash()};
    std::sort(expected.begin(), expected.end());
    REQUIRE(skipped == expected);

    std::vector<std::string> installed = report.installed;
    std::sort(installed.begin(), installed.end());
    std::vector<std::string> leaves = {hash_of(root, "libelf"), hash_of(root, "mpich")};
    std::sort(leaves.begin(), leaves.end());
    REQUIRE(installed == leaves);

    // The failed node leaves neither a record nor a claim
    std::string dwarf = hash_of(root, "libdwarf");
    REQUIRE_FALSE(f.db.is_installed(dwarf).value());
    REQUIRE_FALSE(f.db.claim_exists(dwarf).value());
    REQUIRE(builder.builds(root->hash()) == 0);
}

TEST_CASE("InstallReport to_error names failures and skipped count", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root(), "libdwarf");
    auto root = concretize("mpileaks");

    Installer installer(builder, f.db);
    auto err = installer.install({root}).to_error();

    REQUIRE(err.code == PinfoldError::BuildFailure);
    REQUIRE(err.message == "1 package failed to install:\n  libdwarf/" +
                           hash_of(root, "libdwarf").substr(0, 7) + ": compiler exploded");
    REQUIRE(err.hint == "3 dependent packages were not attempted");
}

TEST_CASE("Installing an abstract spec fails", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root());
    Installer installer(builder, f.db);

    auto report = installer.install({Spec::parse_ptr("libelf").value()});
    REQUIRE(report.failed.size() == 1);
    REQUIRE(report.failed[0].message.find("cannot install abstract spec") != std::string::npos);
}

TEST_CASE("Record without a prefix is rebuilt", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root());
    auto root = concretize("libelf");

    InstallRecord stale;
    stale.hash = root->hash();
    stale.name = "libelf";
    stale.version = "0.8.13";
    stale.prefix = builder.prefix(*root);
    REQUIRE(f.db.record_install(stale).is_ok());

    Installer installer(builder, f.db);
    auto report = installer.install({root});
    REQUIRE(report.ok());
    REQUIRE(report.installed == std::vector<std::string>{root->hash()});
    REQUIRE(builder.is_installed(*root));
}

TEST_CASE("Prefix without a record is adopted", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root());
    auto root = concretize("libelf");
    REQUIRE(builder.FakeBuilder::install(*root).is_ok());

    Installer installer(builder, f.db);
    auto report = installer.install({root});
    REQUIRE(report.reused == std::vector<std::string>{root->hash()});
    REQUIRE(f.db.is_installed(root->hash()).value());
    REQUIRE(builder.builds(root->hash()) == 0);
}

TEST_CASE("Concurrent installers share one build per hash", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root());
    auto mpileaks = concretize("mpileaks");
    auto hypre = concretize("hypre");

    InstallDatabase other;
    REQUIRE(other.open(f.tmp / "var/install.db").is_ok());

    InstallOptions a_opts;
    a_opts.owner = "env-a";
    a_opts.jobs = 2;
    a_opts.poll_interval = std::chrono::milliseconds(5);
    InstallOptions b_opts = a_opts;
    b_opts.owner = "env-b";

    Installer a(builder, f.db, a_opts);
    Installer b(builder, other, b_opts);

    InstallReport ra, rb;
    std::thread ta([&] { ra = a.install({mpileaks}); });
    std::thread tb([&] { rb = b.install({hypre}); });
    ta.join();
    tb.join();

    REQUIRE(ra.ok());
    REQUIRE(rb.ok());
    REQUIRE(ra.installed.size() + ra.reused.size() == 6);
    REQUIRE(rb.installed.size() + rb.reused.size() == 2);
    REQUIRE(ra.installed.size() + rb.installed.size() == 7);
    REQUIRE(builder.builds(hash_of(hypre, "mpich")) == 1);
}

// ---------------------------------------------------------------------------
// Uninstalling
// ---------------------------------------------------------------------------

TEST_CASE("Uninstall removes dependents first", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root());
    auto root = concretize("mpileaks");

    Installer installer(builder, f.db);
    REQUIRE(installer.install({root}).ok());

    auto removed = installer.uninstall({root});
    REQUIRE(removed.is_ok());
    REQUIRE(removed.value().size() == 6);
    REQUIRE(removed.value().front() == root->hash());

    std::vector<std::string> forward(removed.value().rbegin(), removed.value().rend());
    require_dependency_order(forward, root);

    for (const auto& node : traverse(root)) {
        CHECK_FALSE(builder.is_installed(*node));
    }
    REQUIRE(f.db.list().value().empty());
}

TEST_CASE("Uninstall skips specs that are not installed", "[installer]") {
    InstallFixture f;
    TestBuilder builder(f.install_root());
    auto root = concretize("libdwarf");

    Installer installer(builder, f.db);
    REQUIRE(installer.install({concretize("libelf")}).ok());

    auto removed = installer.uninstall({root});
    REQUIRE(removed.is_ok());
    REQUIRE(removed.value() == std::vector<std::string>{hash_of(root, "libelf")});

    auto again = installer.uninstall({root});
    REQUIRE(again.is_ok());
    REQUIRE(again.value().empty());
}
