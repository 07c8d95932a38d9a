#include <catch2/catch.hpp>
#include <pinfold/install_db.hpp>
#include "mock_repo.hpp"
#include <sqlite3.h>
#include <atomic>
#include <filesystem>
#include <sys/wait.h>
#include <unistd.h>

using namespace pinfold;
using pinfold::testing::TempDir;

namespace fs = std::filesystem;

static InstallRecord make_record(const std::string& hash, const std::string& name,
                                 const std::string& version) {
    InstallRecord r;
    r.hash = hash;
    r.name = name;
    r.version = version;
    r.spec = name + "@" + version + "%gcc@4.5.0";
    r.prefix = "/opt/" + name + "-" + version + "-" + hash;
    return r;
}

// ---------------------------------------------------------------------------
// Database lifecycle
// ---------------------------------------------------------------------------

TEST_CASE("InstallDatabase open creates the file and its directory", "[install_db]") {
    TempDir tmp;
    std::string path = tmp / "var/db/install.db";
    InstallDatabase db;
    REQUIRE(db.open(path).is_ok());
    REQUIRE(db.is_open());
    REQUIRE(fs::exists(path));
    db.close();
    REQUIRE_FALSE(db.is_open());
}

TEST_CASE("Operations on a closed database fail", "[install_db]") {
    InstallDatabase db;
    auto r = db.lookup("abc");
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinfoldError::IO);
    REQUIRE(r.error().message == "install database is not open");
    REQUIRE(db.try_claim("abc", "me").is_err());
    REQUIRE(db.list().is_err());
}

TEST_CASE("Records survive reopening", "[install_db]") {
    TempDir tmp;
    std::string path = tmp / "install.db";
    {
        InstallDatabase db;
        REQUIRE(db.open(path).is_ok());
        REQUIRE(db.record_install(make_record("aaaa", "libelf", "0.8.13")).is_ok());
    }
    InstallDatabase db;
    REQUIRE(db.open(path).is_ok());
    auto r = db.is_installed("aaaa");
    REQUIRE(r.is_ok());
    REQUIRE(r.value());
}

TEST_CASE("Schema version mismatch is reported, not discarded", "[install_db]") {
    TempDir tmp;
    std::string path = tmp / "install.db";
    {
        InstallDatabase db;
        REQUIRE(db.open(path).is_ok());
        REQUIRE(db.record_install(make_record("aaaa", "libelf", "0.8.13")).is_ok());
    }
    {
        sqlite3* raw = nullptr;
        REQUIRE(sqlite3_open(path.c_str(), &raw) == SQLITE_OK);
        REQUIRE(sqlite3_exec(raw, "UPDATE schema_info SET value='99' WHERE key='version'",
                             nullptr, nullptr, nullptr) == SQLITE_OK);
        sqlite3_close(raw);
    }

    InstallDatabase db;
    auto r = db.open(path);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinfoldError::IO);
    REQUIRE(r.error().file == path);
    REQUIRE(r.error().message.find("schema version 99") != std::string::npos);
    REQUIRE_FALSE(db.is_open());
}

// ---------------------------------------------------------------------------
// Install records
// ---------------------------------------------------------------------------

TEST_CASE("Lookup miss returns nullopt", "[install_db]") {
    TempDir tmp;
    InstallDatabase db;
    REQUIRE(db.open(tmp / "install.db").is_ok());
    auto r = db.lookup("nothing");
    REQUIRE(r.is_ok());
    REQUIRE_FALSE(r.value().has_value());
}

TEST_CASE("Record, lookup and remove", "[install_db]") {
    TempDir tmp;
    InstallDatabase db;
    REQUIRE(db.open(tmp / "install.db").is_ok());

    auto rec = make_record("aaaa", "libelf", "0.8.13");
    rec.installed_at = 1700000000;
    REQUIRE(db.record_install(rec).is_ok());

    auto found = db.lookup("aaaa");
    REQUIRE(found.is_ok());
    REQUIRE(found.value().has_value());
    const InstallRecord& got = *found.value();
    CHECK(got.name == "libelf");
    CHECK(got.version == "0.8.13");
    CHECK(got.spec == "libelf@0.8.13%gcc@4.5.0");
    CHECK(got.prefix == "/opt/libelf-0.8.13-aaaa");
    CHECK(got.installed_at == 1700000000);

    REQUIRE(db.remove_record("aaaa").is_ok());
    REQUIRE_FALSE(db.is_installed("aaaa").value());
}

TEST_CASE("Record without a timestamp is stamped now", "[install_db]") {
    TempDir tmp;
    InstallDatabase db;
    REQUIRE(db.open(tmp / "install.db").is_ok());
    REQUIRE(db.record_install(make_record("aaaa", "libelf", "0.8.13")).is_ok());
    auto found = db.lookup("aaaa");
    REQUIRE(found.is_ok());
    REQUIRE(found.value()->installed_at > 0);
}

TEST_CASE("Recording the same hash twice replaces the record", "[install_db]") {
    TempDir tmp;
    InstallDatabase db;
    REQUIRE(db.open(tmp / "install.db").is_ok());
    auto rec = make_record("aaaa", "libelf", "0.8.13");
    REQUIRE(db.record_install(rec).is_ok());
    rec.prefix = "/elsewhere";
    REQUIRE(db.record_install(rec).is_ok());

    auto all = db.list();
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 1);
    REQUIRE(all.value()[0].prefix == "/elsewhere");
}

TEST_CASE("List is ordered by name and version", "[install_db]") {
    TempDir tmp;
    InstallDatabase db;
    REQUIRE(db.open(tmp / "install.db").is_ok());
    REQUIRE(db.record_install(make_record("cccc", "mpich", "3.0.4")).is_ok());
    REQUIRE(db.record_install(make_record("bbbb", "libelf", "0.8.13")).is_ok());
    REQUIRE(db.record_install(make_record("aaaa", "libelf", "0.8.12")).is_ok());

    auto all = db.list();
    REQUIRE(all.is_ok());
    REQUIRE(all.value().size() == 3);
    CHECK(all.value()[0].hash == "aaaa");
    CHECK(all.value()[1].hash == "bbbb");
    CHECK(all.value()[2].hash == "cccc");
}

// ---------------------------------------------------------------------------
// Claims
// ---------------------------------------------------------------------------

TEST_CASE("First claim wins, second owner waits", "[install_db]") {
    TempDir tmp;
    InstallDatabase db;
    REQUIRE(db.open(tmp / "install.db").is_ok());

    auto first = db.try_claim("aaaa", "env-a");
    REQUIRE(first.is_ok());
    REQUIRE(first.value() == ClaimOutcome::Claimed);
    REQUIRE(db.claim_exists("aaaa").value());

    auto second = db.try_claim("aaaa", "env-b");
    REQUIRE(second.is_ok());
    REQUIRE(second.value() == ClaimOutcome::HeldByOther);

    // Other hashes are unaffected
    REQUIRE(db.try_claim("bbbb", "env-b").value() == ClaimOutcome::Claimed);
}

TEST_CASE("Claim after install reports AlreadyInstalled", "[install_db]") {
    TempDir tmp;
    InstallDatabase db;
    REQUIRE(db.open(tmp / "install.db").is_ok());

    REQUIRE(db.try_claim("aaaa", "env-a").value() == ClaimOutcome::Claimed);
    REQUIRE(db.record_install(make_record("aaaa", "libelf", "0.8.13")).is_ok());
    REQUIRE(db.release_claim("aaaa", "env-a").is_ok());
    REQUIRE_FALSE(db.claim_exists("aaaa").value());

    auto again = db.try_claim("aaaa", "env-b");
    REQUIRE(again.is_ok());
    REQUIRE(again.value() == ClaimOutcome::AlreadyInstalled);
}

TEST_CASE("Release by a different owner leaves the claim", "[install_db]") {
    TempDir tmp;
    InstallDatabase db;
    REQUIRE(db.open(tmp / "install.db").is_ok());

    REQUIRE(db.try_claim("aaaa", "env-a").value() == ClaimOutcome::Claimed);
    REQUIRE(db.release_claim("aaaa", "env-b").is_ok());
    REQUIRE(db.claim_exists("aaaa").value());

    REQUIRE(db.release_claim("aaaa", "env-a").is_ok());
    REQUIRE(db.try_claim("aaaa", "env-b").value() == ClaimOutcome::Claimed);
}

TEST_CASE("Claims are shared between connections", "[install_db]") {
    TempDir tmp;
    std::string path = tmp / "install.db";
    InstallDatabase a, b;
    REQUIRE(a.open(path).is_ok());
    REQUIRE(b.open(path).is_ok());

    REQUIRE(a.try_claim("aaaa", "env-a").value() == ClaimOutcome::Claimed);
    REQUIRE(b.try_claim("aaaa", "env-b").value() == ClaimOutcome::HeldByOther);

    REQUIRE(a.record_install(make_record("aaaa", "libelf", "0.8.13")).is_ok());
    REQUIRE(a.release_claim("aaaa", "env-a").is_ok());
    REQUIRE(b.try_claim("aaaa", "env-b").value() == ClaimOutcome::AlreadyInstalled);
}

namespace {

std::atomic<bool> g_refuse_commits{false};

int refuse_commit(void*) { return g_refuse_commits ? 1 : 0; }

// Registered as an auto extension so it reaches every new connection
int install_commit_hook(sqlite3* db, const char**, const sqlite3_api_routines*) {
    sqlite3_commit_hook(db, refuse_commit, nullptr);
    return SQLITE_OK;
}

} // namespace

TEST_CASE("Claim whose commit fails leaves the database usable", "[install_db]") {
    TempDir tmp;
    REQUIRE(sqlite3_auto_extension(reinterpret_cast<void (*)()>(install_commit_hook)) == SQLITE_OK);
    InstallDatabase db;
    Status opened = db.open(tmp / "install.db");
    sqlite3_reset_auto_extension();
    REQUIRE(opened.is_ok());

    g_refuse_commits = true;
    auto refused = db.try_claim("aaaa", "env-a");
    g_refuse_commits = false;
    REQUIRE(refused.is_err());
    REQUIRE(refused.error().code == PinfoldError::IO);
    REQUIRE_FALSE(db.claim_exists("aaaa").value());

    REQUIRE(db.try_claim("aaaa", "env-a").value() == ClaimOutcome::Claimed);
    REQUIRE(db.record_install(make_record("aaaa", "libelf", "0.8.13")).is_ok());
    REQUIRE(db.try_claim("aaaa", "env-b").value() == ClaimOutcome::AlreadyInstalled);
}

TEST_CASE("Claim left by a dead process is taken over", "[install_db]") {
    TempDir tmp;
    std::string path = tmp / "install.db";

    pid_t child = ::fork();
    REQUIRE(child >= 0);
    if (child == 0) {
        InstallDatabase db;
        bool claimed = db.open(path).is_ok() &&
            db.try_claim("aaaa", "crashed").is_ok();
        ::_exit(claimed ? 0 : 1);
    }
    int status = 0;
    REQUIRE(::waitpid(child, &status, 0) == child);
    REQUIRE(WIFEXITED(status));
    REQUIRE(WEXITSTATUS(status) == 0);

    InstallDatabase db;
    REQUIRE(db.open(path).is_ok());
    REQUIRE_FALSE(db.claim_exists("aaaa").value());

    auto r = db.try_claim("aaaa", "survivor");
    REQUIRE(r.is_ok());
    REQUIRE(r.value() == ClaimOutcome::Claimed);
    REQUIRE(db.claim_exists("aaaa").value());
}
