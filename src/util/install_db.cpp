#include <pinfold/install_db.hpp>
#include <pinfold/log.hpp>
#include <sqlite3.h>

#include <array>
#include <cerrno>
#include <chrono>
#include <filesystem>
#include <mutex>
#include <signal.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pinfold {

namespace {

constexpr const char* kSchemaVersion = "1";

constexpr const char* kSchema =
    "CREATE TABLE IF NOT EXISTS schema_info ("
    "  key TEXT PRIMARY KEY,"
    "  value TEXT"
    ");"
    "CREATE TABLE IF NOT EXISTS install_record ("
    "  hash TEXT PRIMARY KEY,"
    "  name TEXT,"
    "  version TEXT,"
    "  spec TEXT,"
    "  prefix TEXT,"
    "  installed_at INTEGER"
    ");"
    "CREATE TABLE IF NOT EXISTS install_claim ("
    "  hash TEXT PRIMARY KEY,"
    "  owner TEXT,"
    "  pid INTEGER,"
    "  claimed_at INTEGER"
    ");";

enum Query : size_t {
    kSchemaRead,
    kSchemaWrite,
    kRecordGet,
    kRecordPut,
    kRecordDelete,
    kRecordAll,
    kClaimInsert,
    kClaimHolder,
    kClaimTakeover,
    kClaimDelete,
    kQueryCount
};

// Indexed by Query
constexpr const char* kQuerySql[kQueryCount] = {
    "SELECT value FROM schema_info WHERE key='version'",
    "INSERT OR REPLACE INTO schema_info (key, value) VALUES ('version', ?)",
    "SELECT hash, name, version, spec, prefix, installed_at FROM install_record WHERE hash=?",
    "INSERT OR REPLACE INTO install_record (hash, name, version, spec, prefix, installed_at) "
        "VALUES (?, ?, ?, ?, ?, ?)",
    "DELETE FROM install_record WHERE hash=?",
    "SELECT hash, name, version, spec, prefix, installed_at FROM install_record "
        "ORDER BY name, version, hash",
    "INSERT OR IGNORE INTO install_claim (hash, owner, pid, claimed_at) VALUES (?, ?, ?, ?)",
    "SELECT owner, pid FROM install_claim WHERE hash=?",
    "UPDATE install_claim SET owner=?, pid=?, claimed_at=? WHERE hash=?",
    "DELETE FROM install_claim WHERE hash=? AND owner=?",
};

int64_t unix_now() {
    using namespace std::chrono;
    return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

// EPERM still means the process exists
bool pid_running(int64_t pid) {
    return pid > 0 && (::kill(static_cast<pid_t>(pid), 0) == 0 || errno == EPERM);
}

std::string text_at(sqlite3_stmt* stmt, int col) {
    auto* text = sqlite3_column_text(stmt, col);
    return text ? std::string(reinterpret_cast<const char*>(text)) : std::string();
}

InstallRecord record_from_row(sqlite3_stmt* stmt) {
    InstallRecord r;
    r.hash = text_at(stmt, 0);
    r.name = text_at(stmt, 1);
    r.version = text_at(stmt, 2);
    r.spec = text_at(stmt, 3);
    r.prefix = text_at(stmt, 4);
    r.installed_at = sqlite3_column_int64(stmt, 5);
    return r;
}

// Binds parameters in order and resets the statement when it goes out of
// scope, so no read snapshot outlives the call that took it
class Bound {
public:
    explicit Bound(sqlite3_stmt* stmt) : stmt_(stmt) {}
    ~Bound() {
        sqlite3_reset(stmt_);
        sqlite3_clear_bindings(stmt_);
    }
    Bound(const Bound&) = delete;
    Bound& operator=(const Bound&) = delete;

    Bound& operator<<(const std::string& text) {
        sqlite3_bind_text(stmt_, ++next_, text.c_str(), -1, SQLITE_TRANSIENT);
        return *this;
    }
    Bound& operator<<(int64_t number) {
        sqlite3_bind_int64(stmt_, ++next_, number);
        return *this;
    }

    int step() { return sqlite3_step(stmt_); }

private:
    sqlite3_stmt* stmt_;
    int next_ = 0;
};

} // namespace

// ---------------------------------------------------------------------------
// Connection
// ---------------------------------------------------------------------------

struct InstallDatabase::Impl {
    sqlite3* db = nullptr;
    std::mutex mutex;
    // Prepared on first use, finalized on close
    std::array<sqlite3_stmt*, kQueryCount> queries{};

    ~Impl() { shutdown(); }

    void shutdown() {
        for (auto& stmt : queries) {
            sqlite3_finalize(stmt);
            stmt = nullptr;
        }
        if (db) {
            sqlite3_close(db);
            db = nullptr;
        }
    }

    PinfoldError failure(const std::string& what) const {
        return PinfoldError{PinfoldError::IO, what + ": " + sqlite3_errmsg(db)};
    }

    Status require_open() const {
        if (db) return ok_status();
        return PinfoldError{PinfoldError::IO, "install database is not open"};
    }

    Result<sqlite3_stmt*> query(Query q) {
        sqlite3_stmt*& slot = queries[q];
        if (!slot && sqlite3_prepare_v2(db, kQuerySql[q], -1, &slot, nullptr) != SQLITE_OK) {
            return failure("cannot prepare install database query");
        }
        return Result<sqlite3_stmt*>::ok(slot);
    }

    Status run(const char* sql) {
        char* message = nullptr;
        if (sqlite3_exec(db, sql, nullptr, nullptr, &message) == SQLITE_OK) return ok_status();
        std::string text = message ? message : sqlite3_errmsg(db);
        sqlite3_free(message);
        return PinfoldError{PinfoldError::IO, "install database: " + text};
    }

    Status finish(Bound& stmt, const char* what) {
        if (stmt.step() == SQLITE_DONE) return ok_status();
        return failure(std::string("cannot ") + what);
    }

    Status migrate() {
        PINFOLD_TRY(run(kSchema));

        std::optional<std::string> found;
        {
            PINFOLD_TRY_ASSIGN(sqlite3_stmt* read, query(kSchemaRead));
            Bound current(read);
            int rc = current.step();
            if (rc == SQLITE_ROW) found = text_at(read, 0);
            else if (rc != SQLITE_DONE) return failure("cannot read install database schema");
        }
        // Records describe real prefixes, so an unknown layout is left alone
        if (found && *found != kSchemaVersion) {
            return PinfoldError{PinfoldError::IO,
                "install database has schema version " + *found +
                ", expected " + kSchemaVersion,
                "use a pinfold release that understands this database"};
        }
        if (found) return ok_status();

        PINFOLD_TRY_ASSIGN(sqlite3_stmt* write, query(kSchemaWrite));
        Bound stamp(write);
        stamp << std::string(kSchemaVersion);
        return finish(stamp, "write install database schema");
    }

    Result<bool> has_record(const std::string& hash) {
        PINFOLD_TRY_ASSIGN(sqlite3_stmt* get, query(kRecordGet));
        Bound row(get);
        row << hash;
        int rc = row.step();
        if (rc == SQLITE_ROW) return Result<bool>::ok(true);
        if (rc == SQLITE_DONE) return Result<bool>::ok(false);
        return failure("cannot look up install record");
    }

    // Caller holds BEGIN IMMEDIATE
    Result<ClaimOutcome> claim(const std::string& hash, const std::string& owner) {
        PINFOLD_TRY_ASSIGN(bool recorded, has_record(hash));
        if (recorded) return Result<ClaimOutcome>::ok(ClaimOutcome::AlreadyInstalled);

        const int64_t self = ::getpid();
        {
            PINFOLD_TRY_ASSIGN(sqlite3_stmt* insert, query(kClaimInsert));
            Bound fresh(insert);
            fresh << hash << owner << self << unix_now();
            PINFOLD_TRY(finish(fresh, "insert install claim"));
            if (sqlite3_changes(db) == 1) return Result<ClaimOutcome>::ok(ClaimOutcome::Claimed);
        }

        std::string holder;
        int64_t holder_pid = 0;
        {
            PINFOLD_TRY_ASSIGN(sqlite3_stmt* select, query(kClaimHolder));
            Bound existing(select);
            existing << hash;
            if (existing.step() != SQLITE_ROW) return failure("cannot read install claim");
            holder = text_at(select, 0);
            holder_pid = sqlite3_column_int64(select, 1);
        }
        if (holder_pid == self || pid_running(holder_pid)) {
            return Result<ClaimOutcome>::ok(ClaimOutcome::HeldByOther);
        }

        log::warn("taking over install claim on %s left by dead process %lld (%s)",
                  hash.c_str(), static_cast<long long>(holder_pid), holder.c_str());
        PINFOLD_TRY_ASSIGN(sqlite3_stmt* update, query(kClaimTakeover));
        Bound takeover(update);
        takeover << owner << self << unix_now() << hash;
        PINFOLD_TRY(finish(takeover, "take over install claim"));
        return Result<ClaimOutcome>::ok(ClaimOutcome::Claimed);
    }
};

InstallDatabase::InstallDatabase() : impl_(std::make_unique<Impl>()) {}
InstallDatabase::~InstallDatabase() = default;
InstallDatabase::InstallDatabase(InstallDatabase&&) noexcept = default;
InstallDatabase& InstallDatabase::operator=(InstallDatabase&&) noexcept = default;

Status InstallDatabase::open(const std::string& db_path) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->shutdown();

    fs::path dir = fs::path(db_path).parent_path();
    if (!dir.empty()) {
        std::error_code ec;
        fs::create_directories(dir, ec);
        if (ec) {
            return PinfoldError{PinfoldError::IO,
                "cannot create " + dir.string() + ": " + ec.message(), "", db_path, 0};
        }
    }

    if (sqlite3_open(db_path.c_str(), &impl_->db) != SQLITE_OK) {
        auto err = impl_->db ? impl_->failure("cannot open install database")
                             : PinfoldError{PinfoldError::IO, "cannot open install database"};
        impl_->shutdown();
        err.file = db_path;
        return err;
    }

    // Claims from other processes hold the write lock briefly
    sqlite3_busy_timeout(impl_->db, 10000);

    Status ready = impl_->run("PRAGMA journal_mode=WAL; PRAGMA synchronous=NORMAL;");
    if (ready.is_ok()) ready = impl_->migrate();
    if (ready.is_err()) {
        impl_->shutdown();
        auto err = std::move(ready).error();
        err.file = db_path;
        return err;
    }

    log::debug("opened install database %s", db_path.c_str());
    return ok_status();
}

void InstallDatabase::close() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    impl_->shutdown();
}

bool InstallDatabase::is_open() const {
    return impl_->db != nullptr;
}

// ---------------------------------------------------------------------------
// Install records
// ---------------------------------------------------------------------------

Result<std::optional<InstallRecord>> InstallDatabase::lookup(const std::string& hash) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    PINFOLD_TRY(impl_->require_open());
    PINFOLD_TRY_ASSIGN(sqlite3_stmt* get, impl_->query(kRecordGet));

    Bound row(get);
    row << hash;
    switch (row.step()) {
    case SQLITE_ROW:
        return Result<std::optional<InstallRecord>>::ok(record_from_row(get));
    case SQLITE_DONE:
        return Result<std::optional<InstallRecord>>::ok(std::nullopt);
    default:
        return impl_->failure("cannot look up install record");
    }
}

Result<bool> InstallDatabase::is_installed(const std::string& hash) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    PINFOLD_TRY(impl_->require_open());
    return impl_->has_record(hash);
}

Status InstallDatabase::record_install(const InstallRecord& record) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    PINFOLD_TRY(impl_->require_open());
    PINFOLD_TRY_ASSIGN(sqlite3_stmt* put, impl_->query(kRecordPut));

    Bound row(put);
    row << record.hash << record.name << record.version << record.spec << record.prefix
        << (record.installed_at ? record.installed_at : unix_now());
    return impl_->finish(row, "record install");
}

Status InstallDatabase::remove_record(const std::string& hash) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    PINFOLD_TRY(impl_->require_open());
    PINFOLD_TRY_ASSIGN(sqlite3_stmt* del, impl_->query(kRecordDelete));

    Bound row(del);
    row << hash;
    return impl_->finish(row, "remove install record");
}

Result<std::vector<InstallRecord>> InstallDatabase::list() {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    PINFOLD_TRY(impl_->require_open());
    PINFOLD_TRY_ASSIGN(sqlite3_stmt* all, impl_->query(kRecordAll));

    Bound rows(all);
    std::vector<InstallRecord> records;
    int rc = rows.step();
    for (; rc == SQLITE_ROW; rc = rows.step()) records.push_back(record_from_row(all));
    if (rc != SQLITE_DONE) return impl_->failure("cannot list install records");
    return Result<std::vector<InstallRecord>>::ok(std::move(records));
}

// ---------------------------------------------------------------------------
// Claims
// ---------------------------------------------------------------------------

Result<ClaimOutcome> InstallDatabase::try_claim(const std::string& hash,
                                                const std::string& owner) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    PINFOLD_TRY(impl_->require_open());

    // The write lock is taken before the record check so that check and the
    // insert are one step for every process sharing the file
    PINFOLD_TRY(impl_->run("BEGIN IMMEDIATE;"));
    auto outcome = impl_->claim(hash, owner);
    if (outcome.is_ok()) {
        auto committed = impl_->run("COMMIT;");
        if (committed.is_ok()) return outcome;
        // A failed COMMIT may leave the transaction open
        outcome = std::move(committed).error();
    }
    if (auto undone = impl_->run("ROLLBACK;"); undone.is_err()) {
        log::debug("rollback after failed claim of %s: %s",
                   hash.c_str(), undone.error().message.c_str());
    }
    return outcome;
}

Status InstallDatabase::release_claim(const std::string& hash, const std::string& owner) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    PINFOLD_TRY(impl_->require_open());
    PINFOLD_TRY_ASSIGN(sqlite3_stmt* del, impl_->query(kClaimDelete));

    Bound row(del);
    row << hash << owner;
    return impl_->finish(row, "release install claim");
}

Result<bool> InstallDatabase::claim_exists(const std::string& hash) {
    std::lock_guard<std::mutex> lock(impl_->mutex);
    PINFOLD_TRY(impl_->require_open());
    PINFOLD_TRY_ASSIGN(sqlite3_stmt* select, impl_->query(kClaimHolder));

    Bound row(select);
    row << hash;
    int rc = row.step();
    if (rc == SQLITE_ROW) return Result<bool>::ok(pid_running(sqlite3_column_int64(select, 1)));
    if (rc == SQLITE_DONE) return Result<bool>::ok(false);
    return impl_->failure("cannot read install claim");
}

} // namespace pinfold
