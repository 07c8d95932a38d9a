#pragma once

#include <pinfold/result.hpp>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace pinfold {

struct InstallRecord {
    std::string hash;
    std::string name;
    std::string version;
    std::string spec;      // Spec::format() of the installed node
    std::string prefix;
    int64_t installed_at = 0;
};

enum class ClaimOutcome {
    Claimed,           // caller owns the hash and must build it
    AlreadyInstalled,  // a record exists; nothing to do
    HeldByOther        // another owner is building it; poll until it resolves
};

// Site-wide record of installed specs, shared by every environment and
// process using the same site root. Install work is keyed by content hash:
// the install_claim table lets exactly one owner build a given hash at a
// time, even across processes.
//
// One InstallDatabase may be used from several threads.
class InstallDatabase {
public:
    InstallDatabase();
    ~InstallDatabase();
    InstallDatabase(InstallDatabase&&) noexcept;
    InstallDatabase& operator=(InstallDatabase&&) noexcept;

    Status open(const std::string& db_path);
    void close();
    bool is_open() const;

    // Install records
    Result<std::optional<InstallRecord>> lookup(const std::string& hash);
    Result<bool> is_installed(const std::string& hash);
    Status record_install(const InstallRecord& record);
    Status remove_record(const std::string& hash);
    Result<std::vector<InstallRecord>> list();

    // Claims. `owner` identifies the claimant; the claiming process id is
    // stored beside it so a claim left behind by a dead process is taken
    // over instead of blocking forever.
    Result<ClaimOutcome> try_claim(const std::string& hash, const std::string& owner);
    Status release_claim(const std::string& hash, const std::string& owner);
    Result<bool> claim_exists(const std::string& hash);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace pinfold
