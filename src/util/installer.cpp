#include <pinfold/installer.hpp>
#include <pinfold/fs_util.hpp>
#include <pinfold/graph.hpp>
#include <pinfold/log.hpp>
#include <toml++/toml.hpp>

#include <algorithm>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <map>
#include <mutex>
#include <set>
#include <sstream>
#include <thread>
#include <unistd.h>

namespace fs = std::filesystem;

namespace pinfold {

std::string install_dir_name(const Spec& spec) {
    return spec.name() + "-" + spec.version().to_string() + "-" + spec.hash();
}

// ---------------------------------------------------------------------------
// FakeBuilder
// ---------------------------------------------------------------------------

std::string FakeBuilder::prefix(const Spec& spec) const {
    return (fs::path(root_) / install_dir_name(spec)).string();
}

Status FakeBuilder::install(const Spec& spec) {
    fs::path meta = fs::path(prefix(spec)) / ".pinfold";
    std::error_code ec;
    fs::create_directories(meta, ec);
    if (ec) {
        return PinfoldError{PinfoldError::IO,
            "cannot create " + meta.string() + ": " + ec.message()};
    }

    toml::table doc;
    doc.insert_or_assign("name", spec.name());
    doc.insert_or_assign("version", spec.version().to_string());
    doc.insert_or_assign("hash", spec.hash());
    doc.insert_or_assign("spec", spec.format());
    toml::array deps;
    for (const auto& [name, dep] : spec.dependencies()) {
        deps.push_back(dep->hash());
    }
    doc.insert_or_assign("dependencies", std::move(deps));

    std::ostringstream out;
    out << doc << "\n";
    return atomic_write_file((meta / "spec.toml").string(), out.str());
}

bool FakeBuilder::is_installed(const Spec& spec) const {
    std::error_code ec;
    return fs::exists(fs::path(prefix(spec)) / ".pinfold" / "spec.toml", ec);
}

Status FakeBuilder::uninstall(const Spec& spec) {
    std::error_code ec;
    fs::remove_all(prefix(spec), ec);
    if (ec) {
        return PinfoldError{PinfoldError::IO,
            "cannot remove " + prefix(spec) + ": " + ec.message()};
    }
    return ok_status();
}

// ---------------------------------------------------------------------------
// DirectoryStager
// ---------------------------------------------------------------------------

std::string DirectoryStager::stage_path(const Spec& spec) const {
    return (fs::path(root_) / install_dir_name(spec)).string();
}

Status DirectoryStager::stage(const Spec& spec) {
    std::error_code ec;
    fs::create_directories(stage_path(spec), ec);
    if (ec) {
        return PinfoldError{PinfoldError::IO,
            "cannot stage " + spec.format() + " in " + stage_path(spec) + ": " + ec.message()};
    }
    log::debug("staged %s in %s", spec.name().c_str(), stage_path(spec).c_str());
    return ok_status();
}

// ---------------------------------------------------------------------------
// InstallReport
// ---------------------------------------------------------------------------

PinfoldError InstallReport::to_error() const {
    std::ostringstream msg;
    msg << failed.size() << " package" << (failed.size() == 1 ? "" : "s")
        << " failed to install:";
    for (const auto& f : failed) {
        msg << "\n  " << f.name << "/" << f.hash.substr(0, 7) << ": " << f.message;
    }
    std::string hint;
    if (!skipped.empty()) {
        hint = std::to_string(skipped.size()) + " dependent package" +
               (skipped.size() == 1 ? " was" : "s were") + " not attempted";
    }
    return PinfoldError{PinfoldError::BuildFailure, msg.str(), hint};
}

// ---------------------------------------------------------------------------
// Installer
// ---------------------------------------------------------------------------

namespace {

// Hash-keyed dependency graph of a closure, dependencies first
struct ClosureGraph {
    std::map<std::string, SpecPtr> by_hash;
    DependencyGraph graph;
    std::vector<std::string> order;
};

Result<ClosureGraph> closure_graph(const std::vector<SpecPtr>& roots) {
    ClosureGraph cg;
    for (const auto& spec : traverse_all(roots)) {
        if (!spec->is_concrete()) {
            return PinfoldError{PinfoldError::IncompleteSpec,
                "cannot install abstract spec " + spec->format()};
        }
        cg.by_hash.emplace(spec->hash(), spec);
        cg.graph.add_node(spec->hash());
        for (const auto& [name, dep] : spec->dependencies()) {
            cg.graph.add_edge(spec->hash(), dep->hash());
        }
    }
    PINFOLD_TRY_ASSIGN(cg.order, cg.graph.dependency_order());
    return Result<ClosureGraph>::ok(std::move(cg));
}

} // namespace

Installer::Installer(BuildCollaborator& builder, InstallDatabase& db, InstallOptions options)
    : builder_(builder), db_(db), options_(std::move(options)) {
    if (options_.owner.empty()) {
        options_.owner = "pid:" + std::to_string(::getpid());
    }
    if (options_.jobs < 1) options_.jobs = 1;
}

Installer::Outcome Installer::install_one(const Spec& spec, std::string& message) {
    const std::string& hash = spec.hash();
    bool waited = false;

    for (;;) {
        auto claim = db_.try_claim(hash, options_.owner);
        if (claim.is_err()) {
            message = claim.error().message;
            return Outcome::Failed;
        }

        switch (claim.value()) {
        case ClaimOutcome::AlreadyInstalled:
            if (builder_.is_installed(spec)) return Outcome::Reused;
            // Record without a prefix behind it; drop it and build again
            log::warn("install record for %s/%s has no prefix, reinstalling",
                      spec.name().c_str(), spec.short_hash().c_str());
            if (auto r = db_.remove_record(hash); r.is_err()) {
                message = r.error().message;
                return Outcome::Failed;
            }
            continue;

        case ClaimOutcome::HeldByOther:
            if (!waited) {
                log::info("waiting for another install of %s/%s",
                          spec.name().c_str(), spec.short_hash().c_str());
                waited = true;
            }
            std::this_thread::sleep_for(options_.poll_interval);
            continue;

        case ClaimOutcome::Claimed:
            break;
        }

        Outcome outcome = Outcome::Installed;
        if (builder_.is_installed(spec)) {
            outcome = Outcome::Reused;
        } else {
            log::info("installing %s", spec.format().c_str());
            auto built = builder_.install(spec);
            if (built.is_err()) {
                message = built.error().message;
                outcome = Outcome::Failed;
            }
        }

        if (outcome != Outcome::Failed) {
            InstallRecord record;
            record.hash = hash;
            record.name = spec.name();
            record.version = spec.version().to_string();
            record.spec = spec.format();
            record.prefix = builder_.prefix(spec);
            auto recorded = db_.record_install(record);
            if (recorded.is_err()) {
                message = recorded.error().message;
                outcome = Outcome::Failed;
            }
        }

        auto released = db_.release_claim(hash, options_.owner);
        if (released.is_err()) {
            log::warn("could not release install claim on %s: %s",
                      hash.c_str(), released.error().message.c_str());
        }
        return outcome;
    }
}

InstallReport Installer::install(const std::vector<SpecPtr>& roots) {
    InstallReport report;

    auto built = closure_graph(roots);
    if (built.is_err()) {
        report.failed.push_back({"", "", built.error().message});
        return report;
    }
    ClosureGraph cg = std::move(built).value();

    std::map<std::string, size_t> position;
    std::map<std::string, size_t> pending;
    for (size_t i = 0; i < cg.order.size(); ++i) {
        position[cg.order[i]] = i;
        pending[cg.order[i]] = cg.graph.dependencies(cg.order[i]).size();
    }

    std::mutex mutex;
    std::condition_variable cv;
    std::deque<std::string> ready;
    std::set<std::string> settled;
    size_t remaining = cg.order.size();
    std::map<size_t, std::string> installed, reused, skipped;
    std::map<size_t, InstallFailure> failed;

    for (const auto& hash : cg.order) {
        if (pending[hash] == 0) ready.push_back(hash);
    }

    // Caller holds the lock
    auto skip_dependents = [&](const std::string& hash) {
        std::deque<std::string> queue{hash};
        while (!queue.empty()) {
            std::string cur = queue.front();
            queue.pop_front();
            for (const auto& parent : cg.graph.dependents(cur)) {
                if (!settled.insert(parent).second) continue;
                skipped[position[parent]] = parent;
                log::warn("skipping %s: dependency %s failed",
                          cg.by_hash[parent]->name().c_str(),
                          cg.by_hash[cur]->name().c_str());
                --remaining;
                queue.push_back(parent);
            }
        }
    };

    auto worker = [&]() {
        std::unique_lock<std::mutex> lock(mutex);
        for (;;) {
            cv.wait(lock, [&] { return !ready.empty() || remaining == 0; });
            if (remaining == 0) return;

            std::string hash = ready.front();
            ready.pop_front();
            SpecPtr spec = cg.by_hash[hash];

            lock.unlock();
            std::string message;
            Outcome outcome = install_one(*spec, message);
            lock.lock();

            settled.insert(hash);
            --remaining;
            size_t pos = position[hash];
            if (outcome == Outcome::Failed) {
                log::error("failed to install %s: %s", spec->format().c_str(), message.c_str());
                failed[pos] = InstallFailure{hash, spec->name(), message};
                skip_dependents(hash);
            } else {
                (outcome == Outcome::Installed ? installed : reused)[pos] = hash;
                for (const auto& parent : cg.graph.dependents(hash)) {
                    if (--pending[parent] == 0 && !settled.count(parent)) {
                        ready.push_back(parent);
                    }
                }
            }
            cv.notify_all();
        }
    };

    size_t n_workers = std::min<size_t>(static_cast<size_t>(options_.jobs),
                                        std::max<size_t>(cg.order.size(), 1));
    std::vector<std::thread> workers;
    for (size_t i = 0; i < n_workers; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& t : workers) t.join();

    for (auto& [pos, hash] : installed) report.installed.push_back(hash);
    for (auto& [pos, hash] : reused) report.reused.push_back(hash);
    for (auto& [pos, hash] : skipped) report.skipped.push_back(hash);
    for (auto& [pos, f] : failed) report.failed.push_back(std::move(f));
    return report;
}

Result<std::vector<std::string>> Installer::uninstall(const std::vector<SpecPtr>& roots) {
    PINFOLD_TRY_ASSIGN(ClosureGraph cg, closure_graph(roots));

    std::vector<std::string> removed;
    for (auto it = cg.order.rbegin(); it != cg.order.rend(); ++it) {
        const Spec& spec = *cg.by_hash[*it];
        PINFOLD_TRY_ASSIGN(bool recorded, db_.is_installed(*it));
        if (!recorded && !builder_.is_installed(spec)) continue;

        log::info("uninstalling %s", spec.format().c_str());
        PINFOLD_TRY(builder_.uninstall(spec));
        PINFOLD_TRY(db_.remove_record(*it));
        removed.push_back(*it);
    }
    return Result<std::vector<std::string>>::ok(std::move(removed));
}

} // namespace pinfold
