#pragma once

#include <pinfold/result.hpp>
#include <pinfold/spec.hpp>
#include <map>
#include <string>
#include <vector>

namespace pinfold {

// One concretized root: its hash and the user spec it was resolved from
struct LockedRoot {
    std::string hash;
    std::string spec;
};

// pinfold.lock: every concrete spec of an environment, keyed by hash.
//
//   [_meta]
//   lockfile-version = 1
//
//   [[roots]]
//   hash = "..."
//   spec = "mpileaks ^callpath@0.9"
//
//   [concrete-specs.<hash>]
//   name, namespace, version, compiler, arch
//   variants = { debug = "false" }
//   virtuals = ["mpi"]
//   dependencies = { callpath = "<hash>" }
//
// Loading rebuilds the DAG bottom-up and recomputes every hash; an entry
// whose content does not hash to its key is rejected.
struct LockFile {
    static constexpr int kCurrentVersion = 1;

    int version = kCurrentVersion;
    std::vector<LockedRoot> roots;
    std::map<std::string, SpecPtr> specs_by_hash;

    static Result<LockFile> parse(const std::string& toml_str,
                                  const std::string& source = "<lockfile>");
    static Result<LockFile> load(const std::string& path);

    // Deterministic TOML text
    std::string to_toml() const;
    // Atomic replace of `path`
    Status save(const std::string& path) const;
};

} // namespace pinfold
