#pragma once

#include <pinfold/config.hpp>
#include <pinfold/preferences.hpp>
#include <pinfold/repository.hpp>
#include <pinfold/result.hpp>
#include <pinfold/spec.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pinfold {

// One abstract root and where it came from ("mpileaks ^callpath@0.9" in
// environment 'test'). The origin is quoted in conflict errors.
struct RootRequest {
    Spec spec;
    std::string origin;
};

struct ConcretizeOptions {
    // Previously concrete specs; each node is reused as-is while it still
    // satisfies every constraint on its name
    std::vector<SpecPtr> pinned;
    // Pins dropped for these names
    std::set<std::string> unpinned;
    // Version constraints on these names are ignored for this pass
    std::set<std::string> relaxed_versions;
    // Compiler name every node must use
    std::optional<std::string> force_compiler;
    // Operating system every node must target
    std::optional<std::string> force_os;
    // Pins keep their version and variants but compiler and architecture
    // are chosen again
    bool repick_compiler_and_arch = false;
    // Resolve independent components on separate threads
    bool parallel = true;
};

struct ConcretizeResult {
    std::vector<SpecPtr> roots;  // aligned with the requests
    std::map<std::string, SpecPtr> specs_by_hash;
};

// Turns abstract roots into one unified concrete DAG.
//
// Each package name resolves to exactly one node across all roots. The
// procedure is greedy: packages are decided breadth-first from the roots and
// a constraint that arrives after its package was decided, and is not
// satisfied by that decision, is remembered and resolution starts over with
// it known up front. Output depends only on the inputs, never on thread
// scheduling.
class Concretizer {
public:
    Concretizer(const RepositoryOverlay& repo,
                const PackagePreferences& prefs,
                const ConfigScopeStack& config);

    Result<ConcretizeResult> concretize(const std::vector<RootRequest>& roots,
                                        const ConcretizeOptions& options = {}) const;

    // Convenience for a single root, no reuse
    Result<SpecPtr> concretize_one(const Spec& root) const;

    // Groups of root indices whose possible dependency names overlap
    std::vector<std::vector<size_t>> components(const std::vector<RootRequest>& roots) const;

private:
    const RepositoryOverlay& repo_;
    const PackagePreferences& prefs_;
    const ConfigScopeStack& config_;
};

} // namespace pinfold
