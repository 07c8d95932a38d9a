#include <pinfold/concretizer.hpp>
#include <pinfold/graph.hpp>
#include <pinfold/log.hpp>

#include <algorithm>
#include <deque>
#include <functional>
#include <future>
#include <mutex>
#include <numeric>

namespace pinfold {

namespace {

// Restarts allowed per component before giving up
constexpr int kMaxAttempts = 100;

struct Constraint {
    Spec spec;  // node attributes only
    std::string origin;
};

Spec node_only(const Spec& s) {
    Spec node = s;
    node.clear_dependencies();
    return node;
}

// ---------------------------------------------------------------------------
// Resolution: greedy decisions for one component of roots
// ---------------------------------------------------------------------------

class Resolution {
public:
    Resolution(const RepositoryOverlay& repo,
               const PackagePreferences& prefs,
               const GeneralSettings& settings,
               const std::vector<CompilerEntry>& compilers,
               const ConcretizeOptions& options,
               std::vector<const RootRequest*> roots)
        : repo_(repo), prefs_(prefs), settings_(settings), compilers_(compilers),
          opts_(options), roots_(std::move(roots))
    {
        for (const auto& spec : traverse_all(options.pinned)) {
            pinned_.emplace(spec->name(), spec);
        }
    }

    Result<std::vector<SpecPtr>> run() {
        for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
            reset();
            seed();
            while (!queue_.empty() && !restart_) {
                std::string name = queue_.front();
                queue_.pop_front();
                PINFOLD_TRY(visit(name));
            }
            if (restart_) continue;
            return build();
        }
        log::error("concretization did not settle after %d attempts", kMaxAttempts);
        return PinfoldError{PinfoldError::Internal,
            "concretization did not settle after " + std::to_string(kMaxAttempts) + " attempts"};
    }

private:
    const RepositoryOverlay& repo_;
    const PackagePreferences& prefs_;
    const GeneralSettings& settings_;
    const std::vector<CompilerEntry>& compilers_;
    const ConcretizeOptions& opts_;
    std::vector<const RootRequest*> roots_;

    std::map<std::string, SpecPtr> pinned_;
    // Constraints that forced a restart; known up front on later attempts
    std::map<std::string, std::vector<Constraint>> learned_;

    // Per-attempt state
    std::map<std::string, std::vector<Constraint>> constraints_;
    std::map<std::string, std::string> parent_;
    std::map<std::string, Spec> decided_;
    std::map<std::string, std::string> providers_;              // virtual -> provider
    std::map<std::string, std::set<std::string>> provided_;     // provider -> virtuals
    std::map<std::string, std::set<std::string>> deps_;         // package -> dependency names
    std::deque<std::string> queue_;
    bool restart_ = false;

    void reset() {
        constraints_.clear();
        parent_.clear();
        decided_.clear();
        providers_.clear();
        provided_.clear();
        deps_.clear();
        queue_.clear();
        restart_ = false;
    }

    void seed() {
        for (const auto& [name, learned] : learned_) {
            auto& list = constraints_[name];
            list.insert(list.end(), learned.begin(), learned.end());
        }
        for (const RootRequest* root : roots_) {
            add_constraint(root->spec.name(), node_only(root->spec), root->origin, "");
            for (const auto& [dep_name, dep] : root->spec.dependencies()) {
                add_constraint(dep_name, node_only(*dep), root->origin, "");
            }
            queue_.push_back(root->spec.name());
        }
    }

    std::string resolve_name(const std::string& name) const {
        auto it = providers_.find(name);
        return it == providers_.end() ? name : it->second;
    }

    const Spec* parent_node(const std::string& name) const {
        auto p = parent_.find(name);
        if (p == parent_.end()) return nullptr;
        auto d = decided_.find(resolve_name(p->second));
        return d == decided_.end() ? nullptr : &d->second;
    }

    void add_constraint(const std::string& target, Spec spec,
                        const std::string& origin, const std::string& dependent) {
        if (opts_.relaxed_versions.count(target) && !spec.versions().is_any()) {
            log::warn("ignoring version constraint '%s' from %s while upgrading %s",
                      spec.format().c_str(), origin.c_str(), target.c_str());
            spec.set_versions(VersionList{});
        }
        if (!dependent.empty() && !parent_.count(target)) {
            parent_[target] = dependent;
        }

        Constraint c{std::move(spec), origin};
        auto it = decided_.find(target);
        if (it != decided_.end() && !it->second.satisfies_node(c.spec)) {
            log::debug("'%s' from %s rules out %s; restarting",
                       c.spec.format().c_str(), origin.c_str(), it->second.format().c_str());
            learned_[target].push_back(c);
            restart_ = true;
        }
        constraints_[target].push_back(std::move(c));
    }

    Status visit(const std::string& name) {
        if (decided_.count(name) || providers_.count(name)) return ok_status();
        if (repo_.exists(name)) return decide_package(name);
        if (repo_.is_virtual(name)) return decide_virtual(name);

        std::string hint;
        auto it = constraints_.find(name);
        if (it != constraints_.end() && !it->second.empty()) {
            hint = "required by " + it->second.front().origin;
        }
        return PinfoldError{PinfoldError::NotFound,
            "package '" + name + "' not found", hint};
    }

    // -----------------------------------------------------------------------
    // Virtual packages
    // -----------------------------------------------------------------------

    Status decide_virtual(const std::string& virtual_name) {
        std::vector<std::string> candidates = repo_.providers_for(virtual_name);
        std::string choice;

        // A provider requested by name, or already in the graph
        for (const auto& c : candidates) {
            if (decided_.count(c) || constraints_.count(c)) { choice = c; break; }
        }
        if (choice.empty()) {
            for (const auto& c : candidates) {
                auto pin = pinned_.find(c);
                if (pin != pinned_.end() && !opts_.unpinned.count(c) &&
                    pin->second->provides(virtual_name)) {
                    choice = c;
                    break;
                }
            }
        }
        if (choice.empty()) {
            for (const auto& ranked : prefs_.providers(virtual_name)) {
                if (std::find(candidates.begin(), candidates.end(), ranked) != candidates.end()) {
                    choice = ranked;
                    break;
                }
            }
        }
        if (choice.empty()) choice = candidates.front();

        log::debug("using %s as provider of %s", choice.c_str(), virtual_name.c_str());
        providers_[virtual_name] = choice;
        provided_[choice].insert(virtual_name);
        auto p = parent_.find(virtual_name);
        if (p != parent_.end() && !parent_.count(choice)) parent_[choice] = p->second;
        queue_.push_back(choice);
        return ok_status();
    }

    // -----------------------------------------------------------------------
    // Concrete packages
    // -----------------------------------------------------------------------

    PinfoldError conflict_error(const std::string& name,
                                const std::vector<Constraint>& cons) const {
        std::string msg = "conflicting constraints on '" + name + "':";
        for (const auto& c : cons) {
            msg += "\n    " + c.spec.format() + "  (required by " + c.origin + ")";
        }
        std::string hint;
        for (size_t i = 0; i < cons.size() && hint.empty(); ++i) {
            for (size_t j = i + 1; j < cons.size(); ++j) {
                if (!cons[i].spec.intersects(cons[j].spec)) {
                    hint = "'" + cons[i].spec.format() + "' from " + cons[i].origin +
                           " cannot hold together with '" + cons[j].spec.format() +
                           "' from " + cons[j].origin;
                    break;
                }
            }
        }
        return PinfoldError{PinfoldError::ConcretizationConflict, msg, hint};
    }

    Status decide_package(const std::string& name) {
        const std::vector<Constraint> cons = constraints_[name];

        std::string ns;
        for (const auto& c : cons) {
            if (!c.spec.namespace_name().empty()) { ns = c.spec.namespace_name(); break; }
        }
        PINFOLD_TRY_ASSIGN(const PackageRecipe* recipe, repo_.get(name, ns));

        Spec merged(name);
        for (const auto& c : cons) {
            Spec constraint = c.spec;
            constraint.set_name(name);
            if (merged.constrain(constraint).is_err()) return conflict_error(name, cons);
        }

        auto pin = pinned_.find(name);
        if (pin != pinned_.end() && !opts_.unpinned.count(name) &&
            pin->second->namespace_name() == recipe->namespace_name) {
            if (reusable(*pin->second, merged)) {
                log::debug("reusing %s/%s", pin->second->format().c_str(),
                           pin->second->short_hash().c_str());
                Spec node = node_only(*pin->second);
                node.set_virtuals({});
                return record(name, std::move(node), *recipe);
            }
            if (compiler_or_arch_reset()) {
                keep_version_and_variants(*pin->second, *recipe, merged);
            }
        }

        Spec node(name);
        node.set_namespace(recipe->namespace_name);

        PINFOLD_TRY_ASSIGN(Version version, choose_version(*recipe, merged, cons));
        node.set_versions(VersionList(version));

        PINFOLD_TRY_ASSIGN(ArchSpec arch, choose_arch(name, merged));
        node.set_arch(arch);

        PINFOLD_TRY_ASSIGN(CompilerSpec compiler, choose_compiler(name, merged, arch));
        node.set_compiler(compiler);

        PINFOLD_TRY(choose_variants(*recipe, merged, node));

        return record(name, std::move(node), *recipe);
    }

    bool compiler_or_arch_reset() const {
        return opts_.repick_compiler_and_arch || opts_.force_compiler || opts_.force_os;
    }

    bool reusable(const Spec& pin, const Spec& merged) const {
        if (opts_.repick_compiler_and_arch) return false;
        if (opts_.force_compiler &&
            (!pin.compiler() || pin.compiler()->name != *opts_.force_compiler)) {
            return false;
        }
        if (opts_.force_os && pin.arch().os != *opts_.force_os) return false;
        return pin.satisfies_node(merged);
    }

    // Narrows `merged` to the pin's version and variants when they still fit
    void keep_version_and_variants(const Spec& pin, const PackageRecipe& recipe,
                                   Spec& merged) const {
        if (!recipe.has_version(pin.version())) return;
        Spec kept(pin.name());
        kept.set_versions(VersionList(pin.version()));
        for (const auto& [key, values] : pin.variants()) kept.set_variant(key, values);

        Spec narrowed = merged;
        if (narrowed.constrain(kept).is_err()) {
            log::debug("%s no longer fits its constraints; resolving it again",
                       pin.format().c_str());
            return;
        }
        log::debug("keeping version and variants of %s", pin.format().c_str());
        merged = std::move(narrowed);
    }

    Status record(const std::string& name, Spec node, const PackageRecipe& recipe) {
        const Spec& decided = decided_[name] = std::move(node);
        std::string origin = name + "@" + decided.version().to_string();

        for (const auto& dep : recipe.dependencies) {
            if (dep.when && !decided.satisfies_node(*dep.when)) continue;
            const std::string& target = dep.spec.name();
            deps_[name].insert(target);
            add_constraint(target, node_only(dep.spec), origin, name);
            if (restart_) return ok_status();
            queue_.push_back(target);
        }
        return ok_status();
    }

    Result<Version> choose_version(const PackageRecipe& recipe, const Spec& merged,
                                   const std::vector<Constraint>& cons) const {
        std::vector<Version> candidates;
        for (const auto& v : recipe.versions) {
            if (merged.versions().contains(v)) candidates.push_back(v);
        }

        if (candidates.empty()) {
            if (cons.size() > 1) return conflict_error(recipe.name, cons);
            std::string available;
            for (const auto& v : recipe.versions) {
                if (!available.empty()) available += ", ";
                available += v.to_string();
            }
            std::string msg = "no version of '" + recipe.name + "' satisfies '" +
                              merged.format() + "'";
            if (!cons.empty()) msg += " (required by " + cons.front().origin + ")";
            return PinfoldError{PinfoldError::Version, msg, "available versions: " + available};
        }

        PackagePrefs prefs = prefs_.get(recipe.name);
        for (const auto& preferred : prefs.versions) {
            for (const auto& v : candidates) {
                if (preferred.contains(v)) return Result<Version>::ok(v);
            }
        }
        if (recipe.preferred &&
            std::find(candidates.begin(), candidates.end(), *recipe.preferred) != candidates.end()) {
            return Result<Version>::ok(*recipe.preferred);
        }
        return Result<Version>::ok(candidates.front());
    }

    Result<ArchSpec> choose_arch(const std::string& name, const Spec& merged) const {
        ArchSpec arch = merged.arch();
        const Spec* parent = parent_node(name);
        PackagePrefs prefs = prefs_.get(name);

        if (arch.platform.empty()) {
            if (parent) arch.platform = parent->arch().platform;
            else if (settings_.platform) arch.platform = *settings_.platform;
        }
        if (arch.os.empty()) {
            if (opts_.force_os) arch.os = *opts_.force_os;
            else if (parent) arch.os = parent->arch().os;
            else if (settings_.os) arch.os = *settings_.os;
        }
        if (arch.target.empty()) {
            if (prefs.target) arch.target = *prefs.target;
            else if (parent) arch.target = parent->arch().target;
            else if (settings_.target) arch.target = *settings_.target;
        }

        if (!arch.is_concrete()) {
            return PinfoldError{PinfoldError::IncompleteSpec,
                "cannot determine the architecture of '" + name + "'",
                "set platform, os and target under [config]"};
        }
        return Result<ArchSpec>::ok(std::move(arch));
    }

    Result<CompilerSpec> choose_compiler(const std::string& name, const Spec& merged,
                                         const ArchSpec& arch) const {
        if (compilers_.empty()) {
            return PinfoldError{PinfoldError::NotFound,
                "no compilers are configured",
                "add a [[compilers]] entry with spec = \"<name>@<version>\""};
        }

        std::vector<const CompilerEntry*> candidates;
        for (const auto& entry : compilers_) {
            if (merged.compiler() && !entry.spec.satisfies(*merged.compiler())) continue;
            if (opts_.force_compiler && entry.spec.name != *opts_.force_compiler) continue;
            if (!entry.operating_system.empty() && entry.operating_system != arch.os) continue;
            candidates.push_back(&entry);
        }

        if (candidates.empty()) {
            std::string wanted = merged.compiler() ? merged.compiler()->to_string()
                               : opts_.force_compiler ? *opts_.force_compiler : "any";
            return PinfoldError{PinfoldError::NotFound,
                "no configured compiler matches '" + wanted + "' on " + arch.os +
                " for '" + name + "'"};
        }

        const Spec* parent = parent_node(name);
        auto key = [&](const CompilerEntry* e) {
            size_t inherited = (parent && parent->compiler() && *parent->compiler() == e->spec) ? 0 : 1;
            return std::make_pair(prefs_.compiler_rank(name, e->spec), inherited);
        };
        std::stable_sort(candidates.begin(), candidates.end(),
                         [&](const CompilerEntry* a, const CompilerEntry* b) {
                             return key(a) < key(b);
                         });
        return Result<CompilerSpec>::ok(candidates.front()->spec);
    }

    Status choose_variants(const PackageRecipe& recipe, const Spec& merged, Spec& node) const {
        for (const auto& [key, values] : merged.variants()) {
            auto def = recipe.variants.find(key);
            if (def == recipe.variants.end()) {
                return PinfoldError{PinfoldError::Variant,
                    "package '" + recipe.name + "' has no variant '" + key + "'"};
            }
            for (const auto& v : values) {
                if (!def->second.allows(v)) {
                    return PinfoldError{PinfoldError::Variant,
                        "invalid value '" + v + "' for variant '" + key +
                        "' of package '" + recipe.name + "'"};
                }
            }
        }

        PackagePrefs prefs = prefs_.get(recipe.name);
        for (const auto& [key, def] : recipe.variants) {
            std::string value = def.default_value;
            auto requested = merged.variants().find(key);
            if (requested != merged.variants().end()) {
                if (!requested->second.count(def.default_value)) {
                    value = *requested->second.begin();
                }
            } else {
                auto pref = prefs.variants.find(key);
                if (pref != prefs.variants.end() && pref->second.size() == 1 &&
                    def.allows(*pref->second.begin())) {
                    value = *pref->second.begin();
                }
            }
            node.set_variant(key, {value});
        }
        return ok_status();
    }

    // -----------------------------------------------------------------------
    // Building concrete nodes
    // -----------------------------------------------------------------------

    Result<std::vector<SpecPtr>> build() {
        DependencyGraph graph;
        for (const auto& [name, node] : decided_) graph.add_node(name);
        for (const auto& [name, targets] : deps_) {
            for (const auto& target : targets) graph.add_edge(name, resolve_name(target));
        }

        auto order = graph.dependency_order();
        if (order.is_err()) {
            return PinfoldError{PinfoldError::Cycle,
                "packages depend on each other in a cycle",
                "check the dependencies of the packages being concretized"};
        }

        std::map<std::string, SpecPtr> built;
        for (const auto& name : order.value()) {
            Spec node = decided_.at(name);
            auto pv = provided_.find(name);
            if (pv != provided_.end()) {
                node.set_virtuals(std::vector<std::string>(pv->second.begin(), pv->second.end()));
            }
            for (const auto& target : deps_[name]) {
                node.add_dependency(built.at(resolve_name(target)));
            }
            PINFOLD_TRY_ASSIGN(SpecPtr spec, Spec::make_concrete(std::move(node)));
            built[name] = std::move(spec);
        }

        std::vector<SpecPtr> roots;
        for (const RootRequest* root : roots_) {
            auto it = built.find(resolve_name(root->spec.name()));
            if (it == built.end()) {
                log::error("root '%s' missing after concretization", root->origin.c_str());
                return PinfoldError{PinfoldError::Internal,
                    "root '" + root->origin + "' was not concretized"};
            }
            for (const auto& [dep_name, dep] : root->spec.dependencies()) {
                if (!it->second->contains(dep_name)) {
                    return PinfoldError{PinfoldError::Dependency,
                        "'" + root->spec.name() + "' does not depend on '" + dep_name + "'",
                        "remove '^" + dep_name + "' from '" + root->origin + "'"};
                }
            }
            roots.push_back(it->second);
        }
        return Result<std::vector<SpecPtr>>::ok(std::move(roots));
    }
};

} // namespace

// ---------------------------------------------------------------------------
// Concretizer
// ---------------------------------------------------------------------------

Concretizer::Concretizer(const RepositoryOverlay& repo,
                         const PackagePreferences& prefs,
                         const ConfigScopeStack& config)
    : repo_(repo), prefs_(prefs), config_(config) {}

std::vector<std::vector<size_t>> Concretizer::components(
    const std::vector<RootRequest>& roots) const
{
    std::vector<size_t> parent(roots.size());
    std::iota(parent.begin(), parent.end(), 0);
    std::function<size_t(size_t)> find = [&](size_t i) {
        while (parent[i] != i) {
            parent[i] = parent[parent[i]];
            i = parent[i];
        }
        return i;
    };

    std::map<std::string, size_t> owner;
    for (size_t i = 0; i < roots.size(); ++i) {
        std::set<std::string> names = repo_.possible_dependencies(roots[i].spec.name());
        for (const auto& [dep_name, dep] : roots[i].spec.dependencies()) {
            names.insert(dep_name);
        }
        for (const auto& name : names) {
            auto it = owner.find(name);
            if (it == owner.end()) {
                owner.emplace(name, i);
            } else {
                size_t a = find(i), b = find(it->second);
                if (a != b) parent[std::max(a, b)] = std::min(a, b);
            }
        }
    }

    std::map<size_t, std::vector<size_t>> groups;
    for (size_t i = 0; i < roots.size(); ++i) {
        groups[find(i)].push_back(i);
    }
    std::vector<std::vector<size_t>> out;
    for (auto& [leader, members] : groups) out.push_back(std::move(members));
    return out;
}

Result<ConcretizeResult> Concretizer::concretize(const std::vector<RootRequest>& roots,
                                                 const ConcretizeOptions& options) const {
    for (const auto& root : roots) {
        if (root.spec.is_anonymous()) {
            return PinfoldError{PinfoldError::InvalidArg,
                "cannot concretize '" + root.origin + "': no package name"};
        }
    }

    GeneralSettings settings = config_.settings();
    std::vector<CompilerEntry> compilers = config_.compilers();
    auto groups = components(roots);
    log::debug("concretizing %zu roots in %zu independent components",
               roots.size(), groups.size());

    ConcretizeResult result;
    result.roots.resize(roots.size());
    std::mutex merge_mutex;
    std::vector<std::optional<PinfoldError>> errors(groups.size());

    auto run_group = [&](size_t gi) {
        std::vector<const RootRequest*> members;
        for (size_t idx : groups[gi]) members.push_back(&roots[idx]);

        Resolution resolution(repo_, prefs_, settings, compilers, options, std::move(members));
        auto resolved = resolution.run();
        if (resolved.is_err()) {
            errors[gi] = std::move(resolved).error();
            return;
        }

        std::lock_guard<std::mutex> lock(merge_mutex);
        const auto& specs = resolved.value();
        for (size_t k = 0; k < specs.size(); ++k) {
            result.roots[groups[gi][k]] = specs[k];
        }
        for (const auto& spec : traverse_all(specs)) {
            result.specs_by_hash.emplace(spec->hash(), spec);
        }
    };

    if (options.parallel && groups.size() > 1) {
        std::vector<std::future<void>> tasks;
        for (size_t gi = 0; gi < groups.size(); ++gi) {
            tasks.push_back(std::async(std::launch::async, run_group, gi));
        }
        for (auto& task : tasks) task.get();
    } else {
        for (size_t gi = 0; gi < groups.size(); ++gi) run_group(gi);
    }

    for (auto& error : errors) {
        if (error) return std::move(*error);
    }
    return Result<ConcretizeResult>::ok(std::move(result));
}

Result<SpecPtr> Concretizer::concretize_one(const Spec& root) const {
    std::vector<RootRequest> roots{RootRequest{root, root.to_string()}};
    PINFOLD_TRY_ASSIGN(auto result, concretize(roots));
    return Result<SpecPtr>::ok(result.roots.front());
}

} // namespace pinfold
