#pragma once

#include <pinfold/result.hpp>
#include <pinfold/version.hpp>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace pinfold {

// Compiler constraint or exact compiler: "gcc", "gcc@4.5:", "clang@3.3"
struct CompilerSpec {
    std::string name;
    VersionList versions;

    static Result<CompilerSpec> parse(const std::string& s);

    bool is_concrete() const { return !name.empty() && versions.is_single(); }
    bool satisfies(const CompilerSpec& constraint) const;
    bool intersects(const CompilerSpec& other) const;
    std::string to_string() const;

    bool operator==(const CompilerSpec& o) const {
        return name == o.name && versions == o.versions;
    }
    bool operator!=(const CompilerSpec& o) const { return !(*this == o); }
};

// platform-os-target triple; empty fields are unconstrained
struct ArchSpec {
    std::string platform;
    std::string os;
    std::string target;

    // "linux-debian6-x86_64"; "-" separated, fields may be empty
    static Result<ArchSpec> parse(const std::string& s);

    bool empty() const { return platform.empty() && os.empty() && target.empty(); }
    bool is_concrete() const { return !platform.empty() && !os.empty() && !target.empty(); }
    bool satisfies(const ArchSpec& constraint) const;
    bool intersects(const ArchSpec& other) const;
    std::string to_string() const;

    bool operator==(const ArchSpec& o) const {
        return platform == o.platform && os == o.os && target == o.target;
    }
    bool operator!=(const ArchSpec& o) const { return !(*this == o); }
};

class Spec;
using SpecPtr = std::shared_ptr<const Spec>;

// Boolean variants are stored with the values "true" / "false".
using VariantMap = std::map<std::string, std::set<std::string>>;

// A package request (abstract) or a resolution result (concrete).
//
// A spec becomes concrete only through Spec::make_concrete(), which checks
// every attribute is fixed and stamps the content hash. Concrete specs are
// shared as SpecPtr and never change: every setter drops the hash, so a
// modified copy is abstract again until it is re-made concrete.
class Spec {
public:
    Spec() = default;
    explicit Spec(std::string name) : name_(std::move(name)) {}

    // Parse "mpileaks@2.2 +debug %gcc@4.5 arch=linux-debian6-x86_64 ^callpath@0.9"
    static Result<Spec> parse(const std::string& s);
    static Result<SpecPtr> parse_ptr(const std::string& s);

    // Validate that `node` is fully fixed (its dependencies included) and
    // stamp its content hash.
    static Result<SpecPtr> make_concrete(Spec node);

    // --- attributes ---
    const std::string& name() const { return name_; }
    const std::string& namespace_name() const { return namespace_; }
    const VersionList& versions() const { return versions_; }
    const std::optional<CompilerSpec>& compiler() const { return compiler_; }
    const VariantMap& variants() const { return variants_; }
    const ArchSpec& arch() const { return arch_; }
    const std::map<std::string, SpecPtr>& dependencies() const { return dependencies_; }
    const std::vector<std::string>& virtuals() const { return virtuals_; }

    // Exact version of a concrete spec
    const Version& version() const { return versions_.single(); }
    // Single value of a variant, or empty
    std::string variant_value(const std::string& key) const;

    void set_name(std::string name) { name_ = std::move(name); hash_.clear(); }
    void set_namespace(std::string ns) { namespace_ = std::move(ns); hash_.clear(); }
    void set_versions(VersionList v) { versions_ = std::move(v); hash_.clear(); }
    void set_compiler(std::optional<CompilerSpec> c) { compiler_ = std::move(c); hash_.clear(); }
    void set_variant(const std::string& key, std::set<std::string> values);
    void set_arch(ArchSpec a) { arch_ = std::move(a); hash_.clear(); }
    void set_virtuals(std::vector<std::string> v);
    void add_dependency(SpecPtr dep);
    void clear_dependencies() { dependencies_.clear(); hash_.clear(); }

    // Narrow this abstract spec by every constraint in `other`. Fails when
    // the two cannot describe one package (different names, disjoint
    // versions or variant values, conflicting compiler or arch fields).
    Status constrain(const Spec& other);

    // --- queries ---
    bool is_concrete() const { return !hash_.empty(); }
    bool is_anonymous() const { return name_.empty(); }

    // Content hash; IncompleteSpec error on an abstract spec
    Result<std::string> dag_hash() const;
    // Full content hash, "" for abstract specs
    const std::string& hash() const { return hash_; }
    // First `length` characters of the hash ("" for abstract specs)
    std::string short_hash(size_t length = 7) const;

    // Every concrete spec satisfying this one also satisfies `constraint`.
    bool satisfies(const Spec& constraint) const;
    // Node attributes only (name, version, compiler, variants, arch)
    bool satisfies_node(const Spec& constraint) const;
    // Some concrete spec could satisfy both (node attributes only)
    bool intersects(const Spec& other) const;

    // Dependency named `name`, or providing virtual `name`, anywhere in the
    // transitive closure (the spec itself excluded)
    bool contains(const std::string& name) const;
    SpecPtr find(const std::string& name) const;
    bool provides(const std::string& virtual_name) const;

    // "mpileaks@2.3%gcc@4.5.0~debug arch=linux-debian6-x86_64"
    std::string format() const;
    // format() followed by " ^dep" for every transitive dependency, by name
    std::string to_string() const;
    // Indented dependency tree, one node per line, each node labelled with
    // format(); already printed nodes are marked "(*)"
    std::string tree(const std::string& indent = "") const;

    // Canonical node description hashed into dag_hash()
    std::string node_digest_text() const;

    // Hash equality for concrete specs, structural otherwise
    bool operator==(const Spec& o) const;
    bool operator!=(const Spec& o) const { return !(*this == o); }

private:
    std::string name_;
    std::string namespace_;
    VersionList versions_;
    std::optional<CompilerSpec> compiler_;
    VariantMap variants_;
    ArchSpec arch_;
    std::map<std::string, SpecPtr> dependencies_;
    std::vector<std::string> virtuals_;
    std::string hash_;
};

// Pre-order traversal from `root`, root first, each node once, children in
// name order.
std::vector<SpecPtr> traverse(const SpecPtr& root);

// Traversal of several roots with shared nodes visited once.
std::vector<SpecPtr> traverse_all(const std::vector<SpecPtr>& roots);

// Closure of concrete `roots`, every dependency before its dependents.
// IncompleteSpec error if any node is abstract.
Result<std::vector<SpecPtr>> dependency_order(const std::vector<SpecPtr>& roots);

} // namespace pinfold
