#include <pinfold/spec.hpp>
#include <pinfold/graph.hpp>
#include <pinfold/sha256.hpp>

#include <algorithm>
#include <cctype>
#include <queue>
#include <sstream>
#include <unordered_map>
#include <unordered_set>

namespace pinfold {

// ---------------------------------------------------------------------------
// CompilerSpec
// ---------------------------------------------------------------------------

Result<CompilerSpec> CompilerSpec::parse(const std::string& s) {
    CompilerSpec cs;
    size_t at = s.find('@');
    cs.name = s.substr(0, at);
    if (cs.name.empty()) {
        return PinfoldError{PinfoldError::Parse,
            "invalid compiler '" + s + "': missing name"};
    }
    for (char c : cs.name) {
        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '_' && c != '-') {
            return PinfoldError{PinfoldError::Parse,
                "invalid character '" + std::string(1, c) +
                "' in compiler name '" + cs.name + "'"};
        }
    }
    if (at != std::string::npos) {
        auto vl = VersionList::parse(s.substr(at + 1));
        if (vl.is_err()) return std::move(vl).error();
        cs.versions = std::move(vl).value();
    }
    return Result<CompilerSpec>::ok(std::move(cs));
}

bool CompilerSpec::satisfies(const CompilerSpec& constraint) const {
    if (!constraint.name.empty() && name != constraint.name) return false;
    return versions.satisfies(constraint.versions);
}

bool CompilerSpec::intersects(const CompilerSpec& other) const {
    if (!name.empty() && !other.name.empty() && name != other.name) return false;
    return versions.intersects(other.versions);
}

std::string CompilerSpec::to_string() const {
    if (versions.is_any()) return name;
    return name + "@" + versions.to_string();
}

// ---------------------------------------------------------------------------
// ArchSpec
// ---------------------------------------------------------------------------

Result<ArchSpec> ArchSpec::parse(const std::string& s) {
    std::vector<std::string> fields;
    std::string current;
    for (char c : s) {
        if (c == '-') {
            fields.push_back(current);
            current.clear();
        } else {
            current += c;
        }
    }
    fields.push_back(current);

    if (fields.size() != 3) {
        return PinfoldError{PinfoldError::Parse,
            "invalid architecture '" + s + "'",
            "expected platform-os-target, e.g. linux-debian6-x86_64"};
    }

    ArchSpec a;
    a.platform = fields[0];
    a.os = fields[1];
    a.target = fields[2];
    return Result<ArchSpec>::ok(std::move(a));
}

static bool field_satisfies(const std::string& have, const std::string& want) {
    return want.empty() || have == want;
}

static bool field_intersects(const std::string& a, const std::string& b) {
    return a.empty() || b.empty() || a == b;
}

bool ArchSpec::satisfies(const ArchSpec& constraint) const {
    return field_satisfies(platform, constraint.platform) &&
           field_satisfies(os, constraint.os) &&
           field_satisfies(target, constraint.target);
}

bool ArchSpec::intersects(const ArchSpec& other) const {
    return field_intersects(platform, other.platform) &&
           field_intersects(os, other.os) &&
           field_intersects(target, other.target);
}

std::string ArchSpec::to_string() const {
    if (empty()) return "";
    return platform + "-" + os + "-" + target;
}

// ---------------------------------------------------------------------------
// Spec parser
// ---------------------------------------------------------------------------

namespace {

bool is_ident_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '_' || c == '-' || c == '.';
}

bool is_version_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) ||
           c == '.' || c == '_' || c == '-' || c == ':' || c == ',';
}

class SpecParser {
public:
    explicit SpecParser(const std::string& text) : s_(text) {}

    Result<Spec> parse() {
        if (s_.find_first_not_of(" \t") == std::string::npos) {
            return PinfoldError{PinfoldError::Parse, "empty spec"};
        }

        Spec root;
        std::vector<Spec> deps;
        Spec* cur = &root;

        while (true) {
            bool spaced = skip_space();
            if (pos_ >= s_.size()) break;
            char c = s_[pos_];

            if (c == '^') {
                ++pos_;
                skip_space();
                if (pos_ >= s_.size() || !is_ident_char(s_[pos_])) {
                    return error("expected a package name after '^'");
                }
                deps.emplace_back();
                cur = &deps.back();
                auto st = parse_name(*cur);
                if (st.is_err()) return std::move(st).error();
            } else if (c == '@') {
                ++pos_;
                if (!cur->versions().is_any()) {
                    return error("version specified twice");
                }
                std::string text = read_while(is_version_char);
                if (text.empty()) return error("expected a version after '@'");
                auto vl = VersionList::parse(text);
                if (vl.is_err()) return with_context(std::move(vl).error());
                cur->set_versions(std::move(vl).value());
            } else if (c == '%') {
                ++pos_;
                if (cur->compiler()) return error("compiler specified twice");
                std::string text = read_while([](char ch) {
                    return std::isalnum(static_cast<unsigned char>(ch)) ||
                           ch == '_' || ch == '-';
                });
                if (text.empty()) return error("expected a compiler name after '%'");
                if (pos_ < s_.size() && s_[pos_] == '@') {
                    ++pos_;
                    std::string ver = read_while(is_version_char);
                    if (ver.empty()) return error("expected a compiler version after '@'");
                    text += "@" + ver;
                }
                auto cs = CompilerSpec::parse(text);
                if (cs.is_err()) return with_context(std::move(cs).error());
                cur->set_compiler(std::move(cs).value());
            } else if (c == '+' || c == '~' || (c == '-' && (spaced || pos_ == 0))) {
                ++pos_;
                std::string var = read_while(is_ident_char);
                if (var.empty()) {
                    return error(std::string("expected a variant name after '") + c + "'");
                }
                if (cur->variants().count(var)) {
                    return error("variant '" + var + "' specified twice");
                }
                cur->set_variant(var, {c == '+' ? "true" : "false"});
            } else if (is_ident_char(c)) {
                size_t start = pos_;
                std::string ident = read_while(is_ident_char);
                if (pos_ < s_.size() && s_[pos_] == '=') {
                    ++pos_;
                    std::string value = read_while([](char ch) {
                        return !std::isspace(static_cast<unsigned char>(ch)) &&
                               ch != '^' && ch != '%' && ch != '@';
                    });
                    if (value.empty()) return error("expected a value for '" + ident + "'");
                    auto st = apply_key_value(*cur, ident, value);
                    if (st.is_err()) return std::move(st).error();
                } else {
                    if (!cur->name().empty() || cur != &root || !spaced_allowed_name(start)) {
                        pos_ = start;
                        return error("unexpected token '" + ident + "'");
                    }
                    pos_ = start;
                    auto st = parse_name(*cur);
                    if (st.is_err()) return std::move(st).error();
                }
            } else {
                return error("unexpected character '" + std::string(1, c) + "'");
            }
        }

        for (auto& dep : deps) {
            if (root.dependencies().count(dep.name())) {
                return PinfoldError{PinfoldError::Parse,
                    "dependency '" + dep.name() + "' specified twice in '" + s_ + "'"};
            }
            root.add_dependency(std::make_shared<const Spec>(std::move(dep)));
        }

        return Result<Spec>::ok(std::move(root));
    }

private:
    const std::string& s_;
    size_t pos_ = 0;

    // The root name must come before any attribute
    bool spaced_allowed_name(size_t start) const {
        for (size_t i = 0; i < start; ++i) {
            if (!std::isspace(static_cast<unsigned char>(s_[i]))) return false;
        }
        return true;
    }

    PinfoldError error(const std::string& msg) const {
        return PinfoldError{PinfoldError::Parse,
            msg + " at column " + std::to_string(pos_ + 1) + " in '" + s_ + "'"};
    }

    PinfoldError with_context(PinfoldError e) const {
        e.message += " in spec '" + s_ + "'";
        return e;
    }

    bool skip_space() {
        bool skipped = false;
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) {
            ++pos_;
            skipped = true;
        }
        return skipped;
    }

    template<typename Pred>
    std::string read_while(Pred pred) {
        size_t start = pos_;
        while (pos_ < s_.size() && pred(s_[pos_])) ++pos_;
        return s_.substr(start, pos_ - start);
    }

    Status parse_name(Spec& spec) {
        std::string ident = read_while(is_ident_char);
        if (ident.empty() || ident.front() == '-' || ident.front() == '.') {
            return error("invalid package name '" + ident + "'");
        }
        // "builtin.mock.mpileaks" names a package in a specific namespace
        size_t dot = ident.rfind('.');
        if (dot != std::string::npos) {
            spec.set_namespace(ident.substr(0, dot));
            ident = ident.substr(dot + 1);
        }
        spec.set_name(ident);
        return ok_status();
    }

    Status apply_key_value(Spec& spec, const std::string& key, const std::string& value) {
        if (key == "arch" || key == "architecture") {
            if (!spec.arch().empty()) return error("architecture specified twice");
            auto a = ArchSpec::parse(value);
            if (a.is_err()) return with_context(std::move(a).error());
            spec.set_arch(std::move(a).value());
            return ok_status();
        }
        if (key == "platform" || key == "os" || key == "target") {
            ArchSpec a = spec.arch();
            std::string& field = key == "platform" ? a.platform
                               : key == "os" ? a.os : a.target;
            if (!field.empty()) return error(key + " specified twice");
            field = value;
            spec.set_arch(std::move(a));
            return ok_status();
        }

        if (spec.variants().count(key)) {
            return error("variant '" + key + "' specified twice");
        }
        std::set<std::string> values;
        std::istringstream stream(value);
        std::string item;
        while (std::getline(stream, item, ',')) {
            if (item.empty()) return error("empty value for variant '" + key + "'");
            values.insert(item);
        }
        spec.set_variant(key, std::move(values));
        return ok_status();
    }
};

} // namespace

Result<Spec> Spec::parse(const std::string& s) {
    return SpecParser(s).parse();
}

Result<SpecPtr> Spec::parse_ptr(const std::string& s) {
    auto r = parse(s);
    if (r.is_err()) return std::move(r).error();
    return Result<SpecPtr>::ok(std::make_shared<const Spec>(std::move(r).value()));
}

// ---------------------------------------------------------------------------
// Mutation
// ---------------------------------------------------------------------------

void Spec::set_variant(const std::string& key, std::set<std::string> values) {
    variants_[key] = std::move(values);
    hash_.clear();
}

void Spec::set_virtuals(std::vector<std::string> v) {
    std::sort(v.begin(), v.end());
    v.erase(std::unique(v.begin(), v.end()), v.end());
    virtuals_ = std::move(v);
    hash_.clear();
}

void Spec::add_dependency(SpecPtr dep) {
    dependencies_[dep->name()] = std::move(dep);
    hash_.clear();
}

Status Spec::constrain(const Spec& other) {
    auto conflict = [&](PinfoldError::Code code, const std::string& what) {
        return PinfoldError{code,
            "cannot constrain '" + format() + "' with '" + other.format() + "': " + what};
    };

    if (!other.name_.empty()) {
        if (!name_.empty() && name_ != other.name_) {
            return conflict(PinfoldError::InvalidArg, "package names differ");
        }
        name_ = other.name_;
    }
    if (!other.namespace_.empty()) {
        if (!namespace_.empty() && namespace_ != other.namespace_) {
            return conflict(PinfoldError::InvalidArg, "namespaces differ");
        }
        namespace_ = other.namespace_;
    }

    auto versions = versions_.intersection(other.versions_);
    if (!versions) return conflict(PinfoldError::Version, "no common version");
    versions_ = std::move(*versions);

    if (other.compiler_) {
        if (!compiler_) {
            compiler_ = other.compiler_;
        } else {
            if (!compiler_->intersects(*other.compiler_)) {
                return conflict(PinfoldError::InvalidArg, "compilers conflict");
            }
            if (compiler_->name.empty()) compiler_->name = other.compiler_->name;
            compiler_->versions = *compiler_->versions.intersection(other.compiler_->versions);
        }
    }

    for (const auto& [key, values] : other.variants_) {
        auto it = variants_.find(key);
        if (it == variants_.end()) {
            variants_[key] = values;
            continue;
        }
        std::set<std::string> common;
        for (const auto& v : it->second) {
            if (values.count(v)) common.insert(v);
        }
        if (common.empty()) {
            return conflict(PinfoldError::Variant, "variant '" + key + "' has no common value");
        }
        it->second = std::move(common);
    }

    if (!arch_.intersects(other.arch_)) {
        return conflict(PinfoldError::InvalidArg, "architectures conflict");
    }
    if (arch_.platform.empty()) arch_.platform = other.arch_.platform;
    if (arch_.os.empty()) arch_.os = other.arch_.os;
    if (arch_.target.empty()) arch_.target = other.arch_.target;

    for (const auto& [dep_name, dep] : other.dependencies_) {
        auto it = dependencies_.find(dep_name);
        if (it == dependencies_.end()) {
            dependencies_[dep_name] = dep;
            continue;
        }
        Spec merged = *it->second;
        PINFOLD_TRY(merged.constrain(*dep));
        it->second = std::make_shared<const Spec>(std::move(merged));
    }

    hash_.clear();
    return ok_status();
}

std::string Spec::variant_value(const std::string& key) const {
    auto it = variants_.find(key);
    if (it == variants_.end() || it->second.size() != 1) return "";
    return *it->second.begin();
}

// ---------------------------------------------------------------------------
// Concreteness and hashing
// ---------------------------------------------------------------------------

Result<SpecPtr> Spec::make_concrete(Spec node) {
    auto incomplete = [&](const std::string& what) {
        return PinfoldError{PinfoldError::IncompleteSpec,
            "spec '" + node.format() + "' is not concrete: " + what};
    };

    if (node.name_.empty()) return incomplete("missing package name");
    if (!node.versions_.is_single()) return incomplete("version is not fixed");
    if (!node.compiler_ || !node.compiler_->is_concrete()) {
        return incomplete("compiler is not fixed");
    }
    if (!node.arch_.is_concrete()) return incomplete("architecture is not fixed");
    for (const auto& [key, values] : node.variants_) {
        if (values.size() != 1) return incomplete("variant '" + key + "' has no single value");
    }
    for (const auto& [dep_name, dep] : node.dependencies_) {
        if (!dep->is_concrete()) {
            return incomplete("dependency '" + dep_name + "' is abstract");
        }
    }

    node.hash_ = content_hash(node.node_digest_text());
    return Result<SpecPtr>::ok(std::make_shared<const Spec>(std::move(node)));
}

std::string Spec::node_digest_text() const {
    std::ostringstream out;
    out << "name " << name_ << "\n";
    out << "namespace " << namespace_ << "\n";
    out << "version " << versions_.to_string() << "\n";
    out << "compiler " << (compiler_ ? compiler_->to_string() : "") << "\n";
    out << "arch " << arch_.to_string() << "\n";
    for (const auto& [key, values] : variants_) {
        out << "variant " << key << "=";
        bool first = true;
        for (const auto& v : values) {
            if (!first) out << ",";
            out << v;
            first = false;
        }
        out << "\n";
    }
    for (const auto& v : virtuals_) {
        out << "provides " << v << "\n";
    }
    for (const auto& [dep_name, dep] : dependencies_) {
        out << "depends " << dep_name << " " << dep->hash_ << "\n";
    }
    return out.str();
}

Result<std::string> Spec::dag_hash() const {
    if (hash_.empty()) {
        return PinfoldError{PinfoldError::IncompleteSpec,
            "cannot hash abstract spec '" + to_string() + "'",
            "only concretized specs have a content hash"};
    }
    return Result<std::string>::ok(hash_);
}

std::string Spec::short_hash(size_t length) const {
    return hash_.substr(0, length);
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

bool Spec::provides(const std::string& virtual_name) const {
    return std::binary_search(virtuals_.begin(), virtuals_.end(), virtual_name);
}

bool Spec::satisfies_node(const Spec& c) const {
    bool via_virtual = false;
    if (!c.name_.empty() && c.name_ != name_) {
        if (!provides(c.name_)) return false;
        via_virtual = true;
    }
    if (!c.namespace_.empty() && namespace_ != c.namespace_) return false;

    // Version constraints on a virtual do not apply to the provider's version
    if (!via_virtual && !versions_.satisfies(c.versions_)) return false;

    if (c.compiler_) {
        if (!compiler_ || !compiler_->satisfies(*c.compiler_)) return false;
    }

    for (const auto& [key, allowed] : c.variants_) {
        auto it = variants_.find(key);
        if (it == variants_.end()) return false;
        for (const auto& v : it->second) {
            if (!allowed.count(v)) return false;
        }
    }

    return arch_.satisfies(c.arch_);
}

bool Spec::satisfies(const Spec& c) const {
    if (!satisfies_node(c)) return false;
    for (const auto& [dep_name, dep_constraint] : c.dependencies_) {
        SpecPtr found = find(dep_name);
        if (!found || !found->satisfies(*dep_constraint)) return false;
    }
    return true;
}

bool Spec::intersects(const Spec& o) const {
    if (!name_.empty() && !o.name_.empty() && name_ != o.name_) return false;
    if (!versions_.intersects(o.versions_)) return false;
    if (compiler_ && o.compiler_ && !compiler_->intersects(*o.compiler_)) return false;
    for (const auto& [key, values] : variants_) {
        auto it = o.variants_.find(key);
        if (it == o.variants_.end()) continue;
        bool common = std::any_of(values.begin(), values.end(),
            [&](const std::string& v) { return it->second.count(v) > 0; });
        if (!common) return false;
    }
    return arch_.intersects(o.arch_);
}

SpecPtr Spec::find(const std::string& name) const {
    std::unordered_set<const Spec*> visited;
    std::queue<const Spec*> queue;
    queue.push(this);
    visited.insert(this);
    while (!queue.empty()) {
        const Spec* node = queue.front();
        queue.pop();
        for (const auto& [dep_name, dep] : node->dependencies_) {
            if (dep_name == name || dep->provides(name)) return dep;
            if (visited.insert(dep.get()).second) queue.push(dep.get());
        }
    }
    return nullptr;
}

bool Spec::contains(const std::string& name) const {
    return find(name) != nullptr;
}

// ---------------------------------------------------------------------------
// Formatting
// ---------------------------------------------------------------------------

std::string Spec::format() const {
    std::string out = name_;
    if (!namespace_.empty() && !name_.empty()) out = namespace_ + "." + name_;
    if (!versions_.is_any()) out += "@" + versions_.to_string();
    if (compiler_) out += "%" + compiler_->to_string();

    std::string key_values;
    for (const auto& [key, values] : variants_) {
        if (values.size() == 1 && *values.begin() == "true") {
            out += "+" + key;
        } else if (values.size() == 1 && *values.begin() == "false") {
            out += "~" + key;
        } else {
            key_values += " " + key + "=";
            bool first = true;
            for (const auto& v : values) {
                if (!first) key_values += ",";
                key_values += v;
                first = false;
            }
        }
    }
    out += key_values;

    if (arch_.is_concrete()) {
        out += " arch=" + arch_.to_string();
    } else {
        if (!arch_.platform.empty()) out += " platform=" + arch_.platform;
        if (!arch_.os.empty()) out += " os=" + arch_.os;
        if (!arch_.target.empty()) out += " target=" + arch_.target;
    }
    return out;
}

std::string Spec::to_string() const {
    std::map<std::string, const Spec*> all;
    std::unordered_set<const Spec*> visited;
    std::queue<const Spec*> queue;
    queue.push(this);
    while (!queue.empty()) {
        const Spec* node = queue.front();
        queue.pop();
        for (const auto& [dep_name, dep] : node->dependencies_) {
            if (visited.insert(dep.get()).second) {
                all.emplace(dep_name, dep.get());
                queue.push(dep.get());
            }
        }
    }

    std::string out = format();
    for (const auto& [dep_name, dep] : all) {
        out += " ^" + dep->format();
    }
    return out;
}

std::string Spec::tree(const std::string& indent) const {
    // Keys are node identities; labels come from the node's format()
    DependencyGraph graph;
    std::unordered_map<std::string, const Spec*> nodes;
    std::unordered_set<const Spec*> visited;

    auto key_of = [](const Spec* node) {
        if (node->is_concrete()) return node->hash_;
        std::ostringstream out;
        out << static_cast<const void*>(node);
        return out.str();
    };

    std::queue<const Spec*> queue;
    queue.push(this);
    visited.insert(this);
    graph.add_node(key_of(this));
    nodes[key_of(this)] = this;
    while (!queue.empty()) {
        const Spec* node = queue.front();
        queue.pop();
        std::string from = key_of(node);
        for (const auto& [dep_name, dep] : node->dependencies_) {
            std::string to = key_of(dep.get());
            nodes[to] = dep.get();
            graph.add_edge(from, to);
            if (visited.insert(dep.get()).second) queue.push(dep.get());
        }
    }

    return graph.render_tree(key_of(this), [&](const std::string& key) {
        return nodes.at(key)->format();
    }, indent);
}

bool Spec::operator==(const Spec& o) const {
    if (is_concrete() && o.is_concrete()) return hash_ == o.hash_;
    if (name_ != o.name_ || namespace_ != o.namespace_ ||
        versions_ != o.versions_ || compiler_ != o.compiler_ ||
        variants_ != o.variants_ || arch_ != o.arch_ ||
        virtuals_ != o.virtuals_ ||
        dependencies_.size() != o.dependencies_.size()) {
        return false;
    }
    for (const auto& [dep_name, dep] : dependencies_) {
        auto it = o.dependencies_.find(dep_name);
        if (it == o.dependencies_.end() || *dep != *it->second) return false;
    }
    return true;
}

// ---------------------------------------------------------------------------
// Traversal
// ---------------------------------------------------------------------------

static std::string visit_key(const SpecPtr& spec) {
    if (spec->is_concrete()) return spec->hash();
    std::ostringstream out;
    out << static_cast<const void*>(spec.get());
    return out.str();
}

static void traverse_impl(const SpecPtr& node,
                          std::unordered_set<std::string>& visited,
                          std::vector<SpecPtr>& out) {
    if (!visited.insert(visit_key(node)).second) return;
    out.push_back(node);
    for (const auto& [dep_name, dep] : node->dependencies()) {
        traverse_impl(dep, visited, out);
    }
}

std::vector<SpecPtr> traverse(const SpecPtr& root) {
    std::vector<SpecPtr> out;
    std::unordered_set<std::string> visited;
    traverse_impl(root, visited, out);
    return out;
}

std::vector<SpecPtr> traverse_all(const std::vector<SpecPtr>& roots) {
    std::vector<SpecPtr> out;
    std::unordered_set<std::string> visited;
    for (const auto& root : roots) {
        traverse_impl(root, visited, out);
    }
    return out;
}

Result<std::vector<SpecPtr>> dependency_order(const std::vector<SpecPtr>& roots) {
    std::vector<SpecPtr> nodes = traverse_all(roots);
    DependencyGraph graph;
    std::unordered_map<std::string, SpecPtr> by_hash;
    for (const auto& node : nodes) {
        if (!node->is_concrete()) {
            return PinfoldError{PinfoldError::IncompleteSpec,
                "'" + node->format() + "' is not concrete"};
        }
        by_hash.emplace(node->hash(), node);
        graph.add_node(node->hash());
        for (const auto& [name, dep] : node->dependencies()) {
            graph.add_edge(node->hash(), dep->hash());
        }
    }

    PINFOLD_TRY_ASSIGN(auto order, graph.dependency_order());
    std::vector<SpecPtr> out;
    out.reserve(order.size());
    for (const auto& hash : order) out.push_back(by_hash.at(hash));
    return Result<std::vector<SpecPtr>>::ok(std::move(out));
}

} // namespace pinfold
