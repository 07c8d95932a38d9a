#include <pinfold/lockfile.hpp>
#include <pinfold/fs_util.hpp>
#include <pinfold/log.hpp>
#include <toml++/toml.hpp>

#include <set>
#include <sstream>

namespace pinfold {

// ---------------------------------------------------------------------------
// Writing
// ---------------------------------------------------------------------------

static toml::table spec_to_toml(const Spec& spec) {
    toml::table node;
    node.insert_or_assign("name", spec.name());
    node.insert_or_assign("namespace", spec.namespace_name());
    node.insert_or_assign("version", spec.version().to_string());
    node.insert_or_assign("compiler", spec.compiler() ? spec.compiler()->to_string() : "");
    node.insert_or_assign("arch", spec.arch().to_string());

    toml::table variants;
    variants.is_inline(true);
    for (const auto& [key, values] : spec.variants()) {
        variants.insert_or_assign(key, *values.begin());
    }
    node.insert_or_assign("variants", std::move(variants));

    toml::array virtuals;
    for (const auto& v : spec.virtuals()) virtuals.push_back(v);
    node.insert_or_assign("virtuals", std::move(virtuals));

    toml::table deps;
    deps.is_inline(true);
    for (const auto& [name, dep] : spec.dependencies()) {
        deps.insert_or_assign(name, dep->hash());
    }
    node.insert_or_assign("dependencies", std::move(deps));
    return node;
}

std::string LockFile::to_toml() const {
    toml::table doc;

    toml::table meta;
    meta.insert_or_assign("lockfile-version", static_cast<int64_t>(kCurrentVersion));
    doc.insert_or_assign("_meta", std::move(meta));

    toml::array root_list;
    for (const auto& root : roots) {
        toml::table entry;
        entry.insert_or_assign("hash", root.hash);
        entry.insert_or_assign("spec", root.spec);
        root_list.push_back(std::move(entry));
    }
    doc.insert_or_assign("roots", std::move(root_list));

    toml::table specs;
    for (const auto& [hash, spec] : specs_by_hash) {
        specs.insert_or_assign(hash, spec_to_toml(*spec));
    }
    doc.insert_or_assign("concrete-specs", std::move(specs));

    std::ostringstream out;
    out << doc << "\n";
    return out.str();
}

Status LockFile::save(const std::string& path) const {
    return atomic_write_file(path, to_toml());
}

// ---------------------------------------------------------------------------
// Reading
// ---------------------------------------------------------------------------

namespace {

class SpecRebuilder {
public:
    SpecRebuilder(const toml::table& entries, const std::string& source)
        : entries_(entries), source_(source) {}

    Result<SpecPtr> build(const std::string& hash) {
        auto done = built_.find(hash);
        if (done != built_.end()) return Result<SpecPtr>::ok(done->second);

        auto entry = entries_[hash].as_table();
        if (!entry) {
            return PinfoldError{PinfoldError::Parse,
                "lockfile references unknown spec " + hash, "", source_, 0};
        }
        if (!in_progress_.insert(hash).second) {
            return PinfoldError{PinfoldError::Cycle,
                "lockfile spec " + hash + " depends on itself", "", source_, 0};
        }

        auto fail = [&](const std::string& msg) {
            return PinfoldError{PinfoldError::Parse,
                "lockfile spec " + hash + ": " + msg, "", source_,
                static_cast<int>(entry->source().begin.line)};
        };

        auto name = (*entry)["name"].value<std::string>();
        auto version = (*entry)["version"].value<std::string>();
        auto compiler = (*entry)["compiler"].value<std::string>();
        auto arch = (*entry)["arch"].value<std::string>();
        if (!name || !version || !compiler || !arch) {
            return fail("name, version, compiler and arch are required");
        }

        Spec node(*name);
        node.set_namespace((*entry)["namespace"].value_or(std::string{}));

        auto v = Version::parse(*version);
        if (v.is_err()) return fail(v.error().message);
        node.set_versions(VersionList(v.value()));

        auto cs = CompilerSpec::parse(*compiler);
        if (cs.is_err()) return fail(cs.error().message);
        node.set_compiler(std::move(cs).value());

        auto a = ArchSpec::parse(*arch);
        if (a.is_err()) return fail(a.error().message);
        node.set_arch(std::move(a).value());

        if (auto variants = (*entry)["variants"].as_table()) {
            for (const auto& [key, val] : *variants) {
                auto s = val.value<std::string>();
                if (!s) return fail("variant '" + std::string(key.str()) + "' must be a string");
                node.set_variant(std::string(key.str()), {*s});
            }
        }

        if (auto virtuals = (*entry)["virtuals"].as_array()) {
            std::vector<std::string> names;
            for (const auto& elem : *virtuals) {
                auto s = elem.value<std::string>();
                if (!s) return fail("virtuals must be strings");
                names.push_back(*s);
            }
            node.set_virtuals(std::move(names));
        }

        if (auto deps = (*entry)["dependencies"].as_table()) {
            for (const auto& [dep_name, dep_hash] : *deps) {
                auto h = dep_hash.value<std::string>();
                if (!h) return fail("dependency '" + std::string(dep_name.str()) + "' must be a hash");
                PINFOLD_TRY_ASSIGN(SpecPtr dep, build(*h));
                node.add_dependency(std::move(dep));
            }
        }

        PINFOLD_TRY_ASSIGN(SpecPtr spec, Spec::make_concrete(std::move(node)));
        if (spec->hash() != hash) {
            return PinfoldError{PinfoldError::Checksum,
                "lockfile spec " + hash + " (" + spec->format() + ") hashes to " + spec->hash(),
                "the lockfile was edited or corrupted; run 'pinfold env concretize --force'",
                source_, static_cast<int>(entry->source().begin.line)};
        }

        in_progress_.erase(hash);
        built_.emplace(hash, spec);
        return Result<SpecPtr>::ok(std::move(spec));
    }

private:
    const toml::table& entries_;
    const std::string& source_;
    std::map<std::string, SpecPtr> built_;
    std::set<std::string> in_progress_;
};

Result<LockFile> parse_v1(const toml::table& doc, const std::string& source) {
    LockFile lock;
    lock.version = 1;

    toml::table empty;
    const toml::table* entries = doc["concrete-specs"].as_table();
    if (!entries) entries = &empty;

    SpecRebuilder rebuilder(*entries, source);
    for (const auto& [key, val] : *entries) {
        std::string hash(key.str());
        PINFOLD_TRY_ASSIGN(SpecPtr spec, rebuilder.build(hash));
        lock.specs_by_hash.emplace(hash, std::move(spec));
    }

    if (auto roots = doc["roots"].as_array()) {
        for (const auto& elem : *roots) {
            auto tbl = elem.as_table();
            auto hash = tbl ? (*tbl)["hash"].value<std::string>() : std::nullopt;
            if (!hash) {
                return PinfoldError{PinfoldError::Parse,
                    "lockfile root entries need a 'hash'", "", source,
                    static_cast<int>(elem.source().begin.line)};
            }
            if (!lock.specs_by_hash.count(*hash)) {
                return PinfoldError{PinfoldError::Parse,
                    "lockfile root " + *hash + " has no concrete spec", "", source,
                    static_cast<int>(elem.source().begin.line)};
            }
            LockedRoot root;
            root.hash = *hash;
            root.spec = (*tbl)["spec"].value_or(std::string{});
            lock.roots.push_back(std::move(root));
        }
    }

    return Result<LockFile>::ok(std::move(lock));
}

} // namespace

Result<LockFile> LockFile::parse(const std::string& toml_str, const std::string& source) {
    toml::table doc;
    try {
        doc = toml::parse(toml_str, source);
    } catch (const toml::parse_error& e) {
        return PinfoldError{PinfoldError::Parse,
            "lockfile parse error: " + std::string(e.description()), "",
            source, static_cast<int>(e.source().begin.line)};
    }

    auto version = doc["_meta"]["lockfile-version"].value<int64_t>();
    if (!version) {
        return PinfoldError{PinfoldError::Parse,
            "lockfile has no _meta.lockfile-version", "", source, 0};
    }

    switch (*version) {
    case 1:
        return parse_v1(doc, source);
    default:
        return PinfoldError{PinfoldError::Parse,
            "unsupported lockfile version " + std::to_string(*version),
            "this pinfold reads lockfile version " + std::to_string(kCurrentVersion),
            source, 0};
    }
}

Result<LockFile> LockFile::load(const std::string& path) {
    PINFOLD_TRY_ASSIGN(auto text, read_file(path));
    log::debug("reading lockfile %s", path.c_str());
    return LockFile::parse(text, path);
}

} // namespace pinfold
