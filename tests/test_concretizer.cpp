#include <catch2/catch.hpp>
#include <pinfold/concretizer.hpp>
#include "mock_repo.hpp"

using namespace pinfold;

namespace {

struct ConcretizeFixture {
    RepositoryOverlay repo{pinfold::testing::mock_repository(), "test"};
    ConfigScopeStack config = pinfold::testing::mock_config();
    PackagePreferences prefs{config};
    Concretizer concretizer{repo, prefs, config};

    void configure(const std::string& text) {
        auto scope = ConfigScope::from_string("extra", text, "extra.toml");
        REQUIRE(scope.is_ok());
        REQUIRE(config.push(std::move(scope).value()).is_ok());
    }

    void add_recipe(const std::string& text) {
        auto recipe = PackageRecipe::parse(text);
        REQUIRE(recipe.is_ok());
        REQUIRE(repo.add_local(std::move(recipe).value()).is_ok());
    }

    SpecPtr one(const std::string& text) {
        auto r = concretizer.concretize_one(Spec::parse(text).value());
        if (r.is_err()) FAIL(r.error().format());
        return r.value();
    }
};

RootRequest root(const std::string& text) {
    return RootRequest{Spec::parse(text).value(), text};
}

std::string version_of(const SpecPtr& spec, const std::string& name) {
    SpecPtr node = spec->name() == name ? spec : spec->find(name);
    REQUIRE(node != nullptr);
    return node->version().to_string();
}

} // namespace

// ===== Defaults =====

TEST_CASE("Concretize picks newest versions and configured defaults", "[concretizer]") {
    ConcretizeFixture f;
    auto spec = f.one("mpileaks");

    REQUIRE(spec->is_concrete());
    REQUIRE(spec->version().to_string() == "2.3");
    REQUIRE(spec->namespace_name() == "builtin");
    REQUIRE(spec->compiler()->to_string() == "gcc@4.5.0");
    REQUIRE(spec->arch().to_string() == "linux-debian6-x86_64");
    REQUIRE(spec->variant_value("debug") == "false");
    REQUIRE(spec->variant_value("shared") == "true");

    REQUIRE(version_of(spec, "callpath") == "1.0");
    REQUIRE(version_of(spec, "dyninst") == "8.1.2");
    REQUIRE(version_of(spec, "libelf") == "0.8.13");
    REQUIRE(version_of(spec, "libdwarf") == "20130729");
    REQUIRE(version_of(spec, "mpich") == "3.0.4");

    for (const auto& node : traverse(spec)) {
        CHECK(node->is_concrete());
        CHECK(node->compiler()->to_string() == "gcc@4.5.0");
        CHECK(node->arch().to_string() == "linux-debian6-x86_64");
    }
}

TEST_CASE("Concretize unifies each package to one node", "[concretizer]") {
    ConcretizeFixture f;
    auto spec = f.one("mpileaks");

    auto nodes = traverse(spec);
    REQUIRE(nodes.size() == 6);
    std::set<std::string> names;
    for (const auto& node : nodes) names.insert(node->name());
    REQUIRE(names.size() == nodes.size());

    auto dyninst = spec->find("dyninst");
    auto libdwarf = spec->find("libdwarf");
    REQUIRE(dyninst->dependencies().at("libelf") == libdwarf->dependencies().at("libelf"));
}

TEST_CASE("Virtual dependencies resolve to a provider", "[concretizer]") {
    ConcretizeFixture f;
    auto spec = f.one("hypre");

    auto mpi = spec->find("mpi");
    REQUIRE(mpi != nullptr);
    REQUIRE(mpi->name() == "mpich");
    REQUIRE(mpi->provides("mpi"));
    REQUIRE(spec->dependencies().count("mpich") == 1);
}

// ===== Constraints =====

TEST_CASE("Root dependency constraints are honoured", "[concretizer]") {
    ConcretizeFixture f;
    auto spec = f.one("mpileaks@2.2 +debug ^callpath@0.9 ^libelf@0.8.11");

    REQUIRE(spec->version().to_string() == "2.2");
    REQUIRE(spec->variant_value("debug") == "true");
    REQUIRE(version_of(spec, "callpath") == "0.9");
    REQUIRE(version_of(spec, "libelf") == "0.8.11");
}

TEST_CASE("Naming a provider selects it for the virtual", "[concretizer]") {
    ConcretizeFixture f;
    auto spec = f.one("mpileaks ^zmpi");

    REQUIRE(spec->find("mpi")->name() == "zmpi");
    REQUIRE(spec->contains("fake"));
    REQUIRE_FALSE(spec->contains("mpich"));
}

TEST_CASE("Compiler constraints propagate to dependencies", "[concretizer]") {
    ConcretizeFixture f;
    auto spec = f.one("mpileaks%clang");

    for (const auto& node : traverse(spec)) {
        CHECK(node->compiler()->to_string() == "clang@3.3");
    }
}

TEST_CASE("Recipe dependency constraints apply", "[concretizer]") {
    ConcretizeFixture f;
    auto spec = f.one("cmake-client");
    REQUIRE(version_of(spec, "cmake") == "3.4.3");
}

TEST_CASE("Conditional dependencies follow the decided node", "[concretizer]") {
    ConcretizeFixture f;
    f.add_recipe(R"(
[package]
name = "tool"
versions = ["1.0"]

[variants.python]
default = false

[[dependencies]]
spec = "python@2.7.10"
when = "+python"
)");

    REQUIRE_FALSE(f.one("tool")->contains("python"));
    auto with = f.one("tool+python");
    REQUIRE(version_of(with, "python") == "2.7.10");
    REQUIRE(with->namespace_name() == "test");
}

// ===== Preferences =====

TEST_CASE("Configured version preferences win over newest", "[concretizer]") {
    ConcretizeFixture f;
    f.configure("[packages.libelf]\nversion = [\"0.8.11\"]\n");
    auto spec = f.one("mpileaks");
    REQUIRE(version_of(spec, "libelf") == "0.8.11");
}

TEST_CASE("Recipe preferred version wins over newest", "[concretizer]") {
    ConcretizeFixture f;
    f.add_recipe("[package]\nname = \"stable\"\nversions = [\"1.0\", \"2.0\"]\npreferred = \"1.0\"\n");
    REQUIRE(f.one("stable")->version().to_string() == "1.0");
    REQUIRE(f.one("stable@2.0")->version().to_string() == "2.0");
}

TEST_CASE("Configured provider preferences pick the provider", "[concretizer]") {
    ConcretizeFixture f;
    f.configure("[packages.all.providers]\nmpi = [\"zmpi\"]\n");
    auto spec = f.one("mpileaks");
    REQUIRE(spec->find("mpi")->name() == "zmpi");
}

TEST_CASE("Configured compiler and variant preferences", "[concretizer]") {
    ConcretizeFixture f;
    f.configure("[packages.all]\ncompiler = [\"clang\"]\n\n[packages.mpileaks]\nvariants = \"+debug\"\n");
    auto spec = f.one("mpileaks");
    REQUIRE(spec->compiler()->name == "clang");
    REQUIRE(spec->variant_value("debug") == "true");
    REQUIRE(spec->find("libelf")->compiler()->name == "clang");
}

// ===== Errors =====

TEST_CASE("Unknown packages are NotFound", "[concretizer]") {
    ConcretizeFixture f;
    auto r = f.concretizer.concretize_one(Spec::parse("nonexistent").value());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinfoldError::NotFound);
}

TEST_CASE("Unknown variants and values are Variant errors", "[concretizer]") {
    ConcretizeFixture f;
    REQUIRE(f.concretizer.concretize_one(Spec::parse("mpileaks+bogus").value())
                .error().code == PinfoldError::Variant);
    REQUIRE(f.concretizer.concretize_one(Spec::parse("mpileaks debug=maybe").value())
                .error().code == PinfoldError::Variant);
}

TEST_CASE("Unavailable versions list what exists", "[concretizer]") {
    ConcretizeFixture f;
    auto r = f.concretizer.concretize_one(Spec::parse("libelf@0.9").value());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinfoldError::Version);
    REQUIRE(r.error().hint.find("0.8.13") != std::string::npos);
}

TEST_CASE("Root dependency outside the closure is a Dependency error", "[concretizer]") {
    ConcretizeFixture f;
    auto r = f.concretizer.concretize_one(Spec::parse("libelf ^mpich").value());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinfoldError::Dependency);
}

TEST_CASE("Anonymous roots are rejected", "[concretizer]") {
    ConcretizeFixture f;
    auto r = f.concretizer.concretize({root("@1.0")});
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinfoldError::InvalidArg);
}

TEST_CASE("Disjoint constraints name both origins", "[concretizer]") {
    ConcretizeFixture f;
    auto r = f.concretizer.concretize({
        RootRequest{Spec::parse("callpath ^libelf@:0.8.11").value(), "first root"},
        RootRequest{Spec::parse("dyninst ^libelf@0.8.12:").value(), "second root"},
    });
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinfoldError::ConcretizationConflict);
    REQUIRE(r.error().message.find("first root") != std::string::npos);
    REQUIRE(r.error().message.find("second root") != std::string::npos);
    REQUIRE(r.error().hint.find("cannot hold together") != std::string::npos);
}

TEST_CASE("No compiler for the target OS is NotFound", "[concretizer]") {
    ConcretizeFixture f;
    ConcretizeOptions options;
    options.force_os = "centos7";
    auto r = f.concretizer.concretize({root("libelf")}, options);
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinfoldError::NotFound);
}

// ===== Unification across roots =====

TEST_CASE("Late constraints restart resolution", "[concretizer]") {
    ConcretizeFixture f;
    f.add_recipe("[package]\nname = \"oldelf-user\"\nversions = [\"1.0\"]\n\n"
                 "[[dependencies]]\nspec = \"libelf@:0.8.11\"\n");

    auto r = f.concretizer.concretize({root("libelf"), root("oldelf-user")});
    REQUIRE(r.is_ok());
    const auto& result = r.value();
    REQUIRE(result.roots[0]->version().to_string() == "0.8.11");
    REQUIRE(result.roots[1]->dependencies().at("libelf") == result.roots[0]);
}

TEST_CASE("Shared dependencies are one node across roots", "[concretizer]") {
    ConcretizeFixture f;
    auto r = f.concretizer.concretize({root("mpileaks"), root("hypre")});
    REQUIRE(r.is_ok());
    const auto& result = r.value();
    REQUIRE(result.roots.size() == 2);
    REQUIRE(result.roots[0]->find("mpi") == result.roots[1]->find("mpi"));
    REQUIRE(result.specs_by_hash.size() == 7);
    for (const auto& [hash, spec] : result.specs_by_hash) {
        CHECK(spec->hash() == hash);
    }
}

TEST_CASE("Independent roots form separate components", "[concretizer]") {
    ConcretizeFixture f;
    auto groups = f.concretizer.components({root("mpileaks"), root("python"), root("hypre")});
    REQUIRE(groups.size() == 2);
    REQUIRE(groups[0] == std::vector<size_t>{0, 2});
    REQUIRE(groups[1] == std::vector<size_t>{1});
}

TEST_CASE("Parallel and serial resolution agree", "[concretizer]") {
    ConcretizeFixture f;
    std::vector<RootRequest> roots{root("mpileaks"), root("python"), root("cmake-client"), root("hypre")};

    ConcretizeOptions serial;
    serial.parallel = false;
    auto a = f.concretizer.concretize(roots, serial);
    auto b = f.concretizer.concretize(roots);
    REQUIRE(a.is_ok());
    REQUIRE(b.is_ok());
    for (size_t i = 0; i < roots.size(); ++i) {
        CHECK(a.value().roots[i]->hash() == b.value().roots[i]->hash());
    }
}

TEST_CASE("Concretization is idempotent", "[concretizer]") {
    ConcretizeFixture f;
    auto first = f.one("mpileaks ^zmpi");
    auto second = f.one("mpileaks ^zmpi");
    REQUIRE(first->hash() == second->hash());
}

// ===== Reuse =====

TEST_CASE("Pinned specs are reused while they satisfy constraints", "[concretizer]") {
    ConcretizeFixture f;
    auto old = f.one("mpileaks ^libelf@0.8.12");

    ConcretizeOptions options;
    options.pinned = {old};
    auto r = f.concretizer.concretize({root("mpileaks")}, options);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().roots[0]->hash() == old->hash());
}

TEST_CASE("Unpinned names are re-resolved and dependents rehash", "[concretizer]") {
    ConcretizeFixture f;
    auto old = f.one("mpileaks ^libelf@0.8.12");

    ConcretizeOptions options;
    options.pinned = {old};
    options.unpinned = {"libelf"};
    auto r = f.concretizer.concretize({root("mpileaks")}, options);
    REQUIRE(r.is_ok());
    auto fresh = r.value().roots[0];

    REQUIRE(version_of(fresh, "libelf") == "0.8.13");
    REQUIRE(fresh->find("libdwarf")->hash() != old->find("libdwarf")->hash());
    REQUIRE(fresh->find("dyninst")->hash() != old->find("dyninst")->hash());
    REQUIRE(fresh->hash() != old->hash());
    REQUIRE(fresh->find("mpich")->hash() == old->find("mpich")->hash());
}

TEST_CASE("A pinned provider keeps its virtual", "[concretizer]") {
    ConcretizeFixture f;
    auto old = f.one("hypre ^zmpi");

    ConcretizeOptions options;
    options.pinned = {old};
    auto r = f.concretizer.concretize({root("mpileaks")}, options);
    REQUIRE(r.is_ok());
    REQUIRE(r.value().roots[0]->find("mpi")->name() == "zmpi");
}

TEST_CASE("Relaxed version constraints allow upgrades", "[concretizer]") {
    ConcretizeFixture f;
    auto old = f.one("mpileaks ^callpath@0.9");

    ConcretizeOptions options;
    options.pinned = {old};
    options.unpinned = {"callpath"};
    options.relaxed_versions = {"callpath"};
    auto r = f.concretizer.concretize({root("mpileaks ^callpath@0.9")}, options);
    REQUIRE(r.is_ok());
    REQUIRE(version_of(r.value().roots[0], "callpath") == "1.0");
    REQUIRE(version_of(r.value().roots[0], "libelf") == "0.8.13");
}

TEST_CASE("Forced compiler replaces pins built with another", "[concretizer]") {
    ConcretizeFixture f;
    auto old = f.one("mpileaks");

    ConcretizeOptions options;
    options.pinned = {old};
    options.force_compiler = "clang";
    auto r = f.concretizer.concretize({root("mpileaks")}, options);
    REQUIRE(r.is_ok());
    for (const auto& node : traverse(r.value().roots[0])) {
        CHECK(node->compiler()->name == "clang");
    }
}
