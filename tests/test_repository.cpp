#include <catch2/catch.hpp>
#include <pinfold/repository.hpp>
#include "mock_repo.hpp"

using namespace pinfold;
using pinfold::testing::TempDir;
using pinfold::testing::write_file;

TEST_CASE("Recipe parse sorts versions newest first", "[repository]") {
    auto r = PackageRecipe::parse(R"(
[package]
name = "libelf"
versions = ["0.8.10", "0.8.13", "0.8.12"]
preferred = "0.8.12"
)");
    REQUIRE(r.is_ok());
    const auto& recipe = r.value();
    REQUIRE(recipe.versions.size() == 3);
    REQUIRE(recipe.versions.front().to_string() == "0.8.13");
    REQUIRE(recipe.versions.back().to_string() == "0.8.10");
    REQUIRE(recipe.preferred->to_string() == "0.8.12");
}

TEST_CASE("Recipes added in code are ordered newest first", "[repository]") {
    PackageRecipe recipe;
    recipe.name = "zlib";
    for (const char* v : {"1.2.8", "1.2.11", "1.2.3"}) {
        recipe.versions.push_back(Version::parse(v).value());
    }

    Repository repo("builtin");
    REQUIRE(repo.add(std::move(recipe)).is_ok());
    const auto& versions = repo.get("zlib").value()->versions;
    REQUIRE(versions.size() == 3);
    REQUIRE(versions[0].to_string() == "1.2.11");
    REQUIRE(versions[1].to_string() == "1.2.8");
    REQUIRE(versions[2].to_string() == "1.2.3");
}

TEST_CASE("Recipe parse reads variants and conditional dependencies", "[repository]") {
    auto r = PackageRecipe::parse(R"(
[package]
name = "example"
versions = ["1.0"]
provides = ["blas"]

[variants.debug]
default = false

[variants.flavor]
default = "fast"
values = ["fast", "safe"]
description = "Build flavor"

[[dependencies]]
spec = "libelf@0.8.12:"

[[dependencies]]
spec = "python"
when = "+debug"
)");
    REQUIRE(r.is_ok());
    const auto& recipe = r.value();
    REQUIRE(recipe.provides == std::vector<std::string>{"blas"});

    REQUIRE(recipe.variants.at("debug").is_bool());
    REQUIRE(recipe.variants.at("debug").default_value == "false");
    REQUIRE(recipe.variants.at("flavor").allows("safe"));
    REQUIRE_FALSE(recipe.variants.at("flavor").allows("slow"));
    REQUIRE(recipe.variants.at("flavor").description == "Build flavor");

    REQUIRE(recipe.dependencies.size() == 2);
    REQUIRE(recipe.dependencies[0].spec.versions().to_string() == "0.8.12:");
    REQUIRE_FALSE(recipe.dependencies[0].when.has_value());
    REQUIRE(recipe.dependencies[1].when->variant_value("debug") == "true");
}

TEST_CASE("Recipe parse errors", "[repository]") {
    REQUIRE(PackageRecipe::parse("[package]\nname = \"x\"\n").is_err());
    REQUIRE(PackageRecipe::parse("[package]\nversions = [\"1.0\"]\n").is_err());
    REQUIRE(PackageRecipe::parse("name = \"x\"\n").is_err());
    REQUIRE(PackageRecipe::parse("[package]\nname = \"x\"\nversions = [\"1.0\"]\npreferred = \"2.0\"\n").is_err());
    REQUIRE(PackageRecipe::parse(
        "[package]\nname = \"x\"\nversions = [\"1.0\"]\n[variants.v]\ndescription = \"no default\"\n").is_err());
    REQUIRE(PackageRecipe::parse(
        "[package]\nname = \"x\"\nversions = [\"1.0\"]\n[variants.v]\ndefault = \"a\"\n").is_err());
    REQUIRE(PackageRecipe::parse(
        "[package]\nname = \"x\"\nversions = [\"1.0\"]\n[[dependencies]]\nspec = \"@1.0\"\n").is_err());

    auto bad = PackageRecipe::parse("[package]\nname = \"x\"\nversions = [\"1..0\"]\n", "x.toml");
    REQUIRE(bad.is_err());
    REQUIRE(bad.error().file == "x.toml");
    REQUIRE(bad.error().line == 3);
}

TEST_CASE("Repository add stamps the namespace and rejects duplicates", "[repository]") {
    Repository repo("builtin");
    auto recipe = PackageRecipe::parse("[package]\nname = \"libelf\"\nversions = [\"0.8.13\"]\n").value();
    REQUIRE(repo.add(recipe).is_ok());
    REQUIRE(repo.get("libelf").value()->namespace_name == "builtin");
    REQUIRE(repo.get("libelf").value()->qualified_name() == "builtin.libelf");

    auto dup = repo.add(recipe);
    REQUIRE(dup.is_err());
    REQUIRE(dup.error().code == PinfoldError::Duplicate);
    REQUIRE(repo.get("libdwarf").error().code == PinfoldError::NotFound);
}

TEST_CASE("Repository load reads repo.toml and packages/", "[repository]") {
    TempDir tmp;
    write_file(tmp / "repo/repo.toml", "[repo]\nnamespace = \"site\"\n");
    write_file(tmp / "repo/packages/libelf.toml", "[package]\nname = \"libelf\"\nversions = [\"0.8.13\"]\n");
    write_file(tmp / "repo/packages/mpich.toml",
               "[package]\nname = \"mpich\"\nversions = [\"3.0.4\"]\nprovides = [\"mpi\"]\n");
    write_file(tmp / "repo/packages/README.md", "not a recipe");

    auto r = Repository::load(tmp / "repo");
    REQUIRE(r.is_ok());
    REQUIRE(r.value().namespace_name() == "site");
    REQUIRE(r.value().package_names() == std::vector<std::string>{"libelf", "mpich"});
    REQUIRE(r.value().providers_for("mpi") == std::vector<std::string>{"mpich"});
}

TEST_CASE("Repository load without repo.toml is NotFound", "[repository]") {
    TempDir tmp;
    auto r = Repository::load(tmp.path());
    REQUIRE(r.is_err());
    REQUIRE(r.error().code == PinfoldError::NotFound);
}

TEST_CASE("Overlay prefers local recipes", "[repository]") {
    RepositoryOverlay overlay(pinfold::testing::mock_repository(), "test");
    auto local = PackageRecipe::parse("[package]\nname = \"libelf\"\nversions = [\"0.9.0\"]\n").value();
    REQUIRE(overlay.add_local(local).is_ok());

    auto found = overlay.get("libelf");
    REQUIRE(found.is_ok());
    REQUIRE(found.value()->namespace_name == "test");
    REQUIRE(found.value()->versions.front().to_string() == "0.9.0");

    auto base = overlay.get("libelf", "builtin");
    REQUIRE(base.value()->namespace_name == "builtin");

    REQUIRE(overlay.get("libdwarf", "test").is_err());
    REQUIRE(overlay.get("libelf", "other").error().code == PinfoldError::NotFound);
    REQUIRE(overlay.get("callpath").value()->namespace_name == "builtin");
}

TEST_CASE("Overlay loads local recipes from a directory", "[repository]") {
    TempDir tmp;
    write_file(tmp / "repo/packages/fake.toml", "[package]\nname = \"fake\"\nversions = [\"2.0\"]\n");

    RepositoryOverlay overlay(pinfold::testing::mock_repository(), "test");
    REQUIRE(overlay.load_local(tmp / "repo").is_ok());
    REQUIRE(overlay.local().size() == 1);
    REQUIRE(overlay.get("fake").value()->versions.front().to_string() == "2.0");

    RepositoryOverlay empty(pinfold::testing::mock_repository(), "test");
    REQUIRE(empty.load_local(tmp / "missing").is_ok());
    REQUIRE(empty.local().size() == 0);
}

TEST_CASE("Overlay virtuals and providers", "[repository]") {
    RepositoryOverlay overlay(pinfold::testing::mock_repository(), "test");
    REQUIRE(overlay.is_virtual("mpi"));
    REQUIRE_FALSE(overlay.is_virtual("mpich"));
    REQUIRE_FALSE(overlay.is_virtual("nothing"));
    REQUIRE(overlay.providers_for("mpi") == std::vector<std::string>{"mpich", "zmpi"});
}

TEST_CASE("Possible dependencies expand virtuals", "[repository]") {
    RepositoryOverlay overlay(pinfold::testing::mock_repository(), "test");
    auto deps = overlay.possible_dependencies("mpileaks");
    for (const char* name : {"mpileaks", "callpath", "dyninst", "libdwarf", "libelf",
                             "mpi", "mpich", "zmpi", "fake"}) {
        CHECK(deps.count(name) == 1);
    }
    REQUIRE(deps.count("hypre") == 0);
    REQUIRE(overlay.possible_dependencies("libelf") == std::set<std::string>{"libelf"});
}
