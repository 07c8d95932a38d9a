#include <catch2/catch.hpp>
#include <pinfold/result.hpp>

#include <memory>
#include <string>

using namespace pinfold;

namespace {

Result<int> parse_jobs(const std::string& text) {
    if (text.empty() || text.find_first_not_of("0123456789") != std::string::npos) {
        return PinfoldError{PinfoldError::InvalidArg, "'" + text + "' is not a job count"};
    }
    return Result<int>::ok(std::stoi(text));
}

Status check_jobs(const std::string& text) {
    PINFOLD_TRY(parse_jobs(text));
    return ok_status();
}

Result<int> total_jobs(const std::string& a, const std::string& b) {
    PINFOLD_TRY_ASSIGN(int first, parse_jobs(a));
    PINFOLD_TRY_ASSIGN(int second, parse_jobs(b));
    return Result<int>::ok(first + second);
}

} // namespace

TEST_CASE("ok and err sides", "[result]") {
    auto good = parse_jobs("4");
    REQUIRE(good.is_ok());
    REQUIRE(static_cast<bool>(good));
    REQUIRE(good.value() == 4);

    auto bad = parse_jobs("four");
    REQUIRE(bad.is_err());
    REQUIRE_FALSE(static_cast<bool>(bad));
    REQUIRE(bad.error().code == PinfoldError::InvalidArg);
    REQUIRE(bad.error().message == "'four' is not a job count");
    REQUIRE_THROWS_AS(bad.value(), std::bad_variant_access);
    REQUIRE_THROWS_AS(good.error(), std::bad_variant_access);
}

TEST_CASE("value_or", "[result]") {
    CHECK(parse_jobs("8").value_or(1) == 8);
    CHECK(parse_jobs("").value_or(1) == 1);
}

TEST_CASE("map and and_then pass errors through untouched", "[result]") {
    int calls = 0;
    auto doubled = parse_jobs("x").map([&](int n) { ++calls; return n * 2; });
    auto chained = parse_jobs("x").and_then([&](int n) { ++calls; return parse_jobs(std::to_string(n)); });
    CHECK(calls == 0);
    CHECK(doubled.error().code == PinfoldError::InvalidArg);
    CHECK(chained.error().code == PinfoldError::InvalidArg);

    CHECK(parse_jobs("3").map([](int n) { return std::to_string(n) + " jobs"; }).value() == "3 jobs");
    CHECK(parse_jobs("3").and_then([](int n) { return parse_jobs(std::to_string(n) + "0"); }).value() == 30);
}

TEST_CASE("PINFOLD_TRY returns the error into a Status", "[result]") {
    CHECK(check_jobs("2").is_ok());
    auto failed = check_jobs("-2");
    REQUIRE(failed.is_err());
    CHECK(failed.error().message == "'-2' is not a job count");
}

TEST_CASE("PINFOLD_TRY_ASSIGN stops at the first error", "[result]") {
    CHECK(total_jobs("2", "6").value() == 8);
    auto r = total_jobs("2", "many");
    REQUIRE(r.is_err());
    CHECK(r.error().message == "'many' is not a job count");
}

TEST_CASE("Move-only values", "[result]") {
    auto r = Result<std::unique_ptr<std::string>>::ok(std::make_unique<std::string>("libelf"));
    REQUIRE(r.is_ok());
    std::unique_ptr<std::string> owned = std::move(r).value();
    REQUIRE(*owned == "libelf");
}

TEST_CASE("format renders code, hint and location", "[error]") {
    PinfoldError e{PinfoldError::ConfigFormat, "'spacks' was unexpected",
                   "expected one of: specs, include", "./pinfold.toml", 2};
    REQUIRE(e.location() == "./pinfold.toml:2");
    REQUIRE(e.format() ==
        "error[ConfigFormat]: 'spacks' was unexpected\n"
        "  hint: expected one of: specs, include\n"
        "  --> ./pinfold.toml:2");
}

TEST_CASE("format leaves out an empty hint and location", "[error]") {
    PinfoldError e{PinfoldError::IncompleteSpec, "'libelf' is not concrete"};
    REQUIRE(e.location().empty());
    REQUIRE(e.format() == "error[IncompleteSpec]: 'libelf' is not concrete");

    PinfoldError no_line{PinfoldError::Checksum, "hash mismatch", "", "pinfold.lock", 0};
    REQUIRE(no_line.location() == "pinfold.lock");
}

TEST_CASE("code_name matches the enumerator", "[error]") {
    CHECK(std::string(PinfoldError::code_name(PinfoldError::IO)) == "IO");
    CHECK(std::string(PinfoldError::code_name(PinfoldError::ConcretizationConflict)) ==
          "ConcretizationConflict");
    CHECK(std::string(PinfoldError::code_name(PinfoldError::UnknownEnvironment)) ==
          "UnknownEnvironment");
    CHECK(std::string(PinfoldError::code_name(PinfoldError::Internal)) == "Internal");
}
