#include "testUtils.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cascade/middleware/allOfAll.hpp>
#include <cascade/middleware/helpers.hpp>

#include <any>
#include <stdexcept>
#include <string>

namespace
{
using namespace cascade::test;
}

TEST_CASE("allOfAll - Collects every result", "[allOfAll]")
{
    SECTION("Ignored results are kept")
    {
        auto group = collectionOf<AllOfAll>({
            returning("M1", Result{std::string{"X"}}),
            returning("M2", Result{MiddlewareResult::ignore}),
        });

        auto ctx = makeContext();
        auto result = runSync(*group, ctx);

        REQUIRE(isSuccessfulResult(result));

        const auto& results = std::any_cast<const Results&>(result);
        REQUIRE(results.size() == 2);
        REQUIRE(asString(results[0]) == "X");
        REQUIRE(holds(results[1], MiddlewareResult::ignore));
        REQUIRE(logOf(ctx) == Log{"M1", "M2"});
    }

    SECTION("Every member runs even after a success")
    {
        auto group = collectionOf<AllOfAll>({
            returning("M1", Result{std::string{"X"}}),
            returning("M2", Result{std::string{"Y"}}),
            returning("M3", Result{MiddlewareResult::ok}),
        });

        auto ctx = makeContext();
        auto result = runSync(*group, ctx);

        const auto& results = std::any_cast<const Results&>(result);
        REQUIRE(results.size() == 3);
        REQUIRE(asString(results[1]) == "Y");
        REQUIRE(holds(results[2], MiddlewareResult::ok));
        REQUIRE(logOf(ctx) == Log{"M1", "M2", "M3"});
    }

    SECTION("All ignored is still a success")
    {
        auto group = collectionOf<AllOfAll>({
            returning("M1", Result{MiddlewareResult::ignore}),
        });

        auto result = runSync(*group, makeContext());

        REQUIRE(isSuccessfulResult(result));
        REQUIRE(std::any_cast<const Results&>(result).size() == 1);
    }
}

TEST_CASE("allOfAll - Empty group", "[allOfAll][empty]")
{
    AllOfAll group;

    auto result = runSync(group, makeContext());

    REQUIRE(isSuccessfulResult(result));
    REQUIRE(std::any_cast<const Results&>(result).empty());
}

TEST_CASE("allOfAll - Members share next", "[allOfAll][next]")
{
    auto group = collectionOf<AllOfAll>({around("A"), around("B")});

    auto ctx = makeContext();
    auto result = runSync(*group, ctx);

    const auto& results = std::any_cast<const Results&>(result);
    REQUIRE(asString(results[0]) == "T");
    REQUIRE(asString(results[1]) == "T");
    REQUIRE(logOf(ctx) == Log{"A-before", "T", "A-after", "B-before", "T", "B-after"});
}

TEST_CASE("allOfAll - Errors", "[allOfAll][error]")
{
    Function failing = [](Arguments, ContextPtr, Next) -> ResultSender { throw std::runtime_error{"boom"}; };

    auto group = collectionOf<AllOfAll>({returning("M1", Result{}), failing, returning("M3", Result{})});

    auto ctx = makeContext();
    REQUIRE_THROWS_AS(runSync(*group, ctx), std::runtime_error);
    REQUIRE(logOf(ctx) == Log{"M1"});
}
