#include "testUtils.hpp"

#include <catch2/catch_test_macros.hpp>
#include <cascade/middleware/helpers.hpp>
#include <cascade/middleware/oneOfAll.hpp>

#include <stdexcept>
#include <string>

namespace
{
using namespace cascade::test;
}

TEST_CASE("oneOfAll - First success", "[oneOfAll]")
{
    SECTION("Stops at the first successful result")
    {
        auto group = collectionOf<OneOfAll>({
            returning("M1", Result{MiddlewareResult::ignore}),
            returning("M2", Result{std::string{"X"}}),
            returning("M3", Result{std::string{"Y"}}),
        });

        auto ctx = makeContext();
        auto result = runSync(*group, ctx);

        REQUIRE(asString(result) == "X");
        REQUIRE(logOf(ctx) == Log{"M1", "M2"});
    }

    SECTION("Ok counts as success")
    {
        auto group = collectionOf<OneOfAll>({
            returning("M1", Result{MiddlewareResult::ok}),
            returning("M2", Result{std::string{"X"}}),
        });

        auto ctx = makeContext();
        auto result = runSync(*group, ctx);

        REQUIRE(holds(result, MiddlewareResult::ok));
        REQUIRE(logOf(ctx) == Log{"M1"});
    }

    SECTION("Empty result counts as success")
    {
        auto group = collectionOf<OneOfAll>({
            returning("M1", Result{}),
            returning("M2", Result{std::string{"X"}}),
        });

        auto result = runSync(*group, makeContext());

        REQUIRE_FALSE(result.has_value());
    }
}

TEST_CASE("oneOfAll - Nothing succeeds", "[oneOfAll][ignore]")
{
    SECTION("All members ignore")
    {
        auto group = collectionOf<OneOfAll>({
            returning("M1", Result{MiddlewareResult::ignore}),
            returning("M2", Result{MiddlewareResult::ignore}),
        });

        auto ctx = makeContext();
        auto result = runSync(*group, ctx);

        REQUIRE(holds(result, MiddlewareResult::ignore));
        REQUIRE(logOf(ctx) == Log{"M1", "M2"});
    }

    SECTION("Empty group")
    {
        OneOfAll group;

        auto ctx = makeContext();
        auto result = runSync(group, ctx);

        REQUIRE(holds(result, MiddlewareResult::ignore));
        REQUIRE(logOf(ctx).empty());
    }
}

TEST_CASE("oneOfAll - Members share next", "[oneOfAll][next]")
{
    auto group = collectionOf<OneOfAll>({around("A"), around("B")});

    auto ctx = makeContext();
    auto result = runSync(*group, ctx);

    // A delegates to the terminal itself, B is never reached
    REQUIRE(asString(result) == "T");
    REQUIRE(logOf(ctx) == Log{"A-before", "T", "A-after"});
}

TEST_CASE("oneOfAll - Inside a chain", "[oneOfAll][chain]")
{
    auto group = collectionOf<OneOfAll>({
        returning("guard", Result{MiddlewareResult::ignore}),
        around("fallback"),
    });

    auto chain = chainOf({around("inner"), MiddlewarePtr{group}});

    auto ctx = makeContext();
    auto result = runSync(*chain, ctx);

    REQUIRE(asString(result) == "T");
    REQUIRE(logOf(ctx) == Log{"guard", "fallback-before", "inner-before", "T", "inner-after", "fallback-after"});
}

TEST_CASE("oneOfAll - Errors", "[oneOfAll][error]")
{
    Function failing = [](Arguments, ContextPtr, Next) -> ResultSender { throw std::runtime_error{"boom"}; };

    auto group = collectionOf<OneOfAll>({
        returning("M1", Result{MiddlewareResult::ignore}),
        failing,
        returning("M3", Result{std::string{"Y"}}),
    });

    auto ctx = makeContext();
    REQUIRE_THROWS_AS(runSync(*group, ctx), std::runtime_error);
    REQUIRE(logOf(ctx) == Log{"M1"});
}
