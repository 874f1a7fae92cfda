#include "catch.hpp"
#include "error_context.hpp"

using namespace odata_filter;

TEST_CASE("ErrorContext formatting", "[error_context]")
{
    SECTION("Empty context leaves the message untouched")
    {
        ErrorContext ctx;
        REQUIRE(ctx.IsEmpty());
        REQUIRE(ctx.Format("Unexpected token") == "Unexpected token");
    }

    SECTION("Entries keep insertion order")
    {
        ErrorContext ctx;
        ctx.Set("offset", "12").Set("token", "lt");
        REQUIRE(ctx.Format("Unexpected token") == "Unexpected token [offset: 12, token: lt]");
    }

    SECTION("Setting an existing key replaces it in place")
    {
        ErrorContext ctx;
        ctx.Set("a", "1").Set("b", "2").Set("a", "3");
        REQUIRE(ctx.Get("a") == "3");
        REQUIRE(ctx.Format("m") == "m [a: 3, b: 2]");
    }

    SECTION("Missing keys read as empty, Clear empties the context")
    {
        ErrorContext ctx;
        ctx.Set("a", "1");
        REQUIRE(ctx.Get("missing").empty());
        ctx.Clear();
        REQUIRE(ctx.IsEmpty());
    }
}
