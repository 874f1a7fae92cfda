#include "catch.hpp"
#include "odata_filter_lexer.hpp"
#include "odata_filter_errors.hpp"

using namespace odata_filter;

TEST_CASE("Filter lexer - token kinds", "[odata_filter_lexer]")
{
    SECTION("Comparison expression")
    {
        auto tokens = ODataFilterLexer::Tokenize("Price lt 10");
        REQUIRE(tokens.size() == 4);
        REQUIRE(tokens[0].kind == TokenKind::IDENTIFIER);
        REQUIRE(tokens[0].text == "Price");
        REQUIRE(tokens[1].kind == TokenKind::OPERATOR);
        REQUIRE(tokens[1].text == "lt");
        REQUIRE(tokens[1].IsComparisonOperator());
        REQUIRE(tokens[2].kind == TokenKind::NUMBER_LITERAL);
        REQUIRE(tokens[2].text == "10");
        REQUIRE(tokens[3].kind == TokenKind::END_OF_INPUT);
    }

    SECTION("Function call punctuation")
    {
        auto tokens = ODataFilterLexer::Tokenize("geo.distance(Home,Office)");
        REQUIRE(tokens.size() == 7);
        REQUIRE(tokens[0].text == "geo.distance");
        REQUIRE(tokens[1].IsPunctuation('('));
        REQUIRE(tokens[2].text == "Home");
        REQUIRE(tokens[3].IsPunctuation(','));
        REQUIRE(tokens[4].text == "Office");
        REQUIRE(tokens[5].IsPunctuation(')'));
    }

    SECTION("Property path separator")
    {
        auto tokens = ODataFilterLexer::Tokenize("Address/City");
        REQUIRE(tokens.size() == 4);
        REQUIRE(tokens[1].IsPunctuation('/'));
    }

    SECTION("Logical keywords are operators, other words are identifiers")
    {
        auto tokens = ODataFilterLexer::Tokenize("not a and b or c");
        REQUIRE(tokens[0].IsOperator("not"));
        REQUIRE(tokens[2].IsOperator("and"));
        REQUIRE(tokens[4].IsOperator("or"));
        REQUIRE_FALSE(tokens[2].IsComparisonOperator());
    }

    SECTION("Keywords are case-sensitive")
    {
        auto tokens = ODataFilterLexer::Tokenize("a EQ b");
        REQUIRE(tokens[1].kind == TokenKind::IDENTIFIER);
    }

    SECTION("Range variable identifier")
    {
        auto tokens = ODataFilterLexer::Tokenize("$it/Name");
        REQUIRE(tokens[0].kind == TokenKind::IDENTIFIER);
        REQUIRE(tokens[0].text == "$it");
    }
}

TEST_CASE("Filter lexer - literals", "[odata_filter_lexer]")
{
    SECTION("Decimal and exponent numbers")
    {
        auto tokens = ODataFilterLexer::Tokenize("0.5 1e3 2.5E-2 -7");
        REQUIRE(tokens[0].text == "0.5");
        REQUIRE(tokens[1].text == "1e3");
        REQUIRE(tokens[2].text == "2.5E-2");
        REQUIRE(tokens[3].text == "-7");
        for (size_t i = 0; i < 4; ++i) {
            REQUIRE(tokens[i].kind == TokenKind::NUMBER_LITERAL);
        }
    }

    SECTION("String with escaped quote")
    {
        auto tokens = ODataFilterLexer::Tokenize("Name eq 'O''Neil'");
        REQUIRE(tokens[2].kind == TokenKind::STRING_LITERAL);
        REQUIRE(tokens[2].text == "O'Neil");
        REQUIRE(tokens[2].offset == 8);
    }

    SECTION("Empty string")
    {
        auto tokens = ODataFilterLexer::Tokenize("''");
        REQUIRE(tokens[0].kind == TokenKind::STRING_LITERAL);
        REQUIRE(tokens[0].text.empty());
    }
}

TEST_CASE("Filter lexer - offsets", "[odata_filter_lexer]")
{
    auto tokens = ODataFilterLexer::Tokenize("geo.distance(Home, Office lt 0.5");
    REQUIRE(tokens[0].offset == 0);
    REQUIRE(tokens[2].offset == 13);
    REQUIRE(tokens[4].offset == 19);
    REQUIRE(tokens[5].text == "lt");
    REQUIRE(tokens[5].offset == 26);
    REQUIRE(tokens.back().kind == TokenKind::END_OF_INPUT);
    REQUIRE(tokens.back().offset == 32);
}

TEST_CASE("Filter lexer - end of input is sticky", "[odata_filter_lexer]")
{
    std::string input = "a";
    ODataFilterLexer lexer(input);
    REQUIRE(lexer.Next().kind == TokenKind::IDENTIFIER);
    REQUIRE(lexer.Next().kind == TokenKind::END_OF_INPUT);
    REQUIRE(lexer.Next().kind == TokenKind::END_OF_INPUT);
}

TEST_CASE("Filter lexer - errors", "[odata_filter_lexer]")
{
    SECTION("Unrecognized character")
    {
        try {
            ODataFilterLexer::Tokenize("a eq #1");
            FAIL("Expected LexError");
        } catch (const LexError& e) {
            REQUIRE(e.Kind() == ODataFilterErrorKind::LEX_ERROR);
            REQUIRE(e.Offset() == 5);
        }
    }

    SECTION("Unterminated string reports the opening quote")
    {
        try {
            ODataFilterLexer::Tokenize("Name eq 'abc");
            FAIL("Expected LexError");
        } catch (const LexError& e) {
            REQUIRE(e.Offset() == 8);
            REQUIRE(e.Message() == "Unterminated string literal");
        }
    }

    SECTION("Number running into an identifier")
    {
        REQUIRE_THROWS_AS(ODataFilterLexer::Tokenize("a eq 12abc"), LexError);
    }
}

TEST_CASE("Filter lexer - UTF-8 in string literals", "[odata_filter_lexer]")
{
    SECTION("Multi-byte characters are kept")
    {
        auto tokens = ODataFilterLexer::Tokenize("Name eq 'M\xC3\xBCnchen \xE2\x82\xAC \xF0\x9F\x98\x80'");
        REQUIRE(tokens[2].kind == TokenKind::STRING_LITERAL);
        REQUIRE(tokens[2].text == "M\xC3\xBCnchen \xE2\x82\xAC \xF0\x9F\x98\x80");
    }

    SECTION("Invalid lead byte")
    {
        try {
            ODataFilterLexer::Tokenize("Name eq '\xFF'");
            FAIL("Expected LexError");
        } catch (const LexError& e) {
            REQUIRE(e.Offset() == 9);
            REQUIRE(e.Message() == "Invalid UTF-8 sequence in string literal");
        }
    }

    SECTION("Truncated, overlong and surrogate sequences")
    {
        REQUIRE_THROWS_AS(ODataFilterLexer::Tokenize("Name eq 'a\xC3'"), LexError);
        REQUIRE_THROWS_AS(ODataFilterLexer::Tokenize("Name eq '\xC0\xAF'"), LexError);
        REQUIRE_THROWS_AS(ODataFilterLexer::Tokenize("Name eq '\xED\xA0\x80'"), LexError);
        REQUIRE_THROWS_AS(ODataFilterLexer::Tokenize("Name eq '\xF4\x90\x80\x80'"), LexError);
    }

    SECTION("Stray bytes outside literals are reported in hex")
    {
        try {
            ODataFilterLexer::Tokenize("Name eq \x80");
            FAIL("Expected LexError");
        } catch (const LexError& e) {
            REQUIRE(e.Offset() == 8);
            REQUIRE(e.Message() == "Unrecognized character 0x80");
        }
    }
}
