#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace odata_filter {

enum class TokenKind {
    IDENTIFIER,
    NUMBER_LITERAL,
    STRING_LITERAL,
    OPERATOR,
    PUNCTUATION,
    END_OF_INPUT
};

struct Token {
    TokenKind kind = TokenKind::END_OF_INPUT;
    // Unescaped value for string literals, source text otherwise
    std::string text;
    size_t offset = 0;

    bool Is(TokenKind expected_kind, const std::string& expected_text) const {
        return kind == expected_kind && text == expected_text;
    }
    bool IsOperator(const std::string& op) const { return Is(TokenKind::OPERATOR, op); }
    bool IsPunctuation(char c) const { return kind == TokenKind::PUNCTUATION && text.size() == 1 && text[0] == c; }
    bool IsComparisonOperator() const;
};

// Cursor over a filter expression. Construct a new lexer on the same text to re-scan it.
// The lexer keeps a reference to the input, which must outlive it.
class ODataFilterLexer {
public:
    explicit ODataFilterLexer(const std::string& input);

    // Returns END_OF_INPUT repeatedly once the input is exhausted.
    // Throws LexError on an unrecognized character or an unterminated string.
    Token Next();

    static std::vector<Token> Tokenize(const std::string& input);

    static bool IsKeywordOperator(const std::string& word);

private:
    void SkipWhitespace();
    Token LexIdentifierOrOperator();
    Token LexNumber();
    Token LexString();

    static bool IsIdentifierStart(char c);
    static bool IsIdentifierChar(char c);
    static bool IsDigit(char c);

    const std::string& input;
    size_t pos = 0;
};

} // namespace odata_filter
