#include "odata_filter_lexer.hpp"
#include "odata_filter_errors.hpp"

#include <array>
#include <cctype>

namespace odata_filter {

static const std::array<const char*, 6> COMPARISON_OPERATORS = {"eq", "ne", "lt", "le", "gt", "ge"};
static const std::array<const char*, 3> LOGICAL_OPERATORS = {"and", "or", "not"};

// Length of the well-formed UTF-8 sequence starting at pos, or 0 when the bytes are not one
// (overlong forms, surrogates and code points above U+10FFFF included)
static size_t Utf8SequenceLength(const std::string& input, size_t pos) {
    auto byte = [&](size_t i) { return static_cast<unsigned char>(input[pos + i]); };
    auto lead = byte(0);
    if (lead < 0x80) {
        return 1;
    }

    size_t length;
    unsigned char min_second = 0x80;
    unsigned char max_second = 0xBF;
    if (lead >= 0xC2 && lead <= 0xDF) {
        length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
        length = 3;
        if (lead == 0xE0) min_second = 0xA0;
        if (lead == 0xED) max_second = 0x9F;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
        length = 4;
        if (lead == 0xF0) min_second = 0x90;
        if (lead == 0xF4) max_second = 0x8F;
    } else {
        return 0;
    }

    if (pos + length > input.size()) {
        return 0;
    }
    if (byte(1) < min_second || byte(1) > max_second) {
        return 0;
    }
    for (size_t i = 2; i < length; ++i) {
        if (byte(i) < 0x80 || byte(i) > 0xBF) {
            return 0;
        }
    }
    return length;
}

static std::string DescribeCharacter(char c) {
    auto byte = static_cast<unsigned char>(c);
    if (byte >= 0x20 && byte < 0x7F) {
        return "'" + std::string(1, c) + "'";
    }
    static const char* HEX = "0123456789ABCDEF";
    return std::string("0x") + HEX[byte >> 4] + HEX[byte & 0x0F];
}

bool Token::IsComparisonOperator() const {
    if (kind != TokenKind::OPERATOR) {
        return false;
    }
    for (const auto* op : COMPARISON_OPERATORS) {
        if (text == op) {
            return true;
        }
    }
    return false;
}

ODataFilterLexer::ODataFilterLexer(const std::string& input)
    : input(input)
{}

std::vector<Token> ODataFilterLexer::Tokenize(const std::string& input) {
    ODataFilterLexer lexer(input);
    std::vector<Token> tokens;
    while (true) {
        tokens.push_back(lexer.Next());
        if (tokens.back().kind == TokenKind::END_OF_INPUT) {
            break;
        }
    }
    return tokens;
}

bool ODataFilterLexer::IsKeywordOperator(const std::string& word) {
    for (const auto* op : COMPARISON_OPERATORS) {
        if (word == op) return true;
    }
    for (const auto* op : LOGICAL_OPERATORS) {
        if (word == op) return true;
    }
    return false;
}

Token ODataFilterLexer::Next() {
    SkipWhitespace();

    if (pos >= input.size()) {
        return Token{TokenKind::END_OF_INPUT, "", input.size()};
    }

    char c = input[pos];
    if (c == '(' || c == ')' || c == ',' || c == '/') {
        Token token{TokenKind::PUNCTUATION, std::string(1, c), pos};
        ++pos;
        return token;
    }
    if (c == '\'') {
        return LexString();
    }
    if (IsDigit(c) || (c == '-' && pos + 1 < input.size() && IsDigit(input[pos + 1]))) {
        return LexNumber();
    }
    if (IsIdentifierStart(c)) {
        return LexIdentifierOrOperator();
    }

    throw LexError("Unrecognized character " + DescribeCharacter(c), pos);
}

void ODataFilterLexer::SkipWhitespace() {
    while (pos < input.size() && std::isspace(static_cast<unsigned char>(input[pos]))) {
        ++pos;
    }
}

Token ODataFilterLexer::LexIdentifierOrOperator() {
    size_t start = pos;
    while (pos < input.size() && IsIdentifierChar(input[pos])) {
        ++pos;
    }
    auto word = input.substr(start, pos - start);
    auto kind = IsKeywordOperator(word) ? TokenKind::OPERATOR : TokenKind::IDENTIFIER;
    return Token{kind, word, start};
}

Token ODataFilterLexer::LexNumber() {
    size_t start = pos;
    if (input[pos] == '-') {
        ++pos;
    }
    while (pos < input.size() && IsDigit(input[pos])) {
        ++pos;
    }
    if (pos + 1 < input.size() && input[pos] == '.' && IsDigit(input[pos + 1])) {
        ++pos;
        while (pos < input.size() && IsDigit(input[pos])) {
            ++pos;
        }
    }
    if (pos < input.size() && (input[pos] == 'e' || input[pos] == 'E')) {
        size_t exponent = pos + 1;
        if (exponent < input.size() && (input[exponent] == '+' || input[exponent] == '-')) {
            ++exponent;
        }
        if (exponent < input.size() && IsDigit(input[exponent])) {
            pos = exponent;
            while (pos < input.size() && IsDigit(input[pos])) {
                ++pos;
            }
        }
    }
    // A number running straight into an identifier ("12abc") is not a literal
    if (pos < input.size() && IsIdentifierChar(input[pos])) {
        throw LexError("Malformed numeric literal '" + input.substr(start, pos - start + 1) + "'", start);
    }
    return Token{TokenKind::NUMBER_LITERAL, input.substr(start, pos - start), start};
}

Token ODataFilterLexer::LexString() {
    size_t start = pos;
    ++pos;

    std::string value;
    while (pos < input.size()) {
        char c = input[pos];
        if (c == '\'') {
            // '' is an escaped quote inside the literal
            if (pos + 1 < input.size() && input[pos + 1] == '\'') {
                value += '\'';
                pos += 2;
                continue;
            }
            ++pos;
            return Token{TokenKind::STRING_LITERAL, value, start};
        }
        auto length = Utf8SequenceLength(input, pos);
        if (length == 0) {
            throw LexError("Invalid UTF-8 sequence in string literal", pos);
        }
        value.append(input, pos, length);
        pos += length;
    }

    throw LexError("Unterminated string literal", start);
}

bool ODataFilterLexer::IsIdentifierStart(char c) {
    return std::isalpha(static_cast<unsigned char>(c)) || c == '_' || c == '$';
}

bool ODataFilterLexer::IsIdentifierChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.' || c == '$';
}

bool ODataFilterLexer::IsDigit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

} // namespace odata_filter
