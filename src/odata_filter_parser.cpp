#include "odata_filter_parser.hpp"
#include "odata_filter_errors.hpp"
#include "odata_filter_lexer.hpp"
#include "odata_filter_tracing.hpp"

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <string>

namespace odata_filter {

namespace {

// Resolver errors carry no position; attach the offset of the token that triggered the lookup
template <typename Fn>
auto AtOffset(size_t offset, Fn&& fn) -> decltype(fn()) {
    try {
        return fn();
    } catch (ODataFilterException& e) {
        if (!e.HasOffset()) {
            e.SetOffset(offset);
        }
        throw;
    }
}

std::string EscapeStringLiteral(const std::string& value) {
    std::string escaped = "'";
    for (char c : value) {
        escaped += c;
        if (c == '\'') {
            escaped += '\'';
        }
    }
    escaped += "'";
    return escaped;
}

bool IsComparable(BinaryOperatorKind op, const TypeReference& left, const TypeReference& right) {
    auto family = left.Family();
    if (family == TypeFamily::NONE || family != right.Family()) {
        return false;
    }

    bool equality = op == BinaryOperatorKind::EQUAL || op == BinaryOperatorKind::NOT_EQUAL;
    switch (family) {
        case TypeFamily::NUMERIC:
        case TypeFamily::STRING:
            return true;
        case TypeFamily::TEMPORAL:
            return left.IsSameType(right);
        case TypeFamily::BOOLEAN:
        case TypeFamily::GUID:
            return equality;
        case TypeFamily::GEOGRAPHY:
        case TypeFamily::GEOMETRY:
        default:
            return false;
    }
}

TypeReference BooleanResult(bool nullable) {
    return TypeReference::Primitive("Edm.Boolean", nullable);
}

class FilterParseSession {
public:
    FilterParseSession(const SchemaResolver& resolver, const std::string& filter)
        : resolver(resolver), lexer(filter),
          range_variable(std::make_unique<RangeVariable>(resolver.BoundRangeVariable()))
    {}

    FilterQueryOption Run() {
        Advance();
        auto root = ParseExpr();
        if (current.kind != TokenKind::END_OF_INPUT) {
            throw SyntaxError("end of input", current.text, current.offset);
        }
        if (!root->Type().IsBoolean()) {
            throw TypeMismatchError("$filter", root->Type().FullName(), "", root->offset);
        }

        auto item_type = range_variable->type;
        return FilterQueryOption(std::move(item_type), std::move(range_variable), std::move(root));
    }

private:
    // Counts one level of parentheses or function-call nesting for its lifetime
    class NestingGuard {
    public:
        NestingGuard(FilterParseSession& session, const Token& token) : session(session) {
            if (++session.nesting > ODataFilterParser::MAX_NESTING_DEPTH) {
                throw SyntaxError("Expression nesting exceeds " + std::to_string(ODataFilterParser::MAX_NESTING_DEPTH) + " levels",
                                  "a shallower expression", token.text, token.offset);
            }
        }
        ~NestingGuard() { --session.nesting; }

        NestingGuard(const NestingGuard&) = delete;
        NestingGuard& operator=(const NestingGuard&) = delete;

    private:
        FilterParseSession& session;
    };

    ExpressionNodePtr CheckDepth(ExpressionNodePtr node) {
        if (node->depth > ODataFilterParser::MAX_EXPRESSION_DEPTH) {
            throw SyntaxError("Expression tree exceeds " + std::to_string(ODataFilterParser::MAX_EXPRESSION_DEPTH) + " levels",
                              "a shallower expression", current.text, node->offset);
        }
        return node;
    }

    void Advance() {
        current = lexer.Next();
    }

    void ExpectPunctuation(char c) {
        if (!current.IsPunctuation(c)) {
            throw SyntaxError("'" + std::string(1, c) + "'", current.text, current.offset);
        }
        Advance();
    }

    ExpressionNodePtr ParseExpr() {
        return ParseOr();
    }

    ExpressionNodePtr ParseOr() {
        auto left = ParseAnd();
        while (current.IsOperator("or")) {
            Token op = current;
            Advance();
            auto right = ParseAnd();
            left = MakeLogical(BinaryOperatorKind::OR, op, std::move(left), std::move(right));
        }
        return left;
    }

    ExpressionNodePtr ParseAnd() {
        auto left = ParseNot();
        while (current.IsOperator("and")) {
            Token op = current;
            Advance();
            auto right = ParseNot();
            left = MakeLogical(BinaryOperatorKind::AND, op, std::move(left), std::move(right));
        }
        return left;
    }

    ExpressionNodePtr ParseNot() {
        if (!current.IsOperator("not")) {
            return ParseComparison();
        }

        Token op = current;
        Advance();
        auto operand = ParseComparison();
        const auto& operand_type = operand->Type();
        if (!operand_type.IsBoolean()) {
            throw TypeMismatchError(op.text, operand_type.FullName(), "", op.offset);
        }

        UnaryOperatorNode node;
        node.op = UnaryOperatorKind::NOT;
        node.type = BooleanResult(operand_type.nullable);
        node.operand = std::move(operand);
        return CheckDepth(MakeNode(std::move(node), op.offset));
    }

    ExpressionNodePtr ParseComparison() {
        auto left = ParsePrimary();
        if (!current.IsComparisonOperator()) {
            return left;
        }

        Token op = current;
        Advance();
        auto right = ParsePrimary();

        auto kind = BinaryOperatorKindFromKeyword(op.text);
        const auto& left_type = left->Type();
        const auto& right_type = right->Type();
        if (!IsComparable(kind, left_type, right_type)) {
            throw TypeMismatchError(op.text, left_type.FullName(), right_type.FullName(), op.offset);
        }

        if (current.IsComparisonOperator()) {
            throw SyntaxError("Comparison operators cannot be chained", "'and', 'or', ')' or end of input",
                              current.text, current.offset);
        }

        BinaryOperatorNode node;
        node.op = kind;
        node.type = BooleanResult(left_type.nullable || right_type.nullable);
        size_t offset = left->offset;
        node.left = std::move(left);
        node.right = std::move(right);
        return CheckDepth(MakeNode(std::move(node), offset));
    }

    ExpressionNodePtr MakeLogical(BinaryOperatorKind kind, const Token& op, ExpressionNodePtr left, ExpressionNodePtr right) {
        const auto& left_type = left->Type();
        const auto& right_type = right->Type();
        if (!left_type.IsBoolean() || !right_type.IsBoolean()) {
            throw TypeMismatchError(op.text, left_type.FullName(), right_type.FullName(), op.offset);
        }

        BinaryOperatorNode node;
        node.op = kind;
        node.type = BooleanResult(left_type.nullable || right_type.nullable);
        size_t offset = left->offset;
        node.left = std::move(left);
        node.right = std::move(right);
        return CheckDepth(MakeNode(std::move(node), offset));
    }

    ExpressionNodePtr ParsePrimary() {
        switch (current.kind) {
            case TokenKind::NUMBER_LITERAL:
                return ParseNumberLiteral();
            case TokenKind::STRING_LITERAL: {
                LiteralNode node{EscapeStringLiteral(current.text), TypeReference::Primitive("Edm.String", false)};
                size_t offset = current.offset;
                Advance();
                return MakeNode(std::move(node), offset);
            }
            case TokenKind::IDENTIFIER:
                return ParseIdentifierExpression();
            case TokenKind::PUNCTUATION:
                if (current.IsPunctuation('(')) {
                    NestingGuard guard(*this, current);
                    Advance();
                    auto inner = ParseExpr();
                    ExpectPunctuation(')');
                    return inner;
                }
                break;
            default:
                break;
        }
        throw SyntaxError("expression", current.text, current.offset);
    }

    ExpressionNodePtr ParseNumberLiteral() {
        Token token = current;
        Advance();

        bool is_decimal = token.text.find_first_of(".eE") != std::string::npos;
        if (is_decimal) {
            return MakeNode(LiteralNode{token.text, TypeReference::Primitive("Edm.Double", false)}, token.offset);
        }

        std::string type_name = "Edm.Decimal";
        try {
            long long value = std::stoll(token.text);
            bool fits_int32 = value >= std::numeric_limits<int32_t>::min() && value <= std::numeric_limits<int32_t>::max();
            type_name = fits_int32 ? "Edm.Int32" : "Edm.Int64";
        } catch (const std::out_of_range&) {
            // Wider than Int64; carried as a decimal literal
        }
        return MakeNode(LiteralNode{token.text, TypeReference::Primitive(type_name, false)}, token.offset);
    }

    ExpressionNodePtr ParseIdentifierExpression() {
        Token identifier = current;
        Advance();

        if (current.IsPunctuation('(')) {
            return ParseFunctionCall(identifier);
        }
        if (identifier.text == "true" || identifier.text == "false") {
            return MakeNode(LiteralNode{identifier.text, TypeReference::Primitive("Edm.Boolean", false)}, identifier.offset);
        }
        return ParsePropertyPath(identifier);
    }

    ExpressionNodePtr ParseFunctionCall(const Token& name) {
        NestingGuard guard(*this, name);
        ExpectPunctuation('(');

        std::vector<ExpressionNodePtr> arguments;
        if (!current.IsPunctuation(')')) {
            while (true) {
                arguments.push_back(ParsePrimary());
                if (current.IsPunctuation(',')) {
                    Advance();
                    continue;
                }
                if (current.IsPunctuation(')')) {
                    break;
                }
                throw SyntaxError("',' or ')'", current.text, current.offset);
            }
        }
        Advance();

        std::vector<TypeReference> argument_types;
        argument_types.reserve(arguments.size());
        for (const auto& argument : arguments) {
            argument_types.push_back(argument->Type());
        }

        auto resolution = AtOffset(name.offset, [&]() {
            return resolver.ResolveFunction(name.text, argument_types);
        });

        FunctionCallNode node;
        node.name = name.text;
        node.return_type = resolution.return_type;
        node.arguments = std::move(arguments);
        node.signature = std::move(resolution.signature);
        return CheckDepth(MakeNode(std::move(node), name.offset));
    }

    ExpressionNodePtr ParsePropertyPath(const Token& first) {
        ExpressionNodePtr source;
        if (first.text[0] == '$') {
            const RangeVariable* resolved = AtOffset(first.offset, [&]() {
                return &resolver.ResolveRangeVariable(first.text);
            });
            // A filter has exactly one scope; every reference points at its own variable
            if (resolved->name != range_variable->name) {
                throw UnknownIdentifierError(first.text, first.offset);
            }
            source = MakeNode(RangeVariableReferenceNode{range_variable.get()}, first.offset);
        } else {
            source = MakeNode(RangeVariableReferenceNode{range_variable.get()}, first.offset);
            source = MakePropertyAccess(std::move(source), first);
        }

        while (current.IsPunctuation('/')) {
            Advance();
            if (current.kind != TokenKind::IDENTIFIER) {
                throw SyntaxError("property name", current.text, current.offset);
            }
            Token segment = current;
            Advance();
            source = MakePropertyAccess(std::move(source), segment);
        }
        return source;
    }

    ExpressionNodePtr MakePropertyAccess(ExpressionNodePtr source, const Token& segment) {
        auto type = AtOffset(segment.offset, [&]() {
            return resolver.ResolveProperty(source->Type(), segment.text);
        });

        PropertyAccessNode node;
        node.property_name = segment.text;
        node.navigation = type.kind == TypeKind::ENTITY;
        node.type = std::move(type);
        node.source = std::move(source);
        return CheckDepth(MakeNode(std::move(node), segment.offset));
    }

    const SchemaResolver& resolver;
    ODataFilterLexer lexer;
    Token current;
    std::unique_ptr<RangeVariable> range_variable;
    size_t nesting = 0;
};

} // namespace

ODataFilterParser::ODataFilterParser(const SchemaResolver& resolver)
    : resolver(resolver)
{}

FilterQueryOption ODataFilterParser::Parse(const std::string& filter) const {
    ODATA_FILTER_TRACE_DEBUG("PARSER", "Parsing filter: " + filter);
    try {
        FilterParseSession session(resolver, filter);
        auto result = session.Run();
        ODATA_FILTER_TRACE_DEBUG("PARSER", "Parsed filter into " + result.Expression().KindName());
        return result;
    } catch (const ODataFilterException& e) {
        ODATA_FILTER_TRACE_WARN_DATA("PARSER", "Failed to parse filter", std::string(e.what()) + "\nFilter: " + filter);
        throw;
    }
}

FilterQueryOption ParseFilter(const std::string& filter, const SchemaResolver& resolver) {
    return ODataFilterParser(resolver).Parse(filter);
}

} // namespace odata_filter
