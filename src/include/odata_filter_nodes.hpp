#pragma once

#include "odata_type_reference.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace odata_filter {

// The implicit current-item binding of a filter ($it)
struct RangeVariable {
    std::string name;
    std::string navigation_source;
    TypeReference type;
};

// An overload a function call was matched against
struct FunctionSignature {
    std::string name;
    std::vector<TypeReference> parameter_types;
    TypeReference return_type;

    // "Edm.Double geo.distance(Edm.GeographyPoint, Edm.GeographyPoint)"
    std::string ToString() const;
};

enum class BinaryOperatorKind {
    OR,
    AND,
    EQUAL,
    NOT_EQUAL,
    GREATER_THAN,
    GREATER_THAN_OR_EQUAL,
    LESS_THAN,
    LESS_THAN_OR_EQUAL
};

enum class UnaryOperatorKind {
    NOT
};

std::string BinaryOperatorKindToString(BinaryOperatorKind kind);
std::string UnaryOperatorKindToString(UnaryOperatorKind kind);
// Maps the filter keyword ("lt", "and", ...) to its operator; throws std::invalid_argument otherwise
BinaryOperatorKind BinaryOperatorKindFromKeyword(const std::string& keyword);

struct ExpressionNode;
using ExpressionNodePtr = std::unique_ptr<ExpressionNode>;

struct RangeVariableReferenceNode {
    // Owned by the enclosing FilterQueryOption
    const RangeVariable* variable = nullptr;
};

struct PropertyAccessNode {
    ExpressionNodePtr source;
    std::string property_name;
    TypeReference type;
    bool navigation = false;
};

struct FunctionCallNode {
    std::string name;
    TypeReference return_type;
    std::vector<ExpressionNodePtr> arguments;
    std::optional<FunctionSignature> signature;
};

struct BinaryOperatorNode {
    BinaryOperatorKind op = BinaryOperatorKind::EQUAL;
    ExpressionNodePtr left;
    ExpressionNodePtr right;
    TypeReference type;
};

struct UnaryOperatorNode {
    UnaryOperatorKind op = UnaryOperatorKind::NOT;
    ExpressionNodePtr operand;
    TypeReference type;
};

struct LiteralNode {
    std::string raw_value;
    TypeReference type;
};

struct ExpressionNode {
    using Variant = std::variant<RangeVariableReferenceNode, PropertyAccessNode, FunctionCallNode,
                                 BinaryOperatorNode, UnaryOperatorNode, LiteralNode>;

    ExpressionNode(Variant value, size_t offset);

    const TypeReference& Type() const;
    // Diagnostic name of the node, e.g. "SingleValueFunctionCallNode"
    std::string KindName() const;

    template <typename T>
    bool Is() const { return std::holds_alternative<T>(value); }

    template <typename T>
    const T& As() const { return std::get<T>(value); }

    Variant value;
    // Offset of the first token of the node in the filter text
    size_t offset;
    // Number of nodes on the longest path from this node to a leaf, this node included
    size_t depth;
};

template <typename T>
ExpressionNodePtr MakeNode(T node, size_t offset) {
    return std::make_unique<ExpressionNode>(ExpressionNode::Variant(std::move(node)), offset);
}

// Result of parsing one $filter expression. Owns the range variable and the tree.
class FilterQueryOption {
public:
    FilterQueryOption(TypeReference item_type, std::unique_ptr<RangeVariable> range_variable, ExpressionNodePtr expression);

    FilterQueryOption(const FilterQueryOption&) = delete;
    FilterQueryOption& operator=(const FilterQueryOption&) = delete;
    FilterQueryOption(FilterQueryOption&&) = default;
    FilterQueryOption& operator=(FilterQueryOption&&) = default;

    const TypeReference& ItemType() const { return item_type; }
    const RangeVariable& GetRangeVariable() const { return *range_variable; }
    const ExpressionNode& Expression() const { return *expression; }

private:
    TypeReference item_type;
    std::unique_ptr<RangeVariable> range_variable;
    ExpressionNodePtr expression;
};

} // namespace odata_filter
