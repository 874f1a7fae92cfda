#include "odata_filter_nodes.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

namespace odata_filter {

namespace {

template <class... Ts>
struct Overloaded : Ts... { using Ts::operator()...; };
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

size_t ChildDepth(const ExpressionNodePtr& child) {
    return child ? child->depth : 0;
}

size_t SubtreeDepth(const ExpressionNode::Variant& value) {
    return std::visit(Overloaded{
        [](const RangeVariableReferenceNode&) -> size_t { return 0; },
        [](const PropertyAccessNode& node) -> size_t { return ChildDepth(node.source); },
        [](const FunctionCallNode& node) -> size_t {
            size_t deepest = 0;
            for (const auto& argument : node.arguments) {
                deepest = std::max(deepest, ChildDepth(argument));
            }
            return deepest;
        },
        [](const BinaryOperatorNode& node) -> size_t {
            return std::max(ChildDepth(node.left), ChildDepth(node.right));
        },
        [](const UnaryOperatorNode& node) -> size_t { return ChildDepth(node.operand); },
        [](const LiteralNode&) -> size_t { return 0; },
    }, value);
}

} // namespace

ExpressionNode::ExpressionNode(Variant value, size_t offset)
    : value(std::move(value)), offset(offset), depth(1 + SubtreeDepth(this->value))
{}

std::string FunctionSignature::ToString() const {
    std::ostringstream ss;
    ss << return_type.FullName() << " " << name << "(";
    for (size_t i = 0; i < parameter_types.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << parameter_types[i].FullName();
    }
    ss << ")";
    return ss.str();
}

std::string BinaryOperatorKindToString(BinaryOperatorKind kind) {
    switch (kind) {
        case BinaryOperatorKind::OR: return "Or";
        case BinaryOperatorKind::AND: return "And";
        case BinaryOperatorKind::EQUAL: return "Equal";
        case BinaryOperatorKind::NOT_EQUAL: return "NotEqual";
        case BinaryOperatorKind::GREATER_THAN: return "GreaterThan";
        case BinaryOperatorKind::GREATER_THAN_OR_EQUAL: return "GreaterThanOrEqual";
        case BinaryOperatorKind::LESS_THAN: return "LessThan";
        case BinaryOperatorKind::LESS_THAN_OR_EQUAL: return "LessThanOrEqual";
        default: return "Unknown";
    }
}

std::string UnaryOperatorKindToString(UnaryOperatorKind kind) {
    switch (kind) {
        case UnaryOperatorKind::NOT: return "Not";
        default: return "Unknown";
    }
}

BinaryOperatorKind BinaryOperatorKindFromKeyword(const std::string& keyword) {
    if (keyword == "or") return BinaryOperatorKind::OR;
    if (keyword == "and") return BinaryOperatorKind::AND;
    if (keyword == "eq") return BinaryOperatorKind::EQUAL;
    if (keyword == "ne") return BinaryOperatorKind::NOT_EQUAL;
    if (keyword == "gt") return BinaryOperatorKind::GREATER_THAN;
    if (keyword == "ge") return BinaryOperatorKind::GREATER_THAN_OR_EQUAL;
    if (keyword == "lt") return BinaryOperatorKind::LESS_THAN;
    if (keyword == "le") return BinaryOperatorKind::LESS_THAN_OR_EQUAL;
    throw std::invalid_argument("Not a binary operator keyword: " + keyword);
}

const TypeReference& ExpressionNode::Type() const {
    return std::visit(Overloaded{
        [](const RangeVariableReferenceNode& node) -> const TypeReference& { return node.variable->type; },
        [](const PropertyAccessNode& node) -> const TypeReference& { return node.type; },
        [](const FunctionCallNode& node) -> const TypeReference& { return node.return_type; },
        [](const BinaryOperatorNode& node) -> const TypeReference& { return node.type; },
        [](const UnaryOperatorNode& node) -> const TypeReference& { return node.type; },
        [](const LiteralNode& node) -> const TypeReference& { return node.type; },
    }, value);
}

std::string ExpressionNode::KindName() const {
    return std::visit(Overloaded{
        [](const RangeVariableReferenceNode&) -> std::string { return "EntityRangeVariableReferenceNode"; },
        [](const PropertyAccessNode& node) -> std::string {
            if (node.navigation) {
                return node.type.collection ? "CollectionNavigationNode" : "SingleNavigationNode";
            }
            return node.type.collection ? "CollectionPropertyAccessNode" : "SingleValuePropertyAccessNode";
        },
        [](const FunctionCallNode&) -> std::string { return "SingleValueFunctionCallNode"; },
        [](const BinaryOperatorNode&) -> std::string { return "BinaryOperatorNode"; },
        [](const UnaryOperatorNode&) -> std::string { return "UnaryOperatorNode"; },
        [](const LiteralNode&) -> std::string { return "ConstantNode"; },
    }, value);
}

FilterQueryOption::FilterQueryOption(TypeReference item_type, std::unique_ptr<RangeVariable> range_variable,
                                     ExpressionNodePtr expression)
    : item_type(std::move(item_type)), range_variable(std::move(range_variable)), expression(std::move(expression))
{
    if (!this->range_variable || !this->expression) {
        throw std::invalid_argument("FilterQueryOption requires a range variable and an expression");
    }
}

} // namespace odata_filter
