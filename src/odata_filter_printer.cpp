#include "odata_filter_printer.hpp"

#include <sstream>

namespace odata_filter {

namespace {

class TreeWriter {
public:
    std::string Str() const { return out.str(); }

    void Line(size_t depth, const std::string& text) {
        out << std::string(depth, '\t') << text << "\n";
    }

    void Attribute(size_t depth, const std::string& key, const std::string& value) {
        Line(depth, key + " = " + value);
    }

    void WriteRangeVariable(size_t depth, const RangeVariable& variable) {
        Line(depth, "EntityRangeVariable");
        Attribute(depth + 1, "Name", variable.name);
        Attribute(depth + 1, "NavigationSource", variable.navigation_source);
        Attribute(depth + 1, "TypeReference", variable.type.ToString());
    }

    void WriteNode(size_t depth, const ExpressionNode& node) {
        Line(depth, node.KindName());
        std::visit([this, depth](const auto& value) { WriteAttributes(depth + 1, value); }, node.value);
    }

private:
    void WriteChild(size_t depth, const std::string& key, const ExpressionNode& child) {
        Attribute(depth, key, "");
        WriteNode(depth + 1, child);
    }

    void WriteAttributes(size_t depth, const RangeVariableReferenceNode& node) {
        const auto& variable = *node.variable;
        Attribute(depth, "Name", variable.name);
        Attribute(depth, "NavigationSource", variable.navigation_source);
        Attribute(depth, "TypeReference", variable.type.ToString());
        Attribute(depth, "Range Variable", variable.name);
    }

    void WriteAttributes(size_t depth, const PropertyAccessNode& node) {
        Attribute(depth, node.navigation ? "NavigationProperty" : "Property", node.property_name);
        Attribute(depth, "TypeReference", node.type.ToString());
        WriteChild(depth, "Source", *node.source);
    }

    void WriteAttributes(size_t depth, const FunctionCallNode& node) {
        Attribute(depth, "Name", node.name);
        Attribute(depth, "Return Type", node.return_type.ToString());
        Attribute(depth, "Function", node.signature.has_value() ? node.signature->ToString() : "");
        Attribute(depth, "Arguments", "");
        for (const auto& argument : node.arguments) {
            WriteNode(depth + 1, *argument);
        }
    }

    void WriteAttributes(size_t depth, const BinaryOperatorNode& node) {
        Attribute(depth, "TypeReference", node.type.ToString());
        Attribute(depth, "OperatorKind", BinaryOperatorKindToString(node.op));
        WriteChild(depth, "Left", *node.left);
        WriteChild(depth, "Right", *node.right);
    }

    void WriteAttributes(size_t depth, const UnaryOperatorNode& node) {
        Attribute(depth, "TypeReference", node.type.ToString());
        Attribute(depth, "OperatorKind", UnaryOperatorKindToString(node.op));
        WriteChild(depth, "Operand", *node.operand);
    }

    void WriteAttributes(size_t depth, const LiteralNode& node) {
        Attribute(depth, "TypeReference", node.type.ToString());
        Attribute(depth, "Value", node.raw_value);
    }

    std::ostringstream out;
};

} // namespace

std::string FilterTreePrinter::Render(const FilterQueryOption& filter) const {
    TreeWriter writer;
    writer.Line(0, "FilterQueryOption");
    writer.Attribute(1, "ItemType", filter.ItemType().ToString());
    writer.Attribute(1, "RangeVariable", "");
    writer.WriteRangeVariable(2, filter.GetRangeVariable());
    writer.Attribute(1, "Expression", "");
    writer.WriteNode(2, filter.Expression());
    return writer.Str();
}

std::string FilterTreePrinter::Render(const ExpressionNode& node) const {
    TreeWriter writer;
    writer.WriteNode(0, node);
    return writer.Str();
}

std::string Render(const FilterQueryOption& filter) {
    return FilterTreePrinter().Render(filter);
}

} // namespace odata_filter
