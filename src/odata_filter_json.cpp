#include "odata_filter_json.hpp"
#include "odata_filter_tracing.hpp"

#include "yyjson.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>

using namespace duckdb_yyjson;

namespace odata_filter {

namespace {

struct MutDocDeleter {
    void operator()(yyjson_mut_doc* doc) const { yyjson_mut_doc_free(doc); }
};

class JsonTreeBuilder {
public:
    explicit JsonTreeBuilder(yyjson_mut_doc* doc)
        : doc(doc)
    {}

    yyjson_mut_val* Type(const TypeReference& type) {
        auto obj = yyjson_mut_obj(doc);
        yyjson_mut_obj_add_strcpy(doc, obj, "name", type.FullName().c_str());
        yyjson_mut_obj_add_bool(doc, obj, "nullable", type.nullable);
        yyjson_mut_obj_add_strcpy(doc, obj, "typeKind", TypeKindToString(type.kind).c_str());
        if (type.srid.has_value()) {
            yyjson_mut_obj_add_int(doc, obj, "srid", type.srid.value());
        }
        return obj;
    }

    yyjson_mut_val* Variable(const RangeVariable& variable) {
        auto obj = yyjson_mut_obj(doc);
        yyjson_mut_obj_add_strcpy(doc, obj, "name", variable.name.c_str());
        yyjson_mut_obj_add_strcpy(doc, obj, "navigationSource", variable.navigation_source.c_str());
        yyjson_mut_obj_add_val(doc, obj, "type", Type(variable.type));
        return obj;
    }

    yyjson_mut_val* Node(const ExpressionNode& node) {
        auto obj = yyjson_mut_obj(doc);
        yyjson_mut_obj_add_strcpy(doc, obj, "kind", node.KindName().c_str());
        yyjson_mut_obj_add_uint(doc, obj, "offset", node.offset);
        std::visit([this, obj](const auto& value) { AddMembers(obj, value); }, node.value);
        return obj;
    }

private:
    void AddMembers(yyjson_mut_val* obj, const RangeVariableReferenceNode& node) {
        yyjson_mut_obj_add_strcpy(doc, obj, "name", node.variable->name.c_str());
        yyjson_mut_obj_add_strcpy(doc, obj, "navigationSource", node.variable->navigation_source.c_str());
        yyjson_mut_obj_add_val(doc, obj, "type", Type(node.variable->type));
    }

    void AddMembers(yyjson_mut_val* obj, const PropertyAccessNode& node) {
        yyjson_mut_obj_add_strcpy(doc, obj, "property", node.property_name.c_str());
        yyjson_mut_obj_add_val(doc, obj, "type", Type(node.type));
        yyjson_mut_obj_add_val(doc, obj, "source", Node(*node.source));
    }

    void AddMembers(yyjson_mut_val* obj, const FunctionCallNode& node) {
        yyjson_mut_obj_add_strcpy(doc, obj, "name", node.name.c_str());
        yyjson_mut_obj_add_val(doc, obj, "returnType", Type(node.return_type));
        if (node.signature.has_value()) {
            yyjson_mut_obj_add_strcpy(doc, obj, "function", node.signature->ToString().c_str());
        } else {
            yyjson_mut_obj_add_null(doc, obj, "function");
        }

        auto arguments = yyjson_mut_arr(doc);
        for (const auto& argument : node.arguments) {
            yyjson_mut_arr_append(arguments, Node(*argument));
        }
        yyjson_mut_obj_add_val(doc, obj, "arguments", arguments);
    }

    void AddMembers(yyjson_mut_val* obj, const BinaryOperatorNode& node) {
        yyjson_mut_obj_add_strcpy(doc, obj, "operatorKind", BinaryOperatorKindToString(node.op).c_str());
        yyjson_mut_obj_add_val(doc, obj, "type", Type(node.type));
        yyjson_mut_obj_add_val(doc, obj, "left", Node(*node.left));
        yyjson_mut_obj_add_val(doc, obj, "right", Node(*node.right));
    }

    void AddMembers(yyjson_mut_val* obj, const UnaryOperatorNode& node) {
        yyjson_mut_obj_add_strcpy(doc, obj, "operatorKind", UnaryOperatorKindToString(node.op).c_str());
        yyjson_mut_obj_add_val(doc, obj, "type", Type(node.type));
        yyjson_mut_obj_add_val(doc, obj, "operand", Node(*node.operand));
    }

    void AddMembers(yyjson_mut_val* obj, const LiteralNode& node) {
        yyjson_mut_obj_add_val(doc, obj, "type", Type(node.type));
        yyjson_mut_obj_add_strcpy(doc, obj, "value", node.raw_value.c_str());
    }

    yyjson_mut_doc* doc;
};

} // namespace

std::string RenderJson(const FilterQueryOption& filter, bool pretty) {
    std::unique_ptr<yyjson_mut_doc, MutDocDeleter> doc(yyjson_mut_doc_new(nullptr));
    if (!doc) {
        throw std::runtime_error("Failed to allocate JSON document");
    }

    JsonTreeBuilder builder(doc.get());
    auto root = yyjson_mut_obj(doc.get());
    yyjson_mut_doc_set_root(doc.get(), root);
    yyjson_mut_obj_add_val(doc.get(), root, "itemType", builder.Type(filter.ItemType()));
    yyjson_mut_obj_add_val(doc.get(), root, "rangeVariable", builder.Variable(filter.GetRangeVariable()));
    yyjson_mut_obj_add_val(doc.get(), root, "expression", builder.Node(filter.Expression()));

    yyjson_write_flag flags = pretty ? YYJSON_WRITE_PRETTY : YYJSON_WRITE_NOFLAG;
    size_t length = 0;
    char* json = yyjson_mut_write(doc.get(), flags, &length);
    if (!json) {
        ODATA_FILTER_TRACE_ERROR("JSON", "Failed to serialize filter tree");
        throw std::runtime_error("Failed to serialize filter tree to JSON");
    }

    std::string result(json, length);
    free(json);
    return result;
}

} // namespace odata_filter
