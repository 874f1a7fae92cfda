#include "catch.hpp"
#include "filter_test_schema.hpp"

#include "odata_filter_json.hpp"
#include "odata_filter_parser.hpp"

#include "yyjson.hpp"

#include <memory>

using namespace odata_filter;
using namespace duckdb_yyjson;

namespace {

struct DocDeleter {
    void operator()(yyjson_doc* doc) const { yyjson_doc_free(doc); }
};

using JsonDoc = std::unique_ptr<yyjson_doc, DocDeleter>;

JsonDoc ReadJson(const std::string& json) {
    JsonDoc doc(yyjson_read(json.c_str(), json.size(), YYJSON_READ_NOFLAG));
    REQUIRE(doc != nullptr);
    return doc;
}

std::string GetString(yyjson_val* obj, const char* key) {
    auto val = yyjson_obj_get(obj, key);
    REQUIRE(yyjson_is_str(val));
    return yyjson_get_str(val);
}

} // namespace

TEST_CASE("JSON rendering of a comparison tree", "[odata_filter_json]")
{
    auto resolver = test::CustomerResolver();
    auto filter = ParseFilter("geo.distance(Home, Office) lt 0.5", resolver);
    auto doc = ReadJson(RenderJson(filter));
    auto root = yyjson_doc_get_root(doc.get());

    SECTION("Item type and range variable")
    {
        auto item_type = yyjson_obj_get(root, "itemType");
        REQUIRE(GetString(item_type, "name") == "Test.Customer");
        REQUIRE(GetString(item_type, "typeKind") == "Entity");
        REQUIRE_FALSE(yyjson_get_bool(yyjson_obj_get(item_type, "nullable")));

        auto variable = yyjson_obj_get(root, "rangeVariable");
        REQUIRE(GetString(variable, "name") == "$it");
        REQUIRE(GetString(variable, "navigationSource") == "Customers");
    }

    SECTION("Expression nodes")
    {
        auto expression = yyjson_obj_get(root, "expression");
        REQUIRE(GetString(expression, "kind") == "BinaryOperatorNode");
        REQUIRE(GetString(expression, "operatorKind") == "LessThan");
        REQUIRE(yyjson_get_uint(yyjson_obj_get(expression, "offset")) == 0);

        auto left = yyjson_obj_get(expression, "left");
        REQUIRE(GetString(left, "kind") == "SingleValueFunctionCallNode");
        REQUIRE(GetString(left, "function") == "Edm.Double geo.distance(Edm.GeographyPoint, Edm.GeographyPoint)");

        auto arguments = yyjson_obj_get(left, "arguments");
        REQUIRE(yyjson_arr_size(arguments) == 2);
        auto office = yyjson_arr_get(arguments, 1);
        REQUIRE(GetString(office, "property") == "Office");
        REQUIRE(yyjson_get_uint(yyjson_obj_get(office, "offset")) == 19);
        auto office_type = yyjson_obj_get(office, "type");
        REQUIRE(yyjson_get_int(yyjson_obj_get(office_type, "srid")) == 4326);
        REQUIRE(GetString(yyjson_obj_get(office, "source"), "kind") == "EntityRangeVariableReferenceNode");

        auto right = yyjson_obj_get(expression, "right");
        REQUIRE(GetString(right, "kind") == "ConstantNode");
        REQUIRE(GetString(right, "value") == "0.5");
        REQUIRE(yyjson_get_uint(yyjson_obj_get(right, "offset")) == 30);
        REQUIRE(yyjson_obj_get(yyjson_obj_get(right, "type"), "srid") == nullptr);
    }
}

TEST_CASE("JSON rendering of unary nodes", "[odata_filter_json]")
{
    auto resolver = test::CustomerResolver();
    auto filter = ParseFilter("not contains(Name, 'it''s')", resolver);
    auto doc = ReadJson(RenderJson(filter));
    auto expression = yyjson_obj_get(yyjson_doc_get_root(doc.get()), "expression");

    REQUIRE(GetString(expression, "kind") == "UnaryOperatorNode");
    REQUIRE(GetString(expression, "operatorKind") == "Not");

    auto call = yyjson_obj_get(expression, "operand");
    auto literal = yyjson_arr_get(yyjson_obj_get(call, "arguments"), 1);
    REQUIRE(GetString(literal, "value") == "'it''s'");
}

TEST_CASE("Pretty JSON holds the same document", "[odata_filter_json]")
{
    auto resolver = test::CustomerResolver();
    auto filter = ParseFilter("a eq 1", resolver);

    auto compact = RenderJson(filter);
    auto pretty = RenderJson(filter, true);
    REQUIRE(compact.find('\n') == std::string::npos);
    REQUIRE(pretty.find('\n') != std::string::npos);

    auto doc = ReadJson(pretty);
    auto expression = yyjson_obj_get(yyjson_doc_get_root(doc.get()), "expression");
    REQUIRE(GetString(expression, "operatorKind") == "Equal");
}
