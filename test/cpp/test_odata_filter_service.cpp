#include "catch.hpp"
#include "filter_test_schema.hpp"

#include "odata_filter_service.hpp"

#include <stdexcept>

using namespace odata_filter;

TEST_CASE("ODataFilterService parses filters", "[odata_filter_service]")
{
    ODataFilterService service(test::CustomerMetadataV4());

    auto result = service.Parse("geo.distance(Home, Office) lt 0.5", "Customers");
    REQUIRE(result.filter == "geo.distance(Home, Office) lt 0.5");
    REQUIRE(result.entity_set == "Customers");
    REQUIRE(result.item_type == "Test.Customer");
    REQUIRE(result.expression_kind == "BinaryOperatorNode");
    REQUIRE(result.result_type == "[Edm.Boolean Nullable=True]");
    REQUIRE(result.tree.rfind("FilterQueryOption\n", 0) == 0);
    REQUIRE(result.tree_json.find("\"kind\":\"BinaryOperatorNode\"") != std::string::npos);

    REQUIRE_THROWS_AS(service.Parse("Home lt Office", "Customers"), TypeMismatchError);
    REQUIRE_THROWS_AS(service.Parse("a eq 1", "Suppliers"), UnknownIdentifierError);
}

TEST_CASE("ODataFilterService parses request URLs", "[odata_filter_service]")
{
    ODataFilterService service(std::make_shared<const Edmx>(Edmx::FromXml(test::CustomerMetadataV4())));

    auto result = service.ParseUrl("https://host/odata/Customers?$top=5&$filter=Address/City%20eq%20'Berlin'");
    REQUIRE(result.entity_set == "Customers");
    REQUIRE(result.filter == "Address/City eq 'Berlin'");
    REQUIRE(result.result_type == "[Edm.Boolean Nullable=True]");

    REQUIRE_THROWS_AS(service.ParseUrl("https://host/odata/Customers?$top=5"), SyntaxError);
}

TEST_CASE("ODataFilterService checks filters without throwing", "[odata_filter_service]")
{
    ODataFilterService service(test::CustomerMetadataV4());

    SECTION("Valid filter")
    {
        auto check = service.Check("IsActive and Rating gt 3", "Customers");
        REQUIRE(check.is_valid);
        REQUIRE(check.error_kind.empty());
        REQUIRE_FALSE(check.error_offset.has_value());
    }

    SECTION("Syntax error")
    {
        auto check = service.Check("geo.distance(Home, Office lt 0.5", "Customers");
        REQUIRE_FALSE(check.is_valid);
        REQUIRE(check.error_kind == "SyntaxError");
        REQUIRE(check.error_offset == 26);
        REQUIRE(check.error_message.rfind("SyntaxError: Expected ',' or ')' but found 'lt'", 0) == 0);
    }

    SECTION("Unknown property")
    {
        auto check = service.Check("geo.distance(Home, Unknown) lt 0.5", "Customers");
        REQUIRE(check.error_kind == "UnknownProperty");
        REQUIRE(check.error_offset == 19);
    }

    SECTION("Invalid UTF-8 in a literal")
    {
        auto check = service.Check("Name eq 'ab\xFF'", "Customers");
        REQUIRE_FALSE(check.is_valid);
        REQUIRE(check.error_kind == "LexError");
        REQUIRE(check.error_offset == 11);
    }

    SECTION("Non-ASCII literal")
    {
        REQUIRE(service.Check("Name eq 'K\xC3\xB6ln'", "Customers").is_valid);
        auto result = service.Parse("Name eq 'K\xC3\xB6ln'", "Customers");
        REQUIRE(result.tree_json.find("'K\xC3\xB6ln'") != std::string::npos);
    }

    SECTION("Unknown entity set has no offset")
    {
        auto check = service.Check("a eq 1", "Suppliers");
        REQUIRE(check.error_kind == "UnknownIdentifier");
        REQUIRE_FALSE(check.error_offset.has_value());
    }
}

TEST_CASE("ODataFilterService rejects unusable metadata", "[odata_filter_service]")
{
    REQUIRE_THROWS_AS(ODataFilterService(std::string("<not-edmx/>")), std::runtime_error);
    REQUIRE_THROWS_AS(ODataFilterService(std::shared_ptr<const Edmx>()), std::invalid_argument);
}
