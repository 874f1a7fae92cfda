#include "catch.hpp"
#include "odata_type_reference.hpp"

using namespace odata_filter;

TEST_CASE("TypeReference rendering", "[odata_type_reference]")
{
    REQUIRE(TypeReference::Primitive("Edm.Double", true).ToString() == "[Edm.Double Nullable=True]");
    REQUIRE(TypeReference::Primitive("Edm.Int32", false).ToString() == "[Edm.Int32 Nullable=False]");
    REQUIRE(TypeReference::Geographic("Edm.GeographyPoint", true, 4326).ToString() ==
            "[Edm.GeographyPoint Nullable=True SRID=4326]");

    auto orders = TypeReference("Test.Order", true, TypeKind::ENTITY).AsCollection();
    REQUIRE(orders.FullName() == "Collection(Test.Order)");
    REQUIRE(orders.ToString() == "[Collection(Test.Order) Nullable=True]");
}

TEST_CASE("TypeReference classification", "[odata_type_reference]")
{
    SECTION("Families")
    {
        REQUIRE(TypeReference::Primitive("Edm.Int64").Family() == TypeFamily::NUMERIC);
        REQUIRE(TypeReference::Primitive("Edm.String").Family() == TypeFamily::STRING);
        REQUIRE(TypeReference::Primitive("Edm.Date").Family() == TypeFamily::TEMPORAL);
        REQUIRE(TypeReference::Primitive("Edm.Guid").Family() == TypeFamily::GUID);
        REQUIRE(TypeReference::Primitive("Edm.GeographyPolygon").Family() == TypeFamily::GEOGRAPHY);
        REQUIRE(TypeReference::Primitive("Edm.GeometryPoint").Family() == TypeFamily::GEOMETRY);
        REQUIRE(TypeReference("Test.Customer", false, TypeKind::ENTITY).Family() == TypeFamily::NONE);
        REQUIRE(TypeReference::Primitive("Edm.Int32").AsCollection().Family() == TypeFamily::NONE);
    }

    SECTION("Structured and boolean checks")
    {
        REQUIRE(TypeReference("Test.Address", true, TypeKind::COMPLEX).IsStructured());
        REQUIRE_FALSE(TypeReference("Test.Order", true, TypeKind::ENTITY).AsCollection().IsStructured());
        REQUIRE(TypeReference::Primitive("Edm.Boolean").IsBoolean());
        REQUIRE_FALSE(TypeReference::Primitive("Edm.Boolean").AsCollection().IsBoolean());
    }

    SECTION("Same type ignores nullability and SRID")
    {
        auto a = TypeReference::Geographic("Edm.GeographyPoint", true, 4326);
        auto b = TypeReference::Geographic("Edm.GeographyPoint", false, 0);
        REQUIRE(a.IsSameType(b));
        REQUIRE(a != b);
        REQUIRE(a == a.WithNullable(true));
    }
}

TEST_CASE("TypeReference assignability", "[odata_type_reference]")
{
    auto int32 = TypeReference::Primitive("Edm.Int32");
    auto int64 = TypeReference::Primitive("Edm.Int64");
    auto dbl = TypeReference::Primitive("Edm.Double");
    auto str = TypeReference::Primitive("Edm.String");

    REQUIRE(NumericRank("Edm.Byte") < NumericRank("Edm.Decimal"));
    REQUIRE(NumericRank("Edm.String") == -1);

    REQUIRE(IsAssignable(int32, int64));
    REQUIRE(IsAssignable(int32, dbl));
    REQUIRE_FALSE(IsAssignable(dbl, int32));
    REQUIRE_FALSE(IsAssignable(str, int32));
    REQUIRE(IsAssignable(TypeReference::Primitive("Edm.GeographyPoint"), TypeReference::Primitive("Edm.Geography")));
    REQUIRE_FALSE(IsAssignable(TypeReference::Primitive("Edm.GeometryPoint"), TypeReference::Primitive("Edm.Geography")));
}
