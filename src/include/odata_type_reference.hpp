#pragma once

#include <optional>
#include <string>

namespace odata_filter {

enum class TypeKind {
    PRIMITIVE,
    COMPLEX,
    ENTITY
};

// Groups of primitive types whose values can be compared with each other
enum class TypeFamily {
    NONE,
    NUMERIC,
    STRING,
    BOOLEAN,
    TEMPORAL,
    GUID,
    GEOGRAPHY,
    GEOMETRY
};

class TypeReference {
public:
    TypeReference() = default;
    TypeReference(std::string name, bool nullable, TypeKind kind = TypeKind::PRIMITIVE);

    static TypeReference Primitive(const std::string& name, bool nullable = true);
    static TypeReference Geographic(const std::string& name, bool nullable, std::optional<int> srid);

    bool operator==(const TypeReference& other) const;
    bool operator!=(const TypeReference& other) const { return !(*this == other); }

    // Same type ignoring nullability and facets
    bool IsSameType(const TypeReference& other) const;

    bool IsPrimitive() const { return kind == TypeKind::PRIMITIVE && !collection; }
    bool IsStructured() const { return (kind == TypeKind::COMPLEX || kind == TypeKind::ENTITY) && !collection; }
    bool IsBoolean() const;
    TypeFamily Family() const;

    TypeReference AsCollection() const;
    TypeReference WithNullable(bool nullable) const;

    // "[Edm.GeographyPoint Nullable=True SRID=4326]"
    std::string ToString() const;
    // "Edm.GeographyPoint", "Collection(NS.Order)"
    std::string FullName() const;

public:
    std::string name;
    bool nullable = true;
    TypeKind kind = TypeKind::PRIMITIVE;
    bool collection = false;
    std::optional<int> srid;
};

TypeFamily FamilyOfPrimitive(const std::string& primitive_name);
std::string TypeKindToString(TypeKind kind);

// Position of a numeric type in the promotion order, or -1 for non-numeric types
int NumericRank(const std::string& primitive_name);

// True when a value of type `from` can be passed where `to` is declared without crossing families
bool IsAssignable(const TypeReference& from, const TypeReference& to);

} // namespace odata_filter
