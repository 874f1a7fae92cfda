#include "odata_type_reference.hpp"

#include <array>
#include <sstream>
#include <utility>

namespace odata_filter {

static const std::array<const char*, 8> NUMERIC_PROMOTION_ORDER = {
    "Edm.Byte", "Edm.SByte", "Edm.Int16", "Edm.Int32", "Edm.Int64", "Edm.Single", "Edm.Double", "Edm.Decimal"
};

static const std::array<const char*, 5> TEMPORAL_TYPES = {
    "Edm.Date", "Edm.DateTime", "Edm.DateTimeOffset", "Edm.TimeOfDay", "Edm.Duration"
};

static bool StartsWith(const std::string& value, const std::string& prefix) {
    return value.rfind(prefix, 0) == 0;
}

TypeReference::TypeReference(std::string name, bool nullable, TypeKind kind)
    : name(std::move(name)), nullable(nullable), kind(kind)
{}

TypeReference TypeReference::Primitive(const std::string& name, bool nullable) {
    return TypeReference(name, nullable, TypeKind::PRIMITIVE);
}

TypeReference TypeReference::Geographic(const std::string& name, bool nullable, std::optional<int> srid) {
    TypeReference type(name, nullable, TypeKind::PRIMITIVE);
    type.srid = srid;
    return type;
}

bool TypeReference::operator==(const TypeReference& other) const {
    return name == other.name && nullable == other.nullable && kind == other.kind &&
           collection == other.collection && srid == other.srid;
}

bool TypeReference::IsSameType(const TypeReference& other) const {
    return name == other.name && kind == other.kind && collection == other.collection;
}

bool TypeReference::IsBoolean() const {
    return IsPrimitive() && name == "Edm.Boolean";
}

TypeFamily TypeReference::Family() const {
    if (!IsPrimitive()) {
        return TypeFamily::NONE;
    }
    return FamilyOfPrimitive(name);
}

TypeReference TypeReference::AsCollection() const {
    TypeReference copy = *this;
    copy.collection = true;
    return copy;
}

TypeReference TypeReference::WithNullable(bool nullable) const {
    TypeReference copy = *this;
    copy.nullable = nullable;
    return copy;
}

std::string TypeReference::FullName() const {
    return collection ? "Collection(" + name + ")" : name;
}

std::string TypeReference::ToString() const {
    std::ostringstream ss;
    ss << "[" << FullName() << " Nullable=" << (nullable ? "True" : "False");
    if (srid.has_value()) {
        ss << " SRID=" << srid.value();
    }
    ss << "]";
    return ss.str();
}

TypeFamily FamilyOfPrimitive(const std::string& primitive_name) {
    if (NumericRank(primitive_name) >= 0) {
        return TypeFamily::NUMERIC;
    }
    if (primitive_name == "Edm.String") {
        return TypeFamily::STRING;
    }
    if (primitive_name == "Edm.Boolean") {
        return TypeFamily::BOOLEAN;
    }
    if (primitive_name == "Edm.Guid") {
        return TypeFamily::GUID;
    }
    for (const auto* temporal : TEMPORAL_TYPES) {
        if (primitive_name == temporal) {
            return TypeFamily::TEMPORAL;
        }
    }
    if (StartsWith(primitive_name, "Edm.Geography")) {
        return TypeFamily::GEOGRAPHY;
    }
    if (StartsWith(primitive_name, "Edm.Geometry")) {
        return TypeFamily::GEOMETRY;
    }
    return TypeFamily::NONE;
}

std::string TypeKindToString(TypeKind kind) {
    switch (kind) {
        case TypeKind::PRIMITIVE: return "Primitive";
        case TypeKind::COMPLEX: return "Complex";
        case TypeKind::ENTITY: return "Entity";
        default: return "Unknown";
    }
}

int NumericRank(const std::string& primitive_name) {
    for (size_t i = 0; i < NUMERIC_PROMOTION_ORDER.size(); ++i) {
        if (primitive_name == NUMERIC_PROMOTION_ORDER[i]) {
            return static_cast<int>(i);
        }
    }
    return -1;
}

bool IsAssignable(const TypeReference& from, const TypeReference& to) {
    if (from.IsSameType(to)) {
        return true;
    }
    if (!from.IsPrimitive() || !to.IsPrimitive()) {
        return false;
    }

    auto from_family = from.Family();
    if (from_family != to.Family()) {
        return false;
    }

    switch (from_family) {
        case TypeFamily::NUMERIC:
            return NumericRank(from.name) <= NumericRank(to.name);
        case TypeFamily::GEOGRAPHY:
            return to.name == "Edm.Geography";
        case TypeFamily::GEOMETRY:
            return to.name == "Edm.Geometry";
        default:
            return false;
    }
}

} // namespace odata_filter
