#include "odata_schema_resolver.hpp"
#include "odata_filter_errors.hpp"
#include "odata_filter_tracing.hpp"

#include <algorithm>
#include <sstream>

namespace odata_filter {

static const int DEFAULT_GEOGRAPHY_SRID = 4326;
static const int DEFAULT_GEOMETRY_SRID = 0;

static FunctionSignature Signature(const std::string& name, const std::string& return_type,
                                   std::initializer_list<const char*> parameter_types) {
    FunctionSignature signature;
    signature.name = name;
    signature.return_type = TypeReference::Primitive(return_type, true);
    for (const auto* parameter_type : parameter_types) {
        signature.parameter_types.push_back(TypeReference::Primitive(parameter_type, true));
    }
    return signature;
}

static std::string DescribeArguments(const std::vector<TypeReference>& argument_types) {
    std::ostringstream ss;
    for (size_t i = 0; i < argument_types.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << argument_types[i].FullName();
    }
    return ss.str();
}

static std::vector<std::string> ArgumentTypeNames(const std::vector<TypeReference>& argument_types) {
    std::vector<std::string> names;
    names.reserve(argument_types.size());
    for (const auto& type : argument_types) {
        names.push_back(type.FullName());
    }
    return names;
}

// ----------------------------------------------------------------------

std::optional<size_t> SelectOverload(const std::vector<FunctionSignature>& overloads,
                                     const std::vector<TypeReference>& argument_types) {
    auto matches = [&argument_types](const FunctionSignature& signature, bool exact) {
        if (signature.parameter_types.size() != argument_types.size()) {
            return false;
        }
        for (size_t i = 0; i < argument_types.size(); ++i) {
            const auto& parameter = signature.parameter_types[i];
            bool ok = exact ? argument_types[i].IsSameType(parameter) : IsAssignable(argument_types[i], parameter);
            if (!ok) {
                return false;
            }
        }
        return true;
    };

    for (size_t i = 0; i < overloads.size(); ++i) {
        if (matches(overloads[i], true)) {
            return i;
        }
    }
    for (size_t i = 0; i < overloads.size(); ++i) {
        if (matches(overloads[i], false)) {
            return i;
        }
    }
    return std::nullopt;
}

// ----------------------------------------------------------------------

const std::vector<FunctionSignature>& CanonicalFunctions::Catalog() {
    static const std::vector<FunctionSignature> catalog = {
        // Geospatial
        Signature("geo.distance", "Edm.Double", {"Edm.GeographyPoint", "Edm.GeographyPoint"}),
        Signature("geo.distance", "Edm.Double", {"Edm.GeometryPoint", "Edm.GeometryPoint"}),
        Signature("geo.length", "Edm.Double", {"Edm.GeographyLineString"}),
        Signature("geo.length", "Edm.Double", {"Edm.GeometryLineString"}),
        Signature("geo.intersects", "Edm.Boolean", {"Edm.GeographyPoint", "Edm.GeographyPolygon"}),
        Signature("geo.intersects", "Edm.Boolean", {"Edm.GeometryPoint", "Edm.GeometryPolygon"}),

        // String
        Signature("contains", "Edm.Boolean", {"Edm.String", "Edm.String"}),
        Signature("startswith", "Edm.Boolean", {"Edm.String", "Edm.String"}),
        Signature("endswith", "Edm.Boolean", {"Edm.String", "Edm.String"}),
        Signature("length", "Edm.Int32", {"Edm.String"}),
        Signature("indexof", "Edm.Int32", {"Edm.String", "Edm.String"}),
        Signature("substring", "Edm.String", {"Edm.String", "Edm.Int32"}),
        Signature("substring", "Edm.String", {"Edm.String", "Edm.Int32", "Edm.Int32"}),
        Signature("tolower", "Edm.String", {"Edm.String"}),
        Signature("toupper", "Edm.String", {"Edm.String"}),
        Signature("trim", "Edm.String", {"Edm.String"}),
        Signature("concat", "Edm.String", {"Edm.String", "Edm.String"}),

        // Date and time
        Signature("year", "Edm.Int32", {"Edm.Date"}),
        Signature("year", "Edm.Int32", {"Edm.DateTimeOffset"}),
        Signature("year", "Edm.Int32", {"Edm.DateTime"}),
        Signature("month", "Edm.Int32", {"Edm.Date"}),
        Signature("month", "Edm.Int32", {"Edm.DateTimeOffset"}),
        Signature("month", "Edm.Int32", {"Edm.DateTime"}),
        Signature("day", "Edm.Int32", {"Edm.Date"}),
        Signature("day", "Edm.Int32", {"Edm.DateTimeOffset"}),
        Signature("day", "Edm.Int32", {"Edm.DateTime"}),
        Signature("hour", "Edm.Int32", {"Edm.DateTimeOffset"}),
        Signature("hour", "Edm.Int32", {"Edm.TimeOfDay"}),
        Signature("hour", "Edm.Int32", {"Edm.DateTime"}),
        Signature("minute", "Edm.Int32", {"Edm.DateTimeOffset"}),
        Signature("minute", "Edm.Int32", {"Edm.TimeOfDay"}),
        Signature("minute", "Edm.Int32", {"Edm.DateTime"}),
        Signature("second", "Edm.Int32", {"Edm.DateTimeOffset"}),
        Signature("second", "Edm.Int32", {"Edm.TimeOfDay"}),
        Signature("second", "Edm.Int32", {"Edm.DateTime"}),

        // Arithmetic
        Signature("round", "Edm.Double", {"Edm.Double"}),
        Signature("round", "Edm.Decimal", {"Edm.Decimal"}),
        Signature("floor", "Edm.Double", {"Edm.Double"}),
        Signature("floor", "Edm.Decimal", {"Edm.Decimal"}),
        Signature("ceiling", "Edm.Double", {"Edm.Double"}),
        Signature("ceiling", "Edm.Decimal", {"Edm.Decimal"}),
    };
    return catalog;
}

std::vector<FunctionSignature> CanonicalFunctions::Overloads(const std::string& name) {
    std::vector<FunctionSignature> overloads;
    for (const auto& signature : Catalog()) {
        if (signature.name == name) {
            overloads.push_back(signature);
        }
    }
    return overloads;
}

bool CanonicalFunctions::IsCanonical(const std::string& name) {
    const auto& catalog = Catalog();
    return std::any_of(catalog.begin(), catalog.end(),
                       [&name](const FunctionSignature& signature) { return signature.name == name; });
}

// ----------------------------------------------------------------------

EdmSchemaResolver::EdmSchemaResolver(std::shared_ptr<const Edmx> edmx, const std::string& entity_set_name,
                                     const std::string& range_variable_name)
    : edmx(std::move(edmx))
{
    const EntitySet* entity_set = this->edmx->FindEntitySet(entity_set_name);
    if (entity_set == nullptr) {
        throw UnknownIdentifierError(entity_set_name);
    }

    range_variable.name = range_variable_name;
    range_variable.navigation_source = entity_set->name;
    range_variable.type = TypeReference(this->edmx->QualifyTypeName(entity_set->entity_type_name), false, TypeKind::ENTITY);

    if (FindStructuredType(entity_set->entity_type_name) == nullptr) {
        throw UnknownIdentifierError(entity_set->entity_type_name);
    }

    ODATA_FILTER_TRACE_DEBUG("RESOLVER", "Bound " + range_variable.name + " to entity set " + entity_set->name +
                             " of type " + range_variable.type.name);
}

const RangeVariable& EdmSchemaResolver::ResolveRangeVariable(const std::string& name) const {
    ODATA_FILTER_TRACE_TRACE("RESOLVER", "Resolving range variable " + name);
    if (name != range_variable.name) {
        throw UnknownIdentifierError(name);
    }
    return range_variable;
}

TypeReference EdmSchemaResolver::ResolveProperty(const TypeReference& source_type, const std::string& property_name) const {
    ODATA_FILTER_TRACE_TRACE("RESOLVER", "Resolving property " + property_name + " on " + source_type.FullName());

    if (!source_type.IsStructured()) {
        throw UnknownPropertyError(property_name, source_type.FullName());
    }

    // Walk the base type chain; the depth guard stops cyclic BaseType declarations
    const StructuredType* current = FindStructuredType(source_type.name);
    for (size_t depth = 0; current != nullptr && depth < 32; ++depth) {
        if (const Property* property = current->FindProperty(property_name)) {
            return ResolveTypeName(property->type_name, property->nullable, property->srid);
        }
        if (const NavigationProperty* nav_prop = current->FindNavigationProperty(property_name)) {
            auto [is_collection, target_type] = nav_prop->TargetType();
            auto target = ResolveTypeName(target_type, nav_prop->nullable);
            return is_collection ? target.AsCollection() : target;
        }
        if (current->base_type.empty()) {
            break;
        }
        current = FindStructuredType(current->base_type);
    }

    throw UnknownPropertyError(property_name, source_type.FullName());
}

FunctionResolution EdmSchemaResolver::ResolveFunction(const std::string& name,
                                                      const std::vector<TypeReference>& argument_types) const {
    ODATA_FILTER_TRACE_TRACE("RESOLVER", "Resolving function " + name + "(" + DescribeArguments(argument_types) + ")");

    auto overloads = CanonicalFunctions::Overloads(name);
    auto schema_overloads = SchemaOverloads(name);
    overloads.insert(overloads.end(), schema_overloads.begin(), schema_overloads.end());

    auto selected = SelectOverload(overloads, argument_types);
    if (!selected.has_value()) {
        throw UnknownFunctionError(name, ArgumentTypeNames(argument_types));
    }

    const auto& signature = overloads[selected.value()];
    return FunctionResolution{signature.return_type, signature};
}

TypeReference EdmSchemaResolver::ResolveTypeName(const std::string& type_name, bool nullable,
                                                 std::optional<int> srid) const {
    static const std::string collection_prefix = "Collection(";
    if (type_name.rfind(collection_prefix, 0) == 0 && type_name.back() == ')') {
        auto element_name = type_name.substr(collection_prefix.size(), type_name.size() - collection_prefix.size() - 1);
        return ResolveTypeName(element_name, nullable, srid).AsCollection();
    }

    if (IsPrimitiveTypeName(type_name)) {
        auto family = FamilyOfPrimitive(type_name);
        if (family == TypeFamily::GEOGRAPHY) {
            return TypeReference::Geographic(type_name, nullable, srid.value_or(DEFAULT_GEOGRAPHY_SRID));
        }
        if (family == TypeFamily::GEOMETRY) {
            return TypeReference::Geographic(type_name, nullable, srid.value_or(DEFAULT_GEOMETRY_SRID));
        }
        return TypeReference::Primitive(type_name, nullable);
    }

    auto qualified = edmx->QualifyTypeName(type_name);
    if (edmx->FindEntityType(type_name) != nullptr) {
        return TypeReference(qualified, nullable, TypeKind::ENTITY);
    }
    if (edmx->FindComplexType(type_name) != nullptr) {
        return TypeReference(qualified, nullable, TypeKind::COMPLEX);
    }

    // Enum types and type definitions are carried by name; they belong to no comparable family
    ODATA_FILTER_TRACE_DEBUG("RESOLVER", "Type " + type_name + " is neither primitive nor structured");
    return TypeReference::Primitive(qualified, nullable);
}

const StructuredType* EdmSchemaResolver::FindStructuredType(const std::string& type_name) const {
    if (const EntityType* entity_type = edmx->FindEntityType(type_name)) {
        return entity_type;
    }
    return edmx->FindComplexType(type_name);
}

std::vector<FunctionSignature> EdmSchemaResolver::SchemaOverloads(const std::string& name) const {
    std::vector<FunctionSignature> overloads;
    for (const Function* function : edmx->FindFunctions(name)) {
        FunctionSignature signature;
        signature.name = name;
        signature.return_type = ResolveTypeName(function->return_type, true);
        for (const auto& parameter : function->parameters) {
            signature.parameter_types.push_back(ResolveTypeName(parameter.type, parameter.nullable));
        }
        overloads.push_back(signature);
    }
    return overloads;
}

} // namespace odata_filter
