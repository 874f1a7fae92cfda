#pragma once

#include "odata_edm.hpp"
#include "odata_filter_nodes.hpp"
#include "odata_type_reference.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace odata_filter {

struct FunctionResolution {
    TypeReference return_type;
    std::optional<FunctionSignature> signature;
};

// Lookups the parser performs while building a filter tree. Implementations are
// read-only views over an already loaded model and throw UnknownIdentifierError,
// UnknownPropertyError or UnknownFunctionError when a lookup fails.
class SchemaResolver {
public:
    virtual ~SchemaResolver() = default;

    // The range variable bare property paths are rooted at
    virtual const RangeVariable& BoundRangeVariable() const = 0;

    virtual const RangeVariable& ResolveRangeVariable(const std::string& name) const = 0;
    virtual TypeReference ResolveProperty(const TypeReference& source_type, const std::string& property_name) const = 0;
    virtual FunctionResolution ResolveFunction(const std::string& name,
                                               const std::vector<TypeReference>& argument_types) const = 0;
};

// Index of the first overload whose parameters equal the argument types, otherwise of
// the first one whose parameters are assignable from them, in declaration order.
std::optional<size_t> SelectOverload(const std::vector<FunctionSignature>& overloads,
                                     const std::vector<TypeReference>& argument_types);

// The OData canonical functions usable inside $filter
class CanonicalFunctions {
public:
    static const std::vector<FunctionSignature>& Catalog();
    static std::vector<FunctionSignature> Overloads(const std::string& name);
    static bool IsCanonical(const std::string& name);
};

// Resolver over a CSDL model with $it bound to one entity set
class EdmSchemaResolver : public SchemaResolver {
public:
    EdmSchemaResolver(std::shared_ptr<const Edmx> edmx, const std::string& entity_set_name,
                      const std::string& range_variable_name = "$it");

    const RangeVariable& BoundRangeVariable() const override { return range_variable; }

    const RangeVariable& ResolveRangeVariable(const std::string& name) const override;
    TypeReference ResolveProperty(const TypeReference& source_type, const std::string& property_name) const override;
    FunctionResolution ResolveFunction(const std::string& name,
                                       const std::vector<TypeReference>& argument_types) const override;

    // Maps a CSDL type name ("Edm.Int32", "NS.Address", "Collection(NS.Order)") to a reference
    TypeReference ResolveTypeName(const std::string& type_name, bool nullable = true,
                                  std::optional<int> srid = std::nullopt) const;

    const Edmx& Model() const { return *edmx; }

private:
    const StructuredType* FindStructuredType(const std::string& type_name) const;
    std::vector<FunctionSignature> SchemaOverloads(const std::string& name) const;

    std::shared_ptr<const Edmx> edmx;
    RangeVariable range_variable;
};

} // namespace odata_filter
