#pragma once

#include "tinyxml2.h"

#include <optional>
#include <string>
#include <tuple>
#include <vector>

namespace odata_filter
{

// OData Version enum ---------------------------------------------------
enum class ODataVersion {
    UNKNOWN,
    V2,
    V4
};

// Primitive types --------------------------------------------------------
// True for the Edm.* names of the primitive type system, geo types included
bool IsPrimitiveTypeName(const std::string& type_name);

// Property class ---------------------------------------------------------
class Property
{
public:
    static Property FromXml(const tinyxml2::XMLElement& element);

public:
    std::string name;
    std::string type_name;
    bool nullable = true;
    // Unset when the document omits the facet or declares it "variable"
    std::optional<int> srid;
};

// NavigationProperty class -----------------------------------------------
class NavigationProperty
{
public:
    static NavigationProperty FromXml(const tinyxml2::XMLElement& element);

    // Collection(NS.Order) -> {true, "NS.Order"}
    std::tuple<bool, std::string> TargetType() const;

public:
    std::string name;
    // V4 declares the type directly; V2 documents get it from the association
    std::string type;
    bool nullable = true;

    // V2 only
    std::string relationship;
    std::string from_role;
    std::string to_role;
};

// StructuredType class ---------------------------------------------------
// Common shape of entity and complex types
class StructuredType
{
public:
    const Property* FindProperty(const std::string& property_name) const;
    const NavigationProperty* FindNavigationProperty(const std::string& property_name) const;

public:
    std::string name;
    std::string base_type;
    std::vector<Property> properties;
    std::vector<NavigationProperty> navigation_properties;

protected:
    void ParseMembers(const tinyxml2::XMLElement& element);
};

class ComplexType : public StructuredType
{
public:
    static ComplexType FromXml(const tinyxml2::XMLElement& element);
};

class EntityType : public StructuredType
{
public:
    static EntityType FromXml(const tinyxml2::XMLElement& element);
};

// Function class ---------------------------------------------------------
class FunctionParameter
{
public:
    static FunctionParameter FromXml(const tinyxml2::XMLElement& element);

public:
    std::string name;
    std::string type;
    bool nullable = true;
};

class Function
{
public:
    static Function FromXml(const tinyxml2::XMLElement& element);

public:
    std::string name;
    std::string return_type;
    std::vector<FunctionParameter> parameters;
};

// Association classes (V2) -----------------------------------------------
class AssociationEnd
{
public:
    std::string type;
    std::string multiplicity;
    std::string role;
};

class Association
{
public:
    static Association FromXml(const tinyxml2::XMLElement& element);

    const AssociationEnd* FindEnd(const std::string& role) const;

public:
    std::string name;
    std::vector<AssociationEnd> ends;
};

// EntitySet / EntityContainer classes -------------------------------------
class EntitySet
{
public:
    static EntitySet FromXml(const tinyxml2::XMLElement& element);

public:
    std::string name;
    std::string entity_type_name;
};

class EntityContainer
{
public:
    static EntityContainer FromXml(const tinyxml2::XMLElement& element);

public:
    std::string name;
    std::vector<EntitySet> entity_sets;
};

// Schema class ------------------------------------------------------------
class Schema
{
public:
    static Schema FromXml(const tinyxml2::XMLElement& element);

    bool MatchesNamespace(const std::string& ns_or_alias) const {
        return ns == ns_or_alias || (!alias.empty() && alias == ns_or_alias);
    }

public:
    std::string ns;
    std::string alias;
    std::vector<ComplexType> complex_types;
    std::vector<EntityType> entity_types;
    std::vector<Function> functions;
    std::vector<Association> associations;
    std::vector<EntityContainer> entity_containers;
};

// Edmx class --------------------------------------------------------------
class Edmx
{
public:
    // Detects V2 vs V4 from the Version attribute, then from the edmx namespace.
    // Throws std::runtime_error when the document is not well-formed XML.
    static Edmx FromXml(const std::string& xml);
    static Edmx FromXml(const tinyxml2::XMLDocument& doc);

    const EntityType* FindEntityType(const std::string& type_name) const;
    const ComplexType* FindComplexType(const std::string& type_name) const;
    const EntitySet* FindEntitySet(const std::string& entity_set_name) const;
    std::vector<const Function*> FindFunctions(const std::string& qualified_name) const;

    // Replaces a schema alias by its namespace; primitive and unqualified names are returned as is
    std::string QualifyTypeName(const std::string& type_name) const;

    ODataVersion GetVersion() const { return version_enum; }

public:
    std::string version = "4.0";
    std::vector<Schema> schemas;

private:
    static Edmx FromXml(const tinyxml2::XMLDocument& doc, ODataVersion version);
    static std::tuple<std::string, std::string> SplitNamespace(const std::string& type_name);
    void ResolveV2NavigationTypes();

    ODataVersion version_enum = ODataVersion::V4;
};

} // namespace odata_filter
