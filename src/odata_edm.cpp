#include "odata_edm.hpp"
#include "odata_filter_tracing.hpp"

#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>

namespace odata_filter {

static const char* PRIMITIVE_TYPES[] = {
    "Edm.Binary",
    "Edm.Boolean",
    "Edm.Byte",
    "Edm.Date",
    "Edm.DateTime",
    "Edm.DateTimeOffset",
    "Edm.Decimal",
    "Edm.Double",
    "Edm.Duration",
    "Edm.Guid",
    "Edm.Int16",
    "Edm.Int32",
    "Edm.Int64",
    "Edm.SByte",
    "Edm.Single",
    "Edm.Stream",
    "Edm.String",
    "Edm.TimeOfDay",
    "Edm.Geography",
    "Edm.GeographyPoint",
    "Edm.GeographyLineString",
    "Edm.GeographyPolygon",
    "Edm.GeographyMultiPoint",
    "Edm.GeographyMultiLineString",
    "Edm.GeographyMultiPolygon",
    "Edm.GeographyCollection",
    "Edm.Geometry",
    "Edm.GeometryPoint",
    "Edm.GeometryLineString",
    "Edm.GeometryPolygon",
    "Edm.GeometryMultiPoint",
    "Edm.GeometryMultiLineString",
    "Edm.GeometryMultiPolygon",
    "Edm.GeometryCollection"
};

static std::string AttributeOrEmpty(const tinyxml2::XMLElement& element, const char* name) {
    const char* value = element.Attribute(name);
    return value ? std::string(value) : std::string();
}

static bool BoolAttribute(const tinyxml2::XMLElement& element, const char* name, bool default_value) {
    const char* value = element.Attribute(name);
    if (!value) {
        return default_value;
    }
    return std::string(value) == "true";
}

static std::optional<int> IntAttribute(const tinyxml2::XMLElement& element, const char* name) {
    const char* value = element.Attribute(name);
    if (!value || std::strlen(value) == 0) {
        return std::nullopt;
    }
    try {
        return std::stoi(value);
    } catch (const std::exception&) {
        // "max", "variable" and other symbolic facet values
        return std::nullopt;
    }
}

// Local name of an element, without any "edmx:" style prefix
static std::string LocalName(const tinyxml2::XMLElement& element) {
    std::string name = element.Name();
    auto colon = name.find(':');
    return colon == std::string::npos ? name : name.substr(colon + 1);
}

static const tinyxml2::XMLElement* FirstChildByLocalName(const tinyxml2::XMLElement& parent, const std::string& local_name) {
    for (const tinyxml2::XMLElement* child = parent.FirstChildElement(); child != nullptr; child = child->NextSiblingElement()) {
        if (LocalName(*child) == local_name) {
            return child;
        }
    }
    return nullptr;
}

// Primitive types -----------------------------------------------------------

bool IsPrimitiveTypeName(const std::string& type_name) {
    return std::find(std::begin(PRIMITIVE_TYPES), std::end(PRIMITIVE_TYPES), type_name) != std::end(PRIMITIVE_TYPES);
}

// Property ----------------------------------------------------------------

Property Property::FromXml(const tinyxml2::XMLElement& element) {
    Property property;
    property.name = AttributeOrEmpty(element, "Name");
    property.type_name = AttributeOrEmpty(element, "Type");
    property.nullable = BoolAttribute(element, "Nullable", true);
    property.srid = IntAttribute(element, "SRID");
    return property;
}

// NavigationProperty -------------------------------------------------------

NavigationProperty NavigationProperty::FromXml(const tinyxml2::XMLElement& element) {
    NavigationProperty nav_prop;
    nav_prop.name = AttributeOrEmpty(element, "Name");
    nav_prop.type = AttributeOrEmpty(element, "Type");
    nav_prop.nullable = BoolAttribute(element, "Nullable", true);
    nav_prop.relationship = AttributeOrEmpty(element, "Relationship");
    nav_prop.from_role = AttributeOrEmpty(element, "FromRole");
    nav_prop.to_role = AttributeOrEmpty(element, "ToRole");
    return nav_prop;
}

std::tuple<bool, std::string> NavigationProperty::TargetType() const {
    static const std::string prefix = "Collection(";
    if (type.rfind(prefix, 0) == 0 && !type.empty() && type.back() == ')') {
        return std::make_tuple(true, type.substr(prefix.size(), type.size() - prefix.size() - 1));
    }
    return std::make_tuple(false, type);
}

// StructuredType -----------------------------------------------------------

const Property* StructuredType::FindProperty(const std::string& property_name) const {
    for (const auto& property : properties) {
        if (property.name == property_name) {
            return &property;
        }
    }
    return nullptr;
}

const NavigationProperty* StructuredType::FindNavigationProperty(const std::string& property_name) const {
    for (const auto& nav_prop : navigation_properties) {
        if (nav_prop.name == property_name) {
            return &nav_prop;
        }
    }
    return nullptr;
}

void StructuredType::ParseMembers(const tinyxml2::XMLElement& element) {
    name = AttributeOrEmpty(element, "Name");
    base_type = AttributeOrEmpty(element, "BaseType");

    for (const tinyxml2::XMLElement* prop_el = element.FirstChildElement("Property");
        prop_el != nullptr;
        prop_el = prop_el->NextSiblingElement("Property"))
    {
        properties.push_back(Property::FromXml(*prop_el));
    }

    for (const tinyxml2::XMLElement* nav_prop_el = element.FirstChildElement("NavigationProperty");
        nav_prop_el != nullptr;
        nav_prop_el = nav_prop_el->NextSiblingElement("NavigationProperty"))
    {
        navigation_properties.push_back(NavigationProperty::FromXml(*nav_prop_el));
    }
}

ComplexType ComplexType::FromXml(const tinyxml2::XMLElement& element) {
    ComplexType complex_type;
    complex_type.ParseMembers(element);
    return complex_type;
}

EntityType EntityType::FromXml(const tinyxml2::XMLElement& element) {
    EntityType entity_type;
    entity_type.ParseMembers(element);
    return entity_type;
}

// Function -----------------------------------------------------------------

FunctionParameter FunctionParameter::FromXml(const tinyxml2::XMLElement& element) {
    FunctionParameter parameter;
    parameter.name = AttributeOrEmpty(element, "Name");
    parameter.type = AttributeOrEmpty(element, "Type");
    parameter.nullable = BoolAttribute(element, "Nullable", true);
    return parameter;
}

Function Function::FromXml(const tinyxml2::XMLElement& element) {
    Function function;
    function.name = AttributeOrEmpty(element, "Name");

    for (const tinyxml2::XMLElement* param_el = element.FirstChildElement("Parameter");
        param_el != nullptr;
        param_el = param_el->NextSiblingElement("Parameter"))
    {
        function.parameters.push_back(FunctionParameter::FromXml(*param_el));
    }

    const tinyxml2::XMLElement* return_el = element.FirstChildElement("ReturnType");
    if (return_el) {
        function.return_type = AttributeOrEmpty(*return_el, "Type");
    }
    return function;
}

// Association ----------------------------------------------------------------

Association Association::FromXml(const tinyxml2::XMLElement& element) {
    Association association;
    association.name = AttributeOrEmpty(element, "Name");

    for (const tinyxml2::XMLElement* end_el = element.FirstChildElement("End");
        end_el != nullptr;
        end_el = end_el->NextSiblingElement("End"))
    {
        AssociationEnd end;
        end.type = AttributeOrEmpty(*end_el, "Type");
        end.multiplicity = AttributeOrEmpty(*end_el, "Multiplicity");
        end.role = AttributeOrEmpty(*end_el, "Role");
        association.ends.push_back(end);
    }
    return association;
}

const AssociationEnd* Association::FindEnd(const std::string& role) const {
    for (const auto& end : ends) {
        if (end.role == role) {
            return &end;
        }
    }
    return nullptr;
}

// EntitySet / EntityContainer ------------------------------------------------

EntitySet EntitySet::FromXml(const tinyxml2::XMLElement& element) {
    EntitySet entity_set;
    entity_set.name = AttributeOrEmpty(element, "Name");
    entity_set.entity_type_name = AttributeOrEmpty(element, "EntityType");
    return entity_set;
}

EntityContainer EntityContainer::FromXml(const tinyxml2::XMLElement& element) {
    EntityContainer container;
    container.name = AttributeOrEmpty(element, "Name");

    for (const tinyxml2::XMLElement* set_el = element.FirstChildElement("EntitySet");
        set_el != nullptr;
        set_el = set_el->NextSiblingElement("EntitySet"))
    {
        container.entity_sets.push_back(EntitySet::FromXml(*set_el));
    }
    return container;
}

// Schema -----------------------------------------------------------------------

Schema Schema::FromXml(const tinyxml2::XMLElement& element) {
    Schema schema;
    schema.ns = AttributeOrEmpty(element, "Namespace");
    schema.alias = AttributeOrEmpty(element, "Alias");

    for (const tinyxml2::XMLElement* complex_el = element.FirstChildElement("ComplexType");
        complex_el != nullptr;
        complex_el = complex_el->NextSiblingElement("ComplexType"))
    {
        schema.complex_types.push_back(ComplexType::FromXml(*complex_el));
    }

    for (const tinyxml2::XMLElement* entity_el = element.FirstChildElement("EntityType");
        entity_el != nullptr;
        entity_el = entity_el->NextSiblingElement("EntityType"))
    {
        schema.entity_types.push_back(EntityType::FromXml(*entity_el));
    }

    for (const tinyxml2::XMLElement* function_el = element.FirstChildElement("Function");
        function_el != nullptr;
        function_el = function_el->NextSiblingElement("Function"))
    {
        schema.functions.push_back(Function::FromXml(*function_el));
    }

    for (const tinyxml2::XMLElement* association_el = element.FirstChildElement("Association");
        association_el != nullptr;
        association_el = association_el->NextSiblingElement("Association"))
    {
        schema.associations.push_back(Association::FromXml(*association_el));
    }

    for (const tinyxml2::XMLElement* container_el = element.FirstChildElement("EntityContainer");
        container_el != nullptr;
        container_el = container_el->NextSiblingElement("EntityContainer"))
    {
        schema.entity_containers.push_back(EntityContainer::FromXml(*container_el));
    }

    return schema;
}

// Edmx -------------------------------------------------------------------------

Edmx Edmx::FromXml(const std::string& xml) {
    tinyxml2::XMLDocument doc;
    tinyxml2::XMLError result = doc.Parse(xml.c_str(), xml.size());
    if (result != tinyxml2::XML_SUCCESS) {
        std::stringstream ss;
        ss << "Failed to parse XML [" << tinyxml2::XMLDocument::ErrorIDToName(result) << "]" << std::endl;
        ss << "Description: " << doc.ErrorStr() << std::endl;
        ODATA_FILTER_TRACE_ERROR_DATA("EDM", "Metadata document is not well-formed", ss.str());
        throw std::runtime_error(ss.str());
    }
    return FromXml(doc);
}

Edmx Edmx::FromXml(const tinyxml2::XMLDocument& doc) {
    const tinyxml2::XMLElement* edmx_el = doc.RootElement();
    if (edmx_el == nullptr) {
        throw std::runtime_error("Missing Edmx root element");
    }

    const char* version_attr = edmx_el->Attribute("Version");
    if (version_attr) {
        std::string version_str(version_attr);
        if (version_str == "1.0" || version_str == "2.0") {
            return FromXml(doc, ODataVersion::V2);
        } else if (version_str == "4.0") {
            return FromXml(doc, ODataVersion::V4);
        }
    }

    const char* xmlns_attr = edmx_el->Attribute("xmlns:edmx");
    if (xmlns_attr && std::string(xmlns_attr).find("schemas.microsoft.com/ado") != std::string::npos) {
        return FromXml(doc, ODataVersion::V2);
    }
    return FromXml(doc, ODataVersion::V4);
}

Edmx Edmx::FromXml(const tinyxml2::XMLDocument& doc, ODataVersion version) {
    Edmx edmx;
    edmx.version_enum = version;

    const tinyxml2::XMLElement* edmx_el = doc.RootElement();
    if (edmx_el == nullptr || LocalName(*edmx_el) != "Edmx") {
        throw std::runtime_error("Missing Edmx root element");
    }

    const char* version_attr = edmx_el->Attribute("Version");
    if (version_attr) {
        edmx.version = version_attr;
    }

    const tinyxml2::XMLElement* data_svc_el = FirstChildByLocalName(*edmx_el, "DataServices");
    if (data_svc_el) {
        for (const tinyxml2::XMLElement* schema_el = data_svc_el->FirstChildElement("Schema");
            schema_el != nullptr;
            schema_el = schema_el->NextSiblingElement("Schema"))
        {
            edmx.schemas.push_back(Schema::FromXml(*schema_el));
        }
    }

    if (version == ODataVersion::V2) {
        edmx.ResolveV2NavigationTypes();
    }

    ODATA_FILTER_TRACE_DEBUG("EDM", "Loaded metadata with " + std::to_string(edmx.schemas.size()) +
                             " schema(s), version " + edmx.version);
    return edmx;
}

// V2 navigation properties name an association role instead of a type
void Edmx::ResolveV2NavigationTypes() {
    for (auto& schema : schemas) {
        for (auto& entity_type : schema.entity_types) {
            for (auto& nav_prop : entity_type.navigation_properties) {
                if (!nav_prop.type.empty() || nav_prop.relationship.empty()) {
                    continue;
                }

                auto [assoc_ns, assoc_name] = SplitNamespace(nav_prop.relationship);
                const Association* association = nullptr;
                for (const auto& candidate_schema : schemas) {
                    if (!assoc_ns.empty() && !candidate_schema.MatchesNamespace(assoc_ns)) {
                        continue;
                    }
                    for (const auto& candidate : candidate_schema.associations) {
                        if (candidate.name == assoc_name) {
                            association = &candidate;
                            break;
                        }
                    }
                    if (association) {
                        break;
                    }
                }
                if (!association) {
                    ODATA_FILTER_TRACE_WARN("EDM", "Unresolved association '" + nav_prop.relationship +
                                            "' for navigation property " + entity_type.name + "/" + nav_prop.name);
                    continue;
                }

                const AssociationEnd* end = association->FindEnd(nav_prop.to_role);
                if (!end) {
                    continue;
                }
                nav_prop.type = end->multiplicity == "*" ? "Collection(" + end->type + ")" : end->type;
                nav_prop.nullable = end->multiplicity != "1";
            }
        }
    }
}

std::tuple<std::string, std::string> Edmx::SplitNamespace(const std::string& type_name) {
    size_t pos = type_name.rfind('.');
    if (pos == std::string::npos) {
        return std::make_tuple("", type_name);
    }
    return std::make_tuple(type_name.substr(0, pos), type_name.substr(pos + 1));
}

std::string Edmx::QualifyTypeName(const std::string& type_name) const {
    auto [ns, local_name] = SplitNamespace(type_name);
    if (ns.empty() || ns == "Edm") {
        return type_name;
    }
    for (const auto& schema : schemas) {
        if (schema.MatchesNamespace(ns)) {
            return schema.ns + "." + local_name;
        }
    }
    return type_name;
}

const EntityType* Edmx::FindEntityType(const std::string& type_name) const {
    auto [ns, local_name] = SplitNamespace(type_name);
    for (const auto& schema : schemas) {
        // V2 documents frequently reference types without their namespace
        if (!ns.empty() && !schema.MatchesNamespace(ns)) {
            continue;
        }
        for (const auto& entity_type : schema.entity_types) {
            if (entity_type.name == local_name) {
                return &entity_type;
            }
        }
    }
    return nullptr;
}

const ComplexType* Edmx::FindComplexType(const std::string& type_name) const {
    auto [ns, local_name] = SplitNamespace(type_name);
    for (const auto& schema : schemas) {
        if (!ns.empty() && !schema.MatchesNamespace(ns)) {
            continue;
        }
        for (const auto& complex_type : schema.complex_types) {
            if (complex_type.name == local_name) {
                return &complex_type;
            }
        }
    }
    return nullptr;
}

const EntitySet* Edmx::FindEntitySet(const std::string& entity_set_name) const {
    for (const auto& schema : schemas) {
        for (const auto& container : schema.entity_containers) {
            for (const auto& entity_set : container.entity_sets) {
                if (entity_set.name == entity_set_name) {
                    return &entity_set;
                }
            }
        }
    }
    return nullptr;
}

std::vector<const Function*> Edmx::FindFunctions(const std::string& qualified_name) const {
    std::vector<const Function*> overloads;
    auto [ns, local_name] = SplitNamespace(qualified_name);
    if (ns.empty()) {
        return overloads;
    }
    for (const auto& schema : schemas) {
        if (!schema.MatchesNamespace(ns)) {
            continue;
        }
        for (const auto& function : schema.functions) {
            if (function.name == local_name) {
                overloads.push_back(&function);
            }
        }
    }
    return overloads;
}

} // namespace odata_filter
