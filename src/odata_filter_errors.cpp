#include "odata_filter_errors.hpp"

#include <sstream>

namespace odata_filter {

std::string ErrorKindToString(ODataFilterErrorKind kind) {
    switch (kind) {
        case ODataFilterErrorKind::LEX_ERROR: return "LexError";
        case ODataFilterErrorKind::SYNTAX_ERROR: return "SyntaxError";
        case ODataFilterErrorKind::UNKNOWN_IDENTIFIER: return "UnknownIdentifier";
        case ODataFilterErrorKind::UNKNOWN_PROPERTY: return "UnknownProperty";
        case ODataFilterErrorKind::UNKNOWN_FUNCTION: return "UnknownFunction";
        case ODataFilterErrorKind::TYPE_MISMATCH: return "TypeMismatch";
        default: return "Unknown";
    }
}

// ----------------------------------------------------------------------

ODataFilterException::ODataFilterException(ODataFilterErrorKind kind, const std::string& message,
                                           size_t offset, ErrorContext context)
    : std::runtime_error(message), kind(kind), message(message), offset(offset), context(std::move(context))
{
    Rebuild();
}

void ODataFilterException::SetOffset(size_t offset) {
    this->offset = offset;
    Rebuild();
}

void ODataFilterException::Rebuild() {
    ErrorContext full = context;
    if (HasOffset()) {
        full.Set("offset", std::to_string(offset));
    }
    formatted = ErrorKindToString(kind) + ": " + full.Format(message);
}

// ----------------------------------------------------------------------

LexError::LexError(const std::string& message, size_t offset)
    : ODataFilterException(ODataFilterErrorKind::LEX_ERROR, message, offset)
{}

static std::string DescribeFound(const std::string& found) {
    return found.empty() ? "end of input" : "'" + found + "'";
}

SyntaxError::SyntaxError(const std::string& expected, const std::string& found, size_t offset)
    : SyntaxError("Expected " + expected + " but found " + DescribeFound(found), expected, found, offset)
{}

SyntaxError::SyntaxError(const std::string& message, const std::string& expected, const std::string& found, size_t offset)
    : ODataFilterException(ODataFilterErrorKind::SYNTAX_ERROR, message, offset,
                           ErrorContext().Set("expected", expected)),
      expected(expected), found(found)
{}

UnknownIdentifierError::UnknownIdentifierError(const std::string& name, size_t offset)
    : ODataFilterException(ODataFilterErrorKind::UNKNOWN_IDENTIFIER,
                           "Identifier '" + name + "' is not bound in the current scope", offset,
                           ErrorContext().Set("name", name)),
      name(name)
{}

UnknownPropertyError::UnknownPropertyError(const std::string& property_name, const std::string& source_type, size_t offset)
    : ODataFilterException(ODataFilterErrorKind::UNKNOWN_PROPERTY,
                           "Type '" + source_type + "' has no property '" + property_name + "'", offset,
                           ErrorContext().Set("property", property_name).Set("type", source_type)),
      property_name(property_name), source_type(source_type)
{}

static std::string JoinTypes(const std::vector<std::string>& types) {
    std::ostringstream ss;
    for (size_t i = 0; i < types.size(); ++i) {
        if (i > 0) {
            ss << ", ";
        }
        ss << types[i];
    }
    return ss.str();
}

UnknownFunctionError::UnknownFunctionError(const std::string& function_name, const std::vector<std::string>& argument_types,
                                           size_t offset)
    : ODataFilterException(ODataFilterErrorKind::UNKNOWN_FUNCTION,
                           "No overload of '" + function_name + "' accepts (" + JoinTypes(argument_types) + ")", offset,
                           ErrorContext().Set("function", function_name)),
      function_name(function_name), argument_types(argument_types)
{}

static std::string DescribeMismatch(const std::string& operator_name, const std::string& left_type, const std::string& right_type) {
    if (right_type.empty()) {
        return "Operator '" + operator_name + "' cannot be applied to an operand of type '" + left_type + "'";
    }
    return "Operator '" + operator_name + "' cannot compare '" + left_type + "' with '" + right_type + "'";
}

TypeMismatchError::TypeMismatchError(const std::string& operator_name, const std::string& left_type,
                                     const std::string& right_type, size_t offset)
    : ODataFilterException(ODataFilterErrorKind::TYPE_MISMATCH, DescribeMismatch(operator_name, left_type, right_type),
                           offset, ErrorContext().Set("operator", operator_name)),
      operator_name(operator_name), left_type(left_type), right_type(right_type)
{}

} // namespace odata_filter
