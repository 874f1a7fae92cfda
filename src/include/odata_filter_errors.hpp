#pragma once

#include "error_context.hpp"

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace odata_filter {

enum class ODataFilterErrorKind {
    LEX_ERROR,
    SYNTAX_ERROR,
    UNKNOWN_IDENTIFIER,
    UNKNOWN_PROPERTY,
    UNKNOWN_FUNCTION,
    TYPE_MISMATCH
};

std::string ErrorKindToString(ODataFilterErrorKind kind);

// Base of every error raised while tokenizing, resolving or building a filter tree.
// The offset is the byte position of the offending token in the filter text; errors
// raised by a schema resolver start without one and get it from the parser.
class ODataFilterException : public std::runtime_error {
public:
    static constexpr size_t NO_OFFSET = static_cast<size_t>(-1);

    ODataFilterException(ODataFilterErrorKind kind, const std::string& message,
                         size_t offset = NO_OFFSET, ErrorContext context = ErrorContext());

    const char* what() const noexcept override { return formatted.c_str(); }

    ODataFilterErrorKind Kind() const { return kind; }
    const std::string& Message() const { return message; }
    const ErrorContext& Context() const { return context; }

    bool HasOffset() const { return offset != NO_OFFSET; }
    size_t Offset() const { return offset; }
    void SetOffset(size_t offset);

private:
    void Rebuild();

    ODataFilterErrorKind kind;
    std::string message;
    size_t offset;
    ErrorContext context;
    std::string formatted;
};

class LexError : public ODataFilterException {
public:
    LexError(const std::string& message, size_t offset);
};

class SyntaxError : public ODataFilterException {
public:
    SyntaxError(const std::string& expected, const std::string& found, size_t offset);
    SyntaxError(const std::string& message, const std::string& expected, const std::string& found, size_t offset);

    const std::string& Expected() const { return expected; }
    const std::string& Found() const { return found; }

private:
    std::string expected;
    std::string found;
};

class UnknownIdentifierError : public ODataFilterException {
public:
    explicit UnknownIdentifierError(const std::string& name, size_t offset = NO_OFFSET);

    const std::string& Name() const { return name; }

private:
    std::string name;
};

class UnknownPropertyError : public ODataFilterException {
public:
    UnknownPropertyError(const std::string& property_name, const std::string& source_type, size_t offset = NO_OFFSET);

    const std::string& PropertyName() const { return property_name; }
    const std::string& SourceType() const { return source_type; }

private:
    std::string property_name;
    std::string source_type;
};

class UnknownFunctionError : public ODataFilterException {
public:
    UnknownFunctionError(const std::string& function_name, const std::vector<std::string>& argument_types,
                         size_t offset = NO_OFFSET);

    const std::string& FunctionName() const { return function_name; }
    const std::vector<std::string>& ArgumentTypes() const { return argument_types; }

private:
    std::string function_name;
    std::vector<std::string> argument_types;
};

class TypeMismatchError : public ODataFilterException {
public:
    // Binary operators name both operand types; unary operators and the root check pass an empty right type
    TypeMismatchError(const std::string& operator_name, const std::string& left_type, const std::string& right_type,
                      size_t offset = NO_OFFSET);

    const std::string& OperatorName() const { return operator_name; }
    const std::string& LeftType() const { return left_type; }
    const std::string& RightType() const { return right_type; }

private:
    std::string operator_name;
    std::string left_type;
    std::string right_type;
};

} // namespace odata_filter
