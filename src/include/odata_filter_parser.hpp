#pragma once

#include "odata_filter_nodes.hpp"
#include "odata_schema_resolver.hpp"

#include <cstddef>
#include <string>

namespace odata_filter {

// Recursive-descent parser for $filter expressions.
//
//   expr         := orExpr
//   orExpr       := andExpr ('or' andExpr)*
//   andExpr      := notExpr ('and' notExpr)*
//   notExpr      := ['not'] comparison
//   comparison   := primary [compOp primary]
//   primary      := literal | propertyPath | functionCall | '(' expr ')'
//   propertyPath := identifier ('/' identifier)*
//   functionCall := identifier '(' [primary (',' primary)*] ')'
//
// Every node is typed while it is built. The first lexical, grammar, resolution or
// type error aborts the parse with an ODataFilterException; no partial tree is returned.
//
// Parentheses and function calls may nest at most MAX_NESTING_DEPTH levels, and the
// finished tree may be at most MAX_EXPRESSION_DEPTH nodes deep. Deeper input is a SyntaxError.
class ODataFilterParser {
public:
    static constexpr size_t MAX_NESTING_DEPTH = 100;
    static constexpr size_t MAX_EXPRESSION_DEPTH = 1000;

    explicit ODataFilterParser(const SchemaResolver& resolver);

    // Safe to call repeatedly; each call owns its own parse state
    FilterQueryOption Parse(const std::string& filter) const;

private:
    const SchemaResolver& resolver;
};

FilterQueryOption ParseFilter(const std::string& filter, const SchemaResolver& resolver);

} // namespace odata_filter
