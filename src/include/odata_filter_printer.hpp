#pragma once

#include "odata_filter_nodes.hpp"

#include <string>

namespace odata_filter {

// Renders a parsed filter as an indented diagnostic tree.
//
// Each node prints its kind on one line followed by "Key = Value" attribute lines one
// tab deeper. Node-valued attributes print "Key = " and the child block one further
// tab deeper. The output depends on the tree only, so it is stable across runs.
class FilterTreePrinter {
public:
    std::string Render(const FilterQueryOption& filter) const;
    std::string Render(const ExpressionNode& node) const;
};

std::string Render(const FilterQueryOption& filter);

} // namespace odata_filter
