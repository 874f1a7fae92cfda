#pragma once

#include "odata_filter_nodes.hpp"

#include <string>

namespace odata_filter {

// Serializes a parsed filter to JSON:
//   {"itemType": {...}, "rangeVariable": {...}, "expression": {"kind": "...", ...}}
// Type references are objects with "name", "nullable" and, when present, "srid".
std::string RenderJson(const FilterQueryOption& filter, bool pretty = false);

} // namespace odata_filter
