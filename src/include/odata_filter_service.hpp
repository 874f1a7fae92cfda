#pragma once

#include "odata_edm.hpp"
#include "odata_filter_errors.hpp"

#include <memory>
#include <optional>
#include <string>

namespace odata_filter {

// Flattened view of one parsed filter, as returned by the SQL functions
struct FilterParseResult {
    std::string filter;
    std::string entity_set;
    std::string item_type;
    std::string expression_kind;
    std::string result_type;
    std::string tree;
    std::string tree_json;
};

struct FilterCheckResult {
    bool is_valid = true;
    std::string error_kind;
    std::optional<size_t> error_offset;
    std::string error_message;
};

// Parses filters against one $metadata document. The model is loaded once; each
// call builds its own resolver and parser, so a service can be shared read-only.
class ODataFilterService {
public:
    // Throws std::runtime_error when the metadata is not a readable EDMX document
    explicit ODataFilterService(const std::string& metadata_xml);
    explicit ODataFilterService(std::shared_ptr<const Edmx> edmx);

    // Throws ODataFilterException on the first error in the filter
    FilterParseResult Parse(const std::string& filter, const std::string& entity_set) const;
    // Takes the entity set from the last path segment and the filter from $filter
    FilterParseResult ParseUrl(const std::string& url) const;
    // Parses without rendering. Never throws for errors in the filter or an unknown entity set
    FilterCheckResult Check(const std::string& filter, const std::string& entity_set) const;

    const Edmx& Model() const { return *edmx; }

private:
    std::shared_ptr<const Edmx> edmx;
};

} // namespace odata_filter
