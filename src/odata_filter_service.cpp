#include "odata_filter_service.hpp"
#include "odata_filter_json.hpp"
#include "odata_filter_parser.hpp"
#include "odata_filter_printer.hpp"
#include "odata_filter_tracing.hpp"
#include "odata_filter_uri.hpp"
#include "odata_schema_resolver.hpp"

#include <stdexcept>

namespace odata_filter {

ODataFilterService::ODataFilterService(const std::string& metadata_xml)
    : edmx(std::make_shared<const Edmx>(Edmx::FromXml(metadata_xml)))
{}

ODataFilterService::ODataFilterService(std::shared_ptr<const Edmx> edmx)
    : edmx(std::move(edmx))
{
    if (!this->edmx) {
        throw std::invalid_argument("ODataFilterService requires a metadata model");
    }
}

FilterParseResult ODataFilterService::Parse(const std::string& filter, const std::string& entity_set) const {
    EdmSchemaResolver resolver(edmx, entity_set);
    auto parsed = ParseFilter(filter, resolver);

    FilterParseResult result;
    result.filter = filter;
    result.entity_set = parsed.GetRangeVariable().navigation_source;
    result.item_type = parsed.ItemType().FullName();
    result.expression_kind = parsed.Expression().KindName();
    result.result_type = parsed.Expression().Type().ToString();
    result.tree = Render(parsed);
    result.tree_json = RenderJson(parsed);
    return result;
}

FilterParseResult ODataFilterService::ParseUrl(const std::string& url) const {
    auto entity_set = ExtractEntitySetName(url);
    auto filter = ExtractFilterOption(url);
    ODATA_FILTER_TRACE_DEBUG("SERVICE", "URL " + url + " addresses entity set " + entity_set);
    return Parse(filter, entity_set);
}

FilterCheckResult ODataFilterService::Check(const std::string& filter, const std::string& entity_set) const {
    FilterCheckResult result;
    try {
        EdmSchemaResolver resolver(edmx, entity_set);
        ParseFilter(filter, resolver);
    } catch (const ODataFilterException& e) {
        result.is_valid = false;
        result.error_kind = ErrorKindToString(e.Kind());
        if (e.HasOffset()) {
            result.error_offset = e.Offset();
        }
        result.error_message = e.what();
    }
    return result;
}

} // namespace odata_filter
