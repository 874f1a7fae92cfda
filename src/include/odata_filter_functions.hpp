#pragma once

#include "duckdb.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/function/function_set.hpp"

#include "odata_filter_service.hpp"

using namespace duckdb;

namespace odata_filter {

enum class FilterFunctionMode {
    PARSE,
    PARSE_URL,
    CHECK
};

class ODataFilterBindData : public TableFunctionData
{
public:
    ODataFilterBindData(FilterFunctionMode mode, std::shared_ptr<ODataFilterService> service,
                        std::string input, std::string entity_set);

    std::vector<std::string> GetResultNames() const;
    std::vector<LogicalType> GetResultTypes() const;
    bool HasMoreResults() const;
    unsigned int FetchNextResult(DataChunk &output) const;

private:
    std::vector<Value> ParseRow() const;
    std::vector<Value> CheckRow() const;

    FilterFunctionMode mode;
    std::shared_ptr<ODataFilterService> service;
    // The filter text, or the request URL for PARSE_URL
    std::string input;
    std::string entity_set;
    std::shared_ptr<bool> done;
};

TableFunctionSet CreateODataFilterParseFunction();
TableFunctionSet CreateODataFilterParseUrlFunction();
TableFunctionSet CreateODataFilterCheckFunction();

} // namespace odata_filter
