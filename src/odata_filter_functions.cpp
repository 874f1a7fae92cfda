#include "odata_filter_functions.hpp"
#include "odata_filter_tracing.hpp"

#include <cpptrace/cpptrace.hpp>

#include <sstream>

namespace odata_filter {

static const std::vector<std::string> PARSE_RESULT_NAMES = {
    "filter", "entity_set", "item_type", "expression_kind", "result_type", "tree", "tree_json"
};

static const std::vector<std::string> CHECK_RESULT_NAMES = {
    "is_valid", "error_kind", "error_offset", "error_message"
};

ODataFilterBindData::ODataFilterBindData(FilterFunctionMode mode, std::shared_ptr<ODataFilterService> service,
                                         std::string input, std::string entity_set)
    : TableFunctionData(), mode(mode), service(std::move(service)), input(std::move(input)),
      entity_set(std::move(entity_set)), done(std::make_shared<bool>(false))
{ }

std::vector<std::string> ODataFilterBindData::GetResultNames() const
{
    return mode == FilterFunctionMode::CHECK ? CHECK_RESULT_NAMES : PARSE_RESULT_NAMES;
}

std::vector<LogicalType> ODataFilterBindData::GetResultTypes() const
{
    if (mode == FilterFunctionMode::CHECK) {
        return { LogicalType::BOOLEAN, LogicalType::VARCHAR, LogicalType::UBIGINT, LogicalType::VARCHAR };
    }
    std::vector<LogicalType> types(PARSE_RESULT_NAMES.size() - 1, LogicalType::VARCHAR);
    types.push_back(LogicalType::JSON());
    return types;
}

bool ODataFilterBindData::HasMoreResults() const
{
    return *done == false;
}

unsigned int ODataFilterBindData::FetchNextResult(DataChunk &output) const
{
    auto row = mode == FilterFunctionMode::CHECK ? CheckRow() : ParseRow();
    for (unsigned int i = 0; i < row.size(); i++) {
        output.SetValue(i, 0, row[i]);
    }

    *done = true;
    output.SetCardinality(1);
    return 1;
}

std::vector<Value> ODataFilterBindData::ParseRow() const
{
    try {
        auto result = mode == FilterFunctionMode::PARSE_URL
            ? service->ParseUrl(input)
            : service->Parse(input, entity_set);

        return {
            Value(result.filter), Value(result.entity_set), Value(result.item_type),
            Value(result.expression_kind), Value(result.result_type), Value(result.tree),
            Value(result.tree_json)
        };
    } catch (const ODataFilterException &e) {
        throw InvalidInputException(e.what());
    } catch (const InvalidInputException &) {
        throw;
    } catch (const std::exception &e) {
        std::stringstream ss;
        ss << "Unexpected error while parsing filter: " << e.what() << std::endl;
        ss << cpptrace::generate_trace(0, 10).to_string() << std::endl;
        ODATA_FILTER_TRACE_ERROR("FILTER_SCAN", ss.str());
        throw InvalidInputException(std::string("Unexpected error while parsing filter: ") + e.what());
    }
}

std::vector<Value> ODataFilterBindData::CheckRow() const
{
    auto result = service->Check(input, entity_set);
    if (result.is_valid) {
        return { Value::BOOLEAN(true), Value(), Value(), Value() };
    }

    auto offset = result.error_offset.has_value()
        ? Value::UBIGINT(result.error_offset.value())
        : Value(LogicalType::UBIGINT);
    return { Value::BOOLEAN(false), Value(result.error_kind), offset, Value(result.error_message) };
}

// ----------------------------------------------------------------------

static bool HasParam(const named_parameter_map_t &named_params, const std::string &name)
{
    auto it = named_params.find(name);
    return it != named_params.end() && !it->second.IsNull();
}

static std::string RequireParam(const named_parameter_map_t &named_params, const std::string &function_name,
                                const std::string &name)
{
    if (!HasParam(named_params, name)) {
        throw BinderException(function_name + " requires the named parameter '" + name + "'");
    }
    return named_params.at(name).GetValue<std::string>();
}

static std::shared_ptr<ODataFilterService> ServiceFromInput(TableFunctionBindInput &input, const std::string &function_name)
{
    auto metadata = RequireParam(input.named_parameters, function_name, "metadata");
    try {
        return std::make_shared<ODataFilterService>(metadata);
    } catch (const std::exception &e) {
        ODATA_FILTER_TRACE_ERROR("FILTER_BIND", "Failed to load metadata: " + std::string(e.what()));
        throw InvalidInputException("Invalid metadata document: " + std::string(e.what()));
    }
}

static std::string FirstArgument(TableFunctionBindInput &input, const std::string &function_name)
{
    if (input.inputs.empty() || input.inputs[0].IsNull()) {
        throw BinderException(function_name + " requires a non-NULL first argument");
    }
    return input.inputs[0].GetValue<std::string>();
}

static unique_ptr<FunctionData> BindWithMode(TableFunctionBindInput &input,
                                             vector<LogicalType> &return_types,
                                             vector<string> &names,
                                             FilterFunctionMode mode,
                                             const std::string &function_name)
{
    ODATA_FILTER_TRACE_DEBUG("FILTER_BIND", "Binding " + function_name);

    auto argument = FirstArgument(input, function_name);
    auto service = ServiceFromInput(input, function_name);
    auto entity_set = mode == FilterFunctionMode::PARSE_URL
        ? std::string()
        : RequireParam(input.named_parameters, function_name, "entity_set");

    auto bind_data = make_uniq<ODataFilterBindData>(mode, std::move(service), std::move(argument), std::move(entity_set));
    names = bind_data->GetResultNames();
    return_types = bind_data->GetResultTypes();
    return std::move(bind_data);
}

static unique_ptr<FunctionData> ODataFilterParseBind(ClientContext &context,
                                                     TableFunctionBindInput &input,
                                                     vector<LogicalType> &return_types,
                                                     vector<string> &names)
{
    return BindWithMode(input, return_types, names, FilterFunctionMode::PARSE, "odata_filter_parse");
}

static unique_ptr<FunctionData> ODataFilterParseUrlBind(ClientContext &context,
                                                        TableFunctionBindInput &input,
                                                        vector<LogicalType> &return_types,
                                                        vector<string> &names)
{
    return BindWithMode(input, return_types, names, FilterFunctionMode::PARSE_URL, "odata_filter_parse_url");
}

static unique_ptr<FunctionData> ODataFilterCheckBind(ClientContext &context,
                                                     TableFunctionBindInput &input,
                                                     vector<LogicalType> &return_types,
                                                     vector<string> &names)
{
    return BindWithMode(input, return_types, names, FilterFunctionMode::CHECK, "odata_filter_check");
}

// ----------------------------------------------------------------------

static void ODataFilterScan(ClientContext &context,
                            TableFunctionInput &data,
                            DataChunk &output)
{
    auto &bind_data = data.bind_data->Cast<ODataFilterBindData>();

    if (!bind_data.HasMoreResults()) {
        output.SetCardinality(0);
        return;
    }

    bind_data.FetchNextResult(output);
}

// ----------------------------------------------------------------------

static TableFunctionSet CreateFilterFunction(const std::string &name, table_function_bind_t bind_func, bool with_entity_set)
{
    TableFunctionSet function_set(name);

    auto func = TableFunction({ LogicalType::VARCHAR }, ODataFilterScan, bind_func);
    func.named_parameters["metadata"] = LogicalType::VARCHAR;
    if (with_entity_set) {
        func.named_parameters["entity_set"] = LogicalType::VARCHAR;
    }

    function_set.AddFunction(func);
    return function_set;
}

TableFunctionSet CreateODataFilterParseFunction()
{
    return CreateFilterFunction("odata_filter_parse", ODataFilterParseBind, true);
}

TableFunctionSet CreateODataFilterParseUrlFunction()
{
    return CreateFilterFunction("odata_filter_parse_url", ODataFilterParseUrlBind, false);
}

TableFunctionSet CreateODataFilterCheckFunction()
{
    return CreateFilterFunction("odata_filter_check", ODataFilterCheckBind, true);
}

} // namespace odata_filter
