#include "duckdb.hpp"
#include "duckdb/function/pragma_function.hpp"
#include "duckdb/main/extension/extension_loader.hpp"
#include "duckdb/parser/keyword_helper.hpp"

#include "odata_filter_extension.hpp"
#include "odata_filter_functions.hpp"
#include "odata_filter_tracing.hpp"

// Windows headers may redefine macros after our tracing header include
#ifdef _WIN32
#ifdef ERROR
    #undef ERROR
#endif
#ifdef FILE
    #undef FILE
#endif
#endif

namespace duckdb {

static odata_filter::TraceLevel ParseTraceLevel(const string &level_str) {
    try {
        return odata_filter::FilterTracer::LevelFromString(level_str);
    } catch (const std::invalid_argument &e) {
        throw BinderException(e.what());
    }
}

static void OnTraceEnabled(ClientContext &context, SetScope scope, Value &parameter)
{
    odata_filter::FilterTracer::Instance().SetEnabled(parameter.GetValue<bool>());
}

static void OnTraceLevel(ClientContext &context, SetScope scope, Value &parameter)
{
    odata_filter::FilterTracer::Instance().SetLevel(ParseTraceLevel(parameter.GetValue<string>()));
}

static void OnTraceOutput(ClientContext &context, SetScope scope, Value &parameter)
{
    auto output_str = parameter.GetValue<string>();
    try {
        odata_filter::FilterTracer::Instance().SetOutput(odata_filter::FilterTracer::OutputFromString(output_str));
    } catch (const std::invalid_argument &e) {
        throw BinderException(e.what());
    }
}

static void OnTraceFilePath(ClientContext &context, SetScope scope, Value &parameter)
{
    auto directory = parameter.GetValue<string>();
    odata_filter::FilterTracer::Instance().SetTraceDirectory(directory.empty() ? "." : directory);
}

static void EnableTracingPragmaFunction(ClientContext &context, const FunctionParameters &parameters) {
    if (parameters.values.empty()) {
        throw BinderException("odata_filter_trace_enable pragma requires a boolean parameter");
    }
    odata_filter::FilterTracer::Instance().SetEnabled(parameters.values[0].GetValue<bool>());
}

static void SetTraceLevelPragmaFunction(ClientContext &context, const FunctionParameters &parameters) {
    if (parameters.values.empty()) {
        throw BinderException("odata_filter_trace_level pragma requires a string parameter");
    }
    odata_filter::FilterTracer::Instance().SetLevel(ParseTraceLevel(parameters.values[0].GetValue<string>()));
}

// Answers with a one-row query so the status reaches the client as a result set
static string GetTracingStatusPragmaFunction(ClientContext &context, const FunctionParameters &parameters) {
    auto &tracer = odata_filter::FilterTracer::Instance();

    stringstream query;
    query << "SELECT " << (tracer.IsEnabled() ? "true" : "false") << " AS enabled, "
          << KeywordHelper::WriteQuoted(odata_filter::FilterTracer::LevelToString(tracer.GetLevel()), '\'') << " AS level, "
          << KeywordHelper::WriteQuoted(odata_filter::FilterTracer::OutputToString(tracer.GetOutput()), '\'') << " AS output, "
          << KeywordHelper::WriteQuoted(tracer.GetTraceFilePath(), '\'') << " AS file_path";
    return query.str();
}

static void RegisterConfiguration(DatabaseInstance &instance)
{
    auto &config = DBConfig::GetConfig(instance);

    config.AddExtensionOption("odata_filter_trace_enabled", "Enable OData filter extension tracing",
                              LogicalTypeId::BOOLEAN, Value(false), OnTraceEnabled);
    config.AddExtensionOption("odata_filter_trace_level", "Set OData filter trace level (TRACE, DEBUG, INFO, WARN, ERROR)",
                              LogicalTypeId::VARCHAR, Value("INFO"), OnTraceLevel);
    config.AddExtensionOption("odata_filter_trace_output", "Set OData filter trace output (console, file, both)",
                              LogicalTypeId::VARCHAR, Value("console"), OnTraceOutput);
    config.AddExtensionOption("odata_filter_trace_file_path", "Set the directory of the OData filter trace file",
                              LogicalTypeId::VARCHAR, Value(""), OnTraceFilePath);
}

static void RegisterFilterFunctions(ExtensionLoader &loader)
{
    loader.RegisterFunction(odata_filter::CreateODataFilterParseFunction());
    loader.RegisterFunction(odata_filter::CreateODataFilterParseUrlFunction());
    loader.RegisterFunction(odata_filter::CreateODataFilterCheckFunction());
}

static void RegisterTracingPragmas(ExtensionLoader &loader)
{
    loader.RegisterFunction(PragmaFunctionSet(PragmaFunction::PragmaCall(
        "odata_filter_trace_enable", EnableTracingPragmaFunction, {LogicalType::BOOLEAN})));

    loader.RegisterFunction(PragmaFunctionSet(PragmaFunction::PragmaCall(
        "odata_filter_trace_level", SetTraceLevelPragmaFunction, {LogicalType::VARCHAR})));

    loader.RegisterFunction(PragmaFunctionSet(PragmaFunction::PragmaStatement(
        "odata_filter_trace_status", GetTracingStatusPragmaFunction)));
}

static void LoadInternal(ExtensionLoader &loader) {
    auto &instance = loader.GetDatabaseInstance();

    RegisterConfiguration(instance);
    RegisterFilterFunctions(loader);
    RegisterTracingPragmas(loader);
}

void OdataFilterExtension::Load(ExtensionLoader &loader) {
    LoadInternal(loader);
}

std::string OdataFilterExtension::Name() {
    return "odata_filter";
}

std::string OdataFilterExtension::Version() {
    return "0.1.0";
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(odata_filter, loader) {
    duckdb::OdataFilterExtension::Load(loader);
}

}
