#pragma once

#include <string>
#include <memory>
#include <fstream>
#include <mutex>
#include <atomic>
#include <chrono>
#include <sstream>
#include <iostream>

namespace odata_filter {

enum class TraceLevel {
    NONE = 0,
    ERROR = 1,
    WARN = 2,
    INFO = 3,
    DEBUG_LEVEL = 4,
    TRACE = 5
};

enum class TraceOutput {
    CONSOLE,
    FILE,
    BOTH
};

class FilterTracer {
public:
    static FilterTracer& Instance();
    
    void SetEnabled(bool enabled);
    void SetLevel(TraceLevel level);
    void SetTraceDirectory(const std::string& directory);
    void SetOutput(TraceOutput output);
    
    bool IsEnabled() const { return enabled.load(); }
    TraceLevel GetLevel() const { return level.load(); }
    TraceOutput GetOutput() const { return output.load(); }
    std::string GetTraceDirectory() const;
    std::string GetTraceFilePath() const;
    
    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message);
    void Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data);
    
    void Error(const std::string& component, const std::string& message);
    void Error(const std::string& component, const std::string& message, const std::string& data);
    void Warn(const std::string& component, const std::string& message);
    void Warn(const std::string& component, const std::string& message, const std::string& data);
    void Info(const std::string& component, const std::string& message);
    void Info(const std::string& component, const std::string& message, const std::string& data);
    void Debug(const std::string& component, const std::string& message);
    void Debug(const std::string& component, const std::string& message, const std::string& data);
    void Trace(const std::string& component, const std::string& message);
    void Trace(const std::string& component, const std::string& message, const std::string& data);

    static std::string LevelToString(TraceLevel level);
    // Throws std::invalid_argument for unknown names; matching is case-insensitive
    static TraceLevel LevelFromString(const std::string& level_name);
    static std::string OutputToString(TraceOutput output);
    static TraceOutput OutputFromString(const std::string& output_name);

private:
    FilterTracer() = default;
    ~FilterTracer() = default;
    FilterTracer(const FilterTracer&) = delete;
    FilterTracer& operator=(const FilterTracer&) = delete;
    
    // Callers must hold trace_mutex
    void OpenTraceFile();
    void CloseTraceFile();
    void Emit(const std::string& line);
    std::string GetTimestamp() const;
    
    // Read without the mutex on every trace call; writes still take it
    std::atomic<bool> enabled{false};
    std::atomic<TraceLevel> level{TraceLevel::INFO};
    std::atomic<TraceOutput> output{TraceOutput::CONSOLE};
    std::string trace_directory = ".";
    std::unique_ptr<std::ofstream> trace_file;
    mutable std::mutex trace_mutex;
};

#define ODATA_FILTER_TRACE_ERROR(component, message) \
    ::odata_filter::FilterTracer::Instance().Error(component, message)

#define ODATA_FILTER_TRACE_ERROR_DATA(component, message, data) \
    ::odata_filter::FilterTracer::Instance().Error(component, message, data)

#define ODATA_FILTER_TRACE_WARN(component, message) \
    ::odata_filter::FilterTracer::Instance().Warn(component, message)

#define ODATA_FILTER_TRACE_WARN_DATA(component, message, data) \
    ::odata_filter::FilterTracer::Instance().Warn(component, message, data)

#define ODATA_FILTER_TRACE_INFO(component, message) \
    ::odata_filter::FilterTracer::Instance().Info(component, message)

#define ODATA_FILTER_TRACE_INFO_DATA(component, message, data) \
    ::odata_filter::FilterTracer::Instance().Info(component, message, data)

#define ODATA_FILTER_TRACE_DEBUG(component, message) \
    ::odata_filter::FilterTracer::Instance().Debug(component, message)

#define ODATA_FILTER_TRACE_DEBUG_DATA(component, message, data) \
    ::odata_filter::FilterTracer::Instance().Debug(component, message, data)

#define ODATA_FILTER_TRACE_TRACE(component, message) \
    ::odata_filter::FilterTracer::Instance().Trace(component, message)

#define ODATA_FILTER_TRACE_TRACE_DATA(component, message, data) \
    ::odata_filter::FilterTracer::Instance().Trace(component, message, data)

} // namespace odata_filter
