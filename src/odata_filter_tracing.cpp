#include "odata_filter_tracing.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <stdexcept>

namespace odata_filter {

static const char* TRACE_FILE_NAME = "odata_filter_trace.log";

static std::string UpperCase(const std::string& value) {
    std::string upper = value;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

FilterTracer& FilterTracer::Instance() {
    static FilterTracer instance;
    return instance;
}

void FilterTracer::SetEnabled(bool enabled) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        if (this->enabled == enabled) {
            return;
        }
        this->enabled = enabled;
        if (enabled && output != TraceOutput::CONSOLE) {
            OpenTraceFile();
        } else if (!enabled) {
            CloseTraceFile();
        }
    }

    if (enabled) {
        Info("TRACER", "Tracing enabled, output: " + OutputToString(output.load()));
    }
}

void FilterTracer::SetLevel(TraceLevel level) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->level = level;
    }
    Info("TRACER", "Trace level set to: " + LevelToString(level));
}

void FilterTracer::SetTraceDirectory(const std::string& directory) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        trace_directory = directory.empty() ? "." : directory;

        std::filesystem::path dir_path(trace_directory);
        if (!std::filesystem::exists(dir_path)) {
            std::filesystem::create_directories(dir_path);
        }

        // Reopen so subsequent lines land in the new directory
        if (trace_file) {
            CloseTraceFile();
            OpenTraceFile();
        }
    }
    Info("TRACER", "Trace directory set to: " + directory);
}

void FilterTracer::SetOutput(TraceOutput output) {
    {
        std::lock_guard<std::mutex> lock(trace_mutex);
        this->output = output;
        if (enabled && output != TraceOutput::CONSOLE && !trace_file) {
            OpenTraceFile();
        } else if (output == TraceOutput::CONSOLE) {
            CloseTraceFile();
        }
    }
    Info("TRACER", "Trace output set to: " + OutputToString(output));
}

std::string FilterTracer::GetTraceDirectory() const {
    std::lock_guard<std::mutex> lock(trace_mutex);
    return trace_directory;
}

std::string FilterTracer::GetTraceFilePath() const {
    std::lock_guard<std::mutex> lock(trace_mutex);
    return (std::filesystem::path(trace_directory) / TRACE_FILE_NAME).string();
}

void FilterTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message) {
    Trace(msg_level, component, message, "");
}

void FilterTracer::Trace(TraceLevel msg_level, const std::string& component, const std::string& message, const std::string& data) {
    if (!enabled.load() || msg_level > level.load() || msg_level == TraceLevel::NONE) {
        return;
    }

    std::string log_message;
    log_message.reserve(64 + component.length() + message.length() + data.length());

    log_message += GetTimestamp();
    log_message += " [";
    log_message += LevelToString(msg_level);
    log_message += "] [";
    log_message += component;
    log_message += "] ";
    log_message += message;

    if (!data.empty()) {
        log_message += "\nData: ";
        log_message += data;
    }

    std::lock_guard<std::mutex> lock(trace_mutex);
    Emit(log_message);
}

void FilterTracer::Error(const std::string& component, const std::string& message) {
    Trace(TraceLevel::ERROR, component, message);
}

void FilterTracer::Error(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::ERROR, component, message, data);
}

void FilterTracer::Warn(const std::string& component, const std::string& message) {
    Trace(TraceLevel::WARN, component, message);
}

void FilterTracer::Warn(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::WARN, component, message, data);
}

void FilterTracer::Info(const std::string& component, const std::string& message) {
    Trace(TraceLevel::INFO, component, message);
}

void FilterTracer::Info(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::INFO, component, message, data);
}

void FilterTracer::Debug(const std::string& component, const std::string& message) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message);
}

void FilterTracer::Debug(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::DEBUG_LEVEL, component, message, data);
}

void FilterTracer::Trace(const std::string& component, const std::string& message) {
    Trace(TraceLevel::TRACE, component, message);
}

void FilterTracer::Trace(const std::string& component, const std::string& message, const std::string& data) {
    Trace(TraceLevel::TRACE, component, message, data);
}

void FilterTracer::OpenTraceFile() {
    auto trace_path = std::filesystem::path(trace_directory) / TRACE_FILE_NAME;
    trace_file = std::make_unique<std::ofstream>(trace_path, std::ios::app);
    if (!trace_file->is_open()) {
        std::cerr << "Failed to open trace file: " << trace_path.string() << std::endl;
        trace_file.reset();
    }
}

void FilterTracer::CloseTraceFile() {
    if (trace_file) {
        trace_file->close();
        trace_file.reset();
    }
}

void FilterTracer::Emit(const std::string& line) {
    if (output != TraceOutput::FILE) {
        std::cout << line << std::endl;
    }
    if (output != TraceOutput::CONSOLE && trace_file && trace_file->is_open()) {
        *trace_file << line << std::endl;
    }
}

std::string FilterTracer::GetTimestamp() const {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;

    char time_buffer[32];
    std::strftime(time_buffer, sizeof(time_buffer), "%Y-%m-%d %H:%M:%S", std::localtime(&time_t));

    std::ostringstream timestamp;
    timestamp << time_buffer << "." << std::setw(3) << std::setfill('0') << ms.count();
    return timestamp.str();
}

std::string FilterTracer::LevelToString(TraceLevel level) {
    switch (level) {
        case TraceLevel::NONE: return "NONE";
        case TraceLevel::ERROR: return "ERROR";
        case TraceLevel::WARN: return "WARN";
        case TraceLevel::INFO: return "INFO";
        case TraceLevel::DEBUG_LEVEL: return "DEBUG";
        case TraceLevel::TRACE: return "TRACE";
        default: return "UNKNOWN";
    }
}

TraceLevel FilterTracer::LevelFromString(const std::string& level_name) {
    auto upper = UpperCase(level_name);
    if (upper == "NONE") return TraceLevel::NONE;
    if (upper == "ERROR") return TraceLevel::ERROR;
    if (upper == "WARN") return TraceLevel::WARN;
    if (upper == "INFO") return TraceLevel::INFO;
    if (upper == "DEBUG") return TraceLevel::DEBUG_LEVEL;
    if (upper == "TRACE") return TraceLevel::TRACE;
    throw std::invalid_argument("Invalid trace level: " + level_name + ". Valid levels are: NONE, ERROR, WARN, INFO, DEBUG, TRACE");
}

std::string FilterTracer::OutputToString(TraceOutput output) {
    switch (output) {
        case TraceOutput::CONSOLE: return "console";
        case TraceOutput::FILE: return "file";
        case TraceOutput::BOTH: return "both";
        default: return "unknown";
    }
}

TraceOutput FilterTracer::OutputFromString(const std::string& output_name) {
    auto upper = UpperCase(output_name);
    if (upper == "CONSOLE") return TraceOutput::CONSOLE;
    if (upper == "FILE") return TraceOutput::FILE;
    if (upper == "BOTH") return TraceOutput::BOTH;
    throw std::invalid_argument("Invalid trace output: " + output_name + ". Valid outputs are: console, file, both");
}

} // namespace odata_filter
