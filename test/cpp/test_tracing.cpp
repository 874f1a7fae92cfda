#include "catch.hpp"
#include "odata_filter_tracing.hpp"
#include "odata_filter_parser.hpp"
#include "filter_test_schema.hpp"

#include <atomic>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <thread>
#include <vector>

using namespace odata_filter;

namespace {

// Redirects std::cout for the lifetime of the object
class CoutCapture {
public:
    CoutCapture() : old_buffer(std::cout.rdbuf(buffer.rdbuf())) {}
    ~CoutCapture() { std::cout.rdbuf(old_buffer); }

    std::string Str() const { return buffer.str(); }

private:
    std::stringstream buffer;
    std::streambuf* old_buffer;
};

void ResetTracer() {
    auto& tracer = FilterTracer::Instance();
    tracer.SetEnabled(false);
    tracer.SetOutput(TraceOutput::CONSOLE);
    tracer.SetLevel(TraceLevel::INFO);
    tracer.SetTraceDirectory(".");
}

} // namespace

TEST_CASE("FilterTracer Singleton Pattern", "[tracing]") {
    auto& instance1 = FilterTracer::Instance();
    auto& instance2 = FilterTracer::Instance();
    REQUIRE(&instance1 == &instance2);
}

TEST_CASE("FilterTracer Basic Functionality", "[tracing]") {
    ResetTracer();
    auto& tracer = FilterTracer::Instance();

    SECTION("Default state") {
        REQUIRE_FALSE(tracer.IsEnabled());
        REQUIRE(tracer.GetLevel() == TraceLevel::INFO);
        REQUIRE(tracer.GetOutput() == TraceOutput::CONSOLE);
    }

    SECTION("Enable/Disable tracing") {
        CoutCapture capture;
        tracer.SetEnabled(true);
        REQUIRE(tracer.IsEnabled());

        tracer.SetEnabled(false);
        REQUIRE_FALSE(tracer.IsEnabled());
    }

    SECTION("Set trace level") {
        tracer.SetLevel(TraceLevel::DEBUG_LEVEL);
        REQUIRE(tracer.GetLevel() == TraceLevel::DEBUG_LEVEL);

        tracer.SetLevel(TraceLevel::TRACE);
        REQUIRE(tracer.GetLevel() == TraceLevel::TRACE);
    }

    ResetTracer();
}

TEST_CASE("FilterTracer Level Filtering", "[tracing]") {
    ResetTracer();
    auto& tracer = FilterTracer::Instance();

    std::string output;
    {
        CoutCapture capture;
        tracer.SetEnabled(true);
        tracer.Error("TEST", "Error message");
        tracer.Warn("TEST", "Warning message");
        tracer.Info("TEST", "Info message");
        tracer.Debug("TEST", "Debug message");
        tracer.Trace("TEST", "Trace message");
        output = capture.Str();
    }

    REQUIRE(output.find("[ERROR] [TEST] Error message") != std::string::npos);
    REQUIRE(output.find("[WARN] [TEST] Warning message") != std::string::npos);
    REQUIRE(output.find("[INFO] [TEST] Info message") != std::string::npos);
    REQUIRE(output.find("Debug message") == std::string::npos);
    REQUIRE(output.find("Trace message") == std::string::npos);

    ResetTracer();
}

TEST_CASE("FilterTracer Disabled Produces No Output", "[tracing]") {
    ResetTracer();
    CoutCapture capture;
    ODATA_FILTER_TRACE_ERROR("TEST", "Should not appear");
    REQUIRE(capture.Str().empty());
}

TEST_CASE("FilterTracer Data Messages", "[tracing]") {
    ResetTracer();
    auto& tracer = FilterTracer::Instance();

    std::string output;
    {
        CoutCapture capture;
        tracer.SetEnabled(true);
        ODATA_FILTER_TRACE_INFO_DATA("TEST", "Filter received", "a eq 1");
        output = capture.Str();
    }

    REQUIRE(output.find("Filter received") != std::string::npos);
    REQUIRE(output.find("Data: a eq 1") != std::string::npos);

    ResetTracer();
}

TEST_CASE("FilterTracer File Output", "[tracing]") {
    ResetTracer();
    auto& tracer = FilterTracer::Instance();

    std::string test_dir = "./test_filter_trace_output";
    std::filesystem::remove_all(test_dir);

    tracer.SetTraceDirectory(test_dir);
    REQUIRE(std::filesystem::exists(test_dir));
    REQUIRE(tracer.GetTraceFilePath() == (std::filesystem::path(test_dir) / "odata_filter_trace.log").string());

    tracer.SetOutput(TraceOutput::FILE);
    tracer.SetEnabled(true);
    tracer.SetLevel(TraceLevel::DEBUG_LEVEL);
    {
        CoutCapture capture;
        auto resolver = test::CustomerResolver();
        ParseFilter("a eq 1", resolver);
        REQUIRE(capture.Str().empty());
    }
    tracer.SetEnabled(false);

    std::ifstream file(tracer.GetTraceFilePath());
    REQUIRE(file.is_open());
    std::string content((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    file.close();

    REQUIRE(content.find("[DEBUG] [PARSER] Parsing filter: a eq 1") != std::string::npos);
    REQUIRE(content.find("Parsed filter into BinaryOperatorNode") != std::string::npos);

    ResetTracer();
    std::filesystem::remove_all(test_dir);
}

TEST_CASE("FilterTracer Thread Safety", "[tracing]") {
    ResetTracer();
    auto& tracer = FilterTracer::Instance();

    const int num_threads = 8;
    const int messages_per_thread = 50;
    std::atomic<int> total_messages(0);
    std::string output;
    {
        CoutCapture capture;
        tracer.SetEnabled(true);

        std::vector<std::thread> threads;
        for (int i = 0; i < num_threads; ++i) {
            threads.emplace_back([&tracer, i, &total_messages]() {
                for (int j = 0; j < messages_per_thread; ++j) {
                    tracer.Info("THREAD_" + std::to_string(i), "Message " + std::to_string(j));
                    total_messages++;
                }
            });
        }
        for (auto& thread : threads) {
            thread.join();
        }
        output = capture.Str();
    }

    REQUIRE(total_messages == num_threads * messages_per_thread);
    REQUIRE(output.find("[THREAD_7] Message 49") != std::string::npos);

    ResetTracer();
}

TEST_CASE("FilterTracer Reconfigured While Tracing", "[tracing]") {
    ResetTracer();
    auto& tracer = FilterTracer::Instance();

    std::atomic<bool> done(false);
    std::string output;
    {
        CoutCapture capture;
        tracer.SetEnabled(true);

        std::vector<std::thread> writers;
        for (int i = 0; i < 4; ++i) {
            writers.emplace_back([&tracer, &done]() {
                while (!done) {
                    tracer.Debug("WRITER", "debug line");
                    tracer.Error("WRITER", "error line");
                }
            });
        }

        for (int i = 0; i < 200; ++i) {
            tracer.SetLevel(i % 2 == 0 ? TraceLevel::DEBUG_LEVEL : TraceLevel::ERROR);
            REQUIRE(tracer.IsEnabled());
        }
        done = true;
        for (auto& writer : writers) {
            writer.join();
        }

        tracer.SetLevel(TraceLevel::ERROR);
        REQUIRE(tracer.GetLevel() == TraceLevel::ERROR);
        output = capture.Str();
    }

    REQUIRE(output.find("[ERROR] [WRITER] error line") != std::string::npos);

    ResetTracer();
}

TEST_CASE("FilterTracer String Conversion", "[tracing]") {
    REQUIRE(FilterTracer::LevelToString(TraceLevel::DEBUG_LEVEL) == "DEBUG");
    REQUIRE(FilterTracer::LevelFromString("debug") == TraceLevel::DEBUG_LEVEL);
    REQUIRE(FilterTracer::LevelFromString("Warn") == TraceLevel::WARN);
    REQUIRE_THROWS_AS(FilterTracer::LevelFromString("verbose"), std::invalid_argument);

    REQUIRE(FilterTracer::OutputToString(TraceOutput::BOTH) == "both");
    REQUIRE(FilterTracer::OutputFromString("FILE") == TraceOutput::FILE);
    REQUIRE_THROWS_AS(FilterTracer::OutputFromString("syslog"), std::invalid_argument);
}
