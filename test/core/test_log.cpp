#include <catch2/catch_test_macros.hpp>

#include <catalog_graph/core/log.hpp>

#include <nlohmann/json.hpp>

#include <cstdio>
#include <fstream>
#include <iterator>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace catalog_graph;

namespace {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<CapturedMessage>& into) : into_(into) {}
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        into_.push_back({level, std::string(component), std::string(message)});
    }

private:
    std::vector<CapturedMessage>& into_;
};

} // anonymous namespace

// ===========================================================================
// ParseLogLevel
// ===========================================================================

TEST_CASE("ParseLogLevel: case-insensitive names", "[log]") {
    CHECK(ParseLogLevel("DEBUG") == LogLevel::Debug);
    CHECK(ParseLogLevel("info") == LogLevel::Info);
    CHECK(ParseLogLevel("Warning") == LogLevel::Warn);
    CHECK(ParseLogLevel("error") == LogLevel::Error);
    CHECK_FALSE(ParseLogLevel("loud").has_value());
}

// ===========================================================================
// Sinks
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain line without color", "[log]") {
    std::ostringstream out;
    ColorConsoleSink sink(false, out);
    sink.Write(LogLevel::Warn, "store", "batch retried");
    auto line = out.str();
    CHECK(line.find("[WARN] [store] batch retried") != std::string::npos);
    CHECK(line.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: ANSI escapes with color", "[log]") {
    std::ostringstream out;
    ColorConsoleSink sink(true, out);
    sink.Write(LogLevel::Error, "store", "boom");
    CHECK(out.str().find("\033[") != std::string::npos);
    CHECK(out.str().find("[store]") != std::string::npos);
}

TEST_CASE("JsonSink: one JSON object per line", "[log]") {
    std::ostringstream out;
    JsonSink sink(out);
    sink.Write(LogLevel::Info, "catalog", "loaded 12 tables");
    auto j = nlohmann::json::parse(out.str());
    CHECK(j["level"] == "INFO");
    CHECK(j["component"] == "catalog");
    CHECK(j["message"] == "loaded 12 tables");
    CHECK(j.contains("ts"));
}

TEST_CASE("FileSink: appends to the file", "[log]") {
    const std::string path = "catalog_graph_test_file_sink.log";
    std::remove(path.c_str());
    {
        FileSink sink(path);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Error, "http", "connection refused");
    }
    std::ifstream in(path);
    std::string content((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
    CHECK(content.find("[ERROR] [http] connection refused") != std::string::npos);
    in.close();
    std::remove(path.c_str());
}

TEST_CASE("TeeSink: every sink sees every message", "[log]") {
    std::vector<CapturedMessage> a;
    std::vector<CapturedMessage> b;
    TeeSink tee;
    tee.Add(std::make_unique<CaptureSink>(a));
    tee.Add(std::make_unique<CaptureSink>(b));
    tee.Write(LogLevel::Debug, "resolve", "x");
    REQUIRE(a.size() == 1);
    REQUIRE(b.size() == 1);
    CHECK(b[0].component == "resolve");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: filters below the minimum level", "[log]") {
    std::vector<CapturedMessage> messages;
    Logger logger(std::make_unique<CaptureSink>(messages), LogLevel::Warn);
    logger.Debug("c", "d");
    logger.Info("c", "i");
    logger.Warn("c", "w");
    logger.Error("c", "e");
    REQUIRE(messages.size() == 2);
    CHECK(messages[0].level == LogLevel::Warn);
    CHECK(messages[1].level == LogLevel::Error);

    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.Enabled(LogLevel::Debug));
}

TEST_CASE("Logger: concurrent writers do not lose messages", "[log]") {
    std::vector<CapturedMessage> messages;
    Logger logger(std::make_unique<CaptureSink>(messages), LogLevel::Debug);
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([&logger]() {
            for (int i = 0; i < 50; ++i) logger.Info("t", "m");
        });
    }
    for (auto& th : threads) th.join();
    CHECK(messages.size() == 200);
}

TEST_CASE("Global logger: routes the free functions", "[log]") {
    std::vector<CapturedMessage> messages;
    InitGlobalLogger(std::make_unique<CaptureSink>(messages), LogLevel::Info);
    LogDebug("g", "hidden");
    LogInfo("g", "shown");
    LogError("g", "also shown");
    CHECK(messages.size() == 2);
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(false), LogLevel::Error);
}
