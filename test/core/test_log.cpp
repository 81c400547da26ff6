#include <catch2/catch_test_macros.hpp>

#include <pbi_scan/core/log.hpp>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace pbi_scan;

// ===========================================================================
// Helper: a sink that captures records into a vector.
// ===========================================================================

namespace {

struct CapturedMessage {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    explicit CaptureSink(std::vector<CapturedMessage>* out) : out_(out) {}
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        out_->push_back({level, std::string(component), std::string(message)});
    }
private:
    std::vector<CapturedMessage>* out_;
};

} // anonymous namespace

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: one parseable object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "scan", "batch 1 submitted");
    sink.Write(LogLevel::Warn, "gateway", "retrying");

    std::istringstream lines(oss.str());
    std::string line;
    std::vector<nlohmann::json> records;
    while (std::getline(lines, line)) {
        records.push_back(nlohmann::json::parse(line));
    }
    REQUIRE(records.size() == 2);
    CHECK(records[0]["level"] == "INFO");
    CHECK(records[0]["component"] == "scan");
    CHECK(records[0]["message"] == "batch 1 submitted");
    CHECK(records[0]["ts"].get<std::string>().back() == 'Z');
    CHECK(records[1]["level"] == "WARN");
}

TEST_CASE("JsonSink: run id is carried only when set", "[log]") {
    std::ostringstream tagged;
    JsonSink with_run(tagged, "20240301_120000");
    with_run.Write(LogLevel::Info, "workflow", "started");
    auto record = nlohmann::json::parse(tagged.str());
    CHECK(record["run"] == "20240301_120000");
    CHECK(record["component"] == "workflow");

    std::ostringstream plain;
    JsonSink without_run(plain);
    without_run.Write(LogLevel::Info, "workflow", "started");
    CHECK_FALSE(nlohmann::json::parse(plain.str()).contains("run"));
}

TEST_CASE("JsonSink: escapes control and quote characters", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Error, "esc", "a\nb\t\"c\" d\\e");

    auto j = nlohmann::json::parse(oss.str());
    CHECK(j["message"] == "a\nb\t\"c\" d\\e");
    CHECK(j["level"] == "ERROR");
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "http", "GET /v1.0/myorg/admin/groups");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[http]") != std::string::npos);
    CHECK(output.find("GET /v1.0/myorg/admin/groups") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: color mode uses a per-level color", "[log]") {
    auto render = [](LogLevel level) {
        std::ostringstream oss;
        ColorConsoleSink sink(true, oss);
        sink.Write(level, "x", "msg");
        return oss.str();
    };
    CHECK(render(LogLevel::Debug).find("\033[90m") != std::string::npos);
    CHECK(render(LogLevel::Info).find("\033[36m") != std::string::npos);
    CHECK(render(LogLevel::Warn).find("\033[33m") != std::string::npos);

    auto error = render(LogLevel::Error);
    auto first = error.find("\033[1;31m");
    REQUIRE(first != std::string::npos);
    CHECK(error.find("\033[1;31m", first + 1) != std::string::npos);
    CHECK(error.back() == '\n');
}

// ===========================================================================
// FileSink
// ===========================================================================

TEST_CASE("FileSink: appends JSON lines to the file", "[log]") {
    auto path = (std::filesystem::temp_directory_path() /
                 "pbi_scan_test_file_sink.log").string();
    std::remove(path.c_str());

    {
        FileSink sink(path);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Info, "run", "first");
    }
    {
        FileSink sink(path);
        sink.Write(LogLevel::Debug, "run", "second");
    }

    std::ifstream in(path);
    std::string line;
    std::vector<std::string> lines;
    while (std::getline(in, line)) lines.push_back(line);
    REQUIRE(lines.size() == 2);
    CHECK(nlohmann::json::parse(lines[0])["message"] == "first");
    CHECK(nlohmann::json::parse(lines[1])["message"] == "second");

    std::remove(path.c_str());
}

TEST_CASE("FileSink: runs sharing one log file are told apart by run id", "[log]") {
    auto path = (std::filesystem::temp_directory_path() /
                 "pbi_scan_test_file_sink_runs.log").string();
    std::remove(path.c_str());

    {
        FileSink sink(path, "20240301_120000");
        sink.Write(LogLevel::Info, "scan", "batch 1 submitted");
    }
    {
        FileSink sink(path, "20240302_080000");
        sink.Write(LogLevel::Warn, "gateway", "retrying submit");
    }

    std::ifstream in(path);
    std::string line;
    std::vector<nlohmann::json> records;
    while (std::getline(in, line)) records.push_back(nlohmann::json::parse(line));
    REQUIRE(records.size() == 2);
    CHECK(records[0]["run"] == "20240301_120000");
    CHECK(records[1]["run"] == "20240302_080000");
    CHECK(records[1]["component"] == "gateway");

    std::remove(path.c_str());
}

TEST_CASE("FileSink: unwritable path is silently closed", "[log]") {
    FileSink sink("/nonexistent-dir/pbi_scan/x.log");
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Error, "x", "dropped");
}

// ===========================================================================
// MultiSink
// ===========================================================================

TEST_CASE("MultiSink: forwards every record to each child", "[log]") {
    std::vector<CapturedMessage> a;
    std::vector<CapturedMessage> b;
    MultiSink multi;
    multi.Add(std::make_unique<CaptureSink>(&a));
    multi.Add(std::make_unique<CaptureSink>(&b));

    multi.Write(LogLevel::Warn, "batch", "Batch 2 failed");

    REQUIRE(a.size() == 1);
    REQUIRE(b.size() == 1);
    CHECK(a[0].message == "Batch 2 failed");
    CHECK(b[0].component == "batch");
}

TEST_CASE("MultiSink: empty fan-out is a no-op", "[log]") {
    MultiSink multi;
    multi.Write(LogLevel::Info, "x", "nobody listens");
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: filters below min_level", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(&captured), LogLevel::Warn);

    logger.Debug("c", "filtered");
    logger.Info("c", "filtered");
    logger.Warn("c", "kept");
    logger.Error("c", "kept");

    REQUIRE(captured.size() == 2);
    CHECK(captured[0].level == LogLevel::Warn);
    CHECK(captured[1].level == LogLevel::Error);
}

TEST_CASE("Logger: SetLevel takes effect immediately", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(&captured), LogLevel::Error);

    logger.Info("c", "filtered");
    CHECK(captured.empty());

    logger.SetLevel(LogLevel::Debug);
    logger.Debug("poll", "status Running");
    REQUIRE(captured.size() == 1);
    CHECK(captured[0].component == "poll");
    CHECK(captured[0].message == "status Running");
}

TEST_CASE("Logger: concurrent writers lose nothing", "[log]") {
    std::vector<CapturedMessage> captured;
    Logger logger(std::make_unique<CaptureSink>(&captured), LogLevel::Debug);

    constexpr int kThreads = 8;
    constexpr int kMessagesPerThread = 100;

    std::vector<std::thread> threads;
    threads.reserve(kThreads);
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kMessagesPerThread; ++i) {
                logger.Info("thread-" + std::to_string(t),
                            "msg-" + std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(captured.size() == kThreads * kMessagesPerThread);
}

TEST_CASE("Global logger: routes through InitGlobalLogger", "[log]") {
    std::vector<CapturedMessage> captured;
    InitGlobalLogger(std::make_unique<CaptureSink>(&captured), LogLevel::Info);

    LogDebug("g", "filtered");
    LogInfo("g", "info");
    LogError("g", "error");

    CHECK(captured.size() == 2);

    // Restore a quiet logger so later tests do not write into `captured`.
    InitGlobalLogger(std::make_unique<MultiSink>(), LogLevel::Error);
}
