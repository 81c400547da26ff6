#pragma once

#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace pbi_scan {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

// Abstract log sink: implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message) = 0;
};

// Color console sink: colored, compact output to a stream.
// When use_color is false, writes "<iso-ts> [LEVEL] [component] message".
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// JSON sink: machine-readable JSON lines to a stream.
// {"ts":..,"run":..,"level":..,"component":..,"message":..}; "run" is the
// scan run id (the output directory timestamp) and is omitted when empty.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out, std::string run_id = "");
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ostream& out_;
    std::string run_id_;
};

// File sink: JSON lines appended to a file it owns. Several runs may share
// one log file; run_id tells their lines apart.
class FileSink : public ILogSink {
public:
    explicit FileSink(const std::string& path, std::string run_id = "");
    [[nodiscard]] bool IsOpen() const { return file_.is_open(); }
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::ofstream file_;
    JsonSink json_;
};

// Fan-out sink: forwards every record to each child sink in order.
class MultiSink : public ILogSink {
public:
    void Add(std::unique_ptr<ILogSink> sink);
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override;
private:
    std::vector<std::unique_ptr<ILogSink>> sinks_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);

    void Debug(std::string_view component, std::string_view message);
    void Info(std::string_view component, std::string_view message);
    void Warn(std::string_view component, std::string_view message);
    void Error(std::string_view component, std::string_view message);

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger: set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Initialize the global logger. Must be called before any logging.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Get the global logger. Returns a no-op logger if not initialized.
Logger& GlobalLogger();

void LogDebug(std::string_view component, std::string_view message);
void LogInfo(std::string_view component, std::string_view message);
void LogWarn(std::string_view component, std::string_view message);
void LogError(std::string_view component, std::string_view message);

} // namespace pbi_scan
