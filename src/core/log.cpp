#include <pbi_scan/core/log.hpp>
#include <pbi_scan/core/ansi.hpp>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace pbi_scan {

namespace {

const char* LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
    }
    return "UNKNOWN";
}

// Fixed-width 5-char level tag (right-padded).
const char* LevelTag(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "     ";
}

const char* LevelAnsi(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return ansi::kDim;
        case LogLevel::Info:  return ansi::kCyan;
        case LogLevel::Warn:  return ansi::kYellow;
        case LogLevel::Error: return ansi::kRed;
    }
    return "";
}

std::tm ToTm(std::time_t t, bool utc) {
    std::tm out{};
#ifdef _WIN32
    if (utc) gmtime_s(&out, &t); else localtime_s(&out, &t);
#else
    if (utc) gmtime_r(&t, &out); else localtime_r(&t, &out);
#endif
    return out;
}

std::string Iso8601Now() {
    const auto now = std::chrono::system_clock::now();
    const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now.time_since_epoch()) % 1000;
    const auto utc = ToTm(std::chrono::system_clock::to_time_t(now), true);

    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S")
        << '.' << std::setfill('0') << std::setw(3) << ms.count()
        << 'Z';
    return oss.str();
}

std::string HhMmSsNow() {
    const auto local = ToTm(
        std::chrono::system_clock::to_time_t(std::chrono::system_clock::now()),
        false);
    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S");
    return oss.str();
}

// Escape a string for JSON output (handles \, ", and control characters).
void JsonEscape(std::ostream& out, std::string_view s) {
    for (char c : s) {
        switch (c) {
            case '"':  out << "\\\""; break;
            case '\\': out << "\\\\"; break;
            case '\n': out << "\\n";  break;
            case '\r': out << "\\r";  break;
            case '\t': out << "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    out << "\\u"
                        << std::hex << std::setfill('0') << std::setw(4)
                        << static_cast<int>(static_cast<unsigned char>(c))
                        << std::dec;
                } else {
                    out << c;
                }
                break;
        }
    }
}

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view) override {}
};

std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto instance = std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error);
    return instance;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message) {
    if (!use_color_) {
        out_ << Iso8601Now()
             << " [" << LevelName(level) << "] "
             << "[" << component << "] "
             << message << '\n';
        return;
    }

    // HH:MM:SS LEVEL [component] message
    const auto* level_color = LevelAnsi(level);
    out_ << ansi::kDim << HhMmSsNow() << ansi::kReset << ' '
         << level_color << LevelTag(level) << ansi::kReset << ' '
         << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';
    if (level == LogLevel::Error) {
        out_ << level_color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out, std::string run_id)
    : out_(out), run_id_(std::move(run_id)) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    out_ << "{\"ts\":\"" << Iso8601Now();
    if (!run_id_.empty()) {
        out_ << "\",\"run\":\"";
        JsonEscape(out_, run_id_);
    }
    out_ << "\",\"level\":\"" << LevelName(level)
         << "\",\"component\":\"";
    JsonEscape(out_, component);
    out_ << "\",\"message\":\"";
    JsonEscape(out_, message);
    out_ << "\"}\n";
}

// ---------------------------------------------------------------------------
// FileSink
// ---------------------------------------------------------------------------
FileSink::FileSink(const std::string& path, std::string run_id)
    : file_(path, std::ios::out | std::ios::app), json_(file_, std::move(run_id)) {}

void FileSink::Write(LogLevel level, std::string_view component,
                     std::string_view message) {
    if (!file_.is_open()) return;
    json_.Write(level, component, message);
    file_.flush();
}

// ---------------------------------------------------------------------------
// MultiSink
// ---------------------------------------------------------------------------
void MultiSink::Add(std::unique_ptr<ILogSink> sink) {
    sinks_.push_back(std::move(sink));
}

void MultiSink::Write(LogLevel level, std::string_view component,
                      std::string_view message) {
    for (auto& sink : sinks_) {
        sink->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Logger
// ---------------------------------------------------------------------------
Logger::Logger(std::unique_ptr<ILogSink> sink, LogLevel min_level)
    : sink_(std::move(sink)), min_level_(min_level) {}

void Logger::SetLevel(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    min_level_ = level;
}

void Logger::Debug(std::string_view component, std::string_view message) {
    Log(LogLevel::Debug, component, message);
}

void Logger::Info(std::string_view component, std::string_view message) {
    Log(LogLevel::Info, component, message);
}

void Logger::Warn(std::string_view component, std::string_view message) {
    Log(LogLevel::Warn, component, message);
}

void Logger::Error(std::string_view component, std::string_view message) {
    Log(LogLevel::Error, component, message);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(level, component, message);
    }
}

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message) {
    GlobalLogger().Debug(component, message);
}

void LogInfo(std::string_view component, std::string_view message) {
    GlobalLogger().Info(component, message);
}

void LogWarn(std::string_view component, std::string_view message) {
    GlobalLogger().Warn(component, message);
}

void LogError(std::string_view component, std::string_view message) {
    GlobalLogger().Error(component, message);
}

} // namespace pbi_scan
