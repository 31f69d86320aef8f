#include <slack_mcp/core/log.hpp>
#include <slack_mcp/core/ansi.hpp>
#include <slack_mcp/core/clock.hpp>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <iostream>

namespace slack_mcp {

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

// " key=value key2=value2"; values containing spaces are quoted.
void WritePlainContext(std::ostream& out, const LogContext& context) {
    for (const auto& [key, value] : context) {
        out << ' ' << key << '=';
        if (value.find(' ') != std::string::npos) {
            out << '"' << value << '"';
        } else {
            out << value;
        }
    }
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

void WritePlainLine(std::ostream& out, LogLevel level,
                    std::string_view component, std::string_view message,
                    const LogContext& context) {
    out << Iso8601Now()
        << " [" << LevelName(level) << "] "
        << "[" << component << "] "
        << message;
    WritePlainContext(out, context);
    out << '\n';
}

} // anonymous namespace

std::optional<LogLevel> ParseLogLevel(std::string_view text) {
    std::string upper(text);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::Debug;
    if (upper == "INFO") return LogLevel::Info;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::Warn;
    if (upper == "ERROR") return LogLevel::Error;
    return std::nullopt;
}

// ---------------------------------------------------------------------------
// ColorConsoleSink
// ---------------------------------------------------------------------------
ColorConsoleSink::ColorConsoleSink(bool use_color, std::ostream& out)
    : use_color_(use_color), out_(out) {}

void ColorConsoleSink::Write(LogLevel level, std::string_view component,
                             std::string_view message,
                             const LogContext& context) {
    if (!use_color_) {
        WritePlainLine(out_, level, component, message, context);
        return;
    }

    // HH:MM:SS LEVEL [component] message key=value
    const auto* level_color = LevelAnsi(level);

    out_ << ansi::kDim << HhMmSsNow() << ansi::kReset << ' ';
    out_ << level_color << LevelTag(level) << ansi::kReset << ' ';
    out_ << ansi::kDim << '[' << component << ']' << ansi::kReset << ' ';

    if (level == LogLevel::Error) {
        out_ << level_color << message << ansi::kReset;
    } else {
        out_ << message;
    }
    if (!context.empty()) {
        out_ << ansi::kDim;
        WritePlainContext(out_, context);
        out_ << ansi::kReset;
    }
    out_ << '\n';
}

// ---------------------------------------------------------------------------
// JsonSink
// ---------------------------------------------------------------------------
JsonSink::JsonSink(std::ostream& out) : out_(out) {}

void JsonSink::Write(LogLevel level, std::string_view component,
                     std::string_view message, const LogContext& context) {
    out_ << "{\"ts\":\"" << Iso8601Now()
         << "\",\"level\":\"" << LevelName(level)
         << "\",\"component\":\"";
    JsonEscape(out_, component);
    out_ << "\",\"message\":\"";
    JsonEscape(out_, message);
    out_ << '"';
    if (!context.empty()) {
        out_ << ",\"context\":{";
        bool first = true;
        for (const auto& [key, value] : context) {
            if (!first) out_ << ',';
            first = false;
            out_ << '"';
            JsonEscape(out_, key);
            out_ << "\":\"";
            JsonEscape(out_, value);
            out_ << '"';
        }
        out_ << '}';
    }
    out_ << "}\n";
    out_.flush();
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

bool Logger::IsEnabled(LogLevel level) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return static_cast<int>(level) >= static_cast<int>(min_level_);
}

void Logger::Debug(std::string_view component, std::string_view message,
                   const LogContext& context) {
    Log(LogLevel::Debug, component, message, context);
}

void Logger::Info(std::string_view component, std::string_view message,
                  const LogContext& context) {
    Log(LogLevel::Info, component, message, context);
}

void Logger::Warn(std::string_view component, std::string_view message,
                  const LogContext& context) {
    Log(LogLevel::Warn, component, message, context);
}

void Logger::Error(std::string_view component, std::string_view message,
                   const LogContext& context) {
    Log(LogLevel::Error, component, message, context);
}

void Logger::Log(LogLevel level, std::string_view component,
                 std::string_view message, const LogContext& context) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (static_cast<int>(level) >= static_cast<int>(min_level_)) {
        sink_->Write(level, component, message, context);
    }
}

// ---------------------------------------------------------------------------
// NullSink - discards all messages (used before InitGlobalLogger is called).
// ---------------------------------------------------------------------------
namespace {

class NullSink : public ILogSink {
public:
    void Write(LogLevel, std::string_view, std::string_view,
               const LogContext&) override {}
};

// Never destroyed: tool threads abandoned by a call timeout may still log
// while main() returns.
std::unique_ptr<Logger>& GlobalLoggerInstance() {
    static auto* instance = new std::unique_ptr<Logger>(std::make_unique<Logger>(
        std::make_unique<NullSink>(), LogLevel::Error));
    return *instance;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Global logger
// ---------------------------------------------------------------------------
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level) {
    GlobalLoggerInstance() = std::make_unique<Logger>(std::move(sink), min_level);
}

Logger& GlobalLogger() {
    return *GlobalLoggerInstance();
}

void LogDebug(std::string_view component, std::string_view message,
              const LogContext& context) {
    GlobalLogger().Debug(component, message, context);
}

void LogInfo(std::string_view component, std::string_view message,
             const LogContext& context) {
    GlobalLogger().Info(component, message, context);
}

void LogWarn(std::string_view component, std::string_view message,
             const LogContext& context) {
    GlobalLogger().Warn(component, message, context);
}

void LogError(std::string_view component, std::string_view message,
              const LogContext& context) {
    GlobalLogger().Error(component, message, context);
}

} // namespace slack_mcp
