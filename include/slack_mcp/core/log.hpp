#pragma once

#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace slack_mcp {

enum class LogLevel {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
};

/// Parse "DEBUG", "info", "Warn", ... (case-insensitive). nullopt on anything else.
std::optional<LogLevel> ParseLogLevel(std::string_view text);

// Structured context attached to a log line, rendered in insertion order.
using LogContext = std::vector<std::pair<std::string, std::string>>;

// Abstract log sink - implementations decide where/how to write.
class ILogSink {
public:
    virtual ~ILogSink() = default;
    virtual void Write(LogLevel level, std::string_view component,
                       std::string_view message,
                       const LogContext& context) = 0;
};

// Color console sink - colored, compact output to a stream.
// When use_color is false, writes "<ISO-8601> [LEVEL] [component] message".
class ColorConsoleSink : public ILogSink {
public:
    explicit ColorConsoleSink(bool use_color, std::ostream& out = std::cerr);
    void Write(LogLevel level, std::string_view component,
               std::string_view message, const LogContext& context) override;
private:
    bool use_color_;
    std::ostream& out_;
};

// JSON sink - machine-readable JSON lines to a stream.
class JsonSink : public ILogSink {
public:
    explicit JsonSink(std::ostream& out);
    void Write(LogLevel level, std::string_view component,
               std::string_view message, const LogContext& context) override;
private:
    std::ostream& out_;
};

// Thread-safe logger that dispatches to a sink.
class Logger {
public:
    explicit Logger(std::unique_ptr<ILogSink> sink,
                    LogLevel min_level = LogLevel::Info);

    void SetLevel(LogLevel level);
    [[nodiscard]] bool IsEnabled(LogLevel level) const;

    void Debug(std::string_view component, std::string_view message,
               const LogContext& context = {});
    void Info(std::string_view component, std::string_view message,
              const LogContext& context = {});
    void Warn(std::string_view component, std::string_view message,
              const LogContext& context = {});
    void Error(std::string_view component, std::string_view message,
               const LogContext& context = {});

private:
    void Log(LogLevel level, std::string_view component,
             std::string_view message, const LogContext& context);

    std::unique_ptr<ILogSink> sink_;
    LogLevel min_level_;
    mutable std::mutex mutex_;
};

// ---------------------------------------------------------------------------
// Global logger - set once at startup, used by all components.
// ---------------------------------------------------------------------------

/// Initialize the global logger. Must be called before any logging.
void InitGlobalLogger(std::unique_ptr<ILogSink> sink, LogLevel min_level);

/// Get the global logger. Returns a no-op logger if not initialized.
/// Stays valid during static destruction.
Logger& GlobalLogger();

/// Convenience free functions that forward to GlobalLogger().
void LogDebug(std::string_view component, std::string_view message,
              const LogContext& context = {});
void LogInfo(std::string_view component, std::string_view message,
             const LogContext& context = {});
void LogWarn(std::string_view component, std::string_view message,
             const LogContext& context = {});
void LogError(std::string_view component, std::string_view message,
              const LogContext& context = {});

} // namespace slack_mcp
