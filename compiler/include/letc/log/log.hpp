//! # Logging
//!
//! Structured logging for the compiler and its CLI:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering ("lexer", "parser",
//!   "codegen", "driver", "cli")
//! - Console, file and null sinks
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via LETC_MIN_LOG_LEVEL
//! - ANSI colored console output with terminal detection
//!
//! ## Usage
//!
//! ```cpp
//! LETC_LOG_INFO("cli", "compiling " << path);
//! LETC_LOG_TRACE("parser", "let-block at " << line << ":" << column);
//! ```
//!
//! Nothing is written until `Logger::init()` installs sinks.

#ifndef LETC_LOG_LOG_HPP
#define LETC_LOG_LOG_HPP

#include <chrono>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace letc::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

namespace detail {

struct LevelNames {
    LogLevel level;
    const char* upper;
    const char* lower;
};

inline constexpr LevelNames LEVEL_NAMES[] = {
    {LogLevel::Trace, "TRACE", "trace"}, {LogLevel::Debug, "DEBUG", "debug"},
    {LogLevel::Info, "INFO", "info"},    {LogLevel::Warn, "WARN", "warn"},
    {LogLevel::Error, "ERROR", "error"}, {LogLevel::Fatal, "FATAL", "fatal"},
    {LogLevel::Off, "OFF", "off"},
};

} // namespace detail

/// Returns the upper-case name for a log level (e.g., "TRACE").
inline const char* level_name(LogLevel level) {
    for (const auto& entry : detail::LEVEL_NAMES) {
        if (entry.level == level) {
            return entry.upper;
        }
    }
    return "???";
}

/// Parses an all-lower or all-upper case level name.
inline std::optional<LogLevel> try_parse_level(std::string_view s) {
    for (const auto& entry : detail::LEVEL_NAMES) {
        if (s == entry.upper || s == entry.lower) {
            return entry.level;
        }
    }
    return std::nullopt;
}

/// Like `try_parse_level`, falling back to LogLevel::Info.
inline LogLevel parse_level(std::string_view s) {
    return try_parse_level(s).value_or(LogLevel::Info);
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "parser")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Console sink; writes to stderr unless another stream is given.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true, std::ostream& out = std::cerr);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ostream& out_;
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;

    const char* level_color(LogLevel level) const;
};

/// File sink. Flushes after Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Sink that discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Formats `record` as a text line: "HH:MM:SS.mmm LEVEL [module] message\n".
std::string format_text(const LogRecord& record);

/// Formats `record` as one JSON object followed by a newline.
std::string format_json(const LogRecord& record);

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "parser=trace,lexer=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Module names without "=level" are set to Trace.
    void parse(std::string_view spec);

    /// Check if a message at `level` from `module` passes the filter.
    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest configured level across all modules and the default.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Info;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

/// Thread-safe global logger.
class Logger {
public:
    /// Replaces sinks, level and filter with those described by `config`.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before building the message.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Returns current time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Returns milliseconds since epoch.
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging-related CLI options from `args` (program name excluded).
/// Recognizes --log-level=, --log-filter=, --log-file=, --log-format=,
/// -v/-vv/-vvv, --verbose and -q/--quiet. Falls back to the LETC_LOG
/// environment variable. Default level: Warn.
LogConfig parse_log_options(const std::vector<std::string>& args);

/// Checks if `arg` is one of the options `parse_log_options` consumes.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef LETC_MIN_LOG_LEVEL
#define LETC_MIN_LOG_LEVEL 0
#endif

/// Internal macro; use the level-specific macros below.
#define LETC_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= LETC_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::letc::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: LETC_LOG_TRACE("module", "message " << value);
#define LETC_LOG_TRACE(module, msg) LETC_LOG_IMPL(::letc::log::LogLevel::Trace, module, msg)
#define LETC_LOG_DEBUG(module, msg) LETC_LOG_IMPL(::letc::log::LogLevel::Debug, module, msg)
#define LETC_LOG_INFO(module, msg) LETC_LOG_IMPL(::letc::log::LogLevel::Info, module, msg)
#define LETC_LOG_WARN(module, msg) LETC_LOG_IMPL(::letc::log::LogLevel::Warn, module, msg)
#define LETC_LOG_ERROR(module, msg) LETC_LOG_IMPL(::letc::log::LogLevel::Error, module, msg)
#define LETC_LOG_FATAL(module, msg) LETC_LOG_IMPL(::letc::log::LogLevel::Fatal, module, msg)

} // namespace letc::log

#endif // LETC_LOG_LOG_HPP
