//! # Logger Implementation
//!
//! Implements the Logger singleton, the sinks and LogFilter.

#include "letc/log/log.hpp"

#include <cstdlib>
#include <iomanip>

#include <unistd.h>

namespace letc::log {

// ============================================================================
// Terminal Color Detection
// ============================================================================

/// Detects if stderr supports ANSI color codes.
static bool detect_terminal_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

// ============================================================================
// Record Formatting
// ============================================================================

static void append_escaped(std::ostringstream& oss, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            oss << c;
        }
    }
}

std::string format_text(const LogRecord& record) {
    std::ostringstream oss;
    oss << get_timestamp() << " " << std::left << std::setw(5) << level_name(record.level) << " ["
        << record.module << "] " << record.message << "\n";
    return oss.str();
}

std::string format_json(const LogRecord& record) {
    std::ostringstream oss;
    oss << "{\"ts\":" << record.timestamp_ms << ","
        << "\"level\":\"" << level_name(record.level) << "\","
        << "\"module\":\"";
    append_escaped(oss, record.module);
    oss << "\",\"msg\":\"";
    append_escaped(oss, record.message);
    oss << "\"}\n";
    return oss.str();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors, std::ostream& out)
    : out_(out), colors_enabled_(use_colors && &out == &std::cerr && detect_terminal_colors()) {}

const char* ConsoleSink::level_color(LogLevel level) const {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m"; // Dark gray
    case LogLevel::Debug:
        return "\033[36m"; // Cyan
    case LogLevel::Info:
        return "\033[32m"; // Green
    case LogLevel::Warn:
        return "\033[33m"; // Yellow
    case LogLevel::Error:
        return "\033[31m"; // Red
    case LogLevel::Fatal:
        return "\033[1;31m"; // Bold red
    case LogLevel::Off:
        return "";
    }
    return "";
}

void ConsoleSink::write(const LogRecord& record) {
    if (format_ == LogFormat::JSON) {
        out_ << format_json(record);
        return;
    }

    std::ostringstream oss;
    oss << get_timestamp() << " ";

    if (colors_enabled_) {
        oss << level_color(record.level);
    }

    // Pad level name to 5 chars for alignment
    oss << std::left << std::setw(5) << level_name(record.level);

    if (colors_enabled_) {
        oss << "\033[0m";
    }

    oss << " [" << record.module << "] " << record.message << "\n";

    out_ << oss.str();
}

void ConsoleSink::flush() {
    out_.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record));

    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    // Comma-separated "module=level" pairs
    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = token.substr(eq + 1);
            if (mod == "*") {
                default_level_ = parse_level(lvl);
            } else {
                module_levels_[std::string(mod)] = parse_level(lvl);
            }
        } else if (!token.empty()) {
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;
    logger.filter_ = LogFilter{};

    // A spec without "*=level" keeps the configured level as its default.
    logger.filter_.set_default_level(config.level);

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // The fast path in should_log() must not reject what a per-module
        // override accepts.
        logger.level_ = logger.filter_.min_level();
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    // Fast path: level check without lock
    if (level < level_)
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    if (sinks_.empty())
        return false;
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();

    log(record);
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    if (filter_.min_level() < level_) {
        level_ = filter_.min_level();
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace letc::log
