//! # Log Initialization from CLI
//!
//! Parses logging-related command-line arguments and the LETC_LOG
//! environment variable to produce a LogConfig.

#include "letc/log/log.hpp"

#include <cstdlib>
#include <string>

namespace letc::log {

static bool is_verbosity_flag(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-')
        return false;
    return arg.find_first_not_of('v', 1) == std::string_view::npos;
}

bool is_log_option(std::string_view arg) {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || is_verbosity_flag(arg);
}

LogConfig parse_log_options(const std::vector<std::string>& args) {
    LogConfig config;
    config.level = LogLevel::Warn; // Default: only warnings and above

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (const auto& arg : args) {
        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            if (v_count == 0)
                v_count = 1;
        } else if (is_verbosity_flag(arg)) {
            int count = static_cast<int>(arg.size() - 1);
            if (count > v_count) {
                v_count = count;
            }
        }
    }

    // -v = Info, -vv = Debug, -vvv = Trace, unless --log-level was given
    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("LETC_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            // "module=level" pairs or a bare module list are filter specs,
            // anything else is a level name.
            if (env_str.find('=') != std::string::npos || env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace letc::log
