//! # Argument Parsing
//!
//! | Option                 | Effect                                        |
//! |------------------------|-----------------------------------------------|
//! | `--help`, `-h`         | Print usage                                   |
//! | `--version`, `-V`      | Print the version                             |
//! | `--ignore-warnings`    | Warnings neither print nor fail the run       |
//! | `--no-annotate`        | No provenance comments in ES3 output          |
//! | `--es6`                | Native `{ let ...; }` output                  |
//! | `--compile`            | Compile standard input                        |
//! | `--compile=<file>`     | Compile a file (repeatable)                   |
//! | `--error-format=json`  | Diagnostics as JSON lines                     |
//! | `--no-color`           | No ANSI colors                                |
//!
//! Logging options are recognized here and parsed by `log::parse_log_options`.

#include "cli.hpp"

#include "letc/log/log.hpp"

namespace letc::cli {

namespace {

const std::vector<std::string> KNOWN_OPTIONS = {
    "--help",        "--version",      "--ignore-warnings", "--no-annotate", "--es6",
    "--compile",     "--compile=",     "--error-format=",   "--no-color",    "--log-level=",
    "--log-filter=", "--log-file=",    "--log-format=",     "--verbose",     "--quiet",
};

std::string unknown_option(const std::string& arg) {
    std::string message = "unknown option '" + arg + "'";
    const size_t eq = arg.find('=');
    const bool takes_value = eq != std::string::npos;
    auto name = takes_value ? arg.substr(0, eq + 1) : arg;

    // Only suggest options of the same shape: `--x=value` or bare `--x`
    std::vector<std::string> candidates;
    for (const auto& option : KNOWN_OPTIONS) {
        if (option.ends_with('=') == takes_value) {
            candidates.push_back(option);
        }
    }
    auto suggestion = find_similar(name, candidates);
    if (!suggestion.empty()) {
        message += "; did you mean '" + suggestion + "'?";
    }
    return message;
}

} // anonymous namespace

auto parse_cli_args(const std::vector<std::string>& args) -> Result<CliOptions, std::string> {
    CliOptions options;
    bool has_stdin_unit = false;

    for (const auto& arg : args) {
        if (arg == "--help" || arg == "-h") {
            options.show_help = true;
        } else if (arg == "--version" || arg == "-V") {
            options.show_version = true;
        } else if (arg == "--ignore-warnings") {
            options.ignore_warnings = true;
        } else if (arg == "--no-annotate") {
            options.compile.annotate = false;
        } else if (arg == "--es6") {
            options.compile.target_es3 = false;
        } else if (arg == "--compile") {
            if (has_stdin_unit) {
                return std::string("'--compile' (standard input) given more than once");
            }
            has_stdin_unit = true;
            options.units.push_back(CompileUnit{.path = "<stdin>", .from_stdin = true});
        } else if (arg.starts_with("--compile=")) {
            std::string path = arg.substr(10);
            if (path.empty()) {
                return std::string("option '--compile=' requires a file path");
            }
            options.units.push_back(CompileUnit{.path = std::move(path), .from_stdin = false});
        } else if (arg.starts_with("--error-format=")) {
            std::string format = arg.substr(15);
            if (format == "json") {
                options.diagnostic_format = DiagnosticFormat::JSON;
            } else if (format == "text") {
                options.diagnostic_format = DiagnosticFormat::Text;
            } else {
                return "invalid value '" + format + "' for '--error-format' (expected text or json)";
            }
        } else if (arg == "--no-color") {
            options.color = false;
        } else if (arg.starts_with("--log-level=")) {
            if (!log::try_parse_level(arg.substr(12))) {
                return "invalid log level '" + arg.substr(12) + "'";
            }
        } else if (arg.starts_with("--log-format=")) {
            std::string format = arg.substr(13);
            if (format != "text" && format != "json" && format != "JSON") {
                return "invalid value '" + format + "' for '--log-format' (expected text or json)";
            }
        } else if (log::is_log_option(arg)) {
            // Parsed below
        } else if (!arg.empty() && arg[0] != '-') {
            return "unexpected argument '" + arg + "'; use --compile=" + arg;
        } else {
            return unknown_option(arg);
        }
    }

    options.log = log::parse_log_options(args);
    options.log.colors = options.color;
    return options;
}

} // namespace letc::cli
