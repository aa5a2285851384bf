//! # CLI Dispatcher
//!
//! Entry point of the `letc` binary: sets up logging, then compiles each
//! unit in invocation order against one shared diagnostics sink.
//!
//! ## Return Codes
//!
//! | Code | Meaning                                                   |
//! |------|-----------------------------------------------------------|
//! | 0    | Success (or only warnings with `--ignore-warnings`)       |
//! | 1    | Invalid option, unreadable input, or a reported warning   |

#include "cli.hpp"

#include "letc/compile.hpp"
#include "letc/diag/diagnostics.hpp"
#include "letc/lexer/source.hpp"
#include "letc/log/log.hpp"

#include <iostream>

namespace letc::cli {

void print_usage(std::ostream& out) {
    out << "letc " << VERSION << " - let-block compiler for JavaScript\n\n";
    out << "Usage: letc [options] --compile[=<file>]...\n\n";
    out << "Rewrites `let (a = 1, b) { ... }` blocks. Output goes to stdout in the\n";
    out << "order the units are given; everything else passes through unchanged.\n\n";
    out << "Options:\n";
    out << "  --compile             Compile standard input\n";
    out << "  --compile=<file>      Compile <file> (repeatable)\n";
    out << "  --es6                 Emit native `{ let ...; }` blocks (default: ES3 try/catch)\n";
    out << "  --no-annotate         Omit /*let*/ comments from ES3 output\n";
    out << "  --ignore-warnings     Do not print warnings or fail because of them\n";
    out << "  --error-format=json   Print diagnostics as JSON lines\n";
    out << "  --no-color            Disable colored output\n";
    out << "  --help, -h            Show this message\n";
    out << "  --version, -V         Show the version\n\n";
    out << "Logging:\n";
    out << "  --log-level=<level>   trace, debug, info, warn (default), error, off\n";
    out << "  --log-filter=<spec>   Per-module levels, e.g. parser=trace,*=warn\n";
    out << "  --log-file=<path>     Also write log records to <path>\n";
    out << "  --log-format=json     Log records as JSON lines\n";
    out << "  -v, -vv, -vvv         info, debug, trace\n";
    out << "  -q                    Errors only\n\n";
    out << "Environment:\n";
    out << "  LETC_LOG              Level or filter spec when no log option is given\n";
}

void print_version(std::ostream& out) {
    out << "letc " << VERSION << "\n";
}

auto run_cli(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& err)
    -> int {
    if (options.show_help) {
        print_usage(out);
        return 0;
    }
    if (options.show_version) {
        print_version(out);
        return 0;
    }
    if (options.units.empty()) {
        print_usage(out);
        return 0;
    }

    DiagnosticEmitter emitter(err);
    if (!options.color) {
        emitter.set_color_enabled(false);
    }
    emitter.set_format(options.diagnostic_format);

    diag::DiagnosticSink sink;
    bool failed = false;

    for (const auto& unit : options.units) {
        LETC_LOG_INFO("cli", "compiling " << unit.path);

        auto loaded = unit.from_stdin ? lexer::Source::from_stream(in)
                                      : lexer::Source::from_file(unit.path);
        if (is_err(loaded)) {
            diag::Diagnostic error{.severity = diag::Severity::Error,
                                   .code = unit.from_stdin ? diag::ErrorCodes::IO_ERROR
                                                           : diag::ErrorCodes::FILE_NOT_FOUND,
                                   .message = unwrap_err(loaded),
                                   .span = {},
                                   .file = unit.path};
            sink.report(error);
            emitter.emit(error);
            LETC_LOG_ERROR("cli", unwrap_err(loaded));
            failed = true;
            continue;
        }

        const auto& source = unwrap(loaded);
        emitter.set_source_content(std::string(source.filename()), std::string(source.content()));

        size_t first = sink.size();
        auto program = parse(lex(source, sink), sink);
        out << generate(program, options.compile);
        out.flush();

        auto raised = sink.diagnostics_since(first);
        LETC_LOG_INFO("cli", unit.path << ": " << parser::count_let_blocks(program)
                                       << " let-block(s), " << raised.size()
                                       << " diagnostic(s)");

        if (raised.empty() || options.ignore_warnings) {
            continue;
        }
        emitter.emit_all(raised);
        failed = true;
    }

    return failed ? 1 : 0;
}

int letc_main(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        args.emplace_back(argv[i]);
    }

    auto parsed = parse_cli_args(args);
    if (is_err(parsed)) {
        log::Logger::init(log::parse_log_options({}));

        DiagnosticEmitter emitter(std::cerr);
        emitter.emit(diag::Diagnostic{.severity = diag::Severity::Error,
                                      .code = diag::ErrorCodes::INVALID_OPTION,
                                      .message = unwrap_err(parsed),
                                      .span = {},
                                      .file = {}});
        std::cerr << "Run 'letc --help' for usage.\n";
        return 1;
    }

    const auto& options = unwrap(parsed);
    log::Logger::init(options.log);
    LETC_LOG_DEBUG("cli", "target " << (options.compile.target_es3 ? "ES3" : "native")
                                    << ", annotate " << options.compile.annotate << ", "
                                    << options.units.size() << " unit(s)");

    int code = run_cli(options, std::cin, std::cout, std::cerr);
    log::Logger::instance().flush();
    return code;
}

} // namespace letc::cli
