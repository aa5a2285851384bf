//! # Command-Line Driver
//!
//! Argument parsing and the compile loop behind the `letc` binary.
//!
//! ## Flow
//!
//! ```text
//! letc_main()
//!   ├─ parse_cli_args()   → CliOptions or an E003 error
//!   ├─ Logger::init()
//!   └─ run_cli()
//!        ├─ --help / no units → print_usage()
//!        ├─ --version         → print_version()
//!        └─ per unit: read → lex → parse → generate → stdout, then
//!           that unit's diagnostics → stderr
//! ```

#pragma once

#include "diagnostic.hpp"
#include "letc/common.hpp"
#include "letc/log/log.hpp"

#include <iosfwd>
#include <string>
#include <vector>

namespace letc::cli {

/// One source unit to compile.
struct CompileUnit {
    std::string path; ///< File path, or `<stdin>`
    bool from_stdin = false;
};

/// Parsed command line.
struct CliOptions {
    bool show_help = false;
    bool show_version = false;
    bool ignore_warnings = false;
    bool color = true;

    /// The command line targets ES3 unless `--es6` is given.
    CompileOptions compile{.target_es3 = true, .annotate = true};

    /// Units in invocation order.
    std::vector<CompileUnit> units;

    DiagnosticFormat diagnostic_format = DiagnosticFormat::Text;
    log::LogConfig log;
};

/// Parses `args` (program name excluded).
///
/// Unknown options, `--compile=` without a path, a repeated `--compile` and
/// invalid option values are errors.
auto parse_cli_args(const std::vector<std::string>& args) -> Result<CliOptions, std::string>;

/// Compiles every unit in `options.units`, writing output to `out` and
/// diagnostics to `err`. `in` is read for the `--compile` unit.
///
/// Returns 1 if a file could not be read or an unsuppressed warning was
/// raised, 0 otherwise.
auto run_cli(const CliOptions& options, std::istream& in, std::ostream& out, std::ostream& err)
    -> int;

void print_usage(std::ostream& out);
void print_version(std::ostream& out);

/// Process entry point.
int letc_main(int argc, char* argv[]);

} // namespace letc::cli
