//! # letc Entry Point
//!
//! The binary is named `letc`. All work happens in the CLI driver
//! (`cli/cli.hpp`).
//!
//! ## Usage
//!
//! ```bash
//! letc --compile=app.js              # ES3 try/catch emulation, annotated
//! letc --es6 --compile=app.js        # native { let ...; } blocks
//! cat app.js | letc --no-annotate --compile
//! ```

#include "cli/cli.hpp"

int main(int argc, char* argv[]) {
    return letc::cli::letc_main(argc, argv);
}
