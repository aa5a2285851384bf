//! # Compilation Pipeline
//!
//! Entry points for the text -> tokens -> AST -> text pipeline.
//!
//! ```text
//! source --lex--> tokens --parse--> Program --generate--> output
//! ```
//!
//! `compile()` runs all three stages. The stages stay callable on their own
//! for callers that inspect tokens or the tree.
//!
//! ## Diagnostics
//!
//! Every stage that can warn takes a `DiagnosticSink&`. The overloads without
//! one record into a fresh sink that is dropped on return; pass a sink (for
//! example `diag::global_diagnostics()`) to keep the warnings.
//!
//! ## Example
//!
//! ```cpp
//! CompileOptions options;
//! options.target_es3 = true;
//! diag::DiagnosticSink sink;
//! std::string js = letc::compile(source, options, sink, "app.js");
//! for (const auto& d : sink.diagnostics()) { ... }
//! ```

#ifndef LETC_COMPILE_HPP
#define LETC_COMPILE_HPP

#include "letc/common.hpp"
#include "letc/diag/diagnostics.hpp"
#include "letc/lexer/source.hpp"
#include "letc/lexer/token.hpp"
#include "letc/literal/classifier.hpp"
#include "letc/parser/ast.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace letc {

/// Returns the shared default `JsLiteralClassifier`.
[[nodiscard]] auto default_classifier() -> const literal::LiteralClassifier&;

// ============================================================================
// Stages
// ============================================================================

/// Tokenizes `source`. The source must outlive the returned tokens.
[[nodiscard]] auto lex(const lexer::Source& source, diag::DiagnosticSink& sink,
                       const literal::LiteralClassifier& classifier = default_classifier())
    -> std::vector<lexer::Token>;

/// Tokenizes `source`, discarding diagnostics.
[[nodiscard]] auto lex(const lexer::Source& source) -> std::vector<lexer::Token>;

/// Builds the let-block tree from a token sequence.
[[nodiscard]] auto parse(std::vector<lexer::Token> tokens, diag::DiagnosticSink& sink)
    -> parser::Program;

/// Builds the let-block tree, discarding diagnostics.
[[nodiscard]] auto parse(std::vector<lexer::Token> tokens) -> parser::Program;

/// Emits output text for `program`.
[[nodiscard]] auto generate(const parser::Program& program, const CompileOptions& options = {})
    -> std::string;

// ============================================================================
// Whole Pipeline
// ============================================================================

/// Output text and the diagnostics recorded while producing it.
struct CompileResult {
    std::string output;
    std::vector<diag::Diagnostic> diagnostics;
};

/// `generate(parse(lex(source)), options)`, recording into `sink`.
/// `name` labels the unit in diagnostics.
[[nodiscard]] auto compile(std::string_view source, const CompileOptions& options,
                           diag::DiagnosticSink& sink,
                           const literal::LiteralClassifier& classifier,
                           std::string name = "<input>") -> std::string;

/// Same, with the default classifier.
[[nodiscard]] auto compile(std::string_view source, const CompileOptions& options,
                           diag::DiagnosticSink& sink, std::string name = "<input>")
    -> std::string;

/// Same, with a fresh sink that is dropped on return.
[[nodiscard]] auto compile(std::string_view source, const CompileOptions& options = {})
    -> std::string;

/// Compiles with a fresh sink and returns its contents alongside the output.
[[nodiscard]] auto compile_with_diagnostics(std::string_view source,
                                            const CompileOptions& options = {},
                                            std::string name = "<input>") -> CompileResult;

} // namespace letc

#endif // LETC_COMPILE_HPP
