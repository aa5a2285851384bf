//! # Lexer
//!
//! Converts JavaScript source text into a lossless token sequence.
//!
//! ## Features
//!
//! - **Literal opacity**: strings, templates, regexes and comments come from
//!   the injected `LiteralClassifier` and become single opaque tokens
//! - **Losslessness**: whitespace and line breaks are tokens too, so the
//!   lexemes concatenate back to the input
//! - **Distinguished `let`**: the word `let` gets its own kind for the parser
//! - **Maximal munch punctuators**: `===` is one token, not three
//!
//! ## Error Recovery
//!
//! Lexing never fails. A literal the classifier could not terminate becomes
//! a token running to the end of its span and a warning is reported to the
//! diagnostics sink.
//!
//! ## Example
//!
//! ```cpp
//! Source source = Source::from_string("let (x = 1) { f(x) }");
//! literal::JsLiteralClassifier classifier;
//! diag::DiagnosticSink sink;
//! Lexer lexer(source, classifier, sink);
//! std::vector<Token> tokens = lexer.tokenize(); // ends with Eof
//! ```

#ifndef LETC_LEXER_LEXER_HPP
#define LETC_LEXER_LEXER_HPP

#include "letc/common.hpp"
#include "letc/diag/diagnostics.hpp"
#include "letc/lexer/source.hpp"
#include "letc/lexer/token.hpp"
#include "letc/literal/classifier.hpp"

#include <vector>

namespace letc::lexer {

/// Lexical analyzer over one source unit.
///
/// The source, classifier and sink must outlive the lexer; the source must
/// also outlive the produced tokens.
class Lexer {
public:
    Lexer(const Source& source, const literal::LiteralClassifier& classifier,
          diag::DiagnosticSink& sink);

    /// Tokenizes the entire source. The last token is always `Eof`.
    [[nodiscard]] auto tokenize() -> std::vector<Token>;

private:
    const Source& source_;
    const literal::LiteralClassifier& classifier_;
    diag::DiagnosticSink& sink_;

    std::vector<Token> tokens_;
    size_t pos_ = 0;         ///< Current byte position.
    size_t region_end_ = 0;  ///< End of the code span being lexed.
    size_t token_start_ = 0; ///< Start of the token being built.

    // ========================================================================
    // Character Access
    // ========================================================================

    [[nodiscard]] auto peek() const -> char;
    [[nodiscard]] auto peek_n(size_t n) const -> char;
    auto advance() -> char;
    [[nodiscard]] auto is_at_region_end() const -> bool;

    // ========================================================================
    // Token Creation
    // ========================================================================

    void push_token(TokenKind kind);

    // ========================================================================
    // Code Spans
    // ========================================================================

    /// Lexes `[start, end)` as code.
    void lex_code(size_t start, size_t end);

    void lex_whitespace();
    void lex_newline();
    void lex_word();
    void lex_number();
    void lex_punct();

    // ========================================================================
    // Literal Spans
    // ========================================================================

    /// Emits one opaque token for a classified literal span and reports it if
    /// it is unterminated.
    void lex_literal(const literal::LiteralSpan& span);
};

/// Checks if `c` can start an identifier (`$`, `_`, letters, `\` escapes,
/// any non-ASCII byte).
[[nodiscard]] auto is_identifier_start(char c) -> bool;

/// Checks if `c` can continue an identifier.
[[nodiscard]] auto is_identifier_continue(char c) -> bool;

/// Checks if `text` is a single well-formed identifier word.
[[nodiscard]] auto is_identifier(std::string_view text) -> bool;

} // namespace letc::lexer

#endif // LETC_LEXER_LEXER_HPP
