//! # Token Definitions
//!
//! This module defines the tokens produced by the lexer.
//!
//! ## Overview
//!
//! Tokens fall into four groups:
//!
//! - **Words**: identifiers, numbers and the distinguished `let` keyword
//! - **Punctuators**: JavaScript operators and delimiters, maximal munch
//! - **Trivia**: whitespace runs and line breaks, kept as tokens
//! - **Literals**: strings, templates, regexes and comments, opaque
//!
//! ## Losslessness
//!
//! Every byte of the source belongs to exactly one token, so concatenating
//! the lexemes of a token sequence reproduces the source. Pass-through
//! regions of the output are emitted from these lexemes.

#ifndef LETC_LEXER_TOKEN_HPP
#define LETC_LEXER_TOKEN_HPP

#include "letc/common.hpp"

#include <cstdint>
#include <initializer_list>
#include <string>
#include <string_view>
#include <vector>

namespace letc::lexer {

/// All token kinds.
enum class TokenKind : uint8_t {
    Eof, ///< End of input; empty lexeme.

    // ========================================================================
    // Words
    // ========================================================================
    Identifier, ///< `foo`, `$bar`, `_baz`, keywords other than `let`
    KwLet,      ///< The `let` keyword
    Number,     ///< `42`, `0xFF`, `1.5e3`

    // ========================================================================
    // Punctuators
    // ========================================================================
    Punct, ///< Operator or delimiter: `(`, `{`, `,`, `=`, `===`, `=>`, ...

    // ========================================================================
    // Trivia
    // ========================================================================
    Whitespace, ///< Run of spaces, tabs and other non-newline blanks
    Newline,    ///< `\n`, `\r\n` or lone `\r`

    // ========================================================================
    // Literals (opaque)
    // ========================================================================
    StringLiteral,   ///< `'...'` or `"..."`
    TemplateLiteral, ///< `` `...` ``
    RegexLiteral,    ///< `/.../flags`
    LineComment,     ///< `// ...`
    BlockComment,    ///< `/* ... */`
};

/// A single lexical unit.
///
/// `lexeme` views the `Source` the token was lexed from, so the source must
/// outlive the token.
struct Token {
    /// The kind of token.
    TokenKind kind;

    /// Source location of this token.
    SourceSpan span;

    /// Raw text from source code.
    std::string_view lexeme;

    [[nodiscard]] auto is(TokenKind k) const -> bool {
        return kind == k;
    }

    [[nodiscard]] auto is_one_of(std::initializer_list<TokenKind> kinds) const -> bool {
        for (auto k : kinds) {
            if (kind == k)
                return true;
        }
        return false;
    }

    [[nodiscard]] auto is_eof() const -> bool {
        return kind == TokenKind::Eof;
    }

    /// Checks for a punctuator with exactly this text.
    [[nodiscard]] auto is_punct(std::string_view text) const -> bool {
        return kind == TokenKind::Punct && lexeme == text;
    }

    /// Whitespace or newline.
    [[nodiscard]] auto is_blank() const -> bool {
        return kind == TokenKind::Whitespace || kind == TokenKind::Newline;
    }

    /// Whitespace, newline or comment: tokens with no structural meaning.
    [[nodiscard]] auto is_trivia() const -> bool {
        return is_blank() || kind == TokenKind::LineComment || kind == TokenKind::BlockComment;
    }
};

/// Returns a display name for a token kind (used in diagnostics and dumps).
[[nodiscard]] auto token_kind_to_string(TokenKind kind) -> std::string_view;

/// Checks if a kind is one of the opaque literal kinds (comments included).
[[nodiscard]] auto is_literal(TokenKind kind) -> bool;

/// Concatenates the lexemes of `tokens`.
[[nodiscard]] auto join_lexemes(const std::vector<Token>& tokens) -> std::string;

} // namespace letc::lexer

#endif // LETC_LEXER_TOKEN_HPP
