//! # Let-Block Parser
//!
//! Turns a token sequence into a `Program` of plain runs and let-blocks.
//!
//! ## Algorithm
//!
//! A single left-to-right pass. Punctuator tokens drive an explicit stack of
//! open brackets; literal tokens are opaque and never affect it. Open
//! let-blocks live on an explicit frame stack, so nesting depth is bounded by
//! memory rather than by the call stack.
//!
//! - `let` followed by `(` (modulo whitespace, newlines and comments) starts
//!   header parsing, unless the `let` follows `.` or `?.`
//! - `let x = 1;` and every other use of the word is plain text
//! - the `}` matching a body's `{` closes the innermost let-block
//!
//! ## Error Recovery
//!
//! Parsing never fails. A malformed header is reported and the `let` token is
//! passed through as plain text; scanning resumes right after it. A body left
//! open at end of input is reported and closed there. Mismatched closers in a
//! body are reported and passed through.

#ifndef LETC_PARSER_PARSER_HPP
#define LETC_PARSER_PARSER_HPP

#include "letc/common.hpp"
#include "letc/diag/diagnostics.hpp"
#include "letc/lexer/token.hpp"
#include "letc/parser/ast.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace letc::parser {

// Parser for let-blocks embedded in JavaScript
class Parser {
public:
    Parser(std::vector<lexer::Token> tokens, diag::DiagnosticSink& sink);

    // Parse the whole token sequence
    [[nodiscard]] auto parse() -> Program;

private:
    // An open let-block, or the program itself at the bottom of the stack.
    struct Frame {
        Box<LetBlockNode> block; // null for the program frame
        std::vector<Node> nodes;
        PlainNode pending;
        size_t bracket_base = 0; // bracket stack size when the body opened
    };

    // Result of a successful header parse.
    struct Header {
        std::vector<Declaration> declarations;
        size_t body_start = 0; // index of the token after `{`
    };

    std::vector<lexer::Token> tokens_;
    diag::DiagnosticSink& sink_;
    size_t pos_ = 0;

    std::vector<char> brackets_;
    std::vector<Frame> frames_;
    const lexer::Token* last_significant_ = nullptr;
    size_t header_start_ = 0; // `let` of the header being parsed
    size_t block_count_ = 0;

    // Token access
    [[nodiscard]] auto at(size_t index) const -> const lexer::Token&;
    [[nodiscard]] auto skip_trivia(size_t index) const -> size_t;

    // Plain runs
    void append_plain(const lexer::Token& token);
    void flush_pending(Frame& frame);

    // Brackets
    // Returns true if `token` closed the innermost let-block
    auto handle_closer(const lexer::Token& token) -> bool;
    [[nodiscard]] auto in_let_body() const -> bool {
        return frames_.size() > 1;
    }

    // Let-blocks (parser_let.cpp)
    [[nodiscard]] auto starts_let_block(size_t index) const -> bool;
    [[nodiscard]] auto parse_header(size_t index) -> std::optional<Header>;
    [[nodiscard]] auto parse_initializer(size_t index, size_t& end) -> bool;
    void open_block(size_t let_index, Header header);
    void close_block(const lexer::Token* closing);
};

/// Returns the opener for a closing bracket, or 0 for any other text.
[[nodiscard]] auto matching_opener(std::string_view closer) -> char;

/// Quotes a token for a diagnostic message (`'{'`, `end of input`).
[[nodiscard]] auto describe_token(const lexer::Token& token) -> std::string;

} // namespace letc::parser

#endif // LETC_PARSER_PARSER_HPP
