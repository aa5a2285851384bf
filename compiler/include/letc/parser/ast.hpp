//! # Abstract Syntax Tree (AST)
//!
//! The parser produces a shallow tree with two node kinds:
//!
//! - **PlainNode**: a run of tokens with no let-block in it, emitted verbatim
//! - **LetBlockNode**: one `let ( declList ) { body }` occurrence, whose body
//!   is again a sequence of nodes
//!
//! Everything that is not a let-block stays an opaque token run. Initializers
//! and bodies are never parsed as expressions or statements.
//!
//! ## Ownership Model
//!
//! A `LetBlockNode` is owned through `Box<T>` by the node sequence it appears
//! in; the `Program` owns the whole tree. Tokens view the `Source` they were
//! lexed from, so the source must outlive the tree.
//!
//! ## Raw Tokens
//!
//! Let-block nodes keep their header tokens (`let` through `{`) and their
//! closing `}`. `raw_text()` therefore reproduces the parsed source exactly,
//! and a node the generator cannot rewrite can still be re-emitted as written.

#ifndef LETC_PARSER_AST_HPP
#define LETC_PARSER_AST_HPP

#include "letc/common.hpp"
#include "letc/lexer/token.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace letc::parser {

// ============================================================================
// Declarations
// ============================================================================

/// One `name` or `name = init` entry of a let header.
struct Declaration {
    /// The bound name; always an identifier token.
    lexer::Token name;

    /// Tokens after `=` up to the separating `,` or closing `)`.
    /// Balanced with respect to `()`, `[]` and `{}`.
    std::optional<std::vector<lexer::Token>> initializer;

    /// The whole declaration as written, from `name` to the end of the
    /// initializer.
    std::vector<lexer::Token> tokens;

    [[nodiscard]] auto has_initializer() const -> bool {
        return initializer.has_value();
    }
};

// ============================================================================
// Nodes
// ============================================================================

/// A run of tokens passed through unchanged.
struct PlainNode {
    std::vector<lexer::Token> tokens;
};

struct LetBlockNode;

/// A node in a program or let-block body.
using Node = std::variant<PlainNode, Box<LetBlockNode>>;

/// A `let ( declList ) { body }` occurrence.
///
/// Destruction releases nested blocks from a work list instead of recursing,
/// so tearing down a deeply nested tree uses constant stack.
struct LetBlockNode {
    LetBlockNode() = default;
    ~LetBlockNode();

    LetBlockNode(const LetBlockNode&) = delete;
    auto operator=(const LetBlockNode&) -> LetBlockNode& = delete;

    /// Declarations in header order. The order is significant.
    std::vector<Declaration> declarations;

    /// Nodes between `{` and the matching `}`.
    std::vector<Node> body;

    /// `let` through the opening `{`, as written.
    std::vector<lexer::Token> header;

    /// The closing `}`; empty when the input ended inside the body.
    std::optional<lexer::Token> closing;

    /// From `let` to the closing brace (or the end of input).
    SourceSpan span;

    [[nodiscard]] auto is_terminated() const -> bool {
        return closing.has_value();
    }
};

/// The root of the tree: the top-level node sequence.
struct Program {
    std::vector<Node> nodes;
};

// ============================================================================
// Helpers
// ============================================================================

[[nodiscard]] inline auto is_let_block(const Node& node) -> bool {
    return std::holds_alternative<Box<LetBlockNode>>(node);
}

/// Returns the let-block in `node`. The node must hold one.
[[nodiscard]] inline auto as_let_block(const Node& node) -> const LetBlockNode& {
    return *std::get<Box<LetBlockNode>>(node);
}

/// Returns the plain run in `node`. The node must hold one.
[[nodiscard]] inline auto as_plain(const Node& node) -> const PlainNode& {
    return std::get<PlainNode>(node);
}

/// Reconstructs the source text a node was parsed from.
[[nodiscard]] auto raw_text(const Node& node) -> std::string;

/// Reconstructs the source text a program was parsed from.
[[nodiscard]] auto raw_text(const Program& program) -> std::string;

/// Counts let-blocks in `nodes`, nested ones included.
[[nodiscard]] auto count_let_blocks(const std::vector<Node>& nodes) -> size_t;

/// Counts let-blocks in `program`, nested ones included.
[[nodiscard]] auto count_let_blocks(const Program& program) -> size_t;

/// Returns the deepest let-block nesting level in `program` (0 if none).
[[nodiscard]] auto max_nesting_depth(const Program& program) -> size_t;

} // namespace letc::parser

#endif // LETC_PARSER_AST_HPP
