//! # Let-Block Code Generator
//!
//! This module walks a parsed `Program` and emits JavaScript text. Plain runs
//! are copied token for token; let-blocks are rewritten.
//!
//! ## Strategies
//!
//! | Mode                        | Output for `let (x = 1, y) { f(x, y) }`                 |
//! |-----------------------------|---------------------------------------------------------|
//! | Native                      | `{ let x = 1, y;f(x, y)}`                               |
//! | ES3                         | `try{throw 1}catch(x){try{throw undefined}catch(y){f(x, y)}}` |
//! | ES3, annotated              | `try{throw 1}/*let*/catch(x/* = 1 */){...}`             |
//!
//! ES3 mode opens one `try{throw v}catch(name){` layer per declaration, in
//! header order, and closes all layers right after the body.
//!
//! ## Whitespace
//!
//! Rewritten regions are normalized: whitespace and line breaks at the edges
//! of a body or declaration are dropped. A region that ends in a `//` comment
//! gets a line break so the generated text after it stays live.

#ifndef LETC_CODEGEN_GENERATOR_HPP
#define LETC_CODEGEN_GENERATOR_HPP

#include "letc/common.hpp"
#include "letc/parser/ast.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace letc::codegen {

/// Emits JavaScript for a parsed program.
///
/// Generation never fails. A generator can be reused; each call to
/// `generate()` starts from empty output.
class Generator {
public:
    explicit Generator(CompileOptions options = {});

    /// Generates the output text for `program`.
    [[nodiscard]] auto generate(const parser::Program& program) -> std::string;

    [[nodiscard]] auto options() const -> const CompileOptions& {
        return options_;
    }

private:
    /// A node sequence being emitted. When it is exhausted, `closing` is
    /// emitted `close_count` times.
    struct Frame {
        const std::vector<parser::Node>* nodes;
        size_t next;
        bool trim_edges;
        std::string_view closing;
        size_t close_count;
    };

    CompileOptions options_;
    std::string output_;
    size_t block_count_ = 0;
    std::vector<Frame> frames_;

    void emit(std::string_view text);
    void emit_tokens(const std::vector<lexer::Token>& tokens, size_t begin, size_t end);

    /// Emits one plain run of a body with its edge whitespace dropped.
    void gen_body_plain(const Frame& frame, size_t index, const parser::PlainNode& node);

    /// Emits everything up to the body of `block` and pushes the body frame.
    void open_let_block(const parser::LetBlockNode& block);

    /// `{ let a, b = 1;` (the body and `}` follow)
    void open_native(const parser::LetBlockNode& block);

    /// `try{throw v}catch(a){` per declaration (generator_es3.cpp)
    void open_es3(const parser::LetBlockNode& block);
};

/// Returns the text of `tokens` without leading and trailing whitespace or
/// line-break tokens. A trailing `//` comment gets a `\n` appended.
[[nodiscard]] auto trimmed_text(const std::vector<lexer::Token>& tokens) -> std::string;

/// Makes `text` safe to place inside a `/* */` comment.
[[nodiscard]] auto escape_comment(std::string_view text) -> std::string;

} // namespace letc::codegen

#endif // LETC_CODEGEN_GENERATOR_HPP
