//! # Generator - ES3 Emulation
//!
//! ES3 has no block scope, but a `catch` parameter is scoped to its clause.
//! Each declaration becomes one layer:
//!
//! ```text
//! try{throw INIT}catch(NAME){ ... }
//! ```
//!
//! The first declaration is the outermost layer and the body sits inside the
//! last one. A declaration without initializer throws `undefined`. An
//! initializer that starts with a comment is thrown in parentheses:
//! `try{throw (// note\n 1)}`.
//!
//! ## Annotations
//!
//! With `annotate` set, each layer is marked so the output can be traced back
//! to the source:
//!
//! ```text
//! try{throw "foo"}/*let*/catch(x/* = "foo" */){ ... }
//! ```

#include "letc/codegen/generator.hpp"

namespace letc::codegen {

namespace {

// `throw` must be followed by its operand on the same line, so an initializer
// opening with a comment is parenthesized.
auto starts_with_comment(const std::vector<lexer::Token>& tokens) -> bool {
    for (const auto& token : tokens) {
        if (!token.is_blank()) {
            return token.is_trivia();
        }
    }
    return false;
}

} // anonymous namespace

void Generator::open_es3(const parser::LetBlockNode& block) {
    for (const auto& decl : block.declarations) {
        std::string init = decl.initializer ? trimmed_text(*decl.initializer) : "undefined";

        emit("try{throw ");
        if (decl.initializer && starts_with_comment(*decl.initializer)) {
            emit("(");
            emit(init);
            emit(")");
        } else {
            emit(init);
        }
        emit("}");
        if (options_.annotate) {
            emit("/*let*/");
        }
        emit("catch(");
        emit(decl.name.lexeme);
        if (options_.annotate && decl.initializer) {
            emit("/* = ");
            emit(escape_comment(init));
            emit(" */");
        }
        emit("){");
    }
}

auto escape_comment(std::string_view text) -> std::string {
    std::string out;
    out.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        out += text[i];
        if (text[i] == '*' && i + 1 < text.size() && text[i + 1] == '/') {
            out += ' ';
        }
    }
    return out;
}

} // namespace letc::codegen
