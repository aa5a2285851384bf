//! # Token Utilities
//!
//! - `token_kind_to_string()`: Convert token kind to display string
//! - `is_literal()`: Check if a kind is an opaque literal
//! - `join_lexemes()`: Rebuild text from a token run

#include "letc/lexer/token.hpp"

namespace letc::lexer {

auto token_kind_to_string(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::Eof:
        return "EOF";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::KwLet:
        return "let";
    case TokenKind::Number:
        return "number";
    case TokenKind::Punct:
        return "punctuator";
    case TokenKind::Whitespace:
        return "whitespace";
    case TokenKind::Newline:
        return "newline";
    case TokenKind::StringLiteral:
        return "string";
    case TokenKind::TemplateLiteral:
        return "template";
    case TokenKind::RegexLiteral:
        return "regex";
    case TokenKind::LineComment:
        return "line comment";
    case TokenKind::BlockComment:
        return "block comment";
    }
    return "unknown";
}

auto is_literal(TokenKind kind) -> bool {
    switch (kind) {
    case TokenKind::StringLiteral:
    case TokenKind::TemplateLiteral:
    case TokenKind::RegexLiteral:
    case TokenKind::LineComment:
    case TokenKind::BlockComment:
        return true;
    default:
        return false;
    }
}

auto join_lexemes(const std::vector<Token>& tokens) -> std::string {
    std::string out;
    for (const auto& token : tokens) {
        out += token.lexeme;
    }
    return out;
}

} // namespace letc::lexer
