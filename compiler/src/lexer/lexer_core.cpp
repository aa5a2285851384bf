//! # Lexer Core
//!
//! This file implements the span walk and the character helpers:
//!
//! - **Span walk**: `tokenize()` asks the classifier for spans, lexes code
//!   spans into words/punctuators/trivia and turns literal spans into single
//!   tokens
//! - **Character access**: `peek()`, `advance()`, `is_at_region_end()`
//! - **Token creation**: `push_token()`
//!
//! ## Misbehaving Classifiers
//!
//! Spans are clamped to the input and to what has already been covered, and
//! any uncovered gap is lexed as code. Losslessness therefore holds for any
//! classifier output.

#include "letc/lexer/lexer.hpp"
#include "letc/log/log.hpp"

#include <algorithm>

namespace letc::lexer {

Lexer::Lexer(const Source& source, const literal::LiteralClassifier& classifier,
             diag::DiagnosticSink& sink)
    : source_(source), classifier_(classifier), sink_(sink) {}

auto Lexer::tokenize() -> std::vector<Token> {
    tokens_.clear();

    const size_t length = source_.length();
    auto spans = classifier_.classify(source_.content());

    size_t covered = 0;
    size_t literal_count = 0;
    for (const auto& raw : spans) {
        size_t start = std::max(raw.start, covered);
        size_t end = std::min(raw.end, length);
        if (end <= start) {
            continue;
        }

        if (start > covered) {
            lex_code(covered, start);
        }

        if (raw.kind == literal::SpanKind::Code) {
            lex_code(start, end);
        } else {
            literal::LiteralSpan span = raw;
            span.start = start;
            span.end = end;
            lex_literal(span);
            ++literal_count;
        }
        covered = end;
    }

    if (covered < length) {
        lex_code(covered, length);
    }

    token_start_ = length;
    pos_ = length;
    push_token(TokenKind::Eof);

    LETC_LOG_DEBUG("lexer", "lexed " << tokens_.size() << " tokens (" << literal_count
                                     << " literals) from " << source_.filename());

    return std::move(tokens_);
}

auto Lexer::peek() const -> char {
    return pos_ < region_end_ ? source_.at(pos_) : '\0';
}

auto Lexer::peek_n(size_t n) const -> char {
    return pos_ + n < region_end_ ? source_.at(pos_ + n) : '\0';
}

auto Lexer::advance() -> char {
    char c = peek();
    ++pos_;
    return c;
}

auto Lexer::is_at_region_end() const -> bool {
    return pos_ >= region_end_;
}

void Lexer::push_token(TokenKind kind) {
    tokens_.push_back(Token{.kind = kind,
                            .span = source_.span(token_start_, pos_),
                            .lexeme = source_.slice(token_start_, pos_)});
}

void Lexer::lex_code(size_t start, size_t end) {
    pos_ = start;
    region_end_ = end;

    while (!is_at_region_end()) {
        token_start_ = pos_;
        char c = peek();

        if (c == '\n' || c == '\r') {
            lex_newline();
        } else if (c == ' ' || c == '\t' || c == '\v' || c == '\f') {
            lex_whitespace();
        } else if (c >= '0' && c <= '9') {
            lex_number();
        } else if (c == '.' && peek_n(1) >= '0' && peek_n(1) <= '9') {
            lex_number();
        } else if (is_identifier_start(c)) {
            lex_word();
        } else {
            lex_punct();
        }
    }
}

void Lexer::lex_whitespace() {
    while (!is_at_region_end()) {
        char c = peek();
        if (c != ' ' && c != '\t' && c != '\v' && c != '\f') {
            break;
        }
        advance();
    }
    push_token(TokenKind::Whitespace);
}

void Lexer::lex_newline() {
    if (advance() == '\r' && peek() == '\n') {
        advance();
    }
    push_token(TokenKind::Newline);
}

void Lexer::lex_word() {
    while (!is_at_region_end() && is_identifier_continue(peek())) {
        advance();
    }

    auto text = source_.slice(token_start_, pos_);
    push_token(text == "let" ? TokenKind::KwLet : TokenKind::Identifier);
}

void Lexer::lex_number() {
    // Numbers stay opaque: digits, letters (hex, exponent, BigInt suffix),
    // separators and the decimal point. A sign after an exponent letter is
    // lexed as a separate punctuator.
    while (!is_at_region_end()) {
        char c = peek();
        if (!is_identifier_continue(c) && c != '.') {
            break;
        }
        advance();
    }
    push_token(TokenKind::Number);
}

void Lexer::lex_literal(const literal::LiteralSpan& span) {
    token_start_ = span.start;
    pos_ = span.end;
    region_end_ = span.end;

    TokenKind kind = TokenKind::StringLiteral;
    switch (span.kind) {
    case literal::SpanKind::String:
        kind = TokenKind::StringLiteral;
        break;
    case literal::SpanKind::Template:
        kind = TokenKind::TemplateLiteral;
        break;
    case literal::SpanKind::Regex:
        kind = TokenKind::RegexLiteral;
        break;
    case literal::SpanKind::LineComment:
        kind = TokenKind::LineComment;
        break;
    case literal::SpanKind::BlockComment:
        kind = TokenKind::BlockComment;
        break;
    case literal::SpanKind::Code:
        break;
    }

    push_token(kind);

    if (span.terminated) {
        return;
    }

    const auto& token = tokens_.back();
    std::string where = " starting at line " + std::to_string(token.span.start.line);
    switch (kind) {
    case TokenKind::StringLiteral:
        sink_.warn(diag::ErrorCodes::LEX_UNTERMINATED_STRING,
                   "unterminated string literal" + where, token.span);
        break;
    case TokenKind::TemplateLiteral:
        sink_.warn(diag::ErrorCodes::LEX_UNTERMINATED_STRING,
                   "unterminated template literal" + where, token.span);
        break;
    case TokenKind::RegexLiteral:
        sink_.warn(diag::ErrorCodes::LEX_UNTERMINATED_REGEX,
                   "unterminated regular expression literal" + where, token.span);
        break;
    case TokenKind::BlockComment:
        sink_.warn(diag::ErrorCodes::LEX_UNTERMINATED_COMMENT,
                   "unterminated block comment" + where, token.span);
        break;
    default:
        break;
    }
}

auto is_identifier_start(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_' || c == '$' ||
           c == '\\' || static_cast<unsigned char>(c) >= 0x80;
}

auto is_identifier_continue(char c) -> bool {
    return is_identifier_start(c) || (c >= '0' && c <= '9');
}

auto is_identifier(std::string_view text) -> bool {
    if (text.empty() || !is_identifier_start(text.front())) {
        return false;
    }
    return std::all_of(text.begin(), text.end(), is_identifier_continue);
}

} // namespace letc::lexer
