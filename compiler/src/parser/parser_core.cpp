//! # Parser Core
//!
//! This file implements the scanning loop and bracket tracking.
//!
//! ## Token Navigation
//!
//! | Method          | Description                                 |
//! |-----------------|---------------------------------------------|
//! | `at()`          | Token at an index, `Eof` past the end       |
//! | `skip_trivia()` | First non-whitespace, non-comment index     |
//!
//! ## Bracket Tracking
//!
//! Every frame remembers the bracket stack height at which its body opened.
//! A closer is matched against the openers above that height only:
//!
//! | Situation                             | Effect                         |
//! |---------------------------------------|--------------------------------|
//! | Closer matches the top opener         | Pop                            |
//! | Closer matches a deeper opener        | Pop through it, P006 in a body |
//! | `}` with no `{` above the body height | Closes the let-block           |
//! | Anything else                         | Plain text, P006 in a body     |

#include "letc/log/log.hpp"
#include "letc/parser/parser.hpp"

namespace letc::parser {

using lexer::Token;
using lexer::TokenKind;

Parser::Parser(std::vector<Token> tokens, diag::DiagnosticSink& sink)
    : tokens_(std::move(tokens)), sink_(sink) {
    if (tokens_.empty() || !tokens_.back().is_eof()) {
        SourceSpan end{};
        if (!tokens_.empty()) {
            end = SourceSpan{tokens_.back().span.end, tokens_.back().span.end};
        }
        tokens_.push_back(Token{.kind = TokenKind::Eof, .span = end, .lexeme = {}});
    }
}

auto Parser::at(size_t index) const -> const Token& {
    if (index >= tokens_.size()) {
        return tokens_.back();
    }
    return tokens_[index];
}

auto Parser::skip_trivia(size_t index) const -> size_t {
    while (index < tokens_.size() && at(index).is_trivia()) {
        ++index;
    }
    return index;
}

auto Parser::parse() -> Program {
    frames_.clear();
    brackets_.clear();
    frames_.push_back(Frame{});
    last_significant_ = nullptr;
    block_count_ = 0;
    pos_ = 0;

    while (!at(pos_).is_eof()) {
        const Token& token = at(pos_);

        if (token.is(TokenKind::KwLet) && starts_let_block(pos_)) {
            if (auto header = parse_header(pos_)) {
                open_block(pos_, std::move(*header));
                last_significant_ = &at(pos_ - 1);
                continue;
            }
        }

        if (token.is(TokenKind::Punct)) {
            if (token.is_punct("(") || token.is_punct("[") || token.is_punct("{")) {
                brackets_.push_back(token.lexeme.front());
            } else if (matching_opener(token.lexeme) != 0 && handle_closer(token)) {
                last_significant_ = &token;
                ++pos_;
                continue;
            }
        }

        append_plain(token);
        if (!token.is_trivia()) {
            last_significant_ = &token;
        }
        ++pos_;
    }

    while (in_let_body()) {
        const auto& let_token = frames_.back().block->header.front();
        sink_.warn(diag::ErrorCodes::PARSE_UNTERMINATED_BLOCK,
                   "unterminated let-block: no '}' for the block opened at line " +
                       std::to_string(let_token.span.start.line),
                   let_token.span);
        close_block(nullptr);
    }

    auto& root = frames_.back();
    flush_pending(root);

    Program program{.nodes = std::move(root.nodes)};
    frames_.clear();

    LETC_LOG_DEBUG("parser", "parsed " << block_count_ << " let-block(s) from "
                                       << tokens_.size() << " tokens");
    return program;
}

void Parser::append_plain(const Token& token) {
    frames_.back().pending.tokens.push_back(token);
}

void Parser::flush_pending(Frame& frame) {
    if (frame.pending.tokens.empty()) {
        return;
    }
    frame.nodes.emplace_back(std::move(frame.pending));
    frame.pending = PlainNode{};
}

auto Parser::handle_closer(const Token& token) -> bool {
    const char opener = matching_opener(token.lexeme);
    const size_t base = frames_.back().bracket_base;

    for (size_t i = brackets_.size(); i > base; --i) {
        if (brackets_[i - 1] != opener) {
            continue;
        }
        if (i != brackets_.size() && in_let_body()) {
            sink_.warn(diag::ErrorCodes::PARSE_MISMATCHED_CLOSER,
                       "mismatched " + describe_token(token) + " in let-block body: '" +
                           std::string(1, brackets_.back()) + "' is still open",
                       token.span);
        }
        brackets_.resize(i - 1);
        return false;
    }

    if (!in_let_body()) {
        return false;
    }

    if (token.is_punct("}")) {
        if (brackets_.size() > base) {
            sink_.warn(diag::ErrorCodes::PARSE_MISMATCHED_CLOSER,
                       "let-block closed while '" + std::string(1, brackets_.back()) +
                           "' is still open",
                       token.span);
        }
        brackets_.resize(base);
        close_block(&token);
        return true;
    }

    sink_.warn(diag::ErrorCodes::PARSE_MISMATCHED_CLOSER,
               "mismatched " + describe_token(token) + " in let-block body", token.span);
    return false;
}

auto matching_opener(std::string_view closer) -> char {
    if (closer == ")")
        return '(';
    if (closer == "]")
        return '[';
    if (closer == "}")
        return '{';
    return 0;
}

auto describe_token(const Token& token) -> std::string {
    if (token.is_eof()) {
        return "end of input";
    }
    if (token.is(TokenKind::Newline)) {
        return "line break";
    }
    return "'" + std::string(token.lexeme) + "'";
}

} // namespace letc::parser
