//! # Parser - Let-Blocks
//!
//! This file implements let header parsing and the let-block frame stack.
//!
//! ## Header Grammar
//!
//! ```text
//! let_block   = "let" "(" declaration ("," declaration)* ","? ")" "{" body "}"
//! declaration = IDENT ("=" initializer)?
//! initializer = balanced token run up to a top-level "," or ")"
//! ```
//!
//! Whitespace, line breaks and comments may appear between any two parts.
//!
//! ## Diagnostics
//!
//! | Code | Condition                                              |
//! |------|--------------------------------------------------------|
//! | P001 | No declaration name where one is required              |
//! | P002 | Junk after a name, or `=` with nothing after it        |
//! | P003 | `)` not followed by `{`                                |
//! | P004 | End of input inside the header, or an unbalanced closer |
//!
//! All four degrade the `let` token to plain text.

#include "letc/log/log.hpp"
#include "letc/parser/parser.hpp"

#include <algorithm>

namespace letc::parser {

using lexer::Token;
using lexer::TokenKind;

auto Parser::starts_let_block(size_t index) const -> bool {
    // `obj.let (...)` is a method call
    if (last_significant_ && (last_significant_->is_punct(".") || last_significant_->is_punct("?."))) {
        return false;
    }
    return at(skip_trivia(index + 1)).is_punct("(");
}

auto Parser::parse_header(size_t index) -> std::optional<Header> {
    header_start_ = index;
    const Token& let_token = at(index);

    std::vector<Declaration> declarations;
    size_t cursor = skip_trivia(index + 1) + 1; // past `(`

    while (true) {
        size_t name_index = skip_trivia(cursor);
        const Token& name = at(name_index);

        // Trailing comma
        if (name.is_punct(")") && !declarations.empty()) {
            cursor = name_index;
            break;
        }

        if (!name.is(TokenKind::Identifier)) {
            if (name.is_eof()) {
                sink_.warn(diag::ErrorCodes::PARSE_UNTERMINATED_HEADER,
                           "unterminated let header", let_token.span);
            } else if (name.is_punct(")")) {
                sink_.warn(diag::ErrorCodes::PARSE_EXPECTED_NAME,
                           "let header declares no names", name.span);
            } else {
                sink_.warn(diag::ErrorCodes::PARSE_EXPECTED_NAME,
                           "expected a declaration name in let header, found " +
                               describe_token(name),
                           name.span);
            }
            return std::nullopt;
        }

        Declaration decl{.name = name, .initializer = std::nullopt, .tokens = {name}};
        size_t next = skip_trivia(name_index + 1);
        const Token& separator = at(next);

        if (separator.is_punct("=")) {
            size_t end = 0;
            if (!parse_initializer(next + 1, end)) {
                return std::nullopt;
            }

            std::vector<Token> init(tokens_.begin() + static_cast<std::ptrdiff_t>(next + 1),
                                    tokens_.begin() + static_cast<std::ptrdiff_t>(end));
            if (std::all_of(init.begin(), init.end(),
                            [](const Token& t) { return t.is_trivia(); })) {
                sink_.warn(diag::ErrorCodes::PARSE_EXPECTED_SEPARATOR,
                           "expected an initializer after '=' for '" + std::string(name.lexeme) +
                               "'",
                           separator.span);
                return std::nullopt;
            }

            decl.initializer = std::move(init);
            decl.tokens.assign(tokens_.begin() + static_cast<std::ptrdiff_t>(name_index),
                               tokens_.begin() + static_cast<std::ptrdiff_t>(end));
            next = end;
        } else if (separator.is_eof()) {
            sink_.warn(diag::ErrorCodes::PARSE_UNTERMINATED_HEADER, "unterminated let header",
                       let_token.span);
            return std::nullopt;
        } else if (!separator.is_punct(",") && !separator.is_punct(")")) {
            sink_.warn(diag::ErrorCodes::PARSE_EXPECTED_SEPARATOR,
                       "expected ',', '=' or ')' after '" + std::string(name.lexeme) +
                           "' in let header, found " + describe_token(separator),
                       separator.span);
            return std::nullopt;
        }

        declarations.push_back(std::move(decl));

        if (at(next).is_punct(")")) {
            cursor = next;
            break;
        }
        cursor = next + 1; // past `,`
    }

    size_t brace = skip_trivia(cursor + 1);
    if (!at(brace).is_punct("{")) {
        sink_.warn(diag::ErrorCodes::PARSE_MISSING_BRACE,
                   "let header not followed by '{', found " + describe_token(at(brace)),
                   at(brace).is_eof() ? at(cursor).span : at(brace).span);
        return std::nullopt;
    }

    return Header{.declarations = std::move(declarations), .body_start = brace + 1};
}

auto Parser::parse_initializer(size_t index, size_t& end) -> bool {
    std::vector<char> stack;

    for (size_t i = index;; ++i) {
        const Token& token = at(i);

        if (token.is_eof()) {
            sink_.warn(diag::ErrorCodes::PARSE_UNTERMINATED_HEADER, "unterminated let header",
                       at(header_start_).span);
            return false;
        }
        if (!token.is(TokenKind::Punct)) {
            continue;
        }

        if (stack.empty() && (token.is_punct(",") || token.is_punct(")"))) {
            end = i;
            return true;
        }

        if (token.is_punct("(") || token.is_punct("[") || token.is_punct("{")) {
            stack.push_back(token.lexeme.front());
        } else if (char opener = matching_opener(token.lexeme)) {
            if (stack.empty() || stack.back() != opener) {
                sink_.warn(diag::ErrorCodes::PARSE_UNTERMINATED_HEADER,
                           "unbalanced " + describe_token(token) + " in let header", token.span);
                return false;
            }
            stack.pop_back();
        }
    }
}

void Parser::open_block(size_t let_index, Header header) {
    const Token& let_token = at(let_index);

    auto block = make_box<LetBlockNode>();
    block->declarations = std::move(header.declarations);
    block->header.assign(tokens_.begin() + static_cast<std::ptrdiff_t>(let_index),
                         tokens_.begin() + static_cast<std::ptrdiff_t>(header.body_start));
    block->span = let_token.span;

    LETC_LOG_TRACE("parser", "let-block at " << let_token.span.start.line << ":"
                                             << let_token.span.start.column << " with "
                                             << block->declarations.size()
                                             << " declaration(s), depth " << frames_.size());

    ++block_count_;
    flush_pending(frames_.back());
    frames_.push_back(Frame{.block = std::move(block),
                            .nodes = {},
                            .pending = {},
                            .bracket_base = brackets_.size()});
    pos_ = header.body_start;
}

void Parser::close_block(const Token* closing) {
    Frame frame = std::move(frames_.back());
    frames_.pop_back();
    flush_pending(frame);

    auto block = std::move(frame.block);
    block->body = std::move(frame.nodes);
    if (closing) {
        block->closing = *closing;
        block->span = SourceSpan::merge(block->span, closing->span);
    } else {
        // Runs to the last real token
        const Token& last = at(tokens_.size() - 1);
        block->span.end = last.span.end;
    }

    auto& parent = frames_.back();
    flush_pending(parent);
    parent.nodes.emplace_back(std::move(block));
}

} // namespace letc::parser
