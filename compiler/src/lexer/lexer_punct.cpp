//! # Lexer - Punctuators
//!
//! Punctuators are matched longest first against the ECMAScript punctuator
//! set. The parser only looks at a handful of them (`( ) [ ] { } , = .`),
//! but lexing whole operators keeps `==` and `=>` from ever being read as a
//! declaration's `=`.
//!
//! ## Multi-Character Punctuators
//!
//! | Length | Punctuators                                              |
//! |--------|----------------------------------------------------------|
//! | 4      | `>>>=`                                                   |
//! | 3      | `...` `===` `!==` `**=` `<<=` `>>=` `>>>` `&&=` `\|\|=` `??=` |
//! | 2      | `=>` `==` `!=` `<=` `>=` `&&` `\|\|` `??` `?.` `++` `--`  |
//! |        | `+=` `-=` `*=` `/=` `%=` `&=` `\|=` `^=` `**` `<<` `>>`   |
//!
//! Any other byte, including stray characters such as `#` or `@`, is a
//! one-character punctuator.

#include "letc/lexer/lexer.hpp"

#include <array>

namespace letc::lexer {

namespace {

constexpr std::array<std::string_view, 10> PUNCT_3 = {
    "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=", "??=",
};

constexpr std::array<std::string_view, 22> PUNCT_2 = {
    "=>", "==", "!=", "<=", ">=", "&&", "||", "??", "?.", "++", "--",
    "+=", "-=", "*=", "/=", "%=", "&=", "|=", "^=", "**", "<<", ">>",
};

} // anonymous namespace

void Lexer::lex_punct() {
    auto rest = source_.slice(pos_, region_end_);

    size_t length = 1;
    if (rest.starts_with(">>>=")) {
        length = 4;
    } else {
        for (auto p : PUNCT_3) {
            if (rest.starts_with(p)) {
                length = 3;
                break;
            }
        }
        if (length == 1) {
            for (auto p : PUNCT_2) {
                if (rest.starts_with(p)) {
                    length = 2;
                    break;
                }
            }
        }
    }

    // `a?.5:b` is a conditional, not optional chaining.
    if (length == 2 && rest.starts_with("?.") && rest.size() > 2 && rest[2] >= '0' &&
        rest[2] <= '9') {
        length = 1;
    }

    pos_ += length;
    push_token(TokenKind::Punct);
}

} // namespace letc::lexer
