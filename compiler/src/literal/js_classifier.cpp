//! # ECMAScript Literal Classifier
//!
//! Single forward scan over the text. Code bytes are skipped over while a
//! small amount of context is tracked (the last significant code element) so
//! that a `/` can be told apart as division or the start of a regex literal.
//!
//! ## Literal Forms
//!
//! | Form          | Ends at                      | Unterminated when       |
//! |---------------|------------------------------|-------------------------|
//! | `'` / `"`     | matching quote               | line break, end of input|
//! | `` ` ``       | matching backtick            | end of input            |
//! | `//`          | line break (not included)    | never                   |
//! | `/* */`       | `*/`                         | end of input            |
//! | `/re/flags`   | closing `/` outside `[...]`  | line break, end of input|
//! | `#!` (at 0)   | line break (not included)    | never                   |

#include "letc/literal/classifier.hpp"

#include <array>
#include <optional>

namespace letc::literal {

auto span_kind_to_string(SpanKind kind) -> std::string_view {
    switch (kind) {
    case SpanKind::Code:
        return "code";
    case SpanKind::String:
        return "string";
    case SpanKind::Template:
        return "template";
    case SpanKind::Regex:
        return "regex";
    case SpanKind::LineComment:
        return "line comment";
    case SpanKind::BlockComment:
        return "block comment";
    }
    return "unknown";
}

namespace {

// Keywords after which an expression (and therefore a regex) may start.
constexpr std::array<std::string_view, 14> REGEX_PREFIX_KEYWORDS = {
    "return", "typeof", "instanceof", "in",   "of",   "new",   "delete",
    "void",   "throw",  "case",       "do",   "else", "yield", "await",
};

auto is_word_char(char c) -> bool {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
           c == '_' || c == '$' || c == '\\' || static_cast<unsigned char>(c) >= 0x80;
}

auto is_line_break(char c) -> bool {
    return c == '\n' || c == '\r';
}

/// What the last significant code element was.
enum class Prev : uint8_t {
    Nothing,  ///< Start of a code region.
    Operand,  ///< Identifier, number or literal value.
    Keyword,  ///< A keyword that precedes expressions.
    Punct,    ///< Any punctuator except closers.
    Closer,   ///< `)` or `]`.
};

struct Context {
    Prev prev = Prev::Nothing;

    [[nodiscard]] auto regex_allowed() const -> bool {
        return prev != Prev::Operand && prev != Prev::Closer;
    }
};

struct Literal {
    SpanKind kind;
    bool terminated;
};

class Scanner {
public:
    explicit Scanner(std::string_view text) : text_(text) {}

    auto run() -> std::vector<LiteralSpan>;

private:
    std::string_view text_;
    size_t pos_ = 0;

    [[nodiscard]] auto at_end() const -> bool {
        return pos_ >= text_.size();
    }

    [[nodiscard]] auto peek(size_t ahead = 0) const -> char {
        return pos_ + ahead < text_.size() ? text_[pos_ + ahead] : '\0';
    }

    auto try_literal(Context& ctx) -> std::optional<Literal>;
    void advance_code(Context& ctx);

    auto scan_string(char quote) -> bool;
    auto scan_template() -> bool;
    auto scan_substitution() -> bool;
    auto scan_regex() -> bool;
    void scan_line_comment();
    auto scan_block_comment() -> bool;
};

auto Scanner::run() -> std::vector<LiteralSpan> {
    std::vector<LiteralSpan> spans;
    Context ctx;
    size_t code_start = 0;

    auto flush_code = [&](size_t end) {
        if (end > code_start) {
            spans.push_back(LiteralSpan{.kind = SpanKind::Code, .start = code_start, .end = end});
        }
    };

    // Hashbang line.
    if (text_.starts_with("#!")) {
        scan_line_comment();
        spans.push_back(LiteralSpan{.kind = SpanKind::LineComment, .start = 0, .end = pos_});
        code_start = pos_;
    }

    while (!at_end()) {
        size_t start = pos_;
        if (auto lit = try_literal(ctx)) {
            flush_code(start);
            spans.push_back(LiteralSpan{
                .kind = lit->kind, .start = start, .end = pos_, .terminated = lit->terminated});
            code_start = pos_;
        } else {
            advance_code(ctx);
        }
    }
    flush_code(pos_);

    return spans;
}

auto Scanner::try_literal(Context& ctx) -> std::optional<Literal> {
    char c = peek();

    if (c == '\'' || c == '"') {
        bool ok = scan_string(c);
        ctx.prev = Prev::Operand;
        return Literal{SpanKind::String, ok};
    }

    if (c == '`') {
        bool ok = scan_template();
        ctx.prev = Prev::Operand;
        return Literal{SpanKind::Template, ok};
    }

    if (c == '/') {
        if (peek(1) == '/') {
            scan_line_comment();
            return Literal{SpanKind::LineComment, true};
        }
        if (peek(1) == '*') {
            bool ok = scan_block_comment();
            return Literal{SpanKind::BlockComment, ok};
        }
        if (ctx.regex_allowed()) {
            bool ok = scan_regex();
            ctx.prev = Prev::Operand;
            return Literal{SpanKind::Regex, ok};
        }
    }

    return std::nullopt;
}

void Scanner::advance_code(Context& ctx) {
    char c = peek();

    if (c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f') {
        ++pos_;
        return;
    }

    if (is_word_char(c)) {
        size_t start = pos_;
        while (!at_end() && is_word_char(peek())) {
            ++pos_;
        }
        auto word = text_.substr(start, pos_ - start);

        // Numbers may carry a fraction: `1.5`
        if (word.front() >= '0' && word.front() <= '9') {
            while (peek() == '.' || is_word_char(peek())) {
                ++pos_;
            }
            ctx.prev = Prev::Operand;
            return;
        }

        ctx.prev = Prev::Operand;
        for (auto kw : REGEX_PREFIX_KEYWORDS) {
            if (word == kw) {
                ctx.prev = Prev::Keyword;
                break;
            }
        }
        return;
    }

    ++pos_;
    ctx.prev = (c == ')' || c == ']') ? Prev::Closer : Prev::Punct;
}

auto Scanner::scan_string(char quote) -> bool {
    ++pos_; // opening quote

    while (!at_end()) {
        char c = peek();
        if (c == '\\') {
            // Escapes include line continuations (`\` + CRLF).
            if (peek(1) == '\r' && peek(2) == '\n') {
                pos_ += 3;
            } else {
                pos_ += 2;
            }
            continue;
        }
        if (c == quote) {
            ++pos_;
            return true;
        }
        if (is_line_break(c)) {
            return false;
        }
        ++pos_;
    }

    pos_ = text_.size();
    return false;
}

auto Scanner::scan_template() -> bool {
    ++pos_; // opening backtick

    while (!at_end()) {
        char c = peek();
        if (c == '\\') {
            pos_ += 2;
            continue;
        }
        if (c == '`') {
            ++pos_;
            return true;
        }
        if (c == '$' && peek(1) == '{') {
            pos_ += 2;
            if (!scan_substitution()) {
                return false;
            }
            continue;
        }
        ++pos_;
    }

    pos_ = text_.size();
    return false;
}

auto Scanner::scan_substitution() -> bool {
    Context ctx;
    int depth = 0;

    while (!at_end()) {
        if (try_literal(ctx)) {
            continue;
        }

        char c = peek();
        if (c == '}') {
            ++pos_;
            if (depth == 0) {
                return true;
            }
            --depth;
            ctx.prev = Prev::Punct;
            continue;
        }
        if (c == '{') {
            ++depth;
        }
        advance_code(ctx);
    }

    return false;
}

auto Scanner::scan_regex() -> bool {
    ++pos_; // opening slash
    bool in_class = false;

    while (!at_end()) {
        char c = peek();
        if (is_line_break(c)) {
            return false;
        }
        if (c == '\\') {
            if (is_line_break(peek(1))) {
                ++pos_;
                return false;
            }
            pos_ += 2;
            continue;
        }
        if (c == '[') {
            in_class = true;
        } else if (c == ']') {
            in_class = false;
        } else if (c == '/' && !in_class) {
            ++pos_;
            while (!at_end() && is_word_char(peek())) {
                ++pos_;
            }
            return true;
        }
        ++pos_;
    }

    pos_ = text_.size();
    return false;
}

void Scanner::scan_line_comment() {
    pos_ += 2;
    while (!at_end() && !is_line_break(peek())) {
        ++pos_;
    }
}

auto Scanner::scan_block_comment() -> bool {
    pos_ += 2;
    while (!at_end()) {
        if (peek() == '*' && peek(1) == '/') {
            pos_ += 2;
            return true;
        }
        ++pos_;
    }
    return false;
}

} // anonymous namespace

auto JsLiteralClassifier::classify(std::string_view text) const -> std::vector<LiteralSpan> {
    Scanner scanner(text);
    return scanner.run();
}

} // namespace letc::literal
