//! # Literal Classifier
//!
//! Splits raw JavaScript text into *code* spans and *literal* spans (strings,
//! template literals, regular expressions and comments). The lexer consumes
//! these spans and never decides literal boundaries itself, so brace-like
//! characters inside literals can never be mistaken for structure.
//!
//! ## Injection
//!
//! The lexer takes any `LiteralClassifier`. Tests substitute stubs that return
//! fixed spans; `JsLiteralClassifier` is the default used by the compile
//! driver.
//!
//! ## Example
//!
//! ```cpp
//! JsLiteralClassifier classifier;
//! auto spans = classifier.classify("a = '}' // {");
//! // Code "a = ", String "'}'", Code " ", LineComment "// {"
//! ```

#ifndef LETC_LITERAL_CLASSIFIER_HPP
#define LETC_LITERAL_CLASSIFIER_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

namespace letc::literal {

/// What a span of raw text is.
enum class SpanKind : uint8_t {
    Code,         ///< Structural code, tokenized by the lexer.
    String,       ///< `'...'` or `"..."`
    Template,     ///< `` `...${expr}...` ``, substitutions included.
    Regex,        ///< `/.../flags`
    LineComment,  ///< `// ...` up to, not including, the line break.
    BlockComment, ///< `/* ... */`
};

/// A classified byte range `[start, end)` of the input.
struct LiteralSpan {
    SpanKind kind;
    size_t start;
    size_t end;

    /// False when the literal ran into end of input (or, for strings and
    /// regexes, an unescaped line break) before its closing delimiter.
    bool terminated = true;

    [[nodiscard]] auto length() const -> size_t {
        return end - start;
    }

    [[nodiscard]] auto operator==(const LiteralSpan& other) const -> bool = default;
};

/// Returns a short display name for a span kind.
[[nodiscard]] auto span_kind_to_string(SpanKind kind) -> std::string_view;

/// Segments source text into code and literal spans.
class LiteralClassifier {
public:
    virtual ~LiteralClassifier() = default;

    /// Classifies `text`.
    ///
    /// Implementations should return ordered, contiguous spans covering the
    /// whole input; the lexer tolerates gaps and overlaps but treats gaps as
    /// code.
    [[nodiscard]] virtual auto classify(std::string_view text) const
        -> std::vector<LiteralSpan> = 0;
};

/// Default classifier for ECMAScript source.
///
/// # Regex Detection
///
/// A `/` that does not start a comment begins a regular expression when an
/// expression may start at that point: at the beginning of input, after a
/// punctuator other than `)` and `]`, or after a keyword such as `return` or
/// `typeof`. A preceding `}` is taken to close a block, so `/` after it starts
/// a regex.
///
/// # Template Literals
///
/// Substitutions (`${ ... }`) are scanned with their own brace depth and may
/// contain nested strings, comments and templates; the whole template,
/// substitutions included, is reported as one span.
class JsLiteralClassifier final : public LiteralClassifier {
public:
    [[nodiscard]] auto classify(std::string_view text) const -> std::vector<LiteralSpan> override;
};

} // namespace letc::literal

#endif // LETC_LITERAL_CLASSIFIER_HPP
