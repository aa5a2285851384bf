//! # Source Units
//!
//! A `Source` owns the text of one compilation unit (a file, standard input
//! or an in-memory string) and converts byte offsets to line/column
//! positions for tokens and diagnostics.
//!
//! ## Example
//!
//! ```cpp
//! auto result = Source::from_file("app.js");
//! if (is_err(result)) {
//!     std::cerr << unwrap_err(result) << "\n";
//!     return;
//! }
//! Source source = std::move(unwrap(result));
//!
//! // Or create from string
//! Source snippet = Source::from_string("let (x = 1) { f(x) }", "<test>");
//! SourceLocation loc = snippet.location(5); // line 1, column 6
//! ```

#ifndef LETC_LEXER_SOURCE_HPP
#define LETC_LEXER_SOURCE_HPP

#include "letc/common.hpp"

#include <istream>
#include <string>
#include <string_view>
#include <vector>

namespace letc::lexer {

/// Source text with a line index.
///
/// String views returned by `content()`, `slice()` and `line()`, and the
/// `file` view inside every `SourceLocation`, are valid as long as the Source
/// exists. A Source is move-only for that reason.
class Source {
public:
    /// Constructs a source from a name and content. Builds the line index.
    Source(std::string filename, std::string content);

    Source(const Source&) = delete;
    auto operator=(const Source&) -> Source& = delete;
    Source(Source&&) noexcept = default;
    auto operator=(Source&&) noexcept -> Source& = default;

    [[nodiscard]] auto content() const -> std::string_view {
        return content_;
    }

    [[nodiscard]] auto filename() const -> std::string_view {
        return filename_;
    }

    [[nodiscard]] auto length() const -> size_t {
        return content_.size();
    }

    /// Returns the byte at `offset`, or '\0' if out of bounds.
    [[nodiscard]] auto at(size_t offset) const -> char;

    /// Returns the substring `[start, end)`, clamped to valid bounds.
    [[nodiscard]] auto slice(size_t start, size_t end) const -> std::string_view;

    /// Converts a byte offset to a 1-based line/column location.
    ///
    /// Uses binary search on the line index. Lines are split at `\n`, `\r\n`
    /// and lone `\r`.
    [[nodiscard]] auto location(size_t offset) const -> SourceLocation;

    /// Returns the span `[start, end)` as a pair of locations.
    [[nodiscard]] auto span(size_t start, size_t end) const -> SourceSpan;

    /// Returns line `line_num` (1-based) without its line break.
    [[nodiscard]] auto line(uint32_t line_num) const -> std::string_view;

    [[nodiscard]] auto line_count() const -> uint32_t;

    /// Loads a source file from disk.
    [[nodiscard]] static auto from_file(const std::string& path) -> Result<Source, std::string>;

    /// Reads a whole stream (used for standard input).
    [[nodiscard]] static auto from_stream(std::istream& in, std::string name = "<stdin>")
        -> Result<Source, std::string>;

    /// Creates a source from an in-memory string.
    [[nodiscard]] static auto from_string(std::string content, std::string name = "<input>")
        -> Source;

private:
    std::string filename_;
    std::string content_;
    std::vector<size_t> line_offsets_; ///< Byte offset of each line start.

    void build_line_index();
};

} // namespace letc::lexer

#endif // LETC_LEXER_SOURCE_HPP
