//! # Diagnostics Sink
//!
//! Warnings raised while lexing and parsing are collected here instead of
//! aborting the pipeline. Every stage always produces output; the caller
//! decides whether accumulated diagnostics make the run fail.
//!
//! ## Error Codes
//!
//! | Prefix | Category | Example                               |
//! |--------|----------|---------------------------------------|
//! | L      | Lexer    | L002 - Unterminated string literal    |
//! | P      | Parser   | P003 - let header not followed by `{` |
//! | E      | General  | E001 - File not found                 |
//!
//! ## Sharing
//!
//! A sink is a plain object. The library entry points create a fresh sink per
//! call unless one is passed in; the CLI passes a single sink through every
//! unit it compiles. Appends are serialized so one sink can be shared by
//! concurrent compilations.

#ifndef LETC_DIAG_DIAGNOSTICS_HPP
#define LETC_DIAG_DIAGNOSTICS_HPP

#include "letc/common.hpp"

#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace letc::diag {

namespace ErrorCodes {
// Lexer (L000-L099)
constexpr const char* LEX_UNTERMINATED_STRING = "L002";
constexpr const char* LEX_UNTERMINATED_REGEX = "L003";
constexpr const char* LEX_UNTERMINATED_COMMENT = "L004";

// Parser (P000-P099)
constexpr const char* PARSE_EXPECTED_NAME = "P001";
constexpr const char* PARSE_EXPECTED_SEPARATOR = "P002";
constexpr const char* PARSE_MISSING_BRACE = "P003";
constexpr const char* PARSE_UNTERMINATED_HEADER = "P004";
constexpr const char* PARSE_UNTERMINATED_BLOCK = "P005";
constexpr const char* PARSE_MISMATCHED_CLOSER = "P006";

// General (E000-E099)
constexpr const char* FILE_NOT_FOUND = "E001";
constexpr const char* IO_ERROR = "E002";
constexpr const char* INVALID_OPTION = "E003";
} // namespace ErrorCodes

/// Severity of a recorded diagnostic.
///
/// Lexer and parser only ever raise warnings; errors are reserved for the
/// driver (unreadable files).
enum class Severity : uint8_t {
    Warning,
    Error,
};

/// A single recorded diagnostic.
///
/// `span.start.file` views the `Source` that was being compiled and dangles
/// once that source is gone; `file` is an owned copy that stays valid.
struct Diagnostic {
    Severity severity;
    std::string code;    ///< Error code (e.g. "P003").
    std::string message; ///< Human-readable description.
    SourceSpan span;     ///< Where it happened.
    std::string file;    ///< Owned copy of the unit name.
};

/// Append-only, reset-able collector of diagnostics.
class DiagnosticSink {
public:
    DiagnosticSink() = default;

    DiagnosticSink(const DiagnosticSink&) = delete;
    auto operator=(const DiagnosticSink&) -> DiagnosticSink& = delete;

    /// Appends a diagnostic.
    void report(Diagnostic diag);

    /// Appends a warning with the given code at `span`.
    void warn(const std::string& code, const std::string& message, const SourceSpan& span);

    /// Appends an error with the given code at `span`.
    void error(const std::string& code, const std::string& message, const SourceSpan& span);

    /// Removes every recorded diagnostic.
    void reset();

    /// Returns a snapshot of all diagnostics in report order.
    [[nodiscard]] auto diagnostics() const -> std::vector<Diagnostic>;

    /// Returns the diagnostics recorded at or after index `first`.
    ///
    /// Lets a caller sharing the sink pick out what one compilation added.
    [[nodiscard]] auto diagnostics_since(size_t first) const -> std::vector<Diagnostic>;

    [[nodiscard]] auto size() const -> size_t;

    [[nodiscard]] auto empty() const -> bool {
        return size() == 0;
    }

    [[nodiscard]] auto warning_count() const -> size_t;
    [[nodiscard]] auto error_count() const -> size_t;

private:
    mutable std::mutex mutex_;
    std::vector<Diagnostic> diags_;
    size_t warnings_ = 0;
    size_t errors_ = 0;
};

/// Returns the process-wide shared sink.
///
/// Used by callers that want diagnostics from several compilations gathered
/// in one place. It is only cleared by an explicit `reset()`.
auto global_diagnostics() -> DiagnosticSink&;

} // namespace letc::diag

#endif // LETC_DIAG_DIAGNOSTICS_HPP
