//! # Common Definitions
//!
//! This module provides the types shared by every stage of the let-block
//! compiler: version constants, compile options, source locations, the
//! `Result` type and the owning pointer aliases used by the AST.
//!
//! ## Design Philosophy
//!
//! - **No Exceptions**: Recoverable failures are returned via `Result<T, E>`
//! - **Explicit Ownership**: `Box<T>` for unique ownership of tree nodes
//! - **Pure Stages**: Lexer, parser and generator read their input and the
//!   options passed to them, nothing else

#ifndef LETC_COMMON_HPP
#define LETC_COMMON_HPP

#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <variant>

namespace letc {

// ============================================================================
// Version Information
// ============================================================================

/// The compiler version string.
constexpr const char* VERSION = "1.2.0";

constexpr int VERSION_MAJOR = 1;
constexpr int VERSION_MINOR = 2;
constexpr int VERSION_PATCH = 0;

// ============================================================================
// Compile Options
// ============================================================================

/// Options that select how let-blocks are rewritten.
///
/// Only the generator reads these; lexing and parsing behave the same for
/// every configuration.
///
/// # Example
///
/// ```cpp
/// CompileOptions options;
/// options.target_es3 = true; // try/catch emulation
/// options.annotate = false;  // no provenance comments
/// ```
struct CompileOptions {
    /// Emit nested `try{throw v}catch(name){...}` layers instead of a native
    /// `{ let ...; }` block.
    bool target_es3 = false;

    /// Add `/*let*/` and initializer echo comments. Only used when
    /// `target_es3` is set.
    bool annotate = true;

    [[nodiscard]] auto operator==(const CompileOptions& other) const -> bool = default;
};

// ============================================================================
// Source Location Types
// ============================================================================

/// A precise location in source code.
///
/// # Fields
///
/// - `file`: Name of the source unit (a path, `<stdin>` or `<input>`)
/// - `line`: 1-based line number
/// - `column`: 1-based column number
/// - `offset`: 0-based byte offset from the start of the unit
/// - `length`: Length of the element in bytes
struct SourceLocation {
    std::string_view file;
    uint32_t line;
    uint32_t column;
    uint32_t offset;
    uint32_t length;

    [[nodiscard]] auto operator==(const SourceLocation& other) const -> bool = default;
};

/// A span of source code from start to end location.
struct SourceSpan {
    /// Start location of the span.
    SourceLocation start;

    /// End location of the span.
    SourceLocation end;

    /// Merges two spans into one that covers both.
    [[nodiscard]] static auto merge(const SourceSpan& a, const SourceSpan& b) -> SourceSpan {
        return {a.start, b.end};
    }
};

// ============================================================================
// Result Type
// ============================================================================

/// Either a success value or an error.
///
/// # Example
///
/// ```cpp
/// auto result = parse_cli_args(args);
/// if (is_err(result)) {
///     std::cerr << unwrap_err(result) << "\n";
///     return 1;
/// }
/// const auto& options = unwrap(result);
/// ```
template <typename T, typename E = std::string> using Result = std::variant<T, E>;

/// Checks if a Result contains a success value.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_ok(const Result<T, E>& result) -> bool {
    return std::holds_alternative<T>(result);
}

/// Checks if a Result contains an error.
template <typename T, typename E>
[[nodiscard]] constexpr auto is_err(const Result<T, E>& result) -> bool {
    return std::holds_alternative<E>(result);
}

/// Extracts the success value from a Result.
///
/// Throws `std::bad_variant_access` if the Result contains an error.
template <typename T, typename E> [[nodiscard]] constexpr auto unwrap(Result<T, E>& result) -> T& {
    return std::get<T>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap(const Result<T, E>& result) -> const T& {
    return std::get<T>(result);
}

/// Extracts the error value from a Result.
template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(Result<T, E>& result) -> E& {
    return std::get<E>(result);
}

template <typename T, typename E>
[[nodiscard]] constexpr auto unwrap_err(const Result<T, E>& result) -> const E& {
    return std::get<E>(result);
}

// ============================================================================
// Smart Pointer Aliases
// ============================================================================

/// Unique ownership pointer.
template <typename T> using Box = std::unique_ptr<T>;

/// Creates a new Box containing the given value.
template <typename T, typename... Args> [[nodiscard]] auto make_box(Args&&... args) -> Box<T> {
    return std::make_unique<T>(std::forward<Args>(args)...);
}

} // namespace letc

#endif // LETC_COMMON_HPP
