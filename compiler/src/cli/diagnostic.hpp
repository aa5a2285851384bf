//! # Diagnostic Reporting
//!
//! Prints the records of a `diag::DiagnosticSink` for humans or tools.
//!
//! ## Text Format
//!
//! ```text
//! warning[P003]: let header not followed by '{', found ';'
//!   --> app.js:3:12
//!      |
//!    3 | let (x = 1);
//!      |            ^
//!      |
//! ```
//!
//! ## JSON Format
//!
//! One object per line with `severity`, `code`, `message` and a `span` holding
//! `file`, `start` and `end` line/column pairs.
//!
//! ## Features
//!
//! - Source snippets with line numbers and carets
//! - ANSI colors when stderr is a terminal
//! - "Did you mean?" suggestions via Levenshtein distance

#pragma once

#include "letc/common.hpp"
#include "letc/diag/diagnostics.hpp"

#include <iostream>
#include <string>
#include <unordered_map>
#include <vector>

namespace letc::cli {

// ============================================================================
// ANSI Color Codes
// ============================================================================

struct Colors {
    static constexpr const char* Reset = "\033[0m";
    static constexpr const char* Bold = "\033[1m";

    static constexpr const char* BrightRed = "\033[91m";
    static constexpr const char* BrightYellow = "\033[93m";
    static constexpr const char* BrightBlue = "\033[94m";
};

enum class DiagnosticFormat {
    Text,
    JSON,
};

// ============================================================================
// Diagnostic Emitter
// ============================================================================

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    // Configuration
    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    void set_format(DiagnosticFormat format) {
        format_ = format;
    }
    void set_source_content(const std::string& path, const std::string& content);

    void emit(const diag::Diagnostic& diag);

    // Emits every record in `diags`
    void emit_all(const std::vector<diag::Diagnostic>& diags);

    // Statistics
    size_t error_count() const {
        return error_count_;
    }
    size_t warning_count() const {
        return warning_count_;
    }

private:
    std::ostream& out_;
    bool use_colors_ = true;
    DiagnosticFormat format_ = DiagnosticFormat::Text;
    std::unordered_map<std::string, std::string> source_files_; // path -> content
    size_t error_count_ = 0;
    size_t warning_count_ = 0;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }

    void emit_header(const diag::Diagnostic& diag);
    void emit_source_snippet(const diag::Diagnostic& diag);
    void emit_json(const diag::Diagnostic& diag);

    std::string get_source_line(const std::string& path, uint32_t line) const;
    static const char* severity_string(diag::Severity sev);
    const char* severity_color(diag::Severity sev) const;
};

/// JSON string escaping for diagnostic output.
std::string escape_json_string(const std::string& s);

// Check if terminal supports colors
bool terminal_supports_colors();

// ============================================================================
// "Did You Mean?" Suggestions
// ============================================================================

/**
 * Compute Levenshtein (edit) distance between two strings.
 */
size_t levenshtein_distance(const std::string& s1, const std::string& s2);

/**
 * Find the best matching candidate from a list of options.
 * Returns the closest match if within threshold, or empty string if none found.
 */
std::string find_similar(const std::string& input, const std::vector<std::string>& candidates,
                         size_t max_distance = 3);

} // namespace letc::cli
