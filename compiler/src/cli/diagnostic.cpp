#include "diagnostic.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <iomanip>
#include <sstream>

#include <unistd.h>

namespace letc::cli {

// ============================================================================
// Terminal Detection
// ============================================================================

bool terminal_supports_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

// ============================================================================
// DiagnosticEmitter Implementation
// ============================================================================

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {
    use_colors_ = &out == &std::cerr && terminal_supports_colors();
}

void DiagnosticEmitter::set_source_content(const std::string& path, const std::string& content) {
    source_files_[path] = content;
}

std::string DiagnosticEmitter::get_source_line(const std::string& path, uint32_t line) const {
    auto it = source_files_.find(path);
    if (it == source_files_.end() || line == 0)
        return "";

    const std::string& content = it->second;
    uint32_t current_line = 1;
    size_t line_start = 0;

    for (size_t i = 0; i <= content.size(); ++i) {
        bool at_break = i == content.size() || content[i] == '\n' || content[i] == '\r';
        if (!at_break) {
            continue;
        }
        if (current_line == line) {
            return content.substr(line_start, i - line_start);
        }
        if (i + 1 < content.size() && content[i] == '\r' && content[i + 1] == '\n') {
            ++i;
        }
        ++current_line;
        line_start = i + 1;
    }

    return "";
}

const char* DiagnosticEmitter::severity_string(diag::Severity sev) {
    switch (sev) {
    case diag::Severity::Error:
        return "error";
    case diag::Severity::Warning:
        return "warning";
    }
    return "unknown";
}

const char* DiagnosticEmitter::severity_color(diag::Severity sev) const {
    switch (sev) {
    case diag::Severity::Error:
        return Colors::BrightRed;
    case diag::Severity::Warning:
        return Colors::BrightYellow;
    }
    return Colors::Reset;
}

void DiagnosticEmitter::emit_header(const diag::Diagnostic& diag) {
    // Format: warning[P003]: message
    out_ << color(Colors::Bold) << color(severity_color(diag.severity))
         << severity_string(diag.severity);

    if (!diag.code.empty()) {
        out_ << "[" << diag.code << "]";
    }

    out_ << color(Colors::Reset) << color(Colors::Bold) << ": " << diag.message
         << color(Colors::Reset) << "\n";
}

void DiagnosticEmitter::emit_source_snippet(const diag::Diagnostic& diag) {
    const auto& span = diag.span;
    if (span.start.line == 0) {
        // No position (e.g. a file that could not be read)
        if (!diag.file.empty()) {
            out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << diag.file
                 << "\n";
        }
        return;
    }

    out_ << color(Colors::BrightBlue) << "  --> " << color(Colors::Reset) << diag.file << ":"
         << span.start.line << ":" << span.start.column << "\n";

    std::string source_line = get_source_line(diag.file, span.start.line);
    if (source_line.empty()) {
        return;
    }

    int line_width = std::max(static_cast<int>(std::to_string(span.start.line).length()), 4);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
    out_ << color(Colors::BrightBlue) << std::setw(line_width) << span.start.line << " | "
         << color(Colors::Reset) << source_line << "\n";

    uint32_t start_col = span.start.column > 0 ? span.start.column - 1 : 0;
    uint32_t end_col = span.end.line == span.start.line && span.end.column >= span.start.column
                           ? span.end.column
                           : static_cast<uint32_t>(source_line.length());
    end_col = std::max(end_col, start_col + 1);

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " | "
         << color(Colors::Reset);
    for (uint32_t i = 0; i < start_col; ++i) {
        out_ << (i < source_line.size() && source_line[i] == '\t' ? '\t' : ' ');
    }
    out_ << color(severity_color(diag.severity));
    for (uint32_t i = start_col; i < end_col; ++i) {
        out_ << '^';
    }
    out_ << color(Colors::Reset) << "\n";

    out_ << color(Colors::BrightBlue) << std::setw(line_width) << "" << " |" << color(Colors::Reset)
         << "\n";
}

void DiagnosticEmitter::emit(const diag::Diagnostic& diag) {
    if (diag.severity == diag::Severity::Error) {
        error_count_++;
    } else {
        warning_count_++;
    }

    if (format_ == DiagnosticFormat::JSON) {
        emit_json(diag);
        return;
    }

    emit_header(diag);
    emit_source_snippet(diag);
}

void DiagnosticEmitter::emit_all(const std::vector<diag::Diagnostic>& diags) {
    for (const auto& d : diags) {
        emit(d);
    }
}

std::string escape_json_string(const std::string& s) {
    std::ostringstream result;
    for (char c : s) {
        switch (c) {
        case '"':
            result << "\\\"";
            break;
        case '\\':
            result << "\\\\";
            break;
        case '\b':
            result << "\\b";
            break;
        case '\f':
            result << "\\f";
            break;
        case '\n':
            result << "\\n";
            break;
        case '\r':
            result << "\\r";
            break;
        case '\t':
            result << "\\t";
            break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                // Control character - emit as \uXXXX
                result << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                       << static_cast<int>(c) << std::dec;
            } else {
                result << c;
            }
            break;
        }
    }
    return result.str();
}

void DiagnosticEmitter::emit_json(const diag::Diagnostic& diag) {
    out_ << "{";
    out_ << "\"severity\":\"" << severity_string(diag.severity) << "\",";
    out_ << "\"code\":\"" << escape_json_string(diag.code) << "\",";
    out_ << "\"message\":\"" << escape_json_string(diag.message) << "\",";
    out_ << "\"span\":{";
    out_ << "\"file\":\"" << escape_json_string(diag.file) << "\",";
    out_ << "\"start\":{\"line\":" << diag.span.start.line
         << ",\"column\":" << diag.span.start.column << "},";
    out_ << "\"end\":{\"line\":" << diag.span.end.line << ",\"column\":" << diag.span.end.column
         << "}";
    out_ << "}}\n";
}

// ============================================================================
// "Did You Mean?" Suggestions Implementation
// ============================================================================

size_t levenshtein_distance(const std::string& s1, const std::string& s2) {
    const size_t m = s1.length();
    const size_t n = s2.length();

    if (m == 0)
        return n;
    if (n == 0)
        return m;

    // Use two rows for space efficiency
    std::vector<size_t> prev_row(n + 1);
    std::vector<size_t> curr_row(n + 1);

    for (size_t j = 0; j <= n; ++j) {
        prev_row[j] = j;
    }

    for (size_t i = 1; i <= m; ++i) {
        curr_row[0] = i;

        for (size_t j = 1; j <= n; ++j) {
            // Case-insensitive comparison
            char c1 = static_cast<char>(std::tolower(static_cast<unsigned char>(s1[i - 1])));
            char c2 = static_cast<char>(std::tolower(static_cast<unsigned char>(s2[j - 1])));

            size_t cost = (c1 == c2) ? 0 : 1;

            curr_row[j] = std::min({prev_row[j] + 1,          // deletion
                                    curr_row[j - 1] + 1,      // insertion
                                    prev_row[j - 1] + cost}); // substitution
        }

        std::swap(prev_row, curr_row);
    }

    return prev_row[n];
}

std::string find_similar(const std::string& input, const std::vector<std::string>& candidates,
                         size_t max_distance) {
    if (input.empty() || candidates.empty()) {
        return "";
    }

    std::string best_match;
    size_t best_distance = max_distance + 1;

    for (const auto& candidate : candidates) {
        // Skip if length difference is too large
        size_t len_diff = input.length() > candidate.length() ? input.length() - candidate.length()
                                                              : candidate.length() - input.length();
        if (len_diff > max_distance) {
            continue;
        }

        size_t dist = levenshtein_distance(input, candidate);
        if (dist < best_distance) {
            best_distance = dist;
            best_match = candidate;
        }
    }

    return best_match;
}

} // namespace letc::cli
