//! # Diagnostics Sink Implementation
//!
//! All accessors take the sink's mutex, so readers always see a consistent
//! list and counters even while another thread is appending.

#include "letc/diag/diagnostics.hpp"

namespace letc::diag {

void DiagnosticSink::report(Diagnostic diag) {
    if (diag.file.empty()) {
        diag.file = std::string(diag.span.start.file);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (diag.severity == Severity::Error) {
        ++errors_;
    } else {
        ++warnings_;
    }
    diags_.push_back(std::move(diag));
}

void DiagnosticSink::warn(const std::string& code, const std::string& message,
                          const SourceSpan& span) {
    report(Diagnostic{.severity = Severity::Warning,
                      .code = code,
                      .message = message,
                      .span = span,
                      .file = std::string(span.start.file)});
}

void DiagnosticSink::error(const std::string& code, const std::string& message,
                           const SourceSpan& span) {
    report(Diagnostic{.severity = Severity::Error,
                      .code = code,
                      .message = message,
                      .span = span,
                      .file = std::string(span.start.file)});
}

void DiagnosticSink::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    diags_.clear();
    warnings_ = 0;
    errors_ = 0;
}

auto DiagnosticSink::diagnostics() const -> std::vector<Diagnostic> {
    std::lock_guard<std::mutex> lock(mutex_);
    return diags_;
}

auto DiagnosticSink::diagnostics_since(size_t first) const -> std::vector<Diagnostic> {
    std::lock_guard<std::mutex> lock(mutex_);
    if (first >= diags_.size()) {
        return {};
    }
    return std::vector<Diagnostic>(diags_.begin() + static_cast<std::ptrdiff_t>(first),
                                   diags_.end());
}

auto DiagnosticSink::size() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return diags_.size();
}

auto DiagnosticSink::warning_count() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return warnings_;
}

auto DiagnosticSink::error_count() const -> size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return errors_;
}

auto global_diagnostics() -> DiagnosticSink& {
    static DiagnosticSink sink;
    return sink;
}

} // namespace letc::diag
