#pragma once

#include "source_location.hpp"

#include <fmt/format.h>

#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace loft {

/// Severity levels for diagnostics.
enum class DiagnosticSeverity : uint8_t {
    Warning,
    Error,
};

/// A positioned message. Parse errors are diagnostics with Error severity.
///
/// The highlighted span, when present, is the `length` bytes that end at
/// `location.offset`.
struct Diagnostic {
    DiagnosticSeverity severity = DiagnosticSeverity::Error;
    SourceLocation location;
    std::string message;
    std::optional<uint32_t> length;
    std::optional<std::string> help;
    std::string source_line; // full text of the line containing `location`

    [[nodiscard]] bool is_error() const { return severity == DiagnosticSeverity::Error; }
};

/// Collects diagnostics and forwards each one to an optional handler.
class DiagnosticEngine {
public:
    using DiagnosticHandler = std::function<void(const Diagnostic&)>;

    /// Set a custom handler for diagnostics (e.g., printing in the driver).
    void set_handler(DiagnosticHandler handler) { handler_ = std::move(handler); }

    /// Record an already built diagnostic (typically a parse error).
    void report(Diagnostic diag);

    /// Report a formatted error diagnostic.
    template <typename... Args>
    void error(SourceLocation loc, fmt::format_string<Args...> fmt_str, Args&&... args) {
        report(Diagnostic{DiagnosticSeverity::Error, loc,
                          fmt::format(fmt_str, std::forward<Args>(args)...), std::nullopt,
                          std::nullopt, {}});
    }

    /// Report a formatted warning diagnostic.
    template <typename... Args>
    void warning(SourceLocation loc, fmt::format_string<Args...> fmt_str, Args&&... args) {
        report(Diagnostic{DiagnosticSeverity::Warning, loc,
                          fmt::format(fmt_str, std::forward<Args>(args)...), std::nullopt,
                          std::nullopt, {}});
    }

    [[nodiscard]] bool has_errors() const { return error_count_ > 0; }
    [[nodiscard]] uint32_t error_count() const { return error_count_; }
    [[nodiscard]] uint32_t warning_count() const { return warning_count_; }
    [[nodiscard]] const std::vector<Diagnostic>& diagnostics() const { return diagnostics_; }

    void clear() {
        diagnostics_.clear();
        error_count_ = 0;
        warning_count_ = 0;
    }

private:
    std::vector<Diagnostic> diagnostics_;
    DiagnosticHandler handler_;
    uint32_t error_count_   = 0;
    uint32_t warning_count_ = 0;
};

/// Format a diagnostic as a single line: `path:line:col: severity: message`.
[[nodiscard]] std::string format_diagnostic(const Diagnostic& diag);

/// Render a diagnostic with its source line and a caret underline, e.g.
///
///     error: Unexpected token in expression: ';'
///      --> main.lf:1:10
///       |
///     1 | let x = ;
///       |          ^
[[nodiscard]] std::string render_diagnostic(const Diagnostic& diag);

} // namespace loft
