#include "common/diagnostic.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace loft {

namespace {

std::string_view severity_name(DiagnosticSeverity severity) {
    switch (severity) {
    case DiagnosticSeverity::Warning:
        return "warning";
    case DiagnosticSeverity::Error:
        return "error";
    }
    return "error";
}

} // namespace

void DiagnosticEngine::report(Diagnostic diag) {
    if (diag.severity == DiagnosticSeverity::Error) {
        ++error_count_;
    } else {
        ++warning_count_;
    }

    diagnostics_.push_back(std::move(diag));

    if (handler_) {
        handler_(diagnostics_.back());
    }
}

std::string format_diagnostic(const Diagnostic& diag) {
    return fmt::format("{}: {}: {}", diag.location.to_string(), severity_name(diag.severity),
                       diag.message);
}

std::string render_diagnostic(const Diagnostic& diag) {
    std::string out = fmt::format("{}: {}\n", severity_name(diag.severity), diag.message);

    auto line_no = std::to_string(diag.location.line());
    std::string gutter(line_no.size(), ' ');
    out += fmt::format("{} --> {}\n", gutter, diag.location.to_string());

    if (!diag.source_line.empty()) {
        // The span ends at the reported column; an absent length still
        // gets a single caret.
        uint32_t len = diag.length.value_or(0);
        uint32_t end_col = diag.location.column();
        uint32_t start_col = end_col > len ? end_col - len : 1;
        uint32_t width = std::max<uint32_t>(len, 1);

        out += fmt::format("{} |\n", gutter);
        out += fmt::format("{} | {}\n", line_no, diag.source_line);
        out += fmt::format("{} | {}{}\n", gutter, std::string(start_col - 1, ' '),
                           std::string(width, '^'));
    }

    if (diag.help) {
        out += fmt::format("{} = help: {}\n", gutter, *diag.help);
    }
    return out;
}

} // namespace loft
