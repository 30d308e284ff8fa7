#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace loft {

/// A line/column pair (both 1-based).
struct SourcePosition {
    uint32_t line   = 1;
    uint32_t column = 1;

    [[nodiscard]] bool operator==(const SourcePosition&) const = default;
    [[nodiscard]] auto operator<=>(const SourcePosition&) const = default;
};

/// A point in a named source buffer.
/// The filename is borrowed and must outlive the location.
struct SourceLocation {
    std::string_view filename;
    SourcePosition position;
    uint32_t offset = 0; // byte offset from start of source

    [[nodiscard]] uint32_t line() const { return position.line; }
    [[nodiscard]] uint32_t column() const { return position.column; }

    [[nodiscard]] std::string to_string() const {
        return std::string(filename) + ":" + std::to_string(position.line) + ":" +
               std::to_string(position.column);
    }
};

} // namespace loft
