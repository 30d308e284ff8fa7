#pragma once

#include "common/diagnostic.hpp"
#include "common/source_location.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace loft {

/// Saved cursor state of a PositionedInputStream.
struct StreamPosition {
    uint32_t offset = 0;
    SourcePosition position;
};

/// Byte cursor over a borrowed source buffer that tracks line and column.
///
/// A stream may be bounded to a sub-range of the buffer (see `sub_stream`):
/// it then stops at the end of the range, but offsets, positions and the
/// source lines captured in diagnostics still refer to the whole buffer.
class PositionedInputStream {
public:
    PositionedInputStream(std::string_view source, std::string_view path);

    /// Current character, or '\0' at the end of the stream.
    [[nodiscard]] char peek() const;

    /// Consume and return the current character ('\0' at the end).
    char next();

    [[nodiscard]] bool eof() const { return offset_ >= end_; }

    [[nodiscard]] StreamPosition save_position() const { return {offset_, position_}; }
    void restore_position(StreamPosition pos);

    [[nodiscard]] uint32_t offset() const { return offset_; }
    [[nodiscard]] SourceLocation location() const;
    [[nodiscard]] std::string_view path() const { return path_; }

    /// A stream over [start, end_offset) of the same buffer, starting at the
    /// saved position `start`.
    [[nodiscard]] PositionedInputStream sub_stream(StreamPosition start, uint32_t end_offset) const;

    /// Build an error diagnostic at the current position. `len` is the number
    /// of bytes before the current offset to highlight.
    [[nodiscard]] Diagnostic croak(std::string message,
                                   std::optional<uint32_t> len = std::nullopt) const;

private:
    PositionedInputStream(std::string_view source, std::string_view path, StreamPosition start,
                          uint32_t end);

    /// Full text of the line holding the current position, without its newline.
    [[nodiscard]] std::string_view current_line() const;

    std::string_view source_;
    std::string_view path_;
    uint32_t offset_ = 0;
    uint32_t end_    = 0;
    SourcePosition position_;
};

} // namespace loft
