#include "lexer/input_stream.hpp"

#include <algorithm>

namespace loft {

PositionedInputStream::PositionedInputStream(std::string_view source, std::string_view path)
    : source_(source), path_(path), end_(static_cast<uint32_t>(source.size())) {}

PositionedInputStream::PositionedInputStream(std::string_view source, std::string_view path,
                                             StreamPosition start, uint32_t end)
    : source_(source), path_(path), offset_(start.offset),
      end_(std::min(end, static_cast<uint32_t>(source.size()))), position_(start.position) {}

char PositionedInputStream::peek() const {
    if (eof()) return '\0';
    return source_[offset_];
}

char PositionedInputStream::next() {
    if (eof()) return '\0';
    char c = source_[offset_++];
    if (c == '\n') {
        ++position_.line;
        position_.column = 1;
    } else {
        ++position_.column;
    }
    return c;
}

void PositionedInputStream::restore_position(StreamPosition pos) {
    offset_ = pos.offset;
    position_ = pos.position;
}

SourceLocation PositionedInputStream::location() const {
    return SourceLocation{path_, position_, offset_};
}

PositionedInputStream PositionedInputStream::sub_stream(StreamPosition start,
                                                        uint32_t end_offset) const {
    return PositionedInputStream(source_, path_, start, end_offset);
}

Diagnostic PositionedInputStream::croak(std::string message, std::optional<uint32_t> len) const {
    Diagnostic diag;
    diag.severity = DiagnosticSeverity::Error;
    diag.location = location();
    diag.message = std::move(message);
    diag.length = len;
    diag.source_line = std::string(current_line());
    return diag;
}

std::string_view PositionedInputStream::current_line() const {
    // Columns count bytes, so the line starts column-1 bytes back.
    uint32_t begin = offset_ - std::min(offset_, position_.column - 1);
    size_t end = source_.find('\n', begin);
    if (end == std::string_view::npos) {
        end = source_.size();
    }
    return source_.substr(begin, end - begin);
}

} // namespace loft
