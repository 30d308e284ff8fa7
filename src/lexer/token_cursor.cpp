#include "lexer/token_cursor.hpp"

namespace loft {

TokenCursor::TokenCursor(std::string_view source, std::string_view path)
    : tokenizer_(PositionedInputStream(source, path)) {}

TokenCursor::TokenCursor(Tokenizer tokenizer) : tokenizer_(std::move(tokenizer)) {}

const Token* TokenCursor::peek() {
    if (buffer_.empty() && !tokenizer_.scan(buffer_)) {
        return nullptr;
    }
    return &buffer_.front();
}

std::optional<Token> TokenCursor::next() {
    if (!peek()) {
        return std::nullopt;
    }
    Token tok = std::move(buffer_.front());
    buffer_.pop_front();
    return tok;
}

void TokenCursor::push_back(Token token) {
    buffer_.push_front(std::move(token));
}

Diagnostic TokenCursor::croak(std::string message, std::optional<uint32_t> len) const {
    return tokenizer_.input().croak(std::move(message), len);
}

} // namespace loft
