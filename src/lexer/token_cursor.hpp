#pragma once

#include "common/diagnostic.hpp"
#include "lexer/token.hpp"
#include "lexer/tokenizer.hpp"

#include <deque>
#include <optional>
#include <string>
#include <string_view>

namespace loft {

/// Buffered token source for the parser.
///
/// Tokens are pulled from the tokenizer into a FIFO front buffer on demand.
/// `push_back` returns a token to the front of the buffer, which is the only
/// way the parser backtracks: a speculative probe pushes every token it took
/// back, in reverse order.
///
/// A lexical error is sticky. Once the tokenizer fails, tokens already in the
/// buffer are still handed out, after which the cursor reports end of input
/// and `error()` holds the diagnostic.
class TokenCursor {
public:
    TokenCursor(std::string_view source, std::string_view path);
    explicit TokenCursor(Tokenizer tokenizer);

    /// The next token without consuming it, or nullptr at end of input.
    [[nodiscard]] const Token* peek();

    /// Consume the next token. Returns nullopt at end of input.
    std::optional<Token> next();

    /// Return a token to the front of the buffer.
    void push_back(Token token);

    [[nodiscard]] bool at_end() { return peek() == nullptr; }

    [[nodiscard]] const std::optional<Diagnostic>& error() const { return tokenizer_.error(); }

    /// Build an error diagnostic at the tokenizer's current position.
    [[nodiscard]] Diagnostic croak(std::string message,
                                   std::optional<uint32_t> len = std::nullopt) const;

    [[nodiscard]] std::optional<std::string> take_last_doc_comment() {
        return tokenizer_.take_last_doc_comment();
    }

private:
    Tokenizer tokenizer_;
    std::deque<Token> buffer_;
};

} // namespace loft
