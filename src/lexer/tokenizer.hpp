#pragma once

#include "common/diagnostic.hpp"
#include "lexer/input_stream.hpp"
#include "lexer/token.hpp"

#include <deque>
#include <optional>
#include <string>
#include <vector>

namespace loft {

/// Tokenizer configuration.
struct TokenizerOptions {
    /// Surface comments as Comment / DocComment tokens instead of skipping
    /// them. Raw-token consumers (token dumps, formatters) turn this on; the
    /// parser never does.
    bool emit_comments = false;
};

/// Converts source characters into tokens.
///
/// Template literals are tokenized as one group: the opening backtick, every
/// text chunk and interpolation (tokenized by a nested Tokenizer over the
/// interpolation's characters) and the closing backtick are produced by a
/// single `scan` call.
///
/// Lexical errors are fatal: after the first one `scan` produces nothing more
/// and `error()` holds the diagnostic.
class Tokenizer {
public:
    explicit Tokenizer(PositionedInputStream input, TokenizerOptions options = {});

    /// Append the next token group to `out`. Returns false at end of input or
    /// on error.
    bool scan(std::deque<Token>& out);

    /// Tokenize the remaining input. Stops early on error.
    [[nodiscard]] std::vector<Token> tokenize_all();

    [[nodiscard]] const std::optional<Diagnostic>& error() const { return error_; }

    /// Take the most recent doc comment, leaving the slot empty.
    [[nodiscard]] std::optional<std::string> take_last_doc_comment();

    [[nodiscard]] const PositionedInputStream& input() const { return input_; }

private:
    PositionedInputStream input_;
    TokenizerOptions options_;
    std::optional<Diagnostic> error_;
    std::optional<std::string> last_doc_comment_;

    void skip_whitespace();
    bool read_comment(Token& out);
    bool read_block_comment(std::string& text);

    bool read_number(std::deque<Token>& out);
    void read_ident(std::deque<Token>& out);
    void read_string(std::deque<Token>& out);
    void read_operator(std::deque<Token>& out);
    bool read_template_literal(std::deque<Token>& out);
    bool read_template_expression(std::vector<Token>& group);

    void fail(std::string message, std::optional<uint32_t> len = std::nullopt);

    [[nodiscard]] static bool is_whitespace(char c);
    [[nodiscard]] static bool is_digit(char c);
    [[nodiscard]] static bool is_ident_start(char c);
    [[nodiscard]] static bool is_ident_body(char c);
};

} // namespace loft
