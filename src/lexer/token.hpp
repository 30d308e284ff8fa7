#pragma once

#include "common/decimal.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace loft {

/// All token kinds produced by the tokenizer.
enum class TokenKind : uint8_t {
    Number,
    Keyword,
    Ident,
    String,
    Punct,      // , ; : ( ) { } [ ] #
    Op,         // single operator character or a digraph
    DocComment, // /// or /** */ (only with TokenizerOptions::emit_comments)
    Comment,    // // or /* */    (only with TokenizerOptions::emit_comments)

    // Template literal markers
    TemplateStart,     // `
    TemplateString,    // raw text between interpolations
    TemplateExprStart, // ${
    TemplateExprEnd,   // }
    TemplateEnd,       // `
};

/// Returns the name of a token kind ("Number", "Keyword", ...).
[[nodiscard]] std::string_view token_kind_to_string(TokenKind kind);

/// Check if a word is a reserved keyword.
[[nodiscard]] bool is_keyword(std::string_view word);

/// Check if a character opens an operator token.
[[nodiscard]] bool is_operator_char(char c);

/// Check if a character is a single-character punctuation token.
[[nodiscard]] bool is_punct_char(char c);

/// Check if two characters form a recognized two-character operator.
[[nodiscard]] bool is_digraph(char first, char second);

/// Binary operator precedence (higher binds tighter). Returns 0 for operators
/// that are not binary operators.
[[nodiscard]] int binary_precedence(std::string_view op);

/// A single token. Tokens do not carry positions; the input stream that
/// produced them owns position information.
struct Token {
    TokenKind kind = TokenKind::Ident;
    std::string text; // lexeme, literal contents or comment text
    Decimal number;   // valid when kind == Number

    [[nodiscard]] static Token make(TokenKind kind, std::string text = {}) {
        return Token{kind, std::move(text), {}};
    }

    [[nodiscard]] bool is(TokenKind k) const { return kind == k; }
    [[nodiscard]] bool is_not(TokenKind k) const { return kind != k; }
    [[nodiscard]] bool is(TokenKind k, std::string_view t) const { return kind == k && text == t; }

    [[nodiscard]] bool is_punct(std::string_view p) const { return is(TokenKind::Punct, p); }
    [[nodiscard]] bool is_op(std::string_view o) const { return is(TokenKind::Op, o); }
    [[nodiscard]] bool is_keyword(std::string_view k) const { return is(TokenKind::Keyword, k); }

    /// Human-readable form used in diagnostics, e.g. `'let'`, `"text"`, `42`.
    [[nodiscard]] std::string describe() const;

    [[nodiscard]] bool operator==(const Token&) const = default;
};

} // namespace loft
