#include "lexer/token.hpp"

#include <fmt/format.h>

#include <array>
#include <algorithm>

namespace loft {

namespace {

constexpr std::array<std::string_view, 24> kKeywords = {
    "let",      "const", "fn",    "if",    "else",  "while", "for",   "in",
    "return",   "break", "continue", "match", "def", "enum",  "impl",  "trait",
    "async",    "await", "lazy",  "mut",   "true",  "false", "learn", "teach",
};

constexpr std::string_view kOperatorChars = "+-*/%=!<>&|^~.@?";
constexpr std::string_view kPunctChars    = ",;:(){}[]#";

constexpr std::array<std::string_view, 13> kDigraphs = {
    "->", "=>", "==", "!=", "<=", ">=", "&&", "||", "+=", "-=", "*=", "/=", "::",
};

} // namespace

std::string_view token_kind_to_string(TokenKind kind) {
    switch (kind) {
    case TokenKind::Number:            return "Number";
    case TokenKind::Keyword:           return "Keyword";
    case TokenKind::Ident:             return "Ident";
    case TokenKind::String:            return "String";
    case TokenKind::Punct:             return "Punct";
    case TokenKind::Op:                return "Op";
    case TokenKind::DocComment:        return "DocComment";
    case TokenKind::Comment:           return "Comment";
    case TokenKind::TemplateStart:     return "TemplateStart";
    case TokenKind::TemplateString:    return "TemplateString";
    case TokenKind::TemplateExprStart: return "TemplateExprStart";
    case TokenKind::TemplateExprEnd:   return "TemplateExprEnd";
    case TokenKind::TemplateEnd:       return "TemplateEnd";
    }
    return "Unknown";
}

bool is_keyword(std::string_view word) {
    return std::find(kKeywords.begin(), kKeywords.end(), word) != kKeywords.end();
}

bool is_operator_char(char c) {
    return c != '\0' && kOperatorChars.find(c) != std::string_view::npos;
}

bool is_punct_char(char c) {
    return c != '\0' && kPunctChars.find(c) != std::string_view::npos;
}

bool is_digraph(char first, char second) {
    const char pair[2] = {first, second};
    std::string_view text(pair, 2);
    return std::find(kDigraphs.begin(), kDigraphs.end(), text) != kDigraphs.end();
}

int binary_precedence(std::string_view op) {
    if (op == "||") return 1;
    if (op == "&&") return 2;
    if (op == "==" || op == "!=") return 3;
    if (op == "<" || op == "<=" || op == ">" || op == ">=") return 4;
    if (op == "|") return 5;
    if (op == "^") return 6;
    if (op == "&") return 7;
    if (op == "<<" || op == ">>") return 8;
    if (op == "+" || op == "-") return 9;
    if (op == "*" || op == "/" || op == "%") return 10;
    return 0;
}

std::string Token::describe() const {
    switch (kind) {
    case TokenKind::Number:
        return number.to_string();
    case TokenKind::Keyword:
    case TokenKind::Ident:
    case TokenKind::Punct:
    case TokenKind::Op:
        return fmt::format("'{}'", text);
    case TokenKind::String:
        return fmt::format("\"{}\"", text);
    case TokenKind::DocComment:
        return "doc comment";
    case TokenKind::Comment:
        return "comment";
    case TokenKind::TemplateStart:
    case TokenKind::TemplateEnd:
        return "'`'";
    case TokenKind::TemplateString:
        return fmt::format("template text \"{}\"", text);
    case TokenKind::TemplateExprStart:
        return "'${'";
    case TokenKind::TemplateExprEnd:
        return "'}'";
    }
    return "<unknown>";
}

} // namespace loft
