#include "lexer/tokenizer.hpp"

#include <fmt/format.h>

#include <cctype>
#include <iterator>
#include <string_view>

namespace loft {

namespace {

std::string trim(std::string_view text) {
    auto is_space = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && is_space(text[begin])) ++begin;
    while (end > begin && is_space(text[end - 1])) --end;
    return std::string(text.substr(begin, end - begin));
}

// Byte count of the UTF-8 sequence started by `lead`; 1 for ASCII and for
// bytes that cannot start a sequence.
size_t utf8_sequence_length(unsigned char lead) {
    if (lead >= 0xC2 && lead <= 0xDF) return 2;
    if (lead >= 0xE0 && lead <= 0xEF) return 3;
    if (lead >= 0xF0 && lead <= 0xF4) return 4;
    return 1;
}

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

// Printable ASCII as is, everything else as \xNN.
std::string escape_bytes(std::string_view bytes) {
    std::string out;
    for (char c : bytes) {
        auto b = static_cast<unsigned char>(c);
        if (b >= 0x20 && b < 0x7F) {
            out += c;
        } else {
            out += fmt::format("\\x{:02X}", b);
        }
    }
    return out;
}

} // namespace

// ============================================================================
// Character classification helpers
// ============================================================================

bool Tokenizer::is_whitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\v' || c == '\f';
}

bool Tokenizer::is_digit(char c) {
    return c >= '0' && c <= '9';
}

bool Tokenizer::is_ident_start(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

bool Tokenizer::is_ident_body(char c) {
    return is_ident_start(c) || is_digit(c) || c == '_';
}

// ============================================================================
// Tokenizer core
// ============================================================================

Tokenizer::Tokenizer(PositionedInputStream input, TokenizerOptions options)
    : input_(input), options_(options) {}

void Tokenizer::fail(std::string message, std::optional<uint32_t> len) {
    if (!error_) {
        error_ = input_.croak(std::move(message), len);
    }
}

std::optional<std::string> Tokenizer::take_last_doc_comment() {
    std::optional<std::string> doc = std::move(last_doc_comment_);
    last_doc_comment_.reset();
    return doc;
}

bool Tokenizer::scan(std::deque<Token>& out) {
    if (error_) return false;

    for (;;) {
        skip_whitespace();
        if (input_.eof()) return false;
        if (input_.peek() != '/') break;

        // A lone '/' is the division operator.
        StreamPosition slash = input_.save_position();
        input_.next();
        if (input_.peek() != '/' && input_.peek() != '*') {
            input_.restore_position(slash);
            break;
        }

        Token comment;
        if (!read_comment(comment)) return false;
        if (options_.emit_comments) {
            out.push_back(std::move(comment));
            return true;
        }
    }

    char c = input_.peek();
    if (c == '"') {
        read_string(out);
        return true;
    }
    if (c == '`') {
        return read_template_literal(out);
    }
    if (is_digit(c)) {
        return read_number(out);
    }
    if (is_ident_start(c)) {
        read_ident(out);
        return true;
    }
    if (is_punct_char(c)) {
        input_.next();
        out.push_back(Token::make(TokenKind::Punct, std::string(1, c)));
        return true;
    }
    if (is_operator_char(c)) {
        read_operator(out);
        return true;
    }

    // Report a whole UTF-8 sequence so the message stays valid UTF-8; stray
    // or control bytes are escaped.
    auto lead = static_cast<unsigned char>(input_.next());
    std::string shown(1, static_cast<char>(lead));
    size_t width = utf8_sequence_length(lead);
    while (shown.size() < width && !input_.eof() && is_utf8_continuation(input_.peek())) {
        shown += input_.next();
    }
    auto len = static_cast<uint32_t>(shown.size());
    if (width == 1 || shown.size() < width) {
        shown = escape_bytes(shown);
    }
    fail(fmt::format("Unexpected token '{}'", shown), len);
    return false;
}

std::vector<Token> Tokenizer::tokenize_all() {
    std::deque<Token> pending;
    while (scan(pending)) {
    }
    return std::vector<Token>(std::make_move_iterator(pending.begin()),
                              std::make_move_iterator(pending.end()));
}

// ============================================================================
// Whitespace and comment handling
// ============================================================================

void Tokenizer::skip_whitespace() {
    while (!input_.eof() && is_whitespace(input_.peek())) {
        input_.next();
    }
}

bool Tokenizer::read_comment(Token& out) {
    // The leading '/' has been consumed.
    if (input_.next() == '/') {
        bool is_doc = input_.peek() == '/';
        if (is_doc) {
            input_.next();
        }
        std::string text;
        while (!input_.eof() && input_.peek() != '\n') {
            text += input_.next();
        }
        text = trim(text);
        if (is_doc) {
            last_doc_comment_ = text;
        }
        out = Token::make(is_doc ? TokenKind::DocComment : TokenKind::Comment, std::move(text));
        return true;
    }

    // "/*" consumed. "/**" opens a doc comment, except for the empty "/**/".
    bool is_doc = false;
    if (input_.peek() == '*') {
        StreamPosition star = input_.save_position();
        input_.next();
        if (input_.peek() == '/') {
            input_.restore_position(star);
        } else {
            is_doc = true;
        }
    }

    std::string text;
    if (!read_block_comment(text)) {
        return false;
    }
    text = trim(text);
    if (is_doc) {
        last_doc_comment_ = text;
    }
    out = Token::make(is_doc ? TokenKind::DocComment : TokenKind::Comment, std::move(text));
    return true;
}

bool Tokenizer::read_block_comment(std::string& text) {
    while (!input_.eof()) {
        char c = input_.next();
        if (c == '*' && input_.peek() == '/') {
            input_.next();
            return true;
        }
        text += c;
    }
    fail("Unterminated block comment");
    return false;
}

// ============================================================================
// Literals, identifiers and operators
// ============================================================================

bool Tokenizer::read_number(std::deque<Token>& out) {
    std::string text;
    while (is_digit(input_.peek())) {
        text += input_.next();
    }

    // A fraction needs at least one digit after the dot; "1.foo" is 1 . foo
    if (input_.peek() == '.') {
        StreamPosition dot = input_.save_position();
        input_.next();
        if (is_digit(input_.peek())) {
            text += '.';
            while (is_digit(input_.peek())) {
                text += input_.next();
            }
        } else {
            input_.restore_position(dot);
        }
    }

    auto value = Decimal::parse(text);
    if (!value) {
        fail(fmt::format("Invalid number literal '{}': value out of range", text),
             static_cast<uint32_t>(text.size()));
        return false;
    }
    out.push_back(Token{TokenKind::Number, std::move(text), *value});
    return true;
}

void Tokenizer::read_ident(std::deque<Token>& out) {
    std::string word;
    while (is_ident_body(input_.peek())) {
        word += input_.next();
    }
    TokenKind kind = is_keyword(word) ? TokenKind::Keyword : TokenKind::Ident;
    out.push_back(Token::make(kind, std::move(word)));
}

void Tokenizer::read_string(std::deque<Token>& out) {
    input_.next(); // opening quote

    // A backslash keeps the next character verbatim. End of input closes the
    // string silently.
    std::string text;
    while (!input_.eof()) {
        char c = input_.next();
        if (c == '\\') {
            if (!input_.eof()) {
                text += input_.next();
            }
            continue;
        }
        if (c == '"') {
            break;
        }
        text += c;
    }
    out.push_back(Token::make(TokenKind::String, std::move(text)));
}

void Tokenizer::read_operator(std::deque<Token>& out) {
    char first = input_.next();
    std::string op(1, first);
    if (is_digraph(first, input_.peek())) {
        op += input_.next();
    }
    out.push_back(Token::make(TokenKind::Op, std::move(op)));
}

// ============================================================================
// Template literals
// ============================================================================

bool Tokenizer::read_template_literal(std::deque<Token>& out) {
    std::vector<Token> group;
    group.push_back(Token::make(TokenKind::TemplateStart));
    input_.next(); // opening backtick

    std::string text;
    auto flush_text = [&] {
        if (!text.empty()) {
            group.push_back(Token::make(TokenKind::TemplateString, std::move(text)));
            text.clear();
        }
    };

    bool closed = false;
    while (!input_.eof()) {
        char c = input_.peek();

        if (c == '`') {
            input_.next();
            flush_text();
            group.push_back(Token::make(TokenKind::TemplateEnd));
            closed = true;
            break;
        }

        if (c == '$') {
            StreamPosition dollar = input_.save_position();
            input_.next();
            if (input_.peek() != '{') {
                input_.restore_position(dollar);
                text += input_.next();
                continue;
            }
            input_.next(); // '{'
            flush_text();
            group.push_back(Token::make(TokenKind::TemplateExprStart));
            if (!read_template_expression(group)) {
                return false;
            }
            group.push_back(Token::make(TokenKind::TemplateExprEnd));
            continue;
        }

        if (c == '\\') {
            input_.next();
            if (input_.eof()) {
                break;
            }
            char escaped = input_.next();
            switch (escaped) {
            case 'n':  text += '\n'; break;
            case 't':  text += '\t'; break;
            case 'r':  text += '\r'; break;
            case '\\': text += '\\'; break;
            case '`':  text += '`'; break;
            case '$':  text += '$'; break;
            default:
                text += '\\';
                text += escaped;
                break;
            }
            continue;
        }

        text += input_.next();
    }

    if (!closed) {
        fail("Unterminated template literal");
        return false;
    }

    for (auto& tok : group) {
        out.push_back(std::move(tok));
    }
    return true;
}

bool Tokenizer::read_template_expression(std::vector<Token>& group) {
    // "${" consumed. Collect raw characters up to the matching '}'.
    StreamPosition start = input_.save_position();
    uint32_t end = start.offset;
    int depth = 1;
    while (!input_.eof()) {
        char c = input_.peek();
        if (c == '{') {
            ++depth;
        } else if (c == '}' && --depth == 0) {
            end = input_.offset();
            input_.next();
            break;
        }
        input_.next();
    }

    if (depth > 0) {
        fail("Unterminated template expression");
        return false;
    }

    Tokenizer nested(input_.sub_stream(start, end));
    std::deque<Token> tokens;
    while (nested.scan(tokens)) {
    }
    if (nested.error()) {
        error_ = nested.error();
        return false;
    }

    for (auto& tok : tokens) {
        group.push_back(std::move(tok));
    }
    return true;
}

} // namespace loft
