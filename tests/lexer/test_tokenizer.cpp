#include "common/diagnostic.hpp"
#include "lexer/input_stream.hpp"
#include "lexer/token.hpp"
#include "lexer/tokenizer.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

using namespace loft;

// ============================================================================
// Test helpers
// ============================================================================

// Tokenize expecting no errors.
static std::vector<Token> tokenize_ok(std::string_view source, TokenizerOptions options = {}) {
    Tokenizer tokenizer(PositionedInputStream(source, "test.lf"), options);
    auto tokens = tokenizer.tokenize_all();
    EXPECT_FALSE(tokenizer.error().has_value())
        << "Unexpected error tokenizing: " << source << ": " << tokenizer.error()->message;
    return tokens;
}

// Tokenize expecting a lexical error; returns it.
static Diagnostic tokenize_error(std::string_view source) {
    Tokenizer tokenizer(PositionedInputStream(source, "test.lf"));
    (void)tokenizer.tokenize_all();
    EXPECT_TRUE(tokenizer.error().has_value()) << "Expected an error tokenizing: " << source;
    return tokenizer.error().value_or(Diagnostic{});
}

static std::vector<TokenKind> kinds(const std::vector<Token>& tokens) {
    std::vector<TokenKind> result;
    for (const auto& tok : tokens) {
        result.push_back(tok.kind);
    }
    return result;
}

// ============================================================================
// Token utility tests
// ============================================================================

TEST(TokenTest, TokenKindToString) {
    EXPECT_EQ(token_kind_to_string(TokenKind::Number), "Number");
    EXPECT_EQ(token_kind_to_string(TokenKind::Punct), "Punct");
    EXPECT_EQ(token_kind_to_string(TokenKind::TemplateExprStart), "TemplateExprStart");
    EXPECT_EQ(token_kind_to_string(TokenKind::DocComment), "DocComment");
}

TEST(TokenTest, Keywords) {
    for (std::string_view kw : {"let", "const", "fn", "if", "else", "while", "for", "in",
                                "return", "break", "continue", "match", "def", "enum", "impl",
                                "trait", "async", "await", "lazy", "mut", "true", "false",
                                "learn", "teach"}) {
        EXPECT_TRUE(is_keyword(kw)) << kw;
    }
    EXPECT_FALSE(is_keyword("struct"));
    EXPECT_FALSE(is_keyword("Let"));
    EXPECT_FALSE(is_keyword("self"));
}

TEST(TokenTest, Digraphs) {
    EXPECT_TRUE(is_digraph('-', '>'));
    EXPECT_TRUE(is_digraph('=', '>'));
    EXPECT_TRUE(is_digraph('&', '&'));
    EXPECT_TRUE(is_digraph('/', '='));
    EXPECT_FALSE(is_digraph('<', '<'));
    EXPECT_FALSE(is_digraph('=', '<'));
}

TEST(TokenTest, BinaryPrecedence) {
    EXPECT_EQ(binary_precedence("||"), 1);
    EXPECT_EQ(binary_precedence("&&"), 2);
    EXPECT_EQ(binary_precedence("=="), 3);
    EXPECT_EQ(binary_precedence(">="), 4);
    EXPECT_EQ(binary_precedence("|"), 5);
    EXPECT_EQ(binary_precedence("^"), 6);
    EXPECT_EQ(binary_precedence("&"), 7);
    EXPECT_EQ(binary_precedence("<<"), 8);
    EXPECT_EQ(binary_precedence("-"), 9);
    EXPECT_EQ(binary_precedence("%"), 10);
    EXPECT_EQ(binary_precedence("="), 0);
    EXPECT_EQ(binary_precedence("=>"), 0);
    EXPECT_EQ(binary_precedence("."), 0);
    EXPECT_EQ(binary_precedence("+="), 0);
}

TEST(TokenTest, Describe) {
    EXPECT_EQ(Token::make(TokenKind::Keyword, "let").describe(), "'let'");
    EXPECT_EQ(Token::make(TokenKind::Punct, ";").describe(), "';'");
    EXPECT_EQ(Token::make(TokenKind::String, "hi").describe(), "\"hi\"");
    EXPECT_EQ((Token{TokenKind::Number, "1.50", *Decimal::parse("1.50")}.describe()), "1.50");
    EXPECT_EQ(Token::make(TokenKind::TemplateEnd).describe(), "'`'");
    EXPECT_EQ(Token::make(TokenKind::TemplateExprEnd).describe(), "'}'");
}

// ============================================================================
// Basic tokens
// ============================================================================

TEST(TokenizerTest, Empty) {
    EXPECT_TRUE(tokenize_ok("").empty());
    EXPECT_TRUE(tokenize_ok("  \n\t\r\n ").empty());
}

TEST(TokenizerTest, VarDecl) {
    auto tokens = tokenize_ok("let x = 42;");
    ASSERT_EQ(tokens.size(), 5u);
    EXPECT_EQ(tokens[0], Token::make(TokenKind::Keyword, "let"));
    EXPECT_EQ(tokens[1], Token::make(TokenKind::Ident, "x"));
    EXPECT_EQ(tokens[2], Token::make(TokenKind::Op, "="));
    EXPECT_EQ(tokens[3], (Token{TokenKind::Number, "42", *Decimal::parse("42")}));
    EXPECT_EQ(tokens[4], Token::make(TokenKind::Punct, ";"));
}

TEST(TokenizerTest, Identifiers) {
    auto tokens = tokenize_ok("foo Bar2 snake_case x1_y");
    ASSERT_EQ(tokens.size(), 4u);
    for (const auto& tok : tokens) {
        EXPECT_EQ(tok.kind, TokenKind::Ident);
    }
    EXPECT_EQ(tokens[2].text, "snake_case");
}

TEST(TokenizerTest, KeywordPrefixIsIdentifier) {
    auto tokens = tokenize_ok("letter fnord");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0], Token::make(TokenKind::Ident, "letter"));
    EXPECT_EQ(tokens[1], Token::make(TokenKind::Ident, "fnord"));
}

TEST(TokenizerTest, Punctuation) {
    auto tokens = tokenize_ok(",;:(){}[]#");
    ASSERT_EQ(tokens.size(), 10u);
    for (const auto& tok : tokens) {
        EXPECT_EQ(tok.kind, TokenKind::Punct);
        EXPECT_EQ(tok.text.size(), 1u);
    }
}

TEST(TokenizerTest, SingleCharOperators) {
    auto tokens = tokenize_ok("+ - * / % = ! < > & | ^ ~ . @ ?");
    ASSERT_EQ(tokens.size(), 16u);
    for (const auto& tok : tokens) {
        EXPECT_EQ(tok.kind, TokenKind::Op);
    }
}

TEST(TokenizerTest, DigraphOperators) {
    auto tokens = tokenize_ok("-> => == != <= >= && || += -= *= /=");
    std::vector<std::string> expected = {"->", "=>", "==", "!=", "<=", ">=",
                                         "&&", "||", "+=", "-=", "*=", "/="};
    ASSERT_EQ(tokens.size(), expected.size());
    for (size_t i = 0; i < expected.size(); ++i) {
        EXPECT_EQ(tokens[i], Token::make(TokenKind::Op, expected[i]));
    }
}

TEST(TokenizerTest, NonDigraphLeavesSecondChar) {
    auto tokens = tokenize_ok("a<<b =-c");
    ASSERT_EQ(tokens.size(), 7u);
    EXPECT_EQ(tokens[1], Token::make(TokenKind::Op, "<"));
    EXPECT_EQ(tokens[2], Token::make(TokenKind::Op, "<"));
    EXPECT_EQ(tokens[4], Token::make(TokenKind::Op, "="));
    EXPECT_EQ(tokens[5], Token::make(TokenKind::Op, "-"));
}

TEST(TokenizerTest, DoubleColonIsTwoPunctuators) {
    auto tokens = tokenize_ok("a::b");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[1], Token::make(TokenKind::Punct, ":"));
    EXPECT_EQ(tokens[2], Token::make(TokenKind::Punct, ":"));
}

// ============================================================================
// Numbers and strings
// ============================================================================

TEST(TokenizerTest, Numbers) {
    auto tokens = tokenize_ok("0 42 3.14 1.50");
    ASSERT_EQ(tokens.size(), 4u);
    EXPECT_EQ(tokens[0].number, *Decimal::parse("0"));
    EXPECT_EQ(tokens[1].number, *Decimal::parse("42"));
    EXPECT_EQ(tokens[2].number, *Decimal::parse("3.14"));
    EXPECT_EQ(tokens[3].text, "1.50");
}

TEST(TokenizerTest, NumberFollowedByField) {
    auto tokens = tokenize_ok("1.foo");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Number);
    EXPECT_EQ(tokens[1], Token::make(TokenKind::Op, "."));
    EXPECT_EQ(tokens[2], Token::make(TokenKind::Ident, "foo"));
}

TEST(TokenizerTest, NumberOutOfRange) {
    auto err = tokenize_error("let n = 999999999999999999999999999999;");
    EXPECT_EQ(err.message,
              "Invalid number literal '999999999999999999999999999999': value out of range");
    ASSERT_TRUE(err.length.has_value());
    EXPECT_EQ(*err.length, 30u);
    EXPECT_EQ(err.location.column(), 39u);
}

TEST(TokenizerTest, WideNumbers) {
    auto tokens = tokenize_ok("18446744073709551616 0.12345678901234567890");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].kind, TokenKind::Number);
    EXPECT_EQ(tokens[0].number.to_string(), "18446744073709551616");
    EXPECT_EQ(tokens[1].kind, TokenKind::Number);
    EXPECT_EQ(tokens[1].number.scale, 20u);
    EXPECT_EQ(tokens[1].text, "0.12345678901234567890");
}

TEST(TokenizerTest, Strings) {
    auto tokens = tokenize_ok(R"("hello" "")");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0], Token::make(TokenKind::String, "hello"));
    EXPECT_EQ(tokens[1], Token::make(TokenKind::String, ""));
}

TEST(TokenizerTest, StringBackslashKeepsNextChar) {
    auto tokens = tokenize_ok(R"("a\"b\\c\n")");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0].text, "a\"b\\cn");
}

TEST(TokenizerTest, UnterminatedStringStopsAtEof) {
    auto tokens = tokenize_ok("\"abc");
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_EQ(tokens[0], Token::make(TokenKind::String, "abc"));
}

// ============================================================================
// Comments
// ============================================================================

TEST(TokenizerTest, CommentsSkipped) {
    auto tokens = tokenize_ok("a // line\n/* block\n */ b");
    ASSERT_EQ(tokens.size(), 2u);
    EXPECT_EQ(tokens[0].text, "a");
    EXPECT_EQ(tokens[1].text, "b");
}

TEST(TokenizerTest, DivisionIsNotComment) {
    auto tokens = tokenize_ok("a / b");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1], Token::make(TokenKind::Op, "/"));
}

TEST(TokenizerTest, CommentsEmittedWhenRequested) {
    auto tokens = tokenize_ok("a // note\n/// doc\n/** block doc */ /**/ b",
                              TokenizerOptions{true});
    ASSERT_EQ(tokens.size(), 6u);
    EXPECT_EQ(tokens[1], Token::make(TokenKind::Comment, "note"));
    EXPECT_EQ(tokens[2], Token::make(TokenKind::DocComment, "doc"));
    EXPECT_EQ(tokens[3], Token::make(TokenKind::DocComment, "block doc"));
    EXPECT_EQ(tokens[4], Token::make(TokenKind::Comment, ""));
}

TEST(TokenizerTest, DocCommentCaptured) {
    Tokenizer tokenizer(PositionedInputStream("/// Adds two numbers.  \nfn add() {}", "t.lf"));
    auto tokens = tokenizer.tokenize_all();
    EXPECT_EQ(tokens.front(), Token::make(TokenKind::Keyword, "fn"));

    auto doc = tokenizer.take_last_doc_comment();
    ASSERT_TRUE(doc.has_value());
    EXPECT_EQ(*doc, "Adds two numbers.");
    EXPECT_FALSE(tokenizer.take_last_doc_comment().has_value());
}

TEST(TokenizerTest, LastDocCommentWins) {
    Tokenizer tokenizer(PositionedInputStream("/** first */\n/// second\nx", "t.lf"));
    (void)tokenizer.tokenize_all();
    EXPECT_EQ(tokenizer.take_last_doc_comment(), "second");
}

TEST(TokenizerTest, PlainCommentIsNotDoc) {
    Tokenizer tokenizer(PositionedInputStream("// plain\n/* block */ x", "t.lf"));
    (void)tokenizer.tokenize_all();
    EXPECT_FALSE(tokenizer.take_last_doc_comment().has_value());
}

TEST(TokenizerTest, UnterminatedBlockComment) {
    auto err = tokenize_error("x /* never closed");
    EXPECT_EQ(err.message, "Unterminated block comment");
}

// ============================================================================
// Template literals
// ============================================================================

TEST(TokenizerTest, TemplateWithoutInterpolation) {
    auto tokens = tokenize_ok("`hello`");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[0].kind, TokenKind::TemplateStart);
    EXPECT_EQ(tokens[1], Token::make(TokenKind::TemplateString, "hello"));
    EXPECT_EQ(tokens[2].kind, TokenKind::TemplateEnd);
}

TEST(TokenizerTest, EmptyTemplate) {
    auto tokens = tokenize_ok("``");
    EXPECT_EQ(kinds(tokens),
              (std::vector<TokenKind>{TokenKind::TemplateStart, TokenKind::TemplateEnd}));
}

TEST(TokenizerTest, TemplateInterpolation) {
    auto tokens = tokenize_ok("`a${x + 1}b`");
    EXPECT_EQ(kinds(tokens),
              (std::vector<TokenKind>{TokenKind::TemplateStart, TokenKind::TemplateString,
                                      TokenKind::TemplateExprStart, TokenKind::Ident,
                                      TokenKind::Op, TokenKind::Number,
                                      TokenKind::TemplateExprEnd, TokenKind::TemplateString,
                                      TokenKind::TemplateEnd}));
    EXPECT_EQ(tokens[1].text, "a");
    EXPECT_EQ(tokens[3].text, "x");
    EXPECT_EQ(tokens[7].text, "b");
}

TEST(TokenizerTest, TemplateNestedBraces) {
    auto tokens = tokenize_ok("`${ {a} }`");
    EXPECT_EQ(kinds(tokens),
              (std::vector<TokenKind>{TokenKind::TemplateStart, TokenKind::TemplateExprStart,
                                      TokenKind::Punct, TokenKind::Ident, TokenKind::Punct,
                                      TokenKind::TemplateExprEnd, TokenKind::TemplateEnd}));
}

TEST(TokenizerTest, TemplateEscapes) {
    auto tokens = tokenize_ok(R"(`a\nb\t\`\$\\\q`)");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1].text, "a\nb\t`$\\\\q");
}

TEST(TokenizerTest, TemplateDollarWithoutBrace) {
    auto tokens = tokenize_ok("`$x`");
    ASSERT_EQ(tokens.size(), 3u);
    EXPECT_EQ(tokens[1], Token::make(TokenKind::TemplateString, "$x"));
}

TEST(TokenizerTest, TokensAfterTemplate) {
    auto tokens = tokenize_ok("let s = `v${n}`;");
    ASSERT_EQ(tokens.size(), 10u);
    EXPECT_EQ(tokens.back(), Token::make(TokenKind::Punct, ";"));
}

TEST(TokenizerTest, UnterminatedTemplateLiteral) {
    auto err = tokenize_error("`abc");
    EXPECT_EQ(err.message, "Unterminated template literal");
}

TEST(TokenizerTest, UnterminatedTemplateExpression) {
    auto err = tokenize_error("`${x`");
    EXPECT_EQ(err.message, "Unterminated template expression");
}

TEST(TokenizerTest, ErrorInsideInterpolationReportsRealPosition) {
    auto err = tokenize_error("let s =\n  `${ $ }`;");
    EXPECT_EQ(err.message, "Unexpected token '$'");
    EXPECT_EQ(err.location.line(), 2u);
    EXPECT_EQ(err.location.column(), 8u);
    EXPECT_EQ(err.source_line, "  `${ $ }`;");
}

// ============================================================================
// Lexical errors
// ============================================================================

TEST(TokenizerTest, UnexpectedCharacter) {
    auto err = tokenize_error("let x = $;");
    EXPECT_EQ(err.message, "Unexpected token '$'");
    ASSERT_TRUE(err.length.has_value());
    EXPECT_EQ(*err.length, 1u);
    EXPECT_EQ(err.location.line(), 1u);
    EXPECT_EQ(err.location.column(), 10u);
    EXPECT_EQ(err.source_line, "let x = $;");
}

TEST(TokenizerTest, UnexpectedMultibyteCharacter) {
    // U+00E9 is two bytes; the message carries both and the span covers both.
    auto err = tokenize_error("let caf\xC3\xA9 = 1;");
    EXPECT_EQ(err.message, "Unexpected token '\xC3\xA9'");
    ASSERT_TRUE(err.length.has_value());
    EXPECT_EQ(*err.length, 2u);
    EXPECT_EQ(err.location.column(), 10u);
}

TEST(TokenizerTest, UnexpectedStrayBytesAreEscaped) {
    auto lone = tokenize_error("x \x80" " y");
    EXPECT_EQ(lone.message, "Unexpected token '\\x80'");
    EXPECT_EQ(lone.length.value_or(0), 1u);

    // Lead byte whose continuation is missing.
    auto truncated = tokenize_error("x \xC3" " y");
    EXPECT_EQ(truncated.message, "Unexpected token '\\xC3'");
    EXPECT_EQ(truncated.length.value_or(0), 1u);

    auto control = tokenize_error("x \x01");
    EXPECT_EQ(control.message, "Unexpected token '\\x01'");
}

TEST(TokenizerTest, LeadingUnderscoreIsRejected) {
    auto err = tokenize_error("_unused");
    EXPECT_EQ(err.message, "Unexpected token '_'");
}

TEST(TokenizerTest, ErrorIsFatal) {
    Tokenizer tokenizer(PositionedInputStream("a $ b c", "t.lf"));
    auto tokens = tokenizer.tokenize_all();
    ASSERT_EQ(tokens.size(), 1u);
    EXPECT_TRUE(tokenizer.error().has_value());

    std::deque<Token> more;
    EXPECT_FALSE(tokenizer.scan(more));
    EXPECT_TRUE(more.empty());
}
