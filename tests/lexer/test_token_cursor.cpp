#include "lexer/token.hpp"
#include "lexer/token_cursor.hpp"

#include <gtest/gtest.h>

using namespace loft;

TEST(TokenCursorTest, PeekDoesNotConsume) {
    TokenCursor cursor("a b", "t.lf");
    ASSERT_NE(cursor.peek(), nullptr);
    EXPECT_EQ(cursor.peek()->text, "a");
    EXPECT_EQ(cursor.peek()->text, "a");

    auto tok = cursor.next();
    ASSERT_TRUE(tok.has_value());
    EXPECT_EQ(tok->text, "a");
    EXPECT_EQ(cursor.peek()->text, "b");
}

TEST(TokenCursorTest, EndOfInput) {
    TokenCursor cursor("x", "t.lf");
    EXPECT_FALSE(cursor.at_end());
    (void)cursor.next();
    EXPECT_TRUE(cursor.at_end());
    EXPECT_EQ(cursor.peek(), nullptr);
    EXPECT_FALSE(cursor.next().has_value());
    EXPECT_FALSE(cursor.error().has_value());
}

TEST(TokenCursorTest, PushBackRestoresOrder) {
    TokenCursor cursor("a b c", "t.lf");
    Token a = *cursor.next();
    Token b = *cursor.next();

    // Replay in reverse so the original order comes back.
    cursor.push_back(b);
    cursor.push_back(a);

    EXPECT_EQ(cursor.next()->text, "a");
    EXPECT_EQ(cursor.next()->text, "b");
    EXPECT_EQ(cursor.next()->text, "c");
    EXPECT_TRUE(cursor.at_end());
}

TEST(TokenCursorTest, PushBackAtEnd) {
    TokenCursor cursor("x", "t.lf");
    Token x = *cursor.next();
    EXPECT_TRUE(cursor.at_end());

    cursor.push_back(x);
    EXPECT_FALSE(cursor.at_end());
    EXPECT_EQ(cursor.next()->text, "x");
}

TEST(TokenCursorTest, PushBackSyntheticToken) {
    TokenCursor cursor("f()", "t.lf");
    cursor.push_back(Token::make(TokenKind::Keyword, "async"));
    EXPECT_TRUE(cursor.peek()->is_keyword("async"));
    (void)cursor.next();
    EXPECT_EQ(cursor.peek()->text, "f");
}

TEST(TokenCursorTest, TemplateGroupIsBuffered) {
    TokenCursor cursor("`a${b}`", "t.lf");
    EXPECT_EQ(cursor.next()->kind, TokenKind::TemplateStart);
    EXPECT_EQ(cursor.next()->kind, TokenKind::TemplateString);
    EXPECT_EQ(cursor.next()->kind, TokenKind::TemplateExprStart);
    EXPECT_EQ(cursor.next()->text, "b");
    EXPECT_EQ(cursor.next()->kind, TokenKind::TemplateExprEnd);
    EXPECT_EQ(cursor.next()->kind, TokenKind::TemplateEnd);
    EXPECT_TRUE(cursor.at_end());
}

TEST(TokenCursorTest, LexicalErrorIsSticky) {
    TokenCursor cursor("a $ b", "t.lf");
    EXPECT_EQ(cursor.next()->text, "a");
    EXPECT_FALSE(cursor.next().has_value());
    ASSERT_TRUE(cursor.error().has_value());
    EXPECT_EQ(cursor.error()->message, "Unexpected token '$'");

    // Nothing after the error is ever produced.
    EXPECT_EQ(cursor.peek(), nullptr);
    EXPECT_TRUE(cursor.at_end());
}

TEST(TokenCursorTest, BufferedTokensSurviveError) {
    TokenCursor cursor("`t` $", "t.lf");
    EXPECT_EQ(cursor.next()->kind, TokenKind::TemplateStart);
    EXPECT_EQ(cursor.next()->kind, TokenKind::TemplateString);
    EXPECT_EQ(cursor.next()->kind, TokenKind::TemplateEnd);
    EXPECT_FALSE(cursor.next().has_value());
    EXPECT_TRUE(cursor.error().has_value());
}

TEST(TokenCursorTest, CroakUsesTokenizerPosition) {
    TokenCursor cursor("let x", "t.lf");
    (void)cursor.next();
    (void)cursor.next();
    Diagnostic diag = cursor.croak("Expected '=' but got EOF");
    EXPECT_EQ(diag.location.line(), 1u);
    EXPECT_EQ(diag.location.column(), 6u);
    EXPECT_EQ(diag.source_line, "let x");
}

TEST(TokenCursorTest, DocComment) {
    TokenCursor cursor("/// Entry point.\nfn main() {}", "t.lf");
    EXPECT_TRUE(cursor.peek()->is_keyword("fn"));
    EXPECT_EQ(cursor.take_last_doc_comment(), "Entry point.");
}

TEST(TokenCursorTest, FromConfiguredTokenizer) {
    TokenCursor cursor(Tokenizer(PositionedInputStream("// c\nx", "t.lf"), TokenizerOptions{true}));
    EXPECT_EQ(cursor.next()->kind, TokenKind::Comment);
    EXPECT_EQ(cursor.next()->text, "x");
}
