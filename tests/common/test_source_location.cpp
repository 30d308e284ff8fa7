#include "common/result.hpp"
#include "common/source_location.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace loft;

TEST(SourcePositionTest, DefaultConstruction) {
    SourcePosition pos;
    EXPECT_EQ(pos.line, 1u);
    EXPECT_EQ(pos.column, 1u);
}

TEST(SourcePositionTest, Comparison) {
    SourcePosition a{1, 5};
    SourcePosition b{1, 10};
    SourcePosition c{2, 1};

    EXPECT_LT(a, b);
    EXPECT_LT(b, c);
    EXPECT_LT(a, c);
    EXPECT_EQ(a, a);
}

TEST(SourceLocationTest, ToString) {
    SourceLocation loc{"main.lf", {10, 5}, 42};
    EXPECT_EQ(loc.to_string(), "main.lf:10:5");
    EXPECT_EQ(loc.line(), 10u);
    EXPECT_EQ(loc.column(), 5u);
}

TEST(ResultTest, Ok) {
    auto r = Result<int>::ok(42);
    EXPECT_TRUE(r.is_ok());
    EXPECT_FALSE(r.is_err());
    EXPECT_TRUE(static_cast<bool>(r));
    EXPECT_EQ(r.value(), 42);
}

TEST(ResultTest, Err) {
    Diagnostic diag;
    diag.message = "Unexpected end of input";
    auto r = Result<int>::err(diag);
    EXPECT_TRUE(r.is_err());
    EXPECT_FALSE(static_cast<bool>(r));
    EXPECT_EQ(r.error().message, "Unexpected end of input");
}

TEST(ResultTest, SameValueAndErrorType) {
    auto ok = Result<std::string, std::string>::ok("value");
    auto err = Result<std::string, std::string>::err("error");
    EXPECT_TRUE(ok.is_ok());
    EXPECT_EQ(ok.value(), "value");
    EXPECT_TRUE(err.is_err());
    EXPECT_EQ(err.error(), "error");
}
