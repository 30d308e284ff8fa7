#include "common/string_interner.hpp"

#include <gtest/gtest.h>

#include <string>

using namespace loft;

TEST(StringInternerTest, InternNewString) {
    StringInterner interner;
    auto sv = interner.intern("point");
    EXPECT_EQ(sv, "point");
    EXPECT_EQ(interner.size(), 1u);
}

TEST(StringInternerTest, InternDuplicateReturnsSameView) {
    StringInterner interner;
    auto sv1 = interner.intern("point");
    auto sv2 = interner.intern(std::string("point"));

    EXPECT_EQ(sv1.data(), sv2.data());
    EXPECT_EQ(interner.size(), 1u);
}

TEST(StringInternerTest, ViewOutlivesSource) {
    StringInterner interner;

    std::string temp = "temporary";
    auto sv = interner.intern(std::string_view(temp));
    temp = "modified";

    EXPECT_EQ(sv, "temporary");
}

TEST(StringInternerTest, ViewsSurviveGrowth) {
    StringInterner interner;
    auto first = interner.intern("first");
    for (int i = 0; i < 1000; ++i) {
        (void)interner.intern(std::to_string(i));
    }
    EXPECT_EQ(first, "first");
    EXPECT_EQ(interner.intern("first").data(), first.data());
}

TEST(StringInternerTest, EmptyString) {
    StringInterner interner;
    auto sv = interner.intern("");
    EXPECT_EQ(sv, "");
    EXPECT_EQ(interner.size(), 1u);
}
