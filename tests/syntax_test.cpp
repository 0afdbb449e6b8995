#include "syntax.hpp"

#include <gtest/gtest.h>

namespace jsxform {
namespace {

TEST(SyntaxTest, StringLiteralValueDecodesEscapes) {
    EXPECT_EQ(string_literal_value("'./a.js'"), "./a.js");
    EXPECT_EQ(string_literal_value(R"("./a.js")"), "./a.js");
    EXPECT_EQ(string_literal_value(R"('./\x62.js')"), "./b.js");
    EXPECT_EQ(string_literal_value(R"("\u{1F600}")"), "\xF0\x9F\x98\x80");
    EXPECT_EQ(string_literal_value(R"("\uD83D\uDE00")"), "\xF0\x9F\x98\x80");
    EXPECT_EQ(string_literal_value("\"\xC3\xA9\""), "\xC3\xA9");
    EXPECT_EQ(string_literal_value(R"('a\'b\"c\\d')"), "a'b\"c\\d");
    EXPECT_EQ(string_literal_value(R"("\n\t\0")"), std::string("\n\t\0", 3));
    EXPECT_EQ(string_literal_value(R"("\101")"), "A");
    EXPECT_EQ(string_literal_value(R"("\q")"), "q");
}

TEST(SyntaxTest, LineContinuationsVanish) {
    EXPECT_EQ(string_literal_value("'./lib\\\n/a.js'"), "./lib/a.js");
    EXPECT_EQ(string_literal_value("'a\\\r\nb'"), "ab");
}

TEST(SyntaxTest, QuoteJsStringEscapes) {
    EXPECT_EQ(quote_js_string("/src/a.js"), "\"/src/a.js\"");
    EXPECT_EQ(quote_js_string("a\"b\\c\n"), R"("a\"b\\c\n")");
}

TEST(SyntaxTest, IdentifierCharacters) {
    EXPECT_TRUE(is_ident_start('$'));
    EXPECT_TRUE(is_ident_start('_'));
    EXPECT_FALSE(is_ident_start('1'));
    EXPECT_TRUE(is_ident_part('1'));
    EXPECT_TRUE(is_reserved_word("class"));
    EXPECT_FALSE(is_reserved_word("async"));
}

}  // namespace
}  // namespace jsxform
