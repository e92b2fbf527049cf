#include <gtest/gtest.h>
#include "ednstream/cursor.hpp"
#include <memory>
#include <string>

using namespace ednstream;

namespace {
cursor cursor_over(const std::string& s){ return cursor(std::make_unique<utf8_string_source>(s)); }
}

TEST(Cursor, StartsOnFirstCharacter){
    auto c = cursor_over("ab");
    EXPECT_EQ(c.current(), U'a');
    EXPECT_EQ(c.line(), 1);
    EXPECT_EQ(c.col(), 1);
    EXPECT_TRUE(c.advance());
    EXPECT_EQ(c.current(), U'b');
    EXPECT_EQ(c.col(), 2);
    EXPECT_FALSE(c.advance());
    EXPECT_TRUE(c.eof());
    EXPECT_FALSE(c.failure().has_value());
}

TEST(Cursor, EmptyInputIsEndOfStream){
    auto c = cursor_over("");
    EXPECT_TRUE(c.eof());
    EXPECT_EQ(c.current(), cursor::end_of_stream);
    EXPECT_FALSE(c.advance());
    EXPECT_FALSE(c.advance());
    EXPECT_EQ(c.line(), 1);
    EXPECT_EQ(c.col(), 1);
}

TEST(Cursor, NewlineStartsNextLine){
    auto c = cursor_over("a\nbc");
    c.advance();
    EXPECT_EQ(c.current(), U'\n');
    EXPECT_EQ(c.line(), 1);
    EXPECT_EQ(c.col(), 2);
    c.advance();
    EXPECT_EQ(c.current(), U'b');
    EXPECT_EQ(c.line(), 2);
    EXPECT_EQ(c.col(), 1);
    c.advance();
    EXPECT_EQ(c.col(), 2);
}

TEST(Cursor, MultibyteCharactersCountOnce){
    auto c = cursor_over("\xC3\xA9x");
    EXPECT_EQ(c.current(), char32_t(0xE9));
    c.advance();
    EXPECT_EQ(c.current(), U'x');
    EXPECT_EQ(c.col(), 2);
}

TEST(Cursor, DecodeFailureBecomesEndOfStreamWithFailure){
    auto c = cursor_over("ab\xFF");
    c.advance();
    EXPECT_FALSE(c.advance());
    EXPECT_TRUE(c.eof());
    ASSERT_TRUE(c.failure().has_value());
    EXPECT_EQ(c.failure()->code, error_code::not_utf8);
    EXPECT_EQ(c.failure()->origin, error_origin::syntax);
    EXPECT_EQ(c.failure()->col, 3);
}

TEST(Whitespace, RunWithNewlineEndsAtLineTwoColumnOne){
    auto c = cursor_over(" \n ");
    auto span = skip_whitespace(c);
    ASSERT_TRUE(span.has_value());
    EXPECT_EQ(*span, " \n ");
    EXPECT_TRUE(c.eof());
    EXPECT_EQ(c.line(), 2);
    EXPECT_EQ(c.col(), 1);
}

TEST(Whitespace, CountsEveryNewline){
    auto c = cursor_over("\n\r\n\t,x");
    skip_whitespace(c);
    EXPECT_EQ(c.current(), U'x');
    EXPECT_EQ(c.line(), 3);
    EXPECT_EQ(c.col(), 3);
}

TEST(Whitespace, NothingConsumedGivesNullopt){
    auto c = cursor_over("x ");
    EXPECT_FALSE(skip_whitespace(c).has_value());
    EXPECT_EQ(c.current(), U'x');
    auto e = cursor_over("");
    EXPECT_FALSE(skip_whitespace(e).has_value());
}

TEST(Whitespace, CommasAreWhitespace){
    auto c = cursor_over(",, ,1");
    auto span = skip_whitespace(c);
    ASSERT_TRUE(span);
    EXPECT_EQ(*span, ",, ,");
    EXPECT_EQ(c.current(), U'1');
}

TEST(Whitespace, CommentsRunToEndOfLine){
    auto c = cursor_over("; note, here\n  x");
    auto span = skip_whitespace(c);
    ASSERT_TRUE(span);
    EXPECT_EQ(c.current(), U'x');
    EXPECT_EQ(c.line(), 2);
    EXPECT_EQ(c.col(), 3);

    auto d = cursor_over("; note\nx");
    EXPECT_FALSE(skip_whitespace(d, false).has_value());
    EXPECT_EQ(d.current(), U';');
}

TEST(Whitespace, CommentAtEndOfInput){
    auto c = cursor_over(" ;trailing");
    skip_whitespace(c);
    EXPECT_TRUE(c.eof());
}
