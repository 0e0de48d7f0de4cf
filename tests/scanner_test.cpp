#include "ircline/scanner.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using ircline::Cursor;
using ircline::Scanner::splitWhitespace;

TEST(Cursor, TakeUntilStopsOnDelimiter)
{
    Cursor cursor("abc def");
    auto word = cursor.takeUntil(' ');
    ASSERT_TRUE(word);
    EXPECT_EQ(*word, "abc");
    EXPECT_EQ(cursor.position(), 3u);
    EXPECT_EQ(cursor.remaining(), " def");
}

TEST(Cursor, TakeUntilDelimiterFirst)
{
    Cursor cursor(" rest");
    auto word = cursor.takeUntil(' ');
    ASSERT_TRUE(word);
    EXPECT_TRUE(word->empty());
    EXPECT_EQ(cursor.position(), 0u);
}

TEST(Cursor, TakeUntilMissingDelimiterDoesNotMove)
{
    Cursor cursor("nodelimiter");
    EXPECT_FALSE(cursor.takeUntil(' '));
    EXPECT_EQ(cursor.position(), 0u);
    EXPECT_EQ(cursor.remaining(), "nodelimiter");
}

TEST(Cursor, TakeThroughConsumesDelimiter)
{
    Cursor cursor("nick!user@host");
    auto nick = cursor.takeThrough('!');
    ASSERT_TRUE(nick);
    EXPECT_EQ(*nick, "nick");
    auto user = cursor.takeThrough('@');
    ASSERT_TRUE(user);
    EXPECT_EQ(*user, "user");
    EXPECT_EQ(cursor.remaining(), "host");
}

TEST(Cursor, EmptyInput)
{
    Cursor cursor("");
    EXPECT_TRUE(cursor.empty());
    EXPECT_FALSE(cursor.startsWith(':'));
    EXPECT_FALSE(cursor.consume(':'));
    EXPECT_FALSE(cursor.takeWord());
    EXPECT_TRUE(cursor.remaining().empty());
}

TEST(Cursor, ConsumeOnlyMatchingByte)
{
    Cursor cursor(":x");
    EXPECT_FALSE(cursor.consume(' '));
    EXPECT_TRUE(cursor.consume(':'));
    EXPECT_EQ(cursor.remaining(), "x");
}

TEST(Cursor, AdvanceClampsAtEnd)
{
    Cursor cursor("abc");
    cursor.advance(10);
    EXPECT_TRUE(cursor.empty());
    EXPECT_EQ(cursor.position(), 3u);
}

TEST(SplitWhitespace, DropsEmptyTokens)
{
    std::vector<std::string> expected{"a", "b", "c"};
    EXPECT_EQ(splitWhitespace("  a  b\tc "), expected);
}

TEST(SplitWhitespace, NothingToSplit)
{
    EXPECT_TRUE(splitWhitespace("").empty());
    EXPECT_TRUE(splitWhitespace("    ").empty());
}
