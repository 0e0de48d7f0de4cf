#include "ircline/dump.hpp"

#include <gtest/gtest.h>

#include <sstream>

using ircline::Config;
using ircline::LineDumper;

TEST(LineDumper, JoinedFormatAppendsTerminator)
{
    Config config;
    config.format = Config::Format::JOINED;
    std::stringstream out, log;
    LineDumper dumper(config, out, log);

    EXPECT_TRUE(dumper.feed(":user!host@example.com PRIVMSG #channel :message"));
    EXPECT_EQ(out.str(), "PRIVMSG user!host@example.com #channel message\n");
    EXPECT_EQ(dumper.decoded(), 1u);
    EXPECT_TRUE(log.str().empty());
}

TEST(LineDumper, WireFormatKeepsExistingTerminator)
{
    Config config;
    config.format = Config::Format::WIRE;
    std::stringstream out, log;
    LineDumper dumper(config, out, log);

    EXPECT_TRUE(dumper.feed("PING :irc.example.net\r"));
    EXPECT_EQ(out.str(), "PING irc.example.net \n");
}

TEST(LineDumper, FieldsFormat)
{
    Config config;
    std::stringstream out, log;
    LineDumper dumper(config, out, log);

    EXPECT_TRUE(dumper.feed("NOTICE AUTH :*** Checking Ident"));
    EXPECT_EQ(out.str(), "prefix: \ncommand: NOTICE\nparams[0]: AUTH\n"
                         "params[1]: *** Checking Ident\n\n");
}

TEST(LineDumper, ReportsFailures)
{
    Config config;
    config.appendTerminator = false;
    std::stringstream out, log;
    LineDumper dumper(config, out, log);

    EXPECT_TRUE(dumper.feed("PING a\r"));
    EXPECT_FALSE(dumper.feed("PING"));
    EXPECT_EQ(dumper.decoded(), 1u);
    EXPECT_EQ(dumper.failed(), 1u);
    EXPECT_NE(log.str().find("line 2: incomplete"), std::string::npos);
    EXPECT_FALSE(dumper.shouldStop());
}

TEST(LineDumper, QuietFailures)
{
    Config config;
    config.reportErrors = false;
    std::stringstream out, log;
    LineDumper dumper(config, out, log);

    EXPECT_FALSE(dumper.feed(":server.only"));
    EXPECT_TRUE(log.str().empty());
    EXPECT_TRUE(out.str().empty());
}

TEST(LineDumper, SkipsBlankLines)
{
    Config config;
    std::stringstream out, log;
    LineDumper dumper(config, out, log);

    EXPECT_TRUE(dumper.feed(""));
    EXPECT_TRUE(dumper.feed("\r"));
    EXPECT_EQ(dumper.decoded(), 0u);
    EXPECT_EQ(dumper.failed(), 0u);
    EXPECT_TRUE(out.str().empty());
}

TEST(LineDumper, StopOnError)
{
    Config config;
    config.stopOnError = true;
    std::stringstream out, log;
    LineDumper dumper(config, out, log);

    EXPECT_TRUE(dumper.feed("PING a"));
    EXPECT_FALSE(dumper.shouldStop());
    EXPECT_FALSE(dumper.feed(" PING"));
    EXPECT_TRUE(dumper.shouldStop());
}
