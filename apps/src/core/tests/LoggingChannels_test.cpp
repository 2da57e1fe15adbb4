#include "core/LoggingChannels.h"

#include <gtest/gtest.h>

using namespace NonoGen;

TEST(LoggingChannelsTest, ChannelNamesRoundTrip)
{
    for (LogChannel channel :
         { LogChannel::Cli,
           LogChannel::Config,
           LogChannel::Evaluation,
           LogChannel::Evolution,
           LogChannel::Puzzle,
           LogChannel::Runner }) {
        const auto parsed = logChannelFromString(toString(channel));
        ASSERT_TRUE(parsed.has_value()) << toString(channel);
        EXPECT_EQ(parsed.value(), channel);
    }
    EXPECT_FALSE(logChannelFromString("physics").has_value());
}

TEST(LoggingChannelsTest, ParseLevelStringAcceptsAliases)
{
    EXPECT_EQ(LoggingChannels::parseLevelString("debug"), spdlog::level::debug);
    EXPECT_EQ(LoggingChannels::parseLevelString("WARN"), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::parseLevelString("warning"), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::parseLevelString("err"), spdlog::level::err);
    EXPECT_EQ(LoggingChannels::parseLevelString("off"), spdlog::level::off);
    EXPECT_EQ(LoggingChannels::parseLevelString("nonsense"), spdlog::level::info);
}

TEST(LoggingChannelsTest, ConfigureFromStringSetsChannelLevels)
{
    LoggingChannels::configureFromString("*:warn, evolution:debug");

    EXPECT_EQ(LoggingChannels::get(LogChannel::Evolution)->level(), spdlog::level::debug);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Runner)->level(), spdlog::level::warn);
    EXPECT_EQ(LoggingChannels::get(LogChannel::Puzzle)->level(), spdlog::level::warn);

    // Unknown channels and malformed items are skipped.
    LoggingChannels::configureFromString("physics:trace,runner");
    EXPECT_EQ(LoggingChannels::get(LogChannel::Runner)->level(), spdlog::level::warn);

    LoggingChannels::configureFromString("*:info");
    EXPECT_EQ(LoggingChannels::get(LogChannel::Evolution)->level(), spdlog::level::info);
}

TEST(LoggingChannelsTest, DefaultConfigListsEveryChannel)
{
    const nlohmann::json config = LoggingChannels::defaultConfig();
    ASSERT_TRUE(config.contains("channels"));
    for (const char* name : { "cli", "config", "evaluation", "evolution", "puzzle", "runner" }) {
        EXPECT_TRUE(config["channels"].contains(name)) << name;
    }
}
