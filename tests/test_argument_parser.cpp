/* SPDX-FileCopyrightText: 2025 adocam Authors
 *
 * SPDX-License-Identifier: GPL-3.0-or-later */

#include <gtest/gtest.h>
#include <string_view>
#include <vector>

#include "core/argument_parser.hpp"

using namespace adocam::core;
using namespace adocam::core::args;

namespace {

    std::expected<AppParameters, std::string> parse(std::vector<std::string_view> args) {
        return parse_args(args);
    }

} // namespace

TEST(ArgumentParserTest, InfoCommand) {
    const auto params = parse({"info", "level.adofai"});
    ASSERT_TRUE(params.has_value()) << params.error();
    EXPECT_EQ(params->command, Command::INFO);
    EXPECT_EQ(params->level_path.string(), "level.adofai");
}

TEST(ArgumentParserTest, SampleRange) {
    const auto params = parse({"sample", "a.adofai", "--time", "100", "--end", "900.5", "--step", "50"});
    ASSERT_TRUE(params.has_value()) << params.error();
    EXPECT_EQ(params->command, Command::SAMPLE);
    EXPECT_DOUBLE_EQ(*params->time_ms, 100.0);
    EXPECT_DOUBLE_EQ(*params->end_ms, 900.5);
    EXPECT_DOUBLE_EQ(*params->step_ms, 50.0);
}

TEST(ArgumentParserTest, SampleNeedsTime) {
    EXPECT_FALSE(parse({"sample", "a.adofai"}).has_value());
    EXPECT_FALSE(parse({"sample", "a.adofai", "--time", "500", "--end", "100"}).has_value());
    EXPECT_FALSE(parse({"sample", "a.adofai", "--time", "abc"}).has_value());
}

TEST(ArgumentParserTest, ExportNeedsOutput) {
    EXPECT_FALSE(parse({"export", "a.adofai"}).has_value());
    const auto params = parse({"export", "a.adofai", "--output", "b.adofai"});
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->output_path.string(), "b.adofai");
}

TEST(ArgumentParserTest, CurveTakesEaseName) {
    const auto params = parse({"curve", "InOutBack", "--samples", "12"});
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->command, Command::CURVE);
    EXPECT_EQ(params->ease_name, "InOutBack");
    EXPECT_EQ(params->curve_samples, 12u);
    EXPECT_FALSE(parse({"curve", "Linear", "--samples", "1"}).has_value());
}

TEST(ArgumentParserTest, GlobalOptions) {
    const auto params = parse({"--log-level", "debug", "info", "x.adofai", "--config", "c.json", "--log-file", "l.txt"});
    ASSERT_TRUE(params.has_value());
    EXPECT_EQ(params->log_level, LogLevel::Debug);
    EXPECT_EQ(params->config_path.string(), "c.json");
    EXPECT_EQ(params->log_file.string(), "l.txt");
}

TEST(ArgumentParserTest, HelpSkipsValidation) {
    const auto params = parse({"--help"});
    ASSERT_TRUE(params.has_value());
    EXPECT_TRUE(params->show_help);
    EXPECT_FALSE(usage().empty());
}

TEST(ArgumentParserTest, RejectsBadInput) {
    EXPECT_FALSE(parse({}).has_value());
    EXPECT_FALSE(parse({"render", "x"}).has_value());
    EXPECT_FALSE(parse({"info"}).has_value());
    EXPECT_FALSE(parse({"info", "a", "b"}).has_value());
    EXPECT_FALSE(parse({"info", "a", "--bogus", "1"}).has_value());
    EXPECT_FALSE(parse({"info", "a", "--log-level", "loud"}).has_value());
    EXPECT_FALSE(parse({"info", "a", "--output"}).has_value());
}

TEST(ArgumentParserTest, LogLevelNames) {
    EXPECT_EQ(parse_log_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_log_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_log_level("off"), LogLevel::Off);
    EXPECT_FALSE(parse_log_level("verbose").has_value());
}
