// Command-line parsing for uil_cli.
#include <gtest/gtest.h>

#include <climits>
#include <string>
#include <vector>

#include "uil/cli_args.hpp"

namespace
{
    bool parse(const std::vector<std::string> &args, uil::CliArgs &out)
    {
        out = uil::CliArgs{};
        return uil::parse_cli_args(args, out);
    }
}

TEST(CliArgs, DetectWithAreaLimits)
{
    uil::CliArgs a;
    ASSERT_TRUE(parse({"detect", "shot.png", "--min-area", "250", "--max-area", "90000"}, a));
    EXPECT_EQ(a.command, "detect");
    ASSERT_EQ(a.inputs.size(), 1u);
    EXPECT_EQ(a.inputs[0], "shot.png");
    EXPECT_EQ(a.detect.min_area, 250);
    EXPECT_EQ(a.detect.max_area, 90000);
}

TEST(CliArgs, MatchAndPickOptions)
{
    uil::CliArgs a;
    ASSERT_TRUE(parse({"match", "shot.png", "icon.png", "--threshold", "0.85",
                       "--method", "sqdiff_normed", "--single-scale"},
                      a));
    EXPECT_DOUBLE_EQ(a.match.threshold, 0.85);
    EXPECT_EQ(a.match.method, uil::MatchMethod::SqDiffNormed);
    EXPECT_FALSE(a.match.multi_scale);

    ASSERT_TRUE(parse({"pick", "shot.png", "--type", "color_button_red",
                       "--position", "bottom", "--min-confidence", "0.5"},
                      a));
    EXPECT_EQ(a.query.type, "color_button_red");
    EXPECT_EQ(a.query.position, uil::ScreenPosition::Bottom);
    EXPECT_DOUBLE_EQ(a.query.min_confidence, 0.5);
}

TEST(CliArgs, AreaOutsideIntRangeIsRejected)
{
    uil::CliArgs a;
    EXPECT_FALSE(parse({"detect", "shot.png", "--max-area", "1e12"}, a));
    EXPECT_FALSE(parse({"detect", "shot.png", "--min-area", "3e9"}, a));
    EXPECT_FALSE(parse({"detect", "shot.png", "--min-area", "-5"}, a));
    EXPECT_FALSE(parse({"detect", "shot.png", "--max-area", "-1"}, a));

    ASSERT_TRUE(parse({"detect", "shot.png", "--max-area", std::to_string(INT_MAX)}, a));
    EXPECT_EQ(a.detect.max_area, INT_MAX);
    ASSERT_TRUE(parse({"detect", "shot.png", "--max-area", "0"}, a)); // 0: half the image
    EXPECT_EQ(a.detect.max_area, 0);
}

TEST(CliArgs, MalformedNumbersAreRejected)
{
    uil::CliArgs a;
    EXPECT_FALSE(parse({"detect", "shot.png", "--min-area", "12abc"}, a));
    EXPECT_FALSE(parse({"detect", "shot.png", "--min-area", "nan"}, a));
    EXPECT_FALSE(parse({"detect", "shot.png", "--min-area", "inf"}, a));
    EXPECT_FALSE(parse({"detect", "shot.png", "--min-area", ""}, a));
    EXPECT_FALSE(parse({"detect", "shot.png", "--min-area"}, a));
    EXPECT_FALSE(parse({"match", "a.png", "b.png", "--threshold", "1.5"}, a));
    EXPECT_FALSE(parse({"pick", "a.png", "--min-confidence", "-0.1"}, a));
}

TEST(CliArgs, WrongCommandOrInputCount)
{
    uil::CliArgs a;
    EXPECT_FALSE(parse({}, a));
    EXPECT_FALSE(parse({"scan", "shot.png"}, a));
    EXPECT_FALSE(parse({"detect"}, a));
    EXPECT_FALSE(parse({"detect", "a.png", "b.png"}, a));
    EXPECT_FALSE(parse({"match", "a.png"}, a));
    EXPECT_FALSE(parse({"detect", "a.png", "--bogus"}, a));
}

TEST(ParseNumber, Bounds)
{
    double v = -1.0;
    EXPECT_TRUE(uil::parse_number("0.5", 0.0, 1.0, v));
    EXPECT_DOUBLE_EQ(v, 0.5);
    EXPECT_TRUE(uil::parse_number("1", 0.0, 1.0, v));
    EXPECT_FALSE(uil::parse_number("1.0001", 0.0, 1.0, v));
    EXPECT_DOUBLE_EQ(v, 1.0); // untouched on failure
}
