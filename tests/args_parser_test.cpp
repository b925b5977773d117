#include <gtest/gtest.h>

#include <vector>

#include "cli/args_parser/args_parser.hpp"

namespace {

auto parse(std::vector<const char*> argv, int& exit_code) {
    return pcopy::args_parser::parse_args(static_cast<int>(argv.size()), argv.data(), exit_code);
}

} // namespace

TEST(ArgsParserTest, TwoPositionalsAndOptions)
{
    int code = -1;
    auto args = parse({"pcopy", "-j", "4", "--buffer-size", "8192", "--no-progress", "src", "dst"}, code);
    ASSERT_TRUE(args.has_value());
    EXPECT_EQ(code, 0);
    EXPECT_EQ(args->source, "src");
    EXPECT_EQ(args->destination, "dst");
    EXPECT_EQ(args->threads, 4u);
    EXPECT_EQ(args->buffer_size, 8192u);
    EXPECT_TRUE(args->no_progress);
    EXPECT_FALSE(args->quiet);
}

TEST(ArgsParserTest, MissingDestinationFails)
{
    int code = 0;
    auto args = parse({"pcopy", "only-source"}, code);
    EXPECT_FALSE(args.has_value());
    EXPECT_NE(code, 0);
}

TEST(ArgsParserTest, ExtraPositionalFails)
{
    int code = 0;
    auto args = parse({"pcopy", "a", "b", "c"}, code);
    EXPECT_FALSE(args.has_value());
    EXPECT_NE(code, 0);
}

TEST(ArgsParserTest, ZeroThreadsRejected)
{
    int code = 0;
    auto args = parse({"pcopy", "-j", "0", "a", "b"}, code);
    EXPECT_FALSE(args.has_value());
    EXPECT_NE(code, 0);
}

TEST(ArgsParserTest, QuietAndVerboseAreExclusive)
{
    int code = 0;
    auto args = parse({"pcopy", "-q", "-v", "a", "b"}, code);
    EXPECT_FALSE(args.has_value());
    EXPECT_NE(code, 0);
}
