#include <gtest/gtest.h>
#include <cli/arg_parser.hpp>

TEST(ArgParserTest, SplitsPositionalsOptionsAndFlags) {
    auto result = parse_args({"10.0.0.5", "k1", "--venv", "envA", "--overwrite", "--python=python3.8"},
                             {"venv", "python"}, {"overwrite"});
    ASSERT_TRUE(result.is_ok()) << result.error;
    const auto& args = result.value;
    EXPECT_EQ(args.positional, (std::vector<std::string>{"10.0.0.5", "k1"}));
    EXPECT_EQ(args.option("venv").value_or(""), "envA");
    EXPECT_EQ(args.option("python").value_or(""), "python3.8");
    EXPECT_FALSE(args.option("display-name").has_value());
    EXPECT_TRUE(args.flag("overwrite"));
}

TEST(ArgParserTest, DoubleDashEndsOptions) {
    auto result = parse_args({"--", "--odd-id"}, {}, {});
    ASSERT_TRUE(result.is_ok());
    EXPECT_EQ(result.value.positional, std::vector<std::string>{"--odd-id"});
}

TEST(ArgParserTest, Errors) {
    EXPECT_TRUE(parse_args({"--venv"}, {"venv"}, {}).is_err());
    EXPECT_TRUE(parse_args({"--bogus"}, {"venv"}, {}).is_err());
    EXPECT_TRUE(parse_args({"--overwrite=yes"}, {}, {"overwrite"}).is_err());
}
