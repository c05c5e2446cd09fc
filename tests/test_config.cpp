#include <gtest/gtest.h>

#include "config.hpp"

#include <string>
#include <vector>

using namespace tmx_align;

namespace {

bool parse(std::vector<std::string> args, AppConfig& config, std::string& error) {
    args.insert(args.begin(), "tmx_align");
    std::vector<char*> argv;
    for (auto& arg : args) {
        argv.push_back(arg.data());
    }
    return parse_args(static_cast<int>(argv.size()), argv.data(), config, error);
}

}  // namespace

TEST(ParseArgs, OutputDefaultsToInput) {
    AppConfig config;
    std::string error;
    ASSERT_TRUE(parse({"--input", "tm.tmx"}, config, error)) << error;
    EXPECT_EQ(config.input_path, "tm.tmx");
    EXPECT_EQ(config.output_path, "tm.tmx");
    EXPECT_TRUE(config.backup);
    EXPECT_FALSE(config.background_save);
    EXPECT_FALSE(config.dry_run);
    EXPECT_TRUE(config.script_path.empty());
}

TEST(ParseArgs, AllFlags) {
    AppConfig config;
    std::string error;
    ASSERT_TRUE(parse(
        {"--input", "in.tmx", "--output", "out.tmx", "--script", "-", "--no-backup", "--background-save", "--dry-run",
         "--quiet"},
        config,
        error
    )) << error;
    EXPECT_EQ(config.output_path, "out.tmx");
    EXPECT_EQ(config.script_path, "-");
    EXPECT_FALSE(config.backup);
    EXPECT_TRUE(config.background_save);
    EXPECT_TRUE(config.dry_run);
    EXPECT_TRUE(config.quiet);
}

TEST(ParseArgs, InputIsRequired) {
    AppConfig config;
    std::string error;
    EXPECT_FALSE(parse({"--output", "out.tmx"}, config, error));
    EXPECT_EQ(error, "--input is required");
}

TEST(ParseArgs, MissingValue) {
    AppConfig config;
    std::string error;
    EXPECT_FALSE(parse({"--input"}, config, error));
    EXPECT_EQ(error, "Missing value for --input");
}

TEST(ParseArgs, UnknownArgument) {
    AppConfig config;
    std::string error;
    EXPECT_FALSE(parse({"--input", "a.tmx", "--fast"}, config, error));
    EXPECT_EQ(error, "Unknown argument: --fast");
}

TEST(ParseArgs, HelpAndNoArguments) {
    AppConfig config;
    std::string error;
    EXPECT_FALSE(parse({"--help"}, config, error));
    EXPECT_EQ(error, "help");

    error.clear();
    EXPECT_FALSE(parse({}, config, error));
    EXPECT_EQ(error, "No arguments provided");
}
