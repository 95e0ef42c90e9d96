#include "streamdrop/command_line.hpp"
#include "streamdrop/errors.hpp"

#include <gtest/gtest.h>

#include <sstream>
#include <vector>

namespace streamdrop {
namespace {

Options parse(std::vector<const char*> args) {
    args.insert(args.begin(), "transfer");
    return parseCommandLine(static_cast<int>(args.size()), args.data());
}

TEST(CommandLineTest, ParsesFullInvocation) {
    const auto options = parse({"https://host/file.iso", "--name", "disk.iso", "-u", "alice", "--apikey", "k",
                                "--store-credential", "--max-retries", "5", "--timeout", "30", "-v"});

    EXPECT_EQ(options.source, "https://host/file.iso");
    EXPECT_EQ(options.name.value_or(""), "disk.iso");
    EXPECT_EQ(options.username.value_or(""), "alice");
    EXPECT_EQ(options.apikey.value_or(""), "k");
    EXPECT_TRUE(options.store_credential);
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.download.retry.max_attempts, 5u);
    EXPECT_EQ(options.timeout, std::chrono::seconds(30));
}

TEST(CommandLineTest, DefaultsWithSourceOnly) {
    const auto options = parse({"./local.bin"});

    EXPECT_EQ(options.source, "./local.bin");
    EXPECT_FALSE(options.name.has_value());
    EXPECT_FALSE(options.store_credential);
    EXPECT_EQ(options.download.retry.max_attempts, 0u);
    EXPECT_EQ(options.download.block_size, 4096u);
    EXPECT_EQ(options.timeout, std::chrono::seconds(60));
}

TEST(CommandLineTest, HelpShortCircuits) {
    EXPECT_TRUE(parse({"--help"}).show_help);
    EXPECT_TRUE(parse({"x", "-h", "--bogus"}).show_help);
}

TEST(CommandLineTest, RejectsBadInput) {
    EXPECT_THROW(parse({}), ConfigError);
    EXPECT_THROW(parse({"a", "b"}), ConfigError);
    EXPECT_THROW(parse({"a", "--bogus"}), ConfigError);
    EXPECT_THROW(parse({"a", "--name"}), ConfigError);
    EXPECT_THROW(parse({"a", "--timeout", "0"}), ConfigError);
    EXPECT_THROW(parse({"a", "--max-retries", "many"}), ConfigError);
    EXPECT_THROW(parse({"a", "--max-retries", "3x"}), ConfigError);
}

TEST(CommandLineTest, ClassifiesSources) {
    EXPECT_TRUE(isRemoteSource("http://example.com/a"));
    EXPECT_TRUE(isRemoteSource("https://example.com/a"));
    EXPECT_FALSE(isRemoteSource("/tmp/http://weird"));
    EXPECT_FALSE(isRemoteSource("file.txt"));
}

TEST(CommandLineTest, UsageMentionsOptions) {
    std::ostringstream out;
    printUsage(out, "transfer");
    EXPECT_NE(out.str().find("--store-credential"), std::string::npos);
}

TEST(CommandLineTest, RejectsRetryCountsThatDoNotFit) {
    EXPECT_EQ(parse({"a", "--max-retries", "4294967295"}).download.retry.max_attempts, 4294967295u);
    EXPECT_THROW(parse({"a", "--max-retries", "4294967296"}), ConfigError);
    EXPECT_THROW(parse({"a", "--max-retries", "99999999999999999999"}), ConfigError);
    EXPECT_THROW(parse({"a", "--max-retries", "-1"}), ConfigError);
}

} // namespace
} // namespace streamdrop
