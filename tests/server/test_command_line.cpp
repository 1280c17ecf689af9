/*
 * test_command_line.cpp - Tests for firetv-server argument parsing
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "common/exception.hpp"
#include "server/command_line.hpp"

using namespace firetv;
using namespace firetv::server;
using ::testing::HasSubstr;

namespace {

auto parse(std::vector<std::string> args) -> CommandLineOptions {
    args.insert(args.begin(), "firetv-server");
    return parseCommandLine(args);
}

auto parseError(std::vector<std::string> args) -> std::string {
    try {
        parse(std::move(args));
    } catch (const CommandLineException& e) {
        return e.what();
    }
    ADD_FAILURE() << "expected a CommandLineException";
    return {};
}

}  // namespace

TEST(CommandLineTest, Defaults) {
    auto options = parse({});
    EXPECT_FALSE(options.help);
    EXPECT_FALSE(options.verbose);
    EXPECT_FALSE(options.config_path.has_value());
    EXPECT_FALSE(options.port.has_value());
    EXPECT_FALSE(options.default_device.has_value());
}

TEST(CommandLineTest, ShortOptions) {
    auto options = parse({"-v", "-c", "/etc/firetv/devices.yaml", "-p", "8080",
                          "-d", "10.0.0.5:5555"});
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.config_path, "/etc/firetv/devices.yaml");
    EXPECT_EQ(options.port, 8080);
    ASSERT_TRUE(options.default_device.has_value());
    EXPECT_EQ(options.default_device->host, "10.0.0.5");
    EXPECT_EQ(options.default_device->port, 5555);
}

TEST(CommandLineTest, LongOptions) {
    auto options = parse({"--config", "devices.yaml", "--port", "5600",
                          "--default", "firetv.local:5555", "--verbose"});
    EXPECT_TRUE(options.verbose);
    EXPECT_EQ(options.config_path, "devices.yaml");
    EXPECT_EQ(options.port, 5600);
    EXPECT_EQ(options.default_device->host, "firetv.local");
}

TEST(CommandLineTest, HelpWins) {
    EXPECT_TRUE(parse({"-h"}).help);
    EXPECT_TRUE(parse({"-p", "8080", "--help"}).help);
}

TEST(CommandLineTest, UnknownOption) {
    EXPECT_THAT(parseError({"--frobnicate"}), HasSubstr("Invalid arguments"));
    EXPECT_THAT(parseError({"-x"}), HasSubstr("Invalid arguments"));
}

TEST(CommandLineTest, MissingValue) {
    EXPECT_THAT(parseError({"-c"}), HasSubstr("Invalid arguments"));
    EXPECT_THAT(parseError({"--default"}), HasSubstr("Invalid arguments"));
}

TEST(CommandLineTest, InvalidPort) {
    EXPECT_THAT(parseError({"-p", "abc"}), HasSubstr("Invalid arguments"));
    EXPECT_THAT(parseError({"-p", "0"}), HasSubstr("between 1 and 65535"));
    EXPECT_THAT(parseError({"-p", "70000"}), HasSubstr("between 1 and 65535"));
}

TEST(CommandLineTest, InvalidDefaultDevice) {
    EXPECT_THAT(parseError({"-d", "10.0.0.5"}), HasSubstr("--default"));
    EXPECT_THAT(parseError({"-d", "10.0.0.5:notaport"}),
                HasSubstr("--default"));
    EXPECT_THAT(parseError({"-d", "bad host:5555"}), HasSubstr("--default"));
}

TEST(CommandLineTest, UsageListsOptions) {
    auto text = usage("firetv-server");
    EXPECT_THAT(text, HasSubstr("Usage: firetv-server"));
    EXPECT_THAT(text, HasSubstr("--config"));
    EXPECT_THAT(text, HasSubstr("--default"));
    EXPECT_THAT(text, HasSubstr("5556"));
}
