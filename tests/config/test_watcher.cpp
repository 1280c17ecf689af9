/*
 * test_watcher.cpp - Tests for the configuration file watcher
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>

#include "config/watcher.hpp"

using namespace firetv::config;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

class ConfigWatcherTest : public ::testing::Test {
protected:
    void SetUp() override {
        path_ = fs::temp_directory_path() /
                ("firetv_watch_" +
                 std::to_string(std::chrono::steady_clock::now()
                                    .time_since_epoch()
                                    .count()) +
                 ".yaml");
        write("devices: {}\n");
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove(path_, ec);
    }

    void write(const std::string& content) {
        std::ofstream file(path_, std::ios::trunc);
        file << content;
    }

    void touch() {
        fs::last_write_time(path_, fs::last_write_time(path_) + 2s);
    }

    template <typename Predicate>
    static auto waitFor(Predicate predicate,
                        std::chrono::milliseconds timeout = 3s) -> bool {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (std::chrono::steady_clock::now() < deadline) {
            if (predicate()) {
                return true;
            }
            std::this_thread::sleep_for(10ms);
        }
        return predicate();
    }

    fs::path path_;
};

TEST_F(ConfigWatcherTest, RejectsMissingFile) {
    ConfigWatcher watcher;
    EXPECT_FALSE(watcher.watchFile(path_.string() + ".missing",
                                   [](const fs::path&) {}));
    EXPECT_FALSE(watcher.isWatching());
}

TEST_F(ConfigWatcherTest, RejectsNullCallback) {
    ConfigWatcher watcher;
    EXPECT_FALSE(watcher.watchFile(path_, nullptr));
}

TEST_F(ConfigWatcherTest, RejectsSecondWatch) {
    ConfigWatcher watcher({.poll_interval = 20ms, .debounce_delay = 20ms});
    ASSERT_TRUE(watcher.watchFile(path_, [](const fs::path&) {}));
    EXPECT_FALSE(watcher.watchFile(path_, [](const fs::path&) {}));
    watcher.stop();
    EXPECT_FALSE(watcher.isWatching());
}

TEST_F(ConfigWatcherTest, ReportsChangeOnce) {
    std::atomic<int> calls{0};
    fs::path reported;
    ConfigWatcher watcher({.poll_interval = 20ms, .debounce_delay = 50ms});
    ASSERT_TRUE(watcher.watchFile(path_, [&](const fs::path& path) {
        reported = path;
        ++calls;
    }));

    write("devices:\n  tv: \"10.0.0.5:5555\"\n");
    touch();

    ASSERT_TRUE(waitFor([&] { return calls.load() == 1; }));
    std::this_thread::sleep_for(200ms);
    watcher.stop();
    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(reported, path_);
}

TEST_F(ConfigWatcherTest, NoChangeNoCallback) {
    std::atomic<int> calls{0};
    ConfigWatcher watcher({.poll_interval = 20ms, .debounce_delay = 20ms});
    ASSERT_TRUE(watcher.watchFile(path_, [&](const fs::path&) { ++calls; }));
    std::this_thread::sleep_for(200ms);
    watcher.stop();
    EXPECT_EQ(calls.load(), 0);
}

TEST_F(ConfigWatcherTest, StopIsIdempotent) {
    ConfigWatcher watcher({.poll_interval = 20ms, .debounce_delay = 20ms});
    ASSERT_TRUE(watcher.watchFile(path_, [](const fs::path&) {}));
    watcher.stop();
    watcher.stop();
    EXPECT_FALSE(watcher.isWatching());
}
