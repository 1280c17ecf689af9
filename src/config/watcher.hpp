/*
 * watcher.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Polling watcher that reports changes of the configuration file

**************************************************/

#ifndef FIRETV_CONFIG_WATCHER_HPP
#define FIRETV_CONFIG_WATCHER_HPP

#include <atomic>
#include <chrono>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include <spdlog/spdlog.h>

namespace firetv::config {

/**
 * @brief Callback invoked from the watcher thread after a change settles
 */
using FileChangeCallback = std::function<void(const std::filesystem::path&)>;

/**
 * @brief Watches a single file by polling its modification time
 *
 * A change is reported once the file has been stable for the debounce
 * delay, so editors that write in several steps trigger one reload.
 * Deleting the file is not reported; re-creating it is.
 */
class ConfigWatcher {
public:
    struct WatcherOptions {
        std::chrono::milliseconds poll_interval{1000};
        std::chrono::milliseconds debounce_delay{250};
    };

    explicit ConfigWatcher(WatcherOptions options);
    ConfigWatcher() : ConfigWatcher(WatcherOptions{}) {}
    ~ConfigWatcher();

    ConfigWatcher(const ConfigWatcher&) = delete;
    ConfigWatcher& operator=(const ConfigWatcher&) = delete;

    /**
     * @brief Set the watched file and start the polling thread
     * @return false if the file does not exist or a watch is already running
     */
    auto watchFile(const std::filesystem::path& path,
                   FileChangeCallback callback) -> bool;

    void stop();

    [[nodiscard]] auto isWatching() const -> bool { return running_.load(); }

private:
    void watchLoop();
    void poll();
    [[nodiscard]] auto currentWriteTime() const
        -> std::optional<std::filesystem::file_time_type>;

    WatcherOptions options_;
    std::filesystem::path path_;
    FileChangeCallback callback_;
    std::optional<std::filesystem::file_time_type> lastWriteTime_;
    std::optional<std::chrono::steady_clock::time_point> pendingSince_;

    std::atomic<bool> running_{false};
    std::mutex mutex_;
    std::unique_ptr<std::thread> thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace firetv::config

#endif  // FIRETV_CONFIG_WATCHER_HPP
