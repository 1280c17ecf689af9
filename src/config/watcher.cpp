/*
 * watcher.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Configuration file watcher implementation

**************************************************/

#include "watcher.hpp"

#include <exception>

namespace firetv::config {

ConfigWatcher::ConfigWatcher(WatcherOptions options)
    : options_(options), logger_(spdlog::get("config_watcher")) {
    if (!logger_) {
        logger_ = spdlog::default_logger();
    }

    if (options_.poll_interval < std::chrono::milliseconds(10)) {
        logger_->warn("Poll interval too low ({}ms), adjusting to 10ms minimum",
                      options_.poll_interval.count());
        options_.poll_interval = std::chrono::milliseconds(10);
    }
}

ConfigWatcher::~ConfigWatcher() { stop(); }

auto ConfigWatcher::watchFile(const std::filesystem::path& path,
                              FileChangeCallback callback) -> bool {
    if (!callback) {
        logger_->error("Cannot watch file '{}': callback is null",
                       path.string());
        return false;
    }

    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        logger_->error("Cannot watch file '{}': not a regular file",
                       path.string());
        return false;
    }

    std::lock_guard lock(mutex_);
    if (running_.load()) {
        logger_->warn("Watcher already running for '{}'", path_.string());
        return false;
    }

    path_ = path;
    callback_ = std::move(callback);
    lastWriteTime_ = currentWriteTime();
    pendingSince_.reset();

    running_ = true;
    thread_ = std::make_unique<std::thread>(&ConfigWatcher::watchLoop, this);
    logger_->info("Watching configuration file {} every {}ms", path_.string(),
                  options_.poll_interval.count());
    return true;
}

void ConfigWatcher::stop() {
    std::unique_ptr<std::thread> thread;
    {
        std::lock_guard lock(mutex_);
        running_ = false;
        thread = std::move(thread_);
    }
    if (thread && thread->joinable()) {
        thread->join();
        logger_->debug("Configuration watcher stopped");
    }
}

auto ConfigWatcher::currentWriteTime() const
    -> std::optional<std::filesystem::file_time_type> {
    std::error_code ec;
    auto time = std::filesystem::last_write_time(path_, ec);
    if (ec) {
        return std::nullopt;
    }
    return time;
}

void ConfigWatcher::watchLoop() {
    logger_->debug("Watch loop started");

    while (running_.load()) {
        const auto loopStart = std::chrono::steady_clock::now();

        try {
            poll();
        } catch (const std::exception& e) {
            logger_->error("Error in watch loop: {}", e.what());
        }

        const auto elapsed = std::chrono::steady_clock::now() - loopStart;
        if (elapsed < options_.poll_interval) {
            std::this_thread::sleep_for(options_.poll_interval - elapsed);
        }
    }

    logger_->debug("Watch loop ended");
}

void ConfigWatcher::poll() {
    auto writeTime = currentWriteTime();
    if (!writeTime) {
        // Editors often replace the file; wait for it to come back
        return;
    }

    const auto now = std::chrono::steady_clock::now();
    if (writeTime != lastWriteTime_) {
        lastWriteTime_ = writeTime;
        pendingSince_ = now;
        return;
    }

    if (pendingSince_ && now - *pendingSince_ >= options_.debounce_delay) {
        pendingSince_.reset();
        logger_->info("Configuration file {} changed", path_.string());
        callback_(path_);
    }
}

}  // namespace firetv::config
