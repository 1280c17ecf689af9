/*
 * log_setup.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "log_setup.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <vector>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace firetv::logging {

namespace {

constexpr const char* DEFAULT_LOGGER = "firetv";

std::mutex& registryMutex() {
    static std::mutex mutex;
    return mutex;
}

std::vector<spdlog::sink_ptr>& activeSinks() {
    static std::vector<spdlog::sink_ptr> sinks;
    return sinks;
}

spdlog::level::level_enum& activeLevel() {
    static spdlog::level::level_enum level = spdlog::level::info;
    return level;
}

auto buildLogger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    const auto& sinks = activeSinks();
    auto logger =
        std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(activeLevel());
    logger->flush_on(spdlog::level::warn);
    return logger;
}

}  // namespace

auto levelFromString(const std::string& level)
    -> std::optional<spdlog::level::level_enum> {
    std::string lower = level;
    std::ranges::transform(lower, lower.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical" || lower == "fatal") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

auto levelToString(spdlog::level::level_enum level) -> std::string {
    auto sv = spdlog::level::to_string_view(level);
    return std::string(sv.data(), sv.size());
}

auto SinkFactory::createConsoleSink(spdlog::level::level_enum level,
                                    const std::string& pattern, bool color)
    -> spdlog::sink_ptr {
    spdlog::sink_ptr sink;
    if (color) {
        sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    } else {
        sink = std::make_shared<spdlog::sinks::stdout_sink_mt>();
    }
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

auto SinkFactory::createRotatingFileSink(const std::string& file_path,
                                         size_t max_size, size_t max_files,
                                         spdlog::level::level_enum level,
                                         const std::string& pattern)
    -> spdlog::sink_ptr {
    ensureDirectoryExists(file_path);
    auto sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        file_path, max_size, max_files);
    sink->set_level(level);
    if (!pattern.empty()) {
        sink->set_pattern(pattern);
    }
    return sink;
}

void SinkFactory::ensureDirectoryExists(const std::string& file_path) {
    std::filesystem::path path(file_path);
    auto parent = path.parent_path();
    if (!parent.empty() && !std::filesystem::exists(parent)) {
        std::filesystem::create_directories(parent);
    }
}

void initialize(const LoggingConfig& config) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(SinkFactory::createConsoleSink(
        config.level, config.pattern, config.console_color));

    std::string fileError;
    if (!config.file_path.empty()) {
        try {
            sinks.push_back(SinkFactory::createRotatingFileSink(
                config.file_path, config.max_file_size, config.max_files,
                config.level, config.pattern));
        } catch (const std::exception& e) {
            fileError = e.what();
        }
    }

    std::lock_guard lock(registryMutex());
    activeSinks() = std::move(sinks);
    activeLevel() = config.level;

    // Rebind loggers created before this call
    spdlog::apply_all([](const std::shared_ptr<spdlog::logger>& logger) {
        logger->sinks() = activeSinks();
        logger->set_level(activeLevel());
    });

    auto defaultLogger = spdlog::get(DEFAULT_LOGGER);
    if (!defaultLogger) {
        defaultLogger = buildLogger(DEFAULT_LOGGER);
        spdlog::register_logger(defaultLogger);
    }
    spdlog::set_default_logger(defaultLogger);

    if (!fileError.empty()) {
        defaultLogger->error("Failed to open log file '{}': {}",
                             config.file_path, fileError);
    }
}

auto getLogger(const std::string& name) -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(registryMutex());
    if (auto existing = spdlog::get(name)) {
        return existing;
    }
    if (activeSinks().empty()) {
        // initialize() has not run (unit tests); share the default sinks
        auto fallback = spdlog::default_logger();
        auto logger = std::make_shared<spdlog::logger>(
            name, fallback->sinks().begin(), fallback->sinks().end());
        logger->set_level(fallback->level());
        spdlog::register_logger(logger);
        return logger;
    }
    auto logger = buildLogger(name);
    spdlog::register_logger(logger);
    return logger;
}

void shutdown() {
    std::lock_guard lock(registryMutex());
    spdlog::shutdown();
    activeSinks().clear();
}

}  // namespace firetv::logging
