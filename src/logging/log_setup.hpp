/*
 * log_setup.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Logging configuration and sink setup for the server

**************************************************/

#ifndef FIRETV_LOGGING_LOG_SETUP_HPP
#define FIRETV_LOGGING_LOG_SETUP_HPP

#include <memory>
#include <optional>
#include <string>

#include <spdlog/spdlog.h>

namespace firetv::logging {

inline constexpr const char* DEFAULT_PATTERN =
    "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

/**
 * @brief Logging configuration, read from the `logging` config section
 */
struct LoggingConfig {
    spdlog::level::level_enum level{spdlog::level::info};
    std::string pattern{DEFAULT_PATTERN};
    bool console_color{true};
    std::string file_path;  ///< Empty disables the file sink
    size_t max_file_size{10 * 1024 * 1024};
    size_t max_files{3};

    bool operator==(const LoggingConfig&) const = default;
};

/**
 * @brief Parse a level name ("trace" ... "critical", "off", "warn" or
 * "warning"). Returns nullopt for anything else.
 */
[[nodiscard]] auto levelFromString(const std::string& level)
    -> std::optional<spdlog::level::level_enum>;

[[nodiscard]] auto levelToString(spdlog::level::level_enum level)
    -> std::string;

/**
 * @brief Creates the sinks used by the server loggers
 */
class SinkFactory {
public:
    static auto createConsoleSink(spdlog::level::level_enum level,
                                  const std::string& pattern, bool color)
        -> spdlog::sink_ptr;

    static auto createRotatingFileSink(const std::string& file_path,
                                       size_t max_size, size_t max_files,
                                       spdlog::level::level_enum level,
                                       const std::string& pattern)
        -> spdlog::sink_ptr;

private:
    static void ensureDirectoryExists(const std::string& file_path);
};

/**
 * @brief Install the default "firetv" logger built from the given config
 *
 * Safe to call more than once; later calls replace the sinks of every
 * logger previously handed out by getLogger().
 */
void initialize(const LoggingConfig& config);

/**
 * @brief Get (or create) a named logger sharing the default sinks
 */
[[nodiscard]] auto getLogger(const std::string& name)
    -> std::shared_ptr<spdlog::logger>;

/**
 * @brief Flush and drop all loggers
 */
void shutdown();

}  // namespace firetv::logging

#endif  // FIRETV_LOGGING_LOG_SETUP_HPP
