/*
 * command_line.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Command line options of firetv-server

**************************************************/

#ifndef FIRETV_SERVER_COMMAND_LINE_HPP
#define FIRETV_SERVER_COMMAND_LINE_HPP

#include <optional>
#include <string>
#include <vector>

#include "config/validation.hpp"

namespace firetv::server {

struct CommandLineOptions {
    bool help{false};
    bool verbose{false};
    std::optional<std::string> config_path;
    std::optional<int> port;                     ///< Overrides server.port
    std::optional<config::HostAddress> default_device;  ///< --default
};

/**
 * @brief Parse the arguments, program name included
 *
 * @throws CommandLineException on unknown options, missing values, a port
 * outside 1-65535 or a malformed --default address
 */
[[nodiscard]] auto parseCommandLine(const std::vector<std::string>& args)
    -> CommandLineOptions;

/**
 * @brief Usage text printed for --help and after usage errors
 */
[[nodiscard]] auto usage(const std::string& program) -> std::string;

}  // namespace firetv::server

#endif  // FIRETV_SERVER_COMMAND_LINE_HPP
