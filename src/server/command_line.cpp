/*
 * command_line.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "command_line.hpp"

#include <any>
#include <format>

#include "atom/utils/argsview.hpp"
#include "common/exception.hpp"
#include "config/configuration.hpp"

using namespace std::string_literals;

namespace firetv::server {

auto parseCommandLine(const std::vector<std::string>& args)
    -> CommandLineOptions {
    using ArgType = atom::utils::ArgumentParser::ArgType;

    atom::utils::ArgumentParser program("firetv-server"s);
    program.addArgument("verbose", ArgType::BOOLEAN, false, false,
                        "Enable debug logging", {"v"});
    program.addArgument("help", ArgType::BOOLEAN, false, false,
                        "Show this help and exit", {"h"});
    program.addArgument("config", ArgType::STRING, false, std::any{},
                        "Path to the YAML configuration file", {"c"});
    program.addArgument("port", ArgType::INTEGER, false, std::any{},
                        "Listen port", {"p"});
    program.addArgument("default", ArgType::STRING, false, std::any{},
                        "Default device <address>:<port>", {"d"});
    program.addDescription("Fire TV / Android TV remote control server");

    std::vector<std::string> argv =
        args.empty() ? std::vector<std::string>{"firetv-server"} : args;
    try {
        program.parse(static_cast<int>(argv.size()), argv);
    } catch (const std::exception& e) {
        THROW_COMMAND_LINE_ERROR(std::format("Invalid arguments: {}", e.what()));
    }

    CommandLineOptions options;
    if (program.get<bool>("help").value_or(false)) {
        options.help = true;
        return options;
    }
    options.verbose = program.get<bool>("verbose").value_or(false);

    if (auto path = program.get<std::string>("config")) {
        if (path->empty()) {
            THROW_COMMAND_LINE_ERROR("Option --config expects a path");
        }
        options.config_path = std::move(*path);
    }

    if (auto port = program.get<int>("port")) {
        if (!config::isValidPort(*port)) {
            THROW_COMMAND_LINE_ERROR(
                std::format("Port must be between 1 and 65535: {}", *port));
        }
        options.port = *port;
    }

    if (auto value = program.get<std::string>("default")) {
        auto address = config::parseHostAddress(*value);
        if (!address || !config::isValidHostName(address->host)) {
            THROW_COMMAND_LINE_ERROR(
                std::format("Invalid --default host, expected "
                            "<address>:<port>: {}",
                            *value));
        }
        options.default_device = std::move(*address);
    }

    return options;
}

auto usage(const std::string& program) -> std::string {
    return std::format(
        "Usage: {} [-v|--verbose] [-c|--config <path>] [-p|--port <n>]\n"
        "       [-d|--default <address:port>] [-h|--help]\n"
        "\n"
        "Fire TV / Android TV remote control server\n"
        "\n"
        "Options:\n"
        "  -v, --verbose          Enable debug logging\n"
        "  -c, --config <path>    YAML configuration file\n"
        "  -p, --port <n>         Listen port (default {})\n"
        "  -d, --default <host>   Register device 'default' at <address:port>\n"
        "  -h, --help             Show this help and exit\n",
        program, config::DEFAULT_SERVER_PORT);
}

}  // namespace firetv::server
