/*
 * config_loader.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: YAML configuration loader implementation

**************************************************/

#include "config_loader.hpp"

#include <algorithm>
#include <format>
#include <fstream>
#include <sstream>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

#include "common/exception.hpp"
#include "validation.hpp"

namespace firetv::config {

namespace {

template <typename T>
auto readScalar(const YAML::Node& node, const std::string& where) -> T {
    if (!node.IsScalar()) {
        THROW_CONFIG_PARSE_ERROR(where + ": expected a scalar value");
    }
    try {
        return node.as<T>();
    } catch (const YAML::BadConversion&) {
        THROW_CONFIG_PARSE_ERROR(
            std::format("{}: invalid value '{}' (line {})", where,
                        node.Scalar(), node.Mark().line + 1));
    }
}

template <typename T>
void readOptional(const YAML::Node& section, const char* key,
                  const std::string& sectionName, T& target) {
    if (auto node = section[key]; node && !node.IsNull()) {
        target = readScalar<T>(node, sectionName + "." + key);
    }
}

void readMillis(const YAML::Node& section, const char* key,
                std::chrono::milliseconds& target) {
    if (auto node = section[key]; node && !node.IsNull()) {
        auto value = readScalar<long long>(node, std::string("sessions.") + key);
        if (value <= 0) {
            THROW_CONFIG_PARSE_ERROR(std::format(
                "sessions.{}: must be a positive number of milliseconds", key));
        }
        target = std::chrono::milliseconds(value);
    }
}

void expectMap(const YAML::Node& node, const std::string& where) {
    if (node && !node.IsNull() && !node.IsMap()) {
        THROW_CONFIG_PARSE_ERROR(where + ": expected a mapping");
    }
}

void parseServer(const YAML::Node& node, ServerSettings& server) {
    expectMap(node, "server");
    if (!node || node.IsNull()) {
        return;
    }
    readOptional(node, "bind", "server", server.bind_address);
    readOptional(node, "port", "server", server.port);
    readOptional(node, "threads", "server", server.threads);
    if (!isValidPort(server.port)) {
        THROW_CONFIG_PARSE_ERROR(
            std::format("server.port: {} is not a valid port", server.port));
    }
    if (server.threads < 1) {
        THROW_CONFIG_PARSE_ERROR("server.threads: must be at least 1");
    }
}

void parseLogging(const YAML::Node& node, logging::LoggingConfig& config) {
    expectMap(node, "logging");
    if (!node || node.IsNull()) {
        return;
    }
    if (auto level = node["level"]; level && !level.IsNull()) {
        auto name = readScalar<std::string>(level, "logging.level");
        auto parsed = logging::levelFromString(name);
        if (!parsed) {
            THROW_CONFIG_PARSE_ERROR("logging.level: unknown level '" + name +
                                     "'");
        }
        config.level = *parsed;
    }
    readOptional(node, "pattern", "logging", config.pattern);
    readOptional(node, "color", "logging", config.console_color);
    readOptional(node, "file", "logging", config.file_path);
    readOptional(node, "max_size", "logging", config.max_file_size);
    readOptional(node, "max_files", "logging", config.max_files);
}

void parseSessions(const YAML::Node& node, SessionSettings& sessions) {
    expectMap(node, "sessions");
    if (!node || node.IsNull()) {
        return;
    }
    readMillis(node, "connect_timeout_ms", sessions.connect_timeout);
    readMillis(node, "handshake_timeout_ms", sessions.handshake_timeout);
    readMillis(node, "auth_timeout_ms", sessions.auth_timeout);
    readMillis(node, "command_timeout_ms", sessions.command_timeout);
    readMillis(node, "heartbeat_interval_ms", sessions.heartbeat_interval);
    readMillis(node, "backoff_initial_ms", sessions.backoff_initial);
    readMillis(node, "backoff_max_ms", sessions.backoff_max);
    readMillis(node, "watch_interval_ms", sessions.watch_interval);
    readOptional(node, "backoff_multiplier", "sessions",
                 sessions.backoff_multiplier);
    readOptional(node, "max_reconnect_attempts", "sessions",
                 sessions.max_reconnect_attempts);
    readOptional(node, "connect_on_startup", "sessions",
                 sessions.connect_on_startup);
    readOptional(node, "enroll_public_key", "sessions",
                 sessions.enroll_public_key);
    readOptional(node, "watch", "sessions", sessions.watch);

    if (sessions.backoff_multiplier < 1.0) {
        THROW_CONFIG_PARSE_ERROR("sessions.backoff_multiplier: must be >= 1");
    }
    if (sessions.backoff_max < sessions.backoff_initial) {
        THROW_CONFIG_PARSE_ERROR(
            "sessions.backoff_max_ms: must not be below backoff_initial_ms");
    }
    if (sessions.max_reconnect_attempts < 0) {
        THROW_CONFIG_PARSE_ERROR(
            "sessions.max_reconnect_attempts: must not be negative");
    }
}

auto parseDevice(const std::string& name, const YAML::Node& node,
                 const std::vector<std::string>& families)
    -> DeviceDefinition {
    const std::string where = "devices." + name;
    if (!isValidDeviceId(name)) {
        THROW_CONFIG_PARSE_ERROR(where + ": invalid device id");
    }

    DeviceDefinition device;
    device.name = name;

    // Shorthand: `name: "10.0.0.5:5555"`
    if (node.IsScalar()) {
        auto address = parseHostAddress(readScalar<std::string>(node, where));
        if (!address) {
            THROW_CONFIG_PARSE_ERROR(where + ": expected <address>:<port>");
        }
        device.host = address->host;
        device.port = address->port;
        return device;
    }

    if (!node.IsMap()) {
        THROW_CONFIG_PARSE_ERROR(where + ": expected a mapping");
    }

    auto hostNode = node["host"];
    if (!hostNode || hostNode.IsNull()) {
        THROW_CONFIG_PARSE_ERROR(where + ": missing host");
    }
    auto host = readScalar<std::string>(hostNode, where + ".host");
    auto portNode = node["port"];

    if (auto address = parseHostAddress(host)) {
        if (portNode && !portNode.IsNull()) {
            THROW_CONFIG_PARSE_ERROR(
                where + ": port given both in host and as a separate key");
        }
        device.host = address->host;
        device.port = address->port;
    } else if (isValidHostName(host)) {
        device.host = host;
        if (portNode && !portNode.IsNull()) {
            auto port = readScalar<long>(portNode, where + ".port");
            if (!isValidPort(port)) {
                THROW_CONFIG_PARSE_ERROR(
                    std::format("{}.port: {} is not a valid port", where, port));
            }
            device.port = static_cast<int>(port);
        }
    } else {
        THROW_CONFIG_PARSE_ERROR(where + ": invalid host '" + host + "'");
    }

    readOptional(node, "credential", where, device.credential);
    readOptional(node, "family", where, device.family);

    if (std::ranges::find(families, device.family) == families.end()) {
        THROW_CONFIG_PARSE_ERROR(where + ": unknown device family '" +
                                 device.family + "'");
    }
    return device;
}

void parseDevices(const YAML::Node& node, Configuration& config,
                  const std::vector<std::string>& families) {
    if (!node || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        THROW_CONFIG_PARSE_ERROR("devices: expected a mapping of id to device");
    }
    for (const auto& entry : node) {
        auto name = readScalar<std::string>(entry.first, "devices");
        auto device = parseDevice(name, entry.second, families);
        if (!config.addDevice(std::move(device))) {
            THROW_CONFIG_PARSE_ERROR("devices: duplicate device id '" + name +
                                     "'");
        }
    }
}

}  // namespace

auto ConfigLoader::load(const std::filesystem::path& path,
                        const std::vector<std::string>& families)
    -> Result<Configuration> {
    std::ifstream file(path);
    if (!file) {
        return failure(ErrorCode::ParseError,
                       "Cannot read configuration file: " + path.string());
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parse(buffer.str(), path.string(), families);
}

auto ConfigLoader::parse(const std::string& yaml, std::string_view source,
                         const std::vector<std::string>& families)
    -> Result<Configuration> {
    try {
        YAML::Node root = YAML::Load(yaml);
        Configuration config;

        if (root.IsNull()) {
            spdlog::warn("Configuration {} is empty", source);
            return config;
        }
        if (!root.IsMap()) {
            THROW_CONFIG_PARSE_ERROR("top level must be a mapping");
        }

        parseServer(root["server"], config.server);
        parseLogging(root["logging"], config.logging);
        parseSessions(root["sessions"], config.sessions);
        parseDevices(root["devices"], config, families);

        spdlog::debug("Parsed {} device(s) from {}", config.size(), source);
        return config;
    } catch (const ConfigParseException& e) {
        return failure(ErrorCode::ParseError,
                       std::format("{}: {}", source, e.what()));
    } catch (const YAML::Exception& e) {
        return failure(ErrorCode::ParseError,
                       std::format("{}: {}", source, e.what()));
    }
}

}  // namespace firetv::config
