/*
 * configuration.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: In-memory server configuration: device definitions, server,
session and logging settings, and the device-level diff between two
configurations

**************************************************/

#ifndef FIRETV_CONFIG_CONFIGURATION_HPP
#define FIRETV_CONFIG_CONFIGURATION_HPP

#include <chrono>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "atom/type/json.hpp"
#include "common/result.hpp"
#include "logging/log_setup.hpp"

namespace firetv::config {

inline constexpr int DEFAULT_DEVICE_PORT = 5555;
inline constexpr int DEFAULT_SERVER_PORT = 5556;
inline constexpr const char* DEFAULT_FAMILY = "adb";

/**
 * @brief One configured device
 */
struct DeviceDefinition {
    std::string name;
    std::string host;
    int port{DEFAULT_DEVICE_PORT};
    std::string credential;  ///< Path to the private key; empty means none
    std::string family{DEFAULT_FAMILY};

    /**
     * @brief "host:port", brackets added for IPv6 literals
     */
    [[nodiscard]] auto address() const -> std::string;

    /**
     * @brief True when the link must be re-established to pick up the change
     */
    [[nodiscard]] auto connectionDiffers(const DeviceDefinition& other) const
        -> bool;

    [[nodiscard]] auto toJson() const -> nlohmann::json;

    bool operator==(const DeviceDefinition&) const = default;
};

/**
 * @brief HTTP front end settings (startup only)
 */
struct ServerSettings {
    std::string bind_address{"0.0.0.0"};
    int port{DEFAULT_SERVER_PORT};
    int threads{4};

    bool operator==(const ServerSettings&) const = default;
};

/**
 * @brief Session timing settings (startup only)
 */
struct SessionSettings {
    std::chrono::milliseconds connect_timeout{3000};
    std::chrono::milliseconds handshake_timeout{5000};
    std::chrono::milliseconds auth_timeout{30000};
    std::chrono::milliseconds command_timeout{10000};
    std::chrono::milliseconds heartbeat_interval{30000};
    std::chrono::milliseconds backoff_initial{1000};
    std::chrono::milliseconds backoff_max{60000};
    double backoff_multiplier{2.0};
    int max_reconnect_attempts{0};  ///< 0 retries forever
    bool connect_on_startup{false};
    bool enroll_public_key{true};
    bool watch{false};
    std::chrono::milliseconds watch_interval{1000};

    bool operator==(const SessionSettings&) const = default;
};

/**
 * @brief Result of comparing the device sets of two configurations
 */
struct ConfigDiff {
    std::vector<DeviceDefinition> added;
    std::vector<std::string> removed;
    std::vector<DeviceDefinition> changed;

    [[nodiscard]] auto empty() const -> bool {
        return added.empty() && removed.empty() && changed.empty();
    }

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Complete configuration
 *
 * Device names are unique; definitions keep the order of the file.
 */
class Configuration {
public:
    ServerSettings server;
    SessionSettings sessions;
    logging::LoggingConfig logging;

    [[nodiscard]] auto devices() const -> const std::vector<DeviceDefinition>& {
        return devices_;
    }

    [[nodiscard]] auto find(std::string_view name) const
        -> const DeviceDefinition*;

    [[nodiscard]] auto contains(std::string_view name) const -> bool {
        return find(name) != nullptr;
    }

    /**
     * @brief Add a device; ValidationError if the name is taken
     */
    auto addDevice(DeviceDefinition device) -> VoidResult;

    /**
     * @brief Replace an existing definition or append a new one
     */
    void upsertDevice(DeviceDefinition device);

    /**
     * @brief Copy the device set of another configuration, keeping the
     * startup-only sections of this one
     */
    void assignDevices(const Configuration& other) {
        devices_ = other.devices_;
    }

    [[nodiscard]] auto size() const -> size_t { return devices_.size(); }

private:
    std::vector<DeviceDefinition> devices_;
};

/**
 * @brief Compute added, removed and changed devices going from
 * `before` to `after`
 */
[[nodiscard]] auto diff(const Configuration& before, const Configuration& after)
    -> ConfigDiff;

}  // namespace firetv::config

#endif  // FIRETV_CONFIG_CONFIGURATION_HPP
