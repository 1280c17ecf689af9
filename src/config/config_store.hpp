/*
 * config_store.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Shared, thread-safe owner of the live configuration

**************************************************/

#ifndef FIRETV_CONFIG_CONFIG_STORE_HPP
#define FIRETV_CONFIG_CONFIG_STORE_HPP

#include <filesystem>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "configuration.hpp"

namespace firetv::config {

/**
 * @brief Owner of the live Configuration
 *
 * The session manager and the command server both hold a reference to the
 * same store. Readers take a shared lock; reloads and runtime additions an
 * exclusive one, so readers see either the old or the new device set.
 */
class ConfigStore {
public:
    explicit ConfigStore(Configuration initial,
                         std::filesystem::path source = {});

    ConfigStore(const ConfigStore&) = delete;
    ConfigStore& operator=(const ConfigStore&) = delete;

    [[nodiscard]] auto snapshot() const -> Configuration;

    [[nodiscard]] auto findDevice(std::string_view name) const
        -> std::optional<DeviceDefinition>;

    [[nodiscard]] auto devices() const -> std::vector<DeviceDefinition>;

    [[nodiscard]] auto sessionSettings() const -> SessionSettings;

    [[nodiscard]] auto sourcePath() const -> std::filesystem::path;

    /**
     * @brief Add a device at runtime
     * @param pinned Keep the device across reloads (command line devices)
     * @return ValidationError if the name is already in use
     */
    auto addDevice(DeviceDefinition device, bool pinned = false) -> VoidResult;

    /**
     * @brief Replace the device set with the one of `next`
     *
     * Startup-only sections are kept; pinned devices survive unless `next`
     * defines a device with the same name.
     * @return The applied diff
     */
    auto replaceDevices(const Configuration& next) -> ConfigDiff;

private:
    mutable std::shared_mutex mutex_;
    Configuration config_;
    std::filesystem::path source_;
    std::vector<DeviceDefinition> pinned_;
};

}  // namespace firetv::config

#endif  // FIRETV_CONFIG_CONFIG_STORE_HPP
