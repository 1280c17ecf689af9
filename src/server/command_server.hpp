/*
 * command_server.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: HTTP front end that validates control requests and hands them
to the session manager

**************************************************/

#ifndef FIRETV_SERVER_COMMAND_SERVER_HPP
#define FIRETV_SERVER_COMMAND_SERVER_HPP

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "app.hpp"
#include "atom/type/json.hpp"
#include "common/result.hpp"
#include "config/config_store.hpp"
#include "device/session_manager.hpp"

namespace firetv::server {

namespace controller {
class Controller;
}

/**
 * @brief Request front end for device control
 *
 * Every request is checked here before it reaches the session manager:
 * malformed ids and payloads fail with ValidationError and unknown devices
 * with NotFound, neither touching the network. Handlers run on Crow's
 * worker pool; ordering per device is kept by the device sessions.
 */
class CommandServer {
public:
    CommandServer(config::ConfigStore& store, device::SessionManager& sessions,
                  config::ServerSettings settings);
    ~CommandServer();

    CommandServer(const CommandServer&) = delete;
    CommandServer& operator=(const CommandServer&) = delete;

    /**
     * @brief Validate and execute a named command on a device
     */
    auto dispatch(const std::string& device, std::string_view command,
                  const nlohmann::json& params = nullptr) -> Result<device::Ack>;

    /**
     * @brief Like dispatch() but with the acknowledgement rendered as JSON
     */
    auto dispatchJson(const std::string& device, std::string_view command,
                      const nlohmann::json& params = nullptr)
        -> Result<nlohmann::json>;

    /**
     * @brief Query the device state; an unreachable device reports
     * "disconnected"
     */
    auto deviceState(const std::string& device) -> Result<nlohmann::json>;

    /**
     * @brief Connect a device now instead of on first use
     */
    auto connectDevice(const std::string& device) -> Result<nlohmann::json>;

    /**
     * @brief Drop a device's link
     */
    auto disconnectDevice(const std::string& device) -> Result<nlohmann::json>;

    /**
     * @brief Register a device from `{"device_id", "host", "credential"?,
     * "family"?}`
     */
    auto addDevice(const nlohmann::json& body) -> Result<nlohmann::json>;

    /**
     * @brief All devices keyed by id with their session details
     */
    [[nodiscard]] auto listDevices() const -> nlohmann::json;

    /**
     * @brief Re-read the configuration file and apply the device diff
     */
    auto reloadConfiguration() -> Result<nlohmann::json>;

    [[nodiscard]] auto app() -> ServerApp& { return app_; }

    /**
     * @brief Serve on the configured address from Crow's own threads
     *
     * Returns once the listener is up; stop() ends it.
     */
    void runAsync();

    /**
     * @brief Stop accepting requests; in-flight requests still complete
     */
    void beginShutdown();

    /**
     * @brief Stop the HTTP loop
     */
    void stop();

    [[nodiscard]] auto isAccepting() const -> bool;

    [[nodiscard]] auto settings() const -> const config::ServerSettings& {
        return settings_;
    }

private:
    void registerControllers();
    void configure();
    auto checkDeviceId(const std::string& device) const -> VoidResult;

    config::ConfigStore& store_;
    device::SessionManager& sessions_;
    config::ServerSettings settings_;

    ServerApp app_;
    std::vector<std::unique_ptr<controller::Controller>> controllers_;
    std::future<void> serving_;
    std::atomic<bool> accepting_{true};
};

}  // namespace firetv::server

#endif  // FIRETV_SERVER_COMMAND_SERVER_HPP
