/*
 * session_manager.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Owns one session per configured device and keeps the session
set in line with the configuration

**************************************************/

#ifndef FIRETV_DEVICE_SESSION_MANAGER_HPP
#define FIRETV_DEVICE_SESSION_MANAGER_HPP

#include <atomic>
#include <filesystem>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "common/result.hpp"
#include "config/config_store.hpp"
#include "device_session.hpp"
#include "protocol.hpp"

namespace firetv::device {

/**
 * @brief Registry of live device sessions
 *
 * At most one session exists per device name. Sessions are created for
 * every configured device at start(); they connect lazily on first use
 * unless `connect_on_startup` is set.
 */
class SessionManager {
public:
    SessionManager(config::ConfigStore& store, ProtocolRegistry registry);
    ~SessionManager();

    SessionManager(const SessionManager&) = delete;
    SessionManager& operator=(const SessionManager&) = delete;

    /**
     * @brief Create sessions for all configured devices
     */
    void start();

    /**
     * @brief Connect a device, reusing its session
     *
     * Idempotent: connecting a connected device returns the same session
     * without new I/O.
     * @return NotFound for unknown devices, or the connection error
     */
    auto connect(const std::string& name)
        -> Result<std::shared_ptr<DeviceSession>>;

    /**
     * @brief Execute a command on the device's session
     *
     * Commands to one device run in submission order; different devices
     * run in parallel.
     */
    auto send(const std::string& name, Command command) -> Result<Ack>;

    /**
     * @brief Drop a device's link; its session stays registered
     */
    auto disconnect(const std::string& name) -> VoidResult;

    [[nodiscard]] auto session(const std::string& name) const
        -> std::shared_ptr<DeviceSession>;

    [[nodiscard]] auto list() const -> std::vector<SessionInfo>;

    [[nodiscard]] auto sessionCount() const -> size_t;

    /**
     * @brief Register a device at runtime and create its session
     * @param pinned Keep the device across reloads
     * @return ValidationError for a duplicate name or unknown family
     */
    auto addDevice(config::DeviceDefinition device, bool pinned = false)
        -> VoidResult;

    /**
     * @brief Reload the configuration file the store was loaded from
     */
    auto reload() -> Result<config::ConfigDiff>;

    /**
     * @brief Reload from `path` and apply the device diff
     *
     * A file that fails to parse leaves configuration and sessions
     * untouched and returns ParseError.
     */
    auto reload(const std::filesystem::path& path)
        -> Result<config::ConfigDiff>;

    /**
     * @brief Close removed sessions, create added ones, reconnect changed
     */
    void applyDiff(const config::ConfigDiff& diff);

    /**
     * @brief Close all sessions; later requests fail with Unavailable
     */
    void shutdown();

    [[nodiscard]] auto isShutdown() const -> bool { return shutdown_.load(); }

    [[nodiscard]] auto registry() const -> const ProtocolRegistry& {
        return registry_;
    }

private:
    auto createSession(const config::DeviceDefinition& device)
        -> Result<std::shared_ptr<DeviceSession>>;
    auto lookup(const std::string& name) const
        -> Result<std::shared_ptr<DeviceSession>>;

    config::ConfigStore& store_;
    ProtocolRegistry registry_;
    SessionOptions sessionOptions_;
    ProtocolOptions protocolOptions_;
    bool connectOnStartup_{false};

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<DeviceSession>> sessions_;
    std::mutex reloadMutex_;
    std::atomic<bool> shutdown_{false};
};

}  // namespace firetv::device

#endif  // FIRETV_DEVICE_SESSION_MANAGER_HPP
