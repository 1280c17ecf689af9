/*
 * protocol.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device protocol interface and the registry of protocol families

**************************************************/

#ifndef FIRETV_DEVICE_PROTOCOL_HPP
#define FIRETV_DEVICE_PROTOCOL_HPP

#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include "atom/type/json.hpp"
#include "command.hpp"
#include "common/result.hpp"
#include "config/configuration.hpp"

namespace firetv::device {

/**
 * @brief Timeouts and options handed to every protocol instance
 */
struct ProtocolOptions {
    std::chrono::milliseconds connect_timeout{3000};
    std::chrono::milliseconds handshake_timeout{5000};
    std::chrono::milliseconds auth_timeout{30000};
    std::chrono::milliseconds io_timeout{10000};
    bool enroll_public_key{true};
    std::string banner{"firetv-server"};

    [[nodiscard]] static auto fromSettings(
        const config::SessionSettings& settings) -> ProtocolOptions;
};

/**
 * @brief Wire protocol of one device family
 *
 * An instance serves one device. It is driven by a single session worker
 * thread; only abort() is called from other threads.
 */
class DeviceProtocol {
public:
    virtual ~DeviceProtocol() = default;

    [[nodiscard]] virtual auto family() const -> std::string_view = 0;

    /**
     * @brief Commands this family can execute; constant for the instance
     */
    [[nodiscard]] virtual auto capabilities() const -> CapabilitySet = 0;

    /**
     * @brief Connect and authenticate
     * @return NotConnected, TimeoutError, AuthError or ProtocolError
     */
    virtual auto open(const config::DeviceDefinition& device) -> VoidResult = 0;

    /**
     * @brief Execute a command on an open link
     * @return Command result data (an object, possibly empty)
     */
    virtual auto execute(const Command& command) -> Result<nlohmann::json> = 0;

    /**
     * @brief Cheap liveness check used by the heartbeat
     */
    virtual auto ping() -> VoidResult = 0;

    virtual void close() = 0;

    /**
     * @brief Unblock pending I/O from another thread
     */
    virtual void abort() noexcept = 0;

    [[nodiscard]] virtual auto isOpen() const -> bool = 0;
};

using ProtocolFactory =
    std::function<std::unique_ptr<DeviceProtocol>(const ProtocolOptions&)>;

/**
 * @brief Maps family names to protocol factories
 */
class ProtocolRegistry {
public:
    ProtocolRegistry() = default;

    /**
     * @brief Registry with the built-in "adb" family over TCP
     */
    [[nodiscard]] static auto withDefaults() -> ProtocolRegistry;

    void registerFamily(const std::string& family, ProtocolFactory factory);

    [[nodiscard]] auto contains(std::string_view family) const -> bool;

    [[nodiscard]] auto families() const -> std::vector<std::string>;

    /**
     * @brief Create a protocol instance
     * @return ValidationError for an unknown family
     */
    [[nodiscard]] auto create(std::string_view family,
                              const ProtocolOptions& options) const
        -> Result<std::unique_ptr<DeviceProtocol>>;

private:
    std::map<std::string, ProtocolFactory, std::less<>> factories_;
};

}  // namespace firetv::device

#endif  // FIRETV_DEVICE_PROTOCOL_HPP
