/*
 * device_session.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Live session to one device: connection state machine,
serialized command execution, reconnect with backoff and heartbeat

**************************************************/

#ifndef FIRETV_DEVICE_DEVICE_SESSION_HPP
#define FIRETV_DEVICE_DEVICE_SESSION_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <variant>

#include "atom/type/json.hpp"
#include "backoff.hpp"
#include "command.hpp"
#include "common/result.hpp"
#include "config/configuration.hpp"
#include "protocol.hpp"

namespace firetv::device {

/**
 * @brief Session lifecycle
 *
 * Unconfigured -> Connecting -> Connected -> (Disconnected -> Connecting)*
 * and any state -> Closed, which is terminal.
 */
enum class SessionState : uint8_t {
    Unconfigured,
    Connecting,
    Connected,
    Disconnected,
    Closed
};

[[nodiscard]] auto sessionStateName(SessionState state) -> std::string_view;

struct SessionOptions {
    BackoffPolicy backoff;
    int max_reconnect_attempts{0};  ///< 0 retries forever
    std::chrono::milliseconds heartbeat_interval{30000};  ///< 0 disables
    std::chrono::milliseconds request_timeout{10000};

    [[nodiscard]] static auto fromSettings(
        const config::SessionSettings& settings) -> SessionOptions;
};

/**
 * @brief Snapshot of a session for listings
 */
struct SessionInfo {
    std::string name;
    std::string address;
    std::string family;
    SessionState state{SessionState::Unconfigured};
    std::optional<Error> last_error;
    int consecutive_failures{0};
    std::optional<std::chrono::milliseconds> next_retry;
    std::optional<std::chrono::system_clock::time_point> last_seen;
    uint64_t commands_executed{0};

    [[nodiscard]] auto toJson() const -> nlohmann::json;
};

/**
 * @brief Session to a single device
 *
 * A worker thread owns the protocol instance and runs jobs (commands,
 * connect requests, reconfiguration) strictly in submission order. Public
 * methods only enqueue jobs or read state, so they are safe from any
 * thread.
 */
class DeviceSession {
public:
    using StateListener = std::function<void(
        const std::string& device, SessionState from, SessionState to)>;

    DeviceSession(config::DeviceDefinition device,
                  std::unique_ptr<DeviceProtocol> protocol,
                  SessionOptions options);
    ~DeviceSession();

    DeviceSession(const DeviceSession&) = delete;
    DeviceSession& operator=(const DeviceSession&) = delete;

    /**
     * @brief Register a transition observer; call before start()
     */
    void setStateListener(StateListener listener);

    /**
     * @brief Start the worker thread
     */
    void start();

    /**
     * @brief Request a connection; resolves once connected or failed
     *
     * Connected sessions resolve immediately with success. Also re-enables
     * automatic reconnects with a fresh backoff.
     */
    auto connect() -> std::future<VoidResult>;

    /**
     * @brief Queue a command
     *
     * Fails immediately with NotConnected while Disconnected or Closed and
     * with ValidationError if the protocol lacks the capability.
     */
    auto submit(Command command) -> std::future<Result<Ack>>;

    /**
     * @brief Queue a command and wait at most the request timeout
     *
     * On expiry TimeoutError is returned; the job still runs in order.
     */
    auto execute(Command command) -> Result<Ack>;
    auto execute(Command command, std::chrono::milliseconds timeout)
        -> Result<Ack>;

    /**
     * @brief Apply a changed definition; an active link is re-established
     */
    void reconfigure(config::DeviceDefinition device);

    /**
     * @brief Drop the link and stop automatic reconnects until the next
     * connect()
     */
    auto disconnect() -> std::future<void>;

    /**
     * @brief Close the session for good; queued jobs fail with NotConnected
     */
    void close();

    [[nodiscard]] auto name() const -> const std::string& { return name_; }
    [[nodiscard]] auto state() const -> SessionState;
    [[nodiscard]] auto info() const -> SessionInfo;
    [[nodiscard]] auto definition() const -> config::DeviceDefinition;
    [[nodiscard]] auto family() const -> std::string_view {
        return protocol_->family();
    }
    [[nodiscard]] auto capabilities() const -> CapabilitySet {
        return capabilities_;
    }

private:
    struct ConnectJob {
        std::promise<VoidResult> promise;
    };
    struct CommandJob {
        Command command;
        std::promise<Result<Ack>> promise;
        std::chrono::steady_clock::time_point accepted;
    };
    struct ReconfigureJob {
        config::DeviceDefinition device;
    };
    struct DisconnectJob {
        std::promise<void> promise;
    };
    using Job = std::variant<ConnectJob, CommandJob, ReconfigureJob,
                             DisconnectJob>;

    void run(std::stop_token stopToken);
    void process(ConnectJob& job);
    void process(CommandJob& job);
    void process(ReconfigureJob& job);
    void process(DisconnectJob& job);

    auto establish() -> VoidResult;
    void reconnect();
    void heartbeat();
    void handleLinkFailure(const Error& error);
    void scheduleRetryLocked();
    void restartRetriesLocked();
    [[nodiscard]] auto nextDeadlineLocked() const
        -> std::optional<std::chrono::steady_clock::time_point>;

    void transition(SessionState next);
    auto setStateLocked(SessionState next) -> SessionState;
    void notify(SessionState from, SessionState to);
    void failQueued();

    const std::string name_;
    std::unique_ptr<DeviceProtocol> protocol_;
    const SessionOptions options_;
    const CapabilitySet capabilities_;

    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
    std::deque<Job> jobs_;
    config::DeviceDefinition device_;
    SessionState state_{SessionState::Unconfigured};
    ReconnectBackoff backoff_;
    bool autoReconnect_{true};
    int pendingConnects_{0};
    std::optional<std::chrono::steady_clock::time_point> retryAt_;
    std::chrono::steady_clock::time_point lastActivity_;
    std::optional<std::chrono::system_clock::time_point> lastSeen_;
    std::optional<Error> lastError_;
    int consecutiveFailures_{0};
    uint64_t commandsExecuted_{0};
    StateListener listener_;
    bool workerDone_{false};

    std::jthread worker_;
};

}  // namespace firetv::device

#endif  // FIRETV_DEVICE_DEVICE_SESSION_HPP
