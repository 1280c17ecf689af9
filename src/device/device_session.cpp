/*
 * device_session.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Device session implementation

**************************************************/

#include "device_session.hpp"

#include <algorithm>
#include <format>
#include <type_traits>

#include <spdlog/spdlog.h>

namespace firetv::device {

using Clock = std::chrono::steady_clock;

namespace {

constexpr std::chrono::milliseconds ABORT_REPEAT{50};

auto toIso8601(std::chrono::system_clock::time_point time) -> std::string {
    return std::format("{:%FT%TZ}",
                       std::chrono::floor<std::chrono::milliseconds>(time));
}

}  // namespace

auto sessionStateName(SessionState state) -> std::string_view {
    switch (state) {
        case SessionState::Unconfigured:
            return "unconfigured";
        case SessionState::Connecting:
            return "connecting";
        case SessionState::Connected:
            return "connected";
        case SessionState::Disconnected:
            return "disconnected";
        case SessionState::Closed:
            return "closed";
    }
    return "unknown";
}

auto SessionOptions::fromSettings(const config::SessionSettings& settings)
    -> SessionOptions {
    SessionOptions options;
    options.backoff = {settings.backoff_initial, settings.backoff_max,
                       settings.backoff_multiplier};
    options.max_reconnect_attempts = settings.max_reconnect_attempts;
    options.heartbeat_interval = settings.heartbeat_interval;
    options.request_timeout = settings.command_timeout;
    return options;
}

auto SessionInfo::toJson() const -> nlohmann::json {
    nlohmann::json j = {{"name", name},
                        {"host", address},
                        {"family", family},
                        {"state", std::string(sessionStateName(state))},
                        {"consecutive_failures", consecutive_failures},
                        {"commands_executed", commands_executed}};
    j["last_error"] = last_error ? last_error->toJson() : nlohmann::json();
    j["next_retry_ms"] =
        next_retry ? nlohmann::json(next_retry->count()) : nlohmann::json();
    j["last_seen"] = last_seen ? nlohmann::json(toIso8601(*last_seen))
                               : nlohmann::json();
    return j;
}

DeviceSession::DeviceSession(config::DeviceDefinition device,
                             std::unique_ptr<DeviceProtocol> protocol,
                             SessionOptions options)
    : name_(device.name),
      protocol_(std::move(protocol)),
      options_(options),
      capabilities_(protocol_->capabilities()),
      device_(std::move(device)),
      backoff_(options.backoff),
      lastActivity_(Clock::now()) {}

DeviceSession::~DeviceSession() { close(); }

void DeviceSession::setStateListener(StateListener listener) {
    std::lock_guard lock(mutex_);
    listener_ = std::move(listener);
}

void DeviceSession::start() {
    std::lock_guard lock(mutex_);
    if (worker_.joinable() || state_ == SessionState::Closed) {
        return;
    }
    worker_ = std::jthread([this](std::stop_token stopToken) {
        run(std::move(stopToken));
    });
}

auto DeviceSession::connect() -> std::future<VoidResult> {
    std::promise<VoidResult> promise;
    auto future = promise.get_future();

    std::lock_guard lock(mutex_);
    if (state_ == SessionState::Closed) {
        promise.set_value(
            failure(error::notConnected("Session closed").forDevice(name_)));
        return future;
    }
    ++pendingConnects_;
    jobs_.emplace_back(ConnectJob{std::move(promise)});
    cv_.notify_one();
    return future;
}

auto DeviceSession::submit(Command command) -> std::future<Result<Ack>> {
    std::promise<Result<Ack>> promise;
    auto future = promise.get_future();

    if (!capabilities_.has(command.capability())) {
        promise.set_value(failure(
            error::validation(std::format(
                                  "Family '{}' does not support '{}' ({})",
                                  protocol_->family(), command.name(),
                                  capabilityName(command.capability())))
                .forDevice(name_)));
        return future;
    }

    std::lock_guard lock(mutex_);
    if (state_ == SessionState::Closed) {
        promise.set_value(
            failure(error::notConnected("Session closed").forDevice(name_)));
        return future;
    }
    if (state_ == SessionState::Disconnected && pendingConnects_ == 0) {
        std::string reason = "Device is disconnected";
        if (lastError_) {
            reason += " (" + lastError_->message + ")";
        }
        if (retryAt_) {
            auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
                *retryAt_ - Clock::now());
            reason += std::format(", next retry in {}ms",
                                  std::max<long long>(wait.count(), 0));
        } else {
            reason += ", automatic reconnect stopped";
        }
        promise.set_value(
            failure(error::notConnected(reason).forDevice(name_)));
        return future;
    }

    jobs_.emplace_back(
        CommandJob{std::move(command), std::move(promise), Clock::now()});
    cv_.notify_one();
    return future;
}

auto DeviceSession::execute(Command command) -> Result<Ack> {
    return execute(std::move(command), options_.request_timeout);
}

auto DeviceSession::execute(Command command, std::chrono::milliseconds timeout)
    -> Result<Ack> {
    auto future = submit(std::move(command));
    if (future.wait_for(timeout) != std::future_status::ready) {
        return failure(error::timeout(std::format(
                                          "No result within {}ms; the command "
                                          "stays queued",
                                          timeout.count()))
                           .forDevice(name_));
    }
    return future.get();
}

void DeviceSession::reconfigure(config::DeviceDefinition device) {
    std::lock_guard lock(mutex_);
    if (state_ == SessionState::Closed) {
        return;
    }
    jobs_.emplace_back(ReconfigureJob{std::move(device)});
    cv_.notify_one();
}

auto DeviceSession::disconnect() -> std::future<void> {
    std::promise<void> promise;
    auto future = promise.get_future();

    std::lock_guard lock(mutex_);
    if (state_ == SessionState::Closed) {
        promise.set_value();
        return future;
    }
    jobs_.emplace_back(DisconnectJob{std::move(promise)});
    cv_.notify_one();
    return future;
}

void DeviceSession::close() {
    SessionState previous;
    {
        std::lock_guard lock(mutex_);
        if (state_ == SessionState::Closed) {
            return;
        }
        previous = setStateLocked(SessionState::Closed);
        retryAt_.reset();
    }
    notify(previous, SessionState::Closed);

    worker_.request_stop();
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        // An abort that lands before open() re-arms the transport is lost,
        // so repeat it until the worker has left
        std::unique_lock lock(mutex_);
        while (!workerDone_) {
            lock.unlock();
            protocol_->abort();
            lock.lock();
            cv_.wait_for(lock, ABORT_REPEAT, [this] { return workerDone_; });
        }
        lock.unlock();
        worker_.join();
    } else {
        protocol_->abort();
    }
    protocol_->close();
    failQueued();
}

auto DeviceSession::state() const -> SessionState {
    std::lock_guard lock(mutex_);
    return state_;
}

auto DeviceSession::definition() const -> config::DeviceDefinition {
    std::lock_guard lock(mutex_);
    return device_;
}

auto DeviceSession::info() const -> SessionInfo {
    std::lock_guard lock(mutex_);
    SessionInfo info;
    info.name = name_;
    info.address = device_.address();
    info.family = device_.family;
    info.state = state_;
    info.last_error = lastError_;
    info.consecutive_failures = consecutiveFailures_;
    if (retryAt_) {
        info.next_retry = std::max(
            std::chrono::milliseconds(0),
            std::chrono::duration_cast<std::chrono::milliseconds>(
                *retryAt_ - Clock::now()));
    }
    info.last_seen = lastSeen_;
    info.commands_executed = commandsExecuted_;
    return info;
}

// ============================================================================
// Worker
// ============================================================================

void DeviceSession::run(std::stop_token stopToken) {
    spdlog::debug("[{}] Session worker started", name_);

    while (!stopToken.stop_requested()) {
        std::optional<Job> job;
        bool retryDue = false;
        {
            std::unique_lock lock(mutex_);
            auto hasJob = [this] { return !jobs_.empty(); };
            auto deadline = nextDeadlineLocked();
            if (deadline) {
                cv_.wait_until(lock, stopToken, *deadline, hasJob);
            } else {
                cv_.wait(lock, stopToken, hasJob);
            }
            if (stopToken.stop_requested()) {
                break;
            }

            if (!jobs_.empty()) {
                job.emplace(std::move(jobs_.front()));
                jobs_.pop_front();
            } else if (deadline && Clock::now() >= *deadline) {
                retryDue = state_ == SessionState::Disconnected;
            } else {
                continue;
            }
        }

        if (job) {
            std::visit([this](auto& pending) { process(pending); }, *job);
        } else if (retryDue) {
            reconnect();
        } else {
            heartbeat();
        }
    }

    {
        std::lock_guard lock(mutex_);
        workerDone_ = true;
    }
    cv_.notify_all();
    spdlog::debug("[{}] Session worker stopped", name_);
}

auto DeviceSession::nextDeadlineLocked() const
    -> std::optional<Clock::time_point> {
    if (state_ == SessionState::Disconnected && autoReconnect_ && retryAt_) {
        return retryAt_;
    }
    if (state_ == SessionState::Connected &&
        options_.heartbeat_interval.count() > 0) {
        return lastActivity_ + options_.heartbeat_interval;
    }
    return std::nullopt;
}

void DeviceSession::process(ConnectJob& job) {
    {
        std::lock_guard lock(mutex_);
        --pendingConnects_;
        if (state_ == SessionState::Closed) {
            job.promise.set_value(
                failure(error::notConnected("Session closed").forDevice(name_)));
            return;
        }
        if (state_ == SessionState::Connected) {
            job.promise.set_value(success());
            return;
        }
        restartRetriesLocked();
    }

    auto result = establish();
    if (!result) {
        job.promise.set_value(failure(Error(result.error()).forDevice(name_)));
        return;
    }
    job.promise.set_value(success());
}

void DeviceSession::process(CommandJob& job) {
    SessionState current;
    {
        std::lock_guard lock(mutex_);
        current = state_;
    }

    if (current == SessionState::Unconfigured) {
        // First use: connect lazily
        if (auto connected = establish(); !connected) {
            job.promise.set_value(
                failure(Error(connected.error()).forDevice(name_)));
            return;
        }
    } else if (current != SessionState::Connected) {
        std::string reason = current == SessionState::Closed
                                 ? "Session closed"
                                 : "Device is disconnected";
        job.promise.set_value(
            failure(error::notConnected(reason).forDevice(name_)));
        return;
    }

    auto result = protocol_->execute(job.command);
    if (!result) {
        const auto& err = result.error();
        if (isLinkFailure(err.code)) {
            handleLinkFailure(err);
        }
        spdlog::warn("[{}] {} failed: {}", name_, job.command.name(),
                     err.message);
        job.promise.set_value(failure(Error(err).forDevice(name_)));
        return;
    }

    {
        std::lock_guard lock(mutex_);
        ++commandsExecuted_;
        lastSeen_ = std::chrono::system_clock::now();
        lastActivity_ = Clock::now();
    }

    Ack ack;
    ack.device = name_;
    ack.command = std::string(job.command.name());
    ack.data = std::move(*result);
    ack.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        Clock::now() - job.accepted);
    spdlog::debug("[{}] {} done in {}ms", name_, ack.command,
                  ack.elapsed.count());
    job.promise.set_value(std::move(ack));
}

void DeviceSession::process(ReconfigureJob& job) {
    SessionState current;
    {
        std::lock_guard lock(mutex_);
        device_ = std::move(job.device);
        current = state_;
    }

    if (current == SessionState::Unconfigured ||
        current == SessionState::Closed) {
        return;
    }

    spdlog::info("[{}] Definition changed, reconnecting", name_);
    protocol_->close();
    transition(SessionState::Disconnected);
    {
        std::lock_guard lock(mutex_);
        restartRetriesLocked();
    }
    if (auto result = establish(); !result) {
        spdlog::warn("[{}] Reconnect after definition change failed: {}",
                     name_, result.error().message);
    }
}

void DeviceSession::process(DisconnectJob& job) {
    protocol_->close();
    SessionState previous;
    SessionState next;
    {
        std::lock_guard lock(mutex_);
        autoReconnect_ = false;
        retryAt_.reset();
        previous = state_;
        if (state_ != SessionState::Unconfigured &&
            state_ != SessionState::Closed) {
            setStateLocked(SessionState::Disconnected);
        }
        next = state_;
    }
    notify(previous, next);
    job.promise.set_value();
}

auto DeviceSession::establish() -> VoidResult {
    config::DeviceDefinition device;
    {
        std::lock_guard lock(mutex_);
        if (state_ == SessionState::Closed) {
            return failure(ErrorCode::NotConnected, "Session closed");
        }
        device = device_;
    }

    transition(SessionState::Connecting);
    auto result = protocol_->open(device);

    SessionState previous;
    SessionState next;
    {
        std::lock_guard lock(mutex_);
        if (state_ == SessionState::Closed) {
            return failure(ErrorCode::NotConnected, "Session closed");
        }
        if (result) {
            consecutiveFailures_ = 0;
            backoff_.reset();
            lastError_.reset();
            retryAt_.reset();
            lastSeen_ = std::chrono::system_clock::now();
            lastActivity_ = Clock::now();
            previous = setStateLocked(SessionState::Connected);
        } else {
            ++consecutiveFailures_;
            lastError_ = result.error();
            scheduleRetryLocked();
            previous = setStateLocked(SessionState::Disconnected);
        }
        next = state_;
    }

    if (!result) {
        protocol_->close();
        spdlog::warn("[{}] Connection to {} failed ({}): {}", name_,
                     device.address(), result.error().name(),
                     result.error().message);
    }
    notify(previous, next);
    return result;
}

void DeviceSession::reconnect() {
    int attempt;
    {
        std::lock_guard lock(mutex_);
        retryAt_.reset();
        attempt = consecutiveFailures_ + 1;
    }
    spdlog::info("[{}] Reconnecting (attempt {})", name_, attempt);
    // establish() schedules the next retry on failure
    (void)establish();
}

void DeviceSession::heartbeat() {
    auto result = protocol_->ping();
    if (!result) {
        spdlog::warn("[{}] Heartbeat failed: {}", name_,
                     result.error().message);
        handleLinkFailure(result.error());
        return;
    }
    std::lock_guard lock(mutex_);
    lastSeen_ = std::chrono::system_clock::now();
    lastActivity_ = Clock::now();
}

void DeviceSession::handleLinkFailure(const Error& error) {
    protocol_->close();
    SessionState previous;
    {
        std::lock_guard lock(mutex_);
        if (state_ == SessionState::Closed) {
            return;
        }
        lastError_ = error;
        if (autoReconnect_) {
            retryAt_ = Clock::now() + backoff_.next();
        }
        previous = setStateLocked(SessionState::Disconnected);
    }
    spdlog::warn("[{}] Link lost: {}", name_, error.message);
    notify(previous, SessionState::Disconnected);
}

void DeviceSession::scheduleRetryLocked() {
    if (!autoReconnect_) {
        retryAt_.reset();
        return;
    }
    if (options_.max_reconnect_attempts > 0 &&
        consecutiveFailures_ >= options_.max_reconnect_attempts) {
        autoReconnect_ = false;
        retryAt_.reset();
        spdlog::error("[{}] Giving up after {} failed attempts; waiting for "
                      "an explicit connect",
                      name_, consecutiveFailures_);
        return;
    }
    auto delay = backoff_.next();
    retryAt_ = Clock::now() + delay;
    spdlog::info("[{}] Connection attempt {} in {}ms", name_,
                 backoff_.attempts() + 1, delay.count());
}

void DeviceSession::restartRetriesLocked() {
    autoReconnect_ = true;
    backoff_.reset();
    consecutiveFailures_ = 0;
    retryAt_.reset();
}

void DeviceSession::transition(SessionState next) {
    SessionState previous;
    {
        std::lock_guard lock(mutex_);
        if (state_ == SessionState::Closed) {
            return;
        }
        previous = setStateLocked(next);
    }
    notify(previous, next);
}

auto DeviceSession::setStateLocked(SessionState next) -> SessionState {
    auto previous = state_;
    state_ = next;
    return previous;
}

void DeviceSession::notify(SessionState from, SessionState to) {
    if (from == to) {
        return;
    }
    spdlog::info("[{}] {} -> {}", name_, sessionStateName(from),
                 sessionStateName(to));
    StateListener listener;
    {
        std::lock_guard lock(mutex_);
        listener = listener_;
    }
    if (listener) {
        listener(name_, from, to);
    }
}

void DeviceSession::failQueued() {
    std::deque<Job> pending;
    {
        std::lock_guard lock(mutex_);
        pending.swap(jobs_);
        pendingConnects_ = 0;
    }

    for (auto& job : pending) {
        std::visit(
            [this](auto& j) {
                using T = std::decay_t<decltype(j)>;
                if constexpr (std::is_same_v<T, CommandJob>) {
                    j.promise.set_value(failure(
                        error::notConnected("Session closed").forDevice(name_)));
                } else if constexpr (std::is_same_v<T, ConnectJob>) {
                    j.promise.set_value(failure(
                        error::notConnected("Session closed").forDevice(name_)));
                } else if constexpr (std::is_same_v<T, DisconnectJob>) {
                    j.promise.set_value();
                }
            },
            job);
    }
}

}  // namespace firetv::device
