/*
 * session_manager.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: Session manager implementation

**************************************************/

#include "session_manager.hpp"

#include <algorithm>
#include <format>
#include <optional>

#include <spdlog/spdlog.h>

#include "config/config_loader.hpp"

namespace firetv::device {

namespace {

// Extra time granted on top of the protocol timeouts when waiting for a
// connect result
constexpr std::chrono::milliseconds CONNECT_WAIT_MARGIN{1000};

}  // namespace

SessionManager::SessionManager(config::ConfigStore& store,
                               ProtocolRegistry registry)
    : store_(store), registry_(std::move(registry)) {
    auto settings = store_.sessionSettings();
    sessionOptions_ = SessionOptions::fromSettings(settings);
    protocolOptions_ = ProtocolOptions::fromSettings(settings);
    connectOnStartup_ = settings.connect_on_startup;
}

SessionManager::~SessionManager() { shutdown(); }

void SessionManager::start() {
    for (const auto& device : store_.devices()) {
        auto session = createSession(device);
        if (!session) {
            spdlog::error("Cannot create session for '{}': {}", device.name,
                          session.error().message);
            continue;
        }
        if (connectOnStartup_) {
            (void)(*session)->connect();
        }
    }
    spdlog::info("Session manager started with {} device(s){}",
                 sessionCount(),
                 connectOnStartup_ ? ", connecting" : "");
}

auto SessionManager::createSession(const config::DeviceDefinition& device)
    -> Result<std::shared_ptr<DeviceSession>> {
    std::shared_ptr<DeviceSession> stale;
    std::shared_ptr<DeviceSession> session;
    std::optional<Error> failed;
    {
        std::unique_lock lock(mutex_);
        if (auto it = sessions_.find(device.name); it != sessions_.end()) {
            if (it->second->definition() == device) {
                return it->second;
            }
            // Left over from an earlier definition under the same name
            stale = std::move(it->second);
            sessions_.erase(it);
        }

        auto protocol = registry_.create(device.family, protocolOptions_);
        if (protocol) {
            session = std::make_shared<DeviceSession>(
                device, std::move(*protocol), sessionOptions_);
            session->start();
            sessions_.emplace(device.name, session);
        } else {
            failed = protocol.error();
        }
    }

    if (stale) {
        spdlog::warn("Replacing stale session for '{}' (was {})", device.name,
                     stale->definition().address());
        stale->close();
    }
    if (failed) {
        return failure(std::move(*failed));
    }
    spdlog::debug("Session created for '{}' ({} at {})", device.name,
                  device.family, device.address());
    return session;
}

auto SessionManager::lookup(const std::string& name) const
    -> Result<std::shared_ptr<DeviceSession>> {
    if (shutdown_.load()) {
        return failure(error::unavailable("Server is shutting down"));
    }
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(name);
    if (it == sessions_.end()) {
        return failure(error::notFound(name));
    }
    return it->second;
}

auto SessionManager::session(const std::string& name) const
    -> std::shared_ptr<DeviceSession> {
    std::shared_lock lock(mutex_);
    auto it = sessions_.find(name);
    return it == sessions_.end() ? nullptr : it->second;
}

auto SessionManager::sessionCount() const -> size_t {
    std::shared_lock lock(mutex_);
    return sessions_.size();
}

auto SessionManager::list() const -> std::vector<SessionInfo> {
    std::vector<std::shared_ptr<DeviceSession>> sessions;
    {
        std::shared_lock lock(mutex_);
        sessions.reserve(sessions_.size());
        for (const auto& [name, session] : sessions_) {
            sessions.push_back(session);
        }
    }

    std::vector<SessionInfo> infos;
    infos.reserve(sessions.size());
    for (const auto& session : sessions) {
        infos.push_back(session->info());
    }
    std::ranges::sort(infos, {}, &SessionInfo::name);
    return infos;
}

auto SessionManager::connect(const std::string& name)
    -> Result<std::shared_ptr<DeviceSession>> {
    auto session = lookup(name);
    if (!session) {
        return session;
    }

    auto wait = protocolOptions_.connect_timeout +
                2 * protocolOptions_.handshake_timeout + CONNECT_WAIT_MARGIN;
    if (protocolOptions_.enroll_public_key) {
        wait += protocolOptions_.auth_timeout;
    }

    auto future = (*session)->connect();
    if (future.wait_for(wait) != std::future_status::ready) {
        return failure(error::timeout(std::format(
                                          "Connection still in progress "
                                          "after {}ms",
                                          wait.count()))
                           .forDevice(name));
    }
    if (auto result = future.get(); !result) {
        return std::unexpected(result.error());
    }
    return session;
}

auto SessionManager::send(const std::string& name, Command command)
    -> Result<Ack> {
    auto session = lookup(name);
    if (!session) {
        return std::unexpected(session.error());
    }
    return (*session)->execute(std::move(command));
}

auto SessionManager::disconnect(const std::string& name) -> VoidResult {
    auto session = lookup(name);
    if (!session) {
        return std::unexpected(session.error());
    }
    auto future = (*session)->disconnect();
    if (future.wait_for(sessionOptions_.request_timeout) !=
        std::future_status::ready) {
        return failure(
            error::timeout("Disconnect still queued behind pending commands")
                .forDevice(name));
    }
    return success();
}

auto SessionManager::addDevice(config::DeviceDefinition device, bool pinned)
    -> VoidResult {
    // Store write and session creation must not interleave with a reload
    std::lock_guard reloading(reloadMutex_);
    if (shutdown_.load()) {
        return failure(error::unavailable("Server is shutting down"));
    }
    if (!registry_.contains(device.family)) {
        return failure(ErrorCode::ValidationError,
                       "Unknown device family: " + device.family);
    }
    if (auto added = store_.addDevice(device, pinned); !added) {
        return added;
    }

    auto session = createSession(device);
    if (!session) {
        return std::unexpected(session.error());
    }
    if (connectOnStartup_) {
        (void)(*session)->connect();
    }
    return success();
}

auto SessionManager::reload() -> Result<config::ConfigDiff> {
    auto path = store_.sourcePath();
    if (path.empty()) {
        return failure(ErrorCode::ValidationError,
                       "Server was started without a configuration file");
    }
    return reload(path);
}

auto SessionManager::reload(const std::filesystem::path& path)
    -> Result<config::ConfigDiff> {
    std::lock_guard lock(reloadMutex_);
    if (shutdown_.load()) {
        return failure(error::unavailable("Server is shutting down"));
    }

    auto loaded = config::ConfigLoader::load(path, registry_.families());
    if (!loaded) {
        spdlog::error("Reload failed, keeping current configuration: {}",
                      loaded.error().message);
        return std::unexpected(loaded.error());
    }

    auto changes = store_.replaceDevices(*loaded);
    applyDiff(changes);
    spdlog::info("Configuration reloaded from {}: {} added, {} removed, {} "
                 "changed",
                 path.string(), changes.added.size(), changes.removed.size(),
                 changes.changed.size());
    return changes;
}

void SessionManager::applyDiff(const config::ConfigDiff& diff) {
    std::vector<std::shared_ptr<DeviceSession>> closing;
    std::vector<config::DeviceDefinition> creating = diff.added;

    {
        std::unique_lock lock(mutex_);
        for (const auto& name : diff.removed) {
            if (auto node = sessions_.extract(name)) {
                closing.push_back(std::move(node.mapped()));
            }
        }
        for (const auto& device : diff.changed) {
            auto it = sessions_.find(device.name);
            if (it == sessions_.end()) {
                creating.push_back(device);
                continue;
            }
            if (it->second->family() != device.family) {
                // A different family needs a different protocol instance
                closing.push_back(std::move(it->second));
                sessions_.erase(it);
                creating.push_back(device);
                continue;
            }
            it->second->reconfigure(device);
        }
    }

    for (const auto& session : closing) {
        spdlog::info("Closing session for '{}'", session->name());
        session->close();
    }

    for (const auto& device : creating) {
        auto session = createSession(device);
        if (!session) {
            spdlog::error("Cannot create session for '{}': {}", device.name,
                          session.error().message);
            continue;
        }
        if (connectOnStartup_) {
            (void)(*session)->connect();
        }
    }
}

void SessionManager::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }

    std::vector<std::shared_ptr<DeviceSession>> closing;
    {
        std::unique_lock lock(mutex_);
        for (auto& [name, session] : sessions_) {
            closing.push_back(std::move(session));
        }
        sessions_.clear();
    }

    for (const auto& session : closing) {
        session->close();
    }
    spdlog::info("Session manager stopped, {} session(s) closed",
                 closing.size());
}

}  // namespace firetv::device
