/*
 * app.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: firetv-server entry point

**************************************************/

#include <pthread.h>
#include <csignal>

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "common/exception.hpp"
#include "config/config_loader.hpp"
#include "config/config_store.hpp"
#include "config/watcher.hpp"
#include "device/protocol.hpp"
#include "device/session_manager.hpp"
#include "logging/log_setup.hpp"
#include "server/command_line.hpp"
#include "server/command_server.hpp"

namespace fs = std::filesystem;

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_CONFIG_ERROR = 1;
constexpr int EXIT_USAGE = 2;

constexpr const char* DEFAULT_DEVICE_NAME = "default";

/**
 * @brief Check the --default device against the configured ones
 * @return A diagnostic, or nothing if it can be registered
 */
auto checkDefaultDevice(const firetv::config::Configuration& configuration,
                        const firetv::config::DeviceDefinition& device)
    -> std::optional<std::string> {
    if (configuration.contains(DEFAULT_DEVICE_NAME)) {
        return "Device name 'default' in the configuration is not allowed "
               "together with --default";
    }
    for (const auto& configured : configuration.devices()) {
        if (configured.host == device.host && configured.port == device.port) {
            return "Host " + device.address() +
                   " given with --default is already configured as '" +
                   configured.name + "'";
        }
    }
    return std::nullopt;
}

/**
 * @brief Block the control signals so the main thread can sigwait on them
 *
 * Must run before any thread is started so every thread inherits the mask.
 */
auto blockControlSignals() -> sigset_t {
    sigset_t signals;
    sigemptyset(&signals);
    sigaddset(&signals, SIGINT);
    sigaddset(&signals, SIGTERM);
    sigaddset(&signals, SIGHUP);
    pthread_sigmask(SIG_BLOCK, &signals, nullptr);
    return signals;
}

}  // namespace

int main(int argc, char* argv[]) {
    using namespace firetv;

    // Step 1: Parse command line arguments
    std::vector<std::string> args(argv, argv + argc);
    const std::string program = args.empty() ? "firetv-server" : args[0];
    server::CommandLineOptions options;
    try {
        options = server::parseCommandLine(args);
    } catch (const CommandLineException& e) {
        std::cerr << program << ": " << e.what() << "\n\n"
                  << server::usage(program);
        return EXIT_USAGE;
    }
    if (options.help) {
        std::cout << server::usage(program);
        return EXIT_OK;
    }

    auto signals = blockControlSignals();

    // Step 2: Load configuration; without a file the server starts empty
    auto registry = device::ProtocolRegistry::withDefaults();
    config::Configuration configuration;
    fs::path configPath;
    if (options.config_path) {
        configPath = *options.config_path;
        auto loaded =
            config::ConfigLoader::load(configPath, registry.families());
        if (!loaded) {
            std::cerr << program << ": " << loaded.error().message << "\n";
            return EXIT_CONFIG_ERROR;
        }
        configuration = std::move(*loaded);
    }

    // Step 3: Logging, then command line overrides
    if (options.verbose) {
        configuration.logging.level = spdlog::level::debug;
    }
    logging::initialize(configuration.logging);
    if (options.verbose) {
        spdlog::debug("Verbose logging enabled");
    }
    if (options.port) {
        spdlog::debug("CLI override: server port = {}", *options.port);
        configuration.server.port = *options.port;
    }
    if (!configPath.empty()) {
        spdlog::info("Loaded configuration from {} ({} device(s))",
                     configPath.string(), configuration.size());
    } else {
        spdlog::warn("No configuration file given, starting without devices");
    }

    std::optional<config::DeviceDefinition> defaultDevice;
    if (options.default_device) {
        config::DeviceDefinition device;
        device.name = DEFAULT_DEVICE_NAME;
        device.host = options.default_device->host;
        device.port = options.default_device->port;
        if (auto conflict = checkDefaultDevice(configuration, device)) {
            std::cerr << program << ": " << *conflict << "\n";
            return EXIT_CONFIG_ERROR;
        }
        defaultDevice = std::move(device);
    }

    // Step 4: Sessions and the command server
    config::ConfigStore store(configuration, configPath);
    device::SessionManager sessions(store, std::move(registry));
    if (defaultDevice) {
        if (auto added = sessions.addDevice(*defaultDevice, true); !added) {
            spdlog::critical("Cannot register default device: {}",
                             added.error().message);
            return EXIT_CONFIG_ERROR;
        }
        spdlog::info("Default device at {}", defaultDevice->address());
    }
    sessions.start();

    server::CommandServer commandServer(store, sessions, configuration.server);
    try {
        commandServer.runAsync();
    } catch (const std::exception& e) {
        spdlog::critical("Cannot start command server: {}", e.what());
        sessions.shutdown();
        return EXIT_CONFIG_ERROR;
    }

    // Step 5: Optional config file watcher
    std::unique_ptr<config::ConfigWatcher> watcher;
    if (configuration.sessions.watch && !configPath.empty()) {
        watcher = std::make_unique<config::ConfigWatcher>(
            config::ConfigWatcher::WatcherOptions{
                .poll_interval = configuration.sessions.watch_interval});
        bool watching = watcher->watchFile(
            configPath, [&sessions](const fs::path& path) {
                spdlog::info("Configuration file {} changed", path.string());
                if (auto changes = sessions.reload(path); changes) {
                    spdlog::debug("Applied diff: {}",
                                  changes->toJson().dump());
                }
            });
        if (!watching) {
            spdlog::warn("Cannot watch {}", configPath.string());
        }
    }

    // Step 6: Wait for a control signal; SIGHUP reloads
    for (;;) {
        int received = 0;
        if (sigwait(&signals, &received) != 0) {
            spdlog::error("sigwait failed, shutting down");
            break;
        }
        if (received == SIGHUP) {
            spdlog::info("SIGHUP received, reloading configuration");
            if (auto changes = sessions.reload(); !changes) {
                spdlog::warn("Reload rejected: {}", changes.error().message);
            }
            continue;
        }
        spdlog::info("Signal {} received, shutting down", received);
        break;
    }

    // Step 7: Stop accepting, cancel sessions, then stop the HTTP loop
    commandServer.beginShutdown();
    if (watcher) {
        watcher->stop();
    }
    sessions.shutdown();
    commandServer.stop();
    logging::shutdown();
    return EXIT_OK;
}
