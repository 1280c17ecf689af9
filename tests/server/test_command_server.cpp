/*
 * test_command_server.cpp - Tests for request validation and HTTP routes
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "config/config_loader.hpp"
#include "device/adb/adb_protocol.hpp"
#include "device/fake_adb_device.hpp"
#include "server/command_server.hpp"

using namespace firetv;
using namespace firetv::server;
using namespace firetv::device;
using json = nlohmann::json;
using ::testing::HasSubstr;

namespace {

constexpr const char* CONFIG = R"(
sessions:
  connect_timeout_ms: 200
  handshake_timeout_ms: 200
  auth_timeout_ms: 200
  command_timeout_ms: 2000
  heartbeat_interval_ms: 60000
  backoff_initial_ms: 50
  backoff_max_ms: 200
devices:
  livingroom: "10.0.0.5:5555"
  attic: "10.0.0.9:5555"
)";

}  // namespace

class CommandServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = std::make_shared<test::FakeNetwork>();
        tv_ = network_->add("10.0.0.5", 5555);
        network_->add("10.0.0.6", 5555);

        auto loaded = config::ConfigLoader::parse(CONFIG);
        ASSERT_TRUE(loaded) << loaded.error().message;
        store_ = std::make_unique<config::ConfigStore>(std::move(*loaded));

        ProtocolRegistry registry;
        registry.registerFamily(
            "adb", [network = network_](const ProtocolOptions& options) {
                return std::make_unique<adb::AdbProtocol>(
                    std::make_unique<test::FakeTransport>(network), options);
            });
        sessions_ = std::make_unique<SessionManager>(*store_,
                                                     std::move(registry));
        sessions_->start();
        server_ = std::make_unique<CommandServer>(*store_, *sessions_,
                                                  config::ServerSettings{});
        server_->app().validate();
    }

    void TearDown() override {
        server_.reset();
        sessions_.reset();
        store_.reset();
    }

    auto request(crow::HTTPMethod method, const std::string& url,
                 const std::string& body = "") -> crow::response {
        crow::request req;
        req.method = method;
        req.url = url;
        req.raw_url = url;
        req.body = body;
        crow::response res;
        server_->app().handle_full(req, res);
        return res;
    }

    auto get(const std::string& url) -> crow::response {
        return request(crow::HTTPMethod::Get, url);
    }

    auto post(const std::string& url, const std::string& body = "")
        -> crow::response {
        return request(crow::HTTPMethod::Post, url, body);
    }

    static auto body(const crow::response& res) -> json {
        return json::parse(res.body);
    }

    std::shared_ptr<test::FakeNetwork> network_;
    std::shared_ptr<test::FakeAdbDevice> tv_;
    std::unique_ptr<config::ConfigStore> store_;
    std::unique_ptr<SessionManager> sessions_;
    std::unique_ptr<CommandServer> server_;
};

// ============================================================================
// Dispatch Tests
// ============================================================================

TEST_F(CommandServerTest, InvalidDeviceId) {
    auto result = server_->dispatch("living room!", "home");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ValidationError);
}

TEST_F(CommandServerTest, UnknownDevice) {
    auto result = server_->dispatch("garage", "home");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::NotFound);
    EXPECT_EQ(result.error().device, "garage");
}

TEST_F(CommandServerTest, UnknownCommandTouchesNoDevice) {
    auto result = server_->dispatch("livingroom", "self_destruct");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(result.error().device, "livingroom");
    EXPECT_EQ(tv_->connectCount(), 0);
}

TEST_F(CommandServerTest, MissingAppParameterTouchesNoDevice) {
    auto result = server_->dispatch("livingroom", "launch_app");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ValidationError);
    EXPECT_EQ(tv_->connectCount(), 0);
}

TEST_F(CommandServerTest, DispatchConnectsLazily) {
    auto result = server_->dispatch("livingroom", "home");
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_EQ(result->command, "home");
    EXPECT_EQ(tv_->connectCount(), 1);
    EXPECT_EQ(tv_->keyPresses(), std::vector<int>{3});
}

TEST_F(CommandServerTest, DeviceState) {
    auto state = server_->deviceState("livingroom");
    ASSERT_TRUE(state) << state.error().message;
    EXPECT_EQ((*state)["state"], adb::STATE_STANDBY);
}

TEST_F(CommandServerTest, UnreachableDeviceReportsDisconnected) {
    auto state = server_->deviceState("attic");
    ASSERT_TRUE(state);
    EXPECT_EQ((*state)["state"], adb::STATE_DISCONNECTED);
    EXPECT_EQ((*state)["device"], "attic");
}

TEST_F(CommandServerTest, ConnectAndDisconnect) {
    auto connected = server_->connectDevice("livingroom");
    ASSERT_TRUE(connected) << connected.error().message;
    EXPECT_EQ((*connected)["state"], "connected");

    auto disconnected = server_->disconnectDevice("livingroom");
    ASSERT_TRUE(disconnected);
    EXPECT_EQ(sessions_->session("livingroom")->state(),
              SessionState::Disconnected);

    auto unreachable = server_->connectDevice("attic");
    ASSERT_FALSE(unreachable);
    EXPECT_EQ(unreachable.error().device, "attic");
}

TEST_F(CommandServerTest, AddDeviceValidation) {
    auto missing = server_->addDevice({{"device_id", "bedroom"}});
    ASSERT_FALSE(missing);
    EXPECT_EQ(missing.error().code, ErrorCode::ValidationError);

    auto badId = server_->addDevice(
        {{"device_id", "bed room"}, {"host", "10.0.0.6:5555"}});
    ASSERT_FALSE(badId);
    EXPECT_EQ(badId.error().code, ErrorCode::ValidationError);

    auto badHost =
        server_->addDevice({{"device_id", "bedroom"}, {"host", "10.0.0.6"}});
    ASSERT_FALSE(badHost);
    EXPECT_THAT(badHost.error().message, HasSubstr("<address>:<port>"));

    auto badFamily = server_->addDevice({{"device_id", "bedroom"},
                                         {"host", "10.0.0.6:5555"},
                                         {"family", "roku"}});
    ASSERT_FALSE(badFamily);
    EXPECT_EQ(badFamily.error().code, ErrorCode::ValidationError);
    EXPECT_FALSE(store_->findDevice("bedroom"));
}

TEST_F(CommandServerTest, AddDevice) {
    auto added = server_->addDevice(
        {{"device_id", "bedroom"}, {"host", "10.0.0.6:5555"}});
    ASSERT_TRUE(added) << added.error().message;
    EXPECT_EQ((*added)["device"]["host"], "10.0.0.6:5555");
    EXPECT_TRUE(store_->findDevice("bedroom"));
    EXPECT_TRUE(server_->dispatch("bedroom", "back"));

    auto duplicate = server_->addDevice(
        {{"device_id", "bedroom"}, {"host", "10.0.0.7:5555"}});
    ASSERT_FALSE(duplicate);
    EXPECT_EQ(duplicate.error().code, ErrorCode::ValidationError);
}

TEST_F(CommandServerTest, ListDevices) {
    auto devices = server_->listDevices();
    ASSERT_TRUE(devices.contains("livingroom"));
    ASSERT_TRUE(devices.contains("attic"));
    EXPECT_EQ(devices["livingroom"]["host"], "10.0.0.5:5555");
    EXPECT_EQ(devices["livingroom"]["state"], "unconfigured");
}

TEST_F(CommandServerTest, ReloadWithoutFile) {
    auto result = server_->reloadConfiguration();
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::ValidationError);
}

TEST_F(CommandServerTest, RejectsAfterShutdownBegins) {
    server_->beginShutdown();
    EXPECT_FALSE(server_->isAccepting());
    auto result = server_->dispatch("livingroom", "home");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, ErrorCode::Unavailable);
    EXPECT_EQ(tv_->connectCount(), 0);
    EXPECT_TRUE(server_->app().get_middleware<middleware::ShutdownGate>()
                    .isClosed());
}

// ============================================================================
// Route Tests
// ============================================================================

TEST_F(CommandServerTest, ListRoute) {
    auto res = get("/devices/list");
    EXPECT_EQ(res.code, 200);
    auto json = body(res);
    EXPECT_EQ(json["success"], true);
    EXPECT_TRUE(json["KNOWN_DEVICES"].contains("livingroom"));

    auto v1 = body(get("/api/v1/devices"));
    EXPECT_TRUE(v1["devices"].contains("attic"));
}

TEST_F(CommandServerTest, ActionRoute) {
    auto res = get("/devices/action/livingroom/volume_up");
    EXPECT_EQ(res.code, 200);
    EXPECT_EQ(body(res)["command"], "volume_up");
    EXPECT_EQ(tv_->keyPresses(), std::vector<int>{24});
}

TEST_F(CommandServerTest, ActionRouteErrors) {
    auto unknown = get("/devices/action/garage/home");
    EXPECT_EQ(unknown.code, 404);
    EXPECT_EQ(body(unknown)["error"]["code"], "NotFound");

    auto invalid = get("/devices/action/livingroom/explode");
    EXPECT_EQ(invalid.code, 400);
    EXPECT_EQ(body(invalid)["success"], false);

    auto offline = get("/devices/action/attic/home");
    EXPECT_EQ(offline.code, 503);
    EXPECT_EQ(body(offline)["error"]["code"], "NotConnectedError");
}

TEST_F(CommandServerTest, StateRoute) {
    auto res = get("/devices/state/livingroom");
    EXPECT_EQ(res.code, 200);
    EXPECT_EQ(body(res)["state"], adb::STATE_STANDBY);
}

TEST_F(CommandServerTest, AppRoutes) {
    auto started = get("/devices/livingroom/apps/com.netflix.ninja/start");
    EXPECT_EQ(started.code, 200);
    EXPECT_EQ(tv_->focused_package, "com.netflix.ninja");

    auto state = get("/devices/livingroom/apps/state/com.netflix.ninja");
    EXPECT_EQ(state.code, 200);
    EXPECT_EQ(body(state)["status"], adb::STATE_ON);

    auto running = get("/devices/livingroom/apps/running");
    EXPECT_EQ(running.code, 200);
    EXPECT_TRUE(body(running)["running_apps"].is_array());

    auto stopped = get("/devices/livingroom/apps/com.netflix.ninja/stop");
    EXPECT_EQ(stopped.code, 200);
    EXPECT_EQ(tv_->focused_package, adb::LAUNCHER_PACKAGE);

    auto missing = get("/devices/livingroom/apps/com.example.missing/start");
    EXPECT_EQ(missing.code, 400);
}

TEST_F(CommandServerTest, CommandRoute) {
    auto res = post("/api/v1/devices/livingroom/commands",
                    R"({"command": "key_event", "params": {"code": 85}})");
    EXPECT_EQ(res.code, 200);
    EXPECT_EQ(tv_->keyPresses(), std::vector<int>{85});

    auto noCommand =
        post("/api/v1/devices/livingroom/commands", R"({"params": {}})");
    EXPECT_EQ(noCommand.code, 400);

    auto notJson = post("/api/v1/devices/livingroom/commands", "{oops");
    EXPECT_EQ(notJson.code, 400);
    EXPECT_THAT(body(notJson)["error"]["message"].get<std::string>(),
                HasSubstr("not valid JSON"));
}

TEST_F(CommandServerTest, AddRoute) {
    auto res = post("/devices/add",
                    R"({"device_id": "bedroom", "host": "10.0.0.6:5555"})");
    EXPECT_EQ(res.code, 200);
    EXPECT_TRUE(store_->findDevice("bedroom"));

    auto array = post("/devices/add", "[]");
    EXPECT_EQ(array.code, 400);
}

TEST_F(CommandServerTest, ConnectRoutes) {
    EXPECT_EQ(get("/devices/connect/livingroom").code, 200);
    EXPECT_EQ(get("/devices/disconnect/livingroom").code, 200);
    EXPECT_EQ(get("/devices/connect/garage").code, 404);
}

TEST_F(CommandServerTest, ReloadRoute) {
    auto res = post("/config/reload");
    EXPECT_EQ(res.code, 400);
    EXPECT_EQ(body(res)["success"], false);
}

TEST_F(CommandServerTest, UnknownRoute) {
    EXPECT_EQ(get("/nothing/here").code, 404);
}
