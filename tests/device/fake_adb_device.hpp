/*
 * fake_adb_device.hpp - In-memory ADB device for protocol and session tests
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef FIRETV_TESTS_DEVICE_FAKE_ADB_DEVICE_HPP
#define FIRETV_TESTS_DEVICE_FAKE_ADB_DEVICE_HPP

#include <atomic>
#include <condition_variable>
#include <cstdio>
#include <filesystem>
#include <format>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <set>
#include <string>
#include <vector>

#include <unistd.h>

#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include "device/adb/adb_message.hpp"
#include "device/transport.hpp"

namespace firetv::device::test {

/**
 * @brief RSA key pair written to a temporary PEM file
 */
class TestKey {
public:
    TestKey() : key_(EVP_RSA_gen(2048), EVP_PKEY_free) {
        static std::atomic<int> counter{0};
        path_ = std::filesystem::temp_directory_path() /
                std::format("firetv_test_key_{}_{}.pem",
                            static_cast<long>(::getpid()), counter++);
        FILE* file = std::fopen(path_.c_str(), "w");
        if (file != nullptr) {
            PEM_write_PrivateKey(file, key_.get(), nullptr, nullptr, 0,
                                 nullptr, nullptr);
            std::fclose(file);
        }
    }

    ~TestKey() {
        std::error_code ec;
        std::filesystem::remove(path_, ec);
    }

    TestKey(const TestKey&) = delete;
    TestKey& operator=(const TestKey&) = delete;

    [[nodiscard]] auto path() const -> std::string { return path_.string(); }
    [[nodiscard]] auto pkey() const -> std::shared_ptr<EVP_PKEY> {
        return key_;
    }

    /**
     * @brief Check an AUTH signature the way adbd does
     */
    [[nodiscard]] auto verifies(const std::string& token,
                                const std::string& signature) const -> bool {
        std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(
            EVP_PKEY_CTX_new(key_.get(), nullptr), EVP_PKEY_CTX_free);
        if (!ctx || EVP_PKEY_verify_init(ctx.get()) <= 0 ||
            EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_PADDING) <= 0 ||
            EVP_PKEY_CTX_set_signature_md(ctx.get(), EVP_sha1()) <= 0) {
            return false;
        }
        return EVP_PKEY_verify(
                   ctx.get(),
                   reinterpret_cast<const unsigned char*>(signature.data()),
                   signature.size(),
                   reinterpret_cast<const unsigned char*>(token.data()),
                   token.size()) == 1;
    }

private:
    std::shared_ptr<EVP_PKEY> key_;
    std::filesystem::path path_;
};

/**
 * @brief What a device does with an offered public key
 */
enum class Enrollment { Accept, Reject, Ignore };

/**
 * @brief Simulated Fire TV speaking ADB
 *
 * Replies are produced synchronously when the client writes a complete
 * message. Shell commands are answered from a small model of the TV
 * (screen, wakefulness, focused app, installed apps).
 */
class FakeAdbDevice {
public:
    // Scripted behaviour, set before the device is used
    bool reachable{true};
    bool require_auth{false};
    Enrollment enrollment{Enrollment::Reject};
    bool answer_handshake{true};

    // TV model
    bool screen_on{true};
    bool awake{true};
    bool wake_lock{false};
    std::string focused_package{"com.amazon.tv.launcher"};
    std::set<std::string> installed{"com.netflix.ninja",
                                    "com.amazon.avod"};

    void trust(const TestKey& key) {
        std::lock_guard lock(mutex_);
        trusted_.push_back(&key);
    }

    /**
     * @brief Block shell replies until release()
     */
    void holdShell() {
        std::lock_guard lock(mutex_);
        held_ = true;
    }

    void release() {
        {
            std::lock_guard lock(mutex_);
            held_ = false;
        }
        cv_.notify_all();
    }

    /**
     * @brief Simulate the link dropping; pending and later reads fail
     */
    void dropLink() {
        {
            std::lock_guard lock(mutex_);
            dropped_ = true;
        }
        cv_.notify_all();
    }

    void setShellHandler(
        std::function<std::optional<std::string>(const std::string&)> handler) {
        std::lock_guard lock(mutex_);
        shellHandler_ = std::move(handler);
    }

    [[nodiscard]] auto shellCommands() const -> std::vector<std::string> {
        std::lock_guard lock(mutex_);
        return shellCommands_;
    }

    [[nodiscard]] auto keyPresses() const -> std::vector<int> {
        std::lock_guard lock(mutex_);
        return keyPresses_;
    }

    [[nodiscard]] auto connectCount() const -> int {
        std::lock_guard lock(mutex_);
        return connects_;
    }

    [[nodiscard]] auto enrolledKey() const -> std::string {
        std::lock_guard lock(mutex_);
        return enrolledKey_;
    }

    [[nodiscard]] auto clientBanner() const -> std::string {
        std::lock_guard lock(mutex_);
        return clientBanner_;
    }

    // Transport side

    auto onOpen() -> VoidResult {
        std::lock_guard lock(mutex_);
        if (!reachable) {
            return failure(ErrorCode::NotConnected, "Connection refused");
        }
        ++connects_;
        inbound_.clear();
        outbound_.clear();
        token_.clear();
        dropped_ = false;
        aborted_ = false;
        open_ = true;
        return success();
    }

    auto onWrite(std::string_view data) -> VoidResult {
        std::unique_lock lock(mutex_);
        if (!open_ || dropped_) {
            return failure(ErrorCode::NotConnected, "Broken pipe");
        }
        inbound_.append(data);
        while (inbound_.size() >= adb::HEADER_SIZE) {
            auto header = adb::decodeHeader(
                std::string_view(inbound_).substr(0, adb::HEADER_SIZE),
                adb::MAX_ACCEPTED_PAYLOAD);
            if (!header) {
                return std::unexpected(header.error());
            }
            if (inbound_.size() < adb::HEADER_SIZE + header->length) {
                break;
            }
            adb::Message message{header->command, header->arg0, header->arg1,
                                 inbound_.substr(adb::HEADER_SIZE,
                                                 header->length)};
            inbound_.erase(0, adb::HEADER_SIZE + header->length);
            handle(message, lock);
        }
        cv_.notify_all();
        return success();
    }

    auto onRead(size_t size, std::chrono::milliseconds timeout)
        -> Result<std::string> {
        std::unique_lock lock(mutex_);
        bool ready = cv_.wait_for(lock, timeout, [&] {
            return dropped_ || aborted_ || !open_ ||
                   outbound_.size() >= size;
        });
        if (dropped_ || !open_) {
            return failure(ErrorCode::NotConnected,
                           "Connection closed by peer");
        }
        if (aborted_) {
            return failure(ErrorCode::NotConnected, "Transport aborted");
        }
        if (!ready) {
            return failure(ErrorCode::TimeoutError, "Read timed out");
        }
        auto chunk = outbound_.substr(0, size);
        outbound_.erase(0, size);
        return chunk;
    }

    void onClose() {
        {
            std::lock_guard lock(mutex_);
            open_ = false;
            aborted_ = false;
        }
        cv_.notify_all();
    }

    void onAbort() {
        {
            std::lock_guard lock(mutex_);
            aborted_ = true;
        }
        cv_.notify_all();
    }

    [[nodiscard]] auto isOpen() const -> bool {
        std::lock_guard lock(mutex_);
        return open_ && !dropped_;
    }

private:
    void reply(const adb::Message& message) {
        outbound_ += adb::encode(message);
    }

    void sendToken() {
        token_.resize(20);
        for (auto& c : token_) {
            c = static_cast<char>(rng_() & 0xff);
        }
        reply({adb::A_AUTH, adb::AUTH_TOKEN, 0, token_});
    }

    void accept() {
        reply({adb::A_CNXN, adb::ADB_VERSION, adb::MAX_PAYLOAD,
               std::string("device::ro.product.name=mantis;"
                           "ro.product.model=AFTMM;") +
                   '\0'});
    }

    void handle(const adb::Message& message,
                std::unique_lock<std::mutex>& lock) {
        switch (message.command) {
            case adb::A_CNXN:
                clientBanner_ = message.payload;
                if (!answer_handshake) {
                    return;
                }
                if (require_auth) {
                    sendToken();
                } else {
                    accept();
                }
                return;
            case adb::A_AUTH:
                handleAuth(message);
                return;
            case adb::A_OPEN:
                handleOpen(message, lock);
                return;
            default:
                // OKAY and CLSE acknowledgements from the client
                return;
        }
    }

    void handleAuth(const adb::Message& message) {
        if (message.arg0 == adb::AUTH_SIGNATURE) {
            for (const auto* key : trusted_) {
                if (key->verifies(token_, message.payload)) {
                    accept();
                    return;
                }
            }
            sendToken();
            return;
        }
        if (message.arg0 == adb::AUTH_RSAPUBLICKEY) {
            enrolledKey_ = message.payload;
            switch (enrollment) {
                case Enrollment::Accept:
                    accept();
                    break;
                case Enrollment::Reject:
                    sendToken();
                    break;
                case Enrollment::Ignore:
                    break;
            }
        }
    }

    void handleOpen(const adb::Message& message,
                    std::unique_lock<std::mutex>& lock) {
        std::string destination = message.payload;
        if (!destination.empty() && destination.back() == '\0') {
            destination.pop_back();
        }
        const uint32_t local = message.arg0;
        if (!destination.starts_with("shell:")) {
            reply({adb::A_CLSE, 0, local, {}});
            return;
        }
        auto command = destination.substr(6);
        shellCommands_.push_back(command);

        cv_.wait(lock, [&] { return !held_ || dropped_ || aborted_; });
        if (dropped_ || aborted_) {
            return;
        }

        auto output = shellHandler_ ? shellHandler_(command)
                                    : std::optional<std::string>{};
        if (!output) {
            output = respond(command);
        }
        if (!output) {
            // Refused stream
            reply({adb::A_CLSE, 0, local, {}});
            return;
        }

        const uint32_t remote = nextRemote_++;
        reply({adb::A_OKAY, remote, local, {}});
        if (!output->empty()) {
            reply({adb::A_WRTE, remote, local, *output});
        }
        reply({adb::A_CLSE, remote, local, {}});
    }

    auto respond(const std::string& command) -> std::optional<std::string> {
        if (command == "echo ok") {
            return "ok\r\n";
        }
        if (command == R"(dumpsys power | grep "Display Power")") {
            return std::format("Display Power: state={}\r\n",
                               screen_on ? "ON" : "OFF");
        }
        if (command == R"(dumpsys power | grep "mWakefulness")") {
            return std::format("  mWakefulness={}\r\n",
                               awake ? "Awake" : "Asleep");
        }
        if (command == R"(dumpsys power | grep "Locks")") {
            return std::format("Wake Locks: size={}\r\n", wake_lock ? 1 : 0);
        }
        if (command == "dumpsys window windows | grep mCurrentFocus") {
            if (focused_package.empty()) {
                return "  mCurrentFocus=null\r\n";
            }
            return std::format(
                "  mCurrentFocus=Window{{2b2c3a1 u0 {}/{}.MainActivity}}\r\n",
                focused_package, focused_package);
        }
        if (command.starts_with("input keyevent ")) {
            int code = std::stoi(command.substr(15));
            keyPresses_.push_back(code);
            if (code == 26) {
                screen_on = !screen_on;
            }
            return std::string{};
        }
        if (command.starts_with("monkey -p ")) {
            auto rest = command.substr(10);
            auto package = rest.substr(0, rest.find(' '));
            bool launcher = command.find("category.LAUNCHER") !=
                            std::string::npos;
            bool home = command.find("category.HOME") != std::string::npos;
            if (home) {
                focused_package = package;
                return std::string("Events injected: 1\r\n");
            }
            if (launcher && installed.contains(package)) {
                focused_package = package;
                return std::string("Events injected: 1\r\n0\r\n");
            }
            return std::string(
                "** No activities found to run, monkey aborted.\r\n252\r\n");
        }
        if (command == "ps") {
            std::string output =
                "USER      PID   PPID  VSIZE  RSS   WCHAN    PC  NAME\r\n"
                "root      1     0     8904   788   ffffffff 0 S /init\r\n";
            int uid = 10;
            for (const auto& package : installed) {
                output += std::format(
                    "u0_a{}    {}  250   1030980 85560 ffffffff 0 S {}\r\n",
                    uid, 2000 + uid, package);
                ++uid;
            }
            return output;
        }
        return std::string{};
    }

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::string inbound_;
    std::string outbound_;
    std::string token_;
    std::string clientBanner_;
    std::string enrolledKey_;
    std::vector<const TestKey*> trusted_;
    std::vector<std::string> shellCommands_;
    std::vector<int> keyPresses_;
    std::function<std::optional<std::string>(const std::string&)>
        shellHandler_;
    std::mt19937 rng_{42};
    uint32_t nextRemote_{100};
    int connects_{0};
    bool open_{false};
    bool dropped_{false};
    bool aborted_{false};
    bool held_{false};
};

/**
 * @brief Devices addressed by "host:port"
 */
class FakeNetwork {
public:
    auto add(const std::string& host, int port)
        -> std::shared_ptr<FakeAdbDevice> {
        std::lock_guard lock(mutex_);
        auto device = std::make_shared<FakeAdbDevice>();
        devices_[std::format("{}:{}", host, port)] = device;
        return device;
    }

    auto find(const std::string& host, int port) const
        -> std::shared_ptr<FakeAdbDevice> {
        std::lock_guard lock(mutex_);
        auto it = devices_.find(std::format("{}:{}", host, port));
        return it == devices_.end() ? nullptr : it->second;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<FakeAdbDevice>> devices_;
};

/**
 * @brief Transport that connects to a FakeAdbDevice of a FakeNetwork
 */
class FakeTransport : public Transport {
public:
    explicit FakeTransport(std::shared_ptr<FakeNetwork> network)
        : network_(std::move(network)) {}

    auto open(const std::string& host, int port,
              std::chrono::milliseconds /*timeout*/) -> VoidResult override {
        close();
        auto device = network_->find(host, port);
        if (!device) {
            return failure(ErrorCode::NotConnected,
                           std::format("No route to {}:{}", host, port));
        }
        if (auto opened = device->onOpen(); !opened) {
            return opened;
        }
        std::lock_guard lock(mutex_);
        device_ = std::move(device);
        return success();
    }

    auto write(std::string_view data) -> VoidResult override {
        auto device = current();
        if (!device) {
            return failure(ErrorCode::NotConnected, "Transport is closed");
        }
        return device->onWrite(data);
    }

    auto read(size_t size, std::chrono::milliseconds timeout)
        -> Result<std::string> override {
        auto device = current();
        if (!device) {
            return failure(ErrorCode::NotConnected, "Transport is closed");
        }
        return device->onRead(size, timeout);
    }

    void close() override {
        std::shared_ptr<FakeAdbDevice> device;
        {
            std::lock_guard lock(mutex_);
            device = std::move(device_);
        }
        if (device) {
            device->onClose();
        }
    }

    void abort() noexcept override {
        if (auto device = current()) {
            device->onAbort();
        }
    }

    [[nodiscard]] auto isOpen() const -> bool override {
        auto device = current();
        return device && device->isOpen();
    }

private:
    auto current() const -> std::shared_ptr<FakeAdbDevice> {
        std::lock_guard lock(mutex_);
        return device_;
    }

    std::shared_ptr<FakeNetwork> network_;
    mutable std::mutex mutex_;
    std::shared_ptr<FakeAdbDevice> device_;
};

}  // namespace firetv::device::test

#endif  // FIRETV_TESTS_DEVICE_FAKE_ADB_DEVICE_HPP
