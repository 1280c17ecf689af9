/*
 * adb_message.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/*************************************************

Date: 2024-12

Description: ADB wire messages: header codec and a message channel over a
transport

**************************************************/

#ifndef FIRETV_DEVICE_ADB_ADB_MESSAGE_HPP
#define FIRETV_DEVICE_ADB_ADB_MESSAGE_HPP

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>

#include "common/result.hpp"
#include "device/transport.hpp"

namespace firetv::device::adb {

inline constexpr uint32_t A_CNXN = 0x4e584e43;
inline constexpr uint32_t A_AUTH = 0x48545541;
inline constexpr uint32_t A_OPEN = 0x4e45504f;
inline constexpr uint32_t A_OKAY = 0x59414b4f;
inline constexpr uint32_t A_CLSE = 0x45534c43;
inline constexpr uint32_t A_WRTE = 0x45545257;

inline constexpr uint32_t ADB_VERSION = 0x01000000;
inline constexpr uint32_t MAX_PAYLOAD = 4096;
// Devices may announce a larger maxdata than requested
inline constexpr uint32_t MAX_ACCEPTED_PAYLOAD = 1024 * 1024;
inline constexpr size_t HEADER_SIZE = 24;

// AUTH arg0
inline constexpr uint32_t AUTH_TOKEN = 1;
inline constexpr uint32_t AUTH_SIGNATURE = 2;
inline constexpr uint32_t AUTH_RSAPUBLICKEY = 3;

struct Message {
    uint32_t command{0};
    uint32_t arg0{0};
    uint32_t arg1{0};
    std::string payload;

    bool operator==(const Message&) const = default;
};

struct Header {
    uint32_t command{0};
    uint32_t arg0{0};
    uint32_t arg1{0};
    uint32_t length{0};
    uint32_t checksum{0};
    uint32_t magic{0};
};

/**
 * @brief Sum of payload bytes
 */
[[nodiscard]] auto checksum(std::string_view payload) -> uint32_t;

/**
 * @brief Four letter name of a command word ("CNXN", ...)
 */
[[nodiscard]] auto commandName(uint32_t command) -> std::string;

/**
 * @brief Serialize header and payload
 */
[[nodiscard]] auto encode(const Message& message) -> std::string;

/**
 * @brief Decode and check a 24 byte header
 * @return ProtocolError on a bad magic or an oversized payload
 */
[[nodiscard]] auto decodeHeader(std::string_view bytes, uint32_t maxPayload)
    -> Result<Header>;

/**
 * @brief Sends and receives whole messages over a transport
 */
class MessageChannel {
public:
    explicit MessageChannel(Transport& transport) : transport_(transport) {}

    auto send(const Message& message) -> VoidResult;

    /**
     * @brief Read one message
     * @return TimeoutError if no complete message arrives in time,
     * ProtocolError for malformed data
     */
    auto receive(std::chrono::milliseconds timeout) -> Result<Message>;

    void setMaxPayload(uint32_t maxPayload) { maxPayload_ = maxPayload; }

    [[nodiscard]] auto maxPayload() const -> uint32_t { return maxPayload_; }

private:
    Transport& transport_;
    uint32_t maxPayload_{MAX_PAYLOAD};
};

}  // namespace firetv::device::adb

#endif  // FIRETV_DEVICE_ADB_ADB_MESSAGE_HPP
