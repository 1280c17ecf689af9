/*
 * adb_message.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "adb_message.hpp"

#include <cctype>
#include <format>

#include <spdlog/spdlog.h>

namespace firetv::device::adb {

namespace {

void putLE32(std::string& out, uint32_t value) {
    out.push_back(static_cast<char>(value & 0xFF));
    out.push_back(static_cast<char>((value >> 8) & 0xFF));
    out.push_back(static_cast<char>((value >> 16) & 0xFF));
    out.push_back(static_cast<char>((value >> 24) & 0xFF));
}

auto getLE32(std::string_view in, size_t offset) -> uint32_t {
    auto byte = [&](size_t i) {
        return static_cast<uint32_t>(static_cast<unsigned char>(in[offset + i]));
    };
    return byte(0) | (byte(1) << 8) | (byte(2) << 16) | (byte(3) << 24);
}

}  // namespace

auto checksum(std::string_view payload) -> uint32_t {
    uint32_t sum = 0;
    for (unsigned char c : payload) {
        sum += c;
    }
    return sum;
}

auto commandName(uint32_t command) -> std::string {
    std::string name;
    for (int i = 0; i < 4; ++i) {
        auto c = static_cast<char>((command >> (8 * i)) & 0xFF);
        if (!std::isupper(static_cast<unsigned char>(c))) {
            return std::format("0x{:08x}", command);
        }
        name.push_back(c);
    }
    return name;
}

auto encode(const Message& message) -> std::string {
    std::string out;
    out.reserve(HEADER_SIZE + message.payload.size());
    putLE32(out, message.command);
    putLE32(out, message.arg0);
    putLE32(out, message.arg1);
    putLE32(out, static_cast<uint32_t>(message.payload.size()));
    putLE32(out, checksum(message.payload));
    putLE32(out, message.command ^ 0xFFFFFFFF);
    out += message.payload;
    return out;
}

auto decodeHeader(std::string_view bytes, uint32_t maxPayload)
    -> Result<Header> {
    if (bytes.size() != HEADER_SIZE) {
        return failure(ErrorCode::ProtocolError,
                       std::format("Short ADB header ({} bytes)", bytes.size()));
    }

    Header header;
    header.command = getLE32(bytes, 0);
    header.arg0 = getLE32(bytes, 4);
    header.arg1 = getLE32(bytes, 8);
    header.length = getLE32(bytes, 12);
    header.checksum = getLE32(bytes, 16);
    header.magic = getLE32(bytes, 20);

    if (header.magic != (header.command ^ 0xFFFFFFFF)) {
        return failure(ErrorCode::ProtocolError,
                       std::format("Bad ADB magic for {}",
                                   commandName(header.command)));
    }
    if (header.length > maxPayload) {
        return failure(ErrorCode::ProtocolError,
                       std::format("ADB payload of {} bytes exceeds maximum {}",
                                   header.length, maxPayload));
    }
    return header;
}

auto MessageChannel::send(const Message& message) -> VoidResult {
    spdlog::trace("adb >> {} {} {} ({} bytes)", commandName(message.command),
                  message.arg0, message.arg1, message.payload.size());
    return transport_.write(encode(message));
}

auto MessageChannel::receive(std::chrono::milliseconds timeout)
    -> Result<Message> {
    auto raw = transport_.read(HEADER_SIZE, timeout);
    if (!raw) {
        return std::unexpected(raw.error());
    }

    auto header = decodeHeader(*raw, maxPayload_);
    if (!header) {
        return std::unexpected(header.error());
    }

    Message message{header->command, header->arg0, header->arg1, {}};
    if (header->length > 0) {
        auto payload = transport_.read(header->length, timeout);
        if (!payload) {
            return std::unexpected(payload.error());
        }
        message.payload = std::move(*payload);
    }

    // Newer adbd sends a zero checksum
    if (header->checksum != 0 && header->checksum != checksum(message.payload)) {
        return failure(ErrorCode::ProtocolError,
                       std::format("ADB checksum mismatch for {}",
                                   commandName(message.command)));
    }

    spdlog::trace("adb << {} {} {} ({} bytes)", commandName(message.command),
                  message.arg0, message.arg1, message.payload.size());
    return message;
}

}  // namespace firetv::device::adb
