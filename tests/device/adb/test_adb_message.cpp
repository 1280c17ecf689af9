/*
 * test_adb_message.cpp - Tests for ADB message framing
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include <gtest/gtest.h>

#include "device/adb/adb_message.hpp"
#include "device/fake_adb_device.hpp"

using namespace firetv;
using namespace firetv::device;
using namespace firetv::device::adb;
using namespace std::chrono_literals;

// ============================================================================
// Encoding Tests
// ============================================================================

TEST(AdbMessageTest, CommandNames) {
    EXPECT_EQ(commandName(A_CNXN), "CNXN");
    EXPECT_EQ(commandName(A_AUTH), "AUTH");
    EXPECT_EQ(commandName(A_OPEN), "OPEN");
    EXPECT_EQ(commandName(A_OKAY), "OKAY");
    EXPECT_EQ(commandName(A_CLSE), "CLSE");
    EXPECT_EQ(commandName(A_WRTE), "WRTE");
    EXPECT_EQ(commandName(0x12345678), "0x12345678");
}

TEST(AdbMessageTest, Checksum) {
    EXPECT_EQ(checksum(""), 0u);
    EXPECT_EQ(checksum("AB"), 0x41u + 0x42u);
    EXPECT_EQ(checksum(std::string(2, '\xff')), 510u);
}

TEST(AdbMessageTest, EncodeLayout) {
    auto bytes = encode({A_CNXN, ADB_VERSION, MAX_PAYLOAD, "host::"});
    ASSERT_EQ(bytes.size(), HEADER_SIZE + 6);
    // Little endian command word spells the name
    EXPECT_EQ(bytes.substr(0, 4), "CNXN");
    EXPECT_EQ(static_cast<unsigned char>(bytes[12]), 6);

    auto header = decodeHeader(std::string_view(bytes).substr(0, HEADER_SIZE),
                               MAX_PAYLOAD);
    ASSERT_TRUE(header) << header.error().message;
    EXPECT_EQ(header->command, A_CNXN);
    EXPECT_EQ(header->arg0, ADB_VERSION);
    EXPECT_EQ(header->arg1, MAX_PAYLOAD);
    EXPECT_EQ(header->length, 6u);
    EXPECT_EQ(header->checksum, checksum("host::"));
    EXPECT_EQ(header->magic, A_CNXN ^ 0xFFFFFFFF);
}

TEST(AdbMessageTest, DecodeRejectsBadMagic) {
    auto bytes = encode({A_OKAY, 1, 2, {}});
    bytes[20] ^= 0x01;
    auto header = decodeHeader(bytes, MAX_PAYLOAD);
    ASSERT_FALSE(header);
    EXPECT_EQ(header.error().code, ErrorCode::ProtocolError);
}

TEST(AdbMessageTest, DecodeRejectsOversizedPayload) {
    auto bytes = encode({A_WRTE, 1, 2, std::string(100, 'x')});
    auto header = decodeHeader(std::string_view(bytes).substr(0, HEADER_SIZE),
                               64);
    ASSERT_FALSE(header);
    EXPECT_EQ(header.error().code, ErrorCode::ProtocolError);
}

TEST(AdbMessageTest, DecodeRejectsShortHeader) {
    EXPECT_FALSE(decodeHeader("CNXN", MAX_PAYLOAD));
}

// ============================================================================
// Channel Tests
// ============================================================================

class MessageChannelTest : public ::testing::Test {
protected:
    void SetUp() override {
        network_ = std::make_shared<test::FakeNetwork>();
        device_ = network_->add("10.0.0.5", 5555);
        transport_ = std::make_unique<test::FakeTransport>(network_);
        ASSERT_TRUE(transport_->open("10.0.0.5", 5555, 100ms));
    }

    std::shared_ptr<test::FakeNetwork> network_;
    std::shared_ptr<test::FakeAdbDevice> device_;
    std::unique_ptr<test::FakeTransport> transport_;
};

TEST_F(MessageChannelTest, ExchangesMessages) {
    MessageChannel channel(*transport_);
    ASSERT_TRUE(channel.send({A_CNXN, ADB_VERSION, MAX_PAYLOAD,
                              std::string("host::test") + '\0'}));
    auto reply = channel.receive(200ms);
    ASSERT_TRUE(reply) << reply.error().message;
    EXPECT_EQ(reply->command, A_CNXN);
    EXPECT_NE(reply->payload.find("ro.product.model=AFTMM"), std::string::npos);
    EXPECT_EQ(device_->clientBanner(), std::string("host::test") + '\0');
}

TEST_F(MessageChannelTest, ReceiveTimesOut) {
    MessageChannel channel(*transport_);
    auto reply = channel.receive(30ms);
    ASSERT_FALSE(reply);
    EXPECT_EQ(reply.error().code, ErrorCode::TimeoutError);
}

TEST_F(MessageChannelTest, ReceiveAfterDropFails) {
    MessageChannel channel(*transport_);
    device_->dropLink();
    auto reply = channel.receive(200ms);
    ASSERT_FALSE(reply);
    EXPECT_EQ(reply.error().code, ErrorCode::NotConnected);
}

TEST_F(MessageChannelTest, MaxPayloadIsAdjustable) {
    MessageChannel channel(*transport_);
    EXPECT_EQ(channel.maxPayload(), MAX_PAYLOAD);
    channel.setMaxPayload(MAX_ACCEPTED_PAYLOAD);
    EXPECT_EQ(channel.maxPayload(), MAX_ACCEPTED_PAYLOAD);
}
