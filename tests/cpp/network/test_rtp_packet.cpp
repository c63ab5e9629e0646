/**
 * @file test_rtp_packet.cpp
 * @brief Wire-size accounting for relayed RTP packets
 */

#include "network/rtp_packet.h"

#include <gtest/gtest.h>

using namespace Network;

TEST(RtpPacketTest, MarshalSizeOfBareHeaderAndPayload) {
    RtpPacket packet;
    packet.payload.assign(100, 0xAB);
    EXPECT_EQ(packet.marshalSize(), 112u);
}

TEST(RtpPacketTest, MarshalSizeCountsCsrcExtensionAndPadding) {
    RtpPacket packet;
    packet.header.csrc = {1, 2};
    packet.header.extension = true;
    packet.header.extensionPayload.assign(8, 0);
    packet.payload.assign(20, 0);
    packet.paddingSize = 3;
    // 12 fixed + 8 CSRC + 4 extension header + 8 extension + 20 payload + 3 padding
    EXPECT_EQ(packet.marshalSize(), 55u);
}

TEST(RtpPacketTest, ExtensionBytesIgnoredWithoutExtensionBit) {
    RtpPacket packet;
    packet.header.extensionPayload.assign(8, 0);
    EXPECT_EQ(packet.marshalSize(), 12u);
}
