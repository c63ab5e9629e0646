#ifndef RELAY_CONSTANTS_H
#define RELAY_CONSTANTS_H

#include <cstddef>  // for size_t
#include <cstdint>

// Common constants shared across relay components

namespace RelayConstants {

// Bandwidth estimate bounds, in bytes per second
constexpr uint64_t DEFAULT_REMB_LOW_BANDWIDTH = 30 * 1000;
constexpr uint64_t DEFAULT_REMB_HIGH_BANDWIDTH = 100 * 1000;

// Loss rates below this are treated as headroom for growth
constexpr double REMB_GROWTH_LOSS_THRESHOLD = 0.1;

// Periodic loop intervals
constexpr int DEFAULT_RATE_WINDOW_MS = 3000;        // Byte-rate observation window
constexpr int DEFAULT_KEYFRAME_INTERVAL_MS = 1000;  // Periodic keyframe request
constexpr int DEFAULT_STAT_INTERVAL_MS = 3000;      // Registry statistics sweep

// Channel and cache sizing
constexpr size_t DEFAULT_PACKET_QUEUE_CAPACITY = 1000;
constexpr size_t KEYFRAME_QUEUE_CAPACITY = 1;
constexpr size_t DEFAULT_RETRANSMIT_CACHE_SIZE = 1024;
constexpr size_t DEFAULT_RECEIVE_MTU = 8192;

// Consecutive write failures before a subscriber is reported unhealthy
constexpr int DEFAULT_MAX_SUBSCRIBER_ERRORS = 100;

// Default payload types of the protocol stack
constexpr uint8_t PAYLOAD_TYPE_VP8 = 96;
constexpr uint8_t PAYLOAD_TYPE_VP9 = 98;
constexpr uint8_t PAYLOAD_TYPE_H264 = 102;
constexpr uint8_t PAYLOAD_TYPE_OPUS = 111;

// RTP clock rates
constexpr uint32_t VIDEO_CLOCK_RATE = 90000;
constexpr uint32_t OPUS_CLOCK_RATE = 48000;

}  // namespace RelayConstants

#endif  // RELAY_CONSTANTS_H
