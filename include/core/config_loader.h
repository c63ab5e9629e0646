#ifndef CONFIG_LOADER_H
#define CONFIG_LOADER_H

#include "core/relay_constants.h"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

constexpr const char* DEFAULT_CONFIG_FILE = "config.json";

struct RelayConfig {
    // STUN/TURN URLs handed to the protocol stack when creating peer connections
    std::vector<std::string> iceServers;

    // Bandwidth estimate clamp, bytes per second
    uint64_t rembLowBandwidth = RelayConstants::DEFAULT_REMB_LOW_BANDWIDTH;
    uint64_t rembHighBandwidth = RelayConstants::DEFAULT_REMB_HIGH_BANDWIDTH;

    int rateWindowMs = RelayConstants::DEFAULT_RATE_WINDOW_MS;
    int keyframeIntervalMs = RelayConstants::DEFAULT_KEYFRAME_INTERVAL_MS;
    int statIntervalMs = RelayConstants::DEFAULT_STAT_INTERVAL_MS;

    size_t packetQueueCapacity = RelayConstants::DEFAULT_PACKET_QUEUE_CAPACITY;
    size_t retransmitCacheSize = RelayConstants::DEFAULT_RETRANSMIT_CACHE_SIZE;
    size_t receiveMtu = RelayConstants::DEFAULT_RECEIVE_MTU;

    int maxSubscriberErrors = RelayConstants::DEFAULT_MAX_SUBSCRIBER_ERRORS;
};

// Reads the "relay" section of an already parsed document. Unknown keys are ignored.
bool relayConfigFromJson(const nlohmann::json& input, RelayConfig& config, std::string& error);

nlohmann::json relayConfigToJson(const RelayConfig& config);

// Checks bounds and intervals; returns false with a message on the first violation.
bool validateRelayConfig(const RelayConfig& config, std::string& error);

// Loads configPath into outConfig. On a missing or unreadable file outConfig holds the
// defaults and false is returned.
bool loadRelayConfig(const std::filesystem::path& configPath, RelayConfig& outConfig,
                     bool verbose = true);

#endif  // CONFIG_LOADER_H
