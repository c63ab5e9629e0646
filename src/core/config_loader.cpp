#include "core/config_loader.h"

#include "logging/logger.h"

#include <fstream>
#include <iostream>

bool validateRelayConfig(const RelayConfig& config, std::string& error) {
    if (config.rembLowBandwidth == 0) {
        error = "rembLowBandwidth must be greater than 0";
        return false;
    }
    if (config.rembLowBandwidth > config.rembHighBandwidth) {
        error = "rembLowBandwidth must not exceed rembHighBandwidth";
        return false;
    }
    if (config.rateWindowMs <= 0 || config.keyframeIntervalMs <= 0 || config.statIntervalMs <= 0) {
        error = "rateWindowMs, keyframeIntervalMs and statIntervalMs must be positive";
        return false;
    }
    if (config.packetQueueCapacity == 0) {
        error = "packetQueueCapacity must be greater than 0";
        return false;
    }
    if (config.retransmitCacheSize == 0) {
        error = "retransmitCacheSize must be greater than 0";
        return false;
    }
    if (config.receiveMtu < 1200) {
        error = "receiveMtu must be at least 1200";
        return false;
    }
    if (config.maxSubscriberErrors <= 0) {
        error = "maxSubscriberErrors must be positive";
        return false;
    }
    return true;
}

bool relayConfigFromJson(const nlohmann::json& input, RelayConfig& config, std::string& error) {
    if (!input.is_object()) {
        error = "relay section must be an object";
        return false;
    }

    RelayConfig parsed;
    try {
        if (input.contains("iceServers")) {
            parsed.iceServers = input.at("iceServers").get<std::vector<std::string>>();
        }
        if (input.contains("rembLowBandwidth")) {
            parsed.rembLowBandwidth = input.at("rembLowBandwidth").get<uint64_t>();
        }
        if (input.contains("rembHighBandwidth")) {
            parsed.rembHighBandwidth = input.at("rembHighBandwidth").get<uint64_t>();
        }
        if (input.contains("rateWindowMs")) {
            parsed.rateWindowMs = input.at("rateWindowMs").get<int>();
        }
        if (input.contains("keyframeIntervalMs")) {
            parsed.keyframeIntervalMs = input.at("keyframeIntervalMs").get<int>();
        }
        if (input.contains("statIntervalMs")) {
            parsed.statIntervalMs = input.at("statIntervalMs").get<int>();
        }
        if (input.contains("packetQueueCapacity")) {
            parsed.packetQueueCapacity = input.at("packetQueueCapacity").get<size_t>();
        }
        if (input.contains("retransmitCacheSize")) {
            parsed.retransmitCacheSize = input.at("retransmitCacheSize").get<size_t>();
        }
        if (input.contains("receiveMtu")) {
            parsed.receiveMtu = input.at("receiveMtu").get<size_t>();
        }
        if (input.contains("maxSubscriberErrors")) {
            parsed.maxSubscriberErrors = input.at("maxSubscriberErrors").get<int>();
        }
    } catch (const std::exception& ex) {
        error = std::string("Invalid relay parameters: ") + ex.what();
        return false;
    }

    if (!validateRelayConfig(parsed, error)) {
        return false;
    }
    config = parsed;
    return true;
}

nlohmann::json relayConfigToJson(const RelayConfig& config) {
    nlohmann::json j;
    j["iceServers"] = config.iceServers;
    j["rembLowBandwidth"] = config.rembLowBandwidth;
    j["rembHighBandwidth"] = config.rembHighBandwidth;
    j["rateWindowMs"] = config.rateWindowMs;
    j["keyframeIntervalMs"] = config.keyframeIntervalMs;
    j["statIntervalMs"] = config.statIntervalMs;
    j["packetQueueCapacity"] = config.packetQueueCapacity;
    j["retransmitCacheSize"] = config.retransmitCacheSize;
    j["receiveMtu"] = config.receiveMtu;
    j["maxSubscriberErrors"] = config.maxSubscriberErrors;
    return j;
}

bool loadRelayConfig(const std::filesystem::path& configPath, RelayConfig& outConfig,
                     bool verbose) {
    outConfig = RelayConfig{};

    std::ifstream file(configPath);
    if (!file.is_open()) {
        if (verbose) {
            std::cout << "Config: " << configPath << " not found, using defaults" << '\n';
        }
        return false;
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::exception& e) {
        if (verbose) {
            LOG_ERROR("Config: Failed to parse {}: {}", configPath.string(), e.what());
        }
        return false;
    }

    if (!j.is_object()) {
        if (verbose) {
            LOG_WARN("Config: {} is not a JSON object, using defaults", configPath.string());
        }
        return false;
    }

    // A file without a relay section is valid and keeps every default
    if (!j.contains("relay")) {
        return true;
    }

    std::string error;
    if (!relayConfigFromJson(j["relay"], outConfig, error)) {
        if (verbose) {
            LOG_WARN("Config: {}, using defaults", error);
        }
        outConfig = RelayConfig{};
        return false;
    }
    return true;
}
