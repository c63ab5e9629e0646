#include "network/media_codec.h"

#include "core/relay_constants.h"

#include <algorithm>
#include <cctype>

namespace Network {

using MediaRelay::ErrorCode;

const char* codecToString(Codec codec) {
    switch (codec) {
    case Codec::H264:
        return "h264";
    case Codec::VP8:
        return "vp8";
    case Codec::VP9:
        return "vp9";
    }
    return "vp8";
}

std::optional<Codec> codecFromString(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "h264") {
        return Codec::H264;
    }
    if (lower == "vp8") {
        return Codec::VP8;
    }
    if (lower == "vp9") {
        return Codec::VP9;
    }
    return std::nullopt;
}

uint8_t payloadTypeFor(Codec codec) {
    switch (codec) {
    case Codec::H264:
        return RelayConstants::PAYLOAD_TYPE_H264;
    case Codec::VP9:
        return RelayConstants::PAYLOAD_TYPE_VP9;
    case Codec::VP8:
        break;
    }
    return RelayConstants::PAYLOAD_TYPE_VP8;
}

std::optional<Codec> codecForPayloadType(uint8_t payloadType) {
    switch (payloadType) {
    case RelayConstants::PAYLOAD_TYPE_VP8:
        return Codec::VP8;
    case RelayConstants::PAYLOAD_TYPE_VP9:
        return Codec::VP9;
    case RelayConstants::PAYLOAD_TYPE_H264:
        return Codec::H264;
    default:
        return std::nullopt;
    }
}

CodecCapability videoCapabilityFor(Codec codec) {
    CodecCapability capability;
    capability.kind = MediaKind::Video;
    capability.clockRate = RelayConstants::VIDEO_CLOCK_RATE;
    capability.payloadType = payloadTypeFor(codec);
    switch (codec) {
    case Codec::H264:
        capability.mimeType = "video/H264";
        break;
    case Codec::VP9:
        capability.mimeType = "video/VP9";
        break;
    case Codec::VP8:
        capability.mimeType = "video/VP8";
        break;
    }
    return capability;
}

CodecCapability opusCapability() {
    CodecCapability capability;
    capability.kind = MediaKind::Audio;
    capability.mimeType = "audio/opus";
    capability.clockRate = RelayConstants::OPUS_CLOCK_RATE;
    capability.channels = 2;
    capability.payloadType = RelayConstants::PAYLOAD_TYPE_OPUS;
    return capability;
}

bool isVideoPayloadType(uint8_t payloadType) {
    return payloadType == RelayConstants::PAYLOAD_TYPE_VP8 ||
           payloadType == RelayConstants::PAYLOAD_TYPE_VP9 ||
           payloadType == RelayConstants::PAYLOAD_TYPE_H264;
}

ErrorCode publishOptionsFromJson(const nlohmann::json& input, PublishOptions& options,
                                 std::string& error) {
    if (input.is_null() || !input.is_object()) {
        error = "Publish options must be an object";
        return ErrorCode::NEGOTIATION_INVALID_OPTIONS;
    }

    PublishOptions parsed;
    try {
        parsed.video = input.value("video", false);
        parsed.audio = input.value("audio", false);
        parsed.screen = input.value("screen", false);
        if (input.contains("codec") && input["codec"].is_string()) {
            parsed.codec = codecFromString(input["codec"].get<std::string>()).value_or(Codec::VP8);
        }
    } catch (const nlohmann::json::exception& ex) {
        error = std::string("Invalid publish options: ") + ex.what();
        return ErrorCode::NEGOTIATION_INVALID_OPTIONS;
    }

    options = parsed;
    return ErrorCode::OK;
}

nlohmann::json publishOptionsToJson(const PublishOptions& options) {
    nlohmann::json j;
    j["video"] = options.video;
    j["audio"] = options.audio;
    j["screen"] = options.screen;
    j["codec"] = codecToString(options.codec);
    return j;
}

}  // namespace Network
