#ifndef MEDIA_CODEC_H
#define MEDIA_CODEC_H

#include "core/error_codes.h"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace Network {

enum class Codec { H264, VP8, VP9 };

enum class MediaKind { Audio, Video };

// Negotiation options supplied with a publish request.
struct PublishOptions {
    bool video = false;
    bool audio = false;
    bool screen = false;
    Codec codec = Codec::VP8;
};

struct CodecCapability {
    std::string mimeType;
    uint32_t clockRate = 0;
    uint16_t channels = 0;
    uint8_t payloadType = 0;
    MediaKind kind = MediaKind::Video;
};

const char* codecToString(Codec codec);

// Case-insensitive; returns nullopt for unknown names.
std::optional<Codec> codecFromString(const std::string& name);

uint8_t payloadTypeFor(Codec codec);
std::optional<Codec> codecForPayloadType(uint8_t payloadType);
CodecCapability videoCapabilityFor(Codec codec);
CodecCapability opusCapability();

bool isVideoPayloadType(uint8_t payloadType);

// Absent or non-object input yields NEGOTIATION_INVALID_OPTIONS. Unknown or absent codec
// falls back to VP8.
MediaRelay::ErrorCode publishOptionsFromJson(const nlohmann::json& input, PublishOptions& options,
                                             std::string& error);
nlohmann::json publishOptionsToJson(const PublishOptions& options);

}  // namespace Network

#endif  // MEDIA_CODEC_H
