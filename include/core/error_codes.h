#ifndef ERROR_CODES_H
#define ERROR_CODES_H

#include <cstdint>
#include <string>

namespace MediaRelay {

/**
 * @brief Error codes for the media relay.
 *
 * Categories use upper 4 bits of the low 16 bits (0xF000 mask):
 * - 0x1xxx: Negotiation (setup-time, surfaced to the caller)
 * - 0x2xxx: Transport (per-connection I/O and channel state)
 * - 0x3xxx: Pipeline (routing and retransmit cache)
 * - 0x5xxx: Validation
 * - 0xFxxx: Internal (reserved)
 */
enum class ErrorCode : uint32_t {
    OK = 0,

    // Negotiation (0x1000)
    NEGOTIATION_INVALID_OPTIONS = 0x1001,
    NEGOTIATION_FAILED = 0x1002,
    NEGOTIATION_ALREADY_DONE = 0x1003,

    // Transport (0x2000)
    TRANSPORT_CHANNEL_CLOSED = 0x2001,
    TRANSPORT_INVALID_PACKET = 0x2002,
    TRANSPORT_TRACK_NOT_FOUND = 0x2003,
    TRANSPORT_END_OF_STREAM = 0x2004,
    TRANSPORT_IO_ERROR = 0x2005,
    TRANSPORT_CLOSED = 0x2006,

    // Pipeline (0x3000)
    PIPELINE_CACHE_MISS = 0x3001,
    PIPELINE_NOT_FOUND = 0x3002,
    PIPELINE_NO_PUBLISHER = 0x3003,
    PIPELINE_PUBLISHER_EXISTS = 0x3004,
    PIPELINE_SUBSCRIBER_NOT_FOUND = 0x3005,
    PIPELINE_CLOSED = 0x3006,
    PIPELINE_SUBSCRIBER_EXISTS = 0x3007,

    // Validation (0x5000)
    VALIDATION_INVALID_CONFIG = 0x5001,
    VALIDATION_INVALID_PARAMS = 0x5002,
    VALIDATION_INVALID_COMMAND = 0x5003,

    // Internal (0xF000) - Reserved for fallback
    /** @brief Unknown/unmapped error */
    INTERNAL_UNKNOWN = 0xF001,
};

/**
 * @brief Convert ErrorCode to string representation.
 * @param code The error code
 * @return String name (e.g., "TRANSPORT_TRACK_NOT_FOUND"), or "UNKNOWN_ERROR" for unknown codes
 */
const char* errorCodeToString(ErrorCode code);

/**
 * @brief Get the category name for an error code.
 * @param code The error code
 * @return Category name (e.g., "transport"), or "internal" for unknown codes
 */
const char* getErrorCategory(ErrorCode code);

/**
 * @brief Convert ErrorCode to hex string.
 * @param code The error code
 * @return Hex string (e.g., "0x2003")
 */
std::string errorCodeToHex(ErrorCode code);

/**
 * @brief Convert string to ErrorCode enum.
 * @param str Error code string (e.g., "PIPELINE_CACHE_MISS")
 * @return Corresponding ErrorCode, or INTERNAL_UNKNOWN if not found
 */
ErrorCode stringToErrorCode(const std::string& str);

// Category check helpers
constexpr bool isNegotiationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x1000;
}
constexpr bool isTransportError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x2000;
}
constexpr bool isPipelineError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x3000;
}
constexpr bool isValidationError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0x5000;
}
constexpr bool isInternalError(ErrorCode code) {
    return (static_cast<uint32_t>(code) & 0xF000) == 0xF000;
}

/**
 * @brief Check if the code marks graceful end of a stream rather than a failure.
 *
 * Loops exit quietly on these; they are never counted as I/O errors.
 */
constexpr bool isStreamTermination(ErrorCode code) {
    return code == ErrorCode::TRANSPORT_CHANNEL_CLOSED ||
           code == ErrorCode::TRANSPORT_END_OF_STREAM || code == ErrorCode::TRANSPORT_CLOSED;
}

/**
 * @brief Check if a per-packet error is transient and must not stop forwarding.
 */
constexpr bool isTransientPacketError(ErrorCode code) {
    return code == ErrorCode::TRANSPORT_TRACK_NOT_FOUND || code == ErrorCode::TRANSPORT_IO_ERROR;
}

}  // namespace MediaRelay

#endif  // ERROR_CODES_H
