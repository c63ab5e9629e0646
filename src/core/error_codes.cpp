#include "core/error_codes.h"

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace MediaRelay {

// Error code to string mapping
static const std::unordered_map<ErrorCode, const char*> kErrorCodeStrings = {
    {ErrorCode::OK, "OK"},

    // Negotiation
    {ErrorCode::NEGOTIATION_INVALID_OPTIONS, "NEGOTIATION_INVALID_OPTIONS"},
    {ErrorCode::NEGOTIATION_FAILED, "NEGOTIATION_FAILED"},
    {ErrorCode::NEGOTIATION_ALREADY_DONE, "NEGOTIATION_ALREADY_DONE"},

    // Transport
    {ErrorCode::TRANSPORT_CHANNEL_CLOSED, "TRANSPORT_CHANNEL_CLOSED"},
    {ErrorCode::TRANSPORT_INVALID_PACKET, "TRANSPORT_INVALID_PACKET"},
    {ErrorCode::TRANSPORT_TRACK_NOT_FOUND, "TRANSPORT_TRACK_NOT_FOUND"},
    {ErrorCode::TRANSPORT_END_OF_STREAM, "TRANSPORT_END_OF_STREAM"},
    {ErrorCode::TRANSPORT_IO_ERROR, "TRANSPORT_IO_ERROR"},
    {ErrorCode::TRANSPORT_CLOSED, "TRANSPORT_CLOSED"},

    // Pipeline
    {ErrorCode::PIPELINE_CACHE_MISS, "PIPELINE_CACHE_MISS"},
    {ErrorCode::PIPELINE_NOT_FOUND, "PIPELINE_NOT_FOUND"},
    {ErrorCode::PIPELINE_NO_PUBLISHER, "PIPELINE_NO_PUBLISHER"},
    {ErrorCode::PIPELINE_PUBLISHER_EXISTS, "PIPELINE_PUBLISHER_EXISTS"},
    {ErrorCode::PIPELINE_SUBSCRIBER_NOT_FOUND, "PIPELINE_SUBSCRIBER_NOT_FOUND"},
    {ErrorCode::PIPELINE_CLOSED, "PIPELINE_CLOSED"},
    {ErrorCode::PIPELINE_SUBSCRIBER_EXISTS, "PIPELINE_SUBSCRIBER_EXISTS"},

    // Validation
    {ErrorCode::VALIDATION_INVALID_CONFIG, "VALIDATION_INVALID_CONFIG"},
    {ErrorCode::VALIDATION_INVALID_PARAMS, "VALIDATION_INVALID_PARAMS"},
    {ErrorCode::VALIDATION_INVALID_COMMAND, "VALIDATION_INVALID_COMMAND"},

    // Internal
    {ErrorCode::INTERNAL_UNKNOWN, "INTERNAL_UNKNOWN"},
};

// String to error code mapping (reverse lookup)
static const std::unordered_map<std::string, ErrorCode> kStringToErrorCode = [] {
    std::unordered_map<std::string, ErrorCode> reverse;
    for (const auto& entry : kErrorCodeStrings) {
        reverse.emplace(entry.second, entry.first);
    }
    return reverse;
}();

const char* errorCodeToString(ErrorCode code) {
    auto it = kErrorCodeStrings.find(code);
    if (it != kErrorCodeStrings.end()) {
        return it->second;
    }
    return "UNKNOWN_ERROR";
}

const char* getErrorCategory(ErrorCode code) {
    if (code == ErrorCode::OK) {
        return "ok";
    }
    if (isNegotiationError(code)) {
        return "negotiation";
    }
    if (isTransportError(code)) {
        return "transport";
    }
    if (isPipelineError(code)) {
        return "pipeline";
    }
    if (isValidationError(code)) {
        return "validation";
    }
    return "internal";
}

std::string errorCodeToHex(ErrorCode code) {
    std::ostringstream oss;
    oss << "0x" << std::hex << std::setfill('0') << std::setw(4) << static_cast<uint32_t>(code);
    return oss.str();
}

ErrorCode stringToErrorCode(const std::string& str) {
    auto it = kStringToErrorCode.find(str);
    if (it != kStringToErrorCode.end()) {
        return it->second;
    }
    return ErrorCode::INTERNAL_UNKNOWN;
}

}  // namespace MediaRelay
