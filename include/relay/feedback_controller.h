// Keyframe, bandwidth-estimate and retransmission policies.
#pragma once

#include "core/error_codes.h"
#include "network/rtcp_feedback.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace relay {

// Operations a subscriber's feedback loop needs from the pipeline that owns it.
class FeedbackTarget {
   public:
    virtual ~FeedbackTarget() = default;

    // Writes the cached packet to the subscriber. PIPELINE_CACHE_MISS when it is gone.
    virtual MediaRelay::ErrorCode writeCachedOrForwardToPublisher(
        const std::string& subscriberId, uint32_t ssrc, uint16_t sequence) = 0;
    virtual MediaRelay::ErrorCode forwardRetransmissionToPublisher(
        const Network::RetransmissionRequest& request) = 0;
    virtual MediaRelay::ErrorCode requestPublisherKeyframe() = 0;
    virtual MediaRelay::ErrorCode reportLoss(double lossRate) = 0;
};

// Maps a session id to its pipeline. Returns nullptr when the session is gone.
using FeedbackResolver = std::function<std::shared_ptr<FeedbackTarget>(const std::string&)>;

/**
 * @brief Bandwidth proposal in bytes per second.
 *
 * loss == 0 with no observed rate proposes highBound. Loss below the growth threshold
 * proposes twice the observed rate, otherwise rate * (1 - loss). The result is clamped to
 * [lowBound, highBound].
 *
 * @return nullopt when lossRate is outside [0, 1]
 */
std::optional<uint64_t> proposeBandwidth(double lossRate, uint64_t byteRate, uint64_t lowBound,
                                         uint64_t highBound);

// Estimate addressed to mediaSsrc with bitrate in bits per second.
std::optional<Network::BandwidthEstimate> buildBandwidthEstimate(double lossRate,
                                                                 uint64_t byteRate,
                                                                 uint32_t mediaSsrc,
                                                                 uint64_t lowBound,
                                                                 uint64_t highBound);

Network::KeyframeRequest buildKeyframeRequest(uint32_t mediaSsrc);

struct RetransmissionOutcome {
    size_t servedFromCache = 0;
    size_t escalated = 0;
    size_t failed = 0;
};

// Serves every requested sequence from the pipeline cache; each miss becomes exactly one
// single-sequence request toward the publisher.
RetransmissionOutcome routeRetransmissions(const Network::RetransmissionRequest& request,
                                           const std::string& subscriberId,
                                           FeedbackTarget& target);

void handleSubscriberReport(const Network::FeedbackReport& report,
                            const std::string& subscriberId, FeedbackTarget& target);

}  // namespace relay
