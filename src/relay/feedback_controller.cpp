#include "relay/feedback_controller.h"

#include "core/relay_constants.h"
#include "logging/logger.h"

#include <algorithm>

namespace relay {

using MediaRelay::ErrorCode;

std::optional<uint64_t> proposeBandwidth(double lossRate, uint64_t byteRate, uint64_t lowBound,
                                         uint64_t highBound) {
    if (!(lossRate >= 0.0 && lossRate <= 1.0)) {
        return std::nullopt;
    }

    double proposal;
    if (lossRate == 0.0 && byteRate == 0) {
        proposal = static_cast<double>(highBound);
    } else if (lossRate < RelayConstants::REMB_GROWTH_LOSS_THRESHOLD) {
        proposal = static_cast<double>(byteRate) * 2.0;
    } else {
        proposal = static_cast<double>(byteRate) * (1.0 - lossRate);
    }

    proposal = std::clamp(proposal, static_cast<double>(lowBound), static_cast<double>(highBound));
    return static_cast<uint64_t>(proposal);
}

std::optional<Network::BandwidthEstimate> buildBandwidthEstimate(double lossRate,
                                                                 uint64_t byteRate,
                                                                 uint32_t mediaSsrc,
                                                                 uint64_t lowBound,
                                                                 uint64_t highBound) {
    auto proposal = proposeBandwidth(lossRate, byteRate, lowBound, highBound);
    if (!proposal) {
        return std::nullopt;
    }
    Network::BandwidthEstimate estimate;
    estimate.bitrate = *proposal * 8;
    estimate.ssrcs.push_back(mediaSsrc);
    return estimate;
}

Network::KeyframeRequest buildKeyframeRequest(uint32_t mediaSsrc) {
    Network::KeyframeRequest request;
    request.mediaSsrc = mediaSsrc;
    return request;
}

RetransmissionOutcome routeRetransmissions(const Network::RetransmissionRequest& request,
                                           const std::string& subscriberId,
                                           FeedbackTarget& target) {
    RetransmissionOutcome outcome;
    for (uint16_t sequence : request.sequences()) {
        ErrorCode rc =
            target.writeCachedOrForwardToPublisher(subscriberId, request.mediaSsrc, sequence);
        if (rc == ErrorCode::OK) {
            ++outcome.servedFromCache;
            continue;
        }
        if (rc != ErrorCode::PIPELINE_CACHE_MISS) {
            // Cache hit, subscriber write failed
            ++outcome.failed;
            continue;
        }

        auto single =
            Network::makeSingleRetransmission(request.senderSsrc, request.mediaSsrc, sequence);
        ErrorCode escalateRc = target.forwardRetransmissionToPublisher(single);
        if (escalateRc == ErrorCode::OK) {
            ++outcome.escalated;
        } else {
            ++outcome.failed;
            LOG_DEBUG("Retransmission of ssrc={} seq={} not escalated: {}", request.mediaSsrc,
                      sequence, MediaRelay::errorCodeToString(escalateRc));
        }
    }
    return outcome;
}

void handleSubscriberReport(const Network::FeedbackReport& report,
                            const std::string& subscriberId, FeedbackTarget& target) {
    std::visit(Network::Overloaded{
                   [&](const Network::KeyframeRequest&) {
                       ErrorCode rc = target.requestPublisherKeyframe();
                       LOG_IF(DEBUG, rc != ErrorCode::OK, "[{}] Keyframe request dropped: {}",
                              subscriberId, MediaRelay::errorCodeToString(rc));
                   },
                   [&](const Network::BandwidthEstimate& estimate) {
                       LOG_TRACE("[{}] Ignoring subscriber bandwidth estimate {} bps",
                                 subscriberId, estimate.bitrate);
                   },
                   [&](const Network::RetransmissionRequest& request) {
                       auto outcome = routeRetransmissions(request, subscriberId, target);
                       LOG_TRACE("[{}] NACK ssrc={}: {} from cache, {} escalated, {} failed",
                                 subscriberId, request.mediaSsrc, outcome.servedFromCache,
                                 outcome.escalated, outcome.failed);
                   },
                   [&](const Network::StatisticsReport& stats) {
                       if (stats.kind != Network::StatisticsReport::Kind::Receiver ||
                           stats.reports.empty()) {
                           return;
                       }
                       ErrorCode rc = target.reportLoss(Network::maxLossRate(stats));
                       LOG_IF(DEBUG, rc != ErrorCode::OK, "[{}] Loss sample dropped: {}",
                              subscriberId, MediaRelay::errorCodeToString(rc));
                   },
               },
               report);
}

}  // namespace relay
