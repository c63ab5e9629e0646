#include "network/rtcp_feedback.h"

#include <algorithm>

namespace Network {

std::vector<uint16_t> NackPair::sequences() const {
    std::vector<uint16_t> result;
    result.push_back(packetId);
    for (uint16_t bit = 0; bit < 16; ++bit) {
        if ((lostPackets >> bit) & 0x1) {
            result.push_back(static_cast<uint16_t>(packetId + bit + 1));
        }
    }
    return result;
}

std::vector<uint16_t> RetransmissionRequest::sequences() const {
    std::vector<uint16_t> result;
    for (const auto& pair : nacks) {
        for (uint16_t sequence : pair.sequences()) {
            if (std::find(result.begin(), result.end(), sequence) == result.end()) {
                result.push_back(sequence);
            }
        }
    }
    return result;
}

const char* feedbackReportName(const FeedbackReport& report) {
    return std::visit(Overloaded{
                          [](const KeyframeRequest&) { return "keyframe_request"; },
                          [](const BandwidthEstimate&) { return "bandwidth_estimate"; },
                          [](const RetransmissionRequest&) { return "retransmission_request"; },
                          [](const StatisticsReport& stats) {
                              return stats.kind == StatisticsReport::Kind::Sender
                                         ? "sender_report"
                                         : "receiver_report";
                          },
                      },
                      report);
}

double lossRateFromFraction(uint8_t fractionLost) {
    return static_cast<double>(fractionLost) / 256.0;
}

double maxLossRate(const StatisticsReport& report) {
    uint8_t worst = 0;
    for (const auto& block : report.reports) {
        worst = std::max(worst, block.fractionLost);
    }
    return lossRateFromFraction(worst);
}

RetransmissionRequest makeSingleRetransmission(uint32_t senderSsrc, uint32_t mediaSsrc,
                                               uint16_t sequence) {
    RetransmissionRequest request;
    request.senderSsrc = senderSsrc;
    request.mediaSsrc = mediaSsrc;
    request.nacks.push_back(NackPair{sequence, 0});
    return request;
}

nlohmann::json feedbackReportToJson(const FeedbackReport& report) {
    nlohmann::json j;
    j["type"] = feedbackReportName(report);
    std::visit(Overloaded{
                   [&j](const KeyframeRequest& pli) {
                       j["sender_ssrc"] = pli.senderSsrc;
                       j["media_ssrc"] = pli.mediaSsrc;
                   },
                   [&j](const BandwidthEstimate& remb) {
                       j["sender_ssrc"] = remb.senderSsrc;
                       j["bitrate"] = remb.bitrate;
                       j["ssrcs"] = remb.ssrcs;
                   },
                   [&j](const RetransmissionRequest& nack) {
                       j["sender_ssrc"] = nack.senderSsrc;
                       j["media_ssrc"] = nack.mediaSsrc;
                       j["sequences"] = nack.sequences();
                   },
                   [&j](const StatisticsReport& stats) {
                       j["ssrc"] = stats.ssrc;
                       j["reports"] = nlohmann::json::array();
                       for (const auto& block : stats.reports) {
                           j["reports"].push_back({{"ssrc", block.ssrc},
                                                   {"fraction_lost", block.fractionLost},
                                                   {"total_lost", block.totalLost},
                                                   {"jitter", block.jitter}});
                       }
                   },
               },
               report);
    return j;
}

}  // namespace Network
