#ifndef RTCP_FEEDBACK_H
#define RTCP_FEEDBACK_H

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <variant>
#include <vector>

namespace Network {

// Picture loss indication: asks the encoder of mediaSsrc for a full frame.
struct KeyframeRequest {
    uint32_t senderSsrc = 0;
    uint32_t mediaSsrc = 0;
};

// Receiver estimated maximum bitrate. bitrate is in bits per second.
struct BandwidthEstimate {
    uint32_t senderSsrc = 0;
    uint64_t bitrate = 0;
    std::vector<uint32_t> ssrcs;
};

// Generic NACK entry: packetId plus a bitmask of the 16 following lost sequences.
struct NackPair {
    uint16_t packetId = 0;
    uint16_t lostPackets = 0;

    std::vector<uint16_t> sequences() const;
};

struct RetransmissionRequest {
    uint32_t senderSsrc = 0;
    uint32_t mediaSsrc = 0;
    std::vector<NackPair> nacks;

    // All requested sequence numbers in packet order, without duplicates.
    std::vector<uint16_t> sequences() const;
};

struct ReceptionReport {
    uint32_t ssrc = 0;
    uint8_t fractionLost = 0;  // Fixed point, lost / 256
    uint32_t totalLost = 0;
    uint32_t lastSequenceNumber = 0;
    uint32_t jitter = 0;
};

// Sender or receiver report.
struct StatisticsReport {
    enum class Kind { Sender, Receiver };

    Kind kind = Kind::Receiver;
    uint32_t ssrc = 0;
    uint32_t packetCount = 0;  // Sender reports only
    uint32_t octetCount = 0;   // Sender reports only
    std::vector<ReceptionReport> reports;
};

// Closed set of feedback messages carried on a connection's feedback channel.
using FeedbackReport =
    std::variant<KeyframeRequest, BandwidthEstimate, RetransmissionRequest, StatisticsReport>;

// Helper for exhaustive std::visit over FeedbackReport.
template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};
template <class... Ts>
Overloaded(Ts...) -> Overloaded<Ts...>;

const char* feedbackReportName(const FeedbackReport& report);

// fractionLost / 256, in [0, 1).
double lossRateFromFraction(uint8_t fractionLost);

// Highest fraction-lost across the report blocks of a statistics report.
double maxLossRate(const StatisticsReport& report);

// Builds a request asking mediaSsrc's source to resend one packet.
RetransmissionRequest makeSingleRetransmission(uint32_t senderSsrc, uint32_t mediaSsrc,
                                               uint16_t sequence);

nlohmann::json feedbackReportToJson(const FeedbackReport& report);

}  // namespace Network

#endif  // RTCP_FEEDBACK_H
