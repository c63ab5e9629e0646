#ifndef RTP_PACKET_H
#define RTP_PACKET_H

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace Network {

struct RtpHeader {
    uint8_t version = 2;
    bool padding = false;
    bool extension = false;
    bool marker = false;
    uint8_t payloadType = 0;
    uint16_t sequenceNumber = 0;
    uint32_t timestamp = 0;
    uint32_t ssrc = 0;
    std::vector<uint32_t> csrc;
    uint16_t extensionProfile = 0;
    std::vector<uint8_t> extensionPayload;  // Length is a multiple of 4 bytes
};

// One structured media packet as produced by the protocol stack. The relay never
// modifies packets; they travel between threads as shared immutable objects.
struct RtpPacket {
    RtpHeader header;
    std::vector<uint8_t> payload;
    uint8_t paddingSize = 0;

    // Size of the packet on the wire, used for byte-rate accounting.
    size_t marshalSize() const;
};

using RtpPacketPtr = std::shared_ptr<const RtpPacket>;

}  // namespace Network

#endif  // RTP_PACKET_H
