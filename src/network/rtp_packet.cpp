#include "network/rtp_packet.h"

namespace Network {
namespace {

constexpr size_t kFixedHeaderBytes = 12;
constexpr size_t kExtensionHeaderBytes = 4;

}  // namespace

size_t RtpPacket::marshalSize() const {
    size_t size = kFixedHeaderBytes + header.csrc.size() * sizeof(uint32_t);
    if (header.extension) {
        size += kExtensionHeaderBytes + header.extensionPayload.size();
    }
    return size + payload.size() + paddingSize;
}

}  // namespace Network
