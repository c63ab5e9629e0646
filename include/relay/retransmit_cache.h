#pragma once

#include "network/rtp_packet.h"

#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_map>

namespace relay {

// Short-horizon packet store keyed by (SSRC, sequence). Oldest entries are evicted first.
// Not synchronized; the owning pipeline guards it.
class RetransmitCache {
   public:
    explicit RetransmitCache(size_t capacity);

    void insert(const Network::RtpPacketPtr& packet);
    Network::RtpPacketPtr find(uint32_t ssrc, uint16_t sequence) const;

    size_t size() const { return packets_.size(); }
    size_t capacity() const { return capacity_; }
    uint64_t evictions() const { return evictions_; }
    void clear();

   private:
    static uint64_t makeKey(uint32_t ssrc, uint16_t sequence) {
        return (static_cast<uint64_t>(ssrc) << 16) | sequence;
    }

    size_t capacity_;
    std::unordered_map<uint64_t, Network::RtpPacketPtr> packets_;
    std::deque<uint64_t> order_;
    uint64_t evictions_ = 0;
};

}  // namespace relay
