#include "relay/retransmit_cache.h"

namespace relay {

RetransmitCache::RetransmitCache(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

void RetransmitCache::insert(const Network::RtpPacketPtr& packet) {
    if (!packet) {
        return;
    }
    uint64_t key = makeKey(packet->header.ssrc, packet->header.sequenceNumber);
    auto it = packets_.find(key);
    if (it != packets_.end()) {
        // Sequence wrapped or duplicate: keep the FIFO slot, refresh the packet
        it->second = packet;
        return;
    }

    while (packets_.size() >= capacity_ && !order_.empty()) {
        packets_.erase(order_.front());
        order_.pop_front();
        ++evictions_;
    }
    packets_.emplace(key, packet);
    order_.push_back(key);
}

Network::RtpPacketPtr RetransmitCache::find(uint32_t ssrc, uint16_t sequence) const {
    auto it = packets_.find(makeKey(ssrc, sequence));
    if (it == packets_.end()) {
        return nullptr;
    }
    return it->second;
}

void RetransmitCache::clear() {
    packets_.clear();
    order_.clear();
}

}  // namespace relay
