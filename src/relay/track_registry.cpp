#include "relay/track_registry.h"

#include "network/media_codec.h"

namespace relay {

TrackRegistry::TrackRegistry(std::chrono::milliseconds rateWindow) : rateWindow_(rateWindow) {}

void TrackRegistry::addTrack(const std::shared_ptr<Network::LocalTrack>& track) {
    if (!track) {
        return;
    }
    std::unique_lock<std::shared_mutex> lock(tablesMutex_);
    tracks_[track->ssrc()] = track;
}

std::shared_ptr<Network::LocalTrack> TrackRegistry::findTrack(uint32_t ssrc) const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);
    auto it = tracks_.find(ssrc);
    if (it == tracks_.end()) {
        return nullptr;
    }
    return it->second;
}

size_t TrackRegistry::trackCount() const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);
    return tracks_.size();
}

bool TrackRegistry::setPayloadType(uint32_t ssrc, uint8_t payloadType) {
    std::unique_lock<std::shared_mutex> lock(tablesMutex_);
    return payloadTypes_.emplace(ssrc, payloadType).second;
}

std::map<uint32_t, uint8_t> TrackRegistry::payloadTypes() const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);
    return payloadTypes_;
}

std::optional<uint32_t> TrackRegistry::videoSsrc() const {
    std::shared_lock<std::shared_mutex> lock(tablesMutex_);
    for (const auto& [ssrc, payloadType] : payloadTypes_) {
        if (Network::isVideoPayloadType(payloadType)) {
            return ssrc;
        }
    }
    return std::nullopt;
}

void TrackRegistry::recordBytes(size_t bytes, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(rateMutex_);
    if (!windowStart_) {
        windowStart_ = now;
    }
    windowBytes_ += bytes;
    if (now - *windowStart_ < rateWindow_) {
        return;
    }

    double windowSeconds = std::chrono::duration<double>(rateWindow_).count();
    byteRate_.store(static_cast<uint64_t>(static_cast<double>(windowBytes_) / windowSeconds),
                    std::memory_order_relaxed);
    windowBytes_ = 0;
    windowStart_ = now;
    lossObserved_.store(false, std::memory_order_relaxed);
}

void TrackRegistry::addError() {
    consecutiveErrors_.fetch_add(1, std::memory_order_relaxed);
    totalErrors_.fetch_add(1, std::memory_order_relaxed);
}

}  // namespace relay
