// Per-connection track table plus the running stats the feedback loops read.
#pragma once

#include "network/peer_connection.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>

namespace relay {

class TrackRegistry {
   public:
    using Clock = std::chrono::steady_clock;

    explicit TrackRegistry(std::chrono::milliseconds rateWindow);

    // Tables. Reads take the shared lock, writes the exclusive one.
    void addTrack(const std::shared_ptr<Network::LocalTrack>& track);
    std::shared_ptr<Network::LocalTrack> findTrack(uint32_t ssrc) const;
    size_t trackCount() const;

    // Returns true when ssrc was not registered before; later calls keep the first value.
    bool setPayloadType(uint32_t ssrc, uint8_t payloadType);
    std::map<uint32_t, uint8_t> payloadTypes() const;
    std::optional<uint32_t> videoSsrc() const;

    // Rolling byte count. When the window has elapsed the byte rate is recomputed, the
    // count restarts and the loss flag clears.
    void recordBytes(size_t bytes, Clock::time_point now);
    uint64_t byteRate() const { return byteRate_.load(std::memory_order_relaxed); }

    void markLossObserved() { lossObserved_.store(true, std::memory_order_relaxed); }
    bool lossObserved() const { return lossObserved_.load(std::memory_order_relaxed); }

    // Consecutive I/O failures; cleared by the next success.
    void addError();
    void clearErrors() { consecutiveErrors_.store(0, std::memory_order_relaxed); }
    int errorCount() const { return consecutiveErrors_.load(std::memory_order_relaxed); }
    uint64_t totalErrors() const { return totalErrors_.load(std::memory_order_relaxed); }

    // Writes for streams without a registered track. Kept apart from I/O errors.
    void addTrackMiss() { trackMisses_.fetch_add(1, std::memory_order_relaxed); }
    uint64_t trackMissCount() const { return trackMisses_.load(std::memory_order_relaxed); }

   private:
    mutable std::shared_mutex tablesMutex_;
    std::unordered_map<uint32_t, std::shared_ptr<Network::LocalTrack>> tracks_;
    std::map<uint32_t, uint8_t> payloadTypes_;

    const std::chrono::milliseconds rateWindow_;
    std::mutex rateMutex_;
    uint64_t windowBytes_ = 0;
    std::optional<Clock::time_point> windowStart_;

    std::atomic<uint64_t> byteRate_{0};
    std::atomic<bool> lossObserved_{false};
    std::atomic<int> consecutiveErrors_{0};
    std::atomic<uint64_t> totalErrors_{0};
    std::atomic<uint64_t> trackMisses_{0};
};

}  // namespace relay
