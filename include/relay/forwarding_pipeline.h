#ifndef FORWARDING_PIPELINE_H
#define FORWARDING_PIPELINE_H

#include "core/error_codes.h"
#include "relay/connection_transport.h"
#include "relay/feedback_controller.h"
#include "relay/retransmit_cache.h"

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

namespace relay {

struct PipelineStats {
    std::string sessionId;
    bool hasPublisher = false;
    std::string publisherId;
    size_t subscriberCount = 0;
    uint64_t packetsForwarded = 0;
    uint64_t deliveries = 0;
    uint64_t deliveryFailures = 0;
    uint64_t cacheHits = 0;
    uint64_t cacheMisses = 0;
    uint64_t cacheEvictions = 0;
    size_t cachedPackets = 0;
    std::vector<TransportStats> transports;
};

nlohmann::json pipelineStatsToJson(const PipelineStats& stats);

/**
 * @brief Routes one session's media from its publisher to every subscriber.
 *
 * Binding a publisher starts a forwarding thread that drains the publisher's inbound
 * channel until it closes. Every packet is cached for retransmission and written to a
 * snapshot of the subscribers registered at that moment.
 */
class ForwardingPipeline : public FeedbackTarget {
   public:
    ForwardingPipeline(std::string sessionId, size_t cacheSize);
    ~ForwardingPipeline() override;

    ForwardingPipeline(const ForwardingPipeline&) = delete;
    ForwardingPipeline& operator=(const ForwardingPipeline&) = delete;

    MediaRelay::ErrorCode bindPublisher(std::shared_ptr<ConnectionTransport> transport);
    // Detaches the publisher, closes it and waits for the forwarding thread.
    MediaRelay::ErrorCode unbindPublisher();
    // Detaches the publisher without closing it. Once the caller has closed the returned
    // transport, reapForwarders() joins its forwarding thread.
    std::shared_ptr<ConnectionTransport> detachPublisher();
    void reapForwarders();

    MediaRelay::ErrorCode addSubscriber(std::shared_ptr<ConnectionTransport> transport);
    // Returns the detached transport; the caller closes it outside any registry lock.
    std::shared_ptr<ConnectionTransport> removeSubscriber(const std::string& subscriberId);

    void forward(const Network::RtpPacketPtr& packet);

    // FeedbackTarget
    MediaRelay::ErrorCode writeCachedOrForwardToPublisher(const std::string& subscriberId,
                                                          uint32_t ssrc,
                                                          uint16_t sequence) override;
    MediaRelay::ErrorCode forwardRetransmissionToPublisher(
        const Network::RetransmissionRequest& request) override;
    MediaRelay::ErrorCode requestPublisherKeyframe() override;
    MediaRelay::ErrorCode reportLoss(double lossRate) override;

    std::shared_ptr<ConnectionTransport> publisher() const;
    std::shared_ptr<ConnectionTransport> subscriber(const std::string& subscriberId) const;
    std::vector<std::string> subscriberIds() const;
    size_t subscriberCount() const;
    bool isEmpty() const;
    bool isClosed() const { return closed_.load(); }

    // Closes the publisher and every subscriber. Further membership changes fail.
    void close();

    const std::string& sessionId() const { return sessionId_; }
    PipelineStats stats() const;
    std::vector<std::string> unhealthySubscribers(int maxErrors) const;

   private:
    void forwardLoop(std::shared_ptr<ConnectionTransport> publisher);

    const std::string sessionId_;

    mutable std::shared_mutex membersMutex_;
    std::shared_ptr<ConnectionTransport> publisher_;
    std::map<std::string, std::shared_ptr<ConnectionTransport>> subscribers_;
    std::thread forwardThread_;
    std::vector<std::thread> retiredForwarders_;

    mutable std::mutex cacheMutex_;
    RetransmitCache cache_;

    std::atomic<bool> closed_{false};
    std::atomic<uint64_t> packetsForwarded_{0};
    std::atomic<uint64_t> deliveries_{0};
    std::atomic<uint64_t> deliveryFailures_{0};
    std::atomic<uint64_t> cacheHits_{0};
    std::atomic<uint64_t> cacheMisses_{0};
};

}  // namespace relay

#endif  // FORWARDING_PIPELINE_H
