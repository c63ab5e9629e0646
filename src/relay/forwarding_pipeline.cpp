#include "relay/forwarding_pipeline.h"

#include "logging/logger.h"

#include <utility>

namespace relay {

using MediaRelay::ErrorCode;

nlohmann::json pipelineStatsToJson(const PipelineStats& stats) {
    nlohmann::json j;
    j["session_id"] = stats.sessionId;
    j["has_publisher"] = stats.hasPublisher;
    j["publisher_id"] = stats.publisherId;
    j["subscriber_count"] = stats.subscriberCount;
    j["packets_forwarded"] = stats.packetsForwarded;
    j["deliveries"] = stats.deliveries;
    j["delivery_failures"] = stats.deliveryFailures;
    j["cache_hits"] = stats.cacheHits;
    j["cache_misses"] = stats.cacheMisses;
    j["cache_evictions"] = stats.cacheEvictions;
    j["cached_packets"] = stats.cachedPackets;
    j["transports"] = nlohmann::json::array();
    for (const auto& transport : stats.transports) {
        j["transports"].push_back(transportStatsToJson(transport));
    }
    return j;
}

ForwardingPipeline::ForwardingPipeline(std::string sessionId, size_t cacheSize)
    : sessionId_(std::move(sessionId)), cache_(cacheSize) {}

ForwardingPipeline::~ForwardingPipeline() {
    close();
}

ErrorCode ForwardingPipeline::bindPublisher(std::shared_ptr<ConnectionTransport> transport) {
    if (!transport) {
        return ErrorCode::VALIDATION_INVALID_PARAMS;
    }
    std::unique_lock<std::shared_mutex> lock(membersMutex_);
    if (closed_.load()) {
        return ErrorCode::PIPELINE_CLOSED;
    }
    if (publisher_) {
        return ErrorCode::PIPELINE_PUBLISHER_EXISTS;
    }
    publisher_ = transport;
    forwardThread_ = std::thread(&ForwardingPipeline::forwardLoop, this, transport);
    LOG_INFO("Pipeline {}: publisher {} bound", sessionId_, transport->id());
    return ErrorCode::OK;
}

ErrorCode ForwardingPipeline::unbindPublisher() {
    auto publisher = detachPublisher();
    if (!publisher) {
        return ErrorCode::PIPELINE_NO_PUBLISHER;
    }
    // Closing the publisher closes its channel, which ends the forwarding thread
    publisher->close();
    reapForwarders();
    return ErrorCode::OK;
}

std::shared_ptr<ConnectionTransport> ForwardingPipeline::detachPublisher() {
    std::unique_lock<std::shared_mutex> lock(membersMutex_);
    if (!publisher_) {
        return nullptr;
    }
    std::shared_ptr<ConnectionTransport> publisher;
    publisher.swap(publisher_);
    if (forwardThread_.joinable()) {
        retiredForwarders_.push_back(std::move(forwardThread_));
    }
    LOG_INFO("Pipeline {}: publisher {} unbound", sessionId_, publisher->id());
    return publisher;
}

void ForwardingPipeline::reapForwarders() {
    std::vector<std::thread> retired;
    {
        std::unique_lock<std::shared_mutex> lock(membersMutex_);
        retired.swap(retiredForwarders_);
    }
    for (auto& thread : retired) {
        if (thread.joinable()) {
            thread.join();
        }
    }
}

ErrorCode ForwardingPipeline::addSubscriber(std::shared_ptr<ConnectionTransport> transport) {
    if (!transport) {
        return ErrorCode::VALIDATION_INVALID_PARAMS;
    }
    std::shared_ptr<ConnectionTransport> publisher;
    {
        std::unique_lock<std::shared_mutex> lock(membersMutex_);
        if (closed_.load()) {
            return ErrorCode::PIPELINE_CLOSED;
        }
        if (!subscribers_.emplace(transport->id(), transport).second) {
            return ErrorCode::PIPELINE_SUBSCRIBER_EXISTS;
        }
        publisher = publisher_;
    }

    // Late joiner needs a decodable picture
    if (publisher) {
        publisher->requestKeyframe();
    }
    LOG_INFO("Pipeline {}: subscriber {} added", sessionId_, transport->id());
    return ErrorCode::OK;
}

std::shared_ptr<ConnectionTransport> ForwardingPipeline::removeSubscriber(
    const std::string& subscriberId) {
    std::unique_lock<std::shared_mutex> lock(membersMutex_);
    auto it = subscribers_.find(subscriberId);
    if (it == subscribers_.end()) {
        return nullptr;
    }
    auto transport = it->second;
    subscribers_.erase(it);
    LOG_INFO("Pipeline {}: subscriber {} removed", sessionId_, subscriberId);
    return transport;
}

void ForwardingPipeline::forward(const Network::RtpPacketPtr& packet) {
    if (!packet) {
        return;
    }
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        cache_.insert(packet);
    }

    std::vector<std::shared_ptr<ConnectionTransport>> targets;
    {
        std::shared_lock<std::shared_mutex> lock(membersMutex_);
        targets.reserve(subscribers_.size());
        for (const auto& entry : subscribers_) {
            targets.push_back(entry.second);
        }
    }

    packetsForwarded_.fetch_add(1, std::memory_order_relaxed);
    for (const auto& target : targets) {
        ErrorCode rc = target->writePacket(packet);
        if (rc == ErrorCode::OK) {
            deliveries_.fetch_add(1, std::memory_order_relaxed);
        } else {
            deliveryFailures_.fetch_add(1, std::memory_order_relaxed);
        }
    }
}

ErrorCode ForwardingPipeline::writeCachedOrForwardToPublisher(const std::string& subscriberId,
                                                              uint32_t ssrc, uint16_t sequence) {
    Network::RtpPacketPtr packet;
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        packet = cache_.find(ssrc, sequence);
    }
    if (!packet) {
        cacheMisses_.fetch_add(1, std::memory_order_relaxed);
        return ErrorCode::PIPELINE_CACHE_MISS;
    }
    cacheHits_.fetch_add(1, std::memory_order_relaxed);

    auto target = subscriber(subscriberId);
    if (!target) {
        return ErrorCode::PIPELINE_SUBSCRIBER_NOT_FOUND;
    }
    return target->writePacket(packet);
}

ErrorCode ForwardingPipeline::forwardRetransmissionToPublisher(
    const Network::RetransmissionRequest& request) {
    auto target = publisher();
    if (!target) {
        return ErrorCode::PIPELINE_NO_PUBLISHER;
    }
    return target->sendRetransmissionRequest(request);
}

ErrorCode ForwardingPipeline::requestPublisherKeyframe() {
    auto target = publisher();
    if (!target) {
        return ErrorCode::PIPELINE_NO_PUBLISHER;
    }
    target->requestKeyframe();
    return ErrorCode::OK;
}

ErrorCode ForwardingPipeline::reportLoss(double lossRate) {
    auto target = publisher();
    if (!target) {
        return ErrorCode::PIPELINE_NO_PUBLISHER;
    }
    return target->sendBandwidthEstimate(lossRate);
}

std::shared_ptr<ConnectionTransport> ForwardingPipeline::publisher() const {
    std::shared_lock<std::shared_mutex> lock(membersMutex_);
    return publisher_;
}

std::shared_ptr<ConnectionTransport> ForwardingPipeline::subscriber(
    const std::string& subscriberId) const {
    std::shared_lock<std::shared_mutex> lock(membersMutex_);
    auto it = subscribers_.find(subscriberId);
    if (it == subscribers_.end()) {
        return nullptr;
    }
    return it->second;
}

std::vector<std::string> ForwardingPipeline::subscriberIds() const {
    std::shared_lock<std::shared_mutex> lock(membersMutex_);
    std::vector<std::string> ids;
    ids.reserve(subscribers_.size());
    for (const auto& entry : subscribers_) {
        ids.push_back(entry.first);
    }
    return ids;
}

size_t ForwardingPipeline::subscriberCount() const {
    std::shared_lock<std::shared_mutex> lock(membersMutex_);
    return subscribers_.size();
}

bool ForwardingPipeline::isEmpty() const {
    std::shared_lock<std::shared_mutex> lock(membersMutex_);
    return !publisher_ && subscribers_.empty();
}

void ForwardingPipeline::close() {
    if (closed_.exchange(true)) {
        return;
    }

    std::shared_ptr<ConnectionTransport> publisher;
    std::thread forwardThread;
    std::map<std::string, std::shared_ptr<ConnectionTransport>> subscribers;
    {
        std::unique_lock<std::shared_mutex> lock(membersMutex_);
        publisher.swap(publisher_);
        forwardThread.swap(forwardThread_);
        subscribers.swap(subscribers_);
    }

    if (publisher) {
        publisher->close();
    }
    if (forwardThread.joinable()) {
        forwardThread.join();
    }
    reapForwarders();
    for (auto& entry : subscribers) {
        entry.second->close();
    }
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        cache_.clear();
    }
    LOG_INFO("Pipeline {} closed", sessionId_);
}

PipelineStats ForwardingPipeline::stats() const {
    PipelineStats stats;
    stats.sessionId = sessionId_;

    std::shared_ptr<ConnectionTransport> publisher;
    std::vector<std::shared_ptr<ConnectionTransport>> subscribers;
    {
        std::shared_lock<std::shared_mutex> lock(membersMutex_);
        publisher = publisher_;
        for (const auto& entry : subscribers_) {
            subscribers.push_back(entry.second);
        }
    }

    stats.hasPublisher = publisher != nullptr;
    if (publisher) {
        stats.publisherId = publisher->id();
        stats.transports.push_back(publisher->stats());
    }
    stats.subscriberCount = subscribers.size();
    for (const auto& subscriber : subscribers) {
        stats.transports.push_back(subscriber->stats());
    }

    stats.packetsForwarded = packetsForwarded_.load();
    stats.deliveries = deliveries_.load();
    stats.deliveryFailures = deliveryFailures_.load();
    stats.cacheHits = cacheHits_.load();
    stats.cacheMisses = cacheMisses_.load();
    {
        std::lock_guard<std::mutex> lock(cacheMutex_);
        stats.cacheEvictions = cache_.evictions();
        stats.cachedPackets = cache_.size();
    }
    return stats;
}

std::vector<std::string> ForwardingPipeline::unhealthySubscribers(int maxErrors) const {
    std::shared_lock<std::shared_mutex> lock(membersMutex_);
    std::vector<std::string> ids;
    for (const auto& entry : subscribers_) {
        if (entry.second->errorCount() >= maxErrors) {
            ids.push_back(entry.first);
        }
    }
    return ids;
}

void ForwardingPipeline::forwardLoop(std::shared_ptr<ConnectionTransport> publisher) {
    Network::RtpPacketPtr packet;
    while (publisher->readPacket(packet) == ErrorCode::OK) {
        forward(packet);
    }
    LOG_DEBUG("Pipeline {}: forwarding from {} finished", sessionId_, publisher->id());
}

}  // namespace relay
