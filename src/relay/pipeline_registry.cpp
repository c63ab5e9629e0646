#include "relay/pipeline_registry.h"

#include "logging/logger.h"

#include <chrono>
#include <utility>

namespace relay {

using MediaRelay::ErrorCode;

PipelineRegistry::PipelineRegistry(const RelayConfig& config) : config_(config) {}

PipelineRegistry::~PipelineRegistry() {
    stopStatsSweep();
    closeAll();
}

std::shared_ptr<ForwardingPipeline> PipelineRegistry::getOrCreate(const std::string& sessionId) {
    {
        std::shared_lock<std::shared_mutex> lock(pipelinesMutex_);
        auto it = pipelines_.find(sessionId);
        if (it != pipelines_.end()) {
            return it->second;
        }
    }

    std::unique_lock<std::shared_mutex> lock(pipelinesMutex_);
    return createLocked(sessionId)->second;
}

PipelineRegistry::PipelineMap::iterator PipelineRegistry::createLocked(
    const std::string& sessionId) {
    auto [it, inserted] = pipelines_.try_emplace(sessionId, nullptr);
    if (inserted) {
        it->second = std::make_shared<ForwardingPipeline>(sessionId, config_.retransmitCacheSize);
        LOG_INFO("Pipeline {} created", sessionId);
    }
    return it;
}

std::shared_ptr<ForwardingPipeline> PipelineRegistry::find(const std::string& sessionId) const {
    std::shared_lock<std::shared_mutex> lock(pipelinesMutex_);
    auto it = pipelines_.find(sessionId);
    if (it == pipelines_.end()) {
        return nullptr;
    }
    return it->second;
}

ErrorCode PipelineRegistry::bindPublisher(const std::string& sessionId,
                                          std::shared_ptr<ConnectionTransport> transport) {
    std::shared_ptr<ForwardingPipeline> orphan;
    ErrorCode rc;
    {
        std::unique_lock<std::shared_mutex> lock(pipelinesMutex_);
        auto it = createLocked(sessionId);
        rc = it->second->bindPublisher(std::move(transport));
        if (rc != ErrorCode::OK && it->second->isEmpty()) {
            orphan = it->second;
            pipelines_.erase(it);
        }
    }
    if (orphan) {
        orphan->close();
    }
    return rc;
}

ErrorCode PipelineRegistry::addSubscriber(const std::string& sessionId,
                                          std::shared_ptr<ConnectionTransport> transport) {
    std::shared_ptr<ForwardingPipeline> orphan;
    ErrorCode rc;
    {
        std::unique_lock<std::shared_mutex> lock(pipelinesMutex_);
        auto it = createLocked(sessionId);
        rc = it->second->addSubscriber(std::move(transport));
        if (rc != ErrorCode::OK && it->second->isEmpty()) {
            orphan = it->second;
            pipelines_.erase(it);
        }
    }
    if (orphan) {
        orphan->close();
    }
    return rc;
}

ErrorCode PipelineRegistry::removeSubscriber(const std::string& sessionId,
                                             const std::string& subscriberId) {
    std::shared_ptr<ForwardingPipeline> pipeline;
    std::shared_ptr<ConnectionTransport> removed;
    bool teardown = false;
    {
        std::unique_lock<std::shared_mutex> lock(pipelinesMutex_);
        auto it = pipelines_.find(sessionId);
        if (it == pipelines_.end()) {
            return ErrorCode::PIPELINE_NOT_FOUND;
        }
        pipeline = it->second;
        removed = pipeline->removeSubscriber(subscriberId);
        if (!removed) {
            return ErrorCode::PIPELINE_SUBSCRIBER_NOT_FOUND;
        }
        if (pipeline->isEmpty()) {
            pipelines_.erase(it);
            teardown = true;
        }
    }

    removed->close();
    if (teardown) {
        pipeline->close();
        LOG_INFO("Pipeline {} removed (last subscriber left)", sessionId);
    }
    return ErrorCode::OK;
}

ErrorCode PipelineRegistry::removePublisher(const std::string& sessionId) {
    std::shared_ptr<ForwardingPipeline> pipeline;
    std::shared_ptr<ConnectionTransport> removed;
    bool teardown = false;
    {
        std::unique_lock<std::shared_mutex> lock(pipelinesMutex_);
        auto it = pipelines_.find(sessionId);
        if (it == pipelines_.end()) {
            return ErrorCode::PIPELINE_NOT_FOUND;
        }
        pipeline = it->second;
        removed = pipeline->detachPublisher();
        if (!removed) {
            return ErrorCode::PIPELINE_NO_PUBLISHER;
        }
        if (pipeline->isEmpty()) {
            pipelines_.erase(it);
            teardown = true;
        }
    }

    removed->close();
    pipeline->reapForwarders();
    if (teardown) {
        pipeline->close();
        LOG_INFO("Pipeline {} removed (publisher left)", sessionId);
    }
    return ErrorCode::OK;
}

size_t PipelineRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(pipelinesMutex_);
    return pipelines_.size();
}

std::vector<std::string> PipelineRegistry::sessionIds() const {
    std::shared_lock<std::shared_mutex> lock(pipelinesMutex_);
    std::vector<std::string> ids;
    ids.reserve(pipelines_.size());
    for (const auto& entry : pipelines_) {
        ids.push_back(entry.first);
    }
    return ids;
}

FeedbackResolver PipelineRegistry::resolver() {
    return [this](const std::string& sessionId) -> std::shared_ptr<FeedbackTarget> {
        return find(sessionId);
    };
}

void PipelineRegistry::closeAll() {
    PipelineMap pipelines;
    {
        std::unique_lock<std::shared_mutex> lock(pipelinesMutex_);
        pipelines.swap(pipelines_);
    }
    for (auto& entry : pipelines) {
        entry.second->close();
    }
}

void PipelineRegistry::startStatsSweep() {
    std::lock_guard<std::mutex> lock(sweepMutex_);
    if (sweepRunning_) {
        return;
    }
    sweepRunning_ = true;
    sweepThread_ = std::thread(&PipelineRegistry::statsLoop, this);
}

void PipelineRegistry::stopStatsSweep() {
    {
        std::lock_guard<std::mutex> lock(sweepMutex_);
        if (!sweepRunning_) {
            return;
        }
        sweepRunning_ = false;
    }
    sweepCv_.notify_all();
    if (sweepThread_.joinable()) {
        sweepThread_.join();
    }
}

nlohmann::json PipelineRegistry::sweepStats() {
    nlohmann::json result;
    result["pipelines"] = nlohmann::json::array();
    for (const auto& pipeline : snapshot()) {
        PipelineStats stats = pipeline->stats();
        LOG_DEBUG("Pipeline {}: publisher={} subscribers={} forwarded={} failures={} "
                  "cache hit/miss={}/{}",
                  stats.sessionId, stats.hasPublisher ? stats.publisherId : "-",
                  stats.subscriberCount, stats.packetsForwarded, stats.deliveryFailures,
                  stats.cacheHits, stats.cacheMisses);
        for (const auto& id : pipeline->unhealthySubscribers(config_.maxSubscriberErrors)) {
            LOG_WARN("Pipeline {}: subscriber {} exceeded {} consecutive write errors",
                     stats.sessionId, id, config_.maxSubscriberErrors);
        }
        result["pipelines"].push_back(pipelineStatsToJson(stats));
    }
    result["count"] = result["pipelines"].size();
    return result;
}

std::vector<std::shared_ptr<ForwardingPipeline>> PipelineRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(pipelinesMutex_);
    std::vector<std::shared_ptr<ForwardingPipeline>> pipelines;
    pipelines.reserve(pipelines_.size());
    for (const auto& entry : pipelines_) {
        pipelines.push_back(entry.second);
    }
    return pipelines;
}

void PipelineRegistry::statsLoop() {
    const auto interval = std::chrono::milliseconds(config_.statIntervalMs);
    std::unique_lock<std::mutex> lock(sweepMutex_);
    while (sweepRunning_) {
        if (sweepCv_.wait_for(lock, interval, [this]() { return !sweepRunning_; })) {
            break;
        }
        lock.unlock();
        sweepStats();
        lock.lock();
    }
}

}  // namespace relay
