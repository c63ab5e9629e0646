#ifndef PIPELINE_REGISTRY_H
#define PIPELINE_REGISTRY_H

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "relay/forwarding_pipeline.h"

#include <atomic>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace relay {

/**
 * @brief Active pipelines keyed by session id.
 *
 * A pipeline is created on first reference and erased as soon as it has neither a
 * publisher nor subscribers. Removed transports and torn-down pipelines are closed after
 * the registry lock is released.
 */
class PipelineRegistry {
   public:
    explicit PipelineRegistry(const RelayConfig& config);
    ~PipelineRegistry();

    PipelineRegistry(const PipelineRegistry&) = delete;
    PipelineRegistry& operator=(const PipelineRegistry&) = delete;

    std::shared_ptr<ForwardingPipeline> getOrCreate(const std::string& sessionId);
    std::shared_ptr<ForwardingPipeline> find(const std::string& sessionId) const;

    MediaRelay::ErrorCode bindPublisher(const std::string& sessionId,
                                        std::shared_ptr<ConnectionTransport> transport);
    MediaRelay::ErrorCode addSubscriber(const std::string& sessionId,
                                        std::shared_ptr<ConnectionTransport> transport);
    MediaRelay::ErrorCode removeSubscriber(const std::string& sessionId,
                                           const std::string& subscriberId);
    MediaRelay::ErrorCode removePublisher(const std::string& sessionId);

    size_t size() const;
    std::vector<std::string> sessionIds() const;

    // Session id to pipeline lookup handed to subscriber transports.
    FeedbackResolver resolver();

    void closeAll();

    void startStatsSweep();
    void stopStatsSweep();
    // One sweep: logs aggregate stats and unhealthy subscribers, returns the snapshot.
    nlohmann::json sweepStats();

   private:
    using PipelineMap = std::unordered_map<std::string, std::shared_ptr<ForwardingPipeline>>;

    // Requires pipelinesMutex_ held exclusively.
    PipelineMap::iterator createLocked(const std::string& sessionId);
    std::vector<std::shared_ptr<ForwardingPipeline>> snapshot() const;
    void statsLoop();

    const RelayConfig config_;

    mutable std::shared_mutex pipelinesMutex_;
    PipelineMap pipelines_;

    std::mutex sweepMutex_;
    std::condition_variable sweepCv_;
    bool sweepRunning_ = false;
    std::thread sweepThread_;
};

}  // namespace relay

#endif  // PIPELINE_REGISTRY_H
