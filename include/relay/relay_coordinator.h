#pragma once

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "network/peer_connection.h"
#include "relay/pipeline_registry.h"

#include <atomic>
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace relay {

// Entry point for the signaling layer: turns publish/subscribe requests into transports
// bound to pipelines.
class RelayCoordinator {
   public:
    RelayCoordinator(Network::PeerConnectionFactory& factory, const RelayConfig& config);
    ~RelayCoordinator();

    // Starts the periodic statistics sweep.
    void start();

    MediaRelay::ErrorCode publish(const std::string& sessionId, const std::string& peerId,
                                  const Network::SessionDescription& offer,
                                  const nlohmann::json& options,
                                  Network::SessionDescription& answer);
    MediaRelay::ErrorCode subscribe(const std::string& sessionId, const std::string& peerId,
                                    const Network::SessionDescription& offer,
                                    Network::SessionDescription& answer);
    MediaRelay::ErrorCode unpublish(const std::string& sessionId);
    MediaRelay::ErrorCode unsubscribe(const std::string& sessionId, const std::string& peerId);

    // Commands: publish, subscribe, unpublish, unsubscribe, stats. Parameters are read
    // from message["params"]. Always fills responseOut; returns false for unknown commands.
    bool handleCommand(const std::string& cmdType, const nlohmann::json& message,
                       std::string& responseOut);

    void shutdown();

    PipelineRegistry& registry() { return registry_; }

   private:
    MediaRelay::ErrorCode createTransport(const std::string& peerId, TransportRole role,
                                          std::shared_ptr<ConnectionTransport>& transport);

    Network::PeerConnectionFactory& factory_;
    const RelayConfig config_;
    PipelineRegistry registry_;
    std::atomic<bool> shutdown_{false};
};

}  // namespace relay
