#ifndef CONNECTION_TRANSPORT_H
#define CONNECTION_TRANSPORT_H

#include "core/config_loader.h"
#include "core/error_codes.h"
#include "network/peer_connection.h"
#include "relay/bounded_queue.h"
#include "relay/feedback_controller.h"
#include "relay/track_registry.h"

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <thread>
#include <vector>

namespace relay {

enum class TransportRole { Publisher, Subscriber };

const char* transportRoleToString(TransportRole role);

struct TransportStats {
    std::string id;
    TransportRole role = TransportRole::Publisher;
    bool hasVideo = false;
    bool hasAudio = false;
    bool hasScreen = false;
    bool closed = false;
    size_t trackCount = 0;
    std::map<uint32_t, uint8_t> payloadTypes;
    uint64_t byteRate = 0;
    bool lossObserved = false;
    uint64_t packetsRead = 0;
    uint64_t packetsWritten = 0;
    int consecutiveErrors = 0;
    uint64_t totalErrors = 0;
    uint64_t trackMisses = 0;
    uint64_t keyframeRequests = 0;
    uint64_t bandwidthEstimates = 0;
    uint64_t retransmissionRequests = 0;
    uint64_t feedbackReports = 0;
    size_t queuedPackets = 0;
    size_t activeLoops = 0;
};

nlohmann::json transportStatsToJson(const TransportStats& stats);

/**
 * @brief One peer's media connection and the background loops serving it.
 *
 * A publisher transport receives media and feeds the inbound packet channel consumed
 * through readPacket(). A subscriber transport owns one send-only track per forwarded
 * stream and routes the peer's feedback to its pipeline through the resolver.
 *
 * close() runs the teardown in a fixed order: peer connection, shutdown signal, join of
 * every loop, then the channels. The destructor calls close().
 */
class ConnectionTransport {
   public:
    using StreamCallback = std::function<void(uint32_t ssrc, uint8_t payloadType)>;

    ConnectionTransport(std::string id, TransportRole role,
                        std::unique_ptr<Network::PeerConnection> connection,
                        const RelayConfig& config, FeedbackResolver resolver = {});
    ~ConnectionTransport();

    ConnectionTransport(const ConnectionTransport&) = delete;
    ConnectionTransport& operator=(const ConnectionTransport&) = delete;

    MediaRelay::ErrorCode answerPublish(const Network::SessionDescription& offer,
                                        const nlohmann::json& options, StreamCallback onStream,
                                        Network::SessionDescription& answer);
    MediaRelay::ErrorCode answerSubscribe(const Network::SessionDescription& offer,
                                          const std::map<uint32_t, uint8_t>& ssrcToPayloadType,
                                          const std::string& sessionId,
                                          Network::SessionDescription& answer);

    // Blocks until a packet is available; TRANSPORT_CHANNEL_CLOSED after close().
    MediaRelay::ErrorCode readPacket(Network::RtpPacketPtr& packet);
    MediaRelay::ErrorCode writePacket(const Network::RtpPacketPtr& packet);
    std::map<uint32_t, uint8_t> streamsAndPayloadTypes() const;

    void close();

    // On-demand keyframe request. Coalesces with a request that is still pending.
    void requestKeyframe();
    MediaRelay::ErrorCode sendBandwidthEstimate(double lossRate);
    MediaRelay::ErrorCode sendRetransmissionRequest(const Network::RetransmissionRequest& request);

    const std::string& id() const { return id_; }
    TransportRole role() const { return role_; }
    bool hasVideo() const { return hasVideo_.load(); }
    bool hasAudio() const { return hasAudio_.load(); }
    bool hasScreen() const { return hasScreen_.load(); }
    bool isClosed() const { return shutdown_.load(); }

    uint64_t byteRate() const { return tracks_.byteRate(); }
    bool lossObserved() const { return tracks_.lossObserved(); }
    int errorCount() const { return tracks_.errorCount(); }
    TrackRegistry& tracks() { return tracks_; }
    const TrackRegistry& tracks() const { return tracks_; }

    TransportStats stats() const;

   private:
    struct KeyframeSignal {};

    bool spawn(std::function<void()> loop);
    bool waitForShutdown(std::chrono::milliseconds timeout);
    MediaRelay::ErrorCode writeFeedback(const std::vector<Network::FeedbackReport>& reports);

    void handleInboundTrack(const std::shared_ptr<Network::RemoteTrack>& track);
    void readLoop(std::shared_ptr<Network::RemoteTrack> track);
    void keyframeTickerLoop();
    void keyframeWriterLoop();
    void publisherFeedbackLoop(std::shared_ptr<Network::FeedbackReader> reader);
    void subscriberFeedbackLoop(std::shared_ptr<Network::FeedbackReader> reader,
                                std::string sessionId);

    const std::string id_;
    const TransportRole role_;
    const RelayConfig config_;
    std::unique_ptr<Network::PeerConnection> connection_;
    FeedbackResolver resolver_;
    StreamCallback onStream_;

    TrackRegistry tracks_;
    BoundedQueue<Network::RtpPacketPtr> packets_;
    BoundedQueue<KeyframeSignal> keyframes_;

    std::atomic<bool> hasVideo_{false};
    std::atomic<bool> hasAudio_{false};
    std::atomic<bool> hasScreen_{false};
    std::atomic<bool> negotiated_{false};
    std::atomic<bool> keyframeWriterStarted_{false};
    std::atomic<bool> hasVideoSsrc_{false};
    std::atomic<uint32_t> lastVideoSsrc_{0};

    std::atomic<uint64_t> packetsRead_{0};
    std::atomic<uint64_t> packetsWritten_{0};
    std::atomic<uint64_t> keyframeRequests_{0};
    std::atomic<uint64_t> bandwidthEstimates_{0};
    std::atomic<uint64_t> retransmissionRequests_{0};
    std::atomic<uint64_t> feedbackReports_{0};

    // Shutdown signal shared by every loop
    std::atomic<bool> shutdown_{false};
    std::mutex shutdownMutex_;
    std::condition_variable shutdownCv_;

    mutable std::mutex loopsMutex_;
    std::vector<std::thread> loops_;

    std::mutex closeMutex_;
    bool closed_ = false;
};

}  // namespace relay

#endif  // CONNECTION_TRANSPORT_H
