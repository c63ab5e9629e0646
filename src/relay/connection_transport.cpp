#include "relay/connection_transport.h"

#include "logging/logger.h"
#include "network/media_codec.h"

#include <set>
#include <utility>

namespace relay {

using MediaRelay::ErrorCode;

namespace {

constexpr auto kErrorBackoff = std::chrono::milliseconds(5);

}  // namespace

const char* transportRoleToString(TransportRole role) {
    switch (role) {
    case TransportRole::Publisher:
        return "publisher";
    case TransportRole::Subscriber:
        return "subscriber";
    }
    return "publisher";
}

nlohmann::json transportStatsToJson(const TransportStats& stats) {
    nlohmann::json j;
    j["id"] = stats.id;
    j["role"] = transportRoleToString(stats.role);
    j["has_video"] = stats.hasVideo;
    j["has_audio"] = stats.hasAudio;
    j["has_screen"] = stats.hasScreen;
    j["closed"] = stats.closed;
    j["track_count"] = stats.trackCount;
    nlohmann::json streams = nlohmann::json::object();
    for (const auto& [ssrc, payloadType] : stats.payloadTypes) {
        streams[std::to_string(ssrc)] = payloadType;
    }
    j["streams"] = streams;
    j["byte_rate"] = stats.byteRate;
    j["loss_observed"] = stats.lossObserved;
    j["packets_read"] = stats.packetsRead;
    j["packets_written"] = stats.packetsWritten;
    j["consecutive_errors"] = stats.consecutiveErrors;
    j["total_errors"] = stats.totalErrors;
    j["track_misses"] = stats.trackMisses;
    j["keyframe_requests"] = stats.keyframeRequests;
    j["bandwidth_estimates"] = stats.bandwidthEstimates;
    j["retransmission_requests"] = stats.retransmissionRequests;
    j["feedback_reports"] = stats.feedbackReports;
    j["queued_packets"] = stats.queuedPackets;
    j["active_loops"] = stats.activeLoops;
    return j;
}

ConnectionTransport::ConnectionTransport(std::string id, TransportRole role,
                                         std::unique_ptr<Network::PeerConnection> connection,
                                         const RelayConfig& config, FeedbackResolver resolver)
    : id_(std::move(id)),
      role_(role),
      config_(config),
      connection_(std::move(connection)),
      resolver_(std::move(resolver)),
      tracks_(std::chrono::milliseconds(config.rateWindowMs)),
      packets_(config.packetQueueCapacity),
      keyframes_(RelayConstants::KEYFRAME_QUEUE_CAPACITY) {}

ConnectionTransport::~ConnectionTransport() {
    close();
}

ErrorCode ConnectionTransport::answerPublish(const Network::SessionDescription& offer,
                                             const nlohmann::json& options,
                                             StreamCallback onStream,
                                             Network::SessionDescription& answer) {
    if (role_ != TransportRole::Publisher) {
        LOG_WARN("[{}] answerPublish called on a subscriber transport", id_);
        return ErrorCode::NEGOTIATION_FAILED;
    }
    if (!connection_ || shutdown_.load()) {
        return ErrorCode::TRANSPORT_CLOSED;
    }
    if (negotiated_.exchange(true)) {
        return ErrorCode::NEGOTIATION_ALREADY_DONE;
    }

    Network::PublishOptions publishOptions;
    std::string error;
    ErrorCode rc = Network::publishOptionsFromJson(options, publishOptions, error);
    if (rc != ErrorCode::OK) {
        LOG_WARN("[{}] Rejecting publish: {}", id_, error);
        negotiated_.store(false);
        return rc;
    }
    hasVideo_.store(publishOptions.video);
    hasAudio_.store(publishOptions.audio);
    hasScreen_.store(publishOptions.screen);
    onStream_ = std::move(onStream);

    auto fail = [this](const char* step, ErrorCode cause) {
        LOG_ERROR("[{}] Publish negotiation failed at {}: {}", id_, step,
                  MediaRelay::errorCodeToString(cause));
        return ErrorCode::NEGOTIATION_FAILED;
    };

    if ((rc = connection_->registerCodec(Network::opusCapability())) != ErrorCode::OK) {
        return fail("registerCodec(opus)", rc);
    }
    if ((rc = connection_->registerCodec(Network::videoCapabilityFor(publishOptions.codec))) !=
        ErrorCode::OK) {
        return fail("registerCodec(video)", rc);
    }
    if ((rc = connection_->addTransceiver(Network::MediaKind::Video,
                                          Network::TransceiverDirection::RecvOnly)) !=
        ErrorCode::OK) {
        return fail("addTransceiver(video)", rc);
    }
    if ((rc = connection_->addTransceiver(Network::MediaKind::Audio,
                                          Network::TransceiverDirection::RecvOnly)) !=
        ErrorCode::OK) {
        return fail("addTransceiver(audio)", rc);
    }

    connection_->onTrack(
        [this](std::shared_ptr<Network::RemoteTrack> track) { handleInboundTrack(track); });

    if ((rc = connection_->setRemoteDescription(offer)) != ErrorCode::OK) {
        return fail("setRemoteDescription", rc);
    }
    if ((rc = connection_->createAnswer(answer)) != ErrorCode::OK) {
        return fail("createAnswer", rc);
    }
    if ((rc = connection_->setLocalDescription(answer)) != ErrorCode::OK) {
        return fail("setLocalDescription", rc);
    }

    if (publishOptions.video || publishOptions.screen) {
        spawn([this]() { keyframeTickerLoop(); });
    }
    for (auto& reader : connection_->receiverFeedback()) {
        if (reader) {
            spawn([this, reader]() { publisherFeedbackLoop(reader); });
        }
    }

    LOG_INFO("[{}] Publish negotiated (video={}, audio={}, screen={}, codec={})", id_,
             publishOptions.video, publishOptions.audio, publishOptions.screen,
             Network::codecToString(publishOptions.codec));
    return ErrorCode::OK;
}

ErrorCode ConnectionTransport::answerSubscribe(
    const Network::SessionDescription& offer,
    const std::map<uint32_t, uint8_t>& ssrcToPayloadType, const std::string& sessionId,
    Network::SessionDescription& answer) {
    if (role_ != TransportRole::Subscriber) {
        LOG_WARN("[{}] answerSubscribe called on a publisher transport", id_);
        return ErrorCode::NEGOTIATION_FAILED;
    }
    if (!connection_ || shutdown_.load()) {
        return ErrorCode::TRANSPORT_CLOSED;
    }
    if (ssrcToPayloadType.empty()) {
        return ErrorCode::NEGOTIATION_INVALID_OPTIONS;
    }
    if (negotiated_.exchange(true)) {
        return ErrorCode::NEGOTIATION_ALREADY_DONE;
    }

    auto fail = [this](const char* step, ErrorCode cause) {
        LOG_ERROR("[{}] Subscribe negotiation failed at {}: {}", id_, step,
                  MediaRelay::errorCodeToString(cause));
        return ErrorCode::NEGOTIATION_FAILED;
    };

    ErrorCode rc;
    std::set<uint8_t> registered;
    for (const auto& [ssrc, payloadType] : ssrcToPayloadType) {
        if (!registered.insert(payloadType).second) {
            continue;
        }
        auto codec = Network::codecForPayloadType(payloadType);
        auto capability = codec ? Network::videoCapabilityFor(*codec) : Network::opusCapability();
        capability.payloadType = payloadType;
        if ((rc = connection_->registerCodec(capability)) != ErrorCode::OK) {
            return fail("registerCodec", rc);
        }
    }

    std::vector<std::shared_ptr<Network::FeedbackReader>> senders;
    for (const auto& [ssrc, payloadType] : ssrcToPayloadType) {
        bool video = Network::isVideoPayloadType(payloadType);
        std::string label = video ? "video" : "audio";
        if (video) {
            hasVideo_.store(true);
        } else {
            hasAudio_.store(true);
        }

        std::shared_ptr<Network::LocalTrack> track;
        rc = connection_->createLocalTrack(payloadType, ssrc, label + "-" + std::to_string(ssrc),
                                           label, track);
        if (rc != ErrorCode::OK || !track) {
            return fail("createLocalTrack", rc);
        }
        std::shared_ptr<Network::FeedbackReader> sender;
        if ((rc = connection_->addTrack(track, sender)) != ErrorCode::OK) {
            return fail("addTrack", rc);
        }
        tracks_.addTrack(track);
        tracks_.setPayloadType(ssrc, payloadType);
        if (sender) {
            senders.push_back(std::move(sender));
        }
    }

    if ((rc = connection_->setRemoteDescription(offer)) != ErrorCode::OK) {
        return fail("setRemoteDescription", rc);
    }
    if ((rc = connection_->createAnswer(answer)) != ErrorCode::OK) {
        return fail("createAnswer", rc);
    }
    if ((rc = connection_->setLocalDescription(answer)) != ErrorCode::OK) {
        return fail("setLocalDescription", rc);
    }

    for (auto& sender : senders) {
        spawn([this, sender, sessionId]() { subscriberFeedbackLoop(sender, sessionId); });
    }

    LOG_INFO("[{}] Subscribe negotiated for session {} ({} tracks)", id_, sessionId,
             ssrcToPayloadType.size());
    return ErrorCode::OK;
}

ErrorCode ConnectionTransport::readPacket(Network::RtpPacketPtr& packet) {
    if (!packets_.pop(packet)) {
        return ErrorCode::TRANSPORT_CHANNEL_CLOSED;
    }
    return ErrorCode::OK;
}

ErrorCode ConnectionTransport::writePacket(const Network::RtpPacketPtr& packet) {
    if (!packet) {
        return ErrorCode::TRANSPORT_INVALID_PACKET;
    }
    if (shutdown_.load()) {
        return ErrorCode::TRANSPORT_CLOSED;
    }

    auto track = tracks_.findTrack(packet->header.ssrc);
    if (!track) {
        tracks_.addTrackMiss();
        LOG_DEBUG("[{}] No track for ssrc {}, dropping packet", id_, packet->header.ssrc);
        return ErrorCode::TRANSPORT_TRACK_NOT_FOUND;
    }

    ErrorCode rc = track->writeRtp(*packet);
    if (rc != ErrorCode::OK) {
        if (MediaRelay::isStreamTermination(rc)) {
            return ErrorCode::TRANSPORT_CLOSED;
        }
        tracks_.addError();
        LOG_EVERY_N(WARN, 100, "[{}] Write to ssrc {} failed: {}", id_, packet->header.ssrc,
                    MediaRelay::errorCodeToString(rc));
        return ErrorCode::TRANSPORT_IO_ERROR;
    }
    tracks_.clearErrors();
    packetsWritten_.fetch_add(1, std::memory_order_relaxed);
    return ErrorCode::OK;
}

std::map<uint32_t, uint8_t> ConnectionTransport::streamsAndPayloadTypes() const {
    return tracks_.payloadTypes();
}

void ConnectionTransport::close() {
    std::lock_guard<std::mutex> closeLock(closeMutex_);
    if (closed_) {
        return;
    }
    closed_ = true;

    // 1. Tear down the connection so blocking reads return end-of-stream
    if (connection_) {
        ErrorCode rc = connection_->close();
        LOG_IF(WARN, rc != ErrorCode::OK, "[{}] Peer connection close: {}", id_,
               MediaRelay::errorCodeToString(rc));
    }

    // 2. Reject producers, then raise the shutdown signal. Once shutdown_ reads true no
    //    push can succeed, and producers blocked on a full channel are released.
    {
        std::lock_guard<std::mutex> loopsLock(loopsMutex_);
        packets_.interruptProducers();
        keyframes_.interruptProducers();
        shutdown_.store(true);
    }
    {
        std::lock_guard<std::mutex> lock(shutdownMutex_);
    }
    shutdownCv_.notify_all();

    // 3. Join every loop
    std::vector<std::thread> loops;
    {
        std::lock_guard<std::mutex> loopsLock(loopsMutex_);
        loops.swap(loops_);
    }
    for (auto& loop : loops) {
        if (loop.joinable()) {
            loop.join();
        }
    }

    // 4. Close channels
    packets_.close();
    keyframes_.close();

    LOG_INFO("[{}] {} transport closed ({} loops joined)", id_, transportRoleToString(role_),
             loops.size());
}

void ConnectionTransport::requestKeyframe() {
    if (shutdown_.load()) {
        return;
    }
    if (!keyframes_.tryPush(KeyframeSignal{})) {
        LOG_TRACE("[{}] Keyframe request coalesced", id_);
    }
}

ErrorCode ConnectionTransport::sendBandwidthEstimate(double lossRate) {
    auto ssrc = tracks_.videoSsrc();
    if (!ssrc) {
        return ErrorCode::TRANSPORT_TRACK_NOT_FOUND;
    }
    auto estimate = buildBandwidthEstimate(lossRate, tracks_.byteRate(), *ssrc,
                                           config_.rembLowBandwidth, config_.rembHighBandwidth);
    if (!estimate) {
        LOG_DEBUG("[{}] Ignoring out-of-range loss rate {}", id_, lossRate);
        return ErrorCode::VALIDATION_INVALID_PARAMS;
    }

    ErrorCode rc = writeFeedback({*estimate});
    if (rc == ErrorCode::OK) {
        bandwidthEstimates_.fetch_add(1, std::memory_order_relaxed);
        LOG_DEBUG("[{}] Bandwidth estimate {} bps for ssrc {} (loss={:.3f})", id_,
                  estimate->bitrate, *ssrc, lossRate);
    }
    return rc;
}

ErrorCode ConnectionTransport::sendRetransmissionRequest(
    const Network::RetransmissionRequest& request) {
    ErrorCode rc = writeFeedback({request});
    if (rc == ErrorCode::OK) {
        retransmissionRequests_.fetch_add(1, std::memory_order_relaxed);
        tracks_.markLossObserved();
    }
    return rc;
}

TransportStats ConnectionTransport::stats() const {
    TransportStats stats;
    stats.id = id_;
    stats.role = role_;
    stats.hasVideo = hasVideo_.load();
    stats.hasAudio = hasAudio_.load();
    stats.hasScreen = hasScreen_.load();
    stats.closed = shutdown_.load();
    stats.trackCount = tracks_.trackCount();
    stats.payloadTypes = tracks_.payloadTypes();
    stats.byteRate = tracks_.byteRate();
    stats.lossObserved = tracks_.lossObserved();
    stats.packetsRead = packetsRead_.load();
    stats.packetsWritten = packetsWritten_.load();
    stats.consecutiveErrors = tracks_.errorCount();
    stats.totalErrors = tracks_.totalErrors();
    stats.trackMisses = tracks_.trackMissCount();
    stats.keyframeRequests = keyframeRequests_.load();
    stats.bandwidthEstimates = bandwidthEstimates_.load();
    stats.retransmissionRequests = retransmissionRequests_.load();
    stats.feedbackReports = feedbackReports_.load();
    stats.queuedPackets = packets_.size();
    {
        std::lock_guard<std::mutex> lock(loopsMutex_);
        stats.activeLoops = loops_.size();
    }
    return stats;
}

bool ConnectionTransport::spawn(std::function<void()> loop) {
    std::lock_guard<std::mutex> lock(loopsMutex_);
    if (shutdown_.load()) {
        return false;
    }
    loops_.emplace_back(std::move(loop));
    return true;
}

bool ConnectionTransport::waitForShutdown(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(shutdownMutex_);
    return shutdownCv_.wait_for(lock, timeout, [this]() { return shutdown_.load(); });
}

ErrorCode ConnectionTransport::writeFeedback(const std::vector<Network::FeedbackReport>& reports) {
    if (!connection_ || shutdown_.load()) {
        return ErrorCode::TRANSPORT_CLOSED;
    }
    ErrorCode rc = connection_->writeFeedback(reports);
    if (rc == ErrorCode::OK) {
        return rc;
    }
    if (MediaRelay::isStreamTermination(rc)) {
        return ErrorCode::TRANSPORT_CLOSED;
    }
    LOG_DEBUG("[{}] Feedback write failed: {}", id_, MediaRelay::errorCodeToString(rc));
    return ErrorCode::TRANSPORT_IO_ERROR;
}

void ConnectionTransport::handleInboundTrack(const std::shared_ptr<Network::RemoteTrack>& track) {
    if (!track || shutdown_.load()) {
        return;
    }
    uint32_t ssrc = track->ssrc();
    uint8_t payloadType = track->payloadType();
    tracks_.setPayloadType(ssrc, payloadType);
    LOG_INFO("[{}] Inbound stream ssrc={} pt={}", id_, ssrc, payloadType);
    if (onStream_) {
        onStream_(ssrc, payloadType);
    }

    if (Network::isVideoPayloadType(payloadType)) {
        lastVideoSsrc_.store(ssrc);
        hasVideoSsrc_.store(true);
        if (!keyframeWriterStarted_.exchange(true)) {
            spawn([this]() { keyframeWriterLoop(); });
        }
    }
    spawn([this, track]() { readLoop(track); });
}

void ConnectionTransport::readLoop(std::shared_ptr<Network::RemoteTrack> track) {
    const uint32_t ssrc = track->ssrc();
    while (!shutdown_.load()) {
        Network::RtpPacketPtr packet;
        ErrorCode rc = track->readRtp(packet);
        if (MediaRelay::isStreamTermination(rc)) {
            break;
        }
        if (rc != ErrorCode::OK) {
            tracks_.addError();
            LOG_EVERY_N(WARN, 100, "[{}] Read on ssrc {} failed: {}", id_, ssrc,
                        MediaRelay::errorCodeToString(rc));
            waitForShutdown(kErrorBackoff);
            continue;
        }
        if (!packet) {
            continue;
        }

        tracks_.recordBytes(packet->marshalSize(), TrackRegistry::Clock::now());
        if (Network::isVideoPayloadType(packet->header.payloadType)) {
            lastVideoSsrc_.store(packet->header.ssrc);
            hasVideoSsrc_.store(true);
        }
        packetsRead_.fetch_add(1, std::memory_order_relaxed);

        // Blocks while the channel is full; fails once shutdown is raised
        if (!packets_.push(std::move(packet))) {
            break;
        }
    }
    LOG_DEBUG("[{}] Read loop for ssrc {} exited", id_, ssrc);
}

void ConnectionTransport::keyframeTickerLoop() {
    const auto interval = std::chrono::milliseconds(config_.keyframeIntervalMs);
    while (!waitForShutdown(interval)) {
        if (!keyframes_.push(KeyframeSignal{})) {
            break;
        }
    }
    LOG_DEBUG("[{}] Keyframe ticker exited", id_);
}

void ConnectionTransport::keyframeWriterLoop() {
    const auto interval = std::chrono::milliseconds(config_.keyframeIntervalMs);
    while (!shutdown_.load()) {
        KeyframeSignal signal;
        if (!keyframes_.popFor(signal, interval)) {
            continue;
        }
        if (!hasVideoSsrc_.load()) {
            continue;
        }
        ErrorCode rc = writeFeedback({buildKeyframeRequest(lastVideoSsrc_.load())});
        if (rc == ErrorCode::OK) {
            keyframeRequests_.fetch_add(1, std::memory_order_relaxed);
        }
    }
    LOG_DEBUG("[{}] Keyframe writer exited", id_);
}

void ConnectionTransport::publisherFeedbackLoop(std::shared_ptr<Network::FeedbackReader> reader) {
    while (!shutdown_.load()) {
        std::vector<Network::FeedbackReport> reports;
        ErrorCode rc = reader->readFeedback(reports);
        if (MediaRelay::isStreamTermination(rc)) {
            break;
        }
        if (rc != ErrorCode::OK) {
            waitForShutdown(kErrorBackoff);
            continue;
        }
        feedbackReports_.fetch_add(reports.size(), std::memory_order_relaxed);
        for (const auto& report : reports) {
            LOG_TRACE("[{}] Publisher feedback: {}", id_, Network::feedbackReportName(report));
        }
    }
    LOG_DEBUG("[{}] Publisher feedback loop exited", id_);
}

void ConnectionTransport::subscriberFeedbackLoop(std::shared_ptr<Network::FeedbackReader> reader,
                                                 std::string sessionId) {
    while (!shutdown_.load()) {
        std::vector<Network::FeedbackReport> reports;
        ErrorCode rc = reader->readFeedback(reports);
        if (MediaRelay::isStreamTermination(rc)) {
            break;
        }
        if (rc != ErrorCode::OK) {
            waitForShutdown(kErrorBackoff);
            continue;
        }
        feedbackReports_.fetch_add(reports.size(), std::memory_order_relaxed);

        auto target = resolver_ ? resolver_(sessionId) : nullptr;
        if (!target) {
            LOG_EVERY_N(DEBUG, 50, "[{}] No pipeline for session {}, dropping feedback", id_,
                        sessionId);
            continue;
        }
        for (const auto& report : reports) {
            handleSubscriberReport(report, id_, *target);
        }
    }
    LOG_DEBUG("[{}] Subscriber feedback loop for session {} exited", id_, sessionId);
}

}  // namespace relay
