// Abstract boundary to the real-time protocol stack (ICE/DTLS, SDP, RTP/RTCP codec).
#ifndef PEER_CONNECTION_H
#define PEER_CONNECTION_H

#include "core/error_codes.h"
#include "network/media_codec.h"
#include "network/rtcp_feedback.h"
#include "network/rtp_packet.h"

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace Network {

enum class TransceiverDirection { RecvOnly, SendOnly, SendRecv };

struct SessionDescription {
    std::string type;  // "offer" or "answer"
    std::string sdp;
};

struct PeerConnectionConfig {
    std::vector<std::string> iceServers;
    size_t receiveMtu = 0;
};

// Inbound stream discovered after negotiation.
class RemoteTrack {
   public:
    virtual ~RemoteTrack() = default;

    virtual uint32_t ssrc() const = 0;
    virtual uint8_t payloadType() const = 0;
    virtual MediaKind kind() const = 0;

    // Blocks until the next packet arrives. Returns TRANSPORT_END_OF_STREAM once the
    // owning connection is closed.
    virtual MediaRelay::ErrorCode readRtp(RtpPacketPtr& packet) = 0;
};

// Outbound track. Packets are written unmodified.
class LocalTrack {
   public:
    virtual ~LocalTrack() = default;

    virtual uint32_t ssrc() const = 0;
    virtual uint8_t payloadType() const = 0;
    virtual const std::string& label() const = 0;

    virtual MediaRelay::ErrorCode writeRtp(const RtpPacket& packet) = 0;
};

// Feedback side of an RTP sender or receiver.
class FeedbackReader {
   public:
    virtual ~FeedbackReader() = default;

    // Blocks until at least one report arrives. Returns TRANSPORT_END_OF_STREAM once the
    // owning connection is closed.
    virtual MediaRelay::ErrorCode readFeedback(std::vector<FeedbackReport>& reports) = 0;
};

class PeerConnection {
   public:
    using TrackHandler = std::function<void(std::shared_ptr<RemoteTrack>)>;

    virtual ~PeerConnection() = default;

    virtual MediaRelay::ErrorCode registerCodec(const CodecCapability& capability) = 0;
    virtual MediaRelay::ErrorCode addTransceiver(MediaKind kind,
                                                 TransceiverDirection direction) = 0;

    virtual MediaRelay::ErrorCode createLocalTrack(uint8_t payloadType, uint32_t ssrc,
                                                   const std::string& id,
                                                   const std::string& label,
                                                   std::shared_ptr<LocalTrack>& track) = 0;
    // Attaches track to the connection; sender receives the feedback reader of the
    // resulting RTP sender.
    virtual MediaRelay::ErrorCode addTrack(const std::shared_ptr<LocalTrack>& track,
                                           std::shared_ptr<FeedbackReader>& sender) = 0;

    // Invoked from a protocol stack thread for every inbound stream.
    virtual void onTrack(TrackHandler handler) = 0;

    virtual MediaRelay::ErrorCode setRemoteDescription(const SessionDescription& offer) = 0;
    virtual MediaRelay::ErrorCode createAnswer(SessionDescription& answer) = 0;
    virtual MediaRelay::ErrorCode setLocalDescription(const SessionDescription& answer) = 0;

    // Feedback readers of every RTP receiver, valid after negotiation.
    virtual std::vector<std::shared_ptr<FeedbackReader>> receiverFeedback() = 0;

    virtual MediaRelay::ErrorCode writeFeedback(const std::vector<FeedbackReport>& reports) = 0;

    // Unblocks every pending readRtp and readFeedback with TRANSPORT_END_OF_STREAM.
    virtual MediaRelay::ErrorCode close() = 0;
};

class PeerConnectionFactory {
   public:
    virtual ~PeerConnectionFactory() = default;

    virtual MediaRelay::ErrorCode create(const PeerConnectionConfig& config,
                                         std::unique_ptr<PeerConnection>& connection) = 0;
};

}  // namespace Network

#endif  // PEER_CONNECTION_H
