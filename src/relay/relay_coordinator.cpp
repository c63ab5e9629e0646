#include "relay/relay_coordinator.h"

#include "logging/logger.h"

namespace relay {

using MediaRelay::ErrorCode;
using json = nlohmann::json;

namespace {

// Format: { "status": "error", "error_code": "...", "message": "...", "inner_error": {...} }
std::string buildErrorResponse(ErrorCode code, const std::string& message) {
    json j;
    j["status"] = "error";
    j["error_code"] = MediaRelay::errorCodeToString(code);
    j["message"] = message;
    j["inner_error"]["cpp_code"] = MediaRelay::errorCodeToHex(code);
    j["inner_error"]["category"] = MediaRelay::getErrorCategory(code);
    return j.dump();
}

// Format: { "status": "ok", "message": "...", "data": {...} }
std::string buildOkResponse(const std::string& message, const json& data) {
    json j;
    j["status"] = "ok";
    j["message"] = message;
    if (!data.is_null()) {
        j["data"] = data;
    }
    return j.dump();
}

bool readDescription(const json& params, Network::SessionDescription& offer) {
    if (!params.contains("offer") || !params["offer"].is_object()) {
        return false;
    }
    const json& entry = params["offer"];
    if (!entry.contains("sdp") || !entry["sdp"].is_string()) {
        return false;
    }
    offer.type = entry.value("type", std::string("offer"));
    offer.sdp = entry["sdp"].get<std::string>();
    return true;
}

bool readString(const json& params, const char* key, std::string& out) {
    if (!params.contains(key) || !params[key].is_string()) {
        return false;
    }
    out = params[key].get<std::string>();
    return !out.empty();
}

json descriptionToJson(const Network::SessionDescription& description) {
    return json{{"type", description.type}, {"sdp", description.sdp}};
}

}  // namespace

RelayCoordinator::RelayCoordinator(Network::PeerConnectionFactory& factory,
                                   const RelayConfig& config)
    : factory_(factory), config_(config), registry_(config) {}

RelayCoordinator::~RelayCoordinator() {
    shutdown();
}

void RelayCoordinator::start() {
    registry_.startStatsSweep();
    LOG_INFO("Relay coordinator started (stats every {} ms)", config_.statIntervalMs);
}

ErrorCode RelayCoordinator::createTransport(const std::string& peerId, TransportRole role,
                                            std::shared_ptr<ConnectionTransport>& transport) {
    Network::PeerConnectionConfig pcConfig;
    pcConfig.iceServers = config_.iceServers;
    pcConfig.receiveMtu = config_.receiveMtu;

    std::unique_ptr<Network::PeerConnection> connection;
    ErrorCode rc = factory_.create(pcConfig, connection);
    if (rc != ErrorCode::OK || !connection) {
        LOG_ERROR("[{}] Failed to create peer connection: {}", peerId,
                  MediaRelay::errorCodeToString(rc));
        return ErrorCode::NEGOTIATION_FAILED;
    }
    transport = std::make_shared<ConnectionTransport>(peerId, role, std::move(connection), config_,
                                                      registry_.resolver());
    return ErrorCode::OK;
}

ErrorCode RelayCoordinator::publish(const std::string& sessionId, const std::string& peerId,
                                    const Network::SessionDescription& offer,
                                    const json& options, Network::SessionDescription& answer) {
    if (shutdown_.load()) {
        return ErrorCode::PIPELINE_CLOSED;
    }
    if (auto existing = registry_.find(sessionId); existing && existing->publisher()) {
        return ErrorCode::PIPELINE_PUBLISHER_EXISTS;
    }

    std::shared_ptr<ConnectionTransport> transport;
    ErrorCode rc = createTransport(peerId, TransportRole::Publisher, transport);
    if (rc != ErrorCode::OK) {
        return rc;
    }

    rc = transport->answerPublish(
        offer, options,
        [sessionId, peerId](uint32_t ssrc, uint8_t payloadType) {
            LOG_INFO("Session {}: publisher {} offers ssrc={} pt={}", sessionId, peerId, ssrc,
                     payloadType);
        },
        answer);
    if (rc != ErrorCode::OK) {
        transport->close();
        return rc;
    }

    rc = registry_.bindPublisher(sessionId, transport);
    if (rc != ErrorCode::OK) {
        transport->close();
        return rc;
    }
    return ErrorCode::OK;
}

ErrorCode RelayCoordinator::subscribe(const std::string& sessionId, const std::string& peerId,
                                      const Network::SessionDescription& offer,
                                      Network::SessionDescription& answer) {
    if (shutdown_.load()) {
        return ErrorCode::PIPELINE_CLOSED;
    }
    auto pipeline = registry_.find(sessionId);
    auto publisher = pipeline ? pipeline->publisher() : nullptr;
    if (!publisher) {
        return ErrorCode::PIPELINE_NO_PUBLISHER;
    }
    auto streams = publisher->streamsAndPayloadTypes();
    if (streams.empty()) {
        LOG_WARN("Session {}: publisher {} has no inbound streams yet", sessionId,
                 publisher->id());
        return ErrorCode::PIPELINE_NO_PUBLISHER;
    }

    std::shared_ptr<ConnectionTransport> transport;
    ErrorCode rc = createTransport(peerId, TransportRole::Subscriber, transport);
    if (rc != ErrorCode::OK) {
        return rc;
    }

    rc = transport->answerSubscribe(offer, streams, sessionId, answer);
    if (rc != ErrorCode::OK) {
        transport->close();
        return rc;
    }

    rc = registry_.addSubscriber(sessionId, transport);
    if (rc != ErrorCode::OK) {
        transport->close();
        return rc;
    }
    return ErrorCode::OK;
}

ErrorCode RelayCoordinator::unpublish(const std::string& sessionId) {
    return registry_.removePublisher(sessionId);
}

ErrorCode RelayCoordinator::unsubscribe(const std::string& sessionId, const std::string& peerId) {
    return registry_.removeSubscriber(sessionId, peerId);
}

bool RelayCoordinator::handleCommand(const std::string& cmdType, const json& message,
                                     std::string& responseOut) {
    static const json kEmpty = json::object();
    const json& params =
        message.contains("params") && message["params"].is_object() ? message["params"] : kEmpty;

    if (cmdType == "stats") {
        responseOut = buildOkResponse("Relay statistics", registry_.sweepStats());
        return true;
    }

    bool known = cmdType == "publish" || cmdType == "subscribe" || cmdType == "unpublish" ||
                 cmdType == "unsubscribe";
    if (!known) {
        responseOut = buildErrorResponse(ErrorCode::VALIDATION_INVALID_COMMAND,
                                         "Unknown command: " + cmdType);
        return false;
    }

    std::string sessionId;
    if (!readString(params, "session_id", sessionId)) {
        responseOut = buildErrorResponse(ErrorCode::VALIDATION_INVALID_PARAMS,
                                         "Missing params.session_id");
        return true;
    }

    if (cmdType == "unpublish") {
        ErrorCode rc = unpublish(sessionId);
        if (rc != ErrorCode::OK) {
            responseOut = buildErrorResponse(rc, "Unpublish failed for session " + sessionId);
            return true;
        }
        responseOut = buildOkResponse("Publisher removed", json{{"session_id", sessionId}});
        return true;
    }

    std::string peerId;
    if (!readString(params, "peer_id", peerId)) {
        responseOut =
            buildErrorResponse(ErrorCode::VALIDATION_INVALID_PARAMS, "Missing params.peer_id");
        return true;
    }

    if (cmdType == "unsubscribe") {
        ErrorCode rc = unsubscribe(sessionId, peerId);
        if (rc != ErrorCode::OK) {
            responseOut = buildErrorResponse(rc, "Unsubscribe failed for peer " + peerId);
            return true;
        }
        responseOut = buildOkResponse("Subscriber removed",
                                      json{{"session_id", sessionId}, {"peer_id", peerId}});
        return true;
    }

    Network::SessionDescription offer;
    if (!readDescription(params, offer)) {
        responseOut = buildErrorResponse(ErrorCode::VALIDATION_INVALID_PARAMS,
                                         "Missing params.offer.sdp");
        return true;
    }

    Network::SessionDescription answer;
    ErrorCode rc;
    if (cmdType == "publish") {
        json options = params.contains("options") ? params["options"] : json();
        rc = publish(sessionId, peerId, offer, options, answer);
    } else {
        rc = subscribe(sessionId, peerId, offer, answer);
    }
    if (rc != ErrorCode::OK) {
        responseOut = buildErrorResponse(rc, cmdType + " failed for peer " + peerId);
        return true;
    }

    json data;
    data["session_id"] = sessionId;
    data["peer_id"] = peerId;
    data["answer"] = descriptionToJson(answer);
    responseOut = buildOkResponse(cmdType == "publish" ? "Publishing" : "Subscribed", data);
    return true;
}

void RelayCoordinator::shutdown() {
    if (shutdown_.exchange(true)) {
        return;
    }
    registry_.stopStatsSweep();
    registry_.closeAll();
    LOG_INFO("Relay coordinator stopped");
    media_relay::logging::flush();
}

}  // namespace relay
