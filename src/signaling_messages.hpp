#pragma once

#include "network_classifier.hpp"
#include "room_registry.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>

namespace sdc {

// ─── Inbound signaling messages ──────────────────────────────────────────────

struct JoinMessage {
    std::string stream_id;
    std::string user_id;
    PeerRole role = PeerRole::Viewer;
};

struct LeaveMessage {};

struct OfferMessage {
    std::string target_id;
    std::string sdp;
    std::string stream_id;
};

struct AnswerMessage {
    std::string target_id;
    std::string sdp;
    std::string stream_id;
};

// No target means "every other member of the room"
struct IceCandidateMessage {
    std::optional<std::string> target_id;
    nlohmann::json candidate;
    std::string stream_id;
};

struct ConnectionStateMessage {
    std::string state;
    std::string stream_id;
};

struct BroadcastStartMessage {
    std::string stream_id;
};

struct BroadcastStopMessage {
    std::string stream_id;
};

struct QualityChangeMessage {
    std::string quality;
};

struct TelemetryMessage {
    std::string stream_id;
    std::optional<std::string> viewer_id;  // defaults to the sending connection
    NetworkSample sample;
};

struct GetConfigMessage {};

struct PingMessage {};

using SignalingMessage = std::variant<
    JoinMessage,
    LeaveMessage,
    OfferMessage,
    AnswerMessage,
    IceCandidateMessage,
    ConnectionStateMessage,
    BroadcastStartMessage,
    BroadcastStopMessage,
    QualityChangeMessage,
    TelemetryMessage,
    GetConfigMessage,
    PingMessage>;

// Throws CoreError(InvalidRequest) for malformed JSON, unknown types and missing fields
SignalingMessage parse_signaling_message(const std::string& text);
SignalingMessage parse_signaling_message(const nlohmann::json& msg);
inline SignalingMessage parse_signaling_message(const char* text) {
    return parse_signaling_message(std::string(text));
}

// Telemetry body shared by the WebSocket and HTTP paths
TelemetryMessage parse_telemetry(const nlohmann::json& msg);

const char* message_type(const SignalingMessage& message);

} // namespace sdc
