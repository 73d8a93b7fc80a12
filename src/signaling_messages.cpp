#include "signaling_messages.hpp"
#include "errors.hpp"

using json = nlohmann::json;

namespace sdc {

static std::string require_string(const json& msg, const char* key) {
    auto it = msg.find(key);
    if (it == msg.end() || !it->is_string() || it->get<std::string>().empty()) {
        throw CoreError(ErrorCode::InvalidRequest, std::string("Missing or invalid '") + key + "'");
    }
    return it->get<std::string>();
}

static std::optional<std::string> optional_string(const json& msg, const char* key) {
    auto it = msg.find(key);
    if (it == msg.end() || it->is_null()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw CoreError(ErrorCode::InvalidRequest, std::string("'") + key + "' must be a string");
    }
    if (it->get<std::string>().empty()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

static double require_number(const json& msg, const char* key) {
    auto it = msg.find(key);
    if (it == msg.end() || !it->is_number()) {
        throw CoreError(ErrorCode::InvalidRequest, std::string("Missing or non-numeric '") + key + "'");
    }
    return it->get<double>();
}

TelemetryMessage parse_telemetry(const json& msg) {
    if (!msg.is_object()) {
        throw CoreError(ErrorCode::InvalidRequest, "Telemetry must be a JSON object");
    }

    TelemetryMessage out;
    out.stream_id = require_string(msg, "streamId");
    out.viewer_id = optional_string(msg, "viewerId");
    out.sample.bandwidth_kbps = require_number(msg, "bandwidthKbps");
    out.sample.latency_ms = require_number(msg, "latencyMs");
    out.sample.packet_loss_pct = require_number(msg, "packetLossPct");
    out.sample.timestamp = std::chrono::system_clock::now();
    return out;
}

SignalingMessage parse_signaling_message(const std::string& text) {
    json msg;
    try {
        msg = json::parse(text);
    } catch (const json::parse_error& e) {
        throw CoreError(ErrorCode::InvalidRequest, std::string("Invalid JSON: ") + e.what());
    }
    return parse_signaling_message(msg);
}

SignalingMessage parse_signaling_message(const json& msg) {
    if (!msg.is_object()) {
        throw CoreError(ErrorCode::InvalidRequest, "Message must be a JSON object");
    }
    std::string type = require_string(msg, "type");

    if (type == "join") {
        JoinMessage m;
        m.stream_id = require_string(msg, "streamId");
        m.user_id = optional_string(msg, "userId").value_or("");
        std::string role = optional_string(msg, "role").value_or("viewer");
        auto parsed = parse_role(role);
        if (!parsed) {
            throw CoreError(ErrorCode::InvalidRequest, "Unknown role '" + role + "'");
        }
        m.role = *parsed;
        return m;
    }
    if (type == "leave") {
        return LeaveMessage{};
    }
    if (type == "offer" || type == "answer") {
        std::string target = require_string(msg, "targetId");
        std::string sdp = require_string(msg, "sdp");
        std::string stream = require_string(msg, "streamId");
        if (type == "offer") {
            return OfferMessage{target, sdp, stream};
        }
        return AnswerMessage{target, sdp, stream};
    }
    if (type == "iceCandidate") {
        IceCandidateMessage m;
        m.target_id = optional_string(msg, "targetId");
        auto it = msg.find("candidate");
        if (it == msg.end() || it->is_null()) {
            throw CoreError(ErrorCode::InvalidRequest, "Missing 'candidate'");
        }
        m.candidate = *it;
        m.stream_id = require_string(msg, "streamId");
        return m;
    }
    if (type == "connectionState") {
        return ConnectionStateMessage{require_string(msg, "state"), require_string(msg, "streamId")};
    }
    if (type == "broadcastStart") {
        return BroadcastStartMessage{require_string(msg, "streamId")};
    }
    if (type == "broadcastStop") {
        return BroadcastStopMessage{require_string(msg, "streamId")};
    }
    if (type == "qualityChange") {
        return QualityChangeMessage{require_string(msg, "quality")};
    }
    if (type == "telemetry") {
        return parse_telemetry(msg);
    }
    if (type == "getConfig") {
        return GetConfigMessage{};
    }
    if (type == "ping") {
        return PingMessage{};
    }

    throw CoreError(ErrorCode::InvalidRequest, "Unknown message type '" + type + "'");
}

const char* message_type(const SignalingMessage& message) {
    static const char* const names[] = {
        "join", "leave", "offer", "answer", "iceCandidate", "connectionState",
        "broadcastStart", "broadcastStop", "qualityChange", "telemetry", "getConfig", "ping",
    };
    static_assert(sizeof(names) / sizeof(names[0]) == std::variant_size_v<SignalingMessage>,
                  "message name table out of sync");
    return names[message.index()];
}

} // namespace sdc
