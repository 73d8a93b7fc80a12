#include "signaling_router.hpp"
#include "errors.hpp"
#include "quality_variant.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace sdc {

SignalingRouter::SignalingRouter(RoomRegistry& registry, MessageSink& sink)
    : registry_(registry)
    , sink_(sink)
{
}

ConnectionInfo SignalingRouter::require_member(const std::string& sender_id,
                                               const std::string& stream_id) const {
    auto sender = registry_.lookup(sender_id);
    if (!sender || !sender->room_id || *sender->room_id != stream_id) {
        spdlog::warn("[{}] Rejected relay to room {}: sender is not a member", sender_id, stream_id);
        throw CoreError(ErrorCode::NotInRoom, "Not a member of room " + stream_id);
    }
    return *sender;
}

void SignalingRouter::require_broadcaster(const ConnectionInfo& sender, const char* action) const {
    if (sender.role != PeerRole::Broadcaster) {
        spdlog::warn("[{}] Unauthorized {} in room {} (role {})", sender.connection_id, action,
                     sender.room_id.value_or(""), role_name(sender.role));
        throw CoreError(ErrorCode::Unauthorized, std::string("Only the broadcaster may send ") + action);
    }
}

bool SignalingRouter::send_to_target(const ConnectionInfo& sender, const std::string& target_id,
                                     const json& message) {
    auto target = registry_.lookup(target_id);
    if (!target) {
        spdlog::info("[{}] Dropped {} for {}: target is no longer connected",
                     sender.connection_id, message.value("type", ""), target_id);
        return false;
    }
    if (target->room_id != sender.room_id) {
        spdlog::warn("[{}] Rejected {} to {}: target is in another room",
                     sender.connection_id, message.value("type", ""), target_id);
        throw CoreError(ErrorCode::NotInRoom, "Target " + target_id + " is not in this room");
    }

    try {
        return sink_.send(target_id, message);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Delivery to {} failed: {}", sender.connection_id, target_id, e.what());
        return false;
    }
}

// ─── Point-to-point ──────────────────────────────────────────────────────────

bool SignalingRouter::relay_offer(const std::string& sender_id, const OfferMessage& msg) {
    ConnectionInfo sender = require_member(sender_id, msg.stream_id);
    json out = {
        {"type", "offer"},
        {"fromId", sender_id},
        {"sdp", msg.sdp},
        {"streamId", msg.stream_id},
    };
    spdlog::debug("[{}] Offer -> {}", sender_id, msg.target_id);
    return send_to_target(sender, msg.target_id, out);
}

bool SignalingRouter::relay_answer(const std::string& sender_id, const AnswerMessage& msg) {
    ConnectionInfo sender = require_member(sender_id, msg.stream_id);
    json out = {
        {"type", "answer"},
        {"fromId", sender_id},
        {"sdp", msg.sdp},
        {"streamId", msg.stream_id},
    };
    spdlog::debug("[{}] Answer -> {}", sender_id, msg.target_id);
    return send_to_target(sender, msg.target_id, out);
}

size_t SignalingRouter::relay_ice_candidate(const std::string& sender_id,
                                            const IceCandidateMessage& msg) {
    ConnectionInfo sender = require_member(sender_id, msg.stream_id);
    json out = {
        {"type", "iceCandidate"},
        {"fromId", sender_id},
        {"candidate", msg.candidate},
        {"streamId", msg.stream_id},
    };

    if (msg.target_id) {
        return send_to_target(sender, *msg.target_id, out) ? 1 : 0;
    }
    return registry_.broadcast(msg.stream_id, sender_id, out);
}

// ─── Room-wide ───────────────────────────────────────────────────────────────

size_t SignalingRouter::relay_connection_state(const std::string& sender_id,
                                               const ConnectionStateMessage& msg) {
    require_member(sender_id, msg.stream_id);
    registry_.update_connection_state(sender_id, msg.state);
    spdlog::debug("[{}] Connection state: {}", sender_id, msg.state);

    json out = {
        {"type", "peerConnectionState"},
        {"connectionId", sender_id},
        {"state", msg.state},
    };
    return registry_.broadcast(msg.stream_id, sender_id, out);
}

size_t SignalingRouter::relay_broadcast_start(const std::string& sender_id,
                                              const BroadcastStartMessage& msg) {
    ConnectionInfo sender = require_member(sender_id, msg.stream_id);
    require_broadcaster(sender, "broadcastStart");

    json out = {
        {"type", "broadcastStarted"},
        {"broadcasterId", sender_id},
        {"streamId", msg.stream_id},
    };
    size_t reached = registry_.broadcast(msg.stream_id, sender_id, out);
    spdlog::info("[{}] Broadcast started by {} ({} viewer(s) notified)",
                 msg.stream_id, sender_id, reached);
    return reached;
}

size_t SignalingRouter::relay_broadcast_stop(const std::string& sender_id,
                                             const BroadcastStopMessage& msg) {
    ConnectionInfo sender = require_member(sender_id, msg.stream_id);
    require_broadcaster(sender, "broadcastStop");

    json out = {
        {"type", "broadcastStopped"},
        {"broadcasterId", sender_id},
        {"streamId", msg.stream_id},
    };
    size_t reached = registry_.broadcast(msg.stream_id, sender_id, out);
    spdlog::info("[{}] Broadcast stopped by {}", msg.stream_id, sender_id);
    return reached;
}

size_t SignalingRouter::relay_quality_change(const std::string& sender_id,
                                             const QualityChangeMessage& msg) {
    if (!find_variant(msg.quality)) {
        throw CoreError(ErrorCode::InvalidRequest, "Unknown quality '" + msg.quality + "'");
    }

    auto sender = registry_.lookup(sender_id);
    if (!sender || !sender->room_id) {
        spdlog::warn("[{}] Rejected qualityChange: not in a room", sender_id);
        throw CoreError(ErrorCode::NotInRoom, "Join a room before changing quality");
    }

    json out = {
        {"type", "qualityChanged"},
        {"fromId", sender_id},
        {"quality", msg.quality},
    };
    spdlog::debug("[{}] Quality change to {} in {}", sender_id, msg.quality, *sender->room_id);
    return registry_.broadcast(*sender->room_id, sender_id, out);
}

} // namespace sdc
