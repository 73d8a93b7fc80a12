#pragma once

#include "message_sink.hpp"
#include "room_registry.hpp"
#include "signaling_messages.hpp"
#include <string>

namespace sdc {

// Relays signaling payloads between members of the same room. Holds no state;
// membership comes from the registry at the time of each call.
//
// Every relay throws CoreError(NotInRoom) when the sender is not in the room the
// message names. Point-to-point relays return false when the target has gone
// away; broadcast relays return the number of members reached.
class SignalingRouter {
public:
    SignalingRouter(RoomRegistry& registry, MessageSink& sink);

    bool relay_offer(const std::string& sender_id, const OfferMessage& msg);
    bool relay_answer(const std::string& sender_id, const AnswerMessage& msg);

    // With a target: point-to-point. Without: every other member.
    size_t relay_ice_candidate(const std::string& sender_id, const IceCandidateMessage& msg);

    size_t relay_connection_state(const std::string& sender_id, const ConnectionStateMessage& msg);

    // Throw CoreError(Unauthorized) unless the sender joined as broadcaster
    size_t relay_broadcast_start(const std::string& sender_id, const BroadcastStartMessage& msg);
    size_t relay_broadcast_stop(const std::string& sender_id, const BroadcastStopMessage& msg);

    // Goes to the sender's current room. Throws CoreError(InvalidRequest) for unknown qualities.
    size_t relay_quality_change(const std::string& sender_id, const QualityChangeMessage& msg);

private:
    ConnectionInfo require_member(const std::string& sender_id, const std::string& stream_id) const;
    void require_broadcaster(const ConnectionInfo& sender, const char* action) const;
    bool send_to_target(const ConnectionInfo& sender, const std::string& target_id,
                        const nlohmann::json& message);

    RoomRegistry& registry_;
    MessageSink& sink_;
};

} // namespace sdc
