#pragma once

#include "message_sink.hpp"
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace sdc {

enum class PeerRole {
    Broadcaster,
    Viewer,
};

const char* role_name(PeerRole role);
std::optional<PeerRole> parse_role(const std::string& name);

struct ConnectionInfo {
    std::string connection_id;
    std::string user_id;
    std::optional<std::string> room_id;
    PeerRole role = PeerRole::Viewer;
    std::string state = "new";
    std::chrono::system_clock::time_point joined_at;
};

struct MemberSnapshot {
    std::string connection_id;
    std::string user_id;
    PeerRole role = PeerRole::Viewer;
    std::string state;
    std::chrono::system_clock::time_point joined_at;
};

struct RoomSnapshot {
    std::string stream_id;
    size_t connection_count = 0;
    size_t broadcaster_count = 0;
    size_t viewer_count = 0;
    std::chrono::system_clock::time_point created_at;
    std::vector<MemberSnapshot> members;  // ordered by connection id
};

// Rooms (one per stream) and connections (one per transport session).
// Lock order: connection, then room, then the rooms map. The maps are only
// held for lookups; work on a room is serialized by that room's mutex.
class RoomRegistry {
public:
    explicit RoomRegistry(MessageSink& sink);

    // Non-copyable
    RoomRegistry(const RoomRegistry&) = delete;
    RoomRegistry& operator=(const RoomRegistry&) = delete;

    // Called on transport connect. Returns false if the id is already registered.
    bool register_connection(const std::string& connection_id);

    // Idempotent for the same room. Notifies the other members with peerJoined.
    // Throws CoreError: NotFound (unknown connection), InvalidRequest (empty stream id),
    // AlreadyInDifferentRoom.
    RoomSnapshot join(const std::string& connection_id, const std::string& stream_id,
                      PeerRole role, const std::string& user_id);

    // Returns the room that was left; nullopt when not in a room
    std::optional<std::string> leave(const std::string& connection_id);

    // Transport closed. Safe to call more than once; only the first call evicts.
    std::optional<std::string> on_disconnect(const std::string& connection_id);

    // Records the peer's reported transport state; returns its room, if any
    std::optional<std::string> update_connection_state(const std::string& connection_id,
                                                       const std::string& state);

    std::optional<ConnectionInfo> lookup(const std::string& connection_id) const;
    std::optional<RoomSnapshot> room_stats(const std::string& stream_id) const;
    std::vector<RoomSnapshot> all_rooms() const;

    // Delivers to every member of the room except `exclude_id`; returns the count
    size_t broadcast(const std::string& stream_id, const std::string& exclude_id,
                     const nlohmann::json& message);

    size_t connection_count() const;
    size_t room_count() const;

private:
    struct Room;

    struct Connection {
        std::mutex mutex;
        std::string id;
        std::string user_id;
        PeerRole role = PeerRole::Viewer;
        std::string state = "new";
        std::chrono::system_clock::time_point joined_at;
        std::shared_ptr<Room> room;
        bool closed = false;
    };

    struct Room {
        mutable std::mutex mutex;
        std::string id;
        std::chrono::system_clock::time_point created_at;
        std::map<std::string, MemberSnapshot> members;
        bool closed = false;  // set once emptied, under both mutex and rooms_mutex_; a joiner holding it must retry
    };

    std::shared_ptr<Connection> find_connection(const std::string& connection_id) const;
    std::shared_ptr<Room> find_room(const std::string& stream_id) const;
    std::shared_ptr<Room> find_or_create_room(const std::string& stream_id);

    // Caller holds conn.mutex
    std::optional<std::string> leave_locked(Connection& conn, const char* notify_type);

    static RoomSnapshot snapshot_locked(const Room& room);
    size_t broadcast_locked(const Room& room, const std::string& exclude_id,
                            const nlohmann::json& message);

    MessageSink& sink_;

    mutable std::mutex connections_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Connection>> connections_;

    mutable std::mutex rooms_mutex_;
    std::unordered_map<std::string, std::shared_ptr<Room>> rooms_;
};

} // namespace sdc
