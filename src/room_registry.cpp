#include "room_registry.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

using json = nlohmann::json;

namespace sdc {

const char* role_name(PeerRole role) {
    switch (role) {
        case PeerRole::Broadcaster: return "broadcaster";
        case PeerRole::Viewer: return "viewer";
    }
    return "unknown";
}

std::optional<PeerRole> parse_role(const std::string& name) {
    if (name == "broadcaster") return PeerRole::Broadcaster;
    if (name == "viewer") return PeerRole::Viewer;
    return std::nullopt;
}

RoomRegistry::RoomRegistry(MessageSink& sink)
    : sink_(sink)
{
}

// ─── Lookups ─────────────────────────────────────────────────────────────────

std::shared_ptr<RoomRegistry::Connection>
RoomRegistry::find_connection(const std::string& connection_id) const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    auto it = connections_.find(connection_id);
    return it == connections_.end() ? nullptr : it->second;
}

std::shared_ptr<RoomRegistry::Room> RoomRegistry::find_room(const std::string& stream_id) const {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    auto it = rooms_.find(stream_id);
    return it == rooms_.end() ? nullptr : it->second;
}

std::shared_ptr<RoomRegistry::Room> RoomRegistry::find_or_create_room(const std::string& stream_id) {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    auto& slot = rooms_[stream_id];
    if (!slot || slot->closed) {
        slot = std::make_shared<Room>();
        slot->id = stream_id;
        slot->created_at = std::chrono::system_clock::now();
        spdlog::info("[{}] Room created", stream_id);
    }
    return slot;
}

size_t RoomRegistry::connection_count() const {
    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.size();
}

size_t RoomRegistry::room_count() const {
    std::lock_guard<std::mutex> lock(rooms_mutex_);
    return rooms_.size();
}

// ─── Membership ──────────────────────────────────────────────────────────────

bool RoomRegistry::register_connection(const std::string& connection_id) {
    auto conn = std::make_shared<Connection>();
    conn->id = connection_id;

    std::lock_guard<std::mutex> lock(connections_mutex_);
    return connections_.emplace(connection_id, std::move(conn)).second;
}

RoomSnapshot RoomRegistry::join(const std::string& connection_id, const std::string& stream_id,
                                PeerRole role, const std::string& user_id) {
    if (stream_id.empty()) {
        throw CoreError(ErrorCode::InvalidRequest, "Stream id is required to join");
    }

    auto conn = find_connection(connection_id);
    if (!conn) {
        throw CoreError(ErrorCode::NotFound, "Unknown connection " + connection_id);
    }

    std::lock_guard<std::mutex> conn_lock(conn->mutex);
    if (conn->closed) {
        throw CoreError(ErrorCode::NotFound, "Connection " + connection_id + " is closed");
    }

    if (conn->room) {
        if (conn->room->id != stream_id) {
            throw CoreError(ErrorCode::AlreadyInDifferentRoom,
                            "Connection " + connection_id + " is already in room " + conn->room->id);
        }
        std::lock_guard<std::mutex> room_lock(conn->room->mutex);
        return snapshot_locked(*conn->room);
    }

    // A room found closed was emptied between lookup and lock; take the fresh one
    for (;;) {
        auto room = find_or_create_room(stream_id);
        std::lock_guard<std::mutex> room_lock(room->mutex);
        if (room->closed) {
            continue;
        }

        auto now = std::chrono::system_clock::now();
        conn->room = room;
        conn->role = role;
        conn->user_id = user_id;
        conn->joined_at = now;

        MemberSnapshot member;
        member.connection_id = connection_id;
        member.user_id = user_id;
        member.role = role;
        member.state = conn->state;
        member.joined_at = now;
        room->members[connection_id] = member;

        json notice = {
            {"type", "peerJoined"},
            {"connectionId", connection_id},
            {"userId", user_id},
            {"role", role_name(role)},
        };
        broadcast_locked(*room, connection_id, notice);

        spdlog::info("[{}] {} joined as {} ({} member(s))", stream_id, connection_id,
                     role_name(role), room->members.size());
        return snapshot_locked(*room);
    }
}

std::optional<std::string> RoomRegistry::leave(const std::string& connection_id) {
    auto conn = find_connection(connection_id);
    if (!conn) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> conn_lock(conn->mutex);
    return leave_locked(*conn, "peerLeft");
}

std::optional<std::string> RoomRegistry::on_disconnect(const std::string& connection_id) {
    std::shared_ptr<Connection> conn;
    {
        std::lock_guard<std::mutex> lock(connections_mutex_);
        auto it = connections_.find(connection_id);
        if (it == connections_.end()) {
            return std::nullopt;
        }
        conn = it->second;
        connections_.erase(it);
    }

    std::lock_guard<std::mutex> conn_lock(conn->mutex);
    conn->closed = true;
    auto room_id = leave_locked(*conn, "peerDisconnected");
    spdlog::info("Connection {} closed{}", connection_id,
                 room_id ? " (left " + *room_id + ")" : "");
    return room_id;
}

std::optional<std::string> RoomRegistry::leave_locked(Connection& conn, const char* notify_type) {
    if (!conn.room) {
        return std::nullopt;
    }

    std::shared_ptr<Room> room = std::move(conn.room);
    std::string room_id = room->id;

    std::lock_guard<std::mutex> room_lock(room->mutex);

    // Remaining members hear about it before the removal is visible
    json notice = {
        {"type", notify_type},
        {"connectionId", conn.id},
        {"userId", conn.user_id},
    };
    broadcast_locked(*room, conn.id, notice);

    room->members.erase(conn.id);
    spdlog::info("[{}] {} left ({} member(s))", room_id, conn.id, room->members.size());

    if (room->members.empty()) {
        std::lock_guard<std::mutex> rooms_lock(rooms_mutex_);
        room->closed = true;
        auto it = rooms_.find(room_id);
        if (it != rooms_.end() && it->second == room) {
            rooms_.erase(it);
            spdlog::info("[{}] Room removed", room_id);
        }
    }
    return room_id;
}

std::optional<std::string> RoomRegistry::update_connection_state(const std::string& connection_id,
                                                                 const std::string& state) {
    auto conn = find_connection(connection_id);
    if (!conn) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> conn_lock(conn->mutex);
    conn->state = state;
    if (!conn->room) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> room_lock(conn->room->mutex);
    auto it = conn->room->members.find(connection_id);
    if (it != conn->room->members.end()) {
        it->second.state = state;
    }
    return conn->room->id;
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::optional<ConnectionInfo> RoomRegistry::lookup(const std::string& connection_id) const {
    auto conn = find_connection(connection_id);
    if (!conn) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(conn->mutex);
    if (conn->closed) {
        return std::nullopt;
    }

    ConnectionInfo info;
    info.connection_id = conn->id;
    info.user_id = conn->user_id;
    info.role = conn->role;
    info.state = conn->state;
    info.joined_at = conn->joined_at;
    if (conn->room) {
        info.room_id = conn->room->id;
    }
    return info;
}

RoomSnapshot RoomRegistry::snapshot_locked(const Room& room) {
    RoomSnapshot snap;
    snap.stream_id = room.id;
    snap.created_at = room.created_at;
    snap.connection_count = room.members.size();
    for (const auto& [id, member] : room.members) {
        if (member.role == PeerRole::Broadcaster) {
            snap.broadcaster_count++;
        } else {
            snap.viewer_count++;
        }
        snap.members.push_back(member);
    }
    return snap;
}

std::optional<RoomSnapshot> RoomRegistry::room_stats(const std::string& stream_id) const {
    auto room = find_room(stream_id);
    if (!room) {
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(room->mutex);
    if (room->closed) {
        return std::nullopt;
    }
    return snapshot_locked(*room);
}

std::vector<RoomSnapshot> RoomRegistry::all_rooms() const {
    std::vector<std::shared_ptr<Room>> rooms;
    {
        std::lock_guard<std::mutex> lock(rooms_mutex_);
        for (const auto& [id, room] : rooms_) {
            rooms.push_back(room);
        }
    }

    std::vector<RoomSnapshot> out;
    for (const auto& room : rooms) {
        std::lock_guard<std::mutex> lock(room->mutex);
        if (!room->closed) {
            out.push_back(snapshot_locked(*room));
        }
    }
    std::sort(out.begin(), out.end(), [](const RoomSnapshot& a, const RoomSnapshot& b) {
        return a.stream_id < b.stream_id;
    });
    return out;
}

// ─── Delivery ────────────────────────────────────────────────────────────────

size_t RoomRegistry::broadcast(const std::string& stream_id, const std::string& exclude_id,
                               const json& message) {
    auto room = find_room(stream_id);
    if (!room) {
        return 0;
    }

    std::lock_guard<std::mutex> lock(room->mutex);
    if (room->closed) {
        return 0;
    }
    return broadcast_locked(*room, exclude_id, message);
}

size_t RoomRegistry::broadcast_locked(const Room& room, const std::string& exclude_id,
                                      const json& message) {
    size_t delivered = 0;
    for (const auto& [id, member] : room.members) {
        if (id == exclude_id) continue;
        try {
            if (sink_.send(id, message)) {
                delivered++;
            }
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Delivery to {} failed: {}", room.id, id, e.what());
        }
    }
    return delivered;
}

} // namespace sdc
