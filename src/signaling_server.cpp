#include "signaling_server.hpp"
#include "api_json.hpp"
#include "errors.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace sdc {

SignalingServer::SignalingServer(const AppConfig& config, AbrSessionManager& abr)
    : config_(config)
    , abr_(abr)
    , registry_(*this)
    , router_(registry_, *this)
{
}

SignalingServer::~SignalingServer() {
    stop();
}

bool SignalingServer::start() {
    try {
        rtc::WebSocketServer::Configuration ws_config;
        ws_config.port = config_.server.signaling_port;
        ws_config.enableTls = false;

        ws_server_ = std::make_shared<rtc::WebSocketServer>(ws_config);

        ws_server_->onClient([this](std::shared_ptr<rtc::WebSocket> ws) {
            on_client_connected(ws);
        });

        running_.store(true);
        spdlog::info("Signaling server listening on ws://0.0.0.0:{}", config_.server.signaling_port);
        return true;

    } catch (const std::exception& e) {
        spdlog::error("Failed to start signaling server: {}", e.what());
        return false;
    }
}

void SignalingServer::stop() {
    if (!running_.exchange(false) && !ws_server_) {
        return;
    }

    std::unordered_map<std::string, std::shared_ptr<rtc::WebSocket>> clients;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients.swap(clients_);
    }
    for (auto& [id, ws] : clients) {
        registry_.on_disconnect(id);
        try {
            ws->resetCallbacks();
            ws->close();
        } catch (const std::exception& e) {
            spdlog::debug("[{}] Close failed: {}", id, e.what());
        }
    }

    if (ws_server_) {
        ws_server_->stop();
        ws_server_.reset();
    }

    spdlog::info("Signaling server stopped");
}

// ─── Connection lifecycle ────────────────────────────────────────────────────

void SignalingServer::on_client_connected(std::shared_ptr<rtc::WebSocket> ws) {
    std::string connection_id = "conn-" + std::to_string(next_connection_.fetch_add(1) + 1);

    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_[connection_id] = ws;
    }
    registry_.register_connection(connection_id);

    ws->onOpen([this, connection_id]() {
        spdlog::info("Client connected: {}", connection_id);
        send(connection_id, json{{"type", "welcome"}, {"connectionId", connection_id}});
    });

    ws->onMessage([this, connection_id](auto data) {
        if (std::holds_alternative<std::string>(data)) {
            on_client_message(connection_id, std::get<std::string>(data));
        }
    });

    ws->onClosed([this, connection_id]() {
        on_client_disconnected(connection_id);
    });

    ws->onError([this, connection_id](std::string error) {
        spdlog::warn("[{}] WebSocket error: {}", connection_id, error);
        on_client_disconnected(connection_id);
    });
}

void SignalingServer::on_client_disconnected(const std::string& connection_id) {
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        clients_.erase(connection_id);
    }

    auto room = registry_.on_disconnect(connection_id);
    if (room) {
        spdlog::info("Client disconnected: {} (room {})", connection_id, *room);
    } else {
        spdlog::debug("Client disconnected: {}", connection_id);
    }
}

bool SignalingServer::send(const std::string& connection_id, const json& message) {
    std::shared_ptr<rtc::WebSocket> ws;
    {
        std::lock_guard<std::mutex> lock(clients_mutex_);
        auto it = clients_.find(connection_id);
        if (it == clients_.end()) {
            return false;
        }
        ws = it->second;
    }

    try {
        if (!ws->isOpen()) {
            return false;
        }
        return ws->send(message.dump());
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Failed to send: {}", connection_id, e.what());
        return false;
    }
}

void SignalingServer::send_error(const std::string& connection_id, const char* code,
                                 const std::string& message) {
    send(connection_id, error_body(code, message));
}

// ─── Message dispatch ────────────────────────────────────────────────────────

void SignalingServer::on_client_message(const std::string& connection_id, const std::string& message) {
    try {
        SignalingMessage msg = parse_signaling_message(message);
        spdlog::trace("[{}] <- {}", connection_id, message_type(msg));
        std::visit([&](const auto& m) { handle(connection_id, m); }, msg);

    } catch (const CoreError& e) {
        if (e.code() == ErrorCode::InvalidRequest) {
            spdlog::warn("[{}] Invalid message: {}", connection_id, e.what());
        } else {
            spdlog::debug("[{}] Request failed ({}): {}", connection_id, e.code_name(), e.what());
        }
        send_error(connection_id, e.code_name(), e.what());
    } catch (const json::exception& e) {
        spdlog::warn("[{}] Invalid JSON message: {}", connection_id, e.what());
        send_error(connection_id, error_code_name(ErrorCode::InvalidRequest), e.what());
    } catch (const std::exception& e) {
        spdlog::error("[{}] Error handling message: {}", connection_id, e.what());
        send_error(connection_id, "InternalError", "Internal server error");
    }
}

void SignalingServer::handle(const std::string& id, const JoinMessage& msg) {
    RoomSnapshot room = registry_.join(id, msg.stream_id, msg.role, msg.user_id);
    send(id, json{
        {"type", "joined"},
        {"connectionId", id},
        {"streamId", msg.stream_id},
        {"role", role_name(msg.role)},
        {"roomSize", room.connection_count},
        {"room", room},
        {"rtcConfiguration", rtc_configuration(config_.webrtc)},
    });
}

void SignalingServer::handle(const std::string& id, const LeaveMessage&) {
    auto room = registry_.leave(id);
    json reply = {{"type", "left"}, {"streamId", nullptr}};
    if (room) {
        reply["streamId"] = *room;
    }
    send(id, reply);
}

void SignalingServer::handle(const std::string& id, const OfferMessage& msg) {
    router_.relay_offer(id, msg);
}

void SignalingServer::handle(const std::string& id, const AnswerMessage& msg) {
    router_.relay_answer(id, msg);
}

void SignalingServer::handle(const std::string& id, const IceCandidateMessage& msg) {
    router_.relay_ice_candidate(id, msg);
}

void SignalingServer::handle(const std::string& id, const ConnectionStateMessage& msg) {
    router_.relay_connection_state(id, msg);
}

void SignalingServer::handle(const std::string& id, const BroadcastStartMessage& msg) {
    router_.relay_broadcast_start(id, msg);
}

void SignalingServer::handle(const std::string& id, const BroadcastStopMessage& msg) {
    router_.relay_broadcast_stop(id, msg);
}

void SignalingServer::handle(const std::string& id, const QualityChangeMessage& msg) {
    router_.relay_quality_change(id, msg);
}

void SignalingServer::handle(const std::string& id, const TelemetryMessage& msg) {
    std::string viewer = msg.viewer_id.value_or(id);
    TelemetryResult result = abr_.record_telemetry(msg.stream_id, viewer, msg.sample);

    json reply = result;
    reply["type"] = "qualityRecommendation";
    reply["streamId"] = msg.stream_id;
    send(id, reply);

    if (result.changed) {
        send(id, json{
            {"type", "qualityChanged"},
            {"fromId", "server"},
            {"quality", result.recommended_quality},
        });
    }
}

void SignalingServer::handle(const std::string& id, const GetConfigMessage&) {
    send(id, json{
        {"type", "config"},
        {"rtcConfiguration", rtc_configuration(config_.webrtc)},
        {"mediaConstraints", media_constraints()},
    });
}

void SignalingServer::handle(const std::string& id, const PingMessage&) {
    send(id, json{{"type", "pong"}});
}

} // namespace sdc
