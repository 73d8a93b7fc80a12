#pragma once

#include "abr_session_manager.hpp"
#include "config.hpp"
#include "message_sink.hpp"
#include "room_registry.hpp"
#include "signaling_messages.hpp"
#include "signaling_router.hpp"
#include <rtc/rtc.hpp>
#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace sdc {

// WebSocket front end for room signaling. Owns the room registry and routes
// each inbound message to it, the router or the ABR manager.
class SignalingServer : public MessageSink {
public:
    SignalingServer(const AppConfig& config, AbrSessionManager& abr);
    ~SignalingServer() override;

    // Non-copyable
    SignalingServer(const SignalingServer&) = delete;
    SignalingServer& operator=(const SignalingServer&) = delete;

    // Start / stop
    bool start();
    void stop();

    bool is_running() const { return running_.load(); }

    bool send(const std::string& connection_id, const nlohmann::json& message) override;

    RoomRegistry& registry() { return registry_; }

private:
    void on_client_connected(std::shared_ptr<rtc::WebSocket> ws);
    void on_client_message(const std::string& connection_id, const std::string& message);
    void on_client_disconnected(const std::string& connection_id);

    void handle(const std::string& id, const JoinMessage& msg);
    void handle(const std::string& id, const LeaveMessage& msg);
    void handle(const std::string& id, const OfferMessage& msg);
    void handle(const std::string& id, const AnswerMessage& msg);
    void handle(const std::string& id, const IceCandidateMessage& msg);
    void handle(const std::string& id, const ConnectionStateMessage& msg);
    void handle(const std::string& id, const BroadcastStartMessage& msg);
    void handle(const std::string& id, const BroadcastStopMessage& msg);
    void handle(const std::string& id, const QualityChangeMessage& msg);
    void handle(const std::string& id, const TelemetryMessage& msg);
    void handle(const std::string& id, const GetConfigMessage& msg);
    void handle(const std::string& id, const PingMessage& msg);

    void send_error(const std::string& connection_id, const char* code, const std::string& message);

    AppConfig config_;
    AbrSessionManager& abr_;
    std::shared_ptr<rtc::WebSocketServer> ws_server_;

    std::mutex clients_mutex_;
    std::unordered_map<std::string, std::shared_ptr<rtc::WebSocket>> clients_; // connection id → socket

    RoomRegistry registry_;
    SignalingRouter router_;

    std::atomic<bool> running_{false};
    std::atomic<uint64_t> next_connection_{0};
};

} // namespace sdc
