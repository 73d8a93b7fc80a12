#pragma once

#include "abr_session_manager.hpp"
#include "config.hpp"
#include "http_server.hpp"
#include "room_registry.hpp"
#include "session_store.hpp"
#include <string>
#include <vector>

namespace sdc {

// Route table for the HTTP control API and the /live HLS file tree
class ControlApi {
public:
    ControlApi(const AppConfig& config, AbrSessionManager& abr, RoomRegistry& rooms,
               SessionRecordStore& records);

    HttpResponse handle(const HttpRequest& req);

    // CoreError code → HTTP status
    static int status_for(const std::exception& e);

private:
    HttpResponse route(const HttpRequest& req, const std::vector<std::string>& parts);

    HttpResponse health();
    HttpResponse start_abr(const std::string& stream_key, const std::string& body);
    HttpResponse stop_abr(const std::string& stream_key);
    HttpResponse analytics(const std::string& stream_key);
    HttpResponse sessions();
    HttpResponse presets();
    HttpResponse history(const std::string& query);
    HttpResponse telemetry(const std::string& body);
    HttpResponse rooms();
    HttpResponse room(const std::string& stream_id);
    HttpResponse serve_media(const std::string& path);

    AppConfig config_;
    AbrSessionManager& abr_;
    RoomRegistry& rooms_;
    SessionRecordStore& records_;
};

} // namespace sdc
