#include "control_api.hpp"
#include "api_json.hpp"
#include "errors.hpp"
#include "signaling_messages.hpp"
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <unordered_map>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sdc {

static const std::unordered_map<std::string, std::string> kMimeTypes = {
    {".m3u8", "application/vnd.apple.mpegurl"},
    {".ts",   "video/mp2t"},
    {".m4s",  "video/iso.segment"},
    {".mp4",  "video/mp4"},
    {".aac",  "audio/aac"},
    {".json", "application/json"},
};

static HttpResponse json_response(int status, const json& body) {
    HttpResponse res;
    res.status = status;
    res.body = body.dump();
    return res;
}

static HttpResponse error_response(int status, const char* code, const std::string& message) {
    return json_response(status, json{{"error", message}, {"code", code}});
}

static std::vector<std::string> split_path(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        auto end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        if (end > start) {
            parts.push_back(path.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

static int query_int(const std::string& query, const std::string& key, int fallback) {
    size_t pos = 0;
    while (pos < query.size()) {
        auto end = query.find('&', pos);
        if (end == std::string::npos) end = query.size();
        std::string pair = query.substr(pos, end - pos);
        auto eq = pair.find('=');
        if (eq != std::string::npos && pair.substr(0, eq) == key) {
            try {
                return std::stoi(pair.substr(eq + 1));
            } catch (const std::exception&) {
                return fallback;
            }
        }
        pos = end + 1;
    }
    return fallback;
}

ControlApi::ControlApi(const AppConfig& config, AbrSessionManager& abr, RoomRegistry& rooms,
                       SessionRecordStore& records)
    : config_(config)
    , abr_(abr)
    , rooms_(rooms)
    , records_(records)
{
}

int ControlApi::status_for(const std::exception& e) {
    auto* core = dynamic_cast<const CoreError*>(&e);
    if (!core) {
        return dynamic_cast<const json::exception*>(&e) ? 400 : 500;
    }
    switch (core->code()) {
        case ErrorCode::InvalidRequest: return 400;
        case ErrorCode::Unauthorized: return 403;
        case ErrorCode::NotFound: return 404;
        case ErrorCode::NotInRoom:
        case ErrorCode::AlreadyInDifferentRoom: return 409;
        case ErrorCode::EncodeStartFailure:
        case ErrorCode::EncodeRuntimeFailure:
        case ErrorCode::Timeout: return 502;
    }
    return 500;
}

HttpResponse ControlApi::handle(const HttpRequest& req) {
    if (req.method == "OPTIONS") {
        HttpResponse res;
        res.status = 204;
        return res;
    }

    try {
        return route(req, split_path(req.path));
    } catch (const CoreError& e) {
        int status = status_for(e);
        if (status >= 500) {
            spdlog::error("HTTP {} {}: {}", req.method, req.path, e.what());
        } else {
            spdlog::warn("HTTP {} {}: {}", req.method, req.path, e.what());
        }
        return error_response(status, e.code_name(), e.what());
    } catch (const json::exception& e) {
        spdlog::warn("HTTP {} {}: bad JSON: {}", req.method, req.path, e.what());
        return error_response(400, error_code_name(ErrorCode::InvalidRequest), e.what());
    }
}

HttpResponse ControlApi::route(const HttpRequest& req, const std::vector<std::string>& parts) {
    const std::string& method = req.method;
    auto method_not_allowed = [] {
        return error_response(405, "MethodNotAllowed", "Method not allowed");
    };

    if (parts.size() == 1 && parts[0] == "health") {
        return method == "GET" ? health() : method_not_allowed();
    }

    if (!parts.empty() && parts[0] == "live") {
        if (method != "GET" && method != "HEAD") return method_not_allowed();
        return serve_media(req.path.substr(std::string("/live").size()));
    }

    if (parts.size() < 2 || parts[0] != "api") {
        return error_response(404, error_code_name(ErrorCode::NotFound), "No route for " + req.path);
    }

    if (parts[1] == "abr") {
        if (parts.size() == 3 && parts[2] == "sessions") {
            return method == "GET" ? sessions() : method_not_allowed();
        }
        if (parts.size() == 3 && parts[2] == "presets") {
            return method == "GET" ? presets() : method_not_allowed();
        }
        if (parts.size() == 3 && parts[2] == "history") {
            return method == "GET" ? history(req.query) : method_not_allowed();
        }
        if (parts.size() == 4) {
            const std::string& key = parts[2];
            const std::string& action = parts[3];
            if (action == "start") return method == "POST" ? start_abr(key, req.body) : method_not_allowed();
            if (action == "stop") return method == "POST" ? stop_abr(key) : method_not_allowed();
            if (action == "analytics") return method == "GET" ? analytics(key) : method_not_allowed();
        }
    }

    if (parts[1] == "telemetry" && parts.size() == 2) {
        return method == "POST" ? telemetry(req.body) : method_not_allowed();
    }

    if (parts[1] == "rooms") {
        if (parts.size() == 2) return method == "GET" ? rooms() : method_not_allowed();
        if (parts.size() == 3) return method == "GET" ? room(parts[2]) : method_not_allowed();
    }

    return error_response(404, error_code_name(ErrorCode::NotFound), "No route for " + req.path);
}

// ─── Handlers ────────────────────────────────────────────────────────────────

HttpResponse ControlApi::health() {
    return json_response(200, json{
        {"status", "ok"},
        {"activeSessions", abr_.session_count()},
        {"rooms", rooms_.room_count()},
        {"connections", rooms_.connection_count()},
        {"timestamp", now_epoch_ms()},
    });
}

HttpResponse ControlApi::start_abr(const std::string& stream_key, const std::string& body) {
    json req = body.empty() ? json::object() : json::parse(body);
    if (!req.is_object()) {
        throw CoreError(ErrorCode::InvalidRequest, "Body must be a JSON object");
    }

    auto source = req.find("inputSource");
    if (source == req.end() || !source->is_string() || source->get<std::string>().empty()) {
        throw CoreError(ErrorCode::InvalidRequest, "Missing 'inputSource'");
    }

    std::vector<std::string> variants;
    auto list = req.find("variants");
    if (list != req.end() && !list->is_null()) {
        if (!list->is_array()) {
            throw CoreError(ErrorCode::InvalidRequest, "'variants' must be an array of names");
        }
        for (const auto& v : *list) {
            if (!v.is_string()) {
                throw CoreError(ErrorCode::InvalidRequest, "'variants' must be an array of names");
            }
            variants.push_back(v.get<std::string>());
        }
    }

    AbrManifest manifest = abr_.initialize(stream_key, source->get<std::string>(), variants);
    json out = manifest;
    out["success"] = true;
    out["masterPlaylistUrl"] = "/live/" + stream_key + "/master.m3u8";
    return json_response(201, out);
}

HttpResponse ControlApi::stop_abr(const std::string& stream_key) {
    if (!abr_.stop(stream_key)) {
        throw CoreError(ErrorCode::NotFound, "No ABR session for stream " + stream_key);
    }
    return json_response(200, json{{"success", true}, {"streamKey", stream_key}});
}

HttpResponse ControlApi::analytics(const std::string& stream_key) {
    auto snapshot = abr_.get_analytics(stream_key);
    if (!snapshot) {
        throw CoreError(ErrorCode::NotFound, "No ABR session for stream " + stream_key);
    }
    return json_response(200, json(*snapshot));
}

HttpResponse ControlApi::sessions() {
    json list = json::array();
    for (const auto& s : abr_.active_sessions()) {
        list.push_back(s);
    }
    return json_response(200, json{{"sessions", list}});
}

HttpResponse ControlApi::presets() {
    json list = json::array();
    for (const auto& v : quality_presets()) {
        list.push_back(v);
    }
    return json_response(200, json{{"presets", list}});
}

HttpResponse ControlApi::history(const std::string& query) {
    int limit = std::clamp(query_int(query, "limit", 20), 1, 200);

    json list = json::array();
    for (const auto& s : records_.recent_sessions(limit)) {
        json variants = json::array();
        for (const auto& v : records_.variants_for(s.session_id)) {
            variants.push_back({
                {"quality", v.variant},
                {"status", v.status},
                {"detail", v.detail},
                {"updatedAt", v.updated_at_ms},
            });
        }
        list.push_back({
            {"sessionId", s.session_id},
            {"streamKey", s.stream_key},
            {"startedAt", s.started_at_ms},
            {"endedAt", s.ended_at_ms == 0 ? json(nullptr) : json(s.ended_at_ms)},
            {"endReason", s.end_reason},
            {"variants", variants},
        });
    }
    return json_response(200, json{{"sessions", list}});
}

HttpResponse ControlApi::telemetry(const std::string& body) {
    TelemetryMessage msg = parse_telemetry(json::parse(body));
    if (!msg.viewer_id) {
        throw CoreError(ErrorCode::InvalidRequest, "Missing 'viewerId'");
    }

    TelemetryResult result = abr_.record_telemetry(msg.stream_id, *msg.viewer_id, msg.sample);
    return json_response(200, json(result));
}

HttpResponse ControlApi::rooms() {
    json list = json::array();
    for (const auto& r : rooms_.all_rooms()) {
        list.push_back(r);
    }
    return json_response(200, json{{"rooms", list}});
}

HttpResponse ControlApi::room(const std::string& stream_id) {
    auto snapshot = rooms_.room_stats(stream_id);
    if (!snapshot) {
        throw CoreError(ErrorCode::NotFound, "No room for stream " + stream_id);
    }
    return json_response(200, json(*snapshot));
}

// ─── HLS files ───────────────────────────────────────────────────────────────

HttpResponse ControlApi::serve_media(const std::string& path) {
    auto not_found = [] {
        return error_response(404, error_code_name(ErrorCode::NotFound), "Not found");
    };
    if (path.empty() || path == "/") {
        return not_found();
    }

    // Canonicalize and check the file is inside media_root
    std::error_code ec;
    fs::path root = fs::canonical(config_.server.media_root, ec);
    if (ec) return not_found();
    fs::path file = fs::canonical(root / fs::path(path).relative_path(), ec);
    if (ec) return not_found();

    auto root_str = root.string();
    auto file_str = file.string();
    if (file_str.compare(0, root_str.size(), root_str) != 0 ||
        (file_str.size() > root_str.size() && file_str[root_str.size()] != '/')) {
        spdlog::warn("HTTP: Path traversal attempt: {}", path);
        return not_found();
    }
    if (!fs::is_regular_file(file, ec)) {
        return not_found();
    }

    std::ifstream in(file, std::ios::binary);
    if (!in.is_open()) {
        return error_response(500, "InternalError", "Cannot read file");
    }

    HttpResponse res;
    res.body.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());

    std::string ext = file.extension().string();
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    auto mime = kMimeTypes.find(ext);
    res.content_type = mime != kMimeTypes.end() ? mime->second : "application/octet-stream";

    // Playlists change every segment; segments never do
    res.headers["Cache-Control"] = ext == ".m3u8" ? "no-cache" : "max-age=3600";
    return res;
}

} // namespace sdc
