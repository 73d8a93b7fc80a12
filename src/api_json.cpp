#include "api_json.hpp"
#include "manifest.hpp"

using json = nlohmann::json;

namespace sdc {

static int64_t epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

void to_json(json& j, const QualityVariant& v) {
    j = json{
        {"name", v.name},
        {"resolution", v.resolution()},
        {"videoBitrate", std::to_string(v.video_bitrate_kbps) + "k"},
        {"audioBitrate", std::to_string(v.audio_bitrate_kbps) + "k"},
        {"fps", v.fps},
        {"profile", v.profile},
        {"level", v.level},
        {"bandwidth", v.bandwidth_bps()},
    };
}

void to_json(json& j, const AbrManifest& m) {
    json variants = json::array();
    for (const auto& v : m.variants) {
        json entry = v.preset;
        entry["playlist"] = v.playlist;
        entry["uri"] = variant_playlist_uri(v.preset.name);
        variants.push_back(entry);
    }

    json failed = json::array();
    for (const auto& f : m.failed) {
        failed.push_back({{"quality", f.name}, {"reason", f.reason}});
    }

    j = json{
        {"sessionId", m.session_id},
        {"streamKey", m.stream_key},
        {"masterPlaylist", m.master_playlist},
        {"variants", variants},
        {"failed", failed},
    };
}

void to_json(json& j, const TelemetryResult& r) {
    j = json{
        {"currentQuality", r.current_quality},
        {"recommendedQuality", r.recommended_quality},
        {"condition", condition_name(r.condition)},
        {"availableQualities", r.available_qualities},
        {"changed", r.changed},
    };
}

void to_json(json& j, const SessionSnapshot& s) {
    json variants = json::array();
    for (const auto& v : s.variants) {
        variants.push_back({
            {"quality", v.name},
            {"state", job_state_name(v.state)},
            {"crashCount", v.crash_count},
            {"available", v.available},
        });
    }

    json metrics = json::object();
    for (const auto& [name, value] : s.quality_metrics) {
        metrics[name] = value;
    }

    j = json{
        {"sessionId", s.session_id},
        {"streamKey", s.stream_key},
        {"state", session_state_name(s.state)},
        {"startTime", epoch_ms(s.started_at)},
        {"currentQuality", s.current_quality},
        {"networkCondition", condition_name(s.network_condition)},
        {"masterPlaylist", s.master_playlist},
        {"availableQualities", s.available_qualities},
        {"variants", variants},
        {"viewerCount", s.viewer_count},
        {"qualityMetrics", metrics},
    };
}

void to_json(json& j, const SessionSummary& s) {
    j = json{
        {"streamKey", s.stream_key},
        {"sessionId", s.session_id},
        {"startTime", epoch_ms(s.started_at)},
        {"currentQuality", s.current_quality},
        {"networkCondition", condition_name(s.network_condition)},
        {"state", session_state_name(s.state)},
        {"qualityCount", s.quality_count},
    };
}

void to_json(json& j, const RoomSnapshot& r) {
    json members = json::array();
    for (const auto& m : r.members) {
        members.push_back({
            {"connectionId", m.connection_id},
            {"userId", m.user_id},
            {"role", role_name(m.role)},
            {"state", m.state},
            {"joinedAt", epoch_ms(m.joined_at)},
        });
    }

    j = json{
        {"streamId", r.stream_id},
        {"connectionCount", r.connection_count},
        {"broadcasterCount", r.broadcaster_count},
        {"viewerCount", r.viewer_count},
        {"createdAt", epoch_ms(r.created_at)},
        {"connections", members},
    };
}

json rtc_configuration(const WebRtcConfig& cfg) {
    json ice_servers = json::array();
    for (const auto& stun : cfg.stun_servers) {
        ice_servers.push_back({{"urls", stun}});
    }
    if (!cfg.turn_server.empty()) {
        json turn;
        turn["urls"] = cfg.turn_server;
        turn["username"] = cfg.turn_username;
        turn["credential"] = cfg.turn_credential;
        ice_servers.push_back(turn);
    }

    return json{
        {"iceServers", ice_servers},
        {"iceCandidatePoolSize", cfg.ice_candidate_pool_size},
    };
}

json media_constraints() {
    return json{
        {"video", {
            {"width", {{"ideal", 1280}, {"max", 1920}}},
            {"height", {{"ideal", 720}, {"max", 1080}}},
            {"frameRate", {{"ideal", 30}, {"max", 60}}},
        }},
        {"audio", {
            {"echoCancellation", true},
            {"noiseSuppression", true},
            {"autoGainControl", true},
        }},
    };
}

json error_body(const char* code, const std::string& message) {
    return json{
        {"type", "error"},
        {"code", code},
        {"message", message},
    };
}

} // namespace sdc
