#include "config.hpp"
#include "quality_variant.hpp"
#include <yaml-cpp/yaml.h>
#include <cstdlib>
#include <stdexcept>

namespace sdc {

static std::string env_or(const char* name, const std::string& fallback) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : fallback;
}

static int env_int_or(const char* name, int fallback) {
    const char* val = std::getenv(name);
    return val ? std::stoi(val) : fallback;
}

static std::vector<std::string> string_list(const YAML::Node& parent, const char* key,
                                            const std::vector<std::string>& fallback) {
    YAML::Node node = parent[key];
    if (!node) return fallback;
    if (!node.IsSequence()) {
        throw std::runtime_error("Expected a list for '" + std::string(key) + "'");
    }
    std::vector<std::string> out;
    for (const auto& item : node) {
        out.push_back(item.as<std::string>());
    }
    return out;
}

AppConfig load_config(const std::string& path) {
    AppConfig cfg;
    YAML::Node root;

    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Failed to load config: " + std::string(e.what()));
    }

    try {
        // Server
        if (auto s = root["server"]) {
            cfg.server.signaling_port = s["signaling_port"].as<uint16_t>(cfg.server.signaling_port);
            cfg.server.http_port = s["http_port"].as<uint16_t>(cfg.server.http_port);
            cfg.server.media_root = s["media_root"].as<std::string>(cfg.server.media_root);
        }

        // WebRTC
        if (auto w = root["webrtc"]) {
            cfg.webrtc.stun_servers = string_list(w, "stun_servers", cfg.webrtc.stun_servers);
            cfg.webrtc.turn_server = w["turn_server"].as<std::string>("");
            cfg.webrtc.turn_username = w["turn_username"].as<std::string>("");
            cfg.webrtc.turn_credential = w["turn_credential"].as<std::string>("");
            cfg.webrtc.ice_candidate_pool_size =
                w["ice_candidate_pool_size"].as<int>(cfg.webrtc.ice_candidate_pool_size);
        }

        // ABR
        if (auto a = root["abr"]) {
            cfg.abr.variants = string_list(a, "variants", cfg.abr.variants);
            cfg.abr.required_variants = string_list(a, "required_variants", cfg.abr.required_variants);
            cfg.abr.segment_seconds = a["segment_seconds"].as<int>(cfg.abr.segment_seconds);
            cfg.abr.playlist_length = a["playlist_length"].as<int>(cfg.abr.playlist_length);
            cfg.abr.gop_size = a["gop_size"].as<int>(cfg.abr.gop_size);
            cfg.abr.startup_timeout_ms = a["startup_timeout_ms"].as<int>(cfg.abr.startup_timeout_ms);
            cfg.abr.health_check_interval_ms =
                a["health_check_interval_ms"].as<int>(cfg.abr.health_check_interval_ms);
            cfg.abr.health_check_timeout_ms =
                a["health_check_timeout_ms"].as<int>(cfg.abr.health_check_timeout_ms);
            cfg.abr.health_check_retries = a["health_check_retries"].as<int>(cfg.abr.health_check_retries);
            cfg.abr.retry_backoff_ms = a["retry_backoff_ms"].as<int>(cfg.abr.retry_backoff_ms);
            cfg.abr.crash_window_ms = a["crash_window_ms"].as<int>(cfg.abr.crash_window_ms);
            cfg.abr.stop_grace_ms = a["stop_grace_ms"].as<int>(cfg.abr.stop_grace_ms);
        }

        // Telemetry
        if (auto t = root["telemetry"]) {
            cfg.telemetry.window_size = t["window_size"].as<int>(cfg.telemetry.window_size);
            cfg.telemetry.upgrade_hold_samples =
                t["upgrade_hold_samples"].as<int>(cfg.telemetry.upgrade_hold_samples);
            cfg.telemetry.network_ttl_s = t["network_ttl_s"].as<int>(cfg.telemetry.network_ttl_s);
            cfg.telemetry.metrics_ttl_s = t["metrics_ttl_s"].as<int>(cfg.telemetry.metrics_ttl_s);
            cfg.telemetry.store_timeout_ms = t["store_timeout_ms"].as<int>(cfg.telemetry.store_timeout_ms);
            cfg.telemetry.low_fps_threshold =
                t["low_fps_threshold"].as<double>(cfg.telemetry.low_fps_threshold);
        }

        // Storage
        if (auto st = root["storage"]) {
            cfg.storage.db_path = st["db_path"].as<std::string>(cfg.storage.db_path);
        }

        // Logging
        if (auto l = root["logging"]) {
            cfg.logging.level = l["level"].as<std::string>(cfg.logging.level);
            cfg.logging.file = l["file"].as<std::string>("");
            cfg.logging.max_file_size_mb = l["max_file_size_mb"].as<int>(cfg.logging.max_file_size_mb);
            cfg.logging.max_files = l["max_files"].as<int>(cfg.logging.max_files);
        }
    } catch (const YAML::Exception& e) {
        throw std::runtime_error("Invalid config value: " + std::string(e.what()));
    }

    // Environment variable overrides (Docker / systemd)
    cfg.server.signaling_port = static_cast<uint16_t>(
        env_int_or("SIGNALING_PORT", cfg.server.signaling_port));
    cfg.server.http_port = static_cast<uint16_t>(
        env_int_or("HTTP_PORT", cfg.server.http_port));
    cfg.server.media_root = env_or("MEDIA_ROOT", cfg.server.media_root);
    if (const char* stun = std::getenv("STUN_SERVER")) {
        cfg.webrtc.stun_servers = {stun};
    }
    cfg.webrtc.turn_server = env_or("TURN_SERVER", cfg.webrtc.turn_server);
    cfg.webrtc.turn_username = env_or("TURN_USERNAME", cfg.webrtc.turn_username);
    cfg.webrtc.turn_credential = env_or("TURN_CREDENTIAL", cfg.webrtc.turn_credential);
    cfg.storage.db_path = env_or("DB_PATH", cfg.storage.db_path);
    cfg.logging.level = env_or("LOG_LEVEL", cfg.logging.level);

    validate_config(cfg);
    return cfg;
}

void validate_config(const AppConfig& cfg) {
    if (cfg.abr.variants.empty()) {
        throw std::runtime_error("abr.variants must not be empty");
    }
    for (const auto& name : cfg.abr.variants) {
        if (!find_variant(name)) {
            throw std::runtime_error("abr.variants: unknown quality variant '" + name + "'");
        }
    }
    for (const auto& name : cfg.abr.required_variants) {
        if (!find_variant(name)) {
            throw std::runtime_error("abr.required_variants: unknown quality variant '" + name + "'");
        }
    }

    struct Positive { const char* name; int value; };
    const Positive positives[] = {
        {"abr.segment_seconds", cfg.abr.segment_seconds},
        {"abr.playlist_length", cfg.abr.playlist_length},
        {"abr.gop_size", cfg.abr.gop_size},
        {"abr.startup_timeout_ms", cfg.abr.startup_timeout_ms},
        {"abr.health_check_interval_ms", cfg.abr.health_check_interval_ms},
        {"abr.health_check_timeout_ms", cfg.abr.health_check_timeout_ms},
        {"abr.health_check_retries", cfg.abr.health_check_retries},
        {"abr.crash_window_ms", cfg.abr.crash_window_ms},
        {"abr.stop_grace_ms", cfg.abr.stop_grace_ms},
        {"telemetry.window_size", cfg.telemetry.window_size},
        {"telemetry.upgrade_hold_samples", cfg.telemetry.upgrade_hold_samples},
        {"telemetry.network_ttl_s", cfg.telemetry.network_ttl_s},
        {"telemetry.metrics_ttl_s", cfg.telemetry.metrics_ttl_s},
        {"telemetry.store_timeout_ms", cfg.telemetry.store_timeout_ms},
    };
    for (const auto& p : positives) {
        if (p.value <= 0) {
            throw std::runtime_error(std::string(p.name) + " must be positive");
        }
    }
    if (cfg.abr.retry_backoff_ms < 0) {
        throw std::runtime_error("abr.retry_backoff_ms must not be negative");
    }
    if (cfg.telemetry.upgrade_hold_samples > cfg.telemetry.window_size) {
        throw std::runtime_error("telemetry.upgrade_hold_samples must not exceed telemetry.window_size");
    }
}

} // namespace sdc
