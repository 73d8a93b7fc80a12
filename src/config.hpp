#pragma once

#include <string>
#include <vector>
#include <cstdint>

namespace sdc {

struct ServerConfig {
    uint16_t signaling_port = 8080;
    uint16_t http_port = 8081;
    std::string media_root = "./media/live";
};

struct WebRtcConfig {
    std::vector<std::string> stun_servers = {
        "stun:stun.l.google.com:19302",
        "stun:stun1.l.google.com:19302",
        "stun:stun2.l.google.com:19302",
    };
    std::string turn_server;
    std::string turn_username;
    std::string turn_credential;
    int ice_candidate_pool_size = 10;
};

struct AbrConfig {
    std::vector<std::string> variants = {"240p", "360p", "480p", "720p", "1080p"};
    std::vector<std::string> required_variants;  // empty = any single variant is enough
    int segment_seconds = 2;
    int playlist_length = 10;
    int gop_size = 60;
    int startup_timeout_ms = 5000;
    int health_check_interval_ms = 2000;
    int health_check_timeout_ms = 1000;
    int health_check_retries = 3;
    int retry_backoff_ms = 1000;
    int crash_window_ms = 30000;
    int stop_grace_ms = 3000;
};

struct TelemetryConfig {
    int window_size = 10;
    int upgrade_hold_samples = 3;
    int network_ttl_s = 300;
    int metrics_ttl_s = 60;
    int store_timeout_ms = 200;
    double low_fps_threshold = 15.0;
};

struct StorageConfig {
    std::string db_path = "stream-delivery.db";
};

struct LoggingConfig {
    std::string level = "info";
    std::string file;
    int max_file_size_mb = 10;
    int max_files = 3;
};

struct AppConfig {
    ServerConfig server;
    WebRtcConfig webrtc;
    AbrConfig abr;
    TelemetryConfig telemetry;
    StorageConfig storage;
    LoggingConfig logging;
};

// Load configuration from YAML file, with environment variable overrides
AppConfig load_config(const std::string& path);

// Throws std::runtime_error describing the first invalid field
void validate_config(const AppConfig& cfg);

} // namespace sdc
