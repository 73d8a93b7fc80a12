#include "config.hpp"
#include "logger.hpp"
#include "abr_session_manager.hpp"
#include "control_api.hpp"
#include "gst_encode_driver.hpp"
#include "http_server.hpp"
#include "metrics_store.hpp"
#include "session_store.hpp"
#include "signaling_server.hpp"

#include <spdlog/spdlog.h>
#include <csignal>
#include <atomic>
#include <thread>
#include <chrono>
#include <iostream>
#include <memory>

// ─── Global shutdown flag ─────────────────────────────────────────────────────
static std::atomic<bool> g_shutdown{false};

static void signal_handler(int) {
    g_shutdown.store(true);
}

static std::string join_names(const std::vector<std::string>& names) {
    std::string out;
    for (const auto& n : names) {
        if (!out.empty()) out += ", ";
        out += n;
    }
    return out.empty() ? "(none)" : out;
}

static void print_banner(const sdc::AppConfig& cfg) {
    std::cout << R"(
  ┌─────────────────────────────────────────────┐
  │       STREAM DELIVERY v)" APP_VERSION R"(             │
  │       Live signaling + ABR packaging        │
  └─────────────────────────────────────────────┘
)" << std::endl;

    spdlog::info("Configuration:");
    spdlog::info("  Signaling port  : {}", cfg.server.signaling_port);
    spdlog::info("  HTTP port       : {}", cfg.server.http_port);
    spdlog::info("  Media root      : {}", cfg.server.media_root);
    spdlog::info("  Variants        : {}", join_names(cfg.abr.variants));
    spdlog::info("  Required        : {}", join_names(cfg.abr.required_variants));
    spdlog::info("  Segments        : {}s x {}", cfg.abr.segment_seconds, cfg.abr.playlist_length);
    spdlog::info("  STUN            : {}", join_names(cfg.webrtc.stun_servers));
    spdlog::info("  TURN            : {}", cfg.webrtc.turn_server.empty() ? "(disabled)" : cfg.webrtc.turn_server);
    spdlog::info("  Telemetry window: {} samples, upgrade after {}",
                 cfg.telemetry.window_size, cfg.telemetry.upgrade_hold_samples);
    spdlog::info("  Database        : {}", cfg.storage.db_path);
}

int main(int argc, char* argv[]) {
    // ─── Parse arguments ──────────────────────────────────────────────────────
    std::string config_path = "config.yaml";
    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "-c") && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg == "--help" || arg == "-h") {
            std::cout << "Usage: stream-delivery [options]\n"
                      << "Options:\n"
                      << "  -c, --config <path>    Config file (default: config.yaml)\n"
                      << "  -h, --help             Show this help\n"
                      << "\nEnvironment variables:\n"
                      << "  SIGNALING_PORT         WebSocket signaling port\n"
                      << "  HTTP_PORT              HTTP control API port\n"
                      << "  MEDIA_ROOT             Directory for HLS output\n"
                      << "  STUN_SERVER            STUN server URL (replaces the list)\n"
                      << "  TURN_SERVER            TURN server URL\n"
                      << "  TURN_USERNAME          TURN username\n"
                      << "  TURN_CREDENTIAL        TURN credential\n"
                      << "  DB_PATH                SQLite session history file\n"
                      << "  LOG_LEVEL              Log level (trace/debug/info/warn/error)\n";
            return 0;
        }
    }

    // ─── Load configuration ───────────────────────────────────────────────────
    sdc::AppConfig config;
    try {
        config = sdc::load_config(config_path);
    } catch (const std::exception& e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return 1;
    }

    // ─── Initialize logger ────────────────────────────────────────────────────
    sdc::init_logger(config.logging);
    print_banner(config);

    // ─── Signal handling ──────────────────────────────────────────────────────
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    // ─── Create components ────────────────────────────────────────────────────
    std::unique_ptr<sdc::SqliteSessionStore> records;
    try {
        records = std::make_unique<sdc::SqliteSessionStore>(config.storage.db_path);
    } catch (const std::exception& e) {
        spdlog::critical("Cannot open session database: {}", e.what());
        return 1;
    }

    sdc::InMemoryMetricsStore metrics;
    sdc::GstEncodeDriver encoder;
    sdc::AbrSessionManager abr(config, encoder, metrics, *records);
    sdc::SignalingServer signaling_server(config, abr);
    sdc::ControlApi api(config, abr, signaling_server.registry(), *records);
    sdc::HttpServer http_server(config.server.http_port,
                                [&api](const sdc::HttpRequest& req) { return api.handle(req); });

    // ─── Start everything ─────────────────────────────────────────────────────
    if (!signaling_server.start()) {
        spdlog::critical("Failed to start signaling server");
        return 1;
    }

    if (!http_server.start()) {
        spdlog::critical("Failed to start HTTP server on port {}", config.server.http_port);
        signaling_server.stop();
        return 1;
    }

    spdlog::info("All systems operational");
    spdlog::info("  WebSocket signaling : ws://0.0.0.0:{}", config.server.signaling_port);
    spdlog::info("  Control API         : http://0.0.0.0:{}/api", config.server.http_port);
    spdlog::info("  HLS output          : http://0.0.0.0:{}/live/<stream>/master.m3u8",
                 config.server.http_port);

    // ─── Main loop ────────────────────────────────────────────────────────────
    auto last_stats_time = std::chrono::steady_clock::now();
    constexpr auto stats_interval = std::chrono::seconds(30);

    while (!g_shutdown.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        // Periodic stats logging
        auto now = std::chrono::steady_clock::now();
        if (now - last_stats_time >= stats_interval) {
            last_stats_time = now;

            auto sessions = abr.active_sessions();
            spdlog::info("──── Status ────");
            spdlog::info("  Signaling  : {} connection(s) in {} room(s)",
                         signaling_server.registry().connection_count(),
                         signaling_server.registry().room_count());
            spdlog::info("  ABR        : {} session(s) | {} metric key(s)",
                         sessions.size(), metrics.size());
            for (const auto& s : sessions) {
                spdlog::info("    {} : {} | {} variant(s) | serving {} ({})",
                             s.stream_key, sdc::session_state_name(s.state), s.quality_count,
                             s.current_quality, sdc::condition_name(s.network_condition));
            }
            spdlog::info("────────────────");
        }
    }

    // ─── Graceful shutdown ────────────────────────────────────────────────────
    spdlog::info("Shutting down...");
    http_server.stop();
    signaling_server.stop();
    abr.stop_all();
    spdlog::info("Shutdown complete");

    return 0;
}
