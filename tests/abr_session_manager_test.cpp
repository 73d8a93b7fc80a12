// Tests for the ABR session manager
//
// Tests cover:
// - Session initialization with partial and total encoder failure
// - Telemetry-driven quality recommendation and damping
// - Variant loss: retry, degrade, stop when nothing is left
// - Stop, metrics eviction and session history

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <future>
#include <sstream>
#include <unistd.h>

#include "abr_session_manager.hpp"
#include "errors.hpp"
#include "fake_encode_driver.hpp"

namespace fs = std::filesystem;
using namespace std::chrono_literals;

namespace sdc {
namespace test {

static NetworkSample sample(double bandwidth, double latency, double loss) {
    NetworkSample s;
    s.bandwidth_kbps = bandwidth;
    s.latency_ms = latency;
    s.packet_loss_pct = loss;
    return s;
}

static NetworkSample poor_sample() { return sample(300, 600, 3.0); }
static NetworkSample good_sample() { return sample(3000, 80, 0.3); }
static NetworkSample excellent_sample() { return sample(8000, 20, 0.0); }

static std::string read_file(const fs::path& path) {
    std::ifstream in(path);
    std::stringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

static size_t stream_entries(const std::string& playlist) {
    size_t n = 0;
    for (auto pos = playlist.find("#EXT-X-STREAM-INF"); pos != std::string::npos;
         pos = playlist.find("#EXT-X-STREAM-INF", pos + 1)) {
        n++;
    }
    return n;
}

class AbrSessionManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        media_root_ = fs::temp_directory_path() /
                      ("sdc_abr_" + std::to_string(::getpid()) + "_" + info->name());
        fs::remove_all(media_root_);

        config_.server.media_root = media_root_.string();
        config_.abr.startup_timeout_ms = 500;
        config_.abr.health_check_interval_ms = 60000;
        config_.abr.retry_backoff_ms = 20;
        config_.abr.crash_window_ms = 30000;
        config_.abr.stop_grace_ms = 50;
    }

    void TearDown() override {
        abr_.reset();
        fs::remove_all(media_root_);
    }

    AbrSessionManager& abr() {
        if (!abr_) {
            abr_ = std::make_unique<AbrSessionManager>(config_, driver_, metrics_, records_);
        }
        return *abr_;
    }

    ErrorCode initialize_error(const std::string& key, const std::string& input,
                               const std::vector<std::string>& variants) {
        try {
            abr().initialize(key, input, variants);
        } catch (const CoreError& e) {
            return e.code();
        }
        ADD_FAILURE() << "initialize() did not throw";
        return ErrorCode::Timeout;
    }

    // Crashes the variant twice inside the crash window
    void kill_variant(const std::string& variant) {
        int launches = driver_.launch_count(variant);
        driver_.crash(variant, "first crash");
        ASSERT_TRUE(wait_until([&] { return driver_.launch_count(variant) == launches + 1; }));
        driver_.crash(variant, "second crash");
    }

    fs::path media_root_;
    AppConfig config_;
    FakeEncodeDriver driver_;
    InMemoryMetricsStore metrics_;
    SqliteSessionStore records_{":memory:"};
    std::unique_ptr<AbrSessionManager> abr_;
};

// ============================================================================
// Initialization
// ============================================================================

TEST_F(AbrSessionManagerTest, InitializeWritesManifestForStartedVariants) {
    driver_.fail_launch("1080p");

    AbrManifest manifest = abr().initialize("abc123", "rtmp://ingest/live/abc123",
                                            {"360p", "720p", "1080p"});

    EXPECT_EQ(manifest.stream_key, "abc123");
    EXPECT_EQ(manifest.session_id.rfind("abr_abc123_", 0), 0u);
    ASSERT_EQ(manifest.variants.size(), 2u);
    EXPECT_EQ(manifest.variants[0].preset.name, "360p");
    EXPECT_EQ(manifest.variants[1].preset.name, "720p");
    EXPECT_EQ(manifest.variants[1].playlist,
              (media_root_ / "abc123" / "720p" / "index.m3u8").string());
    ASSERT_EQ(manifest.failed.size(), 1u);
    EXPECT_EQ(manifest.failed[0].name, "1080p");

    EXPECT_EQ(manifest.master_playlist, (media_root_ / "abc123" / "master.m3u8").string());
    std::string playlist = read_file(manifest.master_playlist);
    EXPECT_EQ(stream_entries(playlist), 2u);
    EXPECT_EQ(playlist.find("1080p/index.m3u8"), std::string::npos);

    EXPECT_EQ(driver_.last_spec("720p").output_dir, media_root_ / "abc123" / "720p");
    EXPECT_EQ(abr().session_count(), 1u);
}

TEST_F(AbrSessionManagerTest, InitializeUsesConfiguredVariantsByDefault) {
    config_.abr.variants = {"480p", "240p"};
    AbrManifest manifest = abr().initialize("cam", "rtsp://cam/stream");

    ASSERT_EQ(manifest.variants.size(), 2u);
    EXPECT_EQ(manifest.variants[0].preset.name, "240p");
    EXPECT_EQ(manifest.variants[1].preset.name, "480p");
}

TEST_F(AbrSessionManagerTest, InitializeRecordsSessionHistory) {
    driver_.fail_launch("1080p");
    AbrManifest manifest = abr().initialize("cam", "rtsp://cam/stream", {"720p", "1080p"});

    auto sessions = records_.recent_sessions(5);
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].session_id, manifest.session_id);
    EXPECT_EQ(sessions[0].ended_at_ms, 0);

    auto variants = records_.variants_for(manifest.session_id);
    ASSERT_EQ(variants.size(), 2u);
    EXPECT_EQ(variants[0].variant, "1080p");
    EXPECT_EQ(variants[0].status, "failed");
    EXPECT_EQ(variants[1].variant, "720p");
    EXPECT_EQ(variants[1].status, "running");
}

TEST_F(AbrSessionManagerTest, RequiredVariantFailureAbortsSession) {
    config_.abr.required_variants = {"720p"};
    driver_.fail_launch("720p");

    EXPECT_EQ(initialize_error("cam", "rtsp://cam/stream", {"360p", "720p"}),
              ErrorCode::EncodeStartFailure);
    EXPECT_EQ(abr().session_count(), 0u);
    // The variant that did start is torn down again
    EXPECT_EQ(driver_.terminations("360p"), 1);
}

TEST_F(AbrSessionManagerTest, AllVariantsFailingAborts) {
    driver_.fail_launch("360p");
    driver_.fail_launch("720p");

    try {
        abr().initialize("cam", "rtsp://cam/stream", {"360p", "720p"});
        FAIL() << "initialize() should have thrown";
    } catch (const CoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EncodeStartFailure);
        EXPECT_NE(std::string(e.what()).find("(failed: 360p 720p)"), std::string::npos);
    }
    EXPECT_EQ(abr().session_count(), 0u);
    EXPECT_FALSE(fs::exists(media_root_ / "cam" / "master.m3u8"));
}

TEST_F(AbrSessionManagerTest, InvalidArgumentsAreRejected) {
    EXPECT_EQ(initialize_error("", "rtsp://x", {"360p"}), ErrorCode::InvalidRequest);
    EXPECT_EQ(initialize_error("../etc", "rtsp://x", {"360p"}), ErrorCode::InvalidRequest);
    EXPECT_EQ(initialize_error("..", "rtsp://x", {"360p"}), ErrorCode::InvalidRequest);
    EXPECT_EQ(initialize_error("cam", "", {"360p"}), ErrorCode::InvalidRequest);
    EXPECT_EQ(initialize_error("cam", "rtsp://x", {"360p", "4k"}), ErrorCode::InvalidRequest);
    EXPECT_EQ(initialize_error("cam", "rtsp://x\" ! filesink location=\"/tmp/out", {"360p"}),
              ErrorCode::InvalidRequest);
    EXPECT_EQ(initialize_error("cam", "rtsp://x/a b", {"360p"}), ErrorCode::InvalidRequest);
    EXPECT_EQ(initialize_error("cam", "rtsp://x/\n", {"360p"}), ErrorCode::InvalidRequest);
    EXPECT_EQ(driver_.total_launches(), 0);
}

TEST_F(AbrSessionManagerTest, DuplicateStreamIsRejected) {
    abr().initialize("cam", "rtsp://cam/stream", {"360p"});
    EXPECT_EQ(initialize_error("cam", "rtsp://cam/stream", {"720p"}), ErrorCode::InvalidRequest);
    EXPECT_EQ(driver_.launch_count("720p"), 0);
}

TEST_F(AbrSessionManagerTest, StreamCanBeRestartedAfterStop) {
    abr().initialize("cam", "rtsp://cam/stream", {"360p"});
    ASSERT_TRUE(abr().stop("cam"));
    EXPECT_NO_THROW(abr().initialize("cam", "rtsp://cam/stream", {"360p"}));
}

TEST_F(AbrSessionManagerTest, StopDuringInitializationCancelsIt) {
    driver_.hold_launches();
    auto pending = std::async(std::launch::async, [this] {
        return abr().initialize("cam", "rtsp://cam/stream", {"360p", "720p"});
    });

    ASSERT_TRUE(wait_until([&] { return driver_.total_launches() == 2; }));
    EXPECT_TRUE(abr().stop("cam"));
    driver_.release_launches();

    try {
        pending.get();
        FAIL() << "initialize() should have thrown";
    } catch (const CoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EncodeStartFailure);
    }
    EXPECT_EQ(abr().session_count(), 0u);
    EXPECT_EQ(driver_.terminations("360p"), 1);
    EXPECT_EQ(driver_.terminations("720p"), 1);
}

// ============================================================================
// Telemetry
// ============================================================================

TEST_F(AbrSessionManagerTest, PoorNetworkRecommendsLowQuality) {
    driver_.fail_launch("1080p");
    abr().initialize("abc123", "rtmp://ingest/live/abc123", {"360p", "720p", "1080p"});

    TelemetryResult r = abr().record_telemetry("abc123", "viewer-1", poor_sample());
    EXPECT_EQ(r.current_quality, "720p");
    EXPECT_EQ(r.recommended_quality, "360p");
    EXPECT_EQ(r.condition, NetworkCondition::Poor);
    EXPECT_TRUE(r.changed);
    EXPECT_EQ(r.available_qualities, (std::vector<std::string>{"360p", "720p"}));

    auto snap = abr().get_analytics("abc123");
    ASSERT_TRUE(snap.has_value());
    EXPECT_EQ(snap->current_quality, "720p");
    EXPECT_EQ(snap->network_condition, NetworkCondition::Poor);
    EXPECT_EQ(snap->viewer_count, 1u);
}

TEST_F(AbrSessionManagerTest, RecommendationResolvesToAvailableVariant) {
    abr().initialize("cam", "rtsp://cam/stream", {"360p", "1080p"});

    TelemetryResult r = abr().record_telemetry("cam", "v1", excellent_sample());
    EXPECT_EQ(r.recommended_quality, "1080p");

    // Good wants 720p; the best variant not above it is 360p
    r = abr().record_telemetry("cam", "v1", good_sample());
    EXPECT_EQ(r.condition, NetworkCondition::Good);
    EXPECT_EQ(r.recommended_quality, "360p");
}

TEST_F(AbrSessionManagerTest, RecommendationFallsBackToLowestVariant) {
    abr().initialize("cam", "rtsp://cam/stream", {"720p", "1080p"});
    TelemetryResult r = abr().record_telemetry("cam", "v1", poor_sample());
    EXPECT_EQ(r.recommended_quality, "720p");
    EXPECT_FALSE(r.changed);
}

TEST_F(AbrSessionManagerTest, UpgradesAreDamped) {
    abr().initialize("cam", "rtsp://cam/stream", {"360p", "720p", "1080p"});

    EXPECT_EQ(abr().record_telemetry("cam", "v1", poor_sample()).recommended_quality, "360p");

    TelemetryResult r = abr().record_telemetry("cam", "v1", excellent_sample());
    EXPECT_EQ(r.recommended_quality, "360p");
    EXPECT_FALSE(r.changed);
    r = abr().record_telemetry("cam", "v1", excellent_sample());
    EXPECT_EQ(r.recommended_quality, "360p");

    r = abr().record_telemetry("cam", "v1", excellent_sample());
    EXPECT_EQ(r.recommended_quality, "1080p");
    EXPECT_EQ(r.current_quality, "360p");
    EXPECT_TRUE(r.changed);
}

TEST_F(AbrSessionManagerTest, ViewersAreTrackedIndependently) {
    abr().initialize("cam", "rtsp://cam/stream", {"360p", "720p", "1080p"});

    abr().record_telemetry("cam", "slow", poor_sample());
    TelemetryResult fast = abr().record_telemetry("cam", "fast", excellent_sample());
    // A new viewer starts from the session default, not another viewer's quality
    EXPECT_EQ(fast.current_quality, "720p");
    EXPECT_EQ(fast.recommended_quality, "1080p");
    EXPECT_TRUE(fast.changed);

    TelemetryResult slow = abr().record_telemetry("cam", "slow", poor_sample());
    EXPECT_EQ(slow.recommended_quality, "360p");
    EXPECT_FALSE(slow.changed);

    auto snap = abr().get_analytics("cam");
    EXPECT_EQ(snap->viewer_count, 2u);
    EXPECT_EQ(snap->current_quality, "720p");
    EXPECT_EQ(abr().active_sessions()[0].current_quality, "720p");
}

TEST_F(AbrSessionManagerTest, TelemetryIsStoredPerViewer) {
    abr().initialize("cam", "rtsp://cam/stream", {"360p"});
    abr().record_telemetry("cam", "v1", poor_sample());

    auto stored = metrics_.get("network:cam:v1");
    ASSERT_TRUE(stored.has_value());
    auto payload = nlohmann::json::parse(*stored);
    EXPECT_EQ(payload["condition"], "poor");
    EXPECT_EQ(payload["recommendedQuality"], "360p");
    EXPECT_DOUBLE_EQ(payload["bandwidth"].get<double>(), 300.0);
}

TEST_F(AbrSessionManagerTest, TelemetryErrors) {
    try {
        abr().record_telemetry("nope", "v1", poor_sample());
        FAIL() << "expected NotFound";
    } catch (const CoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NotFound);
    }

    abr().initialize("cam", "rtsp://cam/stream", {"360p"});
    try {
        abr().record_telemetry("cam", "", poor_sample());
        FAIL() << "expected InvalidRequest";
    } catch (const CoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::InvalidRequest);
    }
}

// ============================================================================
// Variant failures
// ============================================================================

TEST_F(AbrSessionManagerTest, SingleCrashRestartsVariant) {
    abr().initialize("cam", "rtsp://cam/stream", {"360p", "720p"});

    driver_.crash("720p");
    ASSERT_TRUE(wait_until([&] { return driver_.launch_count("720p") == 2; }));
    ASSERT_TRUE(wait_until([&] {
        auto snap = abr().get_analytics("cam");
        return snap && snap->variants.size() == 2 && snap->variants[1].state == JobState::Running;
    }));

    auto snap = abr().get_analytics("cam");
    EXPECT_EQ(snap->state, SessionState::Encoding);
    EXPECT_EQ(snap->variants[1].crash_count, 1);
    EXPECT_TRUE(snap->variants[1].available);
}

TEST_F(AbrSessionManagerTest, SecondCrashDegradesSession) {
    AbrManifest manifest = abr().initialize("cam", "rtsp://cam/stream", {"360p", "720p", "1080p"});
    abr().record_telemetry("cam", "v1", excellent_sample());

    kill_variant("1080p");
    ASSERT_TRUE(wait_until([&] {
        auto snap = abr().get_analytics("cam");
        return snap && snap->state == SessionState::Degraded;
    }));

    auto snap = abr().get_analytics("cam");
    EXPECT_EQ(snap->available_qualities, (std::vector<std::string>{"360p", "720p"}));
    EXPECT_FALSE(snap->variants[2].available);
    EXPECT_EQ(snap->current_quality, "720p");

    std::string playlist = read_file(manifest.master_playlist);
    EXPECT_EQ(stream_entries(playlist), 2u);
    EXPECT_EQ(playlist.find("1080p/index.m3u8"), std::string::npos);

    // The viewer was moved off the lost variant
    TelemetryResult r = abr().record_telemetry("cam", "v1", excellent_sample());
    EXPECT_EQ(r.current_quality, "720p");
    EXPECT_EQ(r.recommended_quality, "720p");

    ASSERT_TRUE(wait_until([&] {
        auto variants = records_.variants_for(manifest.session_id);
        return variants.size() == 3 && variants[0].status == "failed";
    }));
}

TEST_F(AbrSessionManagerTest, LosingEveryVariantStopsSession) {
    AbrManifest manifest = abr().initialize("cam", "rtsp://cam/stream", {"360p"});

    kill_variant("360p");
    ASSERT_TRUE(wait_until([&] { return abr().session_count() == 0; }));
    EXPECT_FALSE(abr().get_analytics("cam").has_value());
    EXPECT_FALSE(abr().stop("cam"));

    ASSERT_TRUE(wait_until([&] {
        auto sessions = records_.recent_sessions(1);
        return !sessions.empty() && sessions[0].end_reason == "all variants failed";
    }));

    // The stream key is free again
    EXPECT_NO_THROW(abr().initialize("cam", "rtsp://cam/stream", {"360p"}));
}

// ============================================================================
// Stop and queries
// ============================================================================

TEST_F(AbrSessionManagerTest, ProgressShowsInAnalytics) {
    abr().initialize("cam", "rtsp://cam/stream", {"360p", "720p"});

    driver_.progress("720p", 29.5, 2400.0);
    ASSERT_TRUE(wait_until([&] {
        auto snap = abr().get_analytics("cam");
        return snap && snap->quality_metrics.count("720p");
    }));

    auto snap = abr().get_analytics("cam");
    const auto& m = snap->quality_metrics.at("720p");
    EXPECT_EQ(m["quality"], "720p");
    EXPECT_DOUBLE_EQ(m["fps"].get<double>(), 29.5);
    EXPECT_DOUBLE_EQ(m["bitrate"].get<double>(), 2400.0);
    EXPECT_FALSE(snap->quality_metrics.count("360p"));
}

TEST_F(AbrSessionManagerTest, StopTerminatesJobsAndEvictsMetrics) {
    AbrManifest manifest = abr().initialize("cam", "rtsp://cam/stream", {"360p", "720p"});
    abr().record_telemetry("cam", "v1", good_sample());
    driver_.progress("360p", 30.0);
    ASSERT_TRUE(wait_until([&] { return !metrics_.keys("metrics:").empty(); }));

    EXPECT_TRUE(abr().stop("cam"));

    EXPECT_EQ(driver_.graceful_terminations("360p"), 1);
    EXPECT_EQ(driver_.graceful_terminations("720p"), 1);
    EXPECT_TRUE(metrics_.keys("metrics:").empty());
    EXPECT_TRUE(metrics_.keys("network:").empty());
    EXPECT_EQ(abr().session_count(), 0u);
    EXPECT_FALSE(abr().stop("cam"));

    auto sessions = records_.recent_sessions(1);
    ASSERT_EQ(sessions.size(), 1u);
    EXPECT_EQ(sessions[0].end_reason, "stopped");
    EXPECT_GT(sessions[0].ended_at_ms, 0);
}

TEST_F(AbrSessionManagerTest, ActiveSessionsSortedByStreamKey) {
    abr().initialize("zeta", "rtsp://z", {"360p"});
    abr().initialize("alpha", "rtsp://a", {"360p", "720p"});

    auto sessions = abr().active_sessions();
    ASSERT_EQ(sessions.size(), 2u);
    EXPECT_EQ(sessions[0].stream_key, "alpha");
    EXPECT_EQ(sessions[0].quality_count, 2u);
    EXPECT_EQ(sessions[0].current_quality, "720p");
    EXPECT_EQ(sessions[0].state, SessionState::Encoding);
    EXPECT_EQ(sessions[1].stream_key, "zeta");
    EXPECT_EQ(sessions[1].current_quality, "360p");
}

TEST_F(AbrSessionManagerTest, StopAllEndsEverySession) {
    abr().initialize("a", "rtsp://a", {"360p"});
    abr().initialize("b", "rtsp://b", {"360p"});

    abr().stop_all();
    EXPECT_EQ(abr().session_count(), 0u);
    EXPECT_TRUE(abr().active_sessions().empty());
}

} // namespace test
} // namespace sdc
