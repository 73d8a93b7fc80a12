#pragma once

#include "config.hpp"
#include "encode_job.hpp"
#include "metrics_store.hpp"
#include "network_classifier.hpp"
#include "quality_variant.hpp"
#include "session_store.hpp"
#include "telemetry_window.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace sdc {

enum class SessionState {
    Initializing,
    Encoding,
    Degraded,
    Stopped,
};

const char* session_state_name(SessionState state);

struct VariantOutput {
    QualityVariant preset;
    std::string playlist;  // path of the variant playlist
};

struct FailedVariant {
    std::string name;
    std::string reason;
};

// Returned to the broadcaster by initialize()
struct AbrManifest {
    std::string session_id;
    std::string stream_key;
    std::string master_playlist;
    std::vector<VariantOutput> variants;
    std::vector<FailedVariant> failed;
};

struct TelemetryResult {
    std::string current_quality;       // what the viewer was served before this sample
    std::string recommended_quality;   // damped, resolved against available variants
    NetworkCondition condition = NetworkCondition::Poor;
    std::vector<std::string> available_qualities;
    bool changed = false;
};

struct VariantStatus {
    std::string name;
    JobState state = JobState::Starting;
    int crash_count = 0;
    bool available = true;
};

struct SessionSnapshot {
    std::string session_id;
    std::string stream_key;
    SessionState state = SessionState::Initializing;
    std::chrono::system_clock::time_point started_at;
    std::string current_quality;   // session default; moves only when that variant is lost
    NetworkCondition network_condition = NetworkCondition::Good;  // latest reported by any viewer
    std::string master_playlist;
    std::vector<std::string> available_qualities;
    std::vector<VariantStatus> variants;
    size_t viewer_count = 0;
    std::map<std::string, nlohmann::json> quality_metrics;
};

struct SessionSummary {
    std::string stream_key;
    std::string session_id;
    std::chrono::system_clock::time_point started_at;
    std::string current_quality;
    NetworkCondition network_condition = NetworkCondition::Good;
    SessionState state = SessionState::Initializing;
    size_t quality_count = 0;
};

// Owns one encoding session per live stream. Sessions are looked up under a
// short map lock; all per-session work is serialized by the session's own mutex.
class AbrSessionManager {
public:
    AbrSessionManager(const AppConfig& config, EncodeDriver& driver,
                      MetricsStore& metrics, SessionRecordStore& records);
    ~AbrSessionManager();

    // Non-copyable
    AbrSessionManager(const AbrSessionManager&) = delete;
    AbrSessionManager& operator=(const AbrSessionManager&) = delete;

    // Starts one encode job per variant (configured set when `variants` is empty)
    // and writes the master playlist over the ones that started.
    // Throws CoreError: InvalidRequest for bad arguments or an already active stream,
    // EncodeStartFailure when nothing (or a required variant) could be started.
    AbrManifest initialize(const std::string& stream_key, const std::string& input_source,
                           const std::vector<std::string>& variants = {});

    // Throws CoreError: NotFound when the stream has no session, InvalidRequest for an empty viewer id
    TelemetryResult record_telemetry(const std::string& stream_key, const std::string& viewer_id,
                                     const NetworkSample& sample);

    // Returns false when the stream had no session
    bool stop(const std::string& stream_key);
    void stop_all();

    std::optional<SessionSnapshot> get_analytics(const std::string& stream_key);
    std::vector<SessionSummary> active_sessions();
    size_t session_count() const;

private:
    struct Session {
        std::mutex mutex;

        // Fixed at creation
        std::string session_id;
        std::string stream_key;
        std::filesystem::path output_dir;
        std::chrono::system_clock::time_point started_at;

        std::vector<std::string> variants;  // started variants, ladder order
        std::set<std::string> unavailable;
        std::map<std::string, std::unique_ptr<EncodeJob>> jobs;

        SessionState state = SessionState::Initializing;
        bool cancelled = false;
        std::string current_quality;
        NetworkCondition condition = NetworkCondition::Good;

        struct Viewer {
            TelemetryWindow window;
            std::string quality;
            std::chrono::steady_clock::time_point last_seen;
        };
        std::unordered_map<std::string, Viewer> viewers;
    };
    using SessionPtr = std::shared_ptr<Session>;

    SessionPtr find_session(const std::string& stream_key) const;
    JobOptions job_options() const;

    void on_job_state(const std::weak_ptr<Session>& weak, const std::string& variant,
                      JobState state, const std::string& detail);
    void on_job_progress(const std::string& session_id, const std::string& variant,
                         const EncodeProgress& progress);

    // Caller holds session->mutex
    std::vector<std::string> available_variants(const Session& session) const;
    std::string resolve_quality(const Session& session, const std::string& wanted) const;
    void rewrite_manifest(const Session& session);
    void prune_viewers(Session& session, std::chrono::steady_clock::time_point now);

    void teardown_jobs(std::map<std::string, std::unique_ptr<EncodeJob>> jobs);
    void evict_metrics(const std::string& session_id, const std::string& stream_key);
    void reap_retired();

    void record_durably(const std::function<void(SessionRecordStore&)>& write);

    AppConfig config_;
    EncodeDriver& driver_;
    MetricsStore& metrics_;
    SessionRecordStore& records_;

    mutable std::mutex sessions_mutex_;
    std::unordered_map<std::string, SessionPtr> sessions_;

    // Sessions that ended on their own; joined outside their supervisor threads
    std::mutex retired_mutex_;
    std::vector<SessionPtr> retired_;
};

} // namespace sdc
