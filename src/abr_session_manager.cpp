#include "abr_session_manager.hpp"
#include "errors.hpp"
#include "manifest.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <cctype>
#include <future>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace sdc {

const char* session_state_name(SessionState state) {
    switch (state) {
        case SessionState::Initializing: return "initializing";
        case SessionState::Encoding: return "encoding";
        case SessionState::Degraded: return "degraded";
        case SessionState::Stopped: return "stopped";
    }
    return "unknown";
}

static const char* kDefaultQuality = "720p";

// Stream keys become directory names under media_root
static bool is_valid_stream_key(const std::string& key) {
    if (key.empty() || key.size() > 128 || key == "." || key == "..") {
        return false;
    }
    return std::all_of(key.begin(), key.end(), [](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '-' || c == '.';
    });
}

// Input sources are URIs or file paths; quotes, whitespace and control characters are refused
static bool is_valid_input_source(const std::string& source) {
    if (source.empty() || source.size() > 2048) {
        return false;
    }
    return std::none_of(source.begin(), source.end(), [](char c) {
        auto uc = static_cast<unsigned char>(c);
        return std::isspace(uc) || std::iscntrl(uc) || c == '"' || c == '\'' || c == '\\';
    });
}

static std::string metrics_prefix(const std::string& session_id) {
    return "metrics:" + session_id + ":";
}

static std::string network_prefix(const std::string& stream_key) {
    return "network:" + stream_key + ":";
}

static int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

AbrSessionManager::AbrSessionManager(const AppConfig& config, EncodeDriver& driver,
                                     MetricsStore& metrics, SessionRecordStore& records)
    : config_(config)
    , driver_(driver)
    , metrics_(metrics)
    , records_(records)
{
}

AbrSessionManager::~AbrSessionManager() {
    stop_all();
}

JobOptions AbrSessionManager::job_options() const {
    const AbrConfig& abr = config_.abr;
    JobOptions opts;
    opts.startup_timeout = std::chrono::milliseconds(abr.startup_timeout_ms);
    opts.health_interval = std::chrono::milliseconds(abr.health_check_interval_ms);
    opts.health_timeout = std::chrono::milliseconds(abr.health_check_timeout_ms);
    opts.health_retries = abr.health_check_retries;
    opts.retry_backoff = std::chrono::milliseconds(abr.retry_backoff_ms);
    opts.crash_window = std::chrono::milliseconds(abr.crash_window_ms);
    opts.stop_grace = std::chrono::milliseconds(abr.stop_grace_ms);
    return opts;
}

AbrSessionManager::SessionPtr AbrSessionManager::find_session(const std::string& stream_key) const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    auto it = sessions_.find(stream_key);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

size_t AbrSessionManager::session_count() const {
    std::lock_guard<std::mutex> lock(sessions_mutex_);
    return sessions_.size();
}

// ─── Initialization ──────────────────────────────────────────────────────────

AbrManifest AbrSessionManager::initialize(const std::string& stream_key,
                                          const std::string& input_source,
                                          const std::vector<std::string>& variants) {
    if (!is_valid_stream_key(stream_key)) {
        throw CoreError(ErrorCode::InvalidRequest, "Invalid stream key '" + stream_key + "'");
    }
    if (input_source.empty()) {
        throw CoreError(ErrorCode::InvalidRequest, "Input source is required");
    }
    if (!is_valid_input_source(input_source)) {
        throw CoreError(ErrorCode::InvalidRequest, "Invalid input source");
    }

    const std::vector<std::string>& requested = variants.empty() ? config_.abr.variants : variants;
    for (const auto& name : requested) {
        if (!find_variant(name)) {
            throw CoreError(ErrorCode::InvalidRequest, "Unknown quality variant '" + name + "'");
        }
    }
    std::vector<std::string> ordered = order_variants(requested);
    if (ordered.empty()) {
        throw CoreError(ErrorCode::InvalidRequest, "No quality variants requested");
    }

    reap_retired();

    auto session = std::make_shared<Session>();
    session->stream_key = stream_key;
    session->started_at = std::chrono::system_clock::now();
    session->session_id = "abr_" + stream_key + "_" + std::to_string(to_epoch_ms(session->started_at));
    session->output_dir = fs::path(config_.server.media_root) / stream_key;

    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        if (sessions_.count(stream_key)) {
            throw CoreError(ErrorCode::InvalidRequest,
                            "ABR session already active for stream " + stream_key);
        }
        sessions_[stream_key] = session;
    }

    spdlog::info("[{}] Initializing ABR session {} with {} variant(s) from {}",
                 stream_key, session->session_id, ordered.size(), input_source);

    // Build one job per variant; callbacks hold only a weak reference
    std::weak_ptr<Session> weak = session;
    std::map<std::string, std::unique_ptr<EncodeJob>> jobs;
    for (const auto& name : ordered) {
        EncodeSpec spec;
        spec.input_source = input_source;
        spec.variant = *find_variant(name);
        spec.output_dir = session->output_dir / name;
        spec.segment_seconds = config_.abr.segment_seconds;
        spec.playlist_length = config_.abr.playlist_length;
        spec.gop_size = config_.abr.gop_size;

        std::string session_id = session->session_id;
        jobs[name] = std::make_unique<EncodeJob>(
            driver_, std::move(spec), job_options(),
            [this, weak](const std::string& variant, JobState state, const std::string& detail) {
                on_job_state(weak, variant, state, detail);
            },
            [this, session_id](const std::string& variant, const EncodeProgress& progress) {
                on_job_progress(session_id, variant, progress);
            });
    }

    // Launch all variants in parallel; each waits for its own startup confirmation
    std::map<std::string, std::future<void>> launches;
    for (auto& [name, job] : jobs) {
        EncodeJob* raw = job.get();
        launches[name] = std::async(std::launch::async, [raw] { raw->start(); });
    }

    std::vector<FailedVariant> failed;
    for (auto& [name, launch] : launches) {
        try {
            launch.get();
        } catch (const std::exception& e) {
            spdlog::error("[{}] Variant {} failed to start: {}", stream_key, name, e.what());
            failed.push_back(FailedVariant{name, e.what()});
        }
    }

    std::vector<std::string> started;
    for (const auto& name : ordered) {
        bool did_fail = std::any_of(failed.begin(), failed.end(),
                                    [&](const FailedVariant& f) { return f.name == name; });
        if (!did_fail) {
            started.push_back(name);
        }
    }

    std::string abort_reason;
    for (const auto& required : config_.abr.required_variants) {
        bool was_requested = std::find(ordered.begin(), ordered.end(), required) != ordered.end();
        bool did_start = std::find(started.begin(), started.end(), required) != started.end();
        if (was_requested && !did_start) {
            abort_reason = "required variant " + required + " failed to start";
            break;
        }
    }
    if (abort_reason.empty() && started.empty()) {
        abort_reason = "no variant could be started";
    }

    fs::path master_path;
    if (abort_reason.empty()) {
        try {
            master_path = write_master_playlist(session->output_dir, started);
        } catch (const std::exception& e) {
            abort_reason = std::string("cannot write master playlist: ") + e.what();
        }
    }

    bool cancelled = false;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        cancelled = session->cancelled;
        if (abort_reason.empty() && !cancelled) {
            session->variants = started;

            // A job may already have given up while its siblings were still launching
            for (const auto& name : started) {
                if (jobs[name]->state() == JobState::Failed) {
                    session->unavailable.insert(name);
                }
            }

            if (available_variants(*session).empty()) {
                abort_reason = "every variant failed during startup";
            } else {
                session->jobs = std::move(jobs);
                session->current_quality = resolve_quality(*session, kDefaultQuality);
                session->condition = NetworkCondition::Good;
                session->state = SessionState::Encoding;
                if (!session->unavailable.empty()) {
                    session->state = SessionState::Degraded;
                    rewrite_manifest(*session);
                }
            }
        }
    }

    if (cancelled && abort_reason.empty()) {
        abort_reason = "stopped during initialization";
    }

    if (!abort_reason.empty()) {
        spdlog::error("[{}] ABR initialization failed: {}", stream_key, abort_reason);
        teardown_jobs(std::move(jobs));
        {
            std::lock_guard<std::mutex> lock(sessions_mutex_);
            auto it = sessions_.find(stream_key);
            if (it != sessions_.end() && it->second == session) {
                sessions_.erase(it);
            }
        }

        std::string message = "ABR initialization failed for " + stream_key + ": " + abort_reason;
        if (!failed.empty()) {
            message += " (failed:";
            for (const auto& f : failed) {
                message += " " + f.name;
            }
            message += ")";
        }
        throw CoreError(ErrorCode::EncodeStartFailure, message);
    }

    AbrManifest manifest;
    manifest.session_id = session->session_id;
    manifest.stream_key = stream_key;
    manifest.master_playlist = master_path.string();
    for (const auto& name : started) {
        VariantOutput out;
        out.preset = *find_variant(name);
        out.playlist = (session->output_dir / variant_playlist_uri(name)).string();
        manifest.variants.push_back(std::move(out));
    }
    manifest.failed = failed;

    record_durably([&](SessionRecordStore& store) {
        store.session_started(session->session_id, stream_key, to_epoch_ms(session->started_at));
        for (const auto& name : started) {
            store.variant_status(session->session_id, name, "running", "started");
        }
        for (const auto& f : failed) {
            store.variant_status(session->session_id, f.name, "failed", f.reason);
        }
    });

    if (failed.empty()) {
        spdlog::info("[{}] ABR session {} encoding {} variant(s)",
                     stream_key, session->session_id, started.size());
    } else {
        spdlog::warn("[{}] ABR session {} encoding {} variant(s), {} failed to start",
                     stream_key, session->session_id, started.size(), failed.size());
    }
    return manifest;
}

// ─── Job signals ─────────────────────────────────────────────────────────────

void AbrSessionManager::on_job_state(const std::weak_ptr<Session>& weak, const std::string& variant,
                                     JobState state, const std::string& detail) {
    SessionPtr session = weak.lock();
    if (!session) return;

    std::string session_id;
    std::string stream_key;
    bool all_failed = false;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        // Startup failures are reported through initialize()
        if (session->state == SessionState::Initializing ||
            session->state == SessionState::Stopped) {
            return;
        }
        session_id = session->session_id;
        stream_key = session->stream_key;

        if (state == JobState::Failed) {
            session->unavailable.insert(variant);
            std::vector<std::string> alive = available_variants(*session);

            if (alive.empty()) {
                spdlog::error("[{}] All variants failed, stopping session {}",
                              stream_key, session_id);
                session->state = SessionState::Stopped;
                all_failed = true;
            } else {
                spdlog::warn("[{}] Variant {} unavailable ({}), session degraded",
                             stream_key, variant, detail);
                session->state = SessionState::Degraded;

                // Move viewers off the lost variant
                if (session->current_quality == variant) {
                    session->current_quality = resolve_quality(*session, variant);
                }
                for (auto& [viewer_id, viewer] : session->viewers) {
                    if (viewer.quality == variant) {
                        viewer.quality = resolve_quality(*session, variant);
                    }
                }
            }
            rewrite_manifest(*session);
        } else if (state == JobState::Running && detail == "restarted") {
            spdlog::info("[{}] Variant {} recovered", stream_key, variant);
        }
    }

    if (state == JobState::Failed || (state == JobState::Running && detail == "restarted")) {
        record_durably([&](SessionRecordStore& store) {
            store.variant_status(session_id, variant, job_state_name(state), detail);
        });
    }

    if (!all_failed) return;

    // Detach the session; its jobs are joined later from a thread that is not one of theirs
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(stream_key);
        if (it != sessions_.end() && it->second == session) {
            sessions_.erase(it);
        }
    }
    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        retired_.push_back(session);
    }
    evict_metrics(session_id, stream_key);
    record_durably([&](SessionRecordStore& store) {
        store.session_ended(session_id, "all variants failed", now_epoch_ms());
    });
}

void AbrSessionManager::on_job_progress(const std::string& session_id, const std::string& variant,
                                        const EncodeProgress& progress) {
    if (progress.fps > 0.0 && progress.fps < config_.telemetry.low_fps_threshold) {
        spdlog::warn("[{}] Low encoding FPS on {}: {:.1f}", session_id, variant, progress.fps);
    }

    json payload = {
        {"quality", variant},
        {"fps", progress.fps},
        {"bitrate", progress.bitrate_kbps},
        {"frames", progress.frames},
        {"position", progress.position_s},
        {"timestamp", now_epoch_ms()},
    };

    try {
        bool ok = metrics_.set_ex(metrics_prefix(session_id) + variant, payload.dump(),
                                  std::chrono::seconds(config_.telemetry.metrics_ttl_s),
                                  std::chrono::milliseconds(config_.telemetry.store_timeout_ms));
        if (!ok) {
            spdlog::warn("[{}] Metrics write for {} timed out", session_id, variant);
        }
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Metrics write for {} failed: {}", session_id, variant, e.what());
    }
}

// ─── Telemetry ───────────────────────────────────────────────────────────────

TelemetryResult AbrSessionManager::record_telemetry(const std::string& stream_key,
                                                    const std::string& viewer_id,
                                                    const NetworkSample& sample) {
    if (viewer_id.empty()) {
        throw CoreError(ErrorCode::InvalidRequest, "Viewer id is required");
    }

    SessionPtr session = find_session(stream_key);
    if (!session) {
        throw CoreError(ErrorCode::NotFound, "No ABR session for stream " + stream_key);
    }

    TelemetryResult result;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->state == SessionState::Initializing || session->state == SessionState::Stopped) {
            throw CoreError(ErrorCode::NotFound, "ABR session for " + stream_key + " is not encoding");
        }

        auto now = std::chrono::steady_clock::now();
        prune_viewers(*session, now);

        auto it = session->viewers.find(viewer_id);
        if (it == session->viewers.end()) {
            Session::Viewer viewer{
                TelemetryWindow(static_cast<size_t>(config_.telemetry.window_size),
                                static_cast<size_t>(config_.telemetry.upgrade_hold_samples)),
                session->current_quality,
                now,
            };
            it = session->viewers.emplace(viewer_id, std::move(viewer)).first;
        }
        Session::Viewer& viewer = it->second;
        viewer.last_seen = now;

        NetworkCondition condition = viewer.window.add(sample);
        std::string served = resolve_quality(*session, quality_for_condition(condition));

        result.current_quality = viewer.quality;
        result.recommended_quality = served;
        result.condition = condition;
        result.available_qualities = available_variants(*session);
        result.changed = viewer.quality != served;

        viewer.quality = served;
        if (session->condition != condition) {
            spdlog::info("[{}] Network condition {} -> {} (viewer {})", stream_key,
                         condition_name(session->condition), condition_name(condition), viewer_id);
            session->condition = condition;
        }
    }

    if (result.changed) {
        spdlog::info("[{}] Viewer {} quality {} -> {}", stream_key, viewer_id,
                     result.current_quality, result.recommended_quality);
    }

    // Best effort: a slow or failing store never fails the telemetry call
    json payload = {
        {"bandwidth", sample.bandwidth_kbps},
        {"latency", sample.latency_ms},
        {"packetLoss", sample.packet_loss_pct},
        {"condition", condition_name(result.condition)},
        {"recommendedQuality", result.recommended_quality},
        {"timestamp", to_epoch_ms(sample.timestamp)},
    };
    try {
        bool ok = metrics_.set_ex(network_prefix(stream_key) + viewer_id, payload.dump(),
                                  std::chrono::seconds(config_.telemetry.network_ttl_s),
                                  std::chrono::milliseconds(config_.telemetry.store_timeout_ms));
        if (!ok) {
            spdlog::warn("[{}] Telemetry write for viewer {} timed out", stream_key, viewer_id);
        }
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Telemetry write for viewer {} failed: {}", stream_key, viewer_id, e.what());
    }

    return result;
}

void AbrSessionManager::prune_viewers(Session& session, std::chrono::steady_clock::time_point now) {
    auto ttl = std::chrono::seconds(config_.telemetry.network_ttl_s);
    for (auto it = session.viewers.begin(); it != session.viewers.end();) {
        if (now - it->second.last_seen > ttl) {
            it = session.viewers.erase(it);
        } else {
            ++it;
        }
    }
}

std::vector<std::string> AbrSessionManager::available_variants(const Session& session) const {
    std::vector<std::string> out;
    for (const auto& name : session.variants) {
        if (!session.unavailable.count(name)) {
            out.push_back(name);
        }
    }
    return out;
}

std::string AbrSessionManager::resolve_quality(const Session& session, const std::string& wanted) const {
    std::vector<std::string> available = available_variants(session);
    if (available.empty()) {
        return session.current_quality;
    }

    int wanted_rank = variant_rank(wanted);
    std::string best;
    for (const auto& name : available) {
        if (variant_rank(name) <= wanted_rank) {
            best = name;  // ladder order, so the last match is the highest
        }
    }
    return best.empty() ? available.front() : best;
}

void AbrSessionManager::rewrite_manifest(const Session& session) {
    try {
        write_master_playlist(session.output_dir, available_variants(session));
    } catch (const std::exception& e) {
        spdlog::error("[{}] Failed to rewrite master playlist: {}", session.stream_key, e.what());
    }
}

// ─── Stop ────────────────────────────────────────────────────────────────────

bool AbrSessionManager::stop(const std::string& stream_key) {
    SessionPtr session;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        auto it = sessions_.find(stream_key);
        if (it == sessions_.end()) {
            return false;
        }
        session = it->second;
        sessions_.erase(it);
    }

    std::map<std::string, std::unique_ptr<EncodeJob>> jobs;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        if (session->state == SessionState::Initializing) {
            // initialize() owns the jobs until it finishes launching; it tears them down
            session->cancelled = true;
            spdlog::info("[{}] Stop requested during initialization", stream_key);
            return true;
        }
        session->state = SessionState::Stopped;
        jobs = std::move(session->jobs);
    }

    spdlog::info("[{}] Stopping ABR session {}", stream_key, session->session_id);
    teardown_jobs(std::move(jobs));
    evict_metrics(session->session_id, stream_key);
    record_durably([&](SessionRecordStore& store) {
        store.session_ended(session->session_id, "stopped", now_epoch_ms());
    });

    reap_retired();
    spdlog::info("[{}] ABR session stopped", stream_key);
    return true;
}

void AbrSessionManager::stop_all() {
    std::vector<std::string> keys;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [key, session] : sessions_) {
            keys.push_back(key);
        }
    }
    for (const auto& key : keys) {
        stop(key);
    }
    reap_retired();
}

void AbrSessionManager::teardown_jobs(std::map<std::string, std::unique_ptr<EncodeJob>> jobs) {
    // Stop in parallel so the total wait is one grace period, not one per variant
    std::vector<std::future<void>> stops;
    for (auto& [name, job] : jobs) {
        EncodeJob* raw = job.get();
        stops.push_back(std::async(std::launch::async, [raw] { raw->stop(); }));
    }
    for (auto& f : stops) {
        try {
            f.get();
        } catch (const std::exception& e) {
            spdlog::error("Error while stopping encode job: {}", e.what());
        }
    }
}

void AbrSessionManager::evict_metrics(const std::string& session_id, const std::string& stream_key) {
    try {
        size_t removed = metrics_.erase_prefix(metrics_prefix(session_id));
        removed += metrics_.erase_prefix(network_prefix(stream_key));
        spdlog::debug("[{}] Evicted {} metric key(s)", stream_key, removed);
    } catch (const std::exception& e) {
        spdlog::warn("[{}] Failed to evict metrics: {}", stream_key, e.what());
    }
}

void AbrSessionManager::reap_retired() {
    std::vector<SessionPtr> retired;
    {
        std::lock_guard<std::mutex> lock(retired_mutex_);
        retired.swap(retired_);
    }

    for (auto& session : retired) {
        std::map<std::string, std::unique_ptr<EncodeJob>> jobs;
        {
            std::lock_guard<std::mutex> lock(session->mutex);
            jobs = std::move(session->jobs);
        }
        teardown_jobs(std::move(jobs));
    }
}

void AbrSessionManager::record_durably(const std::function<void(SessionRecordStore&)>& write) {
    try {
        write(records_);
    } catch (const std::exception& e) {
        spdlog::warn("Session record write failed: {}", e.what());
    }
}

// ─── Queries ─────────────────────────────────────────────────────────────────

std::optional<SessionSnapshot> AbrSessionManager::get_analytics(const std::string& stream_key) {
    SessionPtr session = find_session(stream_key);
    if (!session) {
        return std::nullopt;
    }

    SessionSnapshot snap;
    std::vector<std::string> variants;
    {
        std::lock_guard<std::mutex> lock(session->mutex);
        snap.session_id = session->session_id;
        snap.stream_key = session->stream_key;
        snap.state = session->state;
        snap.started_at = session->started_at;
        snap.current_quality = session->current_quality;
        snap.network_condition = session->condition;
        snap.available_qualities = available_variants(*session);
        snap.viewer_count = session->viewers.size();
        if (session->state != SessionState::Initializing) {
            snap.master_playlist = (session->output_dir / "master.m3u8").string();
        }

        for (const auto& name : session->variants) {
            VariantStatus status;
            status.name = name;
            auto job = session->jobs.find(name);
            if (job != session->jobs.end()) {
                status.state = job->second->state();
                status.crash_count = job->second->crash_count();
            }
            status.available = !session->unavailable.count(name);
            snap.variants.push_back(status);
        }
        variants = session->variants;
    }

    // Store reads happen outside the session lock
    for (const auto& name : variants) {
        try {
            auto value = metrics_.get(metrics_prefix(snap.session_id) + name);
            if (value) {
                snap.quality_metrics[name] = json::parse(*value);
            }
        } catch (const std::exception& e) {
            spdlog::warn("[{}] Could not read metrics for {}: {}", stream_key, name, e.what());
        }
    }
    return snap;
}

std::vector<SessionSummary> AbrSessionManager::active_sessions() {
    reap_retired();

    std::vector<SessionPtr> sessions;
    {
        std::lock_guard<std::mutex> lock(sessions_mutex_);
        for (const auto& [key, session] : sessions_) {
            sessions.push_back(session);
        }
    }

    std::vector<SessionSummary> out;
    for (const auto& session : sessions) {
        std::lock_guard<std::mutex> lock(session->mutex);
        SessionSummary s;
        s.stream_key = session->stream_key;
        s.session_id = session->session_id;
        s.started_at = session->started_at;
        s.current_quality = session->current_quality;
        s.network_condition = session->condition;
        s.state = session->state;
        s.quality_count = available_variants(*session).size();
        out.push_back(std::move(s));
    }

    std::sort(out.begin(), out.end(), [](const SessionSummary& a, const SessionSummary& b) {
        return a.stream_key < b.stream_key;
    });
    return out;
}

} // namespace sdc
