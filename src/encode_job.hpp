#pragma once

#include "quality_variant.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <deque>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace sdc {

// ─── Encoder signals ─────────────────────────────────────────────────────────

enum class EncodeEventType {
    Started,
    Progress,
    Error,
    End,
};

struct EncodeProgress {
    double fps = 0.0;
    double bitrate_kbps = 0.0;
    uint64_t frames = 0;
    double position_s = 0.0;
};

struct EncodeEvent {
    EncodeEventType type = EncodeEventType::Progress;
    EncodeProgress progress;
    std::string message;
};

// FIFO between an encoder (producer) and its supervisor thread (consumer)
class EventChannel {
public:
    void push(EncodeEvent event);

    // Waits up to `timeout`; nullopt on timeout or once closed and drained
    std::optional<EncodeEvent> pop_for(std::chrono::milliseconds timeout);

    void close();
    bool closed() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<EncodeEvent> queue_;
    bool closed_ = false;
};

// ─── Encoder process contract ───────────────────────────────────────────────

struct EncodeSpec {
    std::string input_source;
    QualityVariant variant;
    std::filesystem::path output_dir;  // <media_root>/<stream>/<variant>
    int segment_seconds = 2;
    int playlist_length = 10;
    int gop_size = 60;
};

// One running encoder instance producing segmented output
class EncodeProcess {
public:
    virtual ~EncodeProcess() = default;

    // Bounded liveness probe
    virtual bool health_check(std::chrono::milliseconds timeout) = 0;

    // Graceful stop, hard kill once `grace` runs out. True when the graceful path finished.
    virtual bool terminate(std::chrono::milliseconds grace) = 0;
};

class EncodeDriver {
public:
    virtual ~EncodeDriver() = default;

    // Launches the encoder and waits for startup confirmation. Signals are pushed
    // to `events` for the lifetime of the process.
    // Throws CoreError(EncodeStartFailure) when the encoder cannot be started.
    virtual std::unique_ptr<EncodeProcess> launch(const EncodeSpec& spec,
                                                  std::shared_ptr<EventChannel> events,
                                                  std::chrono::milliseconds startup_timeout) = 0;
};

// ─── Job supervision ─────────────────────────────────────────────────────────

enum class JobState {
    Starting,
    Running,
    Failed,
    Stopped,
};

const char* job_state_name(JobState state);

enum class CrashAction {
    Retry,
    GiveUp,
};

// Retry once; a second crash inside the window is final
class CrashTracker {
public:
    using Clock = std::chrono::steady_clock;

    explicit CrashTracker(std::chrono::milliseconds window) : window_(window) {}

    CrashAction on_crash(Clock::time_point now);
    int crash_count() const { return crash_count_; }

private:
    std::chrono::milliseconds window_;
    std::optional<Clock::time_point> last_crash_;
    int crash_count_ = 0;
};

struct JobOptions {
    std::chrono::milliseconds startup_timeout{5000};
    std::chrono::milliseconds health_interval{2000};
    std::chrono::milliseconds health_timeout{1000};
    int health_retries = 3;
    std::chrono::milliseconds retry_backoff{1000};
    std::chrono::milliseconds crash_window{30000};
    std::chrono::milliseconds stop_grace{3000};
};

// Supervises the encoder for one quality variant: consumes its signals,
// probes health, restarts once after a crash and gives up on the second.
class EncodeJob {
public:
    using StateCallback = std::function<void(const std::string& variant, JobState state,
                                             const std::string& detail)>;
    using ProgressCallback = std::function<void(const std::string& variant,
                                                const EncodeProgress& progress)>;

    EncodeJob(EncodeDriver& driver, EncodeSpec spec, JobOptions options,
              StateCallback state_cb, ProgressCallback progress_cb);
    ~EncodeJob();

    // Non-copyable
    EncodeJob(const EncodeJob&) = delete;
    EncodeJob& operator=(const EncodeJob&) = delete;

    // Launches the first encoder and begins supervision.
    // Throws CoreError(EncodeStartFailure); no thread is left running on failure.
    void start();

    // Safe to call repeatedly and from any thread except the supervisor's own
    void stop();

    JobState state() const { return state_.load(); }
    const std::string& variant() const { return spec_.variant.name; }
    int crash_count() const { return crash_count_.load(); }

private:
    void supervise_loop();
    // Both return false when supervision should end
    bool run_health_check();
    bool handle_crash(const std::string& reason);
    void teardown_process(std::chrono::milliseconds grace);
    void set_state(JobState state, const std::string& detail);
    void backoff_wait();

    EncodeDriver& driver_;
    EncodeSpec spec_;
    JobOptions options_;
    StateCallback state_cb_;
    ProgressCallback progress_cb_;

    std::shared_ptr<EventChannel> events_;
    std::unique_ptr<EncodeProcess> process_;
    CrashTracker crashes_;

    std::thread thread_;
    std::atomic<JobState> state_{JobState::Starting};
    std::atomic<bool> stop_requested_{false};
    std::atomic<int> crash_count_{0};
    std::mutex stop_mutex_;

    int failed_health_checks_ = 0;
    std::chrono::steady_clock::time_point last_health_check_;
};

} // namespace sdc
