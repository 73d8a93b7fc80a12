#include "encode_job.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>

namespace sdc {

// ─── EventChannel ────────────────────────────────────────────────────────────

void EventChannel::push(EncodeEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

std::optional<EncodeEvent> EventChannel::pop_for(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    EncodeEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

void EventChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool EventChannel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// ─── CrashTracker ────────────────────────────────────────────────────────────

const char* job_state_name(JobState state) {
    switch (state) {
        case JobState::Starting: return "starting";
        case JobState::Running: return "running";
        case JobState::Failed: return "failed";
        case JobState::Stopped: return "stopped";
    }
    return "unknown";
}

CrashAction CrashTracker::on_crash(Clock::time_point now) {
    crash_count_++;
    if (last_crash_ && now - *last_crash_ <= window_) {
        return CrashAction::GiveUp;
    }
    last_crash_ = now;
    return CrashAction::Retry;
}

// ─── EncodeJob ───────────────────────────────────────────────────────────────

EncodeJob::EncodeJob(EncodeDriver& driver, EncodeSpec spec, JobOptions options,
                     StateCallback state_cb, ProgressCallback progress_cb)
    : driver_(driver)
    , spec_(std::move(spec))
    , options_(options)
    , state_cb_(std::move(state_cb))
    , progress_cb_(std::move(progress_cb))
    , crashes_(options.crash_window)
{
}

EncodeJob::~EncodeJob() {
    stop();
}

void EncodeJob::start() {
    events_ = std::make_shared<EventChannel>();
    set_state(JobState::Starting, "launching");

    try {
        process_ = driver_.launch(spec_, events_, options_.startup_timeout);
    } catch (const CoreError&) {
        events_->close();
        set_state(JobState::Failed, "launch failed");
        throw;
    } catch (const std::exception& e) {
        events_->close();
        set_state(JobState::Failed, e.what());
        throw CoreError(ErrorCode::EncodeStartFailure,
                        "Failed to launch " + spec_.variant.name + ": " + e.what());
    }

    if (!process_) {
        events_->close();
        set_state(JobState::Failed, "launch returned no process");
        throw CoreError(ErrorCode::EncodeStartFailure,
                        "Failed to launch " + spec_.variant.name);
    }

    set_state(JobState::Running, "started");
    last_health_check_ = std::chrono::steady_clock::now();
    thread_ = std::thread(&EncodeJob::supervise_loop, this);
}

void EncodeJob::stop() {
    stop_requested_.store(true);
    if (thread_.joinable() && thread_.get_id() == std::this_thread::get_id()) {
        // Called back from our own supervisor; it exits on the flag
        return;
    }

    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (thread_.joinable()) {
        thread_.join();
    }

    if (process_) {
        teardown_process(options_.stop_grace);
    }

    JobState current = state_.load();
    if (current != JobState::Failed && current != JobState::Stopped) {
        set_state(JobState::Stopped, "stopped");
    }
}

void EncodeJob::supervise_loop() {
    spdlog::debug("[{}] Supervisor started", spec_.variant.name);

    while (!stop_requested_.load()) {
        try {
            auto event = events_->pop_for(std::chrono::milliseconds(100));

            if (event) {
                switch (event->type) {
                    case EncodeEventType::Started:
                        if (state_.load() == JobState::Starting) {
                            set_state(JobState::Running, "started");
                        }
                        break;
                    case EncodeEventType::Progress:
                        if (progress_cb_) {
                            progress_cb_(spec_.variant.name, event->progress);
                        }
                        break;
                    case EncodeEventType::Error:
                    case EncodeEventType::End:
                        if (stop_requested_.load()) break;
                        if (!handle_crash(event->type == EncodeEventType::Error
                                              ? event->message
                                              : "encoder exited unexpectedly")) {
                            return;
                        }
                        break;
                }
            }

            if (!stop_requested_.load() && process_ &&
                std::chrono::steady_clock::now() - last_health_check_ >= options_.health_interval) {
                if (!run_health_check()) {
                    return;
                }
            }
        } catch (const std::exception& e) {
            spdlog::error("[{}] Supervisor error: {}", spec_.variant.name, e.what());
            if (!handle_crash(e.what())) {
                return;
            }
        }
    }

    spdlog::debug("[{}] Supervisor stopped", spec_.variant.name);
}

bool EncodeJob::run_health_check() {
    last_health_check_ = std::chrono::steady_clock::now();

    if (process_->health_check(options_.health_timeout)) {
        failed_health_checks_ = 0;
        return true;
    }

    failed_health_checks_++;
    spdlog::warn("[{}] Health check timed out ({}/{})",
                 spec_.variant.name, failed_health_checks_, options_.health_retries);

    if (failed_health_checks_ >= options_.health_retries) {
        failed_health_checks_ = 0;
        return handle_crash("health check timed out");
    }
    return true;
}

bool EncodeJob::handle_crash(const std::string& reason) {
    crash_count_.fetch_add(1);
    spdlog::error("[{}] Encoder failure: {}", spec_.variant.name, reason);

    teardown_process(std::chrono::milliseconds(0));

    CrashAction action = crashes_.on_crash(std::chrono::steady_clock::now());
    if (action == CrashAction::GiveUp) {
        spdlog::warn("[{}] Second failure inside {}ms, variant marked unavailable",
                     spec_.variant.name, options_.crash_window.count());
        set_state(JobState::Failed, reason);
        return false;
    }

    set_state(JobState::Starting, "restarting after failure: " + reason);
    backoff_wait();
    if (stop_requested_.load()) {
        return false;
    }

    events_ = std::make_shared<EventChannel>();
    try {
        process_ = driver_.launch(spec_, events_, options_.startup_timeout);
    } catch (const std::exception& e) {
        process_.reset();
        return handle_crash(std::string("restart failed: ") + e.what());
    }
    if (!process_) {
        return handle_crash("restart returned no process");
    }

    spdlog::info("[{}] Encoder restarted", spec_.variant.name);
    set_state(JobState::Running, "restarted");
    last_health_check_ = std::chrono::steady_clock::now();
    failed_health_checks_ = 0;
    return true;
}

void EncodeJob::teardown_process(std::chrono::milliseconds grace) {
    if (events_) {
        events_->close();
    }
    if (!process_) return;

    try {
        if (!process_->terminate(grace) && grace.count() > 0) {
            spdlog::warn("[{}] Encoder did not stop within {}ms, killed",
                         spec_.variant.name, grace.count());
        }
    } catch (const std::exception& e) {
        spdlog::error("[{}] Error while terminating encoder: {}", spec_.variant.name, e.what());
    }
    process_.reset();
}

void EncodeJob::set_state(JobState state, const std::string& detail) {
    JobState previous = state_.exchange(state);
    if (previous == state && state != JobState::Starting) {
        return;
    }

    spdlog::debug("[{}] Job {} -> {} ({})", spec_.variant.name,
                  job_state_name(previous), job_state_name(state), detail);
    if (state_cb_) {
        try {
            state_cb_(spec_.variant.name, state, detail);
        } catch (const std::exception& e) {
            spdlog::error("[{}] State callback failed: {}", spec_.variant.name, e.what());
        }
    }
}

void EncodeJob::backoff_wait() {
    // Sleep in small increments to allow quick shutdown
    auto deadline = std::chrono::steady_clock::now() + options_.retry_backoff;
    while (std::chrono::steady_clock::now() < deadline && !stop_requested_.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
}

} // namespace sdc
