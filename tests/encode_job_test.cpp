// Tests for encoder supervision
//
// Tests cover:
// - Event channel handoff
// - Crash tracking inside and outside the window
// - Start, restart and give-up paths of EncodeJob
// - Health probes and progress forwarding

#include <gtest/gtest.h>
#include <mutex>
#include <vector>

#include "encode_job.hpp"
#include "errors.hpp"
#include "fake_encode_driver.hpp"

using namespace std::chrono_literals;

namespace sdc {
namespace test {

// ============================================================================
// EventChannel
// ============================================================================

TEST(EventChannelTest, DeliversInOrder) {
    EventChannel channel;
    channel.push(EncodeEvent{EncodeEventType::Started, {}, "a"});
    channel.push(EncodeEvent{EncodeEventType::End, {}, "b"});

    auto first = channel.pop_for(10ms);
    auto second = channel.pop_for(10ms);
    ASSERT_TRUE(first && second);
    EXPECT_EQ(first->message, "a");
    EXPECT_EQ(second->type, EncodeEventType::End);
    EXPECT_FALSE(channel.pop_for(10ms).has_value());
}

TEST(EventChannelTest, CloseWakesWaiterAndDropsLaterPushes) {
    EventChannel channel;
    std::thread closer([&channel] {
        std::this_thread::sleep_for(20ms);
        channel.close();
    });
    EXPECT_FALSE(channel.pop_for(5000ms).has_value());
    closer.join();

    EXPECT_TRUE(channel.closed());
    channel.push(EncodeEvent{EncodeEventType::Started, {}, ""});
    EXPECT_FALSE(channel.pop_for(10ms).has_value());
}

// ============================================================================
// CrashTracker
// ============================================================================

TEST(CrashTrackerTest, SecondCrashInsideWindowGivesUp) {
    CrashTracker tracker(1000ms);
    auto t0 = CrashTracker::Clock::now();

    EXPECT_EQ(tracker.on_crash(t0), CrashAction::Retry);
    EXPECT_EQ(tracker.on_crash(t0 + 500ms), CrashAction::GiveUp);
    EXPECT_EQ(tracker.crash_count(), 2);
}

TEST(CrashTrackerTest, CrashesOutsideWindowKeepRetrying) {
    CrashTracker tracker(1000ms);
    auto t0 = CrashTracker::Clock::now();

    EXPECT_EQ(tracker.on_crash(t0), CrashAction::Retry);
    EXPECT_EQ(tracker.on_crash(t0 + 2000ms), CrashAction::Retry);
    EXPECT_EQ(tracker.on_crash(t0 + 4500ms), CrashAction::Retry);
    EXPECT_EQ(tracker.on_crash(t0 + 4600ms), CrashAction::GiveUp);
}

// ============================================================================
// EncodeJob
// ============================================================================

class EncodeJobTest : public ::testing::Test {
protected:
    struct Transition {
        JobState state;
        std::string detail;
    };

    void SetUp() override {
        spec_.input_source = "rtmp://localhost/live/cam1";
        spec_.variant = *find_variant("720p");
        spec_.output_dir = "/tmp/sdc-test/cam1/720p";

        options_.startup_timeout = 500ms;
        options_.health_interval = 60000ms;
        options_.health_timeout = 50ms;
        options_.health_retries = 2;
        options_.retry_backoff = 20ms;
        options_.crash_window = 30000ms;
        options_.stop_grace = 100ms;
    }

    std::unique_ptr<EncodeJob> make_job() {
        return std::make_unique<EncodeJob>(
            driver_, spec_, options_,
            [this](const std::string&, JobState state, const std::string& detail) {
                std::lock_guard<std::mutex> lock(mutex_);
                transitions_.push_back(Transition{state, detail});
            },
            [this](const std::string& variant, const EncodeProgress& progress) {
                std::lock_guard<std::mutex> lock(mutex_);
                progress_.emplace_back(variant, progress.fps);
            });
    }

    bool saw(JobState state, const std::string& detail = "") {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& t : transitions_) {
            if (t.state == state && (detail.empty() || t.detail == detail)) return true;
        }
        return false;
    }

    size_t progress_count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return progress_.size();
    }

    FakeEncodeDriver driver_;
    EncodeSpec spec_;
    JobOptions options_;

    std::mutex mutex_;
    std::vector<Transition> transitions_;
    std::vector<std::pair<std::string, double>> progress_;
};

TEST_F(EncodeJobTest, StartRunsEncoder) {
    auto job = make_job();
    job->start();

    EXPECT_EQ(job->state(), JobState::Running);
    EXPECT_EQ(job->variant(), "720p");
    EXPECT_EQ(driver_.launch_count("720p"), 1);
    EXPECT_EQ(driver_.last_spec("720p").input_source, "rtmp://localhost/live/cam1");
    EXPECT_TRUE(saw(JobState::Starting, "launching"));
    EXPECT_TRUE(saw(JobState::Running, "started"));
}

TEST_F(EncodeJobTest, LaunchFailureThrowsAndMarksFailed) {
    driver_.fail_launch("720p");
    auto job = make_job();

    try {
        job->start();
        FAIL() << "start() should have thrown";
    } catch (const CoreError& e) {
        EXPECT_EQ(e.code(), ErrorCode::EncodeStartFailure);
    }
    EXPECT_EQ(job->state(), JobState::Failed);

    // Destructor must not hang on a job that never started
    job.reset();
}

TEST_F(EncodeJobTest, SingleCrashRestartsOnce) {
    auto job = make_job();
    job->start();

    driver_.crash("720p", "segfault");
    ASSERT_TRUE(wait_until([&] { return driver_.launch_count("720p") == 2; }));
    ASSERT_TRUE(wait_until([&] { return saw(JobState::Running, "restarted"); }));

    EXPECT_EQ(job->state(), JobState::Running);
    EXPECT_EQ(job->crash_count(), 1);
    EXPECT_EQ(driver_.terminations("720p"), 1);
}

TEST_F(EncodeJobTest, SecondCrashInsideWindowFails) {
    auto job = make_job();
    job->start();

    driver_.crash("720p");
    ASSERT_TRUE(wait_until([&] { return saw(JobState::Running, "restarted"); }));
    driver_.end_of_stream("720p");

    ASSERT_TRUE(wait_until([&] { return job->state() == JobState::Failed; }));
    EXPECT_EQ(job->crash_count(), 2);
    EXPECT_EQ(driver_.launch_count("720p"), 2);

    // Stop after give-up leaves the terminal state alone
    job->stop();
    EXPECT_EQ(job->state(), JobState::Failed);
}

TEST_F(EncodeJobTest, CrashesOutsideWindowRetryAgain) {
    options_.crash_window = 30ms;
    auto job = make_job();
    job->start();

    driver_.crash("720p");
    ASSERT_TRUE(wait_until([&] { return driver_.launch_count("720p") == 2; }));
    ASSERT_TRUE(wait_until([&] { return job->state() == JobState::Running; }));
    std::this_thread::sleep_for(100ms);

    driver_.crash("720p");
    ASSERT_TRUE(wait_until([&] { return driver_.launch_count("720p") == 3; }));
    ASSERT_TRUE(wait_until([&] { return job->state() == JobState::Running; }));
    EXPECT_EQ(job->crash_count(), 2);
}

TEST_F(EncodeJobTest, FailedRestartCountsAsSecondCrash) {
    auto job = make_job();
    job->start();

    driver_.fail_launch("720p");
    driver_.crash("720p");

    ASSERT_TRUE(wait_until([&] { return job->state() == JobState::Failed; }));
    EXPECT_EQ(job->crash_count(), 2);
}

TEST_F(EncodeJobTest, RepeatedHealthFailuresTreatedAsCrash) {
    options_.health_interval = 10ms;
    auto job = make_job();
    job->start();

    driver_.set_healthy("720p", false);
    ASSERT_TRUE(wait_until([&] { return driver_.launch_count("720p") >= 2; }));
    ASSERT_TRUE(wait_until([&] { return job->state() == JobState::Failed; }, 5000ms));
    EXPECT_EQ(job->crash_count(), 2);
}

TEST_F(EncodeJobTest, ProgressIsForwarded) {
    auto job = make_job();
    job->start();

    driver_.progress("720p", 29.97, 2480.0);
    ASSERT_TRUE(wait_until([&] { return progress_count() == 1; }));

    std::lock_guard<std::mutex> lock(mutex_);
    EXPECT_EQ(progress_[0].first, "720p");
    EXPECT_DOUBLE_EQ(progress_[0].second, 29.97);
}

TEST_F(EncodeJobTest, StopTerminatesGracefullyAndIsIdempotent) {
    auto job = make_job();
    job->start();

    job->stop();
    job->stop();

    EXPECT_EQ(job->state(), JobState::Stopped);
    EXPECT_EQ(driver_.terminations("720p"), 1);
    EXPECT_EQ(driver_.graceful_terminations("720p"), 1);
}

TEST_F(EncodeJobTest, StopDuringBackoffSkipsRestart) {
    options_.retry_backoff = 2000ms;
    auto job = make_job();
    job->start();

    driver_.crash("720p");
    ASSERT_TRUE(wait_until([&] { return saw(JobState::Starting, "restarting after failure: scripted crash"); }));
    job->stop();

    EXPECT_EQ(driver_.launch_count("720p"), 1);
    EXPECT_EQ(job->state(), JobState::Stopped);
}

} // namespace test
} // namespace sdc
