#pragma once

#include "encode_job.hpp"
#include <gst/gst.h>
#include <atomic>
#include <condition_variable>
#include <mutex>
#include <string>
#include <thread>

namespace sdc {

// Encoder backed by a GStreamer pipeline ending in hlssink2
class GstEncodeProcess : public EncodeProcess {
public:
    GstEncodeProcess(const EncodeSpec& spec, std::shared_ptr<EventChannel> events);
    ~GstEncodeProcess() override;

    // Non-copyable
    GstEncodeProcess(const GstEncodeProcess&) = delete;
    GstEncodeProcess& operator=(const GstEncodeProcess&) = delete;

    // Builds the pipeline, sets it PLAYING and waits for the transition.
    // Throws CoreError(EncodeStartFailure) or CoreError(Timeout).
    void start(std::chrono::milliseconds startup_timeout);

    bool health_check(std::chrono::milliseconds timeout) override;
    bool terminate(std::chrono::milliseconds grace) override;

    static std::string build_pipeline_description(const EncodeSpec& spec);

private:
    void bus_thread();
    void handle_bus_message(GstMessage* msg);
    void report_progress();
    void release_pipeline();

    static GstPadProbeReturn on_encoded_buffer(GstPad* pad, GstPadProbeInfo* info,
                                               gpointer user_data);

    EncodeSpec spec_;
    std::shared_ptr<EventChannel> events_;

    GstElement* pipeline_ = nullptr;

    std::thread thread_;
    std::atomic<bool> stop_requested_{false};
    std::atomic<bool> errored_{false};
    std::atomic<bool> eos_requested_{false};

    std::mutex eos_mutex_;
    std::condition_variable eos_cv_;
    bool eos_received_ = false;

    // Updated from the streaming thread
    std::atomic<uint64_t> frames_{0};
    std::atomic<uint64_t> bytes_{0};

    uint64_t last_frames_ = 0;
    uint64_t last_bytes_ = 0;
    std::chrono::steady_clock::time_point last_report_;
};

class GstEncodeDriver : public EncodeDriver {
public:
    GstEncodeDriver();

    std::unique_ptr<EncodeProcess> launch(const EncodeSpec& spec,
                                          std::shared_ptr<EventChannel> events,
                                          std::chrono::milliseconds startup_timeout) override;
};

} // namespace sdc
