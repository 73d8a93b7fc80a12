#include "gst_encode_driver.hpp"
#include "errors.hpp"
#include <spdlog/spdlog.h>
#include <filesystem>
#include <mutex>
#include <system_error>

namespace fs = std::filesystem;

namespace sdc {

static const char* kTestPatternSource = "test://pattern";

static std::string to_uri(const std::string& input) {
    if (input.find("://") != std::string::npos) {
        return input;
    }

    GError* error = nullptr;
    gchar* uri = gst_filename_to_uri(input.c_str(), &error);
    if (!uri) {
        std::string msg = error ? error->message : "invalid path";
        if (error) g_error_free(error);
        throw CoreError(ErrorCode::EncodeStartFailure, "Bad input source '" + input + "': " + msg);
    }
    std::string out(uri);
    g_free(uri);
    return out;
}

// ─── GstEncodeProcess ────────────────────────────────────────────────────────

GstEncodeProcess::GstEncodeProcess(const EncodeSpec& spec, std::shared_ptr<EventChannel> events)
    : spec_(spec)
    , events_(std::move(events))
{
}

GstEncodeProcess::~GstEncodeProcess() {
    terminate(std::chrono::milliseconds(0));
}

std::string GstEncodeProcess::build_pipeline_description(const EncodeSpec& spec) {
    const QualityVariant& v = spec.variant;
    std::string desc;

    if (spec.input_source == kTestPatternSource) {
        // Test pattern source for development/verification
        desc = "videotestsrc is-live=true pattern=ball name=vsrc "
               "audiotestsrc is-live=true wave=sine name=asrc ";
    } else {
        // uri is set on the parsed element, never spliced into the description
        desc = "uridecodebin name=vsrc ";
    }

    std::string video_in = "vsrc. ";
    std::string audio_in = spec.input_source == kTestPatternSource ? "asrc. " : "vsrc. ";

    desc +=
        video_in + "! queue ! videoconvert ! videoscale ! videorate ! "
        "video/x-raw,width=" + std::to_string(v.width) +
        ",height=" + std::to_string(v.height) +
        ",framerate=" + std::to_string(v.fps) + "/1 ! "
        "x264enc name=enc tune=zerolatency speed-preset=veryfast "
        "bitrate=" + std::to_string(v.video_bitrate_kbps) + " "
        "key-int-max=" + std::to_string(spec.gop_size) + " "
        "bframes=0 ! "
        "video/x-h264,profile=" + v.profile + ",level=(string)" + v.level + " ! "
        "h264parse config-interval=-1 ! queue ! hls.video ";

    desc +=
        audio_in + "! queue ! audioconvert ! audioresample ! "
        "avenc_aac bitrate=" + std::to_string(v.audio_bitrate_kbps * 1000) + " ! "
        "aacparse ! queue ! hls.audio ";

    fs::path dir = spec.output_dir;
    desc +=
        "hlssink2 name=hls "
        "location=\"" + (dir / "segment_%03d.ts").string() + "\" "
        "playlist-location=\"" + (dir / "index.m3u8").string() + "\" "
        "target-duration=" + std::to_string(spec.segment_seconds) + " "
        "playlist-length=" + std::to_string(spec.playlist_length) + " "
        "max-files=" + std::to_string(spec.playlist_length);

    return desc;
}

void GstEncodeProcess::start(std::chrono::milliseconds startup_timeout) {
    std::string uri;
    if (spec_.input_source != kTestPatternSource) {
        uri = to_uri(spec_.input_source);
    }

    std::string desc = build_pipeline_description(spec_);
    spdlog::debug("[{}] Pipeline: {}", spec_.variant.name, desc);

    GError* error = nullptr;
    pipeline_ = gst_parse_launch(desc.c_str(), &error);
    if (error) {
        std::string err_msg = error->message;
        g_error_free(error);
        release_pipeline();
        throw CoreError(ErrorCode::EncodeStartFailure, "Failed to create pipeline: " + err_msg);
    }

    if (!uri.empty()) {
        GstElement* source = gst_bin_get_by_name(GST_BIN(pipeline_), "vsrc");
        if (!source) {
            release_pipeline();
            throw CoreError(ErrorCode::EncodeStartFailure, "Pipeline has no source element");
        }
        g_object_set(source, "uri", uri.c_str(), nullptr);
        gst_object_unref(source);
    }

    // Count encoded frames for progress reports
    GstElement* encoder = gst_bin_get_by_name(GST_BIN(pipeline_), "enc");
    if (encoder) {
        GstPad* pad = gst_element_get_static_pad(encoder, "src");
        if (pad) {
            gst_pad_add_probe(pad, GST_PAD_PROBE_TYPE_BUFFER,
                              &GstEncodeProcess::on_encoded_buffer, this, nullptr);
            gst_object_unref(pad);
        }
        gst_object_unref(encoder);
    }

    GstStateChangeReturn ret = gst_element_set_state(pipeline_, GST_STATE_PLAYING);
    if (ret == GST_STATE_CHANGE_FAILURE) {
        release_pipeline();
        throw CoreError(ErrorCode::EncodeStartFailure, "Failed to set pipeline to PLAYING");
    }

    if (ret == GST_STATE_CHANGE_ASYNC) {
        GstClockTime timeout_ns = static_cast<GstClockTime>(startup_timeout.count()) * GST_MSECOND;
        ret = gst_element_get_state(pipeline_, nullptr, nullptr, timeout_ns);
        if (ret == GST_STATE_CHANGE_FAILURE) {
            release_pipeline();
            throw CoreError(ErrorCode::EncodeStartFailure, "Pipeline failed while prerolling");
        }
        if (ret == GST_STATE_CHANGE_ASYNC) {
            release_pipeline();
            throw CoreError(ErrorCode::Timeout,
                            "Pipeline did not start within " +
                            std::to_string(startup_timeout.count()) + "ms");
        }
    }

    last_report_ = std::chrono::steady_clock::now();
    thread_ = std::thread(&GstEncodeProcess::bus_thread, this);
    events_->push(EncodeEvent{EncodeEventType::Started, {}, "pipeline playing"});
    spdlog::info("[{}] Encoder is PLAYING -> {}", spec_.variant.name, spec_.output_dir.string());
}

GstPadProbeReturn GstEncodeProcess::on_encoded_buffer(GstPad*, GstPadProbeInfo* info,
                                                      gpointer user_data) {
    auto* self = static_cast<GstEncodeProcess*>(user_data);
    GstBuffer* buffer = GST_PAD_PROBE_INFO_BUFFER(info);
    if (buffer) {
        self->frames_.fetch_add(1);
        self->bytes_.fetch_add(gst_buffer_get_size(buffer));
    }
    return GST_PAD_PROBE_OK;
}

void GstEncodeProcess::bus_thread() {
    GstBus* bus = gst_element_get_bus(pipeline_);

    while (!stop_requested_.load()) {
        GstMessage* msg = gst_bus_timed_pop(bus, 500 * GST_MSECOND);
        if (msg) {
            handle_bus_message(msg);
            gst_message_unref(msg);
        }

        if (std::chrono::steady_clock::now() - last_report_ >= std::chrono::seconds(1)) {
            report_progress();
        }
    }

    gst_object_unref(bus);
}

void GstEncodeProcess::handle_bus_message(GstMessage* msg) {
    switch (GST_MESSAGE_TYPE(msg)) {
        case GST_MESSAGE_ERROR: {
            GError* err = nullptr;
            gchar* debug_info = nullptr;
            gst_message_parse_error(msg, &err, &debug_info);
            std::string text = err->message;
            spdlog::error("[{}] GStreamer error: {} ({})", spec_.variant.name,
                          text, debug_info ? debug_info : "no debug info");
            g_error_free(err);
            g_free(debug_info);

            errored_.store(true);
            events_->push(EncodeEvent{EncodeEventType::Error, {}, text});
            break;
        }
        case GST_MESSAGE_WARNING: {
            GError* err = nullptr;
            gchar* debug_info = nullptr;
            gst_message_parse_warning(msg, &err, &debug_info);
            spdlog::warn("[{}] GStreamer warning: {} ({})", spec_.variant.name,
                         err->message, debug_info ? debug_info : "no debug info");
            g_error_free(err);
            g_free(debug_info);
            break;
        }
        case GST_MESSAGE_EOS: {
            spdlog::info("[{}] End of stream", spec_.variant.name);
            {
                std::lock_guard<std::mutex> lock(eos_mutex_);
                eos_received_ = true;
            }
            eos_cv_.notify_all();
            if (!eos_requested_.load()) {
                // Input ended on its own
                events_->push(EncodeEvent{EncodeEventType::End, {}, "end of stream"});
            }
            break;
        }
        case GST_MESSAGE_STATE_CHANGED: {
            if (GST_MESSAGE_SRC(msg) == GST_OBJECT(pipeline_)) {
                GstState old_state, new_state, pending_state;
                gst_message_parse_state_changed(msg, &old_state, &new_state, &pending_state);
                spdlog::debug("[{}] Pipeline state: {} -> {}", spec_.variant.name,
                              gst_element_state_get_name(old_state),
                              gst_element_state_get_name(new_state));
            }
            break;
        }
        default:
            break;
    }
}

void GstEncodeProcess::report_progress() {
    auto now = std::chrono::steady_clock::now();
    double elapsed_s = std::chrono::duration<double>(now - last_report_).count();
    last_report_ = now;
    if (elapsed_s <= 0.0) return;

    uint64_t frames = frames_.load();
    uint64_t bytes = bytes_.load();

    EncodeProgress progress;
    progress.frames = frames;
    progress.fps = static_cast<double>(frames - last_frames_) / elapsed_s;
    progress.bitrate_kbps = static_cast<double>(bytes - last_bytes_) * 8.0 / 1000.0 / elapsed_s;

    gint64 position_ns = 0;
    if (gst_element_query_position(pipeline_, GST_FORMAT_TIME, &position_ns)) {
        progress.position_s = static_cast<double>(position_ns) / GST_SECOND;
    }

    last_frames_ = frames;
    last_bytes_ = bytes;
    events_->push(EncodeEvent{EncodeEventType::Progress, progress, ""});
}

bool GstEncodeProcess::health_check(std::chrono::milliseconds timeout) {
    if (!pipeline_ || errored_.load()) {
        return false;
    }

    GstState current = GST_STATE_NULL;
    GstClockTime timeout_ns = static_cast<GstClockTime>(timeout.count()) * GST_MSECOND;
    GstStateChangeReturn ret = gst_element_get_state(pipeline_, &current, nullptr, timeout_ns);
    return ret != GST_STATE_CHANGE_FAILURE && ret != GST_STATE_CHANGE_ASYNC &&
           current == GST_STATE_PLAYING;
}

bool GstEncodeProcess::terminate(std::chrono::milliseconds grace) {
    if (!pipeline_) {
        return true;
    }

    bool graceful = false;
    if (grace.count() > 0 && thread_.joinable() && !errored_.load()) {
        // EOS lets hlssink2 close the last segment and playlist
        eos_requested_.store(true);
        gst_element_send_event(pipeline_, gst_event_new_eos());

        std::unique_lock<std::mutex> lock(eos_mutex_);
        graceful = eos_cv_.wait_for(lock, grace, [this] { return eos_received_; });
    }

    stop_requested_.store(true);
    if (thread_.joinable()) {
        thread_.join();
    }

    release_pipeline();
    return graceful;
}

void GstEncodeProcess::release_pipeline() {
    if (pipeline_) {
        gst_element_set_state(pipeline_, GST_STATE_NULL);
        gst_object_unref(pipeline_);
        pipeline_ = nullptr;
    }
}

// ─── GstEncodeDriver ─────────────────────────────────────────────────────────

GstEncodeDriver::GstEncodeDriver() {
    static std::once_flag init_flag;
    std::call_once(init_flag, [] { gst_init(nullptr, nullptr); });
}

std::unique_ptr<EncodeProcess> GstEncodeDriver::launch(const EncodeSpec& spec,
                                                      std::shared_ptr<EventChannel> events,
                                                      std::chrono::milliseconds startup_timeout) {
    std::error_code ec;
    fs::create_directories(spec.output_dir, ec);
    if (ec) {
        throw CoreError(ErrorCode::EncodeStartFailure,
                        "Cannot create " + spec.output_dir.string() + ": " + ec.message());
    }

    auto process = std::make_unique<GstEncodeProcess>(spec, std::move(events));
    try {
        process->start(startup_timeout);
    } catch (const CoreError& e) {
        if (e.code() == ErrorCode::Timeout) {
            throw CoreError(ErrorCode::EncodeStartFailure, e.what());
        }
        throw;
    }
    return process;
}

} // namespace sdc
