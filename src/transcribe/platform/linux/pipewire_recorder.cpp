#include "platform/linux/pipewire_recorder.hpp"

#include <print>
#include <spa/utils/result.h>

PipeWireRecorder::PipeWireRecorder(DeviceEnumerator& devices, Role role,
                                   uint32_t sample_rate, uint32_t max_seconds)
    : devices_(devices), role_(role), sample_rate_(sample_rate),
      ring_buf_(static_cast<size_t>(sample_rate) * max_seconds),
      target_is_sink_(role == Role::Speaker) {
    pw_init(nullptr, nullptr);
}

PipeWireRecorder::~PipeWireRecorder() {
    stop();
    pw_deinit();
}

bool PipeWireRecorder::set_device(int index) {
    auto devices = devices_.list();
    if (!devices) {
        std::println(stderr, "audio: cannot list devices: {}", devices.error());
        return false;
    }
    if (index < 0 || static_cast<size_t>(index) >= devices->size()) {
        std::println(stderr, "audio: no device with index {} ({} devices)", index, devices->size());
        return false;
    }

    const auto& dev = (*devices)[static_cast<size_t>(index)];
    if (role_ == Role::Microphone && !dev.is_input()) {
        std::println(stderr, "audio: device {} ({}) is not an input device", index, dev.name);
        return false;
    }

    target_ = dev.name;
    target_is_sink_ = dev.is_output();
    return true;
}

bool PipeWireRecorder::start() {
    if (capturing_.load(std::memory_order_relaxed)) return true;

    const char* role_name = role_ == Role::Microphone ? "mic" : "speaker";

    loop_ = pw_thread_loop_new("transcribe", nullptr);
    if (!loop_) {
        std::println(stderr, "audio: failed to create thread loop");
        return false;
    }

    auto* props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_MEDIA_ROLE, "Communication",
        PW_KEY_APP_NAME, "transcribe",
        nullptr
    );
    pw_properties_setf(props, PW_KEY_NODE_NAME, "transcribe-%s", role_name);
    if (!target_.empty()) {
        pw_properties_set(props, PW_KEY_TARGET_OBJECT, target_.c_str());
    }
    if (target_is_sink_) {
        pw_properties_set(props, PW_KEY_STREAM_CAPTURE_SINK, "true");
    }

    stream_ = pw_stream_new_simple(
        pw_thread_loop_get_loop(loop_),
        role_ == Role::Microphone ? "transcribe-mic-capture" : "transcribe-speaker-capture",
        props,
        &stream_events_,
        this
    );

    if (!stream_) {
        std::println(stderr, "audio: failed to create {} stream", role_name);
        teardown();
        return false;
    }

    uint8_t buf[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buf, sizeof(buf));
    auto info = SPA_AUDIO_INFO_RAW_INIT(
        .format = SPA_AUDIO_FORMAT_S16_LE,
        .rate = sample_rate_,
        .channels = 1
    );
    const spa_pod* params[1];
    params[0] = spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &info);

    int ret = pw_stream_connect(
        stream_,
        PW_DIRECTION_INPUT,
        PW_ID_ANY,
        static_cast<pw_stream_flags>(
            PW_STREAM_FLAG_AUTOCONNECT | PW_STREAM_FLAG_MAP_BUFFERS | PW_STREAM_FLAG_RT_PROCESS
        ),
        params, 1
    );
    if (ret < 0) {
        std::println(stderr, "audio: {} stream connect failed: {}", role_name, spa_strerror(ret));
        teardown();
        return false;
    }

    ret = pw_thread_loop_start(loop_);
    if (ret < 0) {
        std::println(stderr, "audio: thread loop start failed: {}", spa_strerror(ret));
        teardown();
        return false;
    }

    ring_buf_.reset();
    capturing_.store(true, std::memory_order_release);
    return true;
}

void PipeWireRecorder::stop() {
    if (!capturing_.load(std::memory_order_relaxed)) return;

    capturing_.store(false, std::memory_order_release);
    if (loop_) {
        pw_thread_loop_stop(loop_);
    }
    teardown();

    if (auto n = ring_buf_.dropped(); n > 0) {
        std::println(stderr, "audio: buffer full, dropped {} samples", n);
    }
}

void PipeWireRecorder::teardown() {
    if (stream_) {
        pw_stream_destroy(stream_);
        stream_ = nullptr;
    }
    if (loop_) {
        pw_thread_loop_destroy(loop_);
        loop_ = nullptr;
    }
}

void PipeWireRecorder::on_process(void* userdata) {
    auto* self = static_cast<PipeWireRecorder*>(userdata);

    auto* buf = pw_stream_dequeue_buffer(self->stream_);
    if (!buf) return;

    auto* d = &buf->buffer->datas[0];
    if (d->data && self->capturing_.load(std::memory_order_relaxed)) {
        auto* samples = reinterpret_cast<const int16_t*>(
            static_cast<const uint8_t*>(d->data) + d->chunk->offset);
        self->ring_buf_.write({samples, d->chunk->size / sizeof(int16_t)});
    }

    pw_stream_queue_buffer(self->stream_, buf);
}

void PipeWireRecorder::on_state_changed(void* /*userdata*/, enum pw_stream_state old,
                                        enum pw_stream_state state, const char* error) {
    if (error) {
        std::println(stderr, "audio: stream state {} -> {}: {}",
                     pw_stream_state_as_string(old),
                     pw_stream_state_as_string(state),
                     error);
    }
}
