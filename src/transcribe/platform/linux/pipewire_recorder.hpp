#pragma once

#include "platform/audio_recorder.hpp"
#include "platform/device_enumerator.hpp"
#include "ring_buffer.hpp"

#include <atomic>
#include <cstdint>
#include <pipewire/pipewire.h>
#include <spa/param/audio/format-utils.h>
#include <string>

// Captures mono S16 audio from a PipeWire node. A microphone recorder reads
// a source; a speaker recorder reads the monitor of a sink.
class PipeWireRecorder : public AudioRecorder {
public:
    enum class Role { Microphone, Speaker };

    PipeWireRecorder(DeviceEnumerator& devices, Role role,
                     uint32_t sample_rate = 16000, uint32_t max_seconds = 300);
    ~PipeWireRecorder() override;

    PipeWireRecorder(const PipeWireRecorder&) = delete;
    PipeWireRecorder& operator=(const PipeWireRecorder&) = delete;

    bool set_device(int index) override;

    bool start() override;
    void stop() override;
    bool is_capturing() const override { return capturing_.load(std::memory_order_relaxed); }

    std::vector<int16_t> drain() override { return ring_buf_.drain_all(); }
    uint32_t sample_rate() const override { return sample_rate_; }

private:
    static void on_process(void* userdata);
    static void on_state_changed(void* userdata, enum pw_stream_state old,
                                 enum pw_stream_state state, const char* error);

    void teardown();

    DeviceEnumerator& devices_;
    Role role_;
    uint32_t sample_rate_;
    RingBuffer ring_buf_;
    std::string target_;
    bool target_is_sink_ = false;
    std::atomic<bool> capturing_{false};

    pw_thread_loop* loop_ = nullptr;
    pw_stream* stream_ = nullptr;

    static constexpr pw_stream_events stream_events_ = {
        .version = PW_VERSION_STREAM_EVENTS,
        .state_changed = on_state_changed,
        .process = on_process,
    };
};
