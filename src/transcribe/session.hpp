#pragma once

#include "platform/audio_recorder.hpp"

#include <chrono>
#include <cstdint>
#include <vector>

enum class SessionState { Idle, Recording, Transcribing };

// One capture source moving through record -> transcribe -> idle.
class Session {
public:
    explicit Session(AudioRecorder& capture);

    bool start_recording();
    // Returns captured samples if recording was active, empty if not.
    std::vector<int16_t> stop_recording();
    void set_idle();

    SessionState state() const { return state_; }
    double recording_duration() const;

private:
    AudioRecorder& capture_;
    SessionState state_ = SessionState::Idle;
    std::chrono::steady_clock::time_point record_start_;
};
