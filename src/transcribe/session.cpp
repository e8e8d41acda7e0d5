#include "session.hpp"

#include <print>

Session::Session(AudioRecorder& capture)
    : capture_(capture) {}

bool Session::start_recording() {
    if (state_ != SessionState::Idle) {
        std::println(stderr, "session: cannot start, state is not idle");
        return false;
    }

    if (!capture_.start()) {
        std::println(stderr, "session: failed to start audio capture");
        return false;
    }

    record_start_ = std::chrono::steady_clock::now();
    state_ = SessionState::Recording;
    return true;
}

std::vector<int16_t> Session::stop_recording() {
    if (state_ != SessionState::Recording) {
        return {};
    }

    capture_.stop();
    auto samples = capture_.drain();
    state_ = SessionState::Transcribing;
    return samples;
}

void Session::set_idle() {
    state_ = SessionState::Idle;
}

double Session::recording_duration() const {
    if (state_ != SessionState::Recording) return 0.0;
    auto now = std::chrono::steady_clock::now();
    return std::chrono::duration<double>(now - record_start_).count();
}
