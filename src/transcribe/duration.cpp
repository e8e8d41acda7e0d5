#include "duration.hpp"

#include <print>

Duration::Duration(std::string name, bool log, bool screen, std::FILE* screen_out)
    : name_(std::move(name)), log_(log), screen_(screen), screen_out_(screen_out),
      start_(std::chrono::steady_clock::now()) {}

Duration::~Duration() {
    stop();
}

std::chrono::milliseconds Duration::elapsed() const {
    if (stopped_) return elapsed_;
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start_);
}

std::chrono::milliseconds Duration::stop() {
    if (stopped_) return elapsed_;

    elapsed_ = elapsed();
    stopped_ = true;

    if (screen_) {
        std::println(screen_out_, "{} took {} ms", name_, elapsed_.count());
    }
    if (log_) {
        std::println(stderr, "duration: {} took {} ms", name_, elapsed_.count());
    }
    return elapsed_;
}
