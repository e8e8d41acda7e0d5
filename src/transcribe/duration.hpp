#pragma once

#include <chrono>
#include <cstdio>
#include <string>

// Times a scope. On stop() or destruction the elapsed time is printed to
// `screen_out` when `screen` is set and to stderr when `log` is set.
class Duration {
public:
    explicit Duration(std::string name, bool log = true, bool screen = false,
                      std::FILE* screen_out = stdout);
    ~Duration();

    Duration(const Duration&) = delete;
    Duration& operator=(const Duration&) = delete;

    std::chrono::milliseconds elapsed() const;

    // Reports once; later calls return the recorded time.
    std::chrono::milliseconds stop();

private:
    std::string name_;
    bool log_;
    bool screen_;
    std::FILE* screen_out_;
    bool stopped_ = false;
    std::chrono::steady_clock::time_point start_;
    std::chrono::milliseconds elapsed_{0};
};
