#pragma once

#include <cstdint>
#include <vector>

class AudioRecorder {
public:
    virtual ~AudioRecorder() = default;

    // Selects the device at `index` in the device listing. Returns false if
    // no such device exists; the previous selection is kept.
    virtual bool set_device(int index) = 0;

    virtual bool start() = 0;
    virtual void stop() = 0;
    virtual bool is_capturing() const = 0;

    // Mono S16 samples captured since start().
    virtual std::vector<int16_t> drain() = 0;
    virtual uint32_t sample_rate() const = 0;
};
