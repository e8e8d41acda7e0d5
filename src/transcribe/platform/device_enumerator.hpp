#pragma once

#include <cstdint>
#include <cstdio>
#include <expected>
#include <string>
#include <vector>

struct AudioDevice {
    int index = -1;
    uint32_t id = 0;
    std::string name;
    std::string description;
    std::string media_class; // "Audio/Source", "Audio/Sink", ...
    std::string api;
    uint32_t channels = 0;
    uint32_t rate = 0;

    bool is_input() const { return media_class.starts_with("Audio/Source"); }
    bool is_output() const { return media_class.starts_with("Audio/Sink"); }
};

class DeviceEnumerator {
public:
    virtual ~DeviceEnumerator() = default;

    // Audio devices in listing order; AudioDevice::index is the position.
    virtual std::expected<std::vector<AudioDevice>, std::string> list() = 0;

    // Writes every device with its index and properties to `out`.
    virtual std::expected<void, std::string> print_detailed_info(std::FILE* out) = 0;
};
