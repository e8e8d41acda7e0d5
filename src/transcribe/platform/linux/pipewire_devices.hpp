#pragma once

#include "platform/device_enumerator.hpp"

class PipeWireDeviceEnumerator : public DeviceEnumerator {
public:
    PipeWireDeviceEnumerator();
    ~PipeWireDeviceEnumerator() override;

    PipeWireDeviceEnumerator(const PipeWireDeviceEnumerator&) = delete;
    PipeWireDeviceEnumerator& operator=(const PipeWireDeviceEnumerator&) = delete;

    std::expected<std::vector<AudioDevice>, std::string> list() override;
    std::expected<void, std::string> print_detailed_info(std::FILE* out) override;
};

// Shared by every enumerator so that listings look the same.
void print_device_table(std::FILE* out, const std::vector<AudioDevice>& devices);
