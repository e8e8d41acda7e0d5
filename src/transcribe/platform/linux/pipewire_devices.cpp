#include "platform/linux/pipewire_devices.hpp"

#include <algorithm>
#include <charconv>
#include <cstring>
#include <pipewire/pipewire.h>
#include <print>
#include <spa/utils/result.h>

namespace {

struct Enumeration {
    pw_main_loop* loop = nullptr;
    int sync_seq = 0;
    std::vector<AudioDevice> devices;
    std::string error;
};

std::string prop(const spa_dict* props, const char* key) {
    const char* v = spa_dict_lookup(props, key);
    return v ? v : "";
}

uint32_t prop_u32(const spa_dict* props, const char* key) {
    const char* v = spa_dict_lookup(props, key);
    if (!v) return 0;
    uint32_t out = 0;
    std::from_chars(v, v + std::strlen(v), out);
    return out;
}

void on_global(void* data, uint32_t id, uint32_t /*permissions*/, const char* type,
               uint32_t /*version*/, const spa_dict* props) {
    auto* e = static_cast<Enumeration*>(data);
    if (!props || std::strcmp(type, PW_TYPE_INTERFACE_Node) != 0) return;

    // Application streams are "Stream/...", hardware and virtual devices "Audio/...".
    auto media_class = prop(props, PW_KEY_MEDIA_CLASS);
    if (!media_class.starts_with("Audio/")) return;

    AudioDevice dev;
    dev.id = id;
    dev.name = prop(props, PW_KEY_NODE_NAME);
    dev.description = prop(props, PW_KEY_NODE_DESCRIPTION);
    dev.media_class = std::move(media_class);
    dev.api = prop(props, PW_KEY_DEVICE_API);
    dev.channels = prop_u32(props, PW_KEY_AUDIO_CHANNELS);
    dev.rate = prop_u32(props, PW_KEY_AUDIO_RATE);
    e->devices.push_back(std::move(dev));
}

void on_core_done(void* data, uint32_t id, int seq) {
    auto* e = static_cast<Enumeration*>(data);
    if (id == PW_ID_CORE && seq == e->sync_seq) {
        pw_main_loop_quit(e->loop);
    }
}

void on_core_error(void* data, uint32_t id, int /*seq*/, int res, const char* message) {
    auto* e = static_cast<Enumeration*>(data);
    if (id == PW_ID_CORE) {
        e->error = std::string(message ? message : "") + " (" + spa_strerror(res) + ")";
        pw_main_loop_quit(e->loop);
    }
}

constexpr pw_registry_events registry_events = {
    .version = PW_VERSION_REGISTRY_EVENTS,
    .global = on_global,
};

constexpr pw_core_events core_events = {
    .version = PW_VERSION_CORE_EVENTS,
    .done = on_core_done,
    .error = on_core_error,
};

} // namespace

PipeWireDeviceEnumerator::PipeWireDeviceEnumerator() {
    pw_init(nullptr, nullptr);
}

PipeWireDeviceEnumerator::~PipeWireDeviceEnumerator() {
    pw_deinit();
}

std::expected<std::vector<AudioDevice>, std::string> PipeWireDeviceEnumerator::list() {
    Enumeration e;

    e.loop = pw_main_loop_new(nullptr);
    if (!e.loop) {
        return std::unexpected("failed to create main loop");
    }

    pw_context* context = pw_context_new(pw_main_loop_get_loop(e.loop), nullptr, 0);
    if (!context) {
        pw_main_loop_destroy(e.loop);
        return std::unexpected("failed to create context");
    }

    pw_core* core = pw_context_connect(context, nullptr, 0);
    if (!core) {
        pw_context_destroy(context);
        pw_main_loop_destroy(e.loop);
        return std::unexpected("cannot connect to the PipeWire daemon");
    }

    pw_registry* registry = pw_core_get_registry(core, PW_VERSION_REGISTRY, 0);

    spa_hook registry_listener;
    spa_hook core_listener;
    spa_zero(registry_listener);
    spa_zero(core_listener);
    pw_registry_add_listener(registry, &registry_listener, &registry_events, &e);
    pw_core_add_listener(core, &core_listener, &core_events, &e);

    // Globals are announced before the reply to this sync arrives.
    e.sync_seq = pw_core_sync(core, PW_ID_CORE, 0);
    pw_main_loop_run(e.loop);

    spa_hook_remove(&core_listener);
    spa_hook_remove(&registry_listener);
    pw_proxy_destroy(reinterpret_cast<pw_proxy*>(registry));
    pw_core_disconnect(core);
    pw_context_destroy(context);
    pw_main_loop_destroy(e.loop);

    if (!e.error.empty()) {
        return std::unexpected(e.error);
    }

    std::ranges::sort(e.devices, {}, &AudioDevice::id);
    for (size_t i = 0; i < e.devices.size(); ++i) {
        e.devices[i].index = static_cast<int>(i);
    }
    return std::move(e.devices);
}

std::expected<void, std::string> PipeWireDeviceEnumerator::print_detailed_info(std::FILE* out) {
    auto devices = list();
    if (!devices) return std::unexpected(devices.error());
    print_device_table(out, *devices);
    return {};
}

void print_device_table(std::FILE* out, const std::vector<AudioDevice>& devices) {
    if (devices.empty()) {
        std::println(out, "No audio devices found.");
        return;
    }

    std::println(out, "{:>5}  {:>5}  {:<22} {:>8} {:>7}  {}",
                 "Index", "Id", "Class", "Channels", "Rate", "Name");
    for (const auto& d : devices) {
        std::println(out, "{:>5}  {:>5}  {:<22} {:>8} {:>7}  {}",
                     d.index, d.id, d.media_class, d.channels, d.rate, d.name);
        if (!d.description.empty()) {
            std::println(out, "{:>15}Description: {}", "", d.description);
        }
        if (!d.api.empty()) {
            std::println(out, "{:>15}API: {}", "", d.api);
        }
    }

    auto inputs = std::ranges::count_if(devices, &AudioDevice::is_input);
    auto outputs = std::ranges::count_if(devices, &AudioDevice::is_output);
    std::println(out, "\n{} input device(s), {} output device(s).", inputs, outputs);
}
