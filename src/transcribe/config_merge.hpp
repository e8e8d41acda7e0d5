#pragma once

#include "config_store.hpp"
#include "platform/audio_recorder.hpp"
#include "request.hpp"

// Folds command-line values onto the store, field by field. Flags only ever
// switch features on; an absent --model resets both local model keys to
// "base" even if a different tier was saved.
void apply_request(const Request& req, ConfigStore& config);

// Binds the configured microphone and speaker indices unless the device is
// disabled or the index is -1.
void bind_audio_devices(const ConfigStore& config, AudioRecorder& mic, AudioRecorder& speaker);
