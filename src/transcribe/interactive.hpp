#pragma once

#include "config_store.hpp"
#include "platform/audio_recorder.hpp"
#include "stt/transcriber.hpp"

#include <istream>

// Records from the enabled sources until a line is read from `input`, then
// transcribes and prints what each source captured. Repeats until EOF.
// Returns the process exit code.
int run_interactive(const ConfigStore& config, AudioRecorder& mic, AudioRecorder& speaker,
                    Transcriber& transcriber, std::istream& input);
