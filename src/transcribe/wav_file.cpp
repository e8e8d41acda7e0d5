#include "wav_file.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <fstream>
#include <iterator>

namespace wav {

namespace {

constexpr uint16_t kFormatPcm = 1;
constexpr uint16_t kFormatFloat = 3;
constexpr uint16_t kFormatExtensible = 0xFFFE;

uint16_t rd16(const uint8_t* p) {
    return static_cast<uint16_t>(p[0] | (p[1] << 8));
}

uint32_t rd32(const uint8_t* p) {
    return static_cast<uint32_t>(p[0]) | (static_cast<uint32_t>(p[1]) << 8) |
           (static_cast<uint32_t>(p[2]) << 16) | (static_cast<uint32_t>(p[3]) << 24);
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

// One sample scaled to [-1, 1].
float sample_at(const uint8_t* p, uint16_t format, uint16_t bits) {
    if (format == kFormatFloat) {
        float f;
        std::memcpy(&f, p, sizeof(f));
        return f;
    }
    switch (bits) {
        case 8: return (static_cast<int>(p[0]) - 128) / 128.0f;
        case 16: return static_cast<int16_t>(rd16(p)) / 32768.0f;
        case 24: {
            int32_t v = static_cast<int32_t>((p[0] << 8) | (p[1] << 16) | (p[2] << 24)) >> 8;
            return v / 8388608.0f;
        }
        case 32: return static_cast<int32_t>(rd32(p)) / 2147483648.0f;
    }
    return 0.0f;
}

int16_t to_s16(float v) {
    long s = std::lrint(v * 32767.0f);
    return static_cast<int16_t>(std::clamp(s, -32768L, 32767L));
}

} // namespace

std::expected<Audio, std::string> decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || !tag_is(bytes.data(), "RIFF") || !tag_is(bytes.data() + 8, "WAVE")) {
        return std::unexpected("not a RIFF/WAVE file");
    }

    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t bits = 0;
    bool have_fmt = false;
    std::span<const uint8_t> data;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* chunk = bytes.data() + pos;
        uint32_t size = rd32(chunk + 4);
        size_t body = pos + 8;
        size_t avail = bytes.size() - body;

        if (tag_is(chunk, "fmt ")) {
            if (size < 16 || avail < 16) return std::unexpected("truncated fmt chunk");
            format = rd16(chunk + 8);
            channels = rd16(chunk + 10);
            sample_rate = rd32(chunk + 12);
            bits = rd16(chunk + 22);
            if (format == kFormatExtensible) {
                if (size < 40 || avail < 40) return std::unexpected("truncated extensible fmt chunk");
                // First two bytes of the SubFormat GUID carry the format tag.
                format = rd16(chunk + 8 + 24);
            }
            have_fmt = true;
        } else if (tag_is(chunk, "data")) {
            // Streaming writers leave the size at 0 or 0xFFFFFFFF.
            size_t n = (size == 0 || size > avail) ? avail : size;
            data = bytes.subspan(body, n);
            break;
        }

        pos = body + size + (size & 1);
    }

    if (!have_fmt) return std::unexpected("missing fmt chunk");
    if (data.data() == nullptr) return std::unexpected("missing data chunk");
    if (channels == 0 || sample_rate == 0) return std::unexpected("invalid fmt chunk");
    if (format == kFormatFloat ? bits != 32
                               : (format != kFormatPcm || (bits != 8 && bits != 16 &&
                                                           bits != 24 && bits != 32))) {
        return std::unexpected(std::format("unsupported encoding (format {}, {} bits)", format, bits));
    }

    size_t frame_bytes = static_cast<size_t>(bits / 8) * channels;
    size_t frames = data.size() / frame_bytes;

    Audio out;
    out.sample_rate = sample_rate;
    out.source_channels = channels;
    out.source_bits = bits;
    out.samples.resize(frames);

    if (format == kFormatPcm && bits == 16) {
        for (size_t i = 0; i < frames; ++i) {
            const uint8_t* frame = data.data() + i * frame_bytes;
            int32_t acc = 0;
            for (uint16_t c = 0; c < channels; ++c) {
                acc += static_cast<int16_t>(rd16(frame + c * 2));
            }
            out.samples[i] = static_cast<int16_t>(acc / channels);
        }
        return out;
    }

    for (size_t i = 0; i < frames; ++i) {
        const uint8_t* frame = data.data() + i * frame_bytes;
        float acc = 0.0f;
        for (uint16_t c = 0; c < channels; ++c) {
            acc += sample_at(frame + c * (bits / 8), format, bits);
        }
        out.samples[i] = to_s16(acc / channels);
    }

    return out;
}

std::expected<Audio, std::string> read_file(const std::filesystem::path& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(std::format("could not open {}", path.string()));
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    return decode(bytes);
}

std::expected<void, std::string> write_file(const std::filesystem::path& path,
                                            std::span<const int16_t> samples,
                                            uint32_t sample_rate) {
    auto bytes = encode(samples, sample_rate);
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected(std::format("could not open {} for writing", path.string()));
    }
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f.good()) {
        return std::unexpected(std::format("write to {} failed", path.string()));
    }
    return {};
}

std::vector<int16_t> resample(std::span<const int16_t> in, uint32_t in_rate, uint32_t out_rate) {
    if (in_rate == out_rate || in_rate == 0 || out_rate == 0 || in.empty()) {
        return {in.begin(), in.end()};
    }

    const double ratio = static_cast<double>(out_rate) / in_rate;
    const size_t out_len = static_cast<size_t>(std::llround(in.size() * ratio));
    std::vector<int16_t> out(out_len);

    for (size_t i = 0; i < out_len; ++i) {
        double src = i / ratio;
        size_t i0 = std::min(static_cast<size_t>(src), in.size() - 1);
        size_t i1 = std::min(i0 + 1, in.size() - 1);
        double frac = src - static_cast<double>(i0);
        double v = (1.0 - frac) * in[i0] + frac * in[i1];
        out[i] = static_cast<int16_t>(std::clamp(std::lrint(v), -32768L, 32767L));
    }
    return out;
}

} // namespace wav
