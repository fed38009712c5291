#include "audio/wav_codec.hpp"

#include <algorithm>
#include <cmath>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace wav {

namespace {

constexpr uint16_t FORMAT_PCM = 1;
constexpr uint16_t FORMAT_FLOAT = 3;
constexpr uint16_t FORMAT_EXTENSIBLE = 0xFFFE;

uint16_t read_u16(const uint8_t* p) {
    uint16_t v;
    std::memcpy(&v, p, 2);
    return v;
}

uint32_t read_u32(const uint8_t* p) {
    uint32_t v;
    std::memcpy(&v, p, 4);
    return v;
}

bool tag_is(const uint8_t* p, const char* tag) {
    return std::memcmp(p, tag, 4) == 0;
}

std::unexpected<Error> corrupt(std::string msg) {
    return std::unexpected(Error{ErrorCode::Decode, std::move(msg)});
}

float convert_sample(const uint8_t* p, uint16_t format, uint16_t bits) {
    if (format == FORMAT_FLOAT) {
        if (bits == 32) {
            float f;
            std::memcpy(&f, p, 4);
            return f;
        }
        double d;
        std::memcpy(&d, p, 8);
        return static_cast<float>(d);
    }

    switch (bits) {
        case 8:
            return (static_cast<float>(p[0]) - 128.0f) / 128.0f;
        case 16: {
            int16_t v;
            std::memcpy(&v, p, 2);
            return static_cast<float>(v) / 32768.0f;
        }
        case 24: {
            int32_t v = p[0] | (p[1] << 8) | (p[2] << 16);
            if (v & 0x800000) v |= ~0xFFFFFF; // sign extend
            return static_cast<float>(v) / 8388608.0f;
        }
        default: {
            int32_t v;
            std::memcpy(&v, p, 4);
            return static_cast<float>(static_cast<double>(v) / 2147483648.0);
        }
    }
}

} // namespace

std::vector<uint8_t> encode(std::span<const float> samples, uint32_t sample_rate,
                            uint16_t channels, SampleFormat format) {
    const uint16_t format_tag = format == SampleFormat::Float32 ? FORMAT_FLOAT : FORMAT_PCM;
    const uint16_t bits_per_sample = format == SampleFormat::Float32 ? 32 : 16;
    const uint16_t block_align = channels * bits_per_sample / 8;
    const uint32_t byte_rate = sample_rate * block_align;
    const uint32_t data_size = static_cast<uint32_t>(samples.size() * (bits_per_sample / 8));

    std::vector<uint8_t> out(44 + data_size);
    auto w = [&out, pos = size_t(0)](const void* data, size_t len) mutable {
        std::memcpy(out.data() + pos, data, len);
        pos += len;
    };
    auto w16 = [&w](uint16_t v) { w(&v, 2); };
    auto w32 = [&w](uint32_t v) { w(&v, 4); };

    w("RIFF", 4);
    w32(36 + data_size);
    w("WAVE", 4);
    w("fmt ", 4);
    w32(16);
    w16(format_tag);
    w16(channels);
    w32(sample_rate);
    w32(byte_rate);
    w16(block_align);
    w16(bits_per_sample);
    w("data", 4);
    w32(data_size);

    uint8_t* dst = out.data() + 44;
    if (format == SampleFormat::Float32) {
        std::memcpy(dst, samples.data(), data_size);
    } else {
        for (float s : samples) {
            float clamped = std::clamp(s, -1.0f, 1.0f);
            auto v = static_cast<int16_t>(std::lround(clamped * 32767.0f));
            std::memcpy(dst, &v, 2);
            dst += 2;
        }
    }

    return out;
}

std::expected<Decoded, Error> decode(std::span<const uint8_t> bytes) {
    if (bytes.size() < 12 || !tag_is(bytes.data(), "RIFF") || !tag_is(bytes.data() + 8, "WAVE")) {
        return corrupt("not a RIFF/WAVE stream");
    }

    bool have_fmt = false;
    uint16_t format = 0;
    uint16_t channels = 0;
    uint32_t sample_rate = 0;
    uint16_t block_align = 0;
    uint16_t bits = 0;
    std::span<const uint8_t> data;
    bool have_data = false;

    size_t pos = 12;
    while (pos + 8 <= bytes.size()) {
        const uint8_t* hdr = bytes.data() + pos;
        uint32_t chunk_size = read_u32(hdr + 4);
        size_t body = pos + 8;
        size_t avail = bytes.size() - body;

        if (tag_is(hdr, "fmt ")) {
            if (chunk_size < 16 || chunk_size > avail) return corrupt("truncated fmt chunk");
            const uint8_t* f = bytes.data() + body;
            format = read_u16(f);
            channels = read_u16(f + 2);
            sample_rate = read_u32(f + 4);
            block_align = read_u16(f + 12);
            bits = read_u16(f + 14);
            if (format == FORMAT_EXTENSIBLE) {
                if (chunk_size < 40) return corrupt("truncated extensible fmt chunk");
                // First two bytes of the sub-format GUID carry the real format tag.
                format = read_u16(f + 24);
            }
            have_fmt = true;
        } else if (tag_is(hdr, "data")) {
            // Size may overrun a truncated file; clamp to the bytes present.
            size_t len = std::min<size_t>(chunk_size, avail);
            data = bytes.subspan(body, len);
            have_data = true;
            break;
        }

        pos = body + chunk_size + (chunk_size & 1);
    }

    if (!have_fmt) return corrupt("missing fmt chunk");
    if (!have_data) return corrupt("missing data chunk");
    if (channels == 0 || sample_rate == 0) return corrupt("zero channels or sample rate");

    bool supported = (format == FORMAT_PCM && (bits == 8 || bits == 16 || bits == 24 || bits == 32)) ||
                     (format == FORMAT_FLOAT && (bits == 32 || bits == 64));
    if (!supported) {
        return corrupt("unsupported sample format " + std::to_string(format) +
                       " with " + std::to_string(bits) + " bits");
    }

    const uint16_t bytes_per_sample = bits / 8;
    if (block_align != channels * bytes_per_sample) return corrupt("inconsistent block alignment");

    const size_t frames = data.size() / block_align;
    Decoded out;
    out.sample_rate = sample_rate;
    out.channels = channels;
    out.samples.resize(frames * channels);

    const uint8_t* p = data.data();
    for (size_t i = 0; i < out.samples.size(); ++i) {
        out.samples[i] = convert_sample(p, format, bits);
        p += bytes_per_sample;
    }

    return out;
}

std::expected<std::vector<uint8_t>, Error> read_file(const std::string& path) {
    std::ifstream f(path, std::ios::binary);
    if (!f.is_open()) {
        return std::unexpected(Error{ErrorCode::Io, "cannot open " + path});
    }
    std::vector<uint8_t> bytes((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
    if (f.bad()) {
        return std::unexpected(Error{ErrorCode::Io, "read failed: " + path});
    }
    return bytes;
}

std::expected<void, Error> write_file(const std::string& path, std::span<const uint8_t> bytes) {
    std::error_code ec;
    auto parent = std::filesystem::path(path).parent_path();
    if (!parent.empty()) std::filesystem::create_directories(parent, ec);

    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f.is_open()) {
        return std::unexpected(Error{ErrorCode::Io, "cannot open " + path + " for writing"});
    }
    f.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
    if (!f) {
        return std::unexpected(Error{ErrorCode::Io, "write failed: " + path});
    }
    return {};
}

} // namespace wav
