#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "audio/wav_codec.hpp"

#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace {

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

std::string read_tag(const uint8_t* p) {
    return {reinterpret_cast<const char*>(p), 4};
}

void put_u16(std::vector<uint8_t>& out, uint16_t v) {
    out.push_back(static_cast<uint8_t>(v & 0xFF));
    out.push_back(static_cast<uint8_t>(v >> 8));
}

void put_u32(std::vector<uint8_t>& out, uint32_t v) {
    for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

void put_tag(std::vector<uint8_t>& out, const char* tag) {
    out.insert(out.end(), tag, tag + 4);
}

// Hand-built header so the decoder sees layouts the encoder never writes.
std::vector<uint8_t> make_wav(uint16_t format, uint16_t channels, uint32_t rate, uint16_t bits,
                              const std::vector<uint8_t>& data, bool extra_chunk = false) {
    std::vector<uint8_t> out;
    put_tag(out, "RIFF");
    put_u32(out, 0); // patched below
    put_tag(out, "WAVE");
    if (extra_chunk) {
        put_tag(out, "LIST");
        put_u32(out, 3);
        out.insert(out.end(), {'a', 'b', 'c', 0}); // odd size plus pad byte
    }
    put_tag(out, "fmt ");
    put_u32(out, 16);
    put_u16(out, format);
    put_u16(out, channels);
    put_u32(out, rate);
    put_u32(out, rate * channels * bits / 8);
    put_u16(out, static_cast<uint16_t>(channels * bits / 8));
    put_u16(out, bits);
    put_tag(out, "data");
    put_u32(out, static_cast<uint32_t>(data.size()));
    out.insert(out.end(), data.begin(), data.end());
    uint32_t riff = static_cast<uint32_t>(out.size() - 8);
    std::memcpy(out.data() + 4, &riff, 4);
    return out;
}

} // namespace

TEST_CASE("wav::encode", "[wav]") {
    constexpr uint32_t sample_rate = 16000;
    std::vector<float> samples = {0.0f, 0.5f, -0.5f, 1.0f, -1.0f, 0.25f};

    SECTION("HeaderMagic") {
        auto wav = wav::encode(samples, sample_rate, 1);
        REQUIRE(read_tag(wav.data()) == "RIFF");
        REQUIRE(read_tag(wav.data() + 8) == "WAVE");
        REQUIRE(read_tag(wav.data() + 12) == "fmt ");
        REQUIRE(read_tag(wav.data() + 36) == "data");
    }

    SECTION("Pcm16HeaderFields") {
        auto wav = wav::encode(samples, sample_rate, 2);
        REQUIRE(wav.size() == 44 + samples.size() * 2);
        REQUIRE(read_u16(wav.data() + 20) == 1);
        REQUIRE(read_u16(wav.data() + 22) == 2);
        REQUIRE(read_u32(wav.data() + 24) == sample_rate);
        REQUIRE(read_u32(wav.data() + 28) == sample_rate * 2 * 2);
        REQUIRE(read_u16(wav.data() + 32) == 4);
        REQUIRE(read_u16(wav.data() + 34) == 16);
        REQUIRE(read_u32(wav.data() + 40) == samples.size() * 2);
        REQUIRE(read_u32(wav.data() + 4) == 36 + samples.size() * 2);
    }

    SECTION("Float32HeaderFields") {
        auto wav = wav::encode(samples, sample_rate, 1, wav::SampleFormat::Float32);
        REQUIRE(wav.size() == 44 + samples.size() * 4);
        REQUIRE(read_u16(wav.data() + 20) == 3);
        REQUIRE(read_u16(wav.data() + 34) == 32);
    }

    SECTION("Pcm16ClampsOutOfRange") {
        std::vector<float> loud = {2.0f, -3.0f};
        auto wav = wav::encode(loud, sample_rate, 1);
        int16_t a, b;
        std::memcpy(&a, wav.data() + 44, 2);
        std::memcpy(&b, wav.data() + 46, 2);
        REQUIRE(a == 32767);
        REQUIRE(b == -32767);
    }

    SECTION("EmptySamples") {
        std::vector<float> empty;
        auto wav = wav::encode(empty, sample_rate, 1);
        REQUIRE(wav.size() == 44);
        REQUIRE(read_u32(wav.data() + 40) == 0);
    }
}

TEST_CASE("wav::decode", "[wav]") {

    SECTION("ReadsWhatEncodeWrites") {
        std::vector<float> samples = {0.0f, 0.5f, -0.5f, 0.25f};
        auto decoded = wav::decode(wav::encode(samples, 8000, 2, wav::SampleFormat::Float32));
        REQUIRE(decoded);
        REQUIRE(decoded->sample_rate == 8000);
        REQUIRE(decoded->channels == 2);
        REQUIRE(decoded->samples == samples);
    }

    SECTION("Pcm8IsUnsigned") {
        auto bytes = make_wav(1, 1, 8000, 8, {128, 255, 0});
        auto decoded = wav::decode(bytes);
        REQUIRE(decoded);
        REQUIRE(decoded->samples.size() == 3);
        REQUIRE(decoded->samples[0] == 0.0f);
        REQUIRE(decoded->samples[1] == Catch::Approx(127.0f / 128.0f));
        REQUIRE(decoded->samples[2] == -1.0f);
    }

    SECTION("Pcm24SignExtends") {
        // 0x800000 is the most negative 24-bit value
        auto bytes = make_wav(1, 1, 16000, 24, {0x00, 0x00, 0x80, 0xFF, 0xFF, 0x7F});
        auto decoded = wav::decode(bytes);
        REQUIRE(decoded);
        REQUIRE(decoded->samples[0] == -1.0f);
        REQUIRE(decoded->samples[1] == Catch::Approx(1.0f).margin(1e-6));
    }

    SECTION("SkipsUnknownChunks") {
        auto bytes = make_wav(1, 1, 16000, 16, {0x00, 0x40}, true);
        auto decoded = wav::decode(bytes);
        REQUIRE(decoded);
        REQUIRE(decoded->samples.size() == 1);
        REQUIRE(decoded->samples[0] == 0.5f);
    }

    SECTION("TruncatedDataIsClamped") {
        auto bytes = make_wav(1, 1, 16000, 16, {0x00, 0x40, 0x00, 0x40});
        bytes.resize(bytes.size() - 2);
        auto decoded = wav::decode(bytes);
        REQUIRE(decoded);
        REQUIRE(decoded->samples.size() == 1);
    }

    SECTION("RejectsNonRiff") {
        std::vector<uint8_t> junk = {'O', 'g', 'g', 'S', 0, 0, 0, 0, 0, 0, 0, 0};
        auto decoded = wav::decode(junk);
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().code == ErrorCode::Decode);
    }

    SECTION("RejectsUnsupportedFormat") {
        // A-law
        auto bytes = make_wav(6, 1, 8000, 8, {0x55});
        auto decoded = wav::decode(bytes);
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().code == ErrorCode::Decode);
    }

    SECTION("RejectsMissingData") {
        auto bytes = make_wav(1, 1, 16000, 16, {});
        bytes.resize(bytes.size() - 8); // drop the data chunk header
        auto decoded = wav::decode(bytes);
        REQUIRE_FALSE(decoded);
        REQUIRE(decoded.error().code == ErrorCode::Decode);
    }
}
