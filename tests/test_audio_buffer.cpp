#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "audio/audio_buffer.hpp"
#include "audio/dsp.hpp"

#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

namespace {

struct TmpWav {
    std::string path;

    TmpWav() {
        path = std::filesystem::temp_directory_path() /
               ("sttpad_test_audio_" + std::to_string(getpid()) + ".wav");
    }

    ~TmpWav() { std::filesystem::remove(path); }
};

AudioBuffer make_buffer(uint32_t rate, uint16_t channels, size_t frames, const std::string& source = "test") {
    std::vector<float> samples(frames * channels);
    for (size_t i = 0; i < samples.size(); ++i) samples[i] = static_cast<float>(i % 100) / 100.0f;
    auto buf = AudioBuffer::from_samples(rate, channels, std::move(samples), source);
    REQUIRE(buf);
    return *buf;
}

} // namespace

TEST_CASE("AudioBuffer", "[audio]") {

    SECTION("FromSamplesValidatesFormat") {
        auto no_rate = AudioBuffer::from_samples(0, 1, {0.0f}, "x");
        REQUIRE_FALSE(no_rate);
        REQUIRE(no_rate.error().code == ErrorCode::Decode);

        auto no_channels = AudioBuffer::from_samples(16000, 0, {0.0f}, "x");
        REQUIRE_FALSE(no_channels);
        REQUIRE(no_channels.error().code == ErrorCode::Decode);
    }

    SECTION("FromSamplesRequiresWholeFrames") {
        auto odd = AudioBuffer::from_samples(16000, 2, {0.1f, 0.2f, 0.3f}, "x");
        REQUIRE_FALSE(odd);
        REQUIRE(odd.error().code == ErrorCode::Decode);
    }

    SECTION("EmptySamplesAccepted") {
        auto buf = AudioBuffer::from_samples(16000, 1, {}, "x");
        REQUIRE(buf);
        REQUIRE(buf->empty());
        REQUIRE(buf->duration() == 0.0);
    }

    SECTION("Accessors") {
        auto buf = make_buffer(8000, 2, 4000);
        REQUIRE(buf.sample_rate() == 8000);
        REQUIRE(buf.channels() == 2);
        REQUIRE(buf.frame_count() == 4000);
        REQUIRE(buf.sample_count() == 8000);
        REQUIRE(buf.duration() == Catch::Approx(0.5));
        REQUIRE(buf.source() == "test");
        REQUIRE_FALSE(buf.is_recorded());
    }

    SECTION("RecordedSource") {
        auto buf = make_buffer(16000, 1, 10, AudioBuffer::RECORDED);
        REQUIRE(buf.is_recorded());
    }

    SECTION("CopiesShareSamples") {
        auto buf = make_buffer(16000, 1, 100);
        AudioBuffer copy = buf;
        REQUIRE(copy.samples().data() == buf.samples().data());
    }

    SECTION("FramesClamped") {
        auto buf = make_buffer(100, 2, 10);
        REQUIRE(buf.frames(0, 3).size() == 6);
        REQUIRE(buf.frames(8, 5).size() == 4);
        REQUIRE(buf.frames(10, 1).empty());
        REQUIRE(buf.frames(2, 1)[0] == buf.samples()[4]);
    }

    SECTION("SliceSeconds") {
        auto buf = make_buffer(100, 1, 100);
        REQUIRE(buf.slice_seconds(0.25, 0.5).size() == 25);
        REQUIRE(buf.slice_seconds(0.9, 5.0).size() == 10);
        REQUIRE(buf.slice_seconds(0.5, 0.5).empty());
        REQUIRE(buf.slice_seconds(-1.0, 0.1).size() == 10);
    }

    SECTION("DecodeEmptyDataIsEmptyAudio") {
        std::vector<float> none;
        auto bytes = wav::encode(none, 16000, 1);
        auto buf = AudioBuffer::decode(bytes, "silence.wav");
        REQUIRE_FALSE(buf);
        REQUIRE(buf.error().code == ErrorCode::EmptyAudio);
    }

    SECTION("DecodeGarbageIsDecodeError") {
        std::vector<uint8_t> junk(64, 0x42);
        auto buf = AudioBuffer::decode(junk, "junk.wav");
        REQUIRE_FALSE(buf);
        REQUIRE(buf.error().code == ErrorCode::Decode);
    }

    SECTION("DecodeFileMissing") {
        auto buf = AudioBuffer::decode_file("/tmp/sttpad_test_no_such_file.wav");
        REQUIRE_FALSE(buf);
        REQUIRE(buf.error().code == ErrorCode::Io);
    }

    SECTION("SaveAndDecodeFile") {
        TmpWav tmp;
        auto buf = make_buffer(22050, 2, 2205);
        REQUIRE(buf.save(tmp.path, wav::SampleFormat::Float32));

        auto loaded = AudioBuffer::decode_file(tmp.path);
        REQUIRE(loaded);
        REQUIRE(loaded->sample_rate() == 22050);
        REQUIRE(loaded->channels() == 2);
        REQUIRE(loaded->frame_count() == 2205);
        REQUIRE(loaded->source() == tmp.path);
        REQUIRE(loaded->samples()[3] == buf.samples()[3]);
    }

    SECTION("SaveEmptyFails") {
        TmpWav tmp;
        AudioBuffer empty;
        auto r = empty.save(tmp.path);
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code == ErrorCode::EmptyAudio);
    }
}

TEST_CASE("dsp", "[audio]") {

    SECTION("MixToMonoAverages") {
        std::vector<float> stereo = {1.0f, 0.0f, 0.5f, 0.5f, -1.0f, 1.0f};
        std::vector<float> mono(3);
        dsp::mix_to_mono(stereo, 2, mono);
        REQUIRE(mono == std::vector<float>{0.5f, 0.5f, 0.0f});
    }

    SECTION("ResampleLength") {
        REQUIRE(dsp::resampled_length(48000, 48000, 16000) == 16000);
        REQUIRE(dsp::resampled_length(100, 16000, 16000) == 100);
        REQUIRE(dsp::resample_linear(std::vector<float>(8000, 0.1f), 8000, 16000).size() == 16000);
    }

    SECTION("ResampleInterpolates") {
        std::vector<float> ramp = {0.0f, 1.0f, 2.0f, 3.0f};
        auto up = dsp::resample_linear(ramp, 1, 2);
        REQUIRE(up.size() == 8);
        REQUIRE(up[1] == Catch::Approx(0.5f));
        REQUIRE(up[7] == 3.0f);
    }

    SECTION("ResampleInPiecesMatchesWhole") {
        std::vector<float> input(1000);
        for (size_t i = 0; i < input.size(); ++i) input[i] = static_cast<float>(i) * 0.001f;
        auto whole = dsp::resample_linear(input, 44100, 16000);

        std::vector<float> pieces(whole.size());
        size_t half = pieces.size() / 2;
        dsp::resample_linear(input, 44100, 16000, 0, std::span<float>(pieces).first(half));
        dsp::resample_linear(input, 44100, 16000, half, std::span<float>(pieces).subspan(half));
        REQUIRE(pieces == whole);
    }

    SECTION("NormalizeRemovesOffsetAndScales") {
        std::vector<float> s = {1.0f, 1.5f, 0.5f, 1.0f};
        dsp::normalize(s);
        REQUIRE(s[0] == Catch::Approx(0.0f).margin(1e-6));
        REQUIRE(s[1] == Catch::Approx(1.0f));
        REQUIRE(s[2] == Catch::Approx(-1.0f));
    }

    SECTION("NormalizeLeavesSilence") {
        std::vector<float> s(16, 0.0f);
        dsp::normalize(s);
        REQUIRE(s == std::vector<float>(16, 0.0f));
    }

    SECTION("ApplyGain") {
        std::vector<float> s = {0.25f, -0.5f};
        dsp::apply_gain(s, 2.0f);
        REQUIRE(s == std::vector<float>{0.5f, -1.0f});
    }
}
