#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "mock_audio_capture.hpp"
#include "recorder.hpp"
#include "ring_buffer.hpp"

#include <chrono>
#include <thread>
#include <vector>

TEST_CASE("Recorder state machine", "[recorder]") {
    RingBuffer ring(1024);
    MockAudioCapture capture(8000, 2);
    Recorder recorder(ring, capture);

    SECTION("InitialStateIdle") {
        REQUIRE(recorder.state() == RecorderState::Idle);
        REQUIRE(recorder.duration() == 0.0);
    }

    SECTION("StartBeginsCapture") {
        REQUIRE(recorder.start());
        REQUIRE(recorder.state() == RecorderState::Recording);
        REQUIRE(capture.is_capturing());
    }

    SECTION("StartTwiceIsInvalidState") {
        REQUIRE(recorder.start());
        auto again = recorder.start();
        REQUIRE_FALSE(again);
        REQUIRE(again.error().code == ErrorCode::InvalidState);
        REQUIRE(capture.starts == 1);
    }

    SECTION("CaptureFailureStaysIdle") {
        capture.fail_start = true;
        auto r = recorder.start();
        REQUIRE_FALSE(r);
        REQUIRE(r.error().code == ErrorCode::Io);
        REQUIRE(recorder.state() == RecorderState::Idle);
    }

    SECTION("FinishWhenIdleIsInvalidState") {
        auto clip = recorder.finish();
        REQUIRE_FALSE(clip);
        REQUIRE(clip.error().code == ErrorCode::InvalidState);
    }

    SECTION("FinishReturnsRecordedClip") {
        REQUIRE(recorder.start());
        std::vector<float> captured(1601, 0.1f); // odd tail sample is not a whole frame
        ring.write(captured);

        auto clip = recorder.finish();
        REQUIRE(clip);
        REQUIRE(clip->is_recorded());
        REQUIRE(clip->sample_rate() == 8000);
        REQUIRE(clip->channels() == 2);
        REQUIRE(clip->frame_count() == 800);
        REQUIRE(clip->duration() == Catch::Approx(0.1));
        REQUIRE(recorder.state() == RecorderState::Idle);
        REQUIRE_FALSE(capture.is_capturing());
    }

    SECTION("FinishWithNothingCapturedIsEmptyAudio") {
        REQUIRE(recorder.start());
        auto clip = recorder.finish();
        REQUIRE_FALSE(clip);
        REQUIRE(clip.error().code == ErrorCode::EmptyAudio);
        REQUIRE(recorder.state() == RecorderState::Idle);
    }

    SECTION("StartDiscardsStaleSamples") {
        std::vector<float> stale(100, 0.5f);
        ring.write(stale);
        REQUIRE(recorder.start());
        REQUIRE(ring.available() == 0);
    }

    SECTION("CancelDiscardsByDefault") {
        REQUIRE(recorder.start());
        std::vector<float> captured(200, 0.1f);
        ring.write(captured);

        REQUIRE_FALSE(recorder.cancel(false).has_value());
        REQUIRE(recorder.state() == RecorderState::Idle);
        REQUIRE_FALSE(capture.is_capturing());
    }

    SECTION("CancelKeepsPartialWhenAsked") {
        REQUIRE(recorder.start());
        std::vector<float> captured(200, 0.1f);
        ring.write(captured);

        auto partial = recorder.cancel(true);
        REQUIRE(partial.has_value());
        REQUIRE(partial->frame_count() == 100);
        REQUIRE(partial->is_recorded());
    }

    SECTION("CancelWhenIdleIsNoop") {
        REQUIRE_FALSE(recorder.cancel(true).has_value());
    }

    SECTION("OverflowIsCappedAtRingCapacity") {
        REQUIRE(recorder.start());
        std::vector<float> flood(2000, 0.2f);
        ring.write(flood);

        auto clip = recorder.finish();
        REQUIRE(clip);
        REQUIRE(clip->sample_count() == 1024);
        REQUIRE(recorder.dropped_samples() == 976);
        REQUIRE(recorder.limit_reached());
        REQUIRE(recorder.dropped_seconds() == Catch::Approx(976.0 / 16000.0));
    }

    SECTION("DurationStopsAtRingCapacity") {
        // 1024 samples of 8 kHz stereo hold 64 ms
        REQUIRE(recorder.max_duration() == Catch::Approx(0.064));
        REQUIRE(recorder.start());
        REQUIRE_FALSE(recorder.limit_reached());
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        REQUIRE(recorder.duration() == Catch::Approx(0.064));
    }

    SECTION("RestartClearsDroppedCount") {
        REQUIRE(recorder.start());
        std::vector<float> flood(2000, 0.2f);
        ring.write(flood);
        REQUIRE(recorder.finish());
        REQUIRE(recorder.start());
        REQUIRE_FALSE(recorder.limit_reached());
        REQUIRE(recorder.dropped_seconds() == 0.0);
    }
}
