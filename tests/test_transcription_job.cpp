#include <catch2/catch_test_macros.hpp>

#include "jobs/transcription_job.hpp"

#include <vector>

namespace {

TranscriptionJob make_job(size_t caret = 0) {
    auto audio = *AudioBuffer::from_samples(16000, 1, std::vector<float>(1600, 0.1f), "clip.wav");
    return TranscriptionJob(7, "silero-en", std::move(audio), caret);
}

} // namespace

TEST_CASE("TranscriptionJob state machine", "[job]") {
    auto job = make_job(42);

    SECTION("StartsPending") {
        REQUIRE(job.state() == JobState::Pending);
        REQUIRE_FALSE(job.is_terminal());
        REQUIRE(job.progress() == 0.0);
        REQUIRE(job.caret_offset() == 42);
        REQUIRE(job.runner_id() == "silero-en");
        REQUIRE_FALSE(job.started_at());
    }

    SECTION("RunningToSucceeded") {
        REQUIRE(job.start());
        REQUIRE(job.state() == JobState::Running);
        REQUIRE(job.started_at());
        REQUIRE(job.succeed("hello world"));
        REQUIRE(job.state() == JobState::Succeeded);
        REQUIRE(job.result() == "hello world");
        REQUIRE_FALSE(job.error());
        REQUIRE(job.progress() == 1.0);
        REQUIRE(job.finished_at());
        REQUIRE(job.processing_seconds() >= 0.0);
    }

    SECTION("SucceedRefusesEmptyText") {
        REQUIRE(job.start());
        REQUIRE_FALSE(job.succeed(""));
        REQUIRE(job.state() == JobState::Running);
    }

    SECTION("SucceedRequiresRunning") {
        REQUIRE_FALSE(job.succeed("early"));
        REQUIRE(job.state() == JobState::Pending);
    }

    SECTION("PendingToFailedSkipsRunning") {
        REQUIRE(job.fail({ErrorCode::EmptyAudio, "no samples"}));
        REQUIRE(job.state() == JobState::Failed);
        REQUIRE(job.error()->code == ErrorCode::EmptyAudio);
        REQUIRE_FALSE(job.result());
        REQUIRE_FALSE(job.started_at());
        REQUIRE(job.processing_seconds() == 0.0);
    }

    SECTION("RunningToFailed") {
        REQUIRE(job.start());
        REQUIRE(job.fail({ErrorCode::Model, "server down"}));
        REQUIRE(job.state() == JobState::Failed);
    }

    SECTION("CancelledOnlyFromRunning") {
        REQUIRE_FALSE(job.finish_cancelled());
        REQUIRE(job.start());
        REQUIRE(job.finish_cancelled());
        REQUIRE(job.state() == JobState::Cancelled);
    }

    SECTION("TerminalStatesAbsorb") {
        REQUIRE(job.start());
        REQUIRE(job.succeed("done"));

        REQUIRE_FALSE(job.start());
        REQUIRE_FALSE(job.succeed("again"));
        REQUIRE_FALSE(job.fail({ErrorCode::Model, "late"}));
        REQUIRE_FALSE(job.finish_cancelled());
        REQUIRE(job.state() == JobState::Succeeded);
        REQUIRE(job.result() == "done");
    }

    SECTION("ProgressBelowOneWhileRunning") {
        REQUIRE(job.start());
        job.set_progress(0.4);
        REQUIRE(job.progress() == 0.4);
        job.set_progress(0.2);
        REQUIRE(job.progress() == 0.4);
        job.set_progress(1.0);
        REQUIRE(job.progress() < 1.0);
        REQUIRE(job.progress() > 0.99);
        REQUIRE(job.succeed("x"));
        REQUIRE(job.progress() == 1.0);
    }

    SECTION("ProgressIgnoredOutsideRunning") {
        job.set_progress(0.5);
        REQUIRE(job.progress() == 0.0);
        REQUIRE(job.start());
        REQUIRE(job.finish_cancelled());
        job.set_progress(0.5);
        REQUIRE(job.progress() == 0.0);
    }

    SECTION("CancelRequestIsCooperative") {
        auto token = job.stop_token();
        REQUIRE_FALSE(job.cancel_requested());
        job.request_cancel();
        REQUIRE(job.cancel_requested());
        REQUIRE(token.stop_requested());
        // The state only changes when the runner observes it
        REQUIRE(job.state() == JobState::Pending);
    }

    SECTION("DeliveredIsOneShot") {
        REQUIRE_FALSE(job.delivered());
        REQUIRE(job.mark_delivered());
        REQUIRE_FALSE(job.mark_delivered());
        REQUIRE(job.delivered());
    }

    SECTION("Json") {
        REQUIRE(job.start());
        REQUIRE(job.fail({ErrorCode::Model, "boom"}));
        auto j = job.to_json();
        REQUIRE(j["id"] == 7);
        REQUIRE(j["runner"] == "silero-en");
        REQUIRE(j["audio_source"] == "clip.wav");
        REQUIRE(j["caret"] == 42);
        REQUIRE(j["state"] == "failed");
        REQUIRE(j["error"] == "ModelError");
        REQUIRE(j["message"] == "boom");
        REQUIRE_FALSE(j.contains("text"));
    }
}
