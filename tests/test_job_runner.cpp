#include <catch2/catch_test_macros.hpp>

#include "fake_runner.hpp"

#include <new>
#include <stdexcept>
#include <vector>

namespace {

AudioBuffer one_second() {
    return *AudioBuffer::from_samples(16000, 1, std::vector<float>(16000, 0.1f), "test");
}

} // namespace

TEST_CASE("JobRunner contract", "[runner]") {
    auto audio = one_second();
    std::stop_source stop;

    SECTION("SuccessPassesThrough") {
        FakeRunner runner("fake", [](auto&, auto&, auto) { return RunOutcome::succeeded("hi"); });
        auto outcome = runner.run(audio, {}, stop.get_token());
        REQUIRE(outcome.kind == RunOutcome::Kind::Succeeded);
        REQUIRE(outcome.text == "hi");
    }

    SECTION("ExceptionBecomesFailure") {
        FakeRunner runner("fake", [](auto&, auto&, auto) -> RunOutcome {
            throw std::runtime_error("tensor shape mismatch");
        });
        auto outcome = runner.run(audio, {}, stop.get_token());
        REQUIRE(outcome.kind == RunOutcome::Kind::Failed);
        REQUIRE(outcome.error);
        REQUIRE(outcome.error->code == ErrorCode::Model);
        REQUIRE(outcome.error->message == "tensor shape mismatch");
    }

    SECTION("OutOfMemoryBecomesFailure") {
        FakeRunner runner("fake", [](auto&, auto&, auto) -> RunOutcome { throw std::bad_alloc(); });
        auto outcome = runner.run(audio, {}, stop.get_token());
        REQUIRE(outcome.kind == RunOutcome::Kind::Failed);
        REQUIRE(outcome.error->message == "out of memory");
    }

    SECTION("EmptyTextIsFailure") {
        FakeRunner runner("fake", [](auto&, auto&, auto) { return RunOutcome::succeeded(""); });
        auto outcome = runner.run(audio, {}, stop.get_token());
        REQUIRE(outcome.kind == RunOutcome::Kind::Failed);
        REQUIRE(outcome.error->code == ErrorCode::Model);
    }

    SECTION("FailureWithoutErrorGetsOne") {
        FakeRunner runner("fake", [](auto&, auto&, auto) { return RunOutcome{}; });
        auto outcome = runner.run(audio, {}, stop.get_token());
        REQUIRE(outcome.kind == RunOutcome::Kind::Failed);
        REQUIRE(outcome.error);
        REQUIRE(outcome.error->code == ErrorCode::Model);
    }

    SECTION("CancelledPassesThrough") {
        FakeRunner runner("fake", [](auto&, auto&, std::stop_token st) {
            return st.stop_requested() ? RunOutcome::cancelled() : RunOutcome::succeeded("x");
        });
        stop.request_stop();
        auto outcome = runner.run(audio, {}, stop.get_token());
        REQUIRE(outcome.kind == RunOutcome::Kind::Cancelled);
        REQUIRE_FALSE(outcome.error);
    }

    SECTION("ProgressClampedAndMonotonic") {
        FakeRunner runner("fake", [](auto&, const ProgressCallback& progress, auto) {
            progress(0.5);
            progress(0.3);
            progress(1.5);
            progress(-1.0);
            return RunOutcome::succeeded("done");
        });
        std::vector<double> seen;
        runner.run(audio, [&seen](double p) { seen.push_back(p); }, stop.get_token());
        REQUIRE(seen == std::vector<double>{0.5, 1.0});
    }

    SECTION("NullProgressCallbackAllowed") {
        FakeRunner runner("fake", [](auto&, const ProgressCallback& progress, auto) {
            progress(0.5);
            return RunOutcome::succeeded("ok");
        });
        REQUIRE(runner.run(audio, {}, stop.get_token()).kind == RunOutcome::Kind::Succeeded);
    }
}

TEST_CASE("JobRunner acquisition", "[runner]") {
    FakeRunner runner("fake", [](auto&, auto&, auto) { return RunOutcome::succeeded("x"); });

    SECTION("OneHolderAtATime") {
        REQUIRE_FALSE(runner.busy());
        REQUIRE(runner.try_acquire());
        REQUIRE(runner.busy());
        REQUIRE_FALSE(runner.try_acquire());
        runner.release();
        REQUIRE_FALSE(runner.busy());
        REQUIRE(runner.try_acquire());
    }

    SECTION("RecordAndRunFromParams") {
        REQUIRE_FALSE(runner.record_and_run());

        ProfileParams params;
        params.set("record_and_run", true);
        FakeRunner recording("fake", [](auto&, auto&, auto) { return RunOutcome::succeeded("x"); }, params);
        REQUIRE(recording.record_and_run());
    }
}
