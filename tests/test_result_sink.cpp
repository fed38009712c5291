#include <catch2/catch_test_macros.hpp>

#include "document/result_sink.hpp"

#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace {

std::shared_ptr<TranscriptionJob> make_job(uint64_t id, size_t caret) {
    auto audio = *AudioBuffer::from_samples(16000, 1, std::vector<float>(160, 0.1f), "clip.wav");
    return std::make_shared<TranscriptionJob>(id, "silero-en", std::move(audio), caret);
}

std::shared_ptr<TranscriptionJob> succeeded_job(uint64_t id, size_t caret, const std::string& text) {
    auto job = make_job(id, caret);
    job->start();
    job->succeed(text);
    return job;
}

} // namespace

TEST_CASE("ResultSink", "[sink]") {
    Document doc;
    InteractiveQueue queue;
    ResultSink sink(doc, queue);

    std::vector<std::string> messages;
    std::vector<DeliveryStatus> delivered;
    sink.set_message_handler([&messages](const TranscriptionJob&, const std::string& m) { messages.push_back(m); });
    sink.set_delivered_handler([&delivered](const std::shared_ptr<TranscriptionJob>&, DeliveryStatus s) {
        delivered.push_back(s);
    });

    REQUIRE(doc.insert_at(0, std::string(50, '.')));

    SECTION("InsertsAtCapturedCaret") {
        auto job = succeeded_job(1, 42, "hello world");
        doc.set_caret(0); // user moved on while the job ran

        REQUIRE(sink.deliver(job) == DeliveryStatus::Inserted);
        REQUIRE(doc.slice(42, 11) == "hello world");
        REQUIRE(doc.length() == 61);
        REQUIRE(job->delivered());
        REQUIRE(messages.empty());
        REQUIRE(delivered == std::vector<DeliveryStatus>{DeliveryStatus::Inserted});
    }

    SECTION("SecondDeliveryIsNoop") {
        auto job = succeeded_job(1, 42, "hello world");
        REQUIRE(sink.deliver(job) == DeliveryStatus::Inserted);
        REQUIRE(sink.deliver(job) == DeliveryStatus::AlreadyDelivered);
        REQUIRE(doc.length() == 61);
        REQUIRE(delivered.size() == 1);
    }

    SECTION("CaretPastEndClamped") {
        auto job = succeeded_job(1, 42, "tail");
        doc.erase(10, 40);
        REQUIRE(sink.deliver(job) == DeliveryStatus::Inserted);
        REQUIRE(doc.text() == std::string(10, '.') + "tail");
    }

    SECTION("InsertionIsUndoable") {
        auto job = succeeded_job(1, 0, "dictated ");
        REQUIRE(sink.deliver(job) == DeliveryStatus::Inserted);
        REQUIRE(doc.undo());
        REQUIRE(doc.text() == std::string(50, '.'));
    }

    SECTION("NotTerminalRejected") {
        auto job = make_job(1, 0);
        REQUIRE(sink.deliver(job) == DeliveryStatus::NotTerminal);
        job->start();
        REQUIRE(sink.deliver(job) == DeliveryStatus::NotTerminal);
        REQUIRE_FALSE(job->delivered());
        REQUIRE(delivered.empty());
    }

    SECTION("FailureReported") {
        auto job = make_job(7, 0);
        job->start();
        job->fail({ErrorCode::Model, "server returned 500"});

        REQUIRE(sink.deliver(job) == DeliveryStatus::Reported);
        REQUIRE(messages == std::vector<std::string>{"job 7 failed: ModelError: server returned 500"});
        REQUIRE(doc.length() == 50);
        REQUIRE(sink.deliver(job) == DeliveryStatus::AlreadyDelivered);
        REQUIRE(messages.size() == 1);
    }

    SECTION("CancellationReported") {
        auto job = make_job(8, 0);
        job->start();
        job->finish_cancelled();

        REQUIRE(sink.deliver(job) == DeliveryStatus::Reported);
        REQUIRE(messages == std::vector<std::string>{"job 8 cancelled"});
        REQUIRE(doc.length() == 50);
    }

    SECTION("OffThreadDeliveryDeferred") {
        auto job = succeeded_job(3, 5, "later");
        DeliveryStatus from_worker = DeliveryStatus::NotTerminal;
        std::thread worker([&] { from_worker = sink.deliver(job); });
        worker.join();

        REQUIRE(from_worker == DeliveryStatus::Deferred);
        REQUIRE(doc.length() == 50);
        REQUIRE_FALSE(job->delivered());
        REQUIRE(queue.pending() == 1);

        REQUIRE(queue.drain() == 1);
        REQUIRE(doc.slice(5, 5) == "later");
        REQUIRE(delivered == std::vector<DeliveryStatus>{DeliveryStatus::Inserted});
    }

    SECTION("StatusNames") {
        REQUIRE(delivery_status_name(DeliveryStatus::Inserted) == "inserted");
        REQUIRE(delivery_status_name(DeliveryStatus::AlreadyDelivered) == "already_delivered");
    }
}
