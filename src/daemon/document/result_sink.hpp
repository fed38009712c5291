#pragma once

#include "document/document.hpp"
#include "jobs/interactive_queue.hpp"
#include "jobs/transcription_job.hpp"

#include <functional>
#include <memory>
#include <string>

enum class DeliveryStatus {
    Inserted,         // succeeded job, text inserted at its caret offset
    Reported,         // failed or cancelled job, message surfaced
    AlreadyDelivered, // second delivery, nothing done
    Deferred,         // called off the interactive thread, queued
    NotTerminal,      // job still pending or running, nothing done
};

std::string_view delivery_status_name(DeliveryStatus status);

// Final stop for every finished job. Mutates the Document only on the
// interactive thread.
class ResultSink {
public:
    // Failed / cancelled outcome, or a result that could not be inserted.
    using MessageHandler = std::function<void(const TranscriptionJob&, const std::string&)>;
    // Fires once per job after it was inserted or reported.
    using DeliveredHandler = std::function<void(const std::shared_ptr<TranscriptionJob>&, DeliveryStatus)>;

    ResultSink(Document& document, InteractiveQueue& queue);

    void set_message_handler(MessageHandler handler) { on_message_ = std::move(handler); }
    void set_delivered_handler(DeliveredHandler handler) { on_delivered_ = std::move(handler); }

    DeliveryStatus deliver(std::shared_ptr<TranscriptionJob> job);

private:
    Document& document_;
    InteractiveQueue& queue_;
    MessageHandler on_message_;
    DeliveredHandler on_delivered_;
};
