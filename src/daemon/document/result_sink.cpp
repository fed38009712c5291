#include "document/result_sink.hpp"

#include <format>
#include <print>

std::string_view delivery_status_name(DeliveryStatus status) {
    switch (status) {
        case DeliveryStatus::Inserted: return "inserted";
        case DeliveryStatus::Reported: return "reported";
        case DeliveryStatus::AlreadyDelivered: return "already_delivered";
        case DeliveryStatus::Deferred: return "deferred";
        case DeliveryStatus::NotTerminal: return "not_terminal";
    }
    return "unknown";
}

ResultSink::ResultSink(Document& document, InteractiveQueue& queue)
    : document_(document), queue_(queue) {}

DeliveryStatus ResultSink::deliver(std::shared_ptr<TranscriptionJob> job) {
    if (!queue_.on_owner_thread()) {
        queue_.post([this, job] { deliver(job); });
        return DeliveryStatus::Deferred;
    }

    if (!job->is_terminal()) return DeliveryStatus::NotTerminal;
    if (!job->mark_delivered()) return DeliveryStatus::AlreadyDelivered;

    auto status = DeliveryStatus::Reported;
    std::string message;

    switch (job->state()) {
        case JobState::Succeeded: {
            auto inserted = document_.insert_at(job->caret_offset(), job->result().value_or(""));
            if (inserted) {
                status = DeliveryStatus::Inserted;
            } else {
                message = std::format("job {}: result not inserted: {}", job->id(), inserted.error().describe());
            }
            break;
        }
        case JobState::Failed: {
            auto err = job->error().value_or(Error{ErrorCode::Model, "unknown failure"});
            message = std::format("job {} failed: {}", job->id(), err.describe());
            break;
        }
        case JobState::Cancelled:
            message = std::format("job {} cancelled", job->id());
            break;
        case JobState::Pending:
        case JobState::Running:
            break;
    }

    if (!message.empty()) {
        if (on_message_) {
            on_message_(*job, message);
        } else {
            std::println(stderr, "sink: {}", message);
        }
    }

    if (on_delivered_) on_delivered_(job, status);
    return status;
}
