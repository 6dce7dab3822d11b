#include "cirrus/transfer/reporting.hpp"

namespace cirrus::transfer {

events::TransferProgressed progress_event(const QueueItem& item,
                                          float progress,
                                          std::string status,
                                          std::string message) {
    events::TransferProgressed event;
    event.id = item.id;
    event.name = item.name;
    event.kind = item.kind;
    event.progress = progress;
    event.status = std::move(status);
    event.message = std::move(message);
    return event;
}

void emit_failure(events::EventBus& bus, const QueueItem& item, const std::string& reason) {
    bus.emit(progress_event(item, 0.0f, "failed", reason));

    events::TransferFinished finished;
    finished.id = item.id;
    finished.name = item.name;
    finished.status = events::TransferOutcome::Failed;
    finished.message = reason;
    bus.emit(finished);
}

} // namespace cirrus::transfer
