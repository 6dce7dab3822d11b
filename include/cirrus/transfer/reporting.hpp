#pragma once

#include "cirrus/events/event_bus.hpp"
#include "cirrus/events/events.hpp"
#include "cirrus/transfer/types.hpp"

#include <string>

namespace cirrus::transfer {

events::TransferProgressed progress_event(const QueueItem& item,
                                          float progress,
                                          std::string status,
                                          std::string message);

/// transfer-progress(failed) followed by transfer-complete(failed)
void emit_failure(events::EventBus& bus, const QueueItem& item, const std::string& reason);

} // namespace cirrus::transfer
