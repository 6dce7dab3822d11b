#pragma once

#include "cirrus/core/config.hpp"
#include "cirrus/core/error.hpp"
#include "cirrus/events/event_bus.hpp"
#include "cirrus/transfer/correlation.hpp"
#include "cirrus/transfer/state.hpp"

#include <vector>

namespace cirrus::transfer {

enum class FolderOutcome {
    Expanded,   ///< Created, children queued, folder completed
    Replayed,   ///< Already initialised, nothing re-emitted
    Skipped     ///< Terminal already, or cancelled while waiting
};

struct FolderChildren {
    std::vector<QueueItem> files;
    std::vector<QueueItem> folders;
};

/**
 * @brief Creates one folder on the server and queues its direct children
 *
 * FLOW:
 * 1. Check the path is a directory and run the idempotency guard
 * 2. create-folder through the correlation manager
 * 3. Record path -> server id
 * 4. List one level, files then subfolders, ahead of the existing queue
 *
 * Errors are returned to the caller, which owns failure reporting. The
 * pending-folder entry is released on success here and on failure by the
 * state transition to failed.
 */
class FolderExpander {
public:
    FolderExpander(const EngineConfig& config,
                   TransferState& state,
                   CorrelationManager& correlation,
                   events::EventBus& bus);

    TransferResult<FolderOutcome> expand(const QueueItem& folder);

    /// Immediate children of folder, each group sorted by name
    static TransferResult<FolderChildren> scan_children(const QueueItem& folder, const std::string& server_folder_id);

private:
    const EngineConfig& config_;
    TransferState& state_;
    CorrelationManager& correlation_;
    events::EventBus& bus_;
};

} // namespace cirrus::transfer
