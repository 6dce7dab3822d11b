/**
 * @file state.hpp
 * @brief The single shared record of the transfer engine
 *
 * WHAT IT HOLDS:
 * - queue            ordered QueueItems, head first
 * - active           the one item being processed, if any
 * - completed/failed terminal outcomes by id
 * - folder_id_map    local folder path -> server folder id (write once)
 * - pending_folders  folder paths whose creation is not yet confirmed
 * - tracking sets    initialised files/folders, awaited replies, block
 *                    notices, finalize notices, request deadlines
 *
 * RULES:
 * - An id lives in at most one of {queue, active, completed, failed}
 * - Every tracking entry of an id is dropped when the id turns terminal
 * - Every method is one critical section; nothing here blocks or emits
 */

#pragma once

#include "cirrus/transfer/types.hpp"

#include <chrono>
#include <cstddef>
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace cirrus::transfer {

using Clock = std::chrono::steady_clock;

/// Result of the idempotency guard at the start of processing an item
enum class BeginOutcome {
    Fresh,      ///< First time, side effects may be emitted
    Replay,     ///< Already initialised, do not re-emit
    Terminal    ///< Already completed or failed, do nothing
};

enum class RequestKind {
    UploadUrls,
    FolderCreation,
    Finalize
};

const char* to_string(RequestKind kind) noexcept;

/// An outstanding external request purged by the staleness sweep
struct SweptRequest {
    std::string id;
    RequestKind kind = RequestKind::UploadUrls;
    std::optional<QueueItem> failed_item;   ///< Set when the sweep failed the active item
};

class TransferState {
public:
    TransferState();

    TransferState(const TransferState&) = delete;
    TransferState& operator=(const TransferState&) = delete;

    // ════════════════════════════════════════════════════════
    // Queue and scheduling
    // ════════════════════════════════════════════════════════

    void set_session_anchor(std::string share_id);
    std::string session_anchor() const;

    /**
     * @brief Append items at the tail
     *
     * RETURNS:
     * true when the engine is idle and not paused, i.e. the caller should
     * wake the scheduler.
     */
    bool enqueue(std::vector<QueueItem> items);

    /// Place items ahead of everything already queued, keeping their order
    void insert_front(std::vector<QueueItem> items);

    /**
     * @brief Pick the next ready item and make it active
     *
     * Returns nullopt when an item is already active, the engine is paused,
     * the queue is empty, or every queued file waits on a pending folder.
     * A picked folder is recorded in pending_folders before returning.
     */
    std::optional<QueueItem> take_next_ready();

    void pause();

    /// Clears the pause flag; returns true when the scheduler should be woken
    bool resume();

    [[nodiscard]] bool is_paused() const;

    /// True while id is the active item and the engine is not paused
    [[nodiscard]] bool should_continue(const std::string& id) const;

    [[nodiscard]] bool is_active(const std::string& id) const;

    std::optional<QueueItem> active_item() const;

    /**
     * @brief Put the active item back at the head of the queue
     *
     * Used when a pause interrupts a transfer. Tracking for the id is
     * cleared so the item starts over when processing resumes. Returns
     * false when id is no longer active or the engine is not paused.
     */
    bool requeue_front(const std::string& id);

    // ════════════════════════════════════════════════════════
    // Idempotency guards
    // ════════════════════════════════════════════════════════

    BeginOutcome begin_file(const std::string& id);
    BeginOutcome begin_folder(const std::string& id);

    /// Returns true only the first time key is seen for id
    bool mark_block_notified(const std::string& id, const std::string& block_key);

    /// Returns true only the first time for id
    bool mark_finalize_notified(const std::string& id);

    // ════════════════════════════════════════════════════════
    // Outstanding external requests
    // ════════════════════════════════════════════════════════

    void record_request(const std::string& id, RequestKind kind, Clock::time_point started_at);

    /// Drops the deadline for id only while it is still of the given kind
    void clear_request(const std::string& id, RequestKind kind);

    /// Kind of the outstanding request for id, if any
    std::optional<RequestKind> pending_request(const std::string& id) const;

    /// Earliest instant at which an outstanding request becomes stale
    std::optional<Clock::time_point> next_expiry(std::chrono::milliseconds threshold) const;

    /**
     * @brief Purge requests older than threshold
     *
     * The active item is failed with "Request timed out" when its request
     * is purged, and a purged folder releases its pending path.
     */
    std::vector<SweptRequest> sweep_stuck(Clock::time_point now, std::chrono::milliseconds threshold);

    // ════════════════════════════════════════════════════════
    // Folder bookkeeping
    // ════════════════════════════════════════════════════════

    /// First mapping for a path wins
    void map_folder(const std::string& path, const std::string& folder_id);

    /// Server id of the item's parent directory, else the item's own parent_id
    std::string resolve_parent(const QueueItem& item) const;

    void release_pending_folder(const std::string& path);

    /// Drop pending paths with no queued or active folder behind them
    std::size_t repair_pending_folders();

    // ════════════════════════════════════════════════════════
    // Terminal transitions
    // ════════════════════════════════════════════════════════

    /// Active id -> completed. False if id is not active.
    bool complete(const std::string& id);

    /// Active or queued id -> failed. False if id is in neither.
    bool fail(const std::string& id, const std::string& reason);

    /// Queued or active id -> failed("Cancelled by user")
    std::optional<QueueItem> cancel(const std::string& id);

    std::vector<QueueItem> cancel_all();

    // ════════════════════════════════════════════════════════
    // Observation
    // ════════════════════════════════════════════════════════

    QueueStatus status() const;
    DetailedQueueStatus detailed_status() const;

    [[nodiscard]] bool in_queue(const std::string& id) const;
    [[nodiscard]] bool is_completed(const std::string& id) const;
    std::optional<std::string> failure_reason(const std::string& id) const;
    [[nodiscard]] bool is_pending_folder(const std::string& path) const;
    std::optional<std::string> folder_id_for(const std::string& path) const;

    /// True if any idempotency or request tracking entry exists for id
    [[nodiscard]] bool has_tracking(const std::string& id) const;

private:
    struct Deadline {
        RequestKind kind;
        Clock::time_point started_at;
    };

    QueueStatus status_locked() const;
    void clear_tracking_locked(const std::string& id);
    bool is_terminal_locked(const std::string& id) const;
    bool parent_pending_locked(const QueueItem& item) const;

    mutable std::mutex mutex_;

    std::deque<QueueItem> queue_;
    std::optional<QueueItem> active_;
    std::unordered_set<std::string> completed_;
    std::unordered_map<std::string, std::string> failed_;
    std::map<std::string, std::string> folder_id_map_;
    std::set<std::string> pending_folders_;

    std::unordered_set<std::string> initialized_files_;
    std::unordered_set<std::string> initialized_folders_;
    std::unordered_map<std::string, std::unordered_set<std::string>> block_notices_;
    std::unordered_set<std::string> finalize_notices_;
    std::unordered_map<std::string, Deadline> deadlines_;

    bool paused_ = false;
    std::string session_anchor_;
    Clock::time_point started_at_;
};

} // namespace cirrus::transfer
