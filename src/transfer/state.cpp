#include "cirrus/transfer/state.hpp"

#include <algorithm>
#include <filesystem>

namespace cirrus::transfer {
namespace {

const char* const kCancelledReason = "Cancelled by user";
const char* const kTimedOutReason = "Request timed out";

std::string parent_path_of(const std::string& path) {
    return std::filesystem::path(path).parent_path().string();
}

} // namespace

const char* to_string(RequestKind kind) noexcept {
    switch (kind) {
        case RequestKind::UploadUrls: return "upload-urls";
        case RequestKind::FolderCreation: return "folder-creation";
        case RequestKind::Finalize: return "finalize";
    }
    return "unknown";
}

TransferState::TransferState() : started_at_(Clock::now()) {}

// ──────────────────────────────────────────────────────────
// Queue and scheduling
// ──────────────────────────────────────────────────────────

void TransferState::set_session_anchor(std::string share_id) {
    std::lock_guard lock(mutex_);
    session_anchor_ = std::move(share_id);
}

std::string TransferState::session_anchor() const {
    std::lock_guard lock(mutex_);
    return session_anchor_;
}

bool TransferState::enqueue(std::vector<QueueItem> items) {
    std::lock_guard lock(mutex_);
    for (auto& item : items) {
        queue_.push_back(std::move(item));
    }
    return !active_.has_value() && !paused_;
}

void TransferState::insert_front(std::vector<QueueItem> items) {
    std::lock_guard lock(mutex_);
    queue_.insert(queue_.begin(),
                  std::make_move_iterator(items.begin()),
                  std::make_move_iterator(items.end()));
}

bool TransferState::parent_pending_locked(const QueueItem& item) const {
    return pending_folders_.count(parent_path_of(item.path)) > 0;
}

std::optional<QueueItem> TransferState::take_next_ready() {
    std::lock_guard lock(mutex_);
    if (active_.has_value() || paused_ || queue_.empty()) {
        return std::nullopt;
    }

    // Folders are always ready; files wait while their parent folder is pending
    auto it = std::find_if(queue_.begin(), queue_.end(), [this](const QueueItem& item) {
        return item.kind == ItemKind::Folder || !parent_pending_locked(item);
    });
    if (it == queue_.end()) {
        return std::nullopt;
    }

    QueueItem next = std::move(*it);
    queue_.erase(it);

    if (next.kind == ItemKind::Folder) {
        pending_folders_.insert(next.path);
    }
    active_ = next;
    return next;
}

void TransferState::pause() {
    std::lock_guard lock(mutex_);
    paused_ = true;
}

bool TransferState::resume() {
    std::lock_guard lock(mutex_);
    paused_ = false;
    return !active_.has_value();
}

bool TransferState::is_paused() const {
    std::lock_guard lock(mutex_);
    return paused_;
}

bool TransferState::should_continue(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return active_.has_value() && active_->id == id && !paused_;
}

bool TransferState::is_active(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return active_.has_value() && active_->id == id;
}

std::optional<QueueItem> TransferState::active_item() const {
    std::lock_guard lock(mutex_);
    return active_;
}

bool TransferState::requeue_front(const std::string& id) {
    std::lock_guard lock(mutex_);
    if (!paused_ || !active_.has_value() || active_->id != id) {
        return false;
    }

    if (active_->kind == ItemKind::Folder) {
        pending_folders_.erase(active_->path);
    }
    clear_tracking_locked(id);
    queue_.push_front(std::move(*active_));
    active_.reset();
    return true;
}

// ──────────────────────────────────────────────────────────
// Idempotency guards
// ──────────────────────────────────────────────────────────

BeginOutcome TransferState::begin_file(const std::string& id) {
    std::lock_guard lock(mutex_);
    if (is_terminal_locked(id)) {
        return BeginOutcome::Terminal;
    }
    return initialized_files_.insert(id).second ? BeginOutcome::Fresh : BeginOutcome::Replay;
}

BeginOutcome TransferState::begin_folder(const std::string& id) {
    std::lock_guard lock(mutex_);
    if (is_terminal_locked(id)) {
        return BeginOutcome::Terminal;
    }
    return initialized_folders_.insert(id).second ? BeginOutcome::Fresh : BeginOutcome::Replay;
}

bool TransferState::mark_block_notified(const std::string& id, const std::string& block_key) {
    std::lock_guard lock(mutex_);
    return block_notices_[id].insert(block_key).second;
}

bool TransferState::mark_finalize_notified(const std::string& id) {
    std::lock_guard lock(mutex_);
    return finalize_notices_.insert(id).second;
}

// ──────────────────────────────────────────────────────────
// Outstanding external requests
// ──────────────────────────────────────────────────────────

void TransferState::record_request(const std::string& id, RequestKind kind, Clock::time_point started_at) {
    std::lock_guard lock(mutex_);
    deadlines_[id] = Deadline{kind, started_at};
}

void TransferState::clear_request(const std::string& id, RequestKind kind) {
    std::lock_guard lock(mutex_);
    auto it = deadlines_.find(id);
    if (it != deadlines_.end() && it->second.kind == kind) {
        deadlines_.erase(it);
    }
}

std::optional<RequestKind> TransferState::pending_request(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = deadlines_.find(id);
    if (it == deadlines_.end()) {
        return std::nullopt;
    }
    return it->second.kind;
}

std::optional<Clock::time_point> TransferState::next_expiry(std::chrono::milliseconds threshold) const {
    std::lock_guard lock(mutex_);
    std::optional<Clock::time_point> earliest;
    for (const auto& [id, deadline] : deadlines_) {
        const auto expiry = deadline.started_at + threshold;
        if (!earliest || expiry < *earliest) {
            earliest = expiry;
        }
    }
    return earliest;
}

std::vector<SweptRequest> TransferState::sweep_stuck(Clock::time_point now, std::chrono::milliseconds threshold) {
    std::lock_guard lock(mutex_);
    std::vector<SweptRequest> swept;

    for (auto it = deadlines_.begin(); it != deadlines_.end();) {
        if (now - it->second.started_at <= threshold) {
            ++it;
            continue;
        }

        SweptRequest entry{it->first, it->second.kind, std::nullopt};
        it = deadlines_.erase(it);

        if (active_.has_value() && active_->id == entry.id) {
            if (active_->kind == ItemKind::Folder) {
                pending_folders_.erase(active_->path);
            }
            failed_[entry.id] = kTimedOutReason;
            clear_tracking_locked(entry.id);
            entry.failed_item = std::move(*active_);
            active_.reset();
        }
        swept.push_back(std::move(entry));
    }
    return swept;
}

// ──────────────────────────────────────────────────────────
// Folder bookkeeping
// ──────────────────────────────────────────────────────────

void TransferState::map_folder(const std::string& path, const std::string& folder_id) {
    std::lock_guard lock(mutex_);
    folder_id_map_.emplace(path, folder_id);
}

std::string TransferState::resolve_parent(const QueueItem& item) const {
    std::lock_guard lock(mutex_);
    auto it = folder_id_map_.find(parent_path_of(item.path));
    return it != folder_id_map_.end() ? it->second : item.parent_id;
}

void TransferState::release_pending_folder(const std::string& path) {
    std::lock_guard lock(mutex_);
    pending_folders_.erase(path);
}

std::size_t TransferState::repair_pending_folders() {
    std::lock_guard lock(mutex_);
    std::size_t removed = 0;
    for (auto it = pending_folders_.begin(); it != pending_folders_.end();) {
        const std::string& path = *it;
        const bool active_owner = active_.has_value() &&
                                  active_->kind == ItemKind::Folder &&
                                  active_->path == path;
        const bool queued_owner = std::any_of(queue_.begin(), queue_.end(), [&path](const QueueItem& item) {
            return item.kind == ItemKind::Folder && item.path == path;
        });

        if (active_owner || queued_owner) {
            ++it;
        } else {
            it = pending_folders_.erase(it);
            ++removed;
        }
    }
    return removed;
}

// ──────────────────────────────────────────────────────────
// Terminal transitions
// ──────────────────────────────────────────────────────────

bool TransferState::complete(const std::string& id) {
    std::lock_guard lock(mutex_);
    if (!active_.has_value() || active_->id != id) {
        return false;
    }
    if (active_->kind == ItemKind::Folder) {
        pending_folders_.erase(active_->path);
    }
    active_.reset();
    completed_.insert(id);
    clear_tracking_locked(id);
    return true;
}

bool TransferState::fail(const std::string& id, const std::string& reason) {
    std::lock_guard lock(mutex_);
    if (active_.has_value() && active_->id == id) {
        if (active_->kind == ItemKind::Folder) {
            pending_folders_.erase(active_->path);
        }
        active_.reset();
    } else {
        auto it = std::find_if(queue_.begin(), queue_.end(), [&id](const QueueItem& item) {
            return item.id == id;
        });
        if (it == queue_.end()) {
            return false;
        }
        queue_.erase(it);
    }
    failed_[id] = reason;
    clear_tracking_locked(id);
    return true;
}

std::optional<QueueItem> TransferState::cancel(const std::string& id) {
    std::lock_guard lock(mutex_);
    std::optional<QueueItem> cancelled;

    if (active_.has_value() && active_->id == id) {
        if (active_->kind == ItemKind::Folder) {
            pending_folders_.erase(active_->path);
        }
        cancelled = std::move(*active_);
        active_.reset();
    } else {
        auto it = std::find_if(queue_.begin(), queue_.end(), [&id](const QueueItem& item) {
            return item.id == id;
        });
        if (it == queue_.end()) {
            return std::nullopt;
        }
        cancelled = std::move(*it);
        queue_.erase(it);
    }

    failed_[id] = kCancelledReason;
    clear_tracking_locked(id);
    return cancelled;
}

std::vector<QueueItem> TransferState::cancel_all() {
    std::lock_guard lock(mutex_);
    std::vector<QueueItem> cancelled;
    cancelled.reserve(queue_.size() + 1);

    if (active_.has_value()) {
        cancelled.push_back(std::move(*active_));
        active_.reset();
    }
    for (auto& item : queue_) {
        cancelled.push_back(std::move(item));
    }
    queue_.clear();
    pending_folders_.clear();

    for (const auto& item : cancelled) {
        failed_[item.id] = kCancelledReason;
        clear_tracking_locked(item.id);
    }
    return cancelled;
}

// ──────────────────────────────────────────────────────────
// Observation
// ──────────────────────────────────────────────────────────

QueueStatus TransferState::status_locked() const {
    QueueStatus status;
    status.queue_size = queue_.size();
    if (active_.has_value()) {
        status.processing = active_->id;
    }
    status.completed = completed_.size();
    status.failed = failed_.size();
    status.paused = paused_;
    status.elapsed_secs = static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::seconds>(Clock::now() - started_at_).count());
    status.pending_folders = pending_folders_.size();
    return status;
}

QueueStatus TransferState::status() const {
    std::lock_guard lock(mutex_);
    return status_locked();
}

DetailedQueueStatus TransferState::detailed_status() const {
    std::lock_guard lock(mutex_);
    DetailedQueueStatus detailed;
    detailed.summary = status_locked();

    detailed.queue_items.reserve(queue_.size());
    for (const auto& item : queue_) {
        detailed.queue_items.push_back(QueuedItemSummary{item.id, item.kind, item.name, item.depth, item.parent_id});
    }
    detailed.pending_folders.assign(pending_folders_.begin(), pending_folders_.end());
    detailed.folder_mappings = folder_id_map_;
    detailed.initialized_files = initialized_files_.size();
    detailed.initialized_folders = initialized_folders_.size();
    for (const auto& [id, keys] : block_notices_) {
        detailed.block_notices += keys.size();
    }
    detailed.outstanding_requests = deadlines_.size();
    return detailed;
}

bool TransferState::in_queue(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return std::any_of(queue_.begin(), queue_.end(), [&id](const QueueItem& item) {
        return item.id == id;
    });
}

bool TransferState::is_completed(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return completed_.count(id) > 0;
}

std::optional<std::string> TransferState::failure_reason(const std::string& id) const {
    std::lock_guard lock(mutex_);
    auto it = failed_.find(id);
    if (it == failed_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TransferState::is_pending_folder(const std::string& path) const {
    std::lock_guard lock(mutex_);
    return pending_folders_.count(path) > 0;
}

std::optional<std::string> TransferState::folder_id_for(const std::string& path) const {
    std::lock_guard lock(mutex_);
    auto it = folder_id_map_.find(path);
    if (it == folder_id_map_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool TransferState::has_tracking(const std::string& id) const {
    std::lock_guard lock(mutex_);
    return initialized_files_.count(id) > 0 ||
           initialized_folders_.count(id) > 0 ||
           block_notices_.count(id) > 0 ||
           finalize_notices_.count(id) > 0 ||
           deadlines_.count(id) > 0;
}

// ──────────────────────────────────────────────────────────
// Helpers (caller holds mutex_)
// ──────────────────────────────────────────────────────────

void TransferState::clear_tracking_locked(const std::string& id) {
    initialized_files_.erase(id);
    initialized_folders_.erase(id);
    block_notices_.erase(id);
    finalize_notices_.erase(id);
    deadlines_.erase(id);
}

bool TransferState::is_terminal_locked(const std::string& id) const {
    return completed_.count(id) > 0 || failed_.count(id) > 0;
}

} // namespace cirrus::transfer
