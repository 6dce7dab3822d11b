#include "cirrus/transfer/engine.hpp"

#include "cirrus/transfer/reporting.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <filesystem>
#include <system_error>

#ifndef CIRRUS_VERSION
#define CIRRUS_VERSION "0.0.0"
#endif

namespace cirrus::transfer {
namespace fs = std::filesystem;

namespace {

const char* const kCancelledReason = "Cancelled by user";
const char* const kTimedOutReason = "Request timed out";
const char* const kChannelClosed = "Channel closed before receiving response";

/// Absolute, lexically normal, without a trailing separator
fs::path normalize_selection(const std::string& raw) {
    std::error_code ec;
    fs::path path = fs::absolute(fs::path(raw), ec);
    if (ec) {
        path = fs::path(raw);
    }
    path = path.lexically_normal();
    if (!path.has_filename() && path.has_parent_path() && path != path.root_path()) {
        path = path.parent_path();
    }
    return path;
}

} // namespace

TransferEngine::TransferEngine(EngineConfig config, events::EventBus& bus, network::UploadClient& uploader)
    : config_(std::move(config))
    , bus_(bus)
    , expander_(config_, state_, correlation_, bus_)
    , pipeline_(config_, state_, correlation_, bus_, uploader) {}

TransferEngine::~TransferEngine() {
    stop();
}

const char* TransferEngine::to_string(Wake reason) noexcept {
    switch (reason) {
        case Wake::Enqueued: return "enqueued";
        case Wake::Resumed: return "resumed";
        case Wake::Finished: return "finished";
        case Wake::Cancelled: return "cancelled";
        case Wake::Maintenance: return "maintenance";
    }
    return "unknown";
}

void TransferEngine::start() {
    if (running_.exchange(true)) {
        return;
    }
    worker_ = std::thread([this]() { run(); });
    spdlog::info("[Engine] started negotiation_timeout={}ms staleness={}ms attempts={}",
        config_.negotiation_timeout.count(), config_.staleness_threshold.count(), config_.max_upload_attempts);
}

void TransferEngine::stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // A running block loop sees the pause and hands its item back to the queue
    state_.pause();
    const auto closed = correlation_.close_all(TransferError{ErrorKind::Negotiation, kChannelClosed});
    wakeups_.shutdown();
    if (worker_.joinable()) {
        worker_.join();
    }
    spdlog::info("[Engine] stopped closed_requests={}", closed);
}

// ──────────────────────────────────────────────────────────
// Commands
// ──────────────────────────────────────────────────────────

std::vector<std::string> TransferEngine::select_files(const std::vector<std::string>& paths,
                                                      const std::string& share_id,
                                                      const std::string& parent_id) {
    state_.set_session_anchor(share_id);

    std::vector<QueueItem> items;
    std::vector<std::string> ids;
    for (const auto& raw : paths) {
        const fs::path path = normalize_selection(raw);
        std::error_code ec;
        if (!fs::is_regular_file(path, ec)) {
            spdlog::warn("[SelectionRejected] kind=file path={}", raw);
            bus_.emit(events::TransferRejected{"Invalid file path: " + raw});
            continue;
        }

        QueueItem item;
        item.kind = ItemKind::File;
        item.id = generate_transfer_id();
        item.path = path.string();
        item.name = path.filename().string();
        item.parent_id = parent_id;
        ids.push_back(item.id);
        items.push_back(std::move(item));
    }

    if (!items.empty()) {
        spdlog::info("[FilesSelected] count={} share={}", items.size(), share_id);
        if (state_.enqueue(std::move(items))) {
            wake(Wake::Enqueued);
        }
    }
    return ids;
}

std::vector<std::string> TransferEngine::select_folders(const std::vector<std::string>& paths,
                                                        const std::string& share_id,
                                                        const std::string& parent_id) {
    state_.set_session_anchor(share_id);

    std::vector<QueueItem> items;
    std::vector<std::string> ids;
    for (const auto& raw : paths) {
        const fs::path path = normalize_selection(raw);
        std::error_code ec;
        if (!fs::is_directory(path, ec)) {
            spdlog::warn("[SelectionRejected] kind=folder path={}", raw);
            bus_.emit(events::TransferRejected{"Invalid folder path: " + raw});
            continue;
        }

        QueueItem item;
        item.kind = ItemKind::Folder;
        item.id = generate_transfer_id();
        item.path = path.string();
        item.name = path.filename().string();
        item.parent_id = parent_id;
        ids.push_back(item.id);
        items.push_back(std::move(item));
    }

    if (!items.empty()) {
        spdlog::info("[FoldersSelected] count={} share={}", items.size(), share_id);
        if (state_.enqueue(std::move(items))) {
            wake(Wake::Enqueued);
        }
    }
    return ids;
}

void TransferEngine::pause() {
    state_.pause();
    spdlog::info("[Engine] paused");
}

void TransferEngine::resume(const std::string& share_id) {
    if (!share_id.empty()) {
        state_.set_session_anchor(share_id);
    }
    spdlog::info("[Engine] resumed share={}", share_id);
    if (state_.resume()) {
        wake(Wake::Resumed);
    }
}

bool TransferEngine::cancel(const std::string& id) {
    auto item = state_.cancel(id);
    if (!item) {
        spdlog::debug("[CancelIgnored] id={} not queued or active", id);
        return false;
    }

    correlation_.fail_all_for(id, TransferError{ErrorKind::Cancelled, kCancelledReason});
    spdlog::info("[TransferCancelled] id={} name={}", item->id, item->name);
    emit_failure(bus_, *item, kCancelledReason);
    wake(Wake::Cancelled);
    return true;
}

std::size_t TransferEngine::cancel_all() {
    const auto cancelled = state_.cancel_all();
    for (const auto& item : cancelled) {
        correlation_.fail_all_for(item.id, TransferError{ErrorKind::Cancelled, kCancelledReason});
        emit_failure(bus_, item, kCancelledReason);
    }
    spdlog::info("[TransferCancelled] all count={}", cancelled.size());
    return cancelled.size();
}

// ──────────────────────────────────────────────────────────
// Inbound replies
// ──────────────────────────────────────────────────────────

DeliveryStatus TransferEngine::settle_delivery(const std::string& id,
                                               RequestKind request,
                                               DeliveryStatus status,
                                               const char* reply) {
    switch (status) {
        case DeliveryStatus::Delivered:
            spdlog::debug("[Reply] kind={} id={} delivered", reply, id);
            break;
        case DeliveryStatus::ReceiverGone:
            state_.clear_request(id, request);
            spdlog::info("[Reply] kind={} id={} receiver gone", reply, id);
            break;
        case DeliveryStatus::NoSlot:
            state_.clear_request(id, request);
            spdlog::warn("[Reply] kind={} id={} dropped, no pending request", reply, id);
            break;
    }
    return status;
}

DeliveryStatus TransferEngine::on_upload_urls(const std::string& transfer_id, UploadUrlsResponse response) {
    const auto status = correlation_.upload_urls().deliver(
        transfer_id, Ok<UploadUrlsResponse, TransferError>(std::move(response)));
    return settle_delivery(transfer_id, RequestKind::UploadUrls, status, "upload-urls");
}

DeliveryStatus TransferEngine::on_upload_error(const std::string& transfer_id, const std::string& error) {
    const auto status = correlation_.upload_urls().fail(transfer_id, TransferError{ErrorKind::Negotiation, error});
    return settle_delivery(transfer_id, RequestKind::UploadUrls, status, "upload-error");
}

DeliveryStatus TransferEngine::on_folder_created(const std::string& transfer_id, FolderResponse response) {
    const auto status = correlation_.folders().deliver(
        transfer_id, Ok<FolderResponse, TransferError>(std::move(response)));
    return settle_delivery(transfer_id, RequestKind::FolderCreation, status, "folder-created");
}

DeliveryStatus TransferEngine::on_folder_error(const std::string& transfer_id, const std::string& error) {
    const auto status = correlation_.folders().fail(transfer_id, TransferError{ErrorKind::Negotiation, error});
    return settle_delivery(transfer_id, RequestKind::FolderCreation, status, "folder-error");
}

void TransferEngine::on_finalize_complete(const FinalizeOutcome& outcome) {
    const auto active = state_.active_item();
    if (!active || active->id != outcome.transfer_id) {
        if (state_.is_completed(outcome.transfer_id)) {
            spdlog::debug("[FinalizeComplete] id={} duplicate, already completed", outcome.transfer_id);
        } else {
            spdlog::warn("[FinalizeComplete] id={} ignored, not the active transfer", outcome.transfer_id);
        }
        return;
    }
    if (!state_.complete(outcome.transfer_id)) {
        return;
    }

    const std::string message = outcome.success
        ? std::string("Upload complete and verified")
        : "Upload complete, but verification failed: " + outcome.error.value_or("Content update failed");

    if (outcome.success) {
        spdlog::info("[UploadCompleted] id={} file={} verified=true", outcome.transfer_id, outcome.file_id);
    } else {
        spdlog::warn("[UploadCompleted] id={} file={} verified=false error={}",
            outcome.transfer_id, outcome.file_id, outcome.error.value_or(""));
    }

    bus_.emit(progress_event(*active, 1.0f, "completed", message));

    events::TransferFinished finished;
    finished.id = active->id;
    finished.name = active->name;
    finished.status = events::TransferOutcome::Completed;
    finished.message = message;
    finished.file_id = outcome.file_id;
    finished.parent_id = outcome.parent_id;
    bus_.emit(finished);

    wake(Wake::Finished);
}

// ──────────────────────────────────────────────────────────
// Administration
// ──────────────────────────────────────────────────────────

QueueStatus TransferEngine::queue_status() const {
    return state_.status();
}

DetailedQueueStatus TransferEngine::detailed_status() const {
    return state_.detailed_status();
}

HealthReport TransferEngine::health() const {
    HealthReport report;
    report.status = "healthy";
    report.timestamp = std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    report.version = CIRRUS_VERSION;
    return report;
}

StuckCleanupReport TransferEngine::cleanup_stuck() {
    auto report = sweep_expired(config_.staleness_threshold);
    if (report.cleaned_count > 0) {
        wake(Wake::Maintenance);
    }
    return report;
}

RepairReport TransferEngine::repair_folders() {
    RepairReport report;
    report.repaired_count = state_.repair_pending_folders();
    spdlog::info("[RepairFolders] repaired={}", report.repaired_count);
    if (report.repaired_count > 0) {
        wake(Wake::Maintenance);
    }
    return report;
}

// ──────────────────────────────────────────────────────────
// Worker
// ──────────────────────────────────────────────────────────

void TransferEngine::wake(Wake reason) {
    if (!wakeups_.push(reason)) {
        spdlog::debug("[Engine] wake-up {} dropped, engine stopped", to_string(reason));
    }
}

void TransferEngine::run() {
    while (running_) {
        std::optional<Wake> reason;
        const auto expiry = state_.next_expiry(config_.staleness_threshold);
        if (expiry) {
            const auto now = Clock::now();
            const auto wait = *expiry > now
                ? std::chrono::duration_cast<std::chrono::milliseconds>(*expiry - now) + std::chrono::milliseconds(1)
                : std::chrono::milliseconds(0);
            reason = wakeups_.pop_for(wait);
        } else {
            reason = wakeups_.pop();
        }

        if (wakeups_.is_shutdown()) {
            break;
        }
        if (reason) {
            spdlog::debug("[Engine] woken by {}", to_string(*reason));
        }
        drain();
    }
}

void TransferEngine::drain() {
    while (running_) {
        sweep_expired(config_.staleness_threshold);

        auto next = state_.take_next_ready();
        if (!next) {
            return;
        }
        try {
            process(*next);
        } catch (const std::exception& e) {
            handle_failure(*next, TransferError{ErrorKind::Io, std::string("Unexpected error: ") + e.what()});
        }
    }
}

void TransferEngine::process(const QueueItem& item) {
    spdlog::debug("[Dequeued] id={} kind={} name={} depth={}", item.id, transfer::to_string(item.kind), item.name, item.depth);

    if (item.kind == ItemKind::Folder) {
        auto result = expander_.expand(item);
        if (result.is_error()) {
            handle_failure(item, result.error());
        }
        return;
    }

    auto result = pipeline_.transfer(item);
    if (result.is_error()) {
        handle_failure(item, result.error());
    }
}

void TransferEngine::handle_failure(const QueueItem& item, const TransferError& error) {
    if (!state_.fail(item.id, error.message)) {
        spdlog::debug("[TransferFailed] id={} already settled, dropped error={}", item.id, error.message);
        return;
    }
    spdlog::warn("[TransferFailed] id={} kind={} class={} reason={}",
        item.id, transfer::to_string(item.kind), cirrus::to_string(error.kind), error.message);
    emit_failure(bus_, item, error.message);
}

StuckCleanupReport TransferEngine::sweep_expired(std::chrono::milliseconds threshold) {
    StuckCleanupReport report;
    for (auto& entry : state_.sweep_stuck(Clock::now(), threshold)) {
        correlation_.fail_all_for(entry.id, TransferError{ErrorKind::Orphaned, kTimedOutReason});
        spdlog::warn("[RequestSwept] id={} request={} threshold={}ms",
            entry.id, transfer::to_string(entry.kind), threshold.count());
        if (entry.failed_item) {
            emit_failure(bus_, *entry.failed_item, kTimedOutReason);
        }
        report.cleaned_ids.push_back(entry.id);
    }
    report.cleaned_count = report.cleaned_ids.size();
    return report;
}

} // namespace cirrus::transfer
