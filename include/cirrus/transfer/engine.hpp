/**
 * @file engine.hpp
 * @brief Single-flight upload scheduler
 *
 * ARCHITECTURE:
 *
 *   commands / inbound replies / admin        (any thread)
 *              │                 │
 *              ▼                 ▼
 *        TransferState    CorrelationManager
 *              │                 ▲
 *              ▼ wake            │ await
 *        worker thread ──► FolderExpander / BlockPipeline ──► EventBus
 *
 * One worker drains the queue. Every other entry point only mutates state
 * through TransferState or resolves a reply slot, then wakes the worker.
 * The worker also wakes on its own when the earliest outstanding request
 * crosses the staleness threshold.
 */

#pragma once

#include "cirrus/core/config.hpp"
#include "cirrus/events/event_bus.hpp"
#include "cirrus/events/event_queue.hpp"
#include "cirrus/network/upload_client.hpp"
#include "cirrus/transfer/block_pipeline.hpp"
#include "cirrus/transfer/correlation.hpp"
#include "cirrus/transfer/folder_expander.hpp"
#include "cirrus/transfer/state.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

namespace cirrus::transfer {

class TransferEngine {
public:
    TransferEngine(EngineConfig config, events::EventBus& bus, network::UploadClient& uploader);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    void start();

    /// Fails outstanding waits with "Channel closed before receiving response" and joins the worker
    void stop();

    // ════════════════════════════════════════════════════════
    // Commands
    // ════════════════════════════════════════════════════════

    /**
     * @brief Queue the regular files among paths
     *
     * Invalid paths emit TransferRejected and are skipped. Returns the ids
     * of the queued items.
     */
    std::vector<std::string> select_files(const std::vector<std::string>& paths,
                                          const std::string& share_id,
                                          const std::string& parent_id);

    std::vector<std::string> select_folders(const std::vector<std::string>& paths,
                                            const std::string& share_id,
                                            const std::string& parent_id);

    void pause();
    void resume(const std::string& share_id);

    /// False when id is neither queued nor active
    bool cancel(const std::string& id);

    std::size_t cancel_all();

    // ════════════════════════════════════════════════════════
    // Inbound replies from the orchestration service
    // ════════════════════════════════════════════════════════

    DeliveryStatus on_upload_urls(const std::string& transfer_id, UploadUrlsResponse response);
    DeliveryStatus on_upload_error(const std::string& transfer_id, const std::string& error);
    DeliveryStatus on_folder_created(const std::string& transfer_id, FolderResponse response);
    DeliveryStatus on_folder_error(const std::string& transfer_id, const std::string& error);

    /// Completes the active file whatever the verification result
    void on_finalize_complete(const FinalizeOutcome& outcome);

    // ════════════════════════════════════════════════════════
    // Administration
    // ════════════════════════════════════════════════════════

    QueueStatus queue_status() const;
    DetailedQueueStatus detailed_status() const;
    HealthReport health() const;
    StuckCleanupReport cleanup_stuck();
    RepairReport repair_folders();

    const EngineConfig& config() const { return config_; }
    const TransferState& state() const { return state_; }

private:
    enum class Wake {
        Enqueued,
        Resumed,
        Finished,
        Cancelled,
        Maintenance
    };

    static const char* to_string(Wake reason) noexcept;

    void wake(Wake reason);
    void run();
    void drain();
    void process(const QueueItem& item);
    void handle_failure(const QueueItem& item, const TransferError& error);
    StuckCleanupReport sweep_expired(std::chrono::milliseconds threshold);
    /// A late reply only clears a deadline of its own request kind
    DeliveryStatus settle_delivery(const std::string& id, RequestKind request, DeliveryStatus status, const char* reply);

    EngineConfig config_;
    events::EventBus& bus_;

    TransferState state_;
    CorrelationManager correlation_;
    FolderExpander expander_;
    BlockPipeline pipeline_;

    events::ThreadSafeQueue<Wake> wakeups_;
    std::thread worker_;
    std::atomic<bool> running_{false};
};

} // namespace cirrus::transfer
