/**
 * @file components.hpp
 * @brief Ready-made subscribers for the engine's outbound events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * TransferEngine engine(config, bus, uploader);
 */

#pragma once

#include "cirrus/events/event_bus.hpp"
#include "cirrus/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace cirrus::events {

/**
 * @brief Logs every outbound message
 *
 * Per-block and progress traffic goes to debug, lifecycle to info,
 * failures to warn.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<InitFileUploadRequested>([this](const InitFileUploadRequested& e) {
            on_init_file_upload(e);
        });

        bus_.subscribe<CreateFolderRequested>([this](const CreateFolderRequested& e) {
            on_create_folder(e);
        });

        bus_.subscribe<BlockCompleted>([this](const BlockCompleted& e) {
            on_block_completed(e);
        });

        bus_.subscribe<ThumbnailCompleted>([this](const ThumbnailCompleted& e) {
            on_thumbnail_completed(e);
        });

        bus_.subscribe<FinalizeTransferRequested>([this](const FinalizeTransferRequested& e) {
            on_finalize_requested(e);
        });

        bus_.subscribe<TransferProgressed>([this](const TransferProgressed& e) {
            on_progress(e);
        });

        bus_.subscribe<TransferFinished>([this](const TransferFinished& e) {
            on_finished(e);
        });

        bus_.subscribe<TransferRejected>([this](const TransferRejected& e) {
            on_rejected(e);
        });
    }

private:
    void on_init_file_upload(const InitFileUploadRequested& e) {
        spdlog::info("[InitFileUpload] id={} name={} size={} mime={} parent={} thumbnail={}",
            e.id, e.name, e.size, e.mime_type, e.parent_id, e.needs_thumbnail);
    }

    void on_create_folder(const CreateFolderRequested& e) {
        spdlog::info("[CreateFolder] id={} name={} parent={}", e.id, e.name, e.parent_id);
    }

    void on_block_completed(const BlockCompleted& e) {
        spdlog::debug("[BlockCompleted] file={} block={} index={} hash={}",
            e.file_id, e.block_id, e.index, e.hash);
    }

    void on_thumbnail_completed(const ThumbnailCompleted& e) {
        spdlog::info("[ThumbnailCompleted] thumbnail={} size={} hash={}", e.thumbnail_id, e.size, e.hash);
    }

    void on_finalize_requested(const FinalizeTransferRequested& e) {
        spdlog::info("[FinalizeTransfer] id={} file={} revision={} size={} hash={}",
            e.id, e.file_id, e.revision_id, e.size, e.content_hash);
    }

    void on_progress(const TransferProgressed& e) {
        spdlog::debug("[Progress] id={} {} status={} progress={:.3f} {}",
            e.id, transfer::to_string(e.kind), e.status, e.progress, e.message.value_or(""));
    }

    void on_finished(const TransferFinished& e) {
        if (e.status == TransferOutcome::Completed) {
            spdlog::info("[TransferComplete] id={} name={} message={}", e.id, e.name, e.message);
        } else {
            spdlog::warn("[TransferFailed] id={} name={} message={}", e.id, e.name, e.message);
        }
    }

    void on_rejected(const TransferRejected& e) {
        spdlog::warn("[TransferRejected] {}", e.message);
    }

    EventBus& bus_;
};

/**
 * @brief Counts transfer outcomes for status displays
 *
 * USAGE:
 * MetricsComponent metrics(bus);
 * // Later...
 * metrics.print_stats();
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> files_completed{0};
        std::atomic<uint64_t> folders_created{0};
        std::atomic<uint64_t> items_failed{0};
        std::atomic<uint64_t> blocks_uploaded{0};
        std::atomic<uint64_t> bytes_uploaded{0};
        std::atomic<uint64_t> thumbnails_uploaded{0};
        std::atomic<uint64_t> selections_rejected{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<BlockCompleted>([this](const BlockCompleted& e) {
            stats_.blocks_uploaded++;
            stats_.bytes_uploaded += e.bytes;
        });

        bus_.subscribe<ThumbnailCompleted>([this](const ThumbnailCompleted&) {
            stats_.thumbnails_uploaded++;
        });

        bus_.subscribe<TransferFinished>([this](const TransferFinished& e) {
            on_finished(e);
        });

        bus_.subscribe<TransferRejected>([this](const TransferRejected&) {
            stats_.selections_rejected++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Transfer Statistics:");
        spdlog::info("  Files completed:     {}", stats_.files_completed.load());
        spdlog::info("  Folders created:     {}", stats_.folders_created.load());
        spdlog::info("  Items failed:        {}", stats_.items_failed.load());
        spdlog::info("  Blocks uploaded:     {}", stats_.blocks_uploaded.load());
        spdlog::info("  Bytes uploaded:      {}", stats_.bytes_uploaded.load());
        spdlog::info("  Thumbnails uploaded: {}", stats_.thumbnails_uploaded.load());
        spdlog::info("  Rejected selections: {}", stats_.selections_rejected.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    void on_finished(const TransferFinished& e) {
        if (e.status == TransferOutcome::Failed) {
            stats_.items_failed++;
        } else if (e.file_id.has_value()) {
            stats_.files_completed++;
        } else {
            stats_.folders_created++;
        }
    }

    EventBus& bus_;
    Stats stats_;
};

} // namespace cirrus::events
