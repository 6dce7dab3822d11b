/**
 * @file events.hpp
 * @brief Outbound messages of the transfer engine
 *
 * Each struct is one message kind of the channel towards the orchestration
 * service. Requests are named after what they ask for, notifications are
 * past tense.
 */

#pragma once

#include "cirrus/transfer/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace cirrus::events {

using transfer::ItemKind;

// ════════════════════════════════════════════════════════
// Negotiation requests
// ════════════════════════════════════════════════════════

/**
 * @brief Ask for block destinations and a content key for one file
 *
 * Answered by upload-urls-response or upload-error-response.
 */
struct InitFileUploadRequested {
    std::string id;
    std::string name;
    std::string path;
    std::string parent_id;
    std::string share_id;
    std::uint64_t size = 0;
    std::optional<std::string> xattrs;
    std::string mime_type;
    std::optional<std::uint64_t> modified_date;
    bool needs_thumbnail = false;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Ask for a server-side folder
 *
 * Answered by folder-created-response or folder-error-response.
 */
struct CreateFolderRequested {
    std::string id;
    std::string name;
    std::string path;
    std::string parent_id;
    std::string share_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Ask the service to record the content hash of an uploaded file
 *
 * Answered by finalize-transfer-complete.
 */
struct FinalizeTransferRequested {
    std::string id;
    std::string name;
    std::uint64_t size = 0;
    std::string content_hash;   ///< SHA-256 of the plaintext
    std::string file_id;
    std::string parent_id;
    std::string revision_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Upload notifications
// ════════════════════════════════════════════════════════

struct BlockCompleted {
    std::string block_id;
    std::string hash;           ///< SHA-256 of the ciphertext
    std::uint64_t index = 0;
    std::string file_id;
    std::uint64_t bytes = 0;    ///< Plaintext bytes covered by the block
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct ThumbnailCompleted {
    std::string thumbnail_id;
    std::string hash;
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

// ════════════════════════════════════════════════════════
// Status reporting
// ════════════════════════════════════════════════════════

struct TransferProgressed {
    std::string id;
    std::string name;
    ItemKind kind = ItemKind::File;
    float progress = 0.0f;      ///< [0, 1]
    std::string status;         ///< preparing | uploading | processing | completed | failed
    std::optional<std::string> message;
    std::optional<double> speed;                    ///< bytes/s
    std::optional<std::uint64_t> remaining_time;    ///< seconds
    std::optional<std::uint64_t> size;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

enum class TransferOutcome {
    Completed,
    Failed
};

struct TransferFinished {
    std::string id;
    std::string name;
    TransferOutcome status = TransferOutcome::Completed;
    std::string message;
    std::optional<std::string> file_id;
    std::optional<std::string> parent_id;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/// Selection-time validation failure, no item was queued
struct TransferRejected {
    std::string message;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace cirrus::events
