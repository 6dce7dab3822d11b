#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace cirrus::transfer {

enum class ItemKind {
    File,
    Folder
};

const char* to_string(ItemKind kind) noexcept;

/// "transfer-<unix millis>-<random 64-bit hex>"
std::string generate_transfer_id();

/**
 * @brief One unit of work in the transfer queue
 *
 * Immutable once created. parent_id is either a server folder id or the
 * caller-supplied destination id for top-level selections.
 */
struct QueueItem {
    ItemKind kind = ItemKind::File;
    std::string id;
    std::string path;        ///< Absolute local path, no trailing separator
    std::string name;
    std::string parent_id;
    std::size_t depth = 0;   ///< Informational only
};

/**
 * @brief Pre-authorised destination for one encrypted block
 */
struct PresignedUrl {
    std::string url;
    std::string block_id;
    std::uint64_t index = 0;
    std::uint64_t expires_in = 0;
};

struct ThumbnailTarget {
    std::string id;
    std::string url;
    std::uint64_t expires_in = 0;
    std::string content_key;
};

/**
 * @brief Upload parameters negotiated for one file
 */
struct UploadUrlsResponse {
    std::string file_id;
    std::string revision_id;
    std::uint64_t total_blocks = 0;
    std::uint64_t block_size = 0;
    std::vector<PresignedUrl> upload_urls;
    std::string content_key;                    ///< base64, 32 raw bytes
    std::optional<ThumbnailTarget> thumbnail;
};

struct FolderResponse {
    std::string folder_id;
};

/**
 * @brief Content verification result reported after finalize-transfer
 */
struct FinalizeOutcome {
    std::string transfer_id;
    std::string file_id;
    std::string parent_id;
    bool success = false;
    std::optional<std::string> error;
};

struct QueuedItemSummary {
    std::string id;
    ItemKind kind = ItemKind::File;
    std::string name;
    std::size_t depth = 0;
    std::string parent_id;
};

struct QueueStatus {
    std::size_t queue_size = 0;
    std::optional<std::string> processing;
    std::size_t completed = 0;
    std::size_t failed = 0;
    bool paused = false;
    std::uint64_t elapsed_secs = 0;
    std::size_t pending_folders = 0;
};

struct DetailedQueueStatus {
    QueueStatus summary;
    std::vector<QueuedItemSummary> queue_items;
    std::vector<std::string> pending_folders;
    std::map<std::string, std::string> folder_mappings;
    std::size_t initialized_files = 0;
    std::size_t initialized_folders = 0;
    std::size_t block_notices = 0;
    std::size_t outstanding_requests = 0;
};

struct StuckCleanupReport {
    std::size_t cleaned_count = 0;
    std::vector<std::string> cleaned_ids;
};

struct RepairReport {
    std::size_t repaired_count = 0;
};

struct HealthReport {
    std::string status;
    std::int64_t timestamp = 0;
    std::string version;
};

} // namespace cirrus::transfer
