/**
 * @file protocol.hpp
 * @brief JSON messages exchanged with the orchestration service
 *
 * OUTBOUND (one object per line):
 *   {"type": "<event>", "payload": {...}}
 *   {"type": "command-result", "command": "<name>", "result": {...}}
 *
 * INBOUND:
 *   {"type": "<reply or command>", ...fields}
 *
 * Replies: upload-urls-response, upload-error-response,
 * folder-created-response, folder-error-response,
 * finalize-transfer-complete, thumbnail-complete.
 *
 * Commands: select-files, select-folders, pause, resume, cancel,
 * cancel-all, queue-status, detailed-queue-status, health, cleanup-stuck,
 * repair-folders.
 */

#pragma once

#include "cirrus/core/result.hpp"
#include "cirrus/events/events.hpp"
#include "cirrus/transfer/engine.hpp"
#include "cirrus/transfer/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace cirrus::transfer::protocol {

using json = nlohmann::json;

// ════════════════════════════════════════════════════════
// Outbound
// ════════════════════════════════════════════════════════

json encode(const events::InitFileUploadRequested& event);
json encode(const events::CreateFolderRequested& event);
json encode(const events::BlockCompleted& event);
json encode(const events::ThumbnailCompleted& event);
json encode(const events::FinalizeTransferRequested& event);
json encode(const events::TransferProgressed& event);
json encode(const events::TransferFinished& event);
json encode(const events::TransferRejected& event);

json encode(const QueueStatus& status);
json encode(const DetailedQueueStatus& status);
json encode(const HealthReport& report);
json encode(const StuckCleanupReport& report);
json encode(const RepairReport& report);

json command_result(const std::string& command, json result);

// ════════════════════════════════════════════════════════
// Inbound
// ════════════════════════════════════════════════════════

/// The "response" object of an upload-urls-response
Result<UploadUrlsResponse> parse_upload_urls(const json& response);

Result<FinalizeOutcome> parse_finalize_complete(const json& message);

/**
 * @brief Routes inbound messages to an engine
 *
 * dispatch() never throws. A malformed message is reported as an error
 * and leaves the engine untouched.
 *
 * RETURNS:
 * A command-result object for commands, nullopt for replies.
 */
class MessageDispatcher {
public:
    explicit MessageDispatcher(TransferEngine& engine) : engine_(engine) {}

    Result<std::optional<json>> dispatch_line(const std::string& line);
    Result<std::optional<json>> dispatch(const json& message);

private:
    Result<std::optional<json>> dispatch_checked(const std::string& type, const json& message);

    TransferEngine& engine_;
};

} // namespace cirrus::transfer::protocol
