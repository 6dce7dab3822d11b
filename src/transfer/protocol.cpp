#include "cirrus/transfer/protocol.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

namespace cirrus::transfer::protocol {
namespace {

std::int64_t unix_millis(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

json envelope(const char* type, json payload, std::chrono::system_clock::time_point timestamp) {
    return json{
        {"type", type},
        {"timestamp", unix_millis(timestamp)},
        {"payload", std::move(payload)}
    };
}

template<typename T>
json optional_value(const std::optional<T>& value) {
    return value.has_value() ? json(*value) : json(nullptr);
}

const char* outcome_name(events::TransferOutcome outcome) {
    return outcome == events::TransferOutcome::Completed ? "completed" : "failed";
}

std::string string_field(const json& message, const char* key) {
    return message.at(key).get<std::string>();
}

std::vector<std::string> string_list(const json& message, const char* key) {
    std::vector<std::string> values;
    if (!message.contains(key)) {
        return values;
    }
    for (const auto& entry : message.at(key)) {
        values.push_back(entry.get<std::string>());
    }
    return values;
}

std::string string_or_empty(const json& message, const char* key) {
    if (!message.contains(key) || message.at(key).is_null()) {
        return {};
    }
    return message.at(key).get<std::string>();
}

} // namespace

// ──────────────────────────────────────────────────────────
// Outbound
// ──────────────────────────────────────────────────────────

json encode(const events::InitFileUploadRequested& event) {
    return envelope("init-file-upload", {
        {"id", event.id},
        {"name", event.name},
        {"path", event.path},
        {"parent_id", event.parent_id},
        {"share_id", event.share_id},
        {"size", event.size},
        {"xattrs", optional_value(event.xattrs)},
        {"mime_type", event.mime_type},
        {"modified_date", optional_value(event.modified_date)},
        {"needs_thumbnail", event.needs_thumbnail}
    }, event.timestamp);
}

json encode(const events::CreateFolderRequested& event) {
    return envelope("create-folder", {
        {"id", event.id},
        {"name", event.name},
        {"path", event.path},
        {"parent_id", event.parent_id},
        {"share_id", event.share_id}
    }, event.timestamp);
}

json encode(const events::BlockCompleted& event) {
    return envelope("block-complete", {
        {"block_id", event.block_id},
        {"hash", event.hash},
        {"index", event.index},
        {"file_id", event.file_id}
    }, event.timestamp);
}

json encode(const events::ThumbnailCompleted& event) {
    return envelope("thumbnail-complete", {
        {"thumbnail_id", event.thumbnail_id},
        {"hash", event.hash},
        {"size", event.size}
    }, event.timestamp);
}

json encode(const events::FinalizeTransferRequested& event) {
    return envelope("finalize-transfer", {
        {"id", event.id},
        {"name", event.name},
        {"size", event.size},
        {"content_hash", event.content_hash},
        {"file_id", event.file_id},
        {"parent_id", event.parent_id},
        {"revision_id", event.revision_id}
    }, event.timestamp);
}

json encode(const events::TransferProgressed& event) {
    json payload = {
        {"id", event.id},
        {"name", event.name},
        {"type", to_string(event.kind)},
        {"progress", event.progress},
        {"status", event.status}
    };
    if (event.message) {
        payload["message"] = *event.message;
    }
    if (event.speed) {
        payload["speed"] = *event.speed;
    }
    if (event.remaining_time) {
        payload["remaining_time"] = *event.remaining_time;
    }
    if (event.size) {
        payload["size"] = *event.size;
    }
    return envelope("transfer-progress", std::move(payload), event.timestamp);
}

json encode(const events::TransferFinished& event) {
    json payload = {
        {"id", event.id},
        {"name", event.name},
        {"status", outcome_name(event.status)},
        {"message", event.message}
    };
    if (event.file_id) {
        payload["file_id"] = *event.file_id;
    }
    if (event.parent_id) {
        payload["parent_id"] = *event.parent_id;
    }
    return envelope("transfer-complete", std::move(payload), event.timestamp);
}

json encode(const events::TransferRejected& event) {
    return envelope("transfer-error", {{"message", event.message}}, event.timestamp);
}

json encode(const QueueStatus& status) {
    return json{
        {"queue_size", status.queue_size},
        {"processing", optional_value(status.processing)},
        {"completed", status.completed},
        {"failed", status.failed},
        {"paused", status.paused},
        {"elapsed_time", status.elapsed_secs},
        {"pending_folders", status.pending_folders}
    };
}

json encode(const DetailedQueueStatus& status) {
    json result = encode(status.summary);

    json items = json::array();
    for (const auto& item : status.queue_items) {
        items.push_back({
            {"id", item.id},
            {"type", to_string(item.kind)},
            {"name", item.name},
            {"depth", item.depth},
            {"parent_id", item.parent_id}
        });
    }
    result["queue_items"] = std::move(items);
    result["pending_folder_paths"] = status.pending_folders;
    result["folder_mappings"] = status.folder_mappings;
    result["initialized_files_count"] = status.initialized_files;
    result["initialized_folders_count"] = status.initialized_folders;
    result["block_completion_sent_count"] = status.block_notices;
    result["outstanding_requests"] = status.outstanding_requests;
    return result;
}

json encode(const HealthReport& report) {
    return json{
        {"status", report.status},
        {"timestamp", report.timestamp},
        {"version", report.version}
    };
}

json encode(const StuckCleanupReport& report) {
    return json{
        {"cleaned_count", report.cleaned_count},
        {"cleaned_ids", report.cleaned_ids}
    };
}

json encode(const RepairReport& report) {
    return json{{"repaired_count", report.repaired_count}};
}

json command_result(const std::string& command, json result) {
    return json{
        {"type", "command-result"},
        {"command", command},
        {"result", std::move(result)}
    };
}

// ──────────────────────────────────────────────────────────
// Inbound
// ──────────────────────────────────────────────────────────

Result<UploadUrlsResponse> parse_upload_urls(const json& response) {
    try {
        UploadUrlsResponse parsed;
        parsed.file_id = string_field(response, "file_id");
        parsed.revision_id = string_or_empty(response, "revision_id");
        parsed.total_blocks = response.at("total_blocks").get<std::uint64_t>();
        parsed.block_size = response.at("block_size").get<std::uint64_t>();
        parsed.content_key = string_field(response, "content_key");

        for (const auto& entry : response.at("upload_urls")) {
            PresignedUrl url;
            url.url = string_field(entry, "url");
            url.block_id = string_field(entry, "block_id");
            url.index = entry.at("index").get<std::uint64_t>();
            url.expires_in = entry.value("expires_in", std::uint64_t{0});
            parsed.upload_urls.push_back(std::move(url));
        }

        if (response.contains("thumbnail") && !response.at("thumbnail").is_null()) {
            const auto& thumb = response.at("thumbnail");
            ThumbnailTarget target;
            target.id = string_field(thumb, "id");
            target.url = string_field(thumb, "url");
            target.expires_in = thumb.value("expires_in", std::uint64_t{0});
            target.content_key = string_or_empty(thumb, "content_key");
            parsed.thumbnail = std::move(target);
        }
        return Ok(std::move(parsed));
    } catch (const json::exception& e) {
        return Err<UploadUrlsResponse>(std::string("Malformed upload-urls-response: ") + e.what());
    }
}

Result<FinalizeOutcome> parse_finalize_complete(const json& message) {
    try {
        FinalizeOutcome outcome;
        outcome.transfer_id = string_field(message, "transfer_id");
        outcome.file_id = string_or_empty(message, "file_id");
        outcome.parent_id = string_or_empty(message, "parent_id");
        outcome.success = message.value("success", false);
        if (message.contains("error") && !message.at("error").is_null()) {
            outcome.error = message.at("error").get<std::string>();
        }
        return Ok(std::move(outcome));
    } catch (const json::exception& e) {
        return Err<FinalizeOutcome>(std::string("Malformed finalize-transfer-complete: ") + e.what());
    }
}

Result<std::optional<json>> MessageDispatcher::dispatch_line(const std::string& line) {
    json message = json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        return Err<std::optional<json>>(std::string("Invalid JSON input"));
    }
    return dispatch(message);
}

Result<std::optional<json>> MessageDispatcher::dispatch(const json& message) {
    if (!message.is_object() || !message.contains("type") || !message.at("type").is_string()) {
        return Err<std::optional<json>>(std::string("Message has no string 'type' field"));
    }
    const std::string type = message.at("type").get<std::string>();
    try {
        return dispatch_checked(type, message);
    } catch (const json::exception& e) {
        return Err<std::optional<json>>("Malformed " + type + ": " + e.what());
    }
}

Result<std::optional<json>> MessageDispatcher::dispatch_checked(const std::string& type, const json& message) {
    using Reply = std::optional<json>;

    // ────────────────────────────────────────
    // Replies from the orchestration service
    // ────────────────────────────────────────
    if (type == "upload-urls-response") {
        const std::string transfer_id = string_field(message, "transfer_id");
        auto parsed = message.contains("response")
            ? parse_upload_urls(message.at("response"))
            : Err<UploadUrlsResponse>(std::string("Malformed upload-urls-response: missing 'response'"));
        if (parsed.is_error()) {
            // The waiting transfer fails now instead of at its negotiation timeout
            engine_.on_upload_error(transfer_id, parsed.error());
            return Err<Reply>(parsed.error());
        }
        engine_.on_upload_urls(transfer_id, std::move(parsed.value()));
        return Ok(Reply{});
    }
    if (type == "upload-error-response") {
        engine_.on_upload_error(string_field(message, "transfer_id"), string_field(message, "error"));
        return Ok(Reply{});
    }
    if (type == "folder-created-response") {
        FolderResponse response;
        response.folder_id = string_field(message.at("response"), "folder_id");
        engine_.on_folder_created(string_field(message, "transfer_id"), std::move(response));
        return Ok(Reply{});
    }
    if (type == "folder-error-response") {
        engine_.on_folder_error(string_field(message, "transfer_id"), string_field(message, "error"));
        return Ok(Reply{});
    }
    if (type == "finalize-transfer-complete") {
        auto parsed = parse_finalize_complete(message);
        if (parsed.is_error()) {
            return Err<Reply>(parsed.error());
        }
        engine_.on_finalize_complete(parsed.value());
        return Ok(Reply{});
    }
    if (type == "thumbnail-complete") {
        spdlog::info("[ThumbnailAcknowledged] thumbnail={}", message.value("thumbnail_id", std::string()));
        return Ok(Reply{});
    }

    // ────────────────────────────────────────
    // Commands
    // ────────────────────────────────────────
    if (type == "select-files" || type == "select-folders") {
        const auto paths = string_list(message, "paths");
        const auto share_id = string_or_empty(message, "share_id");
        const auto parent_id = string_or_empty(message, "parent_id");
        const auto ids = type == "select-files"
            ? engine_.select_files(paths, share_id, parent_id)
            : engine_.select_folders(paths, share_id, parent_id);
        return Ok(Reply{command_result(type, json{{"queued", ids}})});
    }
    if (type == "pause") {
        engine_.pause();
        return Ok(Reply{command_result(type, json{{"paused", true}})});
    }
    if (type == "resume") {
        engine_.resume(string_or_empty(message, "share_id"));
        return Ok(Reply{command_result(type, json{{"paused", false}})});
    }
    if (type == "cancel") {
        const bool cancelled = engine_.cancel(string_field(message, "id"));
        return Ok(Reply{command_result(type, json{{"cancelled", cancelled}})});
    }
    if (type == "cancel-all") {
        const auto count = engine_.cancel_all();
        return Ok(Reply{command_result(type, json{{"cancelled_count", count}})});
    }
    if (type == "queue-status") {
        return Ok(Reply{command_result(type, encode(engine_.queue_status()))});
    }
    if (type == "detailed-queue-status") {
        return Ok(Reply{command_result(type, encode(engine_.detailed_status()))});
    }
    if (type == "health") {
        return Ok(Reply{command_result(type, encode(engine_.health()))});
    }
    if (type == "cleanup-stuck") {
        return Ok(Reply{command_result(type, encode(engine_.cleanup_stuck()))});
    }
    if (type == "repair-folders") {
        return Ok(Reply{command_result(type, encode(engine_.repair_folders()))});
    }

    return Err<Reply>("Unknown message type: " + type);
}

} // namespace cirrus::transfer::protocol
