#include "cirrus/transfer/folder_expander.hpp"

#include "cirrus/transfer/reporting.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace cirrus::transfer {
namespace fs = std::filesystem;

namespace {

bool by_name(const QueueItem& lhs, const QueueItem& rhs) {
    return lhs.name < rhs.name;
}

} // namespace

FolderExpander::FolderExpander(const EngineConfig& config,
                               TransferState& state,
                               CorrelationManager& correlation,
                               events::EventBus& bus)
    : config_(config)
    , state_(state)
    , correlation_(correlation)
    , bus_(bus) {}

TransferResult<FolderOutcome> FolderExpander::expand(const QueueItem& folder) {
    std::error_code ec;
    if (!fs::is_directory(folder.path, ec)) {
        return Fail<FolderOutcome>(ErrorKind::Validation, "Not a directory: " + folder.path);
    }

    switch (state_.begin_folder(folder.id)) {
        case BeginOutcome::Terminal:
            spdlog::debug("[FolderSkipped] id={} already terminal", folder.id);
            return Ok<FolderOutcome, TransferError>(FolderOutcome::Skipped);
        case BeginOutcome::Replay:
            spdlog::info("[FolderReplay] id={} creation already requested", folder.id);
            return Ok<FolderOutcome, TransferError>(FolderOutcome::Replayed);
        case BeginOutcome::Fresh:
            break;
    }

    bus_.emit(progress_event(folder, 0.0f, "preparing", "Scanning folder contents..."));

    events::CreateFolderRequested request;
    request.id = folder.id;
    request.name = folder.name;
    request.path = folder.path;
    request.parent_id = state_.resolve_parent(folder);
    request.share_id = state_.session_anchor();

    spdlog::info("[FolderStarted] id={} path={} parent={}", folder.id, folder.path, request.parent_id);

    auto created = CorrelationManager::await_external(
        correlation_.folders(),
        folder.id,
        [&]() {
            state_.record_request(folder.id, RequestKind::FolderCreation, Clock::now());
            bus_.emit(request);
        },
        config_.negotiation_timeout,
        "Timeout waiting for folder creation");
    state_.clear_request(folder.id, RequestKind::FolderCreation);

    if (created.is_error()) {
        return Err<FolderOutcome, TransferError>(created.error());
    }
    if (!state_.is_active(folder.id)) {
        spdlog::info("[FolderSkipped] id={} no longer active", folder.id);
        return Ok<FolderOutcome, TransferError>(FolderOutcome::Skipped);
    }

    const std::string& server_id = created.value().folder_id;
    if (server_id.empty()) {
        return Fail<FolderOutcome>(ErrorKind::Negotiation, "Folder creation returned an empty folder id");
    }
    state_.map_folder(folder.path, server_id);

    auto children = scan_children(folder, server_id);
    if (children.is_error()) {
        return Err<FolderOutcome, TransferError>(children.error());
    }

    auto& listing = children.value();
    const std::size_t file_count = listing.files.size();
    const std::size_t folder_count = listing.folders.size();

    bus_.emit(progress_event(folder, 0.3f, "processing",
        "Found " + std::to_string(file_count) + " files and " + std::to_string(folder_count) + " subfolders"));

    std::vector<QueueItem> block = std::move(listing.files);
    block.insert(block.end(),
                 std::make_move_iterator(listing.folders.begin()),
                 std::make_move_iterator(listing.folders.end()));
    state_.insert_front(std::move(block));

    if (!state_.complete(folder.id)) {
        // Cancelled between the reply and now; the children stay queued
        return Ok<FolderOutcome, TransferError>(FolderOutcome::Skipped);
    }

    spdlog::info("[FolderCreated] id={} server_id={} files={} subfolders={}",
        folder.id, server_id, file_count, folder_count);

    bus_.emit(progress_event(folder, 1.0f, "completed", "Folder processing complete, starting contents..."));

    events::TransferFinished finished;
    finished.id = folder.id;
    finished.name = folder.name;
    finished.status = events::TransferOutcome::Completed;
    finished.message = "Folder created successfully";
    finished.parent_id = request.parent_id;
    bus_.emit(finished);

    return Ok<FolderOutcome, TransferError>(FolderOutcome::Expanded);
}

TransferResult<FolderChildren> FolderExpander::scan_children(const QueueItem& folder, const std::string& server_folder_id) {
    FolderChildren children;
    std::error_code ec;
    fs::directory_iterator it(folder.path, ec);
    if (ec) {
        return Fail<FolderChildren>(ErrorKind::Io, "Failed to read directory " + folder.path + ": " + ec.message());
    }

    for (const fs::directory_iterator end; it != end; it.increment(ec)) {
        if (ec) {
            return Fail<FolderChildren>(ErrorKind::Io, "Failed to read directory " + folder.path + ": " + ec.message());
        }

        const auto& entry = *it;
        std::error_code type_ec;
        const bool is_dir = entry.is_directory(type_ec);
        const bool is_file = !is_dir && entry.is_regular_file(type_ec);
        if (!is_dir && !is_file) {
            continue;
        }

        QueueItem child;
        child.kind = is_dir ? ItemKind::Folder : ItemKind::File;
        child.id = generate_transfer_id();
        child.path = entry.path().string();
        child.name = entry.path().filename().string();
        child.parent_id = server_folder_id;
        child.depth = folder.depth + 1;

        (is_dir ? children.folders : children.files).push_back(std::move(child));
    }
    if (ec) {
        return Fail<FolderChildren>(ErrorKind::Io, "Failed to read directory " + folder.path + ": " + ec.message());
    }

    std::sort(children.files.begin(), children.files.end(), by_name);
    std::sort(children.folders.begin(), children.folders.end(), by_name);
    return Ok<FolderChildren, TransferError>(std::move(children));
}

} // namespace cirrus::transfer
