#include "cirrus/transfer/block_pipeline.hpp"

#include "cirrus/core/platform.hpp"
#include "cirrus/crypto/digest.hpp"
#include "cirrus/media/mime.hpp"
#include "cirrus/media/thumbnail.hpp"
#include "cirrus/transfer/reporting.hpp"
#include "cirrus/transfer/throughput.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <fstream>
#include <system_error>
#include <thread>

namespace cirrus::transfer {
namespace fs = std::filesystem;

namespace {

const char* const kOctetStream = "application/octet-stream";

double seconds_since(Clock::time_point start) {
    return std::chrono::duration<double>(Clock::now() - start).count();
}

} // namespace

BlockPipeline::BlockPipeline(const EngineConfig& config,
                             TransferState& state,
                             CorrelationManager& correlation,
                             events::EventBus& bus,
                             network::UploadClient& uploader)
    : config_(config)
    , state_(state)
    , correlation_(correlation)
    , bus_(bus)
    , uploader_(uploader) {}

TransferResult<FileOutcome> BlockPipeline::transfer(const QueueItem& file) {
    const fs::path path(file.path);
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Fail<FileOutcome>(ErrorKind::Validation, "File not found: " + file.path);
    }
    if (!fs::is_regular_file(path, ec)) {
        return Fail<FileOutcome>(ErrorKind::Validation, "Not a regular file: " + file.path);
    }
    const std::uint64_t size = fs::file_size(path, ec);
    if (ec) {
        return Fail<FileOutcome>(ErrorKind::Io, "Failed to read file size: " + file.path);
    }
    if (size == 0) {
        return Fail<FileOutcome>(ErrorKind::Validation, "File is empty (0 bytes): " + file.path);
    }

    switch (state_.begin_file(file.id)) {
        case BeginOutcome::Terminal:
            spdlog::debug("[UploadSkipped] id={} already terminal", file.id);
            return Ok<FileOutcome, TransferError>(FileOutcome::Skipped);
        case BeginOutcome::Replay:
            spdlog::info("[UploadReplay] id={} upload already initialised", file.id);
            return Ok<FileOutcome, TransferError>(FileOutcome::Replayed);
        case BeginOutcome::Fresh:
            break;
    }

    auto preparing = progress_event(file, 0.0f, "preparing", "Preparing upload...");
    preparing.size = size;
    bus_.emit(preparing);

    // ────────────────────────────────────────
    // Negotiate destinations and the content key
    // ────────────────────────────────────────
    events::InitFileUploadRequested request;
    request.id = file.id;
    request.name = file.name;
    request.path = file.path;
    request.parent_id = state_.resolve_parent(file);
    request.share_id = state_.session_anchor();
    request.size = size;
    request.xattrs = list_extended_attributes(path);
    request.mime_type = media::mime_type_for(path);
    request.modified_date = modified_unix_seconds(path);
    request.needs_thumbnail = media::needs_thumbnail(request.mime_type, size, config_.thumbnail_max_source_bytes);

    spdlog::info("[UploadStarted] id={} name={} size={} parent={}", file.id, file.name, size, request.parent_id);

    auto negotiated = CorrelationManager::await_external(
        correlation_.upload_urls(),
        file.id,
        [&]() {
            state_.record_request(file.id, RequestKind::UploadUrls, Clock::now());
            bus_.emit(request);
        },
        config_.negotiation_timeout,
        "Timeout waiting for presigned URLs");
    state_.clear_request(file.id, RequestKind::UploadUrls);

    if (negotiated.is_error()) {
        return Err<FileOutcome, TransferError>(negotiated.error());
    }
    if (!state_.should_continue(file.id)) {
        return interrupted(file);
    }

    UploadUrlsResponse& params = negotiated.value();
    auto cipher = crypto::ContentCipher::from_base64_key(params.content_key);
    if (cipher.is_error()) {
        return Err<FileOutcome, TransferError>(cipher.error());
    }

    auto layout = check_block_layout(params, size);
    if (layout.is_error()) {
        return Err<FileOutcome, TransferError>(layout.error());
    }

    if (params.thumbnail.has_value()) {
        bus_.emit(progress_event(file, 0.02f, "uploading", "Generating thumbnail..."));
        // A thumbnail never decides the fate of the file itself
        try {
            auto thumb = upload_thumbnail(file, *params.thumbnail, cipher.value());
            if (thumb.is_error()) {
                spdlog::warn("[ThumbnailFailed] id={} reason={}", file.id, thumb.error().message);
            }
        } catch (const std::exception& e) {
            spdlog::warn("[ThumbnailFailed] id={} reason={}", file.id, e.what());
        }
    }

    // ────────────────────────────────────────
    // Blocks
    // ────────────────────────────────────────
    const auto& blocks = params.upload_urls;

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail<FileOutcome>(ErrorKind::Io, "Failed to open file");
    }

    const std::size_t total = blocks.size();
    bus_.emit(progress_event(file, 0.05f, "uploading", "Starting upload of " + std::to_string(total) + " blocks..."));

    crypto::Sha256 content_hash;
    ThroughputEstimator throughput(config_.speed_window, config_.min_useful_speed, config_.remaining_time_fallback_secs);
    std::uint64_t uploaded = 0;
    std::vector<std::uint8_t> plain;

    for (std::size_t k = 0; k < total; ++k) {
        if (!state_.should_continue(file.id)) {
            return interrupted(file);
        }

        const PresignedUrl& block = blocks[k];
        const std::uint64_t offset = block.index * params.block_size;
        const std::uint64_t length = std::min<std::uint64_t>(params.block_size, size - offset);

        input.seekg(static_cast<std::streamoff>(offset));
        if (!input) {
            return Fail<FileOutcome>(ErrorKind::Io, "Failed to seek in file");
        }
        plain.resize(static_cast<std::size_t>(length));
        input.read(reinterpret_cast<char*>(plain.data()), static_cast<std::streamsize>(length));
        if (static_cast<std::uint64_t>(input.gcount()) != length) {
            return Fail<FileOutcome>(ErrorKind::Io, "Failed to read file block");
        }
        content_hash.update(plain);

        auto sealed = cipher.value().encrypt(crypto::block_nonce(block.index), plain);
        if (sealed.is_error()) {
            return Err<FileOutcome, TransferError>(sealed.error());
        }

        const auto started = Clock::now();
        auto put = upload_with_retry(file, block.url, sealed.value(), config_.block_upload_timeout);
        if (put.is_error()) {
            return Err<FileOutcome, TransferError>(put.error());
        }
        throughput.record(length, seconds_since(started));

        const std::string block_key = block.block_id + ":" + std::to_string(block.index);
        if (state_.mark_block_notified(file.id, block_key)) {
            events::BlockCompleted done;
            done.block_id = block.block_id;
            done.hash = crypto::sha256_hex(sealed.value());
            done.index = block.index;
            done.file_id = params.file_id;
            done.bytes = length;
            bus_.emit(done);
        }

        uploaded += length;
        auto progress = progress_event(file,
            0.05f + 0.95f * static_cast<float>(static_cast<double>(uploaded) / static_cast<double>(size)),
            "uploading",
            "Uploading block " + std::to_string(k + 1) + "/" + std::to_string(total));
        progress.speed = throughput.average_speed();
        progress.remaining_time = throughput.remaining_seconds(size - uploaded);
        progress.size = size;
        bus_.emit(progress);
    }

    // ────────────────────────────────────────
    // Finalize
    // ────────────────────────────────────────
    const std::string plaintext_hash = content_hash.finish_hex();
    bus_.emit(progress_event(file, 1.0f, "processing", "Upload complete, finalizing..."));

    if (state_.mark_finalize_notified(file.id)) {
        events::FinalizeTransferRequested finalize;
        finalize.id = file.id;
        finalize.name = file.name;
        finalize.size = size;
        finalize.content_hash = plaintext_hash;
        finalize.file_id = params.file_id;
        finalize.parent_id = request.parent_id;
        finalize.revision_id = params.revision_id;

        spdlog::info("[UploadFinalizing] id={} file={} blocks={} hash={}", file.id, params.file_id, total, plaintext_hash);
        state_.record_request(file.id, RequestKind::Finalize, Clock::now());
        bus_.emit(finalize);
    }
    return Ok<FileOutcome, TransferError>(FileOutcome::AwaitingFinalize);
}

Result<void, TransferError> BlockPipeline::check_block_layout(UploadUrlsResponse& params, std::uint64_t size) {
    if (params.block_size == 0) {
        return Fail(ErrorKind::Negotiation, "Invalid block size 0 in upload parameters");
    }
    if (params.block_size > crypto::kMaxPlaintextSize) {
        return Fail(ErrorKind::Negotiation,
            "Block size " + std::to_string(params.block_size) + " exceeds the encryptable maximum");
    }

    const std::uint64_t expected_blocks = size / params.block_size + (size % params.block_size != 0 ? 1 : 0);
    if (params.upload_urls.size() != expected_blocks) {
        return Fail(ErrorKind::Negotiation,
            "Upload parameters cover " + std::to_string(params.upload_urls.size()) +
            " blocks, file needs " + std::to_string(expected_blocks));
    }

    // After sorting, position k must carry index k: no gaps, no duplicates
    auto& blocks = params.upload_urls;
    std::sort(blocks.begin(), blocks.end(), [](const PresignedUrl& lhs, const PresignedUrl& rhs) {
        return lhs.index < rhs.index;
    });
    for (std::size_t k = 0; k < blocks.size(); ++k) {
        if (blocks[k].index != k) {
            return Fail(ErrorKind::Negotiation,
                "Upload parameters must number blocks 0.." + std::to_string(expected_blocks - 1) +
                ", found index " + std::to_string(blocks[k].index) + " at position " + std::to_string(k));
        }
    }
    return Ok<TransferError>();
}

TransferResult<FileOutcome> BlockPipeline::interrupted(const QueueItem& file) {
    if (state_.requeue_front(file.id)) {
        spdlog::info("[UploadPaused] id={} returned to the queue head", file.id);
        return Ok<FileOutcome, TransferError>(FileOutcome::Paused);
    }
    spdlog::info("[UploadStopped] id={} no longer active", file.id);
    return Ok<FileOutcome, TransferError>(FileOutcome::Cancelled);
}

Result<void, TransferError> BlockPipeline::upload_thumbnail(const QueueItem& file,
                                                            const ThumbnailTarget& target,
                                                            const crypto::ContentCipher& cipher) {
    auto jpeg = media::generate_thumbnail(file.path,
                                          config_.thumbnail_max_dimension,
                                          config_.thumbnail_jpeg_quality,
                                          config_.thumbnail_max_source_pixels);
    if (jpeg.is_error()) {
        return Fail(ErrorKind::Io, "Thumbnail generation failed: " + jpeg.error());
    }

    auto sealed = cipher.encrypt(crypto::thumbnail_nonce(config_.thumbnail_nonce), jpeg.value());
    if (sealed.is_error()) {
        return Fail(ErrorKind::Crypto, "Failed to encrypt thumbnail");
    }

    auto put = upload_with_retry(file, target.url, sealed.value(), config_.thumbnail_upload_timeout);
    if (put.is_error()) {
        return put;
    }

    events::ThumbnailCompleted done;
    done.thumbnail_id = target.id;
    done.hash = crypto::sha256_hex(sealed.value());
    done.size = sealed.value().size();
    bus_.emit(done);

    spdlog::info("[ThumbnailUploaded] id={} thumbnail={} bytes={}", file.id, target.id, done.size);
    return Ok<TransferError>();
}

Result<void, TransferError> BlockPipeline::upload_with_retry(const QueueItem& file,
                                                             const std::string& url,
                                                             const std::vector<std::uint8_t>& body,
                                                             std::chrono::seconds timeout) {
    const std::uint32_t attempts = config_.max_upload_attempts;
    std::string last_error;

    for (std::uint32_t attempt = 1; attempt <= attempts; ++attempt) {
        auto response = uploader_.put(url, body, kOctetStream, timeout);
        if (response.is_ok() && network::is_success_status(response.value())) {
            return Ok<TransferError>();
        }

        last_error = response.is_ok()
            ? "HTTP status " + std::to_string(response.value())
            : response.error();
        spdlog::warn("[UploadRetry] id={} attempt={}/{} error={}", file.id, attempt, attempts, last_error);

        if (attempt < attempts) {
            std::this_thread::sleep_for(config_.retry_backoff_step * attempt);
        }
    }

    return Fail(ErrorKind::Upload,
        "Upload failed after " + std::to_string(attempts) + " retries: " + last_error);
}

} // namespace cirrus::transfer
