/**
 * @file block_pipeline.hpp
 * @brief Chunked encrypt-and-upload of one file
 *
 * PER BLOCK (strictly in index order):
 *   seek(index * block_size) -> read -> hash plaintext (whole file)
 *   -> AES-256-GCM(block_nonce(index)) -> PUT with retries
 *   -> SHA-256(ciphertext) -> block-complete (once per block key)
 *   -> throughput sample -> transfer-progress
 *
 * After the last block a finalize-transfer request carries the plaintext
 * hash. The item stays active until finalize-transfer-complete arrives.
 */

#pragma once

#include "cirrus/core/config.hpp"
#include "cirrus/core/error.hpp"
#include "cirrus/crypto/cipher.hpp"
#include "cirrus/events/event_bus.hpp"
#include "cirrus/network/upload_client.hpp"
#include "cirrus/transfer/correlation.hpp"
#include "cirrus/transfer/state.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cirrus::transfer {

enum class FileOutcome {
    AwaitingFinalize,   ///< All blocks uploaded, finalize requested
    Paused,             ///< Interrupted by pause, item back at the queue head
    Cancelled,          ///< No longer active, cancellation already reported
    Replayed,           ///< Already initialised, nothing re-emitted
    Skipped             ///< Already terminal
};

class BlockPipeline {
public:
    BlockPipeline(const EngineConfig& config,
                  TransferState& state,
                  CorrelationManager& correlation,
                  events::EventBus& bus,
                  network::UploadClient& uploader);

    TransferResult<FileOutcome> transfer(const QueueItem& file);

    /**
     * @brief Check negotiated parameters against a file of the given size
     *
     * Sorts upload_urls by index and accepts them only when they number
     * exactly 0..n-1 for n = ceil(size / block_size), with a block size
     * the cipher can seal in one call.
     */
    static Result<void, TransferError> check_block_layout(UploadUrlsResponse& params, std::uint64_t size);

private:
    TransferResult<FileOutcome> interrupted(const QueueItem& file);

    Result<void, TransferError> upload_thumbnail(const QueueItem& file,
                                                 const ThumbnailTarget& target,
                                                 const crypto::ContentCipher& cipher);

    Result<void, TransferError> upload_with_retry(const QueueItem& file,
                                                  const std::string& url,
                                                  const std::vector<std::uint8_t>& body,
                                                  std::chrono::seconds timeout);

    const EngineConfig& config_;
    TransferState& state_;
    CorrelationManager& correlation_;
    events::EventBus& bus_;
    network::UploadClient& uploader_;
};

} // namespace cirrus::transfer
