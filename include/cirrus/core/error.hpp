#pragma once

#include "cirrus/core/result.hpp"

#include <string>

namespace cirrus {

/**
 * @brief Failure classes of the transfer engine
 *
 * Every class is fatal for the item it happens to, never for the engine.
 */
enum class ErrorKind {
    Validation,   ///< Bad path, wrong item type, empty file
    Negotiation,  ///< Orchestration service answered with an error
    Timeout,      ///< No reply within the negotiation timeout
    Crypto,       ///< Key decode, key length, cipher failure
    Io,           ///< Open, seek or read failure
    Upload,       ///< Transport error or non-2xx after all retries
    Cancelled,    ///< Cancelled by the user
    Orphaned      ///< Reply slot purged by the stuck-request sweep
};

const char* to_string(ErrorKind kind) noexcept;

struct TransferError {
    ErrorKind kind = ErrorKind::Io;
    std::string message;

    TransferError() = default;
    TransferError(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}
};

template<typename T>
using TransferResult = Result<T, TransferError>;

inline Result<void, TransferError> Fail(ErrorKind kind, std::string message) {
    return Result<void, TransferError>(ErrValue<TransferError>(TransferError{kind, std::move(message)}));
}

template<typename T>
TransferResult<T> Fail(ErrorKind kind, std::string message) {
    return Err<T, TransferError>(TransferError{kind, std::move(message)});
}

} // namespace cirrus
