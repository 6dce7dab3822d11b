#include "cirrus/core/error.hpp"

namespace cirrus {

const char* to_string(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Negotiation: return "negotiation";
        case ErrorKind::Timeout: return "timeout";
        case ErrorKind::Crypto: return "crypto";
        case ErrorKind::Io: return "io";
        case ErrorKind::Upload: return "upload";
        case ErrorKind::Cancelled: return "cancelled";
        case ErrorKind::Orphaned: return "orphaned";
    }
    return "unknown";
}

} // namespace cirrus
