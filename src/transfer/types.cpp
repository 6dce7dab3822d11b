#include "cirrus/transfer/types.hpp"

#include <chrono>
#include <cstdio>
#include <random>

namespace cirrus::transfer {

const char* to_string(ItemKind kind) noexcept {
    switch (kind) {
        case ItemKind::File: return "file";
        case ItemKind::Folder: return "folder";
    }
    return "unknown";
}

std::string generate_transfer_id() {
    thread_local std::mt19937_64 generator{std::random_device{}()};

    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    const auto random = generator();

    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "transfer-%lld-%016llx",
                  static_cast<long long>(millis),
                  static_cast<unsigned long long>(random));
    return buffer;
}

} // namespace cirrus::transfer
