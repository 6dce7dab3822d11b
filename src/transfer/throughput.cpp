#include "cirrus/transfer/throughput.hpp"

#include <numeric>

namespace cirrus::transfer {

ThroughputEstimator::ThroughputEstimator(std::size_t window, double min_useful_speed, std::uint64_t fallback_secs)
    : window_(window > 0 ? window : 1)
    , min_useful_speed_(min_useful_speed)
    , fallback_secs_(fallback_secs) {}

void ThroughputEstimator::record(std::uint64_t bytes, double seconds) {
    if (seconds <= 0.0) {
        return;
    }
    samples_.push_back(static_cast<double>(bytes) / seconds);
    while (samples_.size() > window_) {
        samples_.pop_front();
    }
}

double ThroughputEstimator::average_speed() const noexcept {
    if (samples_.empty()) {
        return 0.0;
    }
    return std::accumulate(samples_.begin(), samples_.end(), 0.0) / static_cast<double>(samples_.size());
}

std::uint64_t ThroughputEstimator::remaining_seconds(std::uint64_t remaining_bytes) const noexcept {
    const double speed = average_speed();
    if (speed <= min_useful_speed_) {
        return fallback_secs_;
    }
    return static_cast<std::uint64_t>(static_cast<double>(remaining_bytes) / speed);
}

} // namespace cirrus::transfer
