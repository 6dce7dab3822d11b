#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace cirrus::transfer {

/**
 * @brief Rolling average of per-block upload speed
 *
 * Keeps the last window samples. The remaining-time estimate falls back to
 * a fixed value while the average is below min_useful_speed.
 */
class ThroughputEstimator {
public:
    ThroughputEstimator(std::size_t window, double min_useful_speed, std::uint64_t fallback_secs);

    /// Samples with a non-positive duration are ignored
    void record(std::uint64_t bytes, double seconds);

    [[nodiscard]] double average_speed() const noexcept;

    [[nodiscard]] std::uint64_t remaining_seconds(std::uint64_t remaining_bytes) const noexcept;

    [[nodiscard]] std::size_t sample_count() const noexcept { return samples_.size(); }

private:
    std::size_t window_;
    double min_useful_speed_;
    std::uint64_t fallback_secs_;
    std::deque<double> samples_;
};

} // namespace cirrus::transfer
