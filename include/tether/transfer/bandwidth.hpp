#pragma once

#include <chrono>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

namespace tether::transfer {

// Throughput over a sliding window plus a smoothed round-trip time
// (srtt += (sample - srtt) / 8). Thread-safe.
class BandwidthEstimator {
public:
    using Clock = std::chrono::steady_clock;

    explicit BandwidthEstimator(std::chrono::milliseconds window = std::chrono::milliseconds(1000));

    void record(std::size_t bytes);
    void record(std::size_t bytes, Clock::time_point now);

    double bytes_per_second() const;
    double bytes_per_second(Clock::time_point now) const;

    void record_rtt(Clock::duration sample);

    // Nothing until the first sample.
    std::optional<std::chrono::microseconds> smoothed_rtt() const;

    uint64_t total_bytes() const;

private:
    struct Sample {
        Clock::time_point at;
        std::size_t bytes;
    };

    void evict(Clock::time_point now) const;

    std::chrono::milliseconds window_;
    mutable std::mutex mutex_;
    mutable std::deque<Sample> samples_;
    mutable std::size_t window_bytes_ = 0;
    uint64_t total_bytes_ = 0;
    std::optional<double> srtt_us_;
};

} // namespace tether::transfer
