#include "tether/transfer/bandwidth.hpp"

namespace tether::transfer {

BandwidthEstimator::BandwidthEstimator(std::chrono::milliseconds window) : window_(window) {}

void BandwidthEstimator::record(std::size_t bytes) {
    record(bytes, Clock::now());
}

void BandwidthEstimator::record(std::size_t bytes, Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);
    samples_.push_back({now, bytes});
    window_bytes_ += bytes;
    total_bytes_ += bytes;
    evict(now);
}

double BandwidthEstimator::bytes_per_second() const {
    return bytes_per_second(Clock::now());
}

double BandwidthEstimator::bytes_per_second(Clock::time_point now) const {
    std::lock_guard<std::mutex> lock(mutex_);
    evict(now);
    const double seconds = std::chrono::duration<double>(window_).count();
    return seconds > 0 ? static_cast<double>(window_bytes_) / seconds : 0.0;
}

void BandwidthEstimator::evict(Clock::time_point now) const {
    while (!samples_.empty() && now - samples_.front().at >= window_) {
        window_bytes_ -= samples_.front().bytes;
        samples_.pop_front();
    }
}

void BandwidthEstimator::record_rtt(Clock::duration sample) {
    const double us = static_cast<double>(std::chrono::duration_cast<std::chrono::microseconds>(sample).count());
    std::lock_guard<std::mutex> lock(mutex_);
    if (!srtt_us_) {
        srtt_us_ = us;
    } else {
        *srtt_us_ += (us - *srtt_us_) / 8.0;
    }
}

std::optional<std::chrono::microseconds> BandwidthEstimator::smoothed_rtt() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!srtt_us_) {
        return std::nullopt;
    }
    return std::chrono::microseconds(static_cast<int64_t>(*srtt_us_));
}

uint64_t BandwidthEstimator::total_bytes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return total_bytes_;
}

} // namespace tether::transfer
