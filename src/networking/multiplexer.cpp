#include "tether/networking/multiplexer.hpp"
#include "tether/log.hpp"
#include <string>

namespace tether::networking {

Multiplexer::Multiplexer(SendFn send, std::chrono::milliseconds default_timeout, uint64_t first_id)
    : send_(std::move(send)), default_timeout_(default_timeout), next_id_(first_id == 0 ? 1 : first_id) {}

uint64_t Multiplexer::allocate_id() {
    // Caller holds mutex_. Id 0 belongs to control packets.
    for (;;) {
        uint64_t id = next_id_++;
        if (next_id_ == 0) {
            next_id_ = 1;
        }
        if (id != 0 && pending_.count(id) == 0) {
            return id;
        }
    }
}

RequestHandle Multiplexer::submit(std::vector<uint8_t> payload, const RequestOptions& options,
                                  Clock::time_point now) {
    RequestHandle handle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            throw *closed_;
        }
        handle.correlation_id = allocate_id();

        PendingRequest request;
        request.submitted_at = now;
        auto timeout = options.timeout.value_or(default_timeout_);
        if (timeout.count() > 0) {
            request.deadline = now + timeout;
        }
        if (options.on_fragment) {
            request.on_fragment = std::make_shared<FragmentCallback>(options.on_fragment);
        }
        handle.result = request.promise.get_future();
        pending_.emplace(handle.correlation_id, std::move(request));
    }

    try {
        send_(handle.correlation_id, std::move(payload), options.compress);
    } catch (const std::exception&) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_.erase(handle.correlation_id);
        throw;
    }
    return handle;
}

bool Multiplexer::on_response(protocol::Packet&& response) {
    const uint64_t id = response.correlation_id();

    if (!response.is_terminal()) {
        std::shared_ptr<FragmentCallback> callback;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = pending_.find(id);
            if (it == pending_.end()) {
                log::debug("mux", "dropping fragment for unknown correlation id " + std::to_string(id));
                return false;
            }
            callback = it->second.on_fragment;
        }
        if (!callback) {
            log::debug("mux", "request " + std::to_string(id) + " has no fragment callback, fragment dropped");
            return true;
        }
        try {
            (*callback)(response);
        } catch (const std::exception& e) {
            log::warn("mux", "fragment handler for request " + std::to_string(id) + " failed: " + e.what());
            fail_request(id, std::current_exception());
        }
        return true;
    }

    PendingRequest request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(id);
        if (it == pending_.end()) {
            log::warn("mux", "stray response for correlation id " + std::to_string(id) + " dropped");
            return false;
        }
        request = std::move(it->second);
        pending_.erase(it);
    }

    if (latency_observer_) {
        latency_observer_(Clock::now() - request.submitted_at);
    }
    request.promise.set_value(std::move(response));
    return true;
}

bool Multiplexer::cancel(uint64_t correlation_id) {
    PendingRequest request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(correlation_id);
        if (it == pending_.end()) {
            return false;
        }
        request = std::move(it->second);
        pending_.erase(it);
    }
    request.promise.set_exception(std::make_exception_ptr(
        Error(ErrorKind::Cancelled, "request " + std::to_string(correlation_id) + " cancelled locally")));
    return true;
}

std::size_t Multiplexer::expire_overdue(Clock::time_point now) {
    std::vector<std::pair<uint64_t, PendingRequest>> expired;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto it = pending_.begin(); it != pending_.end();) {
            if (it->second.deadline && *it->second.deadline <= now) {
                expired.emplace_back(it->first, std::move(it->second));
                it = pending_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& entry : expired) {
        log::debug("mux", "request " + std::to_string(entry.first) + " timed out");
        entry.second.promise.set_exception(std::make_exception_ptr(
            Error(ErrorKind::Timeout, "request " + std::to_string(entry.first) + " exceeded its deadline")));
    }
    return expired.size();
}

void Multiplexer::fail_all(const Error& error) {
    std::unordered_map<uint64_t, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            closed_ = error;
        }
        failed.swap(pending_);
    }
    for (auto& entry : failed) {
        entry.second.promise.set_exception(std::make_exception_ptr(error));
    }
}

void Multiplexer::fail_request(uint64_t correlation_id, std::exception_ptr error) {
    PendingRequest request;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = pending_.find(correlation_id);
        if (it == pending_.end()) {
            return;
        }
        request = std::move(it->second);
        pending_.erase(it);
    }
    request.promise.set_exception(error);
}

std::size_t Multiplexer::pending_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.size();
}

bool Multiplexer::is_pending(uint64_t correlation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pending_.count(correlation_id) > 0;
}

void Multiplexer::set_latency_observer(LatencyFn observer) {
    latency_observer_ = std::move(observer);
}

} // namespace tether::networking
