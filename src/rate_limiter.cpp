//
//  rate_limiter.cpp
//  SubForge
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#include "rate_limiter.hpp"

#include <stdexcept>

#include "logging.hpp"

namespace subforge {

bool InMemoryRateLimitStore::update(const std::string &client_id,
                                    const std::function<bool(RateLimitEntry &)> &fn) {
    std::lock_guard<std::mutex> lock(mutex_);
    return fn(entries_[client_id]);
}

size_t InMemoryRateLimitStore::erase_expired(std::chrono::steady_clock::time_point cutoff) {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t removed = 0;
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (it->second.window_start <= cutoff) {
            it = entries_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }
    return removed;
}

size_t InMemoryRateLimitStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

RateLimiter::RateLimiter(std::shared_ptr<RateLimitStore> store, uint32_t max_requests,
                         std::chrono::milliseconds window, RateLimitClock clock)
    : store_(std::move(store)),
      max_requests_(max_requests),
      window_(window),
      clock_(std::move(clock)) {
    if (!store_) {
        throw std::invalid_argument("rate limiter requires a store");
    }
    if (max_requests_ == 0 || window_.count() <= 0) {
        throw std::invalid_argument("rate limiter needs a positive maximum and window");
    }
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

RateLimiter::~RateLimiter() { stop_sweeper(); }

Admission RateLimiter::admit(const std::string &client_id) {
    const auto now = clock_();
    const bool allowed = store_->update(client_id, [&](RateLimitEntry &entry) {
        if (entry.count == 0 || now - entry.window_start >= window_) {
            entry.count = 1;
            entry.window_start = now;
            return true;
        }
        if (entry.count < max_requests_) {
            ++entry.count;
            return true;
        }
        return false;
    });
    if (!allowed) {
        SF_LOG("ratelimit", "denied '" << client_id << "'");
        return Admission::Denied;
    }
    return Admission::Allowed;
}

size_t RateLimiter::sweep() {
    const size_t removed = store_->erase_expired(clock_() - window_);
    if (removed > 0) {
        SF_LOG("ratelimit", "swept " << removed << " expired client(s)");
    }
    return removed;
}

void RateLimiter::start_sweeper() {
    std::lock_guard<std::mutex> lock(sweeper_mutex_);
    if (sweeper_.joinable()) {
        return;
    }
    sweeper_stop_ = false;
    sweeper_ = std::thread([this] {
        std::unique_lock<std::mutex> guard(sweeper_mutex_);
        while (!sweeper_cv_.wait_for(guard, window_, [this] { return sweeper_stop_; })) {
            guard.unlock();
            sweep();
            guard.lock();
        }
    });
}

void RateLimiter::stop_sweeper() {
    std::thread worker;
    {
        std::lock_guard<std::mutex> lock(sweeper_mutex_);
        if (!sweeper_.joinable()) {
            return;
        }
        sweeper_stop_ = true;
        worker = std::move(sweeper_);
    }
    sweeper_cv_.notify_all();
    worker.join();
}

}  // namespace subforge
