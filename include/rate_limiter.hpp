//
//  rate_limiter.hpp
//  SubForge
//
//  Fixed-window admission control per client identity.
//
//  Created by Till Toenshoff on 12/9/25.
//  Copyright © 2025 Till Toenshoff. All rights reserved.
//

#pragma once

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>

namespace subforge {

inline constexpr uint32_t kDefaultRateLimitMax = 10;
inline constexpr std::chrono::milliseconds kDefaultRateLimitWindow{60000};

enum class Admission { Allowed, Denied };

using RateLimitClock = std::function<std::chrono::steady_clock::time_point()>;

struct RateLimitEntry {
    uint32_t count = 0;
    std::chrono::steady_clock::time_point window_start;
};

/**
 * @brief Storage seam for rate-limit counters.
 *
 * update() runs `fn` on the entry for `client_id` (created on demand) atomically with
 * respect to other update()/erase_expired() calls and returns its result.
 */
class RateLimitStore {
   public:
    virtual ~RateLimitStore() = default;

    virtual bool update(const std::string &client_id,
                        const std::function<bool(RateLimitEntry &)> &fn) = 0;
    // Remove every entry whose window started at or before `cutoff`; returns the count removed.
    virtual size_t erase_expired(std::chrono::steady_clock::time_point cutoff) = 0;
    virtual size_t size() const = 0;
};

// Mutex-guarded in-process map; entries live until swept.
class InMemoryRateLimitStore : public RateLimitStore {
   public:
    bool update(const std::string &client_id,
                const std::function<bool(RateLimitEntry &)> &fn) override;
    size_t erase_expired(std::chrono::steady_clock::time_point cutoff) override;
    size_t size() const override;

   private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RateLimitEntry> entries_;
};

class RateLimiter {
   public:
    explicit RateLimiter(std::shared_ptr<RateLimitStore> store =
                             std::make_shared<InMemoryRateLimitStore>(),
                         uint32_t max_requests = kDefaultRateLimitMax,
                         std::chrono::milliseconds window = kDefaultRateLimitWindow,
                         RateLimitClock clock = {});
    ~RateLimiter();

    RateLimiter(const RateLimiter &) = delete;
    RateLimiter &operator=(const RateLimiter &) = delete;

    // A new or expired identity starts a fresh window; otherwise the request is admitted
    // while the window's count is below the maximum.
    Admission admit(const std::string &client_id);

    // Drop expired entries; returns how many were removed.
    size_t sweep();

    // Background thread calling sweep() once per window until stop_sweeper() or destruction.
    void start_sweeper();
    void stop_sweeper();

    uint32_t max_requests() const { return max_requests_; }
    std::chrono::milliseconds window() const { return window_; }
    size_t tracked_clients() const { return store_->size(); }

   private:
    std::shared_ptr<RateLimitStore> store_;
    uint32_t max_requests_;
    std::chrono::milliseconds window_;
    RateLimitClock clock_;

    std::mutex sweeper_mutex_;
    std::condition_variable sweeper_cv_;
    bool sweeper_stop_ = false;
    std::thread sweeper_;
};

}  // namespace subforge
