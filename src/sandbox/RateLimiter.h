#pragma once
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include "sandbox/SandboxError.h"

/**
 * @brief Per-client sliding window admission control.
 *
 * Each client keeps the timestamps of its admitted requests within the
 * trailing window. Timestamps older than the window are pruned before every
 * check; a client whose window becomes empty is dropped from the table.
 * Once per window the whole table is swept for clients that went idle, so
 * it only holds clients seen during the last two windows.
 *
 * This is a fixed window with pruning, not a token bucket: a client may spend
 * its whole quota in a burst at the edge of a window.
 */
class RateLimiter {
public:
    using Clock = std::chrono::steady_clock;
    using TimeSource = std::function<Clock::time_point()>;

    static constexpr const char* kDefaultClient = "default";

    RateLimiter(int limit, std::chrono::milliseconds window, TimeSource now = TimeSource());

    /**
     * @brief Admit or reject one request for a client.
     *
     * A rejected attempt is not recorded. The RateLimited error message
     * includes the time until the oldest request leaves the window.
     */
    SandboxStatus admit(const std::string& clientId);

    /** @brief Requests currently counted for a client (after pruning). */
    int currentCount(const std::string& clientId);

    /** @brief Number of clients currently tracked. */
    size_t clientCount() const;

    int limit() const { return limit_; }
    std::chrono::milliseconds window() const { return window_; }

private:
    void prune(std::deque<Clock::time_point>& timestamps, Clock::time_point now) const;
    void sweepIdle(Clock::time_point now);

    int limit_;
    std::chrono::milliseconds window_;
    TimeSource now_;

    mutable std::mutex mtx;
    std::unordered_map<std::string, std::deque<Clock::time_point>> windows;
    Clock::time_point lastSweep;
};
