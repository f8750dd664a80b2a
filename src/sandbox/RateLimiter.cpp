#include "sandbox/RateLimiter.h"
#include <algorithm>

RateLimiter::RateLimiter(int limit, std::chrono::milliseconds window, TimeSource now)
    : limit_(std::max(0, limit)), window_(window), now_(std::move(now)) {
    if (!now_) {
        now_ = [] { return Clock::now(); };
    }
    lastSweep = now_();
}

void RateLimiter::prune(std::deque<Clock::time_point>& timestamps, Clock::time_point now) const {
    const Clock::time_point cutoff = now - window_;
    while (!timestamps.empty() && timestamps.front() <= cutoff) {
        timestamps.pop_front();
    }
}

void RateLimiter::sweepIdle(Clock::time_point now) {
    if (now - lastSweep < window_) return;
    lastSweep = now;

    const Clock::time_point cutoff = now - window_;
    for (auto it = windows.begin(); it != windows.end();) {
        if (it->second.empty() || it->second.back() <= cutoff) {
            it = windows.erase(it);
        } else {
            ++it;
        }
    }
}

SandboxStatus RateLimiter::admit(const std::string& clientId) {
    const std::string& key = clientId.empty() ? std::string(kDefaultClient) : clientId;

    std::lock_guard<std::mutex> lock(mtx);
    const Clock::time_point now = now_();
    sweepIdle(now);

    auto it = windows.find(key);
    if (it != windows.end()) {
        prune(it->second, now);
        if (it->second.empty()) {
            windows.erase(it);
            it = windows.end();
        }
    }

    const int current = it == windows.end() ? 0 : static_cast<int>(it->second.size());
    if (current >= limit_) {
        std::string message = "Rate limit exceeded. Try again later.";
        if (it != windows.end()) {
            auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
                it->second.front() + window_ - now);
            message += " Retry after " + std::to_string(std::max<int64_t>(wait.count(), 1)) + " ms.";
        }
        return SandboxStatus::fail(SandboxErrorCode::RateLimited, message);
    }

    windows[key].push_back(now);
    return okStatus();
}

int RateLimiter::currentCount(const std::string& clientId) {
    const std::string& key = clientId.empty() ? std::string(kDefaultClient) : clientId;

    std::lock_guard<std::mutex> lock(mtx);
    auto it = windows.find(key);
    if (it == windows.end()) return 0;

    prune(it->second, now_());
    int count = static_cast<int>(it->second.size());
    if (count == 0) windows.erase(it);
    return count;
}

size_t RateLimiter::clientCount() const {
    std::lock_guard<std::mutex> lock(mtx);
    return windows.size();
}
