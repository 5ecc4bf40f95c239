#pragma once

#include <chrono>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>

namespace shieldpool {
namespace relay {

/**
    Fixed-window request counters, one per key plus a global one.
*/
class RateLimiter
{
public:
    using Clock = std::chrono::steady_clock;

    struct Setup
    {
        std::chrono::seconds window{60};
        unsigned perKey = 30;
        unsigned global = 500;
    };

    explicit RateLimiter(Setup setup, std::function<Clock::time_point()> now = &Clock::now);

    /** Counts the request and says whether it may proceed. */
    bool
    allow(std::string const& key);

    std::size_t
    trackedKeys() const;

private:
    struct Window
    {
        Clock::time_point start;
        unsigned count = 0;
    };

    void
    prune(Clock::time_point now);

    Setup const setup_;
    std::function<Clock::time_point()> now_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, Window> keys_;
    Window global_;
};

} // namespace relay
} // namespace shieldpool
