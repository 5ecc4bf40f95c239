#include "RateLimiter.h"

namespace shieldpool {
namespace relay {

RateLimiter::RateLimiter(Setup setup, std::function<Clock::time_point()> now)
    : setup_(setup), now_(std::move(now))
{
    global_.start = now_();
}

void
RateLimiter::prune(Clock::time_point now)
{
    for (auto it = keys_.begin(); it != keys_.end();)
    {
        if (now - it->second.start >= setup_.window)
            it = keys_.erase(it);
        else
            ++it;
    }
}

bool
RateLimiter::allow(std::string const& key)
{
    auto const now = now_();
    std::lock_guard lock(mutex_);

    if (now - global_.start >= setup_.window)
    {
        global_ = Window{now, 0};
        prune(now);
    }

    auto [it, inserted] = keys_.try_emplace(key, Window{now, 0});
    auto& window = it->second;
    if (!inserted && now - window.start >= setup_.window)
        window = Window{now, 0};

    // a denied request counts against neither window
    if (window.count >= setup_.perKey || global_.count >= setup_.global)
        return false;
    ++window.count;
    ++global_.count;
    return true;
}

std::size_t
RateLimiter::trackedKeys() const
{
    std::lock_guard lock(mutex_);
    return keys_.size();
}

} // namespace relay
} // namespace shieldpool
