#include "NullifierCache.h"

namespace shieldpool {
namespace relay {

std::optional<bool>
MemoryNullifierCache::lookup(ripple::uint256 const& nullifierHash) const
{
    std::lock_guard lock(mutex_);
    if (spent_.count(nullifierHash) != 0)
        return true;
    return std::nullopt;
}

void
MemoryNullifierCache::markSpent(ripple::uint256 const& nullifierHash)
{
    std::lock_guard lock(mutex_);
    spent_.insert(nullifierHash);
}

std::size_t
MemoryNullifierCache::size() const
{
    std::lock_guard lock(mutex_);
    return spent_.size();
}

std::unique_ptr<NullifierCache>
make_NullifierCache(bool enabled)
{
    if (enabled)
        return std::make_unique<MemoryNullifierCache>();
    return std::make_unique<DisabledNullifierCache>();
}

} // namespace relay
} // namespace shieldpool
