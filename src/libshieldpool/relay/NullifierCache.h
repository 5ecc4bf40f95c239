#pragma once

#include <xrpl/basics/UnorderedContainers.h>
#include <xrpl/basics/base_uint.h>
#include <memory>
#include <mutex>
#include <optional>

namespace shieldpool {
namespace relay {

/**
    Positive-only record of spent nullifiers.

    A hit is authoritative: a spent nullifier never becomes unspent. A miss
    says nothing and the ledger must be asked.
*/
class NullifierCache
{
public:
    virtual ~NullifierCache() = default;

    /** true when known spent, empty otherwise. Never false. */
    virtual std::optional<bool>
    lookup(ripple::uint256 const& nullifierHash) const = 0;

    /** Idempotent. */
    virtual void
    markSpent(ripple::uint256 const& nullifierHash) = 0;

    virtual bool
    isAvailable() const = 0;
};

class MemoryNullifierCache : public NullifierCache
{
public:
    std::optional<bool>
    lookup(ripple::uint256 const& nullifierHash) const override;

    void
    markSpent(ripple::uint256 const& nullifierHash) override;

    bool
    isAvailable() const override
    {
        return true;
    }

    std::size_t
    size() const;

private:
    mutable std::mutex mutex_;
    ripple::hash_set<ripple::uint256> spent_;
};

/** Stands in when caching is turned off: every lookup misses. */
class DisabledNullifierCache : public NullifierCache
{
public:
    std::optional<bool>
    lookup(ripple::uint256 const&) const override
    {
        return std::nullopt;
    }

    void
    markSpent(ripple::uint256 const&) override
    {
    }

    bool
    isAvailable() const override
    {
        return false;
    }
};

std::unique_ptr<NullifierCache>
make_NullifierCache(bool enabled);

} // namespace relay
} // namespace shieldpool
