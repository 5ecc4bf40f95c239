#pragma once

#include <libshieldpool/ledger/ProgramAddress.h>
#include <libshieldpool/ledger/Transaction.h>
#include <xrpl/basics/base_uint.h>
#include <array>
#include <cstdint>

namespace shieldpool {
namespace ledger {

/** Where the pool lives and which programs it talks to. */
struct PoolSettings
{
    Address programId;
    Address poolConfig;
    Address tokenProgram;
    Address associatedTokenProgram;
    bool registeredRelayer = false;
};

/**
    Program-derived accounts of one pool.
*/
class PoolAddresses
{
public:
    explicit PoolAddresses(PoolSettings settings);

    PoolSettings const&
    settings() const
    {
        return settings_;
    }

    Address const&
    merkleTree() const
    {
        return merkleTree_;
    }

    Address const&
    verificationKey() const
    {
        return verificationKey_;
    }

    Address const&
    relayerRegistry() const
    {
        return relayerRegistry_;
    }

    Address
    assetVault(ripple::uint256 const& assetId) const;

    /** Marker account that exists once the nullifier has been spent. */
    Address
    nullifierMarker(ripple::uint256 const& nullifierHash) const;

    Address
    relayerNode(Address const& operatorKey) const;

    Address
    tokenAccount(Address const& owner, Address const& mint) const;

private:
    PoolSettings settings_;
    Address merkleTree_;
    Address verificationKey_;
    Address relayerRegistry_;
};

struct WithdrawArgs
{
    ripple::Blob proof;
    ripple::uint256 merkleRoot;
    ripple::uint256 nullifierHash;
    Address recipient;
    std::uint64_t amount = 0;
    ripple::uint256 assetId;
    std::uint64_t relayerFee = 0;
};

/** First eight bytes of sha256("global:withdraw_masp"). */
std::array<std::uint8_t, 8>
withdrawDiscriminator();

/** Discriminator followed by the Borsh-encoded arguments. */
ripple::Blob
encodeWithdrawData(WithdrawArgs const& args);

/**
    Builds the pool's withdraw instruction with its accounts in program
    order. The relayer signs and pays; an unregistered relayer passes the
    program id in place of its relayer node.
*/
Instruction
makeWithdrawInstruction(
    PoolAddresses const& pool,
    Address const& relayer,
    Address const& mint,
    WithdrawArgs const& args);

} // namespace ledger
} // namespace shieldpool
