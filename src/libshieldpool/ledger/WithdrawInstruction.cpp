#include "WithdrawInstruction.h"
#include <xrpl/protocol/digest.h>
#include <algorithm>
#include <cstring>
#include <string_view>
#include <utility>

namespace shieldpool {
namespace ledger {

namespace {

ripple::Slice
text(std::string_view value)
{
    return ripple::Slice(value.data(), value.size());
}

ripple::Slice
bytes(ripple::uint256 const& value)
{
    return ripple::Slice(value.data(), value.size());
}

void
appendU32(ripple::Blob& out, std::uint32_t value)
{
    for (int i = 0; i < 4; ++i)
        out.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
}

void
appendU64(ripple::Blob& out, std::uint64_t value)
{
    for (int i = 0; i < 8; ++i)
        out.push_back(static_cast<std::uint8_t>(value >> (8 * i)));
}

template <class Bytes>
void
appendBytes(ripple::Blob& out, Bytes const& bytes)
{
    out.insert(out.end(), bytes.begin(), bytes.end());
}

} // namespace

PoolAddresses::PoolAddresses(PoolSettings settings) : settings_(std::move(settings))
{
    auto const& program = settings_.programId;
    auto const pool = slice(settings_.poolConfig);

    merkleTree_ = findProgramAddress({text("merkle_tree_v2"), pool}, program).first;
    verificationKey_ = findProgramAddress({text("vk_withdraw"), pool}, program).first;
    relayerRegistry_ = findProgramAddress({text("relayer_registry"), pool}, program).first;
}

Address
PoolAddresses::assetVault(ripple::uint256 const& assetId) const
{
    return findProgramAddress(
               {text("vault_v2"), slice(settings_.poolConfig), bytes(assetId)},
               settings_.programId)
        .first;
}

Address
PoolAddresses::nullifierMarker(ripple::uint256 const& nullifierHash) const
{
    return findProgramAddress(
               {text("nullifier_v2"), slice(settings_.poolConfig), bytes(nullifierHash)},
               settings_.programId)
        .first;
}

Address
PoolAddresses::relayerNode(Address const& operatorKey) const
{
    return findProgramAddress(
               {text("relayer"), slice(relayerRegistry_), slice(operatorKey)},
               settings_.programId)
        .first;
}

Address
PoolAddresses::tokenAccount(Address const& owner, Address const& mint) const
{
    return associatedTokenAddress(
        owner, mint, settings_.tokenProgram, settings_.associatedTokenProgram);
}

std::array<std::uint8_t, 8>
withdrawDiscriminator()
{
    static constexpr char preimage[] = "global:withdraw_masp";
    ripple::sha256_hasher h;
    h(preimage, sizeof(preimage) - 1);
    auto const digest = static_cast<ripple::sha256_hasher::result_type>(h);

    std::array<std::uint8_t, 8> out;
    std::copy_n(digest.begin(), out.size(), out.begin());
    return out;
}

ripple::Blob
encodeWithdrawData(WithdrawArgs const& args)
{
    ripple::Blob out;
    out.reserve(8 + 4 + args.proof.size() + 32 * 3 + 32 + 8 * 2);

    appendBytes(out, withdrawDiscriminator());
    appendU32(out, static_cast<std::uint32_t>(args.proof.size()));
    appendBytes(out, args.proof);
    appendBytes(out, args.merkleRoot);
    appendBytes(out, args.nullifierHash);
    appendBytes(out, args.recipient);
    appendU64(out, args.amount);
    appendBytes(out, args.assetId);
    appendU64(out, args.relayerFee);
    return out;
}

Instruction
makeWithdrawInstruction(
    PoolAddresses const& pool,
    Address const& relayer,
    Address const& mint,
    WithdrawArgs const& args)
{
    auto const& settings = pool.settings();
    auto const vault = pool.assetVault(args.assetId);
    auto const relayerNode =
        settings.registeredRelayer ? pool.relayerNode(relayer) : settings.programId;

    Instruction ix;
    ix.programId = settings.programId;
    ix.accounts = {
        {relayer, true, true},
        {settings.poolConfig, false, true},
        {pool.merkleTree(), false, false},
        {pool.verificationKey(), false, false},
        {vault, false, true},
        {pool.tokenAccount(vault, mint), false, true},
        {pool.tokenAccount(args.recipient, mint), false, true},
        {pool.tokenAccount(relayer, mint), false, true},
        {pool.nullifierMarker(args.nullifierHash), false, true},
        {pool.relayerRegistry(), false, false},
        {relayerNode, false, false},
        {settings.tokenProgram, false, false},
        {systemProgramId(), false, false},
    };
    ix.data = encodeWithdrawData(args);
    return ix;
}

} // namespace ledger
} // namespace shieldpool
