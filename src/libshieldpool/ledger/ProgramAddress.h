#pragma once

#include <libshieldpool/ledger/Address.h>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace shieldpool {
namespace ledger {

/**
    Program-derived addresses.

    A program address is sha256(seeds || programId || "ProgramDerivedAddress")
    and must not be a valid Ed25519 public key, so no private key can sign
    for it.
*/

std::size_t constexpr maxSeeds = 16;
std::size_t constexpr maxSeedLength = 32;

/** True when the bytes decompress to a point on the Ed25519 curve. */
bool
isOnCurve(Address const& address);

/**
    Empty when the hash lands on the curve.

    @throws std::invalid_argument for too many seeds or an overlong seed
*/
std::optional<Address>
createProgramAddress(
    std::vector<ripple::Slice> const& seeds,
    Address const& programId);

/**
    Searches bump seeds from 255 down to 0 and returns the first address off
    the curve together with its bump.

    @throws std::runtime_error if no bump works
*/
std::pair<Address, std::uint8_t>
findProgramAddress(
    std::vector<ripple::Slice> const& seeds,
    Address const& programId);

/** Token account owned by owner for mint, derived by the associated token program. */
Address
associatedTokenAddress(
    Address const& owner,
    Address const& mint,
    Address const& tokenProgram,
    Address const& associatedTokenProgram);

} // namespace ledger
} // namespace shieldpool
