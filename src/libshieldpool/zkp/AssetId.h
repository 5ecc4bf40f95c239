#pragma once

#include <libshieldpool/zkp/FieldElement.h>

namespace shieldpool {
namespace zkp {

/** Domain separator hashed in front of the mint address. */
constexpr char assetIdDomain[] = "psol:asset_id:v1";

/**
 * Asset identifier of a token mint.
 *
 * 0x00 followed by the first 31 bytes of keccak256(domain || mint). The
 * leading zero byte keeps the value below the scalar modulus so it can be
 * used directly as a public input.
 *
 * @throws InvalidLengthError unless the mint is 32 bytes
 */
uint256 deriveAssetId(ripple::Slice mint);

/**
 * A 32-byte ledger address as a field element: 0x00 followed by the first
 * 31 bytes. Used for the recipient and relayer public inputs.
 */
FieldT addressToScalar(ripple::Slice address);

} // namespace zkp
} // namespace shieldpool
