#include "AssetId.h"
#include "Keccak.h"
#include "ZkError.h"
#include <cstring>

namespace shieldpool {
namespace zkp {

namespace {

// 0x00 || bytes[0..31]
uint256 truncateToScalar(std::uint8_t const* bytes) {
    Bytes32 out{};
    std::memcpy(out.data() + 1, bytes, 31);
    return uint256::fromVoid(out.data());
}

} // namespace

uint256 deriveAssetId(ripple::Slice mint) {
    if (mint.size() != 32)
        throw InvalidLengthError("mint address must be 32 bytes");

    Keccak256 h;
    h.update(assetIdDomain, sizeof(assetIdDomain) - 1);
    h.update(mint);
    auto const digest = h.finish();
    return truncateToScalar(digest.data());
}

FieldT addressToScalar(ripple::Slice address) {
    if (address.size() != 32)
        throw InvalidLengthError("address must be 32 bytes");

    return field::fromUint256(truncateToScalar(address.data()));
}

} // namespace zkp
} // namespace shieldpool
