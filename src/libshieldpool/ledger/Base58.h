#pragma once

#include <xrpl/basics/Blob.h>
#include <xrpl/basics/Slice.h>
#include <optional>
#include <string>
#include <string_view>

namespace shieldpool {
namespace ledger {

/**
 * Base58 with the Bitcoin alphabet and no checksum, as used for ledger
 * addresses. Leading zero bytes map to leading '1' characters.
 */
std::string
encodeBase58(ripple::Slice data);

/** Empty on any character outside the alphabet or overlong input. */
std::optional<ripple::Blob>
decodeBase58(std::string_view text);

} // namespace ledger
} // namespace shieldpool
