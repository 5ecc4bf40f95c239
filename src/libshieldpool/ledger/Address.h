#pragma once

#include <xrpl/basics/Slice.h>
#include <xrpl/basics/base_uint.h>
#include <optional>
#include <string>
#include <string_view>

namespace shieldpool {
namespace ledger {

namespace detail {

class AddressTag {
public:
    explicit AddressTag() = default;
};

} // namespace detail

/** 32-byte ledger address (an Ed25519 public key or a program address). */
using Address = ripple::base_uint<256, detail::AddressTag>;

inline ripple::Slice
slice(Address const& a)
{
    return ripple::Slice(a.data(), a.size());
}

std::string
toBase58(Address const& address);

/** Empty unless the text decodes to exactly 32 bytes. */
std::optional<Address>
parseAddress(std::string_view text);

/** @throws std::invalid_argument naming the field on failure */
Address
requireAddress(std::string_view text, std::string const& what);

// Well-known programs
Address
systemProgramId();

constexpr char tokenProgramIdBase58[] = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";
constexpr char associatedTokenProgramIdBase58[] = "ATokenGPvbdGVxr1b2hvZbsiqW5xWH25efTNE1bCTMS";

} // namespace ledger
} // namespace shieldpool
