#include "Address.h"
#include "Base58.h"
#include <stdexcept>

namespace shieldpool {
namespace ledger {

std::string
toBase58(Address const& address)
{
    return encodeBase58(slice(address));
}

std::optional<Address>
parseAddress(std::string_view text)
{
    auto const bytes = decodeBase58(text);
    if (!bytes || bytes->size() != Address::bytes)
        return std::nullopt;
    return Address::fromVoid(bytes->data());
}

Address
requireAddress(std::string_view text, std::string const& what)
{
    if (auto const address = parseAddress(text))
        return *address;
    throw std::invalid_argument(what + " is not a base58 32-byte address");
}

Address
systemProgramId()
{
    return Address{};
}

} // namespace ledger
} // namespace shieldpool
