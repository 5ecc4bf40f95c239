#pragma once

#include <libshieldpool/ledger/Address.h>
#include <array>
#include <cstdint>
#include <string>

namespace shieldpool {
namespace ledger {

using Signature = std::array<std::uint8_t, 64>;

/**
    Ed25519 signing key of the relayer operator.

    The seed is wiped on destruction. Not copyable.
*/
class Keypair
{
public:
    static std::size_t constexpr seedSize = 32;

    /** @throws std::invalid_argument unless seed is 32 bytes */
    static Keypair
    fromSeed(ripple::Slice seed);

    /**
        Parses the ledger CLI keypair format: a JSON array of 64 integers
        holding the seed followed by the public key.

        @throws std::invalid_argument if malformed or the public key does
                not belong to the seed
    */
    static Keypair
    fromJson(std::string const& text);

    /** @throws std::runtime_error if the file cannot be read or parsed */
    static Keypair
    loadFromFile(std::string const& path);

    static Keypair
    generate();

    Keypair(Keypair&& other) noexcept;
    Keypair&
    operator=(Keypair&&) = delete;
    Keypair(Keypair const&) = delete;
    Keypair&
    operator=(Keypair const&) = delete;
    ~Keypair();

    Address const&
    publicKey() const
    {
        return publicKey_;
    }

    Signature
    sign(ripple::Slice message) const;

private:
    explicit Keypair(ripple::Slice seed);

    std::array<std::uint8_t, seedSize> seed_{};
    Address publicKey_;
};

bool
verifySignature(
    Address const& publicKey,
    ripple::Slice message,
    Signature const& signature);

} // namespace ledger
} // namespace shieldpool
