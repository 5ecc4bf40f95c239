#include "ProgramAddress.h"
#include <xrpl/protocol/digest.h>
#include <openssl/bn.h>
#include <algorithm>
#include <array>
#include <memory>
#include <new>
#include <stdexcept>

namespace shieldpool {
namespace ledger {

namespace {

using BigNum = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BigNumCtx = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;

constexpr char pdaMarker[] = "ProgramDerivedAddress";

// d = -121665 / 121666 mod p
constexpr char edwardsD[] =
    "52036CEE2B6FFE738CC740797779E89800700A4D4141D8AB75EB4DCA135978A3";

BigNum
newBigNum()
{
    BigNum n(BN_new(), &BN_free);
    if (!n)
        throw std::bad_alloc();
    return n;
}

BigNum
fromHex(char const* hex)
{
    BIGNUM* raw = nullptr;
    if (BN_hex2bn(&raw, hex) == 0)
        throw std::logic_error("bad curve constant");
    return BigNum(raw, &BN_free);
}

void
check(int rc)
{
    if (rc != 1)
        throw std::runtime_error("curve arithmetic failed");
}

} // namespace

bool
isOnCurve(Address const& address)
{
    // Mirrors point decompression: y is the low 255 bits, little-endian,
    // and the point exists iff (y^2 - 1) / (d*y^2 + 1) is a square mod p.
    std::array<std::uint8_t, 32> le;
    std::copy(address.begin(), address.end(), le.begin());
    le[31] &= 0x7f;

    BigNumCtx ctx(BN_CTX_new(), &BN_CTX_free);
    if (!ctx)
        throw std::bad_alloc();

    auto p = newBigNum();
    check(BN_set_bit(p.get(), 255));
    check(BN_sub_word(p.get(), 19));

    auto y = newBigNum();
    if (BN_lebin2bn(le.data(), static_cast<int>(le.size()), y.get()) == nullptr)
        throw std::runtime_error("curve arithmetic failed");
    check(BN_nnmod(y.get(), y.get(), p.get(), ctx.get()));

    auto const d = fromHex(edwardsD);

    auto y2 = newBigNum();
    check(BN_mod_sqr(y2.get(), y.get(), p.get(), ctx.get()));

    auto one = newBigNum();
    check(BN_one(one.get()));

    auto u = newBigNum();
    check(BN_mod_sub(u.get(), y2.get(), one.get(), p.get(), ctx.get()));
    if (BN_is_zero(u.get()))
        return true;

    auto v = newBigNum();
    check(BN_mod_mul(v.get(), d.get(), y2.get(), p.get(), ctx.get()));
    check(BN_mod_add(v.get(), v.get(), one.get(), p.get(), ctx.get()));

    // Euler's criterion on u*v
    auto uv = newBigNum();
    check(BN_mod_mul(uv.get(), u.get(), v.get(), p.get(), ctx.get()));

    auto exponent = newBigNum();
    if (BN_copy(exponent.get(), p.get()) == nullptr)
        throw std::runtime_error("curve arithmetic failed");
    check(BN_sub_word(exponent.get(), 1));
    check(BN_rshift1(exponent.get(), exponent.get()));

    auto legendre = newBigNum();
    check(BN_mod_exp(legendre.get(), uv.get(), exponent.get(), p.get(), ctx.get()));
    return BN_is_one(legendre.get());
}

std::optional<Address>
createProgramAddress(
    std::vector<ripple::Slice> const& seeds,
    Address const& programId)
{
    if (seeds.size() > maxSeeds)
        throw std::invalid_argument("too many seeds for a program address");

    ripple::sha256_hasher h;
    for (auto const& seed : seeds)
    {
        if (seed.size() > maxSeedLength)
            throw std::invalid_argument("program address seed longer than 32 bytes");
        h(seed.data(), seed.size());
    }
    h(programId.data(), programId.size());
    h(pdaMarker, sizeof(pdaMarker) - 1);

    auto const digest = static_cast<ripple::sha256_hasher::result_type>(h);
    auto const candidate = Address::fromVoid(digest.data());
    if (isOnCurve(candidate))
        return std::nullopt;
    return candidate;
}

std::pair<Address, std::uint8_t>
findProgramAddress(
    std::vector<ripple::Slice> const& seeds,
    Address const& programId)
{
    if (seeds.size() + 1 > maxSeeds)
        throw std::invalid_argument("too many seeds for a program address");

    auto withBump = seeds;
    withBump.emplace_back();

    for (int bump = 255; bump >= 0; --bump)
    {
        std::uint8_t const b = static_cast<std::uint8_t>(bump);
        withBump.back() = ripple::Slice(&b, 1);
        if (auto const address = createProgramAddress(withBump, programId))
            return {*address, b};
    }
    throw std::runtime_error("no viable bump seed for program address");
}

Address
associatedTokenAddress(
    Address const& owner,
    Address const& mint,
    Address const& tokenProgram,
    Address const& associatedTokenProgram)
{
    return findProgramAddress(
               {slice(owner), slice(tokenProgram), slice(mint)},
               associatedTokenProgram)
        .first;
}

} // namespace ledger
} // namespace shieldpool
