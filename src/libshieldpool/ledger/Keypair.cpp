#include "Keypair.h"
#include <xrpl/json/json_reader.h>
#include <xrpl/json/json_value.h>
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <fstream>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace shieldpool {
namespace ledger {

namespace {

using PKey = std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)>;
using MdCtx = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

PKey
privateKey(std::uint8_t const* seed)
{
    PKey key(
        EVP_PKEY_new_raw_private_key(EVP_PKEY_ED25519, nullptr, seed, Keypair::seedSize),
        &EVP_PKEY_free);
    if (!key)
        throw std::runtime_error("ed25519: cannot load private key");
    return key;
}

} // namespace

Keypair::Keypair(ripple::Slice seed)
{
    if (seed.size() != seedSize)
        throw std::invalid_argument("ed25519 seed must be 32 bytes");
    std::copy(seed.begin(), seed.end(), seed_.begin());

    auto const key = privateKey(seed_.data());
    std::size_t len = Address::bytes;
    if (EVP_PKEY_get_raw_public_key(key.get(), publicKey_.data(), &len) != 1 ||
        len != Address::bytes)
    {
        throw std::runtime_error("ed25519: cannot derive public key");
    }
}

Keypair::Keypair(Keypair&& other) noexcept
    : seed_(other.seed_), publicKey_(other.publicKey_)
{
    OPENSSL_cleanse(other.seed_.data(), other.seed_.size());
}

Keypair::~Keypair()
{
    OPENSSL_cleanse(seed_.data(), seed_.size());
}

Keypair
Keypair::fromSeed(ripple::Slice seed)
{
    return Keypair(seed);
}

Keypair
Keypair::generate()
{
    std::array<std::uint8_t, seedSize> seed;
    if (RAND_bytes(seed.data(), static_cast<int>(seed.size())) != 1)
        throw std::runtime_error("ed25519: RAND_bytes failed");
    Keypair kp(ripple::Slice(seed.data(), seed.size()));
    OPENSSL_cleanse(seed.data(), seed.size());
    return kp;
}

Keypair
Keypair::fromJson(std::string const& text)
{
    Json::Value json;
    Json::Reader reader;
    if (!reader.parse(text, json) || !json.isArray() || json.size() != 64)
        throw std::invalid_argument("keypair must be a JSON array of 64 bytes");

    std::array<std::uint8_t, 64> bytes{};
    for (Json::UInt i = 0; i < 64; ++i)
    {
        auto const& v = json[i];
        if (!v.isIntegral() || v.asInt() < 0 || v.asInt() > 255)
        {
            OPENSSL_cleanse(bytes.data(), bytes.size());
            throw std::invalid_argument("keypair entries must be bytes");
        }
        bytes[i] = static_cast<std::uint8_t>(v.asInt());
    }

    Keypair kp(ripple::Slice(bytes.data(), seedSize));
    bool const matches = std::equal(kp.publicKey_.begin(), kp.publicKey_.end(), bytes.begin() + seedSize);
    OPENSSL_cleanse(bytes.data(), bytes.size());
    if (!matches)
        throw std::invalid_argument("keypair public key does not match its seed");
    return kp;
}

Keypair
Keypair::loadFromFile(std::string const& path)
{
    std::ifstream file(path);
    if (!file)
        throw std::runtime_error("cannot open keypair file " + path);

    std::stringstream contents;
    contents << file.rdbuf();
    try
    {
        return fromJson(contents.str());
    }
    catch (std::invalid_argument const& e)
    {
        throw std::runtime_error(path + ": " + e.what());
    }
}

Signature
Keypair::sign(ripple::Slice message) const
{
    auto const key = privateKey(seed_.data());
    MdCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);

    Signature sig{};
    std::size_t len = sig.size();
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1 ||
        EVP_DigestSign(ctx.get(), sig.data(), &len, message.data(), message.size()) != 1 ||
        len != sig.size())
    {
        throw std::runtime_error("ed25519: signing failed");
    }
    return sig;
}

bool
verifySignature(
    Address const& publicKey,
    ripple::Slice message,
    Signature const& signature)
{
    PKey key(
        EVP_PKEY_new_raw_public_key(EVP_PKEY_ED25519, nullptr, publicKey.data(), publicKey.size()),
        &EVP_PKEY_free);
    if (!key)
        return false;

    MdCtx ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!ctx || EVP_DigestVerifyInit(ctx.get(), nullptr, nullptr, nullptr, key.get()) != 1)
        throw std::runtime_error("ed25519: verifier setup failed");

    return EVP_DigestVerify(ctx.get(), signature.data(), signature.size(), message.data(), message.size()) == 1;
}

} // namespace ledger
} // namespace shieldpool
