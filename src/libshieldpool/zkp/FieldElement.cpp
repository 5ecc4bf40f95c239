#include "FieldElement.h"
#include "ZkError.h"
#include <libff/common/profiling.hpp>
#include <openssl/crypto.h>
#include <openssl/rand.h>
#include <gmpxx.h>
#include <algorithm>
#include <cstring>
#include <mutex>

namespace shieldpool {
namespace zkp {

void initCurveParameters() {
    static std::once_flag once;
    std::call_once(once, [] {
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;
        DefaultCurve::init_public_params();
    });
}

namespace {

template <mp_size_t n>
libff::bigint<n> importBigint(std::uint8_t const* bigEndian, std::size_t size) {
    mpz_class m;
    mpz_import(m.get_mpz_t(), size, 1, 1, 0, 0, bigEndian);
    return libff::bigint<n>(m.get_mpz_t());
}

template <mp_size_t n>
Bytes32 exportBigint(libff::bigint<n> const& value) {
    mpz_class m;
    value.to_mpz(m.get_mpz_t());

    Bytes32 tmp{};
    size_t count = 0;
    mpz_export(tmp.data(), &count, 1, 1, 0, 0, m.get_mpz_t());

    // mpz_export writes the minimal number of bytes; right-align them
    Bytes32 out{};
    std::copy(tmp.begin(), tmp.begin() + count, out.end() - count);
    return out;
}

template <mp_size_t n>
mpz_class modulusOf(libff::bigint<n> const& modulus) {
    mpz_class m;
    modulus.to_mpz(m.get_mpz_t());
    return m;
}

// Decodes 32 big-endian bytes into Fp, rejecting anything >= modulus.
template <typename Fp, mp_size_t n>
Fp decodeCanonical(ripple::Slice bytes, libff::bigint<n> const& modulus, char const* what) {
    if (bytes.size() != 32) {
        throw InvalidLengthError(std::string(what) + ": expected 32 bytes, got " +
                                 std::to_string(bytes.size()));
    }

    auto const value = importBigint<n>(bytes.data(), bytes.size());
    if (mpn_cmp(value.data, modulus.data, n) >= 0) {
        throw OutOfRangeError(std::string(what) + ": value not below field modulus");
    }
    return Fp(value);
}

template <typename Fp, mp_size_t n>
Fp parseDecimal(std::string const& text, libff::bigint<n> const& modulus, char const* what) {
    if (text.empty() || text.size() > 80 ||
        !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw std::invalid_argument(std::string(what) + ": not a decimal integer");
    }

    mpz_class const value(text, 10);
    if (value >= modulusOf(modulus)) {
        throw OutOfRangeError(std::string(what) + ": value not below field modulus");
    }
    return Fp(libff::bigint<n>(value.get_mpz_t()));
}

} // namespace

namespace field {

bool isCanonical(uint256 const& value) {
    initCurveParameters();
    auto const v = importBigint<libff::alt_bn128_r_limbs>(value.data(), value.size());
    return mpn_cmp(v.data, libff::alt_bn128_modulus_r.data, libff::alt_bn128_r_limbs) < 0;
}

FieldT reduce(uint256 const& value) {
    initCurveParameters();

    mpz_class m;
    mpz_import(m.get_mpz_t(), value.size(), 1, 1, 0, 0, value.data());
    m %= modulusOf(libff::alt_bn128_modulus_r);
    return FieldT(libff::bigint<libff::alt_bn128_r_limbs>(m.get_mpz_t()));
}

FieldT fromUint256(uint256 const& value) {
    return fromBytes(ripple::Slice(value.data(), value.size()));
}

uint256 toUint256(FieldT const& element) {
    auto const bytes = toBytes(element);
    return uint256::fromVoid(bytes.data());
}

FieldT fromBytes(ripple::Slice bytes) {
    initCurveParameters();
    return decodeCanonical<FieldT>(bytes, libff::alt_bn128_modulus_r, "field element");
}

Bytes32 toBytes(FieldT const& element) {
    return exportBigint(element.as_bigint());
}

FieldT fromDecimal(std::string const& text) {
    initCurveParameters();
    return parseDecimal<FieldT>(text, libff::alt_bn128_modulus_r, "field element");
}

std::string toDecimal(FieldT const& element) {
    mpz_class m;
    element.as_bigint().to_mpz(m.get_mpz_t());
    return m.get_str(10);
}

FieldT fromUint64(std::uint64_t value) {
    initCurveParameters();

    mpz_class m;
    mpz_import(m.get_mpz_t(), 1, 1, sizeof(value), 0, 0, &value);
    return FieldT(libff::bigint<libff::alt_bn128_r_limbs>(m.get_mpz_t()));
}

FieldT random() {
    initCurveParameters();

    Bytes32 buffer;
    for (;;) {
        if (RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
            throw std::runtime_error("RAND_bytes failed");
        }
        // The modulus is a 254-bit number, so drop the top two bits to keep
        // the rejection rate low. Anything still >= modulus is discarded.
        buffer[0] &= 0x3f;

        auto const value = importBigint<libff::alt_bn128_r_limbs>(buffer.data(), buffer.size());
        if (mpn_cmp(value.data, libff::alt_bn128_modulus_r.data, libff::alt_bn128_r_limbs) < 0) {
            OPENSSL_cleanse(buffer.data(), buffer.size());
            return FieldT(value);
        }
    }
}

BaseFieldT baseFromBytes(ripple::Slice bytes) {
    initCurveParameters();
    return decodeCanonical<BaseFieldT>(bytes, libff::alt_bn128_modulus_q, "coordinate");
}

Bytes32 baseToBytes(BaseFieldT const& element) {
    return exportBigint(element.as_bigint());
}

BaseFieldT baseFromDecimal(std::string const& text) {
    initCurveParameters();
    return parseDecimal<BaseFieldT>(text, libff::alt_bn128_modulus_q, "coordinate");
}

} // namespace field

} // namespace zkp
} // namespace shieldpool
