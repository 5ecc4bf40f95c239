#pragma once

#include <xrpl/basics/Slice.h>
#include <xrpl/basics/base_uint.h>
#include <libff/algebra/curves/alt_bn128/alt_bn128_pp.hpp>
#include <array>
#include <cstdint>
#include <string>

namespace shieldpool {
namespace zkp {

using ripple::uint256;

using DefaultCurve = libff::alt_bn128_pp;
using FieldT = libff::Fr<DefaultCurve>;      // scalar field, public inputs and hashes
using BaseFieldT = libff::Fq<DefaultCurve>;  // curve coordinates
using Bytes32 = std::array<std::uint8_t, 32>;

/**
 * Sets up the alt_bn128 parameters used by libff.
 *
 * Safe to call from any thread and any number of times. Every function in
 * this header calls it, so most code never needs to.
 */
void initCurveParameters();

namespace field {

// Scalar field (order r of the BN254 groups).

/** True when the big-endian value is strictly below the scalar modulus. */
bool isCanonical(uint256 const& value);

/** Reduces an arbitrary 256-bit value modulo the scalar field order. */
FieldT reduce(uint256 const& value);

/**
 * Decodes a big-endian value.
 *
 * @throws OutOfRangeError if value >= modulus. Never reduces.
 */
FieldT fromUint256(uint256 const& value);
uint256 toUint256(FieldT const& element);

/**
 * @throws InvalidLengthError unless exactly 32 bytes
 * @throws OutOfRangeError if the encoded value >= modulus
 */
FieldT fromBytes(ripple::Slice bytes);
Bytes32 toBytes(FieldT const& element);

/**
 * Parses a base-10 string with no sign, whitespace or prefix.
 *
 * @throws std::invalid_argument on malformed text
 * @throws OutOfRangeError if the value >= modulus
 */
FieldT fromDecimal(std::string const& text);
std::string toDecimal(FieldT const& element);

FieldT fromUint64(std::uint64_t value);

/** Uniform over [0, modulus), drawn from the OpenSSL CSPRNG. */
FieldT random();

// Base field (coordinates of curve points).

BaseFieldT baseFromBytes(ripple::Slice bytes);
Bytes32 baseToBytes(BaseFieldT const& element);
BaseFieldT baseFromDecimal(std::string const& text);

} // namespace field

} // namespace zkp
} // namespace shieldpool
