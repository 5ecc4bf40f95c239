#pragma once

#include <libshieldpool/zkp/FieldElement.h>
#include <libsnark/zk_proof_systems/ppzksnark/r1cs_gg_ppzksnark/r1cs_gg_ppzksnark.hpp>
#include <array>
#include <cstdint>

namespace shieldpool {
namespace zkp {

using BaseFieldT2 = libff::alt_bn128_Fq2;

// Affine points. (0, 0) stands for the point at infinity.
struct G1Point {
    BaseFieldT x;
    BaseFieldT y;

    bool operator==(G1Point const& o) const { return x == o.x && y == o.y; }
    bool operator!=(G1Point const& o) const { return !(*this == o); }
};

struct G2Point {
    BaseFieldT2 x;
    BaseFieldT2 y;

    bool operator==(G2Point const& o) const { return x == o.x && y == o.y; }
    bool operator!=(G2Point const& o) const { return !(*this == o); }
};

/**
 * Groth16 proof: A, C in G1 and B in G2
 */
struct Groth16Proof {
    G1Point a;
    G2Point b;
    G1Point c;

    bool operator==(Groth16Proof const& o) const { return a == o.a && b == o.b && c == o.c; }
    bool operator!=(Groth16Proof const& o) const { return !(*this == o); }

    libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve> toLibsnark() const;
    static Groth16Proof fromLibsnark(libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve> const& proof);
};

/**
 * Byte conventions of the on-ledger verifier.
 *
 * The pool's verifier reads extension-field coordinates with component 1
 * (the imaginary part) first and negates A itself before pairing, so proofs
 * travel with A as produced by the prover.
 */
struct ProofEncoding {
    bool extensionComponent1First;
    bool negateA;
};

constexpr ProofEncoding kVerifierEncoding{true, false};

/**
 * Fixed 256-byte layout:
 *
 *   0   A.x        32  A.y
 *   64  B.x[1]     96  B.x[0]
 *   128 B.y[1]     160 B.y[0]
 *   192 C.x        224 C.y
 *
 * All coordinates big-endian. The order inside B follows kVerifierEncoding.
 */
class ProofCodec {
public:
    static constexpr std::size_t proofSize = 256;
    using Bytes = std::array<std::uint8_t, proofSize>;

    static Bytes serialize(Groth16Proof const& proof);

    /**
     * @throws InvalidLengthError unless exactly 256 bytes
     * @throws OutOfRangeError if a coordinate is not below the base field modulus
     */
    static Groth16Proof deserialize(ripple::Slice bytes);

    /**
     * Encodes the curve generators and compares against the pinned vector.
     * Run once at startup.
     *
     * @throws std::runtime_error on mismatch
     */
    static void selfTest();

    static G1Point g1Generator();
    static G2Point g2Generator();
};

} // namespace zkp
} // namespace shieldpool
