#include "ProofCodec.h"
#include "ZkError.h"
#include <xrpl/basics/StringUtilities.h>
#include <algorithm>
#include <stdexcept>
#include <string>

namespace shieldpool {
namespace zkp {

namespace {

// Generator of G2 as used by alt_bn128 (EIP-197).
constexpr char G2_X_C0[] = "1800DEEF121F1E76426A00665E5C4479674322D4F75EDADD46DEBD5CD992F6ED";
constexpr char G2_X_C1[] = "198E9393920D483A7260BFB731FB5D25F1AA493335A9E71297E485B7AEF312C2";
constexpr char G2_Y_C0[] = "12C85EA5DB8C6DEB4AAB71808DCB408FE3D1E7690C43D37B4CE6CC0166FA7DAA";
constexpr char G2_Y_C1[] = "090689D0585FF075EC9E99AD690C3395BC4B313370B38EF355ACDADCD122975B";

// Expected encoding of the proof (G1, G2, G1) under kVerifierEncoding.
constexpr char GENERATOR_VECTOR[] =
    "0000000000000000000000000000000000000000000000000000000000000001"
    "0000000000000000000000000000000000000000000000000000000000000002"
    "198E9393920D483A7260BFB731FB5D25F1AA493335A9E71297E485B7AEF312C2"
    "1800DEEF121F1E76426A00665E5C4479674322D4F75EDADD46DEBD5CD992F6ED"
    "090689D0585FF075EC9E99AD690C3395BC4B313370B38EF355ACDADCD122975B"
    "12C85EA5DB8C6DEB4AAB71808DCB408FE3D1E7690C43D37B4CE6CC0166FA7DAA"
    "0000000000000000000000000000000000000000000000000000000000000001"
    "0000000000000000000000000000000000000000000000000000000000000002";

BaseFieldT coordinate(char const* hex) {
    uint256 value;
    if (!value.parseHex(hex))
        throw std::logic_error("bad coordinate constant");
    return field::baseFromBytes(ripple::Slice(value.data(), value.size()));
}

bool isInfinity(G1Point const& p) {
    return p.x.is_zero() && p.y.is_zero();
}

bool isInfinity(G2Point const& p) {
    return p.x.c0.is_zero() && p.x.c1.is_zero() && p.y.c0.is_zero() && p.y.c1.is_zero();
}

void put(ProofCodec::Bytes& out, std::size_t offset, BaseFieldT const& value) {
    auto const bytes = field::baseToBytes(value);
    std::copy(bytes.begin(), bytes.end(), out.begin() + offset);
}

BaseFieldT get(ripple::Slice bytes, std::size_t offset) {
    return field::baseFromBytes(ripple::Slice(bytes.data() + offset, 32));
}

void putExtension(ProofCodec::Bytes& out, std::size_t offset, BaseFieldT2 const& value) {
    auto const& first = kVerifierEncoding.extensionComponent1First ? value.c1 : value.c0;
    auto const& second = kVerifierEncoding.extensionComponent1First ? value.c0 : value.c1;
    put(out, offset, first);
    put(out, offset + 32, second);
}

BaseFieldT2 getExtension(ripple::Slice bytes, std::size_t offset) {
    auto const first = get(bytes, offset);
    auto const second = get(bytes, offset + 32);
    if (kVerifierEncoding.extensionComponent1First)
        return BaseFieldT2(second, first);
    return BaseFieldT2(first, second);
}

// Optional y negation of A; the point at infinity is left alone.
G1Point adjustA(G1Point const& a) {
    if (!kVerifierEncoding.negateA || isInfinity(a))
        return a;
    return G1Point{a.x, -a.y};
}

template <typename Point>
Point affine(Point p) {
    p.to_affine_coordinates();
    return p;
}

} // namespace

libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve> Groth16Proof::toLibsnark() const {
    initCurveParameters();

    auto g1 = [](G1Point const& p) {
        if (isInfinity(p))
            return libff::alt_bn128_G1::zero();
        return libff::alt_bn128_G1(p.x, p.y, BaseFieldT::one());
    };
    auto g2 = [](G2Point const& p) {
        if (isInfinity(p))
            return libff::alt_bn128_G2::zero();
        return libff::alt_bn128_G2(p.x, p.y, BaseFieldT2::one());
    };

    return libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve>(g1(a), g2(b), g1(c));
}

Groth16Proof Groth16Proof::fromLibsnark(libsnark::r1cs_gg_ppzksnark_proof<DefaultCurve> const& proof) {
    auto g1 = [](libff::alt_bn128_G1 const& p) {
        if (p.is_zero())
            return G1Point{BaseFieldT::zero(), BaseFieldT::zero()};
        auto const q = affine(p);
        return G1Point{q.X, q.Y};
    };
    auto g2 = [](libff::alt_bn128_G2 const& p) {
        if (p.is_zero())
            return G2Point{BaseFieldT2::zero(), BaseFieldT2::zero()};
        auto const q = affine(p);
        return G2Point{q.X, q.Y};
    };

    return Groth16Proof{g1(proof.g_A), g2(proof.g_B), g1(proof.g_C)};
}

ProofCodec::Bytes ProofCodec::serialize(Groth16Proof const& proof) {
    Bytes out{};
    auto const a = adjustA(proof.a);

    put(out, 0, a.x);
    put(out, 32, a.y);
    putExtension(out, 64, proof.b.x);
    putExtension(out, 128, proof.b.y);
    put(out, 192, proof.c.x);
    put(out, 224, proof.c.y);
    return out;
}

Groth16Proof ProofCodec::deserialize(ripple::Slice bytes) {
    if (bytes.size() != proofSize) {
        throw InvalidLengthError(
            "proof must be " + std::to_string(proofSize) + " bytes, got " +
            std::to_string(bytes.size()));
    }

    Groth16Proof proof;
    // negation is its own inverse
    proof.a = adjustA(G1Point{get(bytes, 0), get(bytes, 32)});
    proof.b = G2Point{getExtension(bytes, 64), getExtension(bytes, 128)};
    proof.c = G1Point{get(bytes, 192), get(bytes, 224)};
    return proof;
}

G1Point ProofCodec::g1Generator() {
    initCurveParameters();
    return G1Point{BaseFieldT::one(), BaseFieldT::one() + BaseFieldT::one()};
}

G2Point ProofCodec::g2Generator() {
    return G2Point{
        BaseFieldT2(coordinate(G2_X_C0), coordinate(G2_X_C1)),
        BaseFieldT2(coordinate(G2_Y_C0), coordinate(G2_Y_C1))};
}

void ProofCodec::selfTest() {
    initCurveParameters();

    auto const g1 = g1Generator();
    auto const g2 = g2Generator();

    // The pinned coordinates must be the generators libff pairs with,
    // otherwise c0/c1 would be swapped relative to the verifier.
    auto const libG1 = affine(libff::alt_bn128_G1::one());
    auto const libG2 = affine(libff::alt_bn128_G2::one());
    if (libG1.X != g1.x || libG1.Y != g1.y)
        throw std::runtime_error("proof codec self-test: G1 generator mismatch");
    if (libG2.X != g2.x || libG2.Y != g2.y)
        throw std::runtime_error("proof codec self-test: G2 generator mismatch");

    Groth16Proof const proof{g1, g2, g1};
    auto const encoded = serialize(proof);

    auto const expected = ripple::strUnHex(GENERATOR_VECTOR);
    if (!expected || expected->size() != proofSize ||
        !std::equal(encoded.begin(), encoded.end(), expected->begin())) {
        throw std::runtime_error("proof codec self-test: generator encoding mismatch");
    }

    if (deserialize(ripple::Slice(encoded.data(), encoded.size())) != proof)
        throw std::runtime_error("proof codec self-test: round trip mismatch");
}

} // namespace zkp
} // namespace shieldpool
