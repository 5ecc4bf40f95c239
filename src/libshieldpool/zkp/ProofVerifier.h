#pragma once

#include <libshieldpool/zkp/ProofCodec.h>
#include <xrpl/json/json_value.h>
#include <memory>
#include <string>
#include <vector>

namespace shieldpool {
namespace zkp {

/**
 * Verify oracle for withdrawal proofs.
 */
class ProofVerifier {
public:
    virtual ~ProofVerifier() = default;

    /** False for a bad proof or the wrong number of public inputs. */
    virtual bool verify(Groth16Proof const& proof, std::vector<FieldT> const& publicInputs) const = 0;

    /** Whether a real verification key is behind this oracle. */
    virtual bool enabled() const = 0;
};

/**
 * Groth16 verification against a snarkjs verification key.
 */
class Groth16Verifier : public ProofVerifier {
public:
    static constexpr std::size_t publicInputCount = 8;

    using VerificationKey = libsnark::r1cs_gg_ppzksnark_verification_key<DefaultCurve>;

    explicit Groth16Verifier(VerificationKey vk);

    /**
     * Loads snarkjs verification_key.json.
     *
     * @throws std::runtime_error if the file cannot be read, is not a
     *         groth16/bn128 key for 8 public inputs, or holds a point that
     *         is not on the curve
     */
    static std::unique_ptr<Groth16Verifier> fromFile(std::string const& path);
    static std::unique_ptr<Groth16Verifier> fromJson(Json::Value const& json);

    bool verify(Groth16Proof const& proof, std::vector<FieldT> const& publicInputs) const override;
    bool enabled() const override { return true; }

    VerificationKey const& key() const { return vk_; }

private:
    VerificationKey vk_;
};

} // namespace zkp
} // namespace shieldpool
