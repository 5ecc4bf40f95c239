#include "ProofVerifier.h"
#include <xrpl/json/json_reader.h>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace shieldpool {
namespace zkp {

namespace {

std::runtime_error keyError(std::string const& what) {
    return std::runtime_error("verification key: " + what);
}

BaseFieldT coordinate(Json::Value const& v, std::string const& name) {
    if (!v.isString())
        throw keyError(name + " is not a decimal string");
    try {
        return field::baseFromDecimal(v.asString());
    } catch (std::exception const& e) {
        throw keyError(name + ": " + e.what());
    }
}

// [x, y, z] in projective form with z either "1" or "0" (infinity).
libff::alt_bn128_G1 parseG1(Json::Value const& v, std::string const& name) {
    if (!v.isArray() || v.size() != 3)
        throw keyError(name + " must be [x, y, z]");

    auto const z = coordinate(v[2u], name + ".z");
    if (z.is_zero())
        return libff::alt_bn128_G1::zero();
    if (z != BaseFieldT::one())
        throw keyError(name + " is not affine");

    libff::alt_bn128_G1 point(coordinate(v[0u], name + ".x"), coordinate(v[1u], name + ".y"), BaseFieldT::one());
    if (!point.is_well_formed())
        throw keyError(name + " is not on the curve");
    return point;
}

BaseFieldT2 extension(Json::Value const& v, std::string const& name) {
    if (!v.isArray() || v.size() != 2)
        throw keyError(name + " must be [c0, c1]");
    return BaseFieldT2(coordinate(v[0u], name + ".c0"), coordinate(v[1u], name + ".c1"));
}

libff::alt_bn128_G2 parseG2(Json::Value const& v, std::string const& name) {
    if (!v.isArray() || v.size() != 3)
        throw keyError(name + " must be [x, y, z]");

    auto const z = extension(v[2u], name + ".z");
    if (z.is_zero())
        return libff::alt_bn128_G2::zero();
    if (z != BaseFieldT2::one())
        throw keyError(name + " is not affine");

    libff::alt_bn128_G2 point(extension(v[0u], name + ".x"), extension(v[1u], name + ".y"), BaseFieldT2::one());
    if (!point.is_well_formed())
        throw keyError(name + " is not on the curve");
    return point;
}

} // namespace

Groth16Verifier::Groth16Verifier(VerificationKey vk) : vk_(std::move(vk)) {}

std::unique_ptr<Groth16Verifier> Groth16Verifier::fromFile(std::string const& path) {
    std::ifstream file(path);
    if (!file)
        throw keyError("cannot open " + path);

    std::stringstream contents;
    contents << file.rdbuf();

    Json::Value json;
    Json::Reader reader;
    if (!reader.parse(contents.str(), json))
        throw keyError(path + " is not valid JSON");

    return fromJson(json);
}

std::unique_ptr<Groth16Verifier> Groth16Verifier::fromJson(Json::Value const& json) {
    initCurveParameters();

    if (!json.isObject())
        throw keyError("expected a JSON object");
    if (json["protocol"].asString() != "groth16")
        throw keyError("protocol must be groth16");
    if (json["curve"].asString() != "bn128")
        throw keyError("curve must be bn128");
    if (!json["nPublic"].isIntegral() || json["nPublic"].asUInt() != publicInputCount)
        throw keyError("nPublic must be " + std::to_string(publicInputCount));

    auto const& ic = json["IC"];
    if (!ic.isArray() || ic.size() != publicInputCount + 1)
        throw keyError("IC must hold " + std::to_string(publicInputCount + 1) + " points");

    auto const alpha = parseG1(json["vk_alpha_1"], "vk_alpha_1");
    auto const beta = parseG2(json["vk_beta_2"], "vk_beta_2");
    auto gamma = parseG2(json["vk_gamma_2"], "vk_gamma_2");
    auto delta = parseG2(json["vk_delta_2"], "vk_delta_2");

    auto first = parseG1(ic[0u], "IC[0]");
    std::vector<libff::alt_bn128_G1> rest;
    rest.reserve(publicInputCount);
    for (Json::UInt i = 1; i < ic.size(); ++i)
        rest.push_back(parseG1(ic[i], "IC[" + std::to_string(i) + "]"));

    VerificationKey vk(
        DefaultCurve::reduced_pairing(alpha, beta),
        gamma,
        delta,
        libsnark::accumulation_vector<libff::alt_bn128_G1>(std::move(first), std::move(rest)));

    return std::make_unique<Groth16Verifier>(std::move(vk));
}

bool Groth16Verifier::verify(Groth16Proof const& proof, std::vector<FieldT> const& publicInputs) const {
    if (publicInputs.size() != publicInputCount)
        return false;

    auto const snark = proof.toLibsnark();
    if (!snark.is_well_formed())
        return false;

    libsnark::r1cs_primary_input<FieldT> primaryInput(publicInputs.begin(), publicInputs.end());
    return libsnark::r1cs_gg_ppzksnark_verifier_strong_IC<DefaultCurve>(vk_, primaryInput, snark);
}

} // namespace zkp
} // namespace shieldpool
