#include <libshieldpool/zkp/ProofVerifier.h>
#include <xrpl/beast/unit_test.h>
#include <libff/common/profiling.hpp>
#include <libsnark/relations/constraint_satisfaction_problems/r1cs/examples/r1cs_examples.hpp>
#include <functional>
#include <string>

namespace shieldpool {

class ProofVerifier_test : public beast::unit_test::suite
{
    static Json::Value
    g1Generator()
    {
        Json::Value p(Json::arrayValue);
        p.append("1");
        p.append("2");
        p.append("1");
        return p;
    }

    static Json::Value
    pair(char const* c0, char const* c1)
    {
        Json::Value p(Json::arrayValue);
        p.append(c0);
        p.append(c1);
        return p;
    }

    static Json::Value
    g2Generator()
    {
        Json::Value p(Json::arrayValue);
        p.append(pair(
            "10857046999023057135944570762232829481370756359578518086990519993285655852781",
            "11559732032986387107991004021392285783925812861821192530917403151452391805634"));
        p.append(pair(
            "8495653923123431417604973247489272438418190587263600148770280649306958101930",
            "4082367875863433681332203403145435568316851327593401208105741076214120093531"));
        p.append(pair("1", "0"));
        return p;
    }

    // Structurally valid snarkjs key built from the generators.
    static Json::Value
    generatorKey()
    {
        Json::Value vk(Json::objectValue);
        vk["protocol"] = "groth16";
        vk["curve"] = "bn128";
        vk["nPublic"] = 8;
        vk["vk_alpha_1"] = g1Generator();
        vk["vk_beta_2"] = g2Generator();
        vk["vk_gamma_2"] = g2Generator();
        vk["vk_delta_2"] = g2Generator();
        Json::Value& ic = vk["IC"] = Json::Value(Json::arrayValue);
        for (int i = 0; i < 9; ++i)
            ic.append(g1Generator());
        return vk;
    }

    void
    expectRejected(std::string const& what, std::function<void(Json::Value&)> const& mutate)
    {
        auto vk = generatorKey();
        mutate(vk);
        try
        {
            zkp::Groth16Verifier::fromJson(vk);
            fail(what + " accepted");
        }
        catch (std::runtime_error const& e)
        {
            BEAST_EXPECT(std::string(e.what()).find("verification key") == 0);
        }
    }

public:
    void
    run() override
    {
        libff::inhibit_profiling_info = true;
        libff::inhibit_profiling_counters = true;

        testKeyLoading();
        testVerify();
    }

    void
    testKeyLoading()
    {
        testcase("verification key loading");
        using namespace zkp;

        auto const verifier = Groth16Verifier::fromJson(generatorKey());
        BEAST_EXPECT(verifier->enabled());
        BEAST_EXPECT(verifier->key().gamma_g2 == libff::alt_bn128_G2::one());
        BEAST_EXPECT(verifier->key().gamma_ABC_g1.rest.size() == 8);

        expectRejected("plonk", [](Json::Value& vk) { vk["protocol"] = "plonk"; });
        expectRejected("bls12", [](Json::Value& vk) { vk["curve"] = "bls12381"; });
        expectRejected("nPublic", [](Json::Value& vk) { vk["nPublic"] = 7; });
        expectRejected("short IC", [](Json::Value& vk) {
            Json::Value ic(Json::arrayValue);
            for (int i = 0; i < 8; ++i)
                ic.append(g1Generator());
            vk["IC"] = ic;
        });
        expectRejected("off curve", [](Json::Value& vk) { vk["vk_alpha_1"][1u] = "3"; });
        expectRejected("projective", [](Json::Value& vk) { vk["IC"][2u][2u] = "2"; });
        expectRejected("numeric", [](Json::Value& vk) { vk["vk_alpha_1"][0u] = 1; });
        expectRejected("g2 shape", [](Json::Value& vk) { vk["vk_delta_2"][0u] = "1"; });
        expectRejected("not an object", [](Json::Value& vk) { vk = Json::Value(Json::arrayValue); });

        except<std::runtime_error>([] { Groth16Verifier::fromFile("/nonexistent/verification_key.json"); });
    }

    void
    testVerify()
    {
        testcase("groth16 verification");
        using namespace zkp;

        initCurveParameters();

        auto const example = libsnark::generate_r1cs_example_with_field_input<FieldT>(
            32, Groth16Verifier::publicInputCount);
        auto const keypair =
            libsnark::r1cs_gg_ppzksnark_generator<DefaultCurve>(example.constraint_system);
        auto const snark = libsnark::r1cs_gg_ppzksnark_prover<DefaultCurve>(
            keypair.pk, example.primary_input, example.auxiliary_input);

        Groth16Verifier const verifier(keypair.vk);
        std::vector<FieldT> inputs(example.primary_input.begin(), example.primary_input.end());

        // through the wire format and back
        auto const bytes = ProofCodec::serialize(Groth16Proof::fromLibsnark(snark));
        auto const proof = ProofCodec::deserialize(ripple::Slice(bytes.data(), bytes.size()));
        BEAST_EXPECT(verifier.verify(proof, inputs));

        auto tampered = inputs;
        tampered[3] += FieldT::one();
        BEAST_EXPECT(!verifier.verify(proof, tampered));

        auto shorter = inputs;
        shorter.pop_back();
        BEAST_EXPECT(!verifier.verify(proof, shorter));

        auto swapped = proof;
        std::swap(swapped.a, swapped.c);
        BEAST_EXPECT(!verifier.verify(swapped, inputs));

        auto offCurve = proof;
        offCurve.a.y += BaseFieldT::one();
        BEAST_EXPECT(!verifier.verify(offCurve, inputs));
    }
};

BEAST_DEFINE_TESTSUITE(ProofVerifier, zkp, shieldpool);

} // namespace shieldpool
