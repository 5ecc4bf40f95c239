#include <libshieldpool/relay/RelayPipeline.h>
#include <libshieldpool/zkp/AssetId.h>
#include <xrpl/beast/unit_test.h>
#include <test/relay/RelayFixtures.h>
#include <cctype>
#include <string>

namespace shieldpool {

class RelayPipeline_test : public beast::unit_test::suite
{
    using ErrorCategory = relay::ErrorCategory;

    void
    expectRejected(
        relay::WithdrawResult const& r,
        ErrorCategory category,
        std::string const& message)
    {
        BEAST_EXPECT(!r.accepted);
        BEAST_EXPECT(!r.signature);
        BEAST_EXPECT(r.category && *r.category == category);
        expect(r.error && *r.error == message, r.error ? *r.error : "no error");
    }

public:
    void
    run() override
    {
        testValidation();
        testAmounts();
        testAssetGate();
        testVerification();
        testDoubleSpend();
        testLedgerUnavailable();
        testSubmission();
        testFee();
        testRequestJson();
    }

    void
    testValidation()
    {
        testcase("structural validation");

        struct Case
        {
            void (*mutate)(relay::WithdrawRequest&);
            char const* message;
        };
        Case const cases[] = {
            {[](relay::WithdrawRequest& r) { r.proofData = std::string(510, '0'); },
             "Invalid proof data (must be 256 bytes hex)"},
            {[](relay::WithdrawRequest& r) { r.proofData[7] = 'g'; }, "Invalid proof data (must be 256 bytes hex)"},
            {[](relay::WithdrawRequest& r) { r.merkleRoot = "0x" + r.merkleRoot.substr(2); },
             "Invalid merkle root (must be 32 bytes hex)"},
            {[](relay::WithdrawRequest& r) { r.nullifierHash.clear(); },
             "Invalid nullifier hash (must be 32 bytes hex)"},
            {[](relay::WithdrawRequest& r) { r.assetId += "00"; }, "Invalid asset ID (must be 32 bytes hex)"},
            {[](relay::WithdrawRequest& r) { r.recipient = "not-a-key"; }, "Invalid recipient public key"},
            {[](relay::WithdrawRequest& r) { r.recipient = "3yZe7d"; }, "Invalid recipient public key"},
            {[](relay::WithdrawRequest& r) { r.mint.clear(); }, "Invalid mint public key"},
            {[](relay::WithdrawRequest& r) { r.merkleRoot = std::string(64, '0'); },
             "Invalid merkle root (must be nonzero)"},
            {[](relay::WithdrawRequest& r) { r.nullifierHash = std::string(64, '0'); },
             "Invalid nullifier hash (must be nonzero)"},
        };

        for (auto const& c : cases)
        {
            test::PipelineRig rig;
            auto request = test::validRequest();
            c.mutate(request);
            expectRejected(rig.pipeline.process(request), ErrorCategory::Validation, c.message);

            // nothing cryptographic or remote for a malformed request
            BEAST_EXPECT(rig.verifier.calls == 0);
            BEAST_EXPECT(rig.ledger.calls() == 0);
        }
    }

    void
    testAmounts()
    {
        testcase("amount bounds");

        struct Case
        {
            char const* amount;
            char const* message;
        };
        Case const cases[] = {
            {"", "Invalid amount"},
            {"0", "Invalid amount"},
            {"-5", "Invalid amount"},
            {"1.5", "Invalid amount"},
            {"abc", "Invalid amount"},
            {"99999999999999999999999", "Invalid amount"},
            {"18446744073709551616", "Invalid amount"},
            {"999999", "Amount below minimum withdrawal"},
            {"1000000000001", "Amount above maximum withdrawal"},
        };

        for (auto const& c : cases)
        {
            test::PipelineRig rig;
            auto request = test::validRequest();
            request.amount = c.amount;
            expectRejected(rig.pipeline.process(request), ErrorCategory::Validation, c.message);
            BEAST_EXPECT(rig.verifier.calls == 0);
        }

        // both bounds are inclusive
        for (char const* amount : {"1000000", "1000000000000"})
        {
            test::PipelineRig rig;
            auto request = test::validRequest();
            request.amount = amount;
            BEAST_EXPECT(rig.pipeline.process(request).accepted);
        }
    }

    void
    testAssetGate()
    {
        testcase("asset gate");

        {
            relay::PipelineSetup setup;
            setup.supportedAssets.insert(ripple::uint256{7});
            test::PipelineRig rig(setup);
            expectRejected(
                rig.pipeline.process(test::validRequest()),
                ErrorCategory::Validation,
                "Asset not supported by this relayer");
            BEAST_EXPECT(rig.verifier.calls == 0);
        }
        {
            // supported, but claimed for the wrong mint
            auto const otherMint =
                *ledger::parseAddress("EPjFWdd5AufqSSqeM2qN1xzybapC8G4wEGGkZwyTDt1v");
            auto setup = test::PipelineRig::defaultSetup();
            setup.supportedAssets.insert(zkp::deriveAssetId(ledger::slice(otherMint)));
            test::PipelineRig rig(setup);

            auto request = test::validRequest();
            request.mint = ledger::toBase58(otherMint);
            request.assetId = test::wsolAssetHex;
            expectRejected(
                rig.pipeline.process(request),
                ErrorCategory::Validation,
                "Asset ID does not match mint");
            BEAST_EXPECT(rig.verifier.calls == 0);
        }
        {
            // hex case does not matter
            test::PipelineRig rig;
            auto request = test::validRequest();
            for (auto& ch : request.assetId)
                ch = static_cast<char>(std::toupper(static_cast<unsigned char>(ch)));
            BEAST_EXPECT(rig.pipeline.process(request).accepted);
        }
    }

    void
    testVerification()
    {
        testcase("local verification");

        {
            test::PipelineRig rig;
            auto request = test::validRequest();
            request.merkleRoot = std::string(64, 'f');
            expectRejected(
                rig.pipeline.process(request),
                ErrorCategory::Validation,
                "Public input is not a field element");
            BEAST_EXPECT(rig.verifier.calls == 0);
        }
        {
            // first coordinate above the base field modulus
            test::PipelineRig rig;
            auto request = test::validRequest();
            request.proofData.replace(0, 64, std::string(64, 'f'));
            expectRejected(
                rig.pipeline.process(request), ErrorCategory::Validation, "Invalid proof encoding");
            BEAST_EXPECT(rig.verifier.calls == 0);
        }
        {
            test::PipelineRig rig;
            rig.verifier.verdict = false;
            expectRejected(
                rig.pipeline.process(test::validRequest()),
                ErrorCategory::Validation,
                "Proof verification failed");
            BEAST_EXPECT(rig.verifier.calls == 1);
            BEAST_EXPECT(rig.ledger.calls() == 0);
            BEAST_EXPECT(rig.pipeline.totalTransactions() == 0);
        }
        {
            test::PipelineRig rig;
            auto const request = test::validRequest();
            BEAST_EXPECT(rig.pipeline.process(request).accepted);

            auto const& in = rig.verifier.lastInputs;
            BEAST_EXPECT(in.size() == 8);
            if (in.size() == 8)
            {
                ripple::uint256 root;
                (void)root.parseHex(request.merkleRoot);
                BEAST_EXPECT(in[0] == zkp::field::fromUint256(root));
                BEAST_EXPECT(in[2] == zkp::field::fromUint256(test::wsolAsset()));
                BEAST_EXPECT(
                    in[3] ==
                    zkp::addressToScalar(
                        ledger::slice(*ledger::parseAddress(request.recipient))));
                BEAST_EXPECT(in[4] == zkp::field::fromUint64(100000000));
                BEAST_EXPECT(
                    in[5] == zkp::addressToScalar(ledger::slice(rig.operatorKey.publicKey())));
                BEAST_EXPECT(in[6] == zkp::field::fromUint64(500000));
                BEAST_EXPECT(in[7] == zkp::FieldT::zero());
            }
        }
    }

    void
    testDoubleSpend()
    {
        testcase("double spend");

        auto const request = test::validRequest();
        ripple::uint256 nullifier;
        (void)nullifier.parseHex(request.nullifierHash);

        {
            test::PipelineRig rig;
            rig.cache.markSpent(nullifier);
            expectRejected(
                rig.pipeline.process(request),
                ErrorCategory::StateConflict,
                "Nullifier already spent");
            BEAST_EXPECT(rig.ledger.accountCalls == 0);
            BEAST_EXPECT(rig.ledger.submitCalls == 0);
        }
        {
            test::PipelineRig rig;
            rig.ledger.existing.push_back(rig.pool.nullifierMarker(nullifier));
            expectRejected(
                rig.pipeline.process(request),
                ErrorCategory::StateConflict,
                "Nullifier already spent");
            BEAST_EXPECT(rig.ledger.accountCalls == 1);
            BEAST_EXPECT(rig.ledger.submitCalls == 0);
            BEAST_EXPECT(rig.cache.lookup(nullifier).has_value());

            // the second attempt is answered from the cache
            rig.pipeline.process(request);
            BEAST_EXPECT(rig.ledger.accountCalls == 1);
        }
    }

    void
    testLedgerUnavailable()
    {
        testcase("ledger unavailable");

        test::PipelineRig rig;
        rig.ledger.accountError = "network error: timeout during connect";
        expectRejected(
            rig.pipeline.process(test::validRequest()),
            ErrorCategory::TransientNetwork,
            "Ledger temporarily unavailable, try again later");
        BEAST_EXPECT(rig.ledger.submitCalls == 0);
    }

    void
    testSubmission()
    {
        testcase("submission");

        auto const request = test::validRequest();
        ripple::uint256 nullifier;
        (void)nullifier.parseHex(request.nullifierHash);

        {
            test::PipelineRig rig;
            rig.ledger.submitOutcomes = {"sig-1"};
            auto const r = rig.pipeline.process(request);
            BEAST_EXPECT(r.accepted);
            BEAST_EXPECT(r.signature && *r.signature == "sig-1");
            BEAST_EXPECT(!r.error && !r.category);
            BEAST_EXPECT(rig.pipeline.totalTransactions() == 1);
            BEAST_EXPECT(rig.pipeline.totalFeesEarned() == 500000);
            BEAST_EXPECT(rig.cache.lookup(nullifier).has_value());

            // replay is refused without touching the ledger
            auto const accountCalls = rig.ledger.accountCalls;
            expectRejected(
                rig.pipeline.process(request),
                ErrorCategory::StateConflict,
                "Nullifier already spent");
            BEAST_EXPECT(rig.ledger.accountCalls == accountCalls);
            BEAST_EXPECT(rig.pipeline.totalTransactions() == 1);
        }
        {
            test::PipelineRig rig;
            rig.ledger.submitOutcomes = {"!Blockhash not found", "!rpc http status 503", "sig-3"};
            auto const r = rig.pipeline.process(request);
            BEAST_EXPECT(r.accepted && *r.signature == "sig-3");
            BEAST_EXPECT(rig.ledger.submitCalls == 3);
            // a fresh blockhash for every attempt
            BEAST_EXPECT(rig.ledger.blockhashCalls == 3);
            BEAST_EXPECT(rig.sleeps.size() == 2);
        }
        {
            test::PipelineRig rig;
            rig.ledger.submitOutcomes = {
                "!Transaction simulation failed: custom program error: 0x1770"};
            expectRejected(
                rig.pipeline.process(request),
                ErrorCategory::Validation,
                "Transaction rejected by the ledger");
            BEAST_EXPECT(rig.ledger.submitCalls == 1);
            BEAST_EXPECT(rig.pipeline.totalTransactions() == 0);
            BEAST_EXPECT(!rig.cache.lookup(nullifier).has_value());
        }
        {
            test::PipelineRig rig;
            rig.ledger.submitOutcomes = {"!insufficient lamports 5000, need 2039280"};
            expectRejected(
                rig.pipeline.process(request),
                ErrorCategory::Resource,
                "Relayer cannot cover this withdrawal right now");
        }
        {
            test::PipelineRig rig;
            rig.ledger.submitOutcomes = {"!boom", "!boom", "!boom"};
            expectRejected(
                rig.pipeline.process(request), ErrorCategory::Unknown, "Withdrawal failed");
            BEAST_EXPECT(rig.ledger.submitCalls == 3);
        }
    }

    void
    testFee()
    {
        testcase("fee");

        test::PipelineRig rig;
        BEAST_EXPECT(rig.pipeline.fee(100000000) == 500000);
        BEAST_EXPECT(rig.pipeline.fee(199) == 0);
        BEAST_EXPECT(rig.pipeline.fee(1999999) == 9999);
        BEAST_EXPECT(rig.pipeline.fee(0) == 0);

        relay::PipelineSetup setup = test::PipelineRig::defaultSetup();
        setup.feeBps = 0;
        test::PipelineRig noFee(setup);
        BEAST_EXPECT(noFee.pipeline.fee(1000000000000) == 0);
        BEAST_EXPECT(noFee.pipeline.process(test::validRequest()).accepted);
        BEAST_EXPECT(noFee.pipeline.totalFeesEarned() == 0);
    }

    void
    testRequestJson()
    {
        testcase("request and result JSON");

        Json::Value json(Json::objectValue);
        json["proofData"] = "ab";
        json["amount"] = 1500000;
        json["recipient"] = Json::Value(Json::arrayValue);
        auto const r = relay::WithdrawRequest::fromJson(json);
        BEAST_EXPECT(r.proofData == "ab");
        BEAST_EXPECT(r.amount == "1500000");
        BEAST_EXPECT(r.recipient.empty());
        BEAST_EXPECT(r.mint.empty());

        auto const ok = relay::WithdrawResult::accept("sig").toJson();
        BEAST_EXPECT(ok["success"].asBool());
        BEAST_EXPECT(ok["signature"].asString() == "sig");
        BEAST_EXPECT(!ok.isMember("error"));

        auto const bad =
            relay::WithdrawResult::reject(ErrorCategory::StateConflict, "Nullifier already spent")
                .toJson();
        BEAST_EXPECT(!bad["success"].asBool());
        BEAST_EXPECT(bad["error"].asString() == "Nullifier already spent");
        BEAST_EXPECT(bad["category"].asString() == "STATE_CONFLICT");
        BEAST_EXPECT(!bad.isMember("signature"));
    }
};

BEAST_DEFINE_TESTSUITE(RelayPipeline, relay, shieldpool);

} // namespace shieldpool
