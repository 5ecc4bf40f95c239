#include <libshieldpool/relay/RelayService.h>
#include <xrpl/beast/unit_test.h>
#include <xrpl/json/json_reader.h>
#include <xrpl/json/to_string.h>
#include <test/relay/RelayFixtures.h>
#include <string>

namespace shieldpool {

class RelayService_test : public beast::unit_test::suite
{
    using Request = relay::RelayService::Request;
    using Response = relay::RelayService::Response;

    struct Rig
    {
        test::PipelineRig pipeline;
        relay::RateLimiter limiter;
        relay::RelayService service;

        explicit Rig(unsigned perKey = 100)
            : limiter({std::chrono::seconds{60}, perKey, 1000})
            , service(pipeline.pipeline, limiter, test::nullJournal(), [] {
                return relay::RelayService::SystemClock::time_point{
                    std::chrono::milliseconds{1700000000123}};
            })
        {
        }

        Response
        get(std::string const& target, std::string const& remote = "10.0.0.1")
        {
            Request req{relay::http::verb::get, target, 11};
            return service.handle(req, remote);
        }

        Response
        post(std::string const& target, std::string body, std::string const& remote = "10.0.0.1")
        {
            Request req{relay::http::verb::post, target, 11};
            req.body() = std::move(body);
            req.prepare_payload();
            return service.handle(req, remote);
        }
    };

    static Json::Value
    parse(Response const& response)
    {
        Json::Value json;
        Json::Reader().parse(response.body(), json);
        return json;
    }

    static std::string
    withdrawBody(relay::WithdrawRequest const& r)
    {
        Json::Value json(Json::objectValue);
        json["proofData"] = r.proofData;
        json["merkleRoot"] = r.merkleRoot;
        json["nullifierHash"] = r.nullifierHash;
        json["recipient"] = r.recipient;
        json["amount"] = r.amount;
        json["assetId"] = r.assetId;
        json["mint"] = r.mint;
        return Json::to_string(json);
    }

public:
    void
    run() override
    {
        testHealthAndStatus();
        testQuote();
        testRouting();
        testWithdraw();
        testRateLimit();
    }

    void
    testHealthAndStatus()
    {
        testcase("health, status and assets");

        Rig rig;
        auto const health = rig.get("/health");
        BEAST_EXPECT(health.result() == relay::http::status::ok);
        BEAST_EXPECT(health[relay::http::field::content_type] == "application/json");
        // the millisecond timestamp does not fit a 32-bit JSON integer, so
        // check the text rather than reading it back
        auto const& h = health.body();
        BEAST_EXPECT(h.find("\"status\":\"ok\"") != std::string::npos);
        BEAST_EXPECT(h.find("\"timestamp\":1700000000123") != std::string::npos);
        BEAST_EXPECT(h.find("\"proofVerificationEnabled\":true") != std::string::npos);

        auto const s = parse(rig.get("/status"));
        BEAST_EXPECT(s["active"].asBool());
        BEAST_EXPECT(
            s["operator"].asString() ==
            ledger::toBase58(rig.pipeline.operatorKey.publicKey()));
        BEAST_EXPECT(s["feeBps"].asUInt() == 50);
        BEAST_EXPECT(s["totalTransactions"].asUInt() == 0);
        BEAST_EXPECT(s["totalFeesEarned"].asString() == "0");
        BEAST_EXPECT(s["supportedAssets"].size() == 1);
        BEAST_EXPECT(s["supportedAssets"][0u].asString() == test::wsolAssetHex);

        auto const a = parse(rig.get("/assets"));
        BEAST_EXPECT(a["assets"].size() == 1);
        BEAST_EXPECT(a["assets"][0u].asString() == test::wsolAssetHex);
    }

    void
    testQuote()
    {
        testcase("quote");

        Rig rig;
        auto const ok = rig.get("/quote?amount=100000000");
        BEAST_EXPECT(ok.result() == relay::http::status::ok);
        auto const q = parse(ok);
        BEAST_EXPECT(q["amount"].asString() == "100000000");
        BEAST_EXPECT(q["fee"].asString() == "500000");
        BEAST_EXPECT(q["feeBps"].asUInt() == 50);
        BEAST_EXPECT(q["netAmount"].asString() == "99500000");

        auto const zero = parse(rig.get("/quote"));
        BEAST_EXPECT(zero["amount"].asString() == "0");
        BEAST_EXPECT(zero["fee"].asString() == "0");

        auto const big = parse(rig.get("/quote?x=1&amount=18446744073709551615"));
        BEAST_EXPECT(big["fee"].asString() == "92233720368547758");
        BEAST_EXPECT(big["netAmount"].asString() == "18354510353341003857");

        for (char const* target :
             {"/quote?amount=abc", "/quote?amount=-1", "/quote?amount=", "/quote?amount=1e6",
              "/quote?amount=18446744073709551616"})
        {
            auto const r = rig.get(target);
            BEAST_EXPECT(r.result() == relay::http::status::bad_request);
            BEAST_EXPECT(parse(r)["error"].asString() == "Invalid amount");
        }
    }

    void
    testRouting()
    {
        testcase("routing");

        Rig rig;
        auto const missing = rig.get("/nope");
        BEAST_EXPECT(missing.result() == relay::http::status::not_found);
        BEAST_EXPECT(parse(missing)["error"].asString() == "Not found");

        BEAST_EXPECT(rig.post("/health", "{}").result() == relay::http::status::method_not_allowed);
        BEAST_EXPECT(rig.get("/withdraw").result() == relay::http::status::method_not_allowed);

        auto const large = rig.post("/withdraw", std::string(relay::RelayService::maxBodySize + 1, ' '));
        BEAST_EXPECT(large.result() == relay::http::status::payload_too_large);
        BEAST_EXPECT(rig.pipeline.ledger.calls() == 0);
    }

    void
    testWithdraw()
    {
        testcase("withdraw");

        Rig rig;

        for (char const* body : {"not json", "[1,2]", "\"text\""})
        {
            auto const r = rig.post("/withdraw", body);
            BEAST_EXPECT(r.result() == relay::http::status::bad_request);
            auto const j = parse(r);
            BEAST_EXPECT(!j["success"].asBool());
            BEAST_EXPECT(j["error"].asString() == "Request body must be a JSON object");
            BEAST_EXPECT(j["category"].asString() == "VALIDATION_ERROR");
        }

        auto request = test::validRequest();
        request.amount = "12";
        auto const invalid = rig.post("/withdraw", withdrawBody(request));
        BEAST_EXPECT(invalid.result() == relay::http::status::bad_request);
        BEAST_EXPECT(parse(invalid)["error"].asString() == "Amount below minimum withdrawal");

        rig.pipeline.ledger.submitOutcomes = {"sig-ok"};
        auto const accepted = rig.post("/withdraw", withdrawBody(test::validRequest()));
        BEAST_EXPECT(accepted.result() == relay::http::status::ok);
        auto const j = parse(accepted);
        BEAST_EXPECT(j["success"].asBool());
        BEAST_EXPECT(j["signature"].asString() == "sig-ok");

        auto const replay = rig.post("/withdraw", withdrawBody(test::validRequest()));
        BEAST_EXPECT(replay.result() == relay::http::status::conflict);
        BEAST_EXPECT(parse(replay)["error"].asString() == "Nullifier already spent");

        auto const s = parse(rig.get("/status"));
        BEAST_EXPECT(s["totalTransactions"].asUInt() == 1);
        BEAST_EXPECT(s["totalFeesEarned"].asString() == "500000");

        Rig down;
        down.pipeline.ledger.accountError = "rpc http status 503";
        auto const unavailable = down.post("/withdraw", withdrawBody(test::validRequest()));
        BEAST_EXPECT(unavailable.result() == relay::http::status::service_unavailable);
        BEAST_EXPECT(parse(unavailable)["category"].asString() == "TRANSIENT_RPC");
    }

    void
    testRateLimit()
    {
        testcase("rate limit");

        Rig rig(2);
        BEAST_EXPECT(rig.get("/health").result() == relay::http::status::ok);
        BEAST_EXPECT(rig.get("/assets").result() == relay::http::status::ok);
        auto const limited = rig.get("/health");
        BEAST_EXPECT(limited.result() == relay::http::status::too_many_requests);
        BEAST_EXPECT(parse(limited)["error"].asString() == "Too many requests, please slow down");

        // another caller is unaffected
        BEAST_EXPECT(rig.get("/health", "10.0.0.2").result() == relay::http::status::ok);

        // withdrawals are keyed by recipient, not by caller
        auto request = test::validRequest();
        request.amount = "1";
        auto const body = withdrawBody(request);
        BEAST_EXPECT(rig.post("/withdraw", body).result() == relay::http::status::bad_request);
        BEAST_EXPECT(rig.post("/withdraw", body, "10.0.0.3").result() == relay::http::status::bad_request);
        BEAST_EXPECT(rig.post("/withdraw", body, "10.0.0.4").result() == relay::http::status::too_many_requests);
    }
};

BEAST_DEFINE_TESTSUITE(RelayService, relay, shieldpool);

} // namespace shieldpool
