#include <libshieldpool/ledger/SolanaLedger.h>
#include <xrpl/beast/unit_test.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/to_string.h>
#include <boost/property_tree/json_parser.hpp>
#include <deque>
#include <map>
#include <sstream>
#include <string>
#include <vector>

namespace shieldpool {

namespace {

beast::Journal
nullJournal()
{
    return beast::Journal{beast::Journal::getNullSink()};
}

// Answers calls from canned "result" payloads, one queue per method.
class FakeRpc : public ledger::RpcClient
{
public:
    FakeRpc() : RpcClient("http://127.0.0.1:8899", std::chrono::milliseconds(100), nullJournal())
    {
    }

    void
    respond(std::string const& method, std::string const& resultJson)
    {
        replies_[method].push_back(resultJson);
    }

    void
    fail(std::string const& method, std::string const& message)
    {
        replies_[method].push_back("!" + message);
    }

    boost::property_tree::ptree
    call(std::string const& method, Json::Value const& params) override
    {
        calls.push_back({method, Json::to_string(params)});

        auto& queue = replies_[method];
        if (queue.empty())
            throw ledger::LedgerError("no reply queued for " + method);

        auto const reply = queue.size() > 1 ? queue.front() : queue.back();
        if (queue.size() > 1)
            queue.pop_front();

        if (reply.front() == '!')
            throw ledger::LedgerError(reply.substr(1));

        std::istringstream in("{\"result\":" + reply + "}");
        boost::property_tree::ptree tree;
        boost::property_tree::read_json(in, tree);
        return tree.get_child("result");
    }

    std::vector<std::pair<std::string, std::string>> calls;

private:
    std::map<std::string, std::deque<std::string>> replies_;
};

std::string
statuses(std::string const& entry)
{
    return "{\"context\":{\"slot\":82},\"value\":[" + entry + "]}";
}

} // namespace

class SolanaLedger_test : public beast::unit_test::suite
{
    static constexpr char const* signature =
        "5VERv8NMvzbJMEkV8xnrLkEaWRtSz9CosKDYjCJjBRnbJLgp8uirBgmQpjKhoR4tjF3ZpRzrFmBV6UjKdiSZkQUW";

    ledger::SolanaLedger::Setup
    fastSetup(std::chrono::milliseconds confirmTimeout = std::chrono::milliseconds(5000))
    {
        ledger::SolanaLedger::Setup setup;
        setup.confirmTimeout = confirmTimeout;
        setup.pollInterval = std::chrono::milliseconds(0);
        return setup;
    }

public:
    void
    run() override
    {
        testBlockhash();
        testGetAccount();
        testSubmitConfirmed();
        testSubmitFailed();
        testSubmitExpired();
    }

    void
    testBlockhash()
    {
        testcase("latest blockhash");
        using namespace ledger;

        FakeRpc rpc;
        SolanaLedger ledger(rpc, fastSetup(), nullJournal());

        rpc.respond(
            "getLatestBlockhash",
            "{\"context\":{\"slot\":2792},\"value\":{\"blockhash\":"
            "\"EkSnNWid2cvwEVnVx9aBqawnmiCNiDgp3gUdkDPTKN1N\",\"lastValidBlockHeight\":3090}}");
        auto const hash = ledger.latestBlockhash();
        BEAST_EXPECT(toBase58(hash) == "EkSnNWid2cvwEVnVx9aBqawnmiCNiDgp3gUdkDPTKN1N");
        BEAST_EXPECT(rpc.calls.back().second.find("confirmed") != std::string::npos);

        FakeRpc broken;
        SolanaLedger other(broken, fastSetup(), nullJournal());
        broken.respond("getLatestBlockhash", "{\"value\":{\"blockhash\":\"not base58!\"}}");
        except<LedgerError>([&] { other.latestBlockhash(); });
    }

    void
    testGetAccount()
    {
        testcase("account lookup");
        using namespace ledger;

        FakeRpc rpc;
        SolanaLedger ledger(rpc, fastSetup(), nullJournal());

        rpc.respond("getAccountInfo", "{\"context\":{\"slot\":1},\"value\":null}");
        BEAST_EXPECT(!ledger.getAccount(systemProgramId()));

        FakeRpc rpc2;
        SolanaLedger ledger2(rpc2, fastSetup(), nullJournal());
        rpc2.respond(
            "getAccountInfo",
            "{\"context\":{\"slot\":1},\"value\":{\"data\":[\"YWJj\",\"base64\"],"
            "\"executable\":false,\"lamports\":890880,"
            "\"owner\":\"BmtMrkgvVML9Gk7Bt6JRqweHAwW69oFTohaBRaLbgqpb\","
            "\"rentEpoch\":18446744073709551615,\"space\":3}}");
        auto const account = ledger2.getAccount(systemProgramId());
        BEAST_EXPECT(account);
        if (!account)
            return;
        BEAST_EXPECT(account->lamports == 890880);
        BEAST_EXPECT(toBase58(account->owner) == "BmtMrkgvVML9Gk7Bt6JRqweHAwW69oFTohaBRaLbgqpb");
        BEAST_EXPECT((account->data == ripple::Blob{'a', 'b', 'c'}));
        BEAST_EXPECT(rpc2.calls.back().second.find("base64") != std::string::npos);

        FakeRpc rpc3;
        SolanaLedger ledger3(rpc3, fastSetup(), nullJournal());
        rpc3.respond("getAccountInfo", "{\"value\":{\"lamports\":\"lots\"}}");
        except<LedgerError>([&] { ledger3.getAccount(systemProgramId()); });
    }

    void
    testSubmitConfirmed()
    {
        testcase("submit and confirm");
        using namespace ledger;

        FakeRpc rpc;
        SolanaLedger ledger(rpc, fastSetup(), nullJournal());

        rpc.respond("sendTransaction", std::string("\"") + signature + "\"");
        rpc.respond("getSignatureStatuses", statuses("null"));
        rpc.respond(
            "getSignatureStatuses",
            statuses("{\"slot\":83,\"confirmations\":0,\"err\":null,"
                     "\"confirmationStatus\":\"processed\"}"));
        rpc.respond(
            "getSignatureStatuses",
            statuses("{\"slot\":83,\"confirmations\":1,\"err\":null,"
                     "\"confirmationStatus\":\"confirmed\"}"));

        std::uint8_t const wire[] = {'a', 'b', 'c'};
        BEAST_EXPECT(ledger.submitTransaction(ripple::Slice(wire, sizeof(wire))) == signature);

        BEAST_EXPECT(rpc.calls.size() == 4);
        BEAST_EXPECT(rpc.calls[0].first == "sendTransaction");
        BEAST_EXPECT(rpc.calls[0].second.find("\"YWJj\"") != std::string::npos);
        BEAST_EXPECT(rpc.calls[3].second.find(signature) != std::string::npos);

        FakeRpc rejecting;
        SolanaLedger other(rejecting, fastSetup(), nullJournal());
        rejecting.fail("sendTransaction", "Transaction simulation failed: Blockhash not found");
        except<LedgerError>([&] { other.submitTransaction(ripple::Slice(wire, sizeof(wire))); });
        BEAST_EXPECT(rejecting.calls.size() == 1);
    }

    void
    testSubmitFailed()
    {
        testcase("submit with instruction error");
        using namespace ledger;

        FakeRpc rpc;
        SolanaLedger ledger(rpc, fastSetup(), nullJournal());

        rpc.respond("sendTransaction", std::string("\"") + signature + "\"");
        rpc.respond(
            "getSignatureStatuses",
            statuses("{\"slot\":83,\"confirmations\":null,"
                     "\"err\":{\"InstructionError\":[0,{\"Custom\":6001}]},"
                     "\"confirmationStatus\":\"processed\"}"));

        std::uint8_t const wire[] = {1};
        try
        {
            ledger.submitTransaction(ripple::Slice(wire, 1));
            fail("instruction error not reported");
        }
        catch (LedgerError const& e)
        {
            std::string const what = e.what();
            BEAST_EXPECT(what.find("instruction error") != std::string::npos);
            BEAST_EXPECT(what.find("6001") != std::string::npos);
        }
    }

    void
    testSubmitExpired()
    {
        testcase("submit times out");
        using namespace ledger;

        FakeRpc rpc;
        SolanaLedger ledger(rpc, fastSetup(std::chrono::milliseconds(0)), nullJournal());

        rpc.respond("sendTransaction", std::string("\"") + signature + "\"");
        rpc.respond("getSignatureStatuses", statuses("null"));

        std::uint8_t const wire[] = {1};
        try
        {
            ledger.submitTransaction(ripple::Slice(wire, 1));
            fail("expiry not reported");
        }
        catch (LedgerError const& e)
        {
            BEAST_EXPECT(std::string(e.what()).find("transaction expired") == 0);
        }
    }
};

BEAST_DEFINE_TESTSUITE(SolanaLedger, ledger, shieldpool);

} // namespace shieldpool
