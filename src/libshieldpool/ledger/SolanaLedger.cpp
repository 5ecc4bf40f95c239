#include "SolanaLedger.h"
#include <xrpl/basics/Log.h>
#include <xrpl/basics/base64.h>
#include <thread>
#include <utility>

namespace shieldpool {
namespace ledger {

namespace {

bool
isNull(boost::property_tree::ptree const& node)
{
    return node.empty() && (node.data() == "null" || node.data().empty());
}

Json::Value
withCommitment(std::string const& commitment)
{
    Json::Value options(Json::objectValue);
    options["commitment"] = commitment;
    return options;
}

} // namespace

SolanaLedger::SolanaLedger(RpcClient& rpc, Setup setup, beast::Journal journal)
    : rpc_(rpc), setup_(std::move(setup)), j_(journal)
{
}

bool
SolanaLedger::reached(std::string const& status) const
{
    if (status == "finalized")
        return true;
    if (status == "confirmed")
        return setup_.commitment != "finalized";
    return setup_.commitment == "processed";
}

std::string
SolanaLedger::submitTransaction(ripple::Slice wire)
{
    Json::Value options(Json::objectValue);
    options["encoding"] = "base64";
    options["preflightCommitment"] = setup_.commitment;

    Json::Value params(Json::arrayValue);
    params.append(ripple::base64_encode(wire.data(), wire.size()));
    params.append(options);

    auto const signature = rpc_.call("sendTransaction", params).data();
    if (signature.empty())
        throw LedgerError("sendTransaction: deserialization failed, empty signature");
    JLOG(j_.debug()) << "sent transaction " << signature;

    Json::Value signatures(Json::arrayValue);
    signatures.append(signature);
    Json::Value statusParams(Json::arrayValue);
    statusParams.append(signatures);

    auto const deadline = std::chrono::steady_clock::now() + setup_.confirmTimeout;
    for (;;)
    {
        auto const result = rpc_.call("getSignatureStatuses", statusParams);
        auto const value = result.get_child_optional("value");
        if (value && !value->empty())
        {
            auto const& status = value->front().second;
            if (!isNull(status))
            {
                if (auto const err = status.get_child_optional("err"); err && !isNull(*err))
                    throw LedgerError("Transaction failed: instruction error " + compactJson(*err));
                if (reached(status.get<std::string>("confirmationStatus", "")))
                    return signature;
            }
        }

        if (std::chrono::steady_clock::now() >= deadline)
        {
            throw LedgerError(
                "transaction expired: " + signature + " not confirmed within " +
                std::to_string(setup_.confirmTimeout.count()) + "ms");
        }
        std::this_thread::sleep_for(setup_.pollInterval);
    }
}

std::optional<AccountInfo>
SolanaLedger::getAccount(Address const& address)
{
    auto options = withCommitment(setup_.commitment);
    options["encoding"] = "base64";

    Json::Value params(Json::arrayValue);
    params.append(toBase58(address));
    params.append(options);

    auto const result = rpc_.call("getAccountInfo", params);
    auto const value = result.get_child_optional("value");
    if (!value || isNull(*value))
        return std::nullopt;

    AccountInfo info;
    try
    {
        info.lamports = value->get<std::uint64_t>("lamports");
        info.owner = requireAddress(value->get<std::string>("owner"), "owner");

        auto const& data = value->get_child("data");
        if (data.empty())
            throw LedgerError("getAccountInfo: deserialization failed, bad data");
        auto const bytes = ripple::base64_decode(data.front().second.data());
        info.data.assign(bytes.begin(), bytes.end());
    }
    catch (boost::property_tree::ptree_error const& e)
    {
        throw LedgerError(std::string("getAccountInfo: deserialization failed: ") + e.what());
    }
    catch (std::invalid_argument const& e)
    {
        throw LedgerError(std::string("getAccountInfo: deserialization failed: ") + e.what());
    }
    return info;
}

Blockhash
SolanaLedger::latestBlockhash()
{
    Json::Value params(Json::arrayValue);
    params.append(withCommitment(setup_.commitment));

    auto const result = rpc_.call("getLatestBlockhash", params);
    auto const text = result.get<std::string>("value.blockhash", "");
    auto const hash = parseAddress(text);
    if (!hash)
        throw LedgerError("getLatestBlockhash: deserialization failed for '" + text + "'");
    return *hash;
}

} // namespace ledger
} // namespace shieldpool
