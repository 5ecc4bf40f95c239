#pragma once

#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>
#include <boost/asio/ssl/context.hpp>
#include <boost/property_tree/ptree.hpp>
#include <atomic>
#include <chrono>
#include <string>

namespace shieldpool {
namespace ledger {

/**
    Blocking JSON-RPC 2.0 client over HTTP or HTTPS.

    Every call opens its own connection, so one client can be shared by
    any number of threads. Responses are read into a property tree since
    ledger replies carry 64-bit integers (slots, rent epochs) that do not
    fit Json::Value.
*/
class RpcClient
{
public:
    struct Endpoint
    {
        bool tls = false;
        std::string host;
        std::string port;
        std::string target;
    };

    /** @throws std::invalid_argument unless url is http:// or https:// */
    static Endpoint
    parseUrl(std::string const& url);

    RpcClient(std::string const& url, std::chrono::milliseconds timeout, beast::Journal journal);
    virtual ~RpcClient() = default;

    /**
        Calls method and returns its "result" member.

        @throws LedgerError carrying the remote error message, or a
                "network error" message for transport failures
    */
    virtual boost::property_tree::ptree
    call(std::string const& method, Json::Value const& params);

    Endpoint const&
    endpoint() const
    {
        return endpoint_;
    }

private:
    std::string
    post(std::string const& body);

    Endpoint endpoint_;
    std::chrono::milliseconds timeout_;
    boost::asio::ssl::context ssl_;
    std::atomic<std::uint64_t> nextId_{1};
    beast::Journal j_;
};

/** One-line JSON text of a tree node; a leaf yields its bare value. */
std::string
compactJson(boost::property_tree::ptree const& node);

} // namespace ledger
} // namespace shieldpool
