#include "RpcClient.h"
#include "Ledger.h"
#include <xrpl/basics/Log.h>
#include <xrpl/json/to_string.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/property_tree/json_parser.hpp>
#include <openssl/ssl.h>
#include <sstream>
#include <stdexcept>

namespace shieldpool {
namespace ledger {

namespace http = boost::beast::http;
using tcp = boost::asio::ip::tcp;

namespace {

[[noreturn]] void
fail(char const* step, boost::system::error_code const& ec)
{
    if (ec == boost::beast::error::timeout)
        throw LedgerError(std::string("network error: timeout during ") + step);
    throw LedgerError(std::string("network error: ") + step + ": " + ec.message());
}

// Runs one asynchronous step to completion so the stream deadline applies.
template <class Start>
void
runStep(boost::asio::io_context& ioc, char const* step, Start&& start)
{
    boost::system::error_code ec;
    start([&ec](boost::system::error_code e, auto&&...) { ec = e; });
    ioc.restart();
    ioc.run();
    if (ec)
        fail(step, ec);
}

template <class Stream>
http::response<http::string_body>
exchange(
    boost::asio::io_context& ioc,
    Stream& stream,
    http::request<http::string_body> const& req,
    std::chrono::milliseconds timeout)
{
    auto& lowest = boost::beast::get_lowest_layer(stream);

    lowest.expires_after(timeout);
    runStep(ioc, "write", [&](auto handler) { http::async_write(stream, req, handler); });

    boost::beast::flat_buffer buffer;
    http::response<http::string_body> res;
    lowest.expires_after(timeout);
    runStep(ioc, "read", [&](auto handler) { http::async_read(stream, buffer, res, handler); });
    return res;
}

} // namespace

RpcClient::Endpoint
RpcClient::parseUrl(std::string const& url)
{
    Endpoint ep;
    std::string rest;
    if (url.rfind("https://", 0) == 0)
    {
        ep.tls = true;
        rest = url.substr(8);
    }
    else if (url.rfind("http://", 0) == 0)
    {
        rest = url.substr(7);
    }
    else
    {
        throw std::invalid_argument("rpc url must start with http:// or https://");
    }

    auto const slash = rest.find('/');
    auto const authority = rest.substr(0, slash);
    ep.target = slash == std::string::npos ? "/" : rest.substr(slash);

    auto const colon = authority.rfind(':');
    if (colon != std::string::npos && authority.find(']') == std::string::npos)
    {
        ep.host = authority.substr(0, colon);
        ep.port = authority.substr(colon + 1);
    }
    else
    {
        ep.host = authority;
        ep.port = ep.tls ? "443" : "80";
    }

    if (ep.host.empty() || ep.port.empty())
        throw std::invalid_argument("rpc url has no host");
    return ep;
}

RpcClient::RpcClient(
    std::string const& url,
    std::chrono::milliseconds timeout,
    beast::Journal journal)
    : endpoint_(parseUrl(url))
    , timeout_(timeout)
    , ssl_(boost::asio::ssl::context::tls_client)
    , j_(journal)
{
    ssl_.set_default_verify_paths();
    ssl_.set_verify_mode(boost::asio::ssl::verify_peer);
}

std::string
RpcClient::post(std::string const& body)
{
    boost::asio::io_context ioc;

    http::request<http::string_body> req{http::verb::post, endpoint_.target, 11};
    req.set(http::field::host, endpoint_.host);
    req.set(http::field::content_type, "application/json");
    req.set(http::field::user_agent, "shieldpoold");
    req.body() = body;
    req.prepare_payload();

    tcp::resolver resolver(ioc);
    tcp::resolver::results_type endpoints;
    runStep(ioc, "resolve", [&](auto handler) {
        resolver.async_resolve(
            endpoint_.host,
            endpoint_.port,
            [&endpoints, handler](boost::system::error_code ec, tcp::resolver::results_type r) {
                endpoints = std::move(r);
                handler(ec);
            });
    });

    http::response<http::string_body> res;
    if (endpoint_.tls)
    {
        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(ioc, ssl_);
        if (!SSL_set_tlsext_host_name(stream.native_handle(), endpoint_.host.c_str()))
            throw LedgerError("network error: cannot set TLS server name");
        stream.set_verify_callback(boost::asio::ssl::host_name_verification(endpoint_.host));

        auto& lowest = boost::beast::get_lowest_layer(stream);
        lowest.expires_after(timeout_);
        runStep(ioc, "connect", [&](auto handler) { lowest.async_connect(endpoints, handler); });
        lowest.expires_after(timeout_);
        runStep(ioc, "handshake", [&](auto handler) {
            stream.async_handshake(boost::asio::ssl::stream_base::client, handler);
        });

        res = exchange(ioc, stream, req, timeout_);

        // response already complete; the peer may have closed first
        boost::system::error_code ec;
        lowest.socket().shutdown(tcp::socket::shutdown_both, ec);
    }
    else
    {
        boost::beast::tcp_stream stream(ioc);
        stream.expires_after(timeout_);
        runStep(ioc, "connect", [&](auto handler) { stream.async_connect(endpoints, handler); });

        res = exchange(ioc, stream, req, timeout_);

        // response already complete; the peer may have closed first
        boost::system::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    }

    if (res.result() != http::status::ok)
    {
        throw LedgerError("rpc http status " + std::to_string(res.result_int()));
    }
    return std::move(res.body());
}

boost::property_tree::ptree
RpcClient::call(std::string const& method, Json::Value const& params)
{
    Json::Value request(Json::objectValue);
    request["jsonrpc"] = "2.0";
    request["id"] = static_cast<Json::UInt>(nextId_.fetch_add(1) & 0x7fffffff);
    request["method"] = method;
    request["params"] = params;

    JLOG(j_.trace()) << "rpc call " << method;
    std::istringstream text(post(Json::to_string(request)));

    boost::property_tree::ptree response;
    try
    {
        boost::property_tree::read_json(text, response);
    }
    catch (boost::property_tree::json_parser_error const& e)
    {
        throw LedgerError("rpc " + method + ": deserialization failed: " + e.message());
    }

    if (auto const error = response.get_child_optional("error"))
    {
        std::string message = error->get<std::string>("message", error->data());
        if (auto const err = error->get_child_optional("data.err"))
            message += " " + compactJson(*err);
        JLOG(j_.debug()) << "rpc " << method << " error: " << message;
        throw LedgerError(message);
    }

    auto result = response.get_child_optional("result");
    if (!result)
        throw LedgerError("rpc " + method + ": deserialization failed, no result");
    return *result;
}

std::string
compactJson(boost::property_tree::ptree const& node)
{
    if (node.empty())
        return node.data();

    std::ostringstream out;
    boost::property_tree::write_json(out, node, false);
    auto s = out.str();
    while (!s.empty() && s.back() == '\n')
        s.pop_back();
    return s;
}

} // namespace ledger
} // namespace shieldpool
