#pragma once

#include <libshieldpool/relay/RateLimiter.h>
#include <libshieldpool/relay/RelayPipeline.h>
#include <xrpl/beast/utility/Journal.h>
#include <xrpl/json/json_value.h>
#include <boost/beast/http/message.hpp>
#include <boost/beast/http/string_body.hpp>
#include <chrono>
#include <functional>
#include <string>

namespace shieldpool {
namespace relay {

namespace http = boost::beast::http;

/**
    Maps HTTP requests onto the relay pipeline.

    Routes:

        GET  /health
        GET  /status
        GET  /quote?amount=<base units>
        GET  /assets
        POST /withdraw

    Transport agnostic: the server hands over a parsed request and the
    caller's address and writes back whatever comes out.
*/
class RelayService
{
public:
    using Request = http::request<http::string_body>;
    using Response = http::response<http::string_body>;
    using SystemClock = std::chrono::system_clock;

    static constexpr std::size_t maxBodySize = 1024 * 1024;

    RelayService(
        RelayPipeline& pipeline,
        RateLimiter& limiter,
        beast::Journal journal,
        std::function<SystemClock::time_point()> now = &SystemClock::now);

    /** Never throws; internal failures become a 500. */
    Response
    handle(Request const& request, std::string const& remote);

private:
    Response
    route(Request const& request, std::string const& remote);

    Json::Value
    health() const;

    Json::Value
    status() const;

    Response
    quote(Request const& request) const;

    Json::Value
    assets() const;

    Response
    withdraw(Request const& request, std::string const& remote);

    Response
    reply(Request const& request, http::status status, Json::Value const& body) const;

    RelayPipeline& pipeline_;
    RateLimiter& limiter_;
    beast::Journal j_;
    std::function<SystemClock::time_point()> now_;
};

} // namespace relay
} // namespace shieldpool
