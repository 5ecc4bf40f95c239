#include "RelayService.h"
#include <libshieldpool/ledger/Address.h>
#include <xrpl/basics/Log.h>
#include <xrpl/beast/core/LexicalCast.h>
#include <xrpl/json/json_reader.h>
#include <xrpl/json/to_string.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <limits>
#include <optional>
#include <vector>

namespace shieldpool {
namespace relay {

namespace {

std::string
lowerHex(ripple::uint256 const& value)
{
    return boost::algorithm::to_lower_copy(to_string(value));
}

// Value of one query parameter, without percent decoding.
std::optional<std::string>
queryParameter(std::string const& target, std::string const& name)
{
    auto const mark = target.find('?');
    if (mark == std::string::npos)
        return std::nullopt;

    auto const query = target.substr(mark + 1);
    std::vector<std::string> pairs;
    boost::algorithm::split(pairs, query, boost::algorithm::is_any_of("&"));
    for (auto const& pair : pairs)
    {
        auto const eq = pair.find('=');
        if (pair.substr(0, eq) == name)
            return eq == std::string::npos ? std::string() : pair.substr(eq + 1);
    }
    return std::nullopt;
}

std::optional<std::uint64_t>
parseAmount(std::string const& text)
{
    if (text.empty() || text.size() > 20 ||
        !std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; }))
    {
        return std::nullopt;
    }

    std::uint64_t amount = 0;
    if (!beast::lexicalCastChecked(amount, text))
        return std::nullopt;
    return amount;
}

Json::Value
errorBody(std::string const& message)
{
    Json::Value body(Json::objectValue);
    body["error"] = message;
    return body;
}

} // namespace

RelayService::RelayService(
    RelayPipeline& pipeline,
    RateLimiter& limiter,
    beast::Journal journal,
    std::function<SystemClock::time_point()> now)
    : pipeline_(pipeline), limiter_(limiter), j_(journal), now_(std::move(now))
{
}

RelayService::Response
RelayService::handle(Request const& request, std::string const& remote)
{
    JLOG(j_.trace()) << remote << " " << request.method_string() << " " << request.target();

    try
    {
        return route(request, remote);
    }
    catch (std::exception const& e)
    {
        JLOG(j_.error()) << "unhandled error serving " << request.target() << ": " << e.what();
        return reply(request, http::status::internal_server_error, errorBody("Internal error"));
    }
}

RelayService::Response
RelayService::route(Request const& request, std::string const& remote)
{
    if (request.body().size() > maxBodySize)
        return reply(request, http::status::payload_too_large, errorBody("Request body too large"));

    std::string const target(request.target().data(), request.target().size());
    auto const path = target.substr(0, target.find('?'));

    bool const isWithdraw = path == "/withdraw";
    if (!isWithdraw && path != "/health" && path != "/status" && path != "/quote" &&
        path != "/assets")
    {
        return reply(request, http::status::not_found, errorBody("Not found"));
    }

    auto const expected = isWithdraw ? http::verb::post : http::verb::get;
    if (request.method() != expected)
        return reply(request, http::status::method_not_allowed, errorBody("Method not allowed"));

    if (isWithdraw)
        return withdraw(request, remote);

    if (!limiter_.allow(remote))
    {
        return reply(
            request,
            http::status::too_many_requests,
            errorBody("Too many requests, please slow down"));
    }

    if (path == "/health")
        return reply(request, http::status::ok, health());
    if (path == "/status")
        return reply(request, http::status::ok, status());
    if (path == "/quote")
        return quote(request);
    return reply(request, http::status::ok, assets());
}

Json::Value
RelayService::health() const
{
    auto const ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now_().time_since_epoch());

    Json::Value body(Json::objectValue);
    body["status"] = "ok";
    // milliseconds since the epoch are exact in a double
    body["timestamp"] = static_cast<double>(ms.count());
    body["proofVerificationEnabled"] = pipeline_.proofVerificationEnabled();
    return body;
}

Json::Value
RelayService::status() const
{
    auto const& setup = pipeline_.setup();

    Json::Value body(Json::objectValue);
    body["active"] = true;
    body["operator"] = ledger::toBase58(pipeline_.operatorAddress());
    body["feeBps"] = static_cast<Json::UInt>(setup.feeBps);
    body["totalTransactions"] = static_cast<Json::UInt>(std::min<std::uint64_t>(
        pipeline_.totalTransactions(), std::numeric_limits<Json::UInt>::max()));
    body["totalFeesEarned"] = std::to_string(pipeline_.totalFeesEarned());
    body["supportedAssets"] = assets()["assets"];
    body["proofVerificationEnabled"] = pipeline_.proofVerificationEnabled();
    return body;
}

RelayService::Response
RelayService::quote(Request const& request) const
{
    std::string const target(request.target().data(), request.target().size());
    auto const amount = parseAmount(queryParameter(target, "amount").value_or("0"));
    if (!amount)
        return reply(request, http::status::bad_request, errorBody("Invalid amount"));

    auto const fee = pipeline_.fee(*amount);

    Json::Value body(Json::objectValue);
    body["amount"] = std::to_string(*amount);
    body["fee"] = std::to_string(fee);
    body["feeBps"] = static_cast<Json::UInt>(pipeline_.setup().feeBps);
    body["netAmount"] = std::to_string(*amount - fee);
    return reply(request, http::status::ok, body);
}

Json::Value
RelayService::assets() const
{
    Json::Value body(Json::objectValue);
    Json::Value& list = body["assets"] = Json::Value(Json::arrayValue);
    for (auto const& asset : pipeline_.setup().supportedAssets)
        list.append(lowerHex(asset));
    return body;
}

RelayService::Response
RelayService::withdraw(Request const& request, std::string const& remote)
{
    Json::Value json;
    Json::Reader reader;
    if (!reader.parse(request.body(), json) || !json.isObject())
    {
        if (!limiter_.allow(remote))
        {
            return reply(
                request,
                http::status::too_many_requests,
                errorBody("Too many requests, please slow down"));
        }
        auto const result =
            WithdrawResult::reject(ErrorCategory::Validation, "Request body must be a JSON object");
        return reply(request, http::status::bad_request, result.toJson());
    }

    auto const withdrawal = WithdrawRequest::fromJson(json);
    auto const key = withdrawal.recipient.empty() ? remote : "recipient:" + withdrawal.recipient;
    if (!limiter_.allow(key))
    {
        return reply(
            request, http::status::too_many_requests, errorBody("Too many requests, please slow down"));
    }

    auto const result = pipeline_.process(withdrawal);
    auto const status = result.accepted || !result.category
        ? http::status::ok
        : static_cast<http::status>(httpStatus(*result.category));
    return reply(request, status, result.toJson());
}

RelayService::Response
RelayService::reply(Request const& request, http::status status, Json::Value const& body) const
{
    Response response{status, request.version()};
    response.set(http::field::server, "shieldpoold");
    response.set(http::field::content_type, "application/json");
    response.keep_alive(request.keep_alive());
    response.body() = Json::to_string(body);
    response.prepare_payload();
    return response;
}

} // namespace relay
} // namespace shieldpool
