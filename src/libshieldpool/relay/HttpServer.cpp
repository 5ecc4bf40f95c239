#include "HttpServer.h"
#include <xrpl/basics/Log.h>
#include <xrpl/json/json_value.h>
#include <xrpl/json/to_string.h>
#include <boost/asio/dispatch.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/strand.hpp>
#include <boost/beast/core/bind_handler.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <boost/beast/core/tcp_stream.hpp>
#include <boost/beast/http/parser.hpp>
#include <boost/beast/http/read.hpp>
#include <boost/beast/http/write.hpp>
#include <memory>
#include <optional>

namespace shieldpool {
namespace relay {

using tcp = boost::asio::ip::tcp;

class HttpServer::Session : public std::enable_shared_from_this<Session>
{
public:
    Session(HttpServer& server, tcp::socket&& socket)
        : server_(server), stream_(std::move(socket))
    {
        boost::system::error_code ec;
        auto const peer = stream_.socket().remote_endpoint(ec);
        remote_ = ec ? std::string("unknown") : peer.address().to_string();
    }

    void
    run()
    {
        boost::asio::dispatch(
            stream_.get_executor(),
            boost::beast::bind_front_handler(&Session::read, shared_from_this()));
    }

private:
    void
    read()
    {
        parser_.emplace();
        parser_->body_limit(RelayService::maxBodySize);
        stream_.expires_after(server_.setup_.idleTimeout);
        http::async_read(
            stream_,
            buffer_,
            *parser_,
            boost::beast::bind_front_handler(&Session::onRead, shared_from_this()));
    }

    void
    onRead(boost::system::error_code ec, std::size_t)
    {
        if (ec == http::error::end_of_stream)
            return close();

        if (ec == http::error::body_limit)
        {
            Json::Value body(Json::objectValue);
            body["error"] = "Request body too large";

            RelayService::Response response{http::status::payload_too_large, 11};
            response.set(http::field::server, "shieldpoold");
            response.set(http::field::content_type, "application/json");
            response.keep_alive(false);
            response.body() = Json::to_string(body);
            response.prepare_payload();
            return write(std::move(response));
        }

        if (ec)
        {
            JLOG(server_.j_.debug()) << remote_ << " read: " << ec.message();
            return;
        }

        auto request = parser_->release();
        boost::asio::post(
            server_.workers_,
            [self = shared_from_this(), request = std::move(request)]() {
                auto response = self->server_.service_.handle(request, self->remote_);
                boost::asio::post(
                    self->stream_.get_executor(),
                    [self, response = std::move(response)]() mutable {
                        self->write(std::move(response));
                    });
            });
    }

    void
    write(RelayService::Response response)
    {
        response_ = std::make_shared<RelayService::Response>(std::move(response));
        stream_.expires_after(server_.setup_.idleTimeout);
        http::async_write(
            stream_,
            *response_,
            boost::beast::bind_front_handler(&Session::onWrite, shared_from_this()));
    }

    void
    onWrite(boost::system::error_code ec, std::size_t)
    {
        if (ec)
        {
            JLOG(server_.j_.debug()) << remote_ << " write: " << ec.message();
            return;
        }

        bool const keepAlive = response_->keep_alive();
        response_.reset();
        if (!keepAlive)
            return close();
        read();
    }

    void
    close()
    {
        boost::system::error_code ec;
        stream_.socket().shutdown(tcp::socket::shutdown_send, ec);
    }

    HttpServer& server_;
    boost::beast::tcp_stream stream_;
    boost::beast::flat_buffer buffer_;
    std::optional<http::request_parser<http::string_body>> parser_;
    std::shared_ptr<RelayService::Response> response_;
    std::string remote_;
};

HttpServer::HttpServer(
    Setup setup,
    boost::asio::io_context& io,
    boost::asio::thread_pool& workers,
    RelayService& service,
    beast::Journal journal)
    : setup_(std::move(setup))
    , io_(io)
    , workers_(workers)
    , service_(service)
    , j_(journal)
    , acceptor_(boost::asio::make_strand(io))
{
}

void
HttpServer::start()
{
    tcp::endpoint const endpoint(boost::asio::ip::make_address(setup_.ip), setup_.port);

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections);

    JLOG(j_.info()) << "listening on " << localEndpoint();
    accept();
}

void
HttpServer::stop()
{
    boost::asio::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
}

tcp::endpoint
HttpServer::localEndpoint() const
{
    boost::system::error_code ec;
    return acceptor_.local_endpoint(ec);
}

void
HttpServer::accept()
{
    acceptor_.async_accept(
        boost::asio::make_strand(io_),
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == boost::asio::error::operation_aborted)
                return;

            if (ec)
                JLOG(j_.warn()) << "accept: " << ec.message();
            else
                std::make_shared<Session>(*this, std::move(socket))->run();

            accept();
        });
}

} // namespace relay
} // namespace shieldpool
