#pragma once

#include <libshieldpool/relay/RelayService.h>
#include <xrpl/beast/utility/Journal.h>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/thread_pool.hpp>
#include <chrono>
#include <cstdint>
#include <string>

namespace shieldpool {
namespace relay {

/**
    HTTP/1.1 front end for RelayService.

    Connections are served on the io_context threads. Each parsed request
    is handed to the worker pool, so a withdrawal waiting on the ledger
    never blocks socket I/O.
*/
class HttpServer
{
public:
    struct Setup
    {
        std::string ip = "0.0.0.0";
        std::uint16_t port = 3000;
        std::chrono::seconds idleTimeout{30};
    };

    HttpServer(
        Setup setup,
        boost::asio::io_context& io,
        boost::asio::thread_pool& workers,
        RelayService& service,
        beast::Journal journal);

    HttpServer(HttpServer const&) = delete;
    HttpServer&
    operator=(HttpServer const&) = delete;

    /** Binds and starts accepting. @throws boost::system::system_error */
    void
    start();

    /** Stops accepting; sessions already open run to completion. */
    void
    stop();

    boost::asio::ip::tcp::endpoint
    localEndpoint() const;

private:
    class Session;

    void
    accept();

    Setup const setup_;
    boost::asio::io_context& io_;
    boost::asio::thread_pool& workers_;
    RelayService& service_;
    beast::Journal j_;
    boost::asio::ip::tcp::acceptor acceptor_;
};

} // namespace relay
} // namespace shieldpool
