#pragma once

#include <boost/asio.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/core/flat_buffer.hpp>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "config.hpp"

namespace http = boost::beast::http;

namespace itemstore {

class RequestHandler;

// One accepted connection. Reads requests until the peer or a response asks
// to close; each request is handled to completion before the next read.
class Session : public std::enable_shared_from_this<Session> {
public:
    Session(boost::asio::ip::tcp::socket socket,
           std::shared_ptr<RequestHandler> handler)
        : socket_(std::move(socket))
        , handler_(std::move(handler)) {}

    void start();

private:
    void read_request();
    void handle_request();
    void write_response();
    void close();

    boost::asio::ip::tcp::socket socket_;
    boost::beast::flat_buffer buffer_;
    http::request<http::string_body> request_;
    http::response<http::string_body> response_;
    std::shared_ptr<RequestHandler> handler_;
};

class Server {
public:
    // Binds immediately; throws boost::system::system_error if the address
    // cannot be bound. threads == 0 picks the hardware concurrency.
    Server(const std::string& address, unsigned short port,
           std::shared_ptr<RequestHandler> handler,
           unsigned int threads = 0);

    Server(const Server&) = delete;
    Server& operator=(const Server&) = delete;

    // Blocks until stop() is called or SIGINT/SIGTERM arrives
    void run();
    void stop();

    // The bound port, useful when constructed with port 0
    unsigned short local_port() const;

private:
    void accept();
    boost::asio::io_context io_context_;
    boost::asio::ip::tcp::acceptor acceptor_;
    boost::asio::signal_set signals_;
    std::shared_ptr<RequestHandler> handler_;
    unsigned int threads_;
};

} // namespace itemstore
