#include "server.hpp"
#include "request_handler.hpp"
#include "logging.hpp"
#include <algorithm>
#include <csignal>
#include <fmt/format.h>

namespace itemstore {

Server::Server(const std::string& address, unsigned short port,
              std::shared_ptr<RequestHandler> handler,
              unsigned int threads)
    : acceptor_(io_context_),
      signals_(io_context_, SIGINT, SIGTERM),
      handler_(std::move(handler)),
      threads_(threads > 0 ? threads : std::max(1u, std::thread::hardware_concurrency())) {

    boost::asio::ip::tcp::endpoint endpoint{
        boost::asio::ip::make_address(address),
        port
    };

    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::socket_base::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen();
}

void Server::run() {
    accept();

    signals_.async_wait([this](boost::system::error_code ec, int signal) {
        if (!ec) {
            Logger::get().info("Received signal {}, shutting down", signal);
            stop();
        }
    });

    std::vector<std::thread> workers;
    workers.reserve(threads_ - 1);
    for (unsigned int i = 1; i < threads_; ++i) {
        workers.emplace_back([this]() { io_context_.run(); });
    }
    io_context_.run();

    for (auto& worker : workers) {
        worker.join();
    }
}

void Server::stop() {
    io_context_.stop();
}

unsigned short Server::local_port() const {
    return acceptor_.local_endpoint().port();
}

void Server::accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, boost::asio::ip::tcp::socket socket) {
            if (ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (!ec) {
                std::make_shared<Session>(std::move(socket), handler_)->start();
            } else {
                Logger::get().warn("Accept failed: {}", ec.message());
            }
            accept();
        });
}

void Session::start() {
    read_request();
}

void Session::read_request() {
    // A fresh message for every request on a kept-alive connection
    request_ = {};
    auto self = shared_from_this();

    http::async_read(
        socket_,
        buffer_,
        request_,
        [self](boost::system::error_code ec, std::size_t) {
            if (ec == http::error::end_of_stream) {
                self->close();
                return;
            }
            if (ec) {
                Logger::get().debug("Failed to read request: {}", ec.message());
                return;
            }
            self->handle_request();
        });
}

void Session::handle_request() {
    try {
        response_ = handler_->handle_request(request_);
    } catch (const std::exception& e) {
        Logger::get().error("Unhandled error for {} {}: {}",
            std::string(request_.method_string()), std::string(request_.target()), e.what());
        response_ = RequestHandler::text_response(
            request_, http::status::internal_server_error, "Internal Server Error");
    }
    response_.set(http::field::server, fmt::format("{} {}", SERVER_NAME, VERSION));
    write_response();
}

void Session::write_response() {
    auto self = shared_from_this();
    http::async_write(
        socket_,
        response_,
        [self](boost::system::error_code ec, std::size_t) {
            if (ec) {
                Logger::get().debug("Failed to write response: {}", ec.message());
                return;
            }
            if (self->response_.need_eof()) {
                self->close();
                return;
            }
            self->read_request();
        });
}

void Session::close() {
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
    if (ec) {
        Logger::get().debug("Socket shutdown failed: {}", ec.message());
    }
}

} // namespace itemstore
