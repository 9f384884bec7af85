#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "server.hpp"
#include "request_handler.hpp"
#include "item_handlers.hpp"
#include "item_store.hpp"
#include "schema.hpp"
#include "logging.hpp"
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <boost/beast/http.hpp>
#include <boost/beast/core.hpp>
#include <boost/asio.hpp>
#include <nlohmann/json.hpp>

using namespace itemstore;
namespace beast = boost::beast;
namespace http = beast::http;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

class MockRequestHandler : public RequestHandler {
public:
    MOCK_METHOD(Response, handle_request_impl, (const Request&), (override));
    MOCK_METHOD(bool, can_handle, (const Request&), (const, override));
};

class ServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::init("info");
        address_ = "127.0.0.1";

        store_ = std::make_shared<SqliteItemStore>(open_item_database(":memory:"));
        handler_ = make_item_router(store_).build();
    }

    // Runs the server on an ephemeral port for the duration of the test
    void start(std::shared_ptr<RequestHandler> handler) {
        server_ = std::make_unique<Server>(address_, 0, std::move(handler), 2);
        port_ = server_->local_port();
        server_thread_ = std::thread([this]() { server_->run(); });
    }

    void TearDown() override {
        if (server_) {
            server_->stop();
            server_thread_.join();
        }
    }

    http::response<http::string_body> send_request(http::verb method, const std::string& target,
                                                   const std::string& body = "") {
        net::io_context io_context;
        tcp::socket socket(io_context);
        socket.connect(tcp::endpoint(net::ip::make_address(address_), port_));

        http::request<http::string_body> req{method, target, 11};
        req.set(http::field::host, address_ + ":" + std::to_string(port_));
        req.set(http::field::user_agent, "ServerTest");
        req.keep_alive(false);
        if (!body.empty()) {
            req.set(http::field::content_type, "application/json");
            req.body() = body;
        }
        req.prepare_payload();
        http::write(socket, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(socket, buffer, res);

        boost::system::error_code ec;
        socket.shutdown(tcp::socket::shutdown_both, ec);
        return res;
    }

    std::string address_;
    unsigned short port_ = 0;
    std::shared_ptr<SqliteItemStore> store_;
    std::shared_ptr<RequestHandler> handler_;
    std::unique_ptr<Server> server_;
    std::thread server_thread_;
};

TEST_F(ServerTest, ServerInitialization) {
    ASSERT_NO_THROW({
        Server server(address_, 0, handler_);
        EXPECT_NE(server.local_port(), 0);
    });
}

TEST_F(ServerTest, BindingAnInvalidAddressThrows) {
    EXPECT_THROW(Server("not-an-address", 0, handler_), boost::system::system_error);
}

TEST_F(ServerTest, ServerStartStop) {
    Server server(address_, 0, handler_, 1);

    std::thread server_thread([&server]() {
        server.run();
    });

    std::this_thread::sleep_for(std::chrono::milliseconds(100));

    server.stop();
    server_thread.join();
}

TEST_F(ServerTest, AddsServerHeaderToHandlerResponses) {
    auto mock_handler = std::make_shared<MockRequestHandler>();
    EXPECT_CALL(*mock_handler, can_handle(testing::_))
        .WillRepeatedly(testing::Return(true));
    EXPECT_CALL(*mock_handler, handle_request_impl(testing::_))
        .WillRepeatedly([](const Request& req) {
            return RequestHandler::text_response(req, http::status::ok, "pong");
        });

    start(mock_handler);
    auto res = send_request(http::verb::get, "/ping");

    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "pong");
    EXPECT_EQ(res[http::field::server], std::string(SERVER_NAME) + " " + VERSION);
}

TEST_F(ServerTest, HandlerExceptionBecomesInternalError) {
    auto mock_handler = std::make_shared<MockRequestHandler>();
    EXPECT_CALL(*mock_handler, can_handle(testing::_))
        .WillRepeatedly(testing::Return(true));
    EXPECT_CALL(*mock_handler, handle_request_impl(testing::_))
        .WillRepeatedly(testing::Throw(std::runtime_error("boom")));

    start(mock_handler);
    auto res = send_request(http::verb::get, "/anything");

    EXPECT_EQ(res.result(), http::status::internal_server_error);
    EXPECT_EQ(res.body(), "Internal Server Error");
}

TEST_F(ServerTest, ScenarioOverTheWire) {
    start(handler_);

    auto res = send_request(http::verb::get, "/items");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(res.body(), "[]");

    res = send_request(http::verb::post, "/items", R"({"name":"apple"})");
    EXPECT_EQ(res.result(), http::status::created);
    EXPECT_EQ(res[http::field::content_type], "application/json");
    EXPECT_EQ(nlohmann::json::parse(res.body()), nlohmann::json::parse(R"({"id":1,"name":"apple"})"));

    res = send_request(http::verb::post, "/items", R"({"name":"banana"})");
    EXPECT_EQ(nlohmann::json::parse(res.body()), nlohmann::json::parse(R"({"id":2,"name":"banana"})"));

    res = send_request(http::verb::post, "/items", R"({"name":"banana"})");
    EXPECT_EQ(res.result(), http::status::internal_server_error);

    res = send_request(http::verb::put, "/items/1", R"({"name":"avocado"})");
    EXPECT_EQ(res.result(), http::status::ok);
    EXPECT_EQ(nlohmann::json::parse(res.body()), nlohmann::json::parse(R"({"id":1,"name":"avocado"})"));

    res = send_request(http::verb::delete_, "/items/2");
    EXPECT_EQ(res.result(), http::status::no_content);
    EXPECT_TRUE(res.body().empty());

    EXPECT_EQ(send_request(http::verb::get, "/items/2").result(), http::status::not_found);
    EXPECT_EQ(send_request(http::verb::get, "/items/abc").result(), http::status::bad_request);
    EXPECT_EQ(send_request(http::verb::get, "/nope").result(), http::status::not_found);

    res = send_request(http::verb::delete_, "/items");
    EXPECT_EQ(res.result(), http::status::method_not_allowed);
    EXPECT_EQ(res[http::field::allow], "GET, HEAD, POST");
}

TEST_F(ServerTest, KeepAliveServesSeveralRequestsOnOneConnection) {
    start(handler_);

    net::io_context io_context;
    tcp::socket socket(io_context);
    socket.connect(tcp::endpoint(net::ip::make_address(address_), port_));
    beast::flat_buffer buffer;

    for (const std::string name : {"one", "two", "three"}) {
        http::request<http::string_body> req{http::verb::post, "/items", 11};
        req.set(http::field::host, address_);
        req.keep_alive(true);
        req.body() = nlohmann::json{{"name", name}}.dump();
        req.prepare_payload();
        http::write(socket, req);

        http::response<http::string_body> res;
        http::read(socket, buffer, res);
        EXPECT_EQ(res.result(), http::status::created);
        EXPECT_TRUE(res.keep_alive());
    }

    boost::system::error_code ec;
    socket.shutdown(tcp::socket::shutdown_both, ec);
    EXPECT_EQ(store_->list().size(), 3u);
}

TEST_F(ServerTest, ConcurrentClientsAreSerializedAtTheStore) {
    start(handler_);

    constexpr int clients = 6;
    constexpr int per_client = 10;
    std::vector<std::thread> workers;
    std::atomic<int> created{0};

    for (int c = 0; c < clients; ++c) {
        workers.emplace_back([this, c, &created]() {
            for (int i = 0; i < per_client; ++i) {
                auto body = nlohmann::json{{"name", "c" + std::to_string(c) + "-" + std::to_string(i)}}.dump();
                auto res = send_request(http::verb::post, "/items", body);
                if (res.result() == http::status::created) {
                    ++created;
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_EQ(created.load(), clients * per_client);
    auto res = send_request(http::verb::get, "/items");
    EXPECT_EQ(nlohmann::json::parse(res.body()).size(), static_cast<size_t>(clients * per_client));
}
