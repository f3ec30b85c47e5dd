/**
 * @file test_hrms_server.cpp
 * @brief Loopback tests of HrmsServer: HTTP sessions and WebSocket subscribers
 * @date 2025-12-02
 */

#include <gtest/gtest.h>
#include <functional>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/write.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>
#include "TestHrms.hpp"
#include "CHrmsServer.hpp"

using namespace lap::core;
using namespace lap::hrms;
using namespace hrms_test;
using json = nlohmann::json;

namespace bio       = boost::asio;
namespace beast     = boost::beast;
namespace http      = beast::http;
namespace websocket = beast::websocket;
using tcp           = bio::ip::tcp;

class HrmsServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.backendType = BackendType::kMemory;
        config.address = "127.0.0.1";
        config.port = 0;
        config.ioThreads = 2;

        notifier = std::make_shared<ChangeNotifier>(registry);
        service.reset(new RecordService(CreateDocumentBackend(config), notifier, FastCredentials(),
                                        std::make_shared<UuidIdentityGenerator>(), config));
        ASSERT_TRUE(service->Open().HasValue());

        router.reset(new ApiRouter(*service));
        server.reset(new lap::hrms::daemon::HrmsServer(config, *router, registry));
        ASSERT_TRUE(server->start().HasValue());
        endpoint = tcp::endpoint(bio::ip::make_address("127.0.0.1"), server->port());
    }

    void TearDown() override {
        if (server) server->stop();
    }

    http::response<http::string_body> request(http::verb verb, const String& target, const String& body = "") {
        bio::io_context ioc;
        beast::tcp_stream stream(ioc);
        stream.connect(endpoint);

        http::request<http::string_body> req{verb, target, 11};
        req.set(http::field::host, "127.0.0.1");
        req.set(http::field::content_type, "application/json");
        req.body() = body;
        req.prepare_payload();
        http::write(stream, req);

        beast::flat_buffer buffer;
        http::response<http::string_body> res;
        http::read(stream, buffer, res);

        beast::error_code ec;
        stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        return res;
    }

    static bool waitFor(const std::function<bool()>& condition, int timeoutMs = 2000) {
        for (int waited = 0; waited < timeoutMs; waited += 10) {
            if (condition()) return true;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
        return condition();
    }

    HrmsConfig config;
    SubscriptionRegistry registry;
    std::shared_ptr<ChangeNotifier> notifier;
    std::unique_ptr<RecordService> service;
    std::unique_ptr<ApiRouter> router;
    std::unique_ptr<lap::hrms::daemon::HrmsServer> server;
    tcp::endpoint endpoint;
};

TEST_F(HrmsServerTest, BindsEphemeralPort) {
    EXPECT_TRUE(server->isRunning());
    EXPECT_NE(server->port(), 0);
}

TEST_F(HrmsServerTest, RestRoundTrip) {
    auto posted = request(http::verb::post, "/api/employees", R"({"id":"e1","name":"Alice"})");
    EXPECT_EQ(posted.result_int(), 200u);
    EXPECT_EQ(posted[http::field::access_control_allow_origin], "*");
    EXPECT_EQ(json::parse(posted.body()), json({{"ok", true}, {"id", "e1"}}));

    auto listed = request(http::verb::get, "/api/employees");
    EXPECT_EQ(listed.result_int(), 200u);
    json employees = json::parse(listed.body());
    ASSERT_EQ(employees.size(), 1u);
    EXPECT_EQ(employees[0]["name"], "Alice");
}

TEST_F(HrmsServerTest, PreflightAndUnknownRoute) {
    auto preflight = request(http::verb::options, "/api/employees");
    EXPECT_EQ(preflight.result_int(), 204u);
    EXPECT_EQ(preflight[http::field::access_control_allow_origin], "*");
    EXPECT_TRUE(preflight.body().empty());

    auto missing = request(http::verb::get, "/api/payroll");
    EXPECT_EQ(missing.result_int(), 404u);
    EXPECT_EQ(json::parse(missing.body()), json({{"error", "Not found"}}));
}

TEST_F(HrmsServerTest, OversizedBodyIs413) {
    bio::io_context ioc;
    beast::tcp_stream stream(ioc);
    stream.connect(endpoint);

    // the declared length alone exceeds the limit, no body bytes are sent
    String head = "POST /api/employees HTTP/1.1\r\n"
                  "Host: 127.0.0.1\r\n"
                  "Content-Type: application/json\r\n"
                  "Content-Length: 2000000\r\n\r\n";
    bio::write(stream.socket(), bio::buffer(head));

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    EXPECT_EQ(res.result_int(), 413u);
    EXPECT_FALSE(res.keep_alive());
    EXPECT_TRUE(service->Snapshot()->GetCollection(Collection::kEmployees).empty());
}

TEST_F(HrmsServerTest, WebSocketReceivesChangeEvents) {
    bio::io_context ioc;
    websocket::stream<beast::tcp_stream> ws(ioc);
    beast::get_lowest_layer(ws).connect(endpoint);
    ws.handshake("127.0.0.1", "/ws");
    ASSERT_TRUE(waitFor([this]() { return registry.Count() == 1; }));

    ASSERT_EQ(request(http::verb::post, "/api/employees", R"({"id":"e1","name":"A"})").result_int(), 200u);
    ASSERT_EQ(request(http::verb::delete_, "/api/employees/e1").result_int(), 200u);

    beast::flat_buffer buffer;
    ws.read(buffer);
    EXPECT_TRUE(ws.got_text());
    json update = json::parse(beast::buffers_to_string(buffer.data()));
    EXPECT_EQ(update, json({{"event", "employee_update"}, {"data", {{"id", "e1"}, {"name", "A"}}}}));

    buffer.consume(buffer.size());
    ws.read(buffer);
    json removed = json::parse(beast::buffers_to_string(buffer.data()));
    EXPECT_EQ(removed, json({{"event", "employee_delete"}, {"data", "e1"}}));

    ws.close(websocket::close_code::normal);
    EXPECT_TRUE(waitFor([this]() { return registry.Count() == 0; }));
}

TEST_F(HrmsServerTest, DroppedConnectionDeregisters) {
    bio::io_context ioc;
    websocket::stream<beast::tcp_stream> ws(ioc);
    beast::get_lowest_layer(ws).connect(endpoint);
    ws.handshake("127.0.0.1", "/ws");
    ASSERT_TRUE(waitFor([this]() { return registry.Count() == 1; }));

    // no close frame, the socket just goes away
    beast::error_code ec;
    beast::get_lowest_layer(ws).socket().close(ec);

    EXPECT_TRUE(waitFor([this]() { return registry.Count() == 0; }));

    // publishing with nobody connected still succeeds
    EXPECT_EQ(request(http::verb::post, "/api/notifications", R"({"text":"hi"})").result_int(), 200u);
}

TEST_F(HrmsServerTest, UpgradeOnlyOnWsTarget) {
    bio::io_context ioc;
    websocket::stream<beast::tcp_stream> ws(ioc);
    beast::get_lowest_layer(ws).connect(endpoint);

    EXPECT_THROW(ws.handshake("127.0.0.1", "/api/employees"), boost::system::system_error);
    EXPECT_EQ(registry.Count(), 0u);
}
