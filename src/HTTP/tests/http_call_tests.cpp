//
// Transport bridge: completion, failure and cancellation of single calls
//

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/test/unit_test.hpp>

#include <atomic>
#include <optional>
#include <stop_token>
#include <thread>

#include "../../Lib/Errors.h"
#include "../../tests/fixtures/FakeServerFixture.h"
#include "../../tests/fixtures/RecordingListeners.h"
#include "../HttpTransport.h"
#include "../RequestBuilder.h"

struct HttpCallTestFixture : public FakeServerFixture
{
    std::shared_ptr<boost::asio::io_context> ioContext = std::make_shared<boost::asio::io_context>();
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> workGuard = boost::asio::make_work_guard(*ioContext);
    std::thread ioThread;

    std::shared_ptr<Notifier> notifier                  = std::make_shared<Notifier>();
    std::shared_ptr<NotificationRecorder> notifications = std::make_shared<NotificationRecorder>();
    std::shared_ptr<HttpTransport> transport            = std::make_shared<HttpTransport>(ioContext, notifier);
    RequestBuilder builder;

    HttpCallTestFixture()
    {
        notifier->setListener(notifications);
        BOOST_REQUIRE(transport->setServerLocation(serverAddress()));
        ioThread = std::thread([this]() { ioContext->run(); });
    }

    ~HttpCallTestFixture()
    {
        workGuard.reset();
        ioContext->stop();
        ioThread.join();
    }

    HttpCallTestFixture(HttpCallTestFixture const&)                    = delete;
    auto operator=(HttpCallTestFixture const&) -> HttpCallTestFixture& = delete;
    HttpCallTestFixture(HttpCallTestFixture&&)                         = delete;
    auto operator=(HttpCallTestFixture&&) -> HttpCallTestFixture&      = delete;
};

BOOST_FIXTURE_TEST_SUITE(http_call_test_suite, HttpCallTestFixture)

BOOST_AUTO_TEST_CASE(test_completed_call_returns_body_and_status)
{
    routeJson("GET", "/api/info", R"({"name": "test server"})");

    builder.setApiKey("abc");
    auto call     = transport->newCall(builder.build("GET", "/api/info"));
    auto response = call->awaitWithFail(std::stop_token());

    BOOST_CHECK_EQUAL(response.statusCode, 200);
    BOOST_CHECK_EQUAL(response.isSuccessful(), true);
    BOOST_CHECK_EQUAL(nlohmann::json::parse(response.content)["name"], "test server");

    auto request = lastRequest();
    BOOST_CHECK_EQUAL(request.method, "GET");
    BOOST_CHECK_EQUAL(request.path, "/api/info");
    BOOST_CHECK_EQUAL(request.header.find("Authorization")->second, "Bearer YWJj");
}

BOOST_AUTO_TEST_CASE(test_form_body_is_sent)
{
    routeJson("PUT", "/api/categories", R"({"success": 1})");

    auto call     = transport->newCall(builder.build("PUT", "/api/categories", "name=New&pinned=1"));
    auto response = call->await(std::stop_token());

    BOOST_REQUIRE(response.has_value());
    auto request = lastRequest();
    BOOST_CHECK_EQUAL(request.content, "name=New&pinned=1");
    BOOST_CHECK_EQUAL(request.header.find("Content-Type")->second, "application/x-www-form-urlencoded");
}

BOOST_AUTO_TEST_CASE(test_error_status_is_not_a_transport_failure)
{
    auto call     = transport->newCall(builder.build("GET", "/api/missing"));
    auto response = call->awaitWithFail(std::stop_token(), "Should not be shown");

    BOOST_CHECK_EQUAL(response.statusCode, 404);
    BOOST_CHECK_EQUAL(response.isSuccessful(), false);
    BOOST_CHECK(notifications->errors().empty());
}

BOOST_AUTO_TEST_CASE(test_large_body_is_fully_accumulated)
{
    auto data = generateRandomData(1024 * 1024);
    std::string body(data->begin(), data->end());

    route("GET", "/big", [body](const Response& response, const Request&) {
        response->write(SimpleWeb::StatusCode::success_ok, body);
    });

    auto response = transport->newCall(builder.build("GET", "/big"))->awaitWithFail(std::stop_token());
    BOOST_CHECK_EQUAL(response.content.size(), body.size());
    BOOST_CHECK(response.content == body);

    // Status only callers don't keep the body
    auto discarded = transport->newCall(builder.build("GET", "/big"))->await(std::stop_token(), {}, true);
    BOOST_REQUIRE(discarded.has_value());
    BOOST_CHECK_EQUAL(discarded->statusCode, 200);
    BOOST_CHECK(discarded->content.empty());
}

BOOST_AUTO_TEST_CASE(test_transport_failure)
{
    // Nothing listens on this port
    BOOST_REQUIRE(transport->setServerLocation("http://127.0.0.1:1"));

    auto call = transport->newCall(builder.build("GET", "/api/info"));
    BOOST_CHECK_THROW(call->awaitWithFail(std::stop_token(), "Failed to connect to server."), eTransportError);
    BOOST_CHECK_EQUAL(call->isCancelled(), false);
    BOOST_REQUIRE_EQUAL(notifications->errors().size(), 1);
    BOOST_CHECK_EQUAL(notifications->errors()[0], "Failed to connect to server.");

    // Without a message nothing is reported
    auto silent = transport->newCall(builder.build("GET", "/api/info"));
    BOOST_CHECK(!silent->await(std::stop_token()).has_value());
    BOOST_CHECK_EQUAL(notifications->errors().size(), 1);
}

BOOST_AUTO_TEST_CASE(test_verbose_failure_shows_cause)
{
    notifier->setVerbose(true);
    BOOST_REQUIRE(transport->setServerLocation("http://127.0.0.1:1"));

    auto call = transport->newCall(builder.build("GET", "/api/info"));
    BOOST_CHECK(!call->await(std::stop_token(), "Failed to connect to server.").has_value());
    BOOST_REQUIRE_EQUAL(notifications->errors().size(), 1);
    BOOST_CHECK_NE(notifications->errors()[0], "Failed to connect to server.");
}

BOOST_AUTO_TEST_CASE(test_already_cancelled_token_never_sends)
{
    routeJson("GET", "/api/info", "{}");

    std::stop_source source;
    source.request_stop();

    auto call = transport->newCall(builder.build("GET", "/api/info"));
    BOOST_CHECK_THROW(call->awaitWithFail(source.get_token(), "Failed"), eCancelled);
    BOOST_CHECK_EQUAL(call->isCancelled(), true);

    auto other = transport->newCall(builder.build("GET", "/api/info"));
    BOOST_CHECK(!other->await(source.get_token(), "Failed").has_value());

    BOOST_CHECK_EQUAL(requestCount(), 0);
    BOOST_CHECK(notifications->errors().empty());
}

BOOST_AUTO_TEST_CASE(test_cancel_in_flight_call)
{
    std::atomic<bool> bReceived = false;
    route("GET", "/slow", [&bReceived](const Response& response, const Request&) {
        bReceived = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(1500));
        response->write(SimpleWeb::StatusCode::success_ok, "late");
    });

    std::stop_source source;
    auto call = transport->newCall(builder.build("GET", "/slow"));

    std::thread canceller([&]() {
        waitFor([&]() { return bReceived.load(); });
        source.request_stop();
    });

    auto start = std::chrono::steady_clock::now();
    BOOST_CHECK_THROW(call->awaitWithFail(source.get_token(), "Failed"), eCancelled);
    canceller.join();

    BOOST_CHECK(std::chrono::steady_clock::now() - start < std::chrono::milliseconds(1500));
    BOOST_CHECK_EQUAL(call->isCancelled(), true);
    BOOST_CHECK(notifications->errors().empty());

    // Let the handler finish before the server goes away
    std::this_thread::sleep_for(std::chrono::milliseconds(1600));
}

BOOST_AUTO_TEST_CASE(test_cancel_after_completion_is_ignored)
{
    routeJson("GET", "/api/info", "{}");

    auto call     = transport->newCall(builder.build("GET", "/api/info"));
    auto response = call->await(std::stop_token());
    BOOST_REQUIRE(response.has_value());

    call->cancel();
    BOOST_CHECK_EQUAL(call->isCancelled(), false);
}

BOOST_AUTO_TEST_CASE(test_cancelled_state_observed_while_call_completes)
{
    std::atomic<bool> bReceived = false;
    route("GET", "/slow", [&bReceived](const Response& response, const Request&) {
        bReceived = true;
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        response->write(SimpleWeb::StatusCode::success_ok, "done");
    });

    auto call = transport->newCall(builder.build("GET", "/slow"));
    BOOST_CHECK_EQUAL(call->isCancelled(), false);

    std::atomic<bool> bFinished = false;
    std::optional<sHttpResponse> response;
    std::thread waiter([&]() {
        response  = call->await(std::stop_token());
        bFinished = true;
    });

    // Another thread reads the state the whole time the call is being resolved
    bool bSeenCancelled = false;
    while (!bFinished) {
        bSeenCancelled = bSeenCancelled || call->isCancelled();
    }
    waiter.join();

    BOOST_CHECK(bReceived.load());
    BOOST_CHECK_EQUAL(bSeenCancelled, false);
    BOOST_REQUIRE(response.has_value());
    BOOST_CHECK_EQUAL(response->content, "done");
    BOOST_CHECK_EQUAL(call->isCancelled(), false);
}

BOOST_AUTO_TEST_CASE(test_call_can_only_be_awaited_once)
{
    routeJson("GET", "/api/info", "{}");

    auto call = transport->newCall(builder.build("GET", "/api/info"));
    BOOST_CHECK(call->await(std::stop_token()).has_value());
    BOOST_CHECK_THROW(call->await(std::stop_token()), std::logic_error);
}

BOOST_AUTO_TEST_CASE(test_server_location_parsing)
{
    BOOST_CHECK(transport->setServerLocation("http://127.0.0.1:3000/lrr/"));
    auto location = transport->getServerLocation();
    BOOST_CHECK_EQUAL(location.bSecure, false);
    BOOST_CHECK_EQUAL(location.hostPort, "127.0.0.1:3000");
    BOOST_CHECK_EQUAL(location.basePath, "/lrr");
    BOOST_CHECK_EQUAL(transport->getUrl("/api/info"), "http://127.0.0.1:3000/lrr/api/info");

    BOOST_CHECK(transport->setServerLocation("https://example.com"));
    location = transport->getServerLocation();
    BOOST_CHECK_EQUAL(location.bSecure, true);
    BOOST_CHECK_EQUAL(location.hostPort, "example.com:443");
    BOOST_CHECK_EQUAL(location.basePath, "");

    // Rejected addresses keep the previous location
    BOOST_CHECK(!transport->setServerLocation("ftp://example.com"));
    BOOST_CHECK(!transport->setServerLocation("not a url"));
    BOOST_CHECK_EQUAL(*transport->getbaseUrl(), "https://example.com");
}

BOOST_AUTO_TEST_CASE(test_base_path_prefixes_requests)
{
    routeJson("GET", "/lrr/api/info", "{}");

    BOOST_REQUIRE(transport->setServerLocation(serverAddress() + "/lrr"));
    auto response = transport->newCall(builder.build("GET", "/api/info"))->awaitWithFail(std::stop_token());

    BOOST_CHECK_EQUAL(response.statusCode, 200);
    BOOST_CHECK_EQUAL(lastRequest().path, "/lrr/api/info");
}

BOOST_AUTO_TEST_SUITE_END()
