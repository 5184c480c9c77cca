//
// Job polling sequences against the fake server
//

#include <boost/test/unit_test.hpp>

#include "../../tests/fixtures/ApplicationFixture.h"
#include "../JobPoller.h"

struct JobPollerTestFixture : public ApplicationFixture
{
    std::shared_ptr<JobPoller> poller = application->getJobPoller();

    JobPollerTestFixture()
    {
        poller->setpollInterval(std::chrono::milliseconds(10));
    }

    // Replies with each state in turn, repeating the last one
    void routeStates(uint64_t jobId, std::vector<std::string> states)
    {
        auto counter = std::make_shared<std::atomic<size_t>>(0);
        route("GET", "/api/minion/" + std::to_string(jobId), [counter, states](const Response& response, const Request&) {
            auto index = std::min(counter->fetch_add(1), states.size() - 1);
            nlohmann::json reply = {{"state", states[index]}};
            response->write(SimpleWeb::StatusCode::success_ok, reply.dump());
        });
    }
};

BOOST_FIXTURE_TEST_SUITE(job_poller_test_suite, JobPollerTestFixture)

BOOST_AUTO_TEST_CASE(test_poll_until_finished)
{
    routeStates(42, {"inactive", "active", "finished"});

    BOOST_CHECK(poller->pollJob(42, std::stop_token()) == eJobOutcome::Finished);
    BOOST_CHECK_EQUAL(requestCount("GET", "/api/minion/42"), 3);
}

BOOST_AUTO_TEST_CASE(test_poll_until_failed)
{
    routeStates(7, {"active", "failed"});

    BOOST_CHECK(poller->pollJob(7, std::stop_token()) == eJobOutcome::Failed);
    BOOST_CHECK_EQUAL(poller->waitForJob(7, std::stop_token()), false);
}

BOOST_AUTO_TEST_CASE(test_missing_state_keeps_polling)
{
    auto counter = std::make_shared<std::atomic<size_t>>(0);
    route("GET", "/api/minion/9", [counter](const Response& response, const Request&) {
        response->write(SimpleWeb::StatusCode::success_ok, counter->fetch_add(1) < 2 ? "{}" : R"({"state": "finished"})");
    });

    BOOST_CHECK_EQUAL(poller->waitForJob(9, std::stop_token()), true);
    BOOST_CHECK_EQUAL(requestCount("GET", "/api/minion/9"), 3);
}

BOOST_AUTO_TEST_CASE(test_error_status_is_indeterminate)
{
    routeStatus("GET", "/api/minion/5", SimpleWeb::StatusCode::server_error_internal_server_error);

    BOOST_CHECK(poller->pollJob(5, std::stop_token()) == eJobOutcome::Indeterminate);
    BOOST_CHECK_EQUAL(requestCount("GET", "/api/minion/5"), 1);
}

BOOST_AUTO_TEST_CASE(test_unreadable_status_is_indeterminate)
{
    route("GET", "/api/minion/6", [](const Response& response, const Request&) {
        response->write(SimpleWeb::StatusCode::success_ok, "not json");
    });

    BOOST_CHECK(poller->pollJob(6, std::stop_token()) == eJobOutcome::Indeterminate);
}

BOOST_AUTO_TEST_CASE(test_denied_gate_makes_no_queries)
{
    routeStates(42, {"finished"});
    networkMonitor->setAvailable(false);

    BOOST_CHECK(poller->pollJob(42, std::stop_token()) == eJobOutcome::Indeterminate);
    BOOST_CHECK_EQUAL(requestCount(), 0);

    // A denied poll is silent
    BOOST_CHECK(notifications->errors().empty());
}

BOOST_AUTO_TEST_CASE(test_cancelled_poll_stops_querying)
{
    routeStates(42, {"active"});

    std::stop_source source;
    std::thread canceller([&]() {
        waitFor([&]() { return requestCount("GET", "/api/minion/42") >= 2; });
        source.request_stop();
    });

    BOOST_CHECK(poller->pollJob(42, source.get_token()) == eJobOutcome::Indeterminate);
    canceller.join();

    auto queries = requestCount("GET", "/api/minion/42");
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    BOOST_CHECK_EQUAL(requestCount("GET", "/api/minion/42"), queries);
}

BOOST_AUTO_TEST_CASE(test_pre_cancelled_poll_never_queries)
{
    routeStates(42, {"finished"});

    std::stop_source source;
    source.request_stop();

    BOOST_CHECK(poller->pollJob(42, source.get_token()) == eJobOutcome::Indeterminate);
    BOOST_CHECK_EQUAL(requestCount(), 0);
}

BOOST_AUTO_TEST_CASE(test_job_state_parsing)
{
    BOOST_CHECK(parseJobState("finished") == eJobOutcome::Finished);
    BOOST_CHECK(parseJobState("failed") == eJobOutcome::Failed);
    BOOST_CHECK(!parseJobState("active").has_value());
    BOOST_CHECK(!parseJobState("").has_value());
}

BOOST_AUTO_TEST_SUITE_END()
