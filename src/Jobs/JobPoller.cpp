#include "JobPoller.h"
#include "../HTTP/Endpoints.h"
#include "../Lib/Errors.h"
#include "../Settings.h"
#include <iostream>
#include <nlohmann/json.hpp>
#include <utility>

JobPoller::JobPoller(std::shared_ptr<ConnectivityGate> gate, std::shared_ptr<HttpTransport> transport, std::shared_ptr<RequestBuilder> builder)
        : pGate(std::move(gate)), pTransport(std::move(transport)), pBuilder(std::move(builder)),
          pollInterval(JOB_POLL_INTERVAL_MILLISECONDS) {}

auto JobPoller::pollJob(uint64_t jobId, std::stop_token token) -> eJobOutcome {
    InterruptableTimer timer;

    std::cout << "JOB: Waiting for job " << jobId << std::endl;

    while (true) {
        if (!timer.wait_for(pollInterval, token)) {
            std::cout << "JOB: Stopped waiting for job " << jobId << std::endl;
            return eJobOutcome::Indeterminate;
        }

        auto status = checkJobStatus(jobId, token);
        if (status) {
            std::cout << "JOB: Job " << jobId << " ended with "
                      << (*status == eJobOutcome::Finished ? "finished" : *status == eJobOutcome::Failed ? "failed" : "no verdict")
                      << std::endl;
            return *status;
        }
    }
}

auto JobPoller::waitForJob(uint64_t jobId, std::stop_token token) -> bool {
    return pollJob(jobId, std::move(token)) == eJobOutcome::Finished;
}

auto JobPoller::checkJobStatus(uint64_t jobId, std::stop_token token) -> std::optional<eJobOutcome> {
    if (!pGate->canConnect()) {
        return eJobOutcome::Indeterminate;
    }

    auto request = pBuilder->build(MINION_STATUS_ENDPOINT.method, MINION_STATUS_ENDPOINT.path({std::to_string(jobId)}));

    try {
        auto response = pTransport->newCall(request)->awaitWithFail(token);
        if (!response.isSuccessful() || token.stop_requested()) {
            return eJobOutcome::Indeterminate;
        }

        auto json = nlohmann::json::parse(response.content);
        std::string state;
        if (json.contains("state") && json["state"].is_string()) {
            state = json["state"].get<std::string>();
        }

        return parseJobState(state);
    } catch (eCancelled&) {
        return eJobOutcome::Indeterminate;
    } catch (eTransportError&) {
        return eJobOutcome::Indeterminate;
    } catch (nlohmann::json::exception& exception) {
        std::cerr << "JOB: Unreadable status for job " << jobId << ": " << exception.what() << std::endl;
        return eJobOutcome::Indeterminate;
    }
}
