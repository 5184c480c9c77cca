//
// Waits for a server side job (minion) to reach a terminal state
//

#ifndef LRR_CLIENT_JOBPOLLER_H
#define LRR_CLIENT_JOBPOLLER_H

#include "../Connectivity/ConnectivityGate.h"
#include "../HTTP/HttpTransport.h"
#include "../HTTP/RequestBuilder.h"
#include "../Lib/GeneralUtils.h"
#include "../Lib/JobStatus.h"
#include "../Lib/TestingMacros.h"
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <stop_token>

class JobPoller {
public:
    JobPoller(std::shared_ptr<ConnectivityGate> gate, std::shared_ptr<HttpTransport> transport, std::shared_ptr<RequestBuilder> builder);

    // Sleeps for the poll interval then queries the job, until the job finishes or fails. There is no
    // iteration cap, cancelling the token is the only way to give up on a job that never completes.
    // A denied connection, a failed or unsuccessful status query or cancellation ends the poll
    // with an indeterminate outcome.
    auto pollJob(uint64_t jobId, std::stop_token token) -> eJobOutcome;

    // True only if the job finished
    auto waitForJob(uint64_t jobId, std::stop_token token) -> bool;

    // A single status query. Empty means the job is still pending.
    auto checkJobStatus(uint64_t jobId, std::stop_token token) -> std::optional<eJobOutcome>;

private:
    std::shared_ptr<ConnectivityGate> pGate;
    std::shared_ptr<HttpTransport> pTransport;
    std::shared_ptr<RequestBuilder> pBuilder;

    std::chrono::milliseconds pollInterval;

// Testing
EXPOSE_PROPERTY_FOR_TESTING(pollInterval);
};

#endif //LRR_CLIENT_JOBPOLLER_H
