//
// Turns one callback driven HTTP request into a cancellable unit of work that resolves exactly once
//

#ifndef LRR_CLIENT_HTTPCALL_H
#define LRR_CLIENT_HTTPCALL_H

#include "../Lib/Notifier.h"
#include "../Lib/TestingMacros.h"
#include "RequestBuilder.h"
#include <atomic>
#include <client_http.hpp>
#include <future>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>

struct sHttpResponse {
    int statusCode = 0;
    std::string content;
    SimpleWeb::CaseInsensitiveMultimap header;

    [[nodiscard]] auto isSuccessful() const -> bool { return statusCode >= 200 && statusCode < 300; }
};

class HttpCall {
public:
    virtual ~HttpCall() = default;
    HttpCall(HttpCall const&) = delete;
    auto operator =(HttpCall const&) -> HttpCall& = delete;
    HttpCall(HttpCall&&) = delete;
    auto operator=(HttpCall&&) -> HttpCall& = delete;

    // Issues the request and blocks until it resolves. Transport failures are reported with errorMessage
    // (when given) and rethrown as eTransportError. Cancellation through the token throws eCancelled and
    // is never reported.
    auto awaitWithFail(std::stop_token token, const std::string& errorMessage = {}) -> sHttpResponse;

    // Same as awaitWithFail but failures and cancellation yield an empty result. autoClose discards the
    // body for callers that only need the status.
    auto await(std::stop_token token, const std::string& errorMessage = {}, bool autoClose = false) -> std::optional<sHttpResponse>;

    // Resolves the call as cancelled and aborts the underlying request
    void cancel();

    auto isCancelled() const -> bool;

    auto getRequest() const -> const sRequest& { return request; }

protected:
    enum class eOutcome {
        Pending,
        Completed,
        Failed,
        Cancelled
    };

    struct sCallState {
        std::atomic<bool> bResolved = false;
        std::promise<void> promise;
        sHttpResponse response;
        std::string failure;
        // Published after response and failure, readable from any thread
        std::atomic<eOutcome> outcome = eOutcome::Pending;

        // Only the first resolution wins, returns false if the call was already resolved
        auto resolve(eOutcome result, sHttpResponse&& httpResponse = {}, std::string failureCause = {}) -> bool;
    };

    HttpCall(sRequest request, std::shared_ptr<Notifier> notifier);

    // Starts the transport request, results must be delivered through pState
    virtual void enqueue(bool discardBody) = 0;
    // Best effort abort of the transport request
    virtual void abort() = 0;

    const sRequest request;
    const std::shared_ptr<sCallState> pState;

private:
    auto awaitOutcome(std::stop_token token, bool discardBody) -> eOutcome;

    std::shared_ptr<Notifier> pNotifier;
    bool bAwaited = false;
};

#endif //LRR_CLIENT_HTTPCALL_H
