#include "HttpCall.h"
#include "../Lib/Errors.h"
#include <iostream>
#include <utility>

auto HttpCall::sCallState::resolve(eOutcome result, sHttpResponse&& httpResponse, std::string failureCause) -> bool {
    if (bResolved.exchange(true)) {
        return false;
    }

    response = std::move(httpResponse);
    failure = std::move(failureCause);
    outcome = result;
    promise.set_value();
    return true;
}

HttpCall::HttpCall(sRequest request, std::shared_ptr<Notifier> notifier)
        : request(std::move(request)), pState(std::make_shared<sCallState>()), pNotifier(std::move(notifier)) {}

auto HttpCall::awaitOutcome(std::stop_token token, bool discardBody) -> eOutcome {
    if (bAwaited) {
        throw std::logic_error("HttpCall can only be awaited once");
    }
    bAwaited = true;

    auto future = pState->promise.get_future();

    // A task that is already cancelled never touches the network
    if (token.stop_requested()) {
        pState->resolve(eOutcome::Cancelled);
        return pState->outcome;
    }

    enqueue(discardBody);

    {
        std::stop_callback onStop(token, [this] { cancel(); });
        future.wait();
    }

    return pState->outcome;
}

auto HttpCall::awaitWithFail(std::stop_token token, const std::string& errorMessage) -> sHttpResponse {
    switch (awaitOutcome(std::move(token), false)) {
        case eOutcome::Completed:
            return std::move(pState->response);
        case eOutcome::Cancelled:
            throw eCancelled();
        case eOutcome::Failed:
        default:
            std::cerr << "HTTP: " << request.method << " " << request.path << " failed: " << pState->failure << std::endl;
            if (!errorMessage.empty()) {
                pNotifier->handleErrorMessage(pState->failure, errorMessage);
            }
            throw eTransportError(pState->failure);
    }
}

auto HttpCall::await(std::stop_token token, const std::string& errorMessage, bool autoClose) -> std::optional<sHttpResponse> {
    switch (awaitOutcome(std::move(token), autoClose)) {
        case eOutcome::Completed:
            return std::move(pState->response);
        case eOutcome::Failed:
            std::cerr << "HTTP: " << request.method << " " << request.path << " failed: " << pState->failure << std::endl;
            abort();
            if (!errorMessage.empty()) {
                pNotifier->handleErrorMessage(pState->failure, errorMessage);
            }
            return std::nullopt;
        case eOutcome::Cancelled:
        default:
            return std::nullopt;
    }
}

void HttpCall::cancel() {
    if (pState->resolve(eOutcome::Cancelled)) {
        abort();
    }
}

auto HttpCall::isCancelled() const -> bool {
    return pState->outcome == eOutcome::Cancelled;
}
