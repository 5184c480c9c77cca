#include "HttpTransport.h"
#include "../Settings.h"
#include "HttpUtils.h"
#include <client_https.hpp>
#include <folly/Uri.h>
#include <iostream>
#include <mutex>
#include <utility>

namespace {
    template<class SocketType>
    class SimpleWebCall : public HttpCall {
    public:
        using Client = SimpleWeb::Client<SocketType>;

        SimpleWebCall(sServerLocation location, std::shared_ptr<boost::asio::io_context> ioContext, sRequest request, std::shared_ptr<Notifier> notifier)
                : HttpCall(std::move(request), std::move(notifier)), location(std::move(location)), pIoContext(std::move(ioContext)) {}

    protected:
        void enqueue(bool discardBody) override {
            std::unique_lock<std::mutex> lock(mutex_);

            pClient = std::make_shared<Client>(location.hostPort);
            pClient->io_service = pIoContext;
            pClient->config.timeout = HTTP_READ_TIMEOUT_SECONDS;
            pClient->config.timeout_connect = HTTP_CONNECT_TIMEOUT_SECONDS;

            SimpleWeb::CaseInsensitiveMultimap header;
            for (const auto& [name, value] : request.header) {
                header.emplace(name, value);
            }

            if (!request.contentType.empty()) {
                header.emplace("Content-Type", request.contentType);
            }

            // The callback only holds the call state, the client is released by the call itself
            auto state = pState;
            auto body = std::make_shared<std::string>();

            pClient->request(
                    request.method,
                    location.basePath + request.path,
                    request.content,
                    header,
                    [state, body, discardBody](const std::shared_ptr<typename Client::Response>& response, const SimpleWeb::error_code& errorCode) {
                        if (errorCode) {
                            state->resolve(eOutcome::Failed, {}, errorCode.message());
                            return;
                        }

                        if (!discardBody) {
                            body->append(response->content.string());
                        }

                        // Large bodies arrive in several chunks
                        if (!response->content.end) {
                            return;
                        }

                        sHttpResponse result;
                        result.statusCode = parseStatusCode(response->status_code);
                        result.content = std::move(*body);
                        result.header = response->header;
                        state->resolve(eOutcome::Completed, std::move(result));
                    }
            );
        }

        void abort() override {
            std::unique_lock<std::mutex> lock(mutex_);
            if (pClient) {
                pClient->stop();
            }
        }

    private:
        const sServerLocation location;
        std::shared_ptr<boost::asio::io_context> pIoContext;

        std::mutex mutex_;
        std::shared_ptr<Client> pClient = nullptr;
    };
}

HttpTransport::HttpTransport(std::shared_ptr<boost::asio::io_context> ioContext, std::shared_ptr<Notifier> notifier)
        : pIoContext(std::move(ioContext)), pNotifier(std::move(notifier)) {}

auto HttpTransport::setServerLocation(const std::string& url) -> bool {
    sServerLocation parsed;

    try {
        folly::Uri uri(url);

        auto scheme = uri.scheme();
        if (scheme != "http" && scheme != "https") {
            std::cerr << "HTTP: Unsupported scheme in server address " << url << std::endl;
            return false;
        }

        parsed.bSecure = scheme == "https";

        auto port = uri.port();
        if (port == 0) {
            port = parsed.bSecure ? 443 : 80;
        }

        parsed.hostPort = uri.host() + ":" + std::to_string(port);
        parsed.basePath = uri.path();
        while (!parsed.basePath.empty() && parsed.basePath.back() == '/') {
            parsed.basePath.pop_back();
        }
    } catch (std::exception& exception) {
        std::cerr << "HTTP: Unable to parse server address " << url << ": " << exception.what() << std::endl;
        return false;
    }

    auto base = url;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    location = parsed;
    baseUrl = base;
    return true;
}

auto HttpTransport::getServerLocation() const -> sServerLocation {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return location;
}

auto HttpTransport::getUrl(const std::string& path) const -> std::string {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return baseUrl + path;
}

auto HttpTransport::newCall(sRequest request) const -> std::shared_ptr<HttpCall> {
    auto current = getServerLocation();

    if (current.bSecure) {
        return std::make_shared<SimpleWebCall<SimpleWeb::HTTPS>>(current, pIoContext, std::move(request), pNotifier);
    }

    return std::make_shared<SimpleWebCall<SimpleWeb::HTTP>>(current, pIoContext, std::move(request), pNotifier);
}
