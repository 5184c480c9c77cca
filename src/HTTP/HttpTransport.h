//
// Owns the parsed server location and creates one HttpCall per request
//

#ifndef LRR_CLIENT_HTTPTRANSPORT_H
#define LRR_CLIENT_HTTPTRANSPORT_H

#include "../Lib/Notifier.h"
#include "../Lib/TestingMacros.h"
#include "HttpCall.h"
#include "RequestBuilder.h"
#include <boost/asio/io_context.hpp>
#include <memory>
#include <shared_mutex>
#include <string>

struct sServerLocation {
    bool bSecure = false;
    // "host:port" as Simple-Web-Server expects it
    std::string hostPort;
    // Path prefix of the server, without a trailing slash
    std::string basePath;
};

class HttpTransport {
public:
    HttpTransport(std::shared_ptr<boost::asio::io_context> ioContext, std::shared_ptr<Notifier> notifier);

    // Parses the server base url, returns false and keeps the previous location if it can't be parsed
    auto setServerLocation(const std::string& url) -> bool;
    auto getServerLocation() const -> sServerLocation;

    // The absolute url of a server path, for consumers that fetch it themselves
    auto getUrl(const std::string& path) const -> std::string;

    auto newCall(sRequest request) const -> std::shared_ptr<HttpCall>;

private:
    std::shared_ptr<boost::asio::io_context> pIoContext;
    std::shared_ptr<Notifier> pNotifier;

    mutable std::shared_mutex mutex_;
    sServerLocation location;
    std::string baseUrl;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(baseUrl);
};

#endif //LRR_CLIENT_HTTPTRANSPORT_H
