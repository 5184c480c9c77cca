//
// Assembles authenticated requests for the server endpoints
//

#ifndef LRR_CLIENT_REQUESTBUILDER_H
#define LRR_CLIENT_REQUESTBUILDER_H

#include "../Lib/ArchiveTypes.h"
#include "../Lib/TestingMacros.h"
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

struct sRequest {
    std::string method = "GET";
    // Path relative to the server base, including any query string
    std::string path;
    std::string content;
    std::string contentType;
    // Kept in insertion order, duplicates are passed through to the transport untouched
    std::vector<std::pair<std::string, std::string>> header;
};

class RequestBuilder {
public:
    // Stores the credential as "Bearer <base64(key)>", an empty key disables authentication
    void setApiKey(const std::string& rawKey);
    auto getAuthorization() const -> std::string;

    void setCustomHeaders(std::vector<sHeader> headers);
    auto getCustomHeaders() const -> std::vector<sHeader>;

    // A form body (possibly empty) marks the request as url encoded form data
    auto build(const std::string& method, const std::string& path, const std::optional<std::string>& formBody = std::nullopt) const -> sRequest;

private:
    mutable std::shared_mutex mutex_;
    std::string authorization;
    std::vector<sHeader> vCustomHeaders;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(authorization);
};

#endif //LRR_CLIENT_REQUESTBUILDER_H
