#include "RequestBuilder.h"
#include "../Lib/GeneralUtils.h"
#include <mutex>

void RequestBuilder::setApiKey(const std::string& rawKey) {
    auto encoded = rawKey.empty() ? std::string() : "Bearer " + base64Encode(rawKey);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    authorization = encoded;
}

auto RequestBuilder::getAuthorization() const -> std::string {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return authorization;
}

void RequestBuilder::setCustomHeaders(std::vector<sHeader> headers) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    vCustomHeaders = std::move(headers);
}

auto RequestBuilder::getCustomHeaders() const -> std::vector<sHeader> {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return vCustomHeaders;
}

auto RequestBuilder::build(const std::string& method, const std::string& path, const std::optional<std::string>& formBody) const -> sRequest {
    sRequest request;
    request.method = method;
    request.path = path;

    if (formBody) {
        request.content = *formBody;
        request.contentType = "application/x-www-form-urlencoded";
    }

    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (!authorization.empty()) {
        request.header.emplace_back("Authorization", authorization);
    }

    for (const auto& header : vCustomHeaders) {
        request.header.emplace_back(header.name, header.value);
    }

    return request;
}
