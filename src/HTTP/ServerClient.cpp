#include "ServerClient.h"
#include "../Download/DownloadLayout.h"
#include "../Lib/Errors.h"
#include "../Lib/GeneralUtils.h"
#include "Endpoints.h"
#include "HttpUtils.h"
#include <future>
#include <iostream>
#include <regex>
#include <utility>

namespace {
    const std::string FAILED_TO_CONNECT_MESSAGE = "Failed to connect to server.";
    const std::string EXTRACT_MESSAGE = "Extracting archive...";
    const std::string EXTRACT_FAIL_MESSAGE = "Failed to extract archive.";
    const std::string TEMP_CLEAR_SUCCESS_MESSAGE = "Temp folder cleared.";
    const std::string TEMP_CLEAR_FAIL_MESSAGE = "Failed to clear temp folder.";
    const std::string CATEGORY_CREATE_FAIL_MESSAGE = "Failed to create category.";
    const std::string CATEGORY_ADD_FAIL_MESSAGE = "Failed to add to category.";
    const std::string CATEGORY_REMOVE_FAIL_MESSAGE = "Failed to remove from category.";
    const std::string THUMB_SET_FAIL_MESSAGE = "Failed to set thumbnail.";
    const std::string INVALID_URL_MESSAGE = "Invalid URL!";

    // An empty form body still marks the request as form data, the server expects it on PUT and POST
    const std::optional<std::string> EMPTY_FORM = std::string();

    auto thumbnailPath(const std::string& id, uint32_t page) -> std::string {
        return ARCHIVE_THUMBNAIL_ENDPOINT.path({id}) + buildQueryString({{"page", std::to_string(page + 1)}, {"no_fallback", "true"}});
    }
}

ServerClient::ServerClient(
        std::shared_ptr<ConnectivityGate> gate,
        std::shared_ptr<HttpTransport> transport,
        std::shared_ptr<RequestBuilder> builder,
        std::shared_ptr<JobPoller> jobPoller,
        std::shared_ptr<HeaderStore> headerStore,
        std::shared_ptr<Notifier> notifier,
        std::filesystem::path downloadsDirectory
) : pGate(std::move(gate)), pTransport(std::move(transport)), pBuilder(std::move(builder)), pJobPoller(std::move(jobPoller)),
    pHeaderStore(std::move(headerStore)), pNotifier(std::move(notifier)), downloadsDirectory(std::move(downloadsDirectory)) {}

auto ServerClient::updateServerLocation(const std::string& value) -> bool {
    if (value.empty()) {
        pGate->setServerAddress("");
        return true;
    }

    if (value == pGate->getServerAddress()) {
        return true;
    }

    static const std::regex urlRegex(R"(^(https?://|www\.)?[a-z0-9-]+(\.[a-z0-9-]+)*(:\d+)?([/?].*)?$)");
    if (!std::regex_match(value, urlRegex)) {
        pNotifier->notifyError(INVALID_URL_MESSAGE);
        return false;
    }

    auto location = value.rfind("http", 0) == 0 ? value : "http://" + value;

    if (!pTransport->setServerLocation(location)) {
        pNotifier->notifyError(INVALID_URL_MESSAGE);
        return false;
    }

    pGate->setServerAddress(location);

    std::cout << "HTTP: Server location set to " << location << std::endl;
    return true;
}

auto ServerClient::getServerLocation() const -> std::string {
    return pGate->getServerAddress();
}

void ServerClient::setApiKey(const std::string& rawKey) {
    pBuilder->setApiKey(rawKey);
}

void ServerClient::loadHeaders() {
    pBuilder->setCustomHeaders(pHeaderStore->load());
}

auto ServerClient::updateHeaders(const std::vector<sHeader>& headers) -> bool {
    pBuilder->setCustomHeaders(headers);
    return pHeaderStore->save(headers);
}

auto ServerClient::getHeaders() const -> std::vector<sHeader> {
    return pBuilder->getCustomHeaders();
}

auto ServerClient::send(const sRequest& request, std::stop_token token, const std::string& errorMessage) -> std::optional<sHttpResponse> {
    try {
        return pTransport->newCall(request)->awaitWithFail(std::move(token), errorMessage);
    } catch (eTransportError&) {
        // Already logged and reported by the call
        return std::nullopt;
    } catch (eCancelled&) {
        return std::nullopt;
    }
}

auto ServerClient::parseJson(const sHttpResponse& response) -> std::optional<nlohmann::json> {
    try {
        return nlohmann::json::parse(response.content);
    } catch (nlohmann::json::exception& exception) {
        std::cerr << "HTTP: Unable to parse server response: " << exception.what() << std::endl;
        return std::nullopt;
    }
}

auto ServerClient::getServerInfo(std::stop_token token) -> std::optional<nlohmann::json> {
    if (!pGate->canConnect(false)) {
        return std::nullopt;
    }

    pNotifier->updateRefreshing(true);

    std::optional<nlohmann::json> result;
    auto response = send(pBuilder->build(INFO_ENDPOINT.method, INFO_ENDPOINT.path()), std::move(token), FAILED_TO_CONNECT_MESSAGE);
    if (response) {
        if (!response->isSuccessful()) {
            pNotifier->handleErrorMessage(response->statusCode, FAILED_TO_CONNECT_MESSAGE);
        } else {
            result = parseJson(*response);
            if (result && result->is_object()) {
                bServerTracksProgress = readJsonBool(*result, "server_tracks_progress");
            }
        }
    }

    pNotifier->updateRefreshing(false);
    return result;
}

auto ServerClient::canReachServer(std::stop_token token) -> bool {
    if (!pGate->canConnect(false)) {
        return false;
    }

    auto response = pTransport->newCall(pBuilder->build(INFO_ENDPOINT.method, INFO_ENDPOINT.path()))->await(std::move(token), {}, true);
    if (!response) {
        return false;
    }

    if (!response->isSuccessful()) {
        pNotifier->handleErrorMessage(response->statusCode, FAILED_TO_CONNECT_MESSAGE);
        return false;
    }

    return true;
}

auto ServerClient::downloadArchiveList(std::stop_token token) -> std::optional<std::vector<sArchive>> {
    if (!pGate->canConnect(false)) {
        return std::nullopt;
    }

    auto response = send(pBuilder->build(ARCHIVE_LIST_ENDPOINT.method, ARCHIVE_LIST_ENDPOINT.path()), std::move(token), FAILED_TO_CONNECT_MESSAGE);
    if (!response) {
        return std::nullopt;
    }

    if (!response->isSuccessful()) {
        pNotifier->handleErrorMessage(response->statusCode, FAILED_TO_CONNECT_MESSAGE);
        return std::nullopt;
    }

    auto json = parseJson(*response);
    if (!json || !json->is_array()) {
        pNotifier->notifyError(FAILED_TO_CONNECT_MESSAGE);
        return std::nullopt;
    }

    std::vector<sArchive> archives;
    for (const auto& archive : *json) {
        archives.push_back(sArchive::fromJson(archive));
    }

    return archives;
}

auto ServerClient::searchServer(
        const std::string& filter,
        bool onlyNew,
        eSortMethod sortMethod,
        bool descending,
        int64_t start,
        const std::string& categoryId,
        std::stop_token token
) -> std::optional<sSearchResult> {
    if (!pGate->canConnect()) {
        return std::nullopt;
    }

    std::vector<std::pair<std::string, std::string>> params = {
            {"filter", urlEncode(filter)},
            {"newonly", onlyNew ? "true" : "false"},
            {"sortby", sortMethod == eSortMethod::Alpha ? "title" : "date_added"},
            {"order", descending ? "desc" : "asc"},
            {"start", std::to_string(start)}
    };

    if (!categoryId.empty()) {
        params.emplace_back("category", urlEncode(categoryId));
    }

    auto response = send(pBuilder->build(SEARCH_ENDPOINT.method, SEARCH_ENDPOINT.path() + buildQueryString(params)), std::move(token));
    if (!response || !response->isSuccessful()) {
        return std::nullopt;
    }

    auto json = parseJson(*response);
    if (!json || !json->is_object()) {
        return std::nullopt;
    }

    return sSearchResult::fromJson(*json);
}

auto ServerClient::getOrderedArchives(int64_t start, std::stop_token token) -> std::optional<sSearchResult> {
    return searchServer("", false, eSortMethod::Alpha, false, start, {}, std::move(token));
}

auto ServerClient::getRandomArchives(const std::string& filter, uint32_t count, const std::string& categoryId, std::stop_token token) -> std::optional<std::vector<sArchive>> {
    if (!pGate->canConnect()) {
        return std::nullopt;
    }

    auto params = buildQueryString({
            {"filter", urlEncode(filter)},
            {"category", urlEncode(categoryId)},
            {"count", std::to_string(count)}
    });

    auto response = send(pBuilder->build(SEARCH_RANDOM_ENDPOINT.method, SEARCH_RANDOM_ENDPOINT.path() + params), std::move(token));
    if (!response || !response->isSuccessful()) {
        return std::nullopt;
    }

    auto json = parseJson(*response);
    if (!json || !json->is_object()) {
        return std::nullopt;
    }

    return sSearchResult::fromJson(*json).archives;
}

auto ServerClient::getCategories(std::stop_token token) -> std::optional<std::vector<sCategory>> {
    if (!pGate->canConnect()) {
        return std::nullopt;
    }

    auto response = send(pBuilder->build(CATEGORY_LIST_ENDPOINT.method, CATEGORY_LIST_ENDPOINT.path()), std::move(token));
    if (!response || !response->isSuccessful()) {
        return std::nullopt;
    }

    auto json = parseJson(*response);
    if (!json || !json->is_array()) {
        return std::nullopt;
    }

    std::vector<sCategory> categories;
    for (const auto& category : *json) {
        categories.push_back(sCategory::fromJson(category));
    }

    return categories;
}

auto ServerClient::createCategory(const std::string& name, const std::optional<std::string>& search, bool pinned, std::stop_token token) -> std::optional<nlohmann::json> {
    if (!pGate->canConnect()) {
        return std::nullopt;
    }

    auto form = "name=" + urlEncode(name);
    if (search) {
        form += "&search=" + urlEncode(*search);
    }

    if (pinned) {
        form += "&pinned=1";
    }

    auto request = pBuilder->build(CATEGORY_CREATE_ENDPOINT.method, CATEGORY_CREATE_ENDPOINT.path(), form);
    auto response = pTransport->newCall(request)->await(std::move(token), CATEGORY_CREATE_FAIL_MESSAGE);
    if (!response) {
        return std::nullopt;
    }

    auto json = parseJson(*response);
    if (!response->isSuccessful()) {
        // The server explains why a category can't be created
        if (json && json->is_object() && json->contains("error") && (*json)["error"].is_string()) {
            pNotifier->notifyError((*json)["error"].get<std::string>());
        } else {
            pNotifier->notifyError(CATEGORY_CREATE_FAIL_MESSAGE);
        }

        return std::nullopt;
    }

    return json;
}

auto ServerClient::addToCategory(const std::string& categoryId, const std::vector<std::string>& archiveIds, std::stop_token token) -> bool {
    if (!pGate->canConnect(false)) {
        return false;
    }

    std::vector<std::future<bool>> vResults;
    for (const auto& archiveId : archiveIds) {
        auto request = pBuilder->build(CATEGORY_ADD_ARCHIVE_ENDPOINT.method, CATEGORY_ADD_ARCHIVE_ENDPOINT.path({categoryId, archiveId}), EMPTY_FORM);
        vResults.push_back(std::async(std::launch::async, [this, request, token] {
            auto response = pTransport->newCall(request)->await(token, CATEGORY_ADD_FAIL_MESSAGE, true);
            return response && response->isSuccessful();
        }));
    }

    bool success = true;
    for (auto& result : vResults) {
        success = result.get() && success;
    }

    return success;
}

auto ServerClient::removeFromCategory(const std::string& categoryId, const std::string& archiveId, std::stop_token token) -> bool {
    if (!pGate->canConnect(false)) {
        return false;
    }

    auto request = pBuilder->build(CATEGORY_REMOVE_ARCHIVE_ENDPOINT.method, CATEGORY_REMOVE_ARCHIVE_ENDPOINT.path({categoryId, archiveId}));
    auto response = pTransport->newCall(request)->await(std::move(token), CATEGORY_REMOVE_FAIL_MESSAGE, true);
    return response && response->isSuccessful();
}

auto ServerClient::deleteArchive(const std::string& id, std::stop_token token) -> bool {
    if (!pGate->canConnect()) {
        return false;
    }

    auto response = send(pBuilder->build(ARCHIVE_DELETE_ENDPOINT.method, ARCHIVE_DELETE_ENDPOINT.path({id})), std::move(token));
    if (!response || !response->isSuccessful()) {
        return false;
    }

    auto json = parseJson(*response);
    return json && json->is_object() && readJsonUint(*json, "success") == 1;
}

auto ServerClient::deleteArchives(const std::vector<std::string>& ids, std::stop_token token) -> std::vector<std::string> {
    if (!pGate->canConnect()) {
        return {};
    }

    std::vector<std::future<bool>> vResults;
    for (const auto& id : ids) {
        vResults.push_back(std::async(std::launch::async, [this, id, token] { return deleteArchive(id, token); }));
    }

    std::vector<std::string> deleted;
    for (size_t index = 0; index < ids.size(); index++) {
        if (vResults[index].get()) {
            deleted.push_back(ids[index]);
        }
    }

    return deleted;
}

void ServerClient::updateProgress(const std::string& id, uint32_t page, std::stop_token token) {
    if (!pGate->canConnect() || !bServerTracksProgress) {
        return;
    }

    auto request = pBuilder->build(ARCHIVE_PROGRESS_ENDPOINT.method, ARCHIVE_PROGRESS_ENDPOINT.path({id, std::to_string(page + 1)}), EMPTY_FORM);
    auto response = pTransport->newCall(request)->await(std::move(token), {}, true);
    if (response && !response->isSuccessful()) {
        std::cerr << "HTTP: Progress update for " << id << " returned " << response->statusCode << std::endl;
    }
}

void ServerClient::setArchiveNewFlag(const std::string& id, std::stop_token token) {
    if (!pGate->canConnect()) {
        return;
    }

    auto request = pBuilder->build(ARCHIVE_CLEAR_NEW_ENDPOINT.method, ARCHIVE_CLEAR_NEW_ENDPOINT.path({id}));
    auto response = pTransport->newCall(request)->await(std::move(token), {}, true);
    if (response && !response->isSuccessful()) {
        std::cerr << "HTTP: Clearing the new flag of " << id << " returned " << response->statusCode << std::endl;
    }
}

auto ServerClient::extractArchive(const std::string& id, bool forceFull, std::stop_token token) -> std::optional<nlohmann::json> {
    if (!pGate->canConnect(false)) {
        return std::nullopt;
    }

    pNotifier->notifyInfo(EXTRACT_MESSAGE);

    auto path = ARCHIVE_EXTRACT_ENDPOINT.path({id});
    if (forceFull) {
        path += buildQueryString({{"force", "true"}});
    }

    auto response = send(pBuilder->build(ARCHIVE_EXTRACT_ENDPOINT.method, path, EMPTY_FORM), token, EXTRACT_FAIL_MESSAGE);
    if (!response) {
        return std::nullopt;
    }

    try {
        if (!response->isSuccessful()) {
            throw eServerError(response->statusCode);
        }

        if (response->content.empty()) {
            throw eApplicationError(EXTRACT_FAIL_MESSAGE);
        }

        auto json = nlohmann::json::parse(response->content);
        if (json.contains("error")) {
            throw eApplicationError(json["error"].is_string() ? json["error"].get<std::string>() : json["error"].dump());
        }

        if (forceFull && json.contains("job") && json["job"].is_number_integer()) {
            switch (pJobPoller->pollJob(json["job"].get<uint64_t>(), token)) {
                case eJobOutcome::Finished:
                    break;
                case eJobOutcome::Failed:
                    pNotifier->notifyError(EXTRACT_FAIL_MESSAGE);
                    return std::nullopt;
                case eJobOutcome::Indeterminate:
                default:
                    return std::nullopt;
            }
        }

        return json;
    } catch (eServerError& error) {
        pNotifier->handleErrorMessage(error.statusCode(), EXTRACT_FAIL_MESSAGE);
    } catch (eApplicationError& error) {
        pNotifier->notifyError(error.what());
    } catch (nlohmann::json::exception& exception) {
        std::cerr << "HTTP: Unable to parse extraction result for " << id << ": " << exception.what() << std::endl;
        pNotifier->notifyError(EXTRACT_FAIL_MESSAGE);
    }

    return std::nullopt;
}

auto ServerClient::getPageList(const std::string& id, std::stop_token token) -> std::vector<std::string> {
    auto response = extractArchive(id, false, std::move(token));
    if (!response) {
        return {};
    }

    return parsePageList(*response);
}

auto ServerClient::parsePageList(const nlohmann::json& response) -> std::vector<std::string> {
    auto pages = response.find("pages");
    if (pages == response.end() || !pages->is_array()) {
        // Without pages the first key of the reply describes the problem
        if (response.is_object() && !response.empty()) {
            pNotifier->notifyError(response.begin().key());
        }

        return {};
    }

    std::vector<std::string> vPages;
    for (const auto& page : *pages) {
        if (!page.is_string()) {
            continue;
        }

        auto path = page.get<std::string>();
        // The server returns paths relative to its root ("./api/...")
        if (!path.empty() && path.front() == '.') {
            path.erase(0, 1);
        }

        vPages.push_back(path);
    }

    return vPages;
}

auto ServerClient::downloadImage(const std::string& serverPath, std::stop_token token) -> std::optional<std::string> {
    if (!pGate->canConnect()) {
        return std::nullopt;
    }

    auto response = send(pBuilder->build(RAW_PATH_ENDPOINT.method, RAW_PATH_ENDPOINT.path({serverPath})), std::move(token));
    if (!response || !response->isSuccessful()) {
        return std::nullopt;
    }

    return std::move(response->content);
}

auto ServerClient::downloadThumb(const std::string& id, uint32_t page, std::stop_token token) -> std::optional<std::string> {
    if (!pGate->canConnect()) {
        return std::nullopt;
    }

    auto response = send(pBuilder->build(ARCHIVE_THUMBNAIL_ENDPOINT.method, thumbnailPath(id, page)), token);
    if (!response || !response->isSuccessful() || token.stop_requested()) {
        return std::nullopt;
    }

    return std::move(response->content);
}

auto ServerClient::setThumbnail(const std::string& id, uint32_t page, std::stop_token token) -> std::optional<std::string> {
    if (!pGate->canConnect(false)) {
        return std::nullopt;
    }

    auto updatePath = ARCHIVE_SET_THUMBNAIL_ENDPOINT.path({id}) + buildQueryString({{"page", std::to_string(page + 1)}});
    auto update = send(pBuilder->build(ARCHIVE_SET_THUMBNAIL_ENDPOINT.method, updatePath, EMPTY_FORM), token, THUMB_SET_FAIL_MESSAGE);
    if (!update) {
        return std::nullopt;
    }

    if (!update->isSuccessful()) {
        pNotifier->handleErrorMessage(update->statusCode, THUMB_SET_FAIL_MESSAGE);
        return std::nullopt;
    }

    auto response = send(pBuilder->build(ARCHIVE_THUMBNAIL_ENDPOINT.method, ARCHIVE_THUMBNAIL_ENDPOINT.path({id})), token);
    if (!response || !response->isSuccessful() || token.stop_requested()) {
        return std::nullopt;
    }

    return std::move(response->content);
}

auto ServerClient::getThumbUrl(const std::string& id, uint32_t page) const -> std::string {
    auto localPage = pagePath(downloadsDirectory, id, page);
    std::error_code errorCode;
    if (std::filesystem::exists(localPage, errorCode)) {
        return localPage.string();
    }

    if (!pGate->canConnect()) {
        return {};
    }

    return pTransport->getUrl(thumbnailPath(id, page));
}

auto ServerClient::getRawImageUrl(const std::string& serverPath) const -> std::string {
    return pTransport->getUrl(serverPath);
}

auto ServerClient::clearTempFolder(std::stop_token token) -> bool {
    if (!pGate->canConnect(false)) {
        return false;
    }

    auto request = pBuilder->build(TEMP_FOLDER_ENDPOINT.method, TEMP_FOLDER_ENDPOINT.path());
    auto response = pTransport->newCall(request)->await(std::move(token), TEMP_CLEAR_FAIL_MESSAGE, true);
    if (!response) {
        return false;
    }

    if (!response->isSuccessful()) {
        pNotifier->handleErrorMessage(response->statusCode, TEMP_CLEAR_FAIL_MESSAGE);
        return false;
    }

    pNotifier->notifyInfo(TEMP_CLEAR_SUCCESS_MESSAGE);
    return true;
}

auto ServerClient::generateSuggestionList(std::stop_token token) -> std::optional<std::vector<TagSuggestion>> {
    if (!pGate->canConnect()) {
        return std::nullopt;
    }

    auto response = send(pBuilder->build(DATABASE_STATS_ENDPOINT.method, DATABASE_STATS_ENDPOINT.path()), std::move(token));
    if (!response || !response->isSuccessful()) {
        return std::nullopt;
    }

    auto json = parseJson(*response);
    if (!json || !json->is_array()) {
        return std::nullopt;
    }

    std::vector<TagSuggestion> suggestions;
    for (const auto& tag : *json) {
        if (!tag.is_object()) {
            continue;
        }

        auto text = tag.contains("text") && tag["text"].is_string() ? tag["text"].get<std::string>() : std::string();
        auto tagNamespace = tag.contains("namespace") && tag["namespace"].is_string() ? tag["namespace"].get<std::string>() : std::string();
        suggestions.emplace_back(text, tagNamespace, static_cast<uint32_t>(readJsonUint(tag, "weight")));
    }

    return suggestions;
}
