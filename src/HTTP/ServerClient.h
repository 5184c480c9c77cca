//
// Every operation the client performs against the archive server. Operations consult the connectivity
// gate first and return their empty result without touching the network when it refuses. Failures are
// reported through the notifier and degrade to empty results.
//

#ifndef LRR_CLIENT_SERVERCLIENT_H
#define LRR_CLIENT_SERVERCLIENT_H

#include "../Connectivity/ConnectivityGate.h"
#include "../Jobs/JobPoller.h"
#include "../Lib/ArchiveTypes.h"
#include "../Lib/Notifier.h"
#include "../Lib/TestingMacros.h"
#include "HeaderStore.h"
#include "HttpTransport.h"
#include "RequestBuilder.h"
#include <atomic>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

class ServerClient {
public:
    ServerClient(
            std::shared_ptr<ConnectivityGate> gate,
            std::shared_ptr<HttpTransport> transport,
            std::shared_ptr<RequestBuilder> builder,
            std::shared_ptr<JobPoller> jobPoller,
            std::shared_ptr<HeaderStore> headerStore,
            std::shared_ptr<Notifier> notifier,
            std::filesystem::path downloadsDirectory
    );

    // Validates and stores the server base url. Addresses without a scheme are assumed to be http.
    auto updateServerLocation(const std::string& value) -> bool;
    auto getServerLocation() const -> std::string;

    void setApiKey(const std::string& rawKey);

    // Restores the persisted custom headers
    void loadHeaders();
    // Replaces the custom headers wholesale and persists them
    auto updateHeaders(const std::vector<sHeader>& headers) -> bool;
    auto getHeaders() const -> std::vector<sHeader>;

    auto getServerInfo(std::stop_token token = {}) -> std::optional<nlohmann::json>;
    auto serverTracksProgress() const -> bool { return bServerTracksProgress; }
    auto canReachServer(std::stop_token token = {}) -> bool;

    auto downloadArchiveList(std::stop_token token = {}) -> std::optional<std::vector<sArchive>>;
    auto searchServer(
            const std::string& filter,
            bool onlyNew,
            eSortMethod sortMethod,
            bool descending,
            int64_t start = 0,
            const std::string& categoryId = {},
            std::stop_token token = {}
    ) -> std::optional<sSearchResult>;
    // A start of -1 asks the server for every archive
    auto getOrderedArchives(int64_t start = -1, std::stop_token token = {}) -> std::optional<sSearchResult>;
    auto getRandomArchives(const std::string& filter, uint32_t count, const std::string& categoryId = {}, std::stop_token token = {}) -> std::optional<std::vector<sArchive>>;

    auto getCategories(std::stop_token token = {}) -> std::optional<std::vector<sCategory>>;
    auto createCategory(const std::string& name, const std::optional<std::string>& search = std::nullopt, bool pinned = false, std::stop_token token = {}) -> std::optional<nlohmann::json>;
    // All requests are issued concurrently, true only if every one succeeded
    auto addToCategory(const std::string& categoryId, const std::vector<std::string>& archiveIds, std::stop_token token = {}) -> bool;
    auto removeFromCategory(const std::string& categoryId, const std::string& archiveId, std::stop_token token = {}) -> bool;

    auto deleteArchive(const std::string& id, std::stop_token token = {}) -> bool;
    // Returns the ids the server actually deleted
    auto deleteArchives(const std::vector<std::string>& ids, std::stop_token token = {}) -> std::vector<std::string>;

    void updateProgress(const std::string& id, uint32_t page, std::stop_token token = {});
    void setArchiveNewFlag(const std::string& id, std::stop_token token = {});

    // When forceFull is set and the server queues a job, blocks until the job ends
    auto extractArchive(const std::string& id, bool forceFull = false, std::stop_token token = {}) -> std::optional<nlohmann::json>;
    // Server paths of every page of the archive, extracting it if needed
    auto getPageList(const std::string& id, std::stop_token token = {}) -> std::vector<std::string>;
    auto parsePageList(const nlohmann::json& response) -> std::vector<std::string>;

    auto downloadImage(const std::string& serverPath, std::stop_token token = {}) -> std::optional<std::string>;
    auto downloadThumb(const std::string& id, uint32_t page, std::stop_token token = {}) -> std::optional<std::string>;
    // Makes page the archive thumbnail and returns the new thumbnail
    auto setThumbnail(const std::string& id, uint32_t page, std::stop_token token = {}) -> std::optional<std::string>;
    // Prefers the downloaded page, empty when neither a local copy nor the server is available
    auto getThumbUrl(const std::string& id, uint32_t page) const -> std::string;
    auto getRawImageUrl(const std::string& serverPath) const -> std::string;

    auto clearTempFolder(std::stop_token token = {}) -> bool;
    auto generateSuggestionList(std::stop_token token = {}) -> std::optional<std::vector<TagSuggestion>>;

private:
    // Transport failures (already reported when errorMessage is set) and cancellation become an empty result
    auto send(const sRequest& request, std::stop_token token, const std::string& errorMessage = {}) -> std::optional<sHttpResponse>;
    auto parseJson(const sHttpResponse& response) -> std::optional<nlohmann::json>;

    std::shared_ptr<ConnectivityGate> pGate;
    std::shared_ptr<HttpTransport> pTransport;
    std::shared_ptr<RequestBuilder> pBuilder;
    std::shared_ptr<JobPoller> pJobPoller;
    std::shared_ptr<HeaderStore> pHeaderStore;
    std::shared_ptr<Notifier> pNotifier;
    std::filesystem::path downloadsDirectory;

    std::atomic<bool> bServerTracksProgress = false;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(bServerTracksProgress);
};

#endif //LRR_CLIENT_SERVERCLIENT_H
