//
// Owns every client component. Construction wires them together, initialize() brings them up in order
// (server configuration, custom headers, connectivity observer) and shutdown() takes them down again.
//

#ifndef LRR_CLIENT_APPLICATION_H
#define LRR_CLIENT_APPLICATION_H

#include "Categories/CategoryManager.h"
#include "Connectivity/ConnectivityGate.h"
#include "Download/DownloadManager.h"
#include "HTTP/HeaderStore.h"
#include "HTTP/HttpTransport.h"
#include "HTTP/RequestBuilder.h"
#include "HTTP/ServerClient.h"
#include "Interfaces/INetworkMonitor.h"
#include "Jobs/JobPoller.h"
#include "Lib/Notifier.h"
#include "Search/ArchiveIndex.h"
#include "Search/ListingCriteria.h"
#include "Search/SearchSelector.h"
#include "Settings.h"
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>
#include <vector>

struct sApplicationConfig
{
    std::string serverAddress;
    std::string apiKey;
    std::filesystem::path dataDirectory;
    bool verboseMessages = false;
    uint32_t httpWorkerPoolSize = HTTP_WORKER_POOL_SIZE;
    uint32_t downloadConcurrency = DOWNLOAD_CONCURRENCY;

    static auto fromEnvironment() -> sApplicationConfig;
};

class Application {
public:
    Application(sApplicationConfig config, std::shared_ptr<INetworkMonitor> networkMonitor);
    virtual ~Application();
    Application(Application const&) = delete;
    auto operator =(Application const&) -> Application& = delete;
    Application(Application&&) = delete;
    auto operator=(Application&&) -> Application& = delete;

    void initialize();
    void shutdown();
    auto isRunning() const -> bool { return bRunning; }

    // A selector subscribed to category updates for as long as it lives
    auto createSearchSelector(sListingCriteria initial = {}) -> std::unique_ptr<SearchSelector>;

    auto getNotifier() const -> const std::shared_ptr<Notifier>& { return pNotifier; }
    auto getConnectivityGate() const -> const std::shared_ptr<ConnectivityGate>& { return pGate; }
    auto getRequestBuilder() const -> const std::shared_ptr<RequestBuilder>& { return pBuilder; }
    auto getServerClient() const -> const std::shared_ptr<ServerClient>& { return pServerClient; }
    auto getJobPoller() const -> const std::shared_ptr<JobPoller>& { return pJobPoller; }
    auto getDownloadManager() const -> const std::shared_ptr<DownloadManager>& { return pDownloadManager; }
    auto getCategoryManager() const -> const std::shared_ptr<CategoryManager>& { return pCategoryManager; }
    auto getArchiveIndex() const -> const std::shared_ptr<ArchiveIndex>& { return pArchiveIndex; }

    // Download listeners are notified on this context, the host is responsible for running it
    auto getUiContext() const -> const std::shared_ptr<boost::asio::io_context>& { return pUiContext; }

private:
    sApplicationConfig config;
    std::shared_ptr<INetworkMonitor> pNetworkMonitor;

    std::shared_ptr<boost::asio::io_context> pIoContext;
    std::shared_ptr<boost::asio::io_context> pUiContext;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> workGuard;
    std::vector<std::thread> vWorkers;

    std::shared_ptr<Notifier> pNotifier;
    std::shared_ptr<ConnectivityGate> pGate;
    std::shared_ptr<RequestBuilder> pBuilder;
    std::shared_ptr<HttpTransport> pTransport;
    std::shared_ptr<HeaderStore> pHeaderStore;
    std::shared_ptr<JobPoller> pJobPoller;
    std::shared_ptr<ServerClient> pServerClient;
    std::shared_ptr<DownloadManager> pDownloadManager;
    std::shared_ptr<CategoryManager> pCategoryManager;
    std::shared_ptr<ArchiveIndex> pArchiveIndex;

    bool bRunning = false;
};

#endif //LRR_CLIENT_APPLICATION_H
