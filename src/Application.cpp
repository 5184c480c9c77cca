#include "Application.h"
#include <iostream>
#include <utility>

auto sApplicationConfig::fromEnvironment() -> sApplicationConfig {
    sApplicationConfig config;
    config.serverAddress = SERVER_ADDRESS;
    config.apiKey = SERVER_API_KEY;
    config.dataDirectory = DATA_DIRECTORY;
    config.verboseMessages = VERBOSE_MESSAGES;
    return config;
}

Application::Application(sApplicationConfig config, std::shared_ptr<INetworkMonitor> networkMonitor)
        : config(std::move(config)), pNetworkMonitor(std::move(networkMonitor)) {
    pIoContext = std::make_shared<boost::asio::io_context>();
    pUiContext = std::make_shared<boost::asio::io_context>();

    auto downloadsDirectory = this->config.dataDirectory / DOWNLOADS_DIRECTORY_NAME;

    pNotifier = std::make_shared<Notifier>();
    pGate = std::make_shared<ConnectivityGate>(pNotifier);
    pBuilder = std::make_shared<RequestBuilder>();
    pTransport = std::make_shared<HttpTransport>(pIoContext, pNotifier);
    pHeaderStore = std::make_shared<HeaderStore>(this->config.dataDirectory / HEADER_FILE_NAME);
    pJobPoller = std::make_shared<JobPoller>(pGate, pTransport, pBuilder);
    pServerClient = std::make_shared<ServerClient>(pGate, pTransport, pBuilder, pJobPoller, pHeaderStore, pNotifier, downloadsDirectory);
    pDownloadManager = std::make_shared<DownloadManager>(pServerClient, downloadsDirectory, pUiContext, this->config.downloadConcurrency);
    pCategoryManager = std::make_shared<CategoryManager>(pServerClient);
    pArchiveIndex = std::make_shared<ArchiveIndex>(pServerClient);
}

Application::~Application() {
    shutdown();
}

void Application::initialize() {
    if (bRunning) {
        return;
    }

    std::cout << "APP: Initializing" << std::endl;

    pIoContext->restart();
    workGuard.emplace(boost::asio::make_work_guard(*pIoContext));
    for (uint32_t index = 0; index < config.httpWorkerPoolSize; index++) {
        vWorkers.emplace_back([this] { pIoContext->run(); });
    }

    // Configure the server first so nothing is issued against a stale address
    pNotifier->setVerbose(config.verboseMessages);
    pServerClient->setApiKey(config.apiKey);
    if (!config.serverAddress.empty() && !pServerClient->updateServerLocation(config.serverAddress)) {
        std::cerr << "APP: Ignoring invalid server address " << config.serverAddress << std::endl;
    }

    pServerClient->loadHeaders();

    pNetworkMonitor->registerObserver(pGate);

    bRunning = true;
    std::cout << "APP: Ready" << std::endl;
}

void Application::shutdown() {
    if (!bRunning) {
        return;
    }

    std::cout << "APP: Shutting down" << std::endl;

    pDownloadManager->stop();
    pNetworkMonitor->unregisterObserver(pGate);

    workGuard.reset();
    pIoContext->stop();
    for (auto& worker : vWorkers) {
        worker.join();
    }
    vWorkers.clear();

    pUiContext->stop();

    bRunning = false;
}

auto Application::createSearchSelector(sListingCriteria initial) -> std::unique_ptr<SearchSelector> {
    return std::make_unique<SearchSelector>(pServerClient, pArchiveIndex, pCategoryManager, std::move(initial));
}
