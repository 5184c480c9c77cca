//
// Runs archive downloads (every page plus its thumbnail) under a global concurrency limit. Downloads can
// be resumed from a page, cancelled and deleted, and registered listeners are told about progress on
// the UI context.
//

#ifndef LRR_CLIENT_DOWNLOADMANAGER_H
#define LRR_CLIENT_DOWNLOADMANAGER_H

#include "../HTTP/ServerClient.h"
#include "../Interfaces/IDownloadListener.h"
#include "../Lib/TestingMacros.h"
#include "../Settings.h"
#include "DownloadTask.h"
#include "PermitPool.h"
#include <boost/asio/io_context.hpp>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <folly/concurrency/ConcurrentHashMap.h>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class DownloadManager {
public:
    DownloadManager(
            std::shared_ptr<ServerClient> serverClient,
            std::filesystem::path downloadsDirectory,
            std::shared_ptr<boost::asio::io_context> uiContext,
            uint32_t concurrency = DOWNLOAD_CONCURRENCY
    );
    virtual ~DownloadManager();
    DownloadManager(DownloadManager const&) = delete;
    auto operator =(DownloadManager const&) -> DownloadManager& = delete;
    DownloadManager(DownloadManager&&) = delete;
    auto operator=(DownloadManager&&) -> DownloadManager& = delete;

    // Does nothing if the archive is already downloading. overwrite discards anything downloaded before.
    void download(const std::string& id, bool overwrite = false);
    // Continues an earlier download at page index from, does nothing if the archive was never downloaded
    void resumeDownload(const std::string& id, uint32_t from);
    // Stops the download, files already written stay in place for a later resume
    void cancelDownload(const std::string& id);
    void deleteArchive(const std::string& id);

    // Replays the progress of every running download to the new listener before returning
    void addListener(const std::shared_ptr<IImageDownloadListener>& listener);
    void removeListener(const std::shared_ptr<IImageDownloadListener>& listener);

    auto isDownloaded(const std::string& id) const -> bool;
    auto isDownloading(const std::string& id) const -> bool;
    auto getDownloadedPageCount(const std::string& id) const -> uint32_t;
    auto getDownloadedPage(const std::string& id, uint32_t page) const -> std::optional<std::filesystem::path>;
    auto getDownloadedThumb(const std::string& id, uint32_t page) const -> std::optional<std::filesystem::path>;
    // Oldest first
    auto getDownloadedArchives() const -> std::vector<std::string>;

    auto getDownloadsDirectory() const -> const std::filesystem::path& { return downloadsDirectory; }

    // Cancels every download and waits for the workers to exit
    void stop();

private:
    void start(const std::string& id, uint32_t from);
    void run(const std::shared_ptr<DownloadTask>& task, uint32_t from);
    auto downloadPage(const std::shared_ptr<DownloadTask>& task, const std::string& serverPath, uint32_t index) -> bool;
    auto writeFile(const std::filesystem::path& file, const std::string& content) -> bool;

    void updateListeners(const std::shared_ptr<DownloadTask>& task, uint32_t pagesDownloaded);
    void updateRemoveListeners(const std::string& id);
    void updateCancelListeners(const std::string& id);
    auto listenerSnapshot() const -> std::vector<std::shared_ptr<IImageDownloadListener>>;

    std::shared_ptr<ServerClient> pServerClient;
    std::filesystem::path downloadsDirectory;
    std::shared_ptr<boost::asio::io_context> pUiContext;

    folly::ConcurrentHashMap<std::string, std::shared_ptr<DownloadTask>> mRunningDownloads;
    PermitPool permits;

    mutable std::mutex listenerMutex;
    std::vector<std::shared_ptr<IImageDownloadListener>> vListeners;

    std::mutex workerMutex;
    std::condition_variable workerCondition;
    uint32_t runningWorkers = 0;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(permits);
EXPOSE_PROPERTY_FOR_TESTING_READONLY(mRunningDownloads);
};

#endif //LRR_CLIENT_DOWNLOADMANAGER_H
