#include "DownloadManager.h"
#include "../Lib/GeneralUtils.h"
#include "DownloadLayout.h"
#include <algorithm>
#include <boost/asio/post.hpp>
#include <fstream>
#include <future>
#include <iostream>
#include <thread>
#include <utility>

DownloadManager::DownloadManager(
        std::shared_ptr<ServerClient> serverClient,
        std::filesystem::path downloadsDirectory,
        std::shared_ptr<boost::asio::io_context> uiContext,
        uint32_t concurrency
) : pServerClient(std::move(serverClient)), downloadsDirectory(std::move(downloadsDirectory)), pUiContext(std::move(uiContext)),
    permits(concurrency) {}

DownloadManager::~DownloadManager() {
    stop();
}

void DownloadManager::download(const std::string& id, bool overwrite) {
    if (isDownloading(id)) {
        return;
    }

    auto downloadDir = archiveDirectory(downloadsDirectory, id);
    std::error_code errorCode;

    if (overwrite) {
        std::filesystem::remove_all(downloadDir, errorCode);
        if (errorCode) {
            std::cerr << "DL: Unable to remove " << downloadDir << ": " << errorCode.message() << std::endl;
            return;
        }
    } else if (std::filesystem::exists(downloadDir, errorCode)) {
        // Already downloaded, resumeDownload or an overwrite continues a partial copy
        return;
    }

    std::filesystem::create_directories(thumbDirectory(downloadsDirectory, id), errorCode);
    if (errorCode) {
        std::cerr << "DL: Unable to create " << downloadDir << ": " << errorCode.message() << std::endl;
        return;
    }

    start(id, 0);
}

void DownloadManager::resumeDownload(const std::string& id, uint32_t from) {
    if (isDownloading(id)) {
        return;
    }

    std::error_code errorCode;
    if (!std::filesystem::is_directory(archiveDirectory(downloadsDirectory, id), errorCode)) {
        return;
    }

    auto thumbDir = thumbDirectory(downloadsDirectory, id);
    if (!std::filesystem::is_directory(thumbDir, errorCode)) {
        std::filesystem::create_directories(thumbDir, errorCode);
        if (errorCode) {
            std::cerr << "DL: Unable to create " << thumbDir << ": " << errorCode.message() << std::endl;
            return;
        }
    }

    start(id, from);
}

void DownloadManager::start(const std::string& id, uint32_t from) {
    auto task = std::make_shared<DownloadTask>(id);
    if (!mRunningDownloads.insert(id, task).second) {
        return;
    }

    {
        std::unique_lock<std::mutex> lock(workerMutex);
        runningWorkers++;
    }

    updateListeners(task, from);

    std::cout << "DL: Starting download of " << id << " from page " << from << std::endl;

    std::thread([this, task, from] {
        try {
            run(task, from);
        } catch (std::exception& exception) {
            dumpExceptions(exception);
        }

        // Only forget the download if it is still ours, a cancel followed by a new download replaces it
        mRunningDownloads.erase_if_equal(task->id(), task);

        std::unique_lock<std::mutex> lock(workerMutex);
        runningWorkers--;
        workerCondition.notify_all();
    }).detach();
}

void DownloadManager::run(const std::shared_ptr<DownloadTask>& task, uint32_t from) {
    auto permit = permits.acquire(task->token());
    if (!permit) {
        return;
    }

    auto pages = pServerClient->getPageList(task->id(), task->token());
    for (auto index = static_cast<size_t>(from); index < pages.size(); index++) {
        if (!downloadPage(task, pages[index], static_cast<uint32_t>(index))) {
            std::cout << "DL: Download of " << task->id() << " stopped at page " << index << std::endl;
            return;
        }
    }

    std::cout << "DL: Finished downloading " << task->id() << std::endl;
}

auto DownloadManager::downloadPage(const std::shared_ptr<DownloadTask>& task, const std::string& serverPath, uint32_t index) -> bool {
    auto token = task->token();

    auto thumbDownload = std::async(std::launch::async, [this, task, index, token] {
        return pServerClient->downloadThumb(task->id(), index, token);
    });
    auto image = pServerClient->downloadImage(serverPath, token);
    auto thumb = thumbDownload.get();

    // In flight writes are abandoned once the download is cancelled
    if (token.stop_requested()) {
        return false;
    }

    if (image) {
        writeFile(pagePath(downloadsDirectory, task->id(), index), *image);
    }

    if (thumb) {
        writeFile(thumbPath(downloadsDirectory, task->id(), index), *thumb);
    }

    updateListeners(task, index + 1);
    return true;
}

auto DownloadManager::writeFile(const std::filesystem::path& file, const std::string& content) -> bool {
    std::ofstream stream(file, std::ios::binary | std::ios::trunc);
    stream.write(content.data(), static_cast<std::streamsize>(content.size()));
    stream.close();

    if (!stream) {
        std::cerr << "DL: Unable to write " << file << std::endl;
        return false;
    }

    return true;
}

void DownloadManager::cancelDownload(const std::string& id) {
    auto iter = mRunningDownloads.find(id);
    if (iter == mRunningDownloads.end()) {
        return;
    }

    auto task = iter->second;
    if (mRunningDownloads.erase_if_equal(id, task) == 0) {
        return;
    }

    task->cancel();

    std::cout << "DL: Cancelled download of " << id << std::endl;
    updateCancelListeners(id);
}

void DownloadManager::deleteArchive(const std::string& id) {
    std::error_code errorCode;
    std::filesystem::remove_all(archiveDirectory(downloadsDirectory, id), errorCode);
    if (errorCode) {
        std::cerr << "DL: Unable to delete " << id << ": " << errorCode.message() << std::endl;
    }

    updateRemoveListeners(id);
}

void DownloadManager::addListener(const std::shared_ptr<IImageDownloadListener>& listener) {
    {
        std::unique_lock<std::mutex> lock(listenerMutex);
        vListeners.push_back(listener);
    }

    for (const auto& [id, task] : mRunningDownloads) {
        listener->onImageDownloaded(id, task->pageCount());
    }
}

void DownloadManager::removeListener(const std::shared_ptr<IImageDownloadListener>& listener) {
    std::unique_lock<std::mutex> lock(listenerMutex);
    vListeners.erase(std::remove(vListeners.begin(), vListeners.end(), listener), vListeners.end());
}

auto DownloadManager::isDownloaded(const std::string& id) const -> bool {
    std::error_code errorCode;
    return std::filesystem::exists(archiveDirectory(downloadsDirectory, id), errorCode);
}

auto DownloadManager::isDownloading(const std::string& id) const -> bool {
    return mRunningDownloads.find(id) != mRunningDownloads.cend();
}

auto DownloadManager::getDownloadedPageCount(const std::string& id) const -> uint32_t {
    std::error_code errorCode;
    auto downloadDir = archiveDirectory(downloadsDirectory, id);
    if (!std::filesystem::is_directory(downloadDir, errorCode)) {
        return 0;
    }

    uint32_t count = 0;
    for (const auto& entry : std::filesystem::directory_iterator(downloadDir, errorCode)) {
        if (entry.is_regular_file(errorCode)) {
            count++;
        }
    }

    return count;
}

auto DownloadManager::getDownloadedPage(const std::string& id, uint32_t page) const -> std::optional<std::filesystem::path> {
    std::error_code errorCode;
    auto file = pagePath(downloadsDirectory, id, page);
    if (std::filesystem::exists(file, errorCode)) {
        return file;
    }

    return std::nullopt;
}

auto DownloadManager::getDownloadedThumb(const std::string& id, uint32_t page) const -> std::optional<std::filesystem::path> {
    std::error_code errorCode;
    auto file = thumbPath(downloadsDirectory, id, page);
    if (std::filesystem::exists(file, errorCode)) {
        return file;
    }

    return std::nullopt;
}

auto DownloadManager::getDownloadedArchives() const -> std::vector<std::string> {
    std::error_code errorCode;
    if (!std::filesystem::is_directory(downloadsDirectory, errorCode)) {
        return {};
    }

    std::vector<std::filesystem::directory_entry> vEntries;
    for (const auto& entry : std::filesystem::directory_iterator(downloadsDirectory, errorCode)) {
        vEntries.push_back(entry);
    }

    std::sort(vEntries.begin(), vEntries.end(), [](const auto& first, const auto& second) {
        std::error_code firstError, secondError;
        return first.last_write_time(firstError) < second.last_write_time(secondError);
    });

    std::vector<std::string> archives;
    for (const auto& entry : vEntries) {
        archives.push_back(entry.path().filename().string());
    }

    return archives;
}

void DownloadManager::stop() {
    for (const auto& [id, task] : mRunningDownloads) {
        task->cancel();
    }

    mRunningDownloads.clear();

    std::unique_lock<std::mutex> lock(workerMutex);
    workerCondition.wait(lock, [this] { return runningWorkers == 0; });
}

auto DownloadManager::listenerSnapshot() const -> std::vector<std::shared_ptr<IImageDownloadListener>> {
    std::unique_lock<std::mutex> lock(listenerMutex);
    return vListeners;
}

void DownloadManager::updateListeners(const std::shared_ptr<DownloadTask>& task, uint32_t pagesDownloaded) {
    task->setPageCount(pagesDownloaded);

    boost::asio::post(*pUiContext, [listeners = listenerSnapshot(), id = task->id(), pagesDownloaded] {
        for (const auto& listener : listeners) {
            listener->onImageDownloaded(id, pagesDownloaded);
        }
    });
}

void DownloadManager::updateRemoveListeners(const std::string& id) {
    boost::asio::post(*pUiContext, [listeners = listenerSnapshot(), id] {
        for (const auto& listener : listeners) {
            if (auto downloadListener = std::dynamic_pointer_cast<IDownloadListener>(listener)) {
                downloadListener->onDownloadRemoved(id);
            }
        }
    });
}

void DownloadManager::updateCancelListeners(const std::string& id) {
    boost::asio::post(*pUiContext, [listeners = listenerSnapshot(), id] {
        for (const auto& listener : listeners) {
            if (auto downloadListener = std::dynamic_pointer_cast<IDownloadListener>(listener)) {
                downloadListener->onDownloadCanceled(id);
            }
        }
    });
}
