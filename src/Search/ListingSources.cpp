#include "ListingSources.h"
#include <algorithm>
#include <utility>

namespace {
    auto serverPage(const sSearchResult& result, uint64_t key) -> sArchivePage {
        sArchivePage page;
        page.archives = result.archives;

        auto next = key + result.archives.size();
        if (!result.archives.empty() && next < result.totalFiltered) {
            page.nextKey = next;
        }

        return page;
    }
}

auto slicePage(const std::vector<sArchive>& archives, uint64_t key, uint32_t pageSize) -> sArchivePage {
    sArchivePage page;
    if (key >= archives.size()) {
        return page;
    }

    auto end = std::min<uint64_t>(key + pageSize, archives.size());
    page.archives.assign(archives.begin() + static_cast<std::ptrdiff_t>(key), archives.begin() + static_cast<std::ptrdiff_t>(end));
    if (end < archives.size()) {
        page.nextKey = end;
    }

    return page;
}

void ListingSource::invalidate() {
    if (bInvalid.exchange(true)) {
        return;
    }

    std::function<void()> callback;
    {
        std::unique_lock<std::mutex> lock(callbackMutex);
        callback = invalidatedCallback;
    }

    if (callback) {
        callback();
    }
}

void ListingSource::setInvalidatedCallback(std::function<void()> callback) {
    std::unique_lock<std::mutex> lock(callbackMutex);
    invalidatedCallback = std::move(callback);
}

void CachedListingSource::reset() {
    {
        std::unique_lock<std::mutex> lock(cacheMutex);
        mCache.clear();
    }

    invalidate();
}

auto CachedListingSource::load(uint64_t key, uint32_t pageSize, std::stop_token token) -> sArchivePage {
    {
        std::unique_lock<std::mutex> lock(cacheMutex);
        auto iter = mCache.find(key);
        if (iter != mCache.end()) {
            return iter->second;
        }
    }

    auto page = fetch(key, pageSize, std::move(token));
    if (!page) {
        return {};
    }

    if (!page->archives.empty()) {
        std::unique_lock<std::mutex> lock(cacheMutex);
        mCache.emplace(key, *page);
    }

    return *page;
}

auto EmptySource::load(uint64_t, uint32_t, std::stop_token) -> sArchivePage {
    return {};
}

RandomSource::RandomSource(std::shared_ptr<ServerClient> serverClient, std::string filter, uint32_t count, std::string categoryId)
        : pServerClient(std::move(serverClient)), filter(std::move(filter)), count(count), categoryId(std::move(categoryId)) {}

auto RandomSource::fetch(uint64_t key, uint32_t, std::stop_token token) -> std::optional<sArchivePage> {
    // The whole sample is a single page
    if (key != 0) {
        return sArchivePage{};
    }

    auto archives = pServerClient->getRandomArchives(filter, count, categoryId, std::move(token));
    if (!archives) {
        return std::nullopt;
    }

    return sArchivePage{std::move(*archives), std::nullopt};
}

CategorySource::CategorySource(std::shared_ptr<ServerClient> serverClient, std::string categoryId, eSortMethod sortMethod, bool descending, bool onlyNew)
        : pServerClient(std::move(serverClient)), categoryId(std::move(categoryId)), sortMethod(sortMethod), descending(descending), onlyNew(onlyNew) {}

auto CategorySource::load(uint64_t key, uint32_t, std::stop_token token) -> sArchivePage {
    auto result = pServerClient->searchServer("", onlyNew, sortMethod, descending, static_cast<int64_t>(key), categoryId, std::move(token));
    if (!result) {
        return {};
    }

    return serverPage(*result, key);
}

LocalFilterSource::LocalFilterSource(std::shared_ptr<ArchiveIndex> index, std::string filter, eSortMethod sortMethod, bool descending, bool onlyNew)
        : pIndex(std::move(index)), filter(std::move(filter)), sortMethod(sortMethod), descending(descending), onlyNew(onlyNew) {}

auto LocalFilterSource::fetch(uint64_t key, uint32_t pageSize, std::stop_token) -> std::optional<sArchivePage> {
    return slicePage(pIndex->query(filter, sortMethod, descending, onlyNew), key, pageSize);
}

ServerFilterSource::ServerFilterSource(std::shared_ptr<ServerClient> serverClient, bool onlyNew, eSortMethod sortMethod, bool descending, std::string filter)
        : pServerClient(std::move(serverClient)), onlyNew(onlyNew), sortMethod(sortMethod), descending(descending), filter(std::move(filter)) {}

auto ServerFilterSource::fetch(uint64_t key, uint32_t, std::stop_token token) -> std::optional<sArchivePage> {
    auto result = pServerClient->searchServer(filter, onlyNew, sortMethod, descending, static_cast<int64_t>(key), {}, std::move(token));
    if (!result) {
        return std::nullopt;
    }

    return serverPage(*result, key);
}

DefaultSource::DefaultSource(std::shared_ptr<ArchiveIndex> index, eSortMethod sortMethod, bool descending, bool onlyNew)
        : pIndex(std::move(index)), sortMethod(sortMethod), descending(descending), onlyNew(onlyNew) {}

auto DefaultSource::load(uint64_t key, uint32_t pageSize, std::stop_token token) -> sArchivePage {
    if (!pIndex->isLoaded() && !pIndex->refresh(std::move(token))) {
        return {};
    }

    return slicePage(pIndex->query("", sortMethod, descending, onlyNew), key, pageSize);
}
