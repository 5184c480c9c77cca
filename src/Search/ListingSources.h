//
// The listing sources the search selector chooses between
//

#ifndef LRR_CLIENT_LISTINGSOURCES_H
#define LRR_CLIENT_LISTINGSOURCES_H

#include "../HTTP/ServerClient.h"
#include "../Interfaces/IListingSource.h"
#include "../Lib/TestingMacros.h"
#include "ArchiveIndex.h"
#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Invalidation shared by every source. Sources built on this alone are terminal, they can only be
// invalidated and rebuilt.
class ListingSource : public IListingSource {
public:
    auto canReset() const -> bool override { return false; }
    void reset() override { invalidate(); }

    void invalidate() override;
    auto isInvalid() const -> bool override { return bInvalid; }
    void setInvalidatedCallback(std::function<void()> callback) override;

private:
    std::atomic<bool> bInvalid = false;
    std::mutex callbackMutex;
    std::function<void()> invalidatedCallback;
};

// Sources that keep what they fetched. A reset drops the cache before invalidating.
class CachedListingSource : public ListingSource {
public:
    auto canReset() const -> bool override { return true; }
    void reset() override;

    auto load(uint64_t key, uint32_t pageSize, std::stop_token token) -> sArchivePage override;

protected:
    // Produces the page at key when it isn't cached, empty results are not cached
    virtual auto fetch(uint64_t key, uint32_t pageSize, std::stop_token token) -> std::optional<sArchivePage> = 0;

private:
    std::mutex cacheMutex;
    std::map<uint64_t, sArchivePage> mCache;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(mCache);
};

class EmptySource : public ListingSource {
public:
    auto kind() const -> eListingKind override { return eListingKind::Empty; }
    auto load(uint64_t key, uint32_t pageSize, std::stop_token token) -> sArchivePage override;
};

// A random sample drawn once and kept until the source is reset
class RandomSource : public CachedListingSource {
public:
    RandomSource(std::shared_ptr<ServerClient> serverClient, std::string filter, uint32_t count, std::string categoryId);

    auto kind() const -> eListingKind override { return eListingKind::Random; }

    auto getFilter() const -> const std::string& { return filter; }
    auto getCount() const -> uint32_t { return count; }
    auto getCategoryId() const -> const std::string& { return categoryId; }

protected:
    auto fetch(uint64_t key, uint32_t pageSize, std::stop_token token) -> std::optional<sArchivePage> override;

private:
    std::shared_ptr<ServerClient> pServerClient;
    const std::string filter;
    const uint32_t count;
    const std::string categoryId;
};

// Archives of one category, paged by the server
class CategorySource : public ListingSource {
public:
    CategorySource(std::shared_ptr<ServerClient> serverClient, std::string categoryId, eSortMethod sortMethod, bool descending, bool onlyNew);

    auto kind() const -> eListingKind override { return eListingKind::Category; }
    auto load(uint64_t key, uint32_t pageSize, std::stop_token token) -> sArchivePage override;

    auto getCategoryId() const -> const std::string& { return categoryId; }

private:
    std::shared_ptr<ServerClient> pServerClient;
    const std::string categoryId;
    const eSortMethod sortMethod;
    const bool descending;
    const bool onlyNew;
};

// Filters the local archive index
class LocalFilterSource : public CachedListingSource {
public:
    LocalFilterSource(std::shared_ptr<ArchiveIndex> index, std::string filter, eSortMethod sortMethod, bool descending, bool onlyNew);

    auto kind() const -> eListingKind override { return eListingKind::LocalFilter; }

    auto getFilter() const -> const std::string& { return filter; }

protected:
    auto fetch(uint64_t key, uint32_t pageSize, std::stop_token token) -> std::optional<sArchivePage> override;

private:
    std::shared_ptr<ArchiveIndex> pIndex;
    const std::string filter;
    const eSortMethod sortMethod;
    const bool descending;
    const bool onlyNew;
};

// Lets the server filter, keys are the server's start offsets
class ServerFilterSource : public CachedListingSource {
public:
    ServerFilterSource(std::shared_ptr<ServerClient> serverClient, bool onlyNew, eSortMethod sortMethod, bool descending, std::string filter);

    auto kind() const -> eListingKind override { return eListingKind::ServerFilter; }

    auto getFilter() const -> const std::string& { return filter; }

protected:
    auto fetch(uint64_t key, uint32_t pageSize, std::stop_token token) -> std::optional<sArchivePage> override;

private:
    std::shared_ptr<ServerClient> pServerClient;
    const bool onlyNew;
    const eSortMethod sortMethod;
    const bool descending;
    const std::string filter;
};

// Every archive of the local index, fetching the index first if needed
class DefaultSource : public ListingSource {
public:
    DefaultSource(std::shared_ptr<ArchiveIndex> index, eSortMethod sortMethod, bool descending, bool onlyNew);

    auto kind() const -> eListingKind override { return eListingKind::Default; }
    auto load(uint64_t key, uint32_t pageSize, std::stop_token token) -> sArchivePage override;

private:
    std::shared_ptr<ArchiveIndex> pIndex;
    const eSortMethod sortMethod;
    const bool descending;
    const bool onlyNew;
};

// Cuts one page out of a full result list
auto slicePage(const std::vector<sArchive>& archives, uint64_t key, uint32_t pageSize) -> sArchivePage;

#endif //LRR_CLIENT_LISTINGSOURCES_H
