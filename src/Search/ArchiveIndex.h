//
// The full archive list fetched from the server, queried locally by the default and local filter
// listings
//

#ifndef LRR_CLIENT_ARCHIVEINDEX_H
#define LRR_CLIENT_ARCHIVEINDEX_H

#include "../HTTP/ServerClient.h"
#include "../Lib/ArchiveTypes.h"
#include <memory>
#include <optional>
#include <shared_mutex>
#include <stop_token>
#include <string>
#include <vector>

class ArchiveIndex {
public:
    explicit ArchiveIndex(std::shared_ptr<ServerClient> serverClient);

    // Replaces the index with the server's archive list, keeps the old list if the fetch fails
    auto refresh(std::stop_token token = {}) -> bool;
    auto isLoaded() const -> bool;
    void setArchives(std::vector<sArchive> archives);

    auto size() const -> size_t;
    auto getArchive(const std::string& id) const -> std::optional<sArchive>;

    // Archives matching filter (every archive when empty), sorted
    auto query(const std::string& filter, eSortMethod sortMethod, bool descending, bool onlyNew) const -> std::vector<sArchive>;

    // Terms are separated by whitespace or commas and must all occur in the title or tags, ignoring
    // case. A leading '-' negates a term and "namespace:value" terms only match tags.
    static auto matches(const sArchive& archive, const std::string& filter) -> bool;
    static void sort(std::vector<sArchive>& archives, eSortMethod sortMethod, bool descending);

private:
    std::shared_ptr<ServerClient> pServerClient;

    mutable std::shared_mutex mutex_;
    std::vector<sArchive> vArchives;
    bool bLoaded = false;
};

#endif //LRR_CLIENT_ARCHIVEINDEX_H
