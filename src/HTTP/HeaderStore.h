//
// Persists the custom header list as json in the private data directory
//

#ifndef LRR_CLIENT_HEADERSTORE_H
#define LRR_CLIENT_HEADERSTORE_H

#include "../Lib/ArchiveTypes.h"
#include <filesystem>
#include <vector>

class HeaderStore {
public:
    explicit HeaderStore(std::filesystem::path file);

    // A missing or unreadable file yields an empty list
    auto load() const -> std::vector<sHeader>;
    auto save(const std::vector<sHeader>& headers) const -> bool;

    auto path() const -> const std::filesystem::path& { return file; }

private:
    std::filesystem::path file;
};

#endif //LRR_CLIENT_HEADERSTORE_H
