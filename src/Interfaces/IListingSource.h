//
// A strategy that produces pages of archives under one selection rule
//

#ifndef LRR_CLIENT_I_LISTING_SOURCE_H
#define LRR_CLIENT_I_LISTING_SOURCE_H

#include "../Lib/ArchiveTypes.h"
#include <cstdint>
#include <functional>
#include <optional>
#include <stop_token>
#include <vector>

enum class eListingKind {
    Empty,
    Random,
    Category,
    LocalFilter,
    ServerFilter,
    Default
};

struct sArchivePage
{
    std::vector<sArchive> archives;
    // Key to pass to the next load, empty when this was the last page
    std::optional<uint64_t> nextKey;
};

class IListingSource {
public:
    virtual ~IListingSource() = default;

    virtual auto kind() const -> eListingKind = 0;

    // Produce the page starting at key
    virtual auto load(uint64_t key, uint32_t pageSize, std::stop_token token) -> sArchivePage = 0;

    // Sources with a cursor or cache can be reset in place, the others can only be invalidated
    virtual auto canReset() const -> bool = 0;
    virtual void reset() = 0;

    virtual void invalidate() = 0;
    virtual auto isInvalid() const -> bool = 0;

    // Called once when the source is invalidated so the consumer can rebuild
    virtual void setInvalidatedCallback(std::function<void()> callback) = 0;
};

#endif //LRR_CLIENT_I_LISTING_SOURCE_H
