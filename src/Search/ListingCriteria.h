//
// The criteria that choose which listing source produces archives. Every setter reports how the
// current listing has to be reset when the value actually changed.
//

#ifndef LRR_CLIENT_LISTINGCRITERIA_H
#define LRR_CLIENT_LISTINGCRITERIA_H

#include "../Interfaces/IListingSource.h"
#include "../Lib/ArchiveTypes.h"
#include <cstdint>
#include <string>
#include <utility>

enum class eResetKind {
    None,
    // Skipped while a random sample is active
    Soft,
    Forced
};

struct sListingCriteria
{
    std::string filter;
    std::string categoryId;
    uint32_t randomCount = 0;
    bool isSearch = false;
    bool onlyNew = false;
    // Filter the local archive index instead of asking the server
    bool isLocal = false;
    eSortMethod sortMethod = eSortMethod::Alpha;
    bool descending = false;
};

// First match wins: not initialised, random sample, category, local filter, server filter, empty
// search, default listing
auto selectListingKind(const sListingCriteria& criteria, bool initiated) -> eListingKind;

class ListingCriteria {
public:
    ListingCriteria() = default;
    explicit ListingCriteria(sListingCriteria initial) : criteria(std::move(initial)) {}

    auto setOnlyNew(bool value) -> eResetKind;
    auto setLocal(bool value) -> eResetKind;
    auto setRandomCount(uint32_t value) -> eResetKind;
    auto setCategoryId(const std::string& value) -> eResetKind;
    auto setSearch(bool value) -> eResetKind;
    auto setSortMethod(eSortMethod value) -> eResetKind;
    auto setDescending(bool value) -> eResetKind;
    // The filter text never resets the listing on its own, see SearchSelector::filter
    auto setFilter(const std::string& value) -> eResetKind;

    auto values() const -> const sListingCriteria& { return criteria; }

    // Set when the ordering changed so the consumer scrolls back to the first archive
    auto jumpToTop() const -> bool { return bJumpToTop; }
    void setJumpToTop(bool value) { bJumpToTop = value; }

private:
    sListingCriteria criteria;
    bool bJumpToTop = false;
};

#endif //LRR_CLIENT_LISTINGCRITERIA_H
