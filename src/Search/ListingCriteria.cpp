#include "ListingCriteria.h"

namespace {
    template<typename T>
    auto assign(T& field, const T& value, eResetKind kind) -> eResetKind {
        if (field == value) {
            return eResetKind::None;
        }

        field = value;
        return kind;
    }
}

auto selectListingKind(const sListingCriteria& criteria, bool initiated) -> eListingKind {
    // Nothing is queried before startup configuration is done
    if (!initiated) {
        return eListingKind::Empty;
    }

    if (criteria.randomCount > 0) {
        return eListingKind::Random;
    }

    if (!criteria.categoryId.empty()) {
        return eListingKind::Category;
    }

    if (criteria.isLocal && !criteria.filter.empty()) {
        return eListingKind::LocalFilter;
    }

    if (!criteria.filter.empty()) {
        return eListingKind::ServerFilter;
    }

    // An open search with no text shows nothing rather than everything
    if (criteria.isSearch) {
        return eListingKind::Empty;
    }

    return eListingKind::Default;
}

auto ListingCriteria::setOnlyNew(bool value) -> eResetKind {
    return assign(criteria.onlyNew, value, eResetKind::Soft);
}

auto ListingCriteria::setLocal(bool value) -> eResetKind {
    return assign(criteria.isLocal, value, eResetKind::Soft);
}

auto ListingCriteria::setRandomCount(uint32_t value) -> eResetKind {
    return assign(criteria.randomCount, value, eResetKind::Forced);
}

auto ListingCriteria::setCategoryId(const std::string& value) -> eResetKind {
    return assign(criteria.categoryId, value, eResetKind::Forced);
}

auto ListingCriteria::setSearch(bool value) -> eResetKind {
    return assign(criteria.isSearch, value, eResetKind::Forced);
}

auto ListingCriteria::setSortMethod(eSortMethod value) -> eResetKind {
    auto kind = assign(criteria.sortMethod, value, eResetKind::Forced);
    if (kind != eResetKind::None) {
        bJumpToTop = true;
    }

    return kind;
}

auto ListingCriteria::setDescending(bool value) -> eResetKind {
    auto kind = assign(criteria.descending, value, eResetKind::Forced);
    if (kind != eResetKind::None) {
        bJumpToTop = true;
    }

    return kind;
}

auto ListingCriteria::setFilter(const std::string& value) -> eResetKind {
    return assign(criteria.filter, value, eResetKind::None);
}
