#include "SearchSelector.h"
#include "ListingSources.h"
#include <algorithm>
#include <exception>
#include <utility>

SearchSelector::SearchSelector(
        std::shared_ptr<ServerClient> serverClient,
        std::shared_ptr<ArchiveIndex> index,
        std::shared_ptr<CategoryManager> categoryManager,
        sListingCriteria initial
) : pServerClient(std::move(serverClient)), pIndex(std::move(index)), pCategoryManager(std::move(categoryManager)),
    criteria(std::move(initial)) {
    pSource = createSource();
    pCategoryManager->addUpdateListener(this);
}

SearchSelector::~SearchSelector() {
    pCategoryManager->removeUpdateListener(this);

    std::unique_lock<std::recursive_mutex> lock(mutex_);
    pSource->setInvalidatedCallback(nullptr);
}

void SearchSelector::init() {
    mutate([&] {
        if (bInitiated) {
            return;
        }

        bInitiated = true;
        bResetDisabled = false;
        reset(true);
    });
}

auto SearchSelector::isInitiated() const -> bool {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    return bInitiated;
}

void SearchSelector::setOnlyNew(bool value) {
    mutate([&] { apply(criteria.setOnlyNew(value)); });
}

void SearchSelector::setLocal(bool value) {
    mutate([&] { apply(criteria.setLocal(value)); });
}

void SearchSelector::setRandomCount(uint32_t value) {
    mutate([&] { apply(criteria.setRandomCount(value)); });
}

void SearchSelector::setCategoryId(const std::string& value) {
    mutate([&] { apply(criteria.setCategoryId(value)); });
}

void SearchSelector::setSearch(bool value) {
    mutate([&] { apply(criteria.setSearch(value)); });
}

void SearchSelector::setSortMethod(eSortMethod value) {
    mutate([&] { apply(criteria.setSortMethod(value)); });
}

void SearchSelector::setDescending(bool value) {
    mutate([&] { apply(criteria.setDescending(value)); });
}

void SearchSelector::filter(const std::string& text) {
    mutate([&] {
        if (criteria.values().filter == text && criteria.values().categoryId.empty()) {
            return;
        }

        // Inside deferReset the outer batch keeps resets disabled
        auto wasDisabled = bResetDisabled;
        setResetDisabled(true);
        apply(criteria.setFilter(text));
        apply(criteria.setCategoryId(""));
        setResetDisabled(wasDisabled);
    });
}

void SearchSelector::deferReset(const std::function<void(SearchSelector&)>& block) {
    mutate([&] {
        auto wasDisabled = bResetDisabled;
        setResetDisabled(true);
        block(*this);
        setResetDisabled(wasDisabled);
    });
}

void SearchSelector::reset() {
    mutate([&] { reset(true); });
}

auto SearchSelector::getCriteria() const -> sListingCriteria {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    return criteria.values();
}

auto SearchSelector::consumeJumpToTop() -> bool {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    auto jump = criteria.jumpToTop();
    criteria.setJumpToTop(false);
    return jump;
}

auto SearchSelector::getPagingSource() -> std::shared_ptr<IListingSource> {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    if (pSource->isInvalid()) {
        pSource = createSource();
    }

    return pSource;
}

void SearchSelector::setInvalidatedCallback(std::function<void()> callback) {
    std::unique_lock<std::recursive_mutex> lock(mutex_);
    invalidatedCallback = std::move(callback);
}

void SearchSelector::onCategoriesUpdated(const std::vector<sCategory>& categories, bool firstUpdate) {
    mutate([&] {
        const auto& categoryId = criteria.values().categoryId;
        if (firstUpdate || categoryId.empty()) {
            return;
        }

        auto found = std::any_of(categories.begin(), categories.end(), [&categoryId](const auto& category) { return category.id == categoryId; });
        if (!found) {
            apply(criteria.setCategoryId(""));
        }
    });
}

void SearchSelector::mutate(const std::function<void()>& change) {
    std::shared_ptr<IListingSource> pending;
    {
        std::unique_lock<std::recursive_mutex> lock(mutex_);
        mutateDepth++;
        try {
            change();
        } catch (std::exception&) {
            mutateDepth--;
            throw;
        }

        // Nested calls leave the reset to the outermost one
        if (--mutateDepth == 0) {
            pending = std::exchange(pPendingReset, nullptr);
        }
    }

    // Resetting a source runs the consumer callback, which must not see the selector locked
    if (pending) {
        if (pending->canReset()) {
            pending->reset();
        } else {
            pending->invalidate();
        }
    }
}

void SearchSelector::reset(bool force) {
    // A random sample stays put until a reset is forced
    if (bResetDisabled || (criteria.values().randomCount > 0 && !force)) {
        return;
    }

    pPendingReset = pSource;
}

void SearchSelector::apply(eResetKind kind) {
    switch (kind) {
        case eResetKind::Soft:
            reset(false);
            break;
        case eResetKind::Forced:
            reset(true);
            break;
        case eResetKind::None:
        default:
            break;
    }
}

void SearchSelector::setResetDisabled(bool value) {
    if (bResetDisabled == value) {
        return;
    }

    bResetDisabled = value;
    reset(false);
}

auto SearchSelector::createSource() -> std::shared_ptr<IListingSource> {
    const auto& values = criteria.values();

    std::shared_ptr<IListingSource> source;
    switch (selectListingKind(values, bInitiated)) {
        case eListingKind::Random:
            source = std::make_shared<RandomSource>(pServerClient, values.filter, values.randomCount, values.categoryId);
            break;
        case eListingKind::Category:
            source = std::make_shared<CategorySource>(pServerClient, values.categoryId, values.sortMethod, values.descending, values.onlyNew);
            break;
        case eListingKind::LocalFilter:
            source = std::make_shared<LocalFilterSource>(pIndex, values.filter, values.sortMethod, values.descending, values.onlyNew);
            break;
        case eListingKind::ServerFilter:
            source = std::make_shared<ServerFilterSource>(pServerClient, values.onlyNew, values.sortMethod, values.descending, values.filter);
            break;
        case eListingKind::Default:
            source = std::make_shared<DefaultSource>(pIndex, values.sortMethod, values.descending, values.onlyNew);
            break;
        case eListingKind::Empty:
        default:
            source = std::make_shared<EmptySource>();
            break;
    }

    // The consumer callback is read when the invalidation happens
    source->setInvalidatedCallback([this] {
        std::function<void()> callback;
        {
            std::unique_lock<std::recursive_mutex> lock(mutex_);
            callback = invalidatedCallback;
        }

        if (callback) {
            callback();
        }
    });

    return source;
}
