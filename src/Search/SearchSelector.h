//
// Picks the listing source for the current criteria and invalidates it whenever the criteria change.
// Several changes can be batched into a single invalidation with deferReset.
//

#ifndef LRR_CLIENT_SEARCHSELECTOR_H
#define LRR_CLIENT_SEARCHSELECTOR_H

#include "../Categories/CategoryManager.h"
#include "../HTTP/ServerClient.h"
#include "../Interfaces/ICategoryListener.h"
#include "../Interfaces/IListingSource.h"
#include "../Lib/TestingMacros.h"
#include "ArchiveIndex.h"
#include "ListingCriteria.h"
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

class SearchSelector : public ICategoryListener {
public:
    SearchSelector(
            std::shared_ptr<ServerClient> serverClient,
            std::shared_ptr<ArchiveIndex> index,
            std::shared_ptr<CategoryManager> categoryManager,
            sListingCriteria initial = {}
    );
    ~SearchSelector() override;
    SearchSelector(SearchSelector const&) = delete;
    auto operator =(SearchSelector const&) -> SearchSelector& = delete;
    SearchSelector(SearchSelector&&) = delete;
    auto operator=(SearchSelector&&) -> SearchSelector& = delete;

    // Marks startup configuration as done, nothing is listed before this
    void init();
    auto isInitiated() const -> bool;

    void setOnlyNew(bool value);
    void setLocal(bool value);
    void setRandomCount(uint32_t value);
    void setCategoryId(const std::string& value);
    void setSearch(bool value);
    void setSortMethod(eSortMethod value);
    void setDescending(bool value);

    // Sets the filter text and clears the selected category with a single invalidation. Does nothing
    // if the text is unchanged and no category is selected.
    void filter(const std::string& text);

    // Runs block with resets suppressed, then resets once
    void deferReset(const std::function<void(SearchSelector&)>& block);

    // Forced reset, also replaces an established random sample
    void reset();

    auto getCriteria() const -> sListingCriteria;
    auto consumeJumpToTop() -> bool;

    // The active source, rebuilt from the current criteria when the previous one was invalidated
    auto getPagingSource() -> std::shared_ptr<IListingSource>;

    // Told whenever the active source is invalidated
    void setInvalidatedCallback(std::function<void()> callback);

    // ICategoryListener implementation
    void onCategoriesUpdated(const std::vector<sCategory>& categories, bool firstUpdate) override;

private:
    // Runs change under the lock, then performs the reset it requested once unlocked
    void mutate(const std::function<void()>& change);
    void reset(bool force);
    void apply(eResetKind kind);
    void setResetDisabled(bool value);
    auto createSource() -> std::shared_ptr<IListingSource>;

    std::shared_ptr<ServerClient> pServerClient;
    std::shared_ptr<ArchiveIndex> pIndex;
    std::shared_ptr<CategoryManager> pCategoryManager;

    mutable std::recursive_mutex mutex_;
    ListingCriteria criteria;
    bool bInitiated = false;
    bool bResetDisabled = true;
    std::shared_ptr<IListingSource> pSource;
    std::shared_ptr<IListingSource> pPendingReset;
    uint32_t mutateDepth = 0;
    std::function<void()> invalidatedCallback;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(bResetDisabled);
EXPOSE_PROPERTY_FOR_TESTING_READONLY(pSource);
};

#endif //LRR_CLIENT_SEARCHSELECTOR_H
