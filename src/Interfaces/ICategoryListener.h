//
// Notified whenever the category list is refreshed from the server
//

#ifndef LRR_CLIENT_I_CATEGORY_LISTENER_H
#define LRR_CLIENT_I_CATEGORY_LISTENER_H

#include "../Lib/ArchiveTypes.h"
#include <vector>

class ICategoryListener {
public:
    virtual ~ICategoryListener() = default;

    // firstUpdate is only true for the first list delivered after startup
    virtual void onCategoriesUpdated(const std::vector<sCategory>& categories, bool firstUpdate) = 0;
};

#endif //LRR_CLIENT_I_CATEGORY_LISTENER_H
