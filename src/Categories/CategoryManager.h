//
// Keeps the last category list fetched from the server and tells subscribers about every refresh
//

#ifndef LRR_CLIENT_CATEGORYMANAGER_H
#define LRR_CLIENT_CATEGORYMANAGER_H

#include "../HTTP/ServerClient.h"
#include "../Interfaces/ICategoryListener.h"
#include "../Lib/ArchiveTypes.h"
#include <condition_variable>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <thread>
#include <vector>

class CategoryManager {
public:
    explicit CategoryManager(std::shared_ptr<ServerClient> serverClient);

    // Fetches the categories and publishes them, false if the server could not be asked
    auto refresh(std::stop_token token = {}) -> bool;
    void updateCategories(std::vector<sCategory> categories);

    auto getCategories() const -> std::vector<sCategory>;
    auto getCategory(const std::string& id) const -> std::optional<sCategory>;

    // Listeners are not owned and must unsubscribe before they are destroyed. Removing a listener
    // waits for a delivery in progress.
    void addUpdateListener(ICategoryListener* listener);
    void removeUpdateListener(ICategoryListener* listener);

private:
    std::shared_ptr<ServerClient> pServerClient;

    mutable std::mutex mutex_;
    std::vector<sCategory> vCategories;
    bool bFirstUpdate = true;

    std::mutex listenerMutex;
    std::condition_variable deliveryCondition;
    std::vector<ICategoryListener*> vListeners;
    std::vector<std::thread::id> vDeliveringThreads;
};

#endif //LRR_CLIENT_CATEGORYMANAGER_H
