#include "CategoryManager.h"
#include "../Lib/GeneralUtils.h"
#include <algorithm>
#include <iostream>
#include <thread>
#include <utility>

CategoryManager::CategoryManager(std::shared_ptr<ServerClient> serverClient) : pServerClient(std::move(serverClient)) {}

auto CategoryManager::refresh(std::stop_token token) -> bool {
    auto categories = pServerClient->getCategories(std::move(token));
    if (!categories) {
        return false;
    }

    updateCategories(std::move(*categories));
    return true;
}

void CategoryManager::updateCategories(std::vector<sCategory> categories) {
    bool firstUpdate;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        vCategories = categories;
        firstUpdate = bFirstUpdate;
        bFirstUpdate = false;
    }

    std::cout << "APP: Received " << categories.size() << " categories" << std::endl;

    std::vector<ICategoryListener*> listeners;
    {
        std::unique_lock<std::mutex> lock(listenerMutex);
        listeners = vListeners;
        vDeliveringThreads.push_back(std::this_thread::get_id());
    }

    for (auto* listener : listeners) {
        {
            // Skip listeners removed while earlier ones were being told
            std::unique_lock<std::mutex> lock(listenerMutex);
            if (std::find(vListeners.begin(), vListeners.end(), listener) == vListeners.end()) {
                continue;
            }
        }

        try {
            listener->onCategoriesUpdated(categories, firstUpdate);
        } catch (std::exception& exception) {
            dumpExceptions(exception);
        }
    }

    std::unique_lock<std::mutex> lock(listenerMutex);
    vDeliveringThreads.erase(std::find(vDeliveringThreads.begin(), vDeliveringThreads.end(), std::this_thread::get_id()));
    deliveryCondition.notify_all();
}

auto CategoryManager::getCategories() const -> std::vector<sCategory> {
    std::unique_lock<std::mutex> lock(mutex_);
    return vCategories;
}

auto CategoryManager::getCategory(const std::string& id) const -> std::optional<sCategory> {
    std::unique_lock<std::mutex> lock(mutex_);
    auto iter = std::find_if(vCategories.begin(), vCategories.end(), [&id](const auto& category) { return category.id == id; });
    if (iter == vCategories.end()) {
        return std::nullopt;
    }

    return *iter;
}

void CategoryManager::addUpdateListener(ICategoryListener* listener) {
    std::unique_lock<std::mutex> lock(listenerMutex);
    vListeners.push_back(listener);
}

void CategoryManager::removeUpdateListener(ICategoryListener* listener) {
    std::unique_lock<std::mutex> lock(listenerMutex);
    vListeners.erase(std::remove(vListeners.begin(), vListeners.end(), listener), vListeners.end());

    // Once this returns the listener is never called again. A listener removing itself from its own
    // callback only waits for deliveries on other threads.
    deliveryCondition.wait(lock, [this] {
        return std::all_of(vDeliveringThreads.begin(), vDeliveringThreads.end(), [](const auto& id) {
            return id == std::this_thread::get_id();
        });
    });
}
