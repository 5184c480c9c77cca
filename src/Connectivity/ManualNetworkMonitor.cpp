#include "ManualNetworkMonitor.h"
#include <algorithm>

ManualNetworkMonitor::ManualNetworkMonitor(bool available) : bAvailable(available) {}

void ManualNetworkMonitor::registerObserver(const std::shared_ptr<INetworkObserver>& observer) {
    bool available = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        vObservers.push_back(observer);
        available = bAvailable;
    }

    // New observers learn the current state straight away
    if (available) {
        observer->onAvailable();
    } else {
        observer->onLost();
    }
}

void ManualNetworkMonitor::unregisterObserver(const std::shared_ptr<INetworkObserver>& observer) {
    std::unique_lock<std::mutex> lock(mutex_);
    vObservers.erase(std::remove(vObservers.begin(), vObservers.end(), observer), vObservers.end());
}

void ManualNetworkMonitor::setAvailable(bool available) {
    std::vector<std::shared_ptr<INetworkObserver>> observers;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        bAvailable = available;
        observers = vObservers;
    }

    for (const auto& observer : observers) {
        if (available) {
            observer->onAvailable();
        } else {
            observer->onLost();
        }
    }
}

auto ManualNetworkMonitor::observerCount() const -> size_t {
    std::unique_lock<std::mutex> lock(mutex_);
    return vObservers.size();
}
