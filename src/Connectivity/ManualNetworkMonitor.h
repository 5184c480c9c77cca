//
// Network monitor whose availability is pushed by the host. Desktop hosts without a platform
// connectivity service construct it as available.
//

#ifndef LRR_CLIENT_MANUALNETWORKMONITOR_H
#define LRR_CLIENT_MANUALNETWORKMONITOR_H

#include "../Interfaces/INetworkMonitor.h"
#include <mutex>
#include <vector>

class ManualNetworkMonitor : public INetworkMonitor {
public:
    explicit ManualNetworkMonitor(bool available = true);

    void registerObserver(const std::shared_ptr<INetworkObserver>& observer) override;
    void unregisterObserver(const std::shared_ptr<INetworkObserver>& observer) override;

    void setAvailable(bool available);

    auto observerCount() const -> size_t;

private:
    mutable std::mutex mutex_;
    std::vector<std::shared_ptr<INetworkObserver>> vObservers;
    bool bAvailable;
};

#endif //LRR_CLIENT_MANUALNETWORKMONITOR_H
