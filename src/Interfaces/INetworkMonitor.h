//
// Platform network availability. The connectivity gate registers itself as an observer.
//

#ifndef LRR_CLIENT_I_NETWORK_MONITOR_H
#define LRR_CLIENT_I_NETWORK_MONITOR_H

#include <memory>

class INetworkObserver {
public:
    virtual ~INetworkObserver() = default;

    virtual void onAvailable() = 0;
    virtual void onLost() = 0;
};

class INetworkMonitor {
public:
    virtual ~INetworkMonitor() = default;

    virtual void registerObserver(const std::shared_ptr<INetworkObserver>& observer) = 0;
    virtual void unregisterObserver(const std::shared_ptr<INetworkObserver>& observer) = 0;
};

#endif //LRR_CLIENT_I_NETWORK_MONITOR_H
