//
// The single chokepoint deciding whether a network call may be issued
//

#ifndef LRR_CLIENT_CONNECTIVITYGATE_H
#define LRR_CLIENT_CONNECTIVITYGATE_H

#include "../Interfaces/INetworkMonitor.h"
#include "../Lib/Notifier.h"
#include "../Lib/TestingMacros.h"
#include <atomic>
#include <memory>
#include <shared_mutex>
#include <string>

class ConnectivityGate : public INetworkObserver {
public:
    explicit ConnectivityGate(std::shared_ptr<Notifier> notifier);

    void setServerAddress(const std::string& address);
    auto getServerAddress() const -> std::string;
    auto hasServerAddress() const -> bool;

    auto hasNetwork() const -> bool { return bHasNetwork; }

    // INetworkObserver implementation
    void onAvailable() override;
    void onLost() override;

    // Returns false without notifying when no server is configured. When there is no network a
    // "no connection" error is emitted unless silent is set.
    auto canConnect(bool silent = true) const -> bool;

private:
    std::shared_ptr<Notifier> pNotifier;

    mutable std::shared_mutex mutex_;
    std::string serverAddress;
    std::atomic<bool> bHasNetwork = false;

// Testing
EXPOSE_PROPERTY_FOR_TESTING_READONLY(bHasNetwork);
};

#endif //LRR_CLIENT_CONNECTIVITYGATE_H
