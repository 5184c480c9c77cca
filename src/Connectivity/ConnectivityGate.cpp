#include "ConnectivityGate.h"
#include <iostream>
#include <mutex>
#include <utility>

ConnectivityGate::ConnectivityGate(std::shared_ptr<Notifier> notifier) : pNotifier(std::move(notifier)) {}

void ConnectivityGate::setServerAddress(const std::string& address) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    serverAddress = address;
}

auto ConnectivityGate::getServerAddress() const -> std::string {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return serverAddress;
}

auto ConnectivityGate::hasServerAddress() const -> bool {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return !serverAddress.empty();
}

void ConnectivityGate::onAvailable() {
    if (!bHasNetwork.exchange(true)) {
        std::cout << "NET: Network available" << std::endl;
    }
}

void ConnectivityGate::onLost() {
    if (bHasNetwork.exchange(false)) {
        std::cout << "NET: Network lost" << std::endl;
    }
}

auto ConnectivityGate::canConnect(bool silent) const -> bool {
    if (!hasServerAddress()) {
        return false;
    }

    if (!bHasNetwork && !silent) {
        pNotifier->notifyError("No network connection.");
        return false;
    }

    return bHasNetwork;
}
