#include "Notifier.h"
#include <algorithm>

void Notifier::setListener(const std::shared_ptr<INotificationListener>& listener) {
    std::unique_lock<std::mutex> lock(mutex_);
    pListener = listener;
}

void Notifier::setVerbose(bool verbose) {
    std::unique_lock<std::mutex> lock(mutex_);
    bVerbose = verbose;
}

auto Notifier::isVerbose() const -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return bVerbose;
}

void Notifier::notifyError(const std::string& message) {
    std::shared_ptr<INotificationListener> listener;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        listener = pListener;
    }

    if (listener) {
        listener->onError(message);
    }
}

void Notifier::notifyInfo(const std::string& message) {
    std::shared_ptr<INotificationListener> listener;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        listener = pListener;
    }

    if (listener) {
        listener->onInfo(message);
    }
}

void Notifier::handleErrorMessage(int statusCode, const std::string& defaultMessage) {
    notifyError(isVerbose() ? defaultMessage + " Response Code: " + std::to_string(statusCode) : defaultMessage);
}

void Notifier::handleErrorMessage(const std::string& cause, const std::string& defaultMessage) {
    notifyError(isVerbose() ? cause : defaultMessage);
}

void Notifier::registerRefreshListener(const std::shared_ptr<IRefreshListener>& listener) {
    std::unique_lock<std::mutex> lock(mutex_);
    vRefreshListeners.push_back(listener);
}

void Notifier::unregisterRefreshListener(const std::shared_ptr<IRefreshListener>& listener) {
    std::unique_lock<std::mutex> lock(mutex_);
    vRefreshListeners.erase(
            std::remove(vRefreshListeners.begin(), vRefreshListeners.end(), listener),
            vRefreshListeners.end()
    );
}

void Notifier::updateRefreshing(bool refreshing) {
    std::vector<std::shared_ptr<IRefreshListener>> listeners;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        listeners = vRefreshListeners;
    }

    for (const auto& listener : listeners) {
        listener->isRefreshing(refreshing);
    }
}
