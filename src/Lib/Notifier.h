//
// Routes user facing messages to the single registered listener
//

#ifndef LRR_CLIENT_NOTIFIER_H
#define LRR_CLIENT_NOTIFIER_H

#include "../Interfaces/INotificationListener.h"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

class Notifier {
public:
    void setListener(const std::shared_ptr<INotificationListener>& listener);
    void setVerbose(bool verbose);
    auto isVerbose() const -> bool;

    void notifyError(const std::string& message);
    void notifyInfo(const std::string& message);

    // Failure with an HTTP status. Verbose mode appends the status code.
    void handleErrorMessage(int statusCode, const std::string& defaultMessage);
    // Failure with a raw transport cause. Verbose mode shows the cause instead of the canned message.
    void handleErrorMessage(const std::string& cause, const std::string& defaultMessage);

    void registerRefreshListener(const std::shared_ptr<IRefreshListener>& listener);
    void unregisterRefreshListener(const std::shared_ptr<IRefreshListener>& listener);
    void updateRefreshing(bool refreshing);

private:
    mutable std::mutex mutex_;
    std::shared_ptr<INotificationListener> pListener = nullptr;
    std::vector<std::shared_ptr<IRefreshListener>> vRefreshListeners;
    bool bVerbose = false;
};

#endif //LRR_CLIENT_NOTIFIER_H
