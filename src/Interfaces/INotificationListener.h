//
// Receives user facing messages produced by the client layer
//

#ifndef LRR_CLIENT_I_NOTIFICATION_LISTENER_H
#define LRR_CLIENT_I_NOTIFICATION_LISTENER_H

#include <string>

class INotificationListener {
public:
    virtual ~INotificationListener() = default;

    virtual void onError(const std::string& message) = 0;
    virtual void onInfo(const std::string& message) = 0;
};

class IRefreshListener {
public:
    virtual ~IRefreshListener() = default;

    virtual void isRefreshing(bool refreshing) = 0;
};

#endif //LRR_CLIENT_I_NOTIFICATION_LISTENER_H
