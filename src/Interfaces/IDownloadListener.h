//
// Observers of the download scheduler. Listeners are always called on the UI context.
//

#ifndef LRR_CLIENT_I_DOWNLOAD_LISTENER_H
#define LRR_CLIENT_I_DOWNLOAD_LISTENER_H

#include <cstdint>
#include <string>

class IImageDownloadListener {
public:
    virtual ~IImageDownloadListener() = default;

    virtual void onImageDownloaded(const std::string& id, uint32_t pagesDownloaded) = 0;
};

// Listeners that also care about downloads disappearing
class IDownloadListener : public IImageDownloadListener {
public:
    virtual void onDownloadRemoved(const std::string& id) = 0;
    virtual void onDownloadCanceled(const std::string& id) = 0;
};

#endif //LRR_CLIENT_I_DOWNLOAD_LISTENER_H
