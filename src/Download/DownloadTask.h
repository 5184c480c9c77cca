//
// One active archive download
//

#ifndef LRR_CLIENT_DOWNLOADTASK_H
#define LRR_CLIENT_DOWNLOADTASK_H

#include <atomic>
#include <cstdint>
#include <stop_token>
#include <string>
#include <utility>

class DownloadTask {
public:
    explicit DownloadTask(std::string id) : id_(std::move(id)) {}

    auto id() const -> const std::string& { return id_; }

    auto token() const -> std::stop_token { return stopSource.get_token(); }
    void cancel() { stopSource.request_stop(); }
    auto isCancelled() const -> bool { return stopSource.stop_requested(); }

    auto pageCount() const -> uint32_t { return pageCount_; }
    void setPageCount(uint32_t pages) { pageCount_ = pages; }

private:
    const std::string id_;
    std::stop_source stopSource;
    std::atomic<uint32_t> pageCount_ = 0;
};

#endif //LRR_CLIENT_DOWNLOADTASK_H
