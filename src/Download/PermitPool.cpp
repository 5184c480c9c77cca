#include "PermitPool.h"

PermitPool::Permit::~Permit() {
    if (pPool != nullptr) {
        pPool->release();
    }
}

PermitPool::PermitPool(uint32_t capacity) : capacity_(capacity), available_(capacity) {}

auto PermitPool::acquire(std::stop_token token) -> std::optional<Permit> {
    std::unique_lock<std::mutex> lock(mutex_);
    // Stopped tokens never acquire, even when a slot is free
    if (!condition.wait(lock, token, [this] { return available_ > 0; }) || token.stop_requested()) {
        return std::nullopt;
    }

    available_--;
    return std::optional<Permit>(std::in_place, this);
}

auto PermitPool::available() const -> uint32_t {
    std::unique_lock<std::mutex> lock(mutex_);
    return available_;
}

void PermitPool::release() {
    {
        std::unique_lock<std::mutex> lock(mutex_);
        available_++;
    }

    condition.notify_one();
}
