//
// Fixed capacity counting gate bounding how many archives download at once
//

#ifndef LRR_CLIENT_PERMITPOOL_H
#define LRR_CLIENT_PERMITPOOL_H

#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <optional>
#include <stop_token>

class PermitPool {
public:
    // Returns its slot to the pool when destroyed
    class Permit {
    public:
        explicit Permit(PermitPool* pool) : pPool(pool) {}
        ~Permit();

        Permit(Permit const&) = delete;
        auto operator =(Permit const&) -> Permit& = delete;
        Permit(Permit&& other) noexcept : pPool(other.pPool) { other.pPool = nullptr; }
        auto operator=(Permit&&) -> Permit& = delete;

    private:
        PermitPool* pPool;
    };

    explicit PermitPool(uint32_t capacity);

    // Blocks until a slot is free. Returns nothing if the token is stopped while waiting.
    auto acquire(std::stop_token token) -> std::optional<Permit>;

    auto available() const -> uint32_t;
    auto capacity() const -> uint32_t { return capacity_; }

private:
    void release();

    const uint32_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable_any condition;
    uint32_t available_;
};

#endif //LRR_CLIENT_PERMITPOOL_H
