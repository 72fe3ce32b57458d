#pragma once

#include <condition_variable>
#include <cstddef>
#include <mutex>

namespace d8::concurrency {

class Semaphore {
public:
    explicit Semaphore(std::size_t capacity);

    void acquire();
    void release();

    [[nodiscard]] std::size_t capacity() const { return capacity_; }
    [[nodiscard]] std::size_t inUse() const;

    // Releases on scope exit, including unwinding.
    class Guard {
    public:
        explicit Guard(Semaphore& sem) : sem_(&sem) { sem_->acquire(); }
        // Takes over a slot the caller already acquired.
        Guard(Semaphore& sem, std::adopt_lock_t) : sem_(&sem) {}
        ~Guard() { if (sem_) sem_->release(); }

        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;

        void release() {
            if (sem_) sem_->release();
            sem_ = nullptr;
        }

    private:
        Semaphore* sem_;
    };

private:
    const std::size_t capacity_;
    std::size_t used_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
};

}
