#include "concurrency/Semaphore.hpp"

#include <stdexcept>

namespace d8::concurrency {

Semaphore::Semaphore(const std::size_t capacity) : capacity_(capacity) {
    if (capacity_ == 0) throw std::invalid_argument("Semaphore capacity must be at least 1");
}

void Semaphore::acquire() {
    std::unique_lock lock(mutex_);
    cv_.wait(lock, [this] { return used_ < capacity_; });
    ++used_;
}

void Semaphore::release() {
    {
        std::lock_guard lock(mutex_);
        if (used_ == 0) throw std::logic_error("Semaphore released more times than acquired");
        --used_;
    }
    cv_.notify_one();
}

std::size_t Semaphore::inUse() const {
    std::lock_guard lock(mutex_);
    return used_;
}

}
