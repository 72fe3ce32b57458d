#include "concurrency/Context.hpp"
#include "transfer/errors.hpp"

#include <algorithm>
#include <thread>

namespace d8::concurrency {

Context::Context(std::shared_ptr<const Context> parent, std::optional<Clock::time_point> deadline)
    : parent_(std::move(parent)), deadline_(deadline) {
    if (parent_ && parent_->deadline_ && (!deadline_ || *parent_->deadline_ < *deadline_))
        deadline_ = parent_->deadline_;
}

Context::Ptr Context::background() {
    return std::make_shared<Context>(nullptr, std::nullopt);
}

Context::Ptr Context::withCancel() const {
    return std::make_shared<Context>(shared_from_this(), std::nullopt);
}

Context::Ptr Context::withTimeout(const std::chrono::milliseconds timeout) const {
    return std::make_shared<Context>(shared_from_this(), Clock::now() + timeout);
}

void Context::cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

bool Context::explicitlyCancelled() const {
    for (const Context* c = this; c; c = c->parent_.get())
        if (c->cancelled_.load(std::memory_order_acquire)) return true;
    return false;
}

bool Context::deadlineExceeded() const {
    return deadline_ && Clock::now() >= *deadline_;
}

bool Context::cancelled() const { return explicitlyCancelled() || deadlineExceeded(); }

std::optional<std::chrono::milliseconds> Context::remaining() const {
    if (!deadline_) return std::nullopt;
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*deadline_ - Clock::now());
    return left.count() > 0 ? left : std::chrono::milliseconds{0};
}

void Context::check() const {
    if (explicitlyCancelled()) throw transfer::CancelledError(false);
    if (deadlineExceeded()) throw transfer::CancelledError(true);
}

void Context::sleepFor(const std::chrono::milliseconds d) const {
    constexpr std::chrono::milliseconds slice{50};
    const auto until = Clock::now() + d;
    for (;;) {
        check();
        const auto now = Clock::now();
        if (now >= until) return;
        std::this_thread::sleep_for(std::min<Clock::duration>(slice, until - now));
    }
}

}
