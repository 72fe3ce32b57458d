#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace d8::concurrency {

// Cancellation token threaded through every network call. A child observes
// its own cancel() and every ancestor's, and inherits the earlier deadline.
class Context : public std::enable_shared_from_this<Context> {
public:
    using Ptr = std::shared_ptr<Context>;
    using Clock = std::chrono::steady_clock;

    static Ptr background();

    [[nodiscard]] Ptr withCancel() const;
    [[nodiscard]] Ptr withTimeout(std::chrono::milliseconds timeout) const;

    // Lock-free so it can be called from a signal handler.
    void cancel() noexcept;

    [[nodiscard]] bool cancelled() const;
    [[nodiscard]] bool explicitlyCancelled() const;
    [[nodiscard]] bool deadlineExceeded() const;

    [[nodiscard]] std::optional<Clock::time_point> deadline() const { return deadline_; }
    [[nodiscard]] std::optional<std::chrono::milliseconds> remaining() const;

    // Throws transfer::CancelledError once cancelled() is true.
    void check() const;

    // Sleeps unless cancelled first; throws like check().
    void sleepFor(std::chrono::milliseconds d) const;

    Context(std::shared_ptr<const Context> parent, std::optional<Clock::time_point> deadline);

private:
    std::shared_ptr<const Context> parent_;
    std::optional<Clock::time_point> deadline_;
    std::atomic<bool> cancelled_{false};
};

}
