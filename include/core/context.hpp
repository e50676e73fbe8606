#pragma once

#include "core/error.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>

namespace ledgerstore {

/**
 * @brief Deadline + cancellation carried through every blocking call
 *
 * Copies share state. A child created with with_timeout() expires at the
 * earlier of its own and its parent's deadline, and is cancelled whenever
 * the parent is. Cancelling a child does not affect the parent.
 */
class Context {
public:
    using Clock = std::chrono::steady_clock;

    /// No deadline, not cancelled
    Context() : state_(std::make_shared<State>()) {}

    static Context background() { return Context{}; }

    [[nodiscard]] Context with_timeout(std::chrono::milliseconds timeout) const {
        Context child;
        child.state_->parent = state_;
        auto deadline = Clock::now() + timeout;
        if (const auto parent_deadline = this->deadline(); parent_deadline && *parent_deadline < deadline) {
            deadline = *parent_deadline;
        }
        child.state_->deadline = deadline;
        return child;
    }

    void cancel() const {
        state_->cancelled.store(true, std::memory_order_release);
    }

    [[nodiscard]] bool is_cancelled() const {
        for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
            if (s->cancelled.load(std::memory_order_acquire)) return true;
        }
        return false;
    }

    [[nodiscard]] std::optional<Clock::time_point> deadline() const {
        std::optional<Clock::time_point> result;
        for (const State* s = state_.get(); s != nullptr; s = s->parent.get()) {
            if (s->deadline && (!result || *s->deadline < *result)) {
                result = s->deadline;
            }
        }
        return result;
    }

    [[nodiscard]] bool expired() const {
        const auto dl = deadline();
        return dl && Clock::now() >= *dl;
    }

    [[nodiscard]] bool done() const { return is_cancelled() || expired(); }

    /// Time left before the deadline; `fallback` when there is none
    [[nodiscard]] std::chrono::milliseconds remaining(
        std::chrono::milliseconds fallback = std::chrono::milliseconds::max()) const {
        const auto dl = deadline();
        if (!dl) return fallback;
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(*dl - Clock::now());
        return left.count() > 0 ? left : std::chrono::milliseconds{0};
    }

    /// UNAVAILABLE with "context canceled" / "context deadline exceeded" once done
    [[nodiscard]] VoidResult err() const {
        if (is_cancelled()) {
            return VoidResult::error(ErrorCode::UNAVAILABLE, "context canceled");
        }
        if (expired()) {
            return VoidResult::error(ErrorCode::UNAVAILABLE, "context deadline exceeded");
        }
        return VoidResult::ok();
    }

    /**
     * @brief Sleep in short slices, waking early when the context is done
     * @return false if the context finished before the full duration elapsed
     */
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    struct State {
        std::atomic<bool> cancelled{false};
        std::optional<Clock::time_point> deadline;
        std::shared_ptr<State> parent;
    };

    std::shared_ptr<State> state_;
};

} // namespace ledgerstore
