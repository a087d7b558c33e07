/**
 * Cooperative cancellation for the streaming pipeline
 *
 * A CancellationToken is a cheap handle to shared state: copies observe and
 * signal the same cancellation. Producers poll is_cancelled() between steps
 * and subscribe a callback to be woken while blocked.
 */

#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <utility>

namespace figi {

class CancellationToken {
    struct State {
        std::atomic<bool> cancelled{false};
        std::mutex mutex;
        std::map<uint64_t, std::function<void()>> callbacks;
        uint64_t next_id = 0;
    };

public:
    /**
     * RAII registration of a cancellation callback.
     * Destroying it unregisters the callback; once the destructor returns the
     * callback is guaranteed not to be running.
     */
    class Subscription {
    public:
        Subscription() = default;
        Subscription(Subscription&& other) noexcept
            : state_(std::move(other.state_)), id_(other.id_) {}
        Subscription& operator=(Subscription&& other) noexcept {
            if (this != &other) {
                reset();
                state_ = std::move(other.state_);
                id_ = other.id_;
            }
            return *this;
        }
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;

        ~Subscription() { reset(); }

        void reset() {
            if (auto state = state_.lock()) {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->callbacks.erase(id_);
            }
            state_.reset();
        }

    private:
        friend class CancellationToken;
        Subscription(std::weak_ptr<State> state, uint64_t id)
            : state_(std::move(state)), id_(id) {}

        std::weak_ptr<State> state_;
        uint64_t id_ = 0;
    };

    CancellationToken() : state_(std::make_shared<State>()) {}

    // Request cancellation. Idempotent; callbacks run once, on the calling thread.
    void cancel() {
        std::lock_guard<std::mutex> lock(state_->mutex);
        if (state_->cancelled.exchange(true, std::memory_order_acq_rel)) {
            return;
        }
        for (auto& [id, callback] : state_->callbacks) {
            callback();
        }
        state_->callbacks.clear();
    }

    bool is_cancelled() const {
        return state_->cancelled.load(std::memory_order_acquire);
    }

    // Register a callback for cancel(). Runs immediately if already cancelled.
    [[nodiscard]] Subscription subscribe(std::function<void()> callback) const {
        std::unique_lock<std::mutex> lock(state_->mutex);
        if (state_->cancelled.load(std::memory_order_acquire)) {
            lock.unlock();
            callback();
            return Subscription{};
        }
        uint64_t id = state_->next_id++;
        state_->callbacks.emplace(id, std::move(callback));
        return Subscription(state_, id);
    }

private:
    std::shared_ptr<State> state_;
};

} // namespace figi
