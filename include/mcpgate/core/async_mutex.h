#pragma once

#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <utility>
#include <boost/asio/awaitable.hpp>

namespace mcpgate::core {

// Coroutine-friendly FIFO mutex. A contended lock suspends the awaiting coroutine instead of
// blocking an io thread; ownership is handed to waiters in arrival order. A parked waiter is
// its own completion handler, resumed on its associated executor when the lock passes to it.
// If that executor is destroyed before the waiter runs, the lock moves on to the next waiter.
class AsyncMutex {
public:
    class Guard {
    public:
        Guard() = default;
        explicit Guard(AsyncMutex* owner) : owner_(owner) {}
        Guard(Guard&& other) noexcept : owner_(other.owner_) { other.owner_ = nullptr; }
        Guard& operator=(Guard&& other) noexcept {
            if (this != &other) {
                release();
                owner_ = other.owner_;
                other.owner_ = nullptr;
            }
            return *this;
        }
        Guard(const Guard&) = delete;
        Guard& operator=(const Guard&) = delete;
        ~Guard() { release(); }

        bool owns_lock() const noexcept { return owner_ != nullptr; }

        void release() {
            if (owner_) {
                owner_->unlock();
                owner_ = nullptr;
            }
        }

    private:
        AsyncMutex* owner_ = nullptr;
    };

    AsyncMutex();
    AsyncMutex(const AsyncMutex&) = delete;
    AsyncMutex& operator=(const AsyncMutex&) = delete;

    boost::asio::awaitable<Guard> scoped_lock();

    // Non-suspending attempt; an empty guard means the mutex was held.
    Guard try_lock();

    bool locked() const;
    std::size_t waiters() const;

private:
    struct State {
        std::mutex mutex;
        bool locked = false;
        std::deque<std::function<void()>> waiters; // each posts one parked coroutine
    };
    class Handoff;

    static void release(State& state);
    void unlock() { release(*state_); }

    // Shared so a handoff still queued on a dead executor can release the lock
    std::shared_ptr<State> state_;

};

} // namespace mcpgate::core
