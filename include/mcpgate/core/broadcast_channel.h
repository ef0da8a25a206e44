#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace mcpgate::core {

/**
 * Bounded multi-subscriber broadcast queue.
 *
 * Producers never block: the ring keeps the newest `capacity` items and a subscriber that
 * fell further behind gets a single Lagged notice carrying the number of items it missed,
 * after which its cursor continues from the oldest retained item.
 */
template <typename T> class BroadcastChannel {
    struct State {
        explicit State(std::size_t cap) : capacity(cap), ring(cap) {}

        mutable std::mutex mutex;
        std::size_t capacity;
        std::vector<std::optional<T>> ring;
        std::uint64_t head = 0; // sequence number of the next item to publish
        std::size_t receivers = 0;
        bool closed = false;
    };

public:
    enum class RecvStatus { Item, Lagged, Empty, Closed };

    struct RecvResult {
        RecvStatus status = RecvStatus::Empty;
        std::optional<T> value;
        std::uint64_t skipped = 0;
    };

    class Receiver {
    public:
        Receiver() = default;
        Receiver(std::shared_ptr<State> state, std::uint64_t cursor)
            : state_(std::move(state)), cursor_(cursor) {}
        Receiver(Receiver&& other) noexcept
            : state_(std::move(other.state_)), cursor_(other.cursor_) {}
        Receiver& operator=(Receiver&& other) noexcept {
            if (this != &other) {
                detach();
                state_ = std::move(other.state_);
                cursor_ = other.cursor_;
            }
            return *this;
        }
        Receiver(const Receiver&) = delete;
        Receiver& operator=(const Receiver&) = delete;
        ~Receiver() { detach(); }

        bool valid() const noexcept { return state_ != nullptr; }

        RecvResult tryRecv() {
            RecvResult out;
            if (!state_) {
                out.status = RecvStatus::Closed;
                return out;
            }
            std::lock_guard<std::mutex> lk(state_->mutex);
            const std::uint64_t oldest =
                state_->head > state_->capacity ? state_->head - state_->capacity : 0;
            if (cursor_ < oldest) {
                out.status = RecvStatus::Lagged;
                out.skipped = oldest - cursor_;
                cursor_ = oldest;
                return out;
            }
            if (cursor_ < state_->head) {
                out.status = RecvStatus::Item;
                out.value = state_->ring[cursor_ % state_->capacity];
                ++cursor_;
                return out;
            }
            out.status = state_->closed ? RecvStatus::Closed : RecvStatus::Empty;
            return out;
        }

        // Suspends until an item, a lag notice, or close.
        boost::asio::awaitable<RecvResult> recv(
            std::chrono::milliseconds pollInterval = std::chrono::milliseconds(10)) {
            auto executor = co_await boost::asio::this_coro::executor;
            boost::asio::steady_timer timer(executor);
            for (;;) {
                auto r = tryRecv();
                if (r.status != RecvStatus::Empty)
                    co_return r;
                timer.expires_after(pollInterval);
                co_await timer.async_wait(boost::asio::use_awaitable);
            }
        }

    private:
        void detach() {
            if (state_) {
                std::lock_guard<std::mutex> lk(state_->mutex);
                if (state_->receivers > 0)
                    --state_->receivers;
            }
            state_.reset();
        }

        std::shared_ptr<State> state_;
        std::uint64_t cursor_ = 0;
    };

    explicit BroadcastChannel(std::size_t capacity) {
        if (capacity == 0)
            throw std::invalid_argument("BroadcastChannel capacity must be positive");
        state_ = std::make_shared<State>(capacity);
    }

    // Returns the number of live receivers at publish time.
    std::size_t send(T item) {
        std::lock_guard<std::mutex> lk(state_->mutex);
        if (state_->closed)
            return 0;
        state_->ring[state_->head % state_->capacity] = std::move(item);
        ++state_->head;
        return state_->receivers;
    }

    // New receivers only observe items published after they subscribed.
    Receiver subscribe() {
        std::lock_guard<std::mutex> lk(state_->mutex);
        ++state_->receivers;
        return Receiver(state_, state_->head);
    }

    void close() {
        std::lock_guard<std::mutex> lk(state_->mutex);
        state_->closed = true;
    }

    bool closed() const {
        std::lock_guard<std::mutex> lk(state_->mutex);
        return state_->closed;
    }

    std::size_t receiverCount() const {
        std::lock_guard<std::mutex> lk(state_->mutex);
        return state_->receivers;
    }

    std::size_t capacity() const { return state_->capacity; }

private:
    std::shared_ptr<State> state_;
};

} // namespace mcpgate::core
