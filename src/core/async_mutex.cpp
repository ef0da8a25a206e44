#include <mcpgate/core/async_mutex.h>

#include <utility>
#include <boost/asio/associated_executor.hpp>
#include <boost/asio/async_result.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/use_awaitable.hpp>

namespace mcpgate::core {

// Travels with a posted waiter; releases the lock if the waiter is destroyed unresumed.
class AsyncMutex::Handoff {
public:
    explicit Handoff(std::weak_ptr<State> state) : state_(std::move(state)) {}
    Handoff(Handoff&& other) noexcept : state_(std::move(other.state_)) { other.state_.reset(); }
    Handoff& operator=(Handoff&&) = delete;
    Handoff(const Handoff&) = delete;
    Handoff& operator=(const Handoff&) = delete;

    ~Handoff() {
        if (auto state = state_.lock())
            release(*state);
    }

    void disarm() { state_.reset(); }

private:
    std::weak_ptr<State> state_;
};

AsyncMutex::AsyncMutex() : state_(std::make_shared<State>()) {}

boost::asio::awaitable<AsyncMutex::Guard> AsyncMutex::scoped_lock() {
    {
        std::lock_guard<std::mutex> lk(state_->mutex);
        if (!state_->locked) {
            state_->locked = true;
            co_return Guard(this);
        }
    }

    // Ownership arrives when release() posts the parked handler
    co_await boost::asio::async_initiate<const boost::asio::use_awaitable_t<>&, void()>(
        [this](auto handler) {
            using Handler = decltype(handler);
            auto parked = std::make_shared<Handler>(std::move(handler));
            std::weak_ptr<State> weak = state_;
            auto resume = [parked, weak]() {
                auto executor = boost::asio::get_associated_executor(*parked);
                boost::asio::post(executor, [waiter = std::move(*parked),
                                             handoff = Handoff(weak)]() mutable {
                    handoff.disarm();
                    waiter();
                });
            };

            std::unique_lock<std::mutex> lk(state_->mutex);
            if (!state_->locked) {
                // Released between the fast path and here
                state_->locked = true;
                lk.unlock();
                resume();
                return;
            }
            state_->waiters.push_back(std::move(resume));
        },
        boost::asio::use_awaitable);
    co_return Guard(this);
}

AsyncMutex::Guard AsyncMutex::try_lock() {
    std::lock_guard<std::mutex> lk(state_->mutex);
    if (state_->locked)
        return Guard();
    state_->locked = true;
    return Guard(this);
}

bool AsyncMutex::locked() const {
    std::lock_guard<std::mutex> lk(state_->mutex);
    return state_->locked;
}

std::size_t AsyncMutex::waiters() const {
    std::lock_guard<std::mutex> lk(state_->mutex);
    return state_->waiters.size();
}

void AsyncMutex::release(State& state) {
    std::function<void()> next;
    {
        std::lock_guard<std::mutex> lk(state.mutex);
        if (state.waiters.empty()) {
            state.locked = false;
            return;
        }
        next = std::move(state.waiters.front());
        state.waiters.pop_front();
    }
    // locked stays true: the lock passes directly to the next waiter
    next();
}

} // namespace mcpgate::core
