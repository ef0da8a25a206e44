#pragma once

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>

namespace mcpgate::core {

// Owns one io_context and the threads that drive it. Owned by the Gateway; there is no
// process-wide instance.
class IoRuntime {
public:
    explicit IoRuntime(unsigned int threadCount = 0);
    ~IoRuntime() noexcept;

    IoRuntime(const IoRuntime&) = delete;
    IoRuntime& operator=(const IoRuntime&) = delete;

    boost::asio::io_context& context() { return *io_context_; }
    boost::asio::any_io_executor executor() { return io_context_->get_executor(); }

    unsigned int threadCount() const { return thread_count_; }
    bool running() const { return running_.load(std::memory_order_acquire); }

    // Idempotent. Releases the work guard, stops the context and joins the threads.
    void stop();

    static unsigned int defaultThreadCount();

private:
    using WorkGuard = boost::asio::executor_work_guard<boost::asio::io_context::executor_type>;

    std::unique_ptr<boost::asio::io_context> io_context_;
    std::unique_ptr<WorkGuard> work_guard_;
    std::vector<std::thread> io_threads_;
    std::mutex stop_mutex_;
    unsigned int thread_count_{0};
    std::atomic<bool> running_{false};
};

} // namespace mcpgate::core
