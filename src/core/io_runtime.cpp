#include <mcpgate/core/io_runtime.h>

#include <algorithm>

#include <spdlog/spdlog.h>

namespace mcpgate::core {

unsigned int IoRuntime::defaultThreadCount() {
    unsigned int hw = std::thread::hardware_concurrency();
    if (hw == 0)
        hw = 4;
    return std::clamp(hw / 2, 2u, 16u);
}

IoRuntime::IoRuntime(unsigned int threadCount)
    : io_context_(std::make_unique<boost::asio::io_context>()),
      work_guard_(std::make_unique<WorkGuard>(io_context_->get_executor())),
      thread_count_(threadCount == 0 ? defaultThreadCount() : threadCount) {
    io_threads_.reserve(thread_count_);
    try {
        for (unsigned int i = 0; i < thread_count_; ++i) {
            io_threads_.emplace_back([this]() {
                try {
                    io_context_->run();
                } catch (const std::exception& e) {
                    spdlog::error("IoRuntime worker exited with exception: {}", e.what());
                }
            });
        }
    } catch (...) {
        // Thread creation failed: unwind the ones that did start before rethrowing
        work_guard_.reset();
        io_context_->stop();
        for (auto& worker : io_threads_) {
            if (worker.joinable())
                worker.join();
        }
        io_threads_.clear();
        throw;
    }
    running_.store(true, std::memory_order_release);
    spdlog::debug("IoRuntime started with {} threads", thread_count_);
}

IoRuntime::~IoRuntime() noexcept {
    stop();
}

void IoRuntime::stop() {
    std::lock_guard<std::mutex> lock(stop_mutex_);
    if (!running_.exchange(false, std::memory_order_acq_rel))
        return;

    if (work_guard_) {
        work_guard_->reset();
        work_guard_.reset();
    }
    io_context_->stop();

    const auto self = std::this_thread::get_id();
    for (auto& t : io_threads_) {
        if (!t.joinable())
            continue;
        if (t.get_id() == self) {
            // stop() reached from one of our own handlers
            t.detach();
            continue;
        }
        t.join();
    }
    io_threads_.clear();
    spdlog::debug("IoRuntime stopped");
}

} // namespace mcpgate::core
