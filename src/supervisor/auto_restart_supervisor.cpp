#include <mcpgate/supervisor/auto_restart_supervisor.h>

#include <algorithm>
#include <unordered_set>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

namespace mcpgate::supervisor {

using boost::asio::awaitable;

AutoRestartSupervisor::AutoRestartSupervisor(boost::asio::any_io_executor executor,
                                             std::shared_ptr<store::IServerRepository> repository,
                                             std::shared_ptr<server::IServerLifecycle> lifecycle,
                                             AutoRestartConfig config, Clock clock)
    : executor_(std::move(executor)), repository_(std::move(repository)),
      lifecycle_(std::move(lifecycle)), config_(config), clock_(std::move(clock)),
      stopRequested_(std::make_shared<std::atomic<bool>>(false)) {
    if (!clock_)
        clock_ = [] { return std::chrono::system_clock::now(); };
}

AutoRestartSupervisor::~AutoRestartSupervisor() {
    stopRequested_->store(true, std::memory_order_release);
}

void AutoRestartSupervisor::start() {
    if (!config_.enabled) {
        spdlog::info("[AutoRestartSupervisor] Disabled by configuration");
        return;
    }
    bool expected = false;
    if (!running_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
        spdlog::debug("[AutoRestartSupervisor] Already running, skipping start");
        return;
    }
    stopRequested_->store(false, std::memory_order_release);

    auto done = std::make_shared<std::promise<void>>();
    loopDone_ = done->get_future();
    auto self = shared_from_this();
    auto stopFlag = stopRequested_;

    spdlog::info("[AutoRestartSupervisor] Started (interval={}s, max attempts={}, delay={}s)",
                 config_.healthCheckInterval.count(), config_.maxRestartAttempts,
                 config_.restartDelay.count());
    boost::asio::co_spawn(
        executor_,
        [self, stopFlag, done]() -> awaitable<void> {
            using namespace std::chrono_literals;
            auto executor = co_await boost::asio::this_coro::executor;
            boost::asio::steady_timer timer(executor);

            while (!stopFlag->load(std::memory_order_acquire)) {
                // Sliced sleep so stop() is observed within half a second
                auto deadline = std::chrono::steady_clock::now() + self->config_.healthCheckInterval;
                boost::system::error_code ec;
                while (!stopFlag->load(std::memory_order_acquire)) {
                    auto now = std::chrono::steady_clock::now();
                    if (now >= deadline)
                        break;
                    timer.expires_after(
                        std::min<std::chrono::steady_clock::duration>(500ms, deadline - now));
                    co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
                    if (ec)
                        break;
                }
                if (ec || stopFlag->load(std::memory_order_acquire))
                    break;

                try {
                    co_await self->tick(self->clock_());
                } catch (const std::exception& e) {
                    spdlog::error("[AutoRestartSupervisor] Health scan failed: {}", e.what());
                }
            }
            spdlog::debug("[AutoRestartSupervisor] Loop stopped");
            done->set_value();
        },
        boost::asio::detached);
}

void AutoRestartSupervisor::stop() {
    bool expected = true;
    if (!running_.compare_exchange_strong(expected, false, std::memory_order_acq_rel))
        return;
    spdlog::info("[AutoRestartSupervisor] Stopping");
    stopRequested_->store(true, std::memory_order_release);
    if (loopDone_.valid() && loopDone_.wait_for(kStopWait) != std::future_status::ready)
        spdlog::warn("[AutoRestartSupervisor] Health scan still running after {}s",
                     kStopWait.count());
}

int AutoRestartSupervisor::restartBudget(const model::ServerDescriptor& server) const {
    return server.maxRestartAttempts > 0 ? server.maxRestartAttempts : config_.maxRestartAttempts;
}

awaitable<void> AutoRestartSupervisor::tick(TimePoint now) {
    std::vector<model::ServerDescriptor> targets;
    for (auto& server : repository_->listEnabledServers()) {
        if (server.isSystem)
            targets.push_back(std::move(server));
    }

    {
        std::unordered_set<ServerId> live;
        for (const auto& server : targets)
            live.insert(server.id);
        std::lock_guard<std::mutex> lk(mutex_);
        for (auto it = trackers_.begin(); it != trackers_.end();) {
            if (live.count(it->first) == 0)
                it = trackers_.erase(it);
            else
                ++it;
        }
    }

    for (const auto& server : targets) {
        try {
            co_await checkServer(server, now);
        } catch (const std::exception& e) {
            spdlog::error("[AutoRestartSupervisor] {}: check failed: {}", server.id, e.what());
        }
    }
}

awaitable<void> AutoRestartSupervisor::checkServer(const model::ServerDescriptor& server,
                                                   TimePoint now) {
    auto status = co_await lifecycle_->verifyRunning(server.id);
    const int budget = restartBudget(server);
    int failures = 0;
    {
        std::lock_guard<std::mutex> lk(mutex_);
        auto& state = trackers_[server.id];
        if (status) {
            if (state.consecutiveFailures > 0)
                spdlog::info("[AutoRestartSupervisor] {} is healthy again", server.id);
            state = HealthState{now, 0, std::nullopt};
            co_return;
        }

        state.lastHealthCheck = now;
        failures = ++state.consecutiveFailures;
        if (failures > budget) {
            if (failures == budget + 1)
                spdlog::error("[AutoRestartSupervisor] {} exceeded {} restart attempts; giving up "
                              "until it is healthy again",
                              server.id, budget);
            co_return;
        }
        if (state.lastRestartAttempt && now - *state.lastRestartAttempt < config_.restartDelay) {
            spdlog::debug("[AutoRestartSupervisor] {} in restart cooldown", server.id);
            co_return;
        }
        state.lastRestartAttempt = now;
    }

    spdlog::warn("[AutoRestartSupervisor] {} unhealthy; restart attempt {}/{}", server.id,
                 failures, budget);
    auto result = co_await lifecycle_->startServer(server.id);
    if (auto* failed = std::get_if<model::ServerStartResult::Failed>(&result.outcome)) {
        spdlog::error("[AutoRestartSupervisor] restart of {} failed: {}", server.id,
                      failed->error.message);
    } else {
        spdlog::info("[AutoRestartSupervisor] {} restarted", server.id);
    }
}

std::optional<HealthState> AutoRestartSupervisor::healthState(const ServerId& id) const {
    std::lock_guard<std::mutex> lk(mutex_);
    auto it = trackers_.find(id);
    if (it == trackers_.end())
        return std::nullopt;
    return it->second;
}

void AutoRestartSupervisor::forget(const ServerId& id) {
    std::lock_guard<std::mutex> lk(mutex_);
    trackers_.erase(id);
}

void AutoRestartSupervisor::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    trackers_.clear();
}

std::size_t AutoRestartSupervisor::trackedCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return trackers_.size();
}

} // namespace mcpgate::supervisor
