#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>
#include <mcpgate/server/server_lifecycle.h>
#include <mcpgate/store/server_repository.h>

namespace mcpgate::supervisor {

struct AutoRestartConfig {
    bool enabled = true;
    std::chrono::seconds healthCheckInterval{30};
    int maxRestartAttempts = 3;
    std::chrono::seconds restartDelay{5};
};

struct HealthState {
    std::optional<TimePoint> lastHealthCheck;
    int consecutiveFailures = 0;
    std::optional<TimePoint> lastRestartAttempt;
};

/**
 * Periodically probes enabled system servers and restarts the unhealthy ones.
 *
 * Per server: a healthy probe resets the tracker; a failed probe increments the failure
 * count and triggers a restart while the count is within the restart budget and the
 * cooldown since the previous attempt has elapsed. Past the budget the server is left alone
 * until a probe succeeds again. Servers are handled one after another within a tick.
 */
class AutoRestartSupervisor : public std::enable_shared_from_this<AutoRestartSupervisor> {
public:
    using Clock = std::function<TimePoint()>;

    static constexpr auto kStopWait = std::chrono::seconds(45);

    AutoRestartSupervisor(boost::asio::any_io_executor executor,
                          std::shared_ptr<store::IServerRepository> repository,
                          std::shared_ptr<server::IServerLifecycle> lifecycle,
                          AutoRestartConfig config, Clock clock = {});
    ~AutoRestartSupervisor();

    // Launches the periodic loop; logs and returns when disabled. Idempotent.
    void start();
    // Signals the loop and waits for an in-flight tick to finish.
    void stop();
    bool running() const { return running_.load(std::memory_order_acquire); }

    // One scan over the enabled system servers.
    boost::asio::awaitable<void> tick(TimePoint now);

    std::optional<HealthState> healthState(const ServerId& id) const;
    void forget(const ServerId& id);
    void clear();
    std::size_t trackedCount() const;

    const AutoRestartConfig& config() const { return config_; }

private:
    boost::asio::awaitable<void> checkServer(const model::ServerDescriptor& server, TimePoint now);
    int restartBudget(const model::ServerDescriptor& server) const;

    boost::asio::any_io_executor executor_;
    std::shared_ptr<store::IServerRepository> repository_;
    std::shared_ptr<server::IServerLifecycle> lifecycle_;
    AutoRestartConfig config_;
    Clock clock_;

    mutable std::mutex mutex_;
    std::unordered_map<ServerId, HealthState> trackers_;

    std::atomic<bool> running_{false};
    std::shared_ptr<std::atomic<bool>> stopRequested_;
    std::future<void> loopDone_;
};

} // namespace mcpgate::supervisor
