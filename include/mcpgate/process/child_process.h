#pragma once

#include <chrono>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <utility>
#include <boost/asio/awaitable.hpp>
#include <mcpgate/core/types.h>

namespace mcpgate::process {

/**
 * @brief Configuration for spawning a child process with piped stdio
 *
 * Example:
 * @code
 * ProcessConfig config{.executable = "bun", .args = {"x", "server.js"}};
 * config.with_env("IS_MCPGATE_MCP", "1").in_directory("/tmp");
 * @endcode
 */
struct ProcessConfig {
    std::filesystem::path executable; ///< Resolved through PATH when not absolute
    std::vector<std::string> args;
    std::map<std::string, std::string> env; ///< Added to the inherited environment
    std::optional<std::filesystem::path> workdir;

    auto& with_env(std::string key, std::string value) {
        env[std::move(key)] = std::move(value);
        return *this;
    }

    auto& in_directory(std::filesystem::path dir) {
        workdir = std::move(dir);
        return *this;
    }
};

/**
 * @brief RAII handle for a spawned child process
 *
 * The child runs in its own process group with stdin, stdout and stderr connected to
 * pipes. Parent-side descriptors can be released to an Asio stream_descriptor; released
 * descriptors are owned by the caller from then on. The destructor terminates a child that
 * is still running.
 *
 * All public methods are thread-safe.
 */
class ChildProcess {
public:
    /**
     * @brief Fork and exec the configured program
     * @return ProcessSpawnFailed when the pipes, fork or exec fail (exec errors are reported
     *         back through a close-on-exec pipe, so a missing executable fails here)
     */
    static Result<std::unique_ptr<ChildProcess>> spawn(ProcessConfig config);

    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    [[nodiscard]] int pid() const noexcept { return pid_; }

    // Reaps the child if it exited; false once it has been reaped.
    [[nodiscard]] bool isAlive() const noexcept;

    /**
     * @brief Close stdin, SIGTERM the process group, wait, then SIGKILL
     */
    void terminate(std::chrono::milliseconds timeout = std::chrono::seconds{2});

    /**
     * @brief Same escalation as terminate(), waiting on a timer instead of the calling thread
     *
     * Safe to co_await from an io thread; the coroutine's executor keeps serving other work
     * while the child shuts down.
     */
    boost::asio::awaitable<void>
    terminateAsync(std::chrono::milliseconds timeout = std::chrono::seconds{2});

    // Polls waitpid every 10ms until the child exits or the timeout elapses.
    bool waitForExit(std::chrono::milliseconds timeout);
    boost::asio::awaitable<bool> waitForExitAsync(std::chrono::milliseconds timeout);

    [[nodiscard]] std::optional<int> exitCode() const;

    // Transfer ownership of the parent-side pipe ends (-1 if already released)
    int releaseStdin();
    int releaseStdout();
    int releaseStderr();

    const ProcessConfig& config() const { return config_; }

private:
    explicit ChildProcess(ProcessConfig config) : config_(std::move(config)) {}

    bool reapLocked() const;
    void closeStdin();
    bool signalGroup(int sig) const;
    void closeFds();

    ProcessConfig config_;
    int pid_{-1};
    int stdin_fd_{-1};
    int stdout_fd_{-1};
    int stderr_fd_{-1};

    mutable std::mutex mutex_;
    mutable bool reaped_{false};
    mutable std::optional<int> exit_code_;
};

// kill(pid, 0) probe; true for live processes we may not signal (EPERM).
bool isProcessRunning(int pid);

} // namespace mcpgate::process
