#include <mcpgate/core/format.h>
#include <mcpgate/process/child_process.h>

#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/this_coro.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <spdlog/spdlog.h>

#include <cerrno>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/wait.h>

extern char** environ;

namespace mcpgate::process {

namespace {

void closeIfOpen(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

// Environment block for the child: inherited variables with the overrides applied.
std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overrides) {
    std::vector<std::string> out;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && overrides.count(entry.substr(0, eq)))
            continue;
        out.push_back(std::move(entry));
    }
    for (const auto& [key, value] : overrides)
        out.push_back(key + "=" + value);
    return out;
}

} // namespace

Result<std::unique_ptr<ChildProcess>> ChildProcess::spawn(ProcessConfig config) {
    // A child that dies mid-write must not take the gateway down with it
    signal(SIGPIPE, SIG_IGN);

    std::unique_ptr<ChildProcess> child(new ChildProcess(std::move(config)));
    const auto& cfg = child->config_;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int stderr_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};
    auto closeAll = [&]() {
        for (int* p : {stdin_pipe, stdout_pipe, stderr_pipe, error_pipe}) {
            closeIfOpen(p[0]);
            closeIfOpen(p[1]);
        }
    };

    if (pipe2(stdin_pipe, O_CLOEXEC) < 0 || pipe2(stdout_pipe, O_CLOEXEC) < 0 ||
        pipe2(stderr_pipe, O_CLOEXEC) < 0 || pipe2(error_pipe, O_CLOEXEC) < 0) {
        int err = errno;
        closeAll();
        return Error{ErrorCode::ProcessSpawnFailed,
                     format("Failed to create pipes: {}", std::strerror(err))};
    }

    // Everything the child needs is prepared before fork
    std::string exe = cfg.executable.string();
    std::vector<std::string> argStorage;
    argStorage.reserve(cfg.args.size() + 1);
    argStorage.push_back(exe);
    argStorage.insert(argStorage.end(), cfg.args.begin(), cfg.args.end());
    std::vector<char*> argv;
    for (auto& a : argStorage)
        argv.push_back(a.data());
    argv.push_back(nullptr);

    std::vector<std::string> envStorage = buildEnvironment(cfg.env);
    std::vector<char*> envp;
    for (auto& e : envStorage)
        envp.push_back(e.data());
    envp.push_back(nullptr);

    std::string workdir = cfg.workdir ? cfg.workdir->string() : std::string{};

    pid_t pid = fork();
    if (pid < 0) {
        int err = errno;
        closeAll();
        return Error{ErrorCode::ProcessSpawnFailed, format("fork() failed: {}", std::strerror(err))};
    }

    if (pid == 0) {
        // Child: only async-signal-safe calls from here on
        setpgid(0, 0);
        dup2(stdin_pipe[0], STDIN_FILENO);
        dup2(stdout_pipe[1], STDOUT_FILENO);
        dup2(stderr_pipe[1], STDERR_FILENO);
        signal(SIGPIPE, SIG_DFL);

        if (!workdir.empty() && chdir(workdir.c_str()) < 0) {
            int err = errno;
            ssize_t ignored = write(error_pipe[1], &err, sizeof(err));
            (void)ignored;
            _exit(127);
        }

        execvpe(argv[0], argv.data(), envp.data());

        int err = errno;
        ssize_t ignored = write(error_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent
    child->pid_ = pid;
    closeIfOpen(stdin_pipe[0]);
    closeIfOpen(stdout_pipe[1]);
    closeIfOpen(stderr_pipe[1]);
    closeIfOpen(error_pipe[1]);
    child->stdin_fd_ = stdin_pipe[1];
    child->stdout_fd_ = stdout_pipe[0];
    child->stderr_fd_ = stderr_pipe[0];

    // EOF on the error pipe means exec succeeded (close-on-exec)
    int childErrno = 0;
    ssize_t n;
    do {
        n = read(error_pipe[0], &childErrno, sizeof(childErrno));
    } while (n < 0 && errno == EINTR);
    closeIfOpen(error_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(childErrno))) {
        child->waitForExit(std::chrono::seconds{1});
        child->closeFds();
        return Error{ErrorCode::ProcessSpawnFailed,
                     format("Failed to execute '{}': {}", exe, std::strerror(childErrno))};
    }

    spdlog::debug("ChildProcess: spawned {} (pid={})", exe, pid);
    return std::move(child);
}

ChildProcess::~ChildProcess() {
    if (isAlive())
        terminate(std::chrono::seconds{2});
    closeFds();
}

void ChildProcess::closeFds() {
    std::lock_guard<std::mutex> lk(mutex_);
    closeIfOpen(stdin_fd_);
    closeIfOpen(stdout_fd_);
    closeIfOpen(stderr_fd_);
}

bool ChildProcess::reapLocked() const {
    if (reaped_ || pid_ <= 0)
        return true;
    int status = 0;
    pid_t r;
    do {
        r = waitpid(pid_, &status, WNOHANG);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        reaped_ = true;
        if (WIFEXITED(status))
            exit_code_ = WEXITSTATUS(status);
        else if (WIFSIGNALED(status))
            exit_code_ = 128 + WTERMSIG(status);
        return true;
    }
    if (r < 0 && errno == ECHILD) {
        // Reaped elsewhere
        reaped_ = true;
        return true;
    }
    return false;
}

bool ChildProcess::isAlive() const noexcept {
    std::lock_guard<std::mutex> lk(mutex_);
    return !reapLocked();
}

std::optional<int> ChildProcess::exitCode() const {
    std::lock_guard<std::mutex> lk(mutex_);
    reapLocked();
    return exit_code_;
}

bool ChildProcess::waitForExit(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (reapLocked())
                return true;
        }
        if (std::chrono::steady_clock::now() >= deadline)
            return false;
        std::this_thread::sleep_for(std::chrono::milliseconds{10});
    }
}

boost::asio::awaitable<bool> ChildProcess::waitForExitAsync(std::chrono::milliseconds timeout) {
    boost::asio::steady_timer timer(co_await boost::asio::this_coro::executor);
    auto deadline = std::chrono::steady_clock::now() + timeout;
    for (;;) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            if (reapLocked())
                co_return true;
        }
        if (std::chrono::steady_clock::now() >= deadline)
            co_return false;
        timer.expires_after(std::chrono::milliseconds{10});
        boost::system::error_code ec;
        co_await timer.async_wait(boost::asio::redirect_error(boost::asio::use_awaitable, ec));
    }
}

void ChildProcess::closeStdin() {
    // EOF on stdin first; well-behaved servers exit on their own
    std::lock_guard<std::mutex> lk(mutex_);
    closeIfOpen(stdin_fd_);
}

// Whole process group first, the child alone if the group is gone
bool ChildProcess::signalGroup(int sig) const {
    return kill(-pid_, sig) == 0 || kill(pid_, sig) == 0;
}

void ChildProcess::terminate(std::chrono::milliseconds timeout) {
    if (!isAlive())
        return;

    spdlog::debug("ChildProcess: terminating {} (pid={})", config_.executable.string(), pid_);
    closeStdin();
    if (signalGroup(SIGTERM) && waitForExit(timeout))
        return;

    spdlog::warn("ChildProcess: forcefully killing pid {}", pid_);
    signalGroup(SIGKILL);
    if (!waitForExit(std::chrono::seconds{1}))
        spdlog::error("ChildProcess: pid {} did not exit after SIGKILL", pid_);
}

boost::asio::awaitable<void> ChildProcess::terminateAsync(std::chrono::milliseconds timeout) {
    if (!isAlive())
        co_return;

    spdlog::debug("ChildProcess: terminating {} (pid={})", config_.executable.string(), pid_);
    closeStdin();
    if (signalGroup(SIGTERM) && co_await waitForExitAsync(timeout))
        co_return;

    spdlog::warn("ChildProcess: forcefully killing pid {}", pid_);
    signalGroup(SIGKILL);
    if (!co_await waitForExitAsync(std::chrono::seconds{1}))
        spdlog::error("ChildProcess: pid {} did not exit after SIGKILL", pid_);
}

int ChildProcess::releaseStdin() {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::exchange(stdin_fd_, -1);
}

int ChildProcess::releaseStdout() {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::exchange(stdout_fd_, -1);
}

int ChildProcess::releaseStderr() {
    std::lock_guard<std::mutex> lk(mutex_);
    return std::exchange(stderr_fd_, -1);
}

bool isProcessRunning(int pid) {
    if (pid <= 0)
        return false;
    if (kill(pid, 0) == 0)
        return true;
    return errno == EPERM;
}

} // namespace mcpgate::process
