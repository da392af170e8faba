#include "runtime/agent/process.hpp"
#include "core/errors.hpp"
#include <spdlog/spdlog.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <unistd.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <filesystem>

namespace fs = std::filesystem;

namespace agentpool::runtime {

static int make_cloexec_pipe(int pfd[2]) {
#ifdef __linux__
    if (::pipe2(pfd, O_CLOEXEC) == 0) return 0;
#endif
    if (::pipe(pfd) != 0) return -1;
    ::fcntl(pfd[0], F_SETFD, ::fcntl(pfd[0], F_GETFD) | FD_CLOEXEC);
    ::fcntl(pfd[1], F_SETFD, ::fcntl(pfd[1], F_GETFD) | FD_CLOEXEC);
    return 0;
}

static void close_pipe(int pfd[2]) {
    if (pfd[0] >= 0) ::close(pfd[0]);
    if (pfd[1] >= 0) ::close(pfd[1]);
}

static int decode_status(int status) {
    if (WIFEXITED(status)) {
        return WEXITSTATUS(status);
    }
    if (WIFSIGNALED(status)) {
        return 128 + WTERMSIG(status);
    }
    return -1;
}

// ============================================================================
// Spawn
// ============================================================================

std::unique_ptr<AgentProcess> AgentProcess::spawn(const ProcessSpec& spec,
                                                  OutputCallback on_output) {
    std::error_code ec;
    if (spec.working_dir.empty() || !fs::is_directory(spec.working_dir, ec)) {
        spdlog::error("Agent working directory does not exist: {}", spec.working_dir);
        throw PreflightFailure("Agent working directory does not exist: " + spec.working_dir);
    }

    int err_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int errout_pipe[2] = {-1, -1};
    if (make_cloexec_pipe(err_pipe) != 0 ||
        make_cloexec_pipe(out_pipe) != 0 ||
        make_cloexec_pipe(errout_pipe) != 0) {
        int saved = errno;
        close_pipe(err_pipe);
        close_pipe(out_pipe);
        close_pipe(errout_pipe);
        throw PreflightFailure(std::string("pipe failed: ") + strerror(saved));
    }

    // Build argv before fork; only async-signal-safe calls in the child
    std::vector<char*> argv;
    argv.reserve(spec.args.size() + 2);
    argv.push_back(const_cast<char*>(spec.executable.c_str()));
    for (const auto& arg : spec.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int saved = errno;
        close_pipe(err_pipe);
        close_pipe(out_pipe);
        close_pipe(errout_pipe);
        throw PreflightFailure(std::string("fork failed: ") + strerror(saved));
    }

    if (pid == 0) {
        // Own process group so the whole tree can be signalled at once
        ::setpgid(0, 0);

        ::dup2(out_pipe[1], STDOUT_FILENO);
        ::dup2(errout_pipe[1], STDERR_FILENO);

        int null_fd = ::open("/dev/null", O_RDONLY);
        if (null_fd >= 0) {
            ::dup2(null_fd, STDIN_FILENO);
            ::close(null_fd);
        }

        if (::chdir(spec.working_dir.c_str()) != 0) {
            int child_err = errno;
            (void)!::write(err_pipe[1], &child_err, sizeof(child_err));
            _exit(127);
        }

        ::execvp(argv[0], argv.data());

        int child_err = errno;
        (void)!::write(err_pipe[1], &child_err, sizeof(child_err));
        _exit(127);
    }

    // Mirror setpgid in the parent to close the race with an early kill
    ::setpgid(pid, pid);

    ::close(err_pipe[1]);
    ::close(out_pipe[1]);
    ::close(errout_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = ::read(err_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(err_pipe[0]);

    if (n > 0) {
        int status = 0;
        ::waitpid(pid, &status, 0);
        ::close(out_pipe[0]);
        ::close(errout_pipe[0]);
        spdlog::error("Failed to exec {} (errno={}): {}", spec.executable, child_errno, strerror(child_errno));
        throw PreflightFailure("Failed to start " + spec.executable + ": " + strerror(child_errno));
    }

    spdlog::debug("Spawned {} (pid={}, cwd={})", spec.name, pid, spec.working_dir);
    return std::make_unique<AgentProcess>(SpawnedTag{}, spec, pid, out_pipe[0], errout_pipe[0],
                                          std::move(on_output));
}

AgentProcess::AgentProcess(SpawnedTag, ProcessSpec spec, pid_t pid, int stdout_fd, int stderr_fd,
                           OutputCallback on_output)
    : spec_(std::move(spec))
    , pid_(pid)
    , stdout_fd_(stdout_fd)
    , stderr_fd_(stderr_fd)
    , on_output_(std::move(on_output)) {
    drain_thread_ = std::thread(&AgentProcess::drain_loop, this);
}

AgentProcess::~AgentProcess() {
    if (!has_exited()) {
        kill_tree(2000);
    }
    stopping_ = true;
    if (drain_thread_.joinable()) {
        drain_thread_.join();
    }
    if (stdout_fd_ >= 0) ::close(stdout_fd_);
    if (stderr_fd_ >= 0) ::close(stderr_fd_);
}

// ============================================================================
// Output capture
// ============================================================================

void AgentProcess::drain_loop() {
    std::string partial[2];
    int fds[2] = {stdout_fd_, stderr_fd_};
    bool open[2] = {true, true};
    char buf[4096];

    auto emit = [this](OutputStream stream, const std::string& line) {
        if (on_output_) {
            on_output_(stream, line);
        } else {
            spdlog::debug("[{}] {}", spec_.name, line);
        }
    };

    while ((open[0] || open[1]) && !stopping_) {
        struct pollfd pfds[2];
        int count = 0;
        int index_of[2];
        for (int i = 0; i < 2; i++) {
            if (open[i]) {
                pfds[count].fd = fds[i];
                pfds[count].events = POLLIN;
                pfds[count].revents = 0;
                index_of[count] = i;
                count++;
            }
        }

        int rc = ::poll(pfds, count, 200);
        if (rc < 0) {
            if (errno == EINTR) continue;
            spdlog::warn("[{}] output poll failed: {}", spec_.name, strerror(errno));
            break;
        }
        if (rc == 0) {
            continue;
        }

        for (int k = 0; k < count; k++) {
            if (!(pfds[k].revents & (POLLIN | POLLHUP | POLLERR))) {
                continue;
            }
            int i = index_of[k];
            ssize_t n = ::read(fds[i], buf, sizeof(buf));
            if (n <= 0) {
                open[i] = false;
                continue;
            }
            partial[i].append(buf, buf + n);

            size_t pos;
            while ((pos = partial[i].find('\n')) != std::string::npos) {
                std::string line = partial[i].substr(0, pos);
                if (!line.empty() && line.back() == '\r') {
                    line.pop_back();
                }
                partial[i].erase(0, pos + 1);
                emit(i == 0 ? OutputStream::STDOUT : OutputStream::STDERR, line);
            }
        }
    }

    for (int i = 0; i < 2; i++) {
        if (!partial[i].empty()) {
            emit(i == 0 ? OutputStream::STDOUT : OutputStream::STDERR, partial[i]);
        }
    }
}

// ============================================================================
// Lifecycle
// ============================================================================

bool AgentProcess::has_exited() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (exited_) {
        return true;
    }

    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
        exited_ = true;
        exit_code_ = decode_status(status);
        spdlog::debug("{} (pid={}) exited with code {}", spec_.name, pid_, exit_code_);
    } else if (r < 0 && errno == ECHILD) {
        exited_ = true;
    }
    return exited_;
}

std::optional<int> AgentProcess::exit_code() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!exited_) {
        return std::nullopt;
    }
    return exit_code_;
}

bool AgentProcess::wait_for_exit(int timeout_ms) {
    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (has_exited()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    return has_exited();
}

bool AgentProcess::kill_tree(int timeout_ms) {
    if (has_exited()) {
        return true;
    }

    spdlog::debug("Sending SIGTERM to process group {}", pid_);
    if (::kill(-pid_, SIGTERM) != 0 && ::kill(pid_, SIGTERM) != 0 && errno != ESRCH) {
        spdlog::warn("Failed to signal {} (pid={}): {}", spec_.name, pid_, strerror(errno));
        return false;
    }

    if (wait_for_exit(timeout_ms)) {
        return true;
    }

    spdlog::warn("{} (pid={}) ignored SIGTERM, sending SIGKILL", spec_.name, pid_);
    if (::kill(-pid_, SIGKILL) != 0 && ::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::warn("Failed to SIGKILL {} (pid={}): {}", spec_.name, pid_, strerror(errno));
        return false;
    }

    return wait_for_exit(timeout_ms);
}

int AgentProcess::wait() {
    while (!has_exited()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    std::lock_guard<std::mutex> lock(mutex_);
    return exit_code_;
}

} // namespace agentpool::runtime
