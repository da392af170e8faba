#pragma once
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

namespace agentpool::runtime {

// What to launch
struct ProcessSpec {
    std::string name;                  // used to tag captured output
    std::string executable;
    std::vector<std::string> args;
    std::string working_dir;
};

enum class OutputStream {
    STDOUT,
    STDERR
};

// Called from the drain thread for every captured line
using OutputCallback = std::function<void(OutputStream stream, const std::string& line)>;

// One spawned OS process in its own process group. Owns the pid until it
// has been reaped; the destructor kills whatever is still alive.
class AgentProcess {
    // Restricts construction to spawn()
    struct SpawnedTag {
        explicit SpawnedTag() = default;
    };

public:
    AgentProcess(SpawnedTag, ProcessSpec spec, pid_t pid, int stdout_fd, int stderr_fd,
                 OutputCallback on_output);
    ~AgentProcess();

    // Non-copyable
    AgentProcess(const AgentProcess&) = delete;
    AgentProcess& operator=(const AgentProcess&) = delete;

    // Fork + exec. Throws PreflightFailure if the working directory is
    // missing or the executable cannot be exec'd.
    static std::unique_ptr<AgentProcess> spawn(const ProcessSpec& spec,
                                               OutputCallback on_output = nullptr);

    pid_t pid() const { return pid_; }
    const std::string& name() const { return spec_.name; }

    // Non-blocking reap
    bool has_exited();

    // Exit status once reaped (signal deaths map to 128 + signo)
    std::optional<int> exit_code() const;

    // SIGTERM the whole group, SIGKILL after timeout_ms, then reap.
    // Returns false if the signals could not be delivered.
    bool kill_tree(int timeout_ms = 5000);

    // Block until exit, returns the exit code
    int wait();

private:
    ProcessSpec spec_;
    pid_t pid_;
    int stdout_fd_;
    int stderr_fd_;
    OutputCallback on_output_;

    mutable std::mutex mutex_;
    bool exited_ = false;
    int exit_code_ = -1;

    std::atomic<bool> stopping_{false};
    std::thread drain_thread_;

    void drain_loop();
    bool wait_for_exit(int timeout_ms);
};

} // namespace agentpool::runtime
