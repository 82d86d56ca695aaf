#include "core/process.hpp"

#include <unistd.h>
#include <signal.h>
#include <fcntl.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <thread>

pid_t current_pid() {
    return ::getpid();
}

/// Linux keeps exited-but-unreaped children around as zombies; kill(pid, 0)
/// still succeeds for them, so look at the state field in /proc.
static bool is_zombie(pid_t pid) {
    std::ifstream stat("/proc/" + std::to_string(pid) + "/stat");
    if (!stat.is_open()) return false;

    std::string line;
    std::getline(stat, line);
    auto close_paren = line.rfind(')');
    if (close_paren == std::string::npos || close_paren + 2 >= line.size()) {
        return false;
    }
    char state = line[close_paren + 2];
    return state == 'Z' || state == 'X';
}

bool is_process_alive(pid_t pid) {
    if (pid <= 0) return false;

    if (kill(pid, 0) == 0) {
        return !is_zombie(pid);
    }
    return errno == EPERM;
}

bool wait_for_process_exit(pid_t pid,
                           std::chrono::milliseconds timeout,
                           std::chrono::milliseconds poll_interval) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (is_process_alive(pid)) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(poll_interval);
    }
    return true;
}

SpawnResult spawn_detached(const std::string& binary_path, const std::vector<std::string>& args) {
    SpawnResult result;

    // Build argv before fork: only async-signal-safe calls in the child
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(binary_path.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    // Close-on-exec pipe: EOF on the read end means exec succeeded
    int status_pipe[2];
    if (pipe2(status_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    pid_t pid = fork();
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close(status_pipe[0]);
        close(status_pipe[1]);
        return result;
    }

    if (pid == 0) {
        // Child process
        close(status_pipe[0]);
        setsid();

        int devnull = open("/dev/null", O_RDWR);
        if (devnull >= 0) {
            dup2(devnull, STDIN_FILENO);
            dup2(devnull, STDOUT_FILENO);
            dup2(devnull, STDERR_FILENO);
            if (devnull > STDERR_FILENO) close(devnull);
        }

        execv(binary_path.c_str(), argv.data());

        // If execv returns, it failed
        int err = errno;
        ssize_t ignored = write(status_pipe[1], &err, sizeof(err));
        (void)ignored;
        _exit(127);
    }

    // Parent process
    close(status_pipe[1]);

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(status_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(status_pipe[0]);

    if (n > 0) {
        int status;
        waitpid(pid, &status, 0);
        result.error = "exec " + binary_path + " failed: " + std::strerror(child_errno);
        return result;
    }

    result.success = true;
    result.pid = pid;
    return result;
}

bool confirm_started(pid_t pid, std::chrono::milliseconds window) {
    if (pid <= 0) return false;

    auto deadline = std::chrono::steady_clock::now() + window;
    while (true) {
        int status = 0;
        pid_t r = waitpid(pid, &status, WNOHANG);
        if (r == pid) {
            return WIFEXITED(status) && WEXITSTATUS(status) == 0;
        }
        if (r < 0) {
            // Not our child (already reaped elsewhere): fall back to liveness
            return is_process_alive(pid);
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
}
