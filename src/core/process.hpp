#pragma once

#include <chrono>
#include <string>
#include <vector>
#include <sys/types.h>

struct SpawnResult {
    bool success = false;
    pid_t pid = -1;
    std::string error;
};

pid_t current_pid();

/// True while pid exists and is not a zombie.
/// EPERM counts as alive (the process exists, we just may not signal it).
bool is_process_alive(pid_t pid);

/// Poll is_process_alive() every poll_interval until it turns false.
/// Returns false when timeout elapses first.
bool wait_for_process_exit(pid_t pid,
                           std::chrono::milliseconds timeout,
                           std::chrono::milliseconds poll_interval);

/// Start binary_path in its own session with stdio on /dev/null.
/// success is reported only once execv() has replaced the child image;
/// an exec failure (missing file, not executable) comes back as an error.
SpawnResult spawn_detached(const std::string& binary_path,
                           const std::vector<std::string>& args = {});

/// After spawn_detached(): wait up to window and make sure the child did not
/// die with a failure status. A child still running, or one that exited 0,
/// counts as started.
bool confirm_started(pid_t pid, std::chrono::milliseconds window);
