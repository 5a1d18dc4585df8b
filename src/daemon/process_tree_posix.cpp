#include "daemon/process_tree.hpp"
#include "daemon/child_process.hpp"

#include <spdlog/spdlog.h>
#include <signal.h>
#include <cerrno>
#include <cstring>

void terminate_process_tree(ChildProcess& child) {
    pid_t pid = child.pid();
    if (pid <= 0 || child.reaped()) return;

    // The child leads its own group, so the whole tree goes at once
    if (child.leads_group() && killpg(pid, SIGKILL) == 0) {
        return;
    }
    if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::warn("Failed to kill process {}: {}", pid, std::strerror(errno));
    }
}
