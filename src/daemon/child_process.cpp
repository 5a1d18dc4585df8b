#include "daemon/child_process.hpp"
#include "daemon/process_tree.hpp"

#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <cerrno>
#include <cstring>

extern char** environ;

// ── ExitStatus ──────────────────────────────────────────────

ExitStatus ExitStatus::from_wait_status(int status) {
    ExitStatus es;
    if (WIFEXITED(status)) {
        es.code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        es.signal = WTERMSIG(status);
    }
    return es;
}

std::string ExitStatus::describe() const {
    if (signal != 0) {
        std::string out = "signal: " + std::to_string(signal);
        if (const char* name = strsignal(signal)) out += std::string(" (") + name + ")";
        return out;
    }
    return "exit status: " + std::to_string(code);
}

// ── ChildProcess ────────────────────────────────────────────

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && !status_) {
        terminate_process_tree(*this);
        wait();
    }
    close_fds();
}

void ChildProcess::close_fds() {
    if (stdout_fd_ >= 0) {
        close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (stderr_fd_ >= 0) {
        close(stderr_fd_);
        stderr_fd_ = -1;
    }
}

int ChildProcess::take_stdout() {
    int fd = stdout_fd_;
    stdout_fd_ = -1;
    return fd;
}

int ChildProcess::take_stderr() {
    int fd = stderr_fd_;
    stderr_fd_ = -1;
    return fd;
}

bool ChildProcess::spawn(const std::string& binary, const SpawnOptions& options, std::string& error) {
    if (pid_ > 0) {
        error = "Process already spawned";
        return false;
    }

    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};  // reports exec failure errno back to us

    auto close_pair = [](int p[2]) {
        if (p[0] >= 0) close(p[0]);
        if (p[1] >= 0) close(p[1]);
        p[0] = p[1] = -1;
    };

    if (options.capture_output &&
        (pipe2(out_pipe, O_CLOEXEC) < 0 || pipe2(err_pipe, O_CLOEXEC) < 0)) {
        error = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return false;
    }
    if (pipe2(exec_pipe, O_CLOEXEC) < 0) {
        error = std::string("pipe failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        return false;
    }

    // Everything the child needs is prepared before fork
    std::vector<const char*> argv;
    argv.push_back(binary.c_str());
    for (const auto& arg : options.args) {
        argv.push_back(arg.c_str());
    }
    argv.push_back(nullptr);

    std::vector<std::string> env_storage;
    for (char** e = environ; e && *e; ++e) {
        std::string entry(*e);
        auto eq = entry.find('=');
        if (eq != std::string::npos && options.env.count(entry.substr(0, eq))) continue;
        env_storage.push_back(std::move(entry));
    }
    for (const auto& kv : options.env) {
        env_storage.push_back(kv.first + "=" + kv.second);
    }
    std::vector<char*> envp;
    for (auto& entry : env_storage) {
        envp.push_back(entry.data());
    }
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0) {
        error = std::string("fork failed: ") + std::strerror(errno);
        close_pair(out_pipe);
        close_pair(err_pipe);
        close_pair(exec_pipe);
        return false;
    }

    if (pid == 0) {
        // Child process
        if (options.new_process_group) {
            setpgid(0, 0);
        }
        if (options.capture_output) {
            dup2(out_pipe[1], STDOUT_FILENO);
            dup2(err_pipe[1], STDERR_FILENO);
        } else {
            int devnull = open("/dev/null", O_WRONLY);
            if (devnull >= 0) {
                dup2(devnull, STDOUT_FILENO);
                dup2(devnull, STDERR_FILENO);
            }
        }

        execvpe(binary.c_str(), const_cast<char* const*>(argv.data()), envp.data());

        // If execvpe returns, it failed
        int err = errno;
        ssize_t n = write(exec_pipe[1], &err, sizeof(err));
        (void)n;
        _exit(127);
    }

    // Parent process
    pid_ = pid;
    leads_group_ = options.new_process_group;
    if (options.new_process_group) {
        // Also set from the parent so the group exists before we might signal it
        setpgid(pid, pid);
    }
    close(exec_pipe[1]);
    if (options.capture_output) {
        close(out_pipe[1]);
        close(err_pipe[1]);
        stdout_fd_ = out_pipe[0];
        stderr_fd_ = err_pipe[0];
    }

    int child_errno = 0;
    ssize_t n;
    do {
        n = read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    close(exec_pipe[0]);

    if (n == static_cast<ssize_t>(sizeof(child_errno))) {
        error = "Failed to execute " + binary + ": " + std::strerror(child_errno);
        wait();
        close_fds();
        return false;
    }

    return true;
}

std::optional<ExitStatus> ChildProcess::try_wait() {
    if (status_) return status_;
    if (pid_ <= 0) return std::nullopt;

    int status = 0;
    pid_t result = waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        status_ = ExitStatus::from_wait_status(status);
    } else if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to observe
        status_ = ExitStatus{};
    }
    return status_;
}

ExitStatus ChildProcess::wait() {
    if (status_) return *status_;
    if (pid_ <= 0) return ExitStatus{};

    int status = 0;
    pid_t result;
    do {
        result = waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    status_ = (result == pid_) ? ExitStatus::from_wait_status(status) : ExitStatus{};
    return *status_;
}

std::optional<ExitStatus> run_and_wait(const std::string& binary,
                                       const std::vector<std::string>& args,
                                       std::string& error) {
    ChildProcess child;
    SpawnOptions options;
    options.args = args;
    options.capture_output = false;
    options.new_process_group = false;
    if (!child.spawn(binary, options, error)) {
        return std::nullopt;
    }
    return child.wait();
}
