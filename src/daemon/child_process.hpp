#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

/// How a child process ended
struct ExitStatus {
    int code = -1;    // exit code when exited normally, else -1
    int signal = 0;   // terminating signal, 0 if exited normally

    bool success() const { return signal == 0 && code == 0; }

    /// "exit status: 1" / "signal: 9 (SIGKILL)"
    std::string describe() const;

    static ExitStatus from_wait_status(int status);
};

struct SpawnOptions {
    std::vector<std::string> args;
    std::map<std::string, std::string> env;  // added to the inherited environment
    bool capture_output = true;              // pipe stdout/stderr back to us
    bool new_process_group = true;           // child leads its own group
};

/// A spawned child process. Owns its output pipes and reaps the child on
/// destruction (killing it first if it is still running).
class ChildProcess {
public:
    ChildProcess() = default;
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    /// fork + exec. Returns false with `error` set when the process could not
    /// be created or the binary could not be executed.
    bool spawn(const std::string& binary, const SpawnOptions& options, std::string& error);

    pid_t pid() const { return pid_; }

    /// True when the child was made leader of its own process group
    bool leads_group() const { return leads_group_; }

    /// Hand over the read end of the stdout/stderr pipe (-1 if not captured).
    /// The caller becomes responsible for closing it.
    int take_stdout();
    int take_stderr();

    /// Non-blocking exit probe; reaps the child when it has exited
    std::optional<ExitStatus> try_wait();

    /// Block until the child exits
    ExitStatus wait();

    bool reaped() const { return status_.has_value(); }

private:
    pid_t pid_ = -1;
    bool leads_group_ = false;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    std::optional<ExitStatus> status_;

    void close_fds();
};

/// Run a command to completion, discarding its output. Returns its exit
/// status, or nullopt when it could not be started.
std::optional<ExitStatus> run_and_wait(const std::string& binary,
                                       const std::vector<std::string>& args,
                                       std::string& error);
