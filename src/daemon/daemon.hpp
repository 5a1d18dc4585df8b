#pragma once

#include "core/config.hpp"
#include "daemon/engine_supervisor.hpp"

#include <memory>
#include <mutex>
#include <atomic>
#include <thread>
#include <string>
#include <vector>

class LogSink;

class Daemon {
public:
    explicit Daemon(Config& config, SupervisorTimings timings = SupervisorTimings{});
    ~Daemon();

    /// Serve IPC until stop is requested, then terminate the engine
    int run();

    /// Request graceful stop (called from signal handler)
    void request_stop();

    EngineSupervisor& supervisor() { return *supervisor_; }

    /// Connection threads not yet reaped
    size_t worker_count();

private:
    Config& config_;
    std::shared_ptr<LogSink> sink_;
    std::unique_ptr<EngineSupervisor> supervisor_;
    std::atomic<bool> stop_flag_{false};
    int socket_fd_ = -1;

    // One thread per connection; start can block for the whole readiness wait.
    // Finished workers are joined by the accept loop.
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };
    std::mutex workers_mutex_;
    std::vector<Worker> workers_;

    // IPC
    bool start_ipc_server();
    void ipc_loop();
    void serve_client(int client_fd);
    void spawn_worker(int client_fd);
    void reap_workers();
    std::string handle_command(const std::string& json_line);
    void cleanup_socket();
    void join_workers();
};
