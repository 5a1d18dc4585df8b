#pragma once

#include "core/config.hpp"
#include "core/paths.hpp"
#include "daemon/resource_sampler.hpp"
#include "daemon/script_stager.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>
#include <sys/types.h>

class ChildProcess;
class LogForwarder;
class LogSink;
struct ExitStatus;

enum class EngineErrc {
    None,
    AlreadyRunning,
    EngineNotFound,
    StartupTimeout,
    CrashDuringStartup,
    StartupCancelled,
    SpawnFailed,
    ScriptStagingFailed,
    LockPoisoned,
};

const char* to_string(EngineErrc code);

struct EngineResult {
    bool success = true;
    EngineErrc code = EngineErrc::None;
    std::string error;

    static EngineResult ok() { return EngineResult{}; }
    static EngineResult fail(EngineErrc code, std::string error) {
        return EngineResult{false, code, std::move(error)};
    }
};

struct ProxyStatus {
    bool running = false;
    bool active = false;                      // traffic processing on/off
    std::vector<std::string> active_scripts;  // empty unless running
};

/// Everything one engine run needs from its collaborators
struct EngineLaunchOptions {
    std::string engine_path;   // explicit engine binary; empty = resolve
    PathContext paths;
    int port = 9090;
    bool ssl_insecure = false;
    UpstreamProxyConfig upstream_proxy;
    std::vector<std::string> user_scripts;    // enabled scripts, in load order
    std::string rules_dir;
    std::string data_dir;
    std::string cert_dir;
    std::string staging_dir = ScriptStager::default_dir();

    static EngineLaunchOptions from_config(const AppConfig& config);
};

/// Command line and environment handed to the engine
struct EngineCommand {
    std::string binary;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
};

EngineCommand build_engine_command(const std::string& engine_path,
                                   const std::string& entry_addon,
                                   const std::string& anchor_addon,
                                   const std::vector<std::string>& staged_scripts,
                                   const EngineLaunchOptions& options);

/// Poll intervals and deadlines of the supervisor
struct SupervisorTimings {
    std::chrono::milliseconds startup_timeout{120000};
    std::chrono::milliseconds port_release_timeout{5000};
    std::chrono::milliseconds crash_poll_interval{2000};
    std::chrono::milliseconds readiness_poll_interval{200};
    std::chrono::milliseconds progress_log_interval{2000};
};

/// Owns the engine child process for its whole life: start, readiness,
/// crash detection, log forwarding, shutdown and resource accounting.
/// All methods are safe to call from any thread.
class EngineSupervisor {
public:
    explicit EngineSupervisor(std::shared_ptr<LogSink> sink,
                              SupervisorTimings timings = SupervisorTimings{});
    EngineSupervisor(std::shared_ptr<LogSink> sink,
                     std::unique_ptr<ResourceSampler> sampler,
                     SupervisorTimings timings = SupervisorTimings{});
    ~EngineSupervisor();

    EngineSupervisor(const EngineSupervisor&) = delete;
    EngineSupervisor& operator=(const EngineSupervisor&) = delete;

    /// Spawn the engine and block until its port accepts connections
    EngineResult start(const EngineLaunchOptions& options);

    /// Kill the engine, wait for its port to close, remove staged scripts
    EngineResult stop();

    /// Kill the engine and return at once (application exit path)
    EngineResult terminate();

    ProxyStatus get_status();

    /// Flip traffic processing; the engine is told in the background
    EngineResult set_active(bool active);

    EngineStats get_stats();

    /// Pid of the supervised engine, -1 when none
    pid_t engine_pid();

private:
    std::shared_ptr<LogSink> sink_;
    std::unique_ptr<ResourceSampler> sampler_;
    SupervisorTimings timings_;

    // Serialises start/stop/terminate
    std::mutex lifecycle_mutex_;

    // The child handle
    std::mutex child_mutex_;
    std::unique_ptr<ChildProcess> child_;

    std::mutex scripts_mutex_;
    std::vector<std::string> active_scripts_;

    std::atomic<int> last_port_{-1};
    // Set while an exit was asked for; tells a crash from a requested stop
    std::atomic<bool> stop_requested_{false};
    // Bumped by stop/terminate before they queue on lifecycle_mutex_
    std::atomic<uint64_t> cancel_epoch_{0};
    std::atomic<bool> active_{false};

    // Owned by whoever holds lifecycle_mutex_
    std::vector<std::unique_ptr<LogForwarder>> forwarders_;
    std::unique_ptr<ScriptStager> stager_;
    std::thread watcher_thread_;
    std::atomic<bool> watcher_shutdown_{false};

    std::mutex notify_mutex_;
    std::thread notify_thread_;

    EngineResult shutdown(bool graceful);
    std::string settle_exit_locked(const ChildProcess& child, const ExitStatus& status);
    void report_crash(const std::string& msg);
    EngineResult cancel_start(ChildProcess* child);
    void set_active_scripts(std::vector<std::string> scripts);
    void clear_active_scripts();

    void start_watcher();
    void stop_watcher();
    void crash_watch_loop();
    void stop_forwarders();
    bool wait_for_port_release(int port);
};
