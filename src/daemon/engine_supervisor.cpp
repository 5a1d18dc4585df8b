#include "daemon/engine_supervisor.hpp"
#include "daemon/child_process.hpp"
#include "daemon/log_forwarder.hpp"
#include "daemon/port_probe.hpp"
#include "daemon/process_tree.hpp"
#include "api/engine_client.hpp"
#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <unistd.h>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;

const char* to_string(EngineErrc code) {
    switch (code) {
    case EngineErrc::None: return "None";
    case EngineErrc::AlreadyRunning: return "AlreadyRunning";
    case EngineErrc::EngineNotFound: return "EngineNotFound";
    case EngineErrc::StartupTimeout: return "StartupTimeout";
    case EngineErrc::CrashDuringStartup: return "CrashDuringStartup";
    case EngineErrc::StartupCancelled: return "StartupCancelled";
    case EngineErrc::SpawnFailed: return "SpawnFailed";
    case EngineErrc::ScriptStagingFailed: return "ScriptStagingFailed";
    case EngineErrc::LockPoisoned: return "LockPoisoned";
    }
    return "Unknown";
}

// ── Launch options / command line ───────────────────────────

EngineLaunchOptions EngineLaunchOptions::from_config(const AppConfig& config) {
    EngineLaunchOptions opts;
    opts.engine_path = config.engine_binary_path;
    opts.paths = PathContext::from_config(config);
    opts.port = config.proxy_port;
    opts.ssl_insecure = config.ssl_insecure;
    opts.upstream_proxy = config.upstream_proxy;
    opts.user_scripts = config.enabled_scripts;
    opts.rules_dir = Config::rules_dir();
    opts.data_dir = Config::data_dir();
    opts.cert_dir = Config::cert_dir();
    return opts;
}

EngineCommand build_engine_command(const std::string& engine_path,
                                   const std::string& entry_addon,
                                   const std::string& anchor_addon,
                                   const std::vector<std::string>& staged_scripts,
                                   const EngineLaunchOptions& options) {
    EngineCommand cmd;
    cmd.binary = engine_path;

    cmd.args = {"--flow-detail", "0"};
    if (!entry_addon.empty()) {
        cmd.args.insert(cmd.args.end(), {"-s", entry_addon});
    }
    cmd.args.insert(cmd.args.end(), {"-p", std::to_string(options.port)});

    if (options.ssl_insecure) {
        cmd.args.push_back("--ssl-insecure");
    }
    bool upstream = options.upstream_proxy.enabled && !options.upstream_proxy.url.empty();
    if (upstream) {
        cmd.args.insert(cmd.args.end(), {"--mode", "upstream:" + options.upstream_proxy.url});
    }

    for (const auto& script : staged_scripts) {
        cmd.args.insert(cmd.args.end(), {"-s", script});
    }

    // The anchor addon goes last so it sees the final state of every flow
    if (!anchor_addon.empty()) {
        cmd.args.insert(cmd.args.end(), {"-s", anchor_addon});
    }

    std::string user_scripts;
    for (const auto& script : options.user_scripts) {
        if (!user_scripts.empty()) user_scripts += ";";
        user_scripts += script;
    }

    cmd.env["RELAYCRAFT_RULES_DIR"] = options.rules_dir;
    cmd.env["RELAYCRAFT_DATA_DIR"] = options.data_dir;
    cmd.env["MITMPROXY_CONFDIR"] = options.cert_dir;
    cmd.env["RELAYCRAFT_USER_SCRIPTS"] = user_scripts;
    if (upstream) {
        cmd.env["RELAYCRAFT_UPSTREAM_PROXY"] = options.upstream_proxy.url;
    }
    return cmd;
}

// ── EngineSupervisor ────────────────────────────────────────

EngineSupervisor::EngineSupervisor(std::shared_ptr<LogSink> sink, SupervisorTimings timings)
    : EngineSupervisor(std::move(sink),
                       std::make_unique<ResourceSampler>(std::make_unique<ProcfsProcessTable>(), getpid()),
                       timings) {}

EngineSupervisor::EngineSupervisor(std::shared_ptr<LogSink> sink,
                                   std::unique_ptr<ResourceSampler> sampler,
                                   SupervisorTimings timings)
    : sink_(std::move(sink)), sampler_(std::move(sampler)), timings_(timings) {}

EngineSupervisor::~EngineSupervisor() {
    EngineResult result = terminate();
    if (!result.success) {
        spdlog::error("Engine teardown failed: {}", result.error);
    }
    {
        std::lock_guard<std::mutex> lock(notify_mutex_);
        if (notify_thread_.joinable()) notify_thread_.join();
    }
    if (stager_) stager_->cleanup();
}

void EngineSupervisor::set_active_scripts(std::vector<std::string> scripts) {
    std::lock_guard<std::mutex> lock(scripts_mutex_);
    active_scripts_ = std::move(scripts);
}

void EngineSupervisor::clear_active_scripts() {
    std::lock_guard<std::mutex> lock(scripts_mutex_);
    active_scripts_.clear();
}

// Returns the crash entry to write once child_mutex_ is released, or "" when
// the exit was requested
std::string EngineSupervisor::settle_exit_locked(const ChildProcess& child, const ExitStatus& status) {
    clear_active_scripts();
    if (stop_requested_.load()) {
        spdlog::info("Proxy engine (PID {}) exited ({})", child.pid(), status.describe());
        return "";
    }
    return "CRASH: Proxy engine (PID " + std::to_string(child.pid()) +
           ") exited unexpectedly with " + status.describe() +
           ". Check engine.log for details.";
}

void EngineSupervisor::report_crash(const std::string& msg) {
    if (msg.empty()) return;
    spdlog::error("{}", msg);
    if (sink_) sink_->write("crash", msg);
}

EngineResult EngineSupervisor::cancel_start(ChildProcess* child) {
    spdlog::warn("Proxy engine startup cancelled");
    if (child) {
        terminate_process_tree(*child);
        child->wait();
    }
    clear_active_scripts();
    stop_forwarders();
    last_port_.store(-1);
    return EngineResult::fail(EngineErrc::StartupCancelled, "Engine startup was cancelled");
}

EngineResult EngineSupervisor::start(const EngineLaunchOptions& options) {
    // Any stop/terminate issued after this point cancels the start, even one
    // still queued on the lifecycle lock
    const uint64_t epoch = cancel_epoch_.load();
    auto cancelled = [this, epoch]() { return cancel_epoch_.load() != epoch; };

    std::unique_lock<std::mutex> lifecycle(lifecycle_mutex_, std::defer_lock);
    try {
        lifecycle.lock();
    } catch (const std::system_error& e) {
        return EngineResult::fail(EngineErrc::LockPoisoned, std::string("Lock poisoned: ") + e.what());
    }

    std::string crash;
    {
        std::lock_guard<std::mutex> lock(child_mutex_);
        if (child_) {
            auto status = child_->try_wait();
            if (!status) {
                return EngineResult::fail(EngineErrc::AlreadyRunning, "Proxy is already running");
            }
            // Exited before anyone looked; settle it like the watcher would
            auto dead = std::move(child_);
            crash = settle_exit_locked(*dead, *status);
        }
    }
    report_crash(crash);

    // Leftovers of the previous run
    stop_watcher();
    stop_forwarders();

    auto engine = resolve_engine_path(options.paths, options.engine_path);
    if (!engine.found) {
        spdlog::error("{}", engine.error);
        return EngineResult::fail(EngineErrc::EngineNotFound, engine.error);
    }

    std::string entry_addon = find_addon(options.paths, "entry.py");
    if (entry_addon.empty()) {
        return EngineResult::fail(EngineErrc::EngineNotFound, "entry.py not found");
    }
    std::string anchor_addon = find_addon(options.paths, "anchor.py");
    std::string injector = find_addon(options.paths, "injector.py");
    std::string python = resolve_python_path(options.paths, engine.path);

    stager_ = std::make_unique<ScriptStager>(options.staging_dir);
    auto staged = stager_->stage(options.user_scripts, injector, python, cancelled);
    if (staged.cancelled || cancelled()) {
        return cancel_start(nullptr);
    }
    if (!staged.success) {
        return EngineResult::fail(EngineErrc::ScriptStagingFailed, staged.error);
    }

    EngineCommand cmd = build_engine_command(engine.path, entry_addon, anchor_addon,
                                             staged.staged, options);

    SpawnOptions spawn_opts;
    spawn_opts.args = cmd.args;
    spawn_opts.env = cmd.env;

    spdlog::info("Proxy engine spawning at: {}", engine.path);
    auto child = std::make_unique<ChildProcess>();
    std::string err;
    if (!child->spawn(cmd.binary, spawn_opts, err)) {
        spdlog::error("Failed to spawn proxy engine: {}", err);
        return EngineResult::fail(EngineErrc::SpawnFailed, err);
    }
    spdlog::info("Proxy engine spawned with PID: {}", child->pid());

    forwarders_.push_back(std::make_unique<LogForwarder>(child->take_stdout(), sink_));
    forwarders_.push_back(std::make_unique<LogForwarder>(child->take_stderr(), sink_));

    stop_requested_.store(false);
    set_active_scripts(options.user_scripts);
    last_port_.store(options.port);

    if (cancelled()) {
        return cancel_start(child.get());
    }

    // Readiness: the port accepting connections is the only signal
    const int port = options.port;
    auto started = std::chrono::steady_clock::now();
    auto last_log = started;
    bool slow_warned = false;
    spdlog::info("Waiting for proxy port {} to be ready...", port);

    while (true) {
        auto now = std::chrono::steady_clock::now();
        if (now - started >= timings_.startup_timeout) break;

        if (tcp_port_open(port)) {
            auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now - started).count();
            spdlog::info("Proxy port {} is ready (took {}ms)", port, ms);

            {
                std::lock_guard<std::mutex> lock(child_mutex_);
                child_ = std::move(child);
            }
            start_watcher();
            return EngineResult::ok();
        }

        // Checked after the port so a ready-then-exited engine still counts as started
        if (auto status = child->try_wait()) {
            std::string msg = "Engine crashed during startup with " + status->describe();
            spdlog::error("{}", msg);
            clear_active_scripts();
            stop_forwarders();
            last_port_.store(-1);
            return EngineResult::fail(EngineErrc::CrashDuringStartup, msg);
        }

        if (cancelled()) {
            return cancel_start(child.get());
        }

        if (now - last_log >= timings_.progress_log_interval) {
            auto elapsed = std::chrono::duration_cast<std::chrono::seconds>(now - started).count();
            spdlog::info("Still waiting for proxy engine... ({}s elapsed)", elapsed);
            if (elapsed >= 10 && !slow_warned) {
                spdlog::warn("Startup is taking longer than usual. The OS or an antivirus "
                             "might be scanning the engine. Please wait...");
                slow_warned = true;
            }
            last_log = now;
        }

        std::this_thread::sleep_for(timings_.readiness_poll_interval);
    }

    // Timed out: never leave a live engine nobody can reach
    terminate_process_tree(*child);
    child->wait();
    clear_active_scripts();
    stop_forwarders();
    last_port_.store(-1);

    auto secs = std::chrono::duration_cast<std::chrono::seconds>(timings_.startup_timeout).count();
    std::string msg = "Timeout waiting for proxy engine to start (" + std::to_string(secs) +
                      "s). Check if something is blocking port " + std::to_string(port) +
                      " or if antivirus is interfering.";
    spdlog::error("{}", msg);
    return EngineResult::fail(EngineErrc::StartupTimeout, msg);
}

EngineResult EngineSupervisor::stop() {
    return shutdown(true);
}

EngineResult EngineSupervisor::terminate() {
    return shutdown(false);
}

EngineResult EngineSupervisor::shutdown(bool graceful) {
    // Both before taking the lock: an in-flight start sees the new epoch and
    // gives up, and the exit we cause is not logged as a crash
    cancel_epoch_.fetch_add(1);
    stop_requested_.store(true);

    std::unique_lock<std::mutex> lifecycle(lifecycle_mutex_, std::defer_lock);
    try {
        lifecycle.lock();
    } catch (const std::system_error& e) {
        return EngineResult::fail(EngineErrc::LockPoisoned, std::string("Lock poisoned: ") + e.what());
    }

    std::unique_ptr<ChildProcess> child;
    {
        std::lock_guard<std::mutex> lock(child_mutex_);
        child = std::move(child_);
    }

    if (child) {
        terminate_process_tree(*child);
        ExitStatus status = child->wait();
        spdlog::info("Proxy engine (PID {}) stopped ({})", child->pid(), status.describe());
    }

    stop_watcher();
    stop_forwarders();

    if (graceful) {
        int port = last_port_.load();
        if (port > 0 && !wait_for_port_release(port)) {
            spdlog::warn("Proxy port {} still accepting connections after stop", port);
        }
    }
    last_port_.store(-1);

    clear_active_scripts();

    if (graceful && stager_) {
        stager_->cleanup();
    }
    return EngineResult::ok();
}

bool EngineSupervisor::wait_for_port_release(int port) {
    auto started = std::chrono::steady_clock::now();
    while (std::chrono::steady_clock::now() - started < timings_.port_release_timeout) {
        // A refused connection means the port is free
        if (!tcp_port_open(port, 100)) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }
    return false;
}

ProxyStatus EngineSupervisor::get_status() {
    ProxyStatus status;
    status.active = active_.load();

    std::string crash;
    {
        std::lock_guard<std::mutex> lock(child_mutex_);
        if (child_) {
            if (auto exited = child_->try_wait()) {
                auto dead = std::move(child_);
                crash = settle_exit_locked(*dead, *exited);
            } else {
                status.running = true;
            }
        }

        if (status.running) {
            std::lock_guard<std::mutex> scripts_lock(scripts_mutex_);
            status.active_scripts = active_scripts_;
        }
    }
    report_crash(crash);
    return status;
}

EngineResult EngineSupervisor::set_active(bool active) {
    active_.store(active);

    int port = last_port_.load();
    if (port <= 0 || engine_pid() < 0) return EngineResult::ok();

    std::lock_guard<std::mutex> lock(notify_mutex_);
    if (notify_thread_.joinable()) {
        notify_thread_.join();
    }
    notify_thread_ = std::thread([port, active]() {
        EngineClient client("127.0.0.1", port);
        std::string err;
        if (!client.set_traffic_active(active, err)) {
            spdlog::warn("Failed to push traffic state ({}) to engine: {}", active, err);
        }
    });
    return EngineResult::ok();
}

EngineStats EngineSupervisor::get_stats() {
    return sampler_->sample();
}

pid_t EngineSupervisor::engine_pid() {
    std::lock_guard<std::mutex> lock(child_mutex_);
    return child_ ? child_->pid() : -1;
}

// ── Crash watcher ───────────────────────────────────────────

void EngineSupervisor::start_watcher() {
    watcher_shutdown_.store(false);
    watcher_thread_ = std::thread(&EngineSupervisor::crash_watch_loop, this);
}

void EngineSupervisor::stop_watcher() {
    watcher_shutdown_.store(true);
    if (watcher_thread_.joinable()) {
        watcher_thread_.join();
    }
}

void EngineSupervisor::crash_watch_loop() {
    const auto step = std::chrono::milliseconds(100);
    while (true) {
        for (auto waited = std::chrono::milliseconds(0);
             waited < timings_.crash_poll_interval && !watcher_shutdown_.load();
             waited += step) {
            std::this_thread::sleep_for(step);
        }
        if (watcher_shutdown_.load()) break;

        std::unique_lock<std::mutex> lock(child_mutex_, std::defer_lock);
        try {
            lock.lock();
        } catch (const std::system_error& e) {
            if (sink_) sink_->write("crash", std::string("Error watching proxy process: ") + e.what());
            break;
        }

        // Already settled by stop/terminate/status
        if (!child_) break;

        auto status = child_->try_wait();
        if (!status) continue;

        auto dead = std::move(child_);
        std::string crash = settle_exit_locked(*dead, *status);
        lock.unlock();
        report_crash(crash);
        break;
    }
}

void EngineSupervisor::stop_forwarders() {
    for (auto& forwarder : forwarders_) {
        forwarder->stop();
    }
    forwarders_.clear();
}
