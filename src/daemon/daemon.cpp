#include "daemon/daemon.hpp"
#include "core/logging.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <sys/stat.h>
#include <unistd.h>
#include <poll.h>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

json error_reply(const EngineResult& result) {
    return json({{"ok", false}, {"error", result.error}, {"code", to_string(result.code)}});
}

json result_reply(const EngineResult& result) {
    if (result.success) return json({{"ok", true}});
    return error_reply(result);
}

} // namespace

Daemon::Daemon(Config& config, SupervisorTimings timings)
    : config_(config),
      sink_(std::make_shared<FileLogSink>(Config::logs_dir())),
      supervisor_(std::make_unique<EngineSupervisor>(sink_, timings)) {}

Daemon::~Daemon() {
    request_stop();
    join_workers();
    cleanup_socket();
}

void Daemon::cleanup_socket() {
    if (socket_fd_ >= 0) {
        close(socket_fd_);
        socket_fd_ = -1;
    }
    std::string path = Config::socket_path();
    if (!path.empty()) {
        unlink(path.c_str());
    }
}

bool Daemon::start_ipc_server() {
    std::string path = Config::socket_path();
    if (path.empty()) return false;

    // Clean up any existing socket
    unlink(path.c_str());

    std::error_code ec;
    fs::create_directories(fs::path(path).parent_path(), ec);
    if (ec) {
        spdlog::error("Cannot create {}: {}", fs::path(path).parent_path().string(), ec.message());
        return false;
    }

    socket_fd_ = socket(AF_UNIX, SOCK_STREAM, 0);
    if (socket_fd_ < 0) return false;

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (bind(socket_fd_, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        spdlog::error("Cannot bind {}: {}", path, std::strerror(errno));
        close(socket_fd_);
        socket_fd_ = -1;
        return false;
    }

    // Restrict permissions to owner only
    chmod(path.c_str(), 0600);

    if (listen(socket_fd_, 5) < 0) {
        close(socket_fd_);
        socket_fd_ = -1;
        unlink(path.c_str());
        return false;
    }

    spdlog::info("Listening on {}", path);
    return true;
}

void Daemon::ipc_loop() {
    struct pollfd pfd;
    pfd.fd = socket_fd_;
    pfd.events = POLLIN;

    while (!stop_flag_.load()) {
        reap_workers();

        int ret = poll(&pfd, 1, 500); // 500ms timeout
        if (ret <= 0) continue;

        if (pfd.revents & POLLIN) {
            int client_fd = accept(socket_fd_, nullptr, nullptr);
            if (client_fd < 0) continue;
            spawn_worker(client_fd);
        }
    }
}

void Daemon::spawn_worker(int client_fd) {
    auto done = std::make_shared<std::atomic<bool>>(false);
    try {
        std::thread thread([this, client_fd, done]() {
            serve_client(client_fd);
            done->store(true);
        });
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers_.push_back(Worker{std::move(thread), done});
    } catch (const std::system_error& e) {
        spdlog::error("Cannot start connection thread: {}", e.what());
        std::string reply = json({{"ok", false}, {"error", std::string("Daemon busy: ") + e.what()}}).dump() + "\n";
        if (write(client_fd, reply.data(), reply.size()) < 0) {
            spdlog::debug("Busy reply not delivered: {}", std::strerror(errno));
        }
        close(client_fd);
    }
}

void Daemon::reap_workers() {
    std::vector<std::thread> finished;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        for (auto it = workers_.begin(); it != workers_.end();) {
            if (it->done->load()) {
                finished.push_back(std::move(it->thread));
                it = workers_.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& t : finished) {
        if (t.joinable()) t.join();
    }
}

size_t Daemon::worker_count() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

void Daemon::serve_client(int client_fd) {
    // Read a single JSON line
    std::string buffer;
    char c;
    while (read(client_fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 65536) break; // prevent abuse
    }

    if (!buffer.empty()) {
        std::string response = handle_command(buffer);
        response += "\n";
        ssize_t total = 0;
        while (total < (ssize_t)response.size()) {
            ssize_t n = write(client_fd, response.data() + total,
                              response.size() - total);
            if (n <= 0) break;
            total += n;
        }
    }

    close(client_fd);
}

void Daemon::join_workers() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& w : workers) {
        if (w.thread.joinable()) w.thread.join();
    }
}

std::string Daemon::handle_command(const std::string& json_line) {
    try {
        auto req = json::parse(json_line);
        std::string cmd = req.value("cmd", "");

        if (cmd == "status") {
            auto st = supervisor_->get_status();
            json data;
            data["running"] = st.running;
            data["active"] = st.active;
            data["active_scripts"] = st.active_scripts;
            data["pid"] = supervisor_->engine_pid();
            return json({{"ok", true}, {"data", data}}).dump();
        }

        if (cmd == "start") {
            auto options = EngineLaunchOptions::from_config(config_.data());
            // Per-request overrides
            if (req.contains("port")) options.port = req["port"].get<int>();
            if (req.contains("scripts")) {
                options.user_scripts = req["scripts"].get<std::vector<std::string>>();
            }
            return result_reply(supervisor_->start(options)).dump();
        }

        if (cmd == "stop") {
            return result_reply(supervisor_->stop()).dump();
        }

        if (cmd == "terminate") {
            return result_reply(supervisor_->terminate()).dump();
        }

        if (cmd == "set_active") {
            if (!req.contains("active") || !req["active"].is_boolean()) {
                return json({{"ok", false}, {"error", "Missing boolean 'active'"}}).dump();
            }
            return result_reply(supervisor_->set_active(req["active"].get<bool>())).dump();
        }

        if (cmd == "stats") {
            auto stats = supervisor_->get_stats();
            json data = {
                {"memory_usage", stats.memory_usage},
                {"cpu_usage", stats.cpu_usage},
                {"up_time", stats.up_time},
                {"rx_speed", stats.rx_speed},
                {"tx_speed", stats.tx_speed}
            };
            return json({{"ok", true}, {"data", data}}).dump();
        }

        if (cmd == "logs") {
            std::string name = req.value("name", "proxy");
            int lines = req.value("lines", 100);
            if (lines <= 0) lines = 100;
            auto tail = tail_domain_log(Config::logs_dir(), name, static_cast<size_t>(lines));
            if (!tail.success) {
                return json({{"ok", false}, {"error", tail.error}}).dump();
            }
            return json({{"ok", true}, {"data", tail.lines}}).dump();
        }

        return json({{"ok", false}, {"error", "Unknown command: " + cmd}}).dump();

    } catch (const std::exception& e) {
        return json({{"ok", false}, {"error", std::string("Parse error: ") + e.what()}}).dump();
    }
}

void Daemon::request_stop() {
    stop_flag_.store(true);
}

int Daemon::run() {
    // 1. Start IPC server
    if (!start_ipc_server()) {
        return 1;
    }

    // 2. IPC main loop
    ipc_loop();

    // 3. Cleanup: the engine never outlives the daemon
    stop_flag_.store(true);
    auto result = supervisor_->terminate();
    if (!result.success) {
        spdlog::error("Failed to terminate engine: {}", result.error);
    }
    join_workers();
    cleanup_socket();

    return 0;
}
