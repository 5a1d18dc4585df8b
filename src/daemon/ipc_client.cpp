#include "daemon/ipc_client.hpp"
#include "core/config.hpp"

#include <nlohmann/json.hpp>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>
#include <cstring>

using json = nlohmann::json;

json DaemonClient::send_command(const json& cmd, int timeout_sec) {
    std::string path = Config::socket_path();
    if (path.empty()) return json();

    int fd = socket(AF_UNIX, SOCK_STREAM, 0);
    if (fd < 0) return json();

    struct sockaddr_un addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sun_family = AF_UNIX;
    std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

    if (connect(fd, (struct sockaddr*)&addr, sizeof(addr)) < 0) {
        close(fd);
        return json();
    }

    // Set read timeout
    struct timeval tv;
    tv.tv_sec = timeout_sec;
    tv.tv_usec = 0;
    setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv));

    // Send command
    std::string msg = cmd.dump() + "\n";
    ssize_t total = 0;
    while (total < (ssize_t)msg.size()) {
        ssize_t n = write(fd, msg.data() + total, msg.size() - total);
        if (n <= 0) {
            close(fd);
            return json();
        }
        total += n;
    }

    // Read response
    std::string buffer;
    char c;
    while (read(fd, &c, 1) == 1) {
        if (c == '\n') break;
        buffer += c;
        if (buffer.size() > 1024 * 1024) break;
    }

    close(fd);

    if (buffer.empty()) return json();

    try {
        return json::parse(buffer);
    } catch (const json::exception&) {
        return json();
    }
}

bool DaemonClient::simple_command(const json& cmd, std::string& err, int timeout_sec) {
    auto resp = send_command(cmd, timeout_sec);
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return false;
    }
    if (resp.value("ok", false)) return true;
    err = resp.value("error", "Unknown error");
    return false;
}

bool DaemonClient::is_daemon_running() {
    auto resp = send_command({{"cmd", "status"}}, 5);
    return !resp.empty() && resp.value("ok", false);
}

DaemonClient::DaemonStatus DaemonClient::get_status() {
    DaemonStatus status;
    auto resp = send_command({{"cmd", "status"}});
    if (resp.empty() || !resp.value("ok", false)) return status;

    try {
        auto& data = resp["data"];
        status.engine_running = data.value("running", false);
        status.active = data.value("active", false);
        status.engine_pid = data.value("pid", -1);
        if (data.contains("active_scripts")) {
            status.active_scripts = data["active_scripts"].get<std::vector<std::string>>();
        }
    } catch (const json::exception&) {}

    return status;
}

bool DaemonClient::get_stats(Stats& out, std::string& err) {
    auto resp = send_command({{"cmd", "stats"}});
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return false;
    }
    if (!resp.value("ok", false)) {
        err = resp.value("error", "Unknown error");
        return false;
    }

    try {
        auto& data = resp["data"];
        out.memory_usage = data.value("memory_usage", uint64_t{0});
        out.cpu_usage = data.value("cpu_usage", 0.0);
        out.up_time = data.value("up_time", uint64_t{0});
        out.rx_speed = data.value("rx_speed", uint64_t{0});
        out.tx_speed = data.value("tx_speed", uint64_t{0});
    } catch (const json::exception& e) {
        err = e.what();
        return false;
    }
    return true;
}

bool DaemonClient::engine_start(std::string& err) {
    // Readiness may take up to two minutes on a cold start
    return simple_command({{"cmd", "start"}}, err, 150);
}

bool DaemonClient::engine_stop(std::string& err) {
    return simple_command({{"cmd", "stop"}}, err);
}

bool DaemonClient::set_active(bool active, std::string& err) {
    return simple_command({{"cmd", "set_active"}, {"active", active}}, err);
}

bool DaemonClient::tail_log(const std::string& name, int lines,
                            std::vector<std::string>& out, std::string& err) {
    auto resp = send_command({{"cmd", "logs"}, {"name", name}, {"lines", lines}});
    if (resp.empty()) {
        err = "Cannot connect to daemon";
        return false;
    }
    if (!resp.value("ok", false)) {
        err = resp.value("error", "Unknown error");
        return false;
    }

    try {
        out = resp["data"].get<std::vector<std::string>>();
    } catch (const json::exception& e) {
        err = e.what();
        return false;
    }
    return true;
}
