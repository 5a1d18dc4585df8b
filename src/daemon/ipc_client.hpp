#pragma once

#include <nlohmann/json_fwd.hpp>
#include <cstdint>
#include <string>
#include <vector>

class DaemonClient {
public:
    /// Check if the daemon is running (socket exists and responds)
    bool is_daemon_running();

    struct DaemonStatus {
        bool engine_running = false;
        bool active = false;
        int engine_pid = -1;
        std::vector<std::string> active_scripts;
    };

    /// Get daemon status
    DaemonStatus get_status();

    struct Stats {
        uint64_t memory_usage = 0;
        double cpu_usage = 0.0;
        uint64_t up_time = 0;
        uint64_t rx_speed = 0;
        uint64_t tx_speed = 0;
    };

    bool get_stats(Stats& out, std::string& err);

    /// Request engine start/stop; the start request blocks until ready
    bool engine_start(std::string& err);
    bool engine_stop(std::string& err);

    bool set_active(bool active, std::string& err);

    /// Last `lines` lines of a named log held by the daemon
    bool tail_log(const std::string& name, int lines,
                  std::vector<std::string>& out, std::string& err);

private:
    /// Send a JSON command and receive response
    /// Returns empty json on connection failure
    nlohmann::json send_command(const nlohmann::json& cmd, int timeout_sec = 30);

    /// ok → true; otherwise fills err from the reply
    bool simple_command(const nlohmann::json& cmd, std::string& err, int timeout_sec = 30);
};
