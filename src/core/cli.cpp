#include "core/cli.hpp"
#include "core/config.hpp"
#include "core/logging.hpp"
#include "daemon/ipc_client.hpp"

#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <sstream>
#include <vector>

#ifndef APP_VERSION
#define APP_VERSION "unknown"
#endif

namespace {

int daemon_unreachable() {
    std::cerr << "Daemon is not running. Start it with 'relaycraft daemon'.\n";
    return 1;
}

} // namespace

// ── Subcommand dispatch ─────────────────────────────────────

int CLI::run(int argc, char* argv[]) {
    if (argc < 2) return cmd_help();

    const char* cmd = argv[1];

    if (std::strcmp(cmd, "help") == 0 || std::strcmp(cmd, "--help") == 0 || std::strcmp(cmd, "-h") == 0) {
        return cmd_help();
    }
    if (std::strcmp(cmd, "version") == 0 || std::strcmp(cmd, "--version") == 0 || std::strcmp(cmd, "-v") == 0) {
        return cmd_version();
    }
    if (std::strcmp(cmd, "daemon") == 0 || std::strcmp(cmd, "--daemon") == 0) {
        return -2;  // special: caller handles daemon mode
    }
    if (std::strcmp(cmd, "status") == 0) {
        return cmd_status();
    }
    if (std::strcmp(cmd, "start") == 0) {
        return cmd_start();
    }
    if (std::strcmp(cmd, "stop") == 0) {
        return cmd_stop();
    }
    if (std::strcmp(cmd, "active") == 0) {
        return cmd_active(argc, argv);
    }
    if (std::strcmp(cmd, "stats") == 0) {
        return cmd_stats();
    }
    if (std::strcmp(cmd, "logs") == 0) {
        return cmd_logs(argc, argv);
    }
    if (std::strcmp(cmd, "config") == 0) {
        return cmd_config(argc, argv);
    }

    std::cerr << "Unknown command: " << cmd << "\n";
    std::cerr << "Run 'relaycraft help' for usage.\n";
    return 1;
}

// ── help ────────────────────────────────────────────────────

int CLI::cmd_help() {
    std::cout <<
        "relaycraft: proxy engine supervisor\n"
        "\n"
        "Usage:\n"
        "  relaycraft daemon            Run the supervisor daemon\n"
        "  relaycraft start             Start the proxy engine\n"
        "  relaycraft stop              Stop the proxy engine\n"
        "  relaycraft status            Show engine status\n"
        "  relaycraft active on|off     Toggle traffic processing\n"
        "  relaycraft stats             Show CPU/memory/network usage\n"
        "  relaycraft logs <name> [n]   Show the last n lines of a log\n"
        "                               (proxy, app, audit, script, plugin, crash)\n"
        "  relaycraft config            Show settings\n"
        "  relaycraft config set <key> <value>\n"
        "                               Change a setting (port, ssl_insecure, upstream,\n"
        "                               engine, resource_dir, dev_mode, verbose, scripts)\n"
        "  relaycraft version           Show version\n"
        "  relaycraft help              Show this help\n"
        "\n"
        "Settings: " << Config::config_path() << "\n";
    return 0;
}

// ── version ─────────────────────────────────────────────────

int CLI::cmd_version() {
    std::cout << "relaycraft " << APP_VERSION << "\n";
    return 0;
}

// ── status ──────────────────────────────────────────────────

int CLI::cmd_status() {
    DaemonClient dc;
    bool daemon_running = dc.is_daemon_running();
    std::cout << "Daemon:  " << (daemon_running ? "running" : "stopped") << "\n";
    if (!daemon_running) return 0;

    auto st = dc.get_status();
    std::cout << "Engine:  " << (st.engine_running ? "running (pid " + std::to_string(st.engine_pid) + ")" : "stopped") << "\n";
    std::cout << "Traffic: " << (st.active ? "active" : "paused") << "\n";
    if (!st.active_scripts.empty()) {
        std::cout << "Scripts:\n";
        for (const auto& s : st.active_scripts) {
            std::cout << "  " << s << "\n";
        }
    }
    return 0;
}

// ── start / stop ────────────────────────────────────────────

int CLI::cmd_start() {
    DaemonClient dc;
    if (!dc.is_daemon_running()) return daemon_unreachable();

    std::cout << "Starting proxy engine...\n";
    std::string err;
    if (!dc.engine_start(err)) {
        std::cerr << "Failed to start engine: " << err << "\n";
        return 1;
    }
    std::cout << "Proxy engine is ready.\n";
    return 0;
}

int CLI::cmd_stop() {
    DaemonClient dc;
    if (!dc.is_daemon_running()) return daemon_unreachable();

    std::string err;
    if (!dc.engine_stop(err)) {
        std::cerr << "Failed to stop engine: " << err << "\n";
        return 1;
    }
    std::cout << "Proxy engine stopped.\n";
    return 0;
}

// ── active ──────────────────────────────────────────────────

int CLI::cmd_active(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: relaycraft active <on|off>\n";
        return 1;
    }

    bool active;
    if (std::strcmp(argv[2], "on") == 0) {
        active = true;
    } else if (std::strcmp(argv[2], "off") == 0) {
        active = false;
    } else {
        std::cerr << "Usage: relaycraft active <on|off>\n";
        return 1;
    }

    DaemonClient dc;
    if (!dc.is_daemon_running()) return daemon_unreachable();

    std::string err;
    if (!dc.set_active(active, err)) {
        std::cerr << "Failed to set traffic state: " << err << "\n";
        return 1;
    }
    std::cout << "Traffic processing " << (active ? "enabled" : "paused") << ".\n";
    return 0;
}

// ── stats ───────────────────────────────────────────────────

std::string CLI::format_bytes(uint64_t bytes) {
    static const char* units[] = {"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    int unit = 0;
    while (value >= 1024.0 && unit < 4) {
        value /= 1024.0;
        ++unit;
    }
    char buf[32];
    if (unit == 0) {
        std::snprintf(buf, sizeof(buf), "%llu B", static_cast<unsigned long long>(bytes));
    } else {
        std::snprintf(buf, sizeof(buf), "%.1f %s", value, units[unit]);
    }
    return buf;
}

std::string CLI::format_duration(uint64_t seconds) {
    char buf[48];
    uint64_t h = seconds / 3600;
    uint64_t m = (seconds % 3600) / 60;
    uint64_t s = seconds % 60;
    if (h > 0) {
        std::snprintf(buf, sizeof(buf), "%lluh %02llum %02llus",
                      static_cast<unsigned long long>(h),
                      static_cast<unsigned long long>(m),
                      static_cast<unsigned long long>(s));
    } else if (m > 0) {
        std::snprintf(buf, sizeof(buf), "%llum %02llus",
                      static_cast<unsigned long long>(m),
                      static_cast<unsigned long long>(s));
    } else {
        std::snprintf(buf, sizeof(buf), "%llus", static_cast<unsigned long long>(s));
    }
    return buf;
}

int CLI::cmd_stats() {
    DaemonClient dc;
    if (!dc.is_daemon_running()) return daemon_unreachable();

    DaemonClient::Stats stats;
    std::string err;
    if (!dc.get_stats(stats, err)) {
        std::cerr << "Failed to read stats: " << err << "\n";
        return 1;
    }

    char cpu[16];
    std::snprintf(cpu, sizeof(cpu), "%.1f%%", stats.cpu_usage);
    std::cout << "Memory:  " << format_bytes(stats.memory_usage) << "\n";
    std::cout << "CPU:     " << cpu << "\n";
    std::cout << "Uptime:  " << format_duration(stats.up_time) << "\n";
    std::cout << "Down:    " << format_bytes(stats.rx_speed) << "/s\n";
    std::cout << "Up:      " << format_bytes(stats.tx_speed) << "/s\n";
    return 0;
}

// ── logs ────────────────────────────────────────────────────

int CLI::cmd_logs(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: relaycraft logs <proxy|app|audit|script|plugin|crash> [lines]\n";
        return 1;
    }

    std::string name = argv[2];
    int lines = 100;
    if (argc >= 4) {
        lines = std::atoi(argv[3]);
        if (lines <= 0) {
            std::cerr << "Invalid line count: " << argv[3] << "\n";
            return 1;
        }
    }

    DaemonClient dc;
    std::vector<std::string> out;
    std::string err;
    bool ok = false;

    if (dc.is_daemon_running()) {
        ok = dc.tail_log(name, lines, out, err);
    } else {
        // Log files are plain files; read them directly
        auto tail = tail_domain_log(Config::logs_dir(), name, static_cast<size_t>(lines));
        ok = tail.success;
        err = tail.error;
        out = std::move(tail.lines);
    }

    if (!ok) {
        std::cerr << err << "\n";
        return 1;
    }
    for (const auto& line : out) {
        std::cout << line << "\n";
    }
    return 0;
}

// ── config ──────────────────────────────────────────────────

namespace {

bool parse_bool(const std::string& value, bool& out) {
    if (value == "true" || value == "on" || value == "1") {
        out = true;
        return true;
    }
    if (value == "false" || value == "off" || value == "0") {
        out = false;
        return true;
    }
    return false;
}

} // namespace

bool CLI::apply_setting(AppConfig& cfg, const std::string& key,
                        const std::string& value, std::string& err) {
    if (key == "port") {
        char* end = nullptr;
        long port = std::strtol(value.c_str(), &end, 10);
        if (value.empty() || *end != '\0' || port < 1 || port > 65535) {
            err = "Invalid port: " + value;
            return false;
        }
        cfg.proxy_port = static_cast<int>(port);
        return true;
    }
    if (key == "ssl_insecure" || key == "dev_mode" || key == "verbose") {
        bool flag;
        if (!parse_bool(value, flag)) {
            err = "Expected on/off for " + key + ": " + value;
            return false;
        }
        if (key == "ssl_insecure") cfg.ssl_insecure = flag;
        else if (key == "dev_mode") cfg.dev_mode = flag;
        else cfg.verbose_logging = flag;
        return true;
    }
    if (key == "upstream") {
        // "off" disables; anything else is the upstream URL
        if (value == "off" || value.empty()) {
            cfg.upstream_proxy.enabled = false;
        } else {
            cfg.upstream_proxy.enabled = true;
            cfg.upstream_proxy.url = value;
        }
        return true;
    }
    if (key == "engine") {
        cfg.engine_binary_path = Config::expand_home(value);
        return true;
    }
    if (key == "resource_dir") {
        cfg.resource_dir = Config::expand_home(value);
        return true;
    }
    if (key == "scripts") {
        // Comma-separated, in load order; empty clears the list
        cfg.enabled_scripts.clear();
        std::stringstream ss(value);
        std::string item;
        while (std::getline(ss, item, ',')) {
            if (!item.empty()) cfg.enabled_scripts.push_back(Config::expand_home(item));
        }
        return true;
    }
    err = "Unknown setting: " + key;
    return false;
}

int CLI::cmd_config(int argc, char* argv[]) {
    Config config;
    bool loaded = config.load();
    if (!loaded && std::filesystem::exists(Config::config_path())) {
        std::cerr << "Cannot parse " << Config::config_path() << "; fix or remove it first.\n";
        return 1;
    }

    if (argc < 3) {
        const auto& c = config.data();
        std::cout << "port:          " << c.proxy_port << "\n";
        std::cout << "ssl_insecure:  " << (c.ssl_insecure ? "on" : "off") << "\n";
        std::cout << "upstream:      " << (c.upstream_proxy.enabled ? c.upstream_proxy.url : "off") << "\n";
        std::cout << "engine:        " << (c.engine_binary_path.empty() ? "(auto)" : c.engine_binary_path) << "\n";
        std::cout << "resource_dir:  " << (c.resource_dir.empty() ? "(auto)" : c.resource_dir) << "\n";
        std::cout << "dev_mode:      " << (c.dev_mode ? "on" : "off") << "\n";
        std::cout << "verbose:       " << (c.verbose_logging ? "on" : "off") << "\n";
        std::cout << "scripts:\n";
        for (const auto& s : c.enabled_scripts) {
            std::cout << "  " << s << "\n";
        }
        return 0;
    }

    if (std::strcmp(argv[2], "set") != 0 || argc < 5) {
        std::cerr << "Usage: relaycraft config [set <key> <value>]\n";
        return 1;
    }

    std::string err;
    if (!apply_setting(config.data(), argv[3], argv[4], err)) {
        std::cerr << err << "\n";
        return 1;
    }
    if (!config.save()) {
        std::cerr << "Could not write " << Config::config_path() << "\n";
        return 1;
    }
    std::cout << argv[3] << " updated. Restart the engine to apply.\n";
    return 0;
}
