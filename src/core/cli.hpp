#pragma once

#include <cstdint>
#include <string>

struct AppConfig;

class CLI {
public:
    /// Parse argv and dispatch to subcommand.
    /// Returns exit code, or -2 for the daemon subcommand (caller runs it).
    static int run(int argc, char* argv[]);

    /// "12.5 MiB", "512 B"
    static std::string format_bytes(uint64_t bytes);

    /// "1h 02m 03s"
    static std::string format_duration(uint64_t seconds);

    /// Apply one `config set <key> <value>` to `cfg`. False with `err` set
    /// for an unknown key or a bad value.
    static bool apply_setting(AppConfig& cfg, const std::string& key,
                              const std::string& value, std::string& err);

private:
    static int cmd_help();
    static int cmd_version();
    static int cmd_status();
    static int cmd_start();
    static int cmd_stop();
    static int cmd_active(int argc, char* argv[]);
    static int cmd_stats();
    static int cmd_logs(int argc, char* argv[]);
    static int cmd_config(int argc, char* argv[]);
};
