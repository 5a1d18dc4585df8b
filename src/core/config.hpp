#pragma once

#include <string>
#include <vector>

struct UpstreamProxyConfig {
    bool enabled = false;
    std::string url;
};

struct AppConfig {
    // Proxy
    int proxy_port = 9090;
    bool ssl_insecure = false;
    UpstreamProxyConfig upstream_proxy;

    // Engine
    std::string engine_binary_path;  // empty = resolve from install layout
    std::string resource_dir;        // empty = next to the executable
    bool dev_mode = false;

    // Scripts (ordered, as handed over by the script store)
    std::vector<std::string> enabled_scripts;

    // Logging
    bool verbose_logging = false;
};

class Config {
public:
    Config();
    ~Config();

    bool load();
    bool save();

    AppConfig& data();
    const AppConfig& data() const;

    /// Application root: $RELAYCRAFT_HOME, portable dir, or ~/.config/relaycraft
    static std::string root_dir();
    static std::string config_dir();
    static std::string config_path();
    static std::string data_dir();
    static std::string rules_dir();
    static std::string cert_dir();
    static std::string logs_dir();
    static std::string socket_path();

    /// Directory holding the running executable (empty if unknown)
    static std::string exe_dir();
    static std::string expand_home(const std::string& path);

private:
    AppConfig config_;
};
