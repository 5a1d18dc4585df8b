#include "core/config.hpp"

#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <fstream>
#include <cstdlib>

namespace fs = std::filesystem;

std::string Config::expand_home(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::string(home) + path.substr(1);
        }
    }
    return path;
}

Config::Config() = default;

Config::~Config() = default;

std::string Config::exe_dir() {
    std::error_code ec;
    // Linux: /proc/self/exe is a symlink to the running binary
    auto self = fs::canonical("/proc/self/exe", ec);
    if (ec) return "";
    return self.parent_path().string();
}

std::string Config::root_dir() {
    if (const char* env = std::getenv("RELAYCRAFT_HOME")) {
        if (env[0] != '\0') return env;
    }

    // Portable mode: a "portable" marker beside the executable
    std::string dir = exe_dir();
    if (!dir.empty() && fs::exists(fs::path(dir) / "portable")) {
        return dir;
    }

    const char* home = std::getenv("HOME");
    if (!home) return "";
    return std::string(home) + "/.config/relaycraft";
}

std::string Config::config_dir() {
    std::string root = root_dir();
    if (root.empty()) return "";
    return root + "/config";
}

std::string Config::config_path() {
    std::string dir = config_dir();
    if (dir.empty()) return "";
    return dir + "/config.yaml";
}

std::string Config::data_dir() {
    std::string root = root_dir();
    if (root.empty()) return "";
    return root + "/data";
}

std::string Config::rules_dir() {
    std::string dir = data_dir();
    if (dir.empty()) return "";
    return dir + "/rules";
}

std::string Config::cert_dir() {
    std::string root = root_dir();
    if (root.empty()) return "";
    return root + "/certs";
}

std::string Config::logs_dir() {
    std::string root = root_dir();
    if (root.empty()) return "";
    return root + "/logs";
}

std::string Config::socket_path() {
    std::string root = root_dir();
    if (root.empty()) return "";
    return root + "/relaycraft.sock";
}

bool Config::load() {
    std::string path = config_path();
    if (path.empty() || !fs::exists(path)) {
        return false;
    }

    try {
        YAML::Node root = YAML::LoadFile(path);

        if (auto proxy = root["proxy"]) {
            config_.proxy_port = proxy["port"].as<int>(config_.proxy_port);
            config_.ssl_insecure = proxy["ssl_insecure"].as<bool>(config_.ssl_insecure);
            if (auto upstream = proxy["upstream"]) {
                config_.upstream_proxy.enabled =
                    upstream["enabled"].as<bool>(config_.upstream_proxy.enabled);
                config_.upstream_proxy.url =
                    upstream["url"].as<std::string>(config_.upstream_proxy.url);
            }
        }

        if (auto engine = root["engine"]) {
            config_.engine_binary_path = expand_home(
                engine["binary_path"].as<std::string>(config_.engine_binary_path));
            config_.resource_dir = expand_home(
                engine["resource_dir"].as<std::string>(config_.resource_dir));
            config_.dev_mode = engine["dev_mode"].as<bool>(config_.dev_mode);
        }

        if (auto scripts = root["scripts"]) {
            if (auto enabled = scripts["enabled"]) {
                config_.enabled_scripts.clear();
                for (const auto& item : enabled) {
                    std::string p = expand_home(item.as<std::string>(""));
                    if (!p.empty()) config_.enabled_scripts.push_back(std::move(p));
                }
            }
        }

        if (auto logging = root["logging"]) {
            config_.verbose_logging = logging["verbose"].as<bool>(config_.verbose_logging);
        }

        // Port outside the TCP range: fall back to default
        if (config_.proxy_port <= 0 || config_.proxy_port > 65535) {
            config_.proxy_port = 9090;
        }

        return true;
    } catch (const YAML::Exception&) {
        // Parse failed, use defaults
        return false;
    }
}

bool Config::save() {
    std::string dir = config_dir();
    std::string path = config_path();
    if (dir.empty() || path.empty()) return false;

    try {
        fs::create_directories(dir);

        YAML::Emitter out;
        out << YAML::BeginMap;

        out << YAML::Key << "proxy" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "port" << YAML::Value << config_.proxy_port;
        out << YAML::Key << "ssl_insecure" << YAML::Value << config_.ssl_insecure;
        out << YAML::Key << "upstream" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << config_.upstream_proxy.enabled;
        out << YAML::Key << "url" << YAML::Value << config_.upstream_proxy.url;
        out << YAML::EndMap;
        out << YAML::EndMap;

        out << YAML::Key << "engine" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "binary_path" << YAML::Value << config_.engine_binary_path;
        out << YAML::Key << "resource_dir" << YAML::Value << config_.resource_dir;
        out << YAML::Key << "dev_mode" << YAML::Value << config_.dev_mode;
        out << YAML::EndMap;

        out << YAML::Key << "scripts" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "enabled" << YAML::Value << YAML::BeginSeq;
        for (const auto& script : config_.enabled_scripts) {
            out << script;
        }
        out << YAML::EndSeq;
        out << YAML::EndMap;

        out << YAML::Key << "logging" << YAML::Value << YAML::BeginMap;
        out << YAML::Key << "verbose" << YAML::Value << config_.verbose_logging;
        out << YAML::EndMap;

        out << YAML::EndMap;

        std::ofstream fout(path);
        if (!fout.is_open()) return false;
        fout << out.c_str();
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

AppConfig& Config::data() { return config_; }
const AppConfig& Config::data() const { return config_; }
