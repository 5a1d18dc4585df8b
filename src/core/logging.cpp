#include "core/logging.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdio>
#include <deque>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

void init_logging(const std::string& logs_dir, bool verbose) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());

    if (!logs_dir.empty()) {
        try {
            fs::create_directories(logs_dir);
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                logs_dir + "/app.log", 5 * 1024 * 1024, 3));
        } catch (const std::exception& e) {
            // Keep the stderr sink; a read-only root must not stop the app
            fprintf(stderr, "relaycraft: file logging disabled: %s\n", e.what());
        }
    }

    auto logger = std::make_shared<spdlog::logger>("relaycraft", sinks.begin(), sinks.end());
    logger->set_level(verbose ? spdlog::level::debug : spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

// ── FileLogSink ─────────────────────────────────────────────

FileLogSink::FileLogSink(std::string logs_dir) : logs_dir_(std::move(logs_dir)) {}

FileLogSink::~FileLogSink() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& entry : loggers_) {
        entry.second->flush();
    }
}

std::string FileLogSink::file_for_domain(const std::string& domain) {
    if (domain == "audit") return "audit.log";
    if (domain == "script") return "script.log";
    if (domain == "plugin") return "plugin.log";
    if (domain == "crash") return "crash.log";
    if (domain == "engine" || domain == "proxy") return "engine.log";
    return "custom.log";
}

std::string FileLogSink::with_domain_prefix(const std::string& domain, const std::string& message) {
    std::string prefix;
    if (domain == "audit") prefix = "[AUDIT]";
    else if (domain == "script") prefix = "[SCRIPT]";
    else if (domain == "plugin") prefix = "[PLUGIN]";
    else if (domain == "crash") prefix = "[CRASH]";

    if (prefix.empty() || message.find(prefix) != std::string::npos) {
        return message;
    }
    return prefix + " " + message;
}

std::shared_ptr<spdlog::logger> FileLogSink::logger_for(const std::string& file_name) {
    auto it = loggers_.find(file_name);
    if (it != loggers_.end()) return it->second;

    fs::create_directories(logs_dir_);
    auto sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(logs_dir_ + "/" + file_name);
    auto logger = std::make_shared<spdlog::logger>("domain:" + file_name, sink);
    logger->set_pattern("[%Y-%m-%d %H:%M:%S] %v");
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::trace);
    loggers_.emplace(file_name, logger);
    return logger;
}

void FileLogSink::write(const std::string& domain, const std::string& message) {
    try {
        std::shared_ptr<spdlog::logger> logger;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            logger = logger_for(file_for_domain(domain));
        }
        logger->info(with_domain_prefix(domain, message));
    } catch (const std::exception& e) {
        spdlog::debug("Dropped {} log line: {}", domain, e.what());
    }
}

// ── Tail ────────────────────────────────────────────────────

LogTail tail_domain_log(const std::string& logs_dir, const std::string& name, size_t lines) {
    LogTail tail;

    std::string file_name;
    if (name == "proxy") file_name = "engine.log";
    else if (name == "app") file_name = "app.log";
    else if (name == "audit") file_name = "audit.log";
    else if (name == "script") file_name = "script.log";
    else if (name == "plugin") file_name = "plugin.log";
    else if (name == "crash") file_name = "crash.log";
    else {
        tail.error = "Unknown log name: " + name;
        return tail;
    }

    tail.success = true;
    fs::path path = fs::path(logs_dir) / file_name;
    std::ifstream fin(path);
    if (!fin.is_open()) {
        tail.lines.push_back("Log file " + file_name + " not found.");
        return tail;
    }

    std::deque<std::string> window;
    std::string line;
    while (std::getline(fin, line)) {
        window.push_back(line);
        if (window.size() > lines) window.pop_front();
    }
    tail.lines.assign(window.begin(), window.end());
    return tail;
}
