#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace spdlog { class logger; }

/// Install the default application logger (stderr + rotating app.log).
/// Safe to call more than once; the last call wins.
void init_logging(const std::string& logs_dir, bool verbose);

/// Destination for engine output, keyed by logical domain
/// ("engine", "script", "plugin", "audit", "crash", anything else = "other").
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Fire-and-forget; must never throw.
    virtual void write(const std::string& domain, const std::string& message) = 0;
};

/// Appends timestamped lines to <logs_dir>/<domain>.log
class FileLogSink : public LogSink {
public:
    explicit FileLogSink(std::string logs_dir);
    ~FileLogSink() override;

    void write(const std::string& domain, const std::string& message) override;

    /// File name a domain is written to ("engine.log", "custom.log", ...)
    static std::string file_for_domain(const std::string& domain);

    /// Message with the domain's tag prepended unless already present
    static std::string with_domain_prefix(const std::string& domain, const std::string& message);

private:
    std::string logs_dir_;
    std::mutex mutex_;
    std::map<std::string, std::shared_ptr<spdlog::logger>> loggers_;

    std::shared_ptr<spdlog::logger> logger_for(const std::string& file_name);
};

struct LogTail {
    bool success = false;
    std::string error;
    std::vector<std::string> lines;
};

/// Last `lines` lines of a named log: proxy, app, audit, script, plugin, crash
LogTail tail_domain_log(const std::string& logs_dir, const std::string& name, size_t lines);
