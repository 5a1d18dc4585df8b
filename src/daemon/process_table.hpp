#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <sys/types.h>

/// Metrics for one OS process as of the last refresh
struct ProcessSample {
    pid_t pid = -1;
    pid_t parent = -1;
    uint64_t memory_bytes = 0;   // resident set size
    float cpu_percent = 0.0f;    // of one core, since the previous refresh
    uint64_t run_time_sec = 0;
};

/// View of the OS process table. Discovery (refresh_all) is expensive;
/// refresh of a known pid list is cheap.
class ProcessTable {
public:
    virtual ~ProcessTable() = default;

    /// Rescan every process; returns pid -> parent pid
    virtual std::map<pid_t, pid_t> refresh_all() = 0;

    /// Update metrics for just these pids; vanished pids are dropped
    virtual void refresh(const std::vector<pid_t>& pids) = 0;

    virtual std::optional<ProcessSample> find(pid_t pid) const = 0;

    virtual unsigned cpu_count() const = 0;
};

/// Linux implementation backed by /proc
class ProcfsProcessTable : public ProcessTable {
public:
    explicit ProcfsProcessTable(const std::string& proc_root = "/proc");

    std::map<pid_t, pid_t> refresh_all() override;
    void refresh(const std::vector<pid_t>& pids) override;
    std::optional<ProcessSample> find(pid_t pid) const override;
    unsigned cpu_count() const override;

private:
    struct Entry {
        ProcessSample sample;
        uint64_t last_ticks = 0;
        double last_seen = 0.0;  // seconds, monotonic
        bool primed = false;     // has a previous tick reading
    };

    std::string proc_root_;
    long clock_ticks_;
    long page_size_;
    unsigned cpus_;
    std::map<pid_t, Entry> entries_;

    bool update_entry(pid_t pid, double now, double system_uptime);
    double read_system_uptime() const;
};
