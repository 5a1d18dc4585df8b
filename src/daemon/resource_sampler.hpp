#pragma once

#include "daemon/process_table.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>

struct EngineStats {
    uint64_t memory_usage = 0;  // bytes
    float cpu_usage = 0.0f;     // percent of the whole machine, 0-100
    uint64_t up_time = 0;       // seconds, main process only
    uint64_t rx_speed = 0;      // bytes/sec
    uint64_t tx_speed = 0;      // bytes/sec
};

/// Turns cumulative interface byte counters into a rate
class NetworkMeter {
public:
    using Clock = std::chrono::steady_clock;

    struct Counters {
        uint64_t rx = 0;
        uint64_t tx = 0;
    };

    /// Feed the current totals; returns bytes/sec since the last accepted
    /// sample. Samples closer than 100ms to the previous one are ignored.
    Counters update(const Counters& totals, Clock::time_point now);

    /// Sum of all interfaces in a /proc/net/dev style file
    static std::optional<Counters> read_proc_net_dev(const std::string& path = "/proc/net/dev");

private:
    Counters last_;
    Counters last_speed_;
    Clock::time_point last_update_{};
    bool primed_ = false;
};

/// CPU/memory of this application and every process descended from it.
/// Discovery walks the whole process table and is cached for 30 seconds;
/// calls in between only refresh the cached pids.
class ResourceSampler {
public:
    using Clock = std::chrono::steady_clock;

    static constexpr std::chrono::seconds kPidRefreshInterval{30};

    ResourceSampler(std::unique_ptr<ProcessTable> table, pid_t root_pid);

    /// Replace the time source (tests)
    void set_clock(std::function<Clock::time_point()> now);

    /// Replace the interface counter source (tests); nullptr disables rates
    void set_network_source(std::function<std::optional<NetworkMeter::Counters>()> source);

    EngineStats sample();

    /// Pids currently considered part of the application tree
    std::vector<pid_t> cached_pids() const;

    /// Number of full discoveries performed so far
    size_t discovery_count() const;

private:
    std::unique_ptr<ProcessTable> table_;
    pid_t root_pid_;
    std::function<Clock::time_point()> now_;
    std::function<std::optional<NetworkMeter::Counters>()> network_source_;
    NetworkMeter network_;

    mutable std::mutex mutex_;
    std::vector<pid_t> cached_pids_;
    Clock::time_point last_pid_refresh_{};
    size_t discoveries_ = 0;

    void discover_locked(Clock::time_point now);
};
