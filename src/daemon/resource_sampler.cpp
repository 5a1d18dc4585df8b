#include "daemon/resource_sampler.hpp"

#include <spdlog/spdlog.h>
#include <algorithm>
#include <deque>
#include <fstream>
#include <sstream>

// ── NetworkMeter ────────────────────────────────────────────

NetworkMeter::Counters NetworkMeter::update(const Counters& totals, Clock::time_point now) {
    if (!primed_) {
        last_ = totals;
        last_update_ = now;
        primed_ = true;
        return Counters{};
    }

    double elapsed = std::chrono::duration<double>(now - last_update_).count();
    if (elapsed <= 0.1) {
        return last_speed_;
    }

    Counters speed;
    // Counters can go backwards when an interface disappears
    if (totals.rx >= last_.rx) speed.rx = static_cast<uint64_t>((totals.rx - last_.rx) / elapsed);
    if (totals.tx >= last_.tx) speed.tx = static_cast<uint64_t>((totals.tx - last_.tx) / elapsed);

    last_ = totals;
    last_update_ = now;
    last_speed_ = speed;
    return speed;
}

std::optional<NetworkMeter::Counters> NetworkMeter::read_proc_net_dev(const std::string& path) {
    std::ifstream fin(path);
    if (!fin.is_open()) return std::nullopt;

    Counters totals;
    std::string line;
    while (std::getline(fin, line)) {
        auto colon = line.find(':');
        if (colon == std::string::npos) continue;  // header lines

        std::istringstream iss(line.substr(colon + 1));
        uint64_t values[9] = {};
        for (auto& v : values) {
            if (!(iss >> v)) break;
        }
        // rx_bytes is column 0, tx_bytes column 8
        totals.rx += values[0];
        totals.tx += values[8];
    }
    return totals;
}

// ── ResourceSampler ─────────────────────────────────────────

ResourceSampler::ResourceSampler(std::unique_ptr<ProcessTable> table, pid_t root_pid)
    : table_(std::move(table)),
      root_pid_(root_pid),
      now_([] { return Clock::now(); }),
      network_source_([] { return NetworkMeter::read_proc_net_dev(); }) {}

void ResourceSampler::set_clock(std::function<Clock::time_point()> now) {
    std::lock_guard<std::mutex> lock(mutex_);
    now_ = std::move(now);
}

void ResourceSampler::set_network_source(std::function<std::optional<NetworkMeter::Counters>()> source) {
    std::lock_guard<std::mutex> lock(mutex_);
    network_source_ = std::move(source);
}

std::vector<pid_t> ResourceSampler::cached_pids() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cached_pids_;
}

size_t ResourceSampler::discovery_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return discoveries_;
}

void ResourceSampler::discover_locked(Clock::time_point now) {
    auto tree = table_->refresh_all();

    // Breadth-first walk down the parent relation from the root
    std::vector<pid_t> pids{root_pid_};
    std::deque<pid_t> queue{root_pid_};
    while (!queue.empty()) {
        pid_t parent = queue.front();
        queue.pop_front();
        for (const auto& entry : tree) {
            if (entry.second == parent && entry.first != parent) {
                pids.push_back(entry.first);
                queue.push_back(entry.first);
            }
        }
    }

    cached_pids_ = std::move(pids);
    last_pid_refresh_ = now;
    ++discoveries_;
    spdlog::debug("Refreshed application PID tree cache: {} processes found", cached_pids_.size());
}

EngineStats ResourceSampler::sample() {
    std::lock_guard<std::mutex> lock(mutex_);
    auto now = now_();

    if (cached_pids_.empty() || discoveries_ == 0 || now - last_pid_refresh_ > kPidRefreshInterval) {
        discover_locked(now);
    } else {
        table_->refresh(cached_pids_);
    }

    EngineStats stats;
    float total_cpu = 0.0f;
    for (pid_t pid : cached_pids_) {
        auto proc = table_->find(pid);
        if (!proc) continue;  // exited since discovery
        stats.memory_usage += proc->memory_bytes;
        total_cpu += proc->cpu_percent;
        if (pid == root_pid_) {
            stats.up_time = proc->run_time_sec;
        }
    }

    // Whole-machine percentage, task-manager style
    unsigned cpus = table_->cpu_count();
    if (cpus > 0) total_cpu /= static_cast<float>(cpus);
    stats.cpu_usage = std::clamp(total_cpu, 0.0f, 100.0f);

    if (network_source_) {
        if (auto totals = network_source_()) {
            auto speed = network_.update(*totals, now);
            stats.rx_speed = speed.rx;
            stats.tx_speed = speed.tx;
        }
    }
    return stats;
}
