#include "daemon/process_table.hpp"

#include <dirent.h>
#include <unistd.h>
#include <chrono>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <thread>

namespace {

double monotonic_seconds() {
    return std::chrono::duration<double>(
        std::chrono::steady_clock::now().time_since_epoch()).count();
}

bool is_pid_name(const char* name) {
    if (!name || !*name) return false;
    for (const char* c = name; *c; ++c) {
        if (*c < '0' || *c > '9') return false;
    }
    return true;
}

} // namespace

ProcfsProcessTable::ProcfsProcessTable(const std::string& proc_root)
    : proc_root_(proc_root),
      clock_ticks_(sysconf(_SC_CLK_TCK)),
      page_size_(sysconf(_SC_PAGESIZE)),
      cpus_(std::thread::hardware_concurrency()) {
    if (clock_ticks_ <= 0) clock_ticks_ = 100;
    if (page_size_ <= 0) page_size_ = 4096;
    if (cpus_ == 0) cpus_ = 1;
}

unsigned ProcfsProcessTable::cpu_count() const {
    return cpus_;
}

double ProcfsProcessTable::read_system_uptime() const {
    std::ifstream uptime_file(proc_root_ + "/uptime");
    double uptime = 0.0;
    if (uptime_file.is_open()) {
        uptime_file >> uptime;
    }
    return uptime;
}

bool ProcfsProcessTable::update_entry(pid_t pid, double now, double system_uptime) {
    std::string base = proc_root_ + "/" + std::to_string(pid);

    std::ifstream stat_file(base + "/stat");
    if (!stat_file.is_open()) return false;
    std::string content;
    std::getline(stat_file, content);

    // comm may contain spaces and parentheses; fields resume after the last ')'
    auto close_paren = content.rfind(')');
    if (close_paren == std::string::npos) return false;

    std::istringstream iss(content.substr(close_paren + 1));
    std::vector<std::string> fields;
    std::string field;
    while (iss >> field && fields.size() < 20) {
        fields.push_back(field);
    }
    // fields[0] = state, [1] = ppid, [11] = utime, [12] = stime, [19] = starttime
    if (fields.size() < 20) return false;

    Entry& entry = entries_[pid];
    entry.sample.pid = pid;
    entry.sample.parent = static_cast<pid_t>(std::strtol(fields[1].c_str(), nullptr, 10));

    uint64_t ticks = std::strtoull(fields[11].c_str(), nullptr, 10) +
                     std::strtoull(fields[12].c_str(), nullptr, 10);
    if (entry.primed && now > entry.last_seen && ticks >= entry.last_ticks) {
        double cpu_seconds = static_cast<double>(ticks - entry.last_ticks) / clock_ticks_;
        entry.sample.cpu_percent = static_cast<float>(cpu_seconds / (now - entry.last_seen) * 100.0);
    } else {
        entry.sample.cpu_percent = 0.0f;
    }
    entry.last_ticks = ticks;
    entry.last_seen = now;
    entry.primed = true;

    double start_sec = static_cast<double>(std::strtoull(fields[19].c_str(), nullptr, 10)) / clock_ticks_;
    entry.sample.run_time_sec = system_uptime > start_sec
        ? static_cast<uint64_t>(system_uptime - start_sec) : 0;

    std::ifstream statm(base + "/statm");
    uint64_t size_pages = 0, resident_pages = 0;
    if (statm.is_open() && (statm >> size_pages >> resident_pages)) {
        entry.sample.memory_bytes = resident_pages * static_cast<uint64_t>(page_size_);
    }
    return true;
}

std::map<pid_t, pid_t> ProcfsProcessTable::refresh_all() {
    std::map<pid_t, pid_t> tree;
    double now = monotonic_seconds();
    double uptime = read_system_uptime();

    std::map<pid_t, Entry> previous;
    previous.swap(entries_);

    DIR* dir = opendir(proc_root_.c_str());
    if (!dir) return tree;

    while (struct dirent* ent = readdir(dir)) {
        if (!is_pid_name(ent->d_name)) continue;
        pid_t pid = static_cast<pid_t>(std::strtol(ent->d_name, nullptr, 10));

        // Keep the tick history so CPU stays a delta across full rescans
        auto old = previous.find(pid);
        if (old != previous.end()) {
            entries_[pid] = old->second;
        }
        if (update_entry(pid, now, uptime)) {
            tree[pid] = entries_[pid].sample.parent;
        } else {
            entries_.erase(pid);
        }
    }
    closedir(dir);
    return tree;
}

void ProcfsProcessTable::refresh(const std::vector<pid_t>& pids) {
    double now = monotonic_seconds();
    double uptime = read_system_uptime();
    for (pid_t pid : pids) {
        if (!update_entry(pid, now, uptime)) {
            entries_.erase(pid);
        }
    }
}

std::optional<ProcessSample> ProcfsProcessTable::find(pid_t pid) const {
    auto it = entries_.find(pid);
    if (it == entries_.end()) return std::nullopt;
    return it->second.sample;
}
