#include <gtest/gtest.h>
#include "daemon/resource_sampler.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <unistd.h>

namespace fs = std::filesystem;
using Clock = ResourceSampler::Clock;

/// Scripted process table: tests edit `procs` between samples
class FakeProcessTable : public ProcessTable {
public:
    std::map<pid_t, ProcessSample> procs;
    unsigned cpus = 4;
    int full_scans = 0;
    int partial_refreshes = 0;

    std::map<pid_t, pid_t> refresh_all() override {
        ++full_scans;
        std::map<pid_t, pid_t> tree;
        for (const auto& p : procs) tree[p.first] = p.second.parent;
        return tree;
    }

    void refresh(const std::vector<pid_t>&) override { ++partial_refreshes; }

    std::optional<ProcessSample> find(pid_t pid) const override {
        auto it = procs.find(pid);
        if (it == procs.end()) return std::nullopt;
        return it->second;
    }

    unsigned cpu_count() const override { return cpus; }

    void add(pid_t pid, pid_t parent, uint64_t mem, float cpu, uint64_t run_time = 0) {
        ProcessSample s;
        s.pid = pid;
        s.parent = parent;
        s.memory_bytes = mem;
        s.cpu_percent = cpu;
        s.run_time_sec = run_time;
        procs[pid] = s;
    }
};

class ResourceSamplerTest : public ::testing::Test {
protected:
    FakeProcessTable* table = nullptr;
    std::unique_ptr<ResourceSampler> sampler;
    Clock::time_point now = Clock::time_point{} + std::chrono::hours(1);

    void SetUp() override {
        auto t = std::make_unique<FakeProcessTable>();
        table = t.get();
        // 10 = app, 20 = engine, 30 = engine worker, 99 = unrelated
        table->add(1, 0, 0, 0.0f);
        table->add(10, 1, 1000, 10.0f, 120);
        table->add(20, 10, 2000, 20.0f, 60);
        table->add(30, 20, 3000, 30.0f, 30);
        table->add(99, 1, 50000, 90.0f);

        sampler = std::make_unique<ResourceSampler>(std::move(t), 10);
        sampler->set_clock([this] { return now; });
        sampler->set_network_source(nullptr);
    }
};

TEST_F(ResourceSamplerTest, SumsMemoryOverApplicationTree) {
    auto stats = sampler->sample();
    EXPECT_EQ(stats.memory_usage, 6000u);

    auto pids = sampler->cached_pids();
    std::sort(pids.begin(), pids.end());
    EXPECT_EQ(pids, (std::vector<pid_t>{10, 20, 30}));
}

TEST_F(ResourceSamplerTest, CpuIsNormalisedByCoreCount) {
    auto stats = sampler->sample();
    // (10 + 20 + 30) / 4 cores
    EXPECT_FLOAT_EQ(stats.cpu_usage, 15.0f);
}

TEST_F(ResourceSamplerTest, CpuNeverExceedsHundred) {
    table->cpus = 1;
    table->procs[20].cpu_percent = 350.0f;
    auto stats = sampler->sample();
    EXPECT_LE(stats.cpu_usage, 100.0f);
    EXPECT_GE(stats.cpu_usage, 0.0f);
}

TEST_F(ResourceSamplerTest, UpTimeIsRootProcessOnly) {
    auto stats = sampler->sample();
    EXPECT_EQ(stats.up_time, 120u);
}

TEST_F(ResourceSamplerTest, DiscoveryIsCachedFor30Seconds) {
    sampler->sample();
    EXPECT_EQ(sampler->discovery_count(), 1u);

    now += std::chrono::seconds(10);
    sampler->sample();
    now += std::chrono::seconds(19);
    sampler->sample();
    EXPECT_EQ(sampler->discovery_count(), 1u);
    EXPECT_EQ(table->partial_refreshes, 2);

    now += std::chrono::seconds(2);
    sampler->sample();
    EXPECT_EQ(sampler->discovery_count(), 2u);
}

TEST_F(ResourceSamplerTest, NewChildSeenOnlyAfterRediscovery) {
    sampler->sample();
    table->add(40, 20, 4000, 0.0f);

    now += std::chrono::seconds(5);
    EXPECT_EQ(sampler->sample().memory_usage, 6000u);

    now += std::chrono::seconds(30);
    EXPECT_EQ(sampler->sample().memory_usage, 10000u);
}

TEST_F(ResourceSamplerTest, VanishedProcessIsSkipped) {
    sampler->sample();
    table->procs.erase(30);

    now += std::chrono::seconds(1);
    auto stats = sampler->sample();
    EXPECT_EQ(stats.memory_usage, 3000u);
}

TEST_F(ResourceSamplerTest, NetworkRatesFromCounters) {
    uint64_t rx = 1000, tx = 500;
    sampler->set_network_source([&]() -> std::optional<NetworkMeter::Counters> {
        return NetworkMeter::Counters{rx, tx};
    });

    auto first = sampler->sample();
    EXPECT_EQ(first.rx_speed, 0u);
    EXPECT_EQ(first.tx_speed, 0u);

    rx += 2000;
    tx += 1000;
    now += std::chrono::seconds(2);
    auto second = sampler->sample();
    EXPECT_EQ(second.rx_speed, 1000u);
    EXPECT_EQ(second.tx_speed, 500u);
}

TEST(NetworkMeterTest, IgnoresSamplesCloserThan100ms) {
    NetworkMeter meter;
    auto t0 = Clock::time_point{} + std::chrono::seconds(100);
    meter.update({0, 0}, t0);
    auto s1 = meter.update({1000, 1000}, t0 + std::chrono::seconds(1));
    EXPECT_EQ(s1.rx, 1000u);

    auto s2 = meter.update({999999, 999999}, t0 + std::chrono::milliseconds(1050));
    // Too soon: previous rate repeated
    EXPECT_EQ(s2.rx, 1000u);
    EXPECT_EQ(s2.tx, 1000u);
}

TEST(NetworkMeterTest, CounterResetYieldsZero) {
    NetworkMeter meter;
    auto t0 = Clock::time_point{} + std::chrono::seconds(100);
    meter.update({5000, 5000}, t0);
    auto s = meter.update({100, 6000}, t0 + std::chrono::seconds(1));
    EXPECT_EQ(s.rx, 0u);
    EXPECT_EQ(s.tx, 1000u);
}

TEST(NetworkMeterTest, ParsesProcNetDev) {
    fs::path path = fs::temp_directory_path() / ("relaycraft-netdev-" + std::to_string(::getpid()));
    {
        std::ofstream fout(path);
        fout << "Inter-|   Receive                                                |  Transmit\n"
                " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
                "    lo:    1000      10    0    0    0     0          0         0     1000      10    0    0    0     0       0          0\n"
                "  eth0:  250000     200    0    0    0     0          0         0    75000     150    0    0    0     0       0          0\n";
    }
    auto totals = NetworkMeter::read_proc_net_dev(path.string());
    fs::remove(path);

    ASSERT_TRUE(totals.has_value());
    EXPECT_EQ(totals->rx, 251000u);
    EXPECT_EQ(totals->tx, 76000u);

    EXPECT_FALSE(NetworkMeter::read_proc_net_dev("/nonexistent/net/dev").has_value());
}

// ── Procfs backend against a synthetic /proc ────────────────

class ProcfsTableTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / ("relaycraft-proc-" + std::to_string(::getpid()));
        fs::create_directories(root);
        std::ofstream(root / "uptime") << "1000.00 4000.00\n";
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(root, ec);
    }

    void add_proc(pid_t pid, const std::string& comm, pid_t ppid,
                  uint64_t utime, uint64_t stime, uint64_t starttime, uint64_t rss_pages) {
        fs::path dir = root / std::to_string(pid);
        fs::create_directories(dir);
        std::ofstream(dir / "stat") << pid << " (" << comm << ") S " << ppid
            << " 100 100 0 -1 4194304 0 0 0 0 " << utime << " " << stime
            << " 0 0 20 0 1 0 " << starttime << " 123456 " << rss_pages << "\n";
        std::ofstream(dir / "statm") << "5000 " << rss_pages << " 100 10 0 200 0\n";
    }
};

TEST_F(ProcfsTableTest, ReadsTreeMemoryAndRunTime) {
    long ticks = sysconf(_SC_CLK_TCK);
    long page = sysconf(_SC_PAGESIZE);
    if (ticks <= 0) ticks = 100;
    if (page <= 0) page = 4096;

    // comm with spaces and a ')' must not confuse the parser
    add_proc(100, "engine (main)", 1, 50, 25, 900 * ticks, 256);
    add_proc(101, "worker", 100, 0, 0, 990 * ticks, 64);
    fs::create_directories(root / "self");

    ProcfsProcessTable table(root.string());
    auto tree = table.refresh_all();
    ASSERT_EQ(tree.size(), 2u);
    EXPECT_EQ(tree[100], 1);
    EXPECT_EQ(tree[101], 100);

    auto main = table.find(100);
    ASSERT_TRUE(main.has_value());
    EXPECT_EQ(main->memory_bytes, 256u * static_cast<uint64_t>(page));
    EXPECT_EQ(main->run_time_sec, 100u);
    // No previous reading yet
    EXPECT_FLOAT_EQ(main->cpu_percent, 0.0f);
}

TEST_F(ProcfsTableTest, VanishedPidIsDropped) {
    add_proc(200, "short", 1, 0, 0, 0, 1);
    ProcfsProcessTable table(root.string());
    table.refresh_all();
    ASSERT_TRUE(table.find(200).has_value());

    fs::remove_all(root / "200");
    table.refresh({200});
    EXPECT_FALSE(table.find(200).has_value());
}

TEST(ProcfsLiveTest, SamplesThisProcess) {
    ResourceSampler sampler(std::make_unique<ProcfsProcessTable>(), getpid());
    auto stats = sampler.sample();
    EXPECT_GT(stats.memory_usage, 0u);
    EXPECT_LE(stats.cpu_usage, 100.0f);
    auto pids = sampler.cached_pids();
    EXPECT_NE(std::find(pids.begin(), pids.end(), getpid()), pids.end());
}
