#include <gtest/gtest.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <set>
#include <thread>
#include <core/errors.hpp>
#include <managers/fleet_scheduler.hpp>
#include "fake_connection.hpp"

using namespace std::chrono_literals;

namespace {

// Connection that answers every command after a delay and records how
// many run at once across all hosts.
struct Concurrency {
    std::atomic<int> in_flight{0};
    std::atomic<int> peak{0};
};

class SlowConnection : public SSHConnection {
public:
    SlowConnection(Concurrency& c, std::chrono::milliseconds delay) : c_(c), delay_(delay) {}

    SSHResult run(const std::string&, int = 0) override {
        int now = ++c_.in_flight;
        int peak = c_.peak.load();
        while (now > peak && !c_.peak.compare_exchange_weak(peak, now)) {}
        std::this_thread::sleep_for(delay_);
        --c_.in_flight;
        return ok_result("ping\n");
    }
    bool is_connected() const override { return true; }
    void close() override {}
    std::string target() const override { return "slow"; }

private:
    Concurrency& c_;
    std::chrono::milliseconds delay_;
};

HostConfig numbered_host(int i) {
    HostConfig hc;
    hc.name = "host" + std::to_string(i);
    hc.ip = "192.0.2." + std::to_string(i + 1);
    return hc;
}

} // namespace

class FleetSchedulerTest : public ::testing::Test {
protected:
    void add_host(std::shared_ptr<FakeRemote> remote, int index) {
        remotes.push_back(remote);
        hosts.push_back(std::make_unique<HostRecord>(numbered_host(index), opts,
                                                     fake_factory(remote)));
    }

    void add_slow_host(int index, std::chrono::milliseconds delay) {
        hosts.push_back(std::make_unique<HostRecord>(
            numbered_host(index), opts,
            [this, delay](const SessionTarget&) -> std::unique_ptr<SSHConnection> {
                return std::make_unique<SlowConnection>(concurrency, delay);
            }));
    }

    std::vector<HostRecord*> host_ptrs() {
        std::vector<HostRecord*> out;
        for (auto& h : hosts) out.push_back(h.get());
        return out;
    }

    FleetOptions opts;
    Concurrency concurrency;
    std::vector<std::shared_ptr<FakeRemote>> remotes;
    std::vector<std::unique_ptr<HostRecord>> hosts;
    LogCapture logs;
};

TEST(HostTaskNames, Parse) {
    EXPECT_EQ(parse_host_task("discover"), HostTask::Discover);
    EXPECT_EQ(parse_host_task("sync_repos"), HostTask::SyncRepos);
    EXPECT_EQ(parse_host_task("refresh_updates"), HostTask::RefreshUpdates);
    EXPECT_EQ(parse_host_task("ping"), HostTask::Ping);
    EXPECT_THROW(parse_host_task("reboot"), ConfigurationError);
    EXPECT_EQ(to_string(HostTask::RefreshUpdates), "refresh_updates");
}

TEST_F(FleetSchedulerTest, OneOutcomePerHostWithFailureIsolated) {
    const int n = 8;
    const int broken = 5;
    for (int i = 0; i < n; ++i) {
        auto remote = std::make_shared<FakeRemote>();
        remote->on("echo ping", ok_result("ping\n"));
        remote->on("uname -s", ok_result("OpenBSD\n"));
        remote->on("uname -r", ok_result("7.5\n"));
        if (i == broken) remote->go_offline("no route to host");
        add_host(remote, i);
    }

    FleetScheduler scheduler(opts);
    auto outcomes = scheduler.run_task(HostTask::Discover, host_ptrs()).collect();

    ASSERT_EQ(outcomes.size(), static_cast<size_t>(n));
    std::set<std::string> seen;
    for (const auto& o : outcomes) {
        seen.insert(o.host->name());
        if (o.host->name() == "host" + std::to_string(broken)) {
            ASSERT_FALSE(o.ok());
            EXPECT_THROW(std::rethrow_exception(o.error), OfflineHostError);
            EXPECT_NE(o.error_message().find("no route to host"), std::string::npos);
        } else {
            EXPECT_TRUE(o.ok()) << o.host->name() << ": " << o.error_message();
            EXPECT_EQ(o.host->package_manager(), "pkg_add");
        }
    }
    EXPECT_EQ(seen.size(), static_cast<size_t>(n));
}

TEST_F(FleetSchedulerTest, PingResultCarried) {
    auto up = std::make_shared<FakeRemote>();
    up->on("echo ping", ok_result("ping\n"));
    auto down = std::make_shared<FakeRemote>();
    down->go_offline();
    add_host(up, 0);
    add_host(down, 1);

    FleetScheduler scheduler(opts);
    int reachable = 0;
    for (auto& outcome : scheduler.run_task(HostTask::Ping, host_ptrs())) {
        EXPECT_TRUE(outcome.ok());
        if (outcome.result) ++reachable;
    }
    EXPECT_EQ(reachable, 1);
}

TEST_F(FleetSchedulerTest, RespectsMaxThreads) {
    opts.max_threads = 3;
    for (int i = 0; i < 9; ++i) add_slow_host(i, 20ms);

    FleetScheduler scheduler(opts);
    auto outcomes = scheduler.run_task(HostTask::Ping, host_ptrs()).collect();

    EXPECT_EQ(outcomes.size(), 9u);
    EXPECT_LE(concurrency.peak.load(), 3);
    EXPECT_GE(concurrency.peak.load(), 1);
}

TEST_F(FleetSchedulerTest, CancelledBeforeStart) {
    for (int i = 0; i < 4; ++i) {
        auto remote = std::make_shared<FakeRemote>();
        remote->on("echo ping", ok_result("ping\n"));
        add_host(remote, i);
    }

    CancelToken cancel;
    cancel.cancel();
    FleetScheduler scheduler(opts);
    auto outcomes = scheduler.run_task(HostTask::Ping, host_ptrs(), &cancel).collect();

    ASSERT_EQ(outcomes.size(), 4u);
    for (const auto& o : outcomes) {
        EXPECT_THROW(std::rethrow_exception(o.error), TaskCancelled);
    }
    for (const auto& r : remotes) EXPECT_TRUE(r->commands.empty());
}

TEST_F(FleetSchedulerTest, CancelMidRunStillYieldsEveryHost) {
    opts.max_threads = 1;
    for (int i = 0; i < 6; ++i) add_slow_host(i, 10ms);

    CancelToken cancel;
    FleetScheduler scheduler(opts);
    auto run = scheduler.run_task(HostTask::Ping, host_ptrs(), &cancel);

    auto first = run.next();
    ASSERT_TRUE(first.has_value());
    EXPECT_TRUE(first->ok());
    cancel.cancel();

    int cancelled = 0;
    int total = 1;
    while (auto o = run.next()) {
        ++total;
        if (!o->ok()) ++cancelled;
    }
    EXPECT_EQ(total, 6);
    // At most one host was already in flight when the token flipped
    EXPECT_GE(cancelled, 4);
}

TEST_F(FleetSchedulerTest, DroppingRunEarlyJoinsWorkers) {
    opts.max_threads = 2;
    for (int i = 0; i < 10; ++i) add_slow_host(i, 5ms);

    FleetScheduler scheduler(opts);
    {
        auto run = scheduler.run_task(HostTask::Ping, host_ptrs());
        ASSERT_TRUE(run.next().has_value());
    }
    EXPECT_EQ(concurrency.in_flight.load(), 0);
}

TEST_F(FleetSchedulerTest, EmptyHostList) {
    FleetScheduler scheduler(opts);
    auto run = scheduler.run_task(HostTask::Discover, {});
    EXPECT_EQ(run.total(), 0u);
    EXPECT_FALSE(run.next().has_value());
}

TEST_F(FleetSchedulerTest, RerunningRunsAgain) {
    auto remote = std::make_shared<FakeRemote>();
    remote->on("echo ping", ok_result("ping\n"));
    add_host(remote, 0);

    FleetScheduler scheduler(opts);
    scheduler.run_task(HostTask::Ping, host_ptrs()).collect();
    scheduler.run_task(HostTask::Ping, host_ptrs()).collect();
    EXPECT_EQ(std::count(remote->commands.begin(), remote->commands.end(), "echo ping"), 2);
}
