#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <managers/fleet.hpp>
#include <managers/fleet_scheduler.hpp>
#include "fake_connection.hpp"

namespace {

std::vector<HostConfig> three_hosts() {
    std::vector<HostConfig> out;
    for (const char* name : {"web1", "web2", "db1"}) {
        HostConfig hc;
        hc.name = name;
        hc.ip = "192.0.2.1";
        out.push_back(hc);
    }
    return out;
}

} // namespace

TEST(Fleet, KeepsConfigurationOrder) {
    FleetOptions opts;
    Fleet fleet(opts, three_hosts(), fake_factory(std::make_shared<FakeRemote>()));

    ASSERT_EQ(fleet.size(), 3u);
    auto all = fleet.all();
    EXPECT_EQ(all[0]->name(), "web1");
    EXPECT_EQ(all[2]->name(), "db1");
    EXPECT_EQ(fleet.sessions().size(), 3u);
}

TEST(Fleet, FindByName) {
    FleetOptions opts;
    Fleet fleet(opts, three_hosts(), fake_factory(std::make_shared<FakeRemote>()));

    ASSERT_NE(fleet.find("web2"), nullptr);
    EXPECT_EQ(fleet.find("web2")->name(), "web2");
    EXPECT_EQ(fleet.find("mail1"), nullptr);
}

TEST(Fleet, SelectSubsetInGivenOrder) {
    FleetOptions opts;
    Fleet fleet(opts, three_hosts(), fake_factory(std::make_shared<FakeRemote>()));

    auto picked = fleet.select({"db1", "web1"});
    ASSERT_EQ(picked.size(), 2u);
    EXPECT_EQ(picked[0]->name(), "db1");
    EXPECT_EQ(picked[1]->name(), "web1");

    EXPECT_EQ(fleet.select({}).size(), 3u);
}

TEST(Fleet, SelectCollapsesRepeatedNames) {
    FleetOptions opts;
    Fleet fleet(opts, three_hosts(), fake_factory(std::make_shared<FakeRemote>()));

    auto picked = fleet.select({"web1", "db1", "web1", "web1"});
    ASSERT_EQ(picked.size(), 2u);
    EXPECT_EQ(picked[0]->name(), "web1");
    EXPECT_EQ(picked[1]->name(), "db1");

    EXPECT_EQ(fleet.select({"web2", "web2"}).size(), 1u);
}

TEST(Fleet, SelectUnknownThrows) {
    FleetOptions opts;
    Fleet fleet(opts, three_hosts(), fake_factory(std::make_shared<FakeRemote>()));

    try {
        fleet.select({"web1", "mail1"});
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        EXPECT_NE(std::string(e.what()).find("mail1"), std::string::npos);
    }
}

TEST(Fleet, HostsShareFleetOptions) {
    FleetOptions opts;
    opts.stale_threshold = 60;
    Fleet fleet(opts, three_hosts(), fake_factory(std::make_shared<FakeRemote>()));

    // The fleet holds its own copy
    opts.stale_threshold = 1;
    EXPECT_EQ(fleet.options().stale_threshold, 60);

    auto* host = fleet.find("web1");
    auto now = Clock::now();
    host->set_last_refresh(now - std::chrono::seconds(30));
    EXPECT_FALSE(host->is_stale(now));
}

TEST(Fleet, CloseAllDropsHandles) {
    FleetOptions opts;
    opts.session_reuse = true;
    auto remote = std::make_shared<FakeRemote>();
    remote->on("echo ping", ok_result("ping\n"));
    Fleet fleet(opts, three_hosts(), fake_factory(remote));

    for (auto* h : fleet.all()) h->ping();
    EXPECT_TRUE(fleet.find("web1")->session().has_handle());

    fleet.close_all();
    for (auto* h : fleet.all()) EXPECT_FALSE(h->session().has_handle());
}

TEST(Fleet, RepeatedNameRunsHostOnce) {
    FleetOptions opts;
    auto remote = std::make_shared<FakeRemote>();
    remote->on("echo ping", ok_result("ping\n"));
    remote->on("uname -s", ok_result("OpenBSD\n"));
    remote->on("uname -r", ok_result("7.5\n"));
    Fleet fleet(opts, three_hosts(), fake_factory(remote));
    FleetScheduler scheduler(fleet.options());

    auto outcomes = scheduler.run_task(HostTask::Discover,
                                       fleet.select({"web1", "web1", "web1"})).collect();
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].ok()) << outcomes[0].error_message();
    EXPECT_EQ(outcomes[0].host->package_manager(), "pkg_add");
}
