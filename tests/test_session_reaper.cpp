#include <gtest/gtest.h>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <ssh/session_reaper.hpp>
#include "fake_connection.hpp"

using namespace std::chrono_literals;

namespace {

SessionTarget target_for(const std::string& host) {
    SessionTarget t;
    t.host = host;
    t.user = "ops";
    return t;
}

FleetOptions reuse_options(int max_idle = 300, int interval = 30) {
    FleetOptions opts;
    opts.session_reuse = true;
    opts.session_max_idle = max_idle;
    opts.session_reap_interval = interval;
    return opts;
}

// Connection whose close() blocks until the test opens the gate.
struct CloseGate {
    std::mutex mutex;
    std::condition_variable cv;
    bool entered = false;
    bool open = false;
    int closes = 0;

    void wait_entered() {
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait_for(lock, 5s, [this] { return entered; });
    }

    void release() {
        std::lock_guard<std::mutex> lock(mutex);
        open = true;
        cv.notify_all();
    }
};

class GatedConnection : public SSHConnection {
public:
    explicit GatedConnection(std::shared_ptr<CloseGate> gate) : gate_(std::move(gate)) {}

    SSHResult run(const std::string&, int = 0) override { return ok_result(""); }
    bool is_connected() const override { return true; }
    void close() override {
        std::unique_lock<std::mutex> lock(gate_->mutex);
        gate_->entered = true;
        gate_->cv.notify_all();
        gate_->cv.wait(lock, [this] { return gate_->open; });
        ++gate_->closes;
    }
    std::string target() const override { return "gated"; }

private:
    std::shared_ptr<CloseGate> gate_;
};

} // namespace

TEST(SessionReaper, SweepClosesOnlyIdleSessions) {
    auto now = Clock::now();
    auto opts = reuse_options(300);

    auto r_old = std::make_shared<FakeRemote>();
    auto r_fresh = std::make_shared<FakeRemote>();
    auto r_never = std::make_shared<FakeRemote>();
    RemoteSession old_session(target_for("old"), fake_factory(r_old));
    RemoteSession fresh_session(target_for("fresh"), fake_factory(r_fresh));
    RemoteSession unused_session(target_for("never"), fake_factory(r_never));

    old_session.acquire();
    fresh_session.acquire();
    old_session.set_last_used(now - 450s);
    fresh_session.set_last_used(now - 100s);

    SessionReaper reaper(opts, [now] { return now; });
    reaper.bind({&old_session, &fresh_session, &unused_session});

    EXPECT_EQ(reaper.sweep(), 1);
    EXPECT_EQ(r_old->close_count, 1);
    EXPECT_EQ(r_fresh->close_count, 0);
    EXPECT_EQ(r_never->close_count, 0);

    // Reaper closes without dropping the handle
    EXPECT_TRUE(old_session.has_handle());
    EXPECT_FALSE(old_session.last_used().has_value());
    EXPECT_TRUE(fresh_session.last_used().has_value());
}

TEST(SessionReaper, SweepSurvivesCloseErrors) {
    auto now = Clock::now();
    auto opts = reuse_options(300);

    auto r_bad = std::make_shared<FakeRemote>();
    r_bad->throw_on_close = true;
    auto r_good = std::make_shared<FakeRemote>();
    RemoteSession bad(target_for("bad"), fake_factory(r_bad));
    RemoteSession good(target_for("good"), fake_factory(r_good));

    bad.acquire();
    good.acquire();
    bad.set_last_used(now - 1000s);
    good.set_last_used(now - 1000s);

    SessionReaper reaper(opts, [now] { return now; });
    reaper.bind({&bad, &good});

    EXPECT_EQ(reaper.sweep(), 2);
    EXPECT_EQ(r_good->close_count, 1);
}

TEST(SessionReaper, StartIsNoopWithoutReuse) {
    FleetOptions opts;
    opts.session_reuse = false;
    SessionReaper reaper(opts);
    reaper.bind({});

    reaper.start();
    EXPECT_FALSE(reaper.is_running());
}

TEST(SessionReaper, StartIsNoopWhenUnbound) {
    auto opts = reuse_options();
    SessionReaper reaper(opts);

    reaper.start();
    EXPECT_FALSE(reaper.is_running());
}

TEST(SessionReaper, StartStopLifecycle) {
    auto opts = reuse_options();
    SessionReaper reaper(opts);
    reaper.bind({});

    reaper.start();
    EXPECT_TRUE(reaper.is_running());
    reaper.start();
    EXPECT_TRUE(reaper.is_running());

    auto before = std::chrono::steady_clock::now();
    reaper.stop();
    EXPECT_FALSE(reaper.is_running());
    // The wait is interrupted, not slept through
    EXPECT_LT(std::chrono::steady_clock::now() - before, 5s);

    EXPECT_NO_THROW(reaper.stop());
    EXPECT_FALSE(reaper.is_running());

    reaper.start();
    EXPECT_TRUE(reaper.is_running());
    reaper.stop();
}

TEST(SessionReaper, WorkerSweepsOnStart) {
    auto opts = reuse_options(300, 3600);
    auto remote = std::make_shared<FakeRemote>();
    RemoteSession session(target_for("idle"), fake_factory(remote));
    session.acquire();
    session.set_last_used(Clock::now() - 600s);

    SessionReaper reaper(opts);
    reaper.bind({&session});
    reaper.start();

    for (int i = 0; i < 200 && remote->closes() == 0; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    reaper.stop();
    EXPECT_EQ(remote->closes(), 1);
}

TEST(SessionReaper, WarnsOnShortMaxIdle) {
    LogCapture logs;
    auto opts = reuse_options(60, 10);
    SessionReaper reaper(opts);
    reaper.bind({});

    reaper.start();
    reaper.stop();
    EXPECT_TRUE(logs.contains(LogLevel::Warn, "below the recommended minimum"));
}

TEST(SessionReaper, WarnsWhenIntervalNotShorterThanMaxIdle) {
    LogCapture logs;
    auto opts = reuse_options(300, 300);
    SessionReaper reaper(opts);
    reaper.bind({});

    reaper.start();
    reaper.stop();
    EXPECT_TRUE(logs.contains(LogLevel::Warn, "not shorter than max idle"));
    EXPECT_FALSE(logs.contains(LogLevel::Warn, "below the recommended minimum"));
}

TEST(SessionReaper, DetachedWorkerOutlivesReaper) {
    auto opts = reuse_options(300, 3600);
    auto gate = std::make_shared<CloseGate>();
    RemoteSession stuck(target_for("stuck"), [gate](const SessionTarget&) {
        return std::unique_ptr<SSHConnection>(new GatedConnection(gate));
    });
    auto r_next = std::make_shared<FakeRemote>();
    RemoteSession next(target_for("next"), fake_factory(r_next));

    stuck.acquire();
    next.acquire();
    stuck.set_last_used(Clock::now() - 600s);
    next.set_last_used(Clock::now() - 600s);

    {
        SessionReaper reaper(opts);
        reaper.set_stop_timeout(50ms);
        reaper.bind({&stuck, &next});
        reaper.start();

        gate->wait_entered();
        reaper.stop();
        EXPECT_FALSE(reaper.is_running());
    }

    // The worker is still inside close() with the reaper gone
    gate->release();
    std::this_thread::sleep_for(200ms);

    // Stop was requested, so the worker gives up before the next host
    EXPECT_EQ(r_next->closes(), 0);
    {
        std::lock_guard<std::mutex> lock(gate->mutex);
        EXPECT_EQ(gate->closes, 1);
    }
}
