#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include <core/types.hpp>
#include "remote_session.hpp"

// Background thread that closes sessions left idle longer than
// session_max_idle. Only meaningful when session reuse is on; otherwise
// every operation closes its own session and start() does nothing.
class SessionReaper {
public:
    using NowFn = std::function<TimePoint()>;

    explicit SessionReaper(const FleetOptions& options, NowFn now = nullptr);
    ~SessionReaper();

    SessionReaper(const SessionReaper&) = delete;
    SessionReaper& operator=(const SessionReaper&) = delete;

    // Sessions to watch. Must be called while stopped.
    void bind(std::vector<RemoteSession*> sessions);

    void start();
    void stop();
    bool is_running() const;

    // One pass over the bound sessions. Returns how many were closed.
    int sweep();

    // Test hook: how long stop() waits for the worker before detaching.
    void set_stop_timeout(std::chrono::milliseconds timeout) { stop_timeout_ = timeout; }

private:
    // Everything the worker reads. The worker holds its own reference
    // and never touches the reaper, so a detached worker outlives it
    // safely.
    struct WorkerState {
        std::mutex mutex;
        std::condition_variable cv;
        bool stop_requested = false;
        bool finished = false;

        std::vector<RemoteSession*> sessions;
        std::chrono::seconds max_idle{0};
        std::chrono::seconds interval{0};
        NowFn now;
    };

    std::shared_ptr<WorkerState> make_state() const;
    static int sweep_sessions(WorkerState& state);
    static void reaper_loop(std::shared_ptr<WorkerState> state);

    const FleetOptions& options_;
    NowFn now_;
    std::vector<RemoteSession*> sessions_;
    bool bound_ = false;
    std::chrono::milliseconds stop_timeout_;

    std::shared_ptr<WorkerState> state_;
    std::thread thread_;
    bool running_ = false;
    mutable std::mutex state_mutex_;
};
