#include "session_reaper.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <fmt/format.h>
#include <chrono>

// ── Construction / Destruction ──────────────────────────────

SessionReaper::SessionReaper(const FleetOptions& options, NowFn now)
    : options_(options), now_(now ? std::move(now) : NowFn(&Clock::now)),
      stop_timeout_(std::chrono::seconds(REAPER_STOP_TIMEOUT_SECS)) {}

SessionReaper::~SessionReaper() {
    stop();
}

void SessionReaper::bind(std::vector<RemoteSession*> sessions) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    sessions_ = std::move(sessions);
    bound_ = true;
}

// ── Lifecycle ───────────────────────────────────────────────

void SessionReaper::start() {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (!options_.session_reuse) {
        fleet_log_debug("reaper: session reuse disabled, not starting");
        return;
    }
    if (!bound_) {
        fleet_log_warn("reaper: no fleet bound, not starting");
        return;
    }
    if (running_) {
        fleet_log_debug("reaper: already running");
        return;
    }

    if (options_.session_max_idle < MIN_SESSION_MAX_IDLE) {
        fleet_log_warn(fmt::format(
            "reaper: session max idle of {}s is below the recommended minimum of {}s",
            options_.session_max_idle, MIN_SESSION_MAX_IDLE));
    }
    if (options_.session_reap_interval >= options_.session_max_idle) {
        fleet_log_warn(fmt::format(
            "reaper: reap interval ({}s) is not shorter than max idle ({}s), "
            "idle sessions may live up to twice as long as configured",
            options_.session_reap_interval, options_.session_max_idle));
    }

    state_ = make_state();
    running_ = true;
    thread_ = std::thread(&SessionReaper::reaper_loop, state_);
    fleet_log_info(fmt::format("reaper: started (max idle {}s, interval {}s)",
                               options_.session_max_idle, options_.session_reap_interval));
}

void SessionReaper::stop() {
    std::lock_guard<std::mutex> lock(state_mutex_);

    if (!running_) {
        fleet_log_debug("reaper: not running");
        return;
    }

    auto state = state_;
    bool finished = false;
    {
        std::unique_lock<std::mutex> sig_lock(state->mutex);
        state->stop_requested = true;
        state->cv.notify_all();
        finished = state->cv.wait_for(sig_lock, stop_timeout_,
                                      [&state] { return state->finished; });
    }

    if (finished) {
        if (thread_.joinable()) thread_.join();
        fleet_log_info("reaper: stopped");
    } else {
        fleet_log_warn(fmt::format("reaper: worker did not stop within {}ms, detaching",
                                   stop_timeout_.count()));
        if (thread_.joinable()) thread_.detach();
    }
    state_.reset();
    running_ = false;
}

bool SessionReaper::is_running() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return running_;
}

// ── Sweep ───────────────────────────────────────────────────

std::shared_ptr<SessionReaper::WorkerState> SessionReaper::make_state() const {
    auto state = std::make_shared<WorkerState>();
    state->sessions = sessions_;
    state->max_idle = std::chrono::seconds(options_.session_max_idle);
    state->interval = std::chrono::seconds(options_.session_reap_interval);
    state->now = now_;
    return state;
}

int SessionReaper::sweep() {
    std::shared_ptr<WorkerState> state;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        state = make_state();
    }
    return sweep_sessions(*state);
}

int SessionReaper::sweep_sessions(WorkerState& state) {
    auto now = state.now();
    int closed = 0;

    for (auto* session : state.sessions) {
        {
            // Once stop is requested the sessions may be on their way out
            std::lock_guard<std::mutex> lock(state.mutex);
            if (state.stop_requested) return closed;
        }

        const std::string host = session->target().host;
        try {
            auto last = session->last_used();
            if (!last) continue;
            if (now - *last > state.max_idle) {
                fleet_log_debug(fmt::format("reaper: closing idle session to {}", host));
                session->close(false);
                ++closed;
            }
        } catch (const std::exception& e) {
            fleet_log_warn(fmt::format("reaper: error closing session to {}: {}", host, e.what()));
        }
    }

    if (closed > 0) {
        fleet_log_info(fmt::format("reaper: closed {} idle session(s)", closed));
    }
    return closed;
}

// ── Worker loop ─────────────────────────────────────────────

void SessionReaper::reaper_loop(std::shared_ptr<WorkerState> state) {
    while (true) {
        sweep_sessions(*state);

        std::unique_lock<std::mutex> lock(state->mutex);
        if (state->cv.wait_for(lock, state->interval, [&] { return state->stop_requested; })) {
            break;
        }
    }

    std::lock_guard<std::mutex> lock(state->mutex);
    state->finished = true;
    state->cv.notify_all();
}
