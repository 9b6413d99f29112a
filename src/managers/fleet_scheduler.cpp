#include "fleet_scheduler.hpp"
#include <core/errors.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>

// ── Task names ──────────────────────────────────────────────

HostTask parse_host_task(const std::string& name) {
    std::string n = to_lower(trimmed(name));
    if (n == "discover") return HostTask::Discover;
    if (n == "sync_repos") return HostTask::SyncRepos;
    if (n == "refresh_updates") return HostTask::RefreshUpdates;
    if (n == "ping") return HostTask::Ping;
    throw ConfigurationError(fmt::format("Unknown host task: {}", name));
}

std::string to_string(HostTask task) {
    switch (task) {
        case HostTask::Discover: return "discover";
        case HostTask::SyncRepos: return "sync_repos";
        case HostTask::RefreshUpdates: return "refresh_updates";
        case HostTask::Ping: return "ping";
    }
    return "unknown";
}

bool run_host_task(HostTask task, HostRecord& host) {
    switch (task) {
        case HostTask::Discover:
            host.discover();
            return true;
        case HostTask::SyncRepos:
            host.sync_repos();
            return true;
        case HostTask::RefreshUpdates:
            host.refresh_updates();
            return true;
        case HostTask::Ping:
            return host.ping();
    }
    return false;
}

std::string TaskOutcome::error_message() const {
    if (!error) return "";
    try {
        std::rethrow_exception(error);
    } catch (const std::exception& e) {
        return e.what();
    } catch (...) {
        return "unknown error";
    }
}

// ── TaskRun ─────────────────────────────────────────────────

TaskRun::TaskRun(HostTask task, std::vector<HostRecord*> hosts, CancelToken* cancel,
                 int max_threads)
    : state_(std::make_unique<State>()) {
    state_->task = task;
    state_->hosts = std::move(hosts);
    state_->external_cancel = cancel;

    size_t pool = std::min<size_t>(static_cast<size_t>(std::max(max_threads, 1)),
                                   state_->hosts.size());
    workers_.reserve(pool);
    for (size_t i = 0; i < pool; ++i) {
        workers_.emplace_back(&TaskRun::worker, state_.get());
    }
    fleet_log_debug(fmt::format("scheduler: {} on {} hosts with {} workers",
                                to_string(task), state_->hosts.size(), pool));
}

TaskRun::TaskRun(TaskRun&& other) noexcept
    : state_(std::move(other.state_)), workers_(std::move(other.workers_)) {}

TaskRun& TaskRun::operator=(TaskRun&& other) noexcept {
    if (this != &other) {
        shutdown();
        state_ = std::move(other.state_);
        workers_ = std::move(other.workers_);
    }
    return *this;
}

TaskRun::~TaskRun() {
    shutdown();
}

void TaskRun::shutdown() {
    if (!state_) return;
    state_->abandoned.store(true);
    for (auto& t : workers_) {
        if (t.joinable()) t.join();
    }
    workers_.clear();
}

void TaskRun::worker(State* state) {
    while (true) {
        size_t index = state->next_index.fetch_add(1);
        if (index >= state->hosts.size()) return;

        TaskOutcome outcome;
        outcome.host = state->hosts[index];

        bool cancelled = state->abandoned.load() ||
                         (state->external_cancel && state->external_cancel->cancelled());
        if (cancelled) {
            outcome.error = std::make_exception_ptr(TaskCancelled(
                fmt::format("{} cancelled before it started on {}",
                            to_string(state->task), outcome.host->name())));
        } else {
            try {
                outcome.result = run_host_task(state->task, *outcome.host);
            } catch (...) {
                outcome.error = std::current_exception();
            }
            if (outcome.error) {
                fleet_log_debug(fmt::format("scheduler: {} failed on {}: {}",
                                            to_string(state->task), outcome.host->name(),
                                            outcome.error_message()));
            }
        }

        {
            std::lock_guard<std::mutex> lock(state->mutex);
            state->ready.push_back(std::move(outcome));
        }
        state->cv.notify_one();
    }
}

std::optional<TaskOutcome> TaskRun::next() {
    if (!state_) return std::nullopt;

    std::unique_lock<std::mutex> lock(state_->mutex);
    if (state_->taken >= state_->hosts.size()) return std::nullopt;

    state_->cv.wait(lock, [this] { return !state_->ready.empty(); });
    TaskOutcome outcome = std::move(state_->ready.front());
    state_->ready.pop_front();
    ++state_->taken;
    return outcome;
}

std::vector<TaskOutcome> TaskRun::collect() {
    std::vector<TaskOutcome> out;
    while (auto outcome = next()) {
        out.push_back(std::move(*outcome));
    }
    return out;
}

size_t TaskRun::total() const {
    return state_ ? state_->hosts.size() : 0;
}

void TaskRun::iterator::advance() {
    current_ = run_ ? run_->next() : std::nullopt;
    if (!current_) run_ = nullptr;
}

// ── FleetScheduler ──────────────────────────────────────────

TaskRun FleetScheduler::run_task(HostTask task, const std::vector<HostRecord*>& hosts,
                                 CancelToken* cancel) {
    return TaskRun(task, hosts, cancel, options_.max_threads);
}
