#pragma once

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <exception>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include <core/config.hpp>
#include "host_record.hpp"

// The operations the scheduler can fan out
enum class HostTask {
    Discover,
    SyncRepos,
    RefreshUpdates,
    Ping,
};

// "discover", "sync_repos", "refresh_updates", "ping".
// Throws ConfigurationError for anything else.
HostTask parse_host_task(const std::string& name);
std::string to_string(HostTask task);

// Run a task on one host, on the calling thread. The result is ping's
// return value for Ping and true for the other tasks.
bool run_host_task(HostTask task, HostRecord& host);

// Set once to stop a run from starting any more hosts. Hosts already
// in flight finish normally.
class CancelToken {
public:
    void cancel() { cancelled_.store(true); }
    bool cancelled() const { return cancelled_.load(); }
    void reset() { cancelled_.store(false); }

    // Address for set_interrupt_flag()
    std::atomic<bool>* flag() { return &cancelled_; }

private:
    std::atomic<bool> cancelled_{false};
};

// What one host's unit of work produced. error is null on success.
struct TaskOutcome {
    HostRecord* host = nullptr;
    bool result = false;
    std::exception_ptr error;

    bool ok() const { return !error; }
    std::string error_message() const;
};

// A run in progress. Outcomes come out in completion order, one per host,
// and each can be taken only once. Destroying the run before draining it
// cancels the hosts not yet started and waits for the rest.
class TaskRun {
public:
    TaskRun(TaskRun&&) noexcept;
    TaskRun& operator=(TaskRun&&) noexcept;
    ~TaskRun();

    TaskRun(const TaskRun&) = delete;
    TaskRun& operator=(const TaskRun&) = delete;

    // Block until the next outcome is ready. nullopt once all have been
    // taken.
    std::optional<TaskOutcome> next();

    // Drain what is left
    std::vector<TaskOutcome> collect();

    size_t total() const;

    class iterator {
    public:
        using iterator_category = std::input_iterator_tag;
        using value_type = TaskOutcome;
        using difference_type = std::ptrdiff_t;
        using pointer = TaskOutcome*;
        using reference = TaskOutcome&;

        iterator() = default;
        explicit iterator(TaskRun* run) : run_(run) { advance(); }

        reference operator*() { return *current_; }
        pointer operator->() { return &*current_; }
        iterator& operator++() { advance(); return *this; }

        bool operator==(const iterator& other) const { return run_ == other.run_; }
        bool operator!=(const iterator& other) const { return run_ != other.run_; }

    private:
        void advance();

        TaskRun* run_ = nullptr;
        std::optional<TaskOutcome> current_;
    };

    iterator begin() { return iterator(this); }
    iterator end() { return iterator(); }

private:
    friend class FleetScheduler;

    struct State {
        HostTask task;
        std::vector<HostRecord*> hosts;
        CancelToken* external_cancel = nullptr;
        std::atomic<bool> abandoned{false};
        std::atomic<size_t> next_index{0};

        std::mutex mutex;
        std::condition_variable cv;
        std::deque<TaskOutcome> ready;
        size_t taken = 0;
    };

    TaskRun(HostTask task, std::vector<HostRecord*> hosts, CancelToken* cancel, int max_threads);
    static void worker(State* state);
    void shutdown();

    std::unique_ptr<State> state_;
    std::vector<std::thread> workers_;
};

// Fans a HostTask out over hosts with at most max_threads at once.
// Each host's failure is confined to its own outcome.
class FleetScheduler {
public:
    explicit FleetScheduler(const FleetOptions& options) : options_(options) {}

    TaskRun run_task(HostTask task, const std::vector<HostRecord*>& hosts,
                     CancelToken* cancel = nullptr);

private:
    const FleetOptions& options_;
};
