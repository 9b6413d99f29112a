#pragma once

#include <memory>
#include <mutex>
#include <optional>
#include <core/types.hpp>
#include "connection.hpp"

// The one reusable connection a host owns.
//
// The handle is created on the first acquire() and kept until an explicit
// close(true). Every acquire() stamps last_used; the reaper uses that
// stamp to find idle sessions. All methods lock this session's own mutex,
// so the reaper closing a session and a worker acquiring it take turns,
// while sessions of different hosts never contend.
//
// acquire() hands out a shared_ptr so that a close(true) racing an
// in-flight command cannot free the handle under it.
class RemoteSession {
public:
    RemoteSession(SessionTarget target, ConnectionFactory factory);
    ~RemoteSession();

    RemoteSession(const RemoteSession&) = delete;
    RemoteSession& operator=(const RemoteSession&) = delete;

    std::shared_ptr<SSHConnection> acquire();

    // Last acquire() time, or nullopt when unused, closed, or dead.
    // A handle that reports not-connected clears the stamp.
    std::optional<TimePoint> last_used();

    // Close the handle if present. Errors are logged, never thrown.
    // clear_handle also drops the handle so the next acquire() builds a
    // fresh one.
    void close(bool clear_handle = true);

    bool has_handle() const;
    const SessionTarget& target() const { return target_; }

    // Test hook: pretend the last acquire() happened at `when`.
    void set_last_used(std::optional<TimePoint> when);

private:
    SessionTarget target_;
    ConnectionFactory factory_;
    std::shared_ptr<SSHConnection> handle_;
    std::optional<TimePoint> last_used_;
    mutable std::mutex mutex_;
};
