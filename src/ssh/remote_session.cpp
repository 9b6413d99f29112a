#include "remote_session.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

RemoteSession::RemoteSession(SessionTarget target, ConnectionFactory factory)
    : target_(std::move(target)), factory_(std::move(factory)) {}

RemoteSession::~RemoteSession() {
    close(true);
}

std::shared_ptr<SSHConnection> RemoteSession::acquire() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!handle_) {
        handle_ = std::shared_ptr<SSHConnection>(factory_(target_));
    }
    last_used_ = Clock::now();
    return handle_;
}

std::optional<TimePoint> RemoteSession::last_used() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (last_used_ && (!handle_ || !handle_->is_connected())) {
        fleet_log_debug(fmt::format("{}: session no longer connected, clearing last used",
                                    target_.host));
        last_used_.reset();
    }
    return last_used_;
}

void RemoteSession::close(bool clear_handle) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (handle_) {
        try {
            handle_->close();
        } catch (const std::exception& e) {
            fleet_log_warn(fmt::format("Error closing session to {}: {}", target_.host, e.what()));
        }
    }
    last_used_.reset();
    if (clear_handle) {
        handle_.reset();
    }
}

bool RemoteSession::has_handle() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handle_ != nullptr;
}

void RemoteSession::set_last_used(std::optional<TimePoint> when) {
    std::lock_guard<std::mutex> lock(mutex_);
    last_used_ = when;
}
