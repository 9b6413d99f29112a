#pragma once

#include <atomic>
#include <mutex>
#include <string>
#include <platform/socket_util.hpp>
#include "connection.hpp"

// libssh2 forward declarations
typedef struct _LIBSSH2_SESSION LIBSSH2_SESSION;
typedef struct _LIBSSH2_CHANNEL LIBSSH2_CHANNEL;

// SSHConnection over libssh2. The TCP connection, handshake and
// authentication happen on the first run() after construction or close().
// Each command gets its own exec channel (no PTY), so stdout, stderr and
// the exit status come back separately.
class LibSSH2Connection : public SSHConnection {
public:
    explicit LibSSH2Connection(const SessionTarget& target);
    ~LibSSH2Connection() override;

    LibSSH2Connection(const LibSSH2Connection&) = delete;
    LibSSH2Connection& operator=(const LibSSH2Connection&) = delete;

    SSHResult run(const std::string& command, int timeout_secs = 0) override;
    bool is_connected() const override;
    void close() override;
    std::string target() const override { return target_str_; }

private:
    SSHResult establish();
    SSHResult open_socket();
    SSHResult authenticate();
    SSHResult exec(const std::string& command, int timeout_secs);
    void teardown(const char* reason);

    SessionTarget target_;
    std::string target_str_;
    LIBSSH2_SESSION* session_ = nullptr;
    socket_t sock_ = FLEETWATCH_INVALID_SOCKET;
    std::atomic<bool> active_{false};
    mutable std::mutex io_mutex_;
};

// Default ConnectionFactory for HostRecord sessions
std::unique_ptr<SSHConnection> make_libssh2_connection(const SessionTarget& target);
