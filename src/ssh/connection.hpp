#pragma once

#include <memory>
#include <optional>
#include <string>
#include <functional>
#include <core/types.hpp>

// Where and how to reach one host.
struct SessionTarget {
    std::string host;
    int port = 22;
    std::string user;
    int timeout = 10;
    std::optional<std::string> ssh_key_path;
};

// A command-execution handle to one host. Implementations connect lazily
// on the first run() and may be closed and reused.
class SSHConnection {
public:
    virtual ~SSHConnection() = default;

    // Run a command. Transport problems come back as a non-None
    // SSHResult::error rather than as exceptions.
    virtual SSHResult run(const std::string& command, int timeout_secs = 0) = 0;

    // Run a command through `sudo -n` so it fails instead of prompting.
    SSHResult sudo(const std::string& command, int timeout_secs = 0) {
        return run("sudo -n " + command, timeout_secs);
    }

    virtual bool is_connected() const = 0;
    virtual void close() = 0;

    // "user@host:port", for messages
    virtual std::string target() const = 0;
};

using ConnectionFactory = std::function<std::unique_ptr<SSHConnection>(const SessionTarget&)>;
