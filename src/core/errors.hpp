#pragma once

#include <stdexcept>
#include <string>
#include "types.hpp"

class SSHConnection;

// A remote command ran but its result could not be used.
class DataRefreshError : public std::runtime_error {
public:
    explicit DataRefreshError(const std::string& message,
                              std::string stdout_data = "",
                              std::string stderr_data = "")
        : std::runtime_error(message),
          stdout_(std::move(stdout_data)),
          stderr_(std::move(stderr_data)) {}

    const std::string& stdout_data() const { return stdout_; }
    const std::string& stderr_data() const { return stderr_; }

private:
    std::string stdout_;
    std::string stderr_;
};

// Host answered, but it runs something we cannot manage.
class UnsupportedPlatformError : public DataRefreshError {
public:
    using DataRefreshError::DataRefreshError;
};

// Host unreachable, or authentication failed.
class OfflineHostError : public DataRefreshError {
public:
    using DataRefreshError::DataRefreshError;
};

// Bad configuration value: unknown provider, unknown policy name, etc.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Host skipped because its fleet run was cancelled before it started.
class TaskCancelled : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Throw OfflineHostError if `result` never reached the remote command.
// Auth failures are rewritten into a message the user can act on.
void raise_if_offline(const SSHConnection& cx, const SSHResult& result);

// Human-readable reason for a transport failure.
std::string describe_channel_error(const std::string& target, const SSHResult& result);
