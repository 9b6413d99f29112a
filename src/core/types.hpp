#pragma once

#include <string>
#include <optional>
#include <vector>
#include <chrono>
#include <cstdint>

// Result type for operations that can fail
template <typename T>
struct Result {
    bool success;
    T value;
    std::string error;

    static Result<T> Ok(T val) {
        return {true, std::move(val), ""};
    }

    static Result<T> Err(const std::string& err) {
        return {false, T{}, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Specialization for void
template <>
struct Result<void> {
    bool success;
    std::string error;

    static Result<void> Ok() {
        return {true, ""};
    }

    static Result<void> Err(const std::string& err) {
        return {false, err};
    }

    bool is_ok() const { return success; }
    bool is_err() const { return !success; }
};

// Why a command never produced an exit status. None means the remote
// command ran and exit_code is its real status.
enum class ChannelError {
    None,
    Connect,
    Auth,
    Timeout,
    Channel,
};

// SSH command execution result
struct SSHResult {
    int exit_code;
    std::string stdout_data;
    std::string stderr_data;
    ChannelError error = ChannelError::None;

    bool success() const { return exit_code == 0 && error == ChannelError::None; }
    bool failed() const { return !success(); }
    bool transport_failed() const { return error != ChannelError::None; }

    std::string get_output() const {
        return stdout_data.empty() ? stderr_data : stdout_data;
    }
};

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

// One pending software update on a host. Never mutated after construction.
struct Update {
    std::string name;
    std::string current_version;
    std::string new_version;
    std::optional<std::string> source;
    bool security = false;

    bool operator==(const Update& other) const {
        return name == other.name && current_version == other.current_version &&
               new_version == other.new_version && source == other.source &&
               security == other.security;
    }
    bool operator!=(const Update& other) const { return !(*this == other); }
};

// Platform facts returned by discovery
struct HostInfo {
    std::string os;
    std::optional<std::string> version;
    std::optional<std::string> flavor;
    std::optional<std::string> package_manager;
    bool supported = true;

    bool operator==(const HostInfo& other) const {
        return os == other.os && version == other.version && flavor == other.flavor &&
               package_manager == other.package_manager && supported == other.supported;
    }
};
