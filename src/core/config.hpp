#pragma once

#include <string>
#include <optional>
#include <vector>
#include <filesystem>
#include "types.hpp"
#include "constants.hpp"
#include "privilege.hpp"

namespace fs = std::filesystem;

// Process-wide options. Built once at startup and passed by reference to
// everything that needs it; nothing reads it through a global.
struct FleetOptions {
    bool session_reuse = false;
    int session_max_idle = DEFAULT_SESSION_MAX_IDLE;
    int session_reap_interval = DEFAULT_SESSION_REAP_INTERVAL;
    PrivilegePolicy default_privilege_policy = PrivilegePolicy::Skip;
    int64_t stale_threshold = DEFAULT_STALE_THRESHOLD;
    int max_threads = DEFAULT_MAX_THREADS;
    int default_timeout = DEFAULT_CONNECT_TIMEOUT;
    std::optional<std::string> default_username;
    std::string log_level = "info";
    std::string log_file;                        // empty: <temp>/fleetwatch.log
};

// One entry of the `hosts:` list
struct HostConfig {
    std::string name;
    std::string ip;
    int port = DEFAULT_SSH_PORT;
    std::optional<std::string> username;
    std::optional<std::string> description;
    std::optional<int> connect_timeout;
    std::optional<PrivilegePolicy> sudo_policy;
    std::optional<std::string> ssh_key_path;
};

class Config {
public:
    // Load from a YAML file
    static Result<Config> load(const fs::path& path = get_config_path());

    // Parse YAML text (used by load and by tests)
    static Result<Config> parse(const std::string& yaml_text);

    const FleetOptions& options() const { return options_; }
    const std::vector<HostConfig>& hosts() const { return hosts_; }
    const std::vector<std::string>& warnings() const { return warnings_; }

    static fs::path get_config_dir();
    static fs::path get_config_path();

public:
    Config() = default;

private:
    FleetOptions options_;
    std::vector<HostConfig> hosts_;
    std::vector<std::string> warnings_;

    friend class ConfigBuilder;
};

bool config_exists(const fs::path& path = Config::get_config_path());

// Write a commented starter config. Does not overwrite an existing file.
Result<void> create_default_config(const fs::path& path = Config::get_config_path());
