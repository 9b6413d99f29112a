#include "config.hpp"
#include "errors.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>
#include <set>

namespace fs = std::filesystem;

static const std::set<std::string> KNOWN_OPTIONS = {
    "ssh_pipelining",
    "ssh_pipelining_lifetime",
    "ssh_pipelining_reap_interval",
    "default_sudo_policy",
    "stale_threshold",
    "max_threads",
    "default_timeout",
    "default_username",
    "log_level",
    "log_file",
};

class ConfigBuilder {
public:
    explicit ConfigBuilder(Config& config) : config_(config) {}

    void parse_options(const YAML::Node& node) {
        if (!node.IsMap()) {
            throw ConfigurationError("'options' must be a map");
        }
        FleetOptions& o = config_.options_;

        for (const auto& kv : node) {
            std::string key = kv.first.as<std::string>();
            if (!KNOWN_OPTIONS.count(key)) {
                config_.warnings_.push_back(
                    fmt::format("Unknown option '{}' ignored", key));
            }
        }

        o.session_reuse = node["ssh_pipelining"].as<bool>(o.session_reuse);
        o.session_max_idle = node["ssh_pipelining_lifetime"].as<int>(o.session_max_idle);
        o.session_reap_interval =
            node["ssh_pipelining_reap_interval"].as<int>(o.session_reap_interval);
        o.stale_threshold = node["stale_threshold"].as<int64_t>(o.stale_threshold);
        o.max_threads = node["max_threads"].as<int>(o.max_threads);
        o.default_timeout = node["default_timeout"].as<int>(o.default_timeout);
        o.log_level = node["log_level"].as<std::string>(o.log_level);
        o.log_file = node["log_file"].as<std::string>(o.log_file);

        if (node["default_sudo_policy"]) {
            o.default_privilege_policy =
                parse_privilege_policy(node["default_sudo_policy"].as<std::string>());
        }
        if (node["default_username"]) {
            o.default_username = node["default_username"].as<std::string>();
        }

        if (o.max_threads < 1) {
            throw ConfigurationError(fmt::format("max_threads must be at least 1 (got {})",
                                                 o.max_threads));
        }
        if (o.session_max_idle < 1 || o.session_reap_interval < 1) {
            throw ConfigurationError("ssh_pipelining_lifetime and ssh_pipelining_reap_interval "
                                     "must be positive");
        }
        if (o.default_timeout < 1) {
            throw ConfigurationError("default_timeout must be positive");
        }
    }

    void parse_hosts(const YAML::Node& node) {
        if (!node.IsSequence()) {
            throw ConfigurationError("'hosts' must be a list");
        }

        std::set<std::string> seen;
        std::set<std::string> dupes;
        for (const auto& h : node) {
            HostConfig host = parse_host(h);
            if (!seen.insert(host.name).second) {
                dupes.insert(host.name);
            }
            config_.hosts_.push_back(std::move(host));
        }

        if (!dupes.empty()) {
            std::string names;
            for (const auto& d : dupes) {
                if (!names.empty()) names += ", ";
                names += d;
            }
            throw ConfigurationError("Duplicate host names found in configuration: " + names);
        }
    }

private:
    static HostConfig parse_host(const YAML::Node& node) {
        if (!node.IsMap()) {
            throw ConfigurationError("Each host entry must be a map");
        }

        HostConfig host;
        host.name = node["name"].as<std::string>("");
        host.ip = node["ip"].as<std::string>("");
        if (host.name.empty() || host.ip.empty()) {
            throw ConfigurationError("Host entries require both 'name' and 'ip'");
        }
        host.port = node["port"].as<int>(DEFAULT_SSH_PORT);

        if (node["username"]) host.username = node["username"].as<std::string>();
        if (node["description"]) host.description = node["description"].as<std::string>();
        if (node["connect_timeout"]) host.connect_timeout = node["connect_timeout"].as<int>();
        if (node["ssh_key_path"]) host.ssh_key_path = node["ssh_key_path"].as<std::string>();
        if (node["sudo_policy"]) {
            host.sudo_policy = parse_privilege_policy(node["sudo_policy"].as<std::string>());
        }
        return host;
    }

    Config& config_;
};

fs::path Config::get_config_dir() {
    return platform::home_dir() / CONFIG_DIR_NAME;
}

fs::path Config::get_config_path() {
    return get_config_dir() / CONFIG_FILE_NAME;
}

bool config_exists(const fs::path& path) {
    return fs::exists(path);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config;
        ConfigBuilder builder(config);

        if (root.IsMap()) {
            for (const auto& kv : root) {
                std::string key = kv.first.as<std::string>();
                if (key != "options" && key != "hosts") {
                    config.warnings_.push_back(
                        fmt::format("Configuration key {} is not a valid root key, ignoring", key));
                }
            }
            if (root["options"]) builder.parse_options(root["options"]);
            if (root["hosts"]) builder.parse_hosts(root["hosts"]);
        } else if (root && !root.IsNull()) {
            return Result<Config>::Err("Configuration root must be a map");
        }

        return Result<Config>::Ok(std::move(config));
    } catch (const YAML::Exception& e) {
        return Result<Config>::Err("Invalid YAML: " + std::string(e.what()));
    } catch (const ConfigurationError& e) {
        return Result<Config>::Err(e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    if (!config_exists(path)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    std::ifstream in(path);
    if (!in) {
        return Result<Config>::Err("Unable to read config file " + path.string());
    }
    std::string text((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());

    auto result = parse(text);
    if (result.is_err()) {
        result.error = path.string() + ": " + result.error;
    }
    return result;
}

Result<void> create_default_config(const fs::path& path) {
    // Don't overwrite existing config
    if (fs::exists(path)) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# fleetwatch configuration

options:
  # Keep SSH sessions open between operations and reap idle ones
  ssh_pipelining: false
  ssh_pipelining_lifetime: 300      # seconds idle before a session is closed
  ssh_pipelining_reap_interval: 30  # seconds between idle checks

  default_sudo_policy: skip         # skip | nopasswd
  stale_threshold: 86400            # seconds before host data is stale
  default_timeout: 10               # ssh connect timeout, seconds
  max_threads: 15                   # hosts contacted in parallel
  # default_username: admin
  log_level: info

hosts: []
#  - name: web1
#    ip: 192.0.2.10
#    port: 22
#    username: admin
#    description: Frontend
#    sudo_policy: nopasswd
)";

    try {
        if (path.has_parent_path()) fs::create_directories(path.parent_path());
        std::ofstream out(path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}
