#pragma once

#include <string>
#include <map>
#include <memory>
#include <functional>
#include <optional>
#include <vector>
#include <filesystem>
#include <core/config.hpp>
#include <managers/fleet.hpp>
#include <managers/fleet_scheduler.hpp>
#include <ssh/session_reaper.hpp>

class BaseCLI {
public:
    explicit BaseCLI(std::filesystem::path config_path);
    virtual ~BaseCLI();

    using Args = std::vector<std::string>;
    using CommandHandler = std::function<int(BaseCLI&, const Args&)>;

    void add_command(const std::string& name,
                    CommandHandler handler,
                    const std::string& help);

    // Load the config and build the fleet. Prints why on failure.
    bool require_config();

    // Returns the command's exit status
    int execute_command(const std::string& command, const Args& args = {});
    void print_help() const;

    // Fan a task out over the named hosts (all when empty), printing a
    // line per host as it completes. Returns 0 when every host succeeded.
    int run_fleet_task(HostTask task, const Args& hosts, const std::string& done_msg);

    // Public state
    std::filesystem::path config_path;
    std::optional<Config> config;
    std::unique_ptr<Fleet> fleet;
    std::unique_ptr<FleetScheduler> scheduler;
    std::unique_ptr<SessionReaper> reaper;
    CancelToken cancel;

protected:
    std::map<std::string, std::pair<CommandHandler, std::string>> commands_;
};
