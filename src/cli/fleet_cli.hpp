#pragma once

#include "base_cli.hpp"
#include <filesystem>
#include <string>
#include <vector>

// Forward declarations for command registration
void register_host_task_commands(BaseCLI& cli);
void register_connection_commands(BaseCLI& cli);
void register_inventory_commands(BaseCLI& cli);
void register_setup_commands(BaseCLI& cli);

class FleetCLI : public BaseCLI {
public:
    explicit FleetCLI(std::filesystem::path config_path);

    // Run one command against the named hosts (all when empty)
    int run_command(const std::string& command, const std::vector<std::string>& hosts);

private:
    void register_all_commands();
};
