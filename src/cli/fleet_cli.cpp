#include "fleet_cli.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

FleetCLI::FleetCLI(std::filesystem::path config_path) : BaseCLI(std::move(config_path)) {
    register_all_commands();
}

void FleetCLI::register_all_commands() {
    register_host_task_commands(*this);
    register_connection_commands(*this);
    register_inventory_commands(*this);
    register_setup_commands(*this);
}

int FleetCLI::run_command(const std::string& command, const std::vector<std::string>& hosts) {
    fleet_log_debug(fmt::format("command: {} ({} hosts named)", command, hosts.size()));
    return execute_command(command, hosts);
}
