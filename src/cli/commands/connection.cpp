#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/time_utils.hpp>

static int do_ping(BaseCLI& cli, const BaseCLI::Args& args) {
    return cli.run_fleet_task(HostTask::Ping, args, "reachable");
}

static int do_connections(BaseCLI& cli, const BaseCLI::Args& args) {
    int rc = cli.run_fleet_task(HostTask::Ping, args, "reachable");
    if (!cli.fleet) return rc;

    std::cout << theme::section("Sessions");
    const auto& opts = cli.fleet->options();
    std::cout << theme::kv("Reuse", opts.session_reuse ? "on" : "off");
    if (opts.session_reuse) {
        std::cout << theme::kv("Max idle", format_duration(opts.session_max_idle));
        std::cout << theme::kv("Reap every", format_duration(opts.session_reap_interval));
        std::cout << theme::kv("Reaper", cli.reaper->is_running() ? "running" : "stopped");
    }
    std::cout << "\n";

    auto now = Clock::now();
    for (auto* host : cli.fleet->select(args)) {
        auto& session = host->session();
        auto last = session.last_used();
        std::string state;
        if (!session.has_handle()) {
            state = theme::dim("no session");
        } else if (!last) {
            state = theme::yellow("closed");
        } else {
            state = theme::green("open") + theme::dim(", idle " + format_age(last, now));
        }
        std::cout << theme::kv(host->name(),
                               fmt::format("{}@{}:{}  ", session.target().user,
                                           host->address(), host->port()) + state);
    }
    std::cout << "\n";
    return rc;
}

void register_connection_commands(BaseCLI& cli) {
    cli.add_command("ping", do_ping, "Check that hosts answer over SSH");
    cli.add_command("connections", do_connections, "Show per-host session state");
}
