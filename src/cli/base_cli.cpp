#include "base_cli.hpp"
#include "theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/errors.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>

BaseCLI::BaseCLI(std::filesystem::path path) : config_path(std::move(path)) {}

BaseCLI::~BaseCLI() {
    if (reaper) reaper->stop();
    if (fleet) fleet->close_all();
}

void BaseCLI::add_command(const std::string& name,
                         CommandHandler handler,
                         const std::string& help) {
    commands_[name] = {handler, help};
}

bool BaseCLI::require_config() {
    if (fleet) return true;

    if (!config_exists(config_path)) {
        std::cout << theme::fail("No configuration at " + config_path.string());
        std::cout << theme::step("Run 'fleetwatch init' to create one.");
        return false;
    }

    auto result = Config::load(config_path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return false;
    }
    config = result.value;

    const auto& opts = config->options();
    set_log_file(opts.log_file.empty() ? default_log_path()
                                       : std::filesystem::path(opts.log_file));
    auto level = parse_log_level(opts.log_level);
    if (level.is_ok()) {
        set_log_level(level.value);
    } else {
        std::cout << theme::fail(level.error);
    }

    for (const auto& w : config->warnings()) {
        fleet_log_warn(w);
        std::cout << theme::log(w);
    }

    fleet = std::make_unique<Fleet>(opts, config->hosts());
    scheduler = std::make_unique<FleetScheduler>(fleet->options());
    reaper = std::make_unique<SessionReaper>(fleet->options());
    reaper->bind(fleet->sessions());
    reaper->start();
    return true;
}

int BaseCLI::execute_command(const std::string& command, const Args& args) {
    auto it = commands_.find(command);
    if (it == commands_.end()) {
        std::cout << theme::fail("Unknown command: " + command);
        std::cout << theme::step("Run 'fleetwatch --help' for available commands.");
        return 1;
    }

    try {
        return it->second.first(*this, args);
    } catch (const std::exception& e) {
        fleet_log_error(fmt::format("{}: {}", command, e.what()));
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}

void BaseCLI::print_help() const {
    std::vector<std::pair<std::string, std::vector<std::string>>> categories = {
        {"Hosts",     {"discover", "ping", "sync", "refresh"}},
        {"Inventory", {"status", "connections", "privileges", "providers"}},
        {"Setup",     {"init"}},
    };

    for (const auto& [cat_name, cmd_names] : categories) {
        std::cout << "\n" << theme::color::BROWN << theme::color::BOLD
                  << "  " << cat_name << theme::color::RESET << "\n";

        for (const auto& name : cmd_names) {
            auto it = commands_.find(name);
            if (it != commands_.end()) {
                std::cout << theme::color::BLUE
                          << fmt::format("    {:<14}", name)
                          << theme::color::RESET
                          << theme::color::DIM
                          << it->second.second
                          << theme::color::RESET << "\n";
            }
        }
    }
    std::cout << "\n";
}

int BaseCLI::run_fleet_task(HostTask task, const Args& hosts, const std::string& done_msg) {
    if (!require_config()) return 1;

    auto selected = fleet->select(hosts);
    if (selected.empty()) {
        std::cout << theme::info("No hosts configured.");
        return 0;
    }

    cancel.reset();
    platform::set_interrupt_flag(cancel.flag());

    int failures = 0;
    int cancelled = 0;
    auto run = scheduler->run_task(task, selected, &cancel);
    for (auto& outcome : run) {
        const auto& name = outcome.host->name();
        if (outcome.ok()) {
            std::string msg = done_msg;
            if (task == HostTask::Ping && !outcome.result) {
                std::cout << theme::host_line(name, false, "unreachable");
                ++failures;
                continue;
            }
            if (task == HostTask::RefreshUpdates) {
                msg = fmt::format("{} updates ({} security)",
                                  outcome.host->updates().size(),
                                  outcome.host->security_updates().size());
            }
            if (!outcome.host->supported()) msg = "unsupported platform, skipped";
            std::cout << theme::host_line(name, true, msg);
            continue;
        }

        try {
            std::rethrow_exception(outcome.error);
        } catch (const TaskCancelled&) {
            ++cancelled;
            continue;
        } catch (const std::exception& e) {
            std::cout << theme::host_line(name, false, e.what());
        }
        ++failures;
    }

    platform::set_interrupt_flag(nullptr);

    if (cancelled > 0) {
        std::cout << theme::info(fmt::format("Interrupted: {} host(s) not started", cancelled));
    }
    if (failures > 0) {
        std::cout << theme::fail(fmt::format("{} of {} host(s) failed", failures, run.total()));
        return 1;
    }
    return cancelled > 0 ? 130 : 0;
}
