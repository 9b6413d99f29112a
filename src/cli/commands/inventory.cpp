#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <fmt/format.h>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <providers/provider_factory.hpp>

static std::string yes_no(bool b) { return b ? "yes" : "no"; }

static int do_status(BaseCLI& cli, const BaseCLI::Args& args) {
    int rc = cli.run_fleet_task(HostTask::Discover, args, "discovered");
    if (!cli.fleet || cli.cancel.cancelled()) return rc;
    int refresh_rc = cli.run_fleet_task(HostTask::RefreshUpdates, args, "refreshed");
    if (rc == 0) rc = refresh_rc;
    if (cli.cancel.cancelled()) return rc;

    auto now = Clock::now();
    for (auto* host : cli.fleet->select(args)) {
        std::cout << theme::section(host->name());
        std::cout << theme::kv("Address", fmt::format("{}:{}", host->address(), host->port()));
        if (host->description()) std::cout << theme::kv("Description", *host->description());
        std::cout << theme::kv("State", host->online() ? theme::green("online")
                                                       : theme::red("offline"));
        if (!host->supported()) {
            std::cout << theme::kv("Platform", theme::yellow(
                host->os().value_or("unknown") + " (unsupported)"));
            continue;
        }
        if (host->os()) {
            std::cout << theme::kv("Platform", fmt::format("{} {} {}", *host->os(),
                                   host->flavor().value_or(""), host->version().value_or("")));
        }
        if (host->package_manager()) {
            std::cout << theme::kv("Packages", *host->package_manager());
        }
        std::cout << theme::kv("Privileges", to_string(host->privilege_policy()));
        if (host->last_refresh()) {
            std::cout << theme::kv("Refreshed", fmt::format("{} ago ({})",
                                   format_age(host->last_refresh(), now),
                                   format_utc_iso(*host->last_refresh())));
        } else {
            std::cout << theme::kv("Refreshed", "never");
        }
        if (host->is_stale(now)) std::cout << theme::kv("", theme::yellow("stale"));

        auto security = host->security_updates();
        std::cout << theme::kv("Updates", fmt::format("{} ({} security)",
                                                      host->updates().size(), security.size()));
        for (const auto& u : security) {
            std::cout << theme::kv("", theme::red(fmt::format("{} {} -> {}", u.name,
                                                              u.current_version, u.new_version)));
        }
    }
    std::cout << "\n";
    return rc;
}

static int do_privileges(BaseCLI& cli, const BaseCLI::Args& args) {
    if (!cli.require_config()) return 1;

    auto registry = ProviderFactory::registry();

    std::cout << theme::section("Policy");
    std::cout << theme::kv("Default", to_string(cli.fleet->options().default_privilege_policy));
    for (auto* host : cli.fleet->select(args)) {
        std::string policy = to_string(host->privilege_policy());
        if (host->privilege_override()) policy += theme::dim(" (host override)");
        std::cout << theme::kv(host->name(), policy);
    }

    // What each policy permits, per provider
    for (auto policy : {PrivilegePolicy::Skip, PrivilegePolicy::NoPasswd}) {
        std::cout << theme::section("Under " + to_string(policy));
        for (const auto& [name, info] : registry) {
            bool sync_ok = check_privilege_policy(info.reposync_requires_sudo, policy);
            bool updates_ok = check_privilege_policy(info.get_updates_requires_sudo, policy);
            std::cout << theme::kv(name, fmt::format("sync: {}  updates: {}",
                                                     yes_no(sync_ok), yes_no(updates_ok)));
        }
    }
    std::cout << "\n";
    return 0;
}

static int do_providers(BaseCLI& cli, const BaseCLI::Args& args) {
    std::cout << theme::section("Providers");
    for (const auto& [name, info] : ProviderFactory::registry()) {
        std::cout << theme::kv(name, info.description);
        std::cout << theme::kv("", theme::dim(fmt::format(
            "sync needs sudo: {}, updates need sudo: {}",
            yes_no(info.reposync_requires_sudo), yes_no(info.get_updates_requires_sudo))));
        for (const auto& cmd : info.sudo_commands) {
            std::cout << theme::kv("", theme::dim("sudoers: " + cmd));
        }
    }
    std::cout << "\n";
    return 0;
}

void register_inventory_commands(BaseCLI& cli) {
    cli.add_command("status", do_status, "Discover, refresh and summarize hosts");
    cli.add_command("privileges", do_privileges, "Show effective privilege policies");
    cli.add_command("providers", do_providers, "List package-manager providers");
}
