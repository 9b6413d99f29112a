#include "../base_cli.hpp"

static int do_discover(BaseCLI& cli, const BaseCLI::Args& args) {
    return cli.run_fleet_task(HostTask::Discover, args, "discovered");
}

static int do_sync(BaseCLI& cli, const BaseCLI::Args& args) {
    // Repositories can only be synced once the package manager is known
    int rc = cli.run_fleet_task(HostTask::Discover, args, "discovered");
    if (cli.cancel.cancelled()) return rc;
    int sync_rc = cli.run_fleet_task(HostTask::SyncRepos, args, "repositories synced");
    return rc != 0 ? rc : sync_rc;
}

static int do_refresh(BaseCLI& cli, const BaseCLI::Args& args) {
    int rc = cli.run_fleet_task(HostTask::Discover, args, "discovered");
    if (cli.cancel.cancelled()) return rc;
    int refresh_rc = cli.run_fleet_task(HostTask::RefreshUpdates, args, "refreshed");
    return rc != 0 ? rc : refresh_rc;
}

void register_host_task_commands(BaseCLI& cli) {
    cli.add_command("discover", do_discover, "Identify OS and package manager");
    cli.add_command("sync", do_sync, "Refresh remote package catalogs");
    cli.add_command("refresh", do_refresh, "Collect pending updates");
}
