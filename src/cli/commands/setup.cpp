#include "../base_cli.hpp"
#include "../theme.hpp"
#include <iostream>
#include <core/config.hpp>

static int do_init(BaseCLI& cli, const BaseCLI::Args& args) {
    if (config_exists(cli.config_path)) {
        std::cout << theme::info("Config already exists at " + cli.config_path.string());
        return 0;
    }

    auto result = create_default_config(cli.config_path);
    if (result.is_err()) {
        std::cout << theme::fail(result.error);
        return 1;
    }

    std::cout << theme::ok("Created " + cli.config_path.string());
    std::cout << theme::step("Add your hosts under 'hosts:' and run 'fleetwatch discover'.");
    return 0;
}

void register_setup_commands(BaseCLI& cli) {
    cli.add_command("init", do_init, "Write a starter configuration file");
}
