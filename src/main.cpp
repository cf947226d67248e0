#include "app_controller.h"
#include "config_loader.h"

#include <CLI/CLI.hpp>

#include <exception>
#include <iostream>
#include <string>

int main(int argc, char** argv) {
    CLI::App cli{"Scribble"};
    std::string config_path_cli;
    bool validation = false;
    bool write_config = false;
    auto opt_config = cli.add_option("-c,--config", config_path_cli,
        "Path to scribble.cfg file (defaults to scribble.cfg in current directory)");
    cli.add_flag("--validation", validation, "Enable Vulkan validation layers");
    cli.add_flag("--write-config", write_config, "Write the active configuration to the config path and exit");
    CLI11_PARSE(cli, argc, argv);

    try {
        scribble::AppConfigManager config;
        if (opt_config->count() > 0) {
            config.set_cli_config_path(config_path_cli);
        }
        config.reload();
        if (validation) {
            config.override_validation(true);
        }
        if (write_config) {
            return config.save_active_to_file() ? 0 : 1;
        }

        scribble::AppController controller(config.active());
        return controller.run();
    } catch (const std::exception& e) {
        std::cerr << "[app] fatal: " << e.what() << "\n";
        return 1;
    }
}
