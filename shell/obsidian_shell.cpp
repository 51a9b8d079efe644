//
// obsidian_shell.cpp
// Obsidian Shell - Program Entry Point
//
// Loads the configuration, applies command line overrides and runs the
// requested subcommand.
//

#include "command_line.h"
#include "shell_core.h"
#include "../runtime/ShellConfig.h"
#include "../src/command_executor.h"
#include "../src/command_interpreter.h"
#include <iostream>
#include <memory>

int main(int argc, char* argv[]) {
    using namespace ObsidianShell;

    // Buffered std::cin lets the line editor see pending escape-sequence bytes
    std::ios::sync_with_stdio(false);

    CommandLineOptions options;
    std::string error;
    if (!parseCommandLine(argc, argv, options, error)) {
        std::cerr << "Error: " << error << "\n\n";
        printUsage(std::cerr, argv[0]);
        return 1;
    }

    if (options.command == CliCommand::HELP) {
        printUsage(std::cout, argv[0]);
        return 0;
    }
    if (options.command == CliCommand::VERSION) {
        std::cout << "obsidian-shell " << ShellCore::SHELL_VERSION << "\n";
        return 0;
    }

    ShellConfig config;
    try {
        config = ShellConfig::load(options.configPath);
    } catch (const ConfigError& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    if (options.forceAI) {
        config.aiEnabled = true;
    }
    if (options.forceGUI) {
        config.guiEnabled = true;
    }

    if (options.command == CliCommand::CONFIG) {
        std::cout << config.describe();
        return 0;
    }

    ShellCore shell(config,
                    std::make_unique<RuleBasedInterpreter>(config.aiConfig),
                    std::make_unique<ProcessExecutor>());
    shell.setVerbose(options.verbose);
    shell.setDebug(options.debug);

    switch (options.command) {
        case CliCommand::EXEC:
            shell.initialize(false);
            return shell.executeOnce(options.execCommand, options.interpret);

        case CliCommand::UPDATE_MODELS:
            std::cout << "Updating AI models...\n";
            if (!shell.updateModels()) {
                std::cerr << "Error: Model update failed\n";
                return 1;
            }
            std::cout << "Models updated successfully!\n";
            return 0;

        case CliCommand::INTERACTIVE:
        default:
            shell.initialize();
            shell.run();
            return 0;
    }
}
