//
// command_line.cpp
// Obsidian Shell - Command Line Options
//
// Global flags may appear before or after the subcommand. `--interpret` is
// only accepted together with `exec`.
//

#include "command_line.h"
#include "../runtime/ShellConfig.h"
#include <ostream>
#include <vector>

namespace ObsidianShell {

CommandLineOptions::CommandLineOptions()
    : command(CliCommand::INTERACTIVE)
    , interpret(false)
    , forceAI(false)
    , forceGUI(false)
    , verbose(false)
    , debug(false)
    , configPath(DEFAULT_CONFIG_PATH)
{
}

bool parseCommandLine(int argc, const char* const argv[],
                      CommandLineOptions& options, std::string& error) {
    std::vector<std::string> positionals;
    bool seenSubcommand = false;

    for (int i = 1; i < argc; i++) {
        std::string arg = argv[i];

        if (arg == "-a" || arg == "--ai") {
            options.forceAI = true;
        } else if (arg == "-g" || arg == "--gui") {
            options.forceGUI = true;
        } else if (arg == "-v" || arg == "--verbose") {
            options.verbose = true;
        } else if (arg == "--debug") {
            options.debug = true;
        } else if (arg == "-i" || arg == "--interpret") {
            options.interpret = true;
        } else if (arg == "-c" || arg == "--config") {
            if (i + 1 >= argc) {
                error = "Option " + arg + " requires a path";
                return false;
            }
            options.configPath = argv[++i];
        } else if (arg.compare(0, 9, "--config=") == 0) {
            options.configPath = arg.substr(9);
        } else if (arg == "-h" || arg == "--help") {
            options.command = CliCommand::HELP;
            return true;
        } else if (arg == "-V" || arg == "--version") {
            options.command = CliCommand::VERSION;
            return true;
        } else if (arg == "--") {
            // Everything after -- belongs to the exec command
            for (i++; i < argc; i++) {
                positionals.push_back(argv[i]);
            }
        } else if (arg.size() > 1 && arg[0] == '-') {
            error = "Unknown option: " + arg;
            return false;
        } else if (!seenSubcommand) {
            seenSubcommand = true;
            if (arg == "exec") {
                options.command = CliCommand::EXEC;
            } else if (arg == "interactive") {
                options.command = CliCommand::INTERACTIVE;
            } else if (arg == "config") {
                options.command = CliCommand::CONFIG;
            } else if (arg == "update-models") {
                options.command = CliCommand::UPDATE_MODELS;
            } else {
                error = "Unknown command: " + arg;
                return false;
            }
        } else {
            positionals.push_back(arg);
        }
    }

    if (options.command == CliCommand::EXEC) {
        if (positionals.empty()) {
            error = "exec requires a command";
            return false;
        }
        for (size_t i = 0; i < positionals.size(); i++) {
            if (i > 0) {
                options.execCommand += " ";
            }
            options.execCommand += positionals[i];
        }
        return true;
    }

    if (!positionals.empty()) {
        error = "Unexpected argument: " + positionals[0];
        return false;
    }
    if (options.interpret) {
        error = "--interpret is only valid with exec";
        return false;
    }
    return true;
}

void printUsage(std::ostream& out, const std::string& programName) {
    out << "Usage: " << programName << " [options] [command]\n";
    out << "\n";
    out << "AI-powered shell for Obsidian OS\n";
    out << "\n";
    out << "Commands:\n";
    out << "  exec <command> [--interpret]  Execute a single command\n";
    out << "  interactive                   Start the interactive shell (default)\n";
    out << "  config                        Show the effective configuration\n";
    out << "  update-models                 Update AI models\n";
    out << "\n";
    out << "Options:\n";
    out << "  -a, --ai             Enable AI assistance\n";
    out << "  -g, --gui            Enable GUI mode\n";
    out << "  -c, --config <path>  Configuration file (default: " << DEFAULT_CONFIG_PATH << ")\n";
    out << "  -i, --interpret      Interpret the exec command before running it\n";
    out << "  -v, --verbose        Show interpretation and dispatch steps\n";
    out << "      --debug          Print debug trace to stderr\n";
    out << "  -h, --help           Show this help\n";
    out << "  -V, --version        Show version\n";
}

} // namespace ObsidianShell
