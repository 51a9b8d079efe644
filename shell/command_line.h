//
// command_line.h
// Obsidian Shell - Command Line Options
//
// Parses the program's arguments into a subcommand plus global flags.
//

#ifndef OBSIDIAN_COMMAND_LINE_H
#define OBSIDIAN_COMMAND_LINE_H

#include <iosfwd>
#include <string>

namespace ObsidianShell {

enum class CliCommand {
    INTERACTIVE,    // Default when no subcommand is given
    EXEC,
    CONFIG,
    UPDATE_MODELS,
    HELP,
    VERSION
};

struct CommandLineOptions {
    CliCommand command;
    std::string execCommand;    // EXEC: positional words joined by spaces
    bool interpret;             // EXEC: --interpret
    bool forceAI;               // --ai
    bool forceGUI;              // --gui
    bool verbose;
    bool debug;
    std::string configPath;

    CommandLineOptions();
};

// Returns false and sets `error` on an unknown flag, a missing flag value,
// an unknown subcommand, or an `exec` without a command.
bool parseCommandLine(int argc, const char* const argv[],
                      CommandLineOptions& options, std::string& error);

void printUsage(std::ostream& out, const std::string& programName);

} // namespace ObsidianShell

#endif // OBSIDIAN_COMMAND_LINE_H
