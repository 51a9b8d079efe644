//
// command_executor.h
// Obsidian Shell - External Command Execution
//
// Runs a program with an argument vector, waits for it and captures both
// output streams. There is no shell in between: no quoting, globbing or
// metacharacter expansion is performed. There is also no timeout, so a child
// that never exits blocks the caller.
//

#ifndef OBSIDIAN_COMMAND_EXECUTOR_H
#define OBSIDIAN_COMMAND_EXECUTOR_H

#include <string>
#include <vector>

namespace ObsidianShell {

enum class ExecStatus {
    SUCCESS,        // Exit code 0
    SPAWN_FAILED,   // Program not found, not executable, fork/pipe failure
    NONZERO_EXIT    // Ran, but exited non-zero or was killed by a signal
};

struct ExecResult {
    bool success;
    ExecStatus status;
    int exitCode;               // -1 when the process never ran or was signalled
    std::string output;         // Captured stdout; only set on success
    std::string errorOutput;    // Captured stderr
    std::string errorMessage;   // Description for display (failures only)

    ExecResult() : success(false), status(ExecStatus::SPAWN_FAILED), exitCode(-1) {}
};

// A command line split into program and arguments
struct CommandLine {
    std::string program;
    std::vector<std::string> args;

    bool isEmpty() const { return program.empty(); }
};

// Split on whitespace: the first token is the program, the rest are arguments.
CommandLine splitCommandLine(const std::string& line);

class CommandExecutor {
public:
    virtual ~CommandExecutor() = default;

    virtual ExecResult execute(const std::string& program,
                               const std::vector<std::string>& args) = 0;
};

// fork/exec based executor. The program is looked up on PATH.
class ProcessExecutor : public CommandExecutor {
public:
    ProcessExecutor();

    ExecResult execute(const std::string& program,
                       const std::vector<std::string>& args) override;

private:
    static ExecResult spawnFailure(const std::string& program, int error);
};

} // namespace ObsidianShell

#endif // OBSIDIAN_COMMAND_EXECUTOR_H
