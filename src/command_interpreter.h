//
// command_interpreter.h
// Obsidian Shell - Natural Language Command Interpretation
//
// Maps free-form input to an executable command line. The shell loop only
// talks to the CommandInterpreter interface, so the rule table below can be
// replaced by a real inference backend without touching the loop.
//

#ifndef OBSIDIAN_COMMAND_INTERPRETER_H
#define OBSIDIAN_COMMAND_INTERPRETER_H

#include "../runtime/ShellConfig.h"
#include <iosfwd>
#include <string>

namespace ObsidianShell {

struct InterpretResult {
    bool success;
    std::string command;        // Command line to execute (valid when success)
    std::string errorMessage;   // Reason for failure (valid when !success)

    InterpretResult() : success(false) {}

    static InterpretResult ok(const std::string& command);
    static InterpretResult failure(const std::string& message);
};

class CommandInterpreter {
public:
    virtual ~CommandInterpreter() = default;

    /// Translate raw user input into a command line.
    /// Failure is reported in the result; backends may also throw
    /// std::exception, which callers treat the same way.
    virtual InterpretResult interpret(const std::string& input) const = 0;

    /// Prepare the backend. Progress is written to `log`.
    virtual bool initialize(std::ostream& log) { return true; }

    /// Refresh backend models. Progress is written to `log`.
    virtual bool updateModels(std::ostream& log) { return true; }
};

// =============================================================================
// RuleBasedInterpreter - fixed substring decision table
// =============================================================================
//
// Rules are checked in order and the first match wins:
//   "find" and "file"  ->  find . -type f
//   "process"          ->  ps aux
//   "install"          ->  apt install
// Anything else is returned unchanged.

class RuleBasedInterpreter : public CommandInterpreter {
public:
    explicit RuleBasedInterpreter(const AIConfig& config = AIConfig());

    InterpretResult interpret(const std::string& input) const override;
    bool initialize(std::ostream& log) override;
    bool updateModels(std::ostream& log) override;

    static const std::string LIST_FILES_COMMAND;
    static const std::string LIST_PROCESSES_COMMAND;
    static const std::string PACKAGE_INSTALL_COMMAND;

private:
    AIConfig m_config;
};

} // namespace ObsidianShell

#endif // OBSIDIAN_COMMAND_INTERPRETER_H
