//
// shell_core.h
// Obsidian Shell - Core Shell Functionality
//
// The read-dispatch loop. One ShellCore per process owns the session
// configuration, the history store, the interpreter and the executor.
//

#ifndef OBSIDIAN_SHELL_CORE_H
#define OBSIDIAN_SHELL_CORE_H

#include "history_store.h"
#include "../runtime/ShellConfig.h"
#include "../src/command_interpreter.h"
#include "../src/command_executor.h"
#include "../src/completion_provider.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace ObsidianShell {

/// Where the loop is in its cycle
enum class ShellState {
    PROMPTING,
    READING_INPUT,
    DISPATCHING,
    BUILTIN_HANDLING,
    INTERPRET_AND_EXECUTE,
    EXITED
};

/// Commands handled by the shell itself (exact, case-sensitive match)
enum class BuiltinCommand {
    NONE,
    HELP,
    CLEAR,
    HISTORY,
    EXIT        // "exit" or "quit"
};

class ShellCore {
public:
    ShellCore(const ShellConfig& config,
              std::unique_ptr<CommandInterpreter> interpreter,
              std::unique_ptr<CommandExecutor> executor,
              std::istream& input = std::cin,
              std::ostream& output = std::cout);
    ~ShellCore();

    // Session control
    void initialize(bool announce = true);
    void run();
    void quit();
    bool isRunning() const;
    ShellState getState() const;

    // Dispatch one line of input. Returns false if the command failed;
    // failures never end the session.
    bool executeCommand(const std::string& input);

    // One-shot execution for the `exec` subcommand. Returns an exit code.
    int executeOnce(const std::string& command, bool interpret);

    // Ask the interpreter backend to refresh its models
    bool updateModels();

    // Routing rules
    static BuiltinCommand classifyBuiltin(const std::string& trimmedInput);
    static bool shouldInterpret(const std::string& input);
    static const std::vector<std::string>& getInterpretTriggers();

    // Accessors
    const ShellConfig& getConfig() const;
    const HistoryStore& getHistory() const;

    // Output options
    void setVerbose(bool verbose);
    void setDebug(bool debug);
    void setLineEditing(bool enabled);
    bool isVerbose() const;
    bool isDebug() const;

    static const std::string SHELL_VERSION;
    static const size_t HISTORY_DISPLAY_COUNT;
    static const int ESCAPE_TIMEOUT_MS;

private:
    const ShellConfig m_config;
    std::unique_ptr<CommandInterpreter> m_interpreter;
    std::unique_ptr<CommandExecutor> m_executor;
    HistoryStore m_history;
    CompletionProvider m_completion;

    std::istream& m_in;
    std::ostream& m_out;

    ShellState m_state;
    bool m_running;
    bool m_verbose;
    bool m_debug;
    bool m_terminalInput;       // Raw-mode line editing on a tty

    // Line editor state
    int m_historyIndex;
    std::string m_promptText;
    size_t m_promptWidth;

    // Input
    void showPrompt();
    bool readInput(std::string& line);
    bool readInputWithHistory(std::string& line);
    bool inputPending();
    void redrawLine(const std::string& buffer, size_t cursorPos);

    // Built-in handlers
    bool handleHelp();
    bool handleClear();
    bool handleHistory();
    bool handleQuit();

    // Command dispatch
    InterpretResult runInterpreter(const std::string& input);
    bool interpretAndExecute(const std::string& input);
    bool executeCommandLine(const std::string& commandLine);

    // Output helpers
    void showBanner();
    void showHelp();
    void showError(const std::string& error);
    void showMessage(const std::string& message);
    void showSuccess(const std::string& message);
    void debugLog(const std::string& message);
};

} // namespace ObsidianShell

#endif // OBSIDIAN_SHELL_CORE_H
