//
// shell_core.cpp
// Obsidian Shell - Core Shell Functionality
//
// Main shell logic that ties together input, interpretation, execution and
// history. Provides the interactive shell experience.
//

#include "shell_core.h"
#include "../src/shell_strings.h"
#include <cstdio>
#include <filesystem>
#include <iomanip>
#include <sstream>
#include <utility>
#include <poll.h>
#include <termios.h>
#include <unistd.h>

namespace ObsidianShell {

// Static constants
const std::string ShellCore::SHELL_VERSION = "0.1.0";
const size_t ShellCore::HISTORY_DISPLAY_COUNT = 10;
const int ShellCore::ESCAPE_TIMEOUT_MS = 50;

ShellCore::ShellCore(const ShellConfig& config,
                     std::unique_ptr<CommandInterpreter> interpreter,
                     std::unique_ptr<CommandExecutor> executor,
                     std::istream& input,
                     std::ostream& output)
    : m_config(config)
    , m_interpreter(std::move(interpreter))
    , m_executor(std::move(executor))
    , m_history(config.historyPath)
    , m_in(input)
    , m_out(output)
    , m_state(ShellState::PROMPTING)
    , m_running(false)
    , m_verbose(false)
    , m_debug(false)
    , m_terminalInput(&input == &std::cin && isatty(STDIN_FILENO))
    , m_historyIndex(-1)
    , m_promptWidth(0)
{
}

ShellCore::~ShellCore() {
}

void ShellCore::initialize(bool announce) {
    if (announce) {
        showBanner();
    }

    if (!m_history.load()) {
        showError(m_history.getLastError());
    }
    debugLog("Loaded " + std::to_string(m_history.size()) + " history entries from " +
             m_history.getPath());

    if (m_config.aiEnabled && m_interpreter) {
        if (announce) {
            showMessage("Initializing AI engine...");
        }

        std::ostringstream log;
        bool ready = m_interpreter->initialize(log);
        if (announce || m_verbose) {
            m_out << log.str();
        }

        if (!ready) {
            showError("AI engine failed to initialize");
        } else if (announce) {
            showSuccess("AI engine ready!");
        }
    }
}

void ShellCore::run() {
    m_running = true;

    while (m_running) {
        m_state = ShellState::PROMPTING;
        showPrompt();

        m_state = ShellState::READING_INPUT;
        std::string input;
        if (!readInput(input)) {
            // End of input
            m_out << "\n";
            quit();
            break;
        }

        executeCommand(input);
    }
}

void ShellCore::quit() {
    m_running = false;
    m_state = ShellState::EXITED;
}

bool ShellCore::isRunning() const {
    return m_running;
}

ShellState ShellCore::getState() const {
    return m_state;
}

bool ShellCore::executeCommand(const std::string& input) {
    m_state = ShellState::DISPATCHING;

    std::string command = trimWhitespace(input);
    if (command.empty()) {
        m_state = ShellState::PROMPTING;
        return true;  // Just show prompt again
    }

    BuiltinCommand builtin = classifyBuiltin(command);
    if (builtin == BuiltinCommand::EXIT) {
        return handleQuit();
    }

    if (builtin != BuiltinCommand::NONE) {
        m_state = ShellState::BUILTIN_HANDLING;

        bool handled = false;
        switch (builtin) {
            case BuiltinCommand::HELP:
                handled = handleHelp();
                break;

            case BuiltinCommand::CLEAR:
                handled = handleClear();
                break;

            case BuiltinCommand::HISTORY:
                handled = handleHistory();
                break;

            default:
                break;
        }

        m_state = ShellState::PROMPTING;
        return handled;
    }

    m_state = ShellState::INTERPRET_AND_EXECUTE;

    // Raw input goes to history before anything can fail
    m_historyIndex = -1;
    if (!m_history.add(command)) {
        debugLog("History entry not persisted: " + m_history.getLastError());
    }

    bool success;
    if (m_config.aiEnabled && shouldInterpret(command)) {
        success = interpretAndExecute(command);
    } else {
        success = executeCommandLine(command);
    }

    m_state = ShellState::PROMPTING;
    return success;
}

int ShellCore::executeOnce(const std::string& command, bool interpret) {
    std::string trimmed = trimWhitespace(command);

    if (!interpret) {
        return executeCommandLine(trimmed) ? 0 : 1;
    }

    InterpretResult result = runInterpreter(trimmed);
    if (!result.success) {
        showError("AI interpretation failed: " + result.errorMessage);
        return 1;
    }

    showMessage("AI interpretation: " + result.command);
    return executeCommandLine(result.command) ? 0 : 1;
}

bool ShellCore::updateModels() {
    if (!m_interpreter) {
        showError("No interpreter backend configured");
        return false;
    }
    return m_interpreter->updateModels(m_out);
}

// Routing rules

BuiltinCommand ShellCore::classifyBuiltin(const std::string& trimmedInput) {
    if (trimmedInput == "help") {
        return BuiltinCommand::HELP;
    }
    if (trimmedInput == "clear") {
        return BuiltinCommand::CLEAR;
    }
    if (trimmedInput == "history") {
        return BuiltinCommand::HISTORY;
    }
    if (trimmedInput == "exit" || trimmedInput == "quit") {
        return BuiltinCommand::EXIT;
    }
    return BuiltinCommand::NONE;
}

const std::vector<std::string>& ShellCore::getInterpretTriggers() {
    static const std::vector<std::string> triggers = {
        "find", "search", "show", "list", "get", "create", "delete",
        "move", "copy", "open", "start", "stop", "install", "update"
    };
    return triggers;
}

bool ShellCore::shouldInterpret(const std::string& input) {
    std::string lowered = toLowerCase(input);
    for (const auto& trigger : getInterpretTriggers()) {
        if (lowered.find(trigger) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// Command dispatch

InterpretResult ShellCore::runInterpreter(const std::string& input) {
    if (!m_interpreter) {
        return InterpretResult::failure("no interpreter backend configured");
    }

    if (m_verbose) {
        m_out << "Interpreting...\n";
    }

    try {
        return m_interpreter->interpret(input);
    } catch (const std::exception& e) {
        debugLog(std::string("Interpreter threw: ") + e.what());
        return InterpretResult::failure(e.what());
    }
}

bool ShellCore::interpretAndExecute(const std::string& input) {
    InterpretResult result = runInterpreter(input);

    if (result.success) {
        showMessage("AI interpretation: " + result.command);
        return executeCommandLine(result.command);
    }

    showError("AI interpretation failed: " + result.errorMessage);
    showMessage("Executing original command...");
    return executeCommandLine(input);
}

bool ShellCore::executeCommandLine(const std::string& commandLine) {
    CommandLine cmd = splitCommandLine(commandLine);
    if (cmd.isEmpty()) {
        return true;
    }

    if (m_verbose) {
        m_out << "Executing: " << cmd.program << "\n";
    }

    ExecResult result = m_executor->execute(cmd.program, cmd.args);

    if (!result.success) {
        debugLog("Command " + cmd.program + " failed, exit code " + std::to_string(result.exitCode));
        showError(result.errorMessage);
        return false;
    }

    if (!result.output.empty()) {
        m_out << result.output;
        if (result.output.back() != '\n') {
            m_out << "\n";
        }
        m_out.flush();
    }
    return true;
}

// Built-in handlers

bool ShellCore::handleHelp() {
    showHelp();
    return true;
}

bool ShellCore::handleClear() {
    m_out << "\x1B[2J\x1B[1;1H";
    m_out.flush();
    return true;
}

bool ShellCore::handleHistory() {
    m_out << "\nCommand History:\n";
    m_out << "================\n";

    std::vector<std::string> entries = m_history.recent(HISTORY_DISPLAY_COUNT);
    for (size_t i = 0; i < entries.size(); i++) {
        m_out << std::setw(3) << (i + 1) << ": " << entries[i] << "\n";
    }
    m_out << "\n";
    return true;
}

bool ShellCore::handleQuit() {
    quit();
    return true;
}

// Input

void ShellCore::showPrompt() {
    std::string dirName = "~";
    std::error_code ec;
    std::filesystem::path cwd = std::filesystem::current_path(ec);
    if (!ec) {
        dirName = cwd.filename().empty() ? cwd.string() : cwd.filename().string();
    }

    m_promptWidth = displayWidth(dirName) + 3;
    if (m_terminalInput) {
        m_promptText = "\x1B[1;36m" + dirName + "\x1B[0m $ ";
    } else {
        m_promptText = dirName + " $ ";
    }

    m_out << m_promptText;
    m_out.flush();
}

bool ShellCore::readInput(std::string& line) {
    if (m_terminalInput) {
        return readInputWithHistory(line);
    }

    if (!std::getline(m_in, line)) {
        return false;
    }
    return true;
}

bool ShellCore::readInputWithHistory(std::string& line) {
    std::string buffer;
    size_t cursorPos = 0;
    bool done = false;
    bool endOfInput = false;

    // Save current terminal settings. The editor also runs over a plain
    // stream, in which case the terminal is left alone.
    struct termios oldTermios, newTermios;
    bool rawMode = &m_in == &std::cin && tcgetattr(STDIN_FILENO, &oldTermios) == 0;
    if (rawMode) {
        newTermios = oldTermios;

        // Character-at-a-time input; Ctrl+C arrives as a byte
        newTermios.c_lflag &= ~(ICANON | ECHO | ISIG);
        tcsetattr(STDIN_FILENO, TCSANOW, &newTermios);
    }

    const std::vector<std::string>& entries = m_history.getEntries();
    m_historyIndex = -1;

    while (!done) {
        int ch = m_in.get();

        if (ch == EOF) {
            endOfInput = buffer.empty();
            done = true;
        } else if (ch == '\n' || ch == '\r') {
            // Enter - accept input
            done = true;
            m_out << std::endl;
        } else if (ch == '\x1B') {  // ESC key
            // Arrow key sequences; a lone ESC is ignored
            if (inputPending() && m_in.peek() == '[') {
                m_in.get();  // consume '['
                int seq2 = m_in.get();
                switch (seq2) {
                    case 'A':  // Up arrow - previous command in history
                        if (!entries.empty()) {
                            if (m_historyIndex == -1) {
                                m_historyIndex = static_cast<int>(entries.size()) - 1;
                            } else if (m_historyIndex > 0) {
                                m_historyIndex--;
                            }
                            buffer = entries[m_historyIndex];
                            cursorPos = buffer.length();
                            redrawLine(buffer, cursorPos);
                        }
                        break;
                    case 'B':  // Down arrow - next command in history
                        if (!entries.empty() && m_historyIndex != -1) {
                            if (m_historyIndex < static_cast<int>(entries.size()) - 1) {
                                m_historyIndex++;
                                buffer = entries[m_historyIndex];
                            } else {
                                // Past the newest entry - clear line
                                m_historyIndex = -1;
                                buffer.clear();
                            }
                            cursorPos = buffer.length();
                            redrawLine(buffer, cursorPos);
                        }
                        break;
                    case 'C':  // Right arrow
                        if (cursorPos < buffer.length()) {
                            cursorPos = nextCharBoundary(buffer, cursorPos);
                            redrawLine(buffer, cursorPos);
                        }
                        break;
                    case 'D':  // Left arrow
                        if (cursorPos > 0) {
                            cursorPos = previousCharBoundary(buffer, cursorPos);
                            redrawLine(buffer, cursorPos);
                        }
                        break;
                    case 'H':  // Home
                        cursorPos = 0;
                        redrawLine(buffer, cursorPos);
                        break;
                    case 'F':  // End
                        cursorPos = buffer.length();
                        redrawLine(buffer, cursorPos);
                        break;
                }
            }
        } else if (ch == '\t') {
            std::vector<std::string> suggestions = m_completion.complete(buffer);
            if (suggestions.size() == 1) {
                buffer = suggestions[0];
                cursorPos = buffer.length();
                redrawLine(buffer, cursorPos);
            }
        } else if (ch == '\x7F' || ch == '\b') {  // Backspace
            if (cursorPos > 0) {
                size_t start = previousCharBoundary(buffer, cursorPos);
                buffer.erase(start, cursorPos - start);
                cursorPos = start;
                redrawLine(buffer, cursorPos);
            }
        } else if (ch == '\x03') {  // Ctrl+C - discard the line
            buffer.clear();
            done = true;
            m_out << "^C\n";
        } else if (ch == '\x04') {  // Ctrl+D - EOF on an empty line
            if (buffer.empty()) {
                endOfInput = true;
                done = true;
            }
        } else if (ch >= 32 && ch != 127) {  // Printable ASCII and UTF-8 bytes
            buffer.insert(cursorPos, 1, static_cast<char>(ch));
            cursorPos++;
            redrawLine(buffer, cursorPos);
        }
    }

    // Restore normal terminal mode
    if (rawMode) {
        tcsetattr(STDIN_FILENO, TCSANOW, &oldTermios);
    }

    if (endOfInput) {
        return false;
    }
    line = buffer;
    return true;
}

// True when another byte can be read without blocking. Escape sequences
// arrive in one burst, so a short wait tells ESC-[-A from a lone ESC.
bool ShellCore::inputPending() {
    if (m_in.rdbuf()->in_avail() > 0) {
        return true;
    }
    if (&m_in != &std::cin) {
        return false;
    }

    struct pollfd fd;
    fd.fd = STDIN_FILENO;
    fd.events = POLLIN;
    fd.revents = 0;
    return poll(&fd, 1, ESCAPE_TIMEOUT_MS) > 0;
}

void ShellCore::redrawLine(const std::string& buffer, size_t cursorPos) {
    m_out << "\r\x1B[K" << m_promptText << buffer;

    size_t column = m_promptWidth + displayWidth(buffer, cursorPos);
    m_out << "\r";
    if (column > 0) {
        m_out << "\x1B[" << column << "C";
    }
    m_out.flush();
}

// Information and help

void ShellCore::showBanner() {
    m_out << "Obsidian Shell v" << SHELL_VERSION << "\n";
    m_out << "AI-powered shell for Obsidian OS\n";
    m_out << "Type 'help' for available commands or 'exit' to quit.\n\n";
}

void ShellCore::showHelp() {
    m_out << "\nObsidian Shell Help\n";
    m_out << "===================\n";
    m_out << "Built-in commands:\n";
    m_out << "  help     - Show this help\n";
    m_out << "  clear    - Clear the screen\n";
    m_out << "  history  - Show command history\n";
    m_out << "  exit     - Exit the shell\n";
    m_out << "  quit     - Exit the shell\n";
    m_out << "\nAI Features:\n";
    if (m_config.aiEnabled) {
        m_out << "  Natural language commands are automatically interpreted\n";
    } else {
        m_out << "  Disabled (set ai_enabled = true or pass --ai)\n";
    }
    m_out << "  Examples:\n";
    m_out << "    'find all text files' -> 'find . -type f'\n";
    m_out << "    'show running processes' -> 'ps aux'\n";
    m_out << "    'install python package requests' -> 'apt install'\n";
    m_out << "\n";
}

// Configuration

const ShellConfig& ShellCore::getConfig() const {
    return m_config;
}

const HistoryStore& ShellCore::getHistory() const {
    return m_history;
}

void ShellCore::setVerbose(bool verbose) {
    m_verbose = verbose;
}

void ShellCore::setDebug(bool debug) {
    m_debug = debug;
}

void ShellCore::setLineEditing(bool enabled) {
    m_terminalInput = enabled;
}

bool ShellCore::isVerbose() const {
    return m_verbose;
}

bool ShellCore::isDebug() const {
    return m_debug;
}

// Utility functions

void ShellCore::showError(const std::string& error) {
    m_out << "Error: " << error << std::endl;
}

void ShellCore::showMessage(const std::string& message) {
    m_out << message << std::endl;
}

void ShellCore::showSuccess(const std::string& message) {
    m_out << message << std::endl;
}

void ShellCore::debugLog(const std::string& message) {
    if (m_debug) {
        fprintf(stderr, "DEBUG: %s\n", message.c_str());
        fflush(stderr);
    }
}

} // namespace ObsidianShell
