//
// command_interpreter.cpp
// Obsidian Shell - Natural Language Command Interpretation
//

#include "command_interpreter.h"
#include "shell_strings.h"
#include <ostream>

namespace ObsidianShell {

InterpretResult InterpretResult::ok(const std::string& command) {
    InterpretResult result;
    result.success = true;
    result.command = command;
    return result;
}

InterpretResult InterpretResult::failure(const std::string& message) {
    InterpretResult result;
    result.success = false;
    result.errorMessage = message;
    return result;
}

const std::string RuleBasedInterpreter::LIST_FILES_COMMAND = "find . -type f";
const std::string RuleBasedInterpreter::LIST_PROCESSES_COMMAND = "ps aux";
const std::string RuleBasedInterpreter::PACKAGE_INSTALL_COMMAND = "apt install";

RuleBasedInterpreter::RuleBasedInterpreter(const AIConfig& config)
    : m_config(config)
{
}

InterpretResult RuleBasedInterpreter::interpret(const std::string& input) const {
    std::string lowered = toLowerCase(input);

    if (lowered.find("find") != std::string::npos &&
        lowered.find("file") != std::string::npos) {
        return InterpretResult::ok(LIST_FILES_COMMAND);
    }
    if (lowered.find("process") != std::string::npos) {
        return InterpretResult::ok(LIST_PROCESSES_COMMAND);
    }
    if (lowered.find("install") != std::string::npos) {
        // No package name extraction
        return InterpretResult::ok(PACKAGE_INSTALL_COMMAND);
    }

    return InterpretResult::ok(input);
}

bool RuleBasedInterpreter::initialize(std::ostream& log) {
    log << "Loading AI model from: " << m_config.modelPath << "\n";
    return true;
}

bool RuleBasedInterpreter::updateModels(std::ostream& log) {
    log << "Downloading latest AI models...\n";
    return true;
}

} // namespace ObsidianShell
