//
// ShellConfig.h
// Obsidian Shell Runtime - Session Configuration
//
// Session settings read once at startup from a Lua configuration script.
// The script runs in a fresh Lua state and the recognized globals are read
// back from it; anything it does not set keeps its built-in default.
//

#ifndef OBSIDIAN_SHELL_CONFIG_H
#define OBSIDIAN_SHELL_CONFIG_H

#include <string>
#include <stdexcept>

namespace ObsidianShell {

// Raised for a configuration file that exists but cannot be used.
// Fatal at startup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

// Settings for the interpretation backend. Carried through to the
// interpreter, not consulted by the shell loop.
struct AIConfig {
    std::string modelPath;
    std::string apiEndpoint;
    int maxTokens;
    double temperature;

    AIConfig()
        : modelPath("/usr/share/obsidian/models/llm.onnx")
        , apiEndpoint("http://localhost:8000/ai")
        , maxTokens(512)
        , temperature(0.7) {}
};

struct ShellConfig {
    bool aiEnabled;
    bool guiEnabled;
    std::string historyPath;    // Already expanded (no leading ~)
    AIConfig aiConfig;

    ShellConfig();

    // Load from a Lua script. A missing file yields the defaults.
    // Throws ConfigError when the script fails to load or run, or sets a
    // recognized field to a value of the wrong type.
    static ShellConfig load(const std::string& path);

    // Load from Lua source text. `chunkName` is used in error messages.
    static ShellConfig loadFromString(const std::string& source,
                                      const std::string& chunkName = "=config");

    // Human-readable dump used by the `config` command
    std::string describe() const;
};

// Default location of the configuration script (unexpanded)
extern const char* const DEFAULT_CONFIG_PATH;

// Default history file (unexpanded)
extern const char* const DEFAULT_HISTORY_PATH;

// Expand a leading "~/" (or a bare "~") to $HOME. Other paths are returned as-is.
std::string expandHomePath(const std::string& path);

} // namespace ObsidianShell

#endif // OBSIDIAN_SHELL_CONFIG_H
