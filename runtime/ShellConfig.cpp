//
// ShellConfig.cpp
// Obsidian Shell Runtime - Session Configuration Implementation
//
// The configuration script is ordinary Lua, e.g.
//
//   ai_enabled   = true
//   history_path = "~/.obsidian-shell-history"
//   ai_config    = { max_tokens = 256, temperature = 0.2 }
//

#include "ShellConfig.h"
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <memory>
#include <sstream>

extern "C" {
#include <lua.h>
#include <lualib.h>
#include <lauxlib.h>
}

namespace ObsidianShell {

const char* const DEFAULT_CONFIG_PATH = "~/.config/obsidian-shell/config.lua";
const char* const DEFAULT_HISTORY_PATH = "~/.obsidian-shell-history";

namespace {

using LuaStatePtr = std::unique_ptr<lua_State, void (*)(lua_State*)>;

LuaStatePtr newConfigState() {
    LuaStatePtr state(luaL_newstate(), lua_close);
    if (!state) {
        throw ConfigError("Cannot create Lua state for configuration");
    }

    // The script is a key/value document: no io, os, package or debug
    static const luaL_Reg libraries[] = {
        { "_G", luaopen_base },
        { LUA_STRLIBNAME, luaopen_string },
        { LUA_TABLIBNAME, luaopen_table },
        { LUA_MATHLIBNAME, luaopen_math },
        { nullptr, nullptr }
    };
    for (const luaL_Reg* lib = libraries; lib->func; lib++) {
        luaL_requiref(state.get(), lib->name, lib->func, 1);
        lua_pop(state.get(), 1);
    }
    return state;
}

std::string popErrorMessage(lua_State* L) {
    const char* message = lua_tostring(L, -1);
    std::string result = message ? message : "unknown error";
    lua_pop(L, 1);
    return result;
}

// The read* helpers inspect the value on top of the stack and pop it.
// A nil value leaves `out` untouched.

void readBoolean(lua_State* L, const std::string& key, bool& out) {
    int type = lua_type(L, -1);
    if (type == LUA_TBOOLEAN) {
        out = lua_toboolean(L, -1) != 0;
    } else if (type != LUA_TNIL) {
        lua_pop(L, 1);
        throw ConfigError("Configuration field '" + key + "' must be a boolean");
    }
    lua_pop(L, 1);
}

void readString(lua_State* L, const std::string& key, std::string& out) {
    int type = lua_type(L, -1);
    if (type == LUA_TSTRING) {
        out = lua_tostring(L, -1);
    } else if (type != LUA_TNIL) {
        lua_pop(L, 1);
        throw ConfigError("Configuration field '" + key + "' must be a string");
    }
    lua_pop(L, 1);
}

void readNumber(lua_State* L, const std::string& key, double& out) {
    int type = lua_type(L, -1);
    if (type == LUA_TNUMBER) {
        out = static_cast<double>(lua_tonumber(L, -1));
    } else if (type != LUA_TNIL) {
        lua_pop(L, 1);
        throw ConfigError("Configuration field '" + key + "' must be a number");
    }
    lua_pop(L, 1);
}

void readPositiveInteger(lua_State* L, const std::string& key, int& out) {
    double value = static_cast<double>(out);
    readNumber(L, key, value);
    if (value != std::floor(value) || value < 1.0 || value > 1.0e9) {
        throw ConfigError("Configuration field '" + key + "' must be a positive integer");
    }
    out = static_cast<int>(value);
}

void readAIConfig(lua_State* L, AIConfig& ai) {
    lua_getglobal(L, "ai_config");
    int type = lua_type(L, -1);
    if (type == LUA_TNIL) {
        lua_pop(L, 1);
        return;
    }
    if (type != LUA_TTABLE) {
        lua_pop(L, 1);
        throw ConfigError("Configuration field 'ai_config' must be a table");
    }

    // Pop the table on the way out, including when a field is rejected
    try {
        lua_getfield(L, -1, "model_path");
        readString(L, "ai_config.model_path", ai.modelPath);
        lua_getfield(L, -1, "api_endpoint");
        readString(L, "ai_config.api_endpoint", ai.apiEndpoint);
        lua_getfield(L, -1, "max_tokens");
        readPositiveInteger(L, "ai_config.max_tokens", ai.maxTokens);
        lua_getfield(L, -1, "temperature");
        readNumber(L, "ai_config.temperature", ai.temperature);
    } catch (const ConfigError&) {
        lua_pop(L, 1);
        throw;
    }
    lua_pop(L, 1);
}

// Run the chunk on top of the stack and collect the recognized globals
ShellConfig evaluateChunk(lua_State* L) {
    if (lua_pcall(L, 0, 0, 0) != 0) {
        throw ConfigError("Error running configuration: " + popErrorMessage(L));
    }

    ShellConfig config;

    lua_getglobal(L, "ai_enabled");
    readBoolean(L, "ai_enabled", config.aiEnabled);

    lua_getglobal(L, "gui_enabled");
    readBoolean(L, "gui_enabled", config.guiEnabled);

    std::string historyPath = DEFAULT_HISTORY_PATH;
    lua_getglobal(L, "history_path");
    readString(L, "history_path", historyPath);
    config.historyPath = expandHomePath(historyPath);

    readAIConfig(L, config.aiConfig);
    return config;
}

bool fileExists(const std::string& filename) {
    std::ifstream file(filename);
    return file.good();
}

} // namespace

ShellConfig::ShellConfig()
    : aiEnabled(true)
    , guiEnabled(false)
    , historyPath(expandHomePath(DEFAULT_HISTORY_PATH))
{
}

ShellConfig ShellConfig::load(const std::string& path) {
    std::string fullPath = expandHomePath(path);
    if (!fileExists(fullPath)) {
        return ShellConfig();
    }

    LuaStatePtr state = newConfigState();
    if (luaL_loadfile(state.get(), fullPath.c_str()) != 0) {
        throw ConfigError("Failed to parse configuration file: " + popErrorMessage(state.get()));
    }
    return evaluateChunk(state.get());
}

ShellConfig ShellConfig::loadFromString(const std::string& source, const std::string& chunkName) {
    LuaStatePtr state = newConfigState();
    if (luaL_loadbuffer(state.get(), source.data(), source.size(), chunkName.c_str()) != 0) {
        throw ConfigError("Failed to parse configuration: " + popErrorMessage(state.get()));
    }
    return evaluateChunk(state.get());
}

std::string ShellConfig::describe() const {
    std::ostringstream oss;
    oss << "Obsidian Shell Configuration\n";
    oss << "============================\n";
    oss << std::boolalpha;
    oss << "AI Enabled: " << aiEnabled << "\n";
    oss << "GUI Enabled: " << guiEnabled << "\n";
    oss << "History Path: " << historyPath << "\n";
    oss << "Model Path: " << aiConfig.modelPath << "\n";
    oss << "API Endpoint: " << aiConfig.apiEndpoint << "\n";
    oss << "Max Tokens: " << aiConfig.maxTokens << "\n";
    oss << "Temperature: " << aiConfig.temperature << "\n";
    return oss.str();
}

std::string expandHomePath(const std::string& path) {
    if (path.empty() || path[0] != '~') {
        return path;
    }
    if (path.size() > 1 && path[1] != '/') {
        // ~user forms are left alone
        return path;
    }

    const char* home = getenv("HOME");
    if (!home) {
        return path;
    }
    return std::string(home) + path.substr(1);
}

} // namespace ObsidianShell
