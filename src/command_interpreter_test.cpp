//
//  command_interpreter_test.cpp
//  Obsidian Shell - Command Interpreter Unit Tests
//
//  Decision table ordering, case handling and the identity fallback.
//

#include "command_interpreter.h"
#include "shell_strings.h"
#include <iostream>
#include <sstream>

using namespace ObsidianShell;

// Test counter
static int g_testsPassed = 0;
static int g_testsFailed = 0;

// Helper macros
#define TEST(name) void test_##name(); \
    struct TestRegistrar_##name { \
        TestRegistrar_##name() { runTest(#name, test_##name); } \
    } g_testRegistrar_##name; \
    void test_##name()

#define ASSERT(condition) \
    if (!(condition)) { \
        std::cerr << "FAILED: " << #condition << " at line " << __LINE__ << std::endl; \
        g_testsFailed++; \
        return; \
    }

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) { \
        std::cerr << "FAILED: " << #a << " != " << #b << " at line " << __LINE__ << std::endl; \
        std::cerr << "  Expected: " << (b) << std::endl; \
        std::cerr << "  Got:      " << (a) << std::endl; \
        g_testsFailed++; \
        return; \
    }

#define ASSERT_TRUE(condition) ASSERT(condition)
#define ASSERT_FALSE(condition) ASSERT(!(condition))

void runTest(const char* name, void (*testFunc)()) {
    std::cout << "Running test: " << name << "... ";
    int failedBefore = g_testsFailed;
    testFunc();
    if (g_testsFailed == failedBefore) {
        std::cout << "PASSED" << std::endl;
        g_testsPassed++;
    }
}

static std::string interpretOrFail(const std::string& input) {
    RuleBasedInterpreter interpreter;
    InterpretResult result = interpreter.interpret(input);
    if (!result.success) {
        return "<failed: " + result.errorMessage + ">";
    }
    return result.command;
}

// =============================================================================
// Decision Table
// =============================================================================

TEST(FindFilesRule) {
    ASSERT_EQ(interpretOrFail("find all text files"), "find . -type f");
    ASSERT_EQ(interpretOrFail("find file"), "find . -type f");
}

TEST(FindRequiresFile) {
    // "find" alone is not enough for the first rule
    ASSERT_EQ(interpretOrFail("find my keys"), "find my keys");
}

TEST(ProcessRule) {
    ASSERT_EQ(interpretOrFail("show running processes"), "ps aux");
    ASSERT_EQ(interpretOrFail("process list"), "ps aux");
}

TEST(InstallRuleHasNoArguments) {
    ASSERT_EQ(interpretOrFail("install python package requests"), "apt install");
    ASSERT_EQ(interpretOrFail("please install vim"), "apt install");
}

TEST(FirstMatchingRuleWins) {
    // Matches rules 1, 2 and 3; rule 1 comes first
    ASSERT_EQ(interpretOrFail("find the file for process install"), "find . -type f");
    // Matches rules 2 and 3
    ASSERT_EQ(interpretOrFail("install process monitor"), "ps aux");
}

TEST(MatchingIsCaseInsensitive) {
    ASSERT_EQ(interpretOrFail("FIND ALL FILES"), "find . -type f");
    ASSERT_EQ(interpretOrFail("Show Processes"), "ps aux");
    ASSERT_EQ(interpretOrFail("INSTALL"), "apt install");
}

TEST(NoMatchReturnsInputUnchanged) {
    ASSERT_EQ(interpretOrFail("echo Hello World"), "echo Hello World");
    ASSERT_EQ(interpretOrFail("ls -la /tmp"), "ls -la /tmp");
    ASSERT_EQ(interpretOrFail(""), "");
}

TEST(NoMatchIsNotAnError) {
    RuleBasedInterpreter interpreter;
    InterpretResult result = interpreter.interpret("uname -a");
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.errorMessage.empty());
}

TEST(InterpretationIsDeterministic) {
    RuleBasedInterpreter interpreter;
    const char* inputs[] = {
        "find all text files", "show running processes", "date", "Install Things"
    };
    for (const char* input : inputs) {
        InterpretResult first = interpreter.interpret(input);
        InterpretResult second = interpreter.interpret(input);
        ASSERT_EQ(first.success, second.success);
        ASSERT_EQ(first.command, second.command);
    }
}

// =============================================================================
// Backend Hooks
// =============================================================================

TEST(InitializeReportsModelPath) {
    AIConfig config;
    config.modelPath = "/opt/models/test.onnx";
    RuleBasedInterpreter interpreter(config);

    std::ostringstream log;
    ASSERT_TRUE(interpreter.initialize(log));
    ASSERT_TRUE(log.str().find("/opt/models/test.onnx") != std::string::npos);
}

TEST(UpdateModelsSucceeds) {
    RuleBasedInterpreter interpreter;
    std::ostringstream log;
    ASSERT_TRUE(interpreter.updateModels(log));
    ASSERT_FALSE(log.str().empty());
}

TEST(ResultFactories) {
    InterpretResult ok = InterpretResult::ok("ls");
    ASSERT_TRUE(ok.success);
    ASSERT_EQ(ok.command, "ls");

    InterpretResult failed = InterpretResult::failure("model offline");
    ASSERT_FALSE(failed.success);
    ASSERT_EQ(failed.errorMessage, "model offline");
}

// =============================================================================
// String Helpers
// =============================================================================

TEST(TrimWhitespace) {
    ASSERT_EQ(trimWhitespace("  ls -l \t\n"), "ls -l");
    ASSERT_EQ(trimWhitespace(" \t "), "");
    ASSERT_EQ(trimWhitespace("a  b"), "a  b");
    ASSERT_EQ(trimWhitespace("\v\f"), "");
    ASSERT_EQ(trimWhitespace("exit\f"), "exit");
}

TEST(TrimMatchesTokenizer) {
    const char* inputs[] = { " \v\t ", "\f ls \v", "\r\n" };
    for (const char* input : inputs) {
        std::vector<std::string> tokens = splitWhitespace(input);
        std::string trimmed = trimWhitespace(input);
        ASSERT_EQ(trimmed.empty(), tokens.empty());
        if (!tokens.empty()) {
            ASSERT_EQ(trimmed, tokens[0]);
        }
    }
}

TEST(CharBoundariesSkipContinuationBytes) {
    std::string text = "caf\xC3\xA9s";   // "cafés"
    ASSERT_EQ(previousCharBoundary(text, 5), 3u);
    ASSERT_EQ(previousCharBoundary(text, 3), 2u);
    ASSERT_EQ(previousCharBoundary(text, 0), 0u);
    ASSERT_EQ(nextCharBoundary(text, 3), 5u);
    ASSERT_EQ(nextCharBoundary(text, 5), 6u);
    ASSERT_EQ(nextCharBoundary(text, 6), 6u);
    ASSERT_EQ(displayWidth(text), 5u);
    ASSERT_EQ(displayWidth(text, 5), 4u);
}

TEST(ContainsIgnoreCase) {
    ASSERT_TRUE(containsIgnoreCase("Show Running Processes", "process"));
    ASSERT_FALSE(containsIgnoreCase("ls", "list"));
}

// =============================================================================
// Main Test Runner
// =============================================================================

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "CommandInterpreter Unit Tests" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    // Tests run automatically via static initialization

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Test Results" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Passed: " << g_testsPassed << std::endl;
    std::cout << "Failed: " << g_testsFailed << std::endl;
    std::cout << "Total:  " << (g_testsPassed + g_testsFailed) << std::endl;

    return g_testsFailed == 0 ? 0 : 1;
}
