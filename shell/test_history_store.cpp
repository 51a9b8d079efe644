//
// test_history_store.cpp
// Obsidian Shell - HistoryStore Test
//
// Ordering, the recent() window, persistence round-trips and best-effort
// behaviour when the history file cannot be written.
//

#include "history_store.h"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <unistd.h>

using namespace ObsidianShell;

// Test counter
int g_testsPassed = 0;
int g_testsFailed = 0;

#define TEST(name) \
    void test_##name(); \
    void run_test_##name() { \
        std::cout << "Running test: " #name "..." << std::flush; \
        try { \
            test_##name(); \
            std::cout << " PASSED" << std::endl; \
            g_testsPassed++; \
        } catch (const std::exception& e) { \
            std::cout << " FAILED: " << e.what() << std::endl; \
            g_testsFailed++; \
        } catch (...) { \
            std::cout << " FAILED: Unknown exception" << std::endl; \
            g_testsFailed++; \
        } \
    } \
    void test_##name()

#define ASSERT(condition) \
    if (!(condition)) { \
        throw std::runtime_error("Assertion failed: " #condition); \
    }

#define ASSERT_EQ(a, b) \
    if ((a) != (b)) { \
        throw std::runtime_error(std::string("Assertion failed: ") + #a + " == " + #b); \
    }

// Temp file removed when the test finishes
struct TempHistoryFile {
    std::string path;

    explicit TempHistoryFile(const std::string& name) {
        std::filesystem::path dir = std::filesystem::temp_directory_path();
        path = (dir / ("obsidian_history_test_" + std::to_string(getpid()) + "_" + name)).string();
        std::remove(path.c_str());
    }

    ~TempHistoryFile() {
        std::remove(path.c_str());
    }
};

static std::vector<std::string> readLines(const std::string& path) {
    std::vector<std::string> lines;
    std::ifstream file(path);
    std::string line;
    while (std::getline(file, line)) {
        lines.push_back(line);
    }
    return lines;
}

// =============================================================================
// In-Memory Behaviour
// =============================================================================

TEST(empty_history) {
    HistoryStore history("");
    ASSERT(history.isEmpty());
    ASSERT_EQ(history.size(), 0u);
    ASSERT(history.recent(10).empty());
    ASSERT_EQ(history.getEntry(0), "");
}

TEST(insertion_order_kept) {
    HistoryStore history("");
    history.add("ls");
    history.add("pwd");
    history.add("ls");

    ASSERT_EQ(history.size(), 3u);
    ASSERT_EQ(history.getEntry(0), "ls");
    ASSERT_EQ(history.getEntry(1), "pwd");
    ASSERT_EQ(history.getEntry(2), "ls");
}

TEST(recent_window) {
    HistoryStore history("");
    for (int i = 1; i <= 5; i++) {
        history.add("cmd" + std::to_string(i));
    }

    auto lastTwo = history.recent(2);
    ASSERT_EQ(lastTwo.size(), 2u);
    ASSERT_EQ(lastTwo[0], "cmd4");
    ASSERT_EQ(lastTwo[1], "cmd5");

    auto all = history.recent(100);
    ASSERT_EQ(all.size(), 5u);
    ASSERT_EQ(all[0], "cmd1");
    ASSERT_EQ(all[4], "cmd5");

    ASSERT_EQ(history.recent(5).size(), 5u);
}

TEST(recent_zero_is_empty) {
    HistoryStore history("");
    history.add("a");
    ASSERT(history.recent(0).empty());
}

// =============================================================================
// Persistence
// =============================================================================

TEST(add_appends_one_line_per_entry) {
    TempHistoryFile file("append");
    HistoryStore history(file.path);

    ASSERT(history.add("echo one"));
    ASSERT(history.add("echo two"));

    auto lines = readLines(file.path);
    ASSERT_EQ(lines.size(), 2u);
    ASSERT_EQ(lines[0], "echo one");
    ASSERT_EQ(lines[1], "echo two");
}

TEST(round_trip_through_fresh_store) {
    TempHistoryFile file("roundtrip");
    {
        HistoryStore writer(file.path);
        writer.add("a");
        writer.add("b");
        writer.add("c");
    }

    HistoryStore reader(file.path);
    ASSERT(reader.load());
    ASSERT_EQ(reader.size(), 3u);
    ASSERT_EQ(reader.getEntry(0), "a");
    ASSERT_EQ(reader.getEntry(1), "b");
    ASSERT_EQ(reader.getEntry(2), "c");
}

TEST(load_missing_file_is_not_an_error) {
    TempHistoryFile file("missing");
    HistoryStore history(file.path);
    ASSERT(history.load());
    ASSERT(history.isEmpty());
}

TEST(load_then_add_appends_to_existing_log) {
    TempHistoryFile file("existing");
    {
        std::ofstream out(file.path);
        out << "old1\nold2\n";
    }

    HistoryStore history(file.path);
    ASSERT(history.load());
    history.add("new1");

    auto recent = history.recent(3);
    ASSERT_EQ(recent.size(), 3u);
    ASSERT_EQ(recent[0], "old1");
    ASSERT_EQ(recent[2], "new1");

    auto lines = readLines(file.path);
    ASSERT_EQ(lines.size(), 3u);
    ASSERT_EQ(lines[2], "new1");
}

TEST(load_directory_reports_error) {
    std::string dir = std::filesystem::temp_directory_path().string();
    HistoryStore history(dir);
    ASSERT(!history.load());
    ASSERT(!history.getLastError().empty());
    ASSERT(history.isEmpty());
}

// =============================================================================
// Best-Effort Persistence
// =============================================================================

TEST(write_failure_keeps_memory_entry) {
    HistoryStore history("/nonexistent-obsidian-dir/sub/history");

    bool persisted = history.add("ls -la");

    ASSERT(!persisted);
    ASSERT(!history.getLastError().empty());
    ASSERT_EQ(history.size(), 1u);
    ASSERT_EQ(history.getEntry(0), "ls -la");
}

TEST(memory_only_store) {
    HistoryStore history("");
    ASSERT(!history.add("whoami"));
    ASSERT_EQ(history.size(), 1u);
    ASSERT_EQ(history.recent(1)[0], "whoami");
}

int main() {
    std::cout << "========================================" << std::endl;
    std::cout << "HistoryStore Test Suite" << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << std::endl;

    // In-memory behaviour
    run_test_empty_history();
    run_test_insertion_order_kept();
    run_test_recent_window();
    run_test_recent_zero_is_empty();

    // Persistence
    run_test_add_appends_one_line_per_entry();
    run_test_round_trip_through_fresh_store();
    run_test_load_missing_file_is_not_an_error();
    run_test_load_then_add_appends_to_existing_log();
    run_test_load_directory_reports_error();

    // Best-effort persistence
    run_test_write_failure_keeps_memory_entry();
    run_test_memory_only_store();

    std::cout << std::endl;
    std::cout << "========================================" << std::endl;
    std::cout << "Test Results:" << std::endl;
    std::cout << "  Passed: " << g_testsPassed << std::endl;
    std::cout << "  Failed: " << g_testsFailed << std::endl;
    std::cout << "========================================" << std::endl;

    return g_testsFailed > 0 ? 1 : 0;
}
