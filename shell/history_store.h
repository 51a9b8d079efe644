//
// history_store.h
// Obsidian Shell - Command History Storage
//
// Append-only record of issued commands. Every entry is kept in memory and
// appended as one line to the history file. Entries are never rewritten or
// removed.
//

#ifndef OBSIDIAN_HISTORY_STORE_H
#define OBSIDIAN_HISTORY_STORE_H

#include <string>
#include <vector>

namespace ObsidianShell {

class HistoryStore {
public:
    // An empty path keeps history in memory only
    explicit HistoryStore(const std::string& path);
    ~HistoryStore();

    // Read the history file, appending its lines to memory.
    // A missing file is not an error.
    bool load();

    // Record a command. Returns false if the file append failed; the entry
    // is kept in memory either way, so callers are free to ignore the result.
    bool add(const std::string& entry);

    // The last min(count, size()) entries, oldest first
    std::vector<std::string> recent(size_t count) const;

    // Queries
    const std::vector<std::string>& getEntries() const;
    std::string getEntry(size_t index) const;
    size_t size() const;
    bool isEmpty() const;

    const std::string& getPath() const;
    const std::string& getLastError() const;

private:
    std::string m_path;
    std::vector<std::string> m_entries;
    std::string m_lastError;

    bool appendToFile(const std::string& entry);
};

} // namespace ObsidianShell

#endif // OBSIDIAN_HISTORY_STORE_H
