//
// history_store.cpp
// Obsidian Shell - Command History Storage
//
// The file is opened for each append and closed again; no handle is held
// between calls. A command containing a newline spans two lines of the file
// and loads back as two entries.
//

#include "history_store.h"
#include <cerrno>
#include <cstring>
#include <fstream>
#include <sys/stat.h>

namespace ObsidianShell {

HistoryStore::HistoryStore(const std::string& path)
    : m_path(path)
{
}

HistoryStore::~HistoryStore() {
}

bool HistoryStore::load() {
    if (m_path.empty()) {
        return true;
    }

    struct stat info;
    if (stat(m_path.c_str(), &info) != 0) {
        if (errno == ENOENT) {
            // No history yet
            return true;
        }
        m_lastError = "Cannot access history file " + m_path + ": " + std::strerror(errno);
        return false;
    }
    if (S_ISDIR(info.st_mode)) {
        m_lastError = "History path " + m_path + " is a directory";
        return false;
    }

    std::ifstream file(m_path);
    if (!file) {
        m_lastError = "Cannot open history file " + m_path;
        return false;
    }

    std::string line;
    while (std::getline(file, line)) {
        m_entries.push_back(line);
    }

    if (file.bad()) {
        m_lastError = "Error reading history file " + m_path;
        return false;
    }
    return true;
}

bool HistoryStore::add(const std::string& entry) {
    m_entries.push_back(entry);
    return appendToFile(entry);
}

bool HistoryStore::appendToFile(const std::string& entry) {
    if (m_path.empty()) {
        m_lastError = "History file disabled";
        return false;
    }

    std::ofstream file(m_path, std::ios::app);
    if (!file) {
        m_lastError = "Cannot open history file " + m_path + " for append";
        return false;
    }

    file << entry << '\n';
    file.flush();
    if (!file.good()) {
        m_lastError = "Error writing history file " + m_path;
        return false;
    }
    return true;
}

std::vector<std::string> HistoryStore::recent(size_t count) const {
    size_t start = m_entries.size() > count ? m_entries.size() - count : 0;
    return std::vector<std::string>(m_entries.begin() + start, m_entries.end());
}

const std::vector<std::string>& HistoryStore::getEntries() const {
    return m_entries;
}

std::string HistoryStore::getEntry(size_t index) const {
    if (index >= m_entries.size()) {
        return "";
    }
    return m_entries[index];
}

size_t HistoryStore::size() const {
    return m_entries.size();
}

bool HistoryStore::isEmpty() const {
    return m_entries.empty();
}

const std::string& HistoryStore::getPath() const {
    return m_path;
}

const std::string& HistoryStore::getLastError() const {
    return m_lastError;
}

} // namespace ObsidianShell
