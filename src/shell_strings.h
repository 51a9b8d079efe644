//
// shell_strings.h
// Obsidian Shell - String Helpers
//
// Whitespace trimming, case folding and tokenizing shared by the shell loop,
// the interpreter and the process executor.
//

#ifndef OBSIDIAN_SHELL_STRINGS_H
#define OBSIDIAN_SHELL_STRINGS_H

#include <string>
#include <vector>

namespace ObsidianShell {

// Remove leading and trailing whitespace (space, tab, CR, LF, VT, FF)
std::string trimWhitespace(const std::string& text);

// ASCII lower-case copy
std::string toLowerCase(const std::string& text);

// Case-insensitive substring test
bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

// Split on runs of whitespace. No quoting or escaping is recognized.
std::vector<std::string> splitWhitespace(const std::string& text);

// UTF-8 cursor helpers for the line editor. Positions are byte offsets;
// continuation bytes (10xxxxxx) never start a character.
size_t previousCharBoundary(const std::string& text, size_t pos);
size_t nextCharBoundary(const std::string& text, size_t pos);

// Number of characters in the first `bytes` bytes of text
size_t displayWidth(const std::string& text, size_t bytes);
size_t displayWidth(const std::string& text);

} // namespace ObsidianShell

#endif // OBSIDIAN_SHELL_STRINGS_H
