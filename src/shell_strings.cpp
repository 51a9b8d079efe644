//
// shell_strings.cpp
// Obsidian Shell - String Helpers
//

#include "shell_strings.h"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace ObsidianShell {

// Same set as std::isspace in the "C" locale, which splitWhitespace uses
static const char* const WHITESPACE = " \t\r\n\v\f";

std::string trimWhitespace(const std::string& text) {
    size_t start = text.find_first_not_of(WHITESPACE);
    if (start == std::string::npos) {
        return "";
    }

    size_t end = text.find_last_not_of(WHITESPACE);
    return text.substr(start, end - start + 1);
}

std::string toLowerCase(const std::string& text) {
    std::string result = text;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool containsIgnoreCase(const std::string& haystack, const std::string& needle) {
    return toLowerCase(haystack).find(toLowerCase(needle)) != std::string::npos;
}

std::vector<std::string> splitWhitespace(const std::string& text) {
    std::vector<std::string> tokens;
    std::istringstream iss(text);
    std::string token;
    while (iss >> token) {
        tokens.push_back(token);
    }
    return tokens;
}

static bool isContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

size_t previousCharBoundary(const std::string& text, size_t pos) {
    if (pos > text.length()) {
        pos = text.length();
    }
    if (pos == 0) {
        return 0;
    }
    pos--;
    while (pos > 0 && isContinuationByte(text[pos])) {
        pos--;
    }
    return pos;
}

size_t nextCharBoundary(const std::string& text, size_t pos) {
    if (pos >= text.length()) {
        return text.length();
    }
    pos++;
    while (pos < text.length() && isContinuationByte(text[pos])) {
        pos++;
    }
    return pos;
}

size_t displayWidth(const std::string& text, size_t bytes) {
    if (bytes > text.length()) {
        bytes = text.length();
    }
    size_t width = 0;
    for (size_t i = 0; i < bytes; i++) {
        if (!isContinuationByte(text[i])) {
            width++;
        }
    }
    return width;
}

size_t displayWidth(const std::string& text) {
    return displayWidth(text, text.length());
}

} // namespace ObsidianShell
