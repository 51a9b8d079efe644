//
// completion_provider.h
// Obsidian Shell - Tab Completion
//
// Suggestion source for the line editor's Tab key. No completion sources are
// implemented yet, so every query yields an empty list.
//

#ifndef OBSIDIAN_COMPLETION_PROVIDER_H
#define OBSIDIAN_COMPLETION_PROVIDER_H

#include <string>
#include <vector>

namespace ObsidianShell {

class CompletionProvider {
public:
    CompletionProvider();

    // Candidate replacements for the current input line
    std::vector<std::string> complete(const std::string& input) const;
};

} // namespace ObsidianShell

#endif // OBSIDIAN_COMPLETION_PROVIDER_H
