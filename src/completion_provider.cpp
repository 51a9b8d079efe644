//
// completion_provider.cpp
// Obsidian Shell - Tab Completion
//

#include "completion_provider.h"

namespace ObsidianShell {

CompletionProvider::CompletionProvider() {
}

std::vector<std::string> CompletionProvider::complete(const std::string& input) const {
    return {};
}

} // namespace ObsidianShell
