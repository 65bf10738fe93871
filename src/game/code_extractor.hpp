#pragma once

#include <string>
#include <vector>

namespace gamesmith::game {

class CodeExtractor {
public:
    // Returns the trimmed body of the longest ``` fenced block, or the whole
    // text trimmed when no complete block exists. Never fails.
    static std::string Extract(const std::string& text);

    // Untrimmed bodies of every complete fenced block, in document order.
    static std::vector<std::string> FindBlocks(const std::string& text);
};

}  // namespace gamesmith::game
