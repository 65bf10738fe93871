#include "game/code_extractor.hpp"

#include <cctype>

#include "utils/common.hpp"

namespace gamesmith::game {
namespace {

constexpr const char* kFence = "```";
constexpr std::size_t kFenceSize = 3;

bool IsHintChar(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '+' || c == '.' ||
           c == '#' || c == '-';
}

// Position where the block body starts, given the index just past an opening fence.
std::size_t SkipLanguageHint(const std::string& text, std::size_t pos) {
    std::size_t cursor = pos;
    while (cursor < text.size() && IsHintChar(text[cursor])) {
        ++cursor;
    }
    // A hint only counts when nothing but blanks follows it on the fence line.
    std::size_t line_end = cursor;
    while (line_end < text.size() && (text[line_end] == ' ' || text[line_end] == '\t')) {
        ++line_end;
    }
    const bool hint_terminated = line_end == text.size() || text[line_end] == '\n' ||
                                 text[line_end] == '\r';
    if (cursor == pos || !hint_terminated) {
        cursor = pos;
    }
    while (cursor < text.size() && utils::IsSpace(text[cursor])) {
        ++cursor;
    }
    return cursor;
}

}  // namespace

std::vector<std::string> CodeExtractor::FindBlocks(const std::string& text) {
    std::vector<std::string> blocks;
    std::size_t search_from = 0;
    while (true) {
        const auto open = text.find(kFence, search_from);
        if (open == std::string::npos) {
            break;
        }
        const auto body = SkipLanguageHint(text, open + kFenceSize);
        const auto close = text.find(kFence, body);
        if (close == std::string::npos) {
            break;
        }
        blocks.push_back(text.substr(body, close - body));
        search_from = close + kFenceSize;
    }
    return blocks;
}

std::string CodeExtractor::Extract(const std::string& text) {
    const auto blocks = FindBlocks(text);
    if (blocks.empty()) {
        return utils::Trim(text);
    }
    const std::string* longest = &blocks.front();
    for (const auto& block : blocks) {
        if (block.size() > longest->size()) {
            longest = &block;
        }
    }
    return utils::Trim(*longest);
}

}  // namespace gamesmith::game
