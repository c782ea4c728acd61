#include "doc_chunker_utils.hpp"
#include "duckdb/common/string_util.hpp"
#include <algorithm>

namespace duckdb {

namespace doc_chunker {

static const char *const FENCE_DELIMITER = "```";
static constexpr size_t FENCE_WIDTH = 3;

//===--------------------------------------------------------------------===//
// Helpers
//===--------------------------------------------------------------------===//

// Byte positions of every non-overlapping fence delimiter, in document order
static std::vector<size_t> FindFenceDelimiters(const std::string &markdown_str) {
    std::vector<size_t> positions;
    size_t pos = markdown_str.find(FENCE_DELIMITER);
    while (pos != std::string::npos) {
        positions.push_back(pos);
        pos = markdown_str.find(FENCE_DELIMITER, pos + FENCE_WIDTH);
    }
    return positions;
}

// Treat the first line as a language tag when it is a short single token
static void SplitLanguageTag(const std::string &region, CodeBlock &block) {
    const size_t newline = region.find('\n');
    if (newline != std::string::npos) {
        std::string first_line = TrimCopy(region.substr(0, newline));
        if (!first_line.empty() && first_line.find(' ') == std::string::npos &&
            CodepointLength(first_line) < MAX_LANGUAGE_TAG_LENGTH) {
            block.language = std::move(first_line);
            block.code = TrimCopy(region.substr(newline + 1));
            return;
        }
    }
    block.language.clear();
    block.code = TrimCopy(region);
}

//===--------------------------------------------------------------------===//
// Code Block Extraction
//===--------------------------------------------------------------------===//

std::vector<CodeBlock> ExtractCodeBlocks(const std::string &markdown_str, idx_t min_length,
                                         const std::string &language_filter) {
    std::vector<CodeBlock> code_blocks;

    if (markdown_str.empty()) {
        return code_blocks;
    }

    const auto fences = FindFenceDelimiters(markdown_str);
    const auto offsets = CodepointOffsets(markdown_str);
    const idx_t length = offsets.size() - 1;

    auto to_codepoint = [&](size_t byte_pos) -> idx_t {
        return static_cast<idx_t>(std::lower_bound(offsets.begin(), offsets.end(), byte_pos) - offsets.begin());
    };

    // Delimiters pair up consecutively; a trailing unpaired one is ignored
    for (idx_t i = 0; i + 1 < fences.size(); i += 2) {
        const size_t open = fences[i];
        const size_t close = fences[i + 1];

        CodeBlock block;
        SplitLanguageTag(markdown_str.substr(open + FENCE_WIDTH, close - open - FENCE_WIDTH), block);

        if (CodepointLength(block.code) < min_length) {
            continue;
        }
        if (!language_filter.empty() && !StringUtil::CIEquals(block.language, language_filter)) {
            continue;
        }

        const idx_t open_cp = to_codepoint(open);
        const idx_t before_start = open_cp > CODE_CONTEXT_WINDOW ? open_cp - CODE_CONTEXT_WINDOW : 0;
        block.context_before = TrimCopy(markdown_str.substr(offsets[before_start], open - offsets[before_start]));

        const size_t after_pos = close + FENCE_WIDTH;
        const idx_t after_end = std::min(length, to_codepoint(after_pos) + CODE_CONTEXT_WINDOW);
        block.context_after = TrimCopy(markdown_str.substr(after_pos, offsets[after_end] - after_pos));

        code_blocks.push_back(std::move(block));
    }

    return code_blocks;
}

} // namespace doc_chunker

} // namespace duckdb
