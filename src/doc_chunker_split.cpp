#include "doc_chunker_utils.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/exception.hpp"
#include <algorithm>

namespace duckdb {

namespace doc_chunker {

//===--------------------------------------------------------------------===//
// Split Rules
//===--------------------------------------------------------------------===//

const std::vector<SplitRule> &DefaultSplitRules() {
    // Cutting before a fence defers the whole block to the next chunk.
    // The sentence rule keeps the period with the chunk that owns it.
    static const std::vector<SplitRule> rules = {
        {"fence", "```", 0.3, 0},
        {"paragraph", "\n\n", 0.3, 0},
        {"sentence", ". ", 0.3, 1},
        {"line", "\n", 0.3, 0},
        {"space", " ", 0.1, 0},
    };
    return rules;
}

SplitPoint FindSplitPoint(const std::string &window, idx_t budget, const std::vector<SplitRule> &rules) {
    const auto offsets = CodepointOffsets(window);

    for (const auto &rule : rules) {
        const size_t byte_pos = window.rfind(rule.pattern);
        if (byte_pos == std::string::npos) {
            continue;
        }
        // Patterns are ASCII, so every match starts on a code point boundary
        const idx_t offset = static_cast<idx_t>(std::lower_bound(offsets.begin(), offsets.end(), byte_pos) -
                                                offsets.begin());
        if (static_cast<double>(offset) > rule.min_fraction * static_cast<double>(budget)) {
            return SplitPoint {offset + rule.cut_adjust, &rule};
        }
    }

    return SplitPoint {budget, nullptr};
}

//===--------------------------------------------------------------------===//
// Bounded Splitting
//===--------------------------------------------------------------------===//

idx_t ComputeBodyBudget(idx_t chunk_size, const std::string &owning_header) {
    if (owning_header.empty()) {
        return chunk_size;
    }
    const idx_t reserved = CodepointLength(owning_header) + 1;
    // A header that eats the whole budget falls back to the raw chunk size
    return reserved < chunk_size ? chunk_size - reserved : chunk_size;
}

std::vector<std::string> SplitWithinBudget(const std::string &text, idx_t budget) {
    if (budget == 0) {
        throw InvalidInputException("split budget must be greater than zero");
    }

    std::vector<std::string> pieces;
    const auto offsets = CodepointOffsets(text);
    const idx_t length = offsets.size() - 1;

    auto emit = [&](idx_t from, idx_t to) {
        std::string piece = TrimCopy(text.substr(offsets[from], offsets[to] - offsets[from]));
        if (!piece.empty()) {
            pieces.push_back(std::move(piece));
        }
    };

    idx_t start = 0;
    while (start < length) {
        if (length - start <= budget) {
            emit(start, length);
            break;
        }

        const idx_t window_end = start + budget;
        const std::string window = text.substr(offsets[start], offsets[window_end] - offsets[start]);
        const auto split = FindSplitPoint(window, budget);

        const idx_t end = start + split.offset;
        emit(start, end);
        start = end;
    }

    return pieces;
}

std::vector<std::string> InjectHeader(std::vector<std::string> chunks, const std::string &owning_header) {
    if (owning_header.empty()) {
        return chunks;
    }
    for (idx_t i = 1; i < chunks.size(); i++) {
        if (!StringUtil::StartsWith(chunks[i], owning_header)) {
            chunks[i] = owning_header + "\n" + chunks[i];
        }
    }
    return chunks;
}

std::vector<std::string> BoundSection(const std::string &section_text, const std::string &owning_header,
                                      idx_t chunk_size) {
    if (chunk_size == 0) {
        throw InvalidInputException("chunk_size must be greater than zero");
    }

    if (CodepointLength(section_text) <= chunk_size) {
        return {section_text};
    }

    const idx_t budget = ComputeBodyBudget(chunk_size, owning_header);
    return InjectHeader(SplitWithinBudget(section_text, budget), owning_header);
}

} // namespace doc_chunker

} // namespace duckdb
