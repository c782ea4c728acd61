#include "doc_chunker_utils.hpp"
#include "duckdb/common/string_util.hpp"

namespace duckdb {

namespace doc_chunker {

//===--------------------------------------------------------------------===//
// Line Classification
//===--------------------------------------------------------------------===//

int32_t AtxHeaderLevel(const std::string &line) {
    idx_t hashes = 0;
    while (hashes < line.size() && line[hashes] == '#') {
        hashes++;
    }
    if (hashes == 0 || hashes > 6 || hashes >= line.size()) {
        return 0;
    }
    // "#{1,6}" must be followed by at least one whitespace character
    return StringUtil::CharacterIsSpace(line[hashes]) ? static_cast<int32_t>(hashes) : 0;
}

bool IsFenceLine(const std::string &line) {
    return StringUtil::StartsWith(TrimCopy(line), "```");
}

//===--------------------------------------------------------------------===//
// Section Splitting
//===--------------------------------------------------------------------===//

std::vector<DocumentSection> SplitIntoSections(const std::string &text) {
    std::vector<DocumentSection> sections;

    if (text.empty()) {
        return sections;
    }

    FenceState fence = FenceState::IN_PROSE;
    std::vector<std::string> current_lines;
    std::string current_header;
    int32_t current_level = 0;
    idx_t section_start = 1;
    idx_t line_number = 0;

    auto flush = [&](idx_t last_line) {
        std::string content = TrimCopy(StringUtil::Join(current_lines, "\n"));
        if (content.empty()) {
            return;
        }
        DocumentSection section;
        section.header = current_header;
        section.level = current_level;
        section.content = std::move(content);
        section.start_line = section_start;
        section.end_line = last_line;
        sections.push_back(std::move(section));
    };

    size_t pos = 0;
    while (true) {
        const size_t newline = text.find('\n', pos);
        std::string line = text.substr(pos, newline == std::string::npos ? std::string::npos : newline - pos);
        line_number++;

        int32_t level = 0;
        if (IsFenceLine(line)) {
            // Fence markers always stay with the current section, even if they look like headers
            fence = fence == FenceState::IN_PROSE ? FenceState::IN_FENCE : FenceState::IN_PROSE;
            current_lines.push_back(std::move(line));
        } else if (fence == FenceState::IN_PROSE && (level = AtxHeaderLevel(line)) > 0) {
            flush(line_number - 1);
            current_header = TrimCopy(line);
            current_level = level;
            section_start = line_number;
            current_lines.clear();
            current_lines.push_back(std::move(line));
        } else {
            current_lines.push_back(std::move(line));
        }

        if (newline == std::string::npos) {
            break;
        }
        pos = newline + 1;
    }

    flush(line_number);
    return sections;
}

} // namespace doc_chunker

} // namespace duckdb
