#include "doc_chunker_utils.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/exception.hpp"

namespace duckdb {

namespace doc_chunker {

//===--------------------------------------------------------------------===//
// Chunking
//===--------------------------------------------------------------------===//

std::vector<DocumentChunk> ChunkSections(const std::string &text, idx_t chunk_size) {
    if (chunk_size == 0) {
        throw InvalidInputException("chunk_size must be greater than zero");
    }

    std::vector<DocumentChunk> chunks;
    for (const auto &section : SplitIntoSections(text)) {
        auto pieces = BoundSection(section.content, section.header, chunk_size);
        for (auto &piece : pieces) {
            DocumentChunk chunk;
            chunk.chunk_index = chunks.size();
            chunk.header = section.header;
            chunk.text = std::move(piece);
            chunks.push_back(std::move(chunk));
        }
    }
    return chunks;
}

std::vector<std::string> ChunkText(const std::string &text, idx_t chunk_size) {
    std::vector<std::string> result;
    for (auto &chunk : ChunkSections(text, chunk_size)) {
        result.push_back(std::move(chunk.text));
    }
    return result;
}

//===--------------------------------------------------------------------===//
// Embedding Payloads
//===--------------------------------------------------------------------===//

std::string FormatCodeSnippetPayload(const std::string &code, const std::string &title) {
    if (title.empty()) {
        return "Code Snippet:\n" + code;
    }
    return "Title: " + title + "\n\nCode Snippet:\n" + code;
}

//===--------------------------------------------------------------------===//
// Utility Functions
//===--------------------------------------------------------------------===//

static inline bool IsContinuationByte(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

std::vector<idx_t> CodepointOffsets(const std::string &text) {
    std::vector<idx_t> offsets;
    offsets.reserve(text.size() + 1);
    for (idx_t i = 0; i < text.size(); i++) {
        // A stray continuation byte at the very start still opens a character
        if (i == 0 || !IsContinuationByte(text[i])) {
            offsets.push_back(i);
        }
    }
    offsets.push_back(text.size());
    return offsets;
}

idx_t CodepointLength(const std::string &text) {
    idx_t length = 0;
    for (idx_t i = 0; i < text.size(); i++) {
        if (i == 0 || !IsContinuationByte(text[i])) {
            length++;
        }
    }
    return length;
}

std::string TrimCopy(std::string str) {
    StringUtil::Trim(str);
    return str;
}

std::string NormalizeLineEndings(const std::string &text) {
    std::string normalized = StringUtil::Replace(text, "\r\n", "\n");
    return StringUtil::Replace(normalized, "\r", "\n");
}

} // namespace doc_chunker

} // namespace duckdb
