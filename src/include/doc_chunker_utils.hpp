#pragma once

#include "duckdb.hpp"
#include <string>
#include <vector>

namespace duckdb {

namespace doc_chunker {

//===--------------------------------------------------------------------===//
// Defaults
//===--------------------------------------------------------------------===//

static constexpr idx_t DEFAULT_CHUNK_SIZE = 1500;
static constexpr idx_t DEFAULT_MIN_CODE_LENGTH = 50;
static constexpr idx_t CODE_CONTEXT_WINDOW = 500;
static constexpr idx_t MAX_LANGUAGE_TAG_LENGTH = 20;

//===--------------------------------------------------------------------===//
// Section Structure
//===--------------------------------------------------------------------===//

//! Scanner state while walking lines; header detection is off inside a fence
enum class FenceState { IN_PROSE, IN_FENCE };

struct DocumentSection {
    std::string header;          // Trimmed header line, empty before the first header
    int32_t level;               // Number of leading '#' (0 when there is no header)
    std::string content;         // Section lines joined with '\n' and trimmed (includes the header line)
    idx_t start_line;            // 1-based first line of the section
    idx_t end_line;              // 1-based last line of the section
};

struct DocumentChunk {
    idx_t chunk_index;           // Position within the document
    std::string header;          // Header of the owning section
    std::string text;            // Chunk text (header re-injected on continuations)
};

//===--------------------------------------------------------------------===//
// Bounded Splitting Rules
//===--------------------------------------------------------------------===//

//! One boundary heuristic of the split cascade
struct SplitRule {
    const char *name;
    const char *pattern;         // Searched backward in the window
    double min_fraction;         // Match offset must be strictly greater than min_fraction * budget
    idx_t cut_adjust;            // Added to the match offset to get the cut point
};

//! Boundary heuristics in priority order: fence > paragraph > sentence > line > space
const std::vector<SplitRule> &DefaultSplitRules();

//! Where a window is cut: the offset (in code points, relative to the window start) and
//! the rule that produced it, or nullptr for a hard cut at the budget
struct SplitPoint {
    idx_t offset;
    const SplitRule *rule;
};

//===--------------------------------------------------------------------===//
// Code Block Structure
//===--------------------------------------------------------------------===//

struct CodeBlock {
    std::string code;            // Trimmed block body (language line removed)
    std::string language;        // Language tag from the opening line, or empty
    std::string context_before;  // Up to CODE_CONTEXT_WINDOW characters before the opening fence
    std::string context_after;   // Up to CODE_CONTEXT_WINDOW characters after the closing fence
};

//===--------------------------------------------------------------------===//
// Section Splitting
//===--------------------------------------------------------------------===//

// Returns the header level (1-6) if the line is an ATX header, 0 otherwise
int32_t AtxHeaderLevel(const std::string &line);

// Returns true if the trimmed line opens or closes a fenced code block
bool IsFenceLine(const std::string &line);

// Partition a document into sections at ATX headers outside fenced code
std::vector<DocumentSection> SplitIntoSections(const std::string &text);

//===--------------------------------------------------------------------===//
// Bounded Splitting
//===--------------------------------------------------------------------===//

// Per-chunk body budget once room for "header\n" is reserved
idx_t ComputeBodyBudget(idx_t chunk_size, const std::string &owning_header);

// Pick the cut point for a window of `budget` code points
SplitPoint FindSplitPoint(const std::string &window, idx_t budget,
                          const std::vector<SplitRule> &rules = DefaultSplitRules());

// Cut text into pieces of at most `budget` code points (before trimming)
std::vector<std::string> SplitWithinBudget(const std::string &text, idx_t budget);

// Prefix every chunk after the first with the header unless it already starts with it
std::vector<std::string> InjectHeader(std::vector<std::string> chunks, const std::string &owning_header);

// Split one section into chunks of at most chunk_size characters
std::vector<std::string> BoundSection(const std::string &section_text, const std::string &owning_header,
                                      idx_t chunk_size);

//===--------------------------------------------------------------------===//
// Chunking
//===--------------------------------------------------------------------===//

// Sections then bounded splitting, in document order
std::vector<std::string> ChunkText(const std::string &text, idx_t chunk_size = DEFAULT_CHUNK_SIZE);

// Same pipeline as ChunkText, keeping the owning header and index of every chunk
std::vector<DocumentChunk> ChunkSections(const std::string &text, idx_t chunk_size = DEFAULT_CHUNK_SIZE);

//===--------------------------------------------------------------------===//
// Code Block Extraction
//===--------------------------------------------------------------------===//

// Extract fenced code blocks with surrounding prose
std::vector<CodeBlock> ExtractCodeBlocks(const std::string &markdown_str,
                                         idx_t min_length = DEFAULT_MIN_CODE_LENGTH,
                                         const std::string &language_filter = "");

// Text handed to the embedding pipeline for one code block
std::string FormatCodeSnippetPayload(const std::string &code, const std::string &title = "");

//===--------------------------------------------------------------------===//
// Utility Functions
//===--------------------------------------------------------------------===//

// Byte offset of every code point start, followed by text.size() as a sentinel
std::vector<idx_t> CodepointOffsets(const std::string &text);

// Number of code points in a UTF-8 string
idx_t CodepointLength(const std::string &text);

// Copy of the string without leading/trailing whitespace
std::string TrimCopy(std::string str);

// Normalize line endings to '\n'
std::string NormalizeLineEndings(const std::string &text);

} // namespace doc_chunker

} // namespace duckdb
