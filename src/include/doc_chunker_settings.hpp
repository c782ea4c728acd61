#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/main/client_context.hpp"
#include "doc_chunker_utils.hpp"

namespace duckdb {

class ExtensionLoader;

//! Per-call options for chunking, extraction and file reading
struct DocChunkerOptions {
    idx_t chunk_size = doc_chunker::DEFAULT_CHUNK_SIZE;      // Chunk budget in characters
    idx_t min_length = doc_chunker::DEFAULT_MIN_CODE_LENGTH; // Shorter code blocks are dropped
    string language_filter = "";                             // Only keep blocks with this language tag

    // File reader options
    bool include_filepath = true;           // Whether to include the file_path column
    bool normalize_content = true;          // Whether to normalize line endings
    idx_t maximum_file_size = 16777216;     // 16MB default maximum file size
    bool ignore_errors = false;             // Skip missing or unreadable files
};

/**
 * @brief Extension settings and named-parameter parsing
 *
 * Defaults come from the session settings registered on load
 * (doc_chunker_chunk_size, doc_chunker_min_code_length); named parameters
 * passed to a function override them for that call.
 */
class DocChunkerSettings {
public:
    static constexpr const char *CHUNK_SIZE_SETTING = "doc_chunker_chunk_size";
    static constexpr const char *MIN_CODE_LENGTH_SETTING = "doc_chunker_min_code_length";

    /**
     * @brief Register the extension settings with their defaults
     */
    static void Register(ExtensionLoader &loader);

    /**
     * @brief Build options from the current session settings
     *
     * @throws InvalidInputException if a setting holds an out-of-range value
     */
    static DocChunkerOptions LoadDefaults(ClientContext &context);

    /**
     * @brief Apply named parameters on top of the given options
     *
     * @param parameters Named parameters from the bind input
     * @param options Options to update
     * @param function_name Used in error messages
     */
    static void ApplyNamedParameters(const named_parameter_map_t &parameters, DocChunkerOptions &options,
                                     const string &function_name);

    static idx_t ValidateChunkSize(int64_t chunk_size);
    static idx_t ValidateMinLength(int64_t min_length);
};

} // namespace duckdb
