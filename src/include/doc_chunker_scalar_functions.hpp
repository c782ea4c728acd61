#pragma once

#include "duckdb.hpp"
#include "duckdb/function/function_set.hpp"
#include "duckdb/function/scalar_function.hpp"

namespace duckdb {

class ExtensionLoader;

/**
 * @brief Per-row chunking and extraction functions
 *
 * This class provides scalar functions for:
 * - Chunking a document into a list of strings (md_chunk_text)
 * - Extracting code blocks as a list of md_code_block structs (md_extract_code_blocks)
 * - Formatting a code block as an embedding payload (md_code_snippet_payload)
 */
class DocChunkerScalarFunctions {
public:
    /**
     * @brief Register all scalar functions with DuckDB
     *
     * @param loader The extension loader to register the functions with
     */
    static void Register(ExtensionLoader &loader);

private:
    static void RegisterChunkFunctions(ExtensionLoader &loader);
    static void RegisterCodeBlockFunctions(ExtensionLoader &loader);
    static void RegisterPayloadFunctions(ExtensionLoader &loader);
};

} // namespace duckdb
