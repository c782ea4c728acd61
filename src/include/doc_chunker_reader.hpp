#pragma once

#include <vector>
#include "duckdb.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/main/client_context.hpp"
#include "duckdb/function/replacement_scan.hpp"
#include "duckdb/function/table_function.hpp"
#include "doc_chunker_settings.hpp"
#include "doc_chunker_utils.hpp"

namespace duckdb {

class ExtensionLoader;
class TableRef;
struct ReplacementScanData;

const vector<string> markdown_extensions = {"md", "markdown"};

/**
 * @brief Reads Markdown files and chunks them for an ingestion pipeline
 *
 * This class provides table functions that read Markdown files into chunk
 * and code block rows. It supports:
 * - Single files, file lists, glob patterns, and directory paths
 * - Per-file chunk and block indexes, with the source path attached
 * - Replacement scans so that SELECT * FROM 'doc.md' chunks the file
 */
class DocChunkerReader {

public:
    /**
     * @brief Register read_markdown_chunks and read_markdown_code_blocks
     *
     * @param loader The extension loader to register the functions with
     */
    static void RegisterFunction(ExtensionLoader &loader);

    /**
     * @brief Replace a markdown file string with 'read_markdown_chunks'
     *
     * Performs a ReadReplacement on any paths ending in .md or .markdown
     *
     * @param context Client context for the query
     * @param input Input expression for replacement
     * @param data Additional data for the replacement scan
     */
    static unique_ptr<TableRef> ReadMarkdownReplacement(ClientContext &context, ReplacementScanInput &input,
                                                        optional_ptr<ReplacementScanData> data);

    /**
     * @brief Get file paths from various input types (single file, list, glob, directory)
     *
     * Only .md and .markdown files are kept. Results are sorted.
     *
     * @param context Client context for file operations
     * @param path_value The input value containing file path(s)
     * @param ignore_errors Whether to skip missing files instead of throwing
     * @return vector<string> List of resolved file paths
     */
    static vector<string> GetFiles(ClientContext &context, const Value &path_value, bool ignore_errors);

    /**
     * @brief Read a Markdown file
     *
     * @param context Client context for file operations
     * @param file_path Path to the Markdown file
     * @param options Read options (size limit, line ending normalization)
     * @return string The file content
     */
    static string ReadMarkdownFile(ClientContext &context, const string &file_path, const DocChunkerOptions &options);

private:
    static unique_ptr<FunctionData> ReadChunksBind(ClientContext &context, TableFunctionBindInput &input,
                                                   vector<LogicalType> &return_types, vector<string> &names);

    static void ReadChunksFunction(ClientContext &context, TableFunctionInput &input, DataChunk &output);

    static unique_ptr<FunctionData> ReadCodeBlocksBind(ClientContext &context, TableFunctionBindInput &input,
                                                       vector<LogicalType> &return_types, vector<string> &names);

    static void ReadCodeBlocksFunction(ClientContext &context, TableFunctionInput &input, DataChunk &output);

    //! Files matching a glob pattern, directories excluded
    static vector<string> GetGlobFiles(ClientContext &context, const string &pattern);
};

} // namespace duckdb
