#include "doc_chunker_reader.hpp"
#include "doc_chunker_table_functions.hpp"
#include "doc_chunker_types.hpp"
#include "duckdb/common/error_data.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/function/function_set.hpp"
#include "duckdb/function/table_function.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

//===--------------------------------------------------------------------===//
// Bind Data Structures
//===--------------------------------------------------------------------===//

struct FileChunk {
    string file_path;
    doc_chunker::DocumentChunk chunk;
};

struct FileCodeBlock {
    string file_path;
    idx_t block_index;
    doc_chunker::CodeBlock block;
};

struct ReadChunksBindData : public TableFunctionData {
    vector<string> files;
    DocChunkerOptions options;
    vector<FileChunk> rows;
};

struct ReadCodeBlocksBindData : public TableFunctionData {
    vector<string> files;
    DocChunkerOptions options;
    vector<FileCodeBlock> rows;
};

//===--------------------------------------------------------------------===//
// Helper Functions
//===--------------------------------------------------------------------===//

static vector<string> BindFiles(ClientContext &context, TableFunctionBindInput &input, DocChunkerOptions &options,
                                const string &function_name) {
    if (input.inputs.empty()) {
        throw InvalidInputException("%s requires at least one argument", function_name);
    }
    options = DocChunkerSettings::LoadDefaults(context);
    DocChunkerSettings::ApplyNamedParameters(input.named_parameters, options, function_name);

    auto &path_param = input.inputs[0];
    if (path_param.IsNull()) {
        return vector<string>();
    }
    return DocChunkerReader::GetFiles(context, path_param, options.ignore_errors);
}

// Reads each file and hands its content to process; unreadable files are skipped under ignore_errors
template <class PROCESS>
static void ProcessFiles(ClientContext &context, const vector<string> &files, const DocChunkerOptions &options,
                         PROCESS &&process) {
    for (const auto &file_path : files) {
        string content;
        try {
            content = DocChunkerReader::ReadMarkdownFile(context, file_path, options);
        } catch (const std::exception &e) {
            ErrorData error(e);
            if (!options.ignore_errors) {
                throw InvalidInputException("Error reading Markdown file %s: %s", file_path, error.RawMessage());
            }
            DUCKDB_LOG_DEBUG(context, "Skipping unreadable Markdown file %s: %s", file_path, error.RawMessage());
            continue;
        }
        process(file_path, content);
    }
}

static void AddFilePathColumn(const DocChunkerOptions &options, vector<LogicalType> &return_types,
                              vector<string> &names) {
    if (options.include_filepath) {
        names.emplace_back("file_path");
        return_types.emplace_back(LogicalType::VARCHAR);
    }
}

//===--------------------------------------------------------------------===//
// Chunk Reader Implementation
//===--------------------------------------------------------------------===//

unique_ptr<FunctionData> DocChunkerReader::ReadChunksBind(ClientContext &context, TableFunctionBindInput &input,
                                                          vector<LogicalType> &return_types, vector<string> &names) {
    auto result = make_uniq<ReadChunksBindData>();
    result->files = BindFiles(context, input, result->options, "read_markdown_chunks");

    ProcessFiles(context, result->files, result->options, [&](const string &file_path, const string &content) {
        auto chunks = doc_chunker::ChunkSections(content, result->options.chunk_size);
        DUCKDB_LOG_DEBUG(context, "read_markdown_chunks: %s produced %d chunks", file_path, chunks.size());
        for (auto &chunk : chunks) {
            result->rows.push_back(FileChunk {file_path, std::move(chunk)});
        }
    });

    AddFilePathColumn(result->options, return_types, names);
    names.emplace_back("chunk_index");
    return_types.emplace_back(LogicalType::BIGINT);
    names.emplace_back("header");
    return_types.emplace_back(LogicalType::VARCHAR);
    names.emplace_back("chunk");
    return_types.emplace_back(LogicalType::VARCHAR);

    return std::move(result);
}

void DocChunkerReader::ReadChunksFunction(ClientContext &context, TableFunctionInput &input, DataChunk &output) {
    auto &bind_data = input.bind_data->Cast<ReadChunksBindData>();

    DocChunkerScanRows(input, output, bind_data.rows.size(), [&](idx_t row, idx_t out) {
        const auto &file_chunk = bind_data.rows[row];
        idx_t column_idx = 0;
        if (bind_data.options.include_filepath) {
            output.data[column_idx++].SetValue(out, Value(file_chunk.file_path));
        }
        output.data[column_idx++].SetValue(out, Value::BIGINT(static_cast<int64_t>(file_chunk.chunk.chunk_index)));
        output.data[column_idx++].SetValue(out, DocChunkerTypes::HeaderValue(file_chunk.chunk.header));
        output.data[column_idx].SetValue(out, Value(file_chunk.chunk.text));
    });
}

//===--------------------------------------------------------------------===//
// Code Block Reader Implementation
//===--------------------------------------------------------------------===//

unique_ptr<FunctionData> DocChunkerReader::ReadCodeBlocksBind(ClientContext &context, TableFunctionBindInput &input,
                                                              vector<LogicalType> &return_types,
                                                              vector<string> &names) {
    auto result = make_uniq<ReadCodeBlocksBindData>();
    result->files = BindFiles(context, input, result->options, "read_markdown_code_blocks");

    ProcessFiles(context, result->files, result->options, [&](const string &file_path, const string &content) {
        auto blocks =
            doc_chunker::ExtractCodeBlocks(content, result->options.min_length, result->options.language_filter);
        DUCKDB_LOG_DEBUG(context, "read_markdown_code_blocks: %s produced %d code blocks", file_path, blocks.size());
        for (idx_t i = 0; i < blocks.size(); i++) {
            result->rows.push_back(FileCodeBlock {file_path, i, std::move(blocks[i])});
        }
    });

    AddFilePathColumn(result->options, return_types, names);
    names.emplace_back("block_index");
    return_types.emplace_back(LogicalType::BIGINT);
    names.emplace_back("language");
    return_types.emplace_back(LogicalType::VARCHAR);
    names.emplace_back("code");
    return_types.emplace_back(LogicalType::VARCHAR);
    names.emplace_back("context_before");
    return_types.emplace_back(LogicalType::VARCHAR);
    names.emplace_back("context_after");
    return_types.emplace_back(LogicalType::VARCHAR);

    return std::move(result);
}

void DocChunkerReader::ReadCodeBlocksFunction(ClientContext &context, TableFunctionInput &input, DataChunk &output) {
    auto &bind_data = input.bind_data->Cast<ReadCodeBlocksBindData>();

    DocChunkerScanRows(input, output, bind_data.rows.size(), [&](idx_t row, idx_t out) {
        const auto &file_block = bind_data.rows[row];
        idx_t column_idx = 0;
        if (bind_data.options.include_filepath) {
            output.data[column_idx++].SetValue(out, Value(file_block.file_path));
        }
        output.data[column_idx++].SetValue(out, Value::BIGINT(static_cast<int64_t>(file_block.block_index)));
        output.data[column_idx++].SetValue(out, Value(file_block.block.language));
        output.data[column_idx++].SetValue(out, Value(file_block.block.code));
        output.data[column_idx++].SetValue(out, Value(file_block.block.context_before));
        output.data[column_idx].SetValue(out, Value(file_block.block.context_after));
    });
}

//===--------------------------------------------------------------------===//
// Registration
//===--------------------------------------------------------------------===//

static void AddReaderParameters(TableFunction &function) {
    function.named_parameters["include_filepath"] = LogicalType::BOOLEAN;
    function.named_parameters["normalize_content"] = LogicalType::BOOLEAN;
    function.named_parameters["maximum_file_size"] = LogicalType::UBIGINT;
    function.named_parameters["ignore_errors"] = LogicalType::BOOLEAN;
}

void DocChunkerReader::RegisterFunction(ExtensionLoader &loader) {
    // Each reader accepts a single path (file, glob or directory) or a list of files
    TableFunctionSet read_chunks_set("read_markdown_chunks");
    for (auto &path_type : {LogicalType(LogicalType::VARCHAR), LogicalType::LIST(LogicalType::VARCHAR)}) {
        TableFunction read_chunks_func({path_type}, ReadChunksFunction, ReadChunksBind, DocChunkerScanInit);
        AddReaderParameters(read_chunks_func);
        read_chunks_func.named_parameters["chunk_size"] = LogicalType::BIGINT;
        read_chunks_set.AddFunction(read_chunks_func);
    }
    loader.RegisterFunction(read_chunks_set);

    TableFunctionSet read_blocks_set("read_markdown_code_blocks");
    for (auto &path_type : {LogicalType(LogicalType::VARCHAR), LogicalType::LIST(LogicalType::VARCHAR)}) {
        TableFunction read_blocks_func({path_type}, ReadCodeBlocksFunction, ReadCodeBlocksBind, DocChunkerScanInit);
        AddReaderParameters(read_blocks_func);
        read_blocks_func.named_parameters["min_length"] = LogicalType::BIGINT;
        read_blocks_func.named_parameters["language"] = LogicalType::VARCHAR;
        read_blocks_set.AddFunction(read_blocks_func);
    }
    loader.RegisterFunction(read_blocks_set);
}

} // namespace duckdb
