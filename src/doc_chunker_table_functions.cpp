#include "doc_chunker_table_functions.hpp"
#include "doc_chunker_settings.hpp"
#include "doc_chunker_types.hpp"
#include "doc_chunker_utils.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

unique_ptr<GlobalTableFunctionState> DocChunkerScanInit(ClientContext &context, TableFunctionInitInput &input) {
    return make_uniq<DocChunkerScanState>();
}

// Reads the document argument; returns false for a NULL document
static bool GetDocumentInput(TableFunctionBindInput &input, const string &function_name, string &document) {
    if (input.inputs.empty()) {
        throw InvalidInputException("%s requires markdown content as input", function_name);
    }
    auto &document_param = input.inputs[0];
    if (document_param.IsNull()) {
        return false;
    }
    document = StringValue::Get(document_param);
    return true;
}

//===--------------------------------------------------------------------===//
// Sections
//===--------------------------------------------------------------------===//

struct SectionBindData : public TableFunctionData {
    vector<doc_chunker::DocumentSection> sections;
};

static unique_ptr<FunctionData> SectionBind(ClientContext &context, TableFunctionBindInput &input,
                                            vector<LogicalType> &return_types, vector<string> &names) {
    auto result = make_uniq<SectionBindData>();

    string document;
    if (GetDocumentInput(input, "md_sections", document)) {
        result->sections = doc_chunker::SplitIntoSections(document);
        DUCKDB_LOG_DEBUG(context, "md_sections: %d sections", result->sections.size());
    }

    names.emplace_back("section_index");
    return_types.emplace_back(LogicalType::BIGINT);
    names.emplace_back("header");
    return_types.emplace_back(LogicalType::VARCHAR);
    names.emplace_back("level");
    return_types.emplace_back(LogicalType::INTEGER);
    names.emplace_back("content");
    return_types.emplace_back(LogicalType::VARCHAR);
    names.emplace_back("start_line");
    return_types.emplace_back(LogicalType::BIGINT);
    names.emplace_back("end_line");
    return_types.emplace_back(LogicalType::BIGINT);

    return std::move(result);
}

static void SectionFunction(ClientContext &context, TableFunctionInput &input, DataChunk &output) {
    auto &bind_data = input.bind_data->Cast<SectionBindData>();

    DocChunkerScanRows(input, output, bind_data.sections.size(), [&](idx_t row, idx_t out) {
        const auto &section = bind_data.sections[row];
        output.data[0].SetValue(out, Value::BIGINT(static_cast<int64_t>(row)));
        output.data[1].SetValue(out, DocChunkerTypes::HeaderValue(section.header));
        output.data[2].SetValue(out, Value::INTEGER(section.level));
        output.data[3].SetValue(out, Value(section.content));
        output.data[4].SetValue(out, Value::BIGINT(static_cast<int64_t>(section.start_line)));
        output.data[5].SetValue(out, Value::BIGINT(static_cast<int64_t>(section.end_line)));
    });
}

//===--------------------------------------------------------------------===//
// Chunks
//===--------------------------------------------------------------------===//

struct ChunkBindData : public TableFunctionData {
    DocChunkerOptions options;
    vector<doc_chunker::DocumentChunk> chunks;
};

static unique_ptr<FunctionData> ChunkBind(ClientContext &context, TableFunctionBindInput &input,
                                          vector<LogicalType> &return_types, vector<string> &names) {
    auto result = make_uniq<ChunkBindData>();
    result->options = DocChunkerSettings::LoadDefaults(context);
    DocChunkerSettings::ApplyNamedParameters(input.named_parameters, result->options, "md_chunks");

    string document;
    if (GetDocumentInput(input, "md_chunks", document)) {
        result->chunks = doc_chunker::ChunkSections(document, result->options.chunk_size);
        DUCKDB_LOG_DEBUG(context, "md_chunks: %d chunks (chunk_size=%d)", result->chunks.size(),
                         result->options.chunk_size);
    }

    names.emplace_back("chunk_index");
    return_types.emplace_back(LogicalType::BIGINT);
    names.emplace_back("header");
    return_types.emplace_back(LogicalType::VARCHAR);
    names.emplace_back("chunk");
    return_types.emplace_back(LogicalType::VARCHAR);

    return std::move(result);
}

static void ChunkFunction(ClientContext &context, TableFunctionInput &input, DataChunk &output) {
    auto &bind_data = input.bind_data->Cast<ChunkBindData>();

    DocChunkerScanRows(input, output, bind_data.chunks.size(), [&](idx_t row, idx_t out) {
        const auto &chunk = bind_data.chunks[row];
        output.data[0].SetValue(out, Value::BIGINT(static_cast<int64_t>(chunk.chunk_index)));
        output.data[1].SetValue(out, DocChunkerTypes::HeaderValue(chunk.header));
        output.data[2].SetValue(out, Value(chunk.text));
    });
}

//===--------------------------------------------------------------------===//
// Code Blocks
//===--------------------------------------------------------------------===//

struct CodeBlockBindData : public TableFunctionData {
    DocChunkerOptions options;
    vector<doc_chunker::CodeBlock> code_blocks;
};

static unique_ptr<FunctionData> CodeBlockBind(ClientContext &context, TableFunctionBindInput &input,
                                              vector<LogicalType> &return_types, vector<string> &names) {
    auto result = make_uniq<CodeBlockBindData>();
    result->options = DocChunkerSettings::LoadDefaults(context);
    DocChunkerSettings::ApplyNamedParameters(input.named_parameters, result->options, "md_code_blocks");

    string document;
    if (GetDocumentInput(input, "md_code_blocks", document)) {
        result->code_blocks =
            doc_chunker::ExtractCodeBlocks(document, result->options.min_length, result->options.language_filter);
        DUCKDB_LOG_DEBUG(context, "md_code_blocks: %d code blocks (min_length=%d)", result->code_blocks.size(),
                         result->options.min_length);
    }

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

static void CodeBlockFunction(ClientContext &context, TableFunctionInput &input, DataChunk &output) {
    auto &bind_data = input.bind_data->Cast<CodeBlockBindData>();

    DocChunkerScanRows(input, output, bind_data.code_blocks.size(), [&](idx_t row, idx_t out) {
        const auto &block = bind_data.code_blocks[row];
        output.data[0].SetValue(out, Value::BIGINT(static_cast<int64_t>(row)));
        output.data[1].SetValue(out, Value(block.language));
        output.data[2].SetValue(out, Value(block.code));
        output.data[3].SetValue(out, Value(block.context_before));
        output.data[4].SetValue(out, Value(block.context_after));
    });
}

//===--------------------------------------------------------------------===//
// Registration
//===--------------------------------------------------------------------===//

void DocChunkerTableFunctions::Register(ExtensionLoader &loader) {
    RegisterSectionFunction(loader);
    RegisterChunkFunction(loader);
    RegisterCodeBlockFunction(loader);
}

void DocChunkerTableFunctions::RegisterSectionFunction(ExtensionLoader &loader) {
    TableFunction sections_func("md_sections", {LogicalType::VARCHAR}, SectionFunction, SectionBind,
                                DocChunkerScanInit);
    loader.RegisterFunction(sections_func);
}

void DocChunkerTableFunctions::RegisterChunkFunction(ExtensionLoader &loader) {
    TableFunction chunks_func("md_chunks", {LogicalType::VARCHAR}, ChunkFunction, ChunkBind, DocChunkerScanInit);
    chunks_func.named_parameters["chunk_size"] = LogicalType::BIGINT;
    loader.RegisterFunction(chunks_func);
}

void DocChunkerTableFunctions::RegisterCodeBlockFunction(ExtensionLoader &loader) {
    TableFunction code_blocks_func("md_code_blocks", {LogicalType::VARCHAR}, CodeBlockFunction, CodeBlockBind,
                                   DocChunkerScanInit);
    code_blocks_func.named_parameters["min_length"] = LogicalType::BIGINT;
    code_blocks_func.named_parameters["language"] = LogicalType::VARCHAR;
    loader.RegisterFunction(code_blocks_func);
}

} // namespace duckdb
