#include "doc_chunker_scalar_functions.hpp"
#include "doc_chunker_settings.hpp"
#include "doc_chunker_types.hpp"
#include "doc_chunker_utils.hpp"
#include "duckdb/common/vector_operations/unary_executor.hpp"
#include "duckdb/common/vector_operations/binary_executor.hpp"
#include "duckdb/execution/expression_executor_state.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

void DocChunkerScalarFunctions::Register(ExtensionLoader &loader) {
    RegisterChunkFunctions(loader);
    RegisterCodeBlockFunctions(loader);
    RegisterPayloadFunctions(loader);
}

//===--------------------------------------------------------------------===//
// md_chunk_text
//===--------------------------------------------------------------------===//

static void ChunkTextFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    const auto defaults = DocChunkerSettings::LoadDefaults(state.GetContext());
    auto &text_vector = args.data[0];

    for (idx_t row_idx = 0; row_idx < args.size(); row_idx++) {
        Value text_value = text_vector.GetValue(row_idx);
        if (text_value.IsNull()) {
            result.SetValue(row_idx, Value());
            continue;
        }

        idx_t chunk_size = defaults.chunk_size;
        if (args.ColumnCount() > 1) {
            Value size_value = args.data[1].GetValue(row_idx);
            if (size_value.IsNull()) {
                result.SetValue(row_idx, Value());
                continue;
            }
            chunk_size = DocChunkerSettings::ValidateChunkSize(size_value.GetValue<int64_t>());
        }

        vector<Value> chunks;
        for (auto &chunk : doc_chunker::ChunkText(StringValue::Get(text_value), chunk_size)) {
            chunks.emplace_back(std::move(chunk));
        }
        result.SetValue(row_idx, Value::LIST(LogicalType::VARCHAR, std::move(chunks)));
    }

    if (args.AllConstant()) {
        result.SetVectorType(VectorType::CONSTANT_VECTOR);
    }
}

void DocChunkerScalarFunctions::RegisterChunkFunctions(ExtensionLoader &loader) {
    const auto chunk_list_type = LogicalType::LIST(LogicalType::VARCHAR);

    ScalarFunctionSet md_chunk_text("md_chunk_text");
    md_chunk_text.AddFunction(ScalarFunction({LogicalType::VARCHAR}, chunk_list_type, ChunkTextFunction));
    md_chunk_text.AddFunction(
        ScalarFunction({LogicalType::VARCHAR, LogicalType::BIGINT}, chunk_list_type, ChunkTextFunction));

    loader.RegisterFunction(md_chunk_text);
}

//===--------------------------------------------------------------------===//
// md_extract_code_blocks
//===--------------------------------------------------------------------===//

static void ExtractCodeBlocksFunction(DataChunk &args, ExpressionState &state, Vector &result) {
    const auto defaults = DocChunkerSettings::LoadDefaults(state.GetContext());
    const auto code_block_type = DocChunkerTypes::CodeBlockType();
    auto &markdown_vector = args.data[0];

    for (idx_t row_idx = 0; row_idx < args.size(); row_idx++) {
        Value md_value = markdown_vector.GetValue(row_idx);
        if (md_value.IsNull()) {
            result.SetValue(row_idx, Value());
            continue;
        }

        idx_t min_length = defaults.min_length;
        if (args.ColumnCount() > 1) {
            Value length_value = args.data[1].GetValue(row_idx);
            if (length_value.IsNull()) {
                result.SetValue(row_idx, Value());
                continue;
            }
            min_length = DocChunkerSettings::ValidateMinLength(length_value.GetValue<int64_t>());
        }

        vector<Value> blocks;
        for (const auto &block : doc_chunker::ExtractCodeBlocks(StringValue::Get(md_value), min_length)) {
            blocks.push_back(DocChunkerTypes::CodeBlockValue(block));
        }
        result.SetValue(row_idx, Value::LIST(code_block_type, std::move(blocks)));
    }

    if (args.AllConstant()) {
        result.SetVectorType(VectorType::CONSTANT_VECTOR);
    }
}

void DocChunkerScalarFunctions::RegisterCodeBlockFunctions(ExtensionLoader &loader) {
    const auto block_list_type = LogicalType::LIST(DocChunkerTypes::CodeBlockType());

    ScalarFunctionSet md_extract_code_blocks("md_extract_code_blocks");
    md_extract_code_blocks.AddFunction(
        ScalarFunction({LogicalType::VARCHAR}, block_list_type, ExtractCodeBlocksFunction));
    md_extract_code_blocks.AddFunction(
        ScalarFunction({LogicalType::VARCHAR, LogicalType::BIGINT}, block_list_type, ExtractCodeBlocksFunction));

    loader.RegisterFunction(md_extract_code_blocks);
}

//===--------------------------------------------------------------------===//
// md_code_snippet_payload
//===--------------------------------------------------------------------===//

void DocChunkerScalarFunctions::RegisterPayloadFunctions(ExtensionLoader &loader) {
    ScalarFunctionSet md_code_snippet_payload("md_code_snippet_payload");

    md_code_snippet_payload.AddFunction(ScalarFunction(
        {LogicalType::VARCHAR}, LogicalType::VARCHAR, [](DataChunk &args, ExpressionState &state, Vector &result) {
            UnaryExecutor::Execute<string_t, string_t>(args.data[0], result, args.size(), [&](string_t code) {
                const auto payload = doc_chunker::FormatCodeSnippetPayload(code.GetString());
                return StringVector::AddString(result, payload);
            });
        }));

    md_code_snippet_payload.AddFunction(ScalarFunction(
        {LogicalType::VARCHAR, LogicalType::VARCHAR}, LogicalType::VARCHAR,
        [](DataChunk &args, ExpressionState &state, Vector &result) {
            BinaryExecutor::Execute<string_t, string_t, string_t>(
                args.data[0], args.data[1], result, args.size(), [&](string_t code, string_t title) {
                    const auto payload = doc_chunker::FormatCodeSnippetPayload(code.GetString(), title.GetString());
                    return StringVector::AddString(result, payload);
                });
        }));

    loader.RegisterFunction(md_code_snippet_payload);
}

} // namespace duckdb
