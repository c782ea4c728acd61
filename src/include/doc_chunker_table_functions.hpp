#pragma once

#include "duckdb.hpp"
#include "duckdb/function/table_function.hpp"

namespace duckdb {

class ExtensionLoader;

//! Scan cursor shared by every doc_chunker table function; rows live in the bind data
struct DocChunkerScanState : public GlobalTableFunctionState {
    idx_t offset = 0;
};

unique_ptr<GlobalTableFunctionState> DocChunkerScanInit(ClientContext &context, TableFunctionInitInput &input);

//! Emit up to STANDARD_VECTOR_SIZE rows, calling write_row(row_index, output_index) for each
template <class WRITE_ROW>
void DocChunkerScanRows(TableFunctionInput &input, DataChunk &output, idx_t row_count, WRITE_ROW &&write_row) {
    auto &state = input.global_state->Cast<DocChunkerScanState>();

    idx_t output_idx = 0;
    while (state.offset < row_count && output_idx < STANDARD_VECTOR_SIZE) {
        write_row(state.offset, output_idx);
        output_idx++;
        state.offset++;
    }
    output.SetCardinality(output_idx);
}

//! Table functions over a single document string: md_sections, md_chunks, md_code_blocks
class DocChunkerTableFunctions {
public:
    static void Register(ExtensionLoader &loader);

private:
    static void RegisterSectionFunction(ExtensionLoader &loader);
    static void RegisterChunkFunction(ExtensionLoader &loader);
    static void RegisterCodeBlockFunction(ExtensionLoader &loader);
};

} // namespace duckdb
