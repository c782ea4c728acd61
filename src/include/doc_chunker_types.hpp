#pragma once

#include "duckdb.hpp"
#include "duckdb/common/types.hpp"
#include "doc_chunker_utils.hpp"

namespace duckdb {

class ExtensionLoader;

class DocChunkerTypes {
public:
    //! STRUCT(code, language, context_before, context_after), registered as md_code_block
    static LogicalType CodeBlockType();

    //! Convert an extracted block into a value of CodeBlockType()
    static Value CodeBlockValue(const doc_chunker::CodeBlock &block);

    //! Empty header means "no header" and maps to NULL
    static Value HeaderValue(const string &header);

    //! Register the md_code_block type alias
    static void Register(ExtensionLoader &loader);
};

} // namespace duckdb
