#include "doc_chunker_types.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

//===--------------------------------------------------------------------===//
// Code Block Type Definition
//===--------------------------------------------------------------------===//

LogicalType DocChunkerTypes::CodeBlockType() {
    child_list_t<LogicalType> fields;
    fields.push_back(std::make_pair("code", LogicalType::VARCHAR));
    fields.push_back(std::make_pair("language", LogicalType::VARCHAR));
    fields.push_back(std::make_pair("context_before", LogicalType::VARCHAR));
    fields.push_back(std::make_pair("context_after", LogicalType::VARCHAR));
    return LogicalType::STRUCT(fields);
}

Value DocChunkerTypes::CodeBlockValue(const doc_chunker::CodeBlock &block) {
    child_list_t<Value> values;
    values.push_back(std::make_pair("code", Value(block.code)));
    values.push_back(std::make_pair("language", Value(block.language)));
    values.push_back(std::make_pair("context_before", Value(block.context_before)));
    values.push_back(std::make_pair("context_after", Value(block.context_after)));
    return Value::STRUCT(std::move(values));
}

Value DocChunkerTypes::HeaderValue(const string &header) {
    return header.empty() ? Value(LogicalType::VARCHAR) : Value(header);
}

//===--------------------------------------------------------------------===//
// Registration
//===--------------------------------------------------------------------===//

void DocChunkerTypes::Register(ExtensionLoader &loader) {
    auto code_block_type = CodeBlockType();
    code_block_type.SetAlias("md_code_block");
    loader.RegisterType("md_code_block", code_block_type);
}

} // namespace duckdb
