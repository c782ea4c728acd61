#define DUCKDB_EXTENSION_MAIN

#include "duckdb.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

#include "doc_chunker_extension.hpp"
#include "doc_chunker_reader.hpp"
#include "doc_chunker_scalar_functions.hpp"
#include "doc_chunker_settings.hpp"
#include "doc_chunker_table_functions.hpp"
#include "doc_chunker_types.hpp"

namespace duckdb {

static void LoadInternal(ExtensionLoader &loader) {
    // Settings first: every bind reads its defaults from them
    DocChunkerSettings::Register(loader);

    DocChunkerTypes::Register(loader);
    DocChunkerTableFunctions::Register(loader);
    DocChunkerScalarFunctions::Register(loader);
    DocChunkerReader::RegisterFunction(loader);

    // SELECT * FROM 'notes.md' reads the file as chunks
    auto &config = DBConfig::GetConfig(loader.GetDatabaseInstance());
    config.replacement_scans.emplace_back(DocChunkerReader::ReadMarkdownReplacement);
}

void DocChunkerExtension::Load(ExtensionLoader &loader) {
    LoadInternal(loader);
}

std::string DocChunkerExtension::Name() {
	return "doc_chunker";
}

std::string DocChunkerExtension::Version() const {
#ifdef EXT_VERSION_DOC_CHUNKER
	return EXT_VERSION_DOC_CHUNKER;
#else
	return "";
#endif
}

} // namespace duckdb

extern "C" {

DUCKDB_CPP_EXTENSION_ENTRY(doc_chunker, loader) {
    duckdb::LoadInternal(loader);
}

DUCKDB_EXTENSION_API const char *doc_chunker_version() {
	return duckdb::DuckDB::LibraryVersion();
}

}

#ifndef DUCKDB_EXTENSION_MAIN
#error DUCKDB_EXTENSION_MAIN not defined
#endif
