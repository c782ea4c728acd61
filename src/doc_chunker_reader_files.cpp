#include "doc_chunker_reader.hpp"
#include "duckdb/common/file_system.hpp"
#include "duckdb/common/string_util.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/common/types/value.hpp"
#include "duckdb/function/replacement_scan.hpp"
#include "duckdb/logging/logger.hpp"
#include "duckdb/parser/tableref/table_function_ref.hpp"
#include "duckdb/parser/expression/constant_expression.hpp"
#include "duckdb/parser/expression/function_expression.hpp"
#include <algorithm>

namespace duckdb {

static bool HasMarkdownExtension(const string &path) {
    auto dot_pos = path.find_last_of('.');
    if (dot_pos == string::npos) {
        return false;
    }
    auto extension = StringUtil::Lower(path.substr(dot_pos + 1));
    return std::find(markdown_extensions.begin(), markdown_extensions.end(), extension) != markdown_extensions.end();
}

//===--------------------------------------------------------------------===//
// File Path Resolution
//===--------------------------------------------------------------------===//

vector<string> DocChunkerReader::GetFiles(ClientContext &context, const Value &path_value, bool ignore_errors) {
    auto &fs = FileSystem::GetFileSystem(context);
    vector<string> result;

    auto add_directory = [&](const string &directory) {
        for (auto &extension : markdown_extensions) {
            auto files = GetGlobFiles(context, fs.JoinPath(directory, "*." + extension));
            result.insert(result.end(), files.begin(), files.end());
        }
    };

    auto process_path = [&](const string &markdown_path) {
        if (fs.FileExists(markdown_path)) {
            result.push_back(markdown_path);
            return;
        }

        auto glob_files = GetGlobFiles(context, markdown_path);
        if (!glob_files.empty()) {
            result.insert(result.end(), glob_files.begin(), glob_files.end());
            return;
        }

        if (StringUtil::EndsWith(markdown_path, "/")) {
            add_directory(markdown_path);
            return;
        }

        try {
            if (fs.DirectoryExists(markdown_path)) {
                add_directory(markdown_path);
                return;
            }
        } catch (const NotImplementedException &) {
            // File system doesn't support directory existence checking
        }

        if (ignore_errors) {
            DUCKDB_LOG_DEBUG(context, "Skipping missing path %s", markdown_path);
            return;
        }
        if (markdown_path.find("://") != string::npos && !StringUtil::StartsWith(markdown_path, "file://")) {
            throw InvalidInputException("Remote file does not exist or is not accessible: %s", markdown_path);
        }
        throw InvalidInputException("File or directory does not exist: %s", markdown_path);
    };

    if (path_value.type().id() == LogicalTypeId::LIST) {
        for (auto &file_value : ListValue::GetChildren(path_value)) {
            if (file_value.type().id() != LogicalTypeId::VARCHAR) {
                throw InvalidInputException("File list must contain string values");
            }
            if (file_value.IsNull()) {
                continue;
            }
            process_path(StringValue::Get(file_value));
        }
    } else if (path_value.type().id() == LogicalTypeId::VARCHAR) {
        process_path(StringValue::Get(path_value));
    } else {
        throw InvalidInputException("Path must be a string or list of strings");
    }

    vector<string> markdown_files;
    for (const auto &file : result) {
        if (HasMarkdownExtension(file)) {
            markdown_files.push_back(file);
        } else if (!ignore_errors) {
            throw InvalidInputException("File is not a markdown file: %s", file);
        }
    }

    std::sort(markdown_files.begin(), markdown_files.end());
    markdown_files.erase(std::unique(markdown_files.begin(), markdown_files.end()), markdown_files.end());

    return markdown_files;
}

vector<string> DocChunkerReader::GetGlobFiles(ClientContext &context, const string &pattern) {
    auto &fs = FileSystem::GetFileSystem(context);
    vector<string> result;

    try {
        if (!fs.HasGlob(pattern)) {
            return result;
        }
    } catch (const NotImplementedException &) {
        return result;
    }

    bool supports_directory_exists = true;
    try {
        fs.DirectoryExists(pattern);
    } catch (const NotImplementedException &) {
        supports_directory_exists = false;
    }

    try {
        for (auto &file : fs.Glob(pattern)) {
            if (!supports_directory_exists || !fs.DirectoryExists(file.path)) {
                result.push_back(file.path);
            }
        }
    } catch (const NotImplementedException &) {
        // No glob support
    }

    return result;
}

//===--------------------------------------------------------------------===//
// File Reading
//===--------------------------------------------------------------------===//

string DocChunkerReader::ReadMarkdownFile(ClientContext &context, const string &file_path,
                                          const DocChunkerOptions &options) {
    auto &fs = FileSystem::GetFileSystem(context);

    auto file_handle = fs.OpenFile(file_path, FileOpenFlags::FILE_FLAGS_READ);
    const auto file_size = static_cast<idx_t>(fs.GetFileSize(*file_handle));

    if (options.maximum_file_size > 0 && file_size > options.maximum_file_size) {
        throw InvalidInputException("File %s is too large (%llu bytes, maximum is %llu bytes)", file_path,
                                    file_size, options.maximum_file_size);
    }

    string content;
    content.resize(file_size);
    fs.Read(*file_handle, reinterpret_cast<void *>(&content[0]), static_cast<int64_t>(file_size));

    if (options.normalize_content) {
        content = doc_chunker::NormalizeLineEndings(content);
    }

    return content;
}

//===--------------------------------------------------------------------===//
// Replacement Scan Support
//===--------------------------------------------------------------------===//

unique_ptr<TableRef> DocChunkerReader::ReadMarkdownReplacement(ClientContext &context, ReplacementScanInput &input,
                                                               optional_ptr<ReplacementScanData> data) {
    auto &table_name = input.table_name;
    if (!HasMarkdownExtension(table_name)) {
        return nullptr;
    }

    vector<unique_ptr<ParsedExpression>> children;
    children.push_back(make_uniq<ConstantExpression>(Value(table_name)));

    auto result = make_uniq<TableFunctionRef>();
    result->function = make_uniq<FunctionExpression>("read_markdown_chunks", std::move(children));
    return std::move(result);
}

} // namespace duckdb
