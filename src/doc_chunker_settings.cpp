#include "doc_chunker_settings.hpp"
#include "duckdb/common/exception.hpp"
#include "duckdb/main/config.hpp"
#include "duckdb/main/extension/extension_loader.hpp"

namespace duckdb {

void DocChunkerSettings::Register(ExtensionLoader &loader) {
    auto &config = DBConfig::GetConfig(loader.GetDatabaseInstance());

    config.AddExtensionOption(CHUNK_SIZE_SETTING, "Default chunk budget (in characters) for Markdown chunking",
                              LogicalType::BIGINT, Value::BIGINT(static_cast<int64_t>(doc_chunker::DEFAULT_CHUNK_SIZE)));
    config.AddExtensionOption(MIN_CODE_LENGTH_SETTING, "Minimum code length for extracted fenced code blocks",
                              LogicalType::BIGINT,
                              Value::BIGINT(static_cast<int64_t>(doc_chunker::DEFAULT_MIN_CODE_LENGTH)));
}

idx_t DocChunkerSettings::ValidateChunkSize(int64_t chunk_size) {
    if (chunk_size <= 0) {
        throw InvalidInputException("chunk_size must be greater than zero, got %lld",
                                    static_cast<long long>(chunk_size));
    }
    return static_cast<idx_t>(chunk_size);
}

idx_t DocChunkerSettings::ValidateMinLength(int64_t min_length) {
    if (min_length < 0) {
        throw InvalidInputException("min_length must not be negative, got %lld", static_cast<long long>(min_length));
    }
    return static_cast<idx_t>(min_length);
}

DocChunkerOptions DocChunkerSettings::LoadDefaults(ClientContext &context) {
    DocChunkerOptions options;

    Value value;
    if (context.TryGetCurrentSetting(CHUNK_SIZE_SETTING, value) && !value.IsNull()) {
        options.chunk_size = ValidateChunkSize(value.GetValue<int64_t>());
    }
    if (context.TryGetCurrentSetting(MIN_CODE_LENGTH_SETTING, value) && !value.IsNull()) {
        options.min_length = ValidateMinLength(value.GetValue<int64_t>());
    }

    return options;
}

void DocChunkerSettings::ApplyNamedParameters(const named_parameter_map_t &parameters, DocChunkerOptions &options,
                                              const string &function_name) {
    for (const auto &kv : parameters) {
        if (kv.second.IsNull()) {
            throw InvalidInputException("Parameter %s for %s cannot be NULL", kv.first, function_name);
        }
        if (kv.first == "chunk_size") {
            options.chunk_size = ValidateChunkSize(kv.second.GetValue<int64_t>());
        } else if (kv.first == "min_length") {
            options.min_length = ValidateMinLength(kv.second.GetValue<int64_t>());
        } else if (kv.first == "language") {
            options.language_filter = StringValue::Get(kv.second);
        } else if (kv.first == "include_filepath") {
            options.include_filepath = BooleanValue::Get(kv.second);
        } else if (kv.first == "normalize_content") {
            options.normalize_content = BooleanValue::Get(kv.second);
        } else if (kv.first == "maximum_file_size") {
            options.maximum_file_size = UBigIntValue::Get(kv.second);
        } else if (kv.first == "ignore_errors") {
            options.ignore_errors = BooleanValue::Get(kv.second);
        } else {
            throw InvalidInputException("Unknown parameter for %s: %s", function_name, kv.first);
        }
    }
}

} // namespace duckdb
