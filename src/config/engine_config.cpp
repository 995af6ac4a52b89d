#include <murmur/config/engine_config.h>

#include <spdlog/spdlog.h>

#include <cstdlib>
#include <initializer_list>

namespace murmur::config {

namespace {

Result<void> assignSize(const ConfigMap& values, const std::string& key, size_t& target) {
    auto value = lookup_int(values, key);
    if (!value)
        return value.error();
    if (!value.value())
        return {};
    if (*value.value() < 0) {
        return Error{ErrorCode::ConfigurationError, key + " must not be negative"};
    }
    target = static_cast<size_t>(*value.value());
    return {};
}

Result<void> assignMillis(const ConfigMap& values, const std::string& key,
                          std::chrono::milliseconds& target) {
    auto value = lookup_int(values, key);
    if (!value)
        return value.error();
    if (!value.value())
        return {};
    if (*value.value() < 0) {
        return Error{ErrorCode::ConfigurationError, key + " must not be negative"};
    }
    target = std::chrono::milliseconds(*value.value());
    return {};
}

template <typename T>
Result<void> assignDouble(const ConfigMap& values, const std::string& key, T& target) {
    auto value = lookup_double(values, key);
    if (!value)
        return value.error();
    if (value.value()) {
        target = static_cast<T>(*value.value());
    }
    return {};
}

Result<void> assignString(const ConfigMap& values, const std::string& key, std::string& target) {
    auto value = lookup_string(values, key);
    if (!value)
        return value.error();
    if (value.value()) {
        target = *value.value();
    }
    return {};
}

} // namespace

Result<void> EngineConfig::apply(const ConfigMap& values) {
    std::string logFile;
    auto setters = {
        assignString(values, "database.path", database_path),
        assignString(values, "logging.level", logging.level),
        assignString(values, "logging.file", logFile),
        assignSize(values, "logging.max_file_bytes", logging.max_file_bytes),
        assignSize(values, "logging.max_files", logging.max_files),
        assignSize(values, "chunking.max_chunk_chars", chunking.max_chunk_chars),
        assignSize(values, "chunking.overlap_chars", chunking.overlap_chars),
        assignSize(values, "chunking.lookback_chars", chunking.lookback_chars),
        assignSize(values, "embedding.dimension", embedding.dimension),
        assignSize(values, "embedding.batch_size", embedding.batch_size),
        assignSize(values, "embedding.max_attempts", embedding.max_attempts),
        assignMillis(values, "embedding.initial_backoff_ms", embedding.initial_backoff),
        assignMillis(values, "embedding.max_backoff_ms", embedding.max_backoff),
        assignDouble(values, "embedding.jitter", embedding.jitter),
        assignMillis(values, "embedding.call_timeout_ms", embedding.call_timeout),
        assignSize(values, "index.exact_search_threshold", index.exact_search_threshold),
        assignSize(values, "index.ivf_nlist", index.ivf_nlist),
        assignSize(values, "index.ivf_nprobe", index.ivf_nprobe),
        assignSize(values, "index.kmeans_iterations", index.kmeans_iterations),
        assignSize(values, "search.default_k", search.default_k),
        assignDouble(values, "search.default_threshold", search.default_threshold),
        assignMillis(values, "sync.fetch_timeout_ms", sync.fetch_timeout),
        assignSize(values, "sync.fetch_max_attempts", sync.fetch_max_attempts),
        assignMillis(values, "sync.fetch_initial_backoff_ms", sync.fetch_initial_backoff),
        assignSize(values, "sync.pending_batch_limit", sync.pending_batch_limit),
        assignSize(values, "sync.worker_threads", worker_threads),
    };
    for (const auto& result : setters) {
        if (!result)
            return result;
    }

    size_t seed = static_cast<size_t>(index.seed);
    auto seedResult = assignSize(values, "index.seed", seed);
    if (!seedResult)
        return seedResult;
    index.seed = seed;

    if (!logFile.empty()) {
        logging.file = expand_tilde(logFile);
    }
    index.dimension = embedding.dimension;
    return {};
}

Result<void> EngineConfig::applyEnvironment() {
    if (const char* dbPath = std::getenv("MURMUR_DB_PATH"); dbPath && *dbPath) {
        database_path = dbPath;
    }
    if (const char* level = std::getenv("MURMUR_LOG_LEVEL"); level && *level) {
        logging.level = level;
    }
    if (const char* dim = std::getenv("MURMUR_EMBEDDING_DIM"); dim && *dim) {
        ConfigMap env{{"embedding.dimension", dim}};
        auto applied = assignSize(env, "embedding.dimension", embedding.dimension);
        if (!applied) {
            return Error{ErrorCode::ConfigurationError,
                         "MURMUR_EMBEDDING_DIM: " + applied.error().message};
        }
        index.dimension = embedding.dimension;
    }
    return {};
}

Result<void> EngineConfig::validate() const {
    if (auto r = chunking::validate(chunking); !r)
        return r;
    if (auto r = vector::validate(embedding); !r)
        return r;
    if (auto r = vector::validate(index); !r)
        return r;
    if (auto r = ingest::validate(sync); !r)
        return r;
    if (index.dimension != embedding.dimension) {
        return Error{ErrorCode::ConfigurationError,
                     "Index dimension " + std::to_string(index.dimension) +
                         " differs from embedding dimension " +
                         std::to_string(embedding.dimension)};
    }
    if (search.default_k == 0) {
        return Error{ErrorCode::ConfigurationError, "search.default_k must be positive"};
    }
    if (search.default_threshold < -1.0f || search.default_threshold > 1.0f) {
        return Error{ErrorCode::ConfigurationError,
                     "search.default_threshold must be within [-1, 1]"};
    }
    if (logging.max_files == 0 || logging.max_file_bytes == 0) {
        return Error{ErrorCode::ConfigurationError, "Log rotation sizes must be positive"};
    }
    return {};
}

std::string EngineConfig::resolvedDatabasePath() const {
    if (!database_path.empty()) {
        return database_path == ":memory:" ? database_path
                                           : expand_tilde(database_path).string();
    }
    return (get_data_dir() / "murmur.db").string();
}

Result<EngineConfig> EngineConfig::load(const std::filesystem::path& path) {
    EngineConfig config;

    std::filesystem::path configPath = path;
    bool required = !configPath.empty();
    if (configPath.empty()) {
        if (const char* env = std::getenv("MURMUR_CONFIG"); env && *env) {
            configPath = expand_tilde(env);
            required = true;
        } else {
            configPath = get_config_path();
        }
    }

    std::error_code ec;
    if (std::filesystem::exists(configPath, ec)) {
        auto values = parse_config_file(configPath);
        if (!values)
            return values.error();
        auto applied = config.apply(values.value());
        if (!applied)
            return applied.error();
        spdlog::debug("[EngineConfig] Loaded {}", configPath.string());
    } else if (required) {
        return Error{ErrorCode::NotFound, "Config file not found: " + configPath.string()};
    }

    auto env = config.applyEnvironment();
    if (!env)
        return env.error();

    auto valid = config.validate();
    if (!valid)
        return valid.error();
    return config;
}

} // namespace murmur::config
