#pragma once

#include <murmur/chunking/text_chunker.h>
#include <murmur/config/config_helpers.h>
#include <murmur/core/logging.h>
#include <murmur/core/types.h>
#include <murmur/ingest/ingestion_pipeline.h>
#include <murmur/vector/embedding_gateway.h>
#include <murmur/vector/vector_index.h>

#include <cstddef>
#include <filesystem>
#include <string>

namespace murmur::config {

struct SearchDefaults {
    size_t default_k = 10;
    float default_threshold = 0.7f;
};

/**
 * Everything the engine needs, with defaults that work out of the box.
 *
 * File format (all keys optional):
 *
 *   [database]  path
 *   [logging]   level, file, max_file_bytes, max_files
 *   [chunking]  max_chunk_chars, overlap_chars, lookback_chars
 *   [embedding] dimension, batch_size, max_attempts, initial_backoff_ms,
 *               max_backoff_ms, jitter, call_timeout_ms
 *   [index]     exact_search_threshold, ivf_nlist, ivf_nprobe,
 *               kmeans_iterations, seed
 *   [search]    default_k, default_threshold
 *   [sync]      fetch_timeout_ms, fetch_max_attempts, fetch_initial_backoff_ms,
 *               pending_batch_limit, worker_threads
 *
 * Environment overrides: MURMUR_DB_PATH, MURMUR_LOG_LEVEL, MURMUR_EMBEDDING_DIM.
 */
struct EngineConfig {
    std::string database_path; // empty = <data dir>/murmur.db, ":memory:" = in-memory
    core::LoggingConfig logging;
    chunking::ChunkerConfig chunking;
    vector::EmbeddingGatewayConfig embedding;
    vector::IndexConfig index;
    SearchDefaults search;
    ingest::PipelineConfig sync;
    size_t worker_threads = 0; // 0 = hardware concurrency

    /// ConfigurationError naming the first invalid setting.
    Result<void> validate() const;

    /// Apply "section.key" values over the current settings.
    Result<void> apply(const ConfigMap& values);

    /// Apply MURMUR_* environment overrides.
    Result<void> applyEnvironment();

    /// Resolved database file (data dir default applied).
    std::string resolvedDatabasePath() const;

    /**
     * Defaults, then the config file, then the environment, then validate().
     *
     * An explicit `path` (or MURMUR_CONFIG) must exist; the default location
     * is optional.
     */
    static Result<EngineConfig> load(const std::filesystem::path& path = {});
};

} // namespace murmur::config
