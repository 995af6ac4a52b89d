#pragma once

#include <murmur/core/types.h>

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace murmur::chunking {

/**
 * Configuration for message body chunking.
 *
 * Sizes are counted in Unicode code points, so a chunk never splits a UTF-8
 * sequence. Valid when max_chunk_chars > overlap_chars.
 */
struct ChunkerConfig {
    size_t max_chunk_chars = 1000;
    size_t overlap_chars = 200;
    size_t lookback_chars = 100; // window searched backwards for a natural break
};

Result<void> validate(const ChunkerConfig& config);

/**
 * Splits text into ordered, bounded, overlapping chunks.
 *
 * Each chunk is filled greedily up to max_chunk_chars. The cut prefers a
 * sentence boundary, then whitespace, inside the lookback window, and falls
 * back to a hard cut. Every chunk after the first starts exactly
 * overlap_chars before the previous chunk's end. Output is a pure function of
 * (text, config).
 */
class TextChunker {
public:
    explicit TextChunker(ChunkerConfig config = {});

    const ChunkerConfig& config() const { return config_; }

    /// ConfigurationError on invalid parameters; empty text yields no chunks.
    Result<std::vector<std::string>> chunk(std::string_view text) const;

private:
    ChunkerConfig config_;
};

/**
 * Convenience wrapper with an explicit parameter set; lookback defaults to a
 * quarter of the chunk size.
 */
Result<std::vector<std::string>> chunkText(std::string_view text, size_t max_chunk_chars,
                                           size_t overlap_chars);

} // namespace murmur::chunking
