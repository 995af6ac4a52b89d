#include <murmur/chunking/text_chunker.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace murmur::chunking {

namespace {

// Byte offset of every code point start. Continuation bytes (10xxxxxx) never
// start a code point; a malformed leading continuation byte still opens one.
std::vector<size_t> codePointOffsets(std::string_view text) {
    std::vector<size_t> offsets;
    offsets.reserve(text.size());
    for (size_t i = 0; i < text.size(); ++i) {
        auto byte = static_cast<unsigned char>(text[i]);
        if (i == 0 || (byte & 0xC0) != 0x80) {
            offsets.push_back(i);
        }
    }
    return offsets;
}

class CodePointView {
public:
    explicit CodePointView(std::string_view text) : text_(text), offsets_(codePointOffsets(text)) {}

    size_t size() const { return offsets_.size(); }

    size_t byteOffset(size_t cp) const { return cp < offsets_.size() ? offsets_[cp] : text_.size(); }

    std::string slice(size_t from, size_t to) const {
        size_t b = byteOffset(from);
        return std::string(text_.substr(b, byteOffset(to) - b));
    }

    // ASCII classification only; multi-byte code points are never boundaries.
    bool isSpace(size_t cp) const {
        if (cp >= offsets_.size()) {
            return false;
        }
        char c = text_[offsets_[cp]];
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    }

    bool isTerminator(size_t cp) const {
        if (cp >= offsets_.size()) {
            return false;
        }
        char c = text_[offsets_[cp]];
        return c == '.' || c == '!' || c == '?';
    }

    bool isNewline(size_t cp) const { return cp < offsets_.size() && text_[offsets_[cp]] == '\n'; }

private:
    std::string_view text_;
    std::vector<size_t> offsets_;
};

// A cut at `end` (exclusive) lands right after "<terminator><space>" or a newline.
bool isSentenceBreak(const CodePointView& cps, size_t end) {
    if (end == 0) {
        return false;
    }
    if (cps.isNewline(end - 1)) {
        return true;
    }
    return end >= 2 && cps.isSpace(end - 1) && cps.isTerminator(end - 2);
}

bool isWordBreak(const CodePointView& cps, size_t end) {
    return (end > 0 && cps.isSpace(end - 1)) || cps.isSpace(end);
}

} // namespace

Result<void> validate(const ChunkerConfig& config) {
    if (config.max_chunk_chars == 0) {
        return Error{ErrorCode::ConfigurationError, "max_chunk_chars must be positive"};
    }
    if (config.max_chunk_chars <= config.overlap_chars) {
        return Error{ErrorCode::ConfigurationError,
                     "max_chunk_chars (" + std::to_string(config.max_chunk_chars) +
                         ") must exceed overlap_chars (" + std::to_string(config.overlap_chars) +
                         ")"};
    }
    return {};
}

TextChunker::TextChunker(ChunkerConfig config) : config_(config) {}

Result<std::vector<std::string>> TextChunker::chunk(std::string_view text) const {
    if (auto valid = validate(config_); !valid) {
        return valid.error();
    }

    std::vector<std::string> chunks;
    if (text.empty()) {
        return chunks;
    }

    const CodePointView cps(text);
    const size_t total = cps.size();
    const size_t maxChars = config_.max_chunk_chars;
    const size_t overlap = config_.overlap_chars;

    size_t start = 0;
    while (true) {
        if (total - start <= maxChars) {
            chunks.push_back(cps.slice(start, total));
            break;
        }

        const size_t hardEnd = start + maxChars;
        // The next chunk must start strictly after this one does.
        const size_t minEnd = start + overlap + 1;
        const size_t lookback = std::min(config_.lookback_chars, maxChars);
        const size_t windowLow = std::max(minEnd, hardEnd - lookback);

        size_t end = hardEnd;
        bool found = false;
        for (size_t p = hardEnd; p >= windowLow && p > start; --p) {
            if (isSentenceBreak(cps, p)) {
                end = p;
                found = true;
                break;
            }
        }
        if (!found) {
            for (size_t p = hardEnd; p >= windowLow && p > start; --p) {
                if (isWordBreak(cps, p)) {
                    end = p;
                    break;
                }
            }
        }

        chunks.push_back(cps.slice(start, end));
        start = end - overlap;
    }

    spdlog::trace("[TextChunker] {} code points -> {} chunks (max={}, overlap={})", total,
                  chunks.size(), maxChars, overlap);
    return chunks;
}

Result<std::vector<std::string>> chunkText(std::string_view text, size_t max_chunk_chars,
                                           size_t overlap_chars) {
    ChunkerConfig config;
    config.max_chunk_chars = max_chunk_chars;
    config.overlap_chars = overlap_chars;
    config.lookback_chars = max_chunk_chars / 4;
    return TextChunker(config).chunk(text);
}

} // namespace murmur::chunking
