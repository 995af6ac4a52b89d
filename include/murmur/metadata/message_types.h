#pragma once

#include <murmur/core/types.h>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace murmur::metadata {

/**
 * @brief Profile row for one principal
 */
struct Profile {
    std::string id;
    std::string email;
    std::string displayName;
    std::string avatarUrl;
    TimePoint createdAt;
    TimePoint updatedAt;
};

/**
 * @brief A conversation thread on the source platform
 */
struct Conversation {
    std::string id;
    std::string ownerId;
    std::string externalId;
    std::string title;
    nlohmann::json participants = nlohmann::json::array();
    std::optional<TimePoint> lastMessageAt;
};

/**
 * @brief Values used to create or refresh a conversation during ingestion
 */
struct ConversationUpsert {
    std::string externalId;
    std::string title;
    nlohmann::json participants = nlohmann::json::array();
    TimePoint messageSentAt;
};

struct Message {
    std::string id;
    std::string ownerId;
    std::string conversationId;
    std::optional<std::string> externalId;
    std::string senderId;
    TimePoint sentAt;
    std::string body;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * @brief A bounded fragment of a message body; embedding is empty while
 * pending (stored as NULL). embedError holds the provider's reason when it
 * rejected the text permanently.
 */
struct Chunk {
    std::string id;
    std::string ownerId;
    std::string messageId;
    int chunkIndex = 0;
    std::string content;
    std::optional<Embedding> embedding;
    std::optional<std::string> embedError;
};

/**
 * @brief Result of persisting one message unit of work
 */
struct MessageCommit {
    std::string conversationId;
    std::string messageId;
    std::size_t chunksWritten = 0;
};

/**
 * @brief Persisted sync progress for one (owner, source) pair
 */
struct SyncStateRecord {
    std::string ownerId;
    std::string provider;
    std::string cursor;
    std::string status = "idle";
    std::string error;
    std::optional<TimePoint> lastSyncedAt;
};

namespace blob {

// Little-endian float32 encoding of an embedding.
std::vector<std::byte> encodeEmbedding(const Embedding& embedding);

Result<Embedding> decodeEmbedding(const std::vector<std::byte>& bytes);

} // namespace blob

} // namespace murmur::metadata
