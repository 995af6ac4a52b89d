#pragma once

#include <murmur/core/types.h>
#include <murmur/identity/identity_resolver.h>
#include <murmur/metadata/database.h>
#include <murmur/metadata/message_types.h>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace murmur::metadata {

using identity::Principal;

/**
 * @brief Owner-scoped access to profiles, conversations, messages, chunks
 * and sync state.
 *
 * Every query carries an owner predicate taken from the Principal argument;
 * a row that belongs to another owner behaves exactly like a missing row.
 * Calls are serialized on the shared connection, so each public method is
 * one consistent unit against the database.
 */
class MessageRepository {
public:
    explicit MessageRepository(Database& db);

    MessageRepository(const MessageRepository&) = delete;
    MessageRepository& operator=(const MessageRepository&) = delete;

    // Profiles
    Result<void> ensureProfile(const identity::Identity& identity);
    Result<std::optional<Profile>> getProfile(const Principal& owner);

    // Conversations
    Result<std::string> upsertConversation(const Principal& owner,
                                           const ConversationUpsert& conversation);
    Result<std::optional<Conversation>> findConversationByExternalId(const Principal& owner,
                                                                     const std::string& externalId);

    // Messages
    Result<std::optional<Message>> findMessageByExternalId(const Principal& owner,
                                                           const std::string& externalId);

    /**
     * @brief Persist one message with its chunks as a single transaction.
     *
     * The conversation is upserted, the (owner, external id) dedup key is
     * checked and the message and chunk rows are inserted together. Returns
     * DuplicateExternalId, with nothing written, when the key already exists.
     * Ids left empty on `message` and `chunks` are generated.
     */
    Result<MessageCommit> commitMessage(const Principal& owner,
                                        const ConversationUpsert& conversation, Message message,
                                        std::vector<Chunk> chunks);

    // Chunks
    Result<void> updateChunkEmbedding(const Principal& owner, const std::string& chunkId,
                                      const Embedding& embedding);
    /// Record a permanent provider rejection; the chunk leaves the pending queue.
    Result<void> markChunkRejected(const Principal& owner, const std::string& chunkId,
                                   const std::string& reason);
    /// Oldest pending chunks, excluding rejected ones.
    Result<std::vector<Chunk>> listPendingChunks(const Principal& owner, std::size_t limit);
    Result<std::vector<Chunk>> getChunks(const Principal& owner,
                                         const std::vector<std::string>& chunkIds);
    Result<std::vector<Chunk>> getChunksForMessage(const Principal& owner,
                                                   const std::string& messageId);

    /// (chunk id, embedding) for every embedded chunk of the owner.
    Result<std::vector<std::pair<std::string, Embedding>>> loadEmbeddings(const Principal& owner);

    // Counts
    Result<int64_t> countMessages(const Principal& owner);
    Result<int64_t> countChunks(const Principal& owner);
    Result<int64_t> countPendingChunks(const Principal& owner);

    // Deletes; each returns the ids of the chunks that went with the rows.
    Result<std::vector<std::string>> deleteConversation(const Principal& owner,
                                                        const std::string& conversationId);
    Result<std::vector<std::string>> deleteMessage(const Principal& owner,
                                                   const std::string& messageId);
    Result<void> purgeOwner(const Principal& owner);

    // Sync state
    Result<std::optional<SyncStateRecord>> loadSyncState(const Principal& owner,
                                                         const std::string& provider);
    Result<void> saveSyncState(const Principal& owner, const SyncStateRecord& record);

private:
    Result<std::string> upsertConversationLocked(const Principal& owner,
                                                 const ConversationUpsert& conversation);
    Result<std::vector<std::string>> chunkIdsWhere(const std::string& whereClause,
                                                   const Principal& owner, const std::string& id);
    // Delete one owned row of `table`; returns the chunk ids that cascade with it.
    Result<std::vector<std::string>> deleteOwnedRow(const char* table, const char* noun,
                                                    const char* chunkFilter,
                                                    const Principal& owner,
                                                    const std::string& id);
    Result<int64_t> countWhere(const std::string& sql, const Principal& owner);
    Result<std::vector<Chunk>> readChunks(Statement& stmt);

    Database& db_;
    std::mutex mutex_;
};

} // namespace murmur::metadata
