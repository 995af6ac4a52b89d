#include <murmur/core/uuid.h>
#include <murmur/metadata/message_repository.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace murmur::metadata {

namespace {

int64_t toMillis(TimePoint tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

TimePoint fromMillis(int64_t ms) {
    return TimePoint(std::chrono::milliseconds(ms));
}

int64_t nowMillis() {
    return toMillis(std::chrono::system_clock::now());
}

// JSON columns are written by us; a parse failure means the row was edited
// outside the engine, so fall back to the column default.
nlohmann::json parseJsonColumn(const std::string& text, nlohmann::json fallback) {
    auto parsed = nlohmann::json::parse(text, nullptr, false);
    if (parsed.is_discarded()) {
        spdlog::warn("[MessageRepository] Ignoring malformed JSON column");
        return fallback;
    }
    return parsed;
}

std::optional<std::vector<std::byte>> embeddingBlob(const std::optional<Embedding>& embedding) {
    if (!embedding) {
        return std::nullopt;
    }
    return blob::encodeEmbedding(*embedding);
}

// Fetched JSON is not guaranteed to be valid UTF-8; bad bytes become U+FFFD
// instead of throwing.
std::string jsonText(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

constexpr const char* kChunkColumns = "SELECT id, user_id, message_id, chunk_index, content, "
                                      "embedding, embed_error FROM message_chunks ";

} // namespace

namespace blob {

std::vector<std::byte> encodeEmbedding(const Embedding& embedding) {
    std::vector<std::byte> bytes(embedding.size() * 4);
    for (size_t i = 0; i < embedding.size(); ++i) {
        uint32_t bits;
        std::memcpy(&bits, &embedding[i], sizeof(bits));
        for (size_t b = 0; b < 4; ++b) {
            bytes[i * 4 + b] = static_cast<std::byte>((bits >> (8 * b)) & 0xFFu);
        }
    }
    return bytes;
}

Result<Embedding> decodeEmbedding(const std::vector<std::byte>& bytes) {
    if (bytes.size() % 4 != 0) {
        return Error{ErrorCode::CorruptedData,
                     "Embedding blob size " + std::to_string(bytes.size()) +
                         " is not a multiple of 4"};
    }
    Embedding embedding(bytes.size() / 4);
    for (size_t i = 0; i < embedding.size(); ++i) {
        uint32_t bits = 0;
        for (size_t b = 0; b < 4; ++b) {
            bits |= static_cast<uint32_t>(bytes[i * 4 + b]) << (8 * b);
        }
        std::memcpy(&embedding[i], &bits, sizeof(bits));
    }
    return embedding;
}

} // namespace blob

MessageRepository::MessageRepository(Database& db) : db_(db) {}

Result<void> MessageRepository::ensureProfile(const identity::Identity& identity) {
    std::lock_guard<std::mutex> lock(mutex_);

    const int64_t now = nowMillis();
    auto insert = db_.prepareBound(
        "INSERT OR IGNORE INTO profiles "
        "(id, email, display_name, avatar_url, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?)",
        identity.principal.id(), identity.email, identity.display_name, identity.avatar_url, now,
        now);
    if (!insert)
        return insert.error();

    auto done = std::move(insert).value().execute();
    if (done && db_.changes() > 0) {
        spdlog::info("[MessageRepository] Created profile for {}", identity.principal.id());
    }
    return done;
}

Result<std::optional<Profile>> MessageRepository::getProfile(const Principal& owner) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto query = db_.prepareBound("SELECT id, email, display_name, avatar_url, created_at, "
                                  "updated_at FROM profiles WHERE id = ?",
                                  owner.id());
    if (!query)
        return query.error();
    Statement row = std::move(query).value();

    auto found = row.step();
    if (!found)
        return found.error();
    if (!found.value())
        return std::optional<Profile>{};

    Profile profile;
    profile.id = row.getString(0);
    profile.email = row.getString(1);
    profile.displayName = row.getString(2);
    profile.avatarUrl = row.getString(3);
    profile.createdAt = fromMillis(row.getInt64(4));
    profile.updatedAt = fromMillis(row.getInt64(5));
    return std::optional<Profile>{std::move(profile)};
}

Result<std::string> MessageRepository::upsertConversation(const Principal& owner,
                                                          const ConversationUpsert& conversation) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::string id;
    auto committed = db_.transaction([&]() -> Result<void> {
        auto upserted = upsertConversationLocked(owner, conversation);
        if (!upserted)
            return upserted.error();
        id = std::move(upserted).value();
        return {};
    });
    if (!committed)
        return committed.error();
    return id;
}

// Explicit lookup followed by a conditional insert or refresh. Title and
// participants are only filled in when still empty; last_message_at only moves
// forward.
Result<std::string>
MessageRepository::upsertConversationLocked(const Principal& owner,
                                            const ConversationUpsert& conversation) {
    auto query = db_.prepareBound("SELECT id, title, participants, last_message_at "
                                  "FROM conversations WHERE user_id = ? AND external_id = ?",
                                  owner.id(), conversation.externalId);
    if (!query)
        return query.error();
    Statement existing = std::move(query).value();

    auto found = existing.step();
    if (!found)
        return found.error();

    const int64_t sentAt = toMillis(conversation.messageSentAt);
    const int64_t now = nowMillis();

    if (found.value()) {
        std::string id = existing.getString(0);
        std::string title = existing.getString(1);
        auto participants = parseJsonColumn(existing.getString(2), nlohmann::json::array());
        const int64_t lastMessageAt =
            existing.isNull(3) ? sentAt : std::max(existing.getInt64(3), sentAt);

        if (title.empty()) {
            title = conversation.title;
        }
        if (participants.empty()) {
            participants = conversation.participants;
        }

        auto update = db_.prepareBound(
            "UPDATE conversations SET title = ?, participants = ?, last_message_at = ?, "
            "updated_at = ? WHERE id = ? AND user_id = ?",
            title, jsonText(participants), lastMessageAt, now, id, owner.id());
        if (!update)
            return update.error();
        if (auto done = std::move(update).value().execute(); !done)
            return done.error();
        return id;
    }

    std::string id = core::generateUUID();
    auto insert = db_.prepareBound(
        "INSERT INTO conversations (id, user_id, external_id, title, participants, "
        "last_message_at, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?)",
        id, owner.id(), conversation.externalId, conversation.title,
        jsonText(conversation.participants), sentAt, now, now);
    if (!insert)
        return insert.error();
    if (auto done = std::move(insert).value().execute(); !done)
        return done.error();

    spdlog::debug("[MessageRepository] New conversation {} ({}) for {}", id,
                  conversation.externalId, owner.id());
    return id;
}

Result<std::optional<Conversation>>
MessageRepository::findConversationByExternalId(const Principal& owner,
                                                const std::string& externalId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto query =
        db_.prepareBound("SELECT id, user_id, external_id, title, participants, last_message_at "
                         "FROM conversations WHERE user_id = ? AND external_id = ?",
                         owner.id(), externalId);
    if (!query)
        return query.error();
    Statement row = std::move(query).value();

    auto found = row.step();
    if (!found)
        return found.error();
    if (!found.value())
        return std::optional<Conversation>{};

    Conversation conversation;
    conversation.id = row.getString(0);
    conversation.ownerId = row.getString(1);
    conversation.externalId = row.getString(2);
    conversation.title = row.getString(3);
    conversation.participants = parseJsonColumn(row.getString(4), nlohmann::json::array());
    if (!row.isNull(5)) {
        conversation.lastMessageAt = fromMillis(row.getInt64(5));
    }
    return std::optional<Conversation>{std::move(conversation)};
}

Result<std::optional<Message>> MessageRepository::findMessageByExternalId(
    const Principal& owner, const std::string& externalId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto query = db_.prepareBound("SELECT id, user_id, conversation_id, external_id, sender_id, "
                                  "sent_at, body, metadata FROM messages "
                                  "WHERE user_id = ? AND external_id = ?",
                                  owner.id(), externalId);
    if (!query)
        return query.error();
    Statement row = std::move(query).value();

    auto found = row.step();
    if (!found)
        return found.error();
    if (!found.value())
        return std::optional<Message>{};

    Message message;
    message.id = row.getString(0);
    message.ownerId = row.getString(1);
    message.conversationId = row.getString(2);
    if (!row.isNull(3)) {
        message.externalId = row.getString(3);
    }
    message.senderId = row.getString(4);
    message.sentAt = fromMillis(row.getInt64(5));
    message.body = row.getString(6);
    message.metadata = parseJsonColumn(row.getString(7), nlohmann::json::object());
    return std::optional<Message>{std::move(message)};
}

Result<MessageCommit> MessageRepository::commitMessage(const Principal& owner,
                                                       const ConversationUpsert& conversation,
                                                       Message message, std::vector<Chunk> chunks) {
    std::lock_guard<std::mutex> lock(mutex_);

    MessageCommit commit;
    auto committed = db_.transaction([&]() -> Result<void> {
        if (message.externalId) {
            auto lookup = db_.prepareBound(
                "SELECT 1 FROM messages WHERE user_id = ? AND external_id = ?", owner.id(),
                *message.externalId);
            if (!lookup)
                return lookup.error();
            auto seen = std::move(lookup).value().step();
            if (!seen)
                return seen.error();
            if (seen.value()) {
                return Error{ErrorCode::DuplicateExternalId,
                             "Message " + *message.externalId + " already stored"};
            }
        }

        auto conversationId = upsertConversationLocked(owner, conversation);
        if (!conversationId)
            return conversationId.error();
        commit.conversationId = std::move(conversationId).value();

        if (message.id.empty()) {
            message.id = core::generateUUID();
        }
        commit.messageId = message.id;

        const int64_t now = nowMillis();
        auto insert = db_.prepareBound(
            "INSERT INTO messages (id, user_id, conversation_id, external_id, sender_id, sent_at, "
            "body, metadata, created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?, ?)",
            message.id, owner.id(), commit.conversationId, message.externalId, message.senderId,
            toMillis(message.sentAt), message.body, jsonText(message.metadata), now, now);
        if (!insert)
            return insert.error();
        if (auto done = std::move(insert).value().execute(); !done)
            return done;

        auto prepared = db_.prepare(
            "INSERT INTO message_chunks (id, user_id, message_id, chunk_index, content, "
            "embedding, embed_error, created_at, updated_at) "
            "VALUES (?, ?, ?, ?, ?, ?, ?, ?, ?)");
        if (!prepared)
            return prepared.error();
        Statement insertChunk = std::move(prepared).value();

        for (auto& chunk : chunks) {
            if (chunk.id.empty()) {
                chunk.id = core::generateUUID();
            }
            auto rewound = insertChunk.reset();
            if (!rewound)
                return rewound;
            auto bound = insertChunk.bindAll(chunk.id, owner.id(), message.id, chunk.chunkIndex,
                                             chunk.content, embeddingBlob(chunk.embedding),
                                             chunk.embedError, now, now);
            if (!bound)
                return bound;
            if (auto done = insertChunk.execute(); !done)
                return done;
        }
        commit.chunksWritten = chunks.size();
        return {};
    });

    if (!committed)
        return committed.error();
    return commit;
}

Result<void> MessageRepository::updateChunkEmbedding(const Principal& owner,
                                                     const std::string& chunkId,
                                                     const Embedding& embedding) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto update = db_.prepareBound("UPDATE message_chunks SET embedding = ?, "
                                   "embed_error = NULL, updated_at = ? "
                                   "WHERE id = ? AND user_id = ?",
                                   blob::encodeEmbedding(embedding), nowMillis(), chunkId,
                                   owner.id());
    if (!update)
        return update.error();
    if (auto done = std::move(update).value().execute(); !done)
        return done;
    if (db_.changes() == 0) {
        return Error{ErrorCode::NotFound, "Chunk not found: " + chunkId};
    }
    return {};
}

Result<void> MessageRepository::markChunkRejected(const Principal& owner,
                                                  const std::string& chunkId,
                                                  const std::string& reason) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto update = db_.prepareBound("UPDATE message_chunks SET embed_error = ?, updated_at = ? "
                                   "WHERE id = ? AND user_id = ? AND embedding IS NULL",
                                   reason, nowMillis(), chunkId, owner.id());
    if (!update)
        return update.error();
    if (auto done = std::move(update).value().execute(); !done)
        return done;
    if (db_.changes() == 0) {
        return Error{ErrorCode::NotFound, "Pending chunk not found: " + chunkId};
    }
    return {};
}

Result<std::vector<Chunk>> MessageRepository::readChunks(Statement& rows) {
    std::vector<Chunk> chunks;
    for (;;) {
        auto more = rows.step();
        if (!more)
            return more.error();
        if (!more.value())
            return chunks;

        Chunk chunk;
        chunk.id = rows.getString(0);
        chunk.ownerId = rows.getString(1);
        chunk.messageId = rows.getString(2);
        chunk.chunkIndex = rows.getInt(3);
        chunk.content = rows.getString(4);
        if (!rows.isNull(5)) {
            auto decoded = blob::decodeEmbedding(rows.getBlob(5));
            if (!decoded)
                return decoded.error();
            chunk.embedding = std::move(decoded).value();
        }
        if (!rows.isNull(6)) {
            chunk.embedError = rows.getString(6);
        }
        chunks.push_back(std::move(chunk));
    }
}

Result<std::vector<Chunk>> MessageRepository::listPendingChunks(const Principal& owner,
                                                                std::size_t limit) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto query = db_.prepareBound(std::string(kChunkColumns) +
                                      "WHERE user_id = ? AND embedding IS NULL "
                                      "AND embed_error IS NULL "
                                      "ORDER BY created_at, message_id, chunk_index LIMIT ?",
                                  owner.id(), static_cast<int64_t>(limit));
    if (!query)
        return query.error();
    Statement rows = std::move(query).value();
    return readChunks(rows);
}

Result<std::vector<Chunk>> MessageRepository::getChunks(const Principal& owner,
                                                        const std::vector<std::string>& chunkIds) {
    if (chunkIds.empty()) {
        return std::vector<Chunk>{};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    std::string sql = std::string(kChunkColumns) + "WHERE user_id = ? AND id IN (?";
    sql.reserve(sql.size() + chunkIds.size() * 3);
    for (size_t i = 1; i < chunkIds.size(); ++i) {
        sql += ", ?";
    }
    sql += ")";

    auto prepared = db_.prepare(sql);
    if (!prepared)
        return prepared.error();
    Statement rows = std::move(prepared).value();

    int index = 1;
    if (auto bound = rows.bind(index, owner.id()); !bound)
        return bound.error();
    for (const auto& id : chunkIds) {
        if (auto bound = rows.bind(++index, id); !bound)
            return bound.error();
    }
    return readChunks(rows);
}

Result<std::vector<Chunk>> MessageRepository::getChunksForMessage(const Principal& owner,
                                                                  const std::string& messageId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto query = db_.prepareBound(std::string(kChunkColumns) +
                                      "WHERE user_id = ? AND message_id = ? ORDER BY chunk_index",
                                  owner.id(), messageId);
    if (!query)
        return query.error();
    Statement rows = std::move(query).value();
    return readChunks(rows);
}

Result<std::vector<std::pair<std::string, Embedding>>>
MessageRepository::loadEmbeddings(const Principal& owner) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto query = db_.prepareBound("SELECT id, embedding FROM message_chunks "
                                  "WHERE user_id = ? AND embedding IS NOT NULL ORDER BY id",
                                  owner.id());
    if (!query)
        return query.error();
    Statement rows = std::move(query).value();

    std::vector<std::pair<std::string, Embedding>> entries;
    for (;;) {
        auto more = rows.step();
        if (!more)
            return more.error();
        if (!more.value())
            return entries;

        auto decoded = blob::decodeEmbedding(rows.getBlob(1));
        if (!decoded) {
            spdlog::warn("[MessageRepository] Skipping chunk {}: {}", rows.getString(0),
                         decoded.error().message);
            continue;
        }
        entries.emplace_back(rows.getString(0), std::move(decoded).value());
    }
}

Result<int64_t> MessageRepository::countWhere(const std::string& sql, const Principal& owner) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto query = db_.prepareBound(sql, owner.id());
    if (!query)
        return query.error();
    Statement row = std::move(query).value();
    if (auto stepped = row.step(); !stepped)
        return stepped.error();
    return row.getInt64(0);
}

Result<int64_t> MessageRepository::countMessages(const Principal& owner) {
    return countWhere("SELECT COUNT(*) FROM messages WHERE user_id = ?", owner);
}

Result<int64_t> MessageRepository::countChunks(const Principal& owner) {
    return countWhere("SELECT COUNT(*) FROM message_chunks WHERE user_id = ?", owner);
}

Result<int64_t> MessageRepository::countPendingChunks(const Principal& owner) {
    return countWhere(
        "SELECT COUNT(*) FROM message_chunks WHERE user_id = ? AND embedding IS NULL", owner);
}

Result<std::vector<std::string>>
MessageRepository::chunkIdsWhere(const std::string& whereClause, const Principal& owner,
                                 const std::string& id) {
    auto query = db_.prepareBound("SELECT c.id FROM message_chunks c "
                                  "JOIN messages m ON m.id = c.message_id "
                                  "WHERE c.user_id = ? AND " +
                                      whereClause,
                                  owner.id(), id);
    if (!query)
        return query.error();
    Statement rows = std::move(query).value();

    std::vector<std::string> ids;
    for (;;) {
        auto more = rows.step();
        if (!more)
            return more.error();
        if (!more.value())
            return ids;
        ids.push_back(rows.getString(0));
    }
}

Result<std::vector<std::string>>
MessageRepository::deleteOwnedRow(const char* table, const char* noun, const char* chunkFilter,
                                  const Principal& owner, const std::string& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> removed;
    auto committed = db_.transaction([&]() -> Result<void> {
        auto ids = chunkIdsWhere(chunkFilter, owner, id);
        if (!ids)
            return ids.error();

        auto erase = db_.prepareBound(std::string("DELETE FROM ") + table +
                                          " WHERE id = ? AND user_id = ?",
                                      id, owner.id());
        if (!erase)
            return erase.error();
        if (auto done = std::move(erase).value().execute(); !done)
            return done;
        if (db_.changes() == 0) {
            return Error{ErrorCode::NotFound, std::string(noun) + " not found: " + id};
        }
        removed = std::move(ids).value();
        return {};
    });
    if (!committed)
        return committed.error();

    spdlog::debug("[MessageRepository] Deleted {} {} ({} chunks)", noun, id, removed.size());
    return removed;
}

Result<std::vector<std::string>>
MessageRepository::deleteConversation(const Principal& owner, const std::string& conversationId) {
    return deleteOwnedRow("conversations", "Conversation", "m.conversation_id = ?", owner,
                          conversationId);
}

Result<std::vector<std::string>> MessageRepository::deleteMessage(const Principal& owner,
                                                                  const std::string& messageId) {
    return deleteOwnedRow("messages", "Message", "m.id = ?", owner, messageId);
}

Result<void> MessageRepository::purgeOwner(const Principal& owner) {
    std::lock_guard<std::mutex> lock(mutex_);

    // Conversations, messages, chunks and sync state cascade from the profile.
    auto erase = db_.prepareBound("DELETE FROM profiles WHERE id = ?", owner.id());
    if (!erase)
        return erase.error();
    auto done = std::move(erase).value().execute();
    if (done) {
        spdlog::info("[MessageRepository] Purged all data for {}", owner.id());
    }
    return done;
}

Result<std::optional<SyncStateRecord>>
MessageRepository::loadSyncState(const Principal& owner, const std::string& provider) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto query = db_.prepareBound("SELECT cursor, status, error, last_synced_at FROM sync_state "
                                  "WHERE user_id = ? AND provider = ?",
                                  owner.id(), provider);
    if (!query)
        return query.error();
    Statement row = std::move(query).value();

    auto found = row.step();
    if (!found)
        return found.error();
    if (!found.value())
        return std::optional<SyncStateRecord>{};

    SyncStateRecord record;
    record.ownerId = owner.id();
    record.provider = provider;
    record.cursor = row.getString(0);
    record.status = row.getString(1);
    record.error = row.getString(2);
    if (!row.isNull(3)) {
        record.lastSyncedAt = fromMillis(row.getInt64(3));
    }
    return std::optional<SyncStateRecord>{std::move(record)};
}

Result<void> MessageRepository::saveSyncState(const Principal& owner,
                                              const SyncStateRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::optional<int64_t> syncedAt;
    if (record.lastSyncedAt) {
        syncedAt = toMillis(*record.lastSyncedAt);
    }
    const int64_t now = nowMillis();
    auto upsert = db_.prepareBound(
        "INSERT INTO sync_state (user_id, provider, cursor, status, error, last_synced_at, "
        "created_at, updated_at) VALUES (?, ?, ?, ?, ?, ?, ?, ?) "
        "ON CONFLICT (user_id, provider) DO UPDATE SET cursor = excluded.cursor, "
        "status = excluded.status, error = excluded.error, "
        "last_synced_at = excluded.last_synced_at, updated_at = excluded.updated_at",
        owner.id(), record.provider, record.cursor, record.status, record.error, syncedAt, now,
        now);
    if (!upsert)
        return upsert.error();
    return std::move(upsert).value().execute();
}

} // namespace murmur::metadata
