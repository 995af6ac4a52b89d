#pragma once

#include <murmur/core/types.h>
#include <murmur/identity/principal.h>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace murmur::ingest {

/**
 * A message as delivered by the source platform, before deduplication.
 */
struct RawMessage {
    std::optional<std::string> externalId;
    std::string conversationExternalId;
    std::string conversationTitle;
    nlohmann::json participants = nlohmann::json::array();
    std::string senderId;
    TimePoint sentAt;
    std::string body;
    nlohmann::json metadata = nlohmann::json::object();
};

/**
 * One page of fetched messages. `nextCursor` resumes after this page.
 */
struct FetchPage {
    std::vector<RawMessage> messages;
    std::string nextCursor;
    bool hasMore = false;
};

/**
 * Pulls messages for an owner from an external source.
 *
 * fetch() must be idempotent: the same cursor yields the same page. Failures
 * use the transient codes (ProviderUnavailable, Timeout, NetworkError) when a
 * later retry can succeed; exceeding `timeout` is ErrorCode::Timeout.
 */
class IMessageSourceFetcher {
public:
    virtual ~IMessageSourceFetcher() = default;

    virtual Result<FetchPage> fetch(const identity::Principal& owner, const std::string& source,
                                    const std::string& cursor,
                                    std::chrono::milliseconds timeout) = 0;
};

} // namespace murmur::ingest
