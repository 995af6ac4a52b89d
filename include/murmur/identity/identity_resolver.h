#pragma once

#include <murmur/core/types.h>
#include <murmur/identity/principal.h>

#include <map>
#include <mutex>
#include <string>

namespace murmur::identity {

/**
 * Profile attributes that come with a resolved identity; stored in the
 * owner's profile row the first time the principal is seen.
 */
struct Identity {
    Principal principal;
    std::string email;
    std::string display_name;
    std::string avatar_url;
};

/**
 * Supplies the authenticated principal for a request credential (session
 * token, JWT, ...). Unknown or invalid credentials are PermissionDenied.
 */
class IIdentityResolver {
public:
    virtual ~IIdentityResolver() = default;

    virtual Result<Identity> resolve(const std::string& credential) = 0;

protected:
    // The only way to mint a Principal.
    static Principal issue(std::string ownerId) { return Principal(std::move(ownerId)); }
};

/**
 * Fixed credential -> identity table; for development and tests.
 */
class StaticIdentityResolver : public IIdentityResolver {
public:
    struct Entry {
        std::string owner_id;
        std::string email;
        std::string display_name;
        std::string avatar_url;
    };

    StaticIdentityResolver() = default;

    /// Register a credential; InvalidArgument for an empty credential or owner id.
    Result<void> addCredential(const std::string& credential, Entry entry);

    /// Forget a credential (revocation).
    void revokeCredential(const std::string& credential);

    Result<Identity> resolve(const std::string& credential) override;

private:
    std::mutex mutex_;
    std::map<std::string, Entry> entries_;
};

} // namespace murmur::identity
