#include <murmur/identity/identity_resolver.h>

#include <spdlog/spdlog.h>

namespace murmur::identity {

Result<void> StaticIdentityResolver::addCredential(const std::string& credential, Entry entry) {
    if (credential.empty()) {
        return Error{ErrorCode::InvalidArgument, "Credential must not be empty"};
    }
    if (entry.owner_id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Owner id must not be empty"};
    }
    std::lock_guard<std::mutex> lock(mutex_);
    entries_[credential] = std::move(entry);
    return {};
}

void StaticIdentityResolver::revokeCredential(const std::string& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(credential);
}

Result<Identity> StaticIdentityResolver::resolve(const std::string& credential) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(credential);
    if (it == entries_.end()) {
        spdlog::warn("[IdentityResolver] Rejected unknown credential");
        return Error{ErrorCode::PermissionDenied, "Unknown credential"};
    }

    const auto& entry = it->second;
    return Identity{issue(entry.owner_id), entry.email, entry.display_name, entry.avatar_url};
}

} // namespace murmur::identity
