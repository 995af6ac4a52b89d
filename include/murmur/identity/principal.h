#pragma once

#include <functional>
#include <string>

namespace murmur::identity {

class IIdentityResolver;

/**
 * The authenticated owner every operation is scoped to.
 *
 * A Principal cannot be built from a raw string by callers; only an
 * IIdentityResolver can mint one, so an owner id always went through
 * resolution before it reaches storage or the index.
 */
class Principal {
public:
    const std::string& id() const { return id_; }

    bool operator==(const Principal& other) const { return id_ == other.id_; }
    bool operator!=(const Principal& other) const { return id_ != other.id_; }
    bool operator<(const Principal& other) const { return id_ < other.id_; }

private:
    friend class IIdentityResolver;
    explicit Principal(std::string id) : id_(std::move(id)) {}

    std::string id_;
};

} // namespace murmur::identity

template <> struct std::hash<murmur::identity::Principal> {
    size_t operator()(const murmur::identity::Principal& p) const noexcept {
        return std::hash<std::string>{}(p.id());
    }
};
