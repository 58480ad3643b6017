#include "session_registry.hpp"
#include "../core/errors.hpp"
#include <cstring>

namespace sentinel {
namespace kms {

SessionKey::SessionKey(const core::SecretBytes& material) {
    if (material.size() != bytes_.size()) {
        throw core::ConfigurationError("session key must be " + std::to_string(bytes_.size()) +
                                       " bytes, got " + std::to_string(material.size()));
    }
    std::memcpy(bytes_.data(), material.data(), bytes_.size());
}

SessionKey::~SessionKey() {
    core::secure_zero_memory(bytes_.data(), bytes_.size());
}

bool SessionKey::equals(const SessionKey& other) const {
    return core::constant_time_compare(bytes_.data(), other.bytes_.data(), bytes_.size());
}

std::string SessionKey::fingerprint() const {
    return core::fingerprint(bytes_.data(), bytes_.size());
}

std::string SessionKey::to_hex() const {
    return core::to_hex(bytes_.data(), bytes_.size());
}

// ============================================================================
// SessionRegistry
// ============================================================================

void SessionRegistry::put(SessionRecord record) {
    std::string id = record.device_id;
    sessions_[id] = std::move(record);
}

bool SessionRegistry::erase(const std::string& device_id) {
    return sessions_.erase(device_id) > 0;
}

const SessionRecord* SessionRegistry::find(const std::string& device_id) const {
    auto it = sessions_.find(device_id);
    return it == sessions_.end() ? nullptr : &it->second;
}

std::optional<SessionInfo> SessionRegistry::info(const std::string& device_id) const {
    const SessionRecord* rec = find(device_id);
    if (!rec) {
        return std::nullopt;
    }

    SessionInfo info;
    info.device_id = rec->device_id;
    info.issued_at = rec->issued_at;
    info.qber = rec->qber;
    info.hybrid = rec->hybrid;
    info.paired = rec->paired;
    if (rec->key) {
        info.key_fingerprint = rec->key->fingerprint();
    }
    return info;
}

// ============================================================================
// KeyPairing
// ============================================================================

void KeyPairing::open(const std::string& owner, SessionKeyPtr key, bool hybrid) {
    open_ = true;
    owner_ = owner;
    key_ = std::move(key);
    hybrid_ = hybrid;
}

void KeyPairing::close() {
    open_ = false;
    owner_.clear();
    key_.reset();
    hybrid_ = false;
}

SessionKeyPtr KeyPairing::claim(const std::string& requester, bool hybrid) {
    if (!open_ || requester == owner_ || hybrid != hybrid_) {
        return nullptr;
    }
    SessionKeyPtr key = key_;
    close();
    return key;
}

} // namespace kms
} // namespace sentinel
