#pragma once

#include "../core/secure_memory.hpp"
#include "../qkd/key_derivation.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace sentinel {
namespace kms {

/**
 * @brief 256-bit session key, wiped on destruction
 */
class SessionKey {
public:
    /**
     * @throws core::ConfigurationError unless material is exactly 32 bytes
     */
    explicit SessionKey(const core::SecretBytes& material);
    ~SessionKey();

    SessionKey(const SessionKey&) = delete;
    SessionKey& operator=(const SessionKey&) = delete;

    const std::array<uint8_t, qkd::SESSION_KEY_BYTES>& bytes() const { return bytes_; }
    const uint8_t* data() const { return bytes_.data(); }
    static constexpr size_t size() { return qkd::SESSION_KEY_BYTES; }

    /// Constant-time equality
    bool equals(const SessionKey& other) const;

    /// Short BLAKE2b fingerprint, safe to log or display
    std::string fingerprint() const;

    std::string to_hex() const;

private:
    std::array<uint8_t, qkd::SESSION_KEY_BYTES> bytes_{};
};

using SessionKeyPtr = std::shared_ptr<const SessionKey>;

/**
 * @brief Most recent issuance for one device
 */
struct SessionRecord {
    std::string device_id;
    SessionKeyPtr key;
    std::chrono::system_clock::time_point issued_at;
    double qber = 0.0;
    bool hybrid = false;
    bool paired = false;        ///< Received through demo pairing
};

/**
 * @brief Key-free view of a session record
 */
struct SessionInfo {
    std::string device_id;
    std::chrono::system_clock::time_point issued_at;
    double qber = 0.0;
    bool hybrid = false;
    bool paired = false;
    std::string key_fingerprint;
};

/**
 * @brief Session table keyed by device identifier
 *
 * A new record for a device supersedes the old one. Not synchronised;
 * callers hold the key manager's bookkeeping lock.
 */
class SessionRegistry {
public:
    void put(SessionRecord record);
    bool erase(const std::string& device_id);
    const SessionRecord* find(const std::string& device_id) const;
    std::optional<SessionInfo> info(const std::string& device_id) const;

    size_t size() const { return sessions_.size(); }
    void clear() { sessions_.clear(); }

private:
    std::unordered_map<std::string, SessionRecord> sessions_;
};

/**
 * @brief Two-slot pairing window for the two-device demo topology
 *
 * The first slot holds the device whose fresh issuance opened the epoch and
 * its key; the second is filled by at most one other device, which then
 * receives the same key. Filling the second slot closes the epoch. This is
 * a demo concession, not a key-agreement protocol.
 */
class KeyPairing {
public:
    void open(const std::string& owner, SessionKeyPtr key, bool hybrid);
    void close();

    bool is_open() const { return open_; }
    const std::string& owner() const { return owner_; }
    bool hybrid() const { return hybrid_; }

    /**
     * @brief Claim the second slot
     * @return the owner's key, or nullptr if the epoch is closed, the
     *         requester is the owner, or the mode differs
     */
    SessionKeyPtr claim(const std::string& requester, bool hybrid);

private:
    bool open_ = false;
    std::string owner_;
    SessionKeyPtr key_;
    bool hybrid_ = false;
};

} // namespace kms
} // namespace sentinel
