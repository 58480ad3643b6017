#pragma once

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>

namespace sentinel {
namespace core {

/**
 * @brief Initialise libsodium once per process
 * @throws RandomSourceError if sodium_init() fails
 */
void ensure_sodium();

/**
 * @brief Constant-time comparison
 * @note Uses libsodium's hardened memcmp (sodium_memcmp)
 */
bool constant_time_compare(const uint8_t* a, const uint8_t* b, size_t len);

/**
 * @brief Zero memory in a way the compiler cannot elide
 * @note Uses sodium_memzero
 */
void secure_zero_memory(void* ptr, size_t len);

/**
 * @brief Lowercase hex encoding
 */
std::string to_hex(const uint8_t* data, size_t len);

/**
 * @brief Short BLAKE2b fingerprint of secret material, safe to log
 * @param fp_len Digest bytes, clamped to the BLAKE2b output range (16..64)
 */
std::string fingerprint(const uint8_t* data, size_t len, size_t fp_len = 16);

/**
 * @brief Owned byte buffer that is wiped on destruction
 *
 * Holds raw QKD secrets and intermediate keying material. Copying is
 * disabled so secret bytes have exactly one owner.
 */
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(size_t size) : bytes_(size, 0) {}
    SecretBytes(const uint8_t* data, size_t len) : bytes_(data, data + len) {}

    ~SecretBytes() { wipe(); }

    SecretBytes(const SecretBytes&) = delete;
    SecretBytes& operator=(const SecretBytes&) = delete;

    SecretBytes(SecretBytes&& other) noexcept : bytes_(std::move(other.bytes_)) {
        other.bytes_.clear();
    }

    SecretBytes& operator=(SecretBytes&& other) noexcept {
        if (this != &other) {
            wipe();
            bytes_ = std::move(other.bytes_);
            other.bytes_.clear();
        }
        return *this;
    }

    uint8_t* data() { return bytes_.data(); }
    const uint8_t* data() const { return bytes_.data(); }
    size_t size() const { return bytes_.size(); }
    bool empty() const { return bytes_.empty(); }

    uint8_t& operator[](size_t i) { return bytes_[i]; }
    const uint8_t& operator[](size_t i) const { return bytes_[i]; }

    /**
     * @brief Append bytes (used to build concatenated IKM)
     *
     * Growth goes through a fresh buffer so no stale copy of the old
     * contents is left behind by vector reallocation.
     */
    void append(const uint8_t* data, size_t len);

    bool equals(const SecretBytes& other) const {
        return bytes_.size() == other.bytes_.size() &&
               constant_time_compare(bytes_.data(), other.bytes_.data(), bytes_.size());
    }

private:
    void wipe() {
        if (!bytes_.empty()) {
            secure_zero_memory(bytes_.data(), bytes_.size());
        }
    }

    std::vector<uint8_t> bytes_;
};

} // namespace core
} // namespace sentinel
