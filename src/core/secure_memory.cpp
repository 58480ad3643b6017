#include "secure_memory.hpp"
#include "errors.hpp"
#include <sodium.h>
#include <algorithm>
#include <mutex>

namespace sentinel {
namespace core {

void ensure_sodium() {
    static std::once_flag once;
    static int status = 0;
    std::call_once(once, [] { status = sodium_init(); });
    // sodium_init() returns 1 when already initialised elsewhere
    if (status < 0) {
        throw RandomSourceError("sodium_init failed");
    }
}

bool constant_time_compare(const uint8_t* a, const uint8_t* b, size_t len) {
    return sodium_memcmp(a, b, len) == 0;
}

void secure_zero_memory(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

std::string to_hex(const uint8_t* data, size_t len) {
    static const char* hex_chars = "0123456789abcdef";
    std::string hex;
    hex.reserve(len * 2);

    for (size_t i = 0; i < len; ++i) {
        hex.push_back(hex_chars[(data[i] >> 4) & 0x0F]);
        hex.push_back(hex_chars[data[i] & 0x0F]);
    }

    return hex;
}

std::string fingerprint(const uint8_t* data, size_t len, size_t fp_len) {
    fp_len = std::min<size_t>(std::max<size_t>(fp_len, crypto_generichash_BYTES_MIN),
                              crypto_generichash_BYTES_MAX);
    std::vector<uint8_t> digest(fp_len);

    static const char* domain = "sentinel-fp";
    if (crypto_generichash(digest.data(), digest.size(), data, len,
                           reinterpret_cast<const uint8_t*>(domain),
                           std::char_traits<char>::length(domain)) != 0) {
        throw CryptoError("crypto_generichash", "fingerprint");
    }

    return to_hex(digest.data(), digest.size());
}

void SecretBytes::append(const uint8_t* data, size_t len) {
    std::vector<uint8_t> grown;
    grown.reserve(bytes_.size() + len);
    grown.insert(grown.end(), bytes_.begin(), bytes_.end());
    grown.insert(grown.end(), data, data + len);

    wipe();
    bytes_.swap(grown);
}

} // namespace core
} // namespace sentinel
