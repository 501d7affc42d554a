#pragma once

#include "core/result.hpp"
#include <sodium.h>
#include <array>
#include <cstdint>
#include <cstring>
#include <span>
#include <string>
#include <vector>

namespace vellum::crypto {

// Sizes follow libsodium's XChaCha20-Poly1305 and Argon2id constants.
constexpr size_t SYMMETRIC_KEY_SIZE = crypto_aead_xchacha20poly1305_ietf_KEYBYTES;
constexpr size_t NONCE_SIZE = crypto_aead_xchacha20poly1305_ietf_NPUBBYTES;
constexpr size_t TAG_SIZE = crypto_aead_xchacha20poly1305_ietf_ABYTES;
constexpr size_t SALT_SIZE = crypto_pwhash_SALTBYTES;

static_assert(SYMMETRIC_KEY_SIZE == 32);
static_assert(NONCE_SIZE == 24);
static_assert(TAG_SIZE == 16);

/**
 * Initialize libsodium. Safe to call repeatedly.
 * Fails with EntropySource when the system random source is unusable.
 */
[[nodiscard]] inline Result<void, Error> init() {
    if (sodium_init() < 0) {
        return Result<void, Error>::err(
            Error{ErrorKind::EntropySource, "Failed to initialize libsodium random source"});
    }
    return Result<void, Error>::ok();
}

/**
 * Fill a buffer from the system CSPRNG. Callers must have called init().
 */
inline void fill_random(uint8_t* data, size_t len) {
    randombytes_buf(data, len);
}

/**
 * Securely zero memory.
 */
inline void secure_zero(void* ptr, size_t len) {
    sodium_memzero(ptr, len);
}

/**
 * SecretArray - fixed-size secret, zeroed on destruction.
 * Comparison is constant-time.
 */
template<size_t N>
class SecretArray {
public:
    SecretArray() noexcept { bytes_.fill(0); }
    ~SecretArray() { secure_zero(bytes_.data(), N); }

    SecretArray(const SecretArray&) = default;
    SecretArray& operator=(const SecretArray&) = default;

    [[nodiscard]] uint8_t* data() noexcept { return bytes_.data(); }
    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]] static constexpr size_t size() noexcept { return N; }
    [[nodiscard]] std::span<const uint8_t, N> span() const noexcept { return bytes_; }

    bool operator==(const SecretArray& other) const {
        return sodium_memcmp(bytes_.data(), other.bytes_.data(), N) == 0;
    }

private:
    std::array<uint8_t, N> bytes_;
};

using EncryptionKey = SecretArray<SYMMETRIC_KEY_SIZE>;

/**
 * SecretBytes - variable-length secret (decrypted plaintext, decoded
 * entropy), zeroed on destruction and before reallocation. Move-only.
 */
class SecretBytes {
public:
    SecretBytes() = default;
    explicit SecretBytes(size_t size) : bytes_(size, 0) {}
    explicit SecretBytes(std::vector<uint8_t> bytes) : bytes_(std::move(bytes)) {}
    SecretBytes(const uint8_t* data, size_t size) : bytes_(data, data + size) {}
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

    [[nodiscard]] uint8_t* data() noexcept { return bytes_.data(); }
    [[nodiscard]] const uint8_t* data() const noexcept { return bytes_.data(); }
    [[nodiscard]] size_t size() const noexcept { return bytes_.size(); }
    [[nodiscard]] bool empty() const noexcept { return bytes_.empty(); }
    [[nodiscard]] std::span<const uint8_t> span() const noexcept { return bytes_; }
    [[nodiscard]] const std::vector<uint8_t>& bytes() const noexcept { return bytes_; }

    [[nodiscard]] SecretBytes clone() const { return SecretBytes(bytes_.data(), bytes_.size()); }

    bool operator==(const SecretBytes& other) const {
        return bytes_.size() == other.bytes_.size() &&
               (bytes_.empty() ||
                sodium_memcmp(bytes_.data(), other.bytes_.data(), bytes_.size()) == 0);
    }

private:
    void wipe() noexcept {
        if (!bytes_.empty()) {
            secure_zero(bytes_.data(), bytes_.size());
        }
    }

    std::vector<uint8_t> bytes_;
};

/**
 * BLAKE2b over `data`, optionally keyed.
 */
[[nodiscard]] inline std::vector<uint8_t> hash(
    std::span<const uint8_t> data,
    size_t hash_size = crypto_generichash_BYTES,
    std::span<const uint8_t> key = {}
) {
    std::vector<uint8_t> out(hash_size);
    crypto_generichash(out.data(), out.size(),
                       data.data(), data.size(),
                       key.empty() ? nullptr : key.data(), key.size());
    return out;
}

/**
 * Lowercase hex encoding.
 */
[[nodiscard]] inline std::string to_hex(std::span<const uint8_t> data) {
    std::string out(data.size() * 2 + 1, '\0');
    sodium_bin2hex(out.data(), out.size(), data.data(), data.size());
    out.pop_back();
    return out;
}

} // namespace vellum::crypto
