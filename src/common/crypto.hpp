#pragma once
#include <vector>
#include <string>
#include <string_view>
#include <cstdint>
#include <expected> // C++23
#include <openssl/evp.h>

namespace ferry::crypto {

    using Bytes = std::vector<uint8_t>;

    constexpr size_t AES_KEY_SIZE = 32;
    constexpr size_t GCM_IV_SIZE = 12;
    constexpr size_t GCM_TAG_SIZE = 16;
    constexpr size_t SHA256_SIZE = 32;

    enum class Error {
        KeyGenFailed,
        EncryptionFailed,
        DecryptionFailed,
        DerivationFailed,
        InvalidKey,
        EncodingFailed
    };

    // Fill a buffer with cryptographically secure random bytes
    std::expected<Bytes, Error> random_bytes(size_t count);

    // SHA-256 digest
    std::expected<Bytes, Error> sha256(const Bytes& data);

    // Derive a key from a password and salt using PBKDF2-HMAC-SHA256
    std::expected<Bytes, Error> derive_key_from_password(
        const std::string& password,
        const Bytes& salt,
        int iterations
    );

    // AES-256-GCM with a caller-supplied 12-byte IV
    // Returns: [Ciphertext + Tag (16b)]
    std::expected<Bytes, Error> encrypt_aes_gcm(const Bytes& plaintext, const Bytes& key, const Bytes& iv);

    // Input: [Ciphertext + Tag (16b)]. Fails closed when the tag does not verify.
    std::expected<Bytes, Error> decrypt_aes_gcm(const Bytes& sealed, const Bytes& key, const Bytes& iv);

    std::string base64_encode(const unsigned char* data, size_t input_length);
    std::string base64_encode(const Bytes& data);

    // Strict decode. Whitespace or bad padding is an error.
    std::expected<Bytes, Error> base64_decode(std::string_view data);

} // namespace ferry::crypto
