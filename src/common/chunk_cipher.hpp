#pragma once
#include <string>
#include <optional>
#include <expected>
#include "crypto.hpp"

namespace ferry::crypto {

    constexpr int DEFAULT_ITERATIONS = 120'000;
    constexpr size_t SALT_SIZE = 16;
    constexpr std::string_view CIPHER_TAG = "aes-gcm";

    // Key material for one transfer on one side.
    // Two sides derive the same fingerprint only when passphrase, salt and
    // iteration count all match.
    struct EncryptionInfo {
        Bytes key;               // 32-byte AES key
        Bytes salt;              // 16 bytes
        std::string salt_b64;
        int iterations = DEFAULT_ITERATIONS;
        std::string fingerprint; // base64(SHA-256(key))
        std::string algorithm{CIPHER_TAG};
    };

    struct SealedChunk {
        std::string data; // base64(ciphertext + tag)
        std::string iv;   // base64(12-byte nonce)
    };

    // Empty passphrase -> std::nullopt (transfer goes out in the clear).
    // Without a salt a fresh random one is drawn (sender side); the receiver
    // passes the salt carried in the header.
    std::expected<std::optional<EncryptionInfo>, Error> derive_encryption(
        const std::string& passphrase,
        const std::optional<Bytes>& salt = std::nullopt,
        int iterations = DEFAULT_ITERATIONS
    );

    // Each call draws a new random IV. Nonces must never repeat under one key.
    std::expected<SealedChunk, Error> encrypt_chunk(const EncryptionInfo& info, const Bytes& plaintext);

    std::expected<Bytes, Error> decrypt_chunk(const EncryptionInfo& info, const std::string& iv_b64,
                                              const std::string& data_b64);

} // namespace ferry::crypto
