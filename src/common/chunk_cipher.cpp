#include "chunk_cipher.hpp"

namespace ferry::crypto {

std::expected<std::optional<EncryptionInfo>, Error> derive_encryption(
    const std::string& passphrase,
    const std::optional<Bytes>& salt,
    int iterations
) {
    if (passphrase.empty()) return std::optional<EncryptionInfo>{};

    EncryptionInfo info;
    info.iterations = iterations;

    if (salt) {
        info.salt = *salt;
    } else {
        auto fresh = random_bytes(SALT_SIZE);
        if (!fresh) return std::unexpected(fresh.error());
        info.salt = std::move(*fresh);
    }
    info.salt_b64 = base64_encode(info.salt);

    auto key = derive_key_from_password(passphrase, info.salt, iterations);
    if (!key) return std::unexpected(key.error());
    info.key = std::move(*key);

    // The fingerprint travels in the header so the receiver can detect a
    // wrong passphrase before touching any ciphertext
    auto digest = sha256(info.key);
    if (!digest) return std::unexpected(digest.error());
    info.fingerprint = base64_encode(*digest);

    return std::optional<EncryptionInfo>{std::move(info)};
}

std::expected<SealedChunk, Error> encrypt_chunk(const EncryptionInfo& info, const Bytes& plaintext) {
    auto iv = random_bytes(GCM_IV_SIZE);
    if (!iv) return std::unexpected(Error::EncryptionFailed);

    auto sealed = encrypt_aes_gcm(plaintext, info.key, *iv);
    if (!sealed) return std::unexpected(sealed.error());

    return SealedChunk{base64_encode(*sealed), base64_encode(*iv)};
}

std::expected<Bytes, Error> decrypt_chunk(const EncryptionInfo& info, const std::string& iv_b64,
                                          const std::string& data_b64) {
    auto iv = base64_decode(iv_b64);
    auto sealed = base64_decode(data_b64);
    if (!iv || !sealed) return std::unexpected(Error::DecryptionFailed);

    return decrypt_aes_gcm(*sealed, info.key, *iv);
}

} // namespace ferry::crypto
