#include "crypto.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/err.h>
#include <openssl/buffer.h>
#include <openssl/bio.h>
#include <memory>
#include <cstring>

namespace ferry::crypto {

// Helper for smart pointers to OpenSSL objects
using EvpCipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;
using EvpMdCtxPtr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;
using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free_all)>;

std::expected<Bytes, Error> random_bytes(size_t count) {
    Bytes out(count);
    if (count == 0) return out;
    if (RAND_bytes(out.data(), static_cast<int>(count)) != 1) return std::unexpected(Error::KeyGenFailed);
    return out;
}

std::expected<Bytes, Error> sha256(const Bytes& data) {
    EvpMdCtxPtr ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx) return std::unexpected(Error::DerivationFailed);

    Bytes digest(SHA256_SIZE);
    unsigned int len = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &len) != 1) {
        return std::unexpected(Error::DerivationFailed);
    }
    digest.resize(len);
    return digest;
}

std::expected<Bytes, Error> derive_key_from_password(
    const std::string& password,
    const Bytes& salt,
    int iterations
) {
    if (iterations <= 0) return std::unexpected(Error::DerivationFailed);

    Bytes key(AES_KEY_SIZE); // 256-bit key

    // PKCS5_PBKDF2_HMAC is the standard OpenSSL function
    int res = PKCS5_PBKDF2_HMAC(
        password.c_str(), static_cast<int>(password.length()),
        salt.data(), static_cast<int>(salt.size()),
        iterations,
        EVP_sha256(),
        static_cast<int>(key.size()),
        key.data()
    );

    if (res != 1) return std::unexpected(Error::DerivationFailed);
    return key;
}

std::expected<Bytes, Error> encrypt_aes_gcm(const Bytes& plaintext, const Bytes& key, const Bytes& iv) {
    if (key.size() != AES_KEY_SIZE) return std::unexpected(Error::InvalidKey);
    if (iv.size() != GCM_IV_SIZE) return std::unexpected(Error::EncryptionFailed);

    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) return std::unexpected(Error::EncryptionFailed);

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), iv.data()) != 1)
        return std::unexpected(Error::EncryptionFailed);

    Bytes sealed(plaintext.size() + GCM_TAG_SIZE);
    int len = 0;
    if (!plaintext.empty() &&
        EVP_EncryptUpdate(ctx.get(), sealed.data(), &len, plaintext.data(), static_cast<int>(plaintext.size())) != 1)
        return std::unexpected(Error::EncryptionFailed);

    int ciphertext_len = len;

    // GCM emits nothing here, but finalizing is what lets us read the tag
    if (EVP_EncryptFinal_ex(ctx.get(), sealed.data() + ciphertext_len, &len) != 1)
        return std::unexpected(Error::EncryptionFailed);
    ciphertext_len += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            sealed.data() + ciphertext_len) != 1)
        return std::unexpected(Error::EncryptionFailed);

    sealed.resize(ciphertext_len + GCM_TAG_SIZE);
    return sealed;
}

std::expected<Bytes, Error> decrypt_aes_gcm(const Bytes& sealed, const Bytes& key, const Bytes& iv) {
    if (key.size() != AES_KEY_SIZE) return std::unexpected(Error::InvalidKey);
    if (iv.size() != GCM_IV_SIZE) return std::unexpected(Error::DecryptionFailed);
    if (sealed.size() < GCM_TAG_SIZE) return std::unexpected(Error::DecryptionFailed);

    // [Ciphertext ....][Tag (16 bytes)]
    size_t ciphertext_len = sealed.size() - GCM_TAG_SIZE;
    const uint8_t* tag = sealed.data() + ciphertext_len;

    EvpCipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) return std::unexpected(Error::DecryptionFailed);

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, key.data(), iv.data()) != 1)
        return std::unexpected(Error::DecryptionFailed);

    Bytes plaintext(ciphertext_len);
    int len = 0;
    if (ciphertext_len > 0 &&
        EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len, sealed.data(), static_cast<int>(ciphertext_len)) != 1)
        return std::unexpected(Error::DecryptionFailed);
    int written = len;

    // Set Tag for verification
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(GCM_TAG_SIZE),
                            const_cast<uint8_t*>(tag)) != 1)
        return std::unexpected(Error::DecryptionFailed);

    // Finalize checks the tag
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + written, &len) != 1)
        return std::unexpected(Error::DecryptionFailed); // Tag mismatch!

    plaintext.resize(written + len);
    return plaintext;
}

std::string base64_encode(const unsigned char* data, size_t input_length) {
    if (input_length == 0) return {};

    // EVP_EncodeBlock writes 4 output chars per 3 input bytes plus a NUL
    std::string result(4 * ((input_length + 2) / 3) + 1, '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(result.data()), data,
                                  static_cast<int>(input_length));
    result.resize(written < 0 ? 0 : static_cast<size_t>(written));
    return result;
}

std::string base64_encode(const Bytes& data) {
    return base64_encode(data.data(), data.size());
}

std::expected<Bytes, Error> base64_decode(std::string_view data) {
    if (data.empty()) return Bytes{};
    if (data.size() % 4 != 0) return std::unexpected(Error::EncodingFailed);

    BioPtr b64(BIO_new(BIO_f_base64()), BIO_free_all);
    if (!b64) return std::unexpected(Error::EncodingFailed);
    BIO* mem = BIO_new_mem_buf(data.data(), static_cast<int>(data.size()));
    if (!mem) return std::unexpected(Error::EncodingFailed);
    BIO_push(b64.get(), mem);

    // Input carries no newlines
    BIO_set_flags(b64.get(), BIO_FLAGS_BASE64_NO_NL);

    size_t padding = 0;
    if (data.back() == '=') padding++;
    if (data.size() > 1 && data[data.size() - 2] == '=') padding++;
    size_t expected_len = (data.size() / 4) * 3 - padding;

    Bytes out(expected_len);
    int read = BIO_read(b64.get(), out.data(), static_cast<int>(out.size()));
    if (read < 0 || static_cast<size_t>(read) != expected_len) return std::unexpected(Error::EncodingFailed);
    return out;
}

} // namespace ferry::crypto
