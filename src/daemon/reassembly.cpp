#include "reassembly.hpp"
#include <print>
#include <algorithm>

namespace ferry {

std::vector<uint32_t> missing_chunks(const IncomingTransfer& t) {
    std::vector<uint32_t> missing;
    for (uint64_t seq = 1; seq <= t.total_chunks; seq++) {
        if (!t.chunks.contains(static_cast<uint32_t>(seq))) missing.push_back(static_cast<uint32_t>(seq));
    }
    return missing;
}

std::expected<const crypto::EncryptionInfo*, TransferError> decryption_key(IncomingTransfer& t,
                                                                           const std::string& passphrase) {
    if (t.decrypt_info) return &*t.decrypt_info;

    // Without the header there is no salt to derive from
    if (!t.encryption_meta) return std::unexpected(TransferError::MissingMetadata);
    if (passphrase.empty()) return std::unexpected(TransferError::PassphraseRequired);

    const auto& meta = *t.encryption_meta;
    auto salt = crypto::base64_decode(meta.salt);
    if (!salt || salt->empty()) {
        std::println(stderr, "[Reassembly] Header of '{}' carries no usable salt.", t.name);
        return std::unexpected(TransferError::EncryptionSetup);
    }

    int iterations = meta.iterations > 0 ? meta.iterations : crypto::DEFAULT_ITERATIONS;
    auto info = crypto::derive_encryption(passphrase, *salt, iterations);
    if (!info || !info->has_value()) return std::unexpected(TransferError::EncryptionSetup);

    if (!meta.fingerprint.empty() && (*info)->fingerprint != meta.fingerprint) {
        std::println(stderr, "[Reassembly] Passphrase mismatch for '{}'.", t.name);
        return std::unexpected(TransferError::PassphraseMismatch);
    }

    t.decrypt_info = std::move(**info);
    return &*t.decrypt_info;
}

std::expected<std::vector<uint32_t>, TransferError> reassemble(IncomingTransfer& t,
                                                               const std::string& passphrase) {
    if (t.ready) return std::vector<uint32_t>{};
    if (t.total_chunks == 0) return std::unexpected(TransferError::MissingMetadata);

    auto missing = missing_chunks(t);
    if (!missing.empty()) return missing;

    bool encrypted = t.encrypted() ||
        std::any_of(t.chunks.begin(), t.chunks.end(),
                    [&](const auto& slot) { return slot.first <= t.total_chunks && slot.second.encryption; });

    // Key (and fingerprint) first: nothing is decrypted under a wrong passphrase
    const crypto::EncryptionInfo* key = nullptr;
    if (encrypted) {
        auto k = decryption_key(t, passphrase);
        if (!k) return std::unexpected(k.error());
        key = *k;
    }

    // Start from the declared size, or first chunk * count when there is none,
    // but never reserve more than the received payload can decode to
    uint64_t received = 0;
    for (const auto& [seq, chunk] : t.chunks) received += chunk.data.size() / 4 * 3;
    uint64_t estimate = t.size;
    if (estimate == 0) {
        auto first = crypto::base64_decode(t.chunks.at(1).data);
        estimate = first ? static_cast<uint64_t>(first->size()) * t.total_chunks : 0;
    }

    crypto::Bytes out;
    out.reserve(static_cast<size_t>(std::min(estimate, received)));

    // No gaps, so the map holds exactly 1..total in order
    for (const auto& [seq, chunk] : t.chunks) {
        if (seq > t.total_chunks) break;

        crypto::Bytes bytes;
        if (key) {
            if (!chunk.encryption || chunk.encryption->iv.empty()) {
                std::println(stderr, "[Reassembly] Chunk {} of '{}' has no IV.", seq, t.name);
                return std::unexpected(TransferError::Decryption);
            }
            auto plain = crypto::decrypt_chunk(*key, chunk.encryption->iv, chunk.data);
            if (!plain) {
                std::println(stderr, "[Reassembly] Chunk {} of '{}' failed authentication.", seq, t.name);
                return std::unexpected(TransferError::Decryption);
            }
            bytes = std::move(*plain);
        } else {
            auto decoded = crypto::base64_decode(chunk.data);
            if (!decoded) {
                std::println(stderr, "[Reassembly] Chunk {} of '{}' is not valid base64.", seq, t.name);
                return std::unexpected(TransferError::Decryption);
            }
            bytes = std::move(*decoded);
        }

        out.insert(out.end(), bytes.begin(), bytes.end());
    }

    t.result = std::move(out);
    t.ready = true;
    t.error.reset();
    return std::vector<uint32_t>{};
}

} // namespace ferry
