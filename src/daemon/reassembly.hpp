#pragma once
#include <string>
#include <vector>
#include <expected>
#include "incoming.hpp"

namespace ferry {

    // 1-based sequence numbers of the empty slots in [0, total_chunks)
    std::vector<uint32_t> missing_chunks(const IncomingTransfer& t);

    // The cached decryption key for an encrypted transfer, deriving it on first
    // use. The derived fingerprint must match the sender's before the key is
    // accepted (and cached).
    std::expected<const crypto::EncryptionInfo*, TransferError> decryption_key(IncomingTransfer& t,
                                                                               const std::string& passphrase);

    // Assemble the file into t.result and mark it ready.
    //   - returns an empty list on success (or if t was already ready)
    //   - returns the missing sequences when slots are empty; nothing is assembled
    //   - fails without touching the received chunks, so it can be retried
    std::expected<std::vector<uint32_t>, TransferError> reassemble(IncomingTransfer& t,
                                                                   const std::string& passphrase);

} // namespace ferry
