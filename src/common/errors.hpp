#pragma once
#include <string_view>

namespace ferry {

    // Every failure a transfer can surface to the user. None of them is fatal:
    // each leaves the transfer in an inspectable state.
    enum class TransferError {
        EncryptionSetup,    // key derivation failed while a passphrase was supplied
        Decryption,         // AEAD tag did not verify (wrong key or corrupted data)
        PassphraseMismatch, // derived key fingerprint differs from the sender's
        PassphraseRequired, // encrypted transfer but no passphrase available yet
        MissingMetadata,    // reassembly without a known chunk count
        TransferBusy,       // an outgoing transfer is already active
        InvalidInput,       // unsupported file selection
        ReadFailed,         // file source failed mid-transfer
        TooLarge            // peer declared more bytes or chunks than we accept
    };

    std::string_view describe(TransferError error);

} // namespace ferry
