#include "errors.hpp"

namespace ferry {

std::string_view describe(TransferError error) {
    switch (error) {
        case TransferError::EncryptionSetup:    return "Encryption setup failed";
        case TransferError::Decryption:         return "Decryption failed";
        case TransferError::PassphraseMismatch: return "Passphrase mismatch";
        case TransferError::PassphraseRequired: return "Encrypted file - provide passphrase";
        case TransferError::MissingMetadata:    return "Missing chunk metadata";
        case TransferError::TransferBusy:       return "Transfer already in progress";
        case TransferError::InvalidInput:       return "Unsupported file selection";
        case TransferError::ReadFailed:         return "Failed to read file";
        case TransferError::TooLarge:           return "File exceeds the size limit";
    }
    return "Unknown error";
}

} // namespace ferry
