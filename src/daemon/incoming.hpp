#pragma once
#include <string>
#include <map>
#include <optional>
#include <cstdint>

#include "../common/chunk_cipher.hpp"
#include "../common/envelope.hpp"
#include "../common/errors.hpp"
#include "../common/file_source.hpp"

namespace ferry {

    struct IncomingChunk {
        std::string data; // base64, exactly as received
        std::optional<ChunkEncryption> encryption;
    };

    struct IncomingTransfer {
        std::string transfer_id;
        std::string name = "file";
        std::string mime{DEFAULT_MIME};
        uint64_t size = 0;
        uint32_t total_chunks = 0;
        uint32_t chunk_size = 0;
        std::string route;
        std::string from;

        // Keyed by 1-based sequence number; only what actually arrived
        std::map<uint32_t, IncomingChunk> chunks;
        uint32_t received_count = 0;
        uint64_t buffered = 0; // base64 bytes held in chunks

        std::optional<HeaderEncryption> encryption_meta;
        std::optional<crypto::EncryptionInfo> decrypt_info; // derived once, then reused

        bool completed = false; // sender said "no more chunks"
        bool ready = false;     // reassembly succeeded
        bool cancelled = false;
        bool delivered = false; // handed to the consumer on the file channel
        bool auto_accept = true;
        uint32_t missing_tries = 0;

        std::string status_text;
        std::optional<TransferError> error; // last reassembly failure, cleared on success
        uint64_t created_at = 0;

        crypto::Bytes result;

        bool encrypted() const { return encryption_meta.has_value(); }

        double progress() const {
            return total_chunks ? static_cast<double>(received_count) / total_chunks : 0.0;
        }
    };

} // namespace ferry
