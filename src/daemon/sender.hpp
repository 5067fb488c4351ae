#pragma once
#include <string>
#include <map>
#include <memory>
#include <optional>
#include <functional>
#include <chrono>
#include <expected>

#include "transport.hpp"
#include "../common/chunk_cipher.hpp"
#include "../common/config.hpp"
#include "../common/envelope.hpp"
#include "../common/errors.hpp"
#include "../common/file_source.hpp"

namespace ferry {

    // Pacing the driver applies between suspension points
    constexpr std::chrono::milliseconds HEADER_PAUSE{10};
    constexpr std::chrono::milliseconds CHUNK_PAUSE{6};

    // Exactly what went on the wire for one sequence number
    struct CachedChunk {
        std::string data;
        std::optional<ChunkEncryption> encryption;
        size_t raw_length = 0;
    };

    struct OutgoingTransfer {
        std::string id;
        std::unique_ptr<FileSource> file;
        std::string name;
        std::string mime;
        uint64_t size = 0;
        uint32_t chunk_size = DEFAULT_CHUNK_SIZE;
        uint32_t total_chunks = 1;
        uint32_t sent_chunks = 0;
        std::string route;
        std::optional<crypto::EncryptionInfo> encryption;
        bool cancelled = false;
        std::map<uint32_t, CachedChunk> chunk_cache;
    };

    enum class SendState {
        Idle,
        Sending,    // header emitted
        Chunking,
        Completing  // all chunks out, complete message pending
    };

    // What is left of a transfer once it stops being active
    struct SendSummary {
        std::string id;
        std::string name;
        uint64_t size = 0;
        uint32_t total_chunks = 0;
        uint32_t sent_chunks = 0;
        bool completed = false;
        bool cancelled = false;
        std::string reason;
        std::optional<TransferError> error;
    };

    // max(1, ceil(size / chunk_size))
    uint32_t chunk_count(uint64_t size, uint32_t chunk_size);

    std::string make_transfer_id();

    class Sender {
    public:
        using StatusSink = std::function<void(const StatusEvent&)>;

        Sender(Transport& transport, StatusSink on_status);

        // Build the transfer and emit its header. Rejected with TransferBusy
        // while another transfer is active, leaving that one untouched.
        std::expected<std::string, TransferError> begin(std::unique_ptr<FileSource> file,
                                                        const std::string& route,
                                                        const std::string& passphrase,
                                                        uint32_t chunk_size);

        // Advance to the next suspension point: one chunk, or the complete
        // message after the last one. Returns false when nothing is left.
        bool step();

        // Local cancel: announce it to the peer and stop before the next chunk.
        void cancel(const std::string& reason = "cancelled");

        // Peer cancelled: stop without echoing a cancel back
        void abort(const std::string& transfer_id, const std::string& reason);

        // Resend cached chunks bit for bit. Unknown ids and sequences are ignored.
        void serve_request(const std::string& transfer_id, const RequestMessage& request);

        // Drop the resend cache of a completed transfer
        void release();

        SendState state() const { return state_; }
        bool busy() const { return active_ != nullptr; }
        const OutgoingTransfer* active() const { return active_.get(); }
        const OutgoingTransfer* retained() const { return retained_.get(); }
        const std::optional<SendSummary>& last() const { return last_; }

    private:
        void emit(Envelope env);
        void emit_status(StatusEvent ev);
        bool send_chunk(OutgoingTransfer& t);
        void send_complete(OutgoingTransfer& t);
        void finish(bool completed, const std::string& reason, std::optional<TransferError> error);

        Transport& transport_;
        StatusSink on_status_;

        SendState state_ = SendState::Idle;
        std::unique_ptr<OutgoingTransfer> active_;
        std::unique_ptr<OutgoingTransfer> retained_; // completed, still serving resends
        std::optional<SendSummary> last_;
    };

} // namespace ferry
