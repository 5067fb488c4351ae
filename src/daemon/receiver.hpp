#pragma once
#include <string>
#include <map>
#include <optional>
#include <functional>
#include <expected>
#include <filesystem>

#include "transport.hpp"
#include "incoming.hpp"
#include "../common/config.hpp"

namespace ferry {

    // Owns every incoming transfer, keyed by transfer id. Transfers never
    // share state, so they progress independently in any interleaving.
    class Receiver {
    public:
        using StatusSink = std::function<void(const StatusEvent&)>;
        using PassphraseSource = std::function<std::string()>;

        // Transfers declaring more than max_file_size bytes (or more chunks than
        // that size allows) are refused and the sender is told to stop.
        Receiver(Transport& transport, StatusSink on_status, PassphraseSource passphrase, bool auto_accept = true,
                 uint64_t max_file_size = DEFAULT_MAX_FILE_SIZE);

        // header / chunk / complete / cancel. Requests belong to the sender
        // and are ignored here.
        void handle(const Envelope& env, const std::string& from = "", const std::string& route = "");

        // Re-run reassembly for a completed transfer (e.g. after the
        // passphrase was corrected). Emits a resend request if chunks are missing.
        // Unknown or cancelled ids fail with MissingMetadata.
        std::expected<std::vector<uint32_t>, TransferError> retry(const std::string& transfer_id);

        // Deliver a ready transfer on the file channel (manual accept mode)
        bool accept(const std::string& transfer_id);

        // Write a ready transfer into dir under its sanitised name
        std::optional<std::filesystem::path> save(const std::string& transfer_id,
                                                  const std::filesystem::path& dir) const;

        void clear();

        const IncomingTransfer* find(const std::string& transfer_id) const;
        const std::string& active_id() const { return active_; }
        size_t size() const { return incoming_.size(); }

    private:
        IncomingTransfer& ensure(const std::string& transfer_id, const std::string& from, const std::string& route);

        void on_header(IncomingTransfer& t, const HeaderMessage& h);
        void on_chunk(IncomingTransfer& t, const ChunkMessage& c);
        void on_complete(IncomingTransfer& t, const CompleteMessage& c);
        void on_cancel(const std::string& transfer_id, const CancelMessage& c, const std::string& from);

        std::expected<std::vector<uint32_t>, TransferError> attempt(IncomingTransfer& t);
        void request_missing(IncomingTransfer& t, const std::vector<uint32_t>& missing);
        void deliver(IncomingTransfer& t);
        void set_total(IncomingTransfer& t, uint32_t total);
        bool admit(IncomingTransfer& t, uint64_t size, uint64_t total);
        void refuse(IncomingTransfer& t, const std::string& reason);
        void emit_status(StatusEvent ev);

        Transport& transport_;
        StatusSink on_status_;
        PassphraseSource passphrase_;
        bool auto_accept_;
        uint64_t max_file_size_;

        std::map<std::string, IncomingTransfer> incoming_;
        std::string active_; // most recently touched transfer
    };

} // namespace ferry
