#pragma once
#include <string>
#include <memory>
#include <optional>
#include <expected>

#include "transport.hpp"
#include "sender.hpp"
#include "receiver.hpp"
#include "../common/config.hpp"

namespace ferry {

    // One peer's view of file transfer: at most one outgoing transfer and any
    // number of incoming ones, all driven from a single thread.
    //
    // The transport must not call back into on_incoming() from inside send();
    // inbound messages are handed over by whoever polls the link.
    class TransferManager {
    public:
        TransferManager(Transport& transport, TransferConfig config);

        // Start sending a file. Passphrase and route default to the runtime
        // passphrase / config values when not given.
        std::expected<std::string, TransferError> send_file(std::unique_ptr<FileSource> file,
                                                            const std::optional<std::string>& passphrase = std::nullopt,
                                                            const std::optional<std::string>& route = std::nullopt);

        // Advance the outgoing transfer by one chunk. False once it has ended.
        bool pump() { return sender_.step(); }

        void cancel_send(const std::string& reason = "sender-cancel");

        // Entry point for every inbound message; non-file traffic is ignored
        void on_incoming(const InboundMessage& msg);

        // Passphrase typed in at runtime. Retries a completed encrypted transfer
        // that is still waiting for the right key.
        void set_passphrase(const std::string& passphrase);
        std::string pick_passphrase() const;

        const TransferConfig& config() const { return config_; }
        Sender& sender() { return sender_; }
        const Sender& sender() const { return sender_; }
        Receiver& receiver() { return receiver_; }
        const Receiver& receiver() const { return receiver_; }

    private:
        void emit_status(const StatusEvent& ev);

        Transport& transport_;
        TransferConfig config_;
        std::string last_pass_;

        Sender sender_;
        Receiver receiver_;
    };

} // namespace ferry
