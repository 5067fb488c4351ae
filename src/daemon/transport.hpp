#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace ferry {

    using json = nlohmann::json;

    enum class Channel {
        Outgoing, // protocol envelopes for the peer
        Status,   // telemetry for whoever renders progress
        File      // final delivery of an assembled file
    };

    std::string_view to_string(Channel channel);

    // The only thing the engine knows about the network. No ordering, no
    // delivery guarantee.
    class Transport {
    public:
        virtual ~Transport() = default;
        virtual void send(Channel channel, const std::string& payload) = 0;
    };

    // What the surrounding application hands us for every inbound message.
    // Either an already parsed payload or the raw text.
    struct InboundMessage {
        std::optional<json> payload;
        std::string text;
        std::string from;
        std::string route;
    };

    enum class Direction {
        Outgoing,
        Incoming
    };

    struct StatusEvent {
        Direction direction = Direction::Outgoing;
        std::string transfer_id;
        std::string op;
        std::optional<uint32_t> seq;
        std::optional<uint32_t> total_chunks;
        std::optional<double> progress;
        std::optional<std::string> reason;
        std::optional<std::string> name;
        std::optional<uint64_t> size;
        std::optional<std::string> route;
        std::optional<std::string> from;
        std::optional<bool> encrypted;
        std::optional<std::vector<uint32_t>> missing;
        std::optional<uint32_t> tries;
        uint64_t ts = 0;
    };

    json to_json(const StatusEvent& ev);

} // namespace ferry
