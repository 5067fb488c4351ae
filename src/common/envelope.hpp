#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <variant>
#include <optional>
#include <cstdint>
#include <nlohmann/json.hpp>

namespace ferry {

    using json = nlohmann::json;

    constexpr std::string_view ENVELOPE_KIND = "file";
    constexpr int PROTOCOL_VERSION = 1;

    enum class Op {
        Header,
        Chunk,
        Complete,
        Cancel,
        Request
    };

    std::string_view to_string(Op op);

    // Header-level encryption parameters. Everything the receiver needs to
    // re-derive the key except the passphrase itself.
    struct HeaderEncryption {
        std::string alg;
        std::string salt;        // base64
        int iterations = 0;
        std::string fingerprint; // base64(SHA-256(key))
        int iv_bytes = 0;
    };

    struct ChunkEncryption {
        std::string iv;  // base64
        std::string alg;
    };

    // Numeric fields use 0 and strings use "" for "not present"; the
    // receiver only merges what a message actually carries.

    struct HeaderMessage {
        std::string name;
        uint64_t size = 0;
        std::string mime;
        uint32_t total_chunks = 0;
        uint32_t chunk_size = 0;
        std::string route;
        std::optional<HeaderEncryption> encryption;
        int version = PROTOCOL_VERSION;
    };

    struct ChunkMessage {
        uint32_t seq = 0;          // 1-based, 0 = missing
        uint32_t total_chunks = 0;
        std::string data;          // base64 payload (ciphertext + tag when encrypted)
        uint64_t size = 0;         // whole file size
        uint32_t chunk_size = 0;   // raw payload length of this chunk
        std::string route;
        std::optional<ChunkEncryption> encryption;
    };

    struct CompleteMessage {
        uint32_t total_chunks = 0;
        uint64_t size = 0;
        std::string route;
    };

    struct CancelMessage {
        std::string reason;
    };

    struct RequestMessage {
        std::vector<uint32_t> missing; // 1-based, in request order
    };

    // Alternative order mirrors Op
    using Body = std::variant<HeaderMessage, ChunkMessage, CompleteMessage, CancelMessage, RequestMessage>;

    struct Envelope {
        std::string transfer_id;
        uint64_t ts = 0;
        Body body;

        Op op() const;
    };

    // std::visit helper
    template <class... Ts> struct overloaded : Ts... { using Ts::operator()...; };

    // Milliseconds since the Unix epoch
    uint64_t now_ms();

    json to_json(const Envelope& env);
    std::string encode(const Envelope& env);

    // Anything that is not a well-formed {kind:"file"} envelope with a known
    // op yields std::nullopt.
    std::optional<Envelope> decode(const json& j);
    std::optional<Envelope> decode_text(std::string_view text);

} // namespace ferry
