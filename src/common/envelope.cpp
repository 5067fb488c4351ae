#include "envelope.hpp"
#include <chrono>
#include <limits>

namespace ferry {

namespace {

    // Non-negative integer field, 0 when absent or malformed
    uint64_t count_field(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end()) return 0;
        if (it->is_number_unsigned()) return it->get<uint64_t>();
        if (it->is_number_integer()) {
            auto v = it->get<int64_t>();
            return v > 0 ? static_cast<uint64_t>(v) : 0;
        }
        return 0;
    }

    // Like count_field, but values past UINT32_MAX are malformed too
    uint32_t u32_field(const json& j, const char* key) {
        uint64_t v = count_field(j, key);
        return v <= std::numeric_limits<uint32_t>::max() ? static_cast<uint32_t>(v) : 0;
    }

    int int_field(const json& j, const char* key) {
        uint64_t v = count_field(j, key);
        return v <= static_cast<uint64_t>(std::numeric_limits<int>::max()) ? static_cast<int>(v) : 0;
    }

    std::string string_field(const json& j, const char* key) {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string()) return {};
        return it->get<std::string>();
    }

    std::optional<Op> parse_op(const std::string& op) {
        if (op == "header") return Op::Header;
        if (op == "chunk") return Op::Chunk;
        if (op == "complete") return Op::Complete;
        if (op == "cancel") return Op::Cancel;
        if (op == "request") return Op::Request;
        return std::nullopt;
    }

    HeaderMessage decode_header(const json& j) {
        HeaderMessage h;
        h.name = string_field(j, "name");
        h.size = count_field(j, "size");
        h.mime = string_field(j, "mime");
        h.total_chunks = u32_field(j, "totalChunks");
        h.chunk_size = u32_field(j, "chunkSize");
        h.route = string_field(j, "route");
        h.version = int_field(j, "version");

        auto enc = j.find("encryption");
        if (enc != j.end() && enc->is_object()) {
            HeaderEncryption e;
            e.alg = string_field(*enc, "alg");
            e.salt = string_field(*enc, "salt");
            e.iterations = int_field(*enc, "iterations");
            e.fingerprint = string_field(*enc, "fingerprint");
            e.iv_bytes = int_field(*enc, "ivBytes");
            h.encryption = std::move(e);
        }
        return h;
    }

    ChunkMessage decode_chunk(const json& j) {
        ChunkMessage c;
        c.seq = u32_field(j, "seq");
        c.total_chunks = u32_field(j, "totalChunks");
        c.data = string_field(j, "data");
        c.size = count_field(j, "size");
        c.chunk_size = u32_field(j, "chunkSize");
        c.route = string_field(j, "route");

        auto enc = j.find("encryption");
        if (enc != j.end() && enc->is_object()) {
            c.encryption = ChunkEncryption{string_field(*enc, "iv"), string_field(*enc, "alg")};
        }
        return c;
    }

    RequestMessage decode_request(const json& j) {
        RequestMessage r;
        auto it = j.find("missing");
        if (it == j.end() || !it->is_array()) return r;

        constexpr uint64_t max_seq = std::numeric_limits<uint32_t>::max();
        for (const auto& n : *it) {
            if (n.is_number_unsigned()) {
                auto v = n.get<uint64_t>();
                if (v >= 1 && v <= max_seq) r.missing.push_back(static_cast<uint32_t>(v));
            } else if (n.is_number_integer()) {
                auto v = n.get<int64_t>();
                if (v >= 1 && static_cast<uint64_t>(v) <= max_seq) r.missing.push_back(static_cast<uint32_t>(v));
            }
        }
        return r;
    }

} // namespace

std::string_view to_string(Op op) {
    switch (op) {
        case Op::Header:   return "header";
        case Op::Chunk:    return "chunk";
        case Op::Complete: return "complete";
        case Op::Cancel:   return "cancel";
        case Op::Request:  return "request";
    }
    return "unknown";
}

Op Envelope::op() const {
    return static_cast<Op>(body.index());
}

uint64_t now_ms() {
    using namespace std::chrono;
    return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

json to_json(const Envelope& env) {
    json j;
    j["kind"] = std::string(ENVELOPE_KIND);
    j["op"] = std::string(to_string(env.op()));
    j["transferId"] = env.transfer_id;
    j["ts"] = env.ts;

    std::visit(overloaded{
        [&](const HeaderMessage& h) {
            j["name"] = h.name;
            j["size"] = h.size;
            j["mime"] = h.mime;
            j["totalChunks"] = h.total_chunks;
            j["chunkSize"] = h.chunk_size;
            j["route"] = h.route;
            j["version"] = h.version;
            if (h.encryption) {
                j["encryption"] = {
                    {"alg", h.encryption->alg},
                    {"salt", h.encryption->salt},
                    {"iterations", h.encryption->iterations},
                    {"fingerprint", h.encryption->fingerprint},
                    {"ivBytes", h.encryption->iv_bytes}
                };
            }
        },
        [&](const ChunkMessage& c) {
            j["seq"] = c.seq;
            j["totalChunks"] = c.total_chunks;
            j["data"] = c.data;
            j["size"] = c.size;
            j["chunkSize"] = c.chunk_size;
            j["route"] = c.route;
            if (c.encryption) {
                j["encryption"] = {{"iv", c.encryption->iv}, {"alg", c.encryption->alg}};
            }
        },
        [&](const CompleteMessage& c) {
            j["totalChunks"] = c.total_chunks;
            j["size"] = c.size;
            j["route"] = c.route;
        },
        [&](const CancelMessage& c) {
            j["reason"] = c.reason;
        },
        [&](const RequestMessage& r) {
            j["missing"] = r.missing;
        }
    }, env.body);

    return j;
}

std::string encode(const Envelope& env) {
    // File names are raw bytes on disk; never let one make dump() throw
    return to_json(env).dump(-1, ' ', false, json::error_handler_t::replace);
}

std::optional<Envelope> decode(const json& j) {
    if (!j.is_object()) return std::nullopt;
    if (string_field(j, "kind") != ENVELOPE_KIND) return std::nullopt;

    auto op = parse_op(string_field(j, "op"));
    if (!op) return std::nullopt;

    Envelope env;
    env.transfer_id = string_field(j, "transferId");
    if (env.transfer_id.empty()) return std::nullopt;
    env.ts = count_field(j, "ts");

    switch (*op) {
        case Op::Header:   env.body = decode_header(j); break;
        case Op::Chunk:    env.body = decode_chunk(j); break;
        case Op::Complete:
            env.body = CompleteMessage{
                u32_field(j, "totalChunks"),
                count_field(j, "size"),
                string_field(j, "route")
            };
            break;
        case Op::Cancel:   env.body = CancelMessage{string_field(j, "reason")}; break;
        case Op::Request:  env.body = decode_request(j); break;
    }
    return env;
}

std::optional<Envelope> decode_text(std::string_view text) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) return std::nullopt;
    return decode(j);
}

} // namespace ferry
