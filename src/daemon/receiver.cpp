#include "receiver.hpp"
#include "reassembly.hpp"
#include <print>
#include <format>
#include <fstream>
#include <algorithm>

namespace ferry {

// base64 of the largest chunk the sender produces, GCM tag included
static constexpr size_t MAX_CHUNK_TEXT = (MAX_CHUNK_SIZE + crypto::GCM_TAG_SIZE + 2) / 3 * 4;

// base64 a file of `size` bytes can take on the wire, split as finely as allowed
static uint64_t text_budget(uint64_t size) {
    uint64_t chunks = max_chunk_count(size);
    return (size + chunks * crypto::GCM_TAG_SIZE) / 3 * 4 + chunks * 4;
}

Receiver::Receiver(Transport& transport, StatusSink on_status, PassphraseSource passphrase, bool auto_accept,
                   uint64_t max_file_size)
    : transport_(transport),
      on_status_(std::move(on_status)),
      passphrase_(std::move(passphrase)),
      auto_accept_(auto_accept),
      max_file_size_(max_file_size) {}

void Receiver::emit_status(StatusEvent ev) {
    ev.direction = Direction::Incoming;
    ev.ts = now_ms();
    if (on_status_) on_status_(ev);
}

const IncomingTransfer* Receiver::find(const std::string& transfer_id) const {
    auto it = incoming_.find(transfer_id);
    return it != incoming_.end() ? &it->second : nullptr;
}

IncomingTransfer& Receiver::ensure(const std::string& transfer_id, const std::string& from, const std::string& route) {
    auto [it, inserted] = incoming_.try_emplace(transfer_id);
    auto& t = it->second;
    if (inserted) {
        t.transfer_id = transfer_id;
        t.auto_accept = auto_accept_;
        t.created_at = now_ms();
        t.route = route;
    }
    if (!from.empty()) t.from = from;
    active_ = transfer_id;
    return t;
}

void Receiver::set_total(IncomingTransfer& t, uint32_t total) {
    if (total == 0 || total == t.total_chunks) return;
    t.total_chunks = total;

    // Only sequences inside the declared range are kept
    for (auto it = t.chunks.upper_bound(total); it != t.chunks.end(); it = t.chunks.erase(it)) {
        t.buffered -= it->second.data.size();
    }
    t.received_count = static_cast<uint32_t>(t.chunks.size());
}

bool Receiver::admit(IncomingTransfer& t, uint64_t size, uint64_t total) {
    if (size > max_file_size_) {
        refuse(t, std::format("{} bytes declared, limit is {}", size, max_file_size_));
        return false;
    }
    uint64_t ceiling = max_chunk_count(size ? size : max_file_size_);
    if (total > ceiling) {
        refuse(t, std::format("{} chunks declared, at most {} fit", total, ceiling));
        return false;
    }
    return true;
}

void Receiver::refuse(IncomingTransfer& t, const std::string& reason) {
    t.cancelled = true;
    t.ready = false;
    t.chunks.clear();
    t.received_count = 0;
    t.buffered = 0;
    t.error = TransferError::TooLarge;
    t.status_text = std::format("Refused: {}", reason);
    std::println(stderr, "[Receiver] Refusing '{}': {}.", t.name, reason);

    Envelope env{t.transfer_id, now_ms(), CancelMessage{"too-large"}};
    transport_.send(Channel::Outgoing, encode(env));

    StatusEvent ev;
    ev.transfer_id = t.transfer_id;
    ev.op = "error";
    ev.reason = std::string(describe(TransferError::TooLarge));
    emit_status(std::move(ev));
}

void Receiver::handle(const Envelope& env, const std::string& from, const std::string& route) {
    std::visit(overloaded{
        [&](const HeaderMessage& h) {
            auto it = incoming_.find(env.transfer_id);
            if (it != incoming_.end() && (it->second.ready || it->second.cancelled)) {
                // Same id reused for a new transfer
                incoming_.erase(it);
            }
            on_header(ensure(env.transfer_id, from, route), h);
        },
        [&](const ChunkMessage& c) {
            auto& t = ensure(env.transfer_id, from, route);
            if (!t.cancelled) on_chunk(t, c);
        },
        [&](const CompleteMessage& c) {
            auto& t = ensure(env.transfer_id, from, route);
            if (!t.cancelled) on_complete(t, c);
        },
        [&](const CancelMessage& c) {
            on_cancel(env.transfer_id, c, from);
        },
        [](const RequestMessage&) {}
    }, env.body);
}

void Receiver::on_header(IncomingTransfer& t, const HeaderMessage& h) {
    if (!h.name.empty()) t.name = h.name;
    if (!admit(t, h.size ? h.size : t.size, h.total_chunks ? h.total_chunks : t.total_chunks)) return;

    // The header is authoritative for everything it carries
    if (!h.mime.empty()) t.mime = h.mime;
    if (h.size) t.size = h.size;
    if (h.chunk_size) t.chunk_size = h.chunk_size;
    if (!h.route.empty()) t.route = h.route;
    if (h.encryption) t.encryption_meta = h.encryption;
    set_total(t, h.total_chunks);

    t.status_text = std::format("Incoming {} ({} bytes)", t.name, t.size);
    std::println("[Receiver] Incoming '{}' ({} bytes, {} chunks){}{}", t.name, t.size, t.total_chunks,
                 t.from.empty() ? "" : " from " + t.from, t.encrypted() ? " encrypted" : "");

    StatusEvent ev;
    ev.transfer_id = t.transfer_id;
    ev.op = "header";
    ev.name = t.name;
    ev.size = t.size;
    ev.total_chunks = t.total_chunks;
    ev.route = t.route;
    ev.encrypted = t.encrypted();
    ev.from = t.from;
    emit_status(std::move(ev));
}

void Receiver::on_chunk(IncomingTransfer& t, const ChunkMessage& c) {
    if (!admit(t, t.size ? t.size : c.size, t.total_chunks ? t.total_chunks : c.total_chunks)) return;

    // Chunks may beat the header; they only fill what is still unknown
    if (!t.total_chunks) set_total(t, c.total_chunks);
    if (!t.size) t.size = c.size;
    if (!t.chunk_size) t.chunk_size = c.chunk_size;
    if (t.route.empty()) t.route = c.route;

    if (c.seq == 0) return;
    uint64_t last = t.total_chunks ? t.total_chunks : max_chunk_count(t.size ? t.size : max_file_size_);
    if (c.seq > last) {
        std::println(stderr, "[Receiver] Dropping chunk {} of '{}': at most {} expected.", c.seq, t.name, last);
        return;
    }
    if (c.data.size() > MAX_CHUNK_TEXT) {
        std::println(stderr, "[Receiver] Dropping chunk {} of '{}': {} bytes of payload.", c.seq, t.name,
                     c.data.size());
        return;
    }

    auto held = t.chunks.find(c.seq);
    uint64_t buffered = t.buffered + c.data.size() - (held != t.chunks.end() ? held->second.data.size() : 0);
    uint64_t budget = text_budget(t.size ? t.size : max_file_size_);
    if (buffered > budget) {
        refuse(t, std::format("{} bytes of chunk data held, at most {} expected", buffered, budget));
        return;
    }
    t.buffered = buffered;

    if (held != t.chunks.end()) {
        held->second = IncomingChunk{c.data, c.encryption};
    } else {
        t.chunks.emplace(c.seq, IncomingChunk{c.data, c.encryption});
        t.received_count++;
    }

    t.status_text = std::format("Receiving chunk {}/{}", c.seq, t.total_chunks);

    StatusEvent ev;
    ev.transfer_id = t.transfer_id;
    ev.op = "chunk";
    ev.seq = c.seq;
    ev.total_chunks = t.total_chunks;
    ev.progress = t.progress();
    ev.from = t.from;
    emit_status(std::move(ev));

    // A late chunk may be the one a completed transfer was waiting for
    if (t.completed) (void)attempt(t);
}

void Receiver::on_complete(IncomingTransfer& t, const CompleteMessage& c) {
    if (!admit(t, c.size ? c.size : t.size, c.total_chunks ? c.total_chunks : t.total_chunks)) return;

    set_total(t, c.total_chunks);
    if (c.size) t.size = c.size;
    if (t.route.empty()) t.route = c.route;

    t.completed = true;
    t.status_text = "Completing transfer";
    (void)attempt(t);
}

void Receiver::on_cancel(const std::string& transfer_id, const CancelMessage& c, const std::string& from) {
    auto it = incoming_.find(transfer_id);
    if (it != incoming_.end()) {
        auto& t = it->second;
        t.cancelled = true;
        t.ready = false;
        t.chunks.clear();
        t.received_count = 0;
        t.buffered = 0;
        t.result.clear();
        t.status_text = c.reason.empty() ? "Transfer cancelled" : std::format("Transfer cancelled ({})", c.reason);
        std::println("[Receiver] '{}' cancelled by peer{}.", t.name, c.reason.empty() ? "" : ": " + c.reason);
    }

    StatusEvent ev;
    ev.transfer_id = transfer_id;
    ev.op = "cancel";
    ev.reason = c.reason;
    if (!from.empty()) ev.from = from;
    emit_status(std::move(ev));
}

std::expected<std::vector<uint32_t>, TransferError> Receiver::attempt(IncomingTransfer& t) {
    bool was_ready = t.ready;

    auto result = reassemble(t, passphrase_ ? passphrase_() : std::string{});
    if (!result) {
        t.error = result.error();
        t.status_text = std::format("Assemble failed: {}", describe(result.error()));
        std::println(stderr, "[Receiver] {} for '{}'.", describe(result.error()), t.name);

        StatusEvent ev;
        ev.transfer_id = t.transfer_id;
        ev.op = "error";
        ev.reason = std::string(describe(result.error()));
        emit_status(std::move(ev));
        return result;
    }

    if (!result->empty()) {
        request_missing(t, *result);
        return result;
    }

    if (!was_ready && t.ready) {
        t.status_text = std::format("Ready ({} bytes)", t.result.size());
        std::println("[Receiver] '{}' ready ({} bytes).", t.name, t.result.size());

        StatusEvent ev;
        ev.transfer_id = t.transfer_id;
        ev.op = "complete";
        ev.size = t.result.size();
        emit_status(std::move(ev));

        if (t.auto_accept) deliver(t);
    }
    return result;
}

void Receiver::request_missing(IncomingTransfer& t, const std::vector<uint32_t>& missing) {
    if (missing.empty()) return;

    t.missing_tries++;
    t.status_text = std::format("Missing {} chunk(s), requesting resend", missing.size());

    Envelope env{t.transfer_id, now_ms(), RequestMessage{missing}};
    transport_.send(Channel::Outgoing, encode(env));

    StatusEvent ev;
    ev.transfer_id = t.transfer_id;
    ev.op = "request";
    ev.missing = missing;
    ev.tries = t.missing_tries;
    emit_status(std::move(ev));
}

void Receiver::deliver(IncomingTransfer& t) {
    json j;
    j["transferId"] = t.transfer_id;
    j["name"] = t.name;
    j["mime"] = t.mime;
    j["size"] = t.result.size();
    j["route"] = t.route;
    j["from"] = t.from;
    j["encrypted"] = t.encrypted();
    j["data"] = crypto::base64_encode(t.result);
    j["ts"] = now_ms();

    transport_.send(Channel::File, j.dump(-1, ' ', false, json::error_handler_t::replace));
    t.delivered = true;
}

std::expected<std::vector<uint32_t>, TransferError> Receiver::retry(const std::string& transfer_id) {
    auto it = incoming_.find(transfer_id);
    if (it == incoming_.end() || it->second.cancelled) return std::unexpected(TransferError::MissingMetadata);

    // Not complete yet: only report the gaps, the sender is still going
    if (!it->second.completed) return missing_chunks(it->second);
    return attempt(it->second);
}

bool Receiver::accept(const std::string& transfer_id) {
    auto it = incoming_.find(transfer_id);
    if (it == incoming_.end() || !it->second.ready) return false;
    if (!it->second.delivered) deliver(it->second);
    return true;
}

std::optional<std::filesystem::path> Receiver::save(const std::string& transfer_id,
                                                    const std::filesystem::path& dir) const {
    const auto* t = find(transfer_id);
    if (!t || !t->ready) {
        std::println(stderr, "[Receiver] File not ready yet.");
        return std::nullopt;
    }

    // Never let a peer-chosen name escape the target directory
    std::filesystem::path name = std::filesystem::path(t->name).filename();
    if (name.empty() || name == "." || name == "..") name = "file.bin";
    auto out_path = dir / name;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);

    std::ofstream out(out_path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        std::println(stderr, "[Receiver] Cannot open {} for writing.", out_path.string());
        return std::nullopt;
    }
    out.write(reinterpret_cast<const char*>(t->result.data()), static_cast<std::streamsize>(t->result.size()));
    if (!out) {
        std::println(stderr, "[Receiver] Write failed: {}", out_path.string());
        return std::nullopt;
    }
    return out_path;
}

void Receiver::clear() {
    incoming_.clear();
    active_.clear();
}

} // namespace ferry
