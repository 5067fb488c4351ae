#include "sender.hpp"
#include <print>
#include <random>
#include <algorithm>

namespace ferry {

uint32_t chunk_count(uint64_t size, uint32_t chunk_size) {
    if (chunk_size == 0) chunk_size = DEFAULT_CHUNK_SIZE;
    if (size == 0) return 1;
    return static_cast<uint32_t>((size + chunk_size - 1) / chunk_size);
}

static std::string to_base36(uint64_t value) {
    static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    if (value == 0) return "0";
    std::string s;
    while (value > 0) {
        s.push_back(digits[value % 36]);
        value /= 36;
    }
    std::reverse(s.begin(), s.end());
    return s;
}

std::string make_transfer_id() {
    static std::mt19937_64 rng{std::random_device{}()};
    static constexpr char digits[] = "0123456789abcdefghijklmnopqrstuvwxyz";

    std::uniform_int_distribution<int> pick(0, 35);
    std::string tag;
    for (int i = 0; i < 6; i++) tag.push_back(digits[pick(rng)]);

    return "ft-" + tag + "-" + to_base36(now_ms());
}

Sender::Sender(Transport& transport, StatusSink on_status)
    : transport_(transport), on_status_(std::move(on_status)) {}

void Sender::emit(Envelope env) {
    env.ts = now_ms();
    transport_.send(Channel::Outgoing, encode(env));
}

void Sender::emit_status(StatusEvent ev) {
    ev.direction = Direction::Outgoing;
    ev.ts = now_ms();
    if (on_status_) on_status_(ev);
}

std::expected<std::string, TransferError> Sender::begin(std::unique_ptr<FileSource> file,
                                                        const std::string& route,
                                                        const std::string& passphrase,
                                                        uint32_t chunk_size) {
    if (active_) {
        std::println(stderr, "[Sender] Rejected: '{}' is still being sent.", active_->name);
        return std::unexpected(TransferError::TransferBusy);
    }
    if (!file) return std::unexpected(TransferError::InvalidInput);

    auto t = std::make_unique<OutgoingTransfer>();
    t->id = make_transfer_id();
    t->name = file->name();
    t->mime = file->mime();
    t->size = file->size();
    t->chunk_size = clamp_chunk_size(chunk_size);
    t->total_chunks = chunk_count(t->size, t->chunk_size);
    t->route = route;
    t->file = std::move(file);

    if (!passphrase.empty()) {
        // A passphrase was given: never fall back to plaintext
        auto enc = crypto::derive_encryption(passphrase);
        if (!enc || !enc->has_value()) {
            std::println(stderr, "[Sender] Encryption setup failed for '{}'. Send aborted.", t->name);
            return std::unexpected(TransferError::EncryptionSetup);
        }
        t->encryption = std::move(**enc);
    }

    // A new transfer supersedes whatever was kept around for resends
    retained_.reset();
    active_ = std::move(t);
    state_ = SendState::Sending;

    const auto& a = *active_;
    std::println("[Sender] Sending '{}' ({} bytes, {} chunks of {}){}", a.name, a.size, a.total_chunks,
                 a.chunk_size, a.encryption ? " encrypted" : "");

    StatusEvent ev;
    ev.transfer_id = a.id;
    ev.op = "start";
    ev.name = a.name;
    ev.size = a.size;
    ev.total_chunks = a.total_chunks;
    ev.route = a.route;
    ev.encrypted = a.encryption.has_value();
    std::string id = a.id;
    emit_status(std::move(ev));
    if (!active_ || active_->id != id) return id; // cancelled from the status sink

    HeaderMessage h;
    h.name = a.name;
    h.size = a.size;
    h.mime = a.mime;
    h.total_chunks = a.total_chunks;
    h.chunk_size = a.chunk_size;
    h.route = a.route;
    if (a.encryption) {
        h.encryption = HeaderEncryption{
            a.encryption->algorithm,
            a.encryption->salt_b64,
            a.encryption->iterations,
            a.encryption->fingerprint,
            static_cast<int>(crypto::GCM_IV_SIZE)
        };
    }
    emit(Envelope{a.id, 0, std::move(h)});

    return id;
}

bool Sender::step() {
    if (!active_) return false;

    // Cancellation is only observed here, between chunks
    if (active_->cancelled) {
        finish(false, "cancelled", std::nullopt);
        return false;
    }

    switch (state_) {
        case SendState::Idle:
            return false;

        case SendState::Sending:
            state_ = SendState::Chunking;
            [[fallthrough]];

        case SendState::Chunking: {
            if (!send_chunk(*active_)) return false;
            if (!active_) return false;
            if (active_->sent_chunks >= active_->total_chunks) state_ = SendState::Completing;
            return true;
        }

        case SendState::Completing:
            send_complete(*active_);
            return false;
    }
    return false;
}

bool Sender::send_chunk(OutgoingTransfer& t) {
    uint32_t seq = t.sent_chunks + 1;
    uint64_t start = static_cast<uint64_t>(seq - 1) * t.chunk_size;
    size_t length = static_cast<size_t>(std::min<uint64_t>(t.chunk_size, t.size - start));

    auto raw = t.file->read(start, length);
    if (!raw) {
        std::println(stderr, "[Sender] Read failed at chunk {}/{} of '{}'.", seq, t.total_chunks, t.name);
        t.cancelled = true;
        emit(Envelope{t.id, 0, CancelMessage{"read-error"}});
        finish(false, "read-error", raw.error());
        return false;
    }

    CachedChunk cached;
    cached.raw_length = raw->size();
    if (t.encryption) {
        auto sealed = crypto::encrypt_chunk(*t.encryption, *raw);
        if (!sealed) {
            std::println(stderr, "[Sender] Encryption failed at chunk {}/{} of '{}'.", seq, t.total_chunks, t.name);
            t.cancelled = true;
            emit(Envelope{t.id, 0, CancelMessage{"encrypt-error"}});
            finish(false, "encrypt-error", TransferError::EncryptionSetup);
            return false;
        }
        cached.data = std::move(sealed->data);
        cached.encryption = ChunkEncryption{std::move(sealed->iv), t.encryption->algorithm};
    } else {
        cached.data = crypto::base64_encode(*raw);
    }

    ChunkMessage c;
    c.seq = seq;
    c.total_chunks = t.total_chunks;
    c.data = cached.data;
    c.size = t.size;
    c.chunk_size = static_cast<uint32_t>(cached.raw_length);
    c.route = t.route;
    c.encryption = cached.encryption;

    t.chunk_cache[seq] = std::move(cached);
    emit(Envelope{t.id, 0, std::move(c)});
    t.sent_chunks = seq;

    StatusEvent ev;
    ev.transfer_id = t.id;
    ev.op = "chunk";
    ev.seq = seq;
    ev.total_chunks = t.total_chunks;
    ev.progress = static_cast<double>(t.sent_chunks) / t.total_chunks;
    emit_status(std::move(ev)); // may cancel; t is not touched afterwards
    return true;
}

void Sender::send_complete(OutgoingTransfer& t) {
    emit(Envelope{t.id, 0, CompleteMessage{t.total_chunks, t.size, t.route}});
    std::println("[Sender] Sent '{}' ({} chunks).", t.name, t.total_chunks);

    StatusEvent ev;
    ev.transfer_id = t.id;
    ev.op = "complete";
    ev.total_chunks = t.total_chunks;

    finish(true, "", std::nullopt);
    emit_status(std::move(ev));
}

void Sender::cancel(const std::string& reason) {
    if (!active_) return;

    auto& t = *active_;
    t.cancelled = true;
    emit(Envelope{t.id, 0, CancelMessage{reason}});
    std::println("[Sender] Cancelled '{}' after {}/{} chunks ({}).", t.name, t.sent_chunks, t.total_chunks, reason);

    StatusEvent ev;
    ev.transfer_id = t.id;
    ev.op = "cancel";
    ev.reason = reason;

    finish(false, reason, std::nullopt);
    emit_status(std::move(ev));
}

void Sender::abort(const std::string& transfer_id, const std::string& reason) {
    if (retained_ && retained_->id == transfer_id) {
        retained_.reset();
        return;
    }
    if (!active_ || active_->id != transfer_id) return;

    active_->cancelled = true;
    std::println("[Sender] Peer cancelled '{}' ({}).", active_->name, reason.empty() ? "no reason" : reason);
    finish(false, reason, std::nullopt);
}

void Sender::serve_request(const std::string& transfer_id, const RequestMessage& request) {
    OutgoingTransfer* t = nullptr;
    if (active_ && active_->id == transfer_id) t = active_.get();
    else if (retained_ && retained_->id == transfer_id) t = retained_.get();
    if (!t || request.missing.empty()) return;

    std::vector<uint32_t> served;
    for (uint32_t seq : request.missing) {
        auto it = t->chunk_cache.find(seq);
        if (it == t->chunk_cache.end()) continue;

        const auto& cached = it->second;
        ChunkMessage c;
        c.seq = seq;
        c.total_chunks = t->total_chunks;
        c.data = cached.data;
        c.size = t->size;
        c.chunk_size = static_cast<uint32_t>(cached.raw_length);
        c.route = t->route;
        c.encryption = cached.encryption;
        emit(Envelope{t->id, 0, std::move(c)});
        served.push_back(seq);
    }

    std::println("[Sender] Resent {} of {} requested chunk(s) for '{}'.", served.size(), request.missing.size(), t->name);

    StatusEvent ev;
    ev.transfer_id = t->id;
    ev.op = "resend";
    ev.missing = std::move(served);
    emit_status(std::move(ev));
}

void Sender::release() {
    retained_.reset();
}

void Sender::finish(bool completed, const std::string& reason, std::optional<TransferError> error) {
    if (!active_) return;

    SendSummary s;
    s.id = active_->id;
    s.name = active_->name;
    s.size = active_->size;
    s.total_chunks = active_->total_chunks;
    s.sent_chunks = active_->sent_chunks;
    s.completed = completed;
    s.cancelled = active_->cancelled;
    s.reason = reason;
    s.error = error;
    last_ = std::move(s);

    if (completed) {
        // Keep the cache for resend requests; the file itself is no longer needed
        active_->file.reset();
        retained_ = std::move(active_);
    } else {
        active_.reset();
    }
    state_ = SendState::Idle;
}

} // namespace ferry
