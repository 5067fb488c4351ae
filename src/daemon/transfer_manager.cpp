#include "transfer_manager.hpp"
#include <print>

namespace ferry {

static std::string trimmed(const std::string& s) {
    auto first = s.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return {};
    return s.substr(first, s.find_last_not_of(" \t\r\n") - first + 1);
}

TransferManager::TransferManager(Transport& transport, TransferConfig config)
    : transport_(transport),
      config_(std::move(config)),
      sender_(transport, [this](const StatusEvent& ev) { emit_status(ev); }),
      receiver_(transport,
                [this](const StatusEvent& ev) { emit_status(ev); },
                [this] { return pick_passphrase(); },
                config_.auto_accept,
                config_.max_file_size) {
    config_.chunk_size = clamp_chunk_size(config_.chunk_size);
}

void TransferManager::emit_status(const StatusEvent& ev) {
    transport_.send(Channel::Status, to_json(ev).dump(-1, ' ', false, json::error_handler_t::replace));
}

std::string TransferManager::pick_passphrase() const {
    if (!last_pass_.empty()) return last_pass_;
    return trimmed(config_.default_key);
}

std::expected<std::string, TransferError> TransferManager::send_file(std::unique_ptr<FileSource> file,
                                                                     const std::optional<std::string>& passphrase,
                                                                     const std::optional<std::string>& route) {
    std::string pass = passphrase ? trimmed(*passphrase) : pick_passphrase();
    std::string via = trimmed(route ? *route : config_.prefer_route);

    auto id = sender_.begin(std::move(file), via, pass, config_.chunk_size);
    if (!id) std::println(stderr, "[Transfer] File send failed: {}", describe(id.error()));
    return id;
}

void TransferManager::cancel_send(const std::string& reason) {
    sender_.cancel(reason);
}

void TransferManager::on_incoming(const InboundMessage& msg) {
    std::optional<Envelope> env;
    if (msg.payload) {
        env = msg.payload->is_string() ? decode_text(msg.payload->get<std::string>()) : decode(*msg.payload);
    } else if (!msg.text.empty()) {
        env = decode_text(msg.text);
    }
    if (!env) return;

    std::visit(overloaded{
        [&](const RequestMessage& r) {
            // Resends are served by whoever holds the data
            sender_.serve_request(env->transfer_id, r);
        },
        [&](const CancelMessage& c) {
            receiver_.handle(*env, msg.from, msg.route);
            sender_.abort(env->transfer_id, c.reason);
        },
        [&](const auto&) {
            receiver_.handle(*env, msg.from, msg.route);
        }
    }, env->body);
}

void TransferManager::set_passphrase(const std::string& passphrase) {
    last_pass_ = trimmed(passphrase);

    const auto* t = receiver_.find(receiver_.active_id());
    if (!t || !t->encrypted() || t->ready || !t->completed) return;

    auto result = receiver_.retry(t->transfer_id);
    if (result && result->empty()) {
        std::println("[Transfer] '{}' decrypted with the new passphrase.", t->name);
    }
}

} // namespace ferry
