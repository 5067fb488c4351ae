#include "zmq_link.hpp"
#include <print>

namespace ferry {

ZmqLink::ZmqLink(std::string endpoint, Mode mode)
    : endpoint_(std::move(endpoint)), mode_(mode) {}

ZmqLink::~ZmqLink() { close(); }

bool ZmqLink::open() {
    try {
        socket_ = std::make_unique<zmq::socket_t>(ctx_, zmq::socket_type::pair);
        // Chunks are small and plentiful; give them room before dropping
        socket_->set(zmq::sockopt::sndhwm, 10'000);
        socket_->set(zmq::sockopt::rcvhwm, 10'000);
        socket_->set(zmq::sockopt::linger, 2000);

        if (mode_ == Mode::Bind) {
            socket_->bind(endpoint_);
            std::println("[Link] Listening (PAIR) on {}", endpoint_);
        } else {
            socket_->connect(endpoint_);
            std::println("[Link] Connected (PAIR) to {}", endpoint_);
        }
        return true;
    } catch (const zmq::error_t& e) {
        std::println(stderr, "[Link] Error opening {}: {}", endpoint_, e.what());
        socket_.reset();
        return false;
    }
}

void ZmqLink::close() {
    if (!socket_) return;
    socket_->close();
    socket_.reset();
}

void ZmqLink::send(Channel channel, const std::string& payload) {
    switch (channel) {
        case Channel::Status:
            if (on_status) on_status(payload);
            return;
        case Channel::File:
            if (on_file) on_file(payload);
            return;
        case Channel::Outgoing:
            break;
    }

    if (!socket_) {
        std::println(stderr, "[Link] Not open, dropping frame.");
        return;
    }

    try {
        // Never block the engine; the protocol recovers lost frames itself
        auto sent = socket_->send(zmq::buffer(payload), zmq::send_flags::dontwait);
        if (!sent) std::println(stderr, "[Link] Send queue full, frame dropped.");
    } catch (const zmq::error_t& e) {
        std::println(stderr, "[Link] Send Error: {}", e.what());
    }
}

size_t ZmqLink::poll(std::chrono::milliseconds timeout) {
    if (!socket_) return 0;

    size_t delivered = 0;
    try {
        zmq::pollitem_t items[] = {
            { static_cast<void*>(*socket_), 0, ZMQ_POLLIN, 0 }
        };
        zmq::poll(items, 1, timeout);
        if (!(items[0].revents & ZMQ_POLLIN)) return 0;

        // Drain everything that is already queued
        while (true) {
            zmq::message_t frame;
            if (!socket_->recv(frame, zmq::recv_flags::dontwait)) break;

            InboundMessage msg;
            msg.text = frame.to_string();
            msg.from = endpoint_;
            if (on_message) on_message(msg);
            delivered++;
        }
    } catch (const zmq::error_t& e) {
        std::println(stderr, "[Link] Error: {}", e.what());
    }
    return delivered;
}

} // namespace ferry
