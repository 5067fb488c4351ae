#pragma once
#include <string>
#include <memory>
#include <chrono>
#include <functional>
#include <zmq.hpp>

#include "transport.hpp"

namespace ferry {

    // Carries the outgoing channel to a single peer over a ZeroMQ PAIR socket.
    // Status and file payloads stay local and go to the callbacks below.
    //
    // Nothing runs in the background: poll() receives on the caller's thread.
    class ZmqLink : public Transport {
    public:
        enum class Mode { Bind, Connect };

        ZmqLink(std::string endpoint, Mode mode);
        ~ZmqLink() override;

        bool open();
        void close();

        void send(Channel channel, const std::string& payload) override;

        // Wait up to `timeout` for frames and hand each one to on_message.
        // Returns the number of frames delivered.
        size_t poll(std::chrono::milliseconds timeout);

        const std::string& endpoint() const { return endpoint_; }

        // Callbacks
        std::function<void(const InboundMessage&)> on_message;
        std::function<void(const std::string&)> on_status;
        std::function<void(const std::string&)> on_file;

    private:
        std::string endpoint_;
        Mode mode_;

        zmq::context_t ctx_;
        std::unique_ptr<zmq::socket_t> socket_;
    };

} // namespace ferry
