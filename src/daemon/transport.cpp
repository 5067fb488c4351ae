#include "transport.hpp"

namespace ferry {

std::string_view to_string(Channel channel) {
    switch (channel) {
        case Channel::Outgoing: return "outgoing";
        case Channel::Status:   return "status";
        case Channel::File:     return "file";
    }
    return "unknown";
}

json to_json(const StatusEvent& ev) {
    json j;
    j["direction"] = ev.direction == Direction::Outgoing ? "outgoing" : "incoming";
    j["transferId"] = ev.transfer_id;
    j["op"] = ev.op;
    j["ts"] = ev.ts;

    if (ev.seq) j["seq"] = *ev.seq;
    if (ev.total_chunks) j["totalChunks"] = *ev.total_chunks;
    if (ev.progress) j["progress"] = *ev.progress;
    if (ev.reason) j["reason"] = *ev.reason;
    if (ev.name) j["name"] = *ev.name;
    if (ev.size) j["size"] = *ev.size;
    if (ev.route) j["route"] = *ev.route;
    if (ev.from) j["from"] = *ev.from;
    if (ev.encrypted) j["encrypted"] = *ev.encrypted;
    if (ev.missing) j["missing"] = *ev.missing;
    if (ev.tries) j["tries"] = *ev.tries;
    return j;
}

} // namespace ferry
