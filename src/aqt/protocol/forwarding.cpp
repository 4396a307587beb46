#include "aqt/protocol/forwarding.hpp"
#include "aqt/compat/contract.hpp"

namespace aqt::protocol {

void enqueue_on_route(net::Packet p, net::BufferNetwork& network) {
    const auto cur  = p.current_node();
    const auto next = p.next_node();
    aqt::expects(cur && next, "add_packet: packet is absorbed or has no next hop");
    network.push(std::move(p), *cur, *next);
}

net::Packet take_at(net::Buffer& buf, std::size_t idx) {
    aqt::expects(idx < buf.size(), "take_at: index out of range");
    auto it = buf.begin() + static_cast<net::Buffer::difference_type>(idx);
    net::Packet p = std::move(*it);
    buf.erase(it);
    return p;
}

} // namespace aqt::protocol
