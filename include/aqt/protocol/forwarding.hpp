#pragma once
/**
 * @file forwarding.hpp
 * @brief Building blocks shared by every forwarding protocol.
 *
 * Protocols work in two passes: first they pull the packets to move out of
 * their buffers (deciding from the state at the start of the round), then
 * they replay the moves. Replaying is common: packets that arrived at the
 * last node of their path take the absorption step and are returned, all
 * others are re-inserted through the protocol's add_packet().
 */

#include <cstddef>
#include <utility>
#include <vector>

#include "aqt/net/buffer_network.hpp"

namespace aqt::protocol {

/**
 * @brief Default insertion policy: back of buffer (current_node, next_node).
 * @note Aborts if the packet is absorbed or has no next hop.
 */
void enqueue_on_route(net::Packet p, net::BufferNetwork& network);

/// Remove and return the packet at @p idx of @p buf.
[[nodiscard]] net::Packet take_at(net::Buffer& buf, std::size_t idx);

/**
 * @brief Replay moved packets in order.
 * @param moved Packets whose cursor was already advanced/retreated.
 * @param network Network to re-insert into.
 * @param add Insertion policy, called as add(Packet, BufferNetwork&).
 * @return Packets absorbed by this replay, in replay order.
 */
template <class AddFn>
std::vector<net::Packet> replay_moves(std::vector<net::Packet> moved,
                                      net::BufferNetwork& network,
                                      AddFn&& add) {
    std::vector<net::Packet> absorbed;
    for (auto& p : moved) {
        if (p.will_absorb_next()) {
            // Arrived at its destination node: final absorption step.
            p.advance();
            absorbed.push_back(std::move(p));
        } else {
            add(std::move(p), network);
        }
    }
    return absorbed;
}

} // namespace aqt::protocol
