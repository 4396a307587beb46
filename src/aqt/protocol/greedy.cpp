/**
 * @file greedy.cpp
 * @brief GreedyFifo / GreedyLis forwarding.
 */
#include "aqt/protocol/greedy.hpp"
#include "aqt/protocol/forwarding.hpp"
#include "aqt/protocol/priority.hpp"
#include "aqt/compat/contract.hpp"

#include <algorithm>

namespace aqt::protocol {

namespace {

// Pull phase shared by both greedy variants. Each buffer's selection only
// reads that buffer, so scanning edges in order never observes another
// buffer's move; re-insertion waits for replay_moves().
template <class SelectFn>
std::vector<net::Packet> pull_greedy(net::BufferNetwork& network,
                                     std::size_t capacity,
                                     SelectFn&& select) {
    std::vector<net::Packet> moved;
    for (const auto& e : network.edges()) {
        net::Buffer* buf = network.peek_mut(e.from, e.to);
        const std::size_t n = std::min(capacity, buf->size());
        for (std::size_t k = 0; k < n; ++k) {
            net::Packet p = take_at(*buf, select(*buf));
            p.advance();
            moved.push_back(std::move(p));
        }
    }
    return moved;
}

} // namespace

// --------------------------------- FIFO --------------------------------------

GreedyFifo::GreedyFifo(std::size_t capacity) : capacity_(capacity) {
    aqt::expects(capacity_ >= 1, "GreedyFifo: capacity must be at least 1");
}

void GreedyFifo::add_packet(net::Packet p, net::BufferNetwork& network) const {
    enqueue_on_route(std::move(p), network);
}

std::vector<net::Packet> GreedyFifo::forward_packets(net::BufferNetwork& network) const {
    // Front of the buffer = oldest inserted.
    auto moved = pull_greedy(network, capacity_, [](const net::Buffer&) { return std::size_t{0}; });
    return replay_moves(std::move(moved), network,
                        [this](net::Packet p, net::BufferNetwork& n) { add_packet(std::move(p), n); });
}

// --------------------------------- LIS ---------------------------------------

GreedyLis::GreedyLis(std::size_t capacity) : capacity_(capacity) {
    aqt::expects(capacity_ >= 1, "GreedyLis: capacity must be at least 1");
}

void GreedyLis::add_packet(net::Packet p, net::BufferNetwork& network) const {
    enqueue_on_route(std::move(p), network);
}

std::vector<net::Packet> GreedyLis::forward_packets(net::BufferNetwork& network) const {
    auto moved = pull_greedy(network, capacity_, [](const net::Buffer& buf) {
        return *longest_in_system_index(buf); // buffer is non-empty here
    });
    return replay_moves(std::move(moved), network,
                        [this](net::Packet p, net::BufferNetwork& n) { add_packet(std::move(p), n); });
}

} // namespace aqt::protocol
