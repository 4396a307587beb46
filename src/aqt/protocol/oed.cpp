/**
 * @file oed.cpp
 * @brief OED-with-Swap decision and apply passes.
 */
#include "aqt/protocol/oed.hpp"
#include "aqt/protocol/forwarding.hpp"
#include "aqt/protocol/priority.hpp"

namespace aqt::protocol {

namespace {

// Start-of-round view of one path edge. Pointers stay valid because the
// decision pass never mutates the network.
struct EdgeSnapshot {
    bool               exists{false};
    std::size_t        load{0};
    const net::Packet* oldest{nullptr};
    const net::Packet* youngest{nullptr};
};

std::vector<EdgeSnapshot> snapshot_path(const net::BufferNetwork& network) {
    const std::size_t n = network.num_nodes();
    std::vector<EdgeSnapshot> snap(n < 2 ? 0 : n - 1);
    for (std::size_t i = 0; i < snap.size(); ++i) {
        const net::Buffer* buf = network.peek(i, i + 1);
        if (!buf) continue;
        auto& s = snap[i];
        s.exists = true;
        s.load   = buf->size();
        if (const auto o = oldest_index(*buf))   s.oldest   = &(*buf)[*o];
        if (const auto y = youngest_index(*buf)) s.youngest = &(*buf)[*y];
    }
    return snap;
}

} // namespace

void OedWithSwap::add_packet(net::Packet p, net::BufferNetwork& network) const {
    enqueue_on_route(std::move(p), network);
}

std::vector<EdgeDecision> OedWithSwap::decide(const net::BufferNetwork& network) const {
    const auto snap = snapshot_path(network);
    const std::size_t m = snap.size();

    auto has_next = [&](std::size_t i) { return i + 1 < m && snap[i + 1].exists; };

    std::vector<bool> oed(m, false);
    for (std::size_t i = 0; i < m; ++i) {
        if (!snap[i].exists) continue;
        oed[i] = has_next(i) ? oed_criterion(snap[i].load, snap[i + 1].load)
                             : snap[i].load > 0; // last edge: non-empty
    }

    std::vector<EdgeDecision> out(m);
    for (std::size_t i = 0; i < m; ++i) {
        const auto& cur = snap[i];
        if (!cur.exists || cur.load == 0) continue;

        bool fwd = !has_next(i) || oed[i];
        if (!fwd && snap[i + 1].load > 0) {
            fwd = higher_priority(*cur.oldest, *snap[i + 1].youngest);
        }

        bool bwd = false;
        if (i > 0 && snap[i - 1].exists && snap[i - 1].load > 0 && !oed[i - 1]) {
            // Youngest here is younger than the oldest one hop back.
            bwd = higher_priority(*snap[i - 1].oldest, *cur.youngest) &&
                  cur.youngest->cursor() > 0;
        }
        out[i] = EdgeDecision{fwd, bwd};
    }
    return out;
}

std::vector<net::Packet> OedWithSwap::forward_packets(net::BufferNetwork& network) const {
    const auto decisions = decide(network);

    std::vector<net::Packet> moved;
    for (std::size_t i = 0; i < decisions.size(); ++i) {
        const auto d = decisions[i];
        if (!d.forward && !d.backward) continue;
        net::Buffer* buf = network.peek_mut(i, i + 1);

        if (d.forward) {
            net::Packet p = take_at(*buf, *oldest_index(*buf));
            p.advance();
            moved.push_back(std::move(p));
        }
        // A lone packet already left forward; nothing to swap back.
        if (d.backward && !buf->empty()) {
            net::Packet p = take_at(*buf, *youngest_index(*buf));
            p.retreat();
            moved.push_back(std::move(p));
        }
    }

    return replay_moves(std::move(moved), network,
                        [this](net::Packet p, net::BufferNetwork& n) { add_packet(std::move(p), n); });
}

} // namespace aqt::protocol
