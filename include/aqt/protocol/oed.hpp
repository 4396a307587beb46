#pragma once
/**
 * @file oed.hpp
 * @brief OED-with-Swap: odd-even-downhill forwarding on a path, plus backward swaps.
 *
 * Works on the path edges x = (x, x+1). Per round, from one snapshot:
 *  - Forward the oldest packet of x if x and x+1 satisfy the OED criterion,
 *    or the oldest packet of x has higher priority than the youngest of x+1.
 *    The last edge of the path always forwards when non-empty.
 *  - Send the youngest packet of x backward if x-1 is non-empty, x-1 and x
 *    fail the OED criterion, and the youngest packet of x is younger than the
 *    oldest packet of x-1.
 *
 * OED criterion for (x, x+1): L(x) > L(x+1), or L(x) == L(x+1) and L(x) odd.
 *
 * Capacity is fixed at one forward (and at most one backward) move per edge.
 * Missing path edges are treated as gaps: an edge with no successor edge is
 * a last edge, an edge with no predecessor never swaps backward.
 */

#include <cstddef>
#include <vector>

#include "aqt/config/constants.hpp"
#include "aqt/net/buffer_network.hpp"

namespace aqt::protocol {

/// Per-edge move decision, computed before any buffer is mutated.
struct EdgeDecision final {
    bool forward{false};
    bool backward{false};

    bool operator==(const EdgeDecision&) const = default;
};

class OedWithSwap final {
public:
    static constexpr const char* kName = "oed_with_swap";

    OedWithSwap() = default;

    void add_packet(net::Packet p, net::BufferNetwork& network) const;

    /// One round of forwarding; returns the absorbed packets.
    std::vector<net::Packet> forward_packets(net::BufferNetwork& network) const;

    /**
     * @brief Decide every edge's moves from the current network state.
     * @return One entry per path edge (i, i+1), i = 0..num_nodes-2.
     */
    [[nodiscard]] std::vector<EdgeDecision> decide(const net::BufferNetwork& network) const;

    /// OED criterion between an edge and its successor.
    [[nodiscard]] static constexpr bool oed_criterion(std::size_t this_load,
                                                      std::size_t next_load) noexcept {
        return this_load > next_load || (this_load == next_load && this_load % 2 == 1);
    }

    [[nodiscard]] std::size_t capacity() const noexcept { return config::constants::OED_CAPACITY; }
};

} // namespace aqt::protocol
