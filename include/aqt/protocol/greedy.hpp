#pragma once
/**
 * @file greedy.hpp
 * @brief Greedy protocols: every buffer forwards as many packets as its capacity allows.
 * @details GreedyFifo serves buffers in insertion order; GreedyLis serves the
 *          packet that has been in the system longest (smallest injection round).
 */

#include <cstddef>
#include <vector>

#include "aqt/config/constants.hpp"
#include "aqt/net/buffer_network.hpp"

namespace aqt::protocol {

/** @class GreedyFifo
 *  @brief Forwards up to `capacity` packets from the front of each buffer.
 */
class GreedyFifo final {
public:
    static constexpr const char* kName = "greedy_fifo";

    /// Aborts if @p capacity is 0.
    explicit GreedyFifo(std::size_t capacity = config::constants::PROTOCOL_DEFAULT_CAPACITY);

    void add_packet(net::Packet p, net::BufferNetwork& network) const;

    /// One round of forwarding; returns the absorbed packets.
    std::vector<net::Packet> forward_packets(net::BufferNetwork& network) const;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
};

/** @class GreedyLis
 *  @brief Longest-In-System: each slot takes the smallest injection round left in the buffer.
 */
class GreedyLis final {
public:
    static constexpr const char* kName = "greedy_lis";

    /// Aborts if @p capacity is 0.
    explicit GreedyLis(std::size_t capacity = config::constants::PROTOCOL_DEFAULT_CAPACITY);

    void add_packet(net::Packet p, net::BufferNetwork& network) const;

    /// One round of forwarding; returns the absorbed packets.
    std::vector<net::Packet> forward_packets(net::BufferNetwork& network) const;

    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }

private:
    std::size_t capacity_;
};

} // namespace aqt::protocol
