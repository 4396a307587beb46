#pragma once
/**
 * @file protocol.hpp
 * @brief Closed sum type over the forwarding protocols.
 * @details The variant set is fixed at compile time; every operation dispatches
 *          with std::visit, so adding a protocol means adding an alternative
 *          here (the compiler flags every visitor that misses it).
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "aqt/protocol/greedy.hpp"
#include "aqt/protocol/oed.hpp"

namespace aqt::protocol {

/** @enum ProtocolKind
 *  @brief Tag of the active alternative (config names in parentheses).
 */
enum class ProtocolKind : std::uint8_t {
    GreedyFifo = 0, ///< "greedy_fifo"
    GreedyLis,      ///< "greedy_lis"
    OedWithSwap     ///< "oed_with_swap"
};

/// Config name of @p kind.
[[nodiscard]] const char* to_string(ProtocolKind kind) noexcept;

/// Parse a config name; absent if unknown.
[[nodiscard]] std::optional<ProtocolKind> parse_protocol_kind(std::string_view name) noexcept;

/** @class Protocol
 *  @brief Forwarding protocol handle used by the simulation driver.
 *
 * add_packet() and forward_packets() are the only mutation paths the driver uses.
 */
class Protocol final {
public:
    using Variant = std::variant<GreedyFifo, GreedyLis, OedWithSwap>;

    Protocol(GreedyFifo p) : impl_(std::move(p)) {}
    Protocol(GreedyLis p) : impl_(std::move(p)) {}
    Protocol(OedWithSwap p) : impl_(std::move(p)) {}

    static Protocol greedy_fifo(std::size_t capacity) { return Protocol{GreedyFifo{capacity}}; }
    static Protocol greedy_lis(std::size_t capacity) { return Protocol{GreedyLis{capacity}}; }
    static Protocol oed_with_swap() { return Protocol{OedWithSwap{}}; }

    /// Build from a tag; @p capacity is ignored by OED-with-Swap.
    static Protocol make(ProtocolKind kind, std::size_t capacity);

    /// Insert an injected or moved packet. Precondition: not absorbed.
    void add_packet(net::Packet p, net::BufferNetwork& network) const;

    /// Run one round of forwarding and return the absorbed packets.
    std::vector<net::Packet> forward_packets(net::BufferNetwork& network) const;

    [[nodiscard]] std::size_t  capacity() const noexcept;
    [[nodiscard]] ProtocolKind kind() const noexcept;
    [[nodiscard]] const char*  name() const noexcept { return to_string(kind()); }

    [[nodiscard]] const Variant& variant() const noexcept { return impl_; }

private:
    Variant impl_;
};

} // namespace aqt::protocol
