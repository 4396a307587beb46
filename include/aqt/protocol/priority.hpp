#pragma once
/**
 * @file priority.hpp
 * @brief Total order over packets used to pick "oldest"/"youngest" in a buffer.
 *
 * P has higher priority than Q iff P was injected earlier, or both were
 * injected in the same round and P has the smaller id. Oldest = highest
 * priority, youngest = lowest priority.
 */

#include <cstddef>
#include <optional>

#include "aqt/net/buffer_network.hpp"

namespace aqt::protocol {

/// Strict "higher priority" relation (irreflexive, transitive, total on distinct ids).
[[nodiscard]] inline bool higher_priority(const net::Packet& p, const net::Packet& q) noexcept {
    if (p.injection_round() != q.injection_round()) {
        return p.injection_round() < q.injection_round();
    }
    return p.id() < q.id();
}

/// Comparator form (std::sort/min_element puts the oldest first).
struct PriorityOrder {
    bool operator()(const net::Packet& p, const net::Packet& q) const noexcept {
        return higher_priority(p, q);
    }
};

/// Index of the highest-priority packet in @p buf; absent if empty.
[[nodiscard]] std::optional<std::size_t> oldest_index(const net::Buffer& buf) noexcept;

/// Index of the lowest-priority packet in @p buf; absent if empty.
[[nodiscard]] std::optional<std::size_t> youngest_index(const net::Buffer& buf) noexcept;

/// Index of the first packet with the smallest injection round (ids ignored).
[[nodiscard]] std::optional<std::size_t> longest_in_system_index(const net::Buffer& buf) noexcept;

} // namespace aqt::protocol
