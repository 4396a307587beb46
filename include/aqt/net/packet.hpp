#pragma once
/**
 * @file packet.hpp
 * @brief Packet descriptor (identity + route cursor) and the factory that mints ids.
 *
 * A packet sits in the buffer of edge (path[cursor], path[cursor+1]). Protocols
 * move it by advancing or retreating the cursor and re-inserting it; once the
 * cursor reaches the end of the path the packet is absorbed (terminal).
 *
 * Packets can only be created through PacketFactory, which keeps ids unique
 * within that factory's lifetime.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace aqt::net {

/// Dense node index into the BufferNetwork arena.
using NodeId = std::size_t;

/// Unique (per factory) packet identifier.
using PacketId = std::uint64_t;

/// Simulation round number.
using Round = std::uint64_t;

/// Ordered route a packet must follow.
using PacketPath = std::vector<NodeId>;

class PacketFactory;

/**
 * @brief Packet in the AQT model.
 *
 * Equality compares ids only; path, cursor and round are excluded.
 * Copyable so recorders and tests can keep snapshots.
 */
class Packet final {
public:
    [[nodiscard]] PacketId          id() const noexcept { return id_; }
    [[nodiscard]] const PacketPath& path() const noexcept { return path_; }
    [[nodiscard]] std::size_t       cursor() const noexcept { return cursor_; }
    [[nodiscard]] Round             injection_round() const noexcept { return injection_rd_; }

    /// Move one hop forward along the path. Aborts if already absorbed.
    void advance() noexcept;

    /// Move one hop backward along the path. Aborts if cursor is already 0.
    void retreat() noexcept;

    /// cursor == len(path).
    [[nodiscard]] bool is_absorbed() const noexcept { return cursor_ == path_.size(); }

    /// cursor == len(path) - 1: the next advance absorbs the packet.
    [[nodiscard]] bool will_absorb_next() const noexcept {
        return !path_.empty() && cursor_ + 1 == path_.size();
    }

    /// path[cursor]; absent once absorbed.
    [[nodiscard]] std::optional<NodeId> current_node() const noexcept;

    /// path[cursor+1]; absent if absorbed or about to absorb.
    [[nodiscard]] std::optional<NodeId> next_node() const noexcept;

    /// Remaining steps including the absorption step; 0 once absorbed.
    [[nodiscard]] std::size_t dist_to_go() const noexcept;

    /// "Packet{id=3, cur=4, rd=1}" style debug string.
    [[nodiscard]] std::string to_string() const;

    bool operator==(const Packet& other) const noexcept { return id_ == other.id_; }

private:
    friend class PacketFactory;

    Packet(PacketId id, PacketPath path, std::size_t cursor, Round injection_rd)
        : id_(id), path_(std::move(path)), cursor_(cursor), injection_rd_(injection_rd) {}

    PacketId    id_{0};
    PacketPath  path_{};
    std::size_t cursor_{0};
    Round       injection_rd_{0};
};

/**
 * @brief The only authority allowed to mint packet ids.
 *
 * One factory per injection source. Never a process-wide singleton, so
 * independent simulations stay reproducible and can run in parallel.
 */
class PacketFactory final {
public:
    PacketFactory() = default;

    /**
     * @brief Create a packet with the next id.
     * @param path Route to follow.
     * @param injection_rd Round the packet enters the network.
     * @param cursor Starting index into @p path (must be <= len(path)).
     */
    [[nodiscard]] Packet create(PacketPath path, Round injection_rd, std::size_t cursor);

    /// Id the next create() call will assign.
    [[nodiscard]] PacketId next_id() const noexcept { return next_id_; }

private:
    PacketId next_id_{0};
};

} // namespace aqt::net
