#pragma once
/**
 * @file buffer_network.hpp
 * @brief Arena-indexed directed graph whose edges own packet buffers.
 *
 * Nodes are dense indices into an owning vector; edge buffers are addressed
 * only by their (from, to) pair. There are no pointers between nodes, so the
 * edge structure may contain cycles without any ownership concerns.
 *
 * Topology is fixed before the simulation starts: invalid node ids and
 * duplicate edges are contract violations (abort), checked before mutation.
 * Buffer lookups on missing edges are NOT fatal; they return an absent result.
 */

#include <cstddef>
#include <deque>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "aqt/net/packet.hpp"

namespace aqt::net {

/// Ordered packet queue of one edge. Front = oldest inserted.
using Buffer = std::deque<Packet>;

/// Address of an edge buffer.
struct EdgeId final {
    NodeId from{0};
    NodeId to{0};

    bool operator==(const EdgeId&) const = default;
};

/**
 * @class BufferNetwork
 * @brief Owns all nodes and edge buffers of one simulation.
 */
class BufferNetwork final {
public:
    BufferNetwork() = default;

    // --------------------------- Construction --------------------------------
    /// Append a node and return its dense index.
    NodeId add_node();

    /// Add an empty buffer for (from, to). Aborts on unknown ids or a duplicate pair.
    void add_edge(NodeId from, NodeId to);

    // --------------------------- Topology queries ----------------------------
    /// Outgoing neighbours of @p node in edge-addition order. Aborts on unknown node.
    [[nodiscard]] std::vector<NodeId> neighbors(NodeId node) const;

    /// All edges, grouped by `from` ascending, then by `to` in addition order.
    /// Protocols iterate in this order; it must stay deterministic.
    [[nodiscard]] std::vector<EdgeId> edges() const;

    /// All node ids in ascending order.
    [[nodiscard]] std::vector<NodeId> nodes() const;

    [[nodiscard]] std::size_t num_nodes() const noexcept { return nodes_.size(); }
    [[nodiscard]] std::size_t num_edges() const noexcept { return num_edges_; }
    [[nodiscard]] bool        has_edge(NodeId from, NodeId to) const noexcept;

    // --------------------------- Buffer access -------------------------------
    /// Append @p p to the back of buffer (from, to). Aborts if no such edge.
    void push(Packet p, NodeId from, NodeId to);

    /// Read access; nullptr if the edge does not exist (empty buffer != absent).
    [[nodiscard]] const Buffer* peek(NodeId from, NodeId to) const noexcept;

    /// Write access; nullptr if the edge does not exist.
    [[nodiscard]] Buffer* peek_mut(NodeId from, NodeId to) noexcept;

    /// Take all packets of (from, to), leaving it empty. Absent if no such edge.
    [[nodiscard]] std::optional<Buffer> drain(NodeId from, NodeId to);

    /// Number of packets in (from, to); absent if no such edge.
    [[nodiscard]] std::optional<std::size_t> load(NodeId from, NodeId to) const noexcept;

    /// Sum of all buffer loads.
    [[nodiscard]] std::size_t total_load() const noexcept;

    /// One line per edge in canonical order: "from, to: [id, id, ...]".
    [[nodiscard]] std::string to_string() const;

private:
    struct EdgeBuffer {
        NodeId to{0};
        Buffer buffer{};
    };

    struct Node {
        std::vector<EdgeBuffer>                   out{};   ///< Addition order
        std::unordered_map<NodeId, std::size_t>   index{}; ///< to -> slot in out
    };

    void check_node_id(NodeId id, const char* what) const noexcept;

    /// Index of edge (from, to) in nodes_[from].out; absent if no such edge.
    [[nodiscard]] std::optional<std::size_t> slot_of(NodeId from, NodeId to) const noexcept;

    std::vector<Node> nodes_{};
    std::size_t       num_edges_{0};
};

namespace presets {

/// Path network with @p num_buffers edges: nodes 0..num_buffers, edges (i, i+1).
[[nodiscard]] BufferNetwork construct_path(std::size_t num_buffers);

} // namespace presets

} // namespace aqt::net
