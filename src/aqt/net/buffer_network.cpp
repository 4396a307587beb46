/**
* @file buffer_network.cpp
 * @brief BufferNetwork construction, lookups and presets.
 */
#include "aqt/net/buffer_network.hpp"
#include "aqt/compat/contract.hpp"

#include <utility>

namespace aqt::net {

//------------------------------- Construction ---------------------------------

NodeId BufferNetwork::add_node() {
    const NodeId id = nodes_.size();
    nodes_.emplace_back();
    return id;
}

void BufferNetwork::check_node_id(NodeId id, const char* what) const noexcept {
    aqt::expects(id < nodes_.size(), what);
}

void BufferNetwork::add_edge(NodeId from, NodeId to) {
    // Validate everything before touching the arena.
    check_node_id(from, "BufferNetwork::add_edge: unknown from-node");
    check_node_id(to,   "BufferNetwork::add_edge: unknown to-node");
    Node& n = nodes_[from];
    aqt::expects(n.index.find(to) == n.index.end(),
                 "BufferNetwork::add_edge: edge buffer already exists for this pair");

    n.index.emplace(to, n.out.size());
    n.out.push_back(EdgeBuffer{to, {}});
    ++num_edges_;
}

//------------------------------- Topology -------------------------------------

std::vector<NodeId> BufferNetwork::neighbors(NodeId node) const {
    check_node_id(node, "BufferNetwork::neighbors: unknown node");
    std::vector<NodeId> out;
    out.reserve(nodes_[node].out.size());
    for (const auto& eb : nodes_[node].out) out.push_back(eb.to);
    return out;
}

std::vector<EdgeId> BufferNetwork::edges() const {
    std::vector<EdgeId> out;
    out.reserve(num_edges_);
    for (NodeId from = 0; from < nodes_.size(); ++from) {
        for (const auto& eb : nodes_[from].out) out.push_back(EdgeId{from, eb.to});
    }
    return out;
}

std::vector<NodeId> BufferNetwork::nodes() const {
    std::vector<NodeId> out(nodes_.size());
    for (NodeId i = 0; i < nodes_.size(); ++i) out[i] = i;
    return out;
}

bool BufferNetwork::has_edge(NodeId from, NodeId to) const noexcept {
    return peek(from, to) != nullptr;
}

//------------------------------- Buffers --------------------------------------

void BufferNetwork::push(Packet p, NodeId from, NodeId to) {
    Buffer* buf = peek_mut(from, to);
    aqt::expects(buf != nullptr, "BufferNetwork::push: no edge buffer between these nodes");
    buf->push_back(std::move(p));
}

std::optional<std::size_t> BufferNetwork::slot_of(NodeId from, NodeId to) const noexcept {
    if (from >= nodes_.size() || to >= nodes_.size()) return std::nullopt;
    const Node& n = nodes_[from];
    const auto it = n.index.find(to);
    if (it == n.index.end()) return std::nullopt;
    return it->second;
}

const Buffer* BufferNetwork::peek(NodeId from, NodeId to) const noexcept {
    const auto slot = slot_of(from, to);
    if (!slot) return nullptr;
    return &nodes_[from].out[*slot].buffer;
}

Buffer* BufferNetwork::peek_mut(NodeId from, NodeId to) noexcept {
    const auto slot = slot_of(from, to);
    if (!slot) return nullptr;
    return &nodes_[from].out[*slot].buffer;
}

std::optional<Buffer> BufferNetwork::drain(NodeId from, NodeId to) {
    Buffer* buf = peek_mut(from, to);
    if (!buf) return std::nullopt;
    Buffer taken;
    taken.swap(*buf);
    return taken;
}

std::optional<std::size_t> BufferNetwork::load(NodeId from, NodeId to) const noexcept {
    const Buffer* buf = peek(from, to);
    if (!buf) return std::nullopt;
    return buf->size();
}

std::size_t BufferNetwork::total_load() const noexcept {
    std::size_t total = 0;
    for (const auto& n : nodes_) {
        for (const auto& eb : n.out) total += eb.buffer.size();
    }
    return total;
}

std::string BufferNetwork::to_string() const {
    std::string out;
    for (const auto& e : edges()) {
        out += std::to_string(e.from) + ", " + std::to_string(e.to) + ": [";
        const Buffer* buf = peek(e.from, e.to);
        bool first = true;
        for (const auto& p : *buf) {
            if (!first) out += ", ";
            out += std::to_string(p.id());
            first = false;
        }
        out += "]\n";
    }
    return out;
}

//------------------------------- Presets --------------------------------------

BufferNetwork presets::construct_path(std::size_t num_buffers) {
    BufferNetwork network;
    for (std::size_t i = 0; i < num_buffers + 1; ++i) (void)network.add_node();
    for (std::size_t i = 0; i < num_buffers; ++i) network.add_edge(i, i + 1);
    return network;
}

} // namespace aqt::net
