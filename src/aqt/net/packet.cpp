/**
* @file packet.cpp
 * @brief Packet cursor moves and PacketFactory.
 */
#include "aqt/net/packet.hpp"
#include "aqt/compat/contract.hpp"

#include <utility>

namespace aqt::net {

void Packet::advance() noexcept {
    aqt::expects(!is_absorbed(), "Packet::advance: packet has already been absorbed");
    ++cursor_;
}

void Packet::retreat() noexcept {
    aqt::expects(cursor_ != 0, "Packet::retreat: packet is already at the start of its path");
    --cursor_;
}

std::optional<NodeId> Packet::current_node() const noexcept {
    if (cursor_ >= path_.size()) return std::nullopt;
    return path_[cursor_];
}

std::optional<NodeId> Packet::next_node() const noexcept {
    if (cursor_ + 1 >= path_.size()) return std::nullopt;
    return path_[cursor_ + 1];
}

std::size_t Packet::dist_to_go() const noexcept {
    return path_.size() - cursor_;
}

std::string Packet::to_string() const {
    std::string out = "Packet{id=" + std::to_string(id_) + ", cur=";
    if (const auto cur = current_node()) out += std::to_string(*cur);
    else                                 out += "absorbed";
    out += ", rd=" + std::to_string(injection_rd_) + "}";
    return out;
}

Packet PacketFactory::create(PacketPath path, Round injection_rd, std::size_t cursor) {
    aqt::expects(cursor <= path.size(), "PacketFactory::create: cursor beyond end of path");
    Packet p{next_id_, std::move(path), cursor, injection_rd};
    ++next_id_;
    return p;
}

} // namespace aqt::net
