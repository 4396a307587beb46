#include "aqt/protocol/protocol.hpp"

namespace aqt::protocol {

const char* to_string(ProtocolKind kind) noexcept {
    switch (kind) {
        case ProtocolKind::GreedyFifo:  return GreedyFifo::kName;
        case ProtocolKind::GreedyLis:   return GreedyLis::kName;
        case ProtocolKind::OedWithSwap: return OedWithSwap::kName;
    }
    return "unknown";
}

std::optional<ProtocolKind> parse_protocol_kind(std::string_view name) noexcept {
    if (name == GreedyFifo::kName)  return ProtocolKind::GreedyFifo;
    if (name == GreedyLis::kName)   return ProtocolKind::GreedyLis;
    if (name == OedWithSwap::kName) return ProtocolKind::OedWithSwap;
    return std::nullopt;
}

Protocol Protocol::make(ProtocolKind kind, std::size_t capacity) {
    switch (kind) {
        case ProtocolKind::GreedyFifo:  return greedy_fifo(capacity);
        case ProtocolKind::GreedyLis:   return greedy_lis(capacity);
        case ProtocolKind::OedWithSwap: return oed_with_swap();
    }
    return oed_with_swap();
}

void Protocol::add_packet(net::Packet p, net::BufferNetwork& network) const {
    std::visit([&](const auto& impl) { impl.add_packet(std::move(p), network); }, impl_);
}

std::vector<net::Packet> Protocol::forward_packets(net::BufferNetwork& network) const {
    return std::visit([&](const auto& impl) { return impl.forward_packets(network); }, impl_);
}

std::size_t Protocol::capacity() const noexcept {
    return std::visit([](const auto& impl) { return impl.capacity(); }, impl_);
}

ProtocolKind Protocol::kind() const noexcept {
    // Alternatives are declared in ProtocolKind order.
    return static_cast<ProtocolKind>(impl_.index());
}

} // namespace aqt::protocol
