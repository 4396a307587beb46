/**
 * @file adversary.cpp
 * @brief SimRng and adversary implementations.
 */
#include "aqt/sim/adversary.hpp"
#include "aqt/compat/contract.hpp"

#include <numeric>

namespace aqt::sim {

SimRng::SimRng() : gen_(std::random_device{}()) {}

SimRng::SimRng(std::uint64_t seed) : gen_(seed), seed_(seed) {}

std::size_t SimRng::rand_int(std::size_t max) {
    aqt::expects(max > 0, "SimRng::rand_int: empty range");
    std::uniform_int_distribution<std::size_t> dist(0, max - 1);
    return dist(gen_);
}

std::vector<net::Packet> SdPathRandomAdversary::next_packets(const net::BufferNetwork& network,
                                                             net::Round rd) {
    aqt::expects(network.num_nodes() >= 2, "SdPathRandomAdversary: needs a path of at least one buffer");
    const net::NodeId dest = network.num_nodes() - 1;
    const std::size_t src  = dest >= 2 ? rng_.rand_int(dest - 1) : 0;

    net::PacketPath path(dest + 1);
    std::iota(path.begin(), path.end(), net::NodeId{0});

    std::vector<net::Packet> out;
    out.push_back(factory_.create(std::move(path), rd, src));
    return out;
}

std::vector<net::Packet> PresetAdversary::next_packets(const net::BufferNetwork&, net::Round rd) {
    std::vector<net::Packet> out;
    if (next_ >= script_.size()) return out;
    const auto& injections = script_[next_++];
    out.reserve(injections.size());
    for (const auto& inj : injections) {
        out.push_back(factory_.create(inj.path, rd, inj.path_idx));
    }
    return out;
}

const char* to_string(AdversaryKind kind) noexcept {
    switch (kind) {
        case AdversaryKind::SdPathRandom: return SdPathRandomAdversary::kName;
        case AdversaryKind::Preset:       return PresetAdversary::kName;
    }
    return "unknown";
}

std::optional<AdversaryKind> parse_adversary_kind(std::string_view name) noexcept {
    if (name == SdPathRandomAdversary::kName) return AdversaryKind::SdPathRandom;
    if (name == PresetAdversary::kName)       return AdversaryKind::Preset;
    return std::nullopt;
}

std::vector<net::Packet> Adversary::next_packets(const net::BufferNetwork& network, net::Round rd) {
    return std::visit([&](auto& a) { return a.next_packets(network, rd); }, impl_);
}

} // namespace aqt::sim
