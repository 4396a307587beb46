#pragma once
/**
 * @file adversary.hpp
 * @brief Injection policies ("adversaries") and the RNG wrapper they use.
 * @details Each adversary owns its PacketFactory, so packet ids are unique per
 *          injection source and nothing is shared between simulations.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <random>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

#include "aqt/net/buffer_network.hpp"

namespace aqt::sim {

/** @class SimRng
 *  @brief Seeded (reproducible) or entropy-seeded random generator.
 */
class SimRng final {
public:
    /// Unseeded: draws its seed from std::random_device.
    SimRng();
    /// Reproducible stream for @p seed.
    explicit SimRng(std::uint64_t seed);

    /// Uniform integer in [0, max). Aborts if @p max is 0.
    [[nodiscard]] std::size_t rand_int(std::size_t max);

    /// Seed given at construction, absent if unseeded.
    [[nodiscard]] std::optional<std::uint64_t> seed() const noexcept { return seed_; }

private:
    std::mt19937_64              gen_;
    std::optional<std::uint64_t> seed_;
};

/** @class SdPathRandomAdversary
 *  @brief Single-destination path adversary: one packet per round, random source.
 *
 * On a path network 0..d every packet follows [0..d]; the starting cursor is
 * drawn uniformly from [0, d-2] (0 when d < 2).
 */
class SdPathRandomAdversary final {
public:
    static constexpr const char* kName = "sd_path_random";

    SdPathRandomAdversary() = default;
    explicit SdPathRandomAdversary(std::uint64_t seed) : rng_(seed) {}

    /// Aborts if the network has fewer than two nodes.
    std::vector<net::Packet> next_packets(const net::BufferNetwork& network, net::Round rd);

    [[nodiscard]] std::optional<std::uint64_t> seed() const noexcept { return rng_.seed(); }

private:
    net::PacketFactory factory_{};
    SimRng             rng_{};
};

/// One scripted packet: route plus starting cursor.
struct InjectionConfig final {
    net::PacketPath path{};
    std::size_t     path_idx{0};

    bool operator==(const InjectionConfig&) const = default;
};

/** @class PresetAdversary
 *  @brief Replays a fixed script: the k-th call injects the k-th round's packets.
 *  @note Once the script is exhausted it injects nothing.
 */
class PresetAdversary final {
public:
    static constexpr const char* kName = "preset";

    explicit PresetAdversary(std::vector<std::vector<InjectionConfig>> script)
        : script_(std::move(script)) {}

    std::vector<net::Packet> next_packets(const net::BufferNetwork& network, net::Round rd);

    /// Number of scripted rounds.
    [[nodiscard]] std::size_t rounds() const noexcept { return script_.size(); }

    [[nodiscard]] const std::vector<std::vector<InjectionConfig>>& script() const noexcept { return script_; }

private:
    net::PacketFactory                        factory_{};
    std::vector<std::vector<InjectionConfig>> script_;
    std::size_t                               next_{0};
};

enum class AdversaryKind : std::uint8_t {
    SdPathRandom = 0, ///< "sd_path_random"
    Preset            ///< "preset"
};

[[nodiscard]] const char* to_string(AdversaryKind kind) noexcept;
[[nodiscard]] std::optional<AdversaryKind> parse_adversary_kind(std::string_view name) noexcept;

/** @class Adversary
 *  @brief Closed sum type over the injection policies.
 */
class Adversary final {
public:
    using Variant = std::variant<SdPathRandomAdversary, PresetAdversary>;

    Adversary(SdPathRandomAdversary a) : impl_(std::move(a)) {}
    Adversary(PresetAdversary a) : impl_(std::move(a)) {}

    /// Packets to inject this round, already carrying path and injection round @p rd.
    std::vector<net::Packet> next_packets(const net::BufferNetwork& network, net::Round rd);

    [[nodiscard]] AdversaryKind kind() const noexcept { return static_cast<AdversaryKind>(impl_.index()); }
    [[nodiscard]] const char*   name() const noexcept { return to_string(kind()); }

    [[nodiscard]] const Variant& variant() const noexcept { return impl_; }

private:
    Variant impl_;
};

} // namespace aqt::sim
