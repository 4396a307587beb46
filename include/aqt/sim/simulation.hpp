#pragma once
/**
 * @file simulation.hpp
 * @brief Round-synchronous driver tying network, protocol, adversary, threshold and recorders.
 *
 * Each round r (starting at 1):
 *   1. adversary.next_packets -> protocol.add_packet for each packet
 *   2. recorders observe (pre-forward, no absorbed list); threshold polled
 *   3. protocol.forward_packets
 *   4. recorders observe (post-forward, absorbed list); threshold polled
 * When the threshold fires every recorder is finalized exactly once.
 *
 * A Simulation owns all of its state and shares nothing mutable with other
 * simulations except the (thread-safe) observer, so independent runs may be
 * driven from different threads.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "aqt/net/buffer_network.hpp"
#include "aqt/obs/observability.hpp"
#include "aqt/protocol/protocol.hpp"
#include "aqt/sim/adversary.hpp"
#include "aqt/sim/recorder.hpp"
#include "aqt/sim/threshold.hpp"

namespace aqt::sim {

/// Outcome of one run.
struct RunSummary final {
    net::Round    rounds{0};     ///< Last round executed (threshold fired on it)
    std::uint64_t injected{0};   ///< Packets handed to add_packet
    std::uint64_t absorbed{0};   ///< Packets reported absorbed
    std::size_t   final_load{0}; ///< Packets still buffered at the end

    bool operator==(const RunSummary&) const = default;
};

class Simulation final {
public:
    /**
     * @param output_path Directory handed to every recorder (may be empty).
     * @param observer Event sink; nullptr selects the silent observer.
     */
    Simulation(net::BufferNetwork network,
               protocol::Protocol protocol,
               Adversary adversary,
               Threshold threshold,
               std::vector<Recorder> recorders,
               std::string output_path,
               obs::Observer* observer = nullptr);

    Simulation(Simulation&&) = default;
    Simulation& operator=(Simulation&&) = default;

    /// Run until the threshold fires. Aborts if called twice.
    RunSummary run();

    [[nodiscard]] const net::BufferNetwork&    network() const noexcept { return network_; }
    [[nodiscard]] const protocol::Protocol&    protocol() const noexcept { return protocol_; }
    [[nodiscard]] const Adversary&             adversary() const noexcept { return adversary_; }
    [[nodiscard]] const Threshold&             threshold() const noexcept { return threshold_; }
    [[nodiscard]] const std::vector<Recorder>& recorders() const noexcept { return recorders_; }
    [[nodiscard]] const std::string&           output_path() const noexcept { return output_path_; }

private:
    void inject(net::Round rd, RunSummary& summary);
    void observe(net::Round rd, bool post_forward, AbsorbedView absorbed);
    void finish(net::Round rd, RunSummary& summary);
    void emit(obs::EventKind kind, net::Round rd, std::uint64_t absorbed, std::string detail);

    net::BufferNetwork    network_;
    protocol::Protocol    protocol_;
    Adversary             adversary_;
    Threshold             threshold_;
    std::vector<Recorder> recorders_;
    std::string           output_path_;
    obs::Observer*        observer_;
    bool                  ran_{false};
};

} // namespace aqt::sim
