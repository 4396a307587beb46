/**
 * @file simulation.cpp
 * @brief Simulation round loop.
 */
#include "aqt/sim/simulation.hpp"
#include "aqt/compat/contract.hpp"
#include "aqt/config/constants.hpp"

#include <utility>

namespace aqt::sim {

Simulation::Simulation(net::BufferNetwork network,
                       protocol::Protocol protocol,
                       Adversary adversary,
                       Threshold threshold,
                       std::vector<Recorder> recorders,
                       std::string output_path,
                       obs::Observer* observer)
    : network_(std::move(network)),
      protocol_(std::move(protocol)),
      adversary_(std::move(adversary)),
      threshold_(std::move(threshold)),
      recorders_(std::move(recorders)),
      output_path_(std::move(output_path)),
      observer_(observer ? observer : obs::make_null_observer()) {
    for (auto& r : recorders_) r.set_output_path(output_path_);
}

void Simulation::emit(obs::EventKind kind, net::Round rd, std::uint64_t absorbed, std::string detail) {
    obs::SimEvent e;
    e.sim_id   = output_path_;
    e.round    = rd;
    e.kind     = kind;
    e.absorbed = absorbed;
    e.load     = network_.total_load();
    e.detail   = std::move(detail);
    observer_->record(e);
}

void Simulation::inject(net::Round rd, RunSummary& summary) {
    auto packets = adversary_.next_packets(network_, rd);
    for (auto& p : packets) {
        const auto at = p.current_node();
        protocol_.add_packet(std::move(p), network_);
        ++summary.injected;
        emit(obs::EventKind::Injection, rd, 0,
             "into " + (at ? std::to_string(*at) : std::string("?")));
    }
}

void Simulation::observe(net::Round rd, bool post_forward, AbsorbedView absorbed) {
    for (auto& r : recorders_) r.observe(rd, post_forward, network_, absorbed);
}

void Simulation::finish(net::Round rd, RunSummary& summary) {
    std::size_t io_errors = 0;
    for (auto& r : recorders_) {
        r.finalize();
        io_errors += r.io_errors();
    }
    if (io_errors != 0) {
        emit(obs::EventKind::Warning, rd, 0,
             std::to_string(io_errors) + " recorder write(s) failed under '" + output_path_ + "'");
    }
    summary.rounds     = rd;
    summary.final_load = network_.total_load();
    emit(obs::EventKind::SimFinished, rd, 0, protocol_.name());
}

RunSummary Simulation::run() {
    aqt::expects(!ran_, "Simulation::run: a simulation can only be run once");
    ran_ = true;

    RunSummary summary;
    emit(obs::EventKind::SimStarted, 0, 0,
         std::string(protocol_.name()) + "/" + adversary_.name() + "/" + threshold_.name());

    for (net::Round rd = config::constants::SIM_FIRST_ROUND;; ++rd) {
        inject(rd, summary);
        observe(rd, false, std::nullopt);
        if (threshold_.should_stop(rd, network_)) {
            finish(rd, summary);
            break;
        }

        const auto absorbed = protocol_.forward_packets(network_);
        summary.absorbed += absorbed.size();
        observe(rd, true, std::span<const net::Packet>(absorbed));
        emit(obs::EventKind::RoundDone, rd, absorbed.size(), {});
        if (threshold_.should_stop(rd, network_)) {
            finish(rd, summary);
            break;
        }
    }
    return summary;
}

} // namespace aqt::sim
