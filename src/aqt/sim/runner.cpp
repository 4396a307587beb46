/**
 * @file runner.cpp
 * @brief Batch runner.
 */
#include "aqt/sim/runner.hpp"

#include <thread>
#include <utility>

namespace aqt::sim {

config::Result<RunSummary> run_one(const config::SimConfig& cfg, obs::Observer* observer) {
    obs::Observer* sink = observer ? observer : obs::make_null_observer();

    auto simulation = config::build_simulation(cfg, sink);
    if (!simulation) return aqt_detail::unexpected<config::ConfigError>(simulation.error());

    if (auto saved = config::save_sim_config(*simulation); !saved) {
        obs::SimEvent e;
        e.sim_id = cfg.output_path;
        e.kind   = obs::EventKind::Warning;
        e.detail = saved.error().message;
        sink->record(e);
    }
    return simulation->run();
}

std::vector<config::Result<RunSummary>> run_batch(const config::Config& cfg, obs::Observer* observer) {
    const std::size_t n = cfg.simulations.size();

    if (!cfg.parallel) {
        std::vector<config::Result<RunSummary>> results;
        results.reserve(n);
        for (const auto& sc : cfg.simulations) results.push_back(run_one(sc, observer));
        return results;
    }

    // Every thread owns one slot; slots are pre-filled so no reallocation happens.
    std::vector<config::Result<RunSummary>> results(n, RunSummary{});
    std::vector<std::thread> workers;
    workers.reserve(n);
    for (std::size_t i = 0; i < n; ++i) {
        workers.emplace_back([&, i] { results[i] = run_one(cfg.simulations[i], observer); });
    }
    for (auto& t : workers) t.join();
    return results;
}

} // namespace aqt::sim
