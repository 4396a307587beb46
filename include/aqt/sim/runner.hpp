#pragma once
/**
 * @file runner.hpp
 * @brief Runs a batch of configured simulations, sequentially or one thread each.
 */

#include <vector>

#include "aqt/config/config_loader.hpp"
#include "aqt/obs/observability.hpp"
#include "aqt/sim/simulation.hpp"

namespace aqt::sim {

/**
 * @brief Build, save and run every simulation of @p cfg.
 *
 * Each simulation writes <output_path>/sim_config.json before it starts; a
 * failed save is reported as a Warning event and does not stop the run.
 * With cfg.parallel each simulation gets its own std::thread.
 *
 * @return One entry per simulation, in config order: the run summary, or the
 *         error that prevented the simulation from being built.
 */
std::vector<config::Result<RunSummary>> run_batch(const config::Config& cfg,
                                                  obs::Observer* observer = nullptr);

/// Build, save and run a single simulation.
config::Result<RunSummary> run_one(const config::SimConfig& cfg, obs::Observer* observer = nullptr);

} // namespace aqt::sim
