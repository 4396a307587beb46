// apps/aqt_sim/src/main.cpp
// aqt_sim: runs adversarial queuing simulations described by a JSON config.
//
// Usage:
//   ./aqt_sim <config.json>   run every simulation in the file
//   ./aqt_sim                 demo: OED-with-Swap on a 10-buffer path,
//                             random single-destination injections, 10 rounds
//
// Exit status is non-zero if the config cannot be loaded or any simulation
// fails to build.

#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "aqt/config/config_loader.hpp"
#include "aqt/config/constants.hpp"
#include "aqt/obs/observability.hpp"
#include "aqt/sim/runner.hpp"
#include "aqt/version.hpp"

namespace {

int run_demo(aqt::obs::Observer* observer) {
    using namespace aqt::config::constants;

    std::vector<aqt::sim::Recorder> recorders;
    recorders.emplace_back(aqt::sim::DebugPrintRecorder{});

    aqt::sim::Simulation simulation{aqt::net::presets::construct_path(DEMO_NUM_BUFFERS),
                                    aqt::protocol::Protocol::oed_with_swap(),
                                    aqt::sim::SdPathRandomAdversary{DEMO_SEED},
                                    aqt::sim::TimedThreshold{DEMO_NUM_RDS},
                                    std::move(recorders),
                                    std::string{},
                                    observer};
    const auto summary = simulation.run();
    std::cout << "rounds=" << summary.rounds
              << " injected=" << summary.injected
              << " absorbed=" << summary.absorbed
              << " load=" << summary.final_load << std::endl;
    return 0;
}

void print_usage(const char* argv0) {
    std::cerr << "usage: " << argv0 << " [config.json]\n"
              << "  without a config file a demo simulation is run\n";
}

} // namespace

int main(int argc, char** argv) {
    if (argc > 2) {
        print_usage(argv[0]);
        return 2;
    }
    if (argc == 2) {
        const std::string arg = argv[1];
        if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        }
        if (arg == "--version") {
            std::cout << "aqt_sim " << aqt::version_string << std::endl;
            return 0;
        }
    }

    aqt::obs::Observer* observer = aqt::obs::make_simple_observer();
    if (argc < 2) return run_demo(observer);

    auto cfg = aqt::config::Loader::load_from_file(argv[1]);
    if (!cfg) {
        std::cerr << "aqt_sim: " << cfg.error().message << std::endl;
        return 1;
    }

    std::cout << "aqt_sim: running " << cfg->simulations.size() << " simulation(s)"
              << (cfg->parallel ? " in parallel" : "") << std::endl;

    const auto results = aqt::sim::run_batch(*cfg, observer);
    int status = 0;
    for (std::size_t i = 0; i < results.size(); ++i) {
        const auto& r = results[i];
        if (!r) {
            std::cerr << "simulation " << i << ": " << r.error().message << std::endl;
            status = 1;
            continue;
        }
        std::cout << "simulation " << i << " (" << cfg->simulations[i].output_path << "): "
                  << "rounds=" << r->rounds << " injected=" << r->injected
                  << " absorbed=" << r->absorbed << " load=" << r->final_load << std::endl;
    }
    return status;
}
