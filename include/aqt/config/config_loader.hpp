#pragma once
/**
 * @file config_loader.hpp
 * @brief JSON (de)serialization of simulation configs and every configurable object.
 * @details Parsing never throws: errors come back as expected<T, ConfigError>.
 *          Topology problems are caught here (recoverable) before the network
 *          is built, where they would be contract violations.
 *
 * Top-level document:
 * @code
 * { "parallel": false,
 *   "simulations": [ { "graph_adjacency": [[1],[2],[]],
 *                      "protocol":  {"protocol_name": "oed_with_swap", "capacity": 1},
 *                      "adversary": {"adversary_name": "sd_path_random", "seed": 32},
 *                      "threshold": {"threshold_name": "timed", "max_rds": 10},
 *                      "recorders": [{"recorder_name": "buffer_load_csv"}],
 *                      "output_path": "out/run0" } ] }
 * @endcode
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "aqt/compat/expected.hpp"
#include "aqt/net/buffer_network.hpp"
#include "aqt/obs/observability.hpp"
#include "aqt/protocol/protocol.hpp"
#include "aqt/sim/adversary.hpp"
#include "aqt/sim/recorder.hpp"
#include "aqt/sim/simulation.hpp"
#include "aqt/sim/threshold.hpp"

namespace aqt::config {

using json = nlohmann::json;

/// Error codes for config loading/saving.
enum class ConfigErrc : std::uint8_t {
    ParseError = 1, ///< Not valid JSON
    NotAnObject,    ///< Expected a JSON object
    MissingKey,     ///< Required key absent
    WrongType,      ///< Key present with the wrong JSON type
    UnknownName,    ///< protocol/adversary/threshold/recorder name not recognised
    InvalidValue,   ///< Well-typed but out of range (bad node id, duplicate edge, capacity 0)
    IoError         ///< File could not be read or written
};

/// Code plus a human-readable message naming the offending key.
struct ConfigError {
    ConfigErrc  code{ConfigErrc::ParseError};
    std::string message;
};

template <class T>
using Result = aqt_detail::expected<T, ConfigError>;

/** @struct SimConfig
 *  @brief One simulation, kept as raw JSON sections until build_simulation().
 */
struct SimConfig {
    json        graph_adjacency; ///< Array: index = node, value = successors in addition order
    json        protocol;        ///< {"protocol_name", "capacity"?}
    json        adversary;       ///< {"adversary_name", ...}
    json        threshold;       ///< {"threshold_name", ...}
    json        recorders;       ///< Array of {"recorder_name"}
    std::string output_path;     ///< Directory for recorder files and sim_config.json
};

/** @struct Config
 *  @brief Whole program config: a batch of simulations.
 */
struct Config {
    std::vector<SimConfig> simulations;
    bool                   parallel{false}; ///< Run simulations on separate threads
};

/** @class Loader
 *  @brief Source of program configuration (file or in-memory text).
 */
class Loader {
public:
    /// Read and parse a config file.
    static Result<Config> load_from_file(const std::string& path);

    /// Parse config text.
    static Result<Config> load_from_string(std::string_view text);

    /// Serialize back to compact JSON text.
    static std::string dump(const Config& cfg);
};

// ----------------------------- Sections ---------------------------------------
Result<SimConfig> sim_config_from_json(const json& j);
json              sim_config_to_json(const SimConfig& cfg);

Result<net::BufferNetwork> network_from_json(const json& adjacency);
json                       network_to_json(const net::BufferNetwork& network);

Result<protocol::Protocol> protocol_from_json(const json& j);
json                       protocol_to_json(const protocol::Protocol& p);

Result<sim::Adversary> adversary_from_json(const json& j);
json                   adversary_to_json(const sim::Adversary& a);

Result<sim::Threshold> threshold_from_json(const json& j);
json                   threshold_to_json(const sim::Threshold& t);

Result<sim::Recorder> recorder_from_json(const json& j);
json                  recorder_to_json(const sim::Recorder& r);

// ----------------------------- Simulations ------------------------------------
/// Build a ready-to-run Simulation from its config sections.
Result<sim::Simulation> build_simulation(const SimConfig& cfg, obs::Observer* observer = nullptr);

/// Describe a constructed Simulation as a SimConfig (inverse of build_simulation).
SimConfig describe_simulation(const sim::Simulation& simulation);

/// Write <output_path>/sim_config.json (pretty printed), creating the directory.
Result<void> save_sim_config(const sim::Simulation& simulation);

} // namespace aqt::config
