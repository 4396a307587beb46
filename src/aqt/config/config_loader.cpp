/**
* @file config_loader.cpp
 * @brief nlohmann::json backed loader. Parsing runs with exceptions disabled
 *        (parse(..., nullptr, false)) and every access is type-checked first.
 */
#include "aqt/config/config_loader.hpp"
#include "aqt/config/constants.hpp"

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace aqt::config {
    using namespace aqt::config::constants;

namespace {

aqt_detail::unexpected<ConfigError> fail(ConfigErrc code, std::string msg) {
    return aqt_detail::unexpected<ConfigError>(ConfigError{code, std::move(msg)});
}

aqt_detail::unexpected<ConfigError> fail(ConfigError e, const std::string& context) {
    e.message = context + ": " + e.message;
    return aqt_detail::unexpected<ConfigError>(std::move(e));
}

Result<const json*> require(const json& obj, const char* key) {
    if (!obj.is_object()) return fail(ConfigErrc::NotAnObject, std::string("expected an object holding '") + key + "'");
    const auto it = obj.find(key);
    if (it == obj.end()) return fail(ConfigErrc::MissingKey, std::string("missing key '") + key + "'");
    return &*it;
}

Result<std::uint64_t> require_unsigned(const json& obj, const char* key) {
    auto v = require(obj, key);
    if (!v) return aqt_detail::unexpected<ConfigError>(v.error());
    if (!(*v)->is_number_unsigned()) return fail(ConfigErrc::WrongType, std::string("'") + key + "' must be a non-negative integer");
    return (*v)->get<std::uint64_t>();
}

Result<std::string> require_string(const json& obj, const char* key) {
    auto v = require(obj, key);
    if (!v) return aqt_detail::unexpected<ConfigError>(v.error());
    if (!(*v)->is_string()) return fail(ConfigErrc::WrongType, std::string("'") + key + "' must be a string");
    return (*v)->get<std::string>();
}

Result<net::PacketPath> path_from_json(const json& j) {
    if (!j.is_array()) return fail(ConfigErrc::WrongType, "'path' must be an array of node ids");
    net::PacketPath path;
    path.reserve(j.size());
    for (const auto& n : j) {
        if (!n.is_number_unsigned()) return fail(ConfigErrc::WrongType, "'path' entries must be node ids");
        path.push_back(n.get<net::NodeId>());
    }
    return path;
}

bool path_is_routable(const net::PacketPath& path, const net::BufferNetwork& network) {
    for (std::size_t k = 0; k + 1 < path.size(); ++k) {
        if (!network.has_edge(path[k], path[k + 1])) return false;
    }
    return true;
}

// The random path adversary routes along (i, i+1) for every node.
bool is_path_network(const net::BufferNetwork& network) {
    if (network.num_nodes() < 2) return false;
    for (net::NodeId i = 0; i + 1 < network.num_nodes(); ++i) {
        if (!network.has_edge(i, i + 1)) return false;
    }
    return true;
}

} // namespace

// ------------------------------- Network --------------------------------------

Result<net::BufferNetwork> network_from_json(const json& adjacency) {
    if (!adjacency.is_array()) {
        return fail(ConfigErrc::WrongType, std::string("'") + KEY_ADJACENCY + "' must be an array of successor lists");
    }
    const std::size_t n = adjacency.size();

    // Validate the whole topology before building anything.
    for (std::size_t from = 0; from < n; ++from) {
        const auto& succ = adjacency[from];
        if (!succ.is_array()) {
            return fail(ConfigErrc::WrongType, "node " + std::to_string(from) + ": successors must be an array");
        }
        std::unordered_set<std::size_t> seen;
        for (const auto& to : succ) {
            if (!to.is_number_unsigned()) {
                return fail(ConfigErrc::WrongType, "node " + std::to_string(from) + ": successor ids must be non-negative integers");
            }
            const auto id = to.get<std::size_t>();
            if (id >= n) {
                return fail(ConfigErrc::InvalidValue, "node " + std::to_string(from) + ": unknown successor " + std::to_string(id));
            }
            if (!seen.insert(id).second) {
                return fail(ConfigErrc::InvalidValue, "node " + std::to_string(from) + ": duplicate edge to " + std::to_string(id));
            }
        }
    }

    net::BufferNetwork network;
    for (std::size_t i = 0; i < n; ++i) (void)network.add_node();
    for (std::size_t from = 0; from < n; ++from) {
        for (const auto& to : adjacency[from]) network.add_edge(from, to.get<std::size_t>());
    }
    return network;
}

json network_to_json(const net::BufferNetwork& network) {
    json adj = json::array();
    for (const auto node : network.nodes()) adj.push_back(network.neighbors(node));
    return adj;
}

// ------------------------------- Protocol -------------------------------------

Result<protocol::Protocol> protocol_from_json(const json& j) {
    auto name = require_string(j, KEY_PROTOCOL_NAME);
    if (!name) return fail(name.error(), KEY_PROTOCOL);
    const auto kind = protocol::parse_protocol_kind(*name);
    if (!kind) return fail(ConfigErrc::UnknownName, std::string(KEY_PROTOCOL) + ": unknown protocol '" + *name + "'");

    std::uint64_t capacity = PROTOCOL_DEFAULT_CAPACITY;
    if (j.contains(KEY_CAPACITY)) {
        auto cap = require_unsigned(j, KEY_CAPACITY);
        if (!cap) return fail(cap.error(), KEY_PROTOCOL);
        capacity = *cap;
    }
    if (capacity == 0 && *kind != protocol::ProtocolKind::OedWithSwap) {
        return fail(ConfigErrc::InvalidValue, std::string(KEY_PROTOCOL) + ": capacity must be at least 1");
    }
    return protocol::Protocol::make(*kind, static_cast<std::size_t>(capacity));
}

json protocol_to_json(const protocol::Protocol& p) {
    return json{{KEY_PROTOCOL_NAME, p.name()}, {KEY_CAPACITY, p.capacity()}};
}

// ------------------------------- Adversary ------------------------------------

Result<sim::Adversary> adversary_from_json(const json& j) {
    auto name = require_string(j, KEY_ADVERSARY_NAME);
    if (!name) return fail(name.error(), KEY_ADVERSARY);
    const auto kind = sim::parse_adversary_kind(*name);
    if (!kind) return fail(ConfigErrc::UnknownName, std::string(KEY_ADVERSARY) + ": unknown adversary '" + *name + "'");

    switch (*kind) {
        case sim::AdversaryKind::SdPathRandom: {
            if (!j.contains(KEY_SEED)) return sim::Adversary{sim::SdPathRandomAdversary{}};
            auto seed = require_unsigned(j, KEY_SEED);
            if (!seed) return fail(seed.error(), KEY_ADVERSARY);
            return sim::Adversary{sim::SdPathRandomAdversary{*seed}};
        }
        case sim::AdversaryKind::Preset: {
            auto inj = require(j, KEY_INJECTIONS);
            if (!inj) return fail(inj.error(), KEY_ADVERSARY);
            if (!(*inj)->is_array()) return fail(ConfigErrc::WrongType, std::string(KEY_ADVERSARY) + ": 'injections' must be an array of rounds");

            std::vector<std::vector<sim::InjectionConfig>> script;
            for (const auto& rd : **inj) {
                if (!rd.is_array()) return fail(ConfigErrc::WrongType, std::string(KEY_ADVERSARY) + ": each round must be an array");
                auto& round = script.emplace_back();
                for (const auto& cfg : rd) {
                    auto path_j = require(cfg, KEY_PATH);
                    if (!path_j) return fail(path_j.error(), KEY_ADVERSARY);
                    auto path = path_from_json(**path_j);
                    if (!path) return fail(path.error(), KEY_ADVERSARY);
                    auto idx = require_unsigned(cfg, KEY_PATH_IDX);
                    if (!idx) return fail(idx.error(), KEY_ADVERSARY);
                    if (*idx + 1 >= path->size()) {
                        return fail(ConfigErrc::InvalidValue, std::string(KEY_ADVERSARY) + ": 'path_idx' must leave at least one hop to go");
                    }
                    round.push_back(sim::InjectionConfig{std::move(*path), static_cast<std::size_t>(*idx)});
                }
            }
            return sim::Adversary{sim::PresetAdversary{std::move(script)}};
        }
    }
    return fail(ConfigErrc::UnknownName, std::string(KEY_ADVERSARY) + ": unknown adversary '" + *name + "'");
}

json adversary_to_json(const sim::Adversary& a) {
    json out{{KEY_ADVERSARY_NAME, a.name()}};
    if (const auto* r = std::get_if<sim::SdPathRandomAdversary>(&a.variant())) {
        if (const auto seed = r->seed()) out[KEY_SEED] = *seed;
    } else if (const auto* p = std::get_if<sim::PresetAdversary>(&a.variant())) {
        json rounds = json::array();
        for (const auto& rd : p->script()) {
            json round = json::array();
            for (const auto& inj : rd) round.push_back(json{{KEY_PATH, inj.path}, {KEY_PATH_IDX, inj.path_idx}});
            rounds.push_back(std::move(round));
        }
        out[KEY_INJECTIONS] = std::move(rounds);
    }
    return out;
}

// ------------------------------- Threshold ------------------------------------

Result<sim::Threshold> threshold_from_json(const json& j) {
    auto name = require_string(j, KEY_THRESHOLD_NAME);
    if (!name) return fail(name.error(), KEY_THRESHOLD);
    const auto kind = sim::parse_threshold_kind(*name);
    if (!kind) return fail(ConfigErrc::UnknownName, std::string(KEY_THRESHOLD) + ": unknown threshold '" + *name + "'");

    switch (*kind) {
        case sim::ThresholdKind::Timed: {
            auto max_rds = require_unsigned(j, KEY_MAX_RDS);
            if (!max_rds) return fail(max_rds.error(), KEY_THRESHOLD);
            return sim::Threshold{sim::TimedThreshold{*max_rds}};
        }
        case sim::ThresholdKind::TotalLoad: {
            auto max_load = require_unsigned(j, KEY_MAX_LOAD);
            if (!max_load) return fail(max_load.error(), KEY_THRESHOLD);
            return sim::Threshold{sim::TotalLoadThreshold{static_cast<std::size_t>(*max_load)}};
        }
    }
    return fail(ConfigErrc::UnknownName, std::string(KEY_THRESHOLD) + ": unknown threshold '" + *name + "'");
}

json threshold_to_json(const sim::Threshold& t) {
    json out{{KEY_THRESHOLD_NAME, t.name()}};
    if (const auto* timed = std::get_if<sim::TimedThreshold>(&t.variant())) {
        out[KEY_MAX_RDS] = timed->max_rds();
    } else if (const auto* load = std::get_if<sim::TotalLoadThreshold>(&t.variant())) {
        out[KEY_MAX_LOAD] = load->max_load();
    }
    return out;
}

// ------------------------------- Recorder -------------------------------------

Result<sim::Recorder> recorder_from_json(const json& j) {
    auto name = require_string(j, KEY_RECORDER_NAME);
    if (!name) return fail(name.error(), KEY_RECORDERS);
    const auto kind = sim::parse_recorder_kind(*name);
    if (!kind) return fail(ConfigErrc::UnknownName, std::string(KEY_RECORDERS) + ": unknown recorder '" + *name + "'");
    return sim::Recorder::make(*kind);
}

json recorder_to_json(const sim::Recorder& r) {
    return json{{KEY_RECORDER_NAME, r.name()}};
}

// ------------------------------- SimConfig ------------------------------------

Result<SimConfig> sim_config_from_json(const json& j) {
    if (!j.is_object()) return fail(ConfigErrc::NotAnObject, "simulation config must be a JSON object");

    SimConfig cfg;
    const std::pair<const char*, json*> sections[] = {
        {KEY_ADJACENCY, &cfg.graph_adjacency},
        {KEY_PROTOCOL,  &cfg.protocol},
        {KEY_ADVERSARY, &cfg.adversary},
        {KEY_THRESHOLD, &cfg.threshold},
        {KEY_RECORDERS, &cfg.recorders},
    };
    for (const auto& [key, dst] : sections) {
        auto v = require(j, key);
        if (!v) return aqt_detail::unexpected<ConfigError>(v.error());
        *dst = **v;
    }
    if (!cfg.recorders.is_array()) {
        return fail(ConfigErrc::WrongType, std::string("'") + KEY_RECORDERS + "' must be an array");
    }
    auto out = require_string(j, KEY_OUTPUT_PATH);
    if (!out) return aqt_detail::unexpected<ConfigError>(out.error());
    cfg.output_path = std::move(*out);
    return cfg;
}

json sim_config_to_json(const SimConfig& cfg) {
    return json{
        {KEY_ADJACENCY,   cfg.graph_adjacency},
        {KEY_PROTOCOL,    cfg.protocol},
        {KEY_ADVERSARY,   cfg.adversary},
        {KEY_THRESHOLD,   cfg.threshold},
        {KEY_RECORDERS,   cfg.recorders},
        {KEY_OUTPUT_PATH, cfg.output_path},
    };
}

// ------------------------------- Loader ---------------------------------------

Result<Config> Loader::load_from_string(std::string_view text) {
    const json doc = json::parse(text.begin(), text.end(), nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) return fail(ConfigErrc::ParseError, "config is not valid JSON");
    if (!doc.is_object()) return fail(ConfigErrc::NotAnObject, "config must be a JSON object");

    Config cfg;
    auto parallel = require(doc, KEY_PARALLEL);
    if (!parallel) return aqt_detail::unexpected<ConfigError>(parallel.error());
    if (!(*parallel)->is_boolean()) return fail(ConfigErrc::WrongType, std::string("'") + KEY_PARALLEL + "' must be a boolean");
    cfg.parallel = (*parallel)->get<bool>();

    auto sims = require(doc, KEY_SIMULATIONS);
    if (!sims) return aqt_detail::unexpected<ConfigError>(sims.error());
    if (!(*sims)->is_array()) return fail(ConfigErrc::WrongType, std::string("'") + KEY_SIMULATIONS + "' must be an array");

    std::size_t idx = 0;
    for (const auto& s : **sims) {
        auto sc = sim_config_from_json(s);
        if (!sc) return fail(sc.error(), std::string(KEY_SIMULATIONS) + "[" + std::to_string(idx) + "]");
        cfg.simulations.push_back(std::move(*sc));
        ++idx;
    }
    return cfg;
}

Result<Config> Loader::load_from_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) return fail(ConfigErrc::IoError, "cannot open config file '" + path + "'");
    std::ostringstream ss;
    ss << in.rdbuf();
    if (in.bad()) return fail(ConfigErrc::IoError, "cannot read config file '" + path + "'");
    return load_from_string(ss.str());
}

std::string Loader::dump(const Config& cfg) {
    json sims = json::array();
    for (const auto& s : cfg.simulations) sims.push_back(sim_config_to_json(s));
    return json{{KEY_PARALLEL, cfg.parallel}, {KEY_SIMULATIONS, std::move(sims)}}.dump();
}

// ------------------------------- Simulations ----------------------------------

Result<sim::Simulation> build_simulation(const SimConfig& cfg, obs::Observer* observer) {
    auto network = network_from_json(cfg.graph_adjacency);
    if (!network) return aqt_detail::unexpected<ConfigError>(network.error());
    auto protocol = protocol_from_json(cfg.protocol);
    if (!protocol) return aqt_detail::unexpected<ConfigError>(protocol.error());
    auto adversary = adversary_from_json(cfg.adversary);
    if (!adversary) return aqt_detail::unexpected<ConfigError>(adversary.error());
    auto threshold = threshold_from_json(cfg.threshold);
    if (!threshold) return aqt_detail::unexpected<ConfigError>(threshold.error());

    std::vector<sim::Recorder> recorders;
    for (const auto& r : cfg.recorders) {
        auto rec = recorder_from_json(r);
        if (!rec) return aqt_detail::unexpected<ConfigError>(rec.error());
        recorders.push_back(std::move(*rec));
    }

    // Cross-check the adversary's routes against the topology; a missing edge
    // would otherwise be a contract violation on the first injection.
    if (adversary->kind() == sim::AdversaryKind::SdPathRandom && !is_path_network(*network)) {
        return fail(ConfigErrc::InvalidValue, std::string(KEY_ADVERSARY) + ": 'sd_path_random' needs edges (i, i+1) for every node");
    }
    if (const auto* preset = std::get_if<sim::PresetAdversary>(&adversary->variant())) {
        for (const auto& rd : preset->script()) {
            for (const auto& inj : rd) {
                if (!path_is_routable(inj.path, *network)) {
                    return fail(ConfigErrc::InvalidValue, std::string(KEY_ADVERSARY) + ": injection path uses a missing edge");
                }
            }
        }
    }
    if (protocol->kind() == protocol::ProtocolKind::OedWithSwap && network->num_nodes() < 2) {
        return fail(ConfigErrc::InvalidValue, std::string(KEY_PROTOCOL) + ": 'oed_with_swap' needs at least one path edge");
    }

    return sim::Simulation{std::move(*network), std::move(*protocol), std::move(*adversary),
                           std::move(*threshold), std::move(recorders), cfg.output_path, observer};
}

SimConfig describe_simulation(const sim::Simulation& simulation) {
    SimConfig cfg;
    cfg.graph_adjacency = network_to_json(simulation.network());
    cfg.protocol        = protocol_to_json(simulation.protocol());
    cfg.adversary       = adversary_to_json(simulation.adversary());
    cfg.threshold       = threshold_to_json(simulation.threshold());
    cfg.recorders       = json::array();
    for (const auto& r : simulation.recorders()) cfg.recorders.push_back(recorder_to_json(r));
    cfg.output_path     = simulation.output_path();
    return cfg;
}

Result<void> save_sim_config(const sim::Simulation& simulation) {
    namespace fs = std::filesystem;
    const fs::path dir = simulation.output_path();

    std::error_code ec;
    if (!dir.empty()) fs::create_directories(dir, ec);
    if (ec) return fail(ConfigErrc::IoError, "cannot create '" + dir.string() + "': " + ec.message());

    const fs::path file = dir / SIM_CONFIG_FILENAME;
    std::ofstream out(file, std::ios::out | std::ios::trunc);
    if (!out) return fail(ConfigErrc::IoError, "cannot write '" + file.string() + "'");
    out << sim_config_to_json(describe_simulation(simulation)).dump(4) << '\n';
    if (!out) return fail(ConfigErrc::IoError, "cannot write '" + file.string() + "'");
    return {};
}

} // namespace aqt::config
