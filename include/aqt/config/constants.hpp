#pragma once
/**
 * @file constants.hpp
 * @brief Centralized named defaults for the simulator and its config layer.
 * @details These values eliminate magic numbers from the codebase. Override via the
 *          JSON simulation config where a key exists.
 */

#include <cstddef>
#include <cstdint>

namespace aqt::config::constants {

// =====================
// Protocol Defaults
// =====================
inline constexpr std::size_t PROTOCOL_DEFAULT_CAPACITY = 1; ///< Packets per edge per round (greedy)
inline constexpr std::size_t OED_CAPACITY              = 1; ///< OED-with-Swap is fixed at one per edge

// =====================
// Simulation Defaults
// =====================
inline constexpr std::uint64_t SIM_FIRST_ROUND = 1; ///< Round counter starts at 1

// =====================
// Recorder Defaults
// =====================
/// Lines kept in memory before a CSV recorder appends them to disk.
inline constexpr std::size_t RECORDER_LINE_LIMIT = 5000;

inline constexpr const char* BUFFER_LOAD_CSV_FILENAME = "buffer_load.csv";
inline constexpr const char* ABSORPTION_CSV_FILENAME  = "absorption.csv";
inline constexpr const char* SIM_CONFIG_FILENAME      = "sim_config.json";

inline constexpr const char* BUFFER_LOAD_CSV_HEADER = "rd,prime,buffer_from,buffer_to,load";
inline constexpr const char* ABSORPTION_CSV_HEADER  = "rd,packet_id,injection_rd,path_len";

// =====================
// Demo run (CLI without a config file)
// =====================
inline constexpr std::size_t   DEMO_NUM_BUFFERS = 10;
inline constexpr std::uint64_t DEMO_NUM_RDS     = 10;
inline constexpr std::uint64_t DEMO_SEED        = 32;

// =====================
// JSON keys
// =====================
inline constexpr const char* KEY_PARALLEL     = "parallel";
inline constexpr const char* KEY_SIMULATIONS  = "simulations";
inline constexpr const char* KEY_ADJACENCY    = "graph_adjacency";
inline constexpr const char* KEY_PROTOCOL     = "protocol";
inline constexpr const char* KEY_ADVERSARY    = "adversary";
inline constexpr const char* KEY_THRESHOLD    = "threshold";
inline constexpr const char* KEY_RECORDERS    = "recorders";
inline constexpr const char* KEY_OUTPUT_PATH  = "output_path";

inline constexpr const char* KEY_PROTOCOL_NAME  = "protocol_name";
inline constexpr const char* KEY_CAPACITY       = "capacity";
inline constexpr const char* KEY_ADVERSARY_NAME = "adversary_name";
inline constexpr const char* KEY_SEED           = "seed";
inline constexpr const char* KEY_INJECTIONS     = "injections";
inline constexpr const char* KEY_PATH           = "path";
inline constexpr const char* KEY_PATH_IDX       = "path_idx";
inline constexpr const char* KEY_THRESHOLD_NAME = "threshold_name";
inline constexpr const char* KEY_MAX_RDS        = "max_rds";
inline constexpr const char* KEY_MAX_LOAD       = "max_load";
inline constexpr const char* KEY_RECORDER_NAME  = "recorder_name";

} // namespace aqt::config::constants
