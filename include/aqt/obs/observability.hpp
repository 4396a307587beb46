#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: simulation events + counters.
 * @details Backing implementation prints one nlohmann::json object per line;
 *          a null variant only counts.
 */

#include <cstdint>
#include <string>

namespace aqt::obs {

    /** @enum EventKind
     *  @brief What a SimEvent reports.
     */
    enum class EventKind : std::uint8_t {
        SimStarted,   ///< Simulation constructed and about to run
        Injection,    ///< Adversary injected a packet
        RoundDone,    ///< Forwarding finished for a round
        SimFinished,  ///< Threshold stopped the run
        Warning       ///< Non-fatal problem (I/O, config save)
    };

    /// Label used in the JSON line ("sim_started", ...).
    const char* to_string(EventKind k) noexcept;

    /** @struct Counters
     *  @brief Process-level counters across all simulations on this observer.
     */
    struct Counters {
        uint64_t simulations{0}; ///< SimStarted events
        uint64_t injections{0};  ///< Injection events
        uint64_t rounds{0};      ///< RoundDone events
        uint64_t absorbed{0};    ///< Sum of RoundDone.absorbed
        uint64_t warnings{0};    ///< Warning events
    };

    /** @struct SimEvent
     *  @brief Payload describing one simulation event.
     */
    struct SimEvent {
        std::string sim_id;        ///< Caller-provided label (output path or index)
        uint64_t    round{0};      ///< Round the event belongs to (0 = none)
        EventKind   kind{EventKind::RoundDone};
        uint64_t    absorbed{0};   ///< Packets absorbed this round (RoundDone)
        uint64_t    load{0};       ///< Total network load after the event
        std::string detail;        ///< Free text for humans/logs
    };

    /** @class Observer
     *  @brief Observability sink interface. Implementations are thread-safe.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single simulation event.
        virtual void record(const SimEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /// Process-wide printf-backed observer (JSON line per event on stdout).
    Observer* make_simple_observer();

    /// Process-wide observer that counts but prints nothing.
    Observer* make_null_observer();

} // namespace aqt::obs
