#include "aqt/sim/threshold.hpp"

namespace aqt::sim {

const char* to_string(ThresholdKind kind) noexcept {
    switch (kind) {
        case ThresholdKind::Timed:     return TimedThreshold::kName;
        case ThresholdKind::TotalLoad: return TotalLoadThreshold::kName;
    }
    return "unknown";
}

std::optional<ThresholdKind> parse_threshold_kind(std::string_view name) noexcept {
    if (name == TimedThreshold::kName)     return ThresholdKind::Timed;
    if (name == TotalLoadThreshold::kName) return ThresholdKind::TotalLoad;
    return std::nullopt;
}

} // namespace aqt::sim
