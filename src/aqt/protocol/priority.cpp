#include "aqt/protocol/priority.hpp"

namespace aqt::protocol {

std::optional<std::size_t> oldest_index(const net::Buffer& buf) noexcept {
    if (buf.empty()) return std::nullopt;
    std::size_t best = 0;
    for (std::size_t i = 1; i < buf.size(); ++i) {
        if (higher_priority(buf[i], buf[best])) best = i;
    }
    return best;
}

std::optional<std::size_t> youngest_index(const net::Buffer& buf) noexcept {
    if (buf.empty()) return std::nullopt;
    std::size_t worst = 0;
    for (std::size_t i = 1; i < buf.size(); ++i) {
        if (higher_priority(buf[worst], buf[i])) worst = i;
    }
    return worst;
}

std::optional<std::size_t> longest_in_system_index(const net::Buffer& buf) noexcept {
    if (buf.empty()) return std::nullopt;
    std::size_t best = 0;
    for (std::size_t i = 1; i < buf.size(); ++i) {
        // Strict: ties keep the first one found in scan order.
        if (buf[i].injection_round() < buf[best].injection_round()) best = i;
    }
    return best;
}

} // namespace aqt::protocol
