#pragma once
/**
 * @file threshold.hpp
 * @brief Termination predicates polled after injection and after forwarding.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>
#include <variant>

#include "aqt/net/buffer_network.hpp"

namespace aqt::sim {

/// Stop once the round counter reaches max_rds.
class TimedThreshold final {
public:
    static constexpr const char* kName = "timed";

    explicit TimedThreshold(net::Round max_rds) noexcept : max_rds_(max_rds) {}

    [[nodiscard]] bool should_stop(net::Round rd, const net::BufferNetwork&) const noexcept {
        return rd >= max_rds_;
    }
    [[nodiscard]] net::Round max_rds() const noexcept { return max_rds_; }

private:
    net::Round max_rds_;
};

/// Stop once the total number of buffered packets reaches max_load.
class TotalLoadThreshold final {
public:
    static constexpr const char* kName = "total_load";

    explicit TotalLoadThreshold(std::size_t max_load) noexcept : max_load_(max_load) {}

    [[nodiscard]] bool should_stop(net::Round, const net::BufferNetwork& network) const noexcept {
        return network.total_load() >= max_load_;
    }
    [[nodiscard]] std::size_t max_load() const noexcept { return max_load_; }

private:
    std::size_t max_load_;
};

enum class ThresholdKind : std::uint8_t {
    Timed = 0, ///< "timed"
    TotalLoad  ///< "total_load"
};

[[nodiscard]] const char* to_string(ThresholdKind kind) noexcept;
[[nodiscard]] std::optional<ThresholdKind> parse_threshold_kind(std::string_view name) noexcept;

/** @class Threshold
 *  @brief Closed sum type over the termination predicates.
 */
class Threshold final {
public:
    using Variant = std::variant<TimedThreshold, TotalLoadThreshold>;

    Threshold(TimedThreshold t) : impl_(t) {}
    Threshold(TotalLoadThreshold t) : impl_(t) {}

    /// Poll the predicate for round @p rd and the current network state.
    [[nodiscard]] bool should_stop(net::Round rd, const net::BufferNetwork& network) const noexcept {
        return std::visit([&](const auto& t) { return t.should_stop(rd, network); }, impl_);
    }

    [[nodiscard]] ThresholdKind kind() const noexcept { return static_cast<ThresholdKind>(impl_.index()); }
    [[nodiscard]] const char*   name() const noexcept { return to_string(kind()); }

    [[nodiscard]] const Variant& variant() const noexcept { return impl_; }

private:
    Variant impl_;
};

} // namespace aqt::sim
