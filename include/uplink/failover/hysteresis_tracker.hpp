#pragma once
/**
 * @file hysteresis_tracker.hpp
 * @brief Debounced consecutive-failure counters, one per uplink.
 * @details A cycle with more than one unreachable target is a failure and
 *          increments the counter (saturating at the threshold). A fully
 *          successful cycle resets it to zero at once. A single unreachable
 *          target leaves it untouched.
 */

#include <array>
#include <cstdint>
#include <string_view>

#include "uplink/config/constants.hpp"
#include "uplink/failover/uplink.hpp"

namespace uplink::failover {

/** @enum CounterChange
 *  @brief What one cycle did to a counter.
 */
enum class CounterChange : std::uint8_t {
    Unchanged,   ///< Clean cycle on a clean counter
    Noise,       ///< Partial loss below the failure floor; ignored
    Incremented, ///< Counted failure
    Saturated,   ///< Counted failure, already at threshold
    Reset        ///< Clean cycle cleared a nonzero counter
};

std::string_view to_string(CounterChange c) noexcept;

/** @struct CounterUpdate
 *  @brief Before/after view of one counter for one cycle.
 */
struct CounterUpdate {
    Role          role{Role::Primary};
    std::uint32_t previous{0};
    std::uint32_t current{0};
    CounterChange change{CounterChange::Unchanged};
};

/** @class HysteresisTracker
 *  @brief Per-role failure counters in [0, threshold].
 */
class HysteresisTracker {
public:
    /// @param threshold Counter ceiling; values below 1 are raised to 1.
    explicit HysteresisTracker(std::uint32_t threshold = config::constants::FAILURE_THRESHOLD) noexcept
        : threshold_(threshold == 0 ? 1 : threshold) {}

    /**
     * @brief Feed one probe result.
     * @param role Uplink the result belongs to.
     * @param unreachable Number of unreachable targets this cycle.
     */
    CounterUpdate record(Role role, std::uint32_t unreachable) noexcept;

    [[nodiscard]] std::uint32_t failures(Role role) const noexcept { return counters_[index(role)]; }
    [[nodiscard]] bool is_down(Role role) const noexcept { return failures(role) == threshold_; }
    [[nodiscard]] std::uint32_t threshold() const noexcept { return threshold_; }

private:
    static constexpr std::size_t index(Role r) noexcept { return static_cast<std::size_t>(r); }

    std::uint32_t threshold_;
    std::array<std::uint32_t, 2> counters_{};
};

} // namespace uplink::failover
