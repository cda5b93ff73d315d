#pragma once
/**
 * @file failover_policy.hpp
 * @brief Failover/failback decision with asymmetric hysteresis.
 * @details Fail over once the primary counter reaches the threshold and the
 *          secondary is still below it. Fail back only when the primary
 *          counter is exactly zero. The default threshold is named in
 *          constants.hpp to avoid magic numbers.
 */

#include <cstdint>
#include <string_view>
#include "uplink/config/constants.hpp"
#include "uplink/failover/uplink.hpp"

namespace uplink::failover {

/** @enum Action
 *  @brief Route change requested by the policy.
 */
enum class Action : std::uint8_t { Keep, SwitchToSecondary, SwitchToPrimary };

/** @enum Reason
 *  @brief Why the policy chose its action.
 */
enum class Reason : std::uint8_t {
    Steady,            ///< Nothing crossed a threshold
    PrimaryDown,       ///< Primary at threshold, secondary healthy
    BothDown,          ///< Both at threshold; switching has no value
    PrimaryRecovered,  ///< On secondary, primary counter back to zero
    PrimaryStillDown   ///< On secondary, primary counter nonzero
};

std::string_view to_string(Action a) noexcept;
std::string_view to_string(Reason r) noexcept;

/** @struct PolicyConfig
 *  @brief Configuration for failover hysteresis.
 */
struct PolicyConfig {
    uint32_t failure_threshold{config::constants::FAILURE_THRESHOLD}; ///< Counter value meaning "down"
};

/** @struct FailoverDecision
 *  @brief Result of a failover evaluation.
 */
struct FailoverDecision {
    Action action{Action::Keep};
    Reason reason{Reason::Steady};

    bool operator==(const FailoverDecision&) const = default;
};

/** @class FailoverPolicy
 *  @brief Decides whether to move the default route between uplinks.
 */
class FailoverPolicy {
public:
    /// Construct with configuration.
    explicit FailoverPolicy(PolicyConfig cfg) noexcept : cfg_(cfg) {}

    /**
     * @brief Evaluate the need to switch from the current uplink.
     * @param state Route ownership derived this cycle (NoLink yields Keep).
     * @param primary_failures Primary consecutive-failure counter.
     * @param secondary_failures Secondary consecutive-failure counter.
     */
    [[nodiscard]] FailoverDecision evaluate(RouteState state,
                                            uint32_t primary_failures,
                                            uint32_t secondary_failures) const noexcept;

    /// @return Current configuration (by const reference).
    const PolicyConfig& config() const noexcept { return cfg_; }

private:
    PolicyConfig cfg_{}; ///< Policy configuration
};

} // namespace uplink::failover
