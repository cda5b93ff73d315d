/**
 * @file failover_policy.cpp
 * @brief Implementation of FailoverPolicy and helpers.
 */
#include "uplink/failover/failover_policy.hpp"

namespace uplink::failover {

std::string_view to_string(Action a) noexcept {
    switch (a) {
        case Action::Keep:              return "keep";
        case Action::SwitchToSecondary: return "switch_to_secondary";
        case Action::SwitchToPrimary:   return "switch_to_primary";
    }
    return "unknown";
}

std::string_view to_string(Reason r) noexcept {
    switch (r) {
        case Reason::Steady:           return "steady";
        case Reason::PrimaryDown:      return "primary_down";
        case Reason::BothDown:         return "both_down";
        case Reason::PrimaryRecovered: return "primary_recovered";
        case Reason::PrimaryStillDown: return "primary_still_down";
    }
    return "unknown";
}

FailoverDecision FailoverPolicy::evaluate(RouteState state,
                                          uint32_t primary_failures,
                                          uint32_t secondary_failures) const noexcept {
    const uint32_t threshold = cfg_.failure_threshold;

    if (state == RouteState::PrimaryActive) {
        if (primary_failures >= threshold) {
            if (secondary_failures < threshold) {
                return {Action::SwitchToSecondary, Reason::PrimaryDown};
            }
            return {Action::Keep, Reason::BothDown};
        }
        return {};
    }

    if (state == RouteState::SecondaryActive) {
        // Strict: a single counted failure still in memory blocks failback.
        if (primary_failures == 0) {
            return {Action::SwitchToPrimary, Reason::PrimaryRecovered};
        }
        return {Action::Keep, Reason::PrimaryStillDown};
    }

    return {}; // NoLink: nothing to decide
}

} // namespace uplink::failover
