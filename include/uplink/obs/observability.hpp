#pragma once
/**
 * @file observability.hpp
 * @brief Minimal observability facade: decision events + counters.
 * @details Events go to a JSON-ish line sink; counters stay in process and
 *          are not persisted.
 */

#include <cstdint>
#include <cstdio>
#include <mutex>
#include <string>
#include <string_view>

#include "uplink/failover/uplink.hpp"

namespace uplink::obs {

    /** @struct Counters
     *  @brief Process-level counters for route decisions.
     */
    struct Counters {
        uint64_t cycles{0};            ///< Completed probe cycles
        uint64_t failovers{0};         ///< Failover routes installed
        uint64_t failbacks{0};         ///< Failover routes removed on recovery
        uint64_t forced_failbacks{0};  ///< Failbacks forced by a missing/malformed gateway
        uint64_t both_down{0};         ///< Cycles where both uplinks were at threshold
        uint64_t route_errors{0};      ///< Failed route add/delete attempts
        uint64_t restart_errors{0};    ///< Failed tunnel-service restarts

        bool operator==(const Counters&) const = default;
    };

    /** @enum EventKind
     *  @brief What happened to the route this cycle.
     */
    enum class EventKind : uint8_t {
        Cycle,          ///< A probe cycle reached its decision
        Failover,       ///< Route to secondary installed
        Failback,       ///< Route to secondary removed
        ForcedFailback, ///< Failback attempted because the gateway was unusable
        BothDown,       ///< Both uplinks down, route left alone
        RouteError,     ///< Route mutation rejected
        RestartError    ///< Tunnel-service restart failed
    };

    /** @struct DecisionEvent
     *  @brief Payload describing a single route decision.
     */
    struct DecisionEvent {
        uint64_t                  cycle{0};              ///< Orchestrator cycle number
        EventKind                 kind{EventKind::Cycle};
        failover::RouteState      state{failover::RouteState::PrimaryActive};
        uint32_t                  primary_failures{0};
        uint32_t                  secondary_failures{0};
        std::string               gateway;               ///< Secondary gateway, if known
        std::string               reason;                ///< Reason label (for humans/logs)
    };

    /** @class Observer
     *  @brief Observability sink interface.
     */
    class Observer {
    public:
        virtual ~Observer() = default;
        /// Record a single decision event.
        virtual void record(const DecisionEvent& e) = 0;
        /// Return a snapshot of counters.
        virtual Counters snapshot() const = 0;
    };

    /** @class SimpleObserver
     *  @brief Counts events and prints non-cycle events to @p out (nullptr: silent).
     */
    class SimpleObserver final : public Observer {
    public:
        explicit SimpleObserver(std::FILE* out = stdout) noexcept : out_(out) {}
        void record(const DecisionEvent& e) override;
        Counters snapshot() const override;
    private:
        mutable std::mutex mu_;
        Counters ctr_;
        std::FILE* out_;
    };

    std::string_view to_string(EventKind k) noexcept;

    /// Process-wide stdout observer.
    Observer* make_simple_observer();

} // namespace uplink::obs
