/**
* @file observability.cpp
 * @brief Basic printf-backed implementation of Observer.
 */
#include "uplink/obs/observability.hpp"

namespace uplink::obs {

    std::string_view to_string(EventKind k) noexcept {
        switch (k) {
            case EventKind::Cycle:          return "cycle";
            case EventKind::Failover:       return "failover";
            case EventKind::Failback:       return "failback";
            case EventKind::ForcedFailback: return "forced_failback";
            case EventKind::BothDown:       return "both_down";
            case EventKind::RouteError:     return "route_error";
            case EventKind::RestartError:   return "restart_error";
        }
        return "unknown";
    }

    void SimpleObserver::record(const DecisionEvent& e) {
        std::lock_guard<std::mutex> lk(mu_);
        switch (e.kind) {
            case EventKind::Cycle:          ctr_.cycles++; break;
            case EventKind::Failover:       ctr_.failovers++; break;
            case EventKind::Failback:       ctr_.failbacks++; break;
            case EventKind::ForcedFailback: ctr_.forced_failbacks++; break;
            case EventKind::BothDown:       ctr_.both_down++; break;
            case EventKind::RouteError:     ctr_.route_errors++; break;
            case EventKind::RestartError:   ctr_.restart_errors++; break;
        }
        if (out_ == nullptr || e.kind == EventKind::Cycle) return;

        // JSON-ish line (swap for structured logger later)
        const auto kind  = to_string(e.kind);
        const auto state = failover::to_string(e.state);
        std::fprintf(out_,
          R"({"cycle":%llu,"event":"%.*s","state":"%.*s","primary_failures":%u,"secondary_failures":%u,"gateway":"%s","reason":"%s"})" "\n",
          static_cast<unsigned long long>(e.cycle),
          static_cast<int>(kind.size()), kind.data(),
          static_cast<int>(state.size()), state.data(),
          e.primary_failures, e.secondary_failures,
          e.gateway.c_str(), e.reason.c_str());
        std::fflush(out_);
    }

    Counters SimpleObserver::snapshot() const {
        std::lock_guard<std::mutex> lk(mu_);
        return ctr_;
    }

    Observer* make_simple_observer() {
        static SimpleObserver obs; // process-wide singleton
        return &obs;
    }

} // namespace uplink::obs
