#pragma once
/**
 * @file sleeper.hpp
 * @brief Interruptible end-of-cycle sleep.
 */

#include <chrono>
#include <stop_token>

namespace uplink::os {

/** @class Sleeper
 *  @brief Sleep seam so tests can observe the chosen interval without waiting.
 */
class Sleeper {
public:
    virtual ~Sleeper() = default;

    /// Block for @p d or until @p stop is requested, whichever comes first.
    virtual void sleep_for(std::chrono::seconds d, std::stop_token stop) = 0;
};

/// condition_variable_any based sleeper woken by the stop token.
class StopTokenSleeper final : public Sleeper {
public:
    void sleep_for(std::chrono::seconds d, std::stop_token stop) override;
};

} // namespace uplink::os
