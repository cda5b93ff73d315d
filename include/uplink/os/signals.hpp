#pragma once
/**
 * @file signals.hpp
 * @brief Turn SIGINT/SIGTERM into a stop request.
 * @note Call block_termination_signals() before any thread is started so every
 *       thread inherits the mask and only the watcher consumes the signals.
 */

#include <atomic>
#include <stop_token>
#include <thread>

namespace uplink::os {

    /// @brief Block SIGINT and SIGTERM for the calling thread (and its future children).
    /// @return false if the mask could not be changed.
    bool block_termination_signals();

    /** @class SignalWatcher
     *  @brief Dedicated thread waiting in sigtimedwait(); requests stop on @p source.
     */
    class SignalWatcher {
    public:
        explicit SignalWatcher(std::stop_source source);
        ~SignalWatcher() = default; // jthread requests stop and joins

        SignalWatcher(const SignalWatcher&) = delete;
        SignalWatcher& operator=(const SignalWatcher&) = delete;

        /// Signal number that triggered the stop, or 0.
        [[nodiscard]] int received() const noexcept { return received_.load(std::memory_order_acquire); }

    private:
        void run(std::stop_token self, std::stop_source target);

        std::atomic<int> received_{0};
        std::jthread th_; ///< Declared last: started after the other members exist
    };

} // namespace uplink::os
