#pragma once
/**
 * @file log.hpp
 * @brief Severity-filtered line logger used by every component.
 * @details Severities are an ordered enum compared by rank; the only place a
 *          level is looked up by name is configuration parsing.
 */

#include <atomic>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace uplink::obs {

/** @enum Severity
 *  @brief Ordered log levels: Debug < Info < Warn < Error.
 */
enum class Severity : std::uint8_t { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Upper-case level name ("DEBUG", "INFO", "WARN", "ERROR").
std::string_view to_string(Severity s) noexcept;

/// Parse an upper-case level name. Unknown names yield std::nullopt.
std::optional<Severity> parse_severity(std::string_view name) noexcept;

/** @class Logger
 *  @brief Log sink interface with a minimum-severity threshold.
 *
 * Thread-safety: log() may be called concurrently (probe tasks log from
 * their own threads); implementations serialize write().
 */
class Logger {
public:
    virtual ~Logger() = default;

    /// Emit @p msg if @p s passes the threshold.
    void log(Severity s, std::string_view msg) {
        if (enabled(s)) write(s, msg);
    }

    void debug(std::string_view msg) { log(Severity::Debug, msg); }
    void info(std::string_view msg)  { log(Severity::Info, msg); }
    void warn(std::string_view msg)  { log(Severity::Warn, msg); }
    void error(std::string_view msg) { log(Severity::Error, msg); }

    [[nodiscard]] bool enabled(Severity s) const noexcept {
        return static_cast<std::uint8_t>(s) >=
               static_cast<std::uint8_t>(threshold_.load(std::memory_order_relaxed));
    }

    void set_threshold(Severity s) noexcept { threshold_.store(s, std::memory_order_relaxed); }
    [[nodiscard]] Severity threshold() const noexcept { return threshold_.load(std::memory_order_relaxed); }

protected:
    /// Backend hook; called only for messages that passed the threshold.
    virtual void write(Severity s, std::string_view msg) = 0;

private:
    std::atomic<Severity> threshold_{Severity::Info};
};

/// Process-wide stdout sink (`[LEVEL] message` per line).
Logger* make_stdout_logger();

} // namespace uplink::obs
