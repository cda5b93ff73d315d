#pragma once
/**
 * @file config_loader.hpp
 * @brief Loader facade: named defaults overlaid by command-line flags.
 * @details All defaults reference named constants to avoid magic numbers.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include "uplink/compat/expected.hpp"
#include "uplink/config/constants.hpp"
#include "uplink/net/ipv4.hpp"
#include "uplink/obs/log.hpp"
#include "uplink/probe/pinger.hpp"

namespace uplink::config {

    /** @struct FailoverSettings
     *  @brief Aggregate of everything the daemon needs to run.
     */
    struct FailoverSettings {
        std::string   primary_iface{constants::PRIMARY_INTERFACE};     ///< WAN1
        std::string   secondary_iface{constants::SECONDARY_INTERFACE}; ///< WAN2
        std::uint32_t failover_metric{constants::FAILOVER_ROUTE_METRIC};
        std::uint32_t failure_threshold{constants::FAILURE_THRESHOLD};

        probe::PingParams              ping{};     ///< Attempts/timeout per target
        std::vector<net::Ipv4Address>  targets;    ///< Probe set (filled by Loader)

        std::chrono::seconds check_interval{constants::CHECK_INTERVAL_S};
        std::chrono::seconds standby_interval{constants::STANDBY_INTERVAL_S};

        std::string status_dir{constants::STATUS_DIR};
        std::string primary_status_file{constants::PRIMARY_STATUS_FILE};
        std::string secondary_status_file{constants::SECONDARY_STATUS_FILE};

        std::string tunnel_service{constants::TUNNEL_SERVICE}; ///< Empty disables the restart
        std::string init_dir{constants::INIT_SCRIPT_DIR};

        obs::Severity log_level{obs::Severity::Info};
    };

    /// Result codes for configuration loading.
    enum class ConfigError : std::uint8_t {
        UnknownFlag = 1,  ///< Flag not recognized
        MissingValue,     ///< Flag given without its value
        InvalidNumber,    ///< Not a decimal number in range
        InvalidAddress,   ///< Not a dotted-quad IPv4 address
        InvalidSeverity,  ///< Not one of DEBUG/INFO/WARN/ERROR
        InvalidValue,     ///< Value parsed but violates a constraint
        HelpRequested     ///< --help; caller prints usage and exits 0
    };

    std::string_view to_string(ConfigError e) noexcept;

    /** @struct ConfigIssue
     *  @brief Error code plus the offending flag/value for the message.
     */
    struct ConfigIssue {
        ConfigError code{ConfigError::InvalidValue};
        std::string detail;
    };

    /** @class Loader
     *  @brief Source of daemon configuration.
     */
    class Loader {
    public:
        /// Defaults from constants.hpp, including the reference probe targets.
        static FailoverSettings defaults();

        /**
         * @brief Parse flags over defaults() and validate the result.
         * @param argc,argv As passed to main (argv[0] is skipped).
         */
        static uplink_detail::expected<FailoverSettings, ConfigIssue>
        from_args(int argc, const char* const* argv);

        /// Check cross-field constraints (distinct interfaces, nonzero intervals, ...).
        static uplink_detail::expected<void, ConfigIssue> validate(const FailoverSettings& s);

        /// Help text listing every flag.
        static std::string usage(std::string_view prog);
    };

} // namespace uplink::config
