/**
* @file config_loader.cpp
 * @brief Defaults from named constants plus a small flag parser.
 */
#include "uplink/config/config_loader.hpp"
#include "uplink/config/constants.hpp"

#include <charconv>

namespace uplink::config {
    using namespace uplink::config::constants;

    namespace {

        using Issue = uplink_detail::unexpected<ConfigIssue>;

        bool parse_u32(std::string_view text, std::uint32_t& out) {
            if (text.empty()) return false;
            const auto* first = text.data();
            const auto* last  = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(first, last, out);
            return ec == std::errc{} && ptr == last;
        }

        constexpr std::string_view kValueFlags[] = {
            "--primary", "--secondary", "--metric", "--threshold", "--ping-count",
            "--ping-timeout-ms", "--interval", "--standby-interval", "--target",
            "--status-dir", "--tunnel-service", "--init-dir", "--log-level"
        };

        bool takes_value(std::string_view flag) {
            for (auto f : kValueFlags) if (f == flag) return true;
            return false;
        }

        std::vector<net::Ipv4Address> default_targets() {
            std::vector<net::Ipv4Address> out;
            out.reserve(PROBE_TARGETS.size());
            for (auto t : PROBE_TARGETS) {
                if (auto a = net::parse_ipv4(t)) out.push_back(*a);
            }
            return out;
        }

    } // namespace

    std::string_view to_string(ConfigError e) noexcept {
        switch (e) {
            case ConfigError::UnknownFlag:     return "unknown flag";
            case ConfigError::MissingValue:    return "missing value";
            case ConfigError::InvalidNumber:   return "invalid number";
            case ConfigError::InvalidAddress:  return "invalid IPv4 address";
            case ConfigError::InvalidSeverity: return "invalid log level";
            case ConfigError::InvalidValue:    return "invalid value";
            case ConfigError::HelpRequested:   return "help requested";
        }
        return "unknown";
    }

    FailoverSettings Loader::defaults() {
        FailoverSettings s;
        s.targets = default_targets();
        s.log_level = obs::parse_severity(LOG_LEVEL).value_or(obs::Severity::Info);
        return s;
    }

    uplink_detail::expected<FailoverSettings, ConfigIssue>
    Loader::from_args(int argc, const char* const* argv) {
        FailoverSettings s = defaults();
        std::vector<net::Ipv4Address> targets;

        for (int i = 1; i < argc; ++i) {
            const std::string_view flag = argv[i];
            if (flag == "-h" || flag == "--help") {
                return Issue(ConfigIssue{ConfigError::HelpRequested, {}});
            }
            if (!takes_value(flag)) {
                return Issue(ConfigIssue{ConfigError::UnknownFlag, std::string(flag)});
            }
            if (i + 1 >= argc) {
                return Issue(ConfigIssue{ConfigError::MissingValue, std::string(flag)});
            }
            const std::string_view value = argv[++i];
            const auto bad = [&](ConfigError code) {
                return Issue(ConfigIssue{code, std::string(flag) + " " + std::string(value)});
            };

            std::uint32_t n = 0;
            if (flag == "--primary") {
                s.primary_iface = value;
            } else if (flag == "--secondary") {
                s.secondary_iface = value;
            } else if (flag == "--metric") {
                if (!parse_u32(value, n)) return bad(ConfigError::InvalidNumber);
                s.failover_metric = n;
            } else if (flag == "--threshold") {
                if (!parse_u32(value, n)) return bad(ConfigError::InvalidNumber);
                s.failure_threshold = n;
            } else if (flag == "--ping-count") {
                if (!parse_u32(value, n)) return bad(ConfigError::InvalidNumber);
                s.ping.attempts = n;
            } else if (flag == "--ping-timeout-ms") {
                if (!parse_u32(value, n)) return bad(ConfigError::InvalidNumber);
                s.ping.timeout = std::chrono::milliseconds(n);
            } else if (flag == "--interval") {
                if (!parse_u32(value, n)) return bad(ConfigError::InvalidNumber);
                s.check_interval = std::chrono::seconds(n);
            } else if (flag == "--standby-interval") {
                if (!parse_u32(value, n)) return bad(ConfigError::InvalidNumber);
                s.standby_interval = std::chrono::seconds(n);
            } else if (flag == "--target") {
                auto a = net::parse_ipv4(value);
                if (!a) return bad(ConfigError::InvalidAddress);
                targets.push_back(*a);
            } else if (flag == "--status-dir") {
                s.status_dir = value;
            } else if (flag == "--tunnel-service") {
                s.tunnel_service = value;
            } else if (flag == "--init-dir") {
                s.init_dir = value;
            } else if (flag == "--log-level") {
                auto lvl = obs::parse_severity(value);
                if (!lvl) return bad(ConfigError::InvalidSeverity);
                s.log_level = *lvl;
            }
        }

        if (!targets.empty()) s.targets = std::move(targets);

        if (auto ok = validate(s); !ok) return Issue(ok.error());
        return s;
    }

    uplink_detail::expected<void, ConfigIssue> Loader::validate(const FailoverSettings& s) {
        const auto bad = [](std::string detail) {
            return Issue(ConfigIssue{ConfigError::InvalidValue, std::move(detail)});
        };
        if (s.primary_iface.empty() || s.secondary_iface.empty()) return bad("interface names must not be empty");
        if (s.primary_iface == s.secondary_iface) return bad("primary and secondary must differ");
        if (s.failover_metric == 0) return bad("metric must be >= 1");
        if (s.failure_threshold == 0) return bad("threshold must be >= 1");
        if (s.ping.attempts == 0) return bad("ping count must be >= 1");
        if (s.ping.timeout.count() == 0) return bad("ping timeout must be >= 1 ms");
        if (s.check_interval.count() == 0 || s.standby_interval.count() == 0) return bad("intervals must be >= 1 s");
        if (s.targets.empty()) return bad("at least one probe target is required");
        if (s.status_dir.empty()) return bad("status directory must not be empty");
        return {};
    }

    std::string Loader::usage(std::string_view prog) {
        std::string u;
        u += "Usage: ";
        u += prog;
        u += " [options]\n"
             "  --primary IF            primary uplink interface (default eth0)\n"
             "  --secondary IF          secondary uplink interface (default eth1)\n"
             "  --metric N              metric of the failover route (default 5)\n"
             "  --threshold N           consecutive failed cycles before failover (default 3)\n"
             "  --ping-count N          echo attempts per target (default 3)\n"
             "  --ping-timeout-ms N     per-attempt timeout (default 2000)\n"
             "  --interval S            seconds between cycles (default 1)\n"
             "  --standby-interval S    seconds between cycles without link or gateway (default 15)\n"
             "  --target IP             probe target; repeat to replace the default set\n"
             "  --status-dir DIR        directory for wan1_status/wan2_status (default /tmp)\n"
             "  --tunnel-service NAME   init script restarted on failback (default tailscale)\n"
             "  --init-dir DIR          init script directory (default /etc/init.d)\n"
             "  --log-level LEVEL       DEBUG, INFO, WARN or ERROR (default INFO)\n"
             "  -h, --help              show this help\n";
        return u;
    }

} // namespace uplink::config
