/**
 * @file test_config.cpp
 * @brief Tests for configuration defaults, flag parsing, validation and log levels.
 */
#include <gtest/gtest.h>
#include <chrono>
#include <vector>

#include "uplink/config/config_loader.hpp"
#include "uplink/obs/log.hpp"

using uplink::config::ConfigError;
using uplink::config::FailoverSettings;
using uplink::config::Loader;
using uplink::obs::Severity;
using uplink::obs::parse_severity;

namespace {

auto parse(std::vector<const char*> args) {
  args.insert(args.begin(), "uplinkd");
  return Loader::from_args(static_cast<int>(args.size()), args.data());
}

} // namespace

// ---------- defaults ----------

TEST(Config, Defaults) {
  const FailoverSettings s = Loader::defaults();
  EXPECT_EQ(s.primary_iface, "eth0");
  EXPECT_EQ(s.secondary_iface, "eth1");
  EXPECT_EQ(s.failover_metric, 5u);
  EXPECT_EQ(s.failure_threshold, 3u);
  EXPECT_EQ(s.ping.attempts, 3u);
  EXPECT_EQ(s.ping.timeout, std::chrono::milliseconds(2000));
  ASSERT_EQ(s.targets.size(), 3u);
  EXPECT_EQ(s.targets[0].to_string(), "1.1.1.1");
  EXPECT_EQ(s.targets[2].to_string(), "208.67.222.222");
  EXPECT_EQ(s.check_interval, std::chrono::seconds(1));
  EXPECT_EQ(s.standby_interval, std::chrono::seconds(15));
  EXPECT_EQ(s.tunnel_service, "tailscale");
  EXPECT_EQ(s.log_level, Severity::Info);
  EXPECT_TRUE(Loader::validate(s));
}

TEST(Config, NoArgs_GivesDefaults) {
  const auto s = parse({});
  ASSERT_TRUE(s);
  EXPECT_EQ(s->primary_iface, "eth0");
  EXPECT_EQ(s->targets.size(), 3u);
}

// ---------- flags ----------

TEST(Config, Flags_Override) {
  const auto s = parse({"--primary", "wan0", "--secondary", "lte0", "--metric", "50",
                        "--threshold", "5", "--interval", "2", "--standby-interval", "30",
                        "--log-level", "DEBUG", "--status-dir", "/run/uplink",
                        "--tunnel-service", "", "--ping-timeout-ms", "500"});
  ASSERT_TRUE(s) << s.error().detail;
  EXPECT_EQ(s->primary_iface, "wan0");
  EXPECT_EQ(s->secondary_iface, "lte0");
  EXPECT_EQ(s->failover_metric, 50u);
  EXPECT_EQ(s->failure_threshold, 5u);
  EXPECT_EQ(s->check_interval, std::chrono::seconds(2));
  EXPECT_EQ(s->standby_interval, std::chrono::seconds(30));
  EXPECT_EQ(s->log_level, Severity::Debug);
  EXPECT_EQ(s->status_dir, "/run/uplink");
  EXPECT_TRUE(s->tunnel_service.empty());
  EXPECT_EQ(s->ping.timeout, std::chrono::milliseconds(500));
}

/** @test Any --target replaces the whole default set. */
TEST(Config, Targets_ReplaceDefaults) {
  const auto s = parse({"--target", "9.9.9.9", "--target", "149.112.112.112"});
  ASSERT_TRUE(s);
  ASSERT_EQ(s->targets.size(), 2u);
  EXPECT_EQ(s->targets[1].to_string(), "149.112.112.112");
}

// ---------- errors ----------

/** @test An unknown log level is a fatal configuration error. */
TEST(Config, InvalidLogLevel) {
  const auto s = parse({"--log-level", "VERBOSE"});
  ASSERT_FALSE(s);
  EXPECT_EQ(s.error().code, ConfigError::InvalidSeverity);

  EXPECT_EQ(parse({"--log-level", "info"}).error().code, ConfigError::InvalidSeverity);
}

TEST(Config, ParseErrors) {
  EXPECT_EQ(parse({"--bogus"}).error().code, ConfigError::UnknownFlag);
  EXPECT_EQ(parse({"--metric"}).error().code, ConfigError::MissingValue);
  EXPECT_EQ(parse({"--metric", "five"}).error().code, ConfigError::InvalidNumber);
  EXPECT_EQ(parse({"--metric", "-1"}).error().code, ConfigError::InvalidNumber);
  EXPECT_EQ(parse({"--target", "1.2.3"}).error().code, ConfigError::InvalidAddress);
  EXPECT_EQ(parse({"--help"}).error().code, ConfigError::HelpRequested);
}

TEST(Config, Validate_RejectsInconsistentValues) {
  EXPECT_EQ(parse({"--secondary", "eth0"}).error().code, ConfigError::InvalidValue);
  EXPECT_EQ(parse({"--threshold", "0"}).error().code, ConfigError::InvalidValue);
  EXPECT_EQ(parse({"--metric", "0"}).error().code, ConfigError::InvalidValue);
  EXPECT_EQ(parse({"--interval", "0"}).error().code, ConfigError::InvalidValue);
  EXPECT_EQ(parse({"--status-dir", ""}).error().code, ConfigError::InvalidValue);
}

TEST(Config, UsageListsFlags) {
  const auto u = Loader::usage("uplinkd");
  EXPECT_NE(u.find("--log-level"), std::string::npos);
  EXPECT_NE(u.find("--target"), std::string::npos);
}

// ---------- log levels ----------

TEST(LogLevel, ParseAndFormat) {
  for (auto s : {Severity::Debug, Severity::Info, Severity::Warn, Severity::Error}) {
    EXPECT_EQ(parse_severity(to_string(s)), s);
  }
  EXPECT_FALSE(parse_severity("WARNING"));
  EXPECT_FALSE(parse_severity(""));
}
