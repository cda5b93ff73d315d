#pragma once
/**
 * @file status_sink.hpp
 * @brief Per-uplink unreachable counts handed to an external collector.
 * @details Two slots, one per role, rewritten every probe cycle. Their
 *          absence tells the collector that the router is in standby
 *          (no address on either uplink).
 */

#include <cstdint>
#include <string>
#include <utility>

#include "uplink/failover/uplink.hpp"
#include "uplink/obs/log.hpp"

namespace uplink::obs {

/** @class StatusSink
 *  @brief Monitoring handoff seam.
 */
class StatusSink {
public:
    virtual ~StatusSink() = default;

    /// Publish the unreachable count for @p role.
    virtual void publish(failover::Role role, std::uint32_t unreachable) = 0;

    /// Remove both slots.
    virtual void clear() = 0;
};

/** @class FileStatusSink
 *  @brief One decimal file per uplink (e.g. /tmp/wan1_status), replaced atomically.
 *
 * Filesystem errors are logged at WARN and otherwise ignored: monitoring is
 * never allowed to stall failover.
 */
class FileStatusSink final : public StatusSink {
public:
    FileStatusSink(std::string primary_path, std::string secondary_path, Logger& log)
        : primary_path_(std::move(primary_path)), secondary_path_(std::move(secondary_path)), log_(log) {}

    void publish(failover::Role role, std::uint32_t unreachable) override;
    void clear() override;

    const std::string& path(failover::Role role) const noexcept {
        return role == failover::Role::Primary ? primary_path_ : secondary_path_;
    }

private:
    std::string primary_path_;
    std::string secondary_path_;
    Logger& log_;
};

} // namespace uplink::obs
