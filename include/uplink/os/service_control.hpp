#pragma once
/**
 * @file service_control.hpp
 * @brief Restart a dependent system service by name (init-script style).
 */

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

#include "uplink/compat/expected.hpp"

namespace uplink::os {

/// Result codes for service control.
enum class ServiceError : std::uint8_t {
    InvalidName = 1, ///< Empty name or contains '/'
    SpawnFailed,     ///< posix_spawn or waitpid failed
    NonZeroExit,     ///< Script ran and exited with a nonzero status
    Signalled        ///< Script was killed by a signal
};

std::string_view to_string(ServiceError e) noexcept;

/** @class ServiceControl
 *  @brief Service manager seam.
 */
class ServiceControl {
public:
    virtual ~ServiceControl() = default;

    /// Restart @p service and wait for the control script to finish.
    virtual uplink_detail::expected<void, ServiceError> restart(std::string_view service) = 0;
};

/** @class InitScriptServiceControl
 *  @brief Runs `<init_dir>/<service> restart` via posix_spawn, output discarded.
 */
class InitScriptServiceControl final : public ServiceControl {
public:
    explicit InitScriptServiceControl(std::string init_dir) : init_dir_(std::move(init_dir)) {}

    uplink_detail::expected<void, ServiceError> restart(std::string_view service) override;

private:
    std::string init_dir_;
};

} // namespace uplink::os
