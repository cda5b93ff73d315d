/**
 * @file service_control.cpp
 * @brief Portable helpers for ServiceControl.
 */
#include "uplink/os/service_control.hpp"

namespace uplink::os {

std::string_view to_string(ServiceError e) noexcept {
    switch (e) {
        case ServiceError::InvalidName: return "invalid_name";
        case ServiceError::SpawnFailed: return "spawn_failed";
        case ServiceError::NonZeroExit: return "nonzero_exit";
        case ServiceError::Signalled:   return "signalled";
    }
    return "unknown";
}

} // namespace uplink::os
