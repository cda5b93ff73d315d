#include "uplink/net/route_table.hpp"

namespace uplink::net {

std::string_view to_string(NetError e) noexcept {
    switch (e) {
        case NetError::SocketFailed:     return "socket_failed";
        case NetError::QueryFailed:      return "query_failed";
        case NetError::UnknownInterface: return "unknown_interface";
        case NetError::Exists:           return "exists";
        case NetError::NotFound:         return "not_found";
        case NetError::Rejected:         return "rejected";
        case NetError::AllocationFailed: return "allocation_failed";
    }
    return "unknown";
}

} // namespace uplink::net
