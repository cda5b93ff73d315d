/**
 * @file status_sink.cpp
 * @brief File-backed StatusSink (write temp + rename).
 */
#include "uplink/obs/status_sink.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

namespace uplink::obs {

namespace fs = std::filesystem;

void FileStatusSink::publish(failover::Role role, std::uint32_t unreachable) {
    const std::string& target = path(role);
    const std::string tmp = target + ".tmp";

    {
        std::ofstream out(tmp, std::ios::out | std::ios::trunc);
        out << unreachable << '\n';
        out.close();
        if (!out) {
            log_.warn("Failed to write status file " + tmp);
            return;
        }
    }

    std::error_code ec;
    fs::rename(tmp, target, ec);
    if (ec) {
        log_.warn("Failed to publish status file " + target + ": " + ec.message());
        fs::remove(tmp, ec);
    }
}

void FileStatusSink::clear() {
    for (const auto* p : {&primary_path_, &secondary_path_}) {
        std::error_code ec;
        fs::remove(*p, ec); // absent already is fine
        if (ec) log_.warn("Failed to remove status file " + *p + ": " + ec.message());
    }
}

} // namespace uplink::obs
