/**
 * @file log.cpp
 * @brief printf-backed stdout Logger.
 */
#include "uplink/obs/log.hpp"

#include <cstdio>
#include <mutex>

namespace uplink::obs {

std::string_view to_string(Severity s) noexcept {
    switch (s) {
        case Severity::Debug: return "DEBUG";
        case Severity::Info:  return "INFO";
        case Severity::Warn:  return "WARN";
        case Severity::Error: return "ERROR";
    }
    return "UNKNOWN";
}

std::optional<Severity> parse_severity(std::string_view name) noexcept {
    if (name == "DEBUG") return Severity::Debug;
    if (name == "INFO")  return Severity::Info;
    if (name == "WARN")  return Severity::Warn;
    if (name == "ERROR") return Severity::Error;
    return std::nullopt;
}

namespace {

class StdoutLogger final : public Logger {
protected:
    void write(Severity s, std::string_view msg) override {
        const auto level = to_string(s);
        std::lock_guard<std::mutex> lk(mu_);
        std::printf("[%.*s] %.*s\n",
                    static_cast<int>(level.size()), level.data(),
                    static_cast<int>(msg.size()), msg.data());
        std::fflush(stdout);
    }
private:
    std::mutex mu_;
};

} // namespace

Logger* make_stdout_logger() {
    static StdoutLogger log; // process-wide singleton
    return &log;
}

} // namespace uplink::obs
