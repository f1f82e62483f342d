#include <statuscast/status/HeartbeatConfig.hpp>

#include <string>

namespace SC {

auto HeartbeatConfig::Create(std::chrono::milliseconds interval) -> Expected<HeartbeatConfig> {
    if (interval.count() <= 0) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration,
                                     "heartbeat interval must be positive, got "
                                         + std::to_string(interval.count()) + "ms"});
    }
    if (interval > std::chrono::seconds{kMaxIntervalSeconds}) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "heartbeat interval is too large"});
    }
    return HeartbeatConfig{interval};
}

auto HeartbeatConfig::FromSeconds(long long seconds) -> Expected<HeartbeatConfig> {
    if (seconds <= 0) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration,
                                     "heartbeat interval must be positive, got "
                                         + std::to_string(seconds) + "s"});
    }
    if (seconds > kMaxIntervalSeconds) {
        return std::unexpected(Error{Error::Code::InvalidConfiguration, "heartbeat interval is too large"});
    }
    return HeartbeatConfig{std::chrono::seconds{seconds}};
}

} // namespace SC
