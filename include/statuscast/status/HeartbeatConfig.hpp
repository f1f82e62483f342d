#pragma once

#include <statuscast/core/Error.hpp>

#include <chrono>
#include <cstdint>

namespace SC {

// Strictly positive idle interval after which a subscription yields a heartbeat.
class HeartbeatConfig {
public:
    // Longest interval that can still be added to a steady_clock time point.
    static constexpr std::int64_t kMaxIntervalSeconds =
        std::chrono::duration_cast<std::chrono::seconds>(std::chrono::steady_clock::duration::max()).count() / 4;

    static auto Create(std::chrono::milliseconds interval) -> Expected<HeartbeatConfig>;
    static auto FromSeconds(long long seconds) -> Expected<HeartbeatConfig>;

    [[nodiscard]] auto interval() const -> std::chrono::milliseconds { return interval_; }

private:
    explicit HeartbeatConfig(std::chrono::milliseconds interval)
        : interval_{interval} {}

    std::chrono::milliseconds interval_;
};

} // namespace SC
