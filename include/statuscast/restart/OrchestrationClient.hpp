#pragma once

#include <statuscast/core/Error.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace SC {

struct DeploymentRef {
    std::string namespace_name;
    std::string deployment;

    auto operator==(DeploymentRef const&) const -> bool = default;

    [[nodiscard]] auto describe() const -> std::string {
        return "namespace=" + namespace_name + ", deployment=" + deployment;
    }
};

enum class RolloutSignalKind {
    Ready,
    NotReady,
    Failed,
};

struct RolloutSignal {
    RolloutSignalKind kind = RolloutSignalKind::NotReady;
    std::string       message;
};

/**
 * Progress stream for a single rollout.
 *
 * next() blocks until the next observation or until the deadline. It yields
 * std::nullopt when the stream has ended or the deadline passed without a new
 * observation, and an error when the orchestrator could not be reached.
 */
class RolloutWatch {
public:
    virtual ~RolloutWatch() = default;

    virtual auto next(std::chrono::steady_clock::time_point deadline) -> Expected<std::optional<RolloutSignal>> = 0;
};

/**
 * Seam between the restart coordinator and the system that actually restarts
 * workloads. trigger_restart returns the generation the rollout must reach.
 */
class OrchestrationClient {
public:
    virtual ~OrchestrationClient() = default;

    virtual auto trigger_restart(DeploymentRef const& target) -> Expected<std::int64_t> = 0;
    virtual auto watch_rollout(DeploymentRef const& target, std::int64_t target_generation)
        -> Expected<std::unique_ptr<RolloutWatch>> = 0;
};

} // namespace SC
