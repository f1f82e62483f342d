#pragma once

#include <statuscast/restart/OrchestrationClient.hpp>

#include <cstdint>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace SC {

// Diagnostic when the Progressing condition reports a failed rollout for the target generation.
auto detect_rollout_failure(nlohmann::json const& deployment, std::int64_t target_generation)
    -> std::optional<std::string>;

// True once the controller observed the target generation and every desired replica is updated and ready.
auto deployment_ready(nlohmann::json const& deployment, std::int64_t target_generation) -> bool;

// Combines both checks; failure takes precedence over readiness.
auto evaluate_rollout(nlohmann::json const& deployment, std::int64_t target_generation) -> RolloutSignal;

} // namespace SC
