#pragma once

#include <statuscast/restart/OrchestrationClient.hpp>
#include <statuscast/status/ChannelRegistry.hpp>
#include <statuscast/status/ResourceKey.hpp>
#include <statuscast/status/StatusPayload.hpp>

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <mutex>
#include <string_view>
#include <thread>
#include <vector>

#include <parallel_hashmap/phmap.h>

namespace SC {

enum class RestartDecision {
    Accepted,
    RejectedInProgress,
};

enum class RestartOutcome {
    Succeeded,
    Failed,
    TimedOut,
};

[[nodiscard]] auto restart_outcome_name(RestartOutcome outcome) -> std::string_view;

struct RestartCoordinatorOptions {
    std::chrono::milliseconds                                 timeout{std::chrono::seconds{180}};
    std::function<void(ResourceKey const&, RestartOutcome)> on_outcome;
};

/**
 * Runs at most one restart per resource key.
 *
 * An accepted request publishes Restarting on the key's channel before
 * returning, then hands the rollout to a dedicated watcher thread. The
 * watcher publishes exactly one terminal state (Running, or Error with a
 * diagnostic, or Error "timeout") and then clears the job so the key can be
 * restarted again. Watchers cannot be cancelled; the destructor waits for
 * them.
 */
class RestartCoordinator {
public:
    RestartCoordinator(ChannelRegistry& registry, OrchestrationClient& client, RestartCoordinatorOptions options = {});
    ~RestartCoordinator();

    RestartCoordinator(RestartCoordinator const&)            = delete;
    RestartCoordinator& operator=(RestartCoordinator const&) = delete;

    [[nodiscard]] auto request_restart(ResourceKey const& key, DeploymentRef const& target) -> RestartDecision;

    [[nodiscard]] auto in_flight(ResourceKey const& key) const -> bool;
    [[nodiscard]] auto in_flight_count() const -> std::size_t;
    auto               wait_until_idle(std::chrono::milliseconds timeout) const -> bool;

    [[nodiscard]] auto timeout() const -> std::chrono::milliseconds { return options_.timeout; }

private:
    struct RestartJob {
        std::uint64_t                         id;
        DeploymentRef                         target;
        std::chrono::steady_clock::time_point started_at;
    };

    struct RolloutResult {
        RestartOutcome outcome;
        StatusPayload  state;
    };

    void run_watcher(ResourceKey key, DeploymentRef target, std::uint64_t job_id);
    auto drive_rollout(DeploymentRef const& target) -> RolloutResult;
    void finish_job(ResourceKey const& key, std::uint64_t job_id);
    auto take_finished_locked() -> std::vector<std::thread>;

    ChannelRegistry&          registry_;
    OrchestrationClient&      client_;
    RestartCoordinatorOptions options_;

    mutable std::mutex                               mutex_;
    mutable std::condition_variable                  idle_cv_;
    phmap::flat_hash_map<ResourceKey, RestartJob> jobs_;
    std::map<std::uint64_t, std::thread>             watchers_;
    std::vector<std::uint64_t>                       finished_;
    std::uint64_t                                    next_job_id_ = 1;
};

} // namespace SC
