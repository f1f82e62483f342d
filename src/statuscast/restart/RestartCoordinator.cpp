#include <statuscast/restart/RestartCoordinator.hpp>

#include <statuscast/util/TimeUtils.hpp>

#include "log/TaggedLogger.hpp"

#include <exception>
#include <string>
#include <system_error>
#include <utility>

namespace SC {

namespace {

auto failure_message(Error const& error) -> std::string {
    auto message = errorMessageOr(error, std::string{errorCodeToString(error.code)});
    if (error.code == Error::Code::ExternalOrchestrationFailure) {
        return message;
    }
    return "restart failed: " + message;
}

} // namespace

auto restart_outcome_name(RestartOutcome outcome) -> std::string_view {
    switch (outcome) {
    case RestartOutcome::Succeeded:
        return "succeeded";
    case RestartOutcome::Failed:
        return "failed";
    case RestartOutcome::TimedOut:
        return "timed_out";
    }
    return "failed";
}

RestartCoordinator::RestartCoordinator(ChannelRegistry& registry, OrchestrationClient& client, RestartCoordinatorOptions options)
    : registry_{registry}
    , client_{client}
    , options_{std::move(options)} {}

RestartCoordinator::~RestartCoordinator() {
    std::map<std::uint64_t, std::thread> watchers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        watchers = std::move(watchers_);
        watchers_.clear();
    }
    for (auto& [id, watcher] : watchers) {
        if (watcher.joinable()) {
            watcher.join();
        }
    }
}

auto RestartCoordinator::request_restart(ResourceKey const& key, DeploymentRef const& target) -> RestartDecision {
    std::vector<std::thread> finished;
    std::uint64_t            job_id   = 0;
    bool                     rejected = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        finished = take_finished_locked();
        if (jobs_.contains(key)) {
            rejected = true;
        } else {
            job_id = next_job_id_++;
            jobs_.emplace(key, RestartJob{job_id, target, std::chrono::steady_clock::now()});
        }
    }
    for (auto& thread : finished) {
        thread.join();
    }
    if (rejected) {
        sc_log("Restart already in progress for " + key.to_string(), "Restart", "INFO");
        return RestartDecision::RejectedInProgress;
    }

    sc_log("Scheduling restart for " + key.to_string() + " (" + target.describe() + ")", "Restart", "INFO");
    registry_.get_or_create(key)->publish(StatusPayload::Restarting());

    // The watcher cannot record completion until it is stored, since finish_job takes the same lock.
    std::lock_guard<std::mutex> lock(mutex_);
    try {
        watchers_.emplace(job_id, std::thread(&RestartCoordinator::run_watcher, this, key, target, job_id));
    } catch (std::system_error const& ex) {
        jobs_.erase(key);
        idle_cv_.notify_all();
        registry_.get_or_create(key)->publish(
            StatusPayload::Failure(std::string{"restart failed: "} + ex.what()));
    }
    return RestartDecision::Accepted;
}

void RestartCoordinator::run_watcher(ResourceKey key, DeploymentRef target, std::uint64_t job_id) {
    RolloutResult result{RestartOutcome::Failed, StatusPayload::Failure("restart failed")};
    try {
        result = drive_rollout(target);
    } catch (std::exception const& ex) {
        result = RolloutResult{RestartOutcome::Failed, StatusPayload::Failure(std::string{"restart failed: "} + ex.what())};
    }

    registry_.get_or_create(key)->publish(result.state);

    switch (result.outcome) {
    case RestartOutcome::Succeeded:
        sc_log("Restart completed for " + target.describe(), "Restart", "INFO");
        break;
    case RestartOutcome::Failed:
        sc_log("Restart error for " + target.describe() + ": " + result.state.message().value_or(""), "Restart", "ERROR");
        break;
    case RestartOutcome::TimedOut:
        sc_log("Restart timed out for " + target.describe() + " after "
                   + std::to_string(options_.timeout.count()) + "ms",
               "Restart", "ERROR");
        break;
    }
    if (options_.on_outcome) {
        options_.on_outcome(key, result.outcome);
    }
    finish_job(key, job_id);
}

auto RestartCoordinator::drive_rollout(DeploymentRef const& target) -> RolloutResult {
    auto generation = client_.trigger_restart(target);
    if (!generation) {
        return {RestartOutcome::Failed, StatusPayload::Failure(failure_message(generation.error()))};
    }

    auto const deadline = saturating_deadline(std::chrono::steady_clock::now(), options_.timeout);
    auto       watch    = client_.watch_rollout(target, *generation);
    if (!watch) {
        return {RestartOutcome::Failed, StatusPayload::Failure(failure_message(watch.error()))};
    }

    while (std::chrono::steady_clock::now() < deadline) {
        auto signal = (*watch)->next(deadline);
        if (!signal) {
            return {RestartOutcome::Failed, StatusPayload::Failure(failure_message(signal.error()))};
        }
        if (!signal->has_value()) {
            break;
        }
        switch ((*signal)->kind) {
        case RolloutSignalKind::Ready:
            return {RestartOutcome::Succeeded, StatusPayload::Running()};
        case RolloutSignalKind::Failed:
            return {RestartOutcome::Failed, StatusPayload::Failure(std::move((*signal)->message))};
        case RolloutSignalKind::NotReady:
            break;
        }
    }
    return {RestartOutcome::TimedOut, StatusPayload::Failure("timeout")};
}

void RestartCoordinator::finish_job(ResourceKey const& key, std::uint64_t job_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto                        it = jobs_.find(key);
    if (it != jobs_.end() && it->second.id == job_id) {
        jobs_.erase(it);
    }
    finished_.push_back(job_id);
    idle_cv_.notify_all();
}

auto RestartCoordinator::take_finished_locked() -> std::vector<std::thread> {
    std::vector<std::thread> threads;
    std::vector<std::uint64_t> pending;
    for (auto id : finished_) {
        auto it = watchers_.find(id);
        if (it == watchers_.end()) {
            pending.push_back(id);
            continue;
        }
        threads.push_back(std::move(it->second));
        watchers_.erase(it);
    }
    finished_ = std::move(pending);
    return threads;
}

auto RestartCoordinator::in_flight(ResourceKey const& key) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.contains(key);
}

auto RestartCoordinator::in_flight_count() const -> std::size_t {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

auto RestartCoordinator::wait_until_idle(std::chrono::milliseconds timeout) const -> bool {
    std::unique_lock<std::mutex> lock(mutex_);
    return idle_cv_.wait_for(lock, timeout, [this] { return jobs_.empty(); });
}

} // namespace SC
