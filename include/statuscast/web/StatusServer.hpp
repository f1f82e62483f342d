#pragma once

#include <statuscast/core/Error.hpp>
#include <statuscast/restart/OrchestrationClient.hpp>
#include <statuscast/restart/RestartCoordinator.hpp>
#include <statuscast/status/ChannelRegistry.hpp>
#include <statuscast/status/HeartbeatConfig.hpp>
#include <statuscast/web/Metrics.hpp>
#include <statuscast/web/StatusServerOptions.hpp>
#include <statuscast/web/TabCatalog.hpp>
#include <statuscast/web/routing/HttpHelpers.hpp>

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string_view>
#include <thread>

namespace httplib {
class Server;
}

namespace SC {

class ConfigController;
class RestartController;
class StatusStreamController;

struct StatusServerLogHooks {
    std::function<void(std::string_view)> info;
    std::function<void(std::string_view)> error;
};

/**
 * HTTP front end for the tab catalog, restart requests and status streams.
 *
 * Every open stream occupies one worker thread, so options.worker_threads
 * bounds the number of concurrent observers. stop() closes all channels
 * before shutting the listener down so blocked streams end cleanly.
 */
class StatusServer {
public:
    StatusServer(TabCatalog           catalog,
                 OrchestrationClient& client,
                 StatusServerOptions  options,
                 HeartbeatConfig      heartbeat);
    ~StatusServer();

    StatusServer(StatusServer const&)                    = delete;
    auto operator=(StatusServer const&) -> StatusServer& = delete;

    [[nodiscard]] auto start() -> Expected<void>;
    auto stop() -> void;
    auto join() -> void;

    // Flips readiness to 503 and ends every open stream. The listener keeps serving.
    auto begin_drain() -> void;

    [[nodiscard]] auto is_running() const -> bool;
    [[nodiscard]] auto is_draining() const -> bool { return draining_.load(std::memory_order_acquire); }
    [[nodiscard]] auto port() const -> std::uint16_t;

    [[nodiscard]] auto registry() -> ChannelRegistry& { return registry_; }
    [[nodiscard]] auto coordinator() -> RestartCoordinator& { return coordinator_; }
    [[nodiscard]] auto metrics() -> MetricsCollector& { return metrics_; }

private:
    auto configure_routes(httplib::Server& server) -> void;

    TabCatalog          catalog_;
    StatusServerOptions options_;
    MetricsCollector    metrics_;
    ChannelRegistry     registry_;
    RestartCoordinator  coordinator_;
    std::atomic<bool>   draining_{false};
    HttpRequestContext  context_;

    std::unique_ptr<ConfigController>       config_controller_;
    std::unique_ptr<RestartController>      restart_controller_;
    std::unique_ptr<StatusStreamController> stream_controller_;

    std::unique_ptr<httplib::Server> server_;
    std::thread                      server_thread_;
    std::atomic<bool>                running_{false};
    std::uint16_t                    bound_port_ = 0;
    mutable std::mutex               mutex_;
};

int RunStatusServer(TabCatalog catalog, OrchestrationClient& client, StatusServerOptions const& options);

int RunStatusServerWithStopFlag(TabCatalog                                   catalog,
                                OrchestrationClient&                         client,
                                StatusServerOptions const&                   options,
                                std::atomic<bool>&                           should_stop,
                                StatusServerLogHooks const&                  log_hooks = {},
                                std::function<void(Expected<std::uint16_t>)> on_listen = {});

void RequestStatusServerStop();
void ResetStatusServerStopFlag();

} // namespace SC
