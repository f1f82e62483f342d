#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

#include <statuscast/web/StatusServer.hpp>
#include <statuscast/web/routing/ConfigController.hpp>
#include <statuscast/web/routing/RestartController.hpp>
#include <statuscast/web/streaming/StatusStream.hpp>

#include "log/TaggedLogger.hpp"

#include <chrono>
#include <cstdlib>
#include <iostream>
#include <string>
#include <utility>

namespace SC {

static std::atomic<bool> g_should_stop{false};

namespace {

auto make_coordinator_options(StatusServerOptions const& options, MetricsCollector& metrics)
    -> RestartCoordinatorOptions {
    RestartCoordinatorOptions coordinator_options;
    coordinator_options.timeout    = std::chrono::seconds{options.restart_timeout_seconds};
    coordinator_options.on_outcome = [&metrics](ResourceKey const&, RestartOutcome outcome) {
        metrics.record_restart_outcome(outcome);
    };
    return coordinator_options;
}

} // namespace

StatusServer::StatusServer(TabCatalog           catalog,
                           OrchestrationClient& client,
                           StatusServerOptions  options,
                           HeartbeatConfig      heartbeat)
    : catalog_(std::move(catalog))
    , options_(std::move(options))
    , coordinator_(registry_, client, make_coordinator_options(options_, metrics_))
    , context_{catalog_, registry_, coordinator_, metrics_, options_, heartbeat, draining_} {}

StatusServer::~StatusServer() {
    this->stop();
    this->join();
}

auto StatusServer::start() -> Expected<void> {
    std::unique_lock lock(mutex_);
    if (server_) {
        return std::unexpected(Error{Error::Code::InvalidError, "status server already running"});
    }

    server_ = std::make_unique<httplib::Server>();
    auto const worker_threads = static_cast<std::size_t>(options_.worker_threads);
    server_->new_task_queue   = [worker_threads] { return new httplib::ThreadPool(worker_threads); };
    this->configure_routes(*server_);

    auto requested_port = options_.port;
    if (requested_port < 0) {
        requested_port = 0;
    }

    int bound_port = requested_port;
    if (requested_port == 0) {
        bound_port = server_->bind_to_any_port(options_.host);
        if (bound_port < 0) {
            server_.reset();
            return std::unexpected(Error{Error::Code::IoFailure, "failed to bind " + options_.host});
        }
    } else if (!server_->bind_to_port(options_.host, requested_port)) {
        server_.reset();
        return std::unexpected(Error{Error::Code::IoFailure,
                                     "failed to bind " + options_.host + ":" + std::to_string(requested_port)});
    }

    bound_port_ = static_cast<std::uint16_t>(bound_port);
    draining_.store(false, std::memory_order_release);
    running_.store(true);

    server_thread_ = std::thread([this]() {
        if (server_) {
            server_->listen_after_bind();
        }
        running_.store(false);
    });

    lock.unlock();
    server_->wait_until_ready();
    lock.lock();
    if (!server_ || !server_->is_running()) {
        if (server_) {
            server_->stop();
        }
        lock.unlock();
        this->join();
        lock.lock();
        server_.reset();
        bound_port_ = 0;
        running_.store(false);
        return std::unexpected(Error{Error::Code::IoFailure, "status server failed to start listening"});
    }

    sc_log("Listening on " + options_.host + ":" + std::to_string(bound_port_), "Server", "INFO");
    return {};
}

auto StatusServer::begin_drain() -> void {
    if (draining_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }
    sc_log("Draining: readiness off, closing status streams", "Server", "INFO");
    registry_.close_all();
}

auto StatusServer::stop() -> void {
    std::unique_lock lock(mutex_);
    if (!server_) {
        return;
    }
    draining_.store(true, std::memory_order_release);
    // Streams block inside the worker pool; the listener cannot stop until they return.
    registry_.close_all();
    server_->stop();
    lock.unlock();
    this->join();
    lock.lock();
    server_.reset();
    bound_port_ = 0;
    running_.store(false);
}

auto StatusServer::join() -> void {
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

auto StatusServer::is_running() const -> bool {
    return running_.load();
}

auto StatusServer::port() const -> std::uint16_t {
    return bound_port_;
}

auto StatusServer::configure_routes(httplib::Server& server) -> void {
    config_controller_ = ConfigController::Create(context_, [this] { this->begin_drain(); });
    config_controller_->register_routes(server);

    restart_controller_ = RestartController::Create(context_);
    restart_controller_->register_routes(server);

    stream_controller_ = StatusStreamController::Create(context_, draining_);
    stream_controller_->register_routes(server);
}

void RequestStatusServerStop() {
    g_should_stop.store(true);
}

void ResetStatusServerStopFlag() {
    g_should_stop.store(false);
}

int RunStatusServerWithStopFlag(TabCatalog                                   catalog,
                                OrchestrationClient&                         client,
                                StatusServerOptions const&                   options,
                                std::atomic<bool>&                           should_stop,
                                StatusServerLogHooks const&                  log_hooks,
                                std::function<void(Expected<std::uint16_t>)> on_listen) {
    auto log_info = [&](std::string_view message) {
        if (log_hooks.info) {
            log_hooks.info(message);
            return;
        }
        std::cout << message << '\n';
    };

    auto log_error = [&](std::string_view message) {
        if (log_hooks.error) {
            log_hooks.error(message);
            return;
        }
        std::cerr << message << '\n';
    };

    auto report_listen_status = [&](Expected<std::uint16_t> status) {
        if (on_listen) {
            on_listen(std::move(status));
        }
    };

    auto heartbeat = ResolveHeartbeatConfig(options);
    if (!heartbeat) {
        log_error(std::string{"[statuscast] "} + describeError(heartbeat.error()));
        report_listen_status(std::unexpected(heartbeat.error()));
        return EXIT_FAILURE;
    }

    auto const tab_count = catalog.size();
    StatusServer server{std::move(catalog), client, options, *heartbeat};
    auto         started = server.start();
    if (!started) {
        log_error(std::string{"[statuscast] "} + describeError(started.error()));
        report_listen_status(std::unexpected(started.error()));
        return EXIT_FAILURE;
    }

    log_info(std::string{"[statuscast] Listening on http://"} + options.host + ":"
             + std::to_string(server.port()) + " (" + std::to_string(tab_count) + " tabs, heartbeat "
             + std::to_string(heartbeat->interval().count()) + "ms, environment " + options.environment + ")");
    report_listen_status(server.port());

    bool listener_died = false;
    while (!should_stop.load(std::memory_order_acquire)) {
        if (!server.is_running()) {
            listener_died = true;
            break;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    if (listener_died) {
        log_error("[statuscast] Listener stopped unexpectedly");
    } else {
        log_info("[statuscast] Shutting down");
    }
    server.stop();
    return listener_died ? EXIT_FAILURE : EXIT_SUCCESS;
}

int RunStatusServer(TabCatalog catalog, OrchestrationClient& client, StatusServerOptions const& options) {
    return RunStatusServerWithStopFlag(std::move(catalog), client, options, g_should_stop, {}, {});
}

} // namespace SC
