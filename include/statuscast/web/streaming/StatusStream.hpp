#pragma once

#include <statuscast/status/BroadcastChannel.hpp>
#include <statuscast/status/HeartbeatConfig.hpp>

#include <atomic>
#include <memory>
#include <string_view>

namespace httplib {
class Server;
class Request;
class Response;
struct DataSink;
} // namespace httplib

namespace SC {

class MetricsCollector;
struct HttpRequestContext;

/**
 * One observer connection on a status channel.
 *
 * pump() is driven by the HTTP worker thread and blocks until the channel
 * yields the next event. A failed write ends the session and releases the
 * subscription. cancel() may be called from any thread.
 */
class StatusStreamSession {
public:
    StatusStreamSession(StatusSubscription subscription,
                        HeartbeatConfig    heartbeat,
                        MetricsCollector*  metrics,
                        std::atomic<bool>& should_stop);

    auto pump(httplib::DataSink& sink) -> bool;
    void cancel();
    void finalize(bool done);

private:
    void record_event(std::string_view type);

    StatusSubscription                subscription_;
    std::shared_ptr<BroadcastChannel> channel_;
    SubscriptionId                    subscription_id_;
    HeartbeatConfig                   heartbeat_;
    std::atomic<bool>                 cancelled_{false};
    MetricsCollector*                 metrics_{nullptr};
    std::atomic<bool>&                should_stop_;
};

class StatusStreamController {
public:
    static auto Create(HttpRequestContext& ctx, std::atomic<bool>& should_stop)
        -> std::unique_ptr<StatusStreamController>;

    void register_routes(httplib::Server& server);

    ~StatusStreamController();

private:
    StatusStreamController(HttpRequestContext& ctx, std::atomic<bool>& should_stop);

    void handle_stream_request(httplib::Request const& req, httplib::Response& res);

    HttpRequestContext& ctx_;
    std::atomic<bool>&  should_stop_;
};

} // namespace SC
