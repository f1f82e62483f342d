#ifndef CPPHTTPLIB_NO_EXCEPTIONS
#define CPPHTTPLIB_NO_EXCEPTIONS
#endif
#ifndef CPPHTTPLIB_OPENSSL_SUPPORT
#define CPPHTTPLIB_OPENSSL_SUPPORT
#endif
#include <httplib.h>

#include <statuscast/web/streaming/StatusStream.hpp>

#include <statuscast/status/ChannelRegistry.hpp>
#include <statuscast/web/Metrics.hpp>
#include <statuscast/web/TabCatalog.hpp>
#include <statuscast/web/routing/HttpHelpers.hpp>
#include <statuscast/web/streaming/StreamEncoder.hpp>

#include "log/TaggedLogger.hpp"

#include <string>
#include <utility>
#include <variant>

namespace SC {

StatusStreamSession::StatusStreamSession(StatusSubscription subscription,
                                         HeartbeatConfig    heartbeat,
                                         MetricsCollector*  metrics,
                                         std::atomic<bool>& should_stop)
    : subscription_(std::move(subscription))
    , channel_(subscription_.channel())
    , subscription_id_(subscription_.id())
    , heartbeat_(heartbeat)
    , metrics_(metrics)
    , should_stop_(should_stop) {}

auto StatusStreamSession::pump(httplib::DataSink& sink) -> bool {
    if (cancelled_.load(std::memory_order_acquire)) {
        return false;
    }
    if (should_stop_.load(std::memory_order_acquire)) {
        sink.done();
        return true;
    }

    auto event = subscription_.next_event(heartbeat_.interval());
    auto bytes = encode_channel_event(event);
    if (!bytes) {
        sink.done();
        return true;
    }
    if (!sink.write(bytes->data(), bytes->size())) {
        sc_log("Observer write failed on " + channel_->key().to_string() + ", releasing subscription",
               "Stream",
               "DEBUG");
        cancel();
        return false;
    }
    record_event(std::holds_alternative<HeartbeatEvent>(event) ? "heartbeat" : "status");
    return true;
}

void StatusStreamSession::cancel() {
    cancelled_.store(true, std::memory_order_release);
    if (channel_) {
        channel_->unsubscribe(subscription_id_);
    }
}

void StatusStreamSession::finalize(bool) {
    cancelled_.store(true, std::memory_order_release);
    subscription_.close();
}

void StatusStreamSession::record_event(std::string_view type) {
    if (metrics_ != nullptr) {
        metrics_->record_sse_event(type);
    }
}

auto StatusStreamController::Create(HttpRequestContext& ctx, std::atomic<bool>& should_stop)
    -> std::unique_ptr<StatusStreamController> {
    return std::unique_ptr<StatusStreamController>(new StatusStreamController(ctx, should_stop));
}

StatusStreamController::StatusStreamController(HttpRequestContext& ctx, std::atomic<bool>& should_stop)
    : ctx_(ctx)
    , should_stop_(should_stop) {}

StatusStreamController::~StatusStreamController() = default;

void StatusStreamController::register_routes(httplib::Server& server) {
    server.Get(R"(/api/status/(\d+)/stream)",
               [this](httplib::Request const& req, httplib::Response& res) {
                   handle_stream_request(req, res);
               });
}

void StatusStreamController::handle_stream_request(httplib::Request const& req, httplib::Response& res) {
    [[maybe_unused]] RequestMetricsScope request_scope{ctx_.metrics, RouteMetric::StatusStream, res};

    auto index = parse_tab_index(req);
    if (!index) {
        respond_bad_request(res, "invalid tab index");
        return;
    }
    auto key = ctx_.catalog.channel_key(*index);
    if (!key) {
        respond_error(res, key.error());
        return;
    }
    if (should_stop_.load(std::memory_order_acquire)) {
        write_error_response(res, "shutting_down", "server is draining", 503);
        return;
    }

    auto channel = ctx_.registry.get_or_create(*key);
    auto session = std::make_shared<StatusStreamSession>(channel->subscribe(),
                                                         ctx_.heartbeat,
                                                         &ctx_.metrics,
                                                         should_stop_);
    res.set_header("Cache-Control", "no-cache");
    res.set_header("Connection", "keep-alive");
    res.set_header("X-Accel-Buffering", "no");
    ctx_.metrics.record_sse_connection_open();
    res.set_chunked_content_provider(
        "text/event-stream",
        [session](size_t, httplib::DataSink& sink) {
            return session->pump(sink);
        },
        [session, this](bool done) {
            session->cancel();
            session->finalize(done);
            ctx_.metrics.record_sse_connection_close();
        });
}

} // namespace SC
